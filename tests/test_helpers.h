#pragma once

#include "starsim/config.h"
#include "starsim/name_resolver.h"
#include "starsim/survey_provider.h"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <limits>
#include <map>
#include <optional>
#include <random>
#include <string>

namespace starsim {
namespace catalog {
namespace test_support {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/**
 * Fresh directory under the system temp dir, removed on destruction
 */
class TempDirectory {
public:
    TempDirectory() {
        std::random_device rd;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("starsim_test_" + std::to_string(stamp) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDirectory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

/**
 * Silent configuration with its cache inside dir
 */
inline CatalogConfig quietConfig(const TempDirectory& dir) {
    CatalogConfig config;
    config.log_level = CatalogConfig::LogLevel::SILENT;
    config.cache_directory = dir.path().string();
    return config;
}

inline CatalogConfig quietConfig() {
    CatalogConfig config;
    config.log_level = CatalogConfig::LogLevel::SILENT;
    return config;
}

/**
 * Survey provider that serves a fixed table (or a fixed failure) and
 * counts how often it is asked
 */
class FakeSurveyProvider : public SurveyProvider {
public:
    FakeSurveyProvider() : definition_(SurveyDefinition::ucac4()) {}

    SurveyTable queryCone(const EquatorialCoordinates& center, double radius) override {
        calls++;
        last_center = center;
        last_radius = radius;
        if (failure) {
            throw CatalogException(*failure, "simulated provider failure");
        }
        return table;
    }

    const SurveyDefinition& definition() const override { return definition_; }

    /**
     * Append one UCAC4-shaped row
     */
    void addRow(double ra, double dec, double pmra, double pmdec,
                double fmag, double jmag, double vmag) {
        rows_[definition_.ra_column].push_back(ra);
        rows_[definition_.dec_column].push_back(dec);
        rows_[definition_.pmra_column].push_back(pmra);
        rows_[definition_.pmdec_column].push_back(pmdec);
        rows_[definition_.primary_band].push_back(fmag);
        rows_[definition_.alternate1_band].push_back(jmag);
        rows_[definition_.alternate2_band].push_back(vmag);

        table = SurveyTable();
        for (const auto& name : definition_.columns()) {
            table.addColumn(name, rows_[name]);
        }
    }

    SurveyTable table;
    std::optional<ErrorCode> failure;
    int calls = 0;
    EquatorialCoordinates last_center;
    double last_radius = 0.0;

private:
    SurveyDefinition definition_;
    std::map<std::string, std::vector<double>> rows_;
};

/**
 * Name resolver over an in-memory map
 */
class FakeNameResolver : public NameResolver {
public:
    EquatorialCoordinates resolve(const std::string& name) override {
        calls++;
        auto it = known.find(name);
        if (it == known.end()) {
            throw CatalogException(ErrorCode::NAME_NOT_RESOLVED, "unknown " + name);
        }
        return it->second;
    }

    std::map<std::string, EquatorialCoordinates> known;
    int calls = 0;
};

} // namespace test_support
} // namespace catalog
} // namespace starsim
