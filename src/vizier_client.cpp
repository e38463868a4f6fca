#include "starsim/vizier_client.h"
#include "starsim/http.h"
#include "starsim/logger.h"
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace starsim {
namespace catalog {

// =============================================================================
// SurveyDefinition
// =============================================================================

std::vector<std::string> SurveyDefinition::columns() const {
    return {ra_column, dec_column, pmra_column, pmdec_column,
            primary_band, alternate1_band, alternate2_band};
}

SurveyDefinition SurveyDefinition::ucac4() {
    SurveyDefinition def;
    def.name = "UCAC4";
    def.table = "I/322A/out";
    def.ra_column = "RAJ2000";
    def.dec_column = "DEJ2000";
    def.pmra_column = "pmRA";
    def.pmdec_column = "pmDE";
    def.primary_band = "f.mag";
    def.alternate1_band = "Jmag";
    def.alternate2_band = "Vmag";
    return def;
}

// =============================================================================
// CSV helpers
// =============================================================================

namespace {

std::vector<std::string> splitCSVLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    for (char c : line) {
        if (c == '"') {
            in_quotes = !in_quotes;
        } else if (c == ',' && !in_quotes) {
            fields.push_back(field);
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

std::string trimField(const std::string& str) {
    size_t start = str.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t");
    return str.substr(start, end - start + 1);
}

} // anonymous namespace

// =============================================================================
// CSV Parser for TAP responses
// =============================================================================

SurveyTable parseSurveyCSV(const std::string& csv_data,
                           const std::vector<std::string>& columns) {
    std::istringstream stream(csv_data);
    std::string line;

    // Header line names the columns
    std::vector<std::string> header;
    while (std::getline(stream, line)) {
        if (line.empty() || line[0] == '#') continue;
        for (const auto& name : splitCSVLine(line)) {
            header.push_back(trimField(name));
        }
        break;
    }
    if (header.empty()) {
        throw CatalogException(ErrorCode::PARSE_ERROR, "Survey response has no header line");
    }

    std::vector<size_t> positions;
    for (const auto& name : columns) {
        size_t pos = 0;
        while (pos < header.size() && header[pos] != name) ++pos;
        if (pos == header.size()) {
            throw CatalogException(ErrorCode::PARSE_ERROR,
                                   "Survey response lacks column " + name);
        }
        positions.push_back(pos);
    }

    std::vector<std::vector<double>> values(columns.size());
    size_t line_number = 1;

    while (std::getline(stream, line)) {
        line_number++;
        if (line.empty() || line == "\r" || line[0] == '#') continue;

        auto fields = splitCSVLine(line);
        if (fields.size() < header.size()) {
            throw CatalogException(ErrorCode::PARSE_ERROR,
                                   "Short row at line " + std::to_string(line_number));
        }

        for (size_t c = 0; c < columns.size(); ++c) {
            std::string field = trimField(fields[positions[c]]);
            if (field.empty()) {
                values[c].push_back(std::numeric_limits<double>::quiet_NaN());
                continue;
            }
            char* end = nullptr;
            double value = std::strtod(field.c_str(), &end);
            if (end == field.c_str() || *end != '\0') {
                throw CatalogException(ErrorCode::PARSE_ERROR,
                                       "Non-numeric " + columns[c] + " '" + field +
                                       "' at line " + std::to_string(line_number));
            }
            values[c].push_back(value);
        }
    }

    SurveyTable table;
    for (size_t c = 0; c < columns.size(); ++c) {
        table.addColumn(columns[c], std::move(values[c]));
    }
    return table;
}

// =============================================================================
// VizierClient::Impl - Private implementation
// =============================================================================

class VizierClient::Impl {
public:
    SurveyDefinition definition_;
    std::string tap_url_;
    int timeout_seconds_;
    Logger logger_;

    Impl(const CatalogConfig& config, SurveyDefinition definition)
        : definition_(std::move(definition)),
          tap_url_(config.vizier_url),
          timeout_seconds_(config.timeout_seconds),
          logger_(config, "VizierClient") {}

    std::string buildConeQuery(const EquatorialCoordinates& center, double radius) const {
        std::ostringstream adql;
        adql << std::setprecision(12);

        adql << "SELECT ";
        auto columns = definition_.columns();
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) adql << ", ";
            adql << "\"" << columns[i] << "\"";
        }
        adql << " FROM \"" << definition_.table << "\" ";
        adql << "WHERE 1=CONTAINS(POINT('ICRS', \"" << definition_.ra_column << "\", \""
             << definition_.dec_column << "\"), ";
        adql << "CIRCLE('ICRS', " << center.ra << ", " << center.dec << ", " << radius << "))";

        return adql.str();
    }

    SurveyTable executeQuery(const std::string& adql) const {
        std::ostringstream post_data;
        post_data << "REQUEST=doQuery&LANG=ADQL&FORMAT=csv&QUERY=" << http::urlEncode(adql);

        logger_.debug("POST " + tap_url_ + " : " + adql);
        std::string response = http::post(tap_url_, post_data.str(), timeout_seconds_);

        return parseSurveyCSV(response, definition_.columns());
    }
};

// =============================================================================
// VizierClient Public Interface
// =============================================================================

VizierClient::VizierClient(const CatalogConfig& config, SurveyDefinition definition)
    : pImpl_(std::make_unique<Impl>(config, std::move(definition))) {}

VizierClient::~VizierClient() = default;

VizierClient::VizierClient(VizierClient&&) noexcept = default;
VizierClient& VizierClient::operator=(VizierClient&&) noexcept = default;

SurveyTable VizierClient::queryCone(const EquatorialCoordinates& center, double radius) {
    if (!(radius > 0.0) || !std::isfinite(center.ra) || !std::isfinite(center.dec)) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Invalid cone for survey query");
    }
    return pImpl_->executeQuery(pImpl_->buildConeQuery(center, radius));
}

const SurveyDefinition& VizierClient::definition() const {
    return pImpl_->definition_;
}

std::string VizierClient::buildConeQuery(const EquatorialCoordinates& center, double radius) const {
    return pImpl_->buildConeQuery(center, radius);
}

std::string VizierClient::getTapUrl() const {
    return pImpl_->tap_url_;
}

} // namespace catalog
} // namespace starsim
