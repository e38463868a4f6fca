#include "starsim/survey_cache.h"
#include "starsim/logger.h"
#include "starsim/types.h"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <zlib.h>

namespace fs = std::filesystem;

namespace starsim {
namespace catalog {

// =============================================================================
// Compression utilities
// =============================================================================

namespace compression {

std::vector<uint8_t> compress(const void* data, size_t size, int level) {
    uLongf compressed_size = compressBound(size);
    std::vector<uint8_t> compressed(compressed_size);

    int result = compress2(
        compressed.data(), &compressed_size,
        reinterpret_cast<const Bytef*>(data), size,
        level
    );

    if (result != Z_OK) {
        throw CatalogException(ErrorCode::CACHE_ERROR, "Compression failed");
    }

    compressed.resize(compressed_size);
    return compressed;
}

std::vector<uint8_t> decompress(const void* data, size_t compressed_size, size_t original_size) {
    std::vector<uint8_t> decompressed(original_size);
    uLongf dest_size = original_size;

    int result = uncompress(
        decompressed.data(), &dest_size,
        reinterpret_cast<const Bytef*>(data), compressed_size
    );

    if (result != Z_OK || dest_size != original_size) {
        throw CatalogException(ErrorCode::CACHE_ERROR, "Decompression failed");
    }

    return decompressed;
}

} // namespace compression

// =============================================================================
// Binary file format
// =============================================================================

namespace binary {

#pragma pack(push, 1)
struct FileHeader {
    char magic[8];           // "STRSCAT\0"
    uint32_t version;        // Format version
    uint32_t num_columns;    // Columns in the table
    uint64_t num_rows;       // Rows per column
    uint64_t names_size;     // Bytes of the column-name block
    uint64_t compressed_size;// Compressed payload size
    uint64_t original_size;  // Payload size before compression
    char reserved[16];       // Reserved for future use (total 64 bytes)

    FileHeader() : version(1), num_columns(0), num_rows(0), names_size(0),
                   compressed_size(0), original_size(0) {
        std::memcpy(magic, "STRSCAT", 8);
        std::memset(reserved, 0, sizeof(reserved));
    }

    bool isValid() const {
        return std::memcmp(magic, "STRSCAT", 8) == 0 && version == 1;
    }
};
#pragma pack(pop)

} // namespace binary

// =============================================================================
// SurveyCache::Impl - Private implementation
// =============================================================================

class SurveyCache::Impl {
public:
    std::string cache_dir_;
    Logger logger_;

    explicit Impl(const CatalogConfig& config)
        : cache_dir_((fs::path(config.resolvedCacheDirectory()) / "intermediates").string()),
          logger_(config, "SurveyCache") {
        std::error_code ec;
        fs::create_directories(cache_dir_, ec);
        if (ec) {
            throw CatalogException(ErrorCode::CACHE_ERROR,
                                   "Cannot create cache directory " + cache_dir_ + ": " + ec.message());
        }
    }

    std::string getPath(const std::string& key) const {
        return (fs::path(cache_dir_) / (key + ".cat")).string();
    }

    SurveyTable readTable(const std::string& path) const {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) {
            throw CatalogException(ErrorCode::CACHE_ERROR, "Cannot open cache file: " + path);
        }

        binary::FileHeader header;
        ifs.read(reinterpret_cast<char*>(&header), sizeof(header));
        if (!ifs || !header.isValid()) {
            throw CatalogException(ErrorCode::CACHE_ERROR, "Not a survey cache file: " + path);
        }

        std::error_code ec;
        const uint64_t file_size = fs::file_size(path, ec);
        if (ec || file_size < sizeof(header)) {
            throw CatalogException(ErrorCode::CACHE_ERROR, "Cannot size cache file: " + path);
        }
        const uint64_t body_size = file_size - sizeof(header);
        if (header.names_size > body_size ||
            header.compressed_size > body_size - header.names_size) {
            throw CatalogException(ErrorCode::CACHE_ERROR, "Truncated cache file: " + path);
        }

        const uint64_t max_values = std::numeric_limits<uint64_t>::max() / sizeof(double);
        if (header.num_columns > 0 && header.num_rows > max_values / header.num_columns) {
            throw CatalogException(ErrorCode::CACHE_ERROR, "Inconsistent cache header: " + path);
        }
        const uint64_t expected_size = header.num_columns * header.num_rows * sizeof(double);
        if (header.original_size != expected_size) {
            throw CatalogException(ErrorCode::CACHE_ERROR, "Inconsistent cache header: " + path);
        }
        // zlib can't shrink a block below roughly 1/1032 of its size
        if (expected_size / 1032 > header.compressed_size + 1) {
            throw CatalogException(ErrorCode::CACHE_ERROR, "Inconsistent cache header: " + path);
        }

        std::vector<char> names_block(header.names_size);
        ifs.read(names_block.data(), static_cast<std::streamsize>(names_block.size()));

        std::vector<uint8_t> payload(header.compressed_size);
        ifs.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
        if (!ifs) {
            throw CatalogException(ErrorCode::CACHE_ERROR, "Truncated cache file: " + path);
        }

        // names: uint32 length followed by the bytes, one per column
        std::vector<std::string> names;
        size_t offset = 0;
        for (uint32_t c = 0; c < header.num_columns; ++c) {
            uint32_t length = 0;
            if (offset + sizeof(length) > names_block.size()) {
                throw CatalogException(ErrorCode::CACHE_ERROR, "Corrupt column names: " + path);
            }
            std::memcpy(&length, names_block.data() + offset, sizeof(length));
            offset += sizeof(length);
            if (offset + length > names_block.size()) {
                throw CatalogException(ErrorCode::CACHE_ERROR, "Corrupt column names: " + path);
            }
            names.emplace_back(names_block.data() + offset, length);
            offset += length;
        }

        std::vector<uint8_t> raw;
        if (header.original_size > 0) {
            raw = compression::decompress(payload.data(), payload.size(), header.original_size);
        }

        SurveyTable table;
        for (uint32_t c = 0; c < header.num_columns; ++c) {
            std::vector<double> values(header.num_rows);
            if (header.num_rows > 0) {
                std::memcpy(values.data(), raw.data() + c * header.num_rows * sizeof(double),
                            header.num_rows * sizeof(double));
            }
            table.addColumn(names[c], std::move(values));
        }
        return table;
    }

    void writeTable(const std::string& path, const SurveyTable& table) const {
        binary::FileHeader header;
        header.num_columns = static_cast<uint32_t>(table.columnCount());
        header.num_rows = table.rowCount();

        std::string names_block;
        for (const auto& name : table.columnNames()) {
            uint32_t length = static_cast<uint32_t>(name.size());
            names_block.append(reinterpret_cast<const char*>(&length), sizeof(length));
            names_block.append(name);
        }
        header.names_size = names_block.size();

        std::vector<double> raw;
        raw.reserve(header.num_columns * header.num_rows);
        for (const auto& column : table.columns()) {
            raw.insert(raw.end(), column.begin(), column.end());
        }
        header.original_size = raw.size() * sizeof(double);

        std::vector<uint8_t> payload;
        if (!raw.empty()) {
            payload = compression::compress(raw.data(), header.original_size, Z_BEST_COMPRESSION);
        }
        header.compressed_size = payload.size();

        // write beside the target, then move into place
        std::string tmp_path = path + ".tmp";
        {
            std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
            if (!ofs) {
                throw CatalogException(ErrorCode::CACHE_ERROR, "Cannot write cache file: " + tmp_path);
            }
            ofs.write(reinterpret_cast<const char*>(&header), sizeof(header));
            ofs.write(names_block.data(), static_cast<std::streamsize>(names_block.size()));
            ofs.write(reinterpret_cast<const char*>(payload.data()),
                      static_cast<std::streamsize>(payload.size()));
            if (!ofs) {
                throw CatalogException(ErrorCode::CACHE_ERROR, "Failed writing cache file: " + tmp_path);
            }
        }

        std::error_code ec;
        fs::rename(tmp_path, path, ec);
        if (ec) {
            fs::remove(tmp_path, ec);
            throw CatalogException(ErrorCode::CACHE_ERROR, "Cannot move cache file into place: " + path);
        }
    }
};

// =============================================================================
// SurveyCache Public Interface
// =============================================================================

SurveyCache::SurveyCache(const CatalogConfig& config)
    : pImpl_(std::make_unique<Impl>(config)) {}

SurveyCache::~SurveyCache() = default;

SurveyCache::SurveyCache(SurveyCache&&) noexcept = default;
SurveyCache& SurveyCache::operator=(SurveyCache&&) noexcept = default;

std::string SurveyCache::cacheKey(const std::string& catalog, double ra, double dec, double radius) {
    std::ostringstream oss;
    oss << std::setprecision(10);
    oss << catalog << "_" << ra << "_" << dec << "_" << radius;

    std::string key = oss.str();
    key.erase(std::remove(key.begin(), key.end(), ' '), key.end());
    return key;
}

std::string SurveyCache::pathFor(const std::string& catalog, double ra, double dec, double radius) const {
    return pImpl_->getPath(cacheKey(catalog, ra, dec, radius));
}

bool SurveyCache::contains(const std::string& catalog, double ra, double dec, double radius) const {
    return fs::exists(pathFor(catalog, ra, dec, radius));
}

SurveyTable SurveyCache::load(const std::string& catalog, double ra, double dec, double radius) const {
    std::string path = pathFor(catalog, ra, dec, radius);
    SurveyTable table = pImpl_->readTable(path);
    pImpl_->logger_.debug("read " + std::to_string(table.rowCount()) + " rows from " + path);
    return table;
}

void SurveyCache::store(const std::string& catalog, double ra, double dec, double radius,
                        const SurveyTable& table) {
    std::string path = pathFor(catalog, ra, dec, radius);
    pImpl_->writeTable(path, table);
    pImpl_->logger_.debug("wrote " + std::to_string(table.rowCount()) + " rows to " + path);
}

std::string SurveyCache::getCacheDir() const {
    return pImpl_->cache_dir_;
}

} // namespace catalog
} // namespace starsim
