#pragma once

#include "config.h"
#include "survey_table.h"
#include <memory>
#include <string>

namespace starsim {
namespace catalog {

/**
 * SurveyCache - write-once disk cache of raw survey query results
 *
 * One file per (catalog, ra, dec, radius) key. Tables are stored as a
 * fixed header, the column names and a zlib-compressed column-major block
 * of raw doubles, so a reload reproduces the stored table bit for bit.
 * Entries are never refreshed or invalidated.
 *
 * Cache structure:
 *   cache_directory/
 *     └── intermediates/
 *         ├── UCAC4_0_90_0.2.cat
 *         └── ...
 *
 * Example usage:
 * @code
 *   SurveyCache cache(config);
 *   if (!cache.contains("UCAC4", 83.0, -5.0, 0.2)) {
 *       cache.store("UCAC4", 83.0, -5.0, 0.2, client.queryCone({83.0, -5.0}, 0.2));
 *   }
 *   SurveyTable table = cache.load("UCAC4", 83.0, -5.0, 0.2);
 * @endcode
 */
class SurveyCache {
public:
    /**
     * @param config Supplies the cache root (created if it doesn't exist)
     * @throws CatalogException(CACHE_ERROR) if the directory can't be created
     */
    explicit SurveyCache(const CatalogConfig& config);

    ~SurveyCache();

    // No copy, allow move
    SurveyCache(const SurveyCache&) = delete;
    SurveyCache& operator=(const SurveyCache&) = delete;
    SurveyCache(SurveyCache&&) noexcept;
    SurveyCache& operator=(SurveyCache&&) noexcept;

    /**
     * Deterministic key, e.g. "UCAC4_0_90_0.2"
     */
    static std::string cacheKey(const std::string& catalog, double ra, double dec, double radius);

    /**
     * File that holds (or would hold) the entry for a key
     */
    std::string pathFor(const std::string& catalog, double ra, double dec, double radius) const;

    bool contains(const std::string& catalog, double ra, double dec, double radius) const;

    /**
     * @throws CatalogException(CACHE_ERROR) if the entry is missing or corrupt
     */
    SurveyTable load(const std::string& catalog, double ra, double dec, double radius) const;

    /**
     * Persist a table under its key (replacing any partial file)
     * @throws CatalogException(CACHE_ERROR) on I/O or compression failure
     */
    void store(const std::string& catalog, double ra, double dec, double radius,
               const SurveyTable& table);

    /**
     * Get cache directory path
     */
    std::string getCacheDir() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace catalog
} // namespace starsim
