#pragma once

#include <map>
#include <string>

namespace starsim::catalog {

/**
 * @brief Explicit settings handed to every catalog, loader and client
 *
 * Replaces process-wide chattiness and path-prefix state: whoever builds a
 * catalog decides where caches live, how loud it is and which services it
 * talks to.
 */
struct CatalogConfig {
    // Logging
    enum class LogLevel { SILENT, ERROR, WARNING, INFO, DEBUG };
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;                 // Optional log file path

    // Root for cached survey queries ("~" is expanded)
    std::string cache_directory = "~/.cache/starsim";

    // Online services
    std::string vizier_url = "https://tapvizier.cds.unistra.fr/TAPVizieR/tap/sync";
    std::string sesame_url = "https://cds.unistra.fr/cgi-bin/nph-sesame/-oI/A";
    int timeout_seconds = 0;              // 0 = wait for the transport forever

    // Optional local name database (SQLite)
    std::string names_database;

    // Spread per-star loops over OpenMP threads for large ensembles
    bool enable_parallel = false;

    /**
     * @brief Parse a flat JSON object of the fields above
     * @throws CatalogException(INVALID_PARAMS) on malformed values
     *
     * Example:
     * {
     *   "log_level": "debug",
     *   "cache_directory": "/data/starsim",
     *   "timeout_seconds": 120,
     *   "enable_parallel": true
     * }
     */
    static CatalogConfig fromJSON(const std::string& json_config);

    /**
     * @brief Cache directory with a leading "~" replaced by $HOME
     */
    std::string resolvedCacheDirectory() const;
};

CatalogConfig::LogLevel stringToLogLevel(const std::string& str);
std::string logLevelToString(CatalogConfig::LogLevel level);

/**
 * @brief Split a flat JSON object into key/value strings
 *
 * Only what configuration and request files need: one level, scalar
 * values, arrays kept as their raw "[...]" text.
 */
std::map<std::string, std::string> parseFlatJSON(const std::string& json_str);

/**
 * @brief Typed readers over parseFlatJSON() output
 * @throws CatalogException(INVALID_PARAMS) when the value does not parse
 */
double jsonToDouble(const std::string& key, const std::string& value);
int jsonToInt(const std::string& key, const std::string& value);
bool jsonToBool(const std::string& key, const std::string& value);

} // namespace starsim::catalog
