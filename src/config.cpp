#include "starsim/config.h"
#include "starsim/types.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <vector>

namespace starsim::catalog {

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string removeQuotes(const std::string& str) {
    std::string result = trim(str);
    if (result.size() >= 2 && result.front() == '"' && result.back() == '"') {
        result = result.substr(1, result.length() - 2);
    }
    return result;
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // anonymous namespace

std::map<std::string, std::string> parseFlatJSON(const std::string& json_str) {
    std::map<std::string, std::string> result;

    // Remove all whitespace except within quoted strings
    std::string cleaned;
    bool in_quotes = false;
    for (char c : json_str) {
        if (c == '"') {
            in_quotes = !in_quotes;
            cleaned += c;
        } else if (in_quotes || (c != ' ' && c != '\t' && c != '\n' && c != '\r')) {
            cleaned += c;
        }
    }

    size_t start = cleaned.find('{');
    size_t end = cleaned.find_last_of('}');
    if (start == std::string::npos || end == std::string::npos || end < start) {
        throw CatalogException(ErrorCode::INVALID_PARAMS, "Expected a JSON object");
    }
    cleaned = cleaned.substr(start + 1, end - start - 1);

    // Split on top-level commas (arrays keep their commas)
    std::vector<std::string> items;
    std::string item;
    int depth = 0;
    in_quotes = false;
    for (char c : cleaned) {
        if (c == '"') in_quotes = !in_quotes;
        if (!in_quotes && c == '[') ++depth;
        if (!in_quotes && c == ']') --depth;
        if (!in_quotes && depth == 0 && c == ',') {
            items.push_back(item);
            item.clear();
        } else {
            item += c;
        }
    }
    if (!item.empty()) items.push_back(item);

    for (const auto& entry : items) {
        size_t colon = entry.find(':');
        if (colon == std::string::npos) continue;
        std::string key = removeQuotes(entry.substr(0, colon));
        std::string value = removeQuotes(entry.substr(colon + 1));
        result[key] = value;
    }

    return result;
}

double jsonToDouble(const std::string& key, const std::string& value) {
    std::string lower = toLower(value);
    if (lower == "null" || lower == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    char* end = nullptr;
    double parsed = std::strtod(value.c_str(), &end);
    if (value.empty() || end == value.c_str() || *end != '\0') {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Expected a number for '" + key + "', got '" + value + "'");
    }
    return parsed;
}

int jsonToInt(const std::string& key, const std::string& value) {
    double parsed = jsonToDouble(key, value);
    if (!std::isfinite(parsed) || std::abs(parsed) > 2147483647.0 ||
        parsed != static_cast<double>(static_cast<int>(parsed))) {
        throw CatalogException(ErrorCode::INVALID_PARAMS,
                               "Expected an integer for '" + key + "', got '" + value + "'");
    }
    return static_cast<int>(parsed);
}

bool jsonToBool(const std::string& key, const std::string& value) {
    std::string lower = toLower(value);
    if (lower == "true" || lower == "1") return true;
    if (lower == "false" || lower == "0") return false;
    throw CatalogException(ErrorCode::INVALID_PARAMS,
                           "Expected true/false for '" + key + "', got '" + value + "'");
}

CatalogConfig::LogLevel stringToLogLevel(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "silent")  return CatalogConfig::LogLevel::SILENT;
    if (lower == "error")   return CatalogConfig::LogLevel::ERROR;
    if (lower == "warning" || lower == "warn") return CatalogConfig::LogLevel::WARNING;
    if (lower == "info")    return CatalogConfig::LogLevel::INFO;
    if (lower == "debug")   return CatalogConfig::LogLevel::DEBUG;

    throw CatalogException(ErrorCode::INVALID_PARAMS, "Invalid log level: " + str);
}

std::string logLevelToString(CatalogConfig::LogLevel level) {
    switch (level) {
        case CatalogConfig::LogLevel::SILENT:  return "SILENT";
        case CatalogConfig::LogLevel::ERROR:   return "ERROR";
        case CatalogConfig::LogLevel::WARNING: return "WARN";
        case CatalogConfig::LogLevel::INFO:    return "INFO";
        case CatalogConfig::LogLevel::DEBUG:   return "DEBUG";
        default: return "UNKNOWN";
    }
}

CatalogConfig CatalogConfig::fromJSON(const std::string& json_config) {
    auto config_map = parseFlatJSON(json_config);
    CatalogConfig config;

    auto has = [&config_map](const char* key) {
        return config_map.find(key) != config_map.end();
    };

    if (has("log_level")) {
        config.log_level = stringToLogLevel(config_map["log_level"]);
    }
    if (has("log_file")) {
        config.log_file = config_map["log_file"];
    }
    if (has("cache_directory")) {
        config.cache_directory = config_map["cache_directory"];
    }
    if (has("vizier_url")) {
        config.vizier_url = config_map["vizier_url"];
    }
    if (has("sesame_url")) {
        config.sesame_url = config_map["sesame_url"];
    }
    if (has("timeout_seconds")) {
        config.timeout_seconds = jsonToInt("timeout_seconds", config_map["timeout_seconds"]);
        if (config.timeout_seconds < 0) {
            throw CatalogException(ErrorCode::INVALID_PARAMS,
                                   "timeout_seconds must be >= 0");
        }
    }
    if (has("names_database")) {
        config.names_database = config_map["names_database"];
    }
    if (has("enable_parallel")) {
        config.enable_parallel = jsonToBool("enable_parallel", config_map["enable_parallel"]);
    }

    return config;
}

std::string CatalogConfig::resolvedCacheDirectory() const {
    if (!cache_directory.empty() && cache_directory[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + cache_directory.substr(1);
        }
    }
    return cache_directory;
}

} // namespace starsim::catalog
