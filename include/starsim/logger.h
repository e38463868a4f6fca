#pragma once

#include "config.h"
#include <fstream>
#include <memory>
#include <string>

namespace starsim::catalog {

/**
 * @brief Levelled, component-tagged logger built from a CatalogConfig
 *
 * Lines look like "[2024-01-01 12:00:00] [INFO] [Survey] message". They go
 * to standard error when the level passes the configured threshold and are
 * always appended to the configured log file. Copies share the file.
 */
class Logger {
public:
    Logger();
    Logger(const CatalogConfig& config, const std::string& component);

    void log(CatalogConfig::LogLevel level, const std::string& message) const;

    void error(const std::string& message) const { log(CatalogConfig::LogLevel::ERROR, message); }
    void warn(const std::string& message) const { log(CatalogConfig::LogLevel::WARNING, message); }
    void info(const std::string& message) const { log(CatalogConfig::LogLevel::INFO, message); }
    void debug(const std::string& message) const { log(CatalogConfig::LogLevel::DEBUG, message); }

    bool enabled(CatalogConfig::LogLevel level) const;
    const std::string& component() const { return component_; }

    /**
     * @brief Same sinks, different component tag
     */
    Logger withComponent(const std::string& component) const;

private:
    CatalogConfig::LogLevel level_;
    std::string component_;
    std::shared_ptr<std::ofstream> log_stream_;
};

} // namespace starsim::catalog
