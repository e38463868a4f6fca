#include "starsim/logger.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace starsim::catalog {

Logger::Logger()
    : level_(CatalogConfig::LogLevel::WARNING), component_("starsim") {}

Logger::Logger(const CatalogConfig& config, const std::string& component)
    : level_(config.log_level), component_(component) {
    if (!config.log_file.empty()) {
        log_stream_ = std::make_shared<std::ofstream>(config.log_file, std::ios::app);
        if (!log_stream_->is_open()) {
            std::cerr << "Warning: cannot open log file " << config.log_file << std::endl;
            log_stream_.reset();
        }
    }
}

bool Logger::enabled(CatalogConfig::LogLevel level) const {
    return level != CatalogConfig::LogLevel::SILENT &&
           static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(CatalogConfig::LogLevel level, const std::string& message) const {
    bool to_console = enabled(level);
    if (!to_console && !log_stream_) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    std::ostringstream oss;
    oss << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << component_ << "] " << message;

    std::string log_line = oss.str();

    if (to_console) {
        std::cerr << log_line << std::endl;
    }

    if (log_stream_) {
        *log_stream_ << log_line << std::endl;
        log_stream_->flush();
    }
}

Logger Logger::withComponent(const std::string& component) const {
    Logger copy(*this);
    copy.component_ = component;
    return copy;
}

} // namespace starsim::catalog
