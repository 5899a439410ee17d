#include <mip65/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mip65::utils {

std::mutex Logger::console_mutex_;
std::atomic<LogLevel> Logger::current_level_{LogLevel::INFO};
std::ostream* Logger::output_ = &std::cout;

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::instance_for(LogLevel level) {
    static thread_local Logger debug_logger(LogLevel::DEBUG);
    static thread_local Logger info_logger(LogLevel::INFO);
    static thread_local Logger warn_logger(LogLevel::WARN);
    static thread_local Logger error_logger(LogLevel::LOG_ERROR);

    Logger* logger = &info_logger;
    switch (level) {
        case LogLevel::DEBUG:     logger = &debug_logger; break;
        case LogLevel::INFO:      logger = &info_logger;  break;
        case LogLevel::WARN:      logger = &warn_logger;  break;
        case LogLevel::LOG_ERROR: logger = &error_logger; break;
    }
    logger->stream_.str("");
    logger->stream_.clear();
    return *logger;
}

Logger& Logger::debug() { return instance_for(LogLevel::DEBUG); }
Logger& Logger::info()  { return instance_for(LogLevel::INFO); }
Logger& Logger::warn()  { return instance_for(LogLevel::WARN); }
Logger& Logger::error() { return instance_for(LogLevel::LOG_ERROR); }

Logger& Logger::operator<<(const EndlType&) {
    if (level_ < current_level_) {
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm tm{};
    gmtime_r(&time, &tm);

    std::stringstream time_str;
    time_str << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    time_str << '.' << std::setfill('0') << std::setw(3) << ms;

    std::lock_guard<std::mutex> lock(console_mutex_);

    std::ostream& out = *output_;
    out << "[" << time_str.str() << "] ";

    switch (level_) {
        case LogLevel::DEBUG:
            out << "[DEBUG] ";
            break;
        case LogLevel::INFO:
            out << "[INFO] ";
            break;
        case LogLevel::WARN:
            out << "[WARN] ";
            break;
        case LogLevel::LOG_ERROR:
            out << "[ERROR] ";
            break;
    }

    out << stream_.str() << std::endl;
    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::level() {
    return current_level_;
}

std::optional<LogLevel> Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::LOG_ERROR;
    return std::nullopt;
}

bool Logger::set_level(const std::string& name) {
    auto level = parse_level(name);
    if (!level) {
        return false;
    }
    current_level_ = *level;
    return true;
}

void Logger::set_output(std::ostream& out) {
    std::lock_guard<std::mutex> lock(console_mutex_);
    output_ = &out;
}

} // namespace mip65::utils
