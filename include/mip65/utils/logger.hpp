#pragma once
#include <atomic>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace mip65::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

// Stream-style logger: Logger::info() << "x=" << x << Logger::endl;
// A line is emitted on endl if its level passes the global threshold.
class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    Logger& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // "debug", "info", "warn", "error" (any case). Unknown names are ignored.
    static bool set_level(const std::string& name);
    static std::optional<LogLevel> parse_level(const std::string& name);

    // Defaults to std::cout. The stream must outlive its use by the logger.
    static void set_output(std::ostream& out);

private:
    explicit Logger(LogLevel level);

    static Logger& instance_for(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static std::atomic<LogLevel> current_level_;
    static std::ostream* output_;
};

} // namespace mip65::utils
