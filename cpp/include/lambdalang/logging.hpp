#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace lambdalang {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

// Parse "trace" / "debug" / "info" / "warn" / "error" / "critical" / "off".
// Returns false and leaves `out` untouched on unknown names.
bool parse_log_level(const std::string& name, LogLevel& out);

const char* log_level_name(LogLevel level);

/**
 * Process-wide logger backed by spdlog.
 * Writes to stderr by default so command output on stdout stays clean.
 */
class Logger {
public:
    static Logger& getInstance();

    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (level < level_) return;
        std::ostringstream msg;
        format_message(msg, std::forward<Args>(args)...);
        write(level, msg.str());
    }

    void set_level(LogLevel level);
    LogLevel level() const { return level_; }

    // Redirect output to a file (appending). Throws IOError if it cannot be opened.
    void set_output_file(const std::string& filename);

    // Back to the default stderr sink
    void reset_output();

    void flush();

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& message);

    void format_message(std::ostringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::ostringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    class Impl;
    std::unique_ptr<Impl> pImpl;
    LogLevel level_;
};

inline void set_log_level(LogLevel level) {
    Logger::getInstance().set_level(level);
}

// Convenience macros
#define LOG_TRACE(...)    ::lambdalang::Logger::getInstance().log(::lambdalang::LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...)    ::lambdalang::Logger::getInstance().log(::lambdalang::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)     ::lambdalang::Logger::getInstance().log(::lambdalang::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARNING(...)  ::lambdalang::Logger::getInstance().log(::lambdalang::LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERROR(...)    ::lambdalang::Logger::getInstance().log(::lambdalang::LogLevel::ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) ::lambdalang::Logger::getInstance().log(::lambdalang::LogLevel::CRITICAL, __VA_ARGS__)

} // namespace lambdalang
