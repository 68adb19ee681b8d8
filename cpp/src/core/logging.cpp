#include "lambdalang/logging.hpp"
#include "lambdalang/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace lambdalang {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARNING:  return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

} // namespace

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "trace") out = LogLevel::TRACE;
    else if (val == "debug") out = LogLevel::DEBUG;
    else if (val == "info") out = LogLevel::INFO;
    else if (val == "warn" || val == "warning") out = LogLevel::WARNING;
    else if (val == "error") out = LogLevel::ERROR;
    else if (val == "critical" || val == "fatal") out = LogLevel::CRITICAL;
    else if (val == "off") out = LogLevel::OFF;
    else return false;
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return "trace";
        case LogLevel::DEBUG:    return "debug";
        case LogLevel::INFO:     return "info";
        case LogLevel::WARNING:  return "warn";
        case LogLevel::ERROR:    return "error";
        case LogLevel::CRITICAL: return "critical";
        case LogLevel::OFF:      return "off";
    }
    return "info";
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::mutex mutex;

    Impl() {
        logger = make_logger(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    static std::shared_ptr<spdlog::logger> make_logger(spdlog::sink_ptr sink) {
        auto result = std::make_shared<spdlog::logger>("lambdalang", std::move(sink));
        result->set_pattern(kPattern);
        // Filtering happens in Logger::log; let everything through here
        result->set_level(spdlog::level::trace);
        result->flush_on(spdlog::level::warn);
        return result;
    }

    void write(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        logger->log(to_spdlog(level), message);
    }

    void set_output_file(const std::string& filename) {
        std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
        try {
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
        } catch (const spdlog::spdlog_ex& e) {
            throw IOError("Could not open log file: " + filename, e.what());
        }
        std::lock_guard<std::mutex> lock(mutex);
        logger->flush();
        logger = make_logger(std::move(sink));
    }

    void reset_output() {
        std::lock_guard<std::mutex> lock(mutex);
        logger->flush();
        logger = make_logger(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()), level_(LogLevel::INFO) {}

Logger::~Logger() = default;

void Logger::write(LogLevel level, const std::string& message) {
    pImpl->write(level, message);
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

void Logger::set_output_file(const std::string& filename) {
    pImpl->set_output_file(filename);
}

void Logger::reset_output() {
    pImpl->reset_output();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->logger->flush();
}

} // namespace lambdalang
