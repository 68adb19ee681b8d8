#pragma once

#include <stdexcept>
#include <string>

namespace lambdalang {

/**
 * Error handling for the notation toolkit
 * Structured error reporting with context and recovery suggestions.
 * Only load-time and API-misuse failures are exceptions; a token that
 * cannot be resolved is a normal result, never thrown.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Vocabulary / configuration errors
    CONFIGURATION_ERROR = 100,

    // I/O errors
    FILE_NOT_FOUND = 300
};

class LambdaException : public std::runtime_error {
public:
    explicit LambdaException(ErrorCode code, const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "lambdalang error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Malformed or incomplete vocabulary source / configuration. Fatal at startup.
class ConfigurationError : public LambdaException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : LambdaException(ErrorCode::CONFIGURATION_ERROR, message, context, suggestion) {}
};

class InvalidArgumentError : public LambdaException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : LambdaException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class IOError : public LambdaException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : LambdaException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }

    static void check_config(bool condition, const std::string& message,
                             const std::string& context = "") {
        if (!condition) {
            throw ConfigurationError(message, context);
        }
    }
};

// Macros for common error checking
#define LAMBDALANG_CHECK_ARGUMENT(condition, message) \
    lambdalang::ErrorHandler::check_argument(condition, message, __func__)

#define LAMBDALANG_CHECK_CONFIG(condition, message, where) \
    lambdalang::ErrorHandler::check_config(condition, message, where)

} // namespace lambdalang
