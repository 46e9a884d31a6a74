#pragma once

#include <stdexcept>
#include <string>

namespace typo {

/**
 * Structured errors for the typo pipeline.
 * Library code throws; the CLI maps ErrorCode to a process exit status.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // I/O errors
    FILE_NOT_FOUND = 300,
    READ_FAILED = 301,

    // Internal errors
    INTERNAL_ERROR = 500
};

class TypoException : public std::runtime_error {
public:
    explicit TypoException(ErrorCode code, const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "typo error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public TypoException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : TypoException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Raised when an input file cannot be opened or read. path() names the file.
class IOError : public TypoException {
public:
    explicit IOError(const std::string& path, const std::string& reason,
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : TypoException(code, path + ": " + reason)
        , path_(path)
        , reason_(reason) {}

    const std::string& path() const noexcept { return path_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string path_;
    std::string reason_;
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw TypoException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

// Macros for common error checking
#define TYPO_CHECK(condition, code, message) \
    typo::ErrorHandler::check_condition(condition, code, message, __func__)

#define TYPO_CHECK_ARGUMENT(condition, message) \
    typo::ErrorHandler::check_argument(condition, message, __func__)

} // namespace typo
