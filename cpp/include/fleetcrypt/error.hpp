#pragma once

#include <stdexcept>
#include <string>

namespace fleetcrypt {

/**
 * Error reporting for fleetcrypt.
 *
 * Exceptions are reserved for faults: bad arguments from the caller and
 * persistence failures. Absent routing fields, empty suggestion lists and
 * duplicate messages are ordinary results and never thrown.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // I/O errors
    FILE_NOT_FOUND = 300,
    PERMISSION_DENIED = 301,
    WRITE_FAILED = 302,
    STORE_LOCKED = 303,

    INTERNAL_ERROR = 500
};

class FleetcryptException : public std::runtime_error {
public:
    explicit FleetcryptException(ErrorCode code, const std::string& message,
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
        std::string result = "fleetcrypt error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
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

class InvalidArgumentError : public FleetcryptException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : FleetcryptException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class IOError : public FleetcryptException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "",
                     ErrorCode code = ErrorCode::WRITE_FAILED)
        : FleetcryptException(code, message, context, suggestion) {}
};

// Raised when another process already holds a store's journal.
class StoreLockedError : public IOError {
public:
    explicit StoreLockedError(const std::string& path)
        : IOError("Store is locked by another process", path,
                  "Close the other fleetcrypt session first",
                  ErrorCode::STORE_LOCKED) {}
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define FLEETCRYPT_CHECK_ARGUMENT(condition, message) \
    fleetcrypt::ErrorHandler::check_argument(condition, message, __func__)

#define FLEETCRYPT_THROW(code, message) \
    throw fleetcrypt::FleetcryptException(code, message, __func__)

#define FLEETCRYPT_THROW_INVALID_ARG(message) \
    throw fleetcrypt::InvalidArgumentError(message, __func__)

} // namespace fleetcrypt
