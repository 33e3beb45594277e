#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace voxlink {

/**
 * @brief Error types for different failure modes
 */
enum class ErrorType {
    None,
    IOError,
    ParseError,
    TransientBackend,   ///< Tool-call shaped backend failure, worth a retry
    Backend,            ///< Any other generation backend failure
    Transport,          ///< Socket dropped or could not be opened
    STTDecode,          ///< Empty or unusable transcript
    ToolExecution,      ///< OS refused to open a URL/path/app
    FactStore,          ///< Persisted facts missing or malformed
    InvalidState,
    Unknown
};

inline const char* error_type_name(ErrorType type);

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    std::string to_string() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

/**
 * @brief Thrown by a generation stream when the backend call fails.
 *
 * tool_call_shaped() is true for failures caused by the model's tool
 * invocation (bad function call, HTTP 400 on a tools request); those are
 * retried by the response pipeline.
 */
class BackendError : public std::runtime_error {
public:
    BackendError(const std::string& message, bool tool_call_shaped)
        : std::runtime_error(message), tool_call_shaped_(tool_call_shaped) {}

    bool tool_call_shaped() const { return tool_call_shaped_; }

    ErrorType type() const {
        return tool_call_shaped_ ? ErrorType::TransientBackend : ErrorType::Backend;
    }

private:
    bool tool_call_shaped_;
};

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_transport_error(const std::string& message) {
    return Error(ErrorType::Transport, message);
}

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::IOError: return "IOError";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::TransientBackend: return "TransientBackendError";
        case ErrorType::Backend: return "BackendError";
        case ErrorType::Transport: return "TransportError";
        case ErrorType::STTDecode: return "STTDecodeError";
        case ErrorType::ToolExecution: return "ToolExecutionError";
        case ErrorType::FactStore: return "FactStoreError";
        case ErrorType::InvalidState: return "InvalidState";
        default: return "Unknown";
    }
}

} // namespace voxlink
