#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace mcpgate {

// Type aliases
using ServerId = std::string;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    UnsupportedTransport,
    NoAvailablePorts,
    ConnectionFailed,
    InvalidUrl,
    HandshakeFailed,
    ServerNotFound,
    ServerNotRunning,
    MCPCommunication,
    InvalidResponse,
    Timeout,
    ProcessSpawnFailed,
    InvalidArgument,
    InvalidState,
    IoError,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::UnsupportedTransport: return "Unsupported transport";
        case ErrorCode::NoAvailablePorts: return "No available ports";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::InvalidUrl: return "Invalid URL";
        case ErrorCode::HandshakeFailed: return "Handshake failed";
        case ErrorCode::ServerNotFound: return "Server not found";
        case ErrorCode::ServerNotRunning: return "Server not running";
        case ErrorCode::MCPCommunication: return "MCP communication error";
        case ErrorCode::InvalidResponse: return "Invalid response";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ProcessSpawnFailed: return "Process spawn failed";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }

    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }

    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Result type for operations that can fail
template <typename T> class Result {
public:
    // Asio completion handlers default-construct the result slot before it is assigned.
    Result() : data_(Error{ErrorCode::Unknown, "uninitialized result"}) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace mcpgate

// fmt support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<mcpgate::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(mcpgate::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", mcpgate::errorToString(error));
    }
};
