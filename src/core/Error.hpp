// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcprt
{

/// @brief Error codes for categorizing failures across the runtime.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    NotFound,
    ServerNotFound,
    ServerNotRunning,
    LaunchError,
    StopError,
    TransportError,
    ProtocolError,
    FunctionNotFound,
    FunctionExecutionError,
    DispatcherOverloaded,
};

/// @brief Returns a stable, human readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ConfigError: return "config_error";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::ServerNotFound: return "server_not_found";
        case ErrorCode::ServerNotRunning: return "server_not_running";
        case ErrorCode::LaunchError: return "launch_error";
        case ErrorCode::StopError: return "stop_error";
        case ErrorCode::TransportError: return "transport_error";
        case ErrorCode::ProtocolError: return "protocol_error";
        case ErrorCode::FunctionNotFound: return "function_not_found";
        case ErrorCode::FunctionExecutionError: return "function_execution_error";
        case ErrorCode::DispatcherOverloaded: return "dispatcher_overloaded";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace mcprt

template <>
struct std::formatter<mcprt::Error>: std::formatter<std::string>
{
    auto format(const mcprt::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcprt::errorCodeName(error.code), error.message), ctx);
    }
};
