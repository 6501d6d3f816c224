// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace mcprunner
{

/// @brief Error codes for categorizing failures across the runner.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    TransportError,
    LaunchError,
    HandshakeError,
    ProtocolError,
    TimeoutError,
    ToolExecutionError,
    ConnectionClosed,
    SessionConfigMismatch,
    SessionNotFound,
    SessionFailed,
};

/// @brief Returns the stable wire name of an error code (e.g. "TimeoutError").
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "UnknownError";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::TransportError: return "TransportError";
        case ErrorCode::LaunchError: return "LaunchError";
        case ErrorCode::HandshakeError: return "HandshakeError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TimeoutError: return "TimeoutError";
        case ErrorCode::ToolExecutionError: return "ToolExecutionError";
        case ErrorCode::ConnectionClosed: return "ConnectionClosedError";
        case ErrorCode::SessionConfigMismatch: return "SessionConfigMismatchError";
        case ErrorCode::SessionNotFound: return "SessionNotFoundError";
        case ErrorCode::SessionFailed: return "SessionFailedError";
    }
    return "UnknownError";
}

/// @brief Represents an error with a code, a descriptive message and optional structured details.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// Server-reported payload, e.g. the JSON-RPC error object or the tool's content array.
    nlohmann::json details;
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
/// @param details Optional structured payload.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message, nlohmann::json details = nullptr)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message), std::move(details) });
}

} // namespace mcprunner

template <>
struct std::formatter<mcprunner::Error>: std::formatter<std::string>
{
    auto format(const mcprunner::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", mcprunner::errorCodeName(error.code), error.message), ctx);
    }
};
