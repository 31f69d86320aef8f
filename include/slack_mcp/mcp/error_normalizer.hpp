#pragma once

#include <slack_mcp/core/result.hpp>

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// FailureKind - what went wrong while dispatching one tools/call.
// ---------------------------------------------------------------------------
enum class FailureKind {
    NotFound,          // no tool with the requested name
    MalformedRequest,  // bad wire message or arguments rejected by the schema
    Execution,         // the tool returned Err or threw
    Timeout,           // the tool did not finish within the call timeout
};

// ---------------------------------------------------------------------------
// DispatchFailure - a failure captured at the dispatcher boundary.
//
// `tool` is the requested name (may be empty for malformed requests).
// `message` is already client-safe; NormalizeFailure() decides the final text.
// ---------------------------------------------------------------------------
struct DispatchFailure {
    FailureKind kind = FailureKind::Execution;
    std::string tool;
    std::string message;

    static DispatchFailure NotFound(std::string tool_name);
    static DispatchFailure Malformed(std::string tool_name, std::string detail);
    static DispatchFailure Execution(std::string tool_name, std::string message);
    static DispatchFailure TimedOut(std::string tool_name, long long timeout_ms);
};

/// Fallback for failures that carry no usable description.
inline constexpr const char* kUnknownErrorMessage = "unknown error";

/// Longest message placed in an envelope; longer text is cut.
inline constexpr size_t kMaxErrorMessageLength = 1000;

// The functions below never throw and never return an empty string.

/// Client-visible message for a dispatch failure.
std::string NormalizeFailure(const DispatchFailure& failure) noexcept;

/// Message for whatever was thrown: std::exception, std::string,
/// const char*, nlohmann::json, or anything else.
std::string NormalizeException(std::exception_ptr error) noexcept;

/// Message for a structured failure value (string, {message}, {error}, ...).
std::string NormalizeValue(const nlohmann::json& value) noexcept;

/// Message for an Error returned by a tool. Only Error::message is used so
/// operation names and endpoints stay out of client responses.
std::string NormalizeError(const Error& error) noexcept;

} // namespace slack_mcp
