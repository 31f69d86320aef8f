#pragma once

#include <string>

namespace slack_mcp {

/// Current UTC time as ISO-8601 with millisecond precision,
/// e.g. "2024-05-01T12:34:56.789Z".
std::string Iso8601Now();

/// Current local wall-clock time as HH:MM:SS.
std::string HhMmSsNow();

} // namespace slack_mcp
