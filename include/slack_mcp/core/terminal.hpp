#pragma once

namespace slack_mcp {

/// Returns true if stderr is a terminal (for colored log output).
bool IsStderrTty();

/// Returns true if stdin is a terminal. An MCP client always attaches a
/// pipe, so a terminal here means the server was started by hand.
bool IsStdinTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Color is used for log output only when stderr is a terminal and
/// NO_COLOR is unset.
bool ShouldColorLogs();

} // namespace slack_mcp
