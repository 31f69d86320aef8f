#pragma once

#include <slack_mcp/core/log.hpp>
#include <slack_mcp/core/types.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// Config layers. Every field is optional so that a YAML file, the
// environment and the command line can each set a subset; MergeConfigs()
// stacks them and ResolveConfig() fills in defaults.
// ---------------------------------------------------------------------------

struct SlackConfig {
    std::optional<std::string> bot_token;
    std::optional<std::string> user_token;
    std::optional<std::string> api_url;
    std::optional<int> timeout_ms;
    std::optional<int> max_retries;
};

struct ServerConfig {
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<int> tool_timeout_ms;
    std::optional<int> worker_threads;
    std::optional<bool> validate_arguments;
};

struct LoggingConfig {
    std::optional<std::string> level;
    std::optional<bool> json;
    std::optional<std::string> file;
};

struct AppConfig {
    SlackConfig slack;
    ServerConfig server;
    LoggingConfig logging;

    // Command-line only.
    std::optional<std::string> config_file;
    bool check = false;
    bool list_tools = false;
};

// ---------------------------------------------------------------------------
// RuntimeConfig - the validated, fully defaulted result of the layers.
// ---------------------------------------------------------------------------
struct RuntimeConfig {
    // Absent only when no token was required (--list-tools).
    std::optional<SlackToken> bot_token;
    std::optional<SlackToken> user_token;
    std::string api_url = "https://slack.com/api";
    std::chrono::milliseconds api_timeout{30000};
    int max_retries = 3;

    std::string server_name = "enhanced-slack-mcp-server";
    std::string server_version = "2.0.0";
    std::chrono::milliseconds tool_timeout{0};
    size_t worker_threads = 0;
    bool validate_arguments = true;

    LogLevel log_level = LogLevel::Info;
    bool log_json = false;
    std::optional<std::string> log_file;
};

} // namespace slack_mcp
