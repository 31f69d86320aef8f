#pragma once

#include <slack_mcp/config/app_config.hpp>
#include <slack_mcp/core/result.hpp>

#include <string_view>

namespace slack_mcp {

// Parse a YAML config file (sections: slack, server, logging).
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Read SLACK_* and MCP_* environment variables. Unset variables leave the
// field empty; malformed numbers are an error.
Result<AppConfig, Error> LoadFromEnv();

// Parse CLI arguments. --help and --version print and exit the process.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two layers: fields set in `overrides` replace those in `base`.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides);

// Check that values are present where required and within range.
// `require_token` is false for actions that never reach Slack.
Result<void, Error> ValidateConfig(const AppConfig& config, bool require_token);

// ValidateConfig() followed by defaulting every unset field.
Result<RuntimeConfig, Error> ResolveConfig(const AppConfig& config,
                                           bool require_token);

} // namespace slack_mcp
