#include <slack_mcp/config/config_loader.hpp>

#include <slack_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

namespace slack_mcp {

namespace {

constexpr int kMaxRetriesLimit = 10;
constexpr int kMaxWorkerThreads = 64;

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

template <typename T>
void Override(std::optional<T>& target, const std::optional<T>& source) {
    if (source.has_value()) {
        target = source;
    }
}

// Set `target` from a scalar child of `node`, if present.
template <typename T>
void ReadScalar(const YAML::Node& node, const char* key, std::optional<T>& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

std::optional<std::string> EnvString(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return std::nullopt;
    return std::string(value);
}

Result<std::optional<int>, Error> EnvInt(const char* name) {
    auto text = EnvString(name);
    if (!text) return Result<std::optional<int>, Error>::Ok(std::nullopt);
    try {
        size_t consumed = 0;
        int value = std::stoi(*text, &consumed);
        if (consumed == text->size()) {
            return Result<std::optional<int>, Error>::Ok(value);
        }
    } catch (const std::exception&) {
        // Reported below.
    }
    return Result<std::optional<int>, Error>::Err(MakeConfigError(
        std::string("Invalid ") + name + ": '" + *text + "' is not an integer"));
}

bool IsHttpUrl(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        auto root = YAML::LoadFile(std::string(file_path));

        // -- Slack --
        if (const auto slack = root["slack"]) {
            ReadScalar(slack, "bot_token", config.slack.bot_token);
            ReadScalar(slack, "user_token", config.slack.user_token);
            ReadScalar(slack, "api_url", config.slack.api_url);
            ReadScalar(slack, "timeout_ms", config.slack.timeout_ms);
            ReadScalar(slack, "max_retries", config.slack.max_retries);
        }

        // -- Server --
        if (const auto server = root["server"]) {
            ReadScalar(server, "name", config.server.name);
            ReadScalar(server, "version", config.server.version);
            ReadScalar(server, "tool_timeout_ms", config.server.tool_timeout_ms);
            ReadScalar(server, "worker_threads", config.server.worker_threads);
            ReadScalar(server, "validate_arguments", config.server.validate_arguments);
        }

        // -- Logging --
        if (const auto logging = root["logging"]) {
            ReadScalar(logging, "level", config.logging.level);
            ReadScalar(logging, "json", config.logging.json);
            ReadScalar(logging, "file", config.logging.file);
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromEnv() {
    AppConfig config;

    config.slack.bot_token = EnvString("SLACK_BOT_TOKEN");
    config.slack.user_token = EnvString("SLACK_USER_TOKEN");
    config.slack.api_url = EnvString("SLACK_API_URL");
    config.logging.level = EnvString("SLACK_LOG_LEVEL");
    config.server.name = EnvString("MCP_SERVER_NAME");
    config.server.version = EnvString("MCP_SERVER_VERSION");

    struct IntVar {
        const char* name;
        std::optional<int>* target;
    };
    const IntVar int_vars[] = {
        {"SLACK_API_TIMEOUT_MS", &config.slack.timeout_ms},
        {"SLACK_API_MAX_RETRIES", &config.slack.max_retries},
        {"MCP_TOOL_TIMEOUT_MS", &config.server.tool_timeout_ms},
        {"MCP_WORKER_THREADS", &config.server.worker_threads},
    };
    for (const auto& var : int_vars) {
        auto value = EnvInt(var.name);
        if (value.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(value).Error());
        }
        *var.target = value.Value();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("slack-mcp", kVersion);
    program.add_description(
        "MCP server exposing Slack Web API tools over stdio (JSON-RPC 2.0).");

    // Slack
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--bot-token")
        .help("Slack bot token (xoxb-...); prefer SLACK_BOT_TOKEN");
    program.add_argument("--user-token")
        .help("Slack user token (xoxp-...), needed for search");
    program.add_argument("--api-url")
        .help("Slack Web API base URL");
    program.add_argument("--timeout-ms")
        .help("Slack HTTP timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--max-retries")
        .help("Retries for rate-limited or failed Slack calls")
        .scan<'i', int>();

    // Server
    program.add_argument("--tool-timeout-ms")
        .help("Upper bound for a single tool call (0 = none)")
        .scan<'i', int>();
    program.add_argument("--workers")
        .help("Threads for concurrent tools/call requests (0 = inline)")
        .scan<'i', int>();
    program.add_argument("--no-validate")
        .help("Skip input schema validation of tool arguments")
        .default_value(false)
        .implicit_value(true);

    // Logging
    program.add_argument("--log-level")
        .help("DEBUG, INFO, WARN or ERROR");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");

    // Actions
    program.add_argument("--check")
        .help("Verify the Slack credentials and exit")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--list-tools")
        .help("Print the tool catalog as JSON and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }

    // Slack
    if (auto val = program.present("--bot-token")) {
        config.slack.bot_token = *val;
    }
    if (auto val = program.present("--user-token")) {
        config.slack.user_token = *val;
    }
    if (auto val = program.present("--api-url")) {
        config.slack.api_url = *val;
    }
    if (auto val = program.present<int>("--timeout-ms")) {
        config.slack.timeout_ms = *val;
    }
    if (auto val = program.present<int>("--max-retries")) {
        config.slack.max_retries = *val;
    }

    // Server
    if (auto val = program.present<int>("--tool-timeout-ms")) {
        config.server.tool_timeout_ms = *val;
    }
    if (auto val = program.present<int>("--workers")) {
        config.server.worker_threads = *val;
    }
    if (program.get<bool>("--no-validate")) {
        config.server.validate_arguments = false;
    }

    // Logging
    if (auto val = program.present("--log-level")) {
        config.logging.level = *val;
    }
    if (program.get<bool>("--log-json")) {
        config.logging.json = true;
    }
    if (auto val = program.present("--log-file")) {
        config.logging.file = *val;
    }

    // Actions
    config.check = program.get<bool>("--check");
    config.list_tools = program.get<bool>("--list-tools");

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides) {
    AppConfig merged = base;

    Override(merged.slack.bot_token, overrides.slack.bot_token);
    Override(merged.slack.user_token, overrides.slack.user_token);
    Override(merged.slack.api_url, overrides.slack.api_url);
    Override(merged.slack.timeout_ms, overrides.slack.timeout_ms);
    Override(merged.slack.max_retries, overrides.slack.max_retries);

    Override(merged.server.name, overrides.server.name);
    Override(merged.server.version, overrides.server.version);
    Override(merged.server.tool_timeout_ms, overrides.server.tool_timeout_ms);
    Override(merged.server.worker_threads, overrides.server.worker_threads);
    Override(merged.server.validate_arguments, overrides.server.validate_arguments);

    Override(merged.logging.level, overrides.logging.level);
    Override(merged.logging.json, overrides.logging.json);
    Override(merged.logging.file, overrides.logging.file);

    Override(merged.config_file, overrides.config_file);
    merged.check = base.check || overrides.check;
    merged.list_tools = base.list_tools || overrides.list_tools;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config, bool require_token) {
    const auto& slack = config.slack;

    if (slack.bot_token.has_value()) {
        auto token = SlackToken::Create(*slack.bot_token);
        if (token.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid bot token: " + token.Error()));
        }
    } else if (require_token) {
        return Result<void, Error>::Err(MakeConfigError(
            "Missing Slack bot token. Set SLACK_BOT_TOKEN or pass --bot-token."));
    }
    if (slack.user_token.has_value()) {
        auto token = SlackToken::Create(*slack.user_token);
        if (token.IsErr()) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid user token: " + token.Error()));
        }
    }
    if (slack.api_url.has_value() && !IsHttpUrl(*slack.api_url)) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid API URL: '" + *slack.api_url + "' (expected http:// or https://)"));
    }
    if (slack.timeout_ms.has_value() && *slack.timeout_ms <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid timeout_ms: must be greater than 0"));
    }
    if (slack.max_retries.has_value() &&
        (*slack.max_retries < 0 || *slack.max_retries > kMaxRetriesLimit)) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid max_retries: must be between 0 and " +
            std::to_string(kMaxRetriesLimit)));
    }

    const auto& server = config.server;
    if (server.name.has_value() && server.name->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server name must not be empty"));
    }
    if (server.version.has_value() && server.version->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Server version must not be empty"));
    }
    if (server.tool_timeout_ms.has_value() && *server.tool_timeout_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid tool_timeout_ms: must not be negative"));
    }
    if (server.worker_threads.has_value() &&
        (*server.worker_threads < 0 || *server.worker_threads > kMaxWorkerThreads)) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid worker_threads: must be between 0 and " +
            std::to_string(kMaxWorkerThreads)));
    }

    if (config.logging.level.has_value() &&
        !ParseLogLevel(*config.logging.level).has_value()) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid log level: '" + *config.logging.level +
            "' (expected DEBUG, INFO, WARN or ERROR)"));
    }
    if (config.logging.file.has_value() && config.logging.file->empty()) {
        return Result<void, Error>::Err(MakeConfigError("Log file path must not be empty"));
    }

    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<RuntimeConfig, Error> ResolveConfig(const AppConfig& config,
                                           bool require_token) {
    auto valid = ValidateConfig(config, require_token);
    if (valid.IsErr()) {
        return Result<RuntimeConfig, Error>::Err(std::move(valid).Error());
    }

    RuntimeConfig runtime;
    if (config.slack.bot_token) {
        runtime.bot_token = SlackToken::Create(*config.slack.bot_token).Value();
    }
    if (config.slack.user_token) {
        runtime.user_token = SlackToken::Create(*config.slack.user_token).Value();
    }
    if (config.slack.api_url) {
        runtime.api_url = *config.slack.api_url;
        while (!runtime.api_url.empty() && runtime.api_url.back() == '/') {
            runtime.api_url.pop_back();
        }
    }
    if (config.slack.timeout_ms) {
        runtime.api_timeout = std::chrono::milliseconds(*config.slack.timeout_ms);
    }
    if (config.slack.max_retries) {
        runtime.max_retries = *config.slack.max_retries;
    }

    if (config.server.name) runtime.server_name = *config.server.name;
    if (config.server.version) runtime.server_version = *config.server.version;
    if (config.server.tool_timeout_ms) {
        runtime.tool_timeout = std::chrono::milliseconds(*config.server.tool_timeout_ms);
    }
    if (config.server.worker_threads) {
        runtime.worker_threads = static_cast<size_t>(*config.server.worker_threads);
    }
    if (config.server.validate_arguments) {
        runtime.validate_arguments = *config.server.validate_arguments;
    }

    if (config.logging.level) {
        runtime.log_level = *ParseLogLevel(*config.logging.level);
    }
    if (config.logging.json) runtime.log_json = *config.logging.json;
    runtime.log_file = config.logging.file;

    return Result<RuntimeConfig, Error>::Ok(std::move(runtime));
}

} // namespace slack_mcp
