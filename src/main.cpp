#include <slack_mcp/config/config_loader.hpp>
#include <slack_mcp/core/log.hpp>
#include <slack_mcp/core/terminal.hpp>
#include <slack_mcp/core/version.hpp>
#include <slack_mcp/mcp/dispatcher.hpp>
#include <slack_mcp/mcp/error_normalizer.hpp>
#include <slack_mcp/mcp/mcp_server.hpp>
#include <slack_mcp/mcp/schema_validator.hpp>
#include <slack_mcp/mcp/tool_registry.hpp>
#include <slack_mcp/mcp/transport.hpp>
#include <slack_mcp/slack/slack_client.hpp>
#include <slack_mcp/slack/slack_tools.hpp>

#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

// Owned here so the signal watcher can flush it before exiting. Never
// destroyed, like the global logger that writes to it.
std::ofstream& LogFile() {
    static auto* file = new std::ofstream;
    return *file;
}

// Startup errors happen before (or instead of) the configured logger.
void PrintError(const slack_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Stands in for Slack when only the tool catalog is needed.
class OfflineSlackClient : public slack_mcp::ISlackClient {
public:
    slack_mcp::Result<nlohmann::json, slack_mcp::Error> Call(
        const std::string& method, const nlohmann::json& /*params*/,
        slack_mcp::TokenKind /*token*/) override {
        return slack_mcp::Result<nlohmann::json, slack_mcp::Error>::Err(
            slack_mcp::Error{"SlackCall", method, std::nullopt,
                             "Slack is not reachable in catalog mode",
                             std::nullopt,
                             slack_mcp::ErrorCategory::Connection});
    }

    bool HasUserToken() const override { return false; }
};

bool InitLogging(const slack_mcp::RuntimeConfig& config) {
    using namespace slack_mcp;

    std::ostream* out = &std::cerr;
    bool use_color = ShouldColorLogs();
    if (config.log_file) {
        auto& file = LogFile();
        file.open(*config.log_file, std::ios::out | std::ios::app);
        if (!file) {
            std::cerr << "Error: cannot open log file: " << *config.log_file << "\n";
            return false;
        }
        out = &file;
        use_color = false;
    }

    if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(*out), config.log_level);
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color, *out),
                         config.log_level);
    }
    return true;
}

// SIGINT/SIGTERM are blocked process-wide and consumed by one thread with
// sigwait(), so logging never runs in signal context. Must be called before
// any other thread is started; new threads inherit the mask.
void StartSignalWatcher() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        slack_mcp::LogWarn("main", "Could not install signal handling");
        return;
    }

    std::thread([signals]() {
        int received = 0;
        if (sigwait(&signals, &received) != 0) {
            return;
        }
        const char* name = received == SIGINT ? "SIGINT" : "SIGTERM";
        slack_mcp::LogInfo("main", std::string("Received ") + name +
                                       ", shutting down gracefully...");
        std::cout.flush();
        std::cerr.flush();
        LogFile().flush();
        // In-flight calls are abandoned; nothing else needs unwinding.
        std::_Exit(kExitSuccess);
    }).detach();
}

int ListTools() {
    using namespace slack_mcp;

    ToolRegistry registry;
    auto registered =
        RegisterSlackTools(registry, std::make_shared<OfflineSlackClient>());
    if (registered.IsErr()) {
        PrintError(registered.Error());
        return kExitFailure;
    }
    Dispatcher dispatcher(registry);
    std::cout << dispatcher.ListTools().dump(2) << "\n";
    return kExitSuccess;
}

int CheckConnection(slack_mcp::ISlackClient& slack) {
    using namespace slack_mcp;

    auto auth = slack.Call("auth.test", nlohmann::json::object());
    if (auth.IsErr()) {
        LogError("main", "Slack connection test failed",
                 {{"error", auth.Error().ToString()}});
        return kExitFailure;
    }
    const auto& body = auth.Value();
    LogInfo("main", "Slack connection test successful",
            {{"user", body.value("user", "")},
             {"team", body.value("team", "")},
             {"url", body.value("url", "")}});
    return kExitSuccess;
}

int Serve(const slack_mcp::RuntimeConfig& config, bool check_only) {
    using namespace slack_mcp;

    SlackClientOptions client_options;
    client_options.api_url = config.api_url;
    client_options.timeout = config.api_timeout;
    client_options.max_retries = config.max_retries;

    auto slack = std::make_shared<SlackClient>(*config.bot_token,
                                               config.user_token,
                                               client_options);
    if (check_only) {
        return CheckConnection(*slack);
    }

    ToolRegistry registry;
    auto registered = RegisterSlackTools(registry, slack);
    if (registered.IsErr()) {
        LogError("main", "Tool registration failed",
                 {{"error", registered.Error().ToString()}});
        return kExitFailure;
    }

    DispatcherOptions dispatcher_options;
    if (config.validate_arguments) {
        dispatcher_options.validator = std::make_shared<JsonSchemaValidator>();
    }
    dispatcher_options.call_timeout = config.tool_timeout;
    Dispatcher dispatcher(registry, dispatcher_options);

    McpServerOptions server_options;
    server_options.info.name = config.server_name;
    server_options.info.version = config.server_version;
    server_options.worker_threads = config.worker_threads;

    LogInfo("main", "Starting MCP server",
            {{"name", config.server_name},
             {"version", config.server_version},
             {"tools", std::to_string(registry.Size())},
             {"workers", std::to_string(config.worker_threads)}});

    if (IsStdinTty()) {
        LogWarn("main", "stdin is a terminal; expecting one JSON-RPC message per line");
    }

    StreamTransport transport(std::cin, std::cout);
    McpServer server(dispatcher, transport, server_options);
    auto ran = server.Run();
    if (ran.IsErr()) {
        LogError("main", "Server stopped on a transport error",
                 {{"error", ran.Error().ToString()}});
        return kExitFailure;
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace slack_mcp;

    // Until the config is known, warnings and errors go to stderr.
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(ShouldColorLogs()),
                     LogLevel::Warn);

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error());
        return kExitFailure;
    }
    const auto cli_layer = std::move(cli).Value();

    AppConfig file_layer;
    if (cli_layer.config_file) {
        auto yaml = LoadFromYaml(*cli_layer.config_file);
        if (yaml.IsErr()) {
            PrintError(yaml.Error());
            return kExitFailure;
        }
        file_layer = std::move(yaml).Value();
    }

    auto env = LoadFromEnv();
    if (env.IsErr()) {
        PrintError(env.Error());
        return kExitFailure;
    }

    // Command line > environment > config file > defaults.
    const auto merged =
        MergeConfigs(MergeConfigs(file_layer, env.Value()), cli_layer);

    if (merged.list_tools) {
        return ListTools();
    }

    auto resolved = ResolveConfig(merged, /*require_token=*/true);
    if (resolved.IsErr()) {
        PrintError(resolved.Error());
        return kExitFailure;
    }
    const auto config = std::move(resolved).Value();

    if (!InitLogging(config)) {
        return kExitFailure;
    }
    StartSignalWatcher();

    LogDebug("main", "slack-mcp " + std::string(kVersion),
             {{"api_url", config.api_url},
              {"validate_arguments", config.validate_arguments ? "true" : "false"},
              {"tool_timeout_ms", std::to_string(config.tool_timeout.count())}});

    int exit_code = kExitFailure;
    try {
        exit_code = Serve(config, merged.check);
    } catch (...) {
        LogError("main", "Fatal error",
                 {{"error", NormalizeException(std::current_exception())}});
    }
    std::cerr.flush();
    LogFile().flush();
    return exit_code;
}
