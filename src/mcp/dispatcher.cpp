#include <slack_mcp/mcp/dispatcher.hpp>

#include <slack_mcp/core/clock.hpp>
#include <slack_mcp/core/log.hpp>

#include <condition_variable>
#include <future>
#include <mutex>
#include <system_error>
#include <thread>

namespace slack_mcp {

namespace {

using CallResult = Result<nlohmann::json, DispatchFailure>;

// Never throws on invalid UTF-8 coming back from a tool.
std::string SafeDump(const nlohmann::json& value, int indent) {
    return value.dump(indent, ' ', false,
                      nlohmann::json::error_handler_t::replace);
}

nlohmann::json TextContent(std::string text) {
    return nlohmann::json::array(
        {{{"type", "text"}, {"text", std::move(text)}}});
}

// "channel,text" - argument values are only logged at debug level.
std::string ArgumentKeys(const nlohmann::json& arguments) {
    std::string keys;
    if (!arguments.is_object()) return keys;
    for (const auto& item : arguments.items()) {
        if (!keys.empty()) keys += ',';
        keys += item.key();
    }
    return keys;
}

long long ElapsedMs(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start)
        .count();
}

CallResult RunTool(const ITool& tool, const nlohmann::json& arguments) {
    try {
        auto result = tool.Execute(arguments);
        if (result.IsErr()) {
            LogDebug("dispatch", "Tool returned error",
                     {{"tool", tool.Name()}, {"detail", result.Error().ToString()}});
            return CallResult::Err(DispatchFailure::Execution(
                tool.Name(), NormalizeError(result.Error())));
        }
        return CallResult::Ok(std::move(result).Value());
    } catch (...) {
        // Whatever the tool threw becomes an error envelope.
        return CallResult::Err(DispatchFailure::Execution(
            tool.Name(), NormalizeException(std::current_exception())));
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolEnvelope
// ---------------------------------------------------------------------------
nlohmann::json ToolEnvelope::ToJson() const {
    nlohmann::json j;
    j["content"] = content;
    if (is_error) {
        j["isError"] = true;
    }
    return j;
}

std::string ToolEnvelope::Text() const {
    if (!content.is_array() || content.empty()) return "";
    return content[0].value("text", "");
}

ToolEnvelope MakeSuccessEnvelope(const nlohmann::json& result) {
    auto text = result.is_string() ? result.get<std::string>()
                                   : SafeDump(result, 2);
    return ToolEnvelope{false, TextContent(std::move(text))};
}

ToolEnvelope MakeErrorEnvelope(const std::string& message,
                               const std::string& tool) {
    nlohmann::json payload;
    payload["success"] = false;
    payload["error"] = message;
    if (!tool.empty()) {
        payload["tool"] = tool;
    }
    payload["timestamp"] = Iso8601Now();
    return ToolEnvelope{true, TextContent(SafeDump(payload, 2))};
}

// ---------------------------------------------------------------------------
// Dispatcher
// ---------------------------------------------------------------------------

// Shared with every helper thread so a helper can report its exit after the
// Dispatcher is gone.
struct Dispatcher::HelperCount {
    std::mutex mutex;
    std::condition_variable done;
    size_t running = 0;
};

Dispatcher::Dispatcher(const ToolRegistry& registry, DispatcherOptions options)
    : registry_(registry),
      options_(std::move(options)),
      helpers_(std::make_shared<HelperCount>()) {}

Dispatcher::~Dispatcher() {
    if (!WaitForHelpers(options_.shutdown_grace)) {
        LogWarn("dispatch", "Tool threads still running at shutdown",
                {{"threads", std::to_string(HelperThreads())}});
    }
}

size_t Dispatcher::HelperThreads() const {
    std::lock_guard<std::mutex> lock(helpers_->mutex);
    return helpers_->running;
}

bool Dispatcher::WaitForHelpers(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(helpers_->mutex);
    return helpers_->done.wait_for(lock, timeout,
                                   [this] { return helpers_->running == 0; });
}

nlohmann::json Dispatcher::ListTools() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : registry_.ListAll()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }
    LogInfo("dispatch", "Listing " + std::to_string(tools.size()) +
                            " available tools");
    return tools;
}

ToolEnvelope Dispatcher::CallTool(const nlohmann::json& params) const noexcept {
    try {
        if (!params.is_object()) {
            return MakeErrorEnvelope(
                NormalizeFailure(DispatchFailure::Malformed(
                    "", "params must be an object")),
                "");
        }
        auto name_it = params.find("name");
        if (name_it == params.end() || !name_it->is_string()) {
            return MakeErrorEnvelope(
                NormalizeFailure(DispatchFailure::Malformed(
                    "", "missing or non-string 'name'")),
                "");
        }
        auto args_it = params.find("arguments");
        const auto arguments =
            args_it == params.end() ? nlohmann::json() : *args_it;
        return CallTool(name_it->get<std::string>(), arguments);
    } catch (const std::exception& e) {
        LogError("dispatch", "Failed to shape tools/call response",
                 {{"error", e.what()}});
        return ToolEnvelope{true, TextContent(kUnknownErrorMessage)};
    }
}

ToolEnvelope Dispatcher::CallTool(const std::string& name,
                                  const nlohmann::json& arguments) const noexcept {
    try {
        const auto start = std::chrono::steady_clock::now();
        LogInfo("dispatch", "Executing tool: " + name,
                {{"args", ArgumentKeys(arguments)}});
        if (GlobalLogger().IsEnabled(LogLevel::Debug)) {
            LogDebug("dispatch", "Arguments for " + name,
                     {{"args", SafeDump(arguments, -1)}});
        }

        auto outcome = Invoke(name, arguments);
        const auto elapsed = ElapsedMs(start);

        if (outcome.IsOk()) {
            LogInfo("dispatch", "Tool '" + name + "' executed successfully",
                    {{"duration_ms", std::to_string(elapsed)}});
            return MakeSuccessEnvelope(outcome.Value());
        }

        const auto& failure = outcome.Error();
        auto message = NormalizeFailure(failure);
        LogError("dispatch",
                 "Tool '" + name + "' execution failed: " + message,
                 {{"duration_ms", std::to_string(elapsed)}});
        return MakeErrorEnvelope(message, failure.tool.empty() ? name : failure.tool);
    } catch (const std::exception& e) {
        LogError("dispatch", "Failed to shape tools/call response",
                 {{"tool", name}, {"error", e.what()}});
        return ToolEnvelope{true, TextContent(kUnknownErrorMessage)};
    }
}

CallResult Dispatcher::Invoke(const std::string& name,
                              const nlohmann::json& arguments) const {
    auto tool = registry_.Lookup(name);
    if (!tool) {
        return CallResult::Err(DispatchFailure::NotFound(name));
    }

    const auto args = arguments.is_null() ? nlohmann::json::object() : arguments;
    if (!args.is_object()) {
        return CallResult::Err(
            DispatchFailure::Malformed(name, "arguments must be an object"));
    }

    if (options_.validator) {
        auto valid = options_.validator->Validate(tool->InputSchema(), args);
        if (valid.IsErr()) {
            return CallResult::Err(DispatchFailure::Malformed(name, valid.Error()));
        }
    }

    if (options_.call_timeout.count() > 0) {
        return ExecuteWithTimeout(std::move(tool), args);
    }
    return RunTool(*tool, args);
}

// Races the tool against the timeout on a helper thread. On expiry the
// helper is left to finish on its own and its result is discarded; it holds
// its own reference to the tool and to the helper count.
CallResult Dispatcher::ExecuteWithTimeout(std::shared_ptr<const ITool> tool,
                                          const nlohmann::json& arguments) const {
    {
        std::lock_guard<std::mutex> lock(helpers_->mutex);
        if (helpers_->running >= options_.max_helper_threads) {
            LogWarn("dispatch", "Too many tool threads still running",
                    {{"tool", tool->Name()},
                     {"threads", std::to_string(helpers_->running)}});
            return CallResult::Err(DispatchFailure::Execution(
                tool->Name(),
                "Too many earlier calls are still running; try again later"));
        }
        ++helpers_->running;
    }

    auto promise = std::make_shared<std::promise<CallResult>>();
    auto future = promise->get_future();

    try {
        std::thread([tool, arguments, promise, helpers = helpers_]() {
            promise->set_value(RunTool(*tool, arguments));
            std::lock_guard<std::mutex> lock(helpers->mutex);
            --helpers->running;
            helpers->done.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(helpers_->mutex);
            --helpers_->running;
        }
        LogError("dispatch", "Failed to start tool thread",
                 {{"tool", tool->Name()}, {"error", e.what()}});
        return CallResult::Err(DispatchFailure::Execution(tool->Name(), kUnknownErrorMessage));
    }

    const auto timeout = options_.call_timeout;
    if (future.wait_for(timeout) == std::future_status::timeout) {
        LogWarn("dispatch", "Tool timed out",
                {{"tool", tool->Name()},
                 {"timeout_ms", std::to_string(timeout.count())}});
        return CallResult::Err(
            DispatchFailure::TimedOut(tool->Name(), timeout.count()));
    }
    return future.get();
}

} // namespace slack_mcp
