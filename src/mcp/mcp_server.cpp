#include <slack_mcp/mcp/mcp_server.hpp>

#include <slack_mcp/core/log.hpp>

#include <utility>

namespace slack_mcp {

namespace {

bool IsToolsCall(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("id")) return false;
    auto it = message.find("method");
    return it != message.end() && it->is_string() && *it == "tools/call";
}

} // anonymous namespace

McpServer::McpServer(const Dispatcher& dispatcher,
                     ITransport& transport,
                     McpServerOptions options)
    : dispatcher_(dispatcher),
      transport_(transport),
      options_(std::move(options)) {
    if (options_.worker_threads > 0) {
        pool_ = std::make_unique<WorkerPool>(options_.worker_threads);
    }
}

McpServer::~McpServer() = default;

Result<void, Error> McpServer::Run() {
    LogInfo("mcp", "Server running on stdio",
            {{"name", options_.info.name},
             {"version", options_.info.version},
             {"tools", std::to_string(dispatcher_.Registry().Size())},
             {"workers", std::to_string(options_.worker_threads)}});

    while (auto line = transport_.ReadMessage()) {
        if (auto failure = TakeWriteFailure()) {
            return Result<void, Error>::Err(std::move(*failure));
        }

        auto message = nlohmann::json::parse(*line, nullptr,
                                             /*allow_exceptions=*/false);
        if (pool_ && !message.is_discarded() && IsToolsCall(message)) {
            pool_->Submit([this, message = std::move(message)] {
                auto response = HandleMessage(message);
                if (!response) return;
                auto sent = Send(*response);
                if (sent.IsErr()) {
                    RecordWriteFailure(std::move(sent).Error());
                }
            });
            continue;
        }

        std::optional<nlohmann::json> response;
        if (message.is_discarded()) {
            LogWarn("mcp", "Discarding unparseable message",
                    {{"bytes", std::to_string(line->size())}});
            response = MakeError(nullptr, kJsonRpcParseError, "Parse error");
        } else {
            response = HandleMessage(message);
        }
        if (response) {
            auto sent = Send(*response);
            if (sent.IsErr()) return sent;
        }
    }

    if (pool_) pool_->Drain();
    if (auto failure = TakeWriteFailure()) {
        return Result<void, Error>::Err(std::move(*failure));
    }

    LogInfo("mcp", "Input closed, shutting down");
    return Result<void, Error>::Ok();
}

std::optional<nlohmann::json> McpServer::HandleLine(const std::string& line) {
    auto message = nlohmann::json::parse(line, nullptr,
                                         /*allow_exceptions=*/false);
    if (message.is_discarded()) {
        return MakeError(nullptr, kJsonRpcParseError, "Parse error");
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (message.is_array()) {
        return MakeError(nullptr, kJsonRpcInvalidRequest,
                         "Batch requests are not supported");
    }
    if (!message.is_object()) {
        return MakeError(nullptr, kJsonRpcInvalidRequest, "Invalid Request");
    }

    // Notifications have no "id".
    const bool is_notification = !message.contains("id");
    const nlohmann::json id = is_notification ? nlohmann::json() : message["id"];

    auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        if (is_notification) return std::nullopt;
        return MakeError(id, kJsonRpcInvalidRequest, "Invalid JSON-RPC version");
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (is_notification) return std::nullopt;
        return MakeError(id, kJsonRpcInvalidRequest, "Missing 'method'");
    }
    const auto method = method_it->get<std::string>();

    if (is_notification) {
        LogDebug("mcp", "Notification received", {{"method", method}});
        return std::nullopt;
    }

    nlohmann::json params = nlohmann::json::object();
    auto params_it = message.find("params");
    if (params_it != message.end() && !params_it->is_null()) {
        params = *params_it;
    }

    try {
        if (method == "initialize") {
            return HandleInitialize(params, id);
        } else if (method == "ping") {
            return MakeResult(id, nlohmann::json::object());
        } else if (method == "tools/list") {
            return HandleToolsList(id);
        } else if (method == "tools/call") {
            return HandleToolsCall(params, id);
        }
    } catch (const std::exception& e) {
        LogError("mcp", "Request failed", {{"method", method}, {"error", e.what()}});
        return MakeError(id, kJsonRpcInternalError, "Internal error");
    }

    LogDebug("mcp", "Unknown method", {{"method", method}});
    return MakeError(id, kJsonRpcMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    std::string client = "unknown";
    if (params.is_object()) {
        auto info = params.find("clientInfo");
        if (info != params.end() && info->is_object()) {
            client = info->value("name", client);
        }
    }
    LogInfo("mcp", "Client initialized", {{"client", client}});

    nlohmann::json result;
    result["protocolVersion"] = kMcpProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", options_.info.name},
        {"version", options_.info.version}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    return MakeResult(id, {{"tools", dispatcher_.ListTools()}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) const {
    // Bad params are a tool-level failure, answered with an error envelope.
    return MakeResult(id, dispatcher_.CallTool(params).ToJson());
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

Result<void, Error> McpServer::Send(const nlohmann::json& response) {
    return transport_.WriteMessage(response.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void McpServer::RecordWriteFailure(Error error) {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    if (!write_failure_) {
        LogError("mcp", "Failed to write response", {{"error", error.message}});
        write_failure_ = std::move(error);
    }
}

std::optional<Error> McpServer::TakeWriteFailure() {
    std::lock_guard<std::mutex> lock(failure_mutex_);
    auto failure = std::move(write_failure_);
    write_failure_.reset();
    return failure;
}

} // namespace slack_mcp
