#pragma once

#include <slack_mcp/core/result.hpp>
#include <slack_mcp/mcp/dispatcher.hpp>
#include <slack_mcp/mcp/transport.hpp>
#include <slack_mcp/mcp/worker_pool.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace slack_mcp {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

// JSON-RPC 2.0 error codes used by the server.
constexpr int kJsonRpcParseError = -32700;
constexpr int kJsonRpcInvalidRequest = -32600;
constexpr int kJsonRpcMethodNotFound = -32601;
constexpr int kJsonRpcInternalError = -32603;

struct ServerInfo {
    std::string name = "enhanced-slack-mcp-server";
    std::string version = "2.0.0";
};

struct McpServerOptions {
    ServerInfo info;
    // 0 answers tools/call inline on the read loop.
    size_t worker_threads = 0;
};

// ---------------------------------------------------------------------------
// McpServer - MCP 2024-11-05 server on top of an ITransport.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
//
// With worker_threads > 0, tools/call requests run on a WorkerPool and their
// responses may be written out of order. Everything else is answered inline.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(const Dispatcher& dispatcher,
              ITransport& transport,
              McpServerOptions options = {});
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Serve until the transport reports end of input. Outstanding tool
    // calls are finished before returning. Fails only when a response
    // cannot be written.
    [[nodiscard]] Result<void, Error> Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    // Parse one raw line, then HandleMessage(). Unparseable input yields a
    // -32700 response.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(
        const std::string& line);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_.load(); }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id) const;

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    Result<void, Error> Send(const nlohmann::json& response);
    void RecordWriteFailure(Error error);
    std::optional<Error> TakeWriteFailure();

    const Dispatcher& dispatcher_;
    ITransport& transport_;
    McpServerOptions options_;
    std::atomic<bool> initialized_{false};

    std::mutex failure_mutex_;
    std::optional<Error> write_failure_;

    // Declared last so it is destroyed first, while the members its jobs
    // touch are still alive.
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace slack_mcp
