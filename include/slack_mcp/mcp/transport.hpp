#pragma once

#include <slack_mcp/core/result.hpp>

#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace slack_mcp {

// ---------------------------------------------------------------------------
// ITransport - duplex message channel the MCP server reads requests from and
// writes responses to. One message is one serialized JSON-RPC object.
// WriteMessage() may be called from several threads at once.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    // Next message, or nullopt once the peer has closed the channel.
    [[nodiscard]] virtual std::optional<std::string> ReadMessage() = 0;

    [[nodiscard]] virtual Result<void, Error> WriteMessage(
        const std::string& message) = 0;
};

// ---------------------------------------------------------------------------
// StreamTransport - newline-delimited JSON over a pair of streams (stdio in
// production, string streams in tests). Blank lines are skipped and a
// trailing '\r' is stripped.
// ---------------------------------------------------------------------------
class StreamTransport : public ITransport {
public:
    explicit StreamTransport(std::istream& in = std::cin,
                             std::ostream& out = std::cout);

    [[nodiscard]] std::optional<std::string> ReadMessage() override;
    [[nodiscard]] Result<void, Error> WriteMessage(
        const std::string& message) override;

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
};

} // namespace slack_mcp
