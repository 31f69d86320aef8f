#include <slack_mcp/mcp/transport.hpp>

namespace slack_mcp {

StreamTransport::StreamTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::optional<std::string> StreamTransport::ReadMessage() {
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) continue;
        return line;
    }
    return std::nullopt;
}

Result<void, Error> StreamTransport::WriteMessage(const std::string& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << message << '\n';
    out_.flush();
    if (!out_) {
        return Result<void, Error>::Err(Error{
            "WriteMessage", "stdout", std::nullopt,
            "Failed to write to the output stream", std::nullopt,
            ErrorCategory::Connection});
    }
    return Result<void, Error>::Ok();
}

} // namespace slack_mcp
