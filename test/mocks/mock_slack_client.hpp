#pragma once

#include <slack_mcp/slack/i_slack_client.hpp>
#include <slack_mcp/slack/slack_errors.hpp>

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace slack_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockSlackClient - hand-written mock for offline unit testing.
//
// Usage:
//   MockSlackClient mock;
//   mock.EnqueueOk("chat.postMessage", {{"ts", "1700000000.000100"}});
//   auto result = mock.Call("chat.postMessage", {{"channel", "C0123ABCD"}});
//   CHECK(mock.CallCount() == 1);
//   CHECK(mock.Calls()[0].method == "chat.postMessage");
//
// Responses are queued per Web API method and consumed FIFO. If the queue
// for a method is empty, the mock returns a descriptive error rather than
// crashing.
// ---------------------------------------------------------------------------

struct SlackCall {
    std::string method;
    nlohmann::json params;
    TokenKind token;
};

class MockSlackClient : public ISlackClient {
public:
    MockSlackClient() = default;

    // -- Enqueue canned responses -------------------------------------------

    void Enqueue(const std::string& method, Result<nlohmann::json, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[method].push_back(std::move(response));
    }

    // Successful response body; "ok": true is added.
    void EnqueueOk(const std::string& method,
                   nlohmann::json body = nlohmann::json::object()) {
        body["ok"] = true;
        Enqueue(method, Result<nlohmann::json, Error>::Ok(std::move(body)));
    }

    // `"ok": false` response with the given Slack error code.
    void EnqueueSlackError(const std::string& method, const std::string& code) {
        Enqueue(method, Result<nlohmann::json, Error>::Err(
                            MakeSlackApiError(method, code)));
    }

    void SetHasUserToken(bool value) {
        std::lock_guard<std::mutex> lock(mutex_);
        has_user_token_ = value;
    }

    // -- Call history accessors ----------------------------------------------

    [[nodiscard]] std::vector<SlackCall> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    [[nodiscard]] size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    // Calls made to one method, in order.
    [[nodiscard]] std::vector<SlackCall> CallsTo(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SlackCall> out;
        for (const auto& call : calls_) {
            if (call.method == method) out.push_back(call);
        }
        return out;
    }

    [[nodiscard]] std::vector<std::string> Methods() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& call : calls_) {
            out.push_back(call.method);
        }
        return out;
    }

    void Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.clear();
        calls_.clear();
        has_user_token_ = false;
    }

    // -- ISlackClient implementation -----------------------------------------

    Result<nlohmann::json, Error> Call(const std::string& method,
                                       const nlohmann::json& params,
                                       TokenKind token = TokenKind::Bot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({method, params, token});
        auto& queue = responses_[method];
        if (queue.empty()) {
            return Result<nlohmann::json, Error>::Err(Error{
                "SlackCall", method, std::nullopt,
                "MockSlackClient: no response queued for " + method, std::nullopt,
                ErrorCategory::Internal});
        }
        auto response = std::move(queue.front());
        queue.pop_front();
        return response;
    }

    [[nodiscard]] bool HasUserToken() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return has_user_token_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<Result<nlohmann::json, Error>>> responses_;
    std::vector<SlackCall> calls_;
    bool has_user_token_ = false;
};

} // namespace testing
} // namespace slack_mcp
