#include <catch2/catch_test_macros.hpp>

#include <slack_mcp/slack/slack_errors.hpp>

#include <string>

using namespace slack_mcp;

// ===========================================================================
// FriendlySlackMessage / DescribeSlackError
// ===========================================================================

TEST_CASE("FriendlySlackMessage: known codes", "[slack][errors]") {
    auto message = FriendlySlackMessage("channel_not_found");
    REQUIRE(message.has_value());
    CHECK(*message == "Channel not found. Please check the channel ID or name.");

    REQUIRE(FriendlySlackMessage("invalid_auth").has_value());
    REQUIRE(FriendlySlackMessage("ratelimited").has_value());
}

TEST_CASE("FriendlySlackMessage: unknown code", "[slack][errors]") {
    CHECK_FALSE(FriendlySlackMessage("some_new_error").has_value());
    CHECK_FALSE(FriendlySlackMessage("").has_value());
}

TEST_CASE("DescribeSlackError: code is appended", "[slack][errors]") {
    CHECK(DescribeSlackError("not_in_channel") ==
          "Bot is not a member of this channel. Please invite the bot first. "
          "(not_in_channel)");
    CHECK(DescribeSlackError("weird_failure") ==
          "Slack API error: weird_failure (weird_failure)");
}

// ===========================================================================
// CategoryForSlackError / IsRetryableSlackError
// ===========================================================================

TEST_CASE("CategoryForSlackError: mapping", "[slack][errors]") {
    CHECK(CategoryForSlackError("invalid_auth") == ErrorCategory::Authentication);
    CHECK(CategoryForSlackError("missing_scope") == ErrorCategory::Permission);
    CHECK(CategoryForSlackError("user_not_found") == ErrorCategory::NotFound);
    CHECK(CategoryForSlackError("ratelimited") == ErrorCategory::RateLimited);
    CHECK(CategoryForSlackError("name_taken") == ErrorCategory::InvalidArgument);
    CHECK(CategoryForSlackError("service_unavailable") == ErrorCategory::Connection);
    CHECK(CategoryForSlackError("never_heard_of_it") == ErrorCategory::SlackApi);
}

TEST_CASE("IsRetryableSlackError: transient codes only", "[slack][errors]") {
    CHECK(IsRetryableSlackError("ratelimited"));
    CHECK(IsRetryableSlackError("rate_limited"));
    CHECK(IsRetryableSlackError("internal_error"));
    CHECK(IsRetryableSlackError("service_unavailable"));
    CHECK_FALSE(IsRetryableSlackError("channel_not_found"));
    CHECK_FALSE(IsRetryableSlackError("invalid_auth"));
}

// ===========================================================================
// MakeSlackApiError
// ===========================================================================

TEST_CASE("MakeSlackApiError: populates all fields", "[slack][errors]") {
    auto e = MakeSlackApiError("chat.postMessage", "channel_not_found");
    CHECK(e.operation == "SlackCall");
    CHECK(e.endpoint == "chat.postMessage");
    CHECK_FALSE(e.http_status.has_value());
    CHECK(e.slack_error == std::optional<std::string>("channel_not_found"));
    CHECK(e.category == ErrorCategory::NotFound);
    CHECK(e.message ==
          "Channel not found. Please check the channel ID or name. (channel_not_found)");
}
