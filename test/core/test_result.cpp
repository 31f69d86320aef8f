#include <catch2/catch_test_macros.hpp>

#include <slack_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace slack_mcp;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok and Err", "[result]") {
    auto ok = Result<int, std::string>::Ok(42);
    REQUIRE(ok.IsOk());
    CHECK(static_cast<bool>(ok));
    CHECK(ok.Value() == 42);

    auto err = Result<int, std::string>::Err("failure");
    REQUIRE(err.IsErr());
    CHECK_FALSE(static_cast<bool>(err));
    CHECK(err.Error() == "failure");
    CHECK(err.ValueOr(7) == 7);
}

TEST_CASE("Result: AndThen stops at the first Err", "[result]") {
    int calls = 0;
    auto half = [&calls](int v) {
        ++calls;
        if (v % 2 != 0) {
            return Result<int, std::string>::Err("odd: " + std::to_string(v));
        }
        return Result<int, std::string>::Ok(v / 2);
    };

    auto r = Result<int, std::string>::Ok(12).AndThen(half).AndThen(half).AndThen(half);
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "odd: 3");
    CHECK(calls == 3);
}

TEST_CASE("Result: Map changes the value type", "[result]") {
    auto r = Result<int, std::string>::Ok(5).Map(
        [](int v) { return std::string(static_cast<size_t>(v), '*'); });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "*****");

    auto e = Result<int, std::string>::Err("x").Map([](int v) { return v + 1; });
    REQUIRE(e.IsErr());
    CHECK(e.Error() == "x");
}

TEST_CASE("Result: move-only values", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(9));
    auto ptr = std::move(r).Value();
    REQUIRE(ptr);
    CHECK(*ptr == 9);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: ToString with all fields", "[error]") {
    Error e{"SlackCall", "chat.postMessage", 429, "Rate limit exceeded",
            std::string("ratelimited"), ErrorCategory::RateLimited};
    CHECK(e.ToString() ==
          "SlackCall [chat.postMessage] (HTTP 429): Rate limit exceeded - Slack: ratelimited");
}

TEST_CASE("Error: ToString without optional fields", "[error]") {
    Error e{"ConfigLoader", "", std::nullopt, "Missing token", std::nullopt,
            ErrorCategory::Config};
    CHECK(e.ToString() == "ConfigLoader: Missing token");
}

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e{"Op", "", std::nullopt, "msg", std::nullopt};
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.CategoryName() == "internal");
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: startup categories exit with 1", "[error]") {
    Error e{"Op", "", std::nullopt, "msg", std::nullopt, ErrorCategory::Config};
    CHECK(e.ExitCode() == 1);
    e.category = ErrorCategory::Registration;
    CHECK(e.ExitCode() == 1);
    CHECK(e.CategoryName() == "registration");
    e.category = ErrorCategory::NotFound;
    CHECK(e.ExitCode() == 2);
    CHECK(e.CategoryName() == "not_found");
}

TEST_CASE("Error: equality includes category", "[error]") {
    Error a{"Op", "", std::nullopt, "msg", std::nullopt, ErrorCategory::NotFound};
    Error b = a;
    CHECK(a == b);
    b.category = ErrorCategory::SlackApi;
    CHECK(a != b);
}

TEST_CASE("Error: ToJson escapes and omits empty fields", "[error]") {
    Error e{"SlackCall", "", std::nullopt, "bad \"quote\"\nline", std::nullopt,
            ErrorCategory::SlackApi};
    auto j = nlohmann::json::parse(e.ToJson());
    REQUIRE(j.contains("error"));
    const auto& inner = j["error"];
    CHECK(inner["message"] == "bad \"quote\"\nline");
    CHECK(inner["category"] == "slack_api");
    CHECK(inner["exit_code"] == 5);
    CHECK_FALSE(inner.contains("endpoint"));
    CHECK_FALSE(inner.contains("http_status"));
    CHECK_FALSE(inner.contains("slack_error"));
}

// ===========================================================================
// Error::FromHttpStatus
// ===========================================================================

TEST_CASE("FromHttpStatus: 401 maps to Authentication", "[error]") {
    auto e = Error::FromHttpStatus("SlackCall", "auth.test", 401);
    CHECK(e.category == ErrorCategory::Authentication);
    CHECK(e.message == "Authentication failed. Please check your Slack bot token.");
    CHECK(e.http_status == 401);
}

TEST_CASE("FromHttpStatus: 403 maps to Permission", "[error]") {
    auto e = Error::FromHttpStatus("SlackCall", "chat.postMessage", 403);
    CHECK(e.category == ErrorCategory::Permission);
    CHECK(e.message ==
          "Permission denied. The bot may not have the required permissions.");
}

TEST_CASE("FromHttpStatus: 404 maps to NotFound", "[error]") {
    auto e = Error::FromHttpStatus("SlackCall", "users.info", 404);
    CHECK(e.category == ErrorCategory::NotFound);
    CHECK(e.message == "Resource not found. Please check the channel or user ID.");
}

TEST_CASE("FromHttpStatus: 429 maps to RateLimited", "[error]") {
    auto e = Error::FromHttpStatus("SlackCall", "users.list", 429);
    CHECK(e.category == ErrorCategory::RateLimited);
    CHECK(e.message == "Rate limit exceeded. Please try again later.");
}

TEST_CASE("FromHttpStatus: 502/503/504 map to Connection", "[error]") {
    for (int status : {502, 503, 504}) {
        auto e = Error::FromHttpStatus("SlackCall", "", status);
        CHECK(e.category == ErrorCategory::Connection);
        CHECK(e.message == "Slack API unavailable");
    }
}

TEST_CASE("FromHttpStatus: extracts the Slack error code from a JSON body", "[error]") {
    auto e = Error::FromHttpStatus("SlackCall", "", 500,
                                   R"({"ok":false,"error":"internal_error"})");
    REQUIRE(e.slack_error.has_value());
    CHECK(*e.slack_error == "internal_error");
    CHECK(e.message == "Slack server error: internal_error");
}

TEST_CASE("FromHttpStatus: non-JSON body yields no slack_error", "[error]") {
    auto e = Error::FromHttpStatus("SlackCall", "", 500, "<html>oops</html>");
    CHECK_FALSE(e.slack_error.has_value());
    CHECK(e.message == "Slack server internal error");
}

TEST_CASE("FromHttpStatus: unknown status", "[error]") {
    auto e = Error::FromHttpStatus("SlackCall", "", 418);
    CHECK(e.category == ErrorCategory::SlackApi);
    CHECK(e.message == "Slack HTTP Error (418)");
}
