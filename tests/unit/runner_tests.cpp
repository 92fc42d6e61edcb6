#include <doctest/doctest.h>
#include <vconf/runner.hpp>

#include "support/fake_handler.hpp"

using namespace vconf;
using vconf::testing::FakeHandler;
using vconf::testing::field_bytes;

namespace {

Invocation get(const std::string& path, uint16_t status = 200) {
    Invocation invocation;
    invocation.request.path = path;
    invocation.response.status = status;
    return invocation;
}

ExpectedHeader expect_header(const std::string& name, std::optional<std::string> value,
                             bool optional = false) {
    ExpectedHeader header;
    header.name = name;
    header.value = std::move(value);
    header.optional = optional;
    return header;
}

} // namespace

TEST_CASE("a matching response passes") {
    FakeHandler handler;
    handler.reply.headers = {{"Content-Type", field_bytes("text/plain")}};
    handler.reply.body = "hello";

    auto invocation = get("/hello");
    invocation.response.headers.push_back(expect_header("content-type", std::string("text/plain")));
    invocation.response.body = "hello";

    InvocationRunner runner(handler);
    auto result = runner.run(invocation);
    CHECK(result.ok);
    CHECK(result.error.empty());
    CHECK(handler.bridge().table().size() == 0);
}

TEST_CASE("the handler sees the scripted request") {
    FakeHandler handler;
    auto invocation = get("/items?id=1");
    invocation.request.method = "POST";
    invocation.request.headers.push_back({"X-Trace", "abc"});
    invocation.request.body = "payload";

    InvocationRunner runner(handler);
    REQUIRE(runner.run(invocation).ok);
    REQUIRE(handler.seen.size() == 1);
    const auto& seen = handler.seen[0];
    CHECK(seen.method == "POST");
    CHECK(seen.path_with_query == "/items?id=1");
    REQUIRE(seen.headers.size() == 1);
    CHECK(seen.headers[0].first == "X-Trace");
    CHECK(seen.headers[0].second == field_bytes("abc"));
    CHECK(seen.body == "payload");
}

TEST_CASE("invalid request inputs fail before the handler runs") {
    FakeHandler handler;
    InvocationRunner runner(handler);

    SUBCASE("forbidden header") {
        auto invocation = get("/");
        invocation.request.headers.push_back({"Host", "example.com"});
        auto result = runner.run(invocation);
        CHECK_FALSE(result.ok);
        CHECK(result.error == "invalid request header 'Host': forbidden");
    }

    SUBCASE("relative path") {
        auto result = runner.run(get("relative"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("invalid request path") == 0);
    }

    CHECK(handler.seen.empty());
    CHECK(handler.bridge().table().size() == 0);
}

TEST_CASE("status mismatch reports the body") {
    FakeHandler handler;
    handler.reply.status = 500;
    handler.reply.body = "database unavailable";

    InvocationRunner runner(handler);
    auto result = runner.run(get("/"));
    CHECK_FALSE(result.ok);
    CHECK(result.error == "request failed: expected status 200, got 500\nbody:\ndatabase unavailable");
}

TEST_CASE("invalid utf-8 bodies are reported as such") {
    FakeHandler handler;
    handler.reply.status = 404;
    handler.reply.body = std::string("\xff\xfe", 2);

    InvocationRunner runner(handler);
    auto result = runner.run(get("/"));
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("body:\ninvalid utf-8") != std::string::npos);
}

TEST_CASE("header expectations") {
    FakeHandler handler;
    handler.reply.headers = {{"X-Request-Id", field_bytes("ABC")}};
    InvocationRunner runner(handler);

    SUBCASE("names and values compare case-insensitively") {
        auto invocation = get("/");
        invocation.response.headers.push_back(expect_header("x-request-id", std::string("abc")));
        CHECK(runner.run(invocation).ok);
    }

    SUBCASE("an expectation without a value matches any value") {
        auto invocation = get("/");
        invocation.response.headers.push_back(expect_header("X-REQUEST-ID", std::nullopt));
        CHECK(runner.run(invocation).ok);
    }

    SUBCASE("a wrong value fails") {
        auto invocation = get("/");
        invocation.response.headers.push_back(expect_header("x-request-id", std::string("xyz")));
        auto result = runner.run(invocation);
        CHECK_FALSE(result.ok);
        CHECK(result.error == "header x-request-id: expected \"xyz\", got \"abc\"");
    }

    SUBCASE("a missing required header fails") {
        auto invocation = get("/");
        invocation.response.headers.push_back(expect_header("x-request-id", std::nullopt));
        invocation.response.headers.push_back(expect_header("etag", std::nullopt));
        auto result = runner.run(invocation);
        CHECK_FALSE(result.ok);
        CHECK(result.error == "expected header etag not found in response");
    }

    SUBCASE("a missing optional header passes") {
        auto invocation = get("/");
        invocation.response.headers.push_back(expect_header("x-request-id", std::nullopt));
        invocation.response.headers.push_back(expect_header("etag", std::nullopt, true));
        CHECK(runner.run(invocation).ok);
    }

    SUBCASE("an unexpected header fails") {
        auto result = runner.run(get("/"));
        CHECK_FALSE(result.ok);
        CHECK(result.error == "unexpected headers: {\"x-request-id\": \"abc\"}");
    }
}

TEST_CASE("body mismatch") {
    FakeHandler handler;
    handler.reply.body = "actual";

    auto invocation = get("/");
    invocation.response.body = "expected";

    InvocationRunner runner(handler);
    auto result = runner.run(invocation);
    CHECK_FALSE(result.ok);
    CHECK(result.error == "body mismatch: expected \"expected\", got \"actual\"");
}

TEST_CASE("an absent body expectation matches any body") {
    FakeHandler handler;
    handler.reply.body = "anything";
    InvocationRunner runner(handler);
    CHECK(runner.run(get("/")).ok);
}

TEST_CASE("a deferred handler is polled until it responds") {
    FakeHandler handler;
    handler.mode = FakeHandler::Mode::Deferred;
    handler.defer_polls = 4;

    InvocationRunner runner(handler);
    auto result = runner.run(get("/"));
    CHECK(result.ok);
    CHECK(handler.yields == 4);
    CHECK(handler.last_error.empty());
    CHECK(handler.bridge().table().size() == 0);
}

TEST_CASE("delivery failures are distinct from assertion failures") {
    FakeHandler handler;
    InvocationRunner runner(handler);

    SUBCASE("dropped outparam") {
        handler.mode = FakeHandler::Mode::Drop;
        auto result = runner.run(get("/"));
        CHECK_FALSE(result.ok);
        CHECK(result.error == "no response: outparam was dropped");
    }

    SUBCASE("error code") {
        handler.mode = FakeHandler::Mode::Error;
        auto result = runner.run(get("/"));
        CHECK_FALSE(result.ok);
        CHECK(result.error == "no response: internal-error: scripted failure");
    }

    SUBCASE("trap") {
        handler.mode = FakeHandler::Mode::Trap;
        auto result = runner.run(get("/"));
        CHECK_FALSE(result.ok);
        CHECK(result.error == "handler failed: wasm trap: unreachable");
    }

    CHECK(handler.bridge().table().size() == 0);
}

TEST_CASE("a failing invocation does not stop later ones") {
    FakeHandler handler;
    Scenario scenario;
    scenario.invocations.push_back(get("/first"));
    scenario.invocations.push_back(get("/second", 404));
    scenario.invocations.push_back(get("/third"));

    InvocationRunner runner(handler);
    auto report = runner.run_scenario(scenario);
    CHECK_FALSE(report.ok());
    CHECK(report.passed == 2);
    CHECK(report.failed == 1);
    REQUIRE(report.results.size() == 3);
    CHECK(report.results[2].ok);
    CHECK(report.first_error().find("invocation 1: request failed: expected status 404") == 0);
    CHECK(handler.seen.size() == 3);
}

TEST_CASE("utf-8 validation") {
    auto bytes = [](const std::string& s) { return http::Body(s.begin(), s.end()); };
    CHECK(is_valid_utf8(bytes("plain ascii")));
    CHECK(is_valid_utf8(bytes("caf\xc3\xa9")));
    CHECK(is_valid_utf8(bytes("\xf0\x9f\x98\x80")));
    CHECK_FALSE(is_valid_utf8(bytes("\xc3")));
    CHECK_FALSE(is_valid_utf8(bytes("\xc0\xaf")));
    CHECK_FALSE(is_valid_utf8(bytes("\xed\xa0\x80")));
    CHECK(body_text(bytes("\xff")) == "invalid utf-8");
}
