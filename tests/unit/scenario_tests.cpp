#include <doctest/doctest.h>
#include <vconf/scenario.hpp>

using namespace vconf;

TEST_CASE("parse_scenario reads requests and expectations") {
    const char* json = R"({
        // health check first
        "invocations": [
            {
                "request": { "path": "/health" },
                "response": { "status": 200, "body": "ok" }
            },
            {
                "request": {
                    "method": "POST",
                    "path": "/items",
                    "headers": [{ "name": "Content-Type", "value": "application/json" }],
                    "body": "{\"id\": 1}"
                },
                "response": {
                    "status": 201,
                    "headers": [
                        { "name": "location", "value": "/items/1" },
                        { "name": "etag", "optional": true }
                    ]
                }
            }
        ]
    })";

    auto result = parse_scenario(json);
    REQUIRE(result.ok);
    REQUIRE(result.scenario.invocations.size() == 2);

    const auto& health = result.scenario.invocations[0];
    CHECK(health.request.method == "GET");
    CHECK(health.request.path == "/health");
    CHECK(health.request.headers.empty());
    CHECK_FALSE(health.request.body.has_value());
    CHECK(health.response.status == 200);
    CHECK(health.response.body == std::optional<std::string>("ok"));

    const auto& create = result.scenario.invocations[1];
    CHECK(create.request.method == "POST");
    REQUIRE(create.request.headers.size() == 1);
    CHECK(create.request.headers[0].name == "Content-Type");
    CHECK(create.request.body == std::optional<std::string>("{\"id\": 1}"));
    REQUIRE(create.response.headers.size() == 2);
    CHECK(create.response.headers[0].value == std::optional<std::string>("/items/1"));
    CHECK_FALSE(create.response.headers[0].optional);
    CHECK_FALSE(create.response.headers[1].value.has_value());
    CHECK(create.response.headers[1].optional);
    CHECK_FALSE(create.response.body.has_value());
}

TEST_CASE("parse_scenario accepts an empty scenario") {
    auto result = parse_scenario(R"({"invocations": []})");
    REQUIRE(result.ok);
    CHECK(result.scenario.invocations.empty());
}

TEST_CASE("parse_scenario reports the location of missing fields") {
    SUBCASE("request path") {
        auto result = parse_scenario(R"({"invocations": [
            {"request": {"path": "/"}, "response": {"status": 200}},
            {"request": {}, "response": {"status": 200}}
        ]})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "invocations[1].request.path missing");
    }

    SUBCASE("response status") {
        auto result = parse_scenario(R"({"invocations": [{"request": {"path": "/"}, "response": {}}]})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "invocations[0].response.status missing");
    }

    SUBCASE("response object") {
        auto result = parse_scenario(R"({"invocations": [{"request": {"path": "/"}}]})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "invocations[0].response missing");
    }

    SUBCASE("header value") {
        auto result = parse_scenario(R"({"invocations": [
            {"request": {"path": "/", "headers": [{"name": "x"}]}, "response": {"status": 200}}
        ]})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "invocations[0].request.headers[0].value missing");
    }
}

TEST_CASE("parse_scenario rejects bad values") {
    SUBCASE("status out of range") {
        auto result = parse_scenario(R"({"invocations": [{"request": {"path": "/"}, "response": {"status": 42}}]})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "invocations[0].response.status out of range: 42");
    }

    SUBCASE("status as string") {
        auto result = parse_scenario(R"({"invocations": [{"request": {"path": "/"}, "response": {"status": "200"}}]})");
        CHECK_FALSE(result.ok);
    }

    SUBCASE("optional flag type") {
        auto result = parse_scenario(R"({"invocations": [
            {"request": {"path": "/"}, "response": {"status": 200, "headers": [{"name": "a", "optional": "yes"}]}}
        ]})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "invocations[0].response.headers[0].optional must be a boolean");
    }

    SUBCASE("missing invocations") {
        auto result = parse_scenario(R"({"tests": []})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "invocations missing or not an array");
    }

    SUBCASE("not an object") {
        auto result = parse_scenario("[]");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "JSON must be an object");
    }

    SUBCASE("syntax error") {
        auto result = parse_scenario("{ invalid json }");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("parse error") == 0);
    }
}
