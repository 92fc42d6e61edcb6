#include <doctest/doctest.h>
#include <vconf/http_fields.hpp>
#include <vconf/http_types.hpp>

using namespace vconf;
using namespace vconf::http;

namespace {

FieldValue bytes(const std::string& s) {
    return FieldValue(s.begin(), s.end());
}

} // namespace

TEST_CASE("fields append keeps order and name case") {
    Fields fields;
    REQUIRE(fields.append("Content-Type", bytes("text/plain")).isOk());
    REQUIRE(fields.append("x-custom", bytes("a")).isOk());
    REQUIRE(fields.append("X-Custom", bytes("b")).isOk());

    REQUIRE(fields.size() == 3);
    CHECK(fields.entries()[0].first == "Content-Type");
    CHECK(fields.entries()[2].first == "X-Custom");

    auto values = fields.get("X-CUSTOM");
    REQUIRE(values.size() == 2);
    CHECK(values[0] == bytes("a"));
    CHECK(values[1] == bytes("b"));
    CHECK(fields.has("content-type"));
    CHECK_FALSE(fields.has("accept"));
}

TEST_CASE("fields reject invalid names and values") {
    Fields fields;

    auto empty_name = fields.append("", bytes("v"));
    REQUIRE(empty_name.isErr());
    CHECK(empty_name.error() == HeaderError::InvalidSyntax);

    auto space = fields.append("bad name", bytes("v"));
    REQUIRE(space.isErr());
    CHECK(space.error() == HeaderError::InvalidSyntax);

    auto newline = fields.append("x-ok", bytes("line\r\nbreak"));
    REQUIRE(newline.isErr());
    CHECK(newline.error() == HeaderError::InvalidSyntax);

    CHECK(fields.append("x-tab", bytes("a\tb")).isOk());
    CHECK(fields.append("x-obs", FieldValue{0xC3, 0xA9}).isOk());
}

TEST_CASE("fields reject forbidden names in any case") {
    Fields fields;
    for (const char* name : {"connection", "Keep-Alive", "HOST", "transfer-encoding", "upgrade",
                             "te", "proxy-connection", "http2-settings"}) {
        auto r = fields.append(name, bytes("x"));
        REQUIRE(r.isErr());
        CHECK(r.error() == HeaderError::Forbidden);
    }
    CHECK(fields.empty());
}

TEST_CASE("immutable fields refuse every mutation") {
    auto fields = Fields::from_trusted({{"x-a", bytes("1")}}, true);
    CHECK(fields.immutable());

    auto appended = fields.append("x-b", bytes("2"));
    REQUIRE(appended.isErr());
    CHECK(appended.error() == HeaderError::Immutable);
    CHECK(fields.remove("x-a").error() == HeaderError::Immutable);
    CHECK(fields.set("x-a", {bytes("3")}).error() == HeaderError::Immutable);
    CHECK(fields.size() == 1);

    auto copy = fields.clone();
    CHECK_FALSE(copy.immutable());
    CHECK(copy.append("x-b", bytes("2")).isOk());
}

TEST_CASE("fields set and remove replace every entry of a name") {
    Fields fields;
    REQUIRE(fields.append("x-a", bytes("1")).isOk());
    REQUIRE(fields.append("X-A", bytes("2")).isOk());
    REQUIRE(fields.append("x-b", bytes("3")).isOk());

    REQUIRE(fields.set("x-a", {bytes("9")}).isOk());
    REQUIRE(fields.size() == 2);
    CHECK(fields.get("x-a") == std::vector<FieldValue>{bytes("9")});

    REQUIRE(fields.remove("X-B").isOk());
    CHECK_FALSE(fields.has("x-b"));
}

TEST_CASE("fields from_list validates every entry") {
    auto ok = Fields::from_list({{"accept", bytes("*/*")}, {"x-id", bytes("7")}});
    REQUIRE(ok.isOk());
    CHECK(ok.value().size() == 2);

    auto bad = Fields::from_list({{"accept", bytes("*/*")}, {"host", bytes("example.com")}});
    REQUIRE(bad.isErr());
    CHECK(bad.error() == HeaderError::Forbidden);
}

TEST_CASE("path-with-query validation") {
    CHECK(is_valid_path_with_query("/"));
    CHECK(is_valid_path_with_query("/a/b?c=d&e"));
    CHECK_FALSE(is_valid_path_with_query(""));
    CHECK_FALSE(is_valid_path_with_query("relative"));
    CHECK_FALSE(is_valid_path_with_query("/has space"));
    CHECK_FALSE(is_valid_path_with_query("/tab\there"));
}

TEST_CASE("outgoing to incoming request conversion applies defaults") {
    OutgoingRequest request;
    REQUIRE(request.headers.append("accept", bytes("*/*")).isOk());

    auto incoming = to_incoming_request(std::move(request));
    CHECK(incoming.method == "GET");
    CHECK(incoming.uri() == "http://localhost:3000/");
    REQUIRE(incoming.body.has_value());
    CHECK(incoming.body->empty());
    CHECK(incoming.headers.entries().size() == 1);
    CHECK(incoming.headers.immutable());
}

TEST_CASE("outgoing to incoming request conversion maps schemes") {
    auto uri_for = [](std::optional<Scheme> scheme) {
        OutgoingRequest request;
        request.scheme = scheme;
        request.authority = "example.com";
        request.path_with_query = "/x?y=1";
        return to_incoming_request(std::move(request)).uri();
    };

    CHECK(uri_for(std::nullopt) == "http://example.com/x?y=1");
    CHECK(uri_for(Scheme::http()) == "http://example.com/x?y=1");
    CHECK(uri_for(Scheme::https()) == "https://example.com/x?y=1");
    CHECK(uri_for(Scheme::custom("spin")) == "spin://example.com/x?y=1");
}

TEST_CASE("outgoing to incoming request conversion moves the body") {
    OutgoingRequest request;
    request.body = bytes("payload");

    auto incoming = to_incoming_request(std::move(request));
    REQUIRE(incoming.body.has_value());
    CHECK(*incoming.body == bytes("payload"));
    CHECK_FALSE(request.body.has_value());
}

TEST_CASE("input stream reads up to the requested size") {
    InputStream stream{bytes("hello world"), 0};
    CHECK(stream.blocking_read(5) == bytes("hello"));
    CHECK(stream.blocking_read(UINT64_MAX) == bytes(" world"));
    CHECK(stream.at_end());
    CHECK(stream.blocking_read(10).empty());
}
