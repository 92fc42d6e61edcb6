#include <doctest/doctest.h>
#include <vconf/component.hpp>
#include <vconf/componentize.hpp>
#include <vconf/harness.hpp>
#include <vconf/log.hpp>
#include <vconf/platform.hpp>
#include <vconf/process_host.hpp>

#include "support/component_builder.hpp"

using namespace vconf;

TEST_CASE("compute_sha256") {
    SUBCASE("empty input") {
        auto hash = compute_sha256({});
        REQUIRE(hash.ok);
        CHECK(hash.hex_digest == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    }

    SUBCASE("abc") {
        auto hash = compute_sha256({'a', 'b', 'c'});
        REQUIRE(hash.ok);
        CHECK(hash.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }
}

TEST_CASE("binary files round trip") {
    std::string path = make_temp_path("vconf-platform", ".bin");
    std::vector<uint8_t> data = {0x00, 0x61, 0x73, 0x6d, 0xff};
    REQUIRE(write_binary_file(path, data).isOk());
    CHECK(path_exists(path));

    auto read = read_binary_file(path);
    REQUIRE(read.isOk());
    CHECK(read.value() == data);

    CHECK(remove_file(path));
    CHECK_FALSE(path_exists(path));

    auto missing = read_binary_file(path);
    REQUIRE(missing.isErr());
    CHECK(missing.error().code() == ErrorCode::FILE_NOT_FOUND);
}

TEST_CASE("path helpers") {
    CHECK(get_parent_directory("/a/b/spin.toml") == "/a/b");
    CHECK(get_parent_directory("spin.toml").empty());
    CHECK(get_filename("/tests/checkout.wasm") == "checkout.wasm");
    CHECK(join_path("/a", "b.wasm") == "/a/b.wasm");
}

TEST_CASE("find_manifest_source") {
    SUBCASE("first local source") {
        const char* manifest = R"(spin_manifest_version = 2

[application]
name = "demo"

# source = "commented.wasm"
[component.demo]
source = "target/demo.wasm"

[component.other]
source = "other.wasm"
)";
        auto source = find_manifest_source(manifest);
        REQUIRE(source.isOk());
        CHECK(source.value() == "target/demo.wasm");
    }

    SUBCASE("a remote first source is an error, not a fall-through") {
        const char* manifest = R"([component.remote]
source = { url = "https://example.com/a.wasm", digest = "sha256:00" }

[component.local]
source="local.wasm"
)";
        auto source = find_manifest_source(manifest);
        REQUIRE(source.isErr());
        CHECK(source.error().code() == ErrorCode::CONFIG_INVALID);
        CHECK(source.error().message() == "remote component sources are not supported");
    }

    SUBCASE("unquoted source") {
        CHECK(find_manifest_source("[component.a]\nsource = a.wasm\n").isErr());
    }

    SUBCASE("no source") {
        auto source = find_manifest_source("[application]\nname = \"x\"\n");
        REQUIRE(source.isErr());
        CHECK(source.error().code() == ErrorCode::CONFIG_INVALID);
    }
}

TEST_CASE("locate_app") {
    const std::string manifest = "[component.app]\nsource = \"app.wasm\"\n";

    CHECK(locate_app(manifest, "/proj/spin.toml", "").value() == "/proj/app.wasm");
    CHECK(locate_app(manifest, "spin.toml", "").value() == "app.wasm");
    CHECK(locate_app(manifest, "/proj/spin.toml", "/elsewhere/x.wasm").value() == "/elsewhere/x.wasm");
    CHECK(locate_app("[component.app]\nsource = \"/abs/app.wasm\"\n", "/proj/spin.toml", "").value() ==
          "/abs/app.wasm");

    auto none = locate_app("[application]\n", "/proj/spin.toml", "");
    REQUIRE(none.isErr());
    CHECK(none.error().code() == ErrorCode::CONFIG_INVALID);

    auto remote = locate_app("[component.app]\nsource = { url = \"https://example.com/a.wasm\" }\n",
                             "/proj/spin.toml", "");
    REQUIRE(remote.isErr());
    CHECK(remote.error().message().find("remote component sources are not supported") !=
          std::string::npos);
    CHECK(locate_app("[component.app]\nsource = { url = \"x\" }\n", "/proj/spin.toml", "/a.wasm")
              .value() == "/a.wasm");
}

TEST_CASE("expand_placeholders") {
    auto expanded = expand_placeholders({"wasmtime", "{artifact}", "--out={output}", "{artifact}.log"},
                                        {{"artifact", "/tmp/h.wasm"}, {"output", "o"}});
    CHECK(expanded == std::vector<std::string>{"wasmtime", "/tmp/h.wasm", "--out=o", "/tmp/h.wasm.log"});
}

TEST_CASE("run_process reports exit codes") {
    auto ok = run_process({"sh", "-c", "exit 0"}, {});
    REQUIRE(ok.ok);
    CHECK(ok.exit_code == 0);

    auto failed = run_process({"sh", "-c", "exit 3"}, {});
    REQUIRE(failed.ok);
    CHECK(failed.exit_code == 3);

    auto env = run_process({"sh", "-c", "test \"$VCONF_PROBE\" = yes"}, {{"VCONF_PROBE", "yes"}});
    REQUIRE(env.ok);
    CHECK(env.exit_code == 0);

    auto missing = run_process({"vconf-no-such-program"}, {});
    CHECK_FALSE(missing.ok);
    CHECK(missing.error == "command not found: vconf-no-such-program");

    CHECK_FALSE(run_process({}, {}).ok);
}

TEST_CASE("ensure_component") {
    SUBCASE("components pass through") {
        auto component = vconf::testing::ComponentBuilder().export_func("run").build();
        auto result = ensure_component(component, {});
        REQUIRE(result.isOk());
        CHECK(result.value() == component);
    }

    SUBCASE("core module without a command") {
        auto result = ensure_component(vconf::testing::core_module_bytes(), {});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::NOT_A_COMPONENT);
        CHECK(result.error().message() ==
              "app is a core module and no componentize command is configured");
    }

    SUBCASE("core module converted by a command") {
        std::string component_path = make_temp_path("vconf-converted", ".wasm");
        REQUIRE(write_binary_file(component_path,
                                  vconf::testing::ComponentBuilder().export_func("run").build()).isOk());
        auto result = ensure_component(vconf::testing::core_module_bytes(),
                                       {"cp", component_path, "{output}"});
        remove_file(component_path);
        REQUIRE(result.isOk());
        CHECK(is_component(result.value()));
    }

    SUBCASE("converter that produces a core module") {
        auto result = ensure_component(vconf::testing::core_module_bytes(), {"cp", "{input}", "{output}"});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::NOT_A_COMPONENT);
    }

    SUBCASE("garbage") {
        auto result = ensure_component({'j', 'u', 'n', 'k'}, {});
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::MALFORMED_BINARY);
    }
}

TEST_CASE("parse_log_level") {
    CHECK(parse_log_level("debug") == spdlog::level::debug);
    CHECK(parse_log_level("warning") == spdlog::level::warn);
    CHECK(parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(parse_log_level("loud").has_value());
}
