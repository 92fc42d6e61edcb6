#include <doctest/doctest.h>
#include <vconf/component.hpp>
#include <vconf/wasm_binary.hpp>

#include "support/component_builder.hpp"

using namespace vconf;
using vconf::testing::ComponentBuilder;

TEST_CASE("component preamble detection") {
    auto component = ComponentBuilder().build();
    CHECK(is_component(component));
    CHECK_FALSE(is_core_module(component));

    auto module = vconf::testing::core_module_bytes();
    CHECK(is_core_module(module));
    CHECK_FALSE(is_component(module));

    CHECK_FALSE(is_component({0x00, 0x61, 0x73}));
}

TEST_CASE("parse_component lists imports and exports") {
    auto bytes = ComponentBuilder()
        .import_instance("fermyon:spin/key-value@2.0.0")
        .import_func("set-component-id")
        .export_instance("wasi:http/incoming-handler@0.2.0")
        .export_func("run")
        .build();

    auto info = parse_component(bytes);
    REQUIRE(info.isOk());
    REQUIRE(info.value().imports.size() == 2);
    CHECK(info.value().imports[0].name == "fermyon:spin/key-value@2.0.0");
    CHECK(info.value().imports[0].kind == ExternKind::Instance);
    CHECK(info.value().imports[1].kind == ExternKind::Func);
    REQUIRE(info.value().exports.size() == 2);
    CHECK(info.value().exports[1].name == "run");
    CHECK(info.value().exports[1].kind == ExternKind::Func);

    CHECK(find_import(info.value(), "set-component-id") != nullptr);
    CHECK(find_export(info.value(), "missing") == nullptr);
}

TEST_CASE("parse_component skips unrelated sections") {
    ByteWriter out;
    out.write_bytes(wasm::MAGIC, 4);
    out.write_bytes(wasm::COMPONENT_VERSION, 4);
    out.write_section(wasm::CUSTOM, {0x04, 'n', 'a', 'm', 'e', 0x01, 0x02});
    out.write_section(wasm::COMPONENT, ComponentBuilder().export_func("inner").build());

    auto info = parse_component(out.bytes());
    REQUIRE(info.isOk());
    CHECK(info.value().imports.empty());
    CHECK(info.value().exports.empty());
}

TEST_CASE("parse_component accepts versioned import names") {
    ByteWriter section;
    section.write_var_u32(1);
    section.write_u8(0x01);
    section.write_string("wasi:io/streams@0.2.0");
    section.write_string("0.2.0");
    section.write_u8(0x05);
    section.write_var_u32(0);

    ByteWriter out;
    out.write_bytes(wasm::MAGIC, 4);
    out.write_bytes(wasm::COMPONENT_VERSION, 4);
    out.write_section(wasm::IMPORT, section.bytes());

    auto info = parse_component(out.bytes());
    REQUIRE(info.isOk());
    REQUIRE(info.value().imports.size() == 1);
    CHECK(info.value().imports[0].name == "wasi:io/streams@0.2.0");
}

TEST_CASE("parse_component rejects core modules") {
    auto info = parse_component(vconf::testing::core_module_bytes());
    REQUIRE(info.isErr());
    CHECK(info.error().code() == ErrorCode::NOT_A_COMPONENT);
}

TEST_CASE("parse_component rejects malformed binaries") {
    SUBCASE("missing preamble") {
        auto info = parse_component({'n', 'o', 't', ' ', 'w', 'a', 's', 'm'});
        REQUIRE(info.isErr());
        CHECK(info.error().code() == ErrorCode::MALFORMED_BINARY);
    }

    SUBCASE("section past end") {
        auto bytes = ComponentBuilder().build();
        bytes.push_back(wasm::IMPORT);
        bytes.push_back(0x10);
        bytes.push_back(0x01);
        auto info = parse_component(bytes);
        REQUIRE(info.isErr());
        CHECK(info.error().code() == ErrorCode::MALFORMED_BINARY);
        CHECK(info.error().message().find("offset 8") != std::string::npos);
    }

    SUBCASE("unknown extern descriptor") {
        ByteWriter section;
        section.write_var_u32(1);
        section.write_u8(0x00);
        section.write_string("bad");
        section.write_u8(0x09);

        ByteWriter out;
        out.write_bytes(wasm::MAGIC, 4);
        out.write_bytes(wasm::COMPONENT_VERSION, 4);
        out.write_section(wasm::IMPORT, section.bytes());

        auto info = parse_component(out.bytes());
        REQUIRE(info.isErr());
        CHECK(info.error().message().find("'bad'") != std::string::npos);
    }

    SUBCASE("unknown section id") {
        auto bytes = ComponentBuilder().build();
        bytes.push_back(0x2A);
        bytes.push_back(0x00);
        auto info = parse_component(bytes);
        REQUIRE(info.isErr());
        CHECK(info.error().code() == ErrorCode::MALFORMED_BINARY);
    }
}

TEST_CASE("LEB128 round trip through ByteWriter and ByteReader") {
    ByteWriter w;
    w.write_var_u32(0);
    w.write_var_u32(127);
    w.write_var_u32(128);
    w.write_var_u32(624485);
    w.write_var_u32(0xFFFFFFFF);

    ByteReader r(w.bytes());
    CHECK(r.read_var_u32() == 0u);
    CHECK(r.read_var_u32() == 127u);
    CHECK(r.read_var_u32() == 128u);
    CHECK(r.read_var_u32() == 624485u);
    CHECK(r.read_var_u32() == 0xFFFFFFFFu);
    CHECK(r.at_end());
    CHECK_FALSE(r.read_u8().has_value());
}
