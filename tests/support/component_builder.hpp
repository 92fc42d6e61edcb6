#pragma once

// Builds minimal component binaries with just an import and an export
// section, enough for the reader and the composition graph.

#include <vconf/types.hpp>
#include <vconf/wasm_binary.hpp>

#include <string>
#include <utility>
#include <vector>

namespace vconf::testing {

class ComponentBuilder {
public:
    ComponentBuilder& import_instance(const std::string& name) {
        imports_.emplace_back(name, ExternKind::Instance);
        return *this;
    }
    ComponentBuilder& import_func(const std::string& name) {
        imports_.emplace_back(name, ExternKind::Func);
        return *this;
    }
    ComponentBuilder& export_instance(const std::string& name) {
        exports_.emplace_back(name, ExternKind::Instance);
        return *this;
    }
    ComponentBuilder& export_func(const std::string& name) {
        exports_.emplace_back(name, ExternKind::Func);
        return *this;
    }

    std::vector<uint8_t> build() const {
        ByteWriter out;
        out.write_bytes(wasm::MAGIC, 4);
        out.write_bytes(wasm::COMPONENT_VERSION, 4);

        if (!imports_.empty()) {
            ByteWriter section;
            section.write_var_u32(static_cast<uint32_t>(imports_.size()));
            for (const auto& [name, kind] : imports_) {
                section.write_u8(0x00);
                section.write_string(name);
                section.write_u8(kind == ExternKind::Func ? 0x01 : 0x05);
                section.write_var_u32(0);
            }
            out.write_section(wasm::IMPORT, section.bytes());
        }

        if (!exports_.empty()) {
            ByteWriter section;
            section.write_var_u32(static_cast<uint32_t>(exports_.size()));
            uint32_t index = 0;
            for (const auto& [name, kind] : exports_) {
                section.write_u8(0x00);
                section.write_string(name);
                section.write_u8(kind == ExternKind::Func ? wasm::SORT_FUNC : wasm::SORT_INSTANCE);
                section.write_var_u32(index++);
                section.write_u8(0x00);
            }
            out.write_section(wasm::EXPORT, section.bytes());
        }

        return out.take();
    }

private:
    std::vector<std::pair<std::string, ExternKind>> imports_;
    std::vector<std::pair<std::string, ExternKind>> exports_;
};

inline std::vector<uint8_t> core_module_bytes() {
    return {0x00, 0x61, 0x73, 0x6D, 0x01, 0x00, 0x00, 0x00};
}

// Shim exporting every platform capability plus the recorder interfaces
inline std::vector<uint8_t> full_virt_shim() {
    return ComponentBuilder()
        .export_instance("fermyon:spin/key-value@2.0.0")
        .export_instance("fermyon:spin/llm@2.0.0")
        .export_instance("fermyon:spin/redis@2.0.0")
        .export_instance("fermyon:spin/mysql@2.0.0")
        .export_instance("fermyon:spin/postgres@2.0.0")
        .export_instance("fermyon:spin/sqlite@2.0.0")
        .export_instance("fermyon:spin/mqtt@2.0.0")
        .export_instance("fermyon:spin/variables@2.0.0")
        .export_instance("wasi:http/outgoing-handler@0.2.0")
        .export_func("set-component-id")
        .export_instance("fermyon:spin-test-virt/key-value-calls")
        .export_instance("fermyon:spin-test-virt/http-handler")
        .export_instance("wasi:http/types@0.2.0")
        .export_instance("wasi:io/streams@0.2.0")
        .export_instance("fermyon:spin-wasi-virt/http-helper")
        .build();
}

inline std::vector<uint8_t> router_component() {
    return ComponentBuilder()
        .import_func("set-component-id")
        .import_instance("wasi:http/incoming-handler@0.2.0")
        .export_instance("wasi:http/incoming-handler@0.2.0")
        .build();
}

// App using key-value only; the other capabilities are skipped
inline std::vector<uint8_t> key_value_app() {
    return ComponentBuilder()
        .import_instance("fermyon:spin/key-value@2.0.0")
        .export_instance("wasi:http/incoming-handler@0.2.0")
        .build();
}

inline std::vector<uint8_t> test_component() {
    return ComponentBuilder()
        .import_instance("wasi:http/incoming-handler@0.2.0")
        .import_instance("fermyon:spin/key-value@2.0.0")
        .import_instance("fermyon:spin-test-virt/key-value-calls")
        .export_func("run")
        .build();
}

} // namespace vconf::testing
