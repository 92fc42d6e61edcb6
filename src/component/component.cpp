#include "vconf/component.hpp"
#include "vconf/wasm_binary.hpp"

#include <spdlog/spdlog.h>

namespace vconf {

namespace {

constexpr uint8_t MAX_SECTION_ID = wasm::VALUE;

Error malformed(size_t offset, const std::string& what) {
    return Error(ErrorCode::MALFORMED_BINARY,
                 "malformed component at offset " + std::to_string(offset) + ": " + what);
}

bool is_primitive_valtype(uint8_t b) {
    return b >= 0x64 && b <= 0x7F;
}

// importname' / exportname': 0x00 name | 0x01 name versionsuffix
std::optional<std::string> read_extern_name(ByteReader& reader) {
    auto tag = reader.read_u8();
    if (!tag) return std::nullopt;
    auto name = reader.read_string();
    if (!name) return std::nullopt;
    if (*tag == 0x00) {
        return name;
    }
    if (*tag == 0x01) {
        if (!reader.read_string()) return std::nullopt;
        return name;
    }
    return std::nullopt;
}

std::optional<ExternKind> read_sort(ByteReader& reader) {
    auto b = reader.read_u8();
    if (!b) return std::nullopt;
    switch (*b) {
        case wasm::SORT_CORE: {
            auto core = reader.read_u8();
            if (!core || *core != wasm::CORE_SORT_MODULE) return std::nullopt;
            return ExternKind::CoreModule;
        }
        case wasm::SORT_FUNC: return ExternKind::Func;
        case wasm::SORT_VALUE: return ExternKind::Value;
        case wasm::SORT_TYPE: return ExternKind::Type;
        case wasm::SORT_COMPONENT: return ExternKind::Component;
        case wasm::SORT_INSTANCE: return ExternKind::Instance;
        default: return std::nullopt;
    }
}

// valtype ::= typeidx (s33, non-negative) | primvaltype
bool skip_valtype(ByteReader& reader) {
    auto b = reader.read_u8();
    if (!b) return false;
    if (is_primitive_valtype(*b)) return true;
    if ((*b & 0x80) == 0) {
        return *b < 0x40;
    }
    for (int i = 0; i < 4; ++i) {
        auto next = reader.read_u8();
        if (!next) return false;
        if ((*next & 0x80) == 0) return true;
    }
    return false;
}

std::optional<ExternKind> read_externdesc(ByteReader& reader) {
    auto b = reader.read_u8();
    if (!b) return std::nullopt;
    switch (*b) {
        case 0x00: {
            auto core = reader.read_u8();
            if (!core || *core != wasm::CORE_SORT_MODULE) return std::nullopt;
            if (!reader.read_var_u32()) return std::nullopt;
            return ExternKind::CoreModule;
        }
        case 0x01:
            if (!reader.read_var_u32()) return std::nullopt;
            return ExternKind::Func;
        case 0x02: {
            auto bound = reader.read_u8();
            if (!bound) return std::nullopt;
            if (*bound == 0x00) {
                if (!reader.read_var_u32()) return std::nullopt;
            } else if (*bound == 0x01) {
                if (!skip_valtype(reader)) return std::nullopt;
            } else {
                return std::nullopt;
            }
            return ExternKind::Value;
        }
        case 0x03: {
            auto bound = reader.read_u8();
            if (!bound) return std::nullopt;
            if (*bound == 0x00) {
                if (!reader.read_var_u32()) return std::nullopt;
            } else if (*bound != 0x01) {
                return std::nullopt;
            }
            return ExternKind::Type;
        }
        case 0x04:
            if (!reader.read_var_u32()) return std::nullopt;
            return ExternKind::Component;
        case 0x05:
            if (!reader.read_var_u32()) return std::nullopt;
            return ExternKind::Instance;
        default:
            return std::nullopt;
    }
}

Result<void> parse_imports(ByteReader reader, size_t base, ComponentInfo& info) {
    auto count = reader.read_var_u32();
    if (!count) return Result<void>::err(malformed(base, "bad import count"));

    for (uint32_t i = 0; i < *count; ++i) {
        size_t at = base + reader.offset();
        auto name = read_extern_name(reader);
        if (!name) return Result<void>::err(malformed(at, "bad import name"));
        auto kind = read_externdesc(reader);
        if (!kind) {
            return Result<void>::err(malformed(at, "bad extern descriptor for import '" + *name + "'"));
        }
        info.imports.push_back({*name, *kind});
    }

    if (!reader.at_end()) {
        return Result<void>::err(malformed(base + reader.offset(), "trailing bytes in import section"));
    }
    return Result<void>::ok();
}

Result<void> parse_exports(ByteReader reader, size_t base, ComponentInfo& info) {
    auto count = reader.read_var_u32();
    if (!count) return Result<void>::err(malformed(base, "bad export count"));

    for (uint32_t i = 0; i < *count; ++i) {
        size_t at = base + reader.offset();
        auto name = read_extern_name(reader);
        if (!name) return Result<void>::err(malformed(at, "bad export name"));
        auto kind = read_sort(reader);
        if (!kind || !reader.read_var_u32()) {
            return Result<void>::err(malformed(at, "bad sort index for export '" + *name + "'"));
        }
        // Optional ascribed type
        auto has_desc = reader.read_u8();
        if (!has_desc) return Result<void>::err(malformed(at, "truncated export '" + *name + "'"));
        if (*has_desc == 0x01) {
            auto desc = read_externdesc(reader);
            if (!desc || *desc != *kind) {
                return Result<void>::err(malformed(at, "bad ascribed type for export '" + *name + "'"));
            }
        } else if (*has_desc != 0x00) {
            return Result<void>::err(malformed(at, "bad ascribed type flag for export '" + *name + "'"));
        }
        info.exports.push_back({*name, *kind});
    }

    if (!reader.at_end()) {
        return Result<void>::err(malformed(base + reader.offset(), "trailing bytes in export section"));
    }
    return Result<void>::ok();
}

} // namespace

bool is_component(const std::vector<uint8_t>& bytes) {
    return has_component_preamble(bytes);
}

bool is_core_module(const std::vector<uint8_t>& bytes) {
    return has_core_module_preamble(bytes);
}

Result<ComponentInfo> parse_component(const std::vector<uint8_t>& bytes) {
    if (is_core_module(bytes)) {
        return Result<ComponentInfo>::err(
            Error(ErrorCode::NOT_A_COMPONENT, "expected a component, found a core module"));
    }
    if (!is_component(bytes)) {
        return Result<ComponentInfo>::err(malformed(0, "missing component preamble"));
    }

    ComponentInfo info;
    ByteReader reader(bytes);
    reader.skip(wasm::PREAMBLE_SIZE);

    while (!reader.at_end()) {
        size_t section_start = reader.offset();
        auto id = reader.read_u8();
        auto size = reader.read_var_u32();
        if (!id || !size) {
            return Result<ComponentInfo>::err(malformed(section_start, "truncated section header"));
        }
        if (*id > MAX_SECTION_ID) {
            return Result<ComponentInfo>::err(
                malformed(section_start, "unknown section id " + std::to_string(*id)));
        }
        size_t contents_start = reader.offset();
        auto contents = reader.sub_reader(*size);
        if (!contents) {
            return Result<ComponentInfo>::err(malformed(section_start, "section extends past end"));
        }

        if (*id == wasm::IMPORT) {
            auto parsed = parse_imports(*contents, contents_start, info);
            if (parsed.isErr()) return Result<ComponentInfo>::err(parsed.error());
        } else if (*id == wasm::EXPORT) {
            auto parsed = parse_exports(*contents, contents_start, info);
            if (parsed.isErr()) return Result<ComponentInfo>::err(parsed.error());
        }
    }

    spdlog::trace("parsed component: {} imports, {} exports",
                  info.imports.size(), info.exports.size());
    return Result<ComponentInfo>::ok(std::move(info));
}

const ComponentItem* find_import(const ComponentInfo& info, const std::string& name) {
    for (const auto& item : info.imports) {
        if (item.name == name) return &item;
    }
    return nullptr;
}

const ComponentItem* find_export(const ComponentInfo& info, const std::string& name) {
    for (const auto& item : info.exports) {
        if (item.name == name) return &item;
    }
    return nullptr;
}

} // namespace vconf
