#include "vconf/graph.hpp"
#include "vconf/wasm_binary.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <limits>
#include <unordered_map>

namespace vconf {

namespace {

size_t sort_slot(ExternKind kind) {
    return static_cast<size_t>(kind);
}

void write_sort(ByteWriter& w, ExternKind kind) {
    switch (kind) {
        case ExternKind::CoreModule:
            w.write_u8(wasm::SORT_CORE);
            w.write_u8(wasm::CORE_SORT_MODULE);
            break;
        case ExternKind::Func: w.write_u8(wasm::SORT_FUNC); break;
        case ExternKind::Value: w.write_u8(wasm::SORT_VALUE); break;
        case ExternKind::Type: w.write_u8(wasm::SORT_TYPE); break;
        case ExternKind::Component: w.write_u8(wasm::SORT_COMPONENT); break;
        case ExternKind::Instance: w.write_u8(wasm::SORT_INSTANCE); break;
    }
}

// Index assigned to a node within the index space of its sort
struct SortIndex {
    ExternKind kind;
    uint32_t index;
};

// An import of the artifact standing in for unwired nested imports
struct ImplicitImport {
    std::string name;
    ExternKind kind;
    uint32_t type_index = 0;    // into the core or component type space
    SortIndex assigned{ExternKind::Instance, 0};
};

// Empty type definitions: structural stand-ins for the imported item
void write_placeholder_type(ByteWriter& w, ExternKind kind) {
    switch (kind) {
        case ExternKind::Func:
            w.write_u8(0x40);
            w.write_var_u32(0);     // no params
            w.write_u8(0x01);
            w.write_u8(0x00);       // no results
            break;
        case ExternKind::Component:
            w.write_u8(0x41);
            w.write_var_u32(0);
            break;
        case ExternKind::Instance:
            w.write_u8(0x42);
            w.write_var_u32(0);
            break;
        default:
            break;
    }
}

bool needs_component_type(ExternKind kind) {
    return kind == ExternKind::Func || kind == ExternKind::Component || kind == ExternKind::Instance;
}

void write_import_desc(ByteWriter& w, const ImplicitImport& import) {
    switch (import.kind) {
        case ExternKind::CoreModule:
            w.write_u8(0x00);
            w.write_u8(wasm::CORE_SORT_MODULE);
            w.write_var_u32(import.type_index);
            break;
        case ExternKind::Func: w.write_u8(0x01); w.write_var_u32(import.type_index); break;
        case ExternKind::Value:
            w.write_u8(0x02);
            w.write_u8(0x01);
            w.write_u8(0x7F);       // bool
            break;
        case ExternKind::Type:
            w.write_u8(0x03);
            w.write_u8(0x01);       // sub resource
            break;
        case ExternKind::Component: w.write_u8(0x04); w.write_var_u32(import.type_index); break;
        case ExternKind::Instance: w.write_u8(0x05); w.write_var_u32(import.type_index); break;
    }
}

bool is_wired(const Node& n, const std::string& import_name) {
    for (const auto& arg : n.arguments) {
        if (arg.first == import_name) return true;
    }
    return false;
}

// Post-order walk: arguments and alias sources before their users
void visit(const std::vector<Node>& nodes, uint32_t index, std::vector<bool>& visited,
           std::vector<uint32_t>& order) {
    if (visited[index]) return;
    visited[index] = true;
    const Node& n = nodes[index];
    if (n.kind == NodeKind::Alias) {
        visit(nodes, n.source.index, visited, order);
    } else {
        for (const auto& arg : n.arguments) visit(nodes, arg.second.index, visited, order);
    }
    order.push_back(index);
}

} // namespace

// Layout of the encoded artifact:
//   - one component section per distinct package binary used by an
//     instantiation, in registration order (component index space)
//   - type sections and an import section for nested imports left unwired
//   - one instance or alias section per node, in dependency order
//   - a final export section with the public exports
Result<std::vector<uint8_t>> CompositionGraph::encode() const {
    using R = Result<std::vector<uint8_t>>;

    ByteWriter out;
    out.write_bytes(wasm::MAGIC, 4);
    out.write_bytes(wasm::COMPONENT_VERSION, 4);

    std::vector<bool> used(packages_.size(), false);
    for (const auto& n : nodes_) {
        if (n.kind == NodeKind::Instantiation) used[n.package.index] = true;
    }

    // Identical binaries registered under different names are embedded once
    std::unordered_map<uint32_t, uint32_t> component_index;
    std::unordered_map<std::string, uint32_t> by_digest;
    uint32_t next_component = 0;
    for (size_t i = 0; i < packages_.size(); ++i) {
        if (!used[i]) continue;
        const Package& pkg = packages_[i];
        if (!pkg.sha256.empty()) {
            auto same = by_digest.find(pkg.sha256);
            if (same != by_digest.end()) {
                spdlog::debug("package '{}' shares its binary with an earlier package", pkg.name);
                component_index[static_cast<uint32_t>(i)] = same->second;
                continue;
            }
        }
        if (pkg.bytes.size() > std::numeric_limits<uint32_t>::max()) {
            return R::err(Error(ErrorCode::ENCODE_FAILED,
                                "package '" + pkg.name + "' is too large to embed"));
        }
        out.write_section(wasm::COMPONENT, pkg.bytes);
        if (!pkg.sha256.empty()) by_digest[pkg.sha256] = next_component;
        component_index[static_cast<uint32_t>(i)] = next_component++;
    }

    std::vector<uint32_t> order;
    order.reserve(nodes_.size());
    {
        std::vector<bool> visited(nodes_.size(), false);
        for (uint32_t i = 0; i < nodes_.size(); ++i) visit(nodes_, i, visited, order);
    }

    // Unwired imports, deduplicated by name
    std::vector<ImplicitImport> imports;
    std::unordered_map<std::string, size_t> import_slot;
    for (uint32_t index : order) {
        const Node& n = nodes_[index];
        if (n.kind != NodeKind::Instantiation) continue;
        const Package& pkg = packages_[n.package.index];
        for (const auto& item : pkg.info.imports) {
            if (is_wired(n, item.name)) continue;

            auto existing = import_slot.find(item.name);
            if (existing == import_slot.end()) {
                import_slot[item.name] = imports.size();
                imports.push_back({item.name, item.kind});
            } else if (imports[existing->second].kind != item.kind) {
                return R::err(Error(ErrorCode::ENCODE_FAILED,
                                    "import '" + item.name + "' of '" + pkg.name + "' is a " +
                                    extern_kind_to_string(item.kind) + " but another package imports a " +
                                    extern_kind_to_string(imports[existing->second].kind)));
            }
        }
    }

    std::array<uint32_t, 6> counters{};
    counters[sort_slot(ExternKind::Component)] = next_component;

    if (!imports.empty()) {
        ByteWriter core_types;
        ByteWriter types;
        uint32_t core_type_count = 0;
        uint32_t type_count = 0;
        for (auto& import : imports) {
            if (import.kind == ExternKind::CoreModule) {
                core_types.write_u8(0x50);
                core_types.write_var_u32(0);
                import.type_index = core_type_count++;
            } else if (needs_component_type(import.kind)) {
                write_placeholder_type(types, import.kind);
                import.type_index = type_count++;
            }
        }
        if (core_type_count > 0) {
            ByteWriter section;
            section.write_var_u32(core_type_count);
            section.write_bytes(core_types.bytes());
            out.write_section(wasm::CORE_TYPE, section.bytes());
        }
        if (type_count > 0) {
            ByteWriter section;
            section.write_var_u32(type_count);
            section.write_bytes(types.bytes());
            out.write_section(wasm::TYPE, section.bytes());
        }
        counters[sort_slot(ExternKind::Type)] = type_count;

        ByteWriter section;
        section.write_var_u32(static_cast<uint32_t>(imports.size()));
        for (auto& import : imports) {
            section.write_u8(0x00);
            section.write_string(import.name);
            write_import_desc(section, import);
            import.assigned = {import.kind, counters[sort_slot(import.kind)]++};
        }
        out.write_section(wasm::IMPORT, section.bytes());
        spdlog::debug("composition imports {} unwired items", imports.size());
    }

    std::vector<SortIndex> assigned(nodes_.size(), SortIndex{ExternKind::Instance, 0});

    for (uint32_t index : order) {
        const Node& n = nodes_[index];
        ByteWriter section;
        section.write_var_u32(1);

        if (n.kind == NodeKind::Instantiation) {
            const Package& pkg = packages_[n.package.index];
            std::vector<std::pair<std::string, SortIndex>> args;
            for (const auto& [name, source] : n.arguments) {
                args.emplace_back(name, assigned[source.index]);
            }
            for (const auto& item : pkg.info.imports) {
                if (is_wired(n, item.name)) continue;
                args.emplace_back(item.name, imports[import_slot.at(item.name)].assigned);
            }

            section.write_u8(0x00);
            section.write_var_u32(component_index.at(n.package.index));
            section.write_var_u32(static_cast<uint32_t>(args.size()));
            for (const auto& [name, arg] : args) {
                section.write_string(name);
                write_sort(section, arg.kind);
                section.write_var_u32(arg.index);
            }
            out.write_section(wasm::INSTANCE, section.bytes());
        } else {
            const SortIndex& instance = assigned[n.source.index];
            write_sort(section, n.item_kind);
            section.write_u8(0x00);  // export of a component instance
            section.write_var_u32(instance.index);
            section.write_string(n.export_name);
            out.write_section(wasm::ALIAS, section.bytes());
        }

        uint32_t& counter = counters[sort_slot(n.item_kind)];
        assigned[index] = {n.item_kind, counter++};
    }

    if (!exports_.empty()) {
        ByteWriter section;
        section.write_var_u32(static_cast<uint32_t>(exports_.size()));
        for (const auto& e : exports_) {
            const SortIndex& target = assigned[e.source.node.index];
            section.write_u8(0x00);
            section.write_string(e.name);
            write_sort(section, target.kind);
            section.write_var_u32(target.index);
            section.write_u8(0x00);  // no ascribed type
        }
        out.write_section(wasm::EXPORT, section.bytes());
    }

    spdlog::info("encoded composition: {} components, {} imports, {} nodes, {} exports ({} bytes)",
                 next_component, imports.size(), nodes_.size(), exports_.size(), out.bytes().size());
    return R::ok(out.take());
}

} // namespace vconf
