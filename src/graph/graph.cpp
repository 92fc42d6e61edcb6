#include "vconf/graph.hpp"
#include "vconf/component.hpp"
#include "vconf/interface_name.hpp"
#include "vconf/platform.hpp"

#include <spdlog/spdlog.h>

namespace vconf {

namespace {

// Name a source node provides to an import, if it has one
std::optional<std::string> provided_name(const Node& node) {
    if (node.kind == NodeKind::Alias) return node.export_name;
    return std::nullopt;
}

std::optional<Error> check_types(const ComponentItem& import, const Node& source) {
    if (import.kind != source.item_kind) {
        return Error(ErrorCode::TYPE_MISMATCH,
                     "import '" + import.name + "' expects a " + extern_kind_to_string(import.kind) +
                     ", got a " + extern_kind_to_string(source.item_kind));
    }

    auto provided = provided_name(source);
    if (!provided) return std::nullopt;

    auto required_iface = parse_interface_name(import.name);
    auto provided_iface = parse_interface_name(*provided);
    if (required_iface && provided_iface &&
        !interfaces_compatible(*required_iface, *provided_iface)) {
        return Error(ErrorCode::TYPE_MISMATCH,
                     "import '" + import.name + "' is not satisfied by export '" + *provided + "'");
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// Packages
// ============================================================================

Result<PackageId> CompositionGraph::register_package(const std::string& name,
                                                     std::vector<uint8_t> bytes) {
    for (const auto& existing : packages_) {
        if (existing.name == name) {
            return Result<PackageId>::err(
                Error(ErrorCode::DUPLICATE_PACKAGE, "package '" + name + "' is already registered"));
        }
    }

    auto info = parse_component(bytes);
    if (info.isErr()) {
        return Result<PackageId>::err(info.error().withContext("package '" + name + "'"));
    }

    Package package;
    package.name = name;
    auto digest = compute_sha256(bytes);
    if (digest.ok) {
        package.sha256 = digest.hex_digest;
    } else {
        spdlog::warn("could not hash package '{}': {}", name, digest.error);
    }
    package.bytes = std::move(bytes);
    package.info = std::move(info.value());

    PackageId id{static_cast<uint32_t>(packages_.size())};
    spdlog::debug("registered package '{}' ({} bytes, sha256 {}, {} imports, {} exports)", name,
                  package.bytes.size(), package.sha256.substr(0, 12), package.info.imports.size(),
                  package.info.exports.size());
    packages_.push_back(std::move(package));
    return Result<PackageId>::ok(id);
}

const Package* CompositionGraph::package(PackageId id) const {
    if (id.index >= packages_.size()) return nullptr;
    return &packages_[id.index];
}

const Node* CompositionGraph::node(NodeId id) const {
    if (id.index >= nodes_.size()) return nullptr;
    return &nodes_[id.index];
}

// ============================================================================
// Instantiation and Wiring
// ============================================================================

Result<NodeId> CompositionGraph::instantiate(PackageId package_id,
                                             const std::vector<InstantiationArgument>& arguments) {
    const Package* pkg = package(package_id);
    if (!pkg) {
        return Result<NodeId>::err(Error(ErrorCode::INVALID_HANDLE,
                                         "unknown package id " + std::to_string(package_id.index)));
    }

    Node node;
    node.kind = NodeKind::Instantiation;
    node.item_kind = ExternKind::Instance;
    node.package = package_id;

    NodeId id{static_cast<uint32_t>(nodes_.size())};
    nodes_.push_back(std::move(node));

    for (const auto& arg : arguments) {
        auto outcome = set_argument(id, arg.import_name, arg.source);
        if (outcome.status == WiringStatus::Error) {
            // Nothing can refer to the new node yet, so dropping it is safe
            nodes_.pop_back();
            return Result<NodeId>::err(
                outcome.error->withContext("instantiating '" + pkg->name + "'"));
        }
    }

    spdlog::debug("instantiated '{}' as node {}", pkg->name, id.index);
    return Result<NodeId>::ok(id);
}

WiringOutcome CompositionGraph::set_argument(NodeId instance, const std::string& import_name,
                                             ExportRef source) {
    if (instance.index >= nodes_.size() ||
        nodes_[instance.index].kind != NodeKind::Instantiation) {
        return WiringOutcome::failed(Error(ErrorCode::INVALID_HANDLE,
                                           "node " + std::to_string(instance.index) +
                                           " is not an instantiation"));
    }
    if (source.node.index >= nodes_.size()) {
        return WiringOutcome::failed(Error(ErrorCode::INVALID_HANDLE,
                                           "unknown source node " + std::to_string(source.node.index)));
    }

    Node& target = nodes_[instance.index];
    const Package& pkg = packages_[target.package.index];

    const ComponentItem* import = find_import(pkg.info, import_name);
    if (!import) {
        spdlog::debug("'{}' has no import '{}'; skipping", pkg.name, import_name);
        return WiringOutcome::skipped();
    }

    if (depends_on(source.node, instance)) {
        return WiringOutcome::failed(Error(ErrorCode::WOULD_CREATE_CYCLE,
                                           "wiring '" + import_name + "' of '" + pkg.name +
                                           "' to node " + std::to_string(source.node.index) +
                                           " would create a cycle"));
    }

    for (const auto& existing : target.arguments) {
        if (existing.first == import_name) {
            return WiringOutcome::failed(Error(ErrorCode::ALREADY_WIRED,
                                               "import '" + import_name + "' of '" + pkg.name +
                                               "' is already wired"));
        }
    }

    if (auto mismatch = check_types(*import, nodes_[source.node.index])) {
        return WiringOutcome::failed(mismatch->withContext("package '" + pkg.name + "'"));
    }

    target.arguments.emplace_back(import_name, source.node);
    spdlog::debug("wired '{}' of '{}' to node {}", import_name, pkg.name, source.node.index);
    return WiringOutcome::wired();
}

// True when `from` reaches `target` through argument or alias edges
bool CompositionGraph::depends_on(NodeId from, NodeId target) const {
    std::vector<bool> visited(nodes_.size(), false);
    std::vector<NodeId> pending{from};
    while (!pending.empty()) {
        NodeId current = pending.back();
        pending.pop_back();
        if (current == target) return true;
        if (visited[current.index]) continue;
        visited[current.index] = true;

        const Node& n = nodes_[current.index];
        if (n.kind == NodeKind::Alias) {
            pending.push_back(n.source);
        } else {
            for (const auto& arg : n.arguments) pending.push_back(arg.second);
        }
    }
    return false;
}

Result<std::optional<ExportRef>> CompositionGraph::alias_export(NodeId instance,
                                                                const std::string& export_name) {
    using R = Result<std::optional<ExportRef>>;
    if (instance.index >= nodes_.size() ||
        nodes_[instance.index].kind != NodeKind::Instantiation) {
        return R::err(Error(ErrorCode::INVALID_HANDLE,
                            "node " + std::to_string(instance.index) + " is not an instantiation"));
    }

    // Reuse an existing alias of the same export
    for (size_t i = instance.index + 1; i < nodes_.size(); ++i) {
        const Node& n = nodes_[i];
        if (n.kind == NodeKind::Alias && n.source == instance && n.export_name == export_name) {
            return R::ok(ExportRef{NodeId{static_cast<uint32_t>(i)}});
        }
    }

    const Package& pkg = packages_[nodes_[instance.index].package.index];
    const ComponentItem* item = find_export(pkg.info, export_name);
    if (!item) {
        return R::ok(std::nullopt);
    }

    Node alias;
    alias.kind = NodeKind::Alias;
    alias.item_kind = item->kind;
    alias.source = instance;
    alias.export_name = export_name;

    NodeId id{static_cast<uint32_t>(nodes_.size())};
    nodes_.push_back(std::move(alias));
    return R::ok(ExportRef{id});
}

// ============================================================================
// Public Exports
// ============================================================================

Result<void> CompositionGraph::add_public_export(ExportRef source, const std::string& public_name) {
    if (source.node.index >= nodes_.size() || nodes_[source.node.index].kind != NodeKind::Alias) {
        return Result<void>::err(Error(ErrorCode::INVALID_HANDLE,
                                       "node " + std::to_string(source.node.index) +
                                       " is not an export alias"));
    }
    for (const auto& existing : exports_) {
        if (existing.name == public_name) {
            return Result<void>::err(Error(ErrorCode::DUPLICATE_EXPORT,
                                           "export '" + public_name + "' already exists"));
        }
    }
    exports_.push_back({public_name, source});
    return Result<void>::ok();
}

Result<void> CompositionGraph::mark_entry_point(ExportRef source, const std::string& public_name) {
    if (entry_point_) {
        return Result<void>::err(Error(ErrorCode::DUPLICATE_EXPORT,
                                       "entry point already set to '" +
                                       exports_[*entry_point_].name + "'"));
    }
    auto added = add_public_export(source, public_name);
    if (added.isErr()) return added;
    entry_point_ = exports_.size() - 1;
    return Result<void>::ok();
}

Result<void> CompositionGraph::add_export(ExportRef source, const std::string& public_name) {
    return add_public_export(source, public_name);
}

std::optional<std::string> CompositionGraph::entry_point() const {
    if (!entry_point_) return std::nullopt;
    return exports_[*entry_point_].name;
}

} // namespace vconf
