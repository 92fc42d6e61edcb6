#pragma once

/**
 * @file graph.hpp
 * @brief Composition graph of component instantiations
 *
 * The graph is a DAG: every edge refers to a node that already exists, and
 * a wiring that would close a cycle is refused. Nodes may be wired to
 * providers created after them; encode() emits them in dependency order.
 * Handles (PackageId, NodeId, ExportRef) are plain indices into the graph
 * that owns them.
 *
 * @example
 * ```cpp
 * vconf::CompositionGraph graph;
 * auto virt = graph.register_package("virt", virt_bytes).value();
 * auto app = graph.register_package("app", app_bytes).value();
 *
 * auto virt_node = graph.instantiate(virt).value();
 * auto kv = graph.alias_export(virt_node, "fermyon:spin/key-value@2.0.0").value();
 * auto app_node = graph.instantiate(app, {{"fermyon:spin/key-value@2.0.0", *kv}});
 * ```
 */

#include "vconf/result.hpp"
#include "vconf/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vconf {

// ============================================================================
// Graph Elements
// ============================================================================

struct Package {
    std::string name;
    std::vector<uint8_t> bytes;
    std::string sha256;
    ComponentInfo info;
};

enum class NodeKind {
    Instantiation,
    Alias,
};

// Reference to an aliased export node; produced only by alias_export()
struct ExportRef {
    NodeId node;
};

struct InstantiationArgument {
    std::string import_name;
    ExportRef source;
};

struct Node {
    NodeKind kind = NodeKind::Instantiation;
    ExternKind item_kind = ExternKind::Instance;

    // Instantiation
    PackageId package;
    std::vector<std::pair<std::string, NodeId>> arguments;  // in wiring order

    // Alias
    NodeId source;
    std::string export_name;
};

struct PublicExport {
    std::string name;
    ExportRef source;
};

/**
 * @brief Result of a single wiring attempt
 *
 * SkippedUnknownImport is the tolerant-linking outcome: the target package
 * does not import that name, so nothing was wired and nothing failed.
 */
struct WiringOutcome {
    WiringStatus status = WiringStatus::Wired;
    std::optional<Error> error;

    static WiringOutcome wired() { return {WiringStatus::Wired, std::nullopt}; }
    static WiringOutcome skipped() { return {WiringStatus::SkippedUnknownImport, std::nullopt}; }
    static WiringOutcome failed(Error e) { return {WiringStatus::Error, std::move(e)}; }
};

// ============================================================================
// Composition Graph
// ============================================================================

class CompositionGraph {
public:
    CompositionGraph() = default;
    CompositionGraph(const CompositionGraph&) = delete;
    CompositionGraph& operator=(const CompositionGraph&) = delete;
    CompositionGraph(CompositionGraph&&) = default;
    CompositionGraph& operator=(CompositionGraph&&) = default;

    /// Parse and register a component binary under a unique name
    Result<PackageId> register_package(const std::string& name, std::vector<uint8_t> bytes);

    /**
     * @brief Instantiate a package and wire its arguments
     *
     * Arguments naming an import the package does not declare are skipped.
     * Any other wiring failure aborts: the new node is removed and the
     * error returned.
     */
    Result<NodeId> instantiate(PackageId package,
                               const std::vector<InstantiationArgument>& arguments = {});

    /// Wire one import of an instantiation node
    WiringOutcome set_argument(NodeId instance, const std::string& import_name, ExportRef source);

    /// Alias an export of an instantiation node; nullopt if it has no such export
    Result<std::optional<ExportRef>> alias_export(NodeId instance, const std::string& export_name);

    /// Designate the single externally callable export
    Result<void> mark_entry_point(ExportRef source, const std::string& public_name);

    /// Add a further public export alongside the entry point
    Result<void> add_export(ExportRef source, const std::string& public_name);

    /**
     * @brief Serialize to one component binary
     *
     * Imports of an instantiation left unwired become imports of the
     * artifact, one per distinct name, passed through to every instance
     * that needs them.
     */
    Result<std::vector<uint8_t>> encode() const;

    const Package* package(PackageId id) const;
    const Node* node(NodeId id) const;
    size_t package_count() const { return packages_.size(); }
    size_t node_count() const { return nodes_.size(); }
    const std::vector<PublicExport>& exports() const { return exports_; }
    std::optional<std::string> entry_point() const;

private:
    bool depends_on(NodeId from, NodeId target) const;
    Result<void> add_public_export(ExportRef source, const std::string& public_name);

    std::vector<Package> packages_;
    std::vector<Node> nodes_;
    std::vector<PublicExport> exports_;
    std::optional<size_t> entry_point_;
};

} // namespace vconf
