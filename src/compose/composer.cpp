#include "vconf/composer.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace vconf {

// ============================================================================
// Tables
// ============================================================================

const std::vector<CapabilityWiring>& app_capabilities() {
    static const std::vector<CapabilityWiring> table = {
        {"fermyon:spin/key-value@2.0.0", Provider::Shim, "fermyon:spin/key-value@2.0.0"},
        {"fermyon:spin/llm@2.0.0", Provider::Shim, "fermyon:spin/llm@2.0.0"},
        {"fermyon:spin/redis@2.0.0", Provider::Shim, "fermyon:spin/redis@2.0.0"},
        {"fermyon:spin/mysql@2.0.0", Provider::Shim, "fermyon:spin/mysql@2.0.0"},
        {"fermyon:spin/postgres@2.0.0", Provider::Shim, "fermyon:spin/postgres@2.0.0"},
        {"fermyon:spin/sqlite@2.0.0", Provider::Shim, "fermyon:spin/sqlite@2.0.0"},
        {"fermyon:spin/mqtt@2.0.0", Provider::Shim, "fermyon:spin/mqtt@2.0.0"},
        {"fermyon:spin/variables@2.0.0", Provider::Shim, "fermyon:spin/variables@2.0.0"},
        {names::OUTGOING_HANDLER, Provider::Shim, names::OUTGOING_HANDLER},
        // wasi:cli/environment is not virtualized; the artifact imports it from the host
    };
    return table;
}

const std::vector<CapabilityWiring>& router_wiring() {
    static const std::vector<CapabilityWiring> table = {
        {names::SET_COMPONENT_ID, Provider::Shim, names::SET_COMPONENT_ID},
        {names::INCOMING_HANDLER, Provider::App, names::INCOMING_HANDLER},
    };
    return table;
}

const std::vector<CapabilityWiring>& harness_wiring() {
    static const std::vector<CapabilityWiring> table = {
        {names::INCOMING_HANDLER, Provider::Router, names::INCOMING_HANDLER},
        {names::OUTGOING_HANDLER, Provider::Shim, names::OUTGOING_HANDLER},
        {"fermyon:spin/key-value@2.0.0", Provider::Shim, "fermyon:spin/key-value@2.0.0"},
        {"fermyon:spin-test-virt/key-value-calls", Provider::Shim,
         "fermyon:spin-test-virt/key-value-calls"},
        {"fermyon:spin-test-virt/http-handler", Provider::Shim,
         "fermyon:spin-test-virt/http-handler"},
    };
    return table;
}

const std::vector<CapabilityWiring>& virtualized_app_exports() {
    static const std::vector<CapabilityWiring> table = {
        {names::HTTP_TYPES, Provider::Shim, names::HTTP_TYPES, false},
        {names::IO_STREAMS, Provider::Shim, names::IO_STREAMS, false},
        {names::HTTP_HELPER, Provider::Shim, names::HTTP_HELPER, false},
    };
    return table;
}

// ============================================================================
// Fixed Topology
// ============================================================================

namespace {

struct Topology {
    CompositionGraph graph;
    std::optional<NodeId> shim;
    std::optional<NodeId> app;
    std::optional<NodeId> router;

    std::optional<NodeId> node_for(Provider p) const {
        switch (p) {
            case Provider::Shim: return shim;
            case Provider::App: return app;
            case Provider::Router: return router;
        }
        return std::nullopt;
    }
};

// Alias a provider export; nullopt when an optional row's export is absent
Result<std::optional<ExportRef>> resolve_row(Topology& topo, const CapabilityWiring& row) {
    using R = Result<std::optional<ExportRef>>;
    auto node = topo.node_for(row.provider);
    if (!node) {
        return R::err(Error(ErrorCode::INVALID_HANDLE,
                            std::string(provider_to_string(row.provider)) + " is not instantiated yet"));
    }

    auto alias = topo.graph.alias_export(*node, row.export_name);
    if (alias.isErr()) return alias;
    if (!alias.value() && row.required) {
        return R::err(Error(ErrorCode::MISSING_PROVIDER_EXPORT,
                            std::string(provider_to_string(row.provider)) +
                            " does not export '" + row.export_name + "'"));
    }
    return alias;
}

Result<std::vector<InstantiationArgument>> resolve_arguments(
    Topology& topo, const std::vector<CapabilityWiring>& table) {
    using R = Result<std::vector<InstantiationArgument>>;
    std::vector<InstantiationArgument> args;
    for (const auto& row : table) {
        auto ref = resolve_row(topo, row);
        if (ref.isErr()) return R::err(ref.error());
        if (ref.value()) {
            args.push_back({row.name, *ref.value()});
        }
    }
    return R::ok(std::move(args));
}

Result<NodeId> instantiate_named(Topology& topo, const std::string& name,
                                 std::vector<uint8_t> bytes,
                                 const std::vector<InstantiationArgument>& args) {
    auto package = topo.graph.register_package(name, std::move(bytes));
    if (package.isErr()) return Result<NodeId>::err(package.error());
    return topo.graph.instantiate(package.value(), args);
}

// shim, then app wired to the capability table, then router
Result<void> build_app_stack(Topology& topo, const ShimSet& shims, std::vector<uint8_t> app) {
    auto shim = instantiate_named(topo, "virt", shims.virt, {});
    if (shim.isErr()) return Result<void>::err(shim.error());
    topo.shim = shim.value();

    auto app_args = resolve_arguments(topo, app_capabilities());
    if (app_args.isErr()) return Result<void>::err(app_args.error());
    auto app_node = instantiate_named(topo, "app", std::move(app), app_args.value());
    if (app_node.isErr()) return Result<void>::err(app_node.error());
    topo.app = app_node.value();

    auto router_args = resolve_arguments(topo, router_wiring());
    if (router_args.isErr()) return Result<void>::err(router_args.error());
    auto router = instantiate_named(topo, "router", shims.router, router_args.value());
    if (router.isErr()) return Result<void>::err(router.error());
    topo.router = router.value();

    return Result<void>::ok();
}

} // namespace

Result<std::vector<uint8_t>> compose_test_harness(const ShimSet& shims,
                                                  std::vector<uint8_t> app,
                                                  std::vector<uint8_t> test) {
    using R = Result<std::vector<uint8_t>>;
    Topology topo;

    auto stack = build_app_stack(topo, shims, std::move(app));
    if (stack.isErr()) return R::err(stack.error().withContext("composing test harness"));

    auto test_args = resolve_arguments(topo, harness_wiring());
    if (test_args.isErr()) return R::err(test_args.error().withContext("composing test harness"));
    auto test_node = instantiate_named(topo, "test", std::move(test), test_args.value());
    if (test_node.isErr()) return R::err(test_node.error().withContext("composing test harness"));

    auto run = topo.graph.alias_export(test_node.value(), names::RUN);
    if (run.isErr()) return R::err(run.error());
    if (!run.value()) {
        return R::err(Error(ErrorCode::MISSING_PROVIDER_EXPORT,
                            "test harness does not export '" + std::string(names::RUN) + "'"));
    }

    auto marked = topo.graph.mark_entry_point(*run.value(), names::RUN);
    if (marked.isErr()) return R::err(marked.error());

    spdlog::info("composed test harness with {} packages", topo.graph.package_count());
    return topo.graph.encode();
}

Result<std::vector<uint8_t>> virtualize_app(const ShimSet& shims, std::vector<uint8_t> app) {
    using R = Result<std::vector<uint8_t>>;
    Topology topo;

    auto stack = build_app_stack(topo, shims, std::move(app));
    if (stack.isErr()) return R::err(stack.error().withContext("virtualizing app"));

    auto handler = topo.graph.alias_export(*topo.router, names::INCOMING_HANDLER);
    if (handler.isErr()) return R::err(handler.error());
    if (!handler.value()) {
        return R::err(Error(ErrorCode::MISSING_PROVIDER_EXPORT,
                            "router does not export '" + std::string(names::INCOMING_HANDLER) + "'"));
    }
    auto marked = topo.graph.mark_entry_point(*handler.value(), names::INCOMING_HANDLER);
    if (marked.isErr()) return R::err(marked.error());

    for (const auto& row : virtualized_app_exports()) {
        auto ref = resolve_row(topo, row);
        if (ref.isErr()) return R::err(ref.error());
        if (!ref.value()) {
            spdlog::debug("{} has no '{}' export to publish", provider_to_string(row.provider),
                          row.export_name);
            continue;
        }
        auto added = topo.graph.add_export(*ref.value(), row.name);
        if (added.isErr()) return R::err(added.error());
    }

    spdlog::info("virtualized app with {} packages", topo.graph.package_count());
    return topo.graph.encode();
}

} // namespace vconf
