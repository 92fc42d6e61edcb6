/**
 * vconf CLI - Entry Point
 *
 * Composes an app with its virtualized platform and a test component,
 * then runs the test through an execution host.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace vconf::cli::commands {
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_compose(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace vconf::cli;

    CLI::App app{"vconf - conformance tests for virtualized component apps"};
    app.set_version_flag("-V,--version", VCONF_VERSION);
    app.require_subcommand(0, 1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_option("--app", opts.app, "App component (default: first source in the manifest)");
    app.add_option("--manifest", opts.manifest, "Application manifest (default: spin.toml)");
    app.add_option("--config", opts.config, "Config file (default: ./vconf.json when present)");
    app.add_option("--virt", opts.virt, "Virtualization shim component");
    app.add_option("--router", opts.router, "Router component");
    app.add_option("--host-command", opts.host_command, "Execution host command line");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");

    // Commands
    auto* compose_cmd = app.add_subcommand("compose", "Write the composed test harness without running it");
    commands::setup_compose(compose_cmd, opts);

    // Running a test is the default action
    commands::setup_run(&app, opts);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
