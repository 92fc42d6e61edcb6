/**
 * vconf CLI - compose command
 *
 * Write the composed test harness to a file instead of running it.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace vconf::cli::commands {

namespace {

struct ComposeOptions {
    std::string test_path;
    std::string output = DUMP_COMPOSITION_FILE;
};

int cmd_compose(const GlobalOptions& opts, const ComposeOptions& compose_opts) {
    auto config = load_settings(opts);
    if (!config) return 1;

    // Written explicitly below
    config->dump_composition = false;

    auto harness = prepare_harness(harness_options(opts, *config, compose_opts.test_path));
    if (harness.isErr()) {
        print_error(harness.error().message());
        return 1;
    }

    auto written = write_binary_file(compose_opts.output, harness.value().artifact);
    if (written.isErr()) {
        print_error(written.error().message());
        return 1;
    }

    std::cout << "Wrote " << compose_opts.output << " (" << harness.value().artifact.size()
              << " bytes)" << std::endl;
    return 0;
}

} // anonymous namespace

void setup_compose(CLI::App* app, GlobalOptions& opts) {
    static ComposeOptions compose_opts;

    app->add_option("test-path", compose_opts.test_path, "Test component")->required();
    app->add_option("-o,--output", compose_opts.output, "Output file");

    app->callback([&opts]() {
        std::exit(cmd_compose(opts, compose_opts));
    });
}

} // namespace vconf::cli::commands
