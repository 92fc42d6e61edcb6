/**
 * vconf CLI - run (default action)
 *
 * Compose the test harness and run it as a single trial on a
 * process-backed execution host.
 */

#include "../common.hpp"
#include <vconf/process_host.hpp>
#include <vconf/trial.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>

namespace vconf::cli::commands {

namespace {

struct RunOptions {
    std::string test_path;
};

int cmd_run(const GlobalOptions& opts, const RunOptions& run_opts) {
    auto config = load_settings(opts);
    if (!config) return 1;

    if (config->host_command.empty()) {
        print_error("no execution host configured (set host.command, VCONF_HOST_COMMAND or --host-command)");
        return 1;
    }

    auto harness = prepare_harness(harness_options(opts, *config, run_opts.test_path));
    if (harness.isErr()) {
        print_error(harness.error().message());
        return 1;
    }

    ProcessHost host(config->host_command);
    std::vector<Trial> trials;
    trials.push_back(make_harness_trial(host, std::move(harness.value())));

    auto summary = run_trials(trials, std::cout);
    return summary.ok() ? 0 : 101;
}

} // anonymous namespace

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunOptions run_opts;

    app->add_option("test-path", run_opts.test_path, "Test component to run");

    app->callback([app, &opts]() {
        if (!app->get_subcommands().empty()) return;
        if (run_opts.test_path.empty()) {
            std::cout << app->help() << std::endl;
            std::exit(2);
        }
        std::exit(cmd_run(opts, run_opts));
    });
}

} // namespace vconf::cli::commands
