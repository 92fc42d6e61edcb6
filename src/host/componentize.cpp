#include "vconf/componentize.hpp"
#include "vconf/component.hpp"
#include "vconf/platform.hpp"
#include "vconf/process_host.hpp"

#include <spdlog/spdlog.h>

namespace vconf {

Result<std::vector<uint8_t>> componentize(const std::vector<uint8_t>& module,
                                          const std::vector<std::string>& command) {
    using R = Result<std::vector<uint8_t>>;

    if (command.empty()) {
        return R::err(Error(ErrorCode::HOST_UNAVAILABLE, "no componentize command configured"));
    }

    std::string input = make_temp_path("vconf-module", ".wasm");
    std::string output = make_temp_path("vconf-component", ".wasm");

    auto written = write_binary_file(input, module);
    if (written.isErr()) return R::err(written.error());

    auto argv = expand_placeholders(command, {{"input", input}, {"output", output}});
    spdlog::info("componentizing core module with {}", argv.front());
    auto ran = run_process(argv, {});
    remove_file(input);

    if (!ran.ok) {
        remove_file(output);
        return R::err(Error(ErrorCode::HOST_UNAVAILABLE, "componentize: " + ran.error));
    }
    if (ran.exit_code != 0) {
        remove_file(output);
        return R::err(Error(ErrorCode::HOST_FAILED,
                            "componentize command exited with status " + std::to_string(ran.exit_code)));
    }

    auto component = read_binary_file(output);
    remove_file(output);
    if (component.isErr()) return R::err(component.error().withContext("componentize"));
    if (!is_component(component.value())) {
        return R::err(Error(ErrorCode::NOT_A_COMPONENT, "componentize command did not produce a component"));
    }
    return component;
}

Result<std::vector<uint8_t>> ensure_component(std::vector<uint8_t> bytes,
                                              const std::vector<std::string>& command) {
    using R = Result<std::vector<uint8_t>>;

    if (is_component(bytes)) return R::ok(std::move(bytes));
    if (!is_core_module(bytes)) {
        return R::err(Error(ErrorCode::MALFORMED_BINARY, "app is neither a component nor a core module"));
    }
    if (command.empty()) {
        return R::err(Error(ErrorCode::NOT_A_COMPONENT,
                            "app is a core module and no componentize command is configured"));
    }
    return componentize(bytes, command);
}

} // namespace vconf
