#include "vconf/conformance.hpp"
#include "vconf/platform.hpp"
#include "vconf/runner.hpp"

#include <spdlog/spdlog.h>

namespace vconf {

Result<Fixture> load_fixture(const std::string& dir) {
    using R = Result<Fixture>;

    if (!is_directory(dir)) {
        return R::err(Error(ErrorCode::FILE_NOT_FOUND, "fixture directory not found: " + dir));
    }

    Fixture fixture;
    fixture.name = get_filename(dir);
    if (fixture.name.empty()) fixture.name = get_filename(get_parent_directory(dir));

    auto manifest = read_text_file(join_path(dir, FIXTURE_MANIFEST));
    if (manifest.isErr()) return R::err(manifest.error().withContext("fixture " + fixture.name));
    fixture.manifest = std::move(manifest.value());

    auto component = read_binary_file(join_path(dir, FIXTURE_COMPONENT));
    if (component.isErr()) return R::err(component.error().withContext("fixture " + fixture.name));
    fixture.component = std::move(component.value());

    auto scenario_text = read_text_file(join_path(dir, FIXTURE_SCENARIO));
    if (scenario_text.isErr()) return R::err(scenario_text.error().withContext("fixture " + fixture.name));

    auto scenario = parse_scenario(scenario_text.value());
    if (!scenario.ok) {
        return R::err(Error(ErrorCode::SCENARIO_INVALID,
                            "fixture " + fixture.name + ": " + FIXTURE_SCENARIO + ": " + scenario.error));
    }
    fixture.scenario = std::move(scenario.scenario);

    return R::ok(std::move(fixture));
}

Result<void> run_conformance_test(AppHost& host, const ShimSet& shims, const Fixture& fixture) {
    auto artifact = virtualize_app(shims, fixture.component);
    if (artifact.isErr()) {
        return Result<void>::err(artifact.error().withContext("failed to virtualize app"));
    }

    auto app = host.load_app(artifact.value(), fixture.manifest);
    if (app.isErr()) return Result<void>::err(app.error().withContext("loading " + fixture.name));

    InvocationRunner runner(*app.value());
    auto report = runner.run_scenario(fixture.scenario);
    spdlog::info("{}: {} passed, {} failed", fixture.name, report.passed, report.failed);

    if (!report.ok()) {
        return Result<void>::err(Error(ErrorCode::ASSERTION_FAILED, report.first_error()));
    }
    return Result<void>::ok();
}

} // namespace vconf
