#include "vconf/harness.hpp"
#include "vconf/componentize.hpp"
#include "vconf/platform.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <memory>
#include <sstream>

namespace vconf {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

Result<std::vector<uint8_t>> read_component_file(const std::string& role, const std::string& path) {
    if (path.empty()) {
        return Result<std::vector<uint8_t>>::err(
            Error(ErrorCode::CONFIG_INVALID, role + " path is not configured"));
    }
    auto bytes = read_binary_file(path);
    if (bytes.isErr()) return Result<std::vector<uint8_t>>::err(bytes.error().withContext(role));
    return bytes;
}

} // namespace

Result<std::string> find_manifest_source(const std::string& manifest) {
    std::istringstream lines(manifest);
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 6, "source") != 0) continue;

        std::string rest = trim(line.substr(6));
        if (rest.empty() || rest[0] != '=') continue;
        rest = trim(rest.substr(1));

        // The first declared source decides; a later local one is never used instead
        if (!rest.empty() && rest[0] == '{') {
            return Result<std::string>::err(
                Error(ErrorCode::CONFIG_INVALID, "remote component sources are not supported"));
        }
        auto close = rest.size() >= 2 && rest[0] == '"' ? rest.find('"', 1) : std::string::npos;
        if (close == std::string::npos) {
            return Result<std::string>::err(
                Error(ErrorCode::CONFIG_INVALID, "unreadable component source: " + rest));
        }
        return Result<std::string>::ok(rest.substr(1, close - 1));
    }
    return Result<std::string>::err(Error(ErrorCode::CONFIG_INVALID, "no component source"));
}

Result<std::string> locate_app(const std::string& manifest, const std::string& manifest_path,
                               const std::string& app_override) {
    if (!app_override.empty()) return Result<std::string>::ok(app_override);

    auto source = find_manifest_source(manifest);
    if (source.isErr()) return Result<std::string>::err(source.error().withContext(manifest_path));

    const std::string& path = source.value();
    if (!path.empty() && path[0] == '/') return Result<std::string>::ok(path);

    std::string base = get_parent_directory(manifest_path);
    return Result<std::string>::ok(base.empty() ? path : join_path(base, path));
}

Result<ShimSet> load_shims(const Config& config) {
    ShimSet shims;
    auto virt = read_component_file("virtualization shim", config.virt_path);
    if (virt.isErr()) return Result<ShimSet>::err(virt.error());
    shims.virt = std::move(virt.value());

    auto router = read_component_file("router", config.router_path);
    if (router.isErr()) return Result<ShimSet>::err(router.error());
    shims.router = std::move(router.value());

    return Result<ShimSet>::ok(std::move(shims));
}

Result<PreparedHarness> prepare_harness(const HarnessOptions& options) {
    using R = Result<PreparedHarness>;
    PreparedHarness harness;
    harness.name = get_filename(options.test_path);
    if (harness.name.empty()) harness.name = "test";

    auto manifest = read_text_file(options.manifest_path);
    if (manifest.isErr()) return R::err(manifest.error().withContext("reading manifest"));
    harness.manifest = std::move(manifest.value());

    auto app_path = locate_app(harness.manifest, options.manifest_path, options.app_path);
    if (app_path.isErr()) return R::err(app_path.error());
    spdlog::debug("app: {}", app_path.value());

    auto app = read_component_file("app", app_path.value());
    if (app.isErr()) return R::err(app.error());
    auto component = ensure_component(std::move(app.value()), options.config.componentize_command);
    if (component.isErr()) return R::err(component.error().withContext(app_path.value()));

    auto test = read_component_file("test", options.test_path);
    if (test.isErr()) return R::err(test.error());

    auto shims = load_shims(options.config);
    if (shims.isErr()) return R::err(shims.error());

    auto artifact = compose_test_harness(shims.value(), std::move(component.value()), std::move(test.value()));
    if (artifact.isErr()) return R::err(artifact.error());
    harness.artifact = std::move(artifact.value());

    if (options.config.dump_composition) {
        auto written = write_binary_file(DUMP_COMPOSITION_FILE, harness.artifact);
        if (written.isErr()) return R::err(written.error().withContext("dumping composition"));
        spdlog::info("wrote composition to {}", DUMP_COMPOSITION_FILE);
    }

    return R::ok(std::move(harness));
}

Trial make_harness_trial(HarnessHost& host, PreparedHarness harness) {
    auto shared = std::make_shared<PreparedHarness>(std::move(harness));
    Trial trial;
    trial.name = shared->name;
    trial.body = [&host, shared]() -> Result<void> {
        auto instance = host.load_harness(shared->artifact, shared->manifest);
        if (instance.isErr()) return Result<void>::err(instance.error());
        return instance.value()->run();
    };
    return trial;
}

} // namespace vconf
