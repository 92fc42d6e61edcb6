#include "vconf/config.hpp"
#include "vconf/platform.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <set>
#include <sstream>

namespace vconf {

namespace {

struct ConfigError {
    std::string message;
};

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key,
                                      const std::string& where) {
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_string()) throw ConfigError{where + key + " must be a string"};
    return j[key].get<std::string>();
}

std::optional<std::vector<std::string>> get_string_array(const nlohmann::json& j, const std::string& key,
                                                         const std::string& where) {
    if (!j.contains(key)) return std::nullopt;
    if (!j[key].is_array()) throw ConfigError{where + key + " must be an array of strings"};
    std::vector<std::string> result;
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) throw ConfigError{where + key + " must be an array of strings"};
        result.push_back(elem.get<std::string>());
    }
    return result;
}

const nlohmann::json* get_object(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) return nullptr;
    if (!j[key].is_object()) throw ConfigError{key + " must be an object"};
    return &j[key];
}

void warn_unknown_keys(const nlohmann::json& j, const std::set<std::string>& known,
                       const std::string& where, std::vector<std::string>& warnings) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!known.count(it.key())) warnings.push_back("unknown_key:" + where + it.key());
    }
}

std::string resolve_path(const std::string& path, const std::string& source_path) {
    if (path.empty() || path[0] == '/' || source_path.empty()) return path;
    std::string base = get_parent_directory(source_path);
    if (base.empty()) return path;
    return join_path(base, path);
}

} // namespace

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str, nullptr, true, true);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        warn_unknown_keys(j, {"shims", "host", "componentize", "manifest", "log_level", "dump_composition"},
                          "", result.warnings);

        if (const auto* shims = get_object(j, "shims")) {
            warn_unknown_keys(*shims, {"virt", "router"}, "shims.", result.warnings);
            if (auto virt = get_string(*shims, "virt", "shims.")) {
                result.config.virt_path = resolve_path(*virt, source_path);
            }
            if (auto router = get_string(*shims, "router", "shims.")) {
                result.config.router_path = resolve_path(*router, source_path);
            }
        }

        if (const auto* host = get_object(j, "host")) {
            warn_unknown_keys(*host, {"command"}, "host.", result.warnings);
            if (auto command = get_string_array(*host, "command", "host.")) {
                result.config.host_command = *command;
            }
        }

        if (const auto* componentize = get_object(j, "componentize")) {
            warn_unknown_keys(*componentize, {"command"}, "componentize.", result.warnings);
            if (auto command = get_string_array(*componentize, "command", "componentize.")) {
                result.config.componentize_command = *command;
            }
        }

        if (auto manifest = get_string(j, "manifest", "")) {
            result.config.manifest = *manifest;
        }

        if (auto level = get_string(j, "log_level", "")) {
            result.config.log_level = *level;
        }

        if (j.contains("dump_composition")) {
            if (!j["dump_composition"].is_boolean()) {
                result.error = "dump_composition must be a boolean";
                return result;
            }
            result.config.dump_composition = j["dump_composition"].get<bool>();
        }

        result.ok = true;
        return result;

    } catch (const ConfigError& e) {
        result.error = e.message;
        return result;
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

ConfigParseResult load_config(const std::string& path) {
    auto content = read_text_file(path);
    if (content.isErr()) {
        ConfigParseResult result;
        result.config.source_path = path;
        result.error = content.error().message();
        return result;
    }
    return parse_config(content.value(), path);
}

std::vector<std::string> split_command(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream ss(command);
    std::string part;
    while (ss >> part) parts.push_back(part);
    return parts;
}

void apply_env_overrides(Config& config) {
    if (auto level = get_env("VCONF_LOG")) config.log_level = *level;
    if (get_env("VCONF_DUMP_COMPOSITION")) config.dump_composition = true;
    if (auto virt = get_env("VCONF_VIRT")) config.virt_path = *virt;
    if (auto router = get_env("VCONF_ROUTER")) config.router_path = *router;
    if (auto command = get_env("VCONF_HOST_COMMAND")) config.host_command = split_command(*command);
}

} // namespace vconf
