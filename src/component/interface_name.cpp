#include "vconf/interface_name.hpp"

#include <cctype>

namespace vconf {

namespace {

// kebab-case label: lowercase words joined by '-'
bool is_label(const std::string& s) {
    if (s.empty() || s.front() == '-' || s.back() == '-') return false;
    for (char c : s) {
        auto uc = static_cast<unsigned char>(c);
        if (!(std::islower(uc) || std::isdigit(uc) || c == '-')) return false;
    }
    return true;
}

bool same_track(const Version& a, const Version& b) {
    if (a.major() != b.major()) return false;
    if (a.major() > 0) return true;
    if (a.minor() != b.minor()) return false;
    if (a.minor() > 0) return true;
    return a.patch() == b.patch();
}

} // namespace

std::string InterfaceName::unversioned() const {
    return ns + ":" + package + "/" + interface;
}

std::optional<Version> parse_version(const std::string& str) {
    if (str.empty()) return std::nullopt;
    try {
        return semver::version::parse(str);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

std::optional<InterfaceName> parse_interface_name(const std::string& name) {
    auto colon = name.find(':');
    if (colon == std::string::npos) return std::nullopt;
    auto slash = name.find('/', colon + 1);
    if (slash == std::string::npos) return std::nullopt;

    InterfaceName result;
    result.ns = name.substr(0, colon);
    result.package = name.substr(colon + 1, slash - colon - 1);

    std::string rest = name.substr(slash + 1);
    auto at = rest.find('@');
    if (at != std::string::npos) {
        auto version = parse_version(rest.substr(at + 1));
        if (!version) return std::nullopt;
        result.version = *version;
        rest = rest.substr(0, at);
    }
    result.interface = rest;

    if (!is_label(result.ns) || !is_label(result.package) || !is_label(result.interface)) {
        return std::nullopt;
    }
    return result;
}

bool interfaces_compatible(const InterfaceName& required, const InterfaceName& provided) {
    if (required.unversioned() != provided.unversioned()) return false;
    if (!required.version || !provided.version) return true;
    return same_track(*required.version, *provided.version) &&
           !(*provided.version < *required.version);
}

} // namespace vconf
