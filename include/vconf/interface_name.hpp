#pragma once

/**
 * @file interface_name.hpp
 * @brief Parsing and compatibility of component interface names
 *
 * Interface names look like `wasi:http/outgoing-handler@0.2.0`. The version
 * is optional and follows SemVer 2.0.0.
 *
 * @example
 * ```cpp
 * auto want = vconf::parse_interface_name("fermyon:spin/key-value@2.0.0");
 * auto have = vconf::parse_interface_name("fermyon:spin/key-value@2.0.3");
 * if (want && have && vconf::interfaces_compatible(*want, *have)) {
 *     // the provider can satisfy the import
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>

namespace vconf {

using Version = semver::version;

struct InterfaceName {
    std::string ns;         ///< e.g. "wasi"
    std::string package;    ///< e.g. "http"
    std::string interface;  ///< e.g. "outgoing-handler"
    std::optional<Version> version;

    /// "ns:package/interface" without the version
    std::string unversioned() const;
};

/// Parse a SemVer version string; nullopt on failure
std::optional<Version> parse_version(const std::string& str);

/// Parse `ns:package/interface[@version]`; nullopt for plain names like "run"
std::optional<InterfaceName> parse_interface_name(const std::string& name);

/**
 * @brief Check whether `provided` can satisfy an import of `required`
 *
 * Namespace, package and interface must match. When both carry versions the
 * provided version must be on the same compatibility track (same major for
 * >=1.0.0, same minor for 0.x, identical for 0.0.x) and not older.
 */
bool interfaces_compatible(const InterfaceName& required, const InterfaceName& provided);

} // namespace vconf
