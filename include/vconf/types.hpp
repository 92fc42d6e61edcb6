#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vconf {

// ============================================================================
// Extern Kinds (component-model sorts)
// ============================================================================

enum class ExternKind {
    CoreModule,
    Func,
    Value,
    Type,
    Component,
    Instance,
};

inline const char* extern_kind_to_string(ExternKind k) {
    switch (k) {
        case ExternKind::CoreModule: return "core module";
        case ExternKind::Func: return "func";
        case ExternKind::Value: return "value";
        case ExternKind::Type: return "type";
        case ExternKind::Component: return "component";
        case ExternKind::Instance: return "instance";
        default: return "unknown";
    }
}

// ============================================================================
// Component Items
// ============================================================================

// One import or export declared at the top level of a component
struct ComponentItem {
    std::string name;
    ExternKind kind = ExternKind::Instance;
};

struct ComponentInfo {
    std::vector<ComponentItem> imports;
    std::vector<ComponentItem> exports;
};

// ============================================================================
// Graph Handles
// ============================================================================

struct PackageId {
    uint32_t index = 0;

    bool operator==(const PackageId& other) const { return index == other.index; }
    bool operator!=(const PackageId& other) const { return index != other.index; }
};

struct NodeId {
    uint32_t index = 0;

    bool operator==(const NodeId& other) const { return index == other.index; }
    bool operator!=(const NodeId& other) const { return index != other.index; }
};

// ============================================================================
// Wiring Outcome
// ============================================================================

enum class WiringStatus {
    Wired,
    SkippedUnknownImport,
    Error,
};

inline const char* wiring_status_to_string(WiringStatus s) {
    switch (s) {
        case WiringStatus::Wired: return "wired";
        case WiringStatus::SkippedUnknownImport: return "skipped_unknown_import";
        case WiringStatus::Error: return "error";
        default: return "error";
    }
}

} // namespace vconf
