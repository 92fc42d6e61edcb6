#pragma once

#include "vconf/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vconf {
namespace http {

using FieldValue = std::vector<uint8_t>;
using FieldEntry = std::pair<std::string, FieldValue>;
using FieldList = std::vector<FieldEntry>;

// ============================================================================
// Header Errors
// ============================================================================

enum class HeaderError {
    InvalidSyntax,
    Forbidden,
    Immutable,
};

inline const char* header_error_to_string(HeaderError e) {
    switch (e) {
        case HeaderError::InvalidSyntax: return "invalid-syntax";
        case HeaderError::Forbidden: return "forbidden";
        case HeaderError::Immutable: return "immutable";
        default: return "invalid-syntax";
    }
}

// Token grammar (RFC 9110 field-name)
bool is_valid_field_name(const std::string& name);

// Visible ASCII, SP, HTAB and obs-text; no CR, LF, NUL or DEL
bool is_valid_field_value(const FieldValue& value);

// Hop-by-hop and host-controlled names a guest may not set
bool is_forbidden_field_name(const std::string& name);

bool field_name_equals(const std::string& a, const std::string& b);

// ============================================================================
// Fields
// ============================================================================

/**
 * @brief Ordered header collection
 *
 * Names keep the case they were appended with; lookups compare names
 * case-insensitively. Immutable instances reject every mutation with
 * HeaderError::Immutable.
 */
class Fields {
public:
    Fields() = default;

    /// Build from a list, validating every entry
    static Result<Fields, HeaderError> from_list(const FieldList& entries);

    /// Build without validation (host-produced headers)
    static Fields from_trusted(FieldList entries, bool immutable);

    Result<void, HeaderError> append(const std::string& name, const FieldValue& value);
    Result<void, HeaderError> set(const std::string& name, const std::vector<FieldValue>& values);
    Result<void, HeaderError> remove(const std::string& name);

    std::vector<FieldValue> get(const std::string& name) const;
    bool has(const std::string& name) const;

    const FieldList& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool immutable() const { return immutable_; }
    void make_immutable() { immutable_ = true; }

    /// Mutable copy, as wasi `fields.clone` produces
    Fields clone() const;

private:
    Result<void, HeaderError> check_mutation(const std::string& name) const;

    FieldList entries_;
    bool immutable_ = false;
};

} // namespace http
} // namespace vconf
