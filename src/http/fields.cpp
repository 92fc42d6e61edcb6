#include "vconf/http_fields.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace vconf {
namespace http {

namespace {

constexpr const char* FORBIDDEN_NAMES[] = {
    "connection",
    "keep-alive",
    "proxy-authenticate",
    "proxy-authorization",
    "proxy-connection",
    "te",
    "transfer-encoding",
    "upgrade",
    "host",
    "http2-settings",
};

bool is_tchar(unsigned char c) {
    if (std::isalnum(c)) return true;
    return std::strchr("!#$%&'*+-.^_`|~", c) != nullptr && c != '\0';
}

} // namespace

bool is_valid_field_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(),
                       [](char c) { return is_tchar(static_cast<unsigned char>(c)); });
}

bool is_valid_field_value(const FieldValue& value) {
    for (uint8_t b : value) {
        if (b == '\t') continue;
        if (b < 0x20 || b == 0x7F) return false;
    }
    return true;
}

bool field_name_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool is_forbidden_field_name(const std::string& name) {
    for (const char* forbidden : FORBIDDEN_NAMES) {
        if (field_name_equals(name, forbidden)) return true;
    }
    return false;
}

// ============================================================================
// Fields
// ============================================================================

Result<Fields, HeaderError> Fields::from_list(const FieldList& entries) {
    Fields fields;
    for (const auto& [name, value] : entries) {
        auto appended = fields.append(name, value);
        if (appended.isErr()) {
            return Result<Fields, HeaderError>::err(appended.error());
        }
    }
    return Result<Fields, HeaderError>::ok(std::move(fields));
}

Fields Fields::from_trusted(FieldList entries, bool immutable) {
    Fields fields;
    fields.entries_ = std::move(entries);
    fields.immutable_ = immutable;
    return fields;
}

Result<void, HeaderError> Fields::check_mutation(const std::string& name) const {
    if (immutable_) return Result<void, HeaderError>::err(HeaderError::Immutable);
    if (!is_valid_field_name(name)) return Result<void, HeaderError>::err(HeaderError::InvalidSyntax);
    if (is_forbidden_field_name(name)) return Result<void, HeaderError>::err(HeaderError::Forbidden);
    return Result<void, HeaderError>::ok();
}

Result<void, HeaderError> Fields::append(const std::string& name, const FieldValue& value) {
    auto allowed = check_mutation(name);
    if (allowed.isErr()) return allowed;
    if (!is_valid_field_value(value)) return Result<void, HeaderError>::err(HeaderError::InvalidSyntax);
    entries_.emplace_back(name, value);
    return Result<void, HeaderError>::ok();
}

Result<void, HeaderError> Fields::set(const std::string& name,
                                      const std::vector<FieldValue>& values) {
    auto allowed = check_mutation(name);
    if (allowed.isErr()) return allowed;
    for (const auto& value : values) {
        if (!is_valid_field_value(value)) {
            return Result<void, HeaderError>::err(HeaderError::InvalidSyntax);
        }
    }
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const FieldEntry& e) { return field_name_equals(e.first, name); }),
                   entries_.end());
    for (const auto& value : values) {
        entries_.emplace_back(name, value);
    }
    return Result<void, HeaderError>::ok();
}

Result<void, HeaderError> Fields::remove(const std::string& name) {
    auto allowed = check_mutation(name);
    if (allowed.isErr()) return allowed;
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [&](const FieldEntry& e) { return field_name_equals(e.first, name); }),
                   entries_.end());
    return Result<void, HeaderError>::ok();
}

std::vector<FieldValue> Fields::get(const std::string& name) const {
    std::vector<FieldValue> values;
    for (const auto& [entry_name, value] : entries_) {
        if (field_name_equals(entry_name, name)) values.push_back(value);
    }
    return values;
}

bool Fields::has(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const FieldEntry& e) { return field_name_equals(e.first, name); });
}

Fields Fields::clone() const {
    return from_trusted(entries_, false);
}

} // namespace http
} // namespace vconf
