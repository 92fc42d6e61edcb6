#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vconf {

// ============================================================================
// Binary Layout Constants
// ============================================================================

namespace wasm {

constexpr uint8_t MAGIC[4] = {0x00, 0x61, 0x73, 0x6D};  // "\0asm"

// Component preamble: version 0x0d, layer 1
constexpr uint8_t COMPONENT_VERSION[4] = {0x0D, 0x00, 0x01, 0x00};

// Core module preamble: version 1, layer 0
constexpr uint8_t MODULE_VERSION[4] = {0x01, 0x00, 0x00, 0x00};

constexpr size_t PREAMBLE_SIZE = 8;

enum SectionId : uint8_t {
    CUSTOM = 0,
    CORE_MODULE = 1,
    CORE_INSTANCE = 2,
    CORE_TYPE = 3,
    COMPONENT = 4,
    INSTANCE = 5,
    ALIAS = 6,
    TYPE = 7,
    CANON = 8,
    START = 9,
    IMPORT = 10,
    EXPORT = 11,
    VALUE = 12,
};

// Sort bytes (component-level)
enum SortByte : uint8_t {
    SORT_CORE = 0x00,
    SORT_FUNC = 0x01,
    SORT_VALUE = 0x02,
    SORT_TYPE = 0x03,
    SORT_COMPONENT = 0x04,
    SORT_INSTANCE = 0x05,
};

constexpr uint8_t CORE_SORT_MODULE = 0x11;

} // namespace wasm

// ============================================================================
// ByteReader
// ============================================================================

// Sequential reader over a byte buffer. Every read returns nullopt on
// truncation or malformed encoding and leaves the offset unspecified.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& data)
        : data_(data.data()), size_(data.size()) {}

    size_t offset() const { return offset_; }
    size_t remaining() const { return size_ - offset_; }
    bool at_end() const { return offset_ >= size_; }

    std::optional<uint8_t> read_u8();
    std::optional<uint32_t> read_var_u32();
    std::optional<std::string> read_string();
    bool read_bytes(size_t count, std::vector<uint8_t>& out);
    bool skip(size_t count);

    // Sub-reader over the next `count` bytes; advances past them
    std::optional<ByteReader> sub_reader(size_t count);

private:
    const uint8_t* data_;
    size_t size_;
    size_t offset_ = 0;
};

// ============================================================================
// ByteWriter
// ============================================================================

class ByteWriter {
public:
    void write_u8(uint8_t value) { buf_.push_back(value); }
    void write_var_u32(uint32_t value);
    void write_string(const std::string& value);
    void write_bytes(const std::vector<uint8_t>& bytes);
    void write_bytes(const uint8_t* data, size_t size);

    // Appends `id`, the LEB128 size of `contents`, then the contents
    void write_section(uint8_t id, const std::vector<uint8_t>& contents);

    const std::vector<uint8_t>& bytes() const { return buf_; }
    std::vector<uint8_t> take() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

// ============================================================================
// Preamble Helpers
// ============================================================================

bool has_component_preamble(const std::vector<uint8_t>& bytes);
bool has_core_module_preamble(const std::vector<uint8_t>& bytes);

} // namespace vconf
