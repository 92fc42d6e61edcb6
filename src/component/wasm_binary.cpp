#include "vconf/wasm_binary.hpp"

#include <cstring>

namespace vconf {

// ============================================================================
// ByteReader
// ============================================================================

std::optional<uint8_t> ByteReader::read_u8() {
    if (offset_ >= size_) return std::nullopt;
    return data_[offset_++];
}

std::optional<uint32_t> ByteReader::read_var_u32() {
    uint32_t result = 0;
    uint32_t shift = 0;
    // u32 LEB128 spans at most 5 bytes
    for (int i = 0; i < 5; ++i) {
        auto byte = read_u8();
        if (!byte) return std::nullopt;
        if (i == 4 && (*byte & 0xF0) != 0) {
            return std::nullopt;  // overflows 32 bits
        }
        result |= static_cast<uint32_t>(*byte & 0x7F) << shift;
        if ((*byte & 0x80) == 0) {
            return result;
        }
        shift += 7;
    }
    return std::nullopt;
}

std::optional<std::string> ByteReader::read_string() {
    auto len = read_var_u32();
    if (!len || *len > remaining()) return std::nullopt;
    std::string value(reinterpret_cast<const char*>(data_ + offset_), *len);
    offset_ += *len;
    return value;
}

bool ByteReader::read_bytes(size_t count, std::vector<uint8_t>& out) {
    if (count > remaining()) return false;
    out.assign(data_ + offset_, data_ + offset_ + count);
    offset_ += count;
    return true;
}

bool ByteReader::skip(size_t count) {
    if (count > remaining()) return false;
    offset_ += count;
    return true;
}

std::optional<ByteReader> ByteReader::sub_reader(size_t count) {
    if (count > remaining()) return std::nullopt;
    ByteReader sub(data_ + offset_, count);
    offset_ += count;
    return sub;
}

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::write_var_u32(uint32_t value) {
    do {
        uint8_t byte = value & 0x7F;
        value >>= 7;
        if (value != 0) byte |= 0x80;
        buf_.push_back(byte);
    } while (value != 0);
}

void ByteWriter::write_string(const std::string& value) {
    write_var_u32(static_cast<uint32_t>(value.size()));
    buf_.insert(buf_.end(), value.begin(), value.end());
}

void ByteWriter::write_bytes(const std::vector<uint8_t>& bytes) {
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::write_bytes(const uint8_t* data, size_t size) {
    buf_.insert(buf_.end(), data, data + size);
}

void ByteWriter::write_section(uint8_t id, const std::vector<uint8_t>& contents) {
    write_u8(id);
    write_var_u32(static_cast<uint32_t>(contents.size()));
    write_bytes(contents);
}

// ============================================================================
// Preamble Helpers
// ============================================================================

bool has_component_preamble(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= wasm::PREAMBLE_SIZE &&
           std::memcmp(bytes.data(), wasm::MAGIC, 4) == 0 &&
           std::memcmp(bytes.data() + 4, wasm::COMPONENT_VERSION, 4) == 0;
}

bool has_core_module_preamble(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= wasm::PREAMBLE_SIZE &&
           std::memcmp(bytes.data(), wasm::MAGIC, 4) == 0 &&
           std::memcmp(bytes.data() + 4, wasm::MODULE_VERSION, 4) == 0;
}

} // namespace vconf
