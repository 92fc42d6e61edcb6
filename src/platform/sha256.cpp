#include "vconf/platform.hpp"

#include <openssl/evp.h>

#include <memory>

namespace vconf {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string to_hex(const unsigned char* digest, unsigned int size) {
    static const char digits[] = "0123456789abcdef";
    std::string hex(size * 2, '0');
    for (unsigned int i = 0; i < size; ++i) {
        hex[2 * i] = digits[digest[i] >> 4];
        hex[2 * i + 1] = digits[digest[i] & 0x0F];
    }
    return hex;
}

} // namespace

// Package digests identify identical component binaries inside a composition
HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        result.error = "could not allocate a digest context";
        return result;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_size = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_size) != 1) {
        result.error = "sha256 digest of " + std::to_string(data.size()) + " bytes failed";
        return result;
    }

    result.hex_digest = to_hex(digest, digest_size);
    result.ok = true;
    return result;
}

} // namespace vconf
