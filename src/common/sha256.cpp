#include "common/sha256.hpp"

#include "common/error.hpp"

#include <memory>
#include <openssl/evp.h>

namespace stella::digest {

namespace {
std::string toHexLower(const unsigned char *bytes, std::size_t size) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        unsigned char value = bytes[i];
        out[i * 2] = kHex[(value >> 4) & 0x0F];
        out[i * 2 + 1] = kHex[value & 0x0F];
    }
    return out;
}

struct MdContextDeleter {
    void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
} // namespace

std::string Sha256Hex(const uint8_t *data, std::size_t size) {
    std::unique_ptr<EVP_MD_CTX, MdContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw IOError("SHA-256: failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (!EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)
        || (size > 0 && !EVP_DigestUpdate(ctx.get(), data, size))
        || !EVP_DigestFinal_ex(ctx.get(), digest, &digestLen)) {
        throw IOError("SHA-256: digest computation failed");
    }

    return toHexLower(digest, digestLen);
}

std::string Sha256Hex(const std::vector<uint8_t> &bytes) {
    return Sha256Hex(bytes.data(), bytes.size());
}

} // namespace stella::digest
