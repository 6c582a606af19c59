#include "common/digest.h"

#include <cstdint>
#include <cstdio>

#include <openssl/evp.h>

#include "common/logging.h"

namespace Shield::Common {

namespace {

void toHex(const unsigned char* hash, unsigned int hash_len, char* out) noexcept {
    static constexpr char HEX[] = "0123456789abcdef";
    for (unsigned int i = 0; i < hash_len; ++i) {
        out[i * 2] = HEX[hash[i] >> 4];
        out[i * 2 + 1] = HEX[hash[i] & 0x0F];
    }
    out[hash_len * 2] = '\0';
}

} // namespace

Sha256Builder::Sha256Builder() noexcept
    : ctx_(EVP_MD_CTX_new()), ok_(false) {
    if (ctx_) {
        ok_ = EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) == 1;
    }
    if (!ok_) {
        LOG_ERROR("SHA-256 context initialisation failed");
    }
}

Sha256Builder::~Sha256Builder() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

auto Sha256Builder::addField(std::string_view field) noexcept -> bool {
    if (!ok_) return false;
    auto* ctx = static_cast<EVP_MD_CTX*>(ctx_);

    unsigned char prefix[8];
    uint64_t len = field.size();
    for (int i = 7; i >= 0; --i) {
        prefix[i] = static_cast<unsigned char>(len & 0xFF);
        len >>= 8;
    }
    ok_ = EVP_DigestUpdate(ctx, prefix, sizeof(prefix)) == 1 &&
          EVP_DigestUpdate(ctx, field.data(), field.size()) == 1;
    return ok_;
}

auto Sha256Builder::finishHex(char* out, size_t out_size) noexcept -> bool {
    if (!ok_ || !out || out_size < SHA256_HEX_SIZE) {
        return false;
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    ok_ = EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), hash, &hash_len) == 1;
    if (!ok_) {
        return false;
    }
    toHex(hash, hash_len, out);
    ok_ = false;  // finalized
    return true;
}

auto sha256Hex(std::string_view data, char* out, size_t out_size) noexcept -> bool {
    if (!out || out_size < SHA256_HEX_SIZE) {
        return false;
    }
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr) != 1) {
        LOG_ERROR("SHA-256 digest failed");
        return false;
    }
    toHex(hash, hash_len, out);
    return true;
}

} // namespace Shield::Common
