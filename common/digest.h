#pragma once

#include <cstddef>
#include <string_view>

namespace Shield::Common {

constexpr size_t SHA256_HEX_SIZE = 65;  // 64 hex chars + NUL

/// Incremental SHA-256 over several fields. Each update is length-prefixed so
/// ("ab","c") and ("a","bc") hash differently.
class Sha256Builder {
public:
    Sha256Builder() noexcept;
    ~Sha256Builder();

    Sha256Builder(const Sha256Builder&) = delete;
    Sha256Builder& operator=(const Sha256Builder&) = delete;

    auto addField(std::string_view field) noexcept -> bool;

    /// Writes lowercase hex into out (out_size >= SHA256_HEX_SIZE). Finalizes
    /// the builder.
    [[nodiscard]] auto finishHex(char* out, size_t out_size) noexcept -> bool;

private:
    void* ctx_;  // EVP_MD_CTX
    bool ok_;
};

/// One-shot SHA-256 of data as lowercase hex
[[nodiscard]] auto sha256Hex(std::string_view data, char* out, size_t out_size) noexcept -> bool;

} // namespace Shield::Common
