#pragma once
// SHA-256 (FIPS 180-4) used for transaction fingerprints and file hashes.
// Self-contained, no OpenSSL.
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stmt {

class SHA256 {
public:
    static constexpr size_t DIGEST_SIZE = 32;
    static constexpr size_t BLOCK_SIZE = 64;

    using Digest = std::array<uint8_t, DIGEST_SIZE>;

    SHA256() noexcept { reset(); }

    void reset() noexcept;
    void update(const void* data, size_t len) noexcept;
    void update(std::string_view text) noexcept { update(text.data(), text.size()); }
    Digest finalize() noexcept;

    // One-shot helpers
    static std::string hex(std::string_view text);
    static std::string hex(const std::vector<char>& bytes);
    static std::string to_hex(const Digest& digest);

private:
    uint32_t state_[8]{};
    uint8_t buf_[BLOCK_SIZE]{};
    size_t buf_len_ = 0;
    uint64_t total_len_ = 0;

    void compress(const uint8_t* block) noexcept;
};

} // namespace stmt
