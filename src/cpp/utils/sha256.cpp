#include "sha256.hpp"
#include <cstring>

namespace stmt {

namespace {

constexpr uint32_t kRound[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

constexpr uint32_t rotr(uint32_t x, int n) noexcept {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load_be32(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)  |  static_cast<uint32_t>(p[3]);
}

} // namespace

void SHA256::reset() noexcept {
    static constexpr uint32_t kInit[8] = {
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
    };
    std::memcpy(state_, kInit, sizeof(state_));
    buf_len_ = 0;
    total_len_ = 0;
}

void SHA256::update(const void* data, size_t len) noexcept {
    const auto* in = static_cast<const uint8_t*>(data);
    total_len_ += len;

    while (len > 0) {
        if (buf_len_ == 0 && len >= BLOCK_SIZE) {
            compress(in);
            in += BLOCK_SIZE;
            len -= BLOCK_SIZE;
            continue;
        }
        size_t take = BLOCK_SIZE - buf_len_;
        if (take > len) take = len;
        std::memcpy(buf_ + buf_len_, in, take);
        buf_len_ += take;
        in += take;
        len -= take;
        if (buf_len_ == BLOCK_SIZE) {
            compress(buf_);
            buf_len_ = 0;
        }
    }
}

SHA256::Digest SHA256::finalize() noexcept {
    const uint64_t bit_len = total_len_ * 8;

    // 0x80 terminator, zero fill up to 56 mod 64, then big-endian bit length
    buf_[buf_len_++] = 0x80;
    if (buf_len_ > 56) {
        std::memset(buf_ + buf_len_, 0, BLOCK_SIZE - buf_len_);
        compress(buf_);
        buf_len_ = 0;
    }
    std::memset(buf_ + buf_len_, 0, 56 - buf_len_);
    for (int i = 0; i < 8; ++i) {
        buf_[56 + i] = static_cast<uint8_t>(bit_len >> (56 - 8 * i));
    }
    compress(buf_);
    buf_len_ = 0;

    Digest out{};
    for (int i = 0; i < 8; ++i) {
        out[i * 4 + 0] = static_cast<uint8_t>(state_[i] >> 24);
        out[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
        out[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
        out[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
    }
    return out;
}

void SHA256::compress(const uint8_t* block) noexcept {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) w[i] = load_be32(block + i * 4);
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    uint32_t v[8];
    std::memcpy(v, state_, sizeof(v));

    for (int i = 0; i < 64; ++i) {
        uint32_t e = v[4];
        uint32_t a = v[0];
        uint32_t t1 = v[7] + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25))
                    + ((e & v[5]) ^ (~e & v[6])) + kRound[i] + w[i];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22))
                    + ((a & v[1]) ^ (a & v[2]) ^ (v[1] & v[2]));
        v[7] = v[6]; v[6] = v[5]; v[5] = v[4]; v[4] = v[3] + t1;
        v[3] = v[2]; v[2] = v[1]; v[1] = v[0]; v[0] = t1 + t2;
    }

    for (int i = 0; i < 8; ++i) state_[i] += v[i];
}

std::string SHA256::to_hex(const Digest& digest) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(DIGEST_SIZE * 2, '\0');
    for (size_t i = 0; i < DIGEST_SIZE; ++i) {
        out[i * 2]     = kHex[digest[i] >> 4];
        out[i * 2 + 1] = kHex[digest[i] & 0x0F];
    }
    return out;
}

std::string SHA256::hex(std::string_view text) {
    SHA256 ctx;
    ctx.update(text);
    return to_hex(ctx.finalize());
}

std::string SHA256::hex(const std::vector<char>& bytes) {
    SHA256 ctx;
    ctx.update(bytes.data(), bytes.size());
    return to_hex(ctx.finalize());
}

} // namespace stmt
