#include "sha256.h"
#include <algorithm>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace GzSplit {

namespace {
constexpr uint32_t kRound[64] = {
    0x428a2f98,0x71374491,0xb5c0fbcf,0xe9b5dba5,0x3956c25b,0x59f111f1,0x923f82a4,0xab1c5ed5,
    0xd807aa98,0x12835b01,0x243185be,0x550c7dc3,0x72be5d74,0x80deb1fe,0x9bdc06a7,0xc19bf174,
    0xe49b69c1,0xefbe4786,0x0fc19dc6,0x240ca1cc,0x2de92c6f,0x4a7484aa,0x5cb0a9dc,0x76f988da,
    0x983e5152,0xa831c66d,0xb00327c8,0xbf597fc7,0xc6e00bf3,0xd5a79147,0x06ca6351,0x14292967,
    0x27b70a85,0x2e1b2138,0x4d2c6dfc,0x53380d13,0x650a7354,0x766a0abb,0x81c2c92e,0x92722c85,
    0xa2bfe8a1,0xa81a664b,0xc24b8b70,0xc76c51a3,0xd192e819,0xd6990624,0xf40e3585,0x106aa070,
    0x19a4c116,0x1e376c08,0x2748774c,0x34b0bcb5,0x391c0cb3,0x4ed8aa4a,0x5b9cca4f,0x682e6ff3,
    0x748f82ee,0x78a5636f,0x84c87814,0x8cc70208,0x90befffa,0xa4506ceb,0xbef9a3f7,0xc67178f2
};

inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }

inline uint32_t loadBigEndian(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}
}

SHA256::SHA256() { reset(); }

void SHA256::reset() {
    state_ = {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
              0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19};
    blockLen_ = 0;
    totalBytes_ = 0;
}

void SHA256::update(const void* data, size_t len) {
    const auto* bytes = static_cast<const uint8_t*>(data);
    totalBytes_ += len;

    // Top up a partially filled block first
    if (blockLen_ > 0) {
        size_t take = std::min(len, block_.size() - blockLen_);
        std::memcpy(block_.data() + blockLen_, bytes, take);
        blockLen_ += take;
        bytes += take;
        len -= take;
        if (blockLen_ < block_.size()) {
            return;
        }
        compressBlock(block_.data());
        blockLen_ = 0;
    }

    while (len >= block_.size()) {
        compressBlock(bytes);
        bytes += block_.size();
        len -= block_.size();
    }

    std::memcpy(block_.data(), bytes, len);
    blockLen_ = len;
}

void SHA256::update(const std::string& data) {
    update(data.data(), data.size());
}

std::array<uint8_t, 32> SHA256::digest() {
    const uint64_t bitLength = totalBytes_ * 8;

    block_[blockLen_++] = 0x80;
    if (blockLen_ > 56) {
        std::memset(block_.data() + blockLen_, 0, block_.size() - blockLen_);
        compressBlock(block_.data());
        blockLen_ = 0;
    }
    std::memset(block_.data() + blockLen_, 0, 56 - blockLen_);
    for (int i = 0; i < 8; ++i) {
        block_[63 - i] = static_cast<uint8_t>(bitLength >> (8 * i));
    }
    compressBlock(block_.data());

    std::array<uint8_t, 32> out{};
    for (size_t i = 0; i < state_.size(); ++i) {
        out[i * 4 + 0] = static_cast<uint8_t>(state_[i] >> 24);
        out[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
        out[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
        out[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
    }
    reset();
    return out;
}

std::string SHA256::hexdigest() {
    auto hash = digest();
    std::ostringstream oss;
    for (auto b : hash) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return oss.str();
}

void SHA256::compressBlock(const uint8_t* block) {
    uint32_t w[64];
    for (size_t i = 0; i < 16; ++i) {
        w[i] = loadBigEndian(block + i * 4);
    }
    for (size_t i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i-15], 7) ^ rotr(w[i-15], 18) ^ (w[i-15] >> 3);
        uint32_t s1 = rotr(w[i-2], 17) ^ rotr(w[i-2], 19) ^ (w[i-2] >> 10);
        w[i] = w[i-16] + s0 + w[i-7] + s1;
    }

    uint32_t a = state_[0], b = state_[1], c = state_[2], d = state_[3];
    uint32_t e = state_[4], f = state_[5], g = state_[6], h = state_[7];
    for (size_t i = 0; i < 64; ++i) {
        uint32_t S1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        uint32_t choose = (e & f) ^ (~e & g);
        uint32_t t1 = h + S1 + choose + kRound[i] + w[i];
        uint32_t S0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
        uint32_t t2 = S0 + majority;
        h = g; g = f; f = e; e = d + t1;
        d = c; c = b; b = a; a = t1 + t2;
    }
    state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d;
    state_[4] += e; state_[5] += f; state_[6] += g; state_[7] += h;
}

} // namespace GzSplit
