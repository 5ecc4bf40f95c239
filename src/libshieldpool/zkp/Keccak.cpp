#include "Keccak.h"
#include <algorithm>
#include <cstring>

namespace shieldpool {
namespace zkp {

namespace {

constexpr std::array<std::uint64_t, 24> roundConstants = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

constexpr std::array<unsigned, 24> rotations = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};

constexpr std::array<unsigned, 24> lanes = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

inline std::uint64_t rotl(std::uint64_t x, unsigned n) {
    return (x << n) | (x >> (64 - n));
}

void keccakF1600(std::array<std::uint64_t, 25>& a) {
    for (auto rc : roundConstants) {
        // theta
        std::uint64_t c[5];
        for (int x = 0; x < 5; ++x)
            c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
        for (int x = 0; x < 5; ++x) {
            std::uint64_t const d = c[(x + 4) % 5] ^ rotl(c[(x + 1) % 5], 1);
            for (int y = 0; y < 25; y += 5)
                a[y + x] ^= d;
        }

        // rho and pi
        std::uint64_t current = a[1];
        for (std::size_t i = 0; i < 24; ++i) {
            auto const j = lanes[i];
            auto const tmp = a[j];
            a[j] = rotl(current, rotations[i]);
            current = tmp;
        }

        // chi
        for (int y = 0; y < 25; y += 5) {
            std::uint64_t row[5];
            for (int x = 0; x < 5; ++x)
                row[x] = a[y + x];
            for (int x = 0; x < 5; ++x)
                a[y + x] = row[x] ^ (~row[(x + 1) % 5] & row[(x + 2) % 5]);
        }

        // iota
        a[0] ^= rc;
    }
}

} // namespace

Keccak256::Keccak256() = default;

void Keccak256::absorbBlock() {
    for (std::size_t i = 0; i < rate / 8; ++i) {
        std::uint64_t lane = 0;
        for (int b = 7; b >= 0; --b)
            lane = (lane << 8) | buffer_[i * 8 + b];
        state_[i] ^= lane;
    }
    keccakF1600(state_);
    used_ = 0;
}

void Keccak256::update(void const* data, std::size_t size) {
    auto const* p = static_cast<std::uint8_t const*>(data);
    while (size > 0) {
        std::size_t const n = std::min(size, rate - used_);
        std::memcpy(buffer_.data() + used_, p, n);
        used_ += n;
        p += n;
        size -= n;
        if (used_ == rate)
            absorbBlock();
    }
}

ripple::uint256 Keccak256::finish() {
    std::memset(buffer_.data() + used_, 0, rate - used_);
    buffer_[used_] ^= 0x01;
    buffer_[rate - 1] ^= 0x80;
    absorbBlock();

    std::array<std::uint8_t, 32> out;
    for (std::size_t i = 0; i < 4; ++i) {
        for (std::size_t b = 0; b < 8; ++b)
            out[i * 8 + b] = static_cast<std::uint8_t>(state_[i] >> (8 * b));
    }
    return ripple::uint256::fromVoid(out.data());
}

ripple::uint256 keccak256(ripple::Slice data) {
    Keccak256 h;
    h.update(data);
    return h.finish();
}

} // namespace zkp
} // namespace shieldpool
