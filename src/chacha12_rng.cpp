#include "chacha12_rng.hpp"
#include <algorithm>
#include <cstring>

namespace zkrv {

void ChaCha12Rng::quarter_round(uint32_t& a, uint32_t& b, uint32_t& c, uint32_t& d) {
    a += b; d ^= a; d = (d << 16) | (d >> 16);
    c += d; b ^= c; b = (b << 12) | (b >> 20);
    a += b; d ^= a; d = (d << 8) | (d >> 24);
    c += d; b ^= c; b = (b << 7) | (b >> 25);
}

void ChaCha12Rng::generate_block() {
    std::array<uint32_t, 16> ws = state_;

    // 12 rounds (6 double rounds)
    for (int i = 0; i < 6; ++i) {
        quarter_round(ws[0], ws[4], ws[8], ws[12]);
        quarter_round(ws[1], ws[5], ws[9], ws[13]);
        quarter_round(ws[2], ws[6], ws[10], ws[14]);
        quarter_round(ws[3], ws[7], ws[11], ws[15]);

        quarter_round(ws[0], ws[5], ws[10], ws[15]);
        quarter_round(ws[1], ws[6], ws[11], ws[12]);
        quarter_round(ws[2], ws[7], ws[8], ws[13]);
        quarter_round(ws[3], ws[4], ws[9], ws[14]);
    }

    for (int i = 0; i < 16; ++i) {
        uint32_t word = ws[i] + state_[i];
        buffer_[i * 4] = word & 0xFF;
        buffer_[i * 4 + 1] = (word >> 8) & 0xFF;
        buffer_[i * 4 + 2] = (word >> 16) & 0xFF;
        buffer_[i * 4 + 3] = (word >> 24) & 0xFF;
    }

    // 64-bit block counter
    state_[12]++;
    if (state_[12] == 0) {
        state_[13]++;
    }

    index_ = 0;
}

ChaCha12Rng::ChaCha12Rng(const Seed& seed) : index_(64) {
    // "expand 32-byte k"
    state_[0] = 0x61707865;
    state_[1] = 0x3320646e;
    state_[2] = 0x79622d32;
    state_[3] = 0x6b206574;

    for (int i = 0; i < 8; ++i) {
        state_[4 + i] = static_cast<uint32_t>(seed[i * 4]) |
                        (static_cast<uint32_t>(seed[i * 4 + 1]) << 8) |
                        (static_cast<uint32_t>(seed[i * 4 + 2]) << 16) |
                        (static_cast<uint32_t>(seed[i * 4 + 3]) << 24);
    }

    state_[12] = 0;
    state_[13] = 0;
    state_[14] = 0;
    state_[15] = 0;
}

ChaCha12Rng ChaCha12Rng::seed_from_u64(uint64_t seed) {
    Seed bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>((seed >> (8 * i)) & 0xFF);
    }
    return ChaCha12Rng(bytes);
}

uint64_t ChaCha12Rng::next_u64() {
    uint8_t bytes[8];
    fill_bytes(bytes, 8);
    uint64_t result = 0;
    for (int i = 0; i < 8; ++i) {
        result |= static_cast<uint64_t>(bytes[i]) << (i * 8);
    }
    return result;
}

uint32_t ChaCha12Rng::next_u32() {
    uint8_t bytes[4];
    fill_bytes(bytes, 4);
    return static_cast<uint32_t>(bytes[0]) | (static_cast<uint32_t>(bytes[1]) << 8) |
           (static_cast<uint32_t>(bytes[2]) << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
}

BFieldElement ChaCha12Rng::next_field_element() {
    while (true) {
        uint32_t candidate = next_u32() & 0x7FFFFFFFU;
        if (candidate < BFieldElement::MODULUS) {
            return BFieldElement(candidate);
        }
    }
}

void ChaCha12Rng::fill_bytes(uint8_t* buffer, size_t length) {
    size_t remaining = length;
    uint8_t* ptr = buffer;

    while (remaining > 0) {
        if (index_ >= 64) {
            generate_block();
        }

        size_t to_copy = std::min(remaining, static_cast<size_t>(64 - index_));
        std::memcpy(ptr, &buffer_[index_], to_copy);

        ptr += to_copy;
        index_ += to_copy;
        remaining -= to_copy;
    }
}

} // namespace zkrv
