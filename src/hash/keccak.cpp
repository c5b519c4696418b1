#include "hash/keccak.hpp"

namespace zkrv::keccak {

const std::array<uint64_t, NUM_ROUNDS> ROUND_CONSTANTS = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL, 0x8000000080008000ULL,
    0x000000000000808BULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008AULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
    0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800AULL, 0x800000008000000AULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

const std::array<std::array<uint8_t, 5>, 5> ROTATION_OFFSETS = {{
    {0, 36, 3, 41, 18},
    {1, 44, 10, 45, 2},
    {62, 6, 43, 15, 61},
    {28, 55, 25, 21, 56},
    {27, 20, 39, 8, 14}
}};

namespace {

inline uint64_t rotl(uint64_t v, unsigned n) {
    n &= 63;
    return n == 0 ? v : (v << n) | (v >> (64 - n));
}

} // namespace

void keccak_f(State& a) {
    for (size_t round = 0; round < NUM_ROUNDS; ++round) {
        // theta
        uint64_t c[5];
        for (size_t x = 0; x < 5; ++x) {
            c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
        }
        for (size_t x = 0; x < 5; ++x) {
            uint64_t d = c[(x + 4) % 5] ^ rotl(c[(x + 1) % 5], 1);
            for (size_t y = 0; y < 5; ++y) {
                a[x + 5 * y] ^= d;
            }
        }
        // rho and pi: B[y][2x + 3y] = rot(A[x][y], r[x][y])
        uint64_t b[25];
        for (size_t x = 0; x < 5; ++x) {
            for (size_t y = 0; y < 5; ++y) {
                b[y + 5 * ((2 * x + 3 * y) % 5)] = rotl(a[x + 5 * y], ROTATION_OFFSETS[x][y]);
            }
        }
        // chi
        for (size_t x = 0; x < 5; ++x) {
            for (size_t y = 0; y < 5; ++y) {
                a[x + 5 * y] = b[x + 5 * y] ^ (~b[(x + 1) % 5 + 5 * y] & b[(x + 2) % 5 + 5 * y]);
            }
        }
        // iota
        a[0] ^= ROUND_CONSTANTS[round];
    }
}

State state_from_bytes(const std::array<uint8_t, STATE_BYTES>& bytes) {
    State s{};
    for (size_t i = 0; i < STATE_BYTES; ++i) {
        s[i / 8] |= static_cast<uint64_t>(bytes[i]) << (8 * (i % 8));
    }
    return s;
}

std::array<uint8_t, STATE_BYTES> state_to_bytes(const State& state) {
    std::array<uint8_t, STATE_BYTES> out{};
    for (size_t i = 0; i < STATE_BYTES; ++i) {
        out[i] = static_cast<uint8_t>((state[i / 8] >> (8 * (i % 8))) & 0xFF);
    }
    return out;
}

std::array<uint8_t, 32> keccak256(const std::vector<uint8_t>& input) {
    constexpr size_t rate = 136;
    State s{};
    std::vector<uint8_t> padded(input);
    padded.push_back(0x01);
    while (padded.size() % rate != 0) {
        padded.push_back(0x00);
    }
    padded.back() |= 0x80;
    for (size_t off = 0; off < padded.size(); off += rate) {
        for (size_t i = 0; i < rate; ++i) {
            s[i / 8] ^= static_cast<uint64_t>(padded[off + i]) << (8 * (i % 8));
        }
        keccak_f(s);
    }
    std::array<uint8_t, 32> out{};
    for (size_t i = 0; i < 32; ++i) {
        out[i] = static_cast<uint8_t>((s[i / 8] >> (8 * (i % 8))) & 0xFF);
    }
    return out;
}

} // namespace zkrv::keccak
