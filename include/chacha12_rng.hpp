#pragma once

#include "types/b_field_element.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace zkrv {

/**
 * ChaCha12Rng - ChaCha12 keystream used as a deterministic random source.
 *
 * Drives Poseidon2 round-constant generation, the HintRandom phantom
 * instruction and randomized tests. Same seed, same stream.
 */
class ChaCha12Rng {
private:
    std::array<uint32_t, 16> state_;
    std::array<uint8_t, 64> buffer_;
    size_t index_;

    // ChaCha quarter round function
    static void quarter_round(uint32_t& a, uint32_t& b, uint32_t& c, uint32_t& d);

    // Generate next block of keystream
    void generate_block();

public:
    using Seed = std::array<uint8_t, 32>;

    // Initialize with 32-byte seed
    explicit ChaCha12Rng(const Seed& seed);

    // Expand a 64-bit seed into a full key (little-endian, rest zero)
    static ChaCha12Rng seed_from_u64(uint64_t seed);

    // Generate random u64
    uint64_t next_u64();

    // Generate random u32
    uint32_t next_u32();

    // Uniform field element by rejection sampling of 31-bit words
    BFieldElement next_field_element();

    // Fill a buffer with random bytes
    void fill_bytes(uint8_t* buffer, size_t length);
};

} // namespace zkrv
