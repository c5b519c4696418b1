#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace zkrv {

/**
 * Keccak-f[1600] permutation.
 *
 * Lane (x, y) lives at index x + 5y. Byte i of a 200-byte state image is
 * byte (i mod 8) of lane i / 8, little-endian.
 */
namespace keccak {

constexpr size_t NUM_ROUNDS = 24;
constexpr size_t NUM_LANES = 25;
constexpr size_t STATE_BYTES = 200;

using State = std::array<uint64_t, NUM_LANES>;

// Round constants RC[r]
extern const std::array<uint64_t, NUM_ROUNDS> ROUND_CONSTANTS;

// Rotation offsets R[x][y]
extern const std::array<std::array<uint8_t, 5>, 5> ROTATION_OFFSETS;

void keccak_f(State& state);

State state_from_bytes(const std::array<uint8_t, STATE_BYTES>& bytes);
std::array<uint8_t, STATE_BYTES> state_to_bytes(const State& state);

// Keccak-256 with the original 0x01 padding
std::array<uint8_t, 32> keccak256(const std::vector<uint8_t>& input);

} // namespace keccak
} // namespace zkrv
