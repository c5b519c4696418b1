#pragma once

#include "types/b_field_element.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

namespace zkrv {

// Every memory access moves one aligned block of BLOCK_SIZE cells
constexpr size_t BLOCK_SIZE = 4;
// Merkle leaves cover CHUNK cells (two blocks)
constexpr size_t CHUNK = 8;
constexpr size_t BLOCKS_PER_CHUNK = CHUNK / BLOCK_SIZE;
// Timestamp advance of one block access
constexpr uint32_t ACCESS_TIMESTAMP_DELTA = BLOCK_SIZE;

using Block = std::array<BFieldElement, BLOCK_SIZE>;
using ChunkValues = std::array<BFieldElement, CHUNK>;

namespace address_space {
constexpr uint32_t IMMEDIATE = 0;
constexpr uint32_t REGISTER = 1;
constexpr uint32_t HEAP = 2;
// Reserved for public values; not memory backed
constexpr uint32_t PUBLIC_VALUES = 3;
constexpr uint32_t NATIVE = 4;
} // namespace address_space

} // namespace zkrv
