#pragma once

#include "memory/memory_layout.hpp"
#include "memory/memory_merkle.hpp"
#include "vm/config.hpp"
#include "vm/program.hpp"
#include "types/b_field_element.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace zkrv {

struct MemoryReadRecord {
    uint32_t address_space = 0;
    uint32_t pointer = 0;
    uint32_t timestamp = 0;
    uint32_t prev_timestamp = 0;
    Block data{};
};

struct MemoryWriteRecord {
    uint32_t address_space = 0;
    uint32_t pointer = 0;
    uint32_t timestamp = 0;
    uint32_t prev_timestamp = 0;
    Block data{};
    Block prev_data{};
};

enum class MemoryMode {
    Volatile,
    Persistent,
};

// Final state of one touched block (volatile mode)
struct TouchedBlock {
    uint32_t address_space = 0;
    uint32_t pointer = 0;
    Block data{};
    uint32_t timestamp = 0;
};

// Initial and final state of one touched chunk (persistent mode)
struct TouchedChunk {
    uint32_t address_space = 0;
    uint32_t chunk_label = 0;
    ChunkValues initial_values{};
    ChunkValues final_values{};
    std::array<uint32_t, BLOCKS_PER_CHUNK> final_timestamps{};
};

/**
 * FinalMemory - what a finished segment leaves behind
 *
 * Volatile segments report the touched blocks sorted by address;
 * persistent segments report the touched chunks, the full image and the
 * Merkle trees before and after the segment.
 */
struct FinalMemory {
    MemoryMode mode = MemoryMode::Volatile;
    std::vector<TouchedBlock> blocks;
    std::vector<TouchedChunk> chunks;
    MemoryImage image;
    std::optional<MemoryMerkleTree> initial_tree;
    std::optional<MemoryMerkleTree> final_tree;
};

/**
 * MemoryController - online memory used during execution
 *
 * Owns the cell values and the last-access timestamp of every block.
 * read() and write() advance the clock by ACCESS_TIMESTAMP_DELTA and
 * return the record the offline checker needs. Cells never written read
 * as (0, 0), or as the initial image value at timestamp 0.
 */
class MemoryController {
public:
    MemoryController(const MemoryConfig& config, MemoryMode mode, const MemoryImage& initial_image,
                     uint32_t initial_timestamp);

    // Persistent segment continuing from a known tree
    MemoryController(const MemoryConfig& config, const MemoryImage& initial_image, MemoryMerkleTree initial_tree,
                     uint32_t initial_timestamp);

    MemoryReadRecord read(uint32_t address_space, uint32_t pointer);

    // Address space 0 throws ExecutionError(ImmediateWrite)
    MemoryWriteRecord write(uint32_t address_space, uint32_t pointer, const Block& data);

    // Reads without recording or advancing the clock
    Block unsafe_read(uint32_t address_space, uint32_t pointer) const;
    BFieldElement unsafe_read_cell(uint32_t address_space, uint32_t pointer) const;

    // Reserve the clock ticks of one access that was skipped
    void increment_timestamp() { timestamp_ += ACCESS_TIMESTAMP_DELTA; }
    void increment_timestamp_by(uint32_t delta) { timestamp_ += delta; }

    uint32_t timestamp() const { return timestamp_; }
    const MemoryConfig& config() const { return config_; }
    MemoryMode mode() const { return mode_; }
    size_t num_touched_blocks() const;

    // Current contents of every nonzero cell
    MemoryImage image() const;

    FinalMemory finalize() const;

private:
    struct BlockState {
        Block initial{};
        Block data{};
        uint32_t timestamp = 0;
        bool touched = false;
    };

    MemoryConfig config_;
    MemoryMode mode_;
    uint32_t timestamp_;
    std::unordered_map<uint64_t, BlockState> blocks_;
    std::optional<MemoryMerkleTree> initial_tree_;

    void load_image(const MemoryImage& image);
    void check_address(uint32_t address_space, uint32_t pointer) const;
    BlockState& touch(uint32_t address_space, uint32_t pointer);

    static uint64_t key(uint32_t address_space, uint32_t pointer) {
        return (uint64_t{address_space} << 32) | (pointer / BLOCK_SIZE);
    }
};

} // namespace zkrv
