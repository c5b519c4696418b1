#pragma once

#include "memory/memory_layout.hpp"
#include "types/digest.hpp"
#include "vm/config.hpp"
#include "vm/program.hpp"
#include <functional>
#include <map>
#include <unordered_map>
#include <vector>

namespace zkrv {

using Compressor = std::function<Digest(const Digest&, const Digest&)>;

/**
 * MemoryMerkleTree - sparse Merkle tree over the equipartitioned memory
 *
 * Leaves are CHUNK-cell chunks; the leaf label of chunk c in address
 * space a is (a - as_offset) << (pointer_max_bits - 3) | c, so the tree
 * height is as_height + pointer_max_bits - 3. A leaf hashes as
 * compress(values, 0); absent subtrees are all-zero subtrees.
 */
class MemoryMerkleTree {
public:
    explicit MemoryMerkleTree(const MemoryConfig& config);

    static MemoryMerkleTree from_image(const MemoryConfig& config, const MemoryImage& image);

    size_t height() const { return height_; }
    Digest root() const { return node(height_, 0); }

    // Hash of the node at the given height (0 = leaf) and label
    Digest node(size_t height, uint64_t label) const;

    uint64_t leaf_label(uint32_t address_space, uint32_t chunk_label) const;

    /**
     * Replace the given leaves and rehash every ancestor.
     * compress is called once per hash computed.
     */
    void update_leaves(const std::map<uint64_t, ChunkValues>& leaves, const Compressor& compress);
    void update_leaves(const std::map<uint64_t, ChunkValues>& leaves);

    static Digest leaf_hash(const ChunkValues& values, const Compressor& compress);

    // Root of the all-zero subtree of the given height
    const Digest& zero_hash(size_t height) const { return zero_hashes_.at(height); }

private:
    size_t height_;
    size_t chunk_bits_;
    uint32_t as_offset_;
    std::vector<Digest> zero_hashes_;
    std::unordered_map<uint64_t, Digest> nodes_;

    static uint64_t node_key(size_t height, uint64_t label) { return (uint64_t{height} << 48) | label; }
};

} // namespace zkrv
