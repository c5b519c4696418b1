#include "memory/memory_merkle.hpp"
#include "hash/poseidon2.hpp"
#include <set>
#include <stdexcept>

namespace zkrv {

namespace {

Digest plain_compress(const Digest& left, const Digest& right) {
    return Poseidon2::compress(left, right);
}

Digest chunk_digest(const ChunkValues& values) {
    std::array<BFieldElement, Digest::LEN> elements;
    for (size_t i = 0; i < Digest::LEN; ++i) {
        elements[i] = values[i];
    }
    return Digest(elements);
}

} // namespace

MemoryMerkleTree::MemoryMerkleTree(const MemoryConfig& config)
    : height_(config.as_height + config.pointer_max_bits - 3),
      chunk_bits_(config.pointer_max_bits - 3),
      as_offset_(config.as_offset) {
    static_assert(CHUNK == Digest::LEN, "a leaf chunk fills one digest");
    zero_hashes_.reserve(height_ + 1);
    zero_hashes_.push_back(leaf_hash(ChunkValues{}, plain_compress));
    for (size_t h = 1; h <= height_; ++h) {
        zero_hashes_.push_back(Poseidon2::compress(zero_hashes_[h - 1], zero_hashes_[h - 1]));
    }
}

MemoryMerkleTree MemoryMerkleTree::from_image(const MemoryConfig& config, const MemoryImage& image) {
    MemoryMerkleTree tree(config);
    std::map<uint64_t, ChunkValues> leaves;
    for (const auto& [address, value] : image) {
        const auto [as, ptr] = address;
        const uint64_t label = tree.leaf_label(as, ptr / CHUNK);
        leaves[label][ptr % CHUNK] = value;
    }
    tree.update_leaves(leaves);
    return tree;
}

uint64_t MemoryMerkleTree::leaf_label(uint32_t address_space, uint32_t chunk_label) const {
    if (address_space < as_offset_ || (uint64_t{chunk_label} >> chunk_bits_) != 0) {
        throw std::out_of_range("chunk (" + std::to_string(address_space) + ", " + std::to_string(chunk_label) +
                                ") outside the memory tree");
    }
    return (uint64_t{address_space - as_offset_} << chunk_bits_) | chunk_label;
}

Digest MemoryMerkleTree::node(size_t height, uint64_t label) const {
    auto it = nodes_.find(node_key(height, label));
    return it == nodes_.end() ? zero_hashes_.at(height) : it->second;
}

Digest MemoryMerkleTree::leaf_hash(const ChunkValues& values, const Compressor& compress) {
    return compress(chunk_digest(values), Digest::zero());
}

void MemoryMerkleTree::update_leaves(const std::map<uint64_t, ChunkValues>& leaves) {
    update_leaves(leaves, plain_compress);
}

void MemoryMerkleTree::update_leaves(const std::map<uint64_t, ChunkValues>& leaves, const Compressor& compress) {
    std::set<uint64_t> level;
    for (const auto& [label, values] : leaves) {
        if ((label >> height_) != 0) {
            throw std::out_of_range("leaf label " + std::to_string(label) + " outside the memory tree");
        }
        nodes_[node_key(0, label)] = leaf_hash(values, compress);
        level.insert(label);
    }
    for (size_t h = 1; h <= height_; ++h) {
        std::set<uint64_t> parents;
        for (uint64_t label : level) {
            parents.insert(label >> 1);
        }
        for (uint64_t parent : parents) {
            nodes_[node_key(h, parent)] = compress(node(h - 1, 2 * parent), node(h - 1, 2 * parent + 1));
        }
        level = std::move(parents);
    }
}

} // namespace zkrv
