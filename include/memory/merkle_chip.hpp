#pragma once

#include "memory/memory_controller.hpp"
#include "system/poseidon2_periphery.hpp"
#include "vm/chip.hpp"
#include <memory>
#include <vector>

namespace zkrv {

/**
 * MemoryMerkleAir - Merkle paths of the touched chunks, before and after
 *
 * Every touched internal node has an initial and a final row. A row
 * receives its own (tag, height, label, hash) unless it is the root,
 * hashes its children on the direct compression bus and sends both
 * children. A touched child is sent with the row's tag (0 initial,
 * 1 final); an untouched child is sent with tag 2 and count +1 from the
 * initial row and -1 from the final row, so the two cancel only if the
 * child hash did not change.
 *
 * The first two rows are the initial and final roots, bound to the
 * public values initial_root[8] and final_root[8].
 *
 * Columns: is_initial, is_final, is_root, height, label,
 *          parent_hash[8], left_hash[8], right_hash[8],
 *          left_touched, right_touched
 */
class MemoryMerkleAir : public Air {
public:
    static constexpr size_t WIDTH = 5 + 3 * Digest::LEN + 2;
    static constexpr size_t NUM_PUBLIC_VALUES = 2 * Digest::LEN;

    explicit MemoryMerkleAir(size_t tree_height) : tree_height_(tree_height) {}

    std::string name() const override { return "MemoryMerkleAir<8>"; }
    size_t width() const override { return WIDTH; }
    size_t num_public_values() const override { return NUM_PUBLIC_VALUES; }
    void eval(AirBuilder& builder) const override;

private:
    size_t tree_height_;
};

class MemoryMerkleChip : public Chip {
public:
    MemoryMerkleChip(const MemoryConfig& config, std::shared_ptr<Poseidon2PeripheryChip> poseidon2);

    // Takes the touched chunks and both trees of a finished persistent segment
    void set_final_memory(const FinalMemory& final_memory);

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return rows_.size(); }
    size_t trace_width() const override { return MemoryMerkleAir::WIDTH; }
    AirProofInput generate_air_proof_input() override;

private:
    struct NodeRow {
        bool is_final = false;
        bool is_root = false;
        size_t height = 0;
        uint64_t label = 0;
        Digest left;
        Digest right;
        bool left_touched = false;
        bool right_touched = false;
    };

    MemoryConfig config_;
    std::shared_ptr<MemoryMerkleAir> air_;
    std::shared_ptr<Poseidon2PeripheryChip> poseidon2_;
    std::vector<NodeRow> rows_;
    Digest initial_root_;
    Digest final_root_;
};

} // namespace zkrv
