#pragma once

#include "hash/poseidon2.hpp"
#include "memory/memory_controller.hpp"
#include "memory/offline_checker.hpp"
#include "system/poseidon2_periphery.hpp"
#include "vm/chip.hpp"
#include "vm/vm_state.hpp"
#include <array>
#include <memory>
#include <vector>

namespace zkrv {

/**
 * NativePoseidon2Air - Poseidon2 over native field-element memory
 *
 * PERM_POS2 a b _:   [a] <- permute([b] .. [b] + 16)
 * COMP_POS2 a b c:   [a] <- compress([b] .. [b] + 8, [c] .. [c] + 8)
 *
 * a, b and c are registers (d = 1) holding block aligned pointers into
 * address space e = 4. The permutation itself is proven by the Poseidon2
 * periphery chip; this AIR sends (input, output) on the permute bus or
 * (left, right, digest) on the direct bus.
 *
 * Columns: from_pc, from_ts, is_perm, is_comp, reg_ptr[3], reg_val[3][4],
 *          rhs_ptr, input[16], output[16], reg_aux[3][R], read_aux[4][R],
 *          write_aux[4][W]
 */
class NativePoseidon2Air : public Air {
public:
    explicit NativePoseidon2Air(const MemoryConfig& config)
        : memory_(config), pointer_max_bits_(config.pointer_max_bits), decomp_(config.decomp) {}

    std::string name() const override { return "NativePoseidon2Air"; }
    size_t width() const override;
    void eval(AirBuilder& builder) const override;

private:
    MemoryBridge memory_;
    size_t pointer_max_bits_;
    size_t decomp_;
};

class NativePoseidon2Chip : public Chip, public InstructionExecutor {
public:
    NativePoseidon2Chip(const MemoryConfig& config, std::shared_ptr<const MemoryAuxFiller> aux,
                        std::shared_ptr<Poseidon2PeripheryChip> poseidon2);

    ExecutionState execute(MemoryController& memory, const Instruction& instruction,
                           ExecutionState from_state) override;
    std::string get_opcode_name(uint32_t opcode) const override;

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return records_.size(); }
    size_t trace_width() const override { return air_->width(); }
    AirProofInput generate_air_proof_input() override;

private:
    static constexpr size_t STATE_BLOCKS = Poseidon2::WIDTH / BLOCK_SIZE;

    struct Record {
        ExecutionState from_state;
        bool is_comp = false;
        uint32_t c = 0;
        std::array<MemoryReadRecord, 3> regs;
        std::array<MemoryReadRecord, STATE_BLOCKS> reads;
        std::vector<MemoryWriteRecord> writes;
        Poseidon2::State output{};
    };

    MemoryConfig config_;
    std::shared_ptr<NativePoseidon2Air> air_;
    std::shared_ptr<const MemoryAuxFiller> aux_;
    std::shared_ptr<Poseidon2PeripheryChip> poseidon2_;
    std::vector<Record> records_;
};

} // namespace zkrv
