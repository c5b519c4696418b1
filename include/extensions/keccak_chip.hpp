#pragma once

#include "hash/keccak.hpp"
#include "memory/memory_controller.hpp"
#include "memory/offline_checker.hpp"
#include "primitives/bitwise_op_lookup.hpp"
#include "primitives/keccak_air.hpp"
#include "vm/chip.hpp"
#include "vm/vm_state.hpp"
#include <array>
#include <memory>
#include <vector>

namespace zkrv {

/**
 * KeccakfAir - KECCAKF rs, the 200-byte state at the heap address in
 * register rs is permuted in place
 *
 * Instruction: a = register ptr, d = 1, e = 2
 * Each invocation takes the 24 rows of one KeccakSubAir permutation.
 * Extra columns, constant over the 24 rows except where noted:
 *   is_enabled, from_pc, from_ts, rs_ptr, rs_val[4],
 *   read_enable   (round 0 of an enabled permutation)
 *   write_enable  (round 23 of an enabled permutation)
 *   rs_aux[R], bytes[200], mem_aux[50][W]
 *
 * Round 0 reads the register and the 50 input blocks, round 23 writes the
 * 50 output blocks. bytes holds the input on round 0 and the output on
 * round 23; output bytes are range checked on the bitwise bus.
 */
class KeccakfAir : public Air {
public:
    static constexpr size_t NUM_BLOCKS = keccak::STATE_BYTES / BLOCK_SIZE;

    explicit KeccakfAir(const MemoryConfig& config)
        : memory_(config), pointer_max_bits_(config.pointer_max_bits), decomp_(config.decomp) {}

    std::string name() const override { return "KeccakfAir"; }
    size_t width() const override;
    void eval(AirBuilder& builder) const override;

    size_t rs_aux_offset() const { return KeccakSubAir::WIDTH + 10; }
    size_t bytes_offset() const { return rs_aux_offset() + memory_.read_aux_width(); }
    size_t mem_aux_offset() const { return bytes_offset() + keccak::STATE_BYTES; }

private:
    MemoryBridge memory_;
    size_t pointer_max_bits_;
    size_t decomp_;
};

class KeccakfChip : public Chip, public InstructionExecutor {
public:
    KeccakfChip(const MemoryConfig& config, std::shared_ptr<const MemoryAuxFiller> aux,
                std::shared_ptr<BitwiseOperationLookupChip> bitwise);

    ExecutionState execute(MemoryController& memory, const Instruction& instruction,
                           ExecutionState from_state) override;
    std::string get_opcode_name(uint32_t /*opcode*/) const override { return "KECCAKF"; }

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return records_.size() * KeccakSubAir::ROUNDS; }
    size_t trace_width() const override { return air_->width(); }
    AirProofInput generate_air_proof_input() override;

private:
    struct Record {
        ExecutionState from_state;
        MemoryReadRecord rs;
        std::array<MemoryReadRecord, KeccakfAir::NUM_BLOCKS> reads;
        std::array<MemoryWriteRecord, KeccakfAir::NUM_BLOCKS> writes;
        keccak::State input{};
    };

    MemoryConfig config_;
    std::shared_ptr<KeccakfAir> air_;
    std::shared_ptr<const MemoryAuxFiller> aux_;
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::vector<Record> records_;
};

} // namespace zkrv
