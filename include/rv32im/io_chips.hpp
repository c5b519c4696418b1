#pragma once

#include "memory/memory_controller.hpp"
#include "memory/offline_checker.hpp"
#include "primitives/bitwise_op_lookup.hpp"
#include "rv32im/rv32_common.hpp"
#include "system/public_values.hpp"
#include "vm/chip.hpp"
#include "vm/vm_state.hpp"
#include <memory>
#include <vector>

namespace zkrv {

// ============================================================================
// HINT_STOREW - pop one word of hint bytes into the heap
// ============================================================================

/**
 * Instruction: b = register holding the heap address, d = 1, e = 2
 * Columns: from_pc, from_ts, rs_ptr, rs_data[4], data[4], is_valid,
 *          rs_aux[R], write_aux[W]
 *
 * The heap address must be word aligned. Every hinted byte is range
 * checked on the bitwise bus.
 */
class Rv32HintStoreAir : public Air {
public:
    explicit Rv32HintStoreAir(const MemoryConfig& config)
        : memory_(config), pointer_max_bits_(config.pointer_max_bits), decomp_(config.decomp) {}

    std::string name() const override { return "Rv32HintStoreAir"; }
    size_t width() const override { return 12 + memory_.read_aux_width() + memory_.write_aux_width(); }
    void eval(AirBuilder& builder) const override;

private:
    MemoryBridge memory_;
    size_t pointer_max_bits_;
    size_t decomp_;
};

class Rv32HintStoreChip : public Chip, public InstructionExecutor {
public:
    Rv32HintStoreChip(const MemoryConfig& config, std::shared_ptr<const MemoryAuxFiller> aux,
                      std::shared_ptr<BitwiseOperationLookupChip> bitwise, std::shared_ptr<Streams> streams);

    ExecutionState execute(MemoryController& memory, const Instruction& instruction,
                           ExecutionState from_state) override;
    std::string get_opcode_name(uint32_t /*opcode*/) const override { return "HINT_STOREW"; }

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return records_.size(); }
    size_t trace_width() const override { return air_->width(); }
    AirProofInput generate_air_proof_input() override;

private:
    struct Record {
        ExecutionState from_state;
        MemoryReadRecord rs;
        MemoryWriteRecord write;
    };

    MemoryConfig config_;
    std::shared_ptr<Rv32HintStoreAir> air_;
    std::shared_ptr<const MemoryAuxFiller> aux_;
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::shared_ptr<Streams> streams_;
    std::vector<Record> records_;
};

// ============================================================================
// REVEAL - publish a register word as public values
// ============================================================================

/**
 * Instruction: a = register ptr, c = byte offset (multiple of 4), d = 1, e = 3
 * Columns: from_pc, from_ts, rs_ptr, data[4], offset, is_valid, rs_aux[R]
 *
 * Sends (offset / 4, data) to the public values AIR.
 */
class Rv32RevealAir : public Air {
public:
    explicit Rv32RevealAir(const MemoryConfig& config) : memory_(config) {}

    std::string name() const override { return "Rv32RevealAir"; }
    size_t width() const override { return 9 + memory_.read_aux_width(); }
    void eval(AirBuilder& builder) const override;

private:
    MemoryBridge memory_;
};

class Rv32RevealChip : public Chip, public InstructionExecutor {
public:
    Rv32RevealChip(const MemoryConfig& config, std::shared_ptr<const MemoryAuxFiller> aux,
                   std::shared_ptr<PublicValuesChip> public_values);

    ExecutionState execute(MemoryController& memory, const Instruction& instruction,
                           ExecutionState from_state) override;
    std::string get_opcode_name(uint32_t /*opcode*/) const override { return "REVEAL"; }

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return records_.size(); }
    size_t trace_width() const override { return air_->width(); }
    AirProofInput generate_air_proof_input() override;

private:
    struct Record {
        ExecutionState from_state;
        uint32_t offset = 0;
        MemoryReadRecord rs;
    };

    std::shared_ptr<Rv32RevealAir> air_;
    std::shared_ptr<const MemoryAuxFiller> aux_;
    std::shared_ptr<PublicValuesChip> public_values_;
    std::vector<Record> records_;
};

} // namespace zkrv
