#pragma once

#include "memory/memory_controller.hpp"
#include "memory/offline_checker.hpp"
#include "primitives/bitwise_op_lookup.hpp"
#include "rv32im/rv32_common.hpp"
#include "vm/integration.hpp"
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace zkrv {

Block to_block(const std::vector<BFieldElement>& limbs);
std::vector<BFieldElement> from_block(const Block& block);

// ============================================================================
// Rv32BaseAluAdapter - rd <- op(rs1, rs2 | imm)
// ============================================================================

/**
 * Reads rs1 and either rs2 (e = 1) or a 24-bit sign-extended immediate
 * (e = 0), writes rd. Timestamps: rs1 at t, rs2 at t + 4, rd at t + 8.
 *
 * Instruction: a = rd ptr, b = rs1 ptr, c = rs2 ptr | imm, d = 1, e = 1 | 0
 * Columns: from_pc, from_ts, rd_ptr, rs1_ptr, rs2, rs2_as,
 *          rs1_aux[R], rs2_aux[R], rd_aux[W]
 */
class Rv32BaseAluAdapterAir {
public:
    explicit Rv32BaseAluAdapterAir(const MemoryConfig& config) : memory_(config) {}

    size_t width() const { return 6 + 2 * memory_.read_aux_width() + memory_.write_aux_width(); }
    Expr from_pc(const std::vector<Expr>& cols) const { return cols[0]; }
    void eval(AirBuilder& builder, const std::vector<Expr>& cols, const AdapterAirContext& ctx) const;

private:
    MemoryBridge memory_;
};

struct Rv32BaseAluReadRecord {
    uint32_t rd_ptr = 0;
    uint32_t rs1_ptr = 0;
    uint32_t rs2 = 0;
    uint32_t rs2_as = 0;
    MemoryReadRecord rs1;
    std::optional<MemoryReadRecord> rs2_read;
};

struct Rv32BaseAluWriteRecord {
    MemoryWriteRecord rd;
};

class Rv32BaseAluAdapter {
public:
    using AirType = Rv32BaseAluAdapterAir;
    using ReadRecord = Rv32BaseAluReadRecord;
    using WriteRecord = Rv32BaseAluWriteRecord;

    Rv32BaseAluAdapter(const MemoryConfig& config, std::shared_ptr<BitwiseOperationLookupChip> bitwise)
        : config_(config), bitwise_(std::move(bitwise)) {}

    AirType air() const { return AirType(config_); }
    size_t width() const { return air().width(); }

    std::pair<AdapterReads, ReadRecord> preprocess(MemoryController& memory, const Instruction& instruction) const;
    std::pair<ExecutionState, WriteRecord> postprocess(MemoryController& memory, const Instruction& instruction,
                                                       ExecutionState from_state, const AdapterRuntimeContext& ctx,
                                                       const ReadRecord& read_record) const;
    void generate_trace_row(BFieldElement* row, ExecutionState from_state, const ReadRecord& read,
                            const WriteRecord& write, const MemoryAuxFiller& aux) const;

private:
    MemoryConfig config_;
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
};

// ============================================================================
// Rv32BranchAdapter - compare rs1, rs2 and jump
// ============================================================================

/**
 * Instruction: a = rs1 ptr, b = rs2 ptr, c = pc offset, d = 1, e = 1
 * Columns: from_pc, from_ts, rs1_ptr, rs2_ptr, rs1_aux[R], rs2_aux[R]
 *
 * The core supplies to_pc and the offset (immediates[0]).
 */
class Rv32BranchAdapterAir {
public:
    explicit Rv32BranchAdapterAir(const MemoryConfig& config) : memory_(config) {}

    size_t width() const { return 4 + 2 * memory_.read_aux_width(); }
    Expr from_pc(const std::vector<Expr>& cols) const { return cols[0]; }
    void eval(AirBuilder& builder, const std::vector<Expr>& cols, const AdapterAirContext& ctx) const;

private:
    MemoryBridge memory_;
};

struct Rv32BranchReadRecord {
    MemoryReadRecord rs1;
    MemoryReadRecord rs2;
};

struct Rv32BranchWriteRecord {};

class Rv32BranchAdapter {
public:
    using AirType = Rv32BranchAdapterAir;
    using ReadRecord = Rv32BranchReadRecord;
    using WriteRecord = Rv32BranchWriteRecord;

    explicit Rv32BranchAdapter(const MemoryConfig& config) : config_(config) {}

    AirType air() const { return AirType(config_); }
    size_t width() const { return air().width(); }

    std::pair<AdapterReads, ReadRecord> preprocess(MemoryController& memory, const Instruction& instruction) const;
    std::pair<ExecutionState, WriteRecord> postprocess(MemoryController& memory, const Instruction& instruction,
                                                       ExecutionState from_state, const AdapterRuntimeContext& ctx,
                                                       const ReadRecord& read_record) const;
    void generate_trace_row(BFieldElement* row, ExecutionState from_state, const ReadRecord& read,
                            const WriteRecord& write, const MemoryAuxFiller& aux) const;

private:
    MemoryConfig config_;
};

// ============================================================================
// Rv32CondRdWriteAdapter - optional rd write, no reads (JAL, LUI, AUIPC)
// ============================================================================

/**
 * Instruction: a = rd ptr, c = imm, d = 1, f = needs_write
 * Columns: from_pc, from_ts, rd_ptr, needs_write, rd_aux[W]
 */
class Rv32CondRdWriteAdapterAir {
public:
    explicit Rv32CondRdWriteAdapterAir(const MemoryConfig& config) : memory_(config) {}

    size_t width() const { return 4 + memory_.write_aux_width(); }
    Expr from_pc(const std::vector<Expr>& cols) const { return cols[0]; }
    void eval(AirBuilder& builder, const std::vector<Expr>& cols, const AdapterAirContext& ctx) const;

private:
    MemoryBridge memory_;
};

struct Rv32CondRdWriteReadRecord {};

struct Rv32CondRdWriteWriteRecord {
    uint32_t rd_ptr = 0;
    std::optional<MemoryWriteRecord> rd;
};

class Rv32CondRdWriteAdapter {
public:
    using AirType = Rv32CondRdWriteAdapterAir;
    using ReadRecord = Rv32CondRdWriteReadRecord;
    using WriteRecord = Rv32CondRdWriteWriteRecord;

    explicit Rv32CondRdWriteAdapter(const MemoryConfig& config) : config_(config) {}

    AirType air() const { return AirType(config_); }
    size_t width() const { return air().width(); }

    std::pair<AdapterReads, ReadRecord> preprocess(MemoryController& memory, const Instruction& instruction) const;
    std::pair<ExecutionState, WriteRecord> postprocess(MemoryController& memory, const Instruction& instruction,
                                                       ExecutionState from_state, const AdapterRuntimeContext& ctx,
                                                       const ReadRecord& read_record) const;
    void generate_trace_row(BFieldElement* row, ExecutionState from_state, const ReadRecord& read,
                            const WriteRecord& write, const MemoryAuxFiller& aux) const;

private:
    MemoryConfig config_;
};

// ============================================================================
// Rv32JalrAdapter - read rs1, optional rd write
// ============================================================================

/**
 * Instruction: a = rd ptr, b = rs1 ptr, c = imm (16 bits), d = 1,
 *              f = needs_write, g = imm sign
 * Columns: from_pc, from_ts, rd_ptr, rs1_ptr, needs_write, rs1_aux[R], rd_aux[W]
 *
 * The core supplies to_pc and immediates (imm, imm_sign).
 */
class Rv32JalrAdapterAir {
public:
    explicit Rv32JalrAdapterAir(const MemoryConfig& config) : memory_(config) {}

    size_t width() const { return 5 + memory_.read_aux_width() + memory_.write_aux_width(); }
    Expr from_pc(const std::vector<Expr>& cols) const { return cols[0]; }
    void eval(AirBuilder& builder, const std::vector<Expr>& cols, const AdapterAirContext& ctx) const;

private:
    MemoryBridge memory_;
};

struct Rv32JalrReadRecord {
    MemoryReadRecord rs1;
};

struct Rv32JalrWriteRecord {
    uint32_t rd_ptr = 0;
    std::optional<MemoryWriteRecord> rd;
};

class Rv32JalrAdapter {
public:
    using AirType = Rv32JalrAdapterAir;
    using ReadRecord = Rv32JalrReadRecord;
    using WriteRecord = Rv32JalrWriteRecord;

    explicit Rv32JalrAdapter(const MemoryConfig& config) : config_(config) {}

    AirType air() const { return AirType(config_); }
    size_t width() const { return air().width(); }

    std::pair<AdapterReads, ReadRecord> preprocess(MemoryController& memory, const Instruction& instruction) const;
    std::pair<ExecutionState, WriteRecord> postprocess(MemoryController& memory, const Instruction& instruction,
                                                       ExecutionState from_state, const AdapterRuntimeContext& ctx,
                                                       const ReadRecord& read_record) const;
    void generate_trace_row(BFieldElement* row, ExecutionState from_state, const ReadRecord& read,
                            const WriteRecord& write, const MemoryAuxFiller& aux) const;

private:
    MemoryConfig config_;
};

// ============================================================================
// Rv32LoadStoreAdapter - register <-> heap transfers
// ============================================================================

/**
 * Computes ptr = rs1 + sign_extend(imm) and the aligned block holding it.
 * Loads read the heap block at t + 4 and write rd at t + 8; stores read
 * rs2 at t + 4 and write the heap block at t + 8. The value the write
 * replaces (prev_data) is handed to the core so partial stores and loads
 * can be expressed as a whole-block write.
 *
 * Instruction: a = rd | rs2 ptr, b = rs1 ptr, c = imm (16 bits), d = 1,
 *              e = 2, f = needs_write, g = imm sign
 * Columns: from_pc, from_ts, rs1_ptr, rs1_data[4], rd_rs2_ptr, imm, imm_sign,
 *          mem_ptr_limbs[2], mem_as, needs_write, rs1_aux[R], read_aux[R], write_aux[W]
 *
 * Core context: reads = (read_data, prev_data), immediates = (is_load, shift).
 */
class Rv32LoadStoreAdapterAir {
public:
    explicit Rv32LoadStoreAdapterAir(const MemoryConfig& config)
        : memory_(config), pointer_max_bits_(config.pointer_max_bits), decomp_(config.decomp) {}

    size_t width() const { return 14 + 2 * memory_.read_aux_width() + memory_.write_aux_width(); }
    Expr from_pc(const std::vector<Expr>& cols) const { return cols[0]; }
    void eval(AirBuilder& builder, const std::vector<Expr>& cols, const AdapterAirContext& ctx) const;

private:
    MemoryBridge memory_;
    size_t pointer_max_bits_;
    size_t decomp_;
};

struct Rv32LoadStoreReadRecord {
    bool is_load = false;
    uint32_t rd_rs2_ptr = 0;
    uint32_t imm = 0;
    bool imm_sign = false;
    uint32_t mem_as = 0;
    uint32_t mem_ptr = 0;
    uint32_t shift = 0;
    MemoryReadRecord rs1;
    MemoryReadRecord read;
};

struct Rv32LoadStoreWriteRecord {
    std::optional<MemoryWriteRecord> write;
};

class Rv32LoadStoreAdapter {
public:
    using AirType = Rv32LoadStoreAdapterAir;
    using ReadRecord = Rv32LoadStoreReadRecord;
    using WriteRecord = Rv32LoadStoreWriteRecord;

    explicit Rv32LoadStoreAdapter(const MemoryConfig& config) : config_(config) {}

    AirType air() const { return AirType(config_); }
    size_t width() const { return air().width(); }

    std::pair<AdapterReads, ReadRecord> preprocess(MemoryController& memory, const Instruction& instruction) const;
    std::pair<ExecutionState, WriteRecord> postprocess(MemoryController& memory, const Instruction& instruction,
                                                       ExecutionState from_state, const AdapterRuntimeContext& ctx,
                                                       const ReadRecord& read_record) const;
    void generate_trace_row(BFieldElement* row, ExecutionState from_state, const ReadRecord& read,
                            const WriteRecord& write, const MemoryAuxFiller& aux) const;

private:
    MemoryConfig config_;
};

} // namespace zkrv
