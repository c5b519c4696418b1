#pragma once

#include "rv32im/alu_cores.hpp"

namespace zkrv {

/**
 * BranchEqual core: BEQ BNE
 *
 * Columns: a[4], b[4], cmp_result, imm, flags[2], diff_inv_marker[4]
 *
 * cmp_result is whether the branch is taken. When the compared values
 * differ, diff_inv_marker holds an inverse witnessing a nonzero limb.
 */
class BranchEqualCoreAir {
public:
    static constexpr size_t WIDTH = 16;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32BranchEqualAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct BranchEqualCoreRecord {
    BranchEqualOpcode opcode = BranchEqualOpcode::BEQ;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> a{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> b{};
    BFieldElement imm;
    bool cmp_result = false;
    // Index of a differing limb and the inverse of its difference
    int diff_idx = -1;
    BFieldElement diff_inv;
};

class BranchEqualCoreChip {
public:
    using AirType = BranchEqualCoreAir;
    using Record = BranchEqualCoreRecord;

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;
};

/**
 * BranchLessThan core: BLT BLTU BGE BGEU
 *
 * Columns: a[4], b[4], cmp_result, imm, flags[4], a_msb_f, b_msb_f,
 *          cmp_lt, diff_marker[4], diff_val
 *
 * cmp_lt is a < b; cmp_result (branch taken) is cmp_lt for BLT(U) and its
 * negation for BGE(U).
 */
class BranchLessThanCoreAir {
public:
    static constexpr size_t WIDTH = 22;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32BranchLessThanAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct BranchLessThanCoreRecord {
    BranchLessThanOpcode opcode = BranchLessThanOpcode::BLT;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> a{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> b{};
    BFieldElement imm;
    bool cmp_result = false;
    LessThanWitness lt;
};

class BranchLessThanCoreChip {
public:
    using AirType = BranchLessThanCoreAir;
    using Record = BranchLessThanCoreRecord;

    explicit BranchLessThanCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise)
        : bitwise_(std::move(bitwise)) {}

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
};

using Rv32BranchEqualChip = VmChipWrapper<Rv32BranchAdapter, BranchEqualCoreChip>;
using Rv32BranchLessThanChip = VmChipWrapper<Rv32BranchAdapter, BranchLessThanCoreChip>;

} // namespace zkrv
