#pragma once

#include "primitives/bitwise_op_lookup.hpp"
#include "primitives/var_range.hpp"
#include "rv32im/adapters.hpp"
#include "vm/opcode.hpp"
#include <array>
#include <memory>

namespace zkrv {

// ============================================================================
// JalLui
// ============================================================================

/**
 * Columns: imm, rd[4], is_jal, is_lui
 *
 * JAL writes pc + 4 and jumps by the signed offset imm; LUI writes
 * imm << 12. rd is range checked as bytes, the top byte of a return
 * address against PC_BITS.
 */
class JalLuiCoreAir {
public:
    static constexpr size_t WIDTH = 7;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32JalLuiAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct JalLuiCoreRecord {
    JalLuiOpcode opcode = JalLuiOpcode::JAL;
    BFieldElement imm;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> rd{};
};

class JalLuiCoreChip {
public:
    using AirType = JalLuiCoreAir;
    using Record = JalLuiCoreRecord;

    explicit JalLuiCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise) : bitwise_(std::move(bitwise)) {}

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
};

// ============================================================================
// Jalr
// ============================================================================

/**
 * Columns: imm, imm_sign, rs1[4], rd[4], to_pc_least_sig_bit,
 *          to_pc_limbs[2], is_valid
 *
 * to_pc = (rs1 + sign_extend(imm)) & !1, kept as a 15-bit limb of bits
 * 1..15 and a (PC_BITS - 16)-bit limb of the upper half.
 */
class JalrCoreAir {
public:
    static constexpr size_t WIDTH = 14;

    explicit JalrCoreAir(size_t range_max_bits) : range_max_bits_(range_max_bits) {}

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32JalrAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;

private:
    size_t range_max_bits_;
};

struct JalrCoreRecord {
    uint32_t imm = 0;
    bool imm_sign = false;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> rs1{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> rd{};
    bool to_pc_lsb = false;
    uint32_t to_pc = 0;
};

class JalrCoreChip {
public:
    using AirType = JalrCoreAir;
    using Record = JalrCoreRecord;

    JalrCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise,
                 std::shared_ptr<VariableRangeCheckerChip> range_checker)
        : bitwise_(std::move(bitwise)), range_checker_(std::move(range_checker)) {}

    AirType air() const { return AirType(range_checker_->range_max_bits()); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t /*opcode*/) const { return "JALR"; }

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::shared_ptr<VariableRangeCheckerChip> range_checker_;
};

// ============================================================================
// Auipc
// ============================================================================

/**
 * Columns: imm_limbs[3], pc_limbs[4], rd[4], is_valid
 *
 * rd = pc + (imm << 12). imm_limbs are bytes 1..3 of imm << 12 (byte 0 is
 * zero) so rd[0] = pc[0] and the sum carries through bytes 1..3.
 */
class AuipcCoreAir {
public:
    static constexpr size_t WIDTH = 12;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32AuipcAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct AuipcCoreRecord {
    std::array<uint32_t, 3> imm_limbs{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> pc_limbs{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> rd{};
};

class AuipcCoreChip {
public:
    using AirType = AuipcCoreAir;
    using Record = AuipcCoreRecord;

    explicit AuipcCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise) : bitwise_(std::move(bitwise)) {}

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t /*opcode*/) const { return "AUIPC"; }

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
};

using Rv32JalLuiChip = VmChipWrapper<Rv32CondRdWriteAdapter, JalLuiCoreChip>;
using Rv32JalrChip = VmChipWrapper<Rv32JalrAdapter, JalrCoreChip>;
using Rv32AuipcChip = VmChipWrapper<Rv32CondRdWriteAdapter, AuipcCoreChip>;

} // namespace zkrv
