#pragma once

#include "primitives/bitwise_op_lookup.hpp"
#include "primitives/var_range.hpp"
#include "rv32im/adapters.hpp"
#include "vm/opcode.hpp"
#include <array>
#include <memory>

namespace zkrv {

// ============================================================================
// BaseAlu: ADD SUB XOR OR AND
// ============================================================================

/**
 * Columns: a[4], b[4], c[4], opcode flags[5]
 *
 * ADD/SUB carry limb by limb with boolean carries and range check the
 * result bytes; the bitwise ops look up b ^ c and derive AND/OR from it.
 */
class BaseAluCoreAir {
public:
    static constexpr size_t NUM_FLAGS = 5;
    static constexpr size_t WIDTH = 3 * RV32_REGISTER_NUM_LIMBS + NUM_FLAGS;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32BaseAluAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct BaseAluCoreRecord {
    BaseAluOpcode opcode = BaseAluOpcode::ADD;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> a{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> b{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> c{};
};

class BaseAluCoreChip {
public:
    using AirType = BaseAluCoreAir;
    using Record = BaseAluCoreRecord;

    explicit BaseAluCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise) : bitwise_(std::move(bitwise)) {}

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
};

uint32_t run_alu(BaseAluOpcode opcode, uint32_t x, uint32_t y);

// ============================================================================
// Shift: SLL SRL SRA
// ============================================================================

/**
 * Columns: a[4], b[4], c[4], flags[3], b_sign, bit_multiplier_left,
 *          bit_multiplier_right, bit_shift_marker[8], limb_shift_marker[4],
 *          bit_shift_carry[4]
 *
 * The shift amount c[0] mod 32 splits into a limb shift and a bit shift,
 * each selected by a one-hot marker. Bits carried between limbs are range
 * checked against the bit shift.
 */
class ShiftCoreAir {
public:
    static constexpr size_t WIDTH = 34;

    explicit ShiftCoreAir(size_t range_max_bits) : range_max_bits_(range_max_bits) {}

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32ShiftAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;

private:
    size_t range_max_bits_;
};

struct ShiftCoreRecord {
    ShiftOpcode opcode = ShiftOpcode::SLL;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> a{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> b{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> c{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> bit_shift_carry{};
    uint32_t bit_shift = 0;
    uint32_t limb_shift = 0;
    bool b_sign = false;
};

class ShiftCoreChip {
public:
    using AirType = ShiftCoreAir;
    using Record = ShiftCoreRecord;

    ShiftCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise,
                  std::shared_ptr<VariableRangeCheckerChip> range_checker)
        : bitwise_(std::move(bitwise)), range_checker_(std::move(range_checker)) {}

    AirType air() const { return AirType(range_checker_->range_max_bits()); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::shared_ptr<VariableRangeCheckerChip> range_checker_;
};

uint32_t run_shift(ShiftOpcode opcode, uint32_t x, uint32_t y);

// ============================================================================
// LessThan: SLT SLTU
// ============================================================================

/**
 * Columns: b[4], c[4], cmp_result, flags[2], b_msb_f, c_msb_f,
 *          diff_marker[4], diff_val
 *
 * The most significant limbs are reinterpreted as signed for SLT
 * (b_msb_f in [-128, 128)). diff_marker selects the most significant
 * differing limb and diff_val is the positive difference there.
 */
class LessThanCoreAir {
public:
    static constexpr size_t WIDTH = 18;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32LessThanAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct LessThanCoreRecord {
    LessThanOpcode opcode = LessThanOpcode::SLT;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> b{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> c{};
    bool cmp_result = false;
    BFieldElement b_msb_f;
    BFieldElement c_msb_f;
    // Index of the most significant differing limb, or -1
    int diff_idx = -1;
    uint32_t diff_val = 0;
};

class LessThanCoreChip {
public:
    using AirType = LessThanCoreAir;
    using Record = LessThanCoreRecord;

    explicit LessThanCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise) : bitwise_(std::move(bitwise)) {}

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
};

/**
 * Signed or unsigned comparison of two byte vectors, shared by SLT(U)
 * and the BLT/BGE family.
 *
 * Fills the msb field values, the differing limb and its difference and
 * counts the bitwise lookups the AIR makes. Returns x < y.
 */
struct LessThanWitness {
    bool lt = false;
    BFieldElement x_msb_f;
    BFieldElement y_msb_f;
    int diff_idx = -1;
    uint32_t diff_val = 0;
};
LessThanWitness compare_limbs(const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& x,
                              const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& y, bool is_signed,
                              BitwiseOperationLookupChip& bitwise);

/**
 * Constraints of compare_limbs. cmp_lt must be the boolean x < y;
 * the returned expression is the number of markers set.
 */
Expr eval_less_than(AirBuilder& builder, const std::vector<Expr>& x, const std::vector<Expr>& y,
                    const Expr& x_msb_f, const Expr& y_msb_f, const Expr& cmp_lt, const std::vector<Expr>& diff_marker,
                    const Expr& diff_val, const Expr& is_signed, const Expr& is_valid);

std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> limbs_to_bytes(const std::vector<BFieldElement>& limbs);

using Rv32BaseAluChip = VmChipWrapper<Rv32BaseAluAdapter, BaseAluCoreChip>;
using Rv32ShiftChip = VmChipWrapper<Rv32BaseAluAdapter, ShiftCoreChip>;
using Rv32LessThanChip = VmChipWrapper<Rv32BaseAluAdapter, LessThanCoreChip>;

} // namespace zkrv
