#pragma once

#include "primitives/bitwise_op_lookup.hpp"
#include "primitives/range_tuple.hpp"
#include "rv32im/adapters.hpp"
#include "vm/opcode.hpp"
#include <array>
#include <memory>

namespace zkrv {

// ============================================================================
// Mul: low word of b * c
// ============================================================================

/**
 * Columns: a[4], b[4], c[4], is_valid
 *
 * Schoolbook multiplication with one carry per limb. Each (a[i], carry[i])
 * pair goes to the range tuple checker, bounding a[i] by a byte and the
 * carry by the tuple's second size.
 */
class MultiplicationCoreAir {
public:
    static constexpr size_t WIDTH = 13;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32MultiplicationAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct MultiplicationCoreRecord {
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> a{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> b{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> c{};
};

class MultiplicationCoreChip {
public:
    using AirType = MultiplicationCoreAir;
    using Record = MultiplicationCoreRecord;

    explicit MultiplicationCoreChip(std::shared_ptr<RangeTupleCheckerChip> range_tuple);

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t /*opcode*/) const { return "MUL"; }

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<RangeTupleCheckerChip> range_tuple_;
};

// ============================================================================
// MulH: high word of b * c
// ============================================================================

/**
 * Columns: a[4], b[4], c[4], a_mul[4], b_ext, c_ext, flags[3]
 *
 * a_mul is the low word, a the high word of the 64-bit product of the
 * sign-extended operands. b_ext / c_ext are 0 or 255: the limb every
 * operand byte above the fourth takes.
 */
class MulHCoreAir {
public:
    static constexpr size_t WIDTH = 21;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32MulHAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct MulHCoreRecord {
    MulHOpcode opcode = MulHOpcode::MULH;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> a{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> b{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> c{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> a_mul{};
    uint32_t b_ext = 0;
    uint32_t c_ext = 0;
};

class MulHCoreChip {
public:
    using AirType = MulHCoreAir;
    using Record = MulHCoreRecord;

    MulHCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise,
                 std::shared_ptr<RangeTupleCheckerChip> range_tuple);

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::shared_ptr<RangeTupleCheckerChip> range_tuple_;
};

// ============================================================================
// DivRem
// ============================================================================

/**
 * Columns: b[4], c[4], q[4], r[4], zero_divisor, r_zero, b_sign, c_sign,
 *          q_sign, sign_xor, r_neg, c_sum_inv, r_prime[4], c_prime[4],
 *          lt_marker[4], lt_diff, flags[4]
 *
 * Proves b = c * q + r over 64 bits of sign-extended limbs, with
 * |r| < |c| unless c = 0. r_prime and c_prime are the absolute values.
 * Division by zero yields q = -1 and r = b; signed overflow
 * (-2^31 / -1) yields q = -2^31 and r = 0.
 */
class DivRemCoreAir {
public:
    static constexpr size_t WIDTH = 41;

    size_t width() const { return WIDTH; }
    std::string name() const { return "Rv32DivRemAir"; }
    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;
};

struct DivRemCoreRecord {
    DivRemOpcode opcode = DivRemOpcode::DIV;
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> b{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> c{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> q{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> r{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> r_prime{};
    std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> c_prime{};
    bool zero_divisor = false;
    bool r_zero = false;
    bool b_sign = false;
    bool c_sign = false;
    bool q_sign = false;
    bool r_neg = false;
    BFieldElement c_sum_inv;
    int lt_idx = -1;
    uint32_t lt_diff = 0;
};

class DivRemCoreChip {
public:
    using AirType = DivRemCoreAir;
    using Record = DivRemCoreRecord;

    DivRemCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise,
                   std::shared_ptr<RangeTupleCheckerChip> range_tuple);

    AirType air() const { return AirType(); }
    size_t width() const { return AirType::WIDTH; }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

private:
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::shared_ptr<RangeTupleCheckerChip> range_tuple_;
};

// RISC-V M-extension semantics, including division by zero and overflow
uint32_t run_mulh(MulHOpcode opcode, uint32_t x, uint32_t y);
std::pair<uint32_t, uint32_t> run_divrem(bool is_signed, uint32_t x, uint32_t y);

// Operands are register reads (e = 1) only
using Rv32MultiplicationChip = VmChipWrapper<Rv32BaseAluAdapter, MultiplicationCoreChip>;
using Rv32MulHChip = VmChipWrapper<Rv32BaseAluAdapter, MulHCoreChip>;
using Rv32DivRemChip = VmChipWrapper<Rv32BaseAluAdapter, DivRemCoreChip>;

} // namespace zkrv
