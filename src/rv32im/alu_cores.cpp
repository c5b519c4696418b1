#include "rv32im/alu_cores.hpp"
#include <string>

namespace zkrv {

namespace {

constexpr size_t L = RV32_REGISTER_NUM_LIMBS;

Expr one() { return Expr(BFieldElement::one()); }

template <typename E>
E local_opcode(const Instruction& instruction, uint32_t offset, uint32_t count) {
    const uint32_t local = instruction.opcode - offset;
    if (instruction.opcode < offset || local >= count) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             "opcode " + std::to_string(instruction.opcode) + " not handled here");
    }
    return static_cast<E>(local);
}

} // namespace

std::array<uint32_t, RV32_REGISTER_NUM_LIMBS> limbs_to_bytes(const std::vector<BFieldElement>& limbs) {
    std::array<uint32_t, L> bytes{};
    for (size_t i = 0; i < L; ++i) {
        bytes[i] = static_cast<uint32_t>(limbs.at(i).value());
    }
    return bytes;
}

// ============================================================================
// BaseAlu
// ============================================================================

namespace base_alu_col {
constexpr size_t A = 0;
constexpr size_t B = 4;
constexpr size_t C = 8;
constexpr size_t FLAGS = 12;
} // namespace base_alu_col

uint32_t run_alu(BaseAluOpcode opcode, uint32_t x, uint32_t y) {
    switch (opcode) {
    case BaseAluOpcode::ADD: return x + y;
    case BaseAluOpcode::SUB: return x - y;
    case BaseAluOpcode::XOR: return x ^ y;
    case BaseAluOpcode::OR: return x | y;
    case BaseAluOpcode::AND: return x & y;
    }
    return 0;
}

AdapterAirContext BaseAluCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                       const Expr& /*from_pc*/) const {
    using namespace base_alu_col;
    const std::vector<Expr> a = expr_range(cols, A, L);
    const std::vector<Expr> b = expr_range(cols, B, L);
    const std::vector<Expr> c = expr_range(cols, C, L);
    const std::vector<Expr> flags = expr_range(cols, FLAGS, NUM_FLAGS);
    const Expr& is_add = flags[0];
    const Expr& is_sub = flags[1];
    const Expr& is_xor = flags[2];
    const Expr& is_or = flags[3];
    const Expr& is_and = flags[4];

    Expr opcode;
    const Expr is_valid = eval_opcode_flags(builder, flags, opcode_offset::BASE_ALU, opcode);

    const Expr inv_256 = Expr(inv_pow2(RV32_CELL_BITS));
    Expr carry_add;
    Expr carry_sub;
    for (size_t i = 0; i < L; ++i) {
        carry_add = (b[i] + c[i] + carry_add - a[i]) * inv_256;
        builder.when(is_add).assert_bool(carry_add);
        carry_sub = (a[i] + c[i] - b[i] + carry_sub) * inv_256;
        builder.when(is_sub).assert_bool(carry_sub);
    }

    // b ^ c expressed through a for each bitwise op
    const Expr bitwise = is_xor + is_or + is_and;
    for (size_t i = 0; i < L; ++i) {
        const Expr x = is_xor * a[i] + is_and * (b[i] + c[i] - a[i] * 2) + is_or * (a[i] * 2 - b[i] - c[i]);
        BitwiseOperationLookupBus::send_xor(builder, b[i], c[i], x, bitwise);
    }
    for (size_t i = 0; i < L; i += 2) {
        BitwiseOperationLookupBus::send_range(builder, a[i], a[i + 1], is_add + is_sub);
    }

    AdapterAirContext ctx;
    ctx.reads = {b, c};
    ctx.writes = {a};
    ctx.is_valid = is_valid;
    ctx.opcode = opcode;
    return ctx;
}

std::string BaseAluCoreChip::get_opcode_name(uint32_t opcode) const {
    switch (static_cast<BaseAluOpcode>(opcode - opcode_offset::BASE_ALU)) {
    case BaseAluOpcode::ADD: return "ADD";
    case BaseAluOpcode::SUB: return "SUB";
    case BaseAluOpcode::XOR: return "XOR";
    case BaseAluOpcode::OR: return "OR";
    case BaseAluOpcode::AND: return "AND";
    }
    return "UNKNOWN";
}

std::pair<AdapterRuntimeContext, BaseAluCoreRecord> BaseAluCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    BaseAluCoreRecord record;
    record.opcode = local_opcode<BaseAluOpcode>(instruction, opcode_offset::BASE_ALU, 5);
    record.b = limbs_to_bytes(reads.at(0));
    record.c = limbs_to_bytes(reads.at(1));
    record.a = u32_to_bytes(run_alu(record.opcode, bytes_to_u32(record.b), bytes_to_u32(record.c)));

    if (record.opcode == BaseAluOpcode::ADD || record.opcode == BaseAluOpcode::SUB) {
        for (size_t i = 0; i < L; i += 2) {
            bitwise_->request_range(record.a[i], record.a[i + 1]);
        }
    } else {
        for (size_t i = 0; i < L; ++i) {
            bitwise_->request_xor(record.b[i], record.c[i]);
        }
    }
    return {AdapterRuntimeContext::without_pc({u32_to_limbs(bytes_to_u32(record.a))}), record};
}

void BaseAluCoreChip::generate_trace_row(BFieldElement* row, const BaseAluCoreRecord& record) const {
    using namespace base_alu_col;
    write_bytes(row, A, record.a);
    write_bytes(row, B, record.b);
    write_bytes(row, C, record.c);
    row[FLAGS + static_cast<size_t>(record.opcode)] = BFieldElement::one();
}

// ============================================================================
// Shift
// ============================================================================

namespace shift_col {
constexpr size_t A = 0;
constexpr size_t B = 4;
constexpr size_t C = 8;
constexpr size_t FLAGS = 12;
constexpr size_t B_SIGN = 15;
constexpr size_t BIT_MULT_LEFT = 16;
constexpr size_t BIT_MULT_RIGHT = 17;
constexpr size_t BIT_SHIFT_MARKER = 18;
constexpr size_t LIMB_SHIFT_MARKER = 26;
constexpr size_t BIT_SHIFT_CARRY = 30;
} // namespace shift_col

uint32_t run_shift(ShiftOpcode opcode, uint32_t x, uint32_t y) {
    const uint32_t s = y & 31;
    switch (opcode) {
    case ShiftOpcode::SLL: return x << s;
    case ShiftOpcode::SRL: return x >> s;
    case ShiftOpcode::SRA: return static_cast<uint32_t>(static_cast<int32_t>(x) >> s);
    }
    return 0;
}

AdapterAirContext ShiftCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                     const Expr& /*from_pc*/) const {
    using namespace shift_col;
    const std::vector<Expr> a = expr_range(cols, A, L);
    const std::vector<Expr> b = expr_range(cols, B, L);
    const std::vector<Expr> c = expr_range(cols, C, L);
    const std::vector<Expr> flags = expr_range(cols, FLAGS, 3);
    const Expr& is_sll = flags[0];
    const Expr& is_sra = flags[2];
    const Expr is_right = flags[1] + flags[2];
    const Expr& b_sign = cols[B_SIGN];
    const Expr& mult_left = cols[BIT_MULT_LEFT];
    const Expr& mult_right = cols[BIT_MULT_RIGHT];
    const std::vector<Expr> bit_marker = expr_range(cols, BIT_SHIFT_MARKER, RV32_CELL_BITS);
    const std::vector<Expr> limb_marker = expr_range(cols, LIMB_SHIFT_MARKER, L);
    const std::vector<Expr> carry = expr_range(cols, BIT_SHIFT_CARRY, L);

    Expr opcode;
    const Expr is_valid = eval_opcode_flags(builder, flags, opcode_offset::SHIFT, opcode);

    Expr bit_shift;
    Expr pow2_bit_shift;
    Expr bit_marker_sum;
    for (size_t j = 0; j < RV32_CELL_BITS; ++j) {
        builder.assert_bool(bit_marker[j]);
        bit_marker_sum += bit_marker[j];
        bit_shift += bit_marker[j] * static_cast<int64_t>(j);
        pow2_bit_shift += bit_marker[j] * static_cast<int64_t>(int64_t{1} << j);
    }
    builder.assert_eq(bit_marker_sum, is_valid);
    builder.assert_eq(mult_left, is_sll * pow2_bit_shift);
    builder.assert_eq(mult_right, is_right * pow2_bit_shift);

    Expr limb_shift;
    Expr limb_marker_sum;
    for (size_t l = 0; l < L; ++l) {
        builder.assert_bool(limb_marker[l]);
        limb_marker_sum += limb_marker[l];
        limb_shift += limb_marker[l] * static_cast<int64_t>(l);
    }
    builder.assert_eq(limb_marker_sum, is_valid);

    builder.assert_bool(b_sign);
    builder.assert_zero(b_sign * (one() - is_sra));

    for (size_t l = 0; l < L; ++l) {
        ConstraintScope when_limb = builder.when(limb_marker[l]);
        for (size_t j = 0; j < L; ++j) {
            // Left shift: a[j] takes b[j - l] shifted up plus the bits carried out of b[j - l - 1]
            if (j < l) {
                when_limb.assert_zero(a[j] * is_sll);
            } else {
                Expr expected = b[j - l] * mult_left - carry[j - l] * is_sll * 256;
                if (j > l) {
                    expected += carry[j - l - 1] * is_sll;
                }
                when_limb.assert_eq(a[j] * is_sll, expected);
            }

            // Right shift: a[j] takes b[j + l] shifted down plus the carry of b[j + l + 1] or the sign
            if (j + l > L - 1) {
                when_limb.assert_eq(a[j] * is_right, b_sign * static_cast<int64_t>(RV32_CELL_MAX));
            } else {
                Expr expected = (b[j + l] - carry[j + l]) * is_right;
                if (j + l == L - 1) {
                    expected += b_sign * (mult_right - 1) * 256;
                } else {
                    expected += carry[j + l + 1] * is_right * 256;
                }
                when_limb.assert_eq(a[j] * mult_right, expected);
            }
        }
    }

    const VariableRangeCheckerBus range_bus{range_max_bits_};
    for (size_t i = 0; i < L; ++i) {
        range_bus.range_check(builder, carry[i], bit_shift, is_valid);
    }
    // c[0] - bit_shift - 8 * limb_shift is 32 * (a 3-bit number)
    range_bus.range_check(builder, (c[0] - bit_shift - limb_shift * 8) * Expr(inv_pow2(5)), 3, is_valid);

    for (size_t i = 0; i < L; i += 2) {
        BitwiseOperationLookupBus::send_range(builder, a[i], a[i + 1], is_valid);
    }
    BitwiseOperationLookupBus::send_xor(builder, b[L - 1], Expr::from_u64(128), b[L - 1] + 128 - b_sign * 256,
                                        is_sra);

    AdapterAirContext ctx;
    ctx.reads = {b, c};
    ctx.writes = {a};
    ctx.is_valid = is_valid;
    ctx.opcode = opcode;
    return ctx;
}

std::string ShiftCoreChip::get_opcode_name(uint32_t opcode) const {
    switch (static_cast<ShiftOpcode>(opcode - opcode_offset::SHIFT)) {
    case ShiftOpcode::SLL: return "SLL";
    case ShiftOpcode::SRL: return "SRL";
    case ShiftOpcode::SRA: return "SRA";
    }
    return "UNKNOWN";
}

std::pair<AdapterRuntimeContext, ShiftCoreRecord> ShiftCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    ShiftCoreRecord record;
    record.opcode = local_opcode<ShiftOpcode>(instruction, opcode_offset::SHIFT, 3);
    record.b = limbs_to_bytes(reads.at(0));
    record.c = limbs_to_bytes(reads.at(1));
    const uint32_t b = bytes_to_u32(record.b);
    const uint32_t shift = record.c[0] & 31;
    record.a = u32_to_bytes(run_shift(record.opcode, b, shift));
    record.bit_shift = shift % RV32_CELL_BITS;
    record.limb_shift = shift / RV32_CELL_BITS;
    record.b_sign = record.opcode == ShiftOpcode::SRA && (b >> 31) != 0;

    for (size_t i = 0; i < L; ++i) {
        if (record.opcode == ShiftOpcode::SLL) {
            record.bit_shift_carry[i] =
                record.bit_shift == 0 ? 0 : record.b[i] >> (RV32_CELL_BITS - record.bit_shift);
        } else {
            record.bit_shift_carry[i] = record.b[i] & ((1u << record.bit_shift) - 1);
        }
        range_checker_->add_count(record.bit_shift_carry[i], record.bit_shift);
    }
    range_checker_->add_count(record.c[0] >> 5, 3);
    for (size_t i = 0; i < L; i += 2) {
        bitwise_->request_range(record.a[i], record.a[i + 1]);
    }
    if (record.opcode == ShiftOpcode::SRA) {
        bitwise_->request_xor(record.b[L - 1], 128);
    }
    return {AdapterRuntimeContext::without_pc({u32_to_limbs(bytes_to_u32(record.a))}), record};
}

void ShiftCoreChip::generate_trace_row(BFieldElement* row, const ShiftCoreRecord& record) const {
    using namespace shift_col;
    write_bytes(row, A, record.a);
    write_bytes(row, B, record.b);
    write_bytes(row, C, record.c);
    row[FLAGS + static_cast<size_t>(record.opcode)] = BFieldElement::one();
    row[B_SIGN] = bool_field(record.b_sign);
    const BFieldElement pow2(uint64_t{1} << record.bit_shift);
    if (record.opcode == ShiftOpcode::SLL) {
        row[BIT_MULT_LEFT] = pow2;
    } else {
        row[BIT_MULT_RIGHT] = pow2;
    }
    row[BIT_SHIFT_MARKER + record.bit_shift] = BFieldElement::one();
    row[LIMB_SHIFT_MARKER + record.limb_shift] = BFieldElement::one();
    write_bytes(row, BIT_SHIFT_CARRY, record.bit_shift_carry);
}

// ============================================================================
// LessThan
// ============================================================================

LessThanWitness compare_limbs(const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& x,
                              const std::array<uint32_t, RV32_REGISTER_NUM_LIMBS>& y, bool is_signed,
                              BitwiseOperationLookupChip& bitwise) {
    LessThanWitness w;
    const int64_t x_msb = is_signed && x[L - 1] >= 128 ? int64_t{x[L - 1]} - 256 : int64_t{x[L - 1]};
    const int64_t y_msb = is_signed && y[L - 1] >= 128 ? int64_t{y[L - 1]} - 256 : int64_t{y[L - 1]};
    w.x_msb_f = BFieldElement::from_i64(x_msb);
    w.y_msb_f = BFieldElement::from_i64(y_msb);

    for (int i = static_cast<int>(L) - 1; i >= 0; --i) {
        const int64_t xi = i == static_cast<int>(L) - 1 ? x_msb : int64_t{x[i]};
        const int64_t yi = i == static_cast<int>(L) - 1 ? y_msb : int64_t{y[i]};
        if (xi != yi) {
            w.diff_idx = i;
            w.lt = xi < yi;
            w.diff_val = static_cast<uint32_t>(w.lt ? yi - xi : xi - yi);
            break;
        }
    }

    const uint32_t sign_offset = is_signed ? 128 : 0;
    bitwise.request_range(static_cast<uint32_t>(x_msb + sign_offset), static_cast<uint32_t>(y_msb + sign_offset));
    if (w.diff_idx >= 0) {
        bitwise.request_range(w.diff_val - 1, 0);
    }
    return w;
}

Expr eval_less_than(AirBuilder& builder, const std::vector<Expr>& x, const std::vector<Expr>& y,
                    const Expr& x_msb_f, const Expr& y_msb_f, const Expr& cmp_lt,
                    const std::vector<Expr>& diff_marker, const Expr& diff_val, const Expr& is_signed,
                    const Expr& is_valid) {
    // x_msb_f is x[3] or x[3] - 256
    builder.assert_zero((x[L - 1] - x_msb_f) * (x[L - 1] - x_msb_f - 256));
    builder.assert_zero((y[L - 1] - y_msb_f) * (y[L - 1] - y_msb_f - 256));

    const Expr sign = cmp_lt * 2 - 1;
    Expr prefix_sum;
    for (size_t k = L; k-- > 0;) {
        const Expr diff = (k == L - 1 ? y_msb_f - x_msb_f : y[k] - x[k]) * sign;
        prefix_sum += diff_marker[k];
        builder.assert_bool(diff_marker[k]);
        builder.assert_zero((one() - prefix_sum) * diff);
        builder.when(diff_marker[k]).assert_eq(diff_val, diff);
    }
    builder.assert_bool(prefix_sum);
    // Equal operands are never less-than
    builder.when(one() - prefix_sum).assert_zero(cmp_lt);

    BitwiseOperationLookupBus::send_range(builder, x_msb_f + is_signed * 128, y_msb_f + is_signed * 128, is_valid);
    BitwiseOperationLookupBus::send_range(builder, diff_val - 1, Expr(), prefix_sum);
    return prefix_sum;
}

namespace lt_col {
constexpr size_t B = 0;
constexpr size_t C = 4;
constexpr size_t CMP_RESULT = 8;
constexpr size_t FLAGS = 9;
constexpr size_t B_MSB_F = 11;
constexpr size_t C_MSB_F = 12;
constexpr size_t DIFF_MARKER = 13;
constexpr size_t DIFF_VAL = 17;
} // namespace lt_col

AdapterAirContext LessThanCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                        const Expr& /*from_pc*/) const {
    using namespace lt_col;
    const std::vector<Expr> b = expr_range(cols, B, L);
    const std::vector<Expr> c = expr_range(cols, C, L);
    const Expr& cmp_result = cols[CMP_RESULT];
    const std::vector<Expr> flags = expr_range(cols, FLAGS, 2);

    Expr opcode;
    const Expr is_valid = eval_opcode_flags(builder, flags, opcode_offset::LESS_THAN, opcode);
    builder.assert_bool(cmp_result);

    eval_less_than(builder, b, c, cols[B_MSB_F], cols[C_MSB_F], cmp_result, expr_range(cols, DIFF_MARKER, L),
                   cols[DIFF_VAL], flags[0], is_valid);

    AdapterAirContext ctx;
    ctx.reads = {b, c};
    ctx.writes = {{cmp_result, Expr(), Expr(), Expr()}};
    ctx.is_valid = is_valid;
    ctx.opcode = opcode;
    return ctx;
}

std::string LessThanCoreChip::get_opcode_name(uint32_t opcode) const {
    return opcode == zkrv::opcode(LessThanOpcode::SLT) ? "SLT" : "SLTU";
}

std::pair<AdapterRuntimeContext, LessThanCoreRecord> LessThanCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    LessThanCoreRecord record;
    record.opcode = local_opcode<LessThanOpcode>(instruction, opcode_offset::LESS_THAN, 2);
    record.b = limbs_to_bytes(reads.at(0));
    record.c = limbs_to_bytes(reads.at(1));
    const LessThanWitness w = compare_limbs(record.b, record.c, record.opcode == LessThanOpcode::SLT, *bitwise_);
    record.cmp_result = w.lt;
    record.b_msb_f = w.x_msb_f;
    record.c_msb_f = w.y_msb_f;
    record.diff_idx = w.diff_idx;
    record.diff_val = w.diff_val;
    return {AdapterRuntimeContext::without_pc({u32_to_limbs(record.cmp_result ? 1 : 0)}), record};
}

void LessThanCoreChip::generate_trace_row(BFieldElement* row, const LessThanCoreRecord& record) const {
    using namespace lt_col;
    write_bytes(row, B, record.b);
    write_bytes(row, C, record.c);
    row[CMP_RESULT] = bool_field(record.cmp_result);
    row[FLAGS + static_cast<size_t>(record.opcode)] = BFieldElement::one();
    row[B_MSB_F] = record.b_msb_f;
    row[C_MSB_F] = record.c_msb_f;
    if (record.diff_idx >= 0) {
        row[DIFF_MARKER + static_cast<size_t>(record.diff_idx)] = BFieldElement::one();
        row[DIFF_VAL] = BFieldElement(record.diff_val);
    }
}

} // namespace zkrv
