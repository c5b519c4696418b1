#include "rv32im/mul_cores.hpp"
#include "rv32im/alu_cores.hpp"
#include <string>

namespace zkrv {

namespace {

constexpr size_t L = RV32_REGISTER_NUM_LIMBS;
constexpr uint32_t SIGN_MASK = 1u << (RV32_CELL_BITS - 1);

Expr one() { return Expr(BFieldElement::one()); }

void require_register_rs2(const Instruction& instruction) {
    if (instruction.e.value() != address_space::REGISTER) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             "multiply and divide take register operands only");
    }
}

// Limb k of a sign-extended operand
uint32_t ext_limb(const std::array<uint32_t, L>& limbs, uint32_t ext, size_t k) { return k < L ? limbs[k] : ext; }

Expr ext_limb(const std::vector<Expr>& limbs, const Expr& ext, size_t k) { return k < L ? limbs[k] : ext; }

} // namespace

uint32_t run_mulh(MulHOpcode opcode, uint32_t x, uint32_t y) {
    switch (opcode) {
    case MulHOpcode::MULH:
        return static_cast<uint32_t>(
            static_cast<uint64_t>(int64_t{static_cast<int32_t>(x)} * int64_t{static_cast<int32_t>(y)}) >> 32);
    case MulHOpcode::MULHSU:
        return static_cast<uint32_t>(static_cast<uint64_t>(int64_t{static_cast<int32_t>(x)} * int64_t{y}) >> 32);
    case MulHOpcode::MULHU: return static_cast<uint32_t>((uint64_t{x} * uint64_t{y}) >> 32);
    }
    return 0;
}

std::pair<uint32_t, uint32_t> run_divrem(bool is_signed, uint32_t x, uint32_t y) {
    if (y == 0) {
        return {0xFFFFFFFFu, x};
    }
    if (!is_signed) {
        return {x / y, x % y};
    }
    const int32_t sx = static_cast<int32_t>(x);
    const int32_t sy = static_cast<int32_t>(y);
    if (x == 0x80000000u && sy == -1) {
        return {x, 0};
    }
    return {static_cast<uint32_t>(sx / sy), static_cast<uint32_t>(sx % sy)};
}

// ============================================================================
// Mul
// ============================================================================

namespace mul_col {
constexpr size_t A = 0;
constexpr size_t B = 4;
constexpr size_t C = 8;
constexpr size_t IS_VALID = 12;
} // namespace mul_col

AdapterAirContext MultiplicationCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                              const Expr& /*from_pc*/) const {
    using namespace mul_col;
    const std::vector<Expr> a = expr_range(cols, A, L);
    const std::vector<Expr> b = expr_range(cols, B, L);
    const std::vector<Expr> c = expr_range(cols, C, L);
    const Expr& is_valid = cols[IS_VALID];
    builder.assert_bool(is_valid);

    const Expr inv_256 = Expr(inv_pow2(RV32_CELL_BITS));
    Expr carry;
    for (size_t i = 0; i < L; ++i) {
        Expr sum = carry;
        for (size_t k = 0; k <= i; ++k) {
            sum += b[k] * c[i - k];
        }
        carry = (sum - a[i]) * inv_256;
        RangeTupleCheckerBus::send(builder, a[i], carry, is_valid);
    }

    AdapterAirContext ctx;
    ctx.reads = {b, c};
    ctx.writes = {a};
    ctx.is_valid = is_valid;
    ctx.opcode = Expr::from_u64(opcode_offset::MUL) * is_valid;
    return ctx;
}

MultiplicationCoreChip::MultiplicationCoreChip(std::shared_ptr<RangeTupleCheckerChip> range_tuple)
    : range_tuple_(std::move(range_tuple)) {
    const auto& sizes = range_tuple_->sizes();
    if (sizes[0] != (1u << RV32_CELL_BITS) || sizes[1] < L * (1u << RV32_CELL_BITS)) {
        throw std::invalid_argument("range tuple checker too small for 32-bit multiplication");
    }
}

std::pair<AdapterRuntimeContext, MultiplicationCoreRecord> MultiplicationCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    require_register_rs2(instruction);
    MultiplicationCoreRecord record;
    record.b = limbs_to_bytes(reads.at(0));
    record.c = limbs_to_bytes(reads.at(1));

    uint64_t carry = 0;
    for (size_t i = 0; i < L; ++i) {
        uint64_t sum = carry;
        for (size_t k = 0; k <= i; ++k) {
            sum += uint64_t{record.b[k]} * record.c[i - k];
        }
        record.a[i] = static_cast<uint32_t>(sum & RV32_CELL_MAX);
        carry = sum >> RV32_CELL_BITS;
        range_tuple_->add_count(record.a[i], static_cast<uint32_t>(carry));
    }
    return {AdapterRuntimeContext::without_pc({u32_to_limbs(bytes_to_u32(record.a))}), record};
}

void MultiplicationCoreChip::generate_trace_row(BFieldElement* row, const MultiplicationCoreRecord& record) const {
    using namespace mul_col;
    write_bytes(row, A, record.a);
    write_bytes(row, B, record.b);
    write_bytes(row, C, record.c);
    row[IS_VALID] = BFieldElement::one();
}

// ============================================================================
// MulH
// ============================================================================

namespace mulh_col {
constexpr size_t A = 0;
constexpr size_t B = 4;
constexpr size_t C = 8;
constexpr size_t A_MUL = 12;
constexpr size_t B_EXT = 16;
constexpr size_t C_EXT = 17;
constexpr size_t FLAGS = 18;
} // namespace mulh_col

AdapterAirContext MulHCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                    const Expr& /*from_pc*/) const {
    using namespace mulh_col;
    const std::vector<Expr> a = expr_range(cols, A, L);
    const std::vector<Expr> b = expr_range(cols, B, L);
    const std::vector<Expr> c = expr_range(cols, C, L);
    const std::vector<Expr> a_mul = expr_range(cols, A_MUL, L);
    const Expr& b_ext = cols[B_EXT];
    const Expr& c_ext = cols[C_EXT];
    const std::vector<Expr> flags = expr_range(cols, FLAGS, 3);
    const Expr& is_mulh = flags[0];
    const Expr& is_mulhsu = flags[1];
    const Expr& is_mulhu = flags[2];

    Expr opcode;
    const Expr is_valid = eval_opcode_flags(builder, flags, opcode_offset::MULH, opcode);

    const Expr inv_255 = Expr(BFieldElement(RV32_CELL_MAX).inverse());
    const Expr b_sign = b_ext * inv_255;
    const Expr c_sign = c_ext * inv_255;
    builder.assert_bool(b_sign);
    builder.assert_bool(c_sign);
    builder.when(is_mulhu).assert_zero(b_ext);
    builder.when(is_mulhu + is_mulhsu).assert_zero(c_ext);
    // b[3] - 128 * b_sign < 128 (and the same for c under MULH) pins the signs to the top bits
    BitwiseOperationLookupBus::send_range(builder, (b[L - 1] - b_sign * SIGN_MASK) * 2,
                                          (c[L - 1] - c_sign * SIGN_MASK) * (is_mulh + 1), is_mulh + is_mulhsu);

    const Expr inv_256 = Expr(inv_pow2(RV32_CELL_BITS));
    Expr carry;
    for (size_t i = 0; i < L; ++i) {
        Expr sum = carry;
        for (size_t k = 0; k <= i; ++k) {
            sum += b[k] * c[i - k];
        }
        carry = (sum - a_mul[i]) * inv_256;
        RangeTupleCheckerBus::send(builder, a_mul[i], carry, is_valid);
    }

    Expr b_prefix;
    Expr c_prefix;
    for (size_t i = 0; i < L; ++i) {
        b_prefix += b[i];
        c_prefix += c[i];
        Expr sum = carry + b_prefix * c_ext + c_prefix * b_ext;
        for (size_t k = i + 1; k < L; ++k) {
            sum += b[k] * c[L + i - k];
        }
        carry = (sum - a[i]) * inv_256;
        RangeTupleCheckerBus::send(builder, a[i], carry, is_valid);
    }

    AdapterAirContext ctx;
    ctx.reads = {b, c};
    ctx.writes = {a};
    ctx.is_valid = is_valid;
    ctx.opcode = opcode;
    return ctx;
}

MulHCoreChip::MulHCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise,
                           std::shared_ptr<RangeTupleCheckerChip> range_tuple)
    : bitwise_(std::move(bitwise)), range_tuple_(std::move(range_tuple)) {
    const auto& sizes = range_tuple_->sizes();
    if (sizes[0] != (1u << RV32_CELL_BITS) || sizes[1] < 2 * L * (1u << RV32_CELL_BITS)) {
        throw std::invalid_argument("range tuple checker too small for 64-bit products");
    }
}

std::string MulHCoreChip::get_opcode_name(uint32_t opcode) const {
    switch (static_cast<MulHOpcode>(opcode - opcode_offset::MULH)) {
    case MulHOpcode::MULH: return "MULH";
    case MulHOpcode::MULHSU: return "MULHSU";
    case MulHOpcode::MULHU: return "MULHU";
    }
    return "UNKNOWN";
}

std::pair<AdapterRuntimeContext, MulHCoreRecord> MulHCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    require_register_rs2(instruction);
    MulHCoreRecord record;
    record.opcode = static_cast<MulHOpcode>(instruction.opcode - opcode_offset::MULH);
    record.b = limbs_to_bytes(reads.at(0));
    record.c = limbs_to_bytes(reads.at(1));
    const bool b_signed = record.opcode != MulHOpcode::MULHU;
    const bool c_signed = record.opcode == MulHOpcode::MULH;
    const bool b_neg = b_signed && record.b[L - 1] >= SIGN_MASK;
    const bool c_neg = c_signed && record.c[L - 1] >= SIGN_MASK;
    record.b_ext = b_neg ? RV32_CELL_MAX : 0;
    record.c_ext = c_neg ? RV32_CELL_MAX : 0;

    uint64_t carry = 0;
    for (size_t j = 0; j < 2 * L; ++j) {
        uint64_t sum = carry;
        for (size_t k = 0; k <= j; ++k) {
            sum += uint64_t{ext_limb(record.b, record.b_ext, k)} * ext_limb(record.c, record.c_ext, j - k);
        }
        const uint32_t limb = static_cast<uint32_t>(sum & RV32_CELL_MAX);
        carry = sum >> RV32_CELL_BITS;
        if (j < L) {
            record.a_mul[j] = limb;
        } else {
            record.a[j - L] = limb;
        }
        range_tuple_->add_count(limb, static_cast<uint32_t>(carry));
    }

    if (b_signed) {
        bitwise_->request_range((record.b[L - 1] - (b_neg ? SIGN_MASK : 0)) * 2,
                                (record.c[L - 1] - (c_neg ? SIGN_MASK : 0)) * (c_signed ? 2 : 1));
    }
    return {AdapterRuntimeContext::without_pc({u32_to_limbs(bytes_to_u32(record.a))}), record};
}

void MulHCoreChip::generate_trace_row(BFieldElement* row, const MulHCoreRecord& record) const {
    using namespace mulh_col;
    write_bytes(row, A, record.a);
    write_bytes(row, B, record.b);
    write_bytes(row, C, record.c);
    write_bytes(row, A_MUL, record.a_mul);
    row[B_EXT] = BFieldElement(record.b_ext);
    row[C_EXT] = BFieldElement(record.c_ext);
    row[FLAGS + static_cast<size_t>(record.opcode)] = BFieldElement::one();
}

// ============================================================================
// DivRem
// ============================================================================

namespace divrem_col {
constexpr size_t B = 0;
constexpr size_t C = 4;
constexpr size_t Q = 8;
constexpr size_t R = 12;
constexpr size_t ZERO_DIVISOR = 16;
constexpr size_t R_ZERO = 17;
constexpr size_t B_SIGN = 18;
constexpr size_t C_SIGN = 19;
constexpr size_t Q_SIGN = 20;
constexpr size_t SIGN_XOR = 21;
constexpr size_t R_NEG = 22;
constexpr size_t C_SUM_INV = 23;
constexpr size_t R_PRIME = 24;
constexpr size_t C_PRIME = 28;
constexpr size_t LT_MARKER = 32;
constexpr size_t LT_DIFF = 36;
constexpr size_t FLAGS = 37;
} // namespace divrem_col

namespace {

// x' = x, or 2^32 - x when negate: limb-wise sums with boolean carries ending in 1
void eval_abs(AirBuilder& builder, const std::vector<Expr>& x, const std::vector<Expr>& x_abs, const Expr& negate) {
    const Expr inv_256 = Expr(inv_pow2(RV32_CELL_BITS));
    Expr carry;
    for (size_t i = 0; i < L; ++i) {
        carry = (x[i] + x_abs[i] + carry) * inv_256;
        builder.when(negate).assert_bool(carry);
        builder.when(one() - negate).assert_eq(x_abs[i], x[i]);
    }
    builder.when(negate).assert_one(carry);
}

std::array<uint32_t, L> abs_limbs(const std::array<uint32_t, L>& x, bool negate) {
    return negate ? u32_to_bytes(0u - bytes_to_u32(x)) : x;
}

} // namespace

AdapterAirContext DivRemCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                      const Expr& /*from_pc*/) const {
    using namespace divrem_col;
    const std::vector<Expr> b = expr_range(cols, B, L);
    const std::vector<Expr> c = expr_range(cols, C, L);
    const std::vector<Expr> q = expr_range(cols, Q, L);
    const std::vector<Expr> r = expr_range(cols, R, L);
    const Expr& zero_divisor = cols[ZERO_DIVISOR];
    const Expr& r_zero = cols[R_ZERO];
    const Expr& b_sign = cols[B_SIGN];
    const Expr& c_sign = cols[C_SIGN];
    const Expr& q_sign = cols[Q_SIGN];
    const Expr& sign_xor = cols[SIGN_XOR];
    const Expr& r_neg = cols[R_NEG];
    const std::vector<Expr> r_prime = expr_range(cols, R_PRIME, L);
    const std::vector<Expr> c_prime = expr_range(cols, C_PRIME, L);
    const std::vector<Expr> lt_marker = expr_range(cols, LT_MARKER, L);
    const Expr& lt_diff = cols[LT_DIFF];
    const std::vector<Expr> flags = expr_range(cols, FLAGS, 4);
    const Expr& is_div = flags[0];
    const Expr& is_divu = flags[1];
    const Expr& is_rem = flags[2];
    const Expr& is_remu = flags[3];

    Expr opcode;
    const Expr is_valid = eval_opcode_flags(builder, flags, opcode_offset::DIVREM, opcode);
    const Expr is_signed = is_div + is_rem;

    // Operand signs
    builder.assert_bool(b_sign);
    builder.assert_bool(c_sign);
    builder.assert_zero(b_sign * (one() - is_signed));
    builder.assert_zero(c_sign * (one() - is_signed));
    BitwiseOperationLookupBus::send_range(builder, (b[L - 1] - b_sign * SIGN_MASK) * 2,
                                          (c[L - 1] - c_sign * SIGN_MASK) * 2, is_signed);
    builder.assert_eq(sign_xor, b_sign + c_sign - b_sign * c_sign * 2);

    // Division by zero: c = 0 and q = 2^32 - 1, otherwise c_sum_inv inverts the limb sum of c
    builder.assert_bool(zero_divisor);
    builder.assert_zero(zero_divisor * (one() - is_valid));
    Expr c_sum;
    for (size_t i = 0; i < L; ++i) {
        builder.when(zero_divisor).assert_zero(c[i]);
        builder.when(zero_divisor).assert_eq(q[i], Expr::from_u64(RV32_CELL_MAX));
        c_sum += c[i];
    }
    builder.when(is_valid).assert_zero(c_sum * cols[C_SUM_INV] + zero_divisor - 1);

    // The remainder takes the sign of b unless it is zero
    builder.assert_bool(r_zero);
    for (size_t i = 0; i < L; ++i) {
        builder.when(r_zero).assert_zero(r[i]);
    }
    builder.assert_eq(r_neg, b_sign * (one() - r_zero));

    // A nonzero quotient has sign b_sign ^ c_sign
    builder.assert_bool(q_sign);
    builder.assert_zero(q_sign * (one() - is_signed));
    for (size_t i = 0; i < L; ++i) {
        builder.when(one() - zero_divisor).assert_zero((q_sign - sign_xor) * q[i]);
    }

    // b = c * q + r over 2 * L sign-extended limbs
    const Expr b_ext = b_sign * RV32_CELL_MAX;
    const Expr c_ext = c_sign * RV32_CELL_MAX;
    const Expr q_ext = q_sign * RV32_CELL_MAX;
    const Expr r_ext = r_neg * RV32_CELL_MAX;
    const Expr inv_256 = Expr(inv_pow2(RV32_CELL_BITS));
    Expr carry;
    for (size_t j = 0; j < 2 * L; ++j) {
        Expr sum = carry + ext_limb(r, r_ext, j);
        for (size_t k = 0; k <= j; ++k) {
            sum += ext_limb(c, c_ext, k) * ext_limb(q, q_ext, j - k);
        }
        carry = (sum - ext_limb(b, b_ext, j)) * inv_256;
        RangeTupleCheckerBus::send(builder, j < L ? q[j] : r[j - L], carry, is_valid);
    }

    // |r| < |c| when c != 0
    eval_abs(builder, r, r_prime, r_neg);
    eval_abs(builder, c, c_prime, c_sign);
    for (size_t i = 0; i < L; i += 2) {
        BitwiseOperationLookupBus::send_range(builder, r_prime[i], r_prime[i + 1], is_valid);
        BitwiseOperationLookupBus::send_range(builder, c_prime[i], c_prime[i + 1], is_valid);
    }
    const Expr nonzero_divisor = is_valid - zero_divisor;
    Expr prefix_sum;
    for (size_t k = L; k-- > 0;) {
        const Expr diff = c_prime[k] - r_prime[k];
        builder.assert_bool(lt_marker[k]);
        prefix_sum += lt_marker[k];
        builder.when(nonzero_divisor).assert_zero((one() - prefix_sum) * diff);
        builder.when(lt_marker[k]).assert_eq(lt_diff, diff);
    }
    builder.assert_eq(prefix_sum, nonzero_divisor);
    BitwiseOperationLookupBus::send_range(builder, lt_diff - 1, Expr(), nonzero_divisor);

    std::vector<Expr> rd(L);
    for (size_t i = 0; i < L; ++i) {
        rd[i] = (is_div + is_divu) * q[i] + (is_rem + is_remu) * r[i];
    }

    AdapterAirContext ctx;
    ctx.reads = {b, c};
    ctx.writes = {rd};
    ctx.is_valid = is_valid;
    ctx.opcode = opcode;
    return ctx;
}

DivRemCoreChip::DivRemCoreChip(std::shared_ptr<BitwiseOperationLookupChip> bitwise,
                               std::shared_ptr<RangeTupleCheckerChip> range_tuple)
    : bitwise_(std::move(bitwise)), range_tuple_(std::move(range_tuple)) {
    const auto& sizes = range_tuple_->sizes();
    if (sizes[0] != (1u << RV32_CELL_BITS) || sizes[1] < 2 * L * (1u << RV32_CELL_BITS)) {
        throw std::invalid_argument("range tuple checker too small for 64-bit products");
    }
}

std::string DivRemCoreChip::get_opcode_name(uint32_t opcode) const {
    switch (static_cast<DivRemOpcode>(opcode - opcode_offset::DIVREM)) {
    case DivRemOpcode::DIV: return "DIV";
    case DivRemOpcode::DIVU: return "DIVU";
    case DivRemOpcode::REM: return "REM";
    case DivRemOpcode::REMU: return "REMU";
    }
    return "UNKNOWN";
}

std::pair<AdapterRuntimeContext, DivRemCoreRecord> DivRemCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    require_register_rs2(instruction);
    DivRemCoreRecord record;
    record.opcode = static_cast<DivRemOpcode>(instruction.opcode - opcode_offset::DIVREM);
    record.b = limbs_to_bytes(reads.at(0));
    record.c = limbs_to_bytes(reads.at(1));
    const bool is_signed = record.opcode == DivRemOpcode::DIV || record.opcode == DivRemOpcode::REM;
    const uint32_t b = bytes_to_u32(record.b);
    const uint32_t c = bytes_to_u32(record.c);

    const auto [q, r] = run_divrem(is_signed, b, c);
    record.q = u32_to_bytes(q);
    record.r = u32_to_bytes(r);
    record.zero_divisor = c == 0;
    record.r_zero = r == 0;
    record.b_sign = is_signed && (b >> 31) != 0;
    record.c_sign = is_signed && (c >> 31) != 0;
    const bool sign_xor = record.b_sign != record.c_sign;
    if (record.zero_divisor) {
        record.q_sign = is_signed;
    } else {
        record.q_sign = q != 0 && sign_xor;
    }
    record.r_neg = record.b_sign && !record.r_zero;

    uint32_t c_sum = 0;
    for (uint32_t limb : record.c) {
        c_sum += limb;
    }
    if (c_sum != 0) {
        record.c_sum_inv = BFieldElement(c_sum).inverse();
    }

    // Identity carries, paired with the q and r bytes they range check alongside
    const uint32_t b_ext = record.b_sign ? RV32_CELL_MAX : 0;
    const uint32_t c_ext = record.c_sign ? RV32_CELL_MAX : 0;
    const uint32_t q_ext = record.q_sign ? RV32_CELL_MAX : 0;
    const uint32_t r_ext = record.r_neg ? RV32_CELL_MAX : 0;
    uint64_t carry = 0;
    for (size_t j = 0; j < 2 * L; ++j) {
        uint64_t sum = carry + ext_limb(record.r, r_ext, j);
        for (size_t k = 0; k <= j; ++k) {
            sum += uint64_t{ext_limb(record.c, c_ext, k)} * ext_limb(record.q, q_ext, j - k);
        }
        if ((sum & RV32_CELL_MAX) != ext_limb(record.b, b_ext, j)) {
            throw std::logic_error("division identity does not hold");
        }
        carry = sum >> RV32_CELL_BITS;
        range_tuple_->add_count(j < L ? record.q[j] : record.r[j - L], static_cast<uint32_t>(carry));
    }

    record.r_prime = abs_limbs(record.r, record.r_neg);
    record.c_prime = abs_limbs(record.c, record.c_sign);
    for (size_t i = 0; i < L; i += 2) {
        bitwise_->request_range(record.r_prime[i], record.r_prime[i + 1]);
        bitwise_->request_range(record.c_prime[i], record.c_prime[i + 1]);
    }
    if (is_signed) {
        bitwise_->request_range((record.b[L - 1] - (record.b_sign ? SIGN_MASK : 0)) * 2,
                                (record.c[L - 1] - (record.c_sign ? SIGN_MASK : 0)) * 2);
    }
    if (!record.zero_divisor) {
        for (int i = static_cast<int>(L) - 1; i >= 0; --i) {
            if (record.c_prime[i] != record.r_prime[i]) {
                record.lt_idx = i;
                record.lt_diff = record.c_prime[i] - record.r_prime[i];
                break;
            }
        }
        if (record.lt_idx < 0 || record.c_prime[record.lt_idx] < record.r_prime[record.lt_idx]) {
            throw std::logic_error("remainder is not smaller than the divisor");
        }
        bitwise_->request_range(record.lt_diff - 1, 0);
    }

    const bool is_div = record.opcode == DivRemOpcode::DIV || record.opcode == DivRemOpcode::DIVU;
    return {AdapterRuntimeContext::without_pc({u32_to_limbs(is_div ? q : r)}), record};
}

void DivRemCoreChip::generate_trace_row(BFieldElement* row, const DivRemCoreRecord& record) const {
    using namespace divrem_col;
    write_bytes(row, B, record.b);
    write_bytes(row, C, record.c);
    write_bytes(row, Q, record.q);
    write_bytes(row, R, record.r);
    row[ZERO_DIVISOR] = bool_field(record.zero_divisor);
    row[R_ZERO] = bool_field(record.r_zero);
    row[B_SIGN] = bool_field(record.b_sign);
    row[C_SIGN] = bool_field(record.c_sign);
    row[Q_SIGN] = bool_field(record.q_sign);
    row[SIGN_XOR] = bool_field(record.b_sign != record.c_sign);
    row[R_NEG] = bool_field(record.r_neg);
    row[C_SUM_INV] = record.c_sum_inv;
    write_bytes(row, R_PRIME, record.r_prime);
    write_bytes(row, C_PRIME, record.c_prime);
    if (record.lt_idx >= 0) {
        row[LT_MARKER + static_cast<size_t>(record.lt_idx)] = BFieldElement::one();
        row[LT_DIFF] = BFieldElement(record.lt_diff);
    }
    row[FLAGS + static_cast<size_t>(record.opcode)] = BFieldElement::one();
}

} // namespace zkrv
