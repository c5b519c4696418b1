#include "rv32im/branch_cores.hpp"
#include <string>

namespace zkrv {

namespace {

constexpr size_t L = RV32_REGISTER_NUM_LIMBS;

Expr one() { return Expr(BFieldElement::one()); }

// from_pc + imm when taken, from_pc + 4 otherwise
Expr branch_target(const Expr& from_pc, const Expr& cmp_result, const Expr& imm) {
    return from_pc + cmp_result * imm + (one() - cmp_result) * static_cast<int64_t>(DEFAULT_PC_STEP);
}

} // namespace

// ============================================================================
// BranchEqual
// ============================================================================

namespace beq_col {
constexpr size_t A = 0;
constexpr size_t B = 4;
constexpr size_t CMP_RESULT = 8;
constexpr size_t IMM = 9;
constexpr size_t FLAGS = 10;
constexpr size_t DIFF_INV_MARKER = 12;
} // namespace beq_col

AdapterAirContext BranchEqualCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                           const Expr& from_pc) const {
    using namespace beq_col;
    const std::vector<Expr> a = expr_range(cols, A, L);
    const std::vector<Expr> b = expr_range(cols, B, L);
    const Expr& cmp_result = cols[CMP_RESULT];
    const Expr& imm = cols[IMM];
    const Expr& is_beq = cols[FLAGS];
    const Expr& is_bne = cols[FLAGS + 1];

    builder.assert_bool(is_beq);
    builder.assert_bool(is_bne);
    const Expr is_valid = is_beq + is_bne;
    builder.assert_bool(is_valid);
    builder.assert_bool(cmp_result);

    // cmp_eq is a == b
    const Expr cmp_eq = cmp_result * is_beq + (one() - cmp_result) * is_bne;
    Expr sum = cmp_eq;
    for (size_t i = 0; i < L; ++i) {
        builder.when(cmp_eq).assert_eq(a[i], b[i]);
        sum += (a[i] - b[i]) * cols[DIFF_INV_MARKER + i];
    }
    builder.when(is_valid).assert_one(sum);

    AdapterAirContext ctx;
    ctx.to_pc = branch_target(from_pc, cmp_result, imm);
    ctx.reads = {a, b};
    ctx.is_valid = is_valid;
    ctx.opcode = is_bne + Expr::from_u64(opcode_offset::BRANCH_EQUAL) * is_valid;
    ctx.immediates = {imm};
    return ctx;
}

std::string BranchEqualCoreChip::get_opcode_name(uint32_t opcode) const {
    return opcode == zkrv::opcode(BranchEqualOpcode::BEQ) ? "BEQ" : "BNE";
}

std::pair<AdapterRuntimeContext, BranchEqualCoreRecord> BranchEqualCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t from_pc, const AdapterReads& reads) const {
    BranchEqualCoreRecord record;
    record.opcode = static_cast<BranchEqualOpcode>(instruction.opcode - opcode_offset::BRANCH_EQUAL);
    record.a = limbs_to_bytes(reads.at(0));
    record.b = limbs_to_bytes(reads.at(1));
    record.imm = instruction.c;

    for (size_t i = 0; i < L; ++i) {
        if (record.a[i] != record.b[i]) {
            record.diff_idx = static_cast<int>(i);
            record.diff_inv = (BFieldElement(record.a[i]) - BFieldElement(record.b[i])).inverse();
            break;
        }
    }
    const bool equal = record.diff_idx < 0;
    record.cmp_result = record.opcode == BranchEqualOpcode::BEQ ? equal : !equal;

    AdapterRuntimeContext ctx;
    ctx.to_pc = record.cmp_result ? jump_target(from_pc, to_signed(record.imm)) : from_pc + DEFAULT_PC_STEP;
    return {ctx, record};
}

void BranchEqualCoreChip::generate_trace_row(BFieldElement* row, const BranchEqualCoreRecord& record) const {
    using namespace beq_col;
    write_bytes(row, A, record.a);
    write_bytes(row, B, record.b);
    row[CMP_RESULT] = bool_field(record.cmp_result);
    row[IMM] = record.imm;
    row[FLAGS + static_cast<size_t>(record.opcode)] = BFieldElement::one();
    if (record.diff_idx >= 0) {
        row[DIFF_INV_MARKER + static_cast<size_t>(record.diff_idx)] = record.diff_inv;
    }
}

// ============================================================================
// BranchLessThan
// ============================================================================

namespace blt_col {
constexpr size_t A = 0;
constexpr size_t B = 4;
constexpr size_t CMP_RESULT = 8;
constexpr size_t IMM = 9;
constexpr size_t FLAGS = 10;
constexpr size_t A_MSB_F = 14;
constexpr size_t B_MSB_F = 15;
constexpr size_t CMP_LT = 16;
constexpr size_t DIFF_MARKER = 17;
constexpr size_t DIFF_VAL = 21;
} // namespace blt_col

AdapterAirContext BranchLessThanCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                              const Expr& from_pc) const {
    using namespace blt_col;
    const std::vector<Expr> a = expr_range(cols, A, L);
    const std::vector<Expr> b = expr_range(cols, B, L);
    const Expr& cmp_result = cols[CMP_RESULT];
    const Expr& imm = cols[IMM];
    const Expr& cmp_lt = cols[CMP_LT];
    const Expr& is_blt = cols[FLAGS];
    const Expr& is_bltu = cols[FLAGS + 1];
    const Expr& is_bge = cols[FLAGS + 2];
    const Expr& is_bgeu = cols[FLAGS + 3];

    Expr is_valid;
    Expr opcode;
    for (size_t i = 0; i < 4; ++i) {
        builder.assert_bool(cols[FLAGS + i]);
        is_valid += cols[FLAGS + i];
        opcode += cols[FLAGS + i] * static_cast<int64_t>(i);
    }
    builder.assert_bool(is_valid);
    builder.assert_bool(cmp_result);
    opcode += Expr::from_u64(opcode_offset::BRANCH_LESS_THAN) * is_valid;

    const Expr lt = is_blt + is_bltu;
    const Expr ge = is_bge + is_bgeu;
    builder.assert_eq(cmp_lt, cmp_result * lt + (one() - cmp_result) * ge);

    eval_less_than(builder, a, b, cols[A_MSB_F], cols[B_MSB_F], cmp_lt, expr_range(cols, DIFF_MARKER, L),
                   cols[DIFF_VAL], is_blt + is_bge, is_valid);

    AdapterAirContext ctx;
    ctx.to_pc = branch_target(from_pc, cmp_result, imm);
    ctx.reads = {a, b};
    ctx.is_valid = is_valid;
    ctx.opcode = opcode;
    ctx.immediates = {imm};
    return ctx;
}

std::string BranchLessThanCoreChip::get_opcode_name(uint32_t opcode) const {
    switch (static_cast<BranchLessThanOpcode>(opcode - opcode_offset::BRANCH_LESS_THAN)) {
    case BranchLessThanOpcode::BLT: return "BLT";
    case BranchLessThanOpcode::BLTU: return "BLTU";
    case BranchLessThanOpcode::BGE: return "BGE";
    case BranchLessThanOpcode::BGEU: return "BGEU";
    }
    return "UNKNOWN";
}

std::pair<AdapterRuntimeContext, BranchLessThanCoreRecord> BranchLessThanCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t from_pc, const AdapterReads& reads) const {
    BranchLessThanCoreRecord record;
    record.opcode = static_cast<BranchLessThanOpcode>(instruction.opcode - opcode_offset::BRANCH_LESS_THAN);
    record.a = limbs_to_bytes(reads.at(0));
    record.b = limbs_to_bytes(reads.at(1));
    record.imm = instruction.c;

    const bool is_signed = record.opcode == BranchLessThanOpcode::BLT || record.opcode == BranchLessThanOpcode::BGE;
    const bool is_ge = record.opcode == BranchLessThanOpcode::BGE || record.opcode == BranchLessThanOpcode::BGEU;
    record.lt = compare_limbs(record.a, record.b, is_signed, *bitwise_);
    record.cmp_result = is_ge ? !record.lt.lt : record.lt.lt;

    AdapterRuntimeContext ctx;
    ctx.to_pc = record.cmp_result ? jump_target(from_pc, to_signed(record.imm)) : from_pc + DEFAULT_PC_STEP;
    return {ctx, record};
}

void BranchLessThanCoreChip::generate_trace_row(BFieldElement* row, const BranchLessThanCoreRecord& record) const {
    using namespace blt_col;
    write_bytes(row, A, record.a);
    write_bytes(row, B, record.b);
    row[CMP_RESULT] = bool_field(record.cmp_result);
    row[IMM] = record.imm;
    row[FLAGS + static_cast<size_t>(record.opcode)] = BFieldElement::one();
    row[A_MSB_F] = record.lt.x_msb_f;
    row[B_MSB_F] = record.lt.y_msb_f;
    row[CMP_LT] = bool_field(record.lt.lt);
    if (record.lt.diff_idx >= 0) {
        row[DIFF_MARKER + static_cast<size_t>(record.lt.diff_idx)] = BFieldElement::one();
        row[DIFF_VAL] = BFieldElement(record.lt.diff_val);
    }
}

} // namespace zkrv
