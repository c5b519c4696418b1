#include "rv32im/jump_cores.hpp"
#include "rv32im/alu_cores.hpp"
#include <string>

namespace zkrv {

namespace {

constexpr size_t L = RV32_REGISTER_NUM_LIMBS;
// Bits of the top byte of a valid pc
constexpr size_t PC_TOP_BYTE_BITS = PC_BITS - 3 * RV32_CELL_BITS;

Expr one() { return Expr(BFieldElement::one()); }

Expr compose_bytes(const std::vector<Expr>& bytes) { return compose_limbs(bytes, RV32_CELL_BITS); }

// Upper immediates (LUI, AUIPC) are 20 bits
uint32_t upper_immediate(const Instruction& instruction) {
    const uint32_t imm = instruction.c.value();
    if (imm >= (1u << 20)) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             "upper immediate " + std::to_string(imm) + " exceeds 20 bits");
    }
    return imm;
}

} // namespace

// ============================================================================
// JalLui
// ============================================================================

namespace jal_lui_col {
constexpr size_t IMM = 0;
constexpr size_t RD = 1;
constexpr size_t IS_JAL = 5;
constexpr size_t IS_LUI = 6;
} // namespace jal_lui_col

AdapterAirContext JalLuiCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                      const Expr& from_pc) const {
    using namespace jal_lui_col;
    const Expr& imm = cols[IMM];
    const std::vector<Expr> rd = expr_range(cols, RD, L);
    const Expr& is_jal = cols[IS_JAL];
    const Expr& is_lui = cols[IS_LUI];

    builder.assert_bool(is_jal);
    builder.assert_bool(is_lui);
    const Expr is_valid = is_jal + is_lui;
    builder.assert_bool(is_valid);

    // LUI: rd = imm << 12
    builder.when(is_lui).assert_zero(rd[0]);
    builder.when(is_lui).assert_eq(imm * 16, rd[1] + rd[2] * 256 + rd[3] * 65536);
    // JAL: rd = pc + 4
    builder.when(is_jal).assert_eq(compose_bytes(rd), from_pc + static_cast<int64_t>(DEFAULT_PC_STEP));

    BitwiseOperationLookupBus::send_range(builder, rd[0], rd[1], is_valid);
    // A return address has a PC_BITS-bit top: rd[3] * 4 must be a byte for JAL
    BitwiseOperationLookupBus::send_range(
        builder, rd[2], rd[3] + rd[3] * is_jal * static_cast<int64_t>((1 << (RV32_CELL_BITS - PC_TOP_BYTE_BITS)) - 1),
        is_valid);

    AdapterAirContext ctx;
    ctx.to_pc = from_pc + is_jal * imm + is_lui * static_cast<int64_t>(DEFAULT_PC_STEP);
    ctx.writes = {rd};
    ctx.is_valid = is_valid;
    ctx.opcode = is_lui + Expr::from_u64(opcode_offset::JAL_LUI) * is_valid;
    ctx.immediates = {imm};
    return ctx;
}

std::string JalLuiCoreChip::get_opcode_name(uint32_t opcode) const {
    return opcode == zkrv::opcode(JalLuiOpcode::JAL) ? "JAL" : "LUI";
}

std::pair<AdapterRuntimeContext, JalLuiCoreRecord> JalLuiCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t from_pc, const AdapterReads& /*reads*/) const {
    JalLuiCoreRecord record;
    record.opcode = static_cast<JalLuiOpcode>(instruction.opcode - opcode_offset::JAL_LUI);
    record.imm = instruction.c;

    AdapterRuntimeContext ctx;
    if (record.opcode == JalLuiOpcode::JAL) {
        record.rd = u32_to_bytes(from_pc + DEFAULT_PC_STEP);
        ctx.to_pc = jump_target(from_pc, to_signed(record.imm));
        bitwise_->request_range(record.rd[0], record.rd[1]);
        bitwise_->request_range(record.rd[2], record.rd[3] << (RV32_CELL_BITS - PC_TOP_BYTE_BITS));
    } else {
        record.rd = u32_to_bytes(upper_immediate(instruction) << 12);
        ctx.to_pc = from_pc + DEFAULT_PC_STEP;
        bitwise_->request_range(record.rd[0], record.rd[1]);
        bitwise_->request_range(record.rd[2], record.rd[3]);
    }
    ctx.writes = {u32_to_limbs(bytes_to_u32(record.rd))};
    return {ctx, record};
}

void JalLuiCoreChip::generate_trace_row(BFieldElement* row, const JalLuiCoreRecord& record) const {
    using namespace jal_lui_col;
    row[IMM] = record.imm;
    write_bytes(row, RD, record.rd);
    row[record.opcode == JalLuiOpcode::JAL ? IS_JAL : IS_LUI] = BFieldElement::one();
}

// ============================================================================
// Jalr
// ============================================================================

namespace jalr_core_col {
constexpr size_t IMM = 0;
constexpr size_t IMM_SIGN = 1;
constexpr size_t RS1 = 2;
constexpr size_t RD = 6;
constexpr size_t TO_PC_LSB = 10;
constexpr size_t TO_PC_LIMBS = 11;
constexpr size_t IS_VALID = 13;
} // namespace jalr_core_col

AdapterAirContext JalrCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                    const Expr& from_pc) const {
    using namespace jalr_core_col;
    const Expr& imm = cols[IMM];
    const Expr& imm_sign = cols[IMM_SIGN];
    const std::vector<Expr> rs1 = expr_range(cols, RS1, L);
    const std::vector<Expr> rd = expr_range(cols, RD, L);
    const Expr& lsb = cols[TO_PC_LSB];
    const Expr& limb_lo = cols[TO_PC_LIMBS];
    const Expr& limb_hi = cols[TO_PC_LIMBS + 1];
    const Expr& is_valid = cols[IS_VALID];

    builder.assert_bool(is_valid);
    builder.assert_bool(imm_sign);
    builder.assert_bool(lsb);

    // rs1 + sign_extend(imm) = lsb + 2 * limb_lo + 2^16 * limb_hi (mod 2^32)
    const Expr inv_2_16 = Expr(inv_pow2(16));
    const Expr carry_lo = (rs1[0] + rs1[1] * 256 + imm - limb_lo * 2 - lsb) * inv_2_16;
    builder.when(is_valid).assert_bool(carry_lo);
    const Expr carry_hi = (rs1[2] + rs1[3] * 256 + imm_sign * 0xFFFF + carry_lo - limb_hi) * inv_2_16;
    builder.when(is_valid).assert_bool(carry_hi);

    const VariableRangeCheckerBus range_bus{range_max_bits_};
    range_bus.range_check(builder, limb_lo, 15, is_valid);
    range_bus.range_check(builder, limb_hi, PC_BITS - 16, is_valid);

    builder.when(is_valid).assert_eq(compose_bytes(rd), from_pc + static_cast<int64_t>(DEFAULT_PC_STEP));
    BitwiseOperationLookupBus::send_range(builder, rd[0], rd[1], is_valid);
    BitwiseOperationLookupBus::send_range(builder, rd[2], rd[3] * static_cast<int64_t>(1 << (RV32_CELL_BITS - PC_TOP_BYTE_BITS)),
                                          is_valid);

    AdapterAirContext ctx;
    ctx.to_pc = limb_lo * 2 + limb_hi * 65536;
    ctx.reads = {rs1};
    ctx.writes = {rd};
    ctx.is_valid = is_valid;
    ctx.opcode = Expr::from_u64(opcode_offset::JALR) * is_valid;
    ctx.immediates = {imm, imm_sign};
    return ctx;
}

std::pair<AdapterRuntimeContext, JalrCoreRecord> JalrCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t from_pc, const AdapterReads& reads) const {
    JalrCoreRecord record;
    record.imm = instruction.c.value();
    record.imm_sign = !instruction.g.is_zero();
    if (record.imm > 0xFFFF) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0, "JALR offset exceeds 16 bits");
    }
    record.rs1 = limbs_to_bytes(reads.at(0));
    const uint32_t rs1 = limbs_to_u32(reads.at(0));
    const uint32_t target = rs1 + (record.imm | (record.imm_sign ? 0xFFFF0000u : 0u));
    record.to_pc_lsb = (target & 1) != 0;
    record.to_pc = target & ~1u;
    if ((record.to_pc >> PC_BITS) != 0) {
        throw ExecutionError(ExecutionErrorKind::PcOutOfBounds, 0,
                             "jump target " + std::to_string(record.to_pc) + " out of range");
    }
    record.rd = u32_to_bytes(from_pc + DEFAULT_PC_STEP);

    range_checker_->add_count((record.to_pc & 0xFFFF) >> 1, 15);
    range_checker_->add_count(record.to_pc >> 16, PC_BITS - 16);
    bitwise_->request_range(record.rd[0], record.rd[1]);
    bitwise_->request_range(record.rd[2], record.rd[3] << (RV32_CELL_BITS - PC_TOP_BYTE_BITS));

    AdapterRuntimeContext ctx;
    ctx.to_pc = record.to_pc;
    ctx.writes = {u32_to_limbs(from_pc + DEFAULT_PC_STEP)};
    return {ctx, record};
}

void JalrCoreChip::generate_trace_row(BFieldElement* row, const JalrCoreRecord& record) const {
    using namespace jalr_core_col;
    row[IMM] = BFieldElement(record.imm);
    row[IMM_SIGN] = bool_field(record.imm_sign);
    write_bytes(row, RS1, record.rs1);
    write_bytes(row, RD, record.rd);
    row[TO_PC_LSB] = bool_field(record.to_pc_lsb);
    row[TO_PC_LIMBS] = BFieldElement((record.to_pc & 0xFFFF) >> 1);
    row[TO_PC_LIMBS + 1] = BFieldElement(record.to_pc >> 16);
    row[IS_VALID] = BFieldElement::one();
}

// ============================================================================
// Auipc
// ============================================================================

namespace auipc_col {
constexpr size_t IMM_LIMBS = 0;
constexpr size_t PC_LIMBS = 3;
constexpr size_t RD = 7;
constexpr size_t IS_VALID = 11;
} // namespace auipc_col

AdapterAirContext AuipcCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                     const Expr& from_pc) const {
    using namespace auipc_col;
    const std::vector<Expr> imm = expr_range(cols, IMM_LIMBS, 3);
    const std::vector<Expr> pc = expr_range(cols, PC_LIMBS, L);
    const std::vector<Expr> rd = expr_range(cols, RD, L);
    const Expr& is_valid = cols[IS_VALID];

    builder.assert_bool(is_valid);
    builder.when(is_valid).assert_eq(compose_bytes(pc), from_pc);
    builder.assert_eq(rd[0], pc[0]);

    const Expr inv_256 = Expr(inv_pow2(RV32_CELL_BITS));
    Expr carry;
    for (size_t i = 1; i < L; ++i) {
        carry = (pc[i] + imm[i - 1] + carry - rd[i]) * inv_256;
        builder.when(is_valid).assert_bool(carry);
    }

    BitwiseOperationLookupBus::send_range(builder, rd[0], rd[1], is_valid);
    BitwiseOperationLookupBus::send_range(builder, rd[2], rd[3], is_valid);
    BitwiseOperationLookupBus::send_range(builder, imm[0], imm[1], is_valid);
    BitwiseOperationLookupBus::send_range(builder, imm[2], pc[0], is_valid);
    BitwiseOperationLookupBus::send_range(builder, pc[1], pc[2], is_valid);
    BitwiseOperationLookupBus::send_range(
        builder, pc[3] * static_cast<int64_t>(1 << (RV32_CELL_BITS - PC_TOP_BYTE_BITS)), Expr(), is_valid);

    AdapterAirContext ctx;
    ctx.writes = {rd};
    ctx.is_valid = is_valid;
    ctx.opcode = Expr::from_u64(opcode_offset::AUIPC) * is_valid;
    ctx.immediates = {(imm[0] + imm[1] * 256 + imm[2] * 65536) * Expr(inv_pow2(4))};
    return ctx;
}

std::pair<AdapterRuntimeContext, AuipcCoreRecord> AuipcCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t from_pc, const AdapterReads& /*reads*/) const {
    AuipcCoreRecord record;
    const uint32_t shifted = upper_immediate(instruction) << 12;
    const uint32_t rd = from_pc + shifted;
    for (size_t i = 0; i < 3; ++i) {
        record.imm_limbs[i] = (shifted >> (8 * (i + 1))) & 0xFF;
    }
    record.pc_limbs = u32_to_bytes(from_pc);
    record.rd = u32_to_bytes(rd);

    bitwise_->request_range(record.rd[0], record.rd[1]);
    bitwise_->request_range(record.rd[2], record.rd[3]);
    bitwise_->request_range(record.imm_limbs[0], record.imm_limbs[1]);
    bitwise_->request_range(record.imm_limbs[2], record.pc_limbs[0]);
    bitwise_->request_range(record.pc_limbs[1], record.pc_limbs[2]);
    bitwise_->request_range(record.pc_limbs[3] << (RV32_CELL_BITS - PC_TOP_BYTE_BITS), 0);

    return {AdapterRuntimeContext::without_pc({u32_to_limbs(rd)}), record};
}

void AuipcCoreChip::generate_trace_row(BFieldElement* row, const AuipcCoreRecord& record) const {
    using namespace auipc_col;
    for (size_t i = 0; i < 3; ++i) {
        row[IMM_LIMBS + i] = BFieldElement(record.imm_limbs[i]);
    }
    write_bytes(row, PC_LIMBS, record.pc_limbs);
    write_bytes(row, RD, record.rd);
    row[IS_VALID] = BFieldElement::one();
}

} // namespace zkrv
