#include "rv32im/adapters.hpp"
#include "vm/opcode.hpp"
#include <string>

namespace zkrv {

namespace {

Expr one() { return Expr(BFieldElement::one()); }

const Expr& reg_as() {
    static const Expr as = Expr::from_u64(address_space::REGISTER);
    return as;
}

Expr default_to_pc(const AdapterAirContext& ctx, const Expr& from_pc) {
    return ctx.to_pc ? *ctx.to_pc : from_pc + static_cast<int64_t>(DEFAULT_PC_STEP);
}

void require_register_operand(const Instruction& instruction) {
    if (instruction.d.value() != address_space::REGISTER) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             "operand d must be the register address space, got " +
                                 std::to_string(instruction.d.value()));
    }
}

uint32_t next_pc(const AdapterRuntimeContext& ctx, uint32_t from_pc) {
    return ctx.to_pc ? *ctx.to_pc : from_pc + DEFAULT_PC_STEP;
}

} // namespace

Block to_block(const std::vector<BFieldElement>& limbs) {
    if (limbs.size() != BLOCK_SIZE) {
        throw std::invalid_argument("block needs " + std::to_string(BLOCK_SIZE) + " cells, got " +
                                    std::to_string(limbs.size()));
    }
    Block block;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        block[i] = limbs[i];
    }
    return block;
}

std::vector<BFieldElement> from_block(const Block& block) { return std::vector<BFieldElement>(block.begin(), block.end()); }

// ============================================================================
// Rv32BaseAluAdapter
// ============================================================================

namespace alu_col {
constexpr size_t FROM_PC = 0;
constexpr size_t FROM_TS = 1;
constexpr size_t RD_PTR = 2;
constexpr size_t RS1_PTR = 3;
constexpr size_t RS2 = 4;
constexpr size_t RS2_AS = 5;
constexpr size_t RS1_AUX = 6;
} // namespace alu_col

void Rv32BaseAluAdapterAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                 const AdapterAirContext& ctx) const {
    const size_t r = memory_.read_aux_width();
    const Expr& from_pc = cols[alu_col::FROM_PC];
    const Expr& from_ts = cols[alu_col::FROM_TS];
    const Expr& rd_ptr = cols[alu_col::RD_PTR];
    const Expr& rs1_ptr = cols[alu_col::RS1_PTR];
    const Expr& rs2 = cols[alu_col::RS2];
    const Expr& rs2_as = cols[alu_col::RS2_AS];
    const Expr& is_valid = ctx.is_valid;

    builder.assert_bool(rs2_as);
    builder.assert_zero(rs2_as * (one() - is_valid));

    // Immediate: rs2 = c0 + c1 * 2^8 + c2 * 2^16 with c2 = c3 in {0, 255}
    const Expr is_imm = is_valid - rs2_as;
    const auto& c = ctx.reads[1];
    builder.when(is_imm).assert_eq(rs2, c[0] + c[1] * 256 + c[2] * 65536);
    builder.when(is_imm).assert_zero(c[2] * (Expr::from_u64(RV32_CELL_MAX) - c[2]));
    builder.when(is_imm).assert_eq(c[3], c[2]);
    BitwiseOperationLookupBus::send_range(builder, c[0], c[1], is_imm);

    memory_.read(builder, reg_as(), rs1_ptr, ctx.reads[0], from_ts, slice(cols, alu_col::RS1_AUX, r), is_valid);
    memory_.read(builder, rs2_as, rs2, c, from_ts + 4, slice(cols, alu_col::RS1_AUX + r, r), rs2_as);
    memory_.write(builder, reg_as(), rd_ptr, ctx.writes[0], from_ts + 8,
                  slice(cols, alu_col::RS1_AUX + 2 * r, memory_.write_aux_width()), is_valid);

    ProgramBus::lookup(builder, is_valid, from_pc, ctx.opcode, {rd_ptr, rs1_ptr, rs2, reg_as(), rs2_as});
    ExecutionBridge::execute(builder, is_valid, from_pc, from_ts, default_to_pc(ctx, from_pc), from_ts + 12);
}

std::pair<AdapterReads, Rv32BaseAluReadRecord> Rv32BaseAluAdapter::preprocess(MemoryController& memory,
                                                                              const Instruction& instruction) const {
    require_register_operand(instruction);
    Rv32BaseAluReadRecord record;
    record.rd_ptr = instruction.a.value();
    record.rs1_ptr = instruction.b.value();
    record.rs2 = instruction.c.value();
    record.rs2_as = instruction.e.value();

    record.rs1 = memory.read(address_space::REGISTER, record.rs1_ptr);
    std::vector<BFieldElement> c_limbs;
    if (record.rs2_as == address_space::REGISTER) {
        record.rs2_read = memory.read(address_space::REGISTER, record.rs2);
        c_limbs = from_block(record.rs2_read->data);
    } else if (record.rs2_as == RV32_IMM_AS) {
        memory.increment_timestamp();
        const uint32_t imm = record.rs2;
        const uint32_t top = (imm >> 16) & 0xFF;
        if ((imm >> 24) != 0 || (top != 0 && top != RV32_CELL_MAX)) {
            throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                                 "immediate " + std::to_string(imm) + " is not a sign-extended 24-bit value");
        }
        c_limbs = {BFieldElement(imm & 0xFF), BFieldElement((imm >> 8) & 0xFF), BFieldElement(top), BFieldElement(top)};
        bitwise_->request_range(imm & 0xFF, (imm >> 8) & 0xFF);
    } else {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             "operand e must be 0 or 1, got " + std::to_string(record.rs2_as));
    }
    AdapterReads reads{from_block(record.rs1.data), std::move(c_limbs)};
    return {std::move(reads), std::move(record)};
}

std::pair<ExecutionState, Rv32BaseAluWriteRecord> Rv32BaseAluAdapter::postprocess(
    MemoryController& memory, const Instruction& instruction, ExecutionState from_state,
    const AdapterRuntimeContext& ctx, const Rv32BaseAluReadRecord& /*read_record*/) const {
    Rv32BaseAluWriteRecord record;
    record.rd = memory.write(address_space::REGISTER, instruction.a.value(), to_block(ctx.writes.at(0)));
    return {ExecutionState(next_pc(ctx, from_state.pc), memory.timestamp()), record};
}

void Rv32BaseAluAdapter::generate_trace_row(BFieldElement* row, ExecutionState from_state,
                                            const Rv32BaseAluReadRecord& read, const Rv32BaseAluWriteRecord& write,
                                            const MemoryAuxFiller& aux) const {
    const size_t r = aux.read_aux_width();
    row[alu_col::FROM_PC] = BFieldElement(from_state.pc);
    row[alu_col::FROM_TS] = BFieldElement(from_state.timestamp);
    row[alu_col::RD_PTR] = BFieldElement(read.rd_ptr);
    row[alu_col::RS1_PTR] = BFieldElement(read.rs1_ptr);
    row[alu_col::RS2] = BFieldElement(read.rs2);
    row[alu_col::RS2_AS] = BFieldElement(read.rs2_as);
    aux.fill_read(row + alu_col::RS1_AUX, read.rs1);
    if (read.rs2_read) {
        aux.fill_read(row + alu_col::RS1_AUX + r, *read.rs2_read);
    }
    aux.fill_write(row + alu_col::RS1_AUX + 2 * r, write.rd);
}

// ============================================================================
// Rv32BranchAdapter
// ============================================================================

namespace branch_col {
constexpr size_t FROM_PC = 0;
constexpr size_t FROM_TS = 1;
constexpr size_t RS1_PTR = 2;
constexpr size_t RS2_PTR = 3;
constexpr size_t RS1_AUX = 4;
} // namespace branch_col

void Rv32BranchAdapterAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                const AdapterAirContext& ctx) const {
    const size_t r = memory_.read_aux_width();
    const Expr& from_pc = cols[branch_col::FROM_PC];
    const Expr& from_ts = cols[branch_col::FROM_TS];
    const Expr& rs1_ptr = cols[branch_col::RS1_PTR];
    const Expr& rs2_ptr = cols[branch_col::RS2_PTR];

    memory_.read(builder, reg_as(), rs1_ptr, ctx.reads[0], from_ts, slice(cols, branch_col::RS1_AUX, r),
                 ctx.is_valid);
    memory_.read(builder, reg_as(), rs2_ptr, ctx.reads[1], from_ts + 4, slice(cols, branch_col::RS1_AUX + r, r),
                 ctx.is_valid);

    ProgramBus::lookup(builder, ctx.is_valid, from_pc, ctx.opcode,
                       {rs1_ptr, rs2_ptr, ctx.immediates[0], reg_as(), reg_as()});
    ExecutionBridge::execute(builder, ctx.is_valid, from_pc, from_ts, default_to_pc(ctx, from_pc), from_ts + 8);
}

std::pair<AdapterReads, Rv32BranchReadRecord> Rv32BranchAdapter::preprocess(MemoryController& memory,
                                                                            const Instruction& instruction) const {
    require_register_operand(instruction);
    Rv32BranchReadRecord record;
    record.rs1 = memory.read(address_space::REGISTER, instruction.a.value());
    record.rs2 = memory.read(address_space::REGISTER, instruction.b.value());
    AdapterReads reads{from_block(record.rs1.data), from_block(record.rs2.data)};
    return {std::move(reads), record};
}

std::pair<ExecutionState, Rv32BranchWriteRecord> Rv32BranchAdapter::postprocess(
    MemoryController& memory, const Instruction& /*instruction*/, ExecutionState from_state,
    const AdapterRuntimeContext& ctx, const Rv32BranchReadRecord& /*read_record*/) const {
    return {ExecutionState(next_pc(ctx, from_state.pc), memory.timestamp()), Rv32BranchWriteRecord{}};
}

void Rv32BranchAdapter::generate_trace_row(BFieldElement* row, ExecutionState from_state,
                                           const Rv32BranchReadRecord& read, const Rv32BranchWriteRecord& /*write*/,
                                           const MemoryAuxFiller& aux) const {
    row[branch_col::FROM_PC] = BFieldElement(from_state.pc);
    row[branch_col::FROM_TS] = BFieldElement(from_state.timestamp);
    row[branch_col::RS1_PTR] = BFieldElement(read.rs1.pointer);
    row[branch_col::RS2_PTR] = BFieldElement(read.rs2.pointer);
    aux.fill_read(row + branch_col::RS1_AUX, read.rs1);
    aux.fill_read(row + branch_col::RS1_AUX + aux.read_aux_width(), read.rs2);
}

// ============================================================================
// Rv32CondRdWriteAdapter
// ============================================================================

namespace rdw_col {
constexpr size_t FROM_PC = 0;
constexpr size_t FROM_TS = 1;
constexpr size_t RD_PTR = 2;
constexpr size_t NEEDS_WRITE = 3;
constexpr size_t RD_AUX = 4;
} // namespace rdw_col

void Rv32CondRdWriteAdapterAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                     const AdapterAirContext& ctx) const {
    const Expr& from_pc = cols[rdw_col::FROM_PC];
    const Expr& from_ts = cols[rdw_col::FROM_TS];
    const Expr& rd_ptr = cols[rdw_col::RD_PTR];
    const Expr& needs_write = cols[rdw_col::NEEDS_WRITE];

    builder.assert_bool(needs_write);
    builder.assert_zero(needs_write * (one() - ctx.is_valid));
    memory_.write(builder, reg_as(), rd_ptr, ctx.writes[0], from_ts,
                  slice(cols, rdw_col::RD_AUX, memory_.write_aux_width()), needs_write);

    ProgramBus::lookup(builder, ctx.is_valid, from_pc, ctx.opcode,
                       {rd_ptr, Expr(), ctx.immediates[0], reg_as(), Expr(), needs_write});
    ExecutionBridge::execute(builder, ctx.is_valid, from_pc, from_ts, default_to_pc(ctx, from_pc), from_ts + 4);
}

std::pair<AdapterReads, Rv32CondRdWriteReadRecord> Rv32CondRdWriteAdapter::preprocess(
    MemoryController& /*memory*/, const Instruction& instruction) const {
    require_register_operand(instruction);
    return {AdapterReads{}, Rv32CondRdWriteReadRecord{}};
}

std::pair<ExecutionState, Rv32CondRdWriteWriteRecord> Rv32CondRdWriteAdapter::postprocess(
    MemoryController& memory, const Instruction& instruction, ExecutionState from_state,
    const AdapterRuntimeContext& ctx, const Rv32CondRdWriteReadRecord& /*read_record*/) const {
    Rv32CondRdWriteWriteRecord record;
    record.rd_ptr = instruction.a.value();
    if (!instruction.f.is_zero()) {
        record.rd = memory.write(address_space::REGISTER, record.rd_ptr, to_block(ctx.writes.at(0)));
    } else {
        memory.increment_timestamp();
    }
    return {ExecutionState(next_pc(ctx, from_state.pc), memory.timestamp()), record};
}

void Rv32CondRdWriteAdapter::generate_trace_row(BFieldElement* row, ExecutionState from_state,
                                                const Rv32CondRdWriteReadRecord& /*read*/,
                                                const Rv32CondRdWriteWriteRecord& write,
                                                const MemoryAuxFiller& aux) const {
    row[rdw_col::FROM_PC] = BFieldElement(from_state.pc);
    row[rdw_col::FROM_TS] = BFieldElement(from_state.timestamp);
    row[rdw_col::RD_PTR] = BFieldElement(write.rd_ptr);
    if (write.rd) {
        row[rdw_col::NEEDS_WRITE] = BFieldElement::one();
        aux.fill_write(row + rdw_col::RD_AUX, *write.rd);
    }
}

// ============================================================================
// Rv32JalrAdapter
// ============================================================================

namespace jalr_col {
constexpr size_t FROM_PC = 0;
constexpr size_t FROM_TS = 1;
constexpr size_t RD_PTR = 2;
constexpr size_t RS1_PTR = 3;
constexpr size_t NEEDS_WRITE = 4;
constexpr size_t RS1_AUX = 5;
} // namespace jalr_col

void Rv32JalrAdapterAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                              const AdapterAirContext& ctx) const {
    const Expr& from_pc = cols[jalr_col::FROM_PC];
    const Expr& from_ts = cols[jalr_col::FROM_TS];
    const Expr& rd_ptr = cols[jalr_col::RD_PTR];
    const Expr& rs1_ptr = cols[jalr_col::RS1_PTR];
    const Expr& needs_write = cols[jalr_col::NEEDS_WRITE];
    const size_t r = memory_.read_aux_width();

    builder.assert_bool(needs_write);
    builder.assert_zero(needs_write * (one() - ctx.is_valid));
    memory_.read(builder, reg_as(), rs1_ptr, ctx.reads[0], from_ts, slice(cols, jalr_col::RS1_AUX, r),
                 ctx.is_valid);
    memory_.write(builder, reg_as(), rd_ptr, ctx.writes[0], from_ts + 4,
                  slice(cols, jalr_col::RS1_AUX + r, memory_.write_aux_width()), needs_write);

    ProgramBus::lookup(builder, ctx.is_valid, from_pc, ctx.opcode,
                       {rd_ptr, rs1_ptr, ctx.immediates[0], reg_as(), Expr(), needs_write, ctx.immediates[1]});
    ExecutionBridge::execute(builder, ctx.is_valid, from_pc, from_ts, default_to_pc(ctx, from_pc), from_ts + 8);
}

std::pair<AdapterReads, Rv32JalrReadRecord> Rv32JalrAdapter::preprocess(MemoryController& memory,
                                                                        const Instruction& instruction) const {
    require_register_operand(instruction);
    Rv32JalrReadRecord record;
    record.rs1 = memory.read(address_space::REGISTER, instruction.b.value());
    return {AdapterReads{from_block(record.rs1.data)}, record};
}

std::pair<ExecutionState, Rv32JalrWriteRecord> Rv32JalrAdapter::postprocess(
    MemoryController& memory, const Instruction& instruction, ExecutionState from_state,
    const AdapterRuntimeContext& ctx, const Rv32JalrReadRecord& /*read_record*/) const {
    Rv32JalrWriteRecord record;
    record.rd_ptr = instruction.a.value();
    if (!instruction.f.is_zero()) {
        record.rd = memory.write(address_space::REGISTER, record.rd_ptr, to_block(ctx.writes.at(0)));
    } else {
        memory.increment_timestamp();
    }
    return {ExecutionState(next_pc(ctx, from_state.pc), memory.timestamp()), record};
}

void Rv32JalrAdapter::generate_trace_row(BFieldElement* row, ExecutionState from_state,
                                         const Rv32JalrReadRecord& read, const Rv32JalrWriteRecord& write,
                                         const MemoryAuxFiller& aux) const {
    row[jalr_col::FROM_PC] = BFieldElement(from_state.pc);
    row[jalr_col::FROM_TS] = BFieldElement(from_state.timestamp);
    row[jalr_col::RD_PTR] = BFieldElement(write.rd_ptr);
    row[jalr_col::RS1_PTR] = BFieldElement(read.rs1.pointer);
    aux.fill_read(row + jalr_col::RS1_AUX, read.rs1);
    if (write.rd) {
        row[jalr_col::NEEDS_WRITE] = BFieldElement::one();
        aux.fill_write(row + jalr_col::RS1_AUX + aux.read_aux_width(), *write.rd);
    }
}

// ============================================================================
// Rv32LoadStoreAdapter
// ============================================================================

namespace ls_col {
constexpr size_t FROM_PC = 0;
constexpr size_t FROM_TS = 1;
constexpr size_t RS1_PTR = 2;
constexpr size_t RS1_DATA = 3;
constexpr size_t RD_RS2_PTR = 7;
constexpr size_t IMM = 8;
constexpr size_t IMM_SIGN = 9;
constexpr size_t MEM_PTR_LIMBS = 10;
constexpr size_t MEM_AS = 12;
constexpr size_t NEEDS_WRITE = 13;
constexpr size_t RS1_AUX = 14;
} // namespace ls_col

void Rv32LoadStoreAdapterAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                   const AdapterAirContext& ctx) const {
    const size_t r = memory_.read_aux_width();
    const Expr& from_pc = cols[ls_col::FROM_PC];
    const Expr& from_ts = cols[ls_col::FROM_TS];
    const Expr& rs1_ptr = cols[ls_col::RS1_PTR];
    const std::vector<Expr> rs1_data = slice(cols, ls_col::RS1_DATA, RV32_REGISTER_NUM_LIMBS);
    const Expr& rd_rs2_ptr = cols[ls_col::RD_RS2_PTR];
    const Expr& imm = cols[ls_col::IMM];
    const Expr& imm_sign = cols[ls_col::IMM_SIGN];
    const Expr& ptr_lo = cols[ls_col::MEM_PTR_LIMBS];
    const Expr& ptr_hi = cols[ls_col::MEM_PTR_LIMBS + 1];
    const Expr& mem_as = cols[ls_col::MEM_AS];
    const Expr& needs_write = cols[ls_col::NEEDS_WRITE];
    const Expr& is_valid = ctx.is_valid;
    const Expr& is_load = ctx.immediates[0];
    const Expr& shift = ctx.immediates[1];
    const Expr is_store = is_valid - is_load;

    builder.assert_bool(imm_sign);
    builder.assert_bool(needs_write);
    builder.assert_zero(needs_write * (one() - is_valid));
    builder.when(is_store).assert_one(needs_write);

    memory_.read(builder, reg_as(), rs1_ptr, rs1_data, from_ts, slice(cols, ls_col::RS1_AUX, r), is_valid);

    // ptr = rs1 + sign_extend(imm) mod 2^32, as two 16-bit halves
    const Expr inv_2_16 = Expr(inv_pow2(16));
    const Expr carry_lo = (rs1_data[0] + rs1_data[1] * 256 + imm - ptr_lo) * inv_2_16;
    builder.assert_bool(carry_lo);
    const Expr carry_hi = (rs1_data[2] + rs1_data[3] * 256 + imm_sign * 0xFFFF + carry_lo - ptr_hi) * inv_2_16;
    builder.assert_bool(carry_hi);

    const VariableRangeCheckerBus range_bus{decomp_};
    range_bus.range_check(builder, (ptr_lo - shift) * Expr(inv_pow2(2)), 14, is_valid);
    range_bus.range_check(builder, ptr_hi, pointer_max_bits_ - 16, is_valid);
    const Expr aligned_ptr = ptr_lo - shift + ptr_hi * 65536;

    const Expr read_as = is_load * mem_as + is_store * reg_as();
    const Expr read_ptr = is_load * aligned_ptr + is_store * rd_rs2_ptr;
    memory_.read(builder, read_as, read_ptr, ctx.reads[0], from_ts + 4, slice(cols, ls_col::RS1_AUX + r, r),
                 is_valid);

    const std::vector<Expr> write_aux = slice(cols, ls_col::RS1_AUX + 2 * r, memory_.write_aux_width());
    const Expr write_as = is_load * reg_as() + is_store * mem_as;
    const Expr write_ptr = is_load * rd_rs2_ptr + is_store * aligned_ptr;
    memory_.write(builder, write_as, write_ptr, ctx.writes[0], from_ts + 8, write_aux, needs_write);
    builder.when(needs_write).assert_eqs(MemoryBridge::prev_data(write_aux), ctx.reads[1]);

    ProgramBus::lookup(builder, is_valid, from_pc, ctx.opcode,
                       {rd_rs2_ptr, rs1_ptr, imm, reg_as(), mem_as, needs_write, imm_sign});
    ExecutionBridge::execute(builder, is_valid, from_pc, from_ts, default_to_pc(ctx, from_pc), from_ts + 12);
}

std::pair<AdapterReads, Rv32LoadStoreReadRecord> Rv32LoadStoreAdapter::preprocess(
    MemoryController& memory, const Instruction& instruction) const {
    require_register_operand(instruction);
    const auto local = static_cast<LoadStoreOpcode>(instruction.opcode - opcode_offset::LOADSTORE);
    Rv32LoadStoreReadRecord record;
    record.is_load = local != LoadStoreOpcode::STOREW && local != LoadStoreOpcode::STOREH &&
                     local != LoadStoreOpcode::STOREB;
    record.rd_rs2_ptr = instruction.a.value();
    record.imm = instruction.c.value();
    record.imm_sign = !instruction.g.is_zero();
    record.mem_as = instruction.e.value();
    if (record.mem_as != address_space::HEAP) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             "loads and stores address the heap, got address space " +
                                 std::to_string(record.mem_as));
    }
    if (record.imm > 0xFFFF) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0, "load/store offset exceeds 16 bits");
    }

    record.rs1 = memory.read(address_space::REGISTER, instruction.b.value());
    const uint32_t rs1 = limbs_to_u32(from_block(record.rs1.data));
    const uint32_t offset = record.imm | (record.imm_sign ? 0xFFFF0000u : 0u);
    const uint32_t ptr = rs1 + offset;
    if ((uint64_t{ptr} >> config_.pointer_max_bits) != 0) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "heap address " + std::to_string(ptr) + " out of range");
    }
    record.shift = ptr % BLOCK_SIZE;
    const bool word = local == LoadStoreOpcode::LOADW || local == LoadStoreOpcode::STOREW;
    const bool half = local == LoadStoreOpcode::LOADHU || local == LoadStoreOpcode::LOADH ||
                      local == LoadStoreOpcode::STOREH;
    if ((word && record.shift != 0) || (half && record.shift % 2 != 0)) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "misaligned access at " + std::to_string(ptr));
    }
    record.mem_ptr = ptr;
    const uint32_t aligned = ptr - record.shift;

    std::vector<BFieldElement> prev_data;
    if (record.is_load) {
        record.read = memory.read(record.mem_as, aligned);
        prev_data = from_block(memory.unsafe_read(address_space::REGISTER, record.rd_rs2_ptr));
    } else {
        record.read = memory.read(address_space::REGISTER, record.rd_rs2_ptr);
        prev_data = from_block(memory.unsafe_read(record.mem_as, aligned));
    }
    AdapterReads reads{from_block(record.read.data), std::move(prev_data), {BFieldElement(record.shift)}};
    return {std::move(reads), std::move(record)};
}

std::pair<ExecutionState, Rv32LoadStoreWriteRecord> Rv32LoadStoreAdapter::postprocess(
    MemoryController& memory, const Instruction& instruction, ExecutionState from_state,
    const AdapterRuntimeContext& ctx, const Rv32LoadStoreReadRecord& read_record) const {
    Rv32LoadStoreWriteRecord record;
    const Block data = to_block(ctx.writes.at(0));
    if (read_record.is_load) {
        if (!instruction.f.is_zero()) {
            record.write = memory.write(address_space::REGISTER, read_record.rd_rs2_ptr, data);
        } else {
            memory.increment_timestamp();
        }
    } else {
        record.write = memory.write(read_record.mem_as, read_record.mem_ptr - read_record.shift, data);
    }
    return {ExecutionState(next_pc(ctx, from_state.pc), memory.timestamp()), record};
}

void Rv32LoadStoreAdapter::generate_trace_row(BFieldElement* row, ExecutionState from_state,
                                              const Rv32LoadStoreReadRecord& read,
                                              const Rv32LoadStoreWriteRecord& write,
                                              const MemoryAuxFiller& aux) const {
    const size_t r = aux.read_aux_width();
    row[ls_col::FROM_PC] = BFieldElement(from_state.pc);
    row[ls_col::FROM_TS] = BFieldElement(from_state.timestamp);
    row[ls_col::RS1_PTR] = BFieldElement(read.rs1.pointer);
    for (size_t i = 0; i < RV32_REGISTER_NUM_LIMBS; ++i) {
        row[ls_col::RS1_DATA + i] = read.rs1.data[i];
    }
    row[ls_col::RD_RS2_PTR] = BFieldElement(read.rd_rs2_ptr);
    row[ls_col::IMM] = BFieldElement(read.imm);
    row[ls_col::IMM_SIGN] = bool_field(read.imm_sign);
    const uint32_t ptr_lo = read.mem_ptr & 0xFFFF;
    const uint32_t ptr_hi = read.mem_ptr >> 16;
    row[ls_col::MEM_PTR_LIMBS] = BFieldElement(ptr_lo);
    row[ls_col::MEM_PTR_LIMBS + 1] = BFieldElement(ptr_hi);
    row[ls_col::MEM_AS] = BFieldElement(read.mem_as);

    VariableRangeCheckerChip& range_checker = aux.range_checker();
    range_checker.add_count((ptr_lo - read.shift) / 4, 14);
    range_checker.add_count(ptr_hi, config_.pointer_max_bits - 16);

    aux.fill_read(row + ls_col::RS1_AUX, read.rs1);
    aux.fill_read(row + ls_col::RS1_AUX + r, read.read);
    if (write.write) {
        row[ls_col::NEEDS_WRITE] = BFieldElement::one();
        aux.fill_write(row + ls_col::RS1_AUX + 2 * r, *write.write);
    }
}

} // namespace zkrv
