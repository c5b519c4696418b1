#include "rv32im/io_chips.hpp"
#include "primitives/var_range.hpp"
#include "rv32im/adapters.hpp"
#include "vm/bus.hpp"
#include "vm/opcode.hpp"
#include <string>

namespace zkrv {

namespace {

namespace hs_col {
constexpr size_t FROM_PC = 0;
constexpr size_t FROM_TS = 1;
constexpr size_t RS_PTR = 2;
constexpr size_t RS_DATA = 3;
constexpr size_t DATA = 7;
constexpr size_t IS_VALID = 11;
constexpr size_t RS_AUX = 12;
} // namespace hs_col

namespace rv_col {
constexpr size_t FROM_PC = 0;
constexpr size_t FROM_TS = 1;
constexpr size_t RS_PTR = 2;
constexpr size_t DATA = 3;
constexpr size_t OFFSET = 7;
constexpr size_t IS_VALID = 8;
constexpr size_t RS_AUX = 9;
} // namespace rv_col

void require_address_spaces(const Instruction& instruction, uint32_t e) {
    if (instruction.d.value() != address_space::REGISTER || instruction.e.value() != e) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             "expected address spaces (1, " + std::to_string(e) + "), got (" +
                                 std::to_string(instruction.d.value()) + ", " + std::to_string(instruction.e.value()) +
                                 ")");
    }
}

} // namespace

// ============================================================================
// HintStore
// ============================================================================

void Rv32HintStoreAir::eval(AirBuilder& builder) const {
    const std::vector<Expr> cols = builder.main().local_row();
    const Expr& from_pc = cols[hs_col::FROM_PC];
    const Expr& from_ts = cols[hs_col::FROM_TS];
    const Expr& rs_ptr = cols[hs_col::RS_PTR];
    const std::vector<Expr> rs_data = slice(cols, hs_col::RS_DATA, RV32_REGISTER_NUM_LIMBS);
    const std::vector<Expr> data = slice(cols, hs_col::DATA, RV32_REGISTER_NUM_LIMBS);
    const Expr& is_valid = cols[hs_col::IS_VALID];
    const Expr heap_as = Expr::from_u64(address_space::HEAP);
    const Expr reg_as = Expr::from_u64(address_space::REGISTER);

    builder.assert_bool(is_valid);

    // Word aligned pointer below 2^pointer_max_bits
    const VariableRangeCheckerBus range_bus{decomp_};
    const Expr ptr_lo = rs_data[0] + rs_data[1] * 256;
    const Expr ptr_hi = rs_data[2] + rs_data[3] * 256;
    range_bus.range_check(builder, ptr_lo * Expr(inv_pow2(2)), 14, is_valid);
    range_bus.range_check(builder, ptr_hi, pointer_max_bits_ - 16, is_valid);

    BitwiseOperationLookupBus::send_range(builder, data[0], data[1], is_valid);
    BitwiseOperationLookupBus::send_range(builder, data[2], data[3], is_valid);

    const size_t r = memory_.read_aux_width();
    memory_.read(builder, reg_as, rs_ptr, rs_data, from_ts, slice(cols, hs_col::RS_AUX, r), is_valid);
    memory_.write(builder, heap_as, ptr_lo + ptr_hi * 65536, data, from_ts + 4,
                  slice(cols, hs_col::RS_AUX + r, memory_.write_aux_width()), is_valid);

    ProgramBus::lookup(builder, is_valid, from_pc, Expr::from_u64(opcode(HintStoreOpcode::HINT_STOREW)),
                       {Expr(), rs_ptr, Expr(), reg_as, heap_as});
    ExecutionBridge::execute(builder, is_valid, from_pc, from_ts, from_pc + static_cast<int64_t>(DEFAULT_PC_STEP),
                             from_ts + 8);
}

Rv32HintStoreChip::Rv32HintStoreChip(const MemoryConfig& config, std::shared_ptr<const MemoryAuxFiller> aux,
                                     std::shared_ptr<BitwiseOperationLookupChip> bitwise,
                                     std::shared_ptr<Streams> streams)
    : config_(config),
      air_(std::make_shared<Rv32HintStoreAir>(config)),
      aux_(std::move(aux)),
      bitwise_(std::move(bitwise)),
      streams_(std::move(streams)) {}

ExecutionState Rv32HintStoreChip::execute(MemoryController& memory, const Instruction& instruction,
                                          ExecutionState from_state) {
    require_address_spaces(instruction, address_space::HEAP);
    const uint32_t ptr_value = limbs_to_u32(from_block(memory.unsafe_read(address_space::REGISTER,
                                                                          instruction.b.value())));
    if (ptr_value % BLOCK_SIZE != 0 || (uint64_t{ptr_value} >> config_.pointer_max_bits) != 0) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "hint destination " + std::to_string(ptr_value) + " is not an aligned heap address");
    }
    if (streams_->hint_stream.size() < RV32_REGISTER_NUM_LIMBS) {
        throw ExecutionError(ExecutionErrorKind::InputExhausted, 0,
                             "hint stream holds " + std::to_string(streams_->hint_stream.size()) + " bytes");
    }
    Block data;
    for (size_t i = 0; i < RV32_REGISTER_NUM_LIMBS; ++i) {
        data[i] = streams_->hint_stream.front();
        if (data[i].value() > RV32_CELL_MAX) {
            throw ExecutionError(ExecutionErrorKind::HintOutOfBounds, 0,
                                 "hint value " + std::to_string(data[i].value()) + " is not a byte");
        }
        streams_->hint_stream.pop_front();
    }
    bitwise_->request_range(data[0].value(), data[1].value());
    bitwise_->request_range(data[2].value(), data[3].value());

    Record record;
    record.from_state = from_state;
    record.rs = memory.read(address_space::REGISTER, instruction.b.value());
    record.write = memory.write(address_space::HEAP, ptr_value, data);
    records_.push_back(record);
    return ExecutionState(from_state.pc + DEFAULT_PC_STEP, memory.timestamp());
}

AirProofInput Rv32HintStoreChip::generate_air_proof_input() {
    RowMajorMatrix<BFieldElement> trace(air_->width(), padded_height(records_.size()));
    const size_t r = aux_->read_aux_width();

#pragma omp parallel for schedule(static)
    for (size_t i = 0; i < records_.size(); ++i) {
        const Record& record = records_[i];
        BFieldElement* row = trace.row_mut(i);
        row[hs_col::FROM_PC] = BFieldElement(record.from_state.pc);
        row[hs_col::FROM_TS] = BFieldElement(record.from_state.timestamp);
        row[hs_col::RS_PTR] = BFieldElement(record.rs.pointer);
        for (size_t j = 0; j < RV32_REGISTER_NUM_LIMBS; ++j) {
            row[hs_col::RS_DATA + j] = record.rs.data[j];
            row[hs_col::DATA + j] = record.write.data[j];
        }
        row[hs_col::IS_VALID] = BFieldElement::one();

        const uint32_t ptr = record.write.pointer;
        aux_->range_checker().add_count((ptr & 0xFFFF) >> 2, 14);
        aux_->range_checker().add_count(ptr >> 16, config_.pointer_max_bits - 16);
        aux_->fill_read(row + hs_col::RS_AUX, record.rs);
        aux_->fill_write(row + hs_col::RS_AUX + r, record.write);
    }
    records_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

// ============================================================================
// Reveal
// ============================================================================

void Rv32RevealAir::eval(AirBuilder& builder) const {
    const std::vector<Expr> cols = builder.main().local_row();
    const Expr& from_pc = cols[rv_col::FROM_PC];
    const Expr& from_ts = cols[rv_col::FROM_TS];
    const Expr& rs_ptr = cols[rv_col::RS_PTR];
    const std::vector<Expr> data = slice(cols, rv_col::DATA, RV32_REGISTER_NUM_LIMBS);
    const Expr& offset = cols[rv_col::OFFSET];
    const Expr& is_valid = cols[rv_col::IS_VALID];
    const Expr reg_as = Expr::from_u64(address_space::REGISTER);

    builder.assert_bool(is_valid);
    memory_.read(builder, reg_as, rs_ptr, data, from_ts, slice(cols, rv_col::RS_AUX, memory_.read_aux_width()),
                 is_valid);

    std::vector<Expr> fields{offset * Expr(inv_pow2(2))};
    fields.insert(fields.end(), data.begin(), data.end());
    builder.push_send(bus::PUBLIC_VALUES, std::move(fields), is_valid);

    ProgramBus::lookup(builder, is_valid, from_pc, Expr::from_u64(opcode(RevealOpcode::REVEAL)),
                       {rs_ptr, Expr(), offset, reg_as, Expr::from_u64(address_space::PUBLIC_VALUES)});
    ExecutionBridge::execute(builder, is_valid, from_pc, from_ts, from_pc + static_cast<int64_t>(DEFAULT_PC_STEP),
                             from_ts + 4);
}

Rv32RevealChip::Rv32RevealChip(const MemoryConfig& config, std::shared_ptr<const MemoryAuxFiller> aux,
                               std::shared_ptr<PublicValuesChip> public_values)
    : air_(std::make_shared<Rv32RevealAir>(config)), aux_(std::move(aux)), public_values_(std::move(public_values)) {}

ExecutionState Rv32RevealChip::execute(MemoryController& memory, const Instruction& instruction,
                                       ExecutionState from_state) {
    require_address_spaces(instruction, address_space::PUBLIC_VALUES);
    Record record;
    record.from_state = from_state;
    record.offset = instruction.c.value();
    const Block data = memory.unsafe_read(address_space::REGISTER, instruction.a.value());
    public_values_->reveal(record.offset, from_block(data));
    record.rs = memory.read(address_space::REGISTER, instruction.a.value());
    records_.push_back(record);
    return ExecutionState(from_state.pc + DEFAULT_PC_STEP, memory.timestamp());
}

AirProofInput Rv32RevealChip::generate_air_proof_input() {
    RowMajorMatrix<BFieldElement> trace(air_->width(), padded_height(records_.size()));

#pragma omp parallel for schedule(static)
    for (size_t i = 0; i < records_.size(); ++i) {
        const Record& record = records_[i];
        BFieldElement* row = trace.row_mut(i);
        row[rv_col::FROM_PC] = BFieldElement(record.from_state.pc);
        row[rv_col::FROM_TS] = BFieldElement(record.from_state.timestamp);
        row[rv_col::RS_PTR] = BFieldElement(record.rs.pointer);
        for (size_t j = 0; j < RV32_REGISTER_NUM_LIMBS; ++j) {
            row[rv_col::DATA + j] = record.rs.data[j];
        }
        row[rv_col::OFFSET] = BFieldElement(record.offset);
        row[rv_col::IS_VALID] = BFieldElement::one();
        aux_->fill_read(row + rv_col::RS_AUX, record.rs);
    }
    records_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

} // namespace zkrv
