#include "extensions/keccak_chip.hpp"
#include "primitives/var_range.hpp"
#include "rv32im/adapters.hpp"
#include "rv32im/rv32_common.hpp"
#include "vm/bus.hpp"
#include "vm/opcode.hpp"
#include <algorithm>
#include <string>

namespace zkrv {

namespace {

namespace kf_col {
constexpr size_t IS_ENABLED = KeccakSubAir::WIDTH;
constexpr size_t FROM_PC = IS_ENABLED + 1;
constexpr size_t FROM_TS = IS_ENABLED + 2;
constexpr size_t RS_PTR = IS_ENABLED + 3;
constexpr size_t RS_VAL = IS_ENABLED + 4;
constexpr size_t READ_ENABLE = IS_ENABLED + 8;
constexpr size_t WRITE_ENABLE = IS_ENABLED + 9;
} // namespace kf_col

constexpr size_t ROUNDS = KeccakSubAir::ROUNDS;
constexpr size_t NUM_BLOCKS = KeccakfAir::NUM_BLOCKS;

// Timestamp offsets: register read, 50 block reads, 50 block writes
constexpr uint32_t READS_TS = ACCESS_TIMESTAMP_DELTA;
constexpr uint32_t WRITES_TS = READS_TS + NUM_BLOCKS * ACCESS_TIMESTAMP_DELTA;
constexpr uint32_t TOTAL_TS = WRITES_TS + NUM_BLOCKS * ACCESS_TIMESTAMP_DELTA;

} // namespace

size_t KeccakfAir::width() const {
    return mem_aux_offset() + NUM_BLOCKS * memory_.write_aux_width();
}

void KeccakfAir::eval(AirBuilder& builder) const {
    const std::vector<Expr> cols = builder.main().local_row();
    const std::vector<Expr> next = builder.main().next_row();
    KeccakSubAir::eval(builder, cols, next);

    const Expr& is_enabled = cols[kf_col::IS_ENABLED];
    const Expr& from_pc = cols[kf_col::FROM_PC];
    const Expr& from_ts = cols[kf_col::FROM_TS];
    const Expr& rs_ptr = cols[kf_col::RS_PTR];
    const std::vector<Expr> rs_val = slice(cols, kf_col::RS_VAL, RV32_REGISTER_NUM_LIMBS);
    const Expr& read_enable = cols[kf_col::READ_ENABLE];
    const Expr& write_enable = cols[kf_col::WRITE_ENABLE];
    const std::vector<Expr> bytes = slice(cols, bytes_offset(), keccak::STATE_BYTES);
    const Expr reg_as = Expr::from_u64(address_space::REGISTER);
    const Expr heap_as = Expr::from_u64(address_space::HEAP);

    builder.assert_bool(is_enabled);
    builder.assert_eq(read_enable, is_enabled * cols[KeccakSubAir::STEP_FLAGS]);
    builder.assert_eq(write_enable, is_enabled * cols[KeccakSubAir::STEP_FLAGS + ROUNDS - 1]);

    // Instruction columns are shared by the rows of one permutation
    const Expr not_last_step = Expr::from_u64(1) - cols[KeccakSubAir::STEP_FLAGS + ROUNDS - 1];
    for (size_t c = kf_col::IS_ENABLED; c < kf_col::READ_ENABLE; ++c) {
        builder.when_transition().when(not_last_step).assert_eq(next[c], cols[c]);
    }

    // Bytes against the 16-bit limbs of the sub-air
    const std::vector<Expr> output = KeccakSubAir::output_limbs(cols);
    for (size_t l = 0; l < keccak::NUM_LANES; ++l) {
        for (size_t limb = 0; limb < KeccakSubAir::LIMBS; ++limb) {
            const size_t byte = 8 * l + 2 * limb;
            const Expr packed = bytes[byte] + bytes[byte + 1] * 256;
            builder.when(read_enable)
                .assert_eq(cols[KeccakSubAir::PREIMAGE + l * KeccakSubAir::LIMBS + limb], packed);
            builder.when(write_enable).assert_eq(output[l * KeccakSubAir::LIMBS + limb], packed);
        }
    }
    for (size_t i = 0; i < keccak::STATE_BYTES; i += 2) {
        BitwiseOperationLookupBus::send_range(builder, bytes[i], bytes[i + 1], write_enable);
    }

    // Word aligned heap pointer below 2^pointer_max_bits
    const VariableRangeCheckerBus range_bus{decomp_};
    const Expr ptr_lo = rs_val[0] + rs_val[1] * 256;
    const Expr ptr_hi = rs_val[2] + rs_val[3] * 256;
    range_bus.range_check(builder, ptr_lo * Expr(inv_pow2(2)), 14, read_enable);
    range_bus.range_check(builder, ptr_hi, pointer_max_bits_ - 16, read_enable);
    const Expr ptr = ptr_lo + ptr_hi * 65536;

    const size_t r = memory_.read_aux_width();
    const size_t w = memory_.write_aux_width();
    memory_.read(builder, reg_as, rs_ptr, rs_val, from_ts, slice(cols, rs_aux_offset(), r), read_enable);
    for (size_t i = 0; i < NUM_BLOCKS; ++i) {
        const std::vector<Expr> data = slice(bytes, i * BLOCK_SIZE, BLOCK_SIZE);
        const std::vector<Expr> aux = slice(cols, mem_aux_offset() + i * w, w);
        const Expr pointer = ptr + static_cast<int64_t>(i * BLOCK_SIZE);
        memory_.read(builder, heap_as, pointer, data, from_ts + static_cast<int64_t>(READS_TS + i * BLOCK_SIZE),
                     slice(aux, 0, r), read_enable);
        memory_.write(builder, heap_as, pointer, data, from_ts + static_cast<int64_t>(WRITES_TS + i * BLOCK_SIZE),
                      aux, write_enable);
    }

    ProgramBus::lookup(builder, read_enable, from_pc, Expr::from_u64(opcode(KeccakOpcode::KECCAKF)),
                       {rs_ptr, Expr(), Expr(), reg_as, heap_as});
    ExecutionBridge::execute(builder, read_enable, from_pc, from_ts, from_pc + static_cast<int64_t>(DEFAULT_PC_STEP),
                             from_ts + static_cast<int64_t>(TOTAL_TS));
}

KeccakfChip::KeccakfChip(const MemoryConfig& config, std::shared_ptr<const MemoryAuxFiller> aux,
                         std::shared_ptr<BitwiseOperationLookupChip> bitwise)
    : config_(config),
      air_(std::make_shared<KeccakfAir>(config)),
      aux_(std::move(aux)),
      bitwise_(std::move(bitwise)) {}

ExecutionState KeccakfChip::execute(MemoryController& memory, const Instruction& instruction,
                                    ExecutionState from_state) {
    if (instruction.d.value() != address_space::REGISTER || instruction.e.value() != address_space::HEAP) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0, "KECCAKF expects address spaces (1, 2)");
    }
    const uint32_t ptr_value =
        limbs_to_u32(from_block(memory.unsafe_read(address_space::REGISTER, instruction.a.value())));
    if (ptr_value % BLOCK_SIZE != 0 ||
        uint64_t{ptr_value} + keccak::STATE_BYTES > (uint64_t{1} << config_.pointer_max_bits)) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "keccak state at " + std::to_string(ptr_value) + " is not an aligned heap range");
    }

    Record record;
    record.from_state = from_state;
    record.rs = memory.read(address_space::REGISTER, instruction.a.value());

    std::array<uint8_t, keccak::STATE_BYTES> bytes{};
    for (size_t i = 0; i < NUM_BLOCKS; ++i) {
        record.reads[i] = memory.read(address_space::HEAP, ptr_value + static_cast<uint32_t>(i * BLOCK_SIZE));
        for (size_t j = 0; j < BLOCK_SIZE; ++j) {
            const uint32_t cell = record.reads[i].data[j].value();
            if (cell > RV32_CELL_MAX) {
                throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                                     "keccak state cell holds " + std::to_string(cell) + ", not a byte");
            }
            bytes[i * BLOCK_SIZE + j] = static_cast<uint8_t>(cell);
        }
    }
    record.input = keccak::state_from_bytes(bytes);

    keccak::State state = record.input;
    keccak::keccak_f(state);
    const std::array<uint8_t, keccak::STATE_BYTES> out = keccak::state_to_bytes(state);
    for (size_t i = 0; i < NUM_BLOCKS; ++i) {
        Block data;
        for (size_t j = 0; j < BLOCK_SIZE; ++j) {
            data[j] = BFieldElement(out[i * BLOCK_SIZE + j]);
        }
        record.writes[i] = memory.write(address_space::HEAP, ptr_value + static_cast<uint32_t>(i * BLOCK_SIZE), data);
    }
    for (size_t i = 0; i < keccak::STATE_BYTES; i += 2) {
        bitwise_->request_range(out[i], out[i + 1]);
    }

    records_.push_back(record);
    return ExecutionState(from_state.pc + DEFAULT_PC_STEP, memory.timestamp());
}

AirProofInput KeccakfChip::generate_air_proof_input() {
    const size_t width = air_->width();
    const size_t height = padded_height(records_.size() * ROUNDS);
    RowMajorMatrix<BFieldElement> trace(width, height);

    // Rows after the last record run permutations of the zero state
    std::vector<BFieldElement> padding(ROUNDS * width);
    {
        std::vector<BFieldElement*> rows(ROUNDS);
        for (size_t r = 0; r < ROUNDS; ++r) {
            rows[r] = padding.data() + r * width;
        }
        KeccakSubAir::generate_rows(keccak::State{}, rows.data());
    }
    for (size_t i = records_.size() * ROUNDS; i < height; ++i) {
        std::copy_n(padding.data() + (i % ROUNDS) * width, width, trace.row_mut(i));
    }

    const size_t w = aux_->write_aux_width();
    const size_t bytes_offset = air_->bytes_offset();
    const size_t mem_aux_offset = air_->mem_aux_offset();

#pragma omp parallel for schedule(static)
    for (size_t i = 0; i < records_.size(); ++i) {
        const Record& record = records_[i];
        BFieldElement* rows[ROUNDS];
        for (size_t r = 0; r < ROUNDS; ++r) {
            rows[r] = trace.row_mut(i * ROUNDS + r);
            BFieldElement* row = rows[r];
            row[kf_col::IS_ENABLED] = BFieldElement::one();
            row[kf_col::FROM_PC] = BFieldElement(record.from_state.pc);
            row[kf_col::FROM_TS] = BFieldElement(record.from_state.timestamp);
            row[kf_col::RS_PTR] = BFieldElement(record.rs.pointer);
            for (size_t j = 0; j < RV32_REGISTER_NUM_LIMBS; ++j) {
                row[kf_col::RS_VAL + j] = record.rs.data[j];
            }
        }
        KeccakSubAir::generate_rows(record.input, rows);

        BFieldElement* first = rows[0];
        first[kf_col::READ_ENABLE] = BFieldElement::one();
        aux_->fill_read(first + air_->rs_aux_offset(), record.rs);
        for (size_t b = 0; b < NUM_BLOCKS; ++b) {
            for (size_t j = 0; j < BLOCK_SIZE; ++j) {
                first[bytes_offset + b * BLOCK_SIZE + j] = record.reads[b].data[j];
            }
            aux_->fill_read(first + mem_aux_offset + b * w, record.reads[b]);
        }

        BFieldElement* last = rows[ROUNDS - 1];
        last[kf_col::WRITE_ENABLE] = BFieldElement::one();
        for (size_t b = 0; b < NUM_BLOCKS; ++b) {
            for (size_t j = 0; j < BLOCK_SIZE; ++j) {
                last[bytes_offset + b * BLOCK_SIZE + j] = record.writes[b].data[j];
            }
            aux_->fill_write(last + mem_aux_offset + b * w, record.writes[b]);
        }

        const uint32_t ptr = record.reads[0].pointer;
        aux_->range_checker().add_count((ptr & 0xFFFF) >> 2, 14);
        aux_->range_checker().add_count(ptr >> 16, config_.pointer_max_bits - 16);
    }
    records_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

} // namespace zkrv
