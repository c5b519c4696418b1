#include "extensions/native_poseidon2.hpp"
#include "primitives/var_range.hpp"
#include "rv32im/adapters.hpp"
#include "rv32im/rv32_common.hpp"
#include "vm/bus.hpp"
#include "vm/opcode.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace zkrv {

namespace {

namespace np_col {
constexpr size_t FROM_PC = 0;
constexpr size_t FROM_TS = 1;
constexpr size_t IS_PERM = 2;
constexpr size_t IS_COMP = 3;
constexpr size_t REG_PTR = 4;
constexpr size_t REG_VAL = 7;
constexpr size_t RHS_PTR = 19;
constexpr size_t INPUT = 20;
constexpr size_t OUTPUT = INPUT + Poseidon2::WIDTH;
constexpr size_t AUX = OUTPUT + Poseidon2::WIDTH;
} // namespace np_col

constexpr size_t NUM_REGS = 3;
constexpr size_t STATE_BLOCKS = Poseidon2::WIDTH / BLOCK_SIZE;
constexpr size_t DIGEST_BLOCKS = Digest::LEN / BLOCK_SIZE;

uint32_t native_pointer(const MemoryController& memory, uint32_t reg, size_t cells,
                        const MemoryConfig& config) {
    const uint32_t ptr = limbs_to_u32(from_block(memory.unsafe_read(address_space::REGISTER, reg)));
    if (ptr % BLOCK_SIZE != 0 || uint64_t{ptr} + cells > (uint64_t{1} << config.pointer_max_bits)) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "native pointer " + std::to_string(ptr) + " in register " + std::to_string(reg) +
                                 " is not an aligned range of " + std::to_string(cells) + " cells");
    }
    return ptr;
}

} // namespace

size_t NativePoseidon2Air::width() const {
    return np_col::AUX + (NUM_REGS + STATE_BLOCKS) * memory_.read_aux_width() +
           STATE_BLOCKS * memory_.write_aux_width();
}

void NativePoseidon2Air::eval(AirBuilder& builder) const {
    const std::vector<Expr> cols = builder.main().local_row();
    const Expr& from_pc = cols[np_col::FROM_PC];
    const Expr& from_ts = cols[np_col::FROM_TS];
    const Expr& is_perm = cols[np_col::IS_PERM];
    const Expr& is_comp = cols[np_col::IS_COMP];
    const Expr& rhs_ptr = cols[np_col::RHS_PTR];
    const std::vector<Expr> input = slice(cols, np_col::INPUT, Poseidon2::WIDTH);
    const std::vector<Expr> output = slice(cols, np_col::OUTPUT, Poseidon2::WIDTH);
    const Expr is_valid = is_perm + is_comp;
    const Expr reg_as = Expr::from_u64(address_space::REGISTER);
    const Expr native_as = Expr::from_u64(address_space::NATIVE);

    builder.assert_bool(is_perm);
    builder.assert_bool(is_comp);
    builder.assert_bool(is_valid);

    const size_t r = memory_.read_aux_width();
    const size_t w = memory_.write_aux_width();
    const VariableRangeCheckerBus range_bus{decomp_};
    std::vector<Expr> ptrs;
    for (size_t k = 0; k < NUM_REGS; ++k) {
        const std::vector<Expr> val = slice(cols, np_col::REG_VAL + k * RV32_REGISTER_NUM_LIMBS,
                                            RV32_REGISTER_NUM_LIMBS);
        const Expr count = k == 2 ? is_comp : is_valid;
        const Expr ptr_lo = val[0] + val[1] * 256;
        const Expr ptr_hi = val[2] + val[3] * 256;
        range_bus.range_check(builder, ptr_lo * Expr(inv_pow2(2)), 14, count);
        range_bus.range_check(builder, ptr_hi, pointer_max_bits_ - 16, count);
        ptrs.push_back(ptr_lo + ptr_hi * 65536);

        memory_.read(builder, reg_as, cols[np_col::REG_PTR + k], val, from_ts + static_cast<int64_t>(4 * k),
                     slice(cols, np_col::AUX + k * r, r), count);
    }
    const Expr& dst_ptr = ptrs[0];
    const Expr& lhs_ptr = ptrs[1];

    // Right half of the input: [b] + 8 for PERM_POS2, [c] for COMP_POS2
    builder.assert_eq(rhs_ptr, is_perm * (lhs_ptr + 8) + is_comp * ptrs[2]);

    const Expr base_ts = from_ts + 8 + is_comp * 4;
    const size_t read_aux = np_col::AUX + NUM_REGS * r;
    for (size_t k = 0; k < STATE_BLOCKS; ++k) {
        const Expr pointer = k < DIGEST_BLOCKS ? lhs_ptr + static_cast<int64_t>(k * BLOCK_SIZE)
                                               : rhs_ptr + static_cast<int64_t>((k - DIGEST_BLOCKS) * BLOCK_SIZE);
        memory_.read(builder, native_as, pointer, slice(input, k * BLOCK_SIZE, BLOCK_SIZE),
                     base_ts + static_cast<int64_t>(4 * k), slice(cols, read_aux + k * r, r), is_valid);
    }
    const Expr write_ts = base_ts + static_cast<int64_t>(4 * STATE_BLOCKS);
    const size_t write_aux = read_aux + STATE_BLOCKS * r;
    for (size_t k = 0; k < STATE_BLOCKS; ++k) {
        memory_.write(builder, native_as, dst_ptr + static_cast<int64_t>(k * BLOCK_SIZE),
                      slice(output, k * BLOCK_SIZE, BLOCK_SIZE), write_ts + static_cast<int64_t>(4 * k),
                      slice(cols, write_aux + k * w, w), k < DIGEST_BLOCKS ? is_valid : is_perm);
    }

    std::vector<Expr> permute_fields = input;
    permute_fields.insert(permute_fields.end(), output.begin(), output.end());
    builder.push_send(bus::POSEIDON2_PERMUTE, std::move(permute_fields), is_perm);

    std::vector<Expr> compress_fields = input;
    compress_fields.insert(compress_fields.end(), output.begin(), output.begin() + Digest::LEN);
    builder.push_send(bus::POSEIDON2_DIRECT, std::move(compress_fields), is_comp);

    ProgramBus::lookup(builder, is_valid, from_pc, Expr::from_u64(opcode(Poseidon2Opcode::PERM_POS2)) + is_comp,
                       {cols[np_col::REG_PTR], cols[np_col::REG_PTR + 1], cols[np_col::REG_PTR + 2], reg_as,
                        native_as});
    ExecutionBridge::execute(builder, is_valid, from_pc, from_ts, from_pc + static_cast<int64_t>(DEFAULT_PC_STEP),
                             from_ts + 40 - is_comp * 4);
}

NativePoseidon2Chip::NativePoseidon2Chip(const MemoryConfig& config, std::shared_ptr<const MemoryAuxFiller> aux,
                                         std::shared_ptr<Poseidon2PeripheryChip> poseidon2)
    : config_(config),
      air_(std::make_shared<NativePoseidon2Air>(config)),
      aux_(std::move(aux)),
      poseidon2_(std::move(poseidon2)) {
    if (!poseidon2_) {
        throw std::invalid_argument("native Poseidon2 chip needs the Poseidon2 periphery chip");
    }
}

std::string NativePoseidon2Chip::get_opcode_name(uint32_t opcode_value) const {
    return opcode_value == opcode(Poseidon2Opcode::COMP_POS2) ? "COMP_POS2" : "PERM_POS2";
}

ExecutionState NativePoseidon2Chip::execute(MemoryController& memory, const Instruction& instruction,
                                            ExecutionState from_state) {
    if (instruction.d.value() != address_space::REGISTER || instruction.e.value() != address_space::NATIVE) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             get_opcode_name(instruction.opcode) + " expects address spaces (1, 4)");
    }
    Record record;
    record.from_state = from_state;
    record.is_comp = instruction.opcode == opcode(Poseidon2Opcode::COMP_POS2);
    record.c = instruction.c.value();

    const size_t out_cells = record.is_comp ? Digest::LEN : Poseidon2::WIDTH;
    const uint32_t dst = native_pointer(memory, instruction.a.value(), out_cells, config_);
    const uint32_t lhs = native_pointer(memory, instruction.b.value(), record.is_comp ? Digest::LEN : Poseidon2::WIDTH,
                                        config_);
    const uint32_t rhs = record.is_comp ? native_pointer(memory, instruction.c.value(), Digest::LEN, config_)
                                        : lhs + static_cast<uint32_t>(Digest::LEN);

    record.regs[0] = memory.read(address_space::REGISTER, instruction.a.value());
    record.regs[1] = memory.read(address_space::REGISTER, instruction.b.value());
    if (record.is_comp) {
        record.regs[2] = memory.read(address_space::REGISTER, instruction.c.value());
    }

    Poseidon2::State input;
    for (size_t k = 0; k < STATE_BLOCKS; ++k) {
        const uint32_t pointer = k < DIGEST_BLOCKS ? lhs + static_cast<uint32_t>(k * BLOCK_SIZE)
                                                   : rhs + static_cast<uint32_t>((k - DIGEST_BLOCKS) * BLOCK_SIZE);
        record.reads[k] = memory.read(address_space::NATIVE, pointer);
        std::copy(record.reads[k].data.begin(), record.reads[k].data.end(), input.begin() + k * BLOCK_SIZE);
    }

    if (record.is_comp) {
        Digest left;
        Digest right;
        for (size_t i = 0; i < Digest::LEN; ++i) {
            left[i] = input[i];
            right[i] = input[Digest::LEN + i];
        }
        const Digest digest = poseidon2_->compress(left, right);
        for (size_t i = 0; i < Digest::LEN; ++i) {
            record.output[i] = digest[i];
        }
    } else {
        record.output = poseidon2_->permute(input);
    }

    for (size_t k = 0; k < out_cells / BLOCK_SIZE; ++k) {
        Block data;
        std::copy(record.output.begin() + k * BLOCK_SIZE, record.output.begin() + (k + 1) * BLOCK_SIZE,
                  data.begin());
        record.writes.push_back(memory.write(address_space::NATIVE, dst + static_cast<uint32_t>(k * BLOCK_SIZE), data));
    }

    records_.push_back(std::move(record));
    return ExecutionState(from_state.pc + DEFAULT_PC_STEP, memory.timestamp());
}

AirProofInput NativePoseidon2Chip::generate_air_proof_input() {
    RowMajorMatrix<BFieldElement> trace(air_->width(), padded_height(records_.size()));
    const size_t r = aux_->read_aux_width();
    const size_t w = aux_->write_aux_width();
    const size_t read_aux = np_col::AUX + NUM_REGS * r;
    const size_t write_aux = read_aux + STATE_BLOCKS * r;

#pragma omp parallel for schedule(static)
    for (size_t i = 0; i < records_.size(); ++i) {
        const Record& record = records_[i];
        BFieldElement* row = trace.row_mut(i);
        row[np_col::FROM_PC] = BFieldElement(record.from_state.pc);
        row[np_col::FROM_TS] = BFieldElement(record.from_state.timestamp);
        row[record.is_comp ? np_col::IS_COMP : np_col::IS_PERM] = BFieldElement::one();

        const size_t num_regs = record.is_comp ? NUM_REGS : NUM_REGS - 1;
        for (size_t k = 0; k < num_regs; ++k) {
            const MemoryReadRecord& reg = record.regs[k];
            row[np_col::REG_PTR + k] = BFieldElement(reg.pointer);
            for (size_t j = 0; j < RV32_REGISTER_NUM_LIMBS; ++j) {
                row[np_col::REG_VAL + k * RV32_REGISTER_NUM_LIMBS + j] = reg.data[j];
            }
            const uint32_t ptr = limbs_to_u32(from_block(reg.data));
            aux_->range_checker().add_count((ptr & 0xFFFF) >> 2, 14);
            aux_->range_checker().add_count(ptr >> 16, config_.pointer_max_bits - 16);
            aux_->fill_read(row + np_col::AUX + k * r, reg);
        }
        if (!record.is_comp) {
            row[np_col::REG_PTR + 2] = BFieldElement(record.c);
        }
        row[np_col::RHS_PTR] = BFieldElement(record.reads[DIGEST_BLOCKS].pointer);

        for (size_t k = 0; k < STATE_BLOCKS; ++k) {
            for (size_t j = 0; j < BLOCK_SIZE; ++j) {
                row[np_col::INPUT + k * BLOCK_SIZE + j] = record.reads[k].data[j];
            }
            aux_->fill_read(row + read_aux + k * r, record.reads[k]);
        }
        for (size_t j = 0; j < Poseidon2::WIDTH; ++j) {
            row[np_col::OUTPUT + j] = record.output[j];
        }
        for (size_t k = 0; k < record.writes.size(); ++k) {
            aux_->fill_write(row + write_aux + k * w, record.writes[k]);
        }
    }
    records_.clear();

    AirProofInput input;
    input.common_main = std::move(trace);
    return input;
}

} // namespace zkrv
