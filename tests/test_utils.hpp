#pragma once

#include "air/debug_checker.hpp"
#include "memory/memory_layout.hpp"
#include "rv32im/rv32_common.hpp"
#include "vm/chip_complex.hpp"
#include "vm/instruction.hpp"
#include "vm/opcode.hpp"
#include "vm/program.hpp"
#include "vm/segment.hpp"
#include "system/program_chip.hpp"
#include <memory>
#include <cstdint>
#include <vector>

namespace zkrv {
namespace test {

/**
 * Instruction builders for hand-written test programs.
 * Registers are given by index; immediates follow the chip encodings.
 */

inline int64_t reg(uint32_t r) { return register_pointer(r); }

inline Instruction alu(BaseAluOpcode op, uint32_t rd, uint32_t rs1, uint32_t rs2) {
    return Instruction::from_isize(opcode(op), reg(rd), reg(rs1), reg(rs2), address_space::REGISTER,
                                   address_space::REGISTER);
}

// 24-bit sign-extended immediate
inline Instruction alu_imm(BaseAluOpcode op, uint32_t rd, uint32_t rs1, int32_t imm) {
    return Instruction::from_isize(opcode(op), reg(rd), reg(rs1), static_cast<uint32_t>(imm) & 0xFFFFFF,
                                   address_space::REGISTER, address_space::IMMEDIATE);
}

inline Instruction add(uint32_t rd, uint32_t rs1, uint32_t rs2) { return alu(BaseAluOpcode::ADD, rd, rs1, rs2); }
inline Instruction sub(uint32_t rd, uint32_t rs1, uint32_t rs2) { return alu(BaseAluOpcode::SUB, rd, rs1, rs2); }
inline Instruction addi(uint32_t rd, uint32_t rs1, int32_t imm) {
    return alu_imm(BaseAluOpcode::ADD, rd, rs1, imm);
}

inline Instruction shift_imm(ShiftOpcode op, uint32_t rd, uint32_t rs1, uint32_t shamt) {
    return Instruction::from_isize(opcode(op), reg(rd), reg(rs1), shamt, address_space::REGISTER,
                                   address_space::IMMEDIATE);
}

inline Instruction sltu(uint32_t rd, uint32_t rs1, uint32_t rs2) {
    return Instruction::from_isize(opcode(LessThanOpcode::SLTU), reg(rd), reg(rs1), reg(rs2),
                                   address_space::REGISTER, address_space::REGISTER);
}

template <typename Op>
Instruction rtype(Op op, uint32_t rd, uint32_t rs1, uint32_t rs2) {
    return Instruction::from_isize(opcode(op), reg(rd), reg(rs1), reg(rs2), address_space::REGISTER,
                                   address_space::REGISTER);
}

inline Instruction lui(uint32_t rd, uint32_t imm20) {
    return Instruction::from_isize(opcode(JalLuiOpcode::LUI), reg(rd), 0, imm20, address_space::REGISTER, 0,
                                   rd != 0 ? 1 : 0);
}

inline Instruction jal(uint32_t rd, int32_t offset) {
    return Instruction::from_isize(opcode(JalLuiOpcode::JAL), reg(rd), 0, offset, address_space::REGISTER, 0,
                                   rd != 0 ? 1 : 0);
}

inline Instruction jalr(uint32_t rd, uint32_t rs1, int32_t imm) {
    return Instruction::from_isize(opcode(JalrOpcode::JALR), reg(rd), reg(rs1), static_cast<uint32_t>(imm) & 0xFFFF,
                                   address_space::REGISTER, 0, rd != 0 ? 1 : 0, imm < 0 ? 1 : 0);
}

inline Instruction auipc(uint32_t rd, uint32_t imm20) {
    return Instruction::from_isize(opcode(AuipcOpcode::AUIPC), reg(rd), 0, imm20, address_space::REGISTER, 0,
                                   rd != 0 ? 1 : 0);
}

inline Instruction branch(BranchEqualOpcode op, uint32_t rs1, uint32_t rs2, int32_t offset) {
    return Instruction::from_isize(opcode(op), reg(rs1), reg(rs2), offset, address_space::REGISTER,
                                   address_space::REGISTER);
}

inline Instruction branch(BranchLessThanOpcode op, uint32_t rs1, uint32_t rs2, int32_t offset) {
    return Instruction::from_isize(opcode(op), reg(rs1), reg(rs2), offset, address_space::REGISTER,
                                   address_space::REGISTER);
}

inline Instruction loadstore(LoadStoreOpcode op, uint32_t rd_rs2, uint32_t rs1, int32_t imm) {
    const bool is_store =
        op == LoadStoreOpcode::STOREW || op == LoadStoreOpcode::STOREH || op == LoadStoreOpcode::STOREB;
    return Instruction::from_isize(opcode(op), reg(rd_rs2), reg(rs1), static_cast<uint32_t>(imm) & 0xFFFF,
                                   address_space::REGISTER, address_space::HEAP, (is_store || rd_rs2 != 0) ? 1 : 0,
                                   imm < 0 ? 1 : 0);
}

inline Instruction lw(uint32_t rd, uint32_t rs1, int32_t imm) { return loadstore(LoadStoreOpcode::LOADW, rd, rs1, imm); }
inline Instruction sw(uint32_t rs2, uint32_t rs1, int32_t imm) {
    return loadstore(LoadStoreOpcode::STOREW, rs2, rs1, imm);
}

inline Instruction reveal(uint32_t rs, uint32_t byte_offset) {
    return Instruction::from_isize(opcode(RevealOpcode::REVEAL), reg(rs), 0, byte_offset, address_space::REGISTER,
                                   address_space::PUBLIC_VALUES);
}

inline Instruction hint_storew(uint32_t rs) {
    return Instruction::from_isize(opcode(HintStoreOpcode::HINT_STOREW), 0, reg(rs), 0, address_space::REGISTER,
                                   address_space::HEAP);
}

inline Instruction phantom(PhantomDiscriminant discriminant, int64_t a = 0, int64_t b = 0) {
    return Instruction::from_isize(opcode(SystemOpcode::PHANTOM), a, b, static_cast<uint16_t>(discriminant), 0, 0);
}

inline Instruction terminate(uint32_t exit_code = 0) {
    return Instruction::from_isize(opcode(SystemOpcode::TERMINATE), 0, 0, exit_code, 0, 0);
}

// Heap-operand instruction: rd, rs1, rs2 hold heap addresses
inline Instruction heap_op(uint32_t global_opcode, uint32_t rd, uint32_t rs1, uint32_t rs2) {
    return Instruction::from_isize(global_opcode, reg(rd), reg(rs1), reg(rs2), address_space::REGISTER,
                                   address_space::HEAP);
}

// Sets register rd to an arbitrary 32-bit value
inline std::vector<Instruction> li(uint32_t rd, uint32_t value) {
    const uint32_t lo = value & 0xFFF;
    const uint32_t hi = (value >> 12) + (lo >= 0x800 ? 1 : 0);
    const int32_t lo_signed = lo >= 0x800 ? static_cast<int32_t>(lo) - 0x1000 : static_cast<int32_t>(lo);
    if ((hi & 0xFFFFF) == 0) {
        return {addi(rd, 0, lo_signed)};
    }
    return {lui(rd, hi & 0xFFFFF), addi(rd, rd, lo_signed)};
}

/**
 * ProgramBuilder - appends instructions at consecutive pcs
 */
class ProgramBuilder {
public:
    ProgramBuilder& push(const Instruction& instruction) {
        instructions_.push_back(instruction);
        return *this;
    }
    ProgramBuilder& push(const std::vector<Instruction>& instructions) {
        instructions_.insert(instructions_.end(), instructions.begin(), instructions.end());
        return *this;
    }

    uint32_t next_pc() const { return static_cast<uint32_t>(instructions_.size()) * DEFAULT_PC_STEP; }

    Program build() const { return Program::from_instructions(instructions_); }
    VmExe exe() const { return VmExe(build(), 0); }

private:
    std::vector<Instruction> instructions_;
};

// Constraint and bus check over every trace of a segment's proof input
inline void debug_check(VmChipComplex& complex, const ProofInput& input) {
    const std::vector<AirRef> airs = complex.airs();
    std::vector<DebugAirInput> debug;
    for (const auto& [air_id, air_input] : input.per_air) {
        debug.push_back(debug_input(airs[air_id].get(), air_input));
    }
    DebugChecker::check_all(debug);
}

/**
 * SegmentRun - one segment executed from pc_start with its traces
 * generated and checked by the debug checker
 */
struct SegmentRun {
    std::unique_ptr<ExecutionSegment> segment;
    ProofInput input;
    MemoryImage memory;
};

inline SegmentRun run_segment(const VmConfig& config, const VmExe& exe,
                              std::vector<std::vector<uint8_t>> inputs = {}) {
    TwoAdicPcs pcs(config.system.fri_params);
    VmCommittedExe committed = VmCommittedExe::commit(exe, pcs);
    auto streams = std::make_shared<Streams>(std::move(inputs));
    SegmentRun run;
    run.segment = std::make_unique<ExecutionSegment>(config, committed.exe.program, committed.committed_program,
                                                     streams,
                                                     ExecutionSegment::InitialMemory{exe.init_memory, std::nullopt});
    DefaultSegmentationStrategy strategy(config.system.max_segment_len, config.system.max_trace_height);
    run.segment->execute_from_state(ExecutionState(exe.pc_start, INITIAL_TIMESTAMP), strategy);
    run.memory = run.segment->memory().image();
    run.input = run.segment->generate_proof_input();
    debug_check(run.segment->chip_complex(), run.input);
    return run;
}

// Padded trace height of the named AIR in a segment's proof input, 0 when absent
inline size_t air_rows(SegmentRun& run, const std::string& air_name) {
    const std::vector<std::string> names = run.segment->chip_complex().air_names();
    for (const auto& [air_id, air_input] : run.input.per_air) {
        if (names[air_id] == air_name) {
            return air_input.common_main.height();
        }
    }
    return 0;
}

// Heap image cells holding bytes at ptr, for persistent initial memory
inline void put_bytes(MemoryImage& image, uint32_t ptr, const std::vector<uint8_t>& bytes) {
    for (size_t i = 0; i < bytes.size(); ++i) {
        image[{address_space::HEAP, ptr + static_cast<uint32_t>(i)}] = BFieldElement(bytes[i]);
    }
}

inline void put_register(MemoryImage& image, uint32_t r, uint32_t value) {
    const auto bytes = u32_to_bytes(value);
    for (size_t i = 0; i < RV32_REGISTER_NUM_LIMBS; ++i) {
        image[{address_space::REGISTER, register_pointer(r) + static_cast<uint32_t>(i)}] = BFieldElement(bytes[i]);
    }
}

inline uint32_t read_register(const MemoryImage& image, uint32_t r) {
    uint32_t value = 0;
    for (size_t i = 0; i < RV32_REGISTER_NUM_LIMBS; ++i) {
        auto it = image.find({address_space::REGISTER, register_pointer(r) + static_cast<uint32_t>(i)});
        const uint32_t byte = it == image.end() ? 0 : it->second.value();
        value |= byte << (8 * i);
    }
    return value;
}

inline std::vector<uint8_t> read_bytes(const MemoryImage& image, uint32_t as, uint32_t ptr, size_t len) {
    std::vector<uint8_t> out(len, 0);
    for (size_t i = 0; i < len; ++i) {
        auto it = image.find({as, ptr + static_cast<uint32_t>(i)});
        if (it != image.end()) {
            out[i] = static_cast<uint8_t>(it->second.value());
        }
    }
    return out;
}

} // namespace test
} // namespace zkrv
