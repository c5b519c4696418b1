#pragma once

#include "vm/instruction.hpp"
#include "types/b_field_element.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace zkrv {

constexpr uint32_t DEFAULT_PC_STEP = 4;

/**
 * Program - instruction slots indexed by pc = pc_base + i * step
 *
 * Absent slots are padding and fault when fetched.
 */
class Program {
public:
    Program() = default;
    Program(std::vector<std::optional<Instruction>> slots, uint32_t pc_base = 0, uint32_t step = DEFAULT_PC_STEP);

    static Program from_instructions(const std::vector<Instruction>& instructions, uint32_t pc_base = 0);

    /**
     * Fetch the instruction at pc.
     * Throws ExecutionError(PcOutOfBounds) for misaligned, out-of-range or
     * padding slots.
     */
    const Instruction& get_instruction(uint32_t pc) const;

    bool contains(uint32_t pc) const;

    size_t len() const { return slots_.size(); }
    size_t num_defined() const;
    uint32_t pc_base() const { return pc_base_; }
    uint32_t step() const { return step_; }
    const std::vector<std::optional<Instruction>>& slots() const { return slots_; }

    // Slot index of pc, or nullopt outside the program
    std::optional<size_t> index_of(uint32_t pc) const;

private:
    std::vector<std::optional<Instruction>> slots_;
    uint32_t pc_base_ = 0;
    uint32_t step_ = DEFAULT_PC_STEP;
};

// (address space, pointer) -> cell value
using MemoryImage = std::map<std::pair<uint32_t, uint32_t>, BFieldElement>;

/**
 * VmExe - executable image: program, entry point and initial memory
 */
struct VmExe {
    Program program;
    uint32_t pc_start = 0;
    MemoryImage init_memory;

    VmExe() = default;
    explicit VmExe(Program p, uint32_t start = 0) : program(std::move(p)), pc_start(start) {}
};

} // namespace zkrv
