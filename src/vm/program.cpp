#include "vm/program.hpp"
#include "vm/execution_error.hpp"
#include <stdexcept>

namespace zkrv {

Program::Program(std::vector<std::optional<Instruction>> slots, uint32_t pc_base, uint32_t step)
    : slots_(std::move(slots)), pc_base_(pc_base), step_(step) {
    if (step_ == 0) {
        throw std::invalid_argument("program step must be positive");
    }
}

Program Program::from_instructions(const std::vector<Instruction>& instructions, uint32_t pc_base) {
    std::vector<std::optional<Instruction>> slots(instructions.begin(), instructions.end());
    return Program(std::move(slots), pc_base, DEFAULT_PC_STEP);
}

std::optional<size_t> Program::index_of(uint32_t pc) const {
    if (pc < pc_base_ || (pc - pc_base_) % step_ != 0) {
        return std::nullopt;
    }
    size_t index = (pc - pc_base_) / step_;
    if (index >= slots_.size()) {
        return std::nullopt;
    }
    return index;
}

bool Program::contains(uint32_t pc) const {
    auto index = index_of(pc);
    return index && slots_[*index].has_value();
}

const Instruction& Program::get_instruction(uint32_t pc) const {
    auto index = index_of(pc);
    if (!index || !slots_[*index]) {
        throw ExecutionError(ExecutionErrorKind::PcOutOfBounds, pc,
                             "program has " + std::to_string(slots_.size()) + " slots from pc_base " +
                                 std::to_string(pc_base_));
    }
    return *slots_[*index];
}

size_t Program::num_defined() const {
    size_t n = 0;
    for (const auto& slot : slots_) {
        n += slot.has_value() ? 1 : 0;
    }
    return n;
}

} // namespace zkrv
