#include "system/program_chip.hpp"
#include "vm/execution_error.hpp"
#include <algorithm>
#include <stdexcept>

namespace zkrv {

void ProgramAir::eval(AirBuilder& builder) const {
    auto cached = builder.partitioned_main(0);
    auto common = builder.main();
    builder.push_receive(bus::PROGRAM, cached.local_row(), common.local(0));
}

VmCommittedExe VmCommittedExe::commit(VmExe exe, const TwoAdicPcs& pcs) {
    VmCommittedExe out;
    out.committed_program = pcs.commit_matrix(ProgramChip::generate_cached_trace(exe.program));
    out.exe = std::move(exe);
    return out;
}

ProgramChip::ProgramChip() : air_(std::make_shared<ProgramAir>()) {}

void ProgramChip::set_program(const Program& program, std::shared_ptr<const CommittedMatrix> committed) {
    if (committed && (committed->width() != ProgramAir::CACHED_WIDTH ||
                      committed->trace.height() != padded_height(program.len()))) {
        throw std::invalid_argument("committed program trace does not match the program shape");
    }
    program_ = program;
    committed_ = std::move(committed);
    frequencies_.assign(program_.len(), 0);
}

void ProgramChip::set_program(const Program& program) { set_program(program, nullptr); }

const Instruction& ProgramChip::get_instruction(uint32_t pc) {
    const Instruction& instruction = program_.get_instruction(pc);
    ++frequencies_[*program_.index_of(pc)];
    return instruction;
}

RowMajorMatrix<BFieldElement> ProgramChip::generate_cached_trace(const Program& program) {
    const size_t height = padded_height(program.len());
    RowMajorMatrix<BFieldElement> trace(ProgramAir::CACHED_WIDTH, height);
    for (size_t i = 0; i < height; ++i) {
        BFieldElement* row = trace.row_mut(i);
        row[0] = BFieldElement(uint64_t{program.pc_base()} + uint64_t{i} * program.step());
        if (i < program.len() && program.slots()[i]) {
            const Instruction& instruction = *program.slots()[i];
            row[1] = BFieldElement(instruction.opcode);
            const std::vector<BFieldElement> operands = instruction.operands();
            for (size_t j = 0; j < NUM_OPERANDS; ++j) {
                row[2 + j] = operands[j];
            }
        } else {
            row[1] = BFieldElement(PROGRAM_PADDING_OPCODE);
        }
    }
    return trace;
}

AirProofInput ProgramChip::generate_air_proof_input() {
    if (!committed_) {
        throw std::logic_error("program trace must be committed before proving");
    }
    AirProofInput input;
    input.cached_mains.push_back(committed_);
    input.common_main = RowMajorMatrix<BFieldElement>(1, committed_->trace.height());
    for (size_t i = 0; i < frequencies_.size(); ++i) {
        input.common_main.set(i, 0, BFieldElement(frequencies_[i]));
    }
    std::fill(frequencies_.begin(), frequencies_.end(), 0);
    return input;
}

} // namespace zkrv
