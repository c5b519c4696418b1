#include "vm/segment.hpp"
#include "common/debug_control.hpp"
#include "vm/execution_error.hpp"
#include "vm/opcode.hpp"
#include <stdexcept>

namespace zkrv {

bool DefaultSegmentationStrategy::should_segment(const std::vector<std::string>& air_names,
                                                 const std::vector<size_t>& heights, size_t instructions,
                                                 uint32_t timestamp_delta) const {
    if (instructions >= max_segment_len_) {
        ZKRV_DEBUG_PRINT("[segment] cut after %zu instructions\n", instructions);
        return true;
    }
    if (timestamp_delta >= max_segment_len_) {
        ZKRV_DEBUG_PRINT("[segment] cut at timestamp delta %u\n", timestamp_delta);
        return true;
    }
    for (size_t i = 0; i < heights.size(); ++i) {
        if (heights[i] >= max_trace_height_) {
            ZKRV_DEBUG_PRINT("[segment] cut: %s has %zu rows\n", air_names[i].c_str(), heights[i]);
            return true;
        }
    }
    return false;
}

ExecutionSegment::ExecutionSegment(const VmConfig& config, const Program& program,
                                   std::shared_ptr<const CommittedMatrix> committed_program,
                                   std::shared_ptr<Streams> streams, InitialMemory initial_memory,
                                   const std::vector<std::optional<BFieldElement>>& revealed)
    : config_(config), chip_complex_(std::make_unique<VmChipComplex>(config, std::move(streams))) {
    chip_complex_->program_chip().set_program(program, std::move(committed_program));
    if (!revealed.empty()) {
        chip_complex_->public_values_chip().seed(revealed);
    }

    const MemoryConfig& mem = config_.system.memory_config;
    if (initial_memory.tree) {
        if (!config_.system.continuation_enabled) {
            throw std::invalid_argument("a Merkle tree can only seed a persistent segment");
        }
        memory_ = std::make_unique<MemoryController>(mem, initial_memory.image, std::move(*initial_memory.tree),
                                                     INITIAL_TIMESTAMP);
    } else {
        memory_ = std::make_unique<MemoryController>(mem, chip_complex_->memory_mode(), initial_memory.image,
                                                     INITIAL_TIMESTAMP);
    }
}

void ExecutionSegment::execute_from_state(ExecutionState state, const SegmentationStrategy& strategy) {
    if (status_ != SegmentStatus::Fresh) {
        throw std::logic_error("segment already executed");
    }
    status_ = SegmentStatus::Running;
    chip_complex_->connector_chip().begin(state);

    std::vector<std::string> executor_names;
    {
        const std::vector<std::string> names = chip_complex_->air_names();
        for (size_t id : chip_complex_->executor_air_ids()) {
            executor_names.push_back(names[id]);
        }
    }
    const uint32_t terminate_opcode = opcode(SystemOpcode::TERMINATE);
    const uint32_t start_timestamp = state.timestamp;

    while (true) {
        const uint32_t pc = state.pc;
        const Instruction* instruction = nullptr;
        try {
            instruction = &chip_complex_->program_chip().get_instruction(pc);
        } catch (const ExecutionError& e) {
            throw e.with_context(pc, "");
        }
        InstructionExecutor* executor = chip_complex_->executor_for(instruction->opcode);
        if (executor == nullptr) {
            throw ExecutionError(ExecutionErrorKind::DisabledOperation, pc,
                                 "no chip handles opcode " + std::to_string(instruction->opcode));
        }

        ZKRV_IF_DEBUG {
            ZKRV_DEBUG_PRINT("[exec] pc 0x%08x ts %u %s\n", pc, state.timestamp,
                             executor->get_opcode_name(instruction->opcode).c_str());
        }
        try {
            state = executor->execute(*memory_, *instruction, state);
        } catch (const ExecutionError& e) {
            throw e.with_context(pc, executor->get_opcode_name(instruction->opcode));
        }
        ++num_instructions_;

        if (instruction->opcode == terminate_opcode) {
            exit_code_ = chip_complex_->terminate_chip().exit_code();
            status_ = SegmentStatus::Terminated;
            break;
        }
        if (strategy.should_segment(executor_names, chip_complex_->executor_heights(), num_instructions_,
                                    state.timestamp - start_timestamp)) {
            if (!config_.system.continuation_enabled) {
                throw ExecutionError(ExecutionErrorKind::SegmentationFailure, state.pc,
                                     "segment limit reached after " + std::to_string(num_instructions_) +
                                         " instructions without continuations");
            }
            status_ = SegmentStatus::Segmented;
            break;
        }
    }
    finish(state);
}

void ExecutionSegment::finish(ExecutionState state) {
    final_state_ = state;
    chip_complex_->connector_chip().end(state, exit_code_);
    final_memory_ = memory_->finalize();
    chip_complex_->set_final_memory(*final_memory_);
    ZKRV_DEBUG_PRINT("[segment] %s at pc 0x%08x ts %u after %zu instructions\n",
                     is_terminated() ? "terminated" : "suspended", state.pc, state.timestamp, num_instructions_);
}

ExecutionState ExecutionSegment::final_state() const {
    if (status_ == SegmentStatus::Fresh || status_ == SegmentStatus::Running) {
        throw std::logic_error("segment has not stopped");
    }
    return final_state_;
}

const FinalMemory& ExecutionSegment::final_memory() const {
    if (!final_memory_) {
        throw std::logic_error("segment has not stopped");
    }
    return *final_memory_;
}

ProofInput ExecutionSegment::generate_proof_input() {
    if (!final_memory_) {
        throw std::logic_error("segment has not stopped");
    }
    return chip_complex_->generate_proof_input();
}

} // namespace zkrv
