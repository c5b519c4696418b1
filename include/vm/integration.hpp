#pragma once

#include "memory/memory_controller.hpp"
#include "memory/offline_checker.hpp"
#include "vm/bus.hpp"
#include "vm/chip.hpp"
#include "vm/execution_error.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zkrv {

// Data the adapter read, one vector per operand
using AdapterReads = std::vector<std::vector<BFieldElement>>;

/**
 * AdapterRuntimeContext - what a core hands back to its adapter
 *
 * to_pc == nullopt means pc + DEFAULT_PC_STEP.
 */
struct AdapterRuntimeContext {
    std::optional<uint32_t> to_pc;
    std::vector<std::vector<BFieldElement>> writes;

    static AdapterRuntimeContext without_pc(std::vector<std::vector<BFieldElement>> writes) {
        return AdapterRuntimeContext{std::nullopt, std::move(writes)};
    }
};

/**
 * AdapterAirContext - symbolic interface between a core AIR and an adapter AIR
 *
 * The core owns the operand data and the opcode; the adapter owns the
 * register pointers, the timestamps and every memory-bus message.
 * immediates are instruction operands only the core can express (branch
 * offsets, upper immediates), in adapter-defined order.
 */
struct AdapterAirContext {
    std::optional<Expr> to_pc;
    std::vector<std::vector<Expr>> reads;
    std::vector<std::vector<Expr>> writes;
    Expr is_valid;
    Expr opcode;
    std::vector<Expr> immediates;
};

/**
 * VmAirWrapper - AIR of an (adapter, core) chip
 *
 * The row is [adapter columns | core columns]. The core evaluates first
 * and returns the context the adapter turns into bus messages.
 */
template <typename AdapterAir, typename CoreAir>
class VmAirWrapper : public Air {
public:
    VmAirWrapper(AdapterAir adapter, CoreAir core) : adapter_(std::move(adapter)), core_(std::move(core)) {}

    std::string name() const override { return core_.name(); }
    size_t width() const override { return adapter_.width() + core_.width(); }

    void eval(AirBuilder& builder) const override {
        const std::vector<Expr> local = builder.main().local_row();
        const std::vector<Expr> adapter_cols(local.begin(), local.begin() + adapter_.width());
        const std::vector<Expr> core_cols(local.begin() + adapter_.width(), local.end());
        AdapterAirContext ctx = core_.eval(builder, core_cols, adapter_.from_pc(adapter_cols));
        adapter_.eval(builder, adapter_cols, ctx);
    }

private:
    AdapterAir adapter_;
    CoreAir core_;
};

/**
 * VmChipWrapper - instruction executor built from an adapter and a core
 *
 * execute() runs adapter.preprocess (reads), core.execute_instruction
 * (semantics) and adapter.postprocess (writes), keeping one record per
 * instruction. Rows are generated in parallel from the records.
 *
 * Adapter requirements:
 *   AirType, ReadRecord, WriteRecord, width(), air(),
 *   preprocess(memory, instruction) -> (AdapterReads, ReadRecord)
 *   postprocess(memory, instruction, from_state, ctx, read_record) -> (ExecutionState, WriteRecord)
 *   generate_trace_row(row, from_state, read_record, write_record, aux)
 * Core requirements:
 *   AirType, Record, width(), air(), get_opcode_name(opcode),
 *   execute_instruction(instruction, from_pc, reads) -> (AdapterRuntimeContext, Record)
 *   generate_trace_row(row, record)
 */
template <typename Adapter, typename Core>
class VmChipWrapper : public Chip, public InstructionExecutor {
public:
    using AirType = VmAirWrapper<typename Adapter::AirType, typename Core::AirType>;

    VmChipWrapper(Adapter adapter, Core core, std::shared_ptr<const MemoryAuxFiller> aux)
        : adapter_(std::move(adapter)),
          core_(std::move(core)),
          aux_(std::move(aux)),
          air_(std::make_shared<AirType>(adapter_.air(), core_.air())) {}

    ExecutionState execute(MemoryController& memory, const Instruction& instruction,
                           ExecutionState from_state) override {
        auto read_result = adapter_.preprocess(memory, instruction);
        auto core_result = core_.execute_instruction(instruction, from_state.pc, read_result.first);
        auto write_result =
            adapter_.postprocess(memory, instruction, from_state, core_result.first, read_result.second);
        records_.push_back(Record{from_state, std::move(read_result.second), std::move(write_result.second),
                                  std::move(core_result.second)});
        return write_result.first;
    }

    std::string get_opcode_name(uint32_t opcode) const override { return core_.get_opcode_name(opcode); }

    AirRef air() const override { return air_; }
    size_t current_trace_height() const override { return records_.size(); }
    size_t trace_width() const override { return air_->width(); }

    AirProofInput generate_air_proof_input() override {
        const size_t width = trace_width();
        const size_t adapter_width = adapter_.width();
        RowMajorMatrix<BFieldElement> trace(width, padded_height(records_.size()));

#pragma omp parallel for schedule(static)
        for (size_t r = 0; r < records_.size(); ++r) {
            const Record& record = records_[r];
            BFieldElement* row = trace.row_mut(r);
            adapter_.generate_trace_row(row, record.from_state, record.read, record.write, *aux_);
            core_.generate_trace_row(row + adapter_width, record.core);
        }
        records_.clear();

        AirProofInput input;
        input.common_main = std::move(trace);
        return input;
    }

    const Core& core() const { return core_; }

private:
    struct Record {
        ExecutionState from_state;
        typename Adapter::ReadRecord read;
        typename Adapter::WriteRecord write;
        typename Core::Record core;
    };

    Adapter adapter_;
    Core core_;
    std::shared_ptr<const MemoryAuxFiller> aux_;
    std::shared_ptr<AirType> air_;
    std::vector<Record> records_;
};

} // namespace zkrv
