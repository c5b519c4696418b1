#pragma once

#include "memory/memory_controller.hpp"
#include "memory/offline_checker.hpp"
#include "primitives/bitwise_op_lookup.hpp"
#include "rv32im/rv32_common.hpp"
#include "vm/integration.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace zkrv {

/**
 * Rv32VecHeapAdapter - operands behind heap pointers held in registers
 *
 * Reads num_reads source registers and the destination register, then
 * read_blocks[i] consecutive heap blocks at the address held by source i,
 * and writes write_blocks blocks at the address held by the destination.
 * Every access advances the clock by 4, in that order.
 *
 * Instruction: a = rd ptr, b = rs1 ptr, c = rs2 ptr, d = 1, e = 2
 * Columns: from_pc, from_ts, rs_ptr[num_reads], rd_ptr, rs_val[num_reads][4],
 *          rd_val[4], register read auxes, heap read auxes, heap write auxes
 *
 * The top byte of every address is range checked so that addresses stay
 * below 2^pointer_max_bits.
 */
class Rv32VecHeapAdapterAir {
public:
    Rv32VecHeapAdapterAir(const MemoryConfig& config, std::vector<size_t> read_blocks, size_t write_blocks)
        : memory_(config),
          pointer_max_bits_(config.pointer_max_bits),
          read_blocks_(std::move(read_blocks)),
          write_blocks_(write_blocks) {}

    size_t num_reads() const { return read_blocks_.size(); }
    size_t total_read_blocks() const;
    size_t width() const;
    Expr from_pc(const std::vector<Expr>& cols) const { return cols[0]; }
    void eval(AirBuilder& builder, const std::vector<Expr>& cols, const AdapterAirContext& ctx) const;

private:
    MemoryBridge memory_;
    size_t pointer_max_bits_;
    std::vector<size_t> read_blocks_;
    size_t write_blocks_;
};

struct Rv32VecHeapReadRecord {
    std::vector<MemoryReadRecord> rs;
    MemoryReadRecord rd;
    std::vector<MemoryReadRecord> heap_reads;
};

struct Rv32VecHeapWriteRecord {
    std::vector<MemoryWriteRecord> heap_writes;
};

class Rv32VecHeapAdapter {
public:
    using AirType = Rv32VecHeapAdapterAir;
    using ReadRecord = Rv32VecHeapReadRecord;
    using WriteRecord = Rv32VecHeapWriteRecord;

    Rv32VecHeapAdapter(const MemoryConfig& config, std::shared_ptr<BitwiseOperationLookupChip> bitwise,
                       std::vector<size_t> read_blocks, size_t write_blocks)
        : config_(config), bitwise_(std::move(bitwise)), read_blocks_(std::move(read_blocks)),
          write_blocks_(write_blocks) {}

    AirType air() const { return AirType(config_, read_blocks_, write_blocks_); }
    size_t width() const { return air().width(); }

    // reads[i] holds the read_blocks[i] * 4 cells behind source i
    std::pair<AdapterReads, ReadRecord> preprocess(MemoryController& memory, const Instruction& instruction) const;
    // ctx.writes[0] holds write_blocks * 4 cells
    std::pair<ExecutionState, WriteRecord> postprocess(MemoryController& memory, const Instruction& instruction,
                                                       ExecutionState from_state, const AdapterRuntimeContext& ctx,
                                                       const ReadRecord& read_record) const;
    void generate_trace_row(BFieldElement* row, ExecutionState from_state, const ReadRecord& read,
                            const WriteRecord& write, const MemoryAuxFiller& aux) const;

private:
    MemoryConfig config_;
    std::shared_ptr<BitwiseOperationLookupChip> bitwise_;
    std::vector<size_t> read_blocks_;
    size_t write_blocks_;

    uint32_t heap_address(const MemoryReadRecord& reg, size_t num_blocks) const;
};

} // namespace zkrv
