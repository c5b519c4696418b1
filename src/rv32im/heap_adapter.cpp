#include "rv32im/heap_adapter.hpp"
#include "rv32im/adapters.hpp"
#include <algorithm>
#include <numeric>
#include <string>

namespace zkrv {

namespace {

// Register pointers, then register values, then the aux slices
struct HeapLayout {
    size_t num_reads;
    size_t rs_ptr(size_t i) const { return 2 + i; }
    size_t rd_ptr() const { return 2 + num_reads; }
    size_t rs_val(size_t i) const { return 3 + num_reads + i * RV32_REGISTER_NUM_LIMBS; }
    size_t rd_val() const { return 3 + num_reads + num_reads * RV32_REGISTER_NUM_LIMBS; }
    size_t aux_start() const { return rd_val() + RV32_REGISTER_NUM_LIMBS; }
};

std::vector<Expr> block_of(const std::vector<Expr>& cells, size_t block) {
    return std::vector<Expr>(cells.begin() + block * BLOCK_SIZE, cells.begin() + (block + 1) * BLOCK_SIZE);
}

} // namespace

size_t Rv32VecHeapAdapterAir::total_read_blocks() const {
    return std::accumulate(read_blocks_.begin(), read_blocks_.end(), size_t{0});
}

size_t Rv32VecHeapAdapterAir::width() const {
    const HeapLayout layout{num_reads()};
    return layout.aux_start() + (num_reads() + 1 + total_read_blocks()) * memory_.read_aux_width() +
           write_blocks_ * memory_.write_aux_width();
}

void Rv32VecHeapAdapterAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                 const AdapterAirContext& ctx) const {
    const HeapLayout layout{num_reads()};
    const size_t r = memory_.read_aux_width();
    const size_t w = memory_.write_aux_width();
    const Expr& from_pc = cols[0];
    const Expr& from_ts = cols[1];
    const Expr& is_valid = ctx.is_valid;
    const Expr reg_as = Expr::from_u64(address_space::REGISTER);
    const Expr heap_as = Expr::from_u64(address_space::HEAP);

    size_t aux = layout.aux_start();
    Expr ts = from_ts;
    std::vector<std::vector<Expr>> reg_vals;
    for (size_t i = 0; i <= num_reads(); ++i) {
        const bool is_rd = i == num_reads();
        const Expr& ptr = cols[is_rd ? layout.rd_ptr() : layout.rs_ptr(i)];
        std::vector<Expr> val = slice(cols, is_rd ? layout.rd_val() : layout.rs_val(i), RV32_REGISTER_NUM_LIMBS);
        memory_.read(builder, reg_as, ptr, val, ts, slice(cols, aux, r), is_valid);
        aux += r;
        ts = ts + static_cast<int64_t>(ACCESS_TIMESTAMP_DELTA);
        reg_vals.push_back(std::move(val));
    }

    // Top limbs scaled so a byte range check bounds the address
    const int64_t scale = int64_t{1} << (RV32_REGISTER_NUM_LIMBS * RV32_CELL_BITS - pointer_max_bits_);
    for (size_t i = 0; i < reg_vals.size(); i += 2) {
        const Expr hi = reg_vals[i][RV32_REGISTER_NUM_LIMBS - 1] * scale;
        const Expr lo = i + 1 < reg_vals.size() ? reg_vals[i + 1][RV32_REGISTER_NUM_LIMBS - 1] * scale : Expr();
        BitwiseOperationLookupBus::send_range(builder, hi, lo, is_valid);
    }

    for (size_t i = 0; i < num_reads(); ++i) {
        const Expr address = compose_limbs(reg_vals[i], RV32_CELL_BITS);
        for (size_t blk = 0; blk < read_blocks_[i]; ++blk) {
            memory_.read(builder, heap_as, address + static_cast<int64_t>(blk * BLOCK_SIZE),
                         block_of(ctx.reads[i], blk), ts, slice(cols, aux, r), is_valid);
            aux += r;
            ts = ts + static_cast<int64_t>(ACCESS_TIMESTAMP_DELTA);
        }
    }

    const Expr rd_address = compose_limbs(reg_vals.back(), RV32_CELL_BITS);
    for (size_t blk = 0; blk < write_blocks_; ++blk) {
        memory_.write(builder, heap_as, rd_address + static_cast<int64_t>(blk * BLOCK_SIZE),
                      block_of(ctx.writes[0], blk), ts, slice(cols, aux, w), is_valid);
        aux += w;
        ts = ts + static_cast<int64_t>(ACCESS_TIMESTAMP_DELTA);
    }

    const Expr rs2_ptr = num_reads() > 1 ? cols[layout.rs_ptr(1)] : Expr();
    ProgramBus::lookup(builder, is_valid, from_pc, ctx.opcode,
                       {cols[layout.rd_ptr()], cols[layout.rs_ptr(0)], rs2_ptr, reg_as, heap_as});
    ExecutionBridge::execute(builder, is_valid, from_pc, from_ts, from_pc + static_cast<int64_t>(DEFAULT_PC_STEP),
                             ts);
}

uint32_t Rv32VecHeapAdapter::heap_address(const MemoryReadRecord& reg, size_t num_blocks) const {
    const uint32_t address = limbs_to_u32(from_block(reg.data));
    const uint64_t end = uint64_t{address} + num_blocks * BLOCK_SIZE;
    if ((address >> config_.pointer_max_bits) != 0 || end > (uint64_t{1} << config_.pointer_max_bits)) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "heap operand at " + std::to_string(address) + " exceeds 2^" +
                                 std::to_string(config_.pointer_max_bits));
    }
    if (address % BLOCK_SIZE != 0) {
        throw ExecutionError(ExecutionErrorKind::InvalidMemoryAccess, 0,
                             "heap operand at " + std::to_string(address) + " is not block aligned");
    }
    return address;
}

std::pair<AdapterReads, Rv32VecHeapReadRecord> Rv32VecHeapAdapter::preprocess(MemoryController& memory,
                                                                              const Instruction& instruction) const {
    if (instruction.d.value() != address_space::REGISTER || instruction.e.value() != address_space::HEAP) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0, "heap operands need d = 1 and e = 2");
    }
    const uint32_t rs_ptrs[2] = {instruction.b.value(), instruction.c.value()};
    if (read_blocks_.size() > 2) {
        throw std::logic_error("heap adapter supports at most two source registers");
    }
    if (read_blocks_.size() < 2 && instruction.c.value() != 0) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0, "unused operand c must be zero");
    }

    Rv32VecHeapReadRecord record;
    for (size_t i = 0; i < read_blocks_.size(); ++i) {
        record.rs.push_back(memory.read(address_space::REGISTER, rs_ptrs[i]));
    }
    record.rd = memory.read(address_space::REGISTER, instruction.a.value());

    // Checked before any heap access so a bad destination fails early
    heap_address(record.rd, write_blocks_);
    std::vector<uint32_t> top_bytes;
    AdapterReads reads(read_blocks_.size());
    for (size_t i = 0; i < read_blocks_.size(); ++i) {
        const uint32_t address = heap_address(record.rs[i], read_blocks_[i]);
        top_bytes.push_back(record.rs[i].data[RV32_REGISTER_NUM_LIMBS - 1].value());
        for (size_t blk = 0; blk < read_blocks_[i]; ++blk) {
            record.heap_reads.push_back(
                memory.read(address_space::HEAP, address + static_cast<uint32_t>(blk * BLOCK_SIZE)));
            const Block& data = record.heap_reads.back().data;
            reads[i].insert(reads[i].end(), data.begin(), data.end());
        }
    }
    top_bytes.push_back(record.rd.data[RV32_REGISTER_NUM_LIMBS - 1].value());

    const uint32_t scale = 1u << (RV32_REGISTER_NUM_LIMBS * RV32_CELL_BITS - config_.pointer_max_bits);
    for (size_t i = 0; i < top_bytes.size(); i += 2) {
        const uint32_t lo = i + 1 < top_bytes.size() ? top_bytes[i + 1] * scale : 0;
        bitwise_->request_range(top_bytes[i] * scale, lo);
    }
    return {std::move(reads), std::move(record)};
}

std::pair<ExecutionState, Rv32VecHeapWriteRecord> Rv32VecHeapAdapter::postprocess(
    MemoryController& memory, const Instruction& /*instruction*/, ExecutionState from_state,
    const AdapterRuntimeContext& ctx, const Rv32VecHeapReadRecord& read_record) const {
    const std::vector<BFieldElement>& cells = ctx.writes.at(0);
    if (cells.size() != write_blocks_ * BLOCK_SIZE) {
        throw std::logic_error("heap adapter expects " + std::to_string(write_blocks_ * BLOCK_SIZE) +
                               " output cells, got " + std::to_string(cells.size()));
    }
    const uint32_t address = heap_address(read_record.rd, write_blocks_);
    Rv32VecHeapWriteRecord record;
    for (size_t blk = 0; blk < write_blocks_; ++blk) {
        Block block;
        std::copy(cells.begin() + blk * BLOCK_SIZE, cells.begin() + (blk + 1) * BLOCK_SIZE, block.begin());
        record.heap_writes.push_back(
            memory.write(address_space::HEAP, address + static_cast<uint32_t>(blk * BLOCK_SIZE), block));
    }
    return {ExecutionState(from_state.pc + DEFAULT_PC_STEP, memory.timestamp()), std::move(record)};
}

void Rv32VecHeapAdapter::generate_trace_row(BFieldElement* row, ExecutionState from_state,
                                            const Rv32VecHeapReadRecord& read, const Rv32VecHeapWriteRecord& write,
                                            const MemoryAuxFiller& aux) const {
    const HeapLayout layout{read_blocks_.size()};
    row[0] = BFieldElement(from_state.pc);
    row[1] = BFieldElement(from_state.timestamp);
    for (size_t i = 0; i < read.rs.size(); ++i) {
        row[layout.rs_ptr(i)] = BFieldElement(read.rs[i].pointer);
        for (size_t j = 0; j < RV32_REGISTER_NUM_LIMBS; ++j) {
            row[layout.rs_val(i) + j] = read.rs[i].data[j];
        }
    }
    row[layout.rd_ptr()] = BFieldElement(read.rd.pointer);
    for (size_t j = 0; j < RV32_REGISTER_NUM_LIMBS; ++j) {
        row[layout.rd_val() + j] = read.rd.data[j];
    }

    BFieldElement* cursor = row + layout.aux_start();
    for (const MemoryReadRecord& rs : read.rs) {
        aux.fill_read(cursor, rs);
        cursor += aux.read_aux_width();
    }
    aux.fill_read(cursor, read.rd);
    cursor += aux.read_aux_width();
    for (const MemoryReadRecord& heap : read.heap_reads) {
        aux.fill_read(cursor, heap);
        cursor += aux.read_aux_width();
    }
    for (const MemoryWriteRecord& heap : write.heap_writes) {
        aux.fill_write(cursor, heap);
        cursor += aux.write_aux_width();
    }
}

} // namespace zkrv
