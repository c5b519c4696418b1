#pragma once

#include "memory/memory_controller.hpp"
#include "primitives/var_range.hpp"
#include "vm/config.hpp"
#include <memory>
#include <vector>

namespace zkrv {

/**
 * AssertLtSubAir - proves x < y for values below 2^max_bits
 *
 * y - x - 1 is decomposed into decomp-bit limbs that are range checked
 * on the variable range checker bus.
 */
struct AssertLtSubAir {
    size_t max_bits = 29;
    size_t decomp = 17;

    size_t num_limbs() const { return (max_bits + decomp - 1) / decomp; }

    void eval(AirBuilder& builder, const Expr& x, const Expr& y, const std::vector<Expr>& limbs,
              const Expr& count) const;

    // Fill the limbs of y - x - 1 and count their range checks; requires x < y
    void generate(VariableRangeCheckerChip& range_checker, uint32_t x, uint32_t y, BFieldElement* limbs) const;
};

/**
 * MemoryBridge - memory bus interactions of one block access
 *
 * A read receives (as, ptr, data, prev_ts) and sends (as, ptr, data, ts);
 * a write receives the previous data instead. Both assert prev_ts < ts.
 *
 * Read aux columns:  prev_timestamp, lt_limbs[L]
 * Write aux columns: prev_timestamp, lt_limbs[L], prev_data[4]
 */
class MemoryBridge {
public:
    explicit MemoryBridge(const MemoryConfig& config) : lt_{config.clk_max_bits, config.decomp} {}

    size_t read_aux_width() const { return 1 + lt_.num_limbs(); }
    size_t write_aux_width() const { return read_aux_width() + BLOCK_SIZE; }

    void read(AirBuilder& builder, const Expr& address_space, const Expr& pointer, const std::vector<Expr>& data,
              const Expr& timestamp, const std::vector<Expr>& aux, const Expr& count) const;

    void write(AirBuilder& builder, const Expr& address_space, const Expr& pointer, const std::vector<Expr>& data,
               const Expr& timestamp, const std::vector<Expr>& aux, const Expr& count) const;

    // prev_data columns of a write aux slice
    static std::vector<Expr> prev_data(const std::vector<Expr>& write_aux) {
        return std::vector<Expr>(write_aux.end() - BLOCK_SIZE, write_aux.end());
    }

private:
    AssertLtSubAir lt_;

    void access(AirBuilder& builder, const Expr& address_space, const Expr& pointer,
                const std::vector<Expr>& prev_data, const std::vector<Expr>& data, const Expr& timestamp,
                const std::vector<Expr>& aux, const Expr& count) const;
};

/**
 * MemoryAuxFiller - trace-side counterpart of MemoryBridge
 */
class MemoryAuxFiller {
public:
    MemoryAuxFiller(const MemoryConfig& config, std::shared_ptr<VariableRangeCheckerChip> range_checker)
        : lt_{config.clk_max_bits, config.decomp}, range_checker_(std::move(range_checker)) {}

    size_t read_aux_width() const { return 1 + lt_.num_limbs(); }
    size_t write_aux_width() const { return read_aux_width() + BLOCK_SIZE; }

    void fill_read(BFieldElement* aux, const MemoryReadRecord& record) const;
    void fill_write(BFieldElement* aux, const MemoryWriteRecord& record) const;

    VariableRangeCheckerChip& range_checker() const { return *range_checker_; }

private:
    AssertLtSubAir lt_;
    std::shared_ptr<VariableRangeCheckerChip> range_checker_;
};

// Slice [offset, offset + len) of a row of expressions
std::vector<Expr> slice(const std::vector<Expr>& row, size_t offset, size_t len);

} // namespace zkrv
