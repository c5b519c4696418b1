#pragma once

#include "memory/offline_checker.hpp"
#include "mod_builder/field_expr.hpp"
#include "primitives/bitwise_op_lookup.hpp"
#include "primitives/var_range.hpp"
#include "rv32im/heap_adapter.hpp"
#include "vm/integration.hpp"
#include <memory>
#include <string>
#include <vector>

namespace zkrv {
namespace mod_builder {

/**
 * Local opcodes a field-expression chip answers to.
 *
 * flags[i] is the flag local opcode locals[i] sets, or NO_FLAG for the
 * single default opcode that sets none.
 */
struct FieldExprOpcodes {
    static constexpr size_t NO_FLAG = SIZE_MAX;

    uint32_t offset = 0;
    std::vector<uint32_t> locals;
    std::vector<size_t> flags;
    std::vector<std::string> names;
};

class FieldExpressionCoreAir {
public:
    FieldExpressionCoreAir(std::shared_ptr<const FieldExpr> expr, FieldExprOpcodes opcodes,
                           std::vector<size_t> inputs_per_read, std::string name)
        : expr_(std::move(expr)), opcodes_(std::move(opcodes)), inputs_per_read_(std::move(inputs_per_read)),
          name_(std::move(name)) {}

    std::string name() const { return name_; }
    size_t width() const { return expr_->width(); }

    AdapterAirContext eval(AirBuilder& builder, const std::vector<Expr>& cols, const Expr& from_pc) const;

private:
    std::shared_ptr<const FieldExpr> expr_;
    FieldExprOpcodes opcodes_;
    std::vector<size_t> inputs_per_read_;
    std::string name_;
};

struct FieldExpressionRecord {
    std::vector<mpz_class> inputs;
    std::vector<mpz_class> vars;
    std::vector<bool> flags;
};

/**
 * FieldExpressionCoreChip - runs a FieldExpr on heap operands
 *
 * Reads arrive as the limbs of inputs_per_read[i] consecutive inputs;
 * the single write is the limbs of the output variables.
 */
class FieldExpressionCoreChip {
public:
    using AirType = FieldExpressionCoreAir;
    using Record = FieldExpressionRecord;

    FieldExpressionCoreChip(std::shared_ptr<const FieldExpr> expr, FieldExprOpcodes opcodes,
                            std::vector<size_t> inputs_per_read,
                            std::shared_ptr<VariableRangeCheckerChip> range_checker, std::string name);

    AirType air() const { return AirType(expr_, opcodes_, inputs_per_read_, name_); }
    size_t width() const { return expr_->width(); }
    std::string get_opcode_name(uint32_t opcode) const;

    std::pair<AdapterRuntimeContext, Record> execute_instruction(const Instruction& instruction, uint32_t from_pc,
                                                                 const AdapterReads& reads) const;
    void generate_trace_row(BFieldElement* row, const Record& record) const;

    const FieldExpr& expr() const { return *expr_; }
    std::vector<uint32_t> global_opcodes() const;

    // Blocks the heap adapter reads per operand and writes in total
    std::vector<size_t> read_blocks() const;
    size_t write_blocks() const;

private:
    std::shared_ptr<const FieldExpr> expr_;
    FieldExprOpcodes opcodes_;
    std::vector<size_t> inputs_per_read_;
    std::shared_ptr<VariableRangeCheckerChip> range_checker_;
    std::string name_;
};

using Rv32FieldExprChip = VmChipWrapper<Rv32VecHeapAdapter, FieldExpressionCoreChip>;

// Shared dependencies of every heap field-expression chip
struct FieldExprChipContext {
    MemoryConfig config;
    std::shared_ptr<const MemoryAuxFiller> aux;
    std::shared_ptr<VariableRangeCheckerChip> range_checker;
    std::shared_ptr<BitwiseOperationLookupChip> bitwise;
};

std::shared_ptr<Rv32FieldExprChip> make_field_expr_chip(const FieldExprChipContext& ctx,
                                                        std::shared_ptr<const FieldExpr> expr,
                                                        FieldExprOpcodes opcodes, std::vector<size_t> inputs_per_read,
                                                        const std::string& name);

} // namespace mod_builder

// Re-exported for the chip complex
using mod_builder::FieldExprChipContext;
using mod_builder::Rv32FieldExprChip;

} // namespace zkrv
