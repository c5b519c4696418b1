#include "mod_builder/core_chip.hpp"
#include <algorithm>
#include <numeric>
#include <optional>
#include <stdexcept>

namespace zkrv {
namespace mod_builder {

AdapterAirContext FieldExpressionCoreAir::eval(AirBuilder& builder, const std::vector<Expr>& cols,
                                               const Expr& /*from_pc*/) const {
    const Expr& is_valid = cols[0];
    expr_->eval(builder, cols);

    Expr flag_sum;
    Expr opcode = is_valid * static_cast<int64_t>(opcodes_.offset);
    std::optional<uint32_t> default_local;
    for (size_t i = 0; i < opcodes_.locals.size(); ++i) {
        if (opcodes_.flags[i] == FieldExprOpcodes::NO_FLAG) {
            default_local = opcodes_.locals[i];
            continue;
        }
        const Expr& flag = cols[expr_->flag_offset(opcodes_.flags[i])];
        flag_sum += flag;
        opcode += flag * static_cast<int64_t>(opcodes_.locals[i]);
    }
    if (default_local) {
        opcode += (is_valid - flag_sum) * static_cast<int64_t>(*default_local);
    } else {
        builder.assert_eq(flag_sum, is_valid);
    }

    AdapterAirContext ctx;
    ctx.is_valid = is_valid;
    ctx.opcode = opcode;
    const size_t n = expr_->num_limbs();
    size_t input = 0;
    for (size_t count : inputs_per_read_) {
        ctx.reads.push_back(std::vector<Expr>(cols.begin() + expr_->input_offset(input),
                                              cols.begin() + expr_->input_offset(input) + count * n));
        input += count;
    }
    std::vector<Expr> writes;
    for (size_t var : expr_->outputs()) {
        writes.insert(writes.end(), cols.begin() + expr_->var_offset(var), cols.begin() + expr_->var_offset(var) + n);
    }
    ctx.writes.push_back(std::move(writes));
    return ctx;
}

FieldExpressionCoreChip::FieldExpressionCoreChip(std::shared_ptr<const FieldExpr> expr, FieldExprOpcodes opcodes,
                                                 std::vector<size_t> inputs_per_read,
                                                 std::shared_ptr<VariableRangeCheckerChip> range_checker,
                                                 std::string name)
    : expr_(std::move(expr)),
      opcodes_(std::move(opcodes)),
      inputs_per_read_(std::move(inputs_per_read)),
      range_checker_(std::move(range_checker)),
      name_(std::move(name)) {
    if (opcodes_.locals.size() != opcodes_.flags.size() || opcodes_.locals.size() != opcodes_.names.size()) {
        throw std::invalid_argument(name_ + ": opcode locals, flags and names differ in length");
    }
    if (std::count(opcodes_.flags.begin(), opcodes_.flags.end(), FieldExprOpcodes::NO_FLAG) > 1) {
        throw std::invalid_argument(name_ + ": more than one default opcode");
    }
    if (std::accumulate(inputs_per_read_.begin(), inputs_per_read_.end(), size_t{0}) != expr_->num_inputs()) {
        throw std::invalid_argument(name_ + ": reads do not cover the inputs");
    }
    if ((expr_->num_limbs() % BLOCK_SIZE) != 0) {
        throw std::invalid_argument(name_ + ": limbs per element must fill whole blocks");
    }
}

std::string FieldExpressionCoreChip::get_opcode_name(uint32_t opcode) const {
    for (size_t i = 0; i < opcodes_.locals.size(); ++i) {
        if (opcodes_.offset + opcodes_.locals[i] == opcode) {
            return opcodes_.names[i];
        }
    }
    return name_ + "<" + std::to_string(opcode) + ">";
}

std::vector<uint32_t> FieldExpressionCoreChip::global_opcodes() const {
    std::vector<uint32_t> out;
    for (uint32_t local : opcodes_.locals) {
        out.push_back(opcodes_.offset + local);
    }
    return out;
}

std::vector<size_t> FieldExpressionCoreChip::read_blocks() const {
    std::vector<size_t> out;
    for (size_t count : inputs_per_read_) {
        out.push_back(count * expr_->num_limbs() / BLOCK_SIZE);
    }
    return out;
}

size_t FieldExpressionCoreChip::write_blocks() const {
    return expr_->outputs().size() * expr_->num_limbs() / BLOCK_SIZE;
}

std::pair<AdapterRuntimeContext, FieldExpressionRecord> FieldExpressionCoreChip::execute_instruction(
    const Instruction& instruction, uint32_t /*from_pc*/, const AdapterReads& reads) const {
    const auto it = std::find(opcodes_.locals.begin(), opcodes_.locals.end(), instruction.opcode - opcodes_.offset);
    if (instruction.opcode < opcodes_.offset || it == opcodes_.locals.end()) {
        throw ExecutionError(ExecutionErrorKind::InvalidInstruction, 0,
                             name_ + " does not handle opcode " + std::to_string(instruction.opcode));
    }
    const size_t flag = opcodes_.flags[static_cast<size_t>(it - opcodes_.locals.begin())];

    FieldExpressionRecord record;
    record.flags.assign(expr_->num_flags(), false);
    if (flag != FieldExprOpcodes::NO_FLAG) {
        record.flags[flag] = true;
    }

    const size_t n = expr_->num_limbs();
    for (size_t r = 0; r < inputs_per_read_.size(); ++r) {
        const std::vector<BFieldElement>& cells = reads.at(r);
        for (size_t j = 0; j < inputs_per_read_[r]; ++j) {
            std::vector<BFieldElement> limbs(cells.begin() + j * n, cells.begin() + (j + 1) * n);
            for (const BFieldElement& limb : limbs) {
                if (limb.value() > RV32_CELL_MAX) {
                    throw ExecutionError(ExecutionErrorKind::ModularPrecondition, 0,
                                         name_ + " operand cell " + std::to_string(limb.value()) + " is not a byte");
                }
            }
            record.inputs.push_back(expr_->from_limbs(limbs));
        }
    }
    record.vars = expr_->execute(record.inputs, record.flags);

    std::vector<BFieldElement> output;
    for (size_t var : expr_->outputs()) {
        const std::vector<BFieldElement> limbs = expr_->to_limbs(record.vars[var]);
        output.insert(output.end(), limbs.begin(), limbs.end());
    }
    return {AdapterRuntimeContext::without_pc({std::move(output)}), std::move(record)};
}

void FieldExpressionCoreChip::generate_trace_row(BFieldElement* row, const FieldExpressionRecord& record) const {
    expr_->generate_row(row, record.inputs, record.vars, record.flags, *range_checker_);
}

std::shared_ptr<Rv32FieldExprChip> make_field_expr_chip(const FieldExprChipContext& ctx,
                                                        std::shared_ptr<const FieldExpr> expr,
                                                        FieldExprOpcodes opcodes, std::vector<size_t> inputs_per_read,
                                                        const std::string& name) {
    FieldExpressionCoreChip core(std::move(expr), std::move(opcodes), std::move(inputs_per_read), ctx.range_checker,
                                 name);
    Rv32VecHeapAdapter adapter(ctx.config, ctx.bitwise, core.read_blocks(), core.write_blocks());
    return std::make_shared<Rv32FieldExprChip>(std::move(adapter), std::move(core), ctx.aux);
}

} // namespace mod_builder
} // namespace zkrv
