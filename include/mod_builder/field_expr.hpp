#pragma once

#include "air/air.hpp"
#include "primitives/var_range.hpp"
#include "types/b_field_element.hpp"
#include <gmpxx.h>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace zkrv {
namespace mod_builder {

/**
 * Field expressions over F_q for a big prime q, proven limb by limb.
 *
 * Every element of F_q lives in num_limbs columns of limb_bits bits. A
 * constraint E(inputs, vars) = 0 (mod q) is proven by witnessing the
 * quotient k = E / q as signed limbs and the carries of E - q * k,
 * propagated limb by limb down to zero.
 *
 * The symbolic side keeps every constraint homogeneous in the row's
 * columns: constants are scaled by is_valid, so an all-zero padding row
 * satisfies every constraint.
 */
struct ExprBuilderConfig {
    mpz_class modulus;
    size_t num_limbs = 32;
    size_t limb_bits = 8;
    // Bits the variable range checker can prove
    size_t range_checker_bits = 17;
};

// 32 limbs of 8 bits: moduli up to 256 bits
ExprBuilderConfig config_256(const mpz_class& modulus, size_t range_checker_bits = 17);
// 48 limbs of 8 bits: moduli up to 384 bits
ExprBuilderConfig config_384(const mpz_class& modulus, size_t range_checker_bits = 17);

enum class NodeKind : uint8_t {
    Input,
    Var,
    Const,
    Add,
    Sub,
    Mul,
    // Compute only, never part of a constraint
    Div,
    IntAdd,
    IntMul,
    // flag ? lhs : rhs
    Select,
};

struct Node {
    NodeKind kind = NodeKind::Const;
    // Input, Var: slot; Select: flag
    size_t index = 0;
    size_t lhs = 0;
    size_t rhs = 0;
    int64_t scalar = 0;
    mpz_class constant;

    size_t degree = 1;
    size_t num_limbs = 1;
    // Bound on |limb| of the limb polynomial
    uint64_t limb_bound = 0;
    // Bound on |value| as an integer
    mpz_class int_bound;
};

class FieldVariable;

/**
 * ExprBuilder - records inputs, variables and their constraints
 *
 * Variables are new witness columns. Each variable i carries one
 * constraint (proven zero mod q) and one compute expression (how the
 * executor fills it). Arithmetic on FieldVariable saves operands into
 * fresh variables whenever a node would exceed the degree or limb bound
 * the carry argument supports.
 */
class ExprBuilder : public std::enable_shared_from_this<ExprBuilder> {
public:
    static constexpr size_t MAX_DEGREE = 3;
    static constexpr size_t NO_CONSTRAINT = SIZE_MAX;

    static std::shared_ptr<ExprBuilder> create(const ExprBuilderConfig& config);

    const ExprBuilderConfig& config() const { return config_; }

    FieldVariable new_input();
    // Opcode-selected boolean; returns the flag index
    size_t new_flag();
    FieldVariable constant(const mpz_class& value);

    // Fresh variable whose constraint and compute are set separately
    std::pair<size_t, FieldVariable> new_var();
    void set_constraint(size_t var, const FieldVariable& constraint);
    void set_compute(size_t var, const FieldVariable& compute);

    size_t num_inputs() const { return num_inputs_; }
    size_t num_flags() const { return num_flags_; }
    size_t num_vars() const { return constraints_.size(); }

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<size_t>& constraints() const { return constraints_; }
    const std::vector<size_t>& computes() const { return computes_; }

    // Largest limb magnitude an expression may reach before it is saved
    uint64_t limb_threshold() const;

    // Internal: node construction with automatic saving
    size_t add_node(Node node);
    size_t binary(NodeKind kind, size_t lhs, size_t rhs);
    size_t scalar_op(NodeKind kind, size_t operand, int64_t scalar);
    size_t select(size_t flag, size_t lhs, size_t rhs);
    size_t divide(size_t lhs, size_t rhs);
    // Returns the Var node the expression was saved into
    size_t save(size_t node);

private:
    explicit ExprBuilder(const ExprBuilderConfig& config) : config_(config) {}

    ExprBuilderConfig config_;
    std::vector<Node> nodes_;
    size_t num_inputs_ = 0;
    size_t num_flags_ = 0;
    std::vector<size_t> constraints_;
    std::vector<size_t> computes_;

    Node leaf(NodeKind kind, size_t index) const;
    Node combine(NodeKind kind, size_t lhs, size_t rhs) const;
    bool fits(const Node& node) const;
    bool is_leaf(size_t node) const;
};

/**
 * FieldVariable - handle on a node of an ExprBuilder
 */
class FieldVariable {
public:
    FieldVariable() = default;
    FieldVariable(std::shared_ptr<ExprBuilder> builder, size_t node) : builder_(std::move(builder)), node_(node) {}

    size_t node() const { return node_; }
    const std::shared_ptr<ExprBuilder>& builder() const { return builder_; }

    FieldVariable operator+(const FieldVariable& rhs) const;
    FieldVariable operator-(const FieldVariable& rhs) const;
    FieldVariable operator*(const FieldVariable& rhs) const;
    // New variable z with constraint z * rhs - this
    FieldVariable operator/(const FieldVariable& rhs) const;
    // this / rhs for compute expressions; adds no variable or constraint
    FieldVariable div_unchecked(const FieldVariable& rhs) const;

    FieldVariable int_add(int64_t k) const;
    FieldVariable int_mul(int64_t k) const;

    // Saves into a variable (no-op for a variable); returns its index
    size_t save() const;
    FieldVariable saved() const;

    static FieldVariable select(size_t flag, const FieldVariable& if_set, const FieldVariable& if_unset);

private:
    std::shared_ptr<ExprBuilder> builder_;
    size_t node_ = 0;
};

/**
 * Fp2 - F_q[u] / (u^2 + 1) on top of FieldVariable
 */
struct Fp2 {
    FieldVariable c0;
    FieldVariable c1;

    static Fp2 new_input(ExprBuilder& builder);

    Fp2 operator+(const Fp2& rhs) const { return {c0 + rhs.c0, c1 + rhs.c1}; }
    Fp2 operator-(const Fp2& rhs) const { return {c0 - rhs.c0, c1 - rhs.c1}; }
    Fp2 operator*(const Fp2& rhs) const;
    // Multiply by the small element xi0 + xi1 * u
    Fp2 mul_by_small(int64_t xi0, int64_t xi1) const;
    Fp2 int_add(int64_t k) const { return {c0.int_add(k), c1}; }

    // Save both coefficients; returns their variable indices
    std::pair<size_t, size_t> save() const { return {c0.save(), c1.save()}; }
};

/**
 * FieldExpr - a finished ExprBuilder with its trace layout
 *
 * Core columns: is_valid, inputs[num_inputs][N], vars[num_vars][N],
 * then per constraint q_limbs followed by carries, then flags.
 */
class FieldExpr {
public:
    // outputs: variables written back to memory, in order
    FieldExpr(const ExprBuilder& builder, std::vector<size_t> outputs);

    const ExprBuilderConfig& config() const { return config_; }
    size_t num_limbs() const { return config_.num_limbs; }
    size_t num_inputs() const { return num_inputs_; }
    size_t num_vars() const { return constraints_.size(); }
    size_t num_flags() const { return num_flags_; }
    const std::vector<size_t>& outputs() const { return outputs_; }

    size_t width() const;
    size_t input_offset(size_t input) const { return 1 + input * num_limbs(); }
    size_t var_offset(size_t var) const { return 1 + (num_inputs_ + var) * num_limbs(); }
    size_t flag_offset(size_t flag) const { return flags_start_ + flag; }

    // Constraints on the core columns (first column is is_valid)
    void eval(AirBuilder& builder, const std::vector<Expr>& cols) const;

    /**
     * Values of every variable for the given inputs (canonical, < q).
     * Throws ExecutionError(ModularPrecondition) on division by a
     * non-invertible value.
     */
    std::vector<mpz_class> execute(const std::vector<mpz_class>& inputs, const std::vector<bool>& flags) const;

    // Fill the core columns of one row, counting its range checks
    void generate_row(BFieldElement* row, const std::vector<mpz_class>& inputs, const std::vector<mpz_class>& vars,
                      const std::vector<bool>& flags, VariableRangeCheckerChip& range_checker) const;

    std::vector<BFieldElement> to_limbs(const mpz_class& value) const;
    mpz_class from_limbs(const std::vector<BFieldElement>& limbs) const;

private:
    struct ConstraintLayout {
        size_t q_limbs = 1;
        size_t num_carries = 0;
        // Carry c is range checked as c + 2^carry_bits in carry_bits + 1 bits
        size_t carry_bits = 0;
        size_t offset = 0;
    };

    ExprBuilderConfig config_;
    std::vector<Node> nodes_;
    size_t num_inputs_;
    size_t num_flags_;
    std::vector<size_t> constraints_;
    std::vector<size_t> computes_;
    std::vector<size_t> outputs_;
    std::vector<int64_t> modulus_limbs_;
    std::vector<ConstraintLayout> layouts_;
    size_t flags_start_ = 0;

    std::vector<Expr> eval_symbolic(size_t node, const std::vector<Expr>& cols) const;
    std::vector<int64_t> eval_limbs(size_t node, const std::vector<std::vector<int64_t>>& input_limbs,
                                    const std::vector<std::vector<int64_t>>& var_limbs,
                                    const std::vector<bool>& flags) const;
    mpz_class eval_int(size_t node, const std::vector<mpz_class>& inputs, const std::vector<mpz_class>& vars,
                       const std::vector<bool>& flags) const;
    mpz_class eval_mod(size_t node, const std::vector<mpz_class>& inputs, const std::vector<mpz_class>& vars,
                       const std::vector<bool>& flags) const;
    std::vector<int64_t> byte_limbs(const mpz_class& value, size_t num_limbs) const;
};

} // namespace mod_builder
} // namespace zkrv
