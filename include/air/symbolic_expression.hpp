#pragma once

#include "types/b_field_element.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace zkrv {

/**
 * Where a symbolic variable reads its value from.
 *
 * Preprocessed, Main and Permutation variables are trace cells (row offset
 * 0 = local, 1 = next). Public, Challenge and Exposed are per-proof scalars.
 * Permutation (after-challenge), Challenge and Exposed values live in E.
 */
enum class Entry : uint8_t {
    Preprocessed = 0,
    Main = 1,
    Permutation = 2,
    Public = 3,
    Challenge = 4,
    Exposed = 5,
};

struct SymbolicVariable {
    Entry entry = Entry::Main;
    uint32_t part_index = 0;
    uint32_t offset = 0;
    uint32_t index = 0;

    bool is_trace_cell() const {
        return entry == Entry::Preprocessed || entry == Entry::Main || entry == Entry::Permutation;
    }
    bool is_extension() const {
        return entry == Entry::Permutation || entry == Entry::Challenge || entry == Entry::Exposed;
    }
    size_t degree_multiple() const { return is_trace_cell() ? 1 : 0; }

    bool operator==(const SymbolicVariable& o) const {
        return entry == o.entry && part_index == o.part_index && offset == o.offset && index == o.index;
    }
};

enum class ExprKind : uint8_t {
    Variable = 0,
    IsFirstRow = 1,
    IsLastRow = 2,
    IsTransition = 3,
    Constant = 4,
    Add = 5,
    Sub = 6,
    Neg = 7,
    Mul = 8,
};

/**
 * SymbolicExpression - immutable expression tree over trace variables
 *
 * Nodes are shared, so reusing a sub-expression costs nothing and the
 * DAG compiler sees the sharing. Constants are folded on construction.
 * degree_multiple() counts trace-polynomial factors; the row selectors
 * IsFirstRow and IsLastRow count as 1, IsTransition as 0.
 */
class SymbolicExpression {
public:
    struct Node {
        ExprKind kind = ExprKind::Constant;
        SymbolicVariable var;
        BFieldElement constant;
        std::shared_ptr<const Node> lhs;
        std::shared_ptr<const Node> rhs;
        size_t degree = 0;
        bool extension = false;
    };

    SymbolicExpression();
    SymbolicExpression(BFieldElement constant);  // NOLINT(google-explicit-constructor)

    static SymbolicExpression from_i64(int64_t value);
    static SymbolicExpression from_u64(uint64_t value);
    static SymbolicExpression variable(const SymbolicVariable& var);
    static SymbolicExpression is_first_row();
    static SymbolicExpression is_last_row();
    static SymbolicExpression is_transition();

    ExprKind kind() const { return node_->kind; }
    size_t degree_multiple() const { return node_->degree; }
    bool is_extension() const { return node_->extension; }
    bool is_constant() const { return node_->kind == ExprKind::Constant; }
    bool is_zero() const { return is_constant() && node_->constant.is_zero(); }
    bool is_one() const { return is_constant() && node_->constant.is_one(); }
    BFieldElement constant_value() const { return node_->constant; }
    const std::shared_ptr<const Node>& node() const { return node_; }

    SymbolicExpression& operator+=(const SymbolicExpression& rhs);
    SymbolicExpression& operator-=(const SymbolicExpression& rhs);
    SymbolicExpression& operator*=(const SymbolicExpression& rhs);

    SymbolicExpression square() const { return *this * *this; }

    std::string to_string() const;

    friend SymbolicExpression operator+(const SymbolicExpression& a, const SymbolicExpression& b);
    friend SymbolicExpression operator-(const SymbolicExpression& a, const SymbolicExpression& b);
    friend SymbolicExpression operator*(const SymbolicExpression& a, const SymbolicExpression& b);
    friend SymbolicExpression operator-(const SymbolicExpression& a);

private:
    explicit SymbolicExpression(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

    static SymbolicExpression make_binary(ExprKind kind, const SymbolicExpression& a, const SymbolicExpression& b);

    std::shared_ptr<const Node> node_;
};

using Expr = SymbolicExpression;

SymbolicExpression operator+(const SymbolicExpression& a, int64_t b);
SymbolicExpression operator+(int64_t a, const SymbolicExpression& b);
SymbolicExpression operator-(const SymbolicExpression& a, int64_t b);
SymbolicExpression operator-(int64_t a, const SymbolicExpression& b);
SymbolicExpression operator*(const SymbolicExpression& a, int64_t b);
SymbolicExpression operator*(int64_t a, const SymbolicExpression& b);

// Sum / dot helpers used throughout the chips
SymbolicExpression sum_of(const std::vector<SymbolicExpression>& terms);

// x * (x - 1), zero iff x is boolean
SymbolicExpression bool_check(const SymbolicExpression& x);

// a + b - 2ab for boolean a, b
SymbolicExpression xor_expr(const SymbolicExpression& a, const SymbolicExpression& b);

// Little-endian composition sum_i limbs[i] * 2^(i * limb_bits)
SymbolicExpression compose_limbs(const std::vector<SymbolicExpression>& limbs, size_t limb_bits);

} // namespace zkrv
