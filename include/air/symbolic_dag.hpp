#pragma once

#include "air/symbolic_expression.hpp"
#include "types/x_field_element.hpp"
#include <cstdint>
#include <vector>

namespace zkrv {

struct DagNode {
    ExprKind kind = ExprKind::Constant;
    SymbolicVariable var;
    BFieldElement constant;
    uint32_t lhs = 0;
    uint32_t rhs = 0;
    bool extension = false;
    size_t degree = 0;
};

/**
 * SymbolicDag - topologically ordered, deduplicated expression nodes
 *
 * Every node index is smaller than the indices of the nodes using it, so a
 * single forward pass evaluates the whole DAG. Structurally equal
 * sub-expressions share one node.
 */
struct SymbolicDag {
    std::vector<DagNode> nodes;
    // Root node of every compiled expression, in input order
    std::vector<uint32_t> roots;

    static SymbolicDag build(const std::vector<SymbolicExpression>& expressions);

    size_t max_degree() const;
    size_t size() const { return nodes.size(); }
};

inline XFieldElement lift(BFieldElement value) { return XFieldElement(value); }
inline const XFieldElement& lift(const XFieldElement& value) { return value; }

/**
 * Supplies variable and selector values for one evaluation point: a trace
 * row (B = BFieldElement) or an out-of-domain point (B = XFieldElement).
 */
template <typename B>
class VariableSource {
public:
    virtual ~VariableSource() = default;

    // Preprocessed, Main and Public variables
    virtual B base(const SymbolicVariable& var) const = 0;
    // Permutation, Challenge and Exposed variables
    virtual XFieldElement extension(const SymbolicVariable& var) const = 0;

    virtual B is_first_row() const = 0;
    virtual B is_last_row() const = 0;
    virtual B is_transition() const = 0;
};

/**
 * DagEvaluator - one forward pass over a SymbolicDag
 *
 * Base nodes are computed in B and extension nodes in the extension field.
 * An evaluator owns its scratch buffers; use one per thread.
 */
template <typename B>
class DagEvaluator {
public:
    explicit DagEvaluator(const SymbolicDag& dag)
        : dag_(dag), base_(dag.nodes.size()), ext_(dag.nodes.size()) {}

    void evaluate(const VariableSource<B>& source) {
        const auto& nodes = dag_.nodes;
        for (size_t i = 0; i < nodes.size(); ++i) {
            const DagNode& n = nodes[i];
            if (n.extension) {
                ext_[i] = eval_ext(n, source);
            } else {
                base_[i] = eval_base(n, source);
            }
        }
    }

    XFieldElement value(uint32_t node) const {
        return dag_.nodes[node].extension ? ext_[node] : lift(base_[node]);
    }

    B base_value(uint32_t node) const { return base_[node]; }

    XFieldElement root_value(size_t root) const { return value(dag_.roots[root]); }

    // Horner fold of all roots: acc = acc * alpha + c_i
    XFieldElement fold_roots(const XFieldElement& alpha) const {
        XFieldElement acc = XFieldElement::zero();
        for (uint32_t root : dag_.roots) {
            acc = acc * alpha + value(root);
        }
        return acc;
    }

private:
    const SymbolicDag& dag_;
    std::vector<B> base_;
    std::vector<XFieldElement> ext_;

    B eval_base(const DagNode& n, const VariableSource<B>& source) const {
        switch (n.kind) {
            case ExprKind::Variable: return source.base(n.var);
            case ExprKind::IsFirstRow: return source.is_first_row();
            case ExprKind::IsLastRow: return source.is_last_row();
            case ExprKind::IsTransition: return source.is_transition();
            case ExprKind::Constant: return B(n.constant);
            case ExprKind::Add: return base_[n.lhs] + base_[n.rhs];
            case ExprKind::Sub: return base_[n.lhs] - base_[n.rhs];
            case ExprKind::Neg: return -base_[n.lhs];
            case ExprKind::Mul: return base_[n.lhs] * base_[n.rhs];
        }
        return B();
    }

    XFieldElement eval_ext(const DagNode& n, const VariableSource<B>& source) const {
        switch (n.kind) {
            case ExprKind::Variable: return source.extension(n.var);
            case ExprKind::Add: return value(n.lhs) + value(n.rhs);
            case ExprKind::Sub: return value(n.lhs) - value(n.rhs);
            case ExprKind::Neg: return -value(n.lhs);
            case ExprKind::Mul: return value(n.lhs) * value(n.rhs);
            default: return lift(eval_base(n, source));
        }
    }
};

} // namespace zkrv
