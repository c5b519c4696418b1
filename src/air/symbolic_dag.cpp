#include "air/symbolic_dag.hpp"
#include <algorithm>
#include <map>
#include <tuple>
#include <unordered_map>

namespace zkrv {

namespace {

using NodeKey = std::tuple<uint8_t, uint8_t, uint32_t, uint32_t, uint32_t, uint32_t, uint32_t, uint32_t>;

NodeKey key_of(const DagNode& n) {
    return NodeKey(static_cast<uint8_t>(n.kind), static_cast<uint8_t>(n.var.entry), n.var.part_index,
                   n.var.offset, n.var.index, n.constant.value(), n.lhs, n.rhs);
}

class DagBuilder {
public:
    explicit DagBuilder(SymbolicDag& dag) : dag_(dag) {}

    uint32_t add(const std::shared_ptr<const SymbolicExpression::Node>& root) {
        // Iterative post-order; expression trees for wide AIRs get deep.
        std::vector<std::pair<const SymbolicExpression::Node*, bool>> stack;
        stack.emplace_back(root.get(), false);
        while (!stack.empty()) {
            auto [node, expanded] = stack.back();
            stack.pop_back();
            if (memo_.count(node)) {
                continue;
            }
            if (!expanded) {
                stack.emplace_back(node, true);
                if (node->rhs) {
                    stack.emplace_back(node->rhs.get(), false);
                }
                if (node->lhs) {
                    stack.emplace_back(node->lhs.get(), false);
                }
                continue;
            }
            DagNode n;
            n.kind = node->kind;
            n.extension = node->extension;
            n.degree = node->degree;
            if (node->kind == ExprKind::Variable) {
                n.var = node->var;
            } else if (node->kind == ExprKind::Constant) {
                n.constant = node->constant;
            }
            if (node->lhs) {
                n.lhs = memo_.at(node->lhs.get());
            }
            if (node->rhs) {
                n.rhs = memo_.at(node->rhs.get());
            }
            memo_[node] = intern(n);
        }
        return memo_.at(root.get());
    }

private:
    SymbolicDag& dag_;
    std::unordered_map<const SymbolicExpression::Node*, uint32_t> memo_;
    std::map<NodeKey, uint32_t> interned_;

    uint32_t intern(const DagNode& n) {
        NodeKey key = key_of(n);
        auto it = interned_.find(key);
        if (it != interned_.end()) {
            return it->second;
        }
        auto index = static_cast<uint32_t>(dag_.nodes.size());
        dag_.nodes.push_back(n);
        interned_.emplace(key, index);
        return index;
    }
};

} // namespace

SymbolicDag SymbolicDag::build(const std::vector<SymbolicExpression>& expressions) {
    SymbolicDag dag;
    DagBuilder builder(dag);
    dag.roots.reserve(expressions.size());
    for (const auto& expr : expressions) {
        dag.roots.push_back(builder.add(expr.node()));
    }
    return dag;
}

size_t SymbolicDag::max_degree() const {
    size_t degree = 0;
    for (uint32_t root : roots) {
        degree = std::max(degree, nodes[root].degree);
    }
    return degree;
}

} // namespace zkrv
