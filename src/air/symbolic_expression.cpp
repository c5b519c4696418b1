#include "air/symbolic_expression.hpp"
#include <algorithm>
#include <sstream>

namespace zkrv {

namespace {

std::shared_ptr<const SymbolicExpression::Node> make_constant_node(BFieldElement value) {
    auto node = std::make_shared<SymbolicExpression::Node>();
    node->kind = ExprKind::Constant;
    node->constant = value;
    return node;
}

const std::shared_ptr<const SymbolicExpression::Node>& zero_node() {
    static const std::shared_ptr<const SymbolicExpression::Node> zero = make_constant_node(BFieldElement::zero());
    return zero;
}

std::shared_ptr<const SymbolicExpression::Node> make_selector_node(ExprKind kind) {
    auto node = std::make_shared<SymbolicExpression::Node>();
    node->kind = kind;
    node->degree = kind == ExprKind::IsTransition ? 0 : 1;
    return node;
}

} // namespace

SymbolicExpression::SymbolicExpression() : node_(zero_node()) {}

SymbolicExpression::SymbolicExpression(BFieldElement constant)
    : node_(constant.is_zero() ? zero_node() : make_constant_node(constant)) {}

SymbolicExpression SymbolicExpression::from_i64(int64_t value) {
    return SymbolicExpression(BFieldElement::from_i64(value));
}

SymbolicExpression SymbolicExpression::from_u64(uint64_t value) {
    return SymbolicExpression(BFieldElement(value));
}

SymbolicExpression SymbolicExpression::variable(const SymbolicVariable& var) {
    auto node = std::make_shared<Node>();
    node->kind = ExprKind::Variable;
    node->var = var;
    node->degree = var.degree_multiple();
    node->extension = var.is_extension();
    return SymbolicExpression(std::shared_ptr<const Node>(std::move(node)));
}

SymbolicExpression SymbolicExpression::is_first_row() {
    static const auto node = make_selector_node(ExprKind::IsFirstRow);
    return SymbolicExpression(node);
}

SymbolicExpression SymbolicExpression::is_last_row() {
    static const auto node = make_selector_node(ExprKind::IsLastRow);
    return SymbolicExpression(node);
}

SymbolicExpression SymbolicExpression::is_transition() {
    static const auto node = make_selector_node(ExprKind::IsTransition);
    return SymbolicExpression(node);
}

SymbolicExpression SymbolicExpression::make_binary(ExprKind kind, const SymbolicExpression& a,
                                                   const SymbolicExpression& b) {
    auto node = std::make_shared<Node>();
    node->kind = kind;
    node->lhs = a.node_;
    node->rhs = b.node_;
    node->degree = kind == ExprKind::Mul ? a.degree_multiple() + b.degree_multiple()
                                         : std::max(a.degree_multiple(), b.degree_multiple());
    node->extension = a.is_extension() || b.is_extension();
    return SymbolicExpression(std::shared_ptr<const Node>(std::move(node)));
}

SymbolicExpression operator+(const SymbolicExpression& a, const SymbolicExpression& b) {
    if (a.is_constant() && b.is_constant()) {
        return SymbolicExpression(a.constant_value() + b.constant_value());
    }
    if (a.is_zero()) return b;
    if (b.is_zero()) return a;
    return SymbolicExpression::make_binary(ExprKind::Add, a, b);
}

SymbolicExpression operator-(const SymbolicExpression& a, const SymbolicExpression& b) {
    if (a.is_constant() && b.is_constant()) {
        return SymbolicExpression(a.constant_value() - b.constant_value());
    }
    if (b.is_zero()) return a;
    if (a.is_zero()) return -b;
    return SymbolicExpression::make_binary(ExprKind::Sub, a, b);
}

SymbolicExpression operator*(const SymbolicExpression& a, const SymbolicExpression& b) {
    if (a.is_constant() && b.is_constant()) {
        return SymbolicExpression(a.constant_value() * b.constant_value());
    }
    if (a.is_zero() || b.is_zero()) return SymbolicExpression();
    if (a.is_one()) return b;
    if (b.is_one()) return a;
    return SymbolicExpression::make_binary(ExprKind::Mul, a, b);
}

SymbolicExpression operator-(const SymbolicExpression& a) {
    if (a.is_constant()) {
        return SymbolicExpression(-a.constant_value());
    }
    auto node = std::make_shared<SymbolicExpression::Node>();
    node->kind = ExprKind::Neg;
    node->lhs = a.node_;
    node->degree = a.degree_multiple();
    node->extension = a.is_extension();
    return SymbolicExpression(std::shared_ptr<const SymbolicExpression::Node>(std::move(node)));
}

SymbolicExpression& SymbolicExpression::operator+=(const SymbolicExpression& rhs) {
    *this = *this + rhs;
    return *this;
}

SymbolicExpression& SymbolicExpression::operator-=(const SymbolicExpression& rhs) {
    *this = *this - rhs;
    return *this;
}

SymbolicExpression& SymbolicExpression::operator*=(const SymbolicExpression& rhs) {
    *this = *this * rhs;
    return *this;
}

SymbolicExpression operator+(const SymbolicExpression& a, int64_t b) { return a + SymbolicExpression::from_i64(b); }
SymbolicExpression operator+(int64_t a, const SymbolicExpression& b) { return SymbolicExpression::from_i64(a) + b; }
SymbolicExpression operator-(const SymbolicExpression& a, int64_t b) { return a - SymbolicExpression::from_i64(b); }
SymbolicExpression operator-(int64_t a, const SymbolicExpression& b) { return SymbolicExpression::from_i64(a) - b; }
SymbolicExpression operator*(const SymbolicExpression& a, int64_t b) { return a * SymbolicExpression::from_i64(b); }
SymbolicExpression operator*(int64_t a, const SymbolicExpression& b) { return SymbolicExpression::from_i64(a) * b; }

SymbolicExpression sum_of(const std::vector<SymbolicExpression>& terms) {
    SymbolicExpression acc;
    for (const auto& t : terms) {
        acc += t;
    }
    return acc;
}

SymbolicExpression bool_check(const SymbolicExpression& x) {
    return x * (x - 1);
}

SymbolicExpression xor_expr(const SymbolicExpression& a, const SymbolicExpression& b) {
    return a + b - 2 * (a * b);
}

SymbolicExpression compose_limbs(const std::vector<SymbolicExpression>& limbs, size_t limb_bits) {
    SymbolicExpression acc;
    BFieldElement radix = BFieldElement::two().pow(limb_bits);
    BFieldElement scale = BFieldElement::one();
    for (const auto& limb : limbs) {
        acc += limb * SymbolicExpression(scale);
        scale *= radix;
    }
    return acc;
}

namespace {

void print_node(std::ostringstream& os, const SymbolicExpression::Node& n) {
    switch (n.kind) {
        case ExprKind::Variable: {
            static const char* names[] = {"pre", "main", "perm", "pub", "chal", "exp"};
            os << names[static_cast<int>(n.var.entry)];
            if (n.var.entry == Entry::Main) os << n.var.part_index;
            os << "[" << n.var.index << "]";
            if (n.var.offset == 1) os << "'";
            break;
        }
        case ExprKind::IsFirstRow: os << "is_first_row"; break;
        case ExprKind::IsLastRow: os << "is_last_row"; break;
        case ExprKind::IsTransition: os << "is_transition"; break;
        case ExprKind::Constant: os << n.constant; break;
        case ExprKind::Neg: os << "-("; print_node(os, *n.lhs); os << ")"; break;
        case ExprKind::Add:
        case ExprKind::Sub:
        case ExprKind::Mul: {
            const char* op = n.kind == ExprKind::Add ? " + " : (n.kind == ExprKind::Sub ? " - " : " * ");
            os << "(";
            print_node(os, *n.lhs);
            os << op;
            print_node(os, *n.rhs);
            os << ")";
            break;
        }
    }
}

} // namespace

std::string SymbolicExpression::to_string() const {
    std::ostringstream os;
    print_node(os, *node_);
    return os.str();
}

} // namespace zkrv
