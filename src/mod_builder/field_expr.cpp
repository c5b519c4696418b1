#include "mod_builder/field_expr.hpp"
#include "vm/execution_error.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace zkrv {
namespace mod_builder {

namespace {

ExprBuilderConfig make_config(const mpz_class& modulus, size_t num_limbs, size_t range_checker_bits) {
    if (modulus <= 2) {
        throw std::invalid_argument("field expression modulus must be an odd prime");
    }
    ExprBuilderConfig config;
    config.modulus = modulus;
    config.num_limbs = num_limbs;
    config.limb_bits = 8;
    config.range_checker_bits = range_checker_bits;
    if (mpz_sizeinbase(modulus.get_mpz_t(), 2) > num_limbs * config.limb_bits) {
        throw std::invalid_argument("modulus of " + std::to_string(mpz_sizeinbase(modulus.get_mpz_t(), 2)) +
                                    " bits does not fit " + std::to_string(num_limbs) + " limbs");
    }
    return config;
}

mpz_class reduce(const mpz_class& x, const mpz_class& modulus) {
    mpz_class r = x % modulus;
    if (r < 0) {
        r += modulus;
    }
    return r;
}

size_t bit_length(uint64_t x) {
    size_t bits = 0;
    while (x != 0) {
        ++bits;
        x >>= 1;
    }
    return bits;
}

uint64_t abs_u64(int64_t k) { return k < 0 ? static_cast<uint64_t>(-k) : static_cast<uint64_t>(k); }

} // namespace

ExprBuilderConfig config_256(const mpz_class& modulus, size_t range_checker_bits) {
    return make_config(modulus, 32, range_checker_bits);
}

ExprBuilderConfig config_384(const mpz_class& modulus, size_t range_checker_bits) {
    return make_config(modulus, 48, range_checker_bits);
}

// ============================================================================
// ExprBuilder
// ============================================================================

std::shared_ptr<ExprBuilder> ExprBuilder::create(const ExprBuilderConfig& config) {
    return std::shared_ptr<ExprBuilder>(new ExprBuilder(config));
}

uint64_t ExprBuilder::limb_threshold() const {
    // Leaves room for q * p and the carry offset within the range checker
    return uint64_t{1} << (config_.limb_bits + config_.range_checker_bits - 2);
}

Node ExprBuilder::leaf(NodeKind kind, size_t index) const {
    Node node;
    node.kind = kind;
    node.index = index;
    node.degree = 1;
    node.num_limbs = config_.num_limbs;
    node.limb_bound = (uint64_t{1} << config_.limb_bits) - 1;
    node.int_bound = (mpz_class(1) << static_cast<mp_bitcnt_t>(config_.num_limbs * config_.limb_bits)) - 1;
    return node;
}

Node ExprBuilder::combine(NodeKind kind, size_t lhs, size_t rhs) const {
    const Node& a = nodes_[lhs];
    const Node& b = nodes_[rhs];
    Node node;
    node.kind = kind;
    node.lhs = lhs;
    node.rhs = rhs;
    switch (kind) {
    case NodeKind::Add:
    case NodeKind::Sub:
        node.degree = std::max(a.degree, b.degree);
        node.num_limbs = std::max(a.num_limbs, b.num_limbs);
        node.limb_bound = a.limb_bound + b.limb_bound;
        node.int_bound = a.int_bound + b.int_bound;
        break;
    case NodeKind::Mul:
        node.degree = a.degree + b.degree;
        node.num_limbs = a.num_limbs + b.num_limbs - 1;
        node.limb_bound = a.limb_bound * b.limb_bound * std::min(a.num_limbs, b.num_limbs);
        node.int_bound = a.int_bound * b.int_bound;
        break;
    default:
        throw std::logic_error("combine: not a binary node kind");
    }
    return node;
}

bool ExprBuilder::fits(const Node& node) const {
    return node.degree <= MAX_DEGREE && node.limb_bound <= limb_threshold();
}

bool ExprBuilder::is_leaf(size_t node) const {
    const NodeKind kind = nodes_[node].kind;
    return kind == NodeKind::Input || kind == NodeKind::Var || kind == NodeKind::Const;
}

size_t ExprBuilder::add_node(Node node) {
    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

FieldVariable ExprBuilder::new_input() {
    const size_t node = add_node(leaf(NodeKind::Input, num_inputs_++));
    return FieldVariable(shared_from_this(), node);
}

size_t ExprBuilder::new_flag() { return num_flags_++; }

FieldVariable ExprBuilder::constant(const mpz_class& value) {
    Node node;
    node.kind = NodeKind::Const;
    node.constant = reduce(value, config_.modulus);
    node.degree = 1;
    const size_t bits = std::max<size_t>(mpz_sizeinbase(node.constant.get_mpz_t(), 2), 1);
    node.num_limbs = (bits + config_.limb_bits - 1) / config_.limb_bits;
    node.limb_bound = (uint64_t{1} << config_.limb_bits) - 1;
    node.int_bound = node.constant;
    return FieldVariable(shared_from_this(), add_node(std::move(node)));
}

std::pair<size_t, FieldVariable> ExprBuilder::new_var() {
    const size_t index = constraints_.size();
    const size_t node = add_node(leaf(NodeKind::Var, index));
    constraints_.push_back(NO_CONSTRAINT);
    computes_.push_back(NO_CONSTRAINT);
    return {index, FieldVariable(shared_from_this(), node)};
}

void ExprBuilder::set_constraint(size_t var, const FieldVariable& constraint) {
    if (var >= constraints_.size() || constraint.builder().get() != this) {
        throw std::invalid_argument("set_constraint: unknown variable or foreign expression");
    }
    if (nodes_[constraint.node()].degree > MAX_DEGREE) {
        throw std::logic_error("constraint of variable " + std::to_string(var) + " has degree " +
                               std::to_string(nodes_[constraint.node()].degree));
    }
    constraints_[var] = constraint.node();
}

void ExprBuilder::set_compute(size_t var, const FieldVariable& compute) {
    if (var >= computes_.size() || compute.builder().get() != this) {
        throw std::invalid_argument("set_compute: unknown variable or foreign expression");
    }
    computes_[var] = compute.node();
}

size_t ExprBuilder::save(size_t node) {
    if (nodes_[node].kind == NodeKind::Var) {
        return node;
    }
    const size_t index = constraints_.size();
    const size_t var = add_node(leaf(NodeKind::Var, index));
    // Built directly: node - var may sit just above the threshold
    const size_t constraint = add_node(combine(NodeKind::Sub, node, var));
    constraints_.push_back(constraint);
    computes_.push_back(node);
    return var;
}

size_t ExprBuilder::binary(NodeKind kind, size_t lhs, size_t rhs) {
    Node node = combine(kind, lhs, rhs);
    while (!fits(node)) {
        const bool lhs_savable = !is_leaf(lhs);
        const bool rhs_savable = !is_leaf(rhs);
        if (!lhs_savable && !rhs_savable) {
            throw std::logic_error("field expression too large for " + std::to_string(config_.num_limbs) +
                                   " limbs of " + std::to_string(config_.limb_bits) + " bits");
        }
        const bool pick_lhs =
            lhs_savable && (!rhs_savable || nodes_[lhs].limb_bound > nodes_[rhs].limb_bound ||
                            (nodes_[lhs].limb_bound == nodes_[rhs].limb_bound &&
                             nodes_[lhs].degree >= nodes_[rhs].degree));
        if (lhs == rhs) {
            lhs = rhs = save(lhs);
        } else if (pick_lhs) {
            lhs = save(lhs);
        } else {
            rhs = save(rhs);
        }
        node = combine(kind, lhs, rhs);
    }
    return add_node(std::move(node));
}

size_t ExprBuilder::scalar_op(NodeKind kind, size_t operand, int64_t scalar) {
    for (;;) {
        const Node& a = nodes_[operand];
        Node node;
        node.kind = kind;
        node.lhs = operand;
        node.scalar = scalar;
        node.num_limbs = a.num_limbs;
        if (kind == NodeKind::IntAdd) {
            node.degree = std::max<size_t>(a.degree, 1);
            node.limb_bound = a.limb_bound + abs_u64(scalar);
            node.int_bound = a.int_bound + mpz_class(static_cast<unsigned long>(abs_u64(scalar)));
        } else if (kind == NodeKind::IntMul) {
            node.degree = a.degree;
            node.limb_bound = a.limb_bound * abs_u64(scalar);
            node.int_bound = a.int_bound * mpz_class(static_cast<unsigned long>(abs_u64(scalar)));
        } else {
            throw std::logic_error("scalar_op: not a scalar node kind");
        }
        if (fits(node)) {
            return add_node(std::move(node));
        }
        if (is_leaf(operand)) {
            throw std::logic_error("scalar " + std::to_string(scalar) + " too large for the limb layout");
        }
        operand = save(operand);
    }
}

size_t ExprBuilder::select(size_t flag, size_t lhs, size_t rhs) {
    if (flag >= num_flags_) {
        throw std::invalid_argument("select on unknown flag " + std::to_string(flag));
    }
    for (;;) {
        const Node& a = nodes_[lhs];
        const Node& b = nodes_[rhs];
        Node node;
        node.kind = NodeKind::Select;
        node.index = flag;
        node.lhs = lhs;
        node.rhs = rhs;
        node.degree = std::max(a.degree, b.degree) + 1;
        node.num_limbs = std::max(a.num_limbs, b.num_limbs);
        node.limb_bound = std::max(a.limb_bound, b.limb_bound);
        node.int_bound = std::max(a.int_bound, b.int_bound);
        if (fits(node)) {
            return add_node(std::move(node));
        }
        if (!is_leaf(lhs) && (is_leaf(rhs) || a.degree >= b.degree)) {
            lhs = save(lhs);
        } else if (!is_leaf(rhs)) {
            rhs = save(rhs);
        } else {
            throw std::logic_error("select operands cannot be reduced further");
        }
    }
}

size_t ExprBuilder::divide(size_t lhs, size_t rhs) {
    // Canonical result: bounded like a variable
    Node node = leaf(NodeKind::Div, 0);
    node.lhs = lhs;
    node.rhs = rhs;
    return add_node(std::move(node));
}

// ============================================================================
// FieldVariable / Fp2
// ============================================================================

FieldVariable FieldVariable::operator+(const FieldVariable& rhs) const {
    return FieldVariable(builder_, builder_->binary(NodeKind::Add, node_, rhs.node_));
}

FieldVariable FieldVariable::operator-(const FieldVariable& rhs) const {
    return FieldVariable(builder_, builder_->binary(NodeKind::Sub, node_, rhs.node_));
}

FieldVariable FieldVariable::operator*(const FieldVariable& rhs) const {
    return FieldVariable(builder_, builder_->binary(NodeKind::Mul, node_, rhs.node_));
}

FieldVariable FieldVariable::operator/(const FieldVariable& rhs) const {
    auto z = builder_->new_var();
    builder_->set_constraint(z.first, z.second * rhs - *this);
    builder_->set_compute(z.first, div_unchecked(rhs));
    return z.second;
}

FieldVariable FieldVariable::div_unchecked(const FieldVariable& rhs) const {
    return FieldVariable(builder_, builder_->divide(node_, rhs.node_));
}

FieldVariable FieldVariable::int_add(int64_t k) const {
    return FieldVariable(builder_, builder_->scalar_op(NodeKind::IntAdd, node_, k));
}

FieldVariable FieldVariable::int_mul(int64_t k) const {
    return FieldVariable(builder_, builder_->scalar_op(NodeKind::IntMul, node_, k));
}

size_t FieldVariable::save() const { return builder_->nodes()[saved().node_].index; }

FieldVariable FieldVariable::saved() const { return FieldVariable(builder_, builder_->save(node_)); }

FieldVariable FieldVariable::select(size_t flag, const FieldVariable& if_set, const FieldVariable& if_unset) {
    return FieldVariable(if_set.builder_, if_set.builder_->select(flag, if_set.node_, if_unset.node_));
}

Fp2 Fp2::new_input(ExprBuilder& builder) { return {builder.new_input(), builder.new_input()}; }

Fp2 Fp2::operator*(const Fp2& rhs) const {
    return {c0 * rhs.c0 - c1 * rhs.c1, c0 * rhs.c1 + c1 * rhs.c0};
}

Fp2 Fp2::mul_by_small(int64_t xi0, int64_t xi1) const {
    return {c0.int_mul(xi0) - c1.int_mul(xi1), c0.int_mul(xi1) + c1.int_mul(xi0)};
}

// ============================================================================
// FieldExpr
// ============================================================================

FieldExpr::FieldExpr(const ExprBuilder& builder, std::vector<size_t> outputs)
    : config_(builder.config()),
      nodes_(builder.nodes()),
      num_inputs_(builder.num_inputs()),
      num_flags_(builder.num_flags()),
      constraints_(builder.constraints()),
      computes_(builder.computes()),
      outputs_(std::move(outputs)) {
    const size_t b = config_.limb_bits;
    for (size_t i = 0; i < constraints_.size(); ++i) {
        if (constraints_[i] == ExprBuilder::NO_CONSTRAINT || computes_[i] == ExprBuilder::NO_CONSTRAINT) {
            throw std::logic_error("variable " + std::to_string(i) + " lacks a constraint or a compute");
        }
    }
    for (size_t out : outputs_) {
        if (out >= constraints_.size()) {
            throw std::invalid_argument("output refers to unknown variable " + std::to_string(out));
        }
    }

    modulus_limbs_ = byte_limbs(config_.modulus, (mpz_sizeinbase(config_.modulus.get_mpz_t(), 2) + b - 1) / b);

    size_t offset = 1 + (num_inputs_ + constraints_.size()) * num_limbs();
    const uint64_t limb_max = (uint64_t{1} << b) - 1;
    for (size_t constraint : constraints_) {
        const Node& e = nodes_[constraint];
        if (e.degree > ExprBuilder::MAX_DEGREE) {
            throw std::logic_error("constraint degree " + std::to_string(e.degree) + " exceeds " +
                                   std::to_string(ExprBuilder::MAX_DEGREE));
        }
        ConstraintLayout layout;
        const mpz_class q_bound = e.int_bound / config_.modulus + 1;
        const size_t q_bits = mpz_sizeinbase(q_bound.get_mpz_t(), 2);
        layout.q_limbs = std::max<size_t>((q_bits + b - 1) / b, 1);
        const size_t total_limbs = std::max(e.num_limbs, layout.q_limbs + modulus_limbs_.size() - 1);
        layout.num_carries = total_limbs - 1;

        const uint64_t pq_bound = limb_max * limb_max * std::min(layout.q_limbs, modulus_limbs_.size());
        const uint64_t max_abs = e.limb_bound + pq_bound;
        const uint64_t carry_max = (max_abs + limb_max - 1) / limb_max;
        layout.carry_bits = bit_length(carry_max);
        if (layout.carry_bits + 1 > config_.range_checker_bits) {
            throw std::logic_error("carries of " + std::to_string(layout.carry_bits + 1) +
                                   " bits exceed the range checker");
        }
        layout.offset = offset;
        offset += layout.q_limbs + layout.num_carries;
        layouts_.push_back(layout);
    }
    flags_start_ = offset;
}

size_t FieldExpr::width() const { return flags_start_ + num_flags_; }

std::vector<int64_t> FieldExpr::byte_limbs(const mpz_class& value, size_t count) const {
    const size_t b = config_.limb_bits;
    const unsigned long mask = (1UL << b) - 1;
    mpz_class v = abs(value);
    std::vector<int64_t> limbs(count, 0);
    for (size_t i = 0; i < count; ++i) {
        limbs[i] = static_cast<int64_t>(mpz_get_ui(v.get_mpz_t()) & mask);
        v >>= static_cast<mp_bitcnt_t>(b);
    }
    if (v != 0) {
        throw std::logic_error("value does not fit " + std::to_string(count) + " limbs");
    }
    if (value < 0) {
        for (int64_t& limb : limbs) {
            limb = -limb;
        }
    }
    return limbs;
}

std::vector<BFieldElement> FieldExpr::to_limbs(const mpz_class& value) const {
    std::vector<BFieldElement> out;
    out.reserve(num_limbs());
    for (int64_t limb : byte_limbs(value, num_limbs())) {
        out.emplace_back(static_cast<uint64_t>(limb));
    }
    return out;
}

mpz_class FieldExpr::from_limbs(const std::vector<BFieldElement>& limbs) const {
    mpz_class value = 0;
    for (size_t i = limbs.size(); i-- > 0;) {
        value <<= static_cast<mp_bitcnt_t>(config_.limb_bits);
        value += static_cast<unsigned long>(limbs[i].value());
    }
    return value;
}

std::vector<Expr> FieldExpr::eval_symbolic(size_t index, const std::vector<Expr>& cols) const {
    const Node& node = nodes_[index];
    const Expr& is_valid = cols[0];
    switch (node.kind) {
    case NodeKind::Input:
        return std::vector<Expr>(cols.begin() + input_offset(node.index),
                                 cols.begin() + input_offset(node.index) + num_limbs());
    case NodeKind::Var:
        return std::vector<Expr>(cols.begin() + var_offset(node.index),
                                 cols.begin() + var_offset(node.index) + num_limbs());
    case NodeKind::Const: {
        std::vector<Expr> out;
        for (int64_t limb : byte_limbs(node.constant, node.num_limbs)) {
            out.push_back(is_valid * limb);
        }
        return out;
    }
    case NodeKind::Add:
    case NodeKind::Sub: {
        const std::vector<Expr> a = eval_symbolic(node.lhs, cols);
        const std::vector<Expr> b = eval_symbolic(node.rhs, cols);
        std::vector<Expr> out(std::max(a.size(), b.size()));
        for (size_t i = 0; i < out.size(); ++i) {
            if (i < a.size()) {
                out[i] += a[i];
            }
            if (i < b.size()) {
                out[i] = node.kind == NodeKind::Add ? out[i] + b[i] : out[i] - b[i];
            }
        }
        return out;
    }
    case NodeKind::Mul: {
        const std::vector<Expr> a = eval_symbolic(node.lhs, cols);
        const std::vector<Expr> b = eval_symbolic(node.rhs, cols);
        std::vector<Expr> out(a.size() + b.size() - 1);
        for (size_t i = 0; i < a.size(); ++i) {
            for (size_t j = 0; j < b.size(); ++j) {
                out[i + j] += a[i] * b[j];
            }
        }
        return out;
    }
    case NodeKind::IntAdd: {
        std::vector<Expr> out = eval_symbolic(node.lhs, cols);
        out[0] += is_valid * node.scalar;
        return out;
    }
    case NodeKind::IntMul: {
        std::vector<Expr> out = eval_symbolic(node.lhs, cols);
        for (Expr& limb : out) {
            limb = limb * node.scalar;
        }
        return out;
    }
    case NodeKind::Select: {
        const Expr& flag = cols[flag_offset(node.index)];
        const std::vector<Expr> a = eval_symbolic(node.lhs, cols);
        const std::vector<Expr> b = eval_symbolic(node.rhs, cols);
        std::vector<Expr> out(std::max(a.size(), b.size()));
        for (size_t i = 0; i < out.size(); ++i) {
            if (i < a.size()) {
                out[i] += flag * a[i];
            }
            if (i < b.size()) {
                out[i] += (is_valid - flag) * b[i];
            }
        }
        return out;
    }
    case NodeKind::Div:
        break;
    }
    throw std::logic_error("division inside a constraint");
}

void FieldExpr::eval(AirBuilder& builder, const std::vector<Expr>& cols) const {
    const size_t b = config_.limb_bits;
    const Expr& is_valid = cols[0];
    const VariableRangeCheckerBus range_bus{config_.range_checker_bits};

    builder.assert_bool(is_valid);
    Expr flag_sum;
    for (size_t f = 0; f < num_flags_; ++f) {
        const Expr& flag = cols[flag_offset(f)];
        builder.assert_bool(flag);
        builder.when(Expr(BFieldElement::one()) - is_valid).assert_zero(flag);
        flag_sum += flag;
    }
    if (num_flags_ > 1) {
        builder.assert_bool(flag_sum);
    }

    for (size_t v = 0; v < num_vars(); ++v) {
        for (size_t i = 0; i < num_limbs(); ++i) {
            range_bus.range_check(builder, cols[var_offset(v) + i], b, is_valid);
        }
    }

    for (size_t k = 0; k < constraints_.size(); ++k) {
        const ConstraintLayout& layout = layouts_[k];
        const std::vector<Expr> e = eval_symbolic(constraints_[k], cols);
        const std::vector<Expr> q(cols.begin() + layout.offset, cols.begin() + layout.offset + layout.q_limbs);
        const std::vector<Expr> carries(cols.begin() + layout.offset + layout.q_limbs,
                                        cols.begin() + layout.offset + layout.q_limbs + layout.num_carries);
        const size_t total = layout.num_carries + 1;

        for (size_t i = 0; i < total; ++i) {
            Expr limb = i < e.size() ? e[i] : Expr();
            for (size_t j = 0; j < modulus_limbs_.size(); ++j) {
                if (j <= i && i - j < q.size()) {
                    limb -= q[i - j] * modulus_limbs_[j];
                }
            }
            if (i > 0) {
                limb += carries[i - 1];
            }
            if (i + 1 < total) {
                limb -= carries[i] * static_cast<int64_t>(int64_t{1} << b);
            }
            builder.assert_zero(limb);
        }

        for (const Expr& limb : q) {
            range_bus.range_check(builder, limb + static_cast<int64_t>(int64_t{1} << b), b + 1, is_valid);
        }
        for (const Expr& carry : carries) {
            range_bus.range_check(builder, carry + static_cast<int64_t>(int64_t{1} << layout.carry_bits),
                                  layout.carry_bits + 1, is_valid);
        }
    }
}

mpz_class FieldExpr::eval_int(size_t index, const std::vector<mpz_class>& inputs, const std::vector<mpz_class>& vars,
                              const std::vector<bool>& flags) const {
    const Node& node = nodes_[index];
    switch (node.kind) {
    case NodeKind::Input:
        return inputs[node.index];
    case NodeKind::Var:
        return vars[node.index];
    case NodeKind::Const:
        return node.constant;
    case NodeKind::Add:
        return eval_int(node.lhs, inputs, vars, flags) + eval_int(node.rhs, inputs, vars, flags);
    case NodeKind::Sub:
        return eval_int(node.lhs, inputs, vars, flags) - eval_int(node.rhs, inputs, vars, flags);
    case NodeKind::Mul:
        return eval_int(node.lhs, inputs, vars, flags) * eval_int(node.rhs, inputs, vars, flags);
    case NodeKind::IntAdd:
        return eval_int(node.lhs, inputs, vars, flags) + mpz_class(static_cast<long>(node.scalar));
    case NodeKind::IntMul:
        return eval_int(node.lhs, inputs, vars, flags) * mpz_class(static_cast<long>(node.scalar));
    case NodeKind::Select:
        return flags[node.index] ? eval_int(node.lhs, inputs, vars, flags) : eval_int(node.rhs, inputs, vars, flags);
    case NodeKind::Div:
        break;
    }
    throw std::logic_error("division inside a constraint");
}

mpz_class FieldExpr::eval_mod(size_t index, const std::vector<mpz_class>& inputs, const std::vector<mpz_class>& vars,
                              const std::vector<bool>& flags) const {
    const Node& node = nodes_[index];
    const mpz_class& q = config_.modulus;
    switch (node.kind) {
    case NodeKind::Input:
        return reduce(inputs[node.index], q);
    case NodeKind::Var:
        return vars[node.index];
    case NodeKind::Const:
        return node.constant;
    case NodeKind::Add:
        return reduce(eval_mod(node.lhs, inputs, vars, flags) + eval_mod(node.rhs, inputs, vars, flags), q);
    case NodeKind::Sub:
        return reduce(eval_mod(node.lhs, inputs, vars, flags) - eval_mod(node.rhs, inputs, vars, flags), q);
    case NodeKind::Mul:
        return reduce(eval_mod(node.lhs, inputs, vars, flags) * eval_mod(node.rhs, inputs, vars, flags), q);
    case NodeKind::IntAdd:
        return reduce(eval_mod(node.lhs, inputs, vars, flags) + mpz_class(static_cast<long>(node.scalar)), q);
    case NodeKind::IntMul:
        return reduce(eval_mod(node.lhs, inputs, vars, flags) * mpz_class(static_cast<long>(node.scalar)), q);
    case NodeKind::Select:
        return flags[node.index] ? eval_mod(node.lhs, inputs, vars, flags) : eval_mod(node.rhs, inputs, vars, flags);
    case NodeKind::Div: {
        const mpz_class denominator = eval_mod(node.rhs, inputs, vars, flags);
        mpz_class inverse;
        if (mpz_invert(inverse.get_mpz_t(), denominator.get_mpz_t(), q.get_mpz_t()) == 0) {
            throw ExecutionError(ExecutionErrorKind::ModularPrecondition, 0,
                                 "division by a value with no inverse modulo " + q.get_str(16));
        }
        return reduce(eval_mod(node.lhs, inputs, vars, flags) * inverse, q);
    }
    }
    throw std::logic_error("unknown node kind");
}

std::vector<mpz_class> FieldExpr::execute(const std::vector<mpz_class>& inputs, const std::vector<bool>& flags) const {
    if (inputs.size() != num_inputs_ || flags.size() != num_flags_) {
        throw std::invalid_argument("field expression expects " + std::to_string(num_inputs_) + " inputs and " +
                                    std::to_string(num_flags_) + " flags");
    }
    std::vector<mpz_class> vars(num_vars());
    for (size_t i = 0; i < vars.size(); ++i) {
        vars[i] = eval_mod(computes_[i], inputs, vars, flags);
    }
    return vars;
}

std::vector<int64_t> FieldExpr::eval_limbs(size_t index, const std::vector<std::vector<int64_t>>& input_limbs,
                                           const std::vector<std::vector<int64_t>>& var_limbs,
                                           const std::vector<bool>& flags) const {
    const Node& node = nodes_[index];
    switch (node.kind) {
    case NodeKind::Input:
        return input_limbs[node.index];
    case NodeKind::Var:
        return var_limbs[node.index];
    case NodeKind::Const:
        return byte_limbs(node.constant, node.num_limbs);
    case NodeKind::Add:
    case NodeKind::Sub: {
        const std::vector<int64_t> a = eval_limbs(node.lhs, input_limbs, var_limbs, flags);
        const std::vector<int64_t> b = eval_limbs(node.rhs, input_limbs, var_limbs, flags);
        std::vector<int64_t> out(std::max(a.size(), b.size()), 0);
        for (size_t i = 0; i < a.size(); ++i) {
            out[i] += a[i];
        }
        for (size_t i = 0; i < b.size(); ++i) {
            out[i] += node.kind == NodeKind::Add ? b[i] : -b[i];
        }
        return out;
    }
    case NodeKind::Mul: {
        const std::vector<int64_t> a = eval_limbs(node.lhs, input_limbs, var_limbs, flags);
        const std::vector<int64_t> b = eval_limbs(node.rhs, input_limbs, var_limbs, flags);
        std::vector<int64_t> out(a.size() + b.size() - 1, 0);
        for (size_t i = 0; i < a.size(); ++i) {
            for (size_t j = 0; j < b.size(); ++j) {
                out[i + j] += a[i] * b[j];
            }
        }
        return out;
    }
    case NodeKind::IntAdd: {
        std::vector<int64_t> out = eval_limbs(node.lhs, input_limbs, var_limbs, flags);
        out[0] += node.scalar;
        return out;
    }
    case NodeKind::IntMul: {
        std::vector<int64_t> out = eval_limbs(node.lhs, input_limbs, var_limbs, flags);
        for (int64_t& limb : out) {
            limb *= node.scalar;
        }
        return out;
    }
    case NodeKind::Select: {
        std::vector<int64_t> out = flags[node.index] ? eval_limbs(node.lhs, input_limbs, var_limbs, flags)
                                                     : eval_limbs(node.rhs, input_limbs, var_limbs, flags);
        out.resize(std::max(nodes_[node.lhs].num_limbs, nodes_[node.rhs].num_limbs), 0);
        return out;
    }
    case NodeKind::Div:
        break;
    }
    throw std::logic_error("division inside a constraint");
}

void FieldExpr::generate_row(BFieldElement* row, const std::vector<mpz_class>& inputs,
                             const std::vector<mpz_class>& vars, const std::vector<bool>& flags,
                             VariableRangeCheckerChip& range_checker) const {
    const size_t b = config_.limb_bits;
    const int64_t base = int64_t{1} << b;
    row[0] = BFieldElement::one();

    std::vector<std::vector<int64_t>> input_limbs(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        input_limbs[i] = byte_limbs(inputs[i], num_limbs());
        for (size_t j = 0; j < num_limbs(); ++j) {
            row[input_offset(i) + j] = BFieldElement(static_cast<uint64_t>(input_limbs[i][j]));
        }
    }
    std::vector<std::vector<int64_t>> var_limbs(vars.size());
    for (size_t v = 0; v < vars.size(); ++v) {
        var_limbs[v] = byte_limbs(vars[v], num_limbs());
        for (size_t j = 0; j < num_limbs(); ++j) {
            row[var_offset(v) + j] = BFieldElement(static_cast<uint64_t>(var_limbs[v][j]));
            range_checker.add_count(static_cast<uint32_t>(var_limbs[v][j]), b);
        }
    }
    for (size_t f = 0; f < num_flags_; ++f) {
        row[flag_offset(f)] = flags[f] ? BFieldElement::one() : BFieldElement::zero();
    }

    for (size_t k = 0; k < constraints_.size(); ++k) {
        const ConstraintLayout& layout = layouts_[k];
        const mpz_class e_int = eval_int(constraints_[k], inputs, vars, flags);
        const mpz_class quotient = e_int / config_.modulus;
        if (quotient * config_.modulus != e_int) {
            throw std::logic_error("constraint " + std::to_string(k) + " not satisfied by the computed variables");
        }
        const std::vector<int64_t> q = byte_limbs(quotient, layout.q_limbs);
        for (size_t i = 0; i < q.size(); ++i) {
            row[layout.offset + i] = BFieldElement::from_i64(q[i]);
            range_checker.add_count(static_cast<uint32_t>(q[i] + base), b + 1);
        }

        const std::vector<int64_t> e = eval_limbs(constraints_[k], input_limbs, var_limbs, flags);
        const size_t total = layout.num_carries + 1;
        int64_t carry = 0;
        for (size_t i = 0; i < total; ++i) {
            int64_t limb = i < e.size() ? e[i] : 0;
            for (size_t j = 0; j < modulus_limbs_.size(); ++j) {
                if (j <= i && i - j < q.size()) {
                    limb -= q[i - j] * modulus_limbs_[j];
                }
            }
            limb += carry;
            if (i + 1 == total) {
                if (limb != 0) {
                    throw std::logic_error("carry chain of constraint " + std::to_string(k) + " does not close");
                }
                break;
            }
            if (limb % base != 0) {
                throw std::logic_error("limb " + std::to_string(i) + " of constraint " + std::to_string(k) +
                                       " is not divisible by the limb base");
            }
            carry = limb / base;
            row[layout.offset + layout.q_limbs + i] = BFieldElement::from_i64(carry);
            range_checker.add_count(static_cast<uint32_t>(carry + (int64_t{1} << layout.carry_bits)),
                                    layout.carry_bits + 1);
        }
    }
}

} // namespace mod_builder
} // namespace zkrv
