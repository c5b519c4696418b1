#pragma once

#include "air/symbolic_expression.hpp"
#include "table/matrix.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zkrv {

using BusIndex = uint16_t;

enum class InteractionType : uint8_t {
    Send = 0,
    Receive = 1,
};

/**
 * One bus message declared by an AIR row: (bus, fields, count, kind).
 * A send contributes +count, a receive -count to the bus balance.
 */
struct SymbolicInteraction {
    BusIndex bus = 0;
    std::vector<SymbolicExpression> fields;
    SymbolicExpression count;
    InteractionType type = InteractionType::Send;
};

/**
 * SymbolicWindow - the local and next rows of one trace partition
 */
class SymbolicWindow {
public:
    SymbolicWindow() = default;
    SymbolicWindow(Entry entry, uint32_t part_index, size_t width)
        : entry_(entry), part_index_(part_index), width_(width) {}

    size_t width() const { return width_; }
    SymbolicExpression local(size_t column) const { return at(0, column); }
    SymbolicExpression next(size_t column) const { return at(1, column); }
    std::vector<SymbolicExpression> local_row() const;
    std::vector<SymbolicExpression> next_row() const;

private:
    Entry entry_ = Entry::Main;
    uint32_t part_index_ = 0;
    size_t width_ = 0;

    SymbolicExpression at(uint32_t offset, size_t column) const;
};

class AirBuilder;

/**
 * ConstraintScope - constraints multiplied by a condition
 *
 * builder.when(cond).assert_zero(x) asserts cond * x = 0.
 */
class ConstraintScope {
public:
    ConstraintScope(AirBuilder& builder, SymbolicExpression condition)
        : builder_(builder), condition_(std::move(condition)) {}

    void assert_zero(const SymbolicExpression& x);
    void assert_eq(const SymbolicExpression& a, const SymbolicExpression& b) { assert_zero(a - b); }
    void assert_one(const SymbolicExpression& x) { assert_zero(x - 1); }
    void assert_bool(const SymbolicExpression& x) { assert_zero(bool_check(x)); }
    void assert_zeros(const std::vector<SymbolicExpression>& xs);
    void assert_eqs(const std::vector<SymbolicExpression>& a, const std::vector<SymbolicExpression>& b);

    ConstraintScope when(const SymbolicExpression& cond) const { return ConstraintScope(builder_, condition_ * cond); }
    ConstraintScope when_ne(const SymbolicExpression& x, int64_t value) const { return when(x - value); }

private:
    AirBuilder& builder_;
    SymbolicExpression condition_;
};

/**
 * AirBuilder - symbolic builder every AIR evaluates against
 *
 * Main partitions are ordered cached partitions first, common partition
 * last. main() is the common partition.
 */
class AirBuilder {
public:
    AirBuilder(size_t preprocessed_width, std::vector<size_t> main_widths, size_t num_public_values);

    SymbolicWindow preprocessed() const { return SymbolicWindow(Entry::Preprocessed, 0, preprocessed_width_); }
    SymbolicWindow main() const;
    SymbolicWindow partitioned_main(size_t part) const;
    size_t num_main_partitions() const { return main_widths_.size(); }

    SymbolicExpression public_value(size_t index) const;
    size_t num_public_values() const { return num_public_values_; }

    static SymbolicExpression is_first_row() { return SymbolicExpression::is_first_row(); }
    static SymbolicExpression is_last_row() { return SymbolicExpression::is_last_row(); }
    static SymbolicExpression is_transition() { return SymbolicExpression::is_transition(); }

    void assert_zero(const SymbolicExpression& x);
    void assert_eq(const SymbolicExpression& a, const SymbolicExpression& b) { assert_zero(a - b); }
    void assert_one(const SymbolicExpression& x) { assert_zero(x - 1); }
    void assert_bool(const SymbolicExpression& x) { assert_zero(bool_check(x)); }

    ConstraintScope when(const SymbolicExpression& cond) { return ConstraintScope(*this, cond); }
    ConstraintScope when_first_row() { return when(is_first_row()); }
    ConstraintScope when_last_row() { return when(is_last_row()); }
    ConstraintScope when_transition() { return when(is_transition()); }

    void push_interaction(BusIndex bus, std::vector<SymbolicExpression> fields,
                          SymbolicExpression count, InteractionType type);
    void push_send(BusIndex bus, std::vector<SymbolicExpression> fields, SymbolicExpression count) {
        push_interaction(bus, std::move(fields), std::move(count), InteractionType::Send);
    }
    void push_receive(BusIndex bus, std::vector<SymbolicExpression> fields, SymbolicExpression count) {
        push_interaction(bus, std::move(fields), std::move(count), InteractionType::Receive);
    }

    const std::vector<SymbolicExpression>& constraints() const { return constraints_; }
    const std::vector<SymbolicInteraction>& interactions() const { return interactions_; }

private:
    size_t preprocessed_width_;
    std::vector<size_t> main_widths_;
    size_t num_public_values_;
    std::vector<SymbolicExpression> constraints_;
    std::vector<SymbolicInteraction> interactions_;
};

/**
 * Air - algebraic intermediate representation of one chip
 *
 * An AIR declares its partition widths, an optional preprocessed trace and
 * its constraints and bus messages through eval().
 */
class Air {
public:
    virtual ~Air() = default;

    virtual std::string name() const = 0;

    // Width of the common (non-cached) main partition
    virtual size_t width() const = 0;

    virtual std::vector<size_t> cached_main_widths() const { return {}; }

    virtual std::optional<RowMajorMatrix<BFieldElement>> preprocessed_trace() const { return std::nullopt; }

    virtual size_t num_public_values() const { return 0; }

    virtual void eval(AirBuilder& builder) const = 0;
};

using AirRef = std::shared_ptr<const Air>;

} // namespace zkrv
