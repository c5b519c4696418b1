#include "air/air.hpp"
#include <stdexcept>

namespace zkrv {

SymbolicExpression SymbolicWindow::at(uint32_t offset, size_t column) const {
    if (column >= width_) {
        throw std::out_of_range("column " + std::to_string(column) + " outside window of width " +
                                std::to_string(width_));
    }
    SymbolicVariable var;
    var.entry = entry_;
    var.part_index = part_index_;
    var.offset = offset;
    var.index = static_cast<uint32_t>(column);
    return SymbolicExpression::variable(var);
}

std::vector<SymbolicExpression> SymbolicWindow::local_row() const {
    std::vector<SymbolicExpression> row;
    row.reserve(width_);
    for (size_t c = 0; c < width_; ++c) {
        row.push_back(local(c));
    }
    return row;
}

std::vector<SymbolicExpression> SymbolicWindow::next_row() const {
    std::vector<SymbolicExpression> row;
    row.reserve(width_);
    for (size_t c = 0; c < width_; ++c) {
        row.push_back(next(c));
    }
    return row;
}

void ConstraintScope::assert_zero(const SymbolicExpression& x) {
    builder_.assert_zero(condition_ * x);
}

void ConstraintScope::assert_zeros(const std::vector<SymbolicExpression>& xs) {
    for (const auto& x : xs) {
        assert_zero(x);
    }
}

void ConstraintScope::assert_eqs(const std::vector<SymbolicExpression>& a,
                                 const std::vector<SymbolicExpression>& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("assert_eqs: length mismatch");
    }
    for (size_t i = 0; i < a.size(); ++i) {
        assert_eq(a[i], b[i]);
    }
}

AirBuilder::AirBuilder(size_t preprocessed_width, std::vector<size_t> main_widths, size_t num_public_values)
    : preprocessed_width_(preprocessed_width),
      main_widths_(std::move(main_widths)),
      num_public_values_(num_public_values) {
    if (main_widths_.empty()) {
        throw std::invalid_argument("AIR needs at least the common main partition");
    }
}

SymbolicWindow AirBuilder::main() const {
    return partitioned_main(main_widths_.size() - 1);
}

SymbolicWindow AirBuilder::partitioned_main(size_t part) const {
    if (part >= main_widths_.size()) {
        throw std::out_of_range("main partition index out of range");
    }
    return SymbolicWindow(Entry::Main, static_cast<uint32_t>(part), main_widths_[part]);
}

SymbolicExpression AirBuilder::public_value(size_t index) const {
    if (index >= num_public_values_) {
        throw std::out_of_range("public value index out of range");
    }
    SymbolicVariable var;
    var.entry = Entry::Public;
    var.index = static_cast<uint32_t>(index);
    return SymbolicExpression::variable(var);
}

void AirBuilder::assert_zero(const SymbolicExpression& x) {
    if (x.is_zero()) {
        return;
    }
    if (x.is_constant()) {
        throw std::logic_error("AIR asserts a non-zero constant: " + x.to_string());
    }
    constraints_.push_back(x);
}

void AirBuilder::push_interaction(BusIndex bus, std::vector<SymbolicExpression> fields,
                                  SymbolicExpression count, InteractionType type) {
    if (count.is_zero()) {
        return;
    }
    SymbolicInteraction interaction;
    interaction.bus = bus;
    interaction.fields = std::move(fields);
    interaction.count = std::move(count);
    interaction.type = type;
    interactions_.push_back(std::move(interaction));
}

} // namespace zkrv
