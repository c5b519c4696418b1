#include "memory/offline_checker.hpp"
#include <stdexcept>

namespace zkrv {

std::vector<Expr> slice(const std::vector<Expr>& row, size_t offset, size_t len) {
    if (offset + len > row.size()) {
        throw std::out_of_range("column slice [" + std::to_string(offset) + ", " + std::to_string(offset + len) +
                                ") exceeds row width " + std::to_string(row.size()));
    }
    return std::vector<Expr>(row.begin() + offset, row.begin() + offset + len);
}

void AssertLtSubAir::eval(AirBuilder& builder, const Expr& x, const Expr& y, const std::vector<Expr>& limbs,
                          const Expr& count) const {
    builder.when(count).assert_eq(y - x - 1, compose_limbs(limbs, decomp));
    VariableRangeCheckerBus{decomp}.range_check_limbs(builder, limbs, max_bits, count);
}

void AssertLtSubAir::generate(VariableRangeCheckerChip& range_checker, uint32_t x, uint32_t y,
                              BFieldElement* limbs) const {
    if (x >= y) {
        throw std::invalid_argument("assert_lt: " + std::to_string(x) + " is not below " + std::to_string(y));
    }
    range_checker.decompose(y - x - 1, max_bits, limbs, num_limbs());
}

void MemoryBridge::access(AirBuilder& builder, const Expr& address_space, const Expr& pointer,
                          const std::vector<Expr>& prev_data, const std::vector<Expr>& data, const Expr& timestamp,
                          const std::vector<Expr>& aux, const Expr& count) const {
    const Expr& prev_timestamp = aux[0];
    std::vector<Expr> limbs(aux.begin() + 1, aux.begin() + 1 + lt_.num_limbs());

    std::vector<Expr> prev_fields{address_space, pointer};
    prev_fields.insert(prev_fields.end(), prev_data.begin(), prev_data.end());
    prev_fields.push_back(prev_timestamp);
    builder.push_receive(bus::MEMORY, std::move(prev_fields), count);

    std::vector<Expr> fields{address_space, pointer};
    fields.insert(fields.end(), data.begin(), data.end());
    fields.push_back(timestamp);
    builder.push_send(bus::MEMORY, std::move(fields), count);

    lt_.eval(builder, prev_timestamp, timestamp, limbs, count);
}

void MemoryBridge::read(AirBuilder& builder, const Expr& address_space, const Expr& pointer,
                        const std::vector<Expr>& data, const Expr& timestamp, const std::vector<Expr>& aux,
                        const Expr& count) const {
    access(builder, address_space, pointer, data, data, timestamp, aux, count);
}

void MemoryBridge::write(AirBuilder& builder, const Expr& address_space, const Expr& pointer,
                         const std::vector<Expr>& data, const Expr& timestamp, const std::vector<Expr>& aux,
                         const Expr& count) const {
    access(builder, address_space, pointer, prev_data(aux), data, timestamp, aux, count);
}

void MemoryAuxFiller::fill_read(BFieldElement* aux, const MemoryReadRecord& record) const {
    aux[0] = BFieldElement(record.prev_timestamp);
    lt_.generate(*range_checker_, record.prev_timestamp, record.timestamp, aux + 1);
}

void MemoryAuxFiller::fill_write(BFieldElement* aux, const MemoryWriteRecord& record) const {
    aux[0] = BFieldElement(record.prev_timestamp);
    lt_.generate(*range_checker_, record.prev_timestamp, record.timestamp, aux + 1);
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        aux[1 + lt_.num_limbs() + i] = record.prev_data[i];
    }
}

} // namespace zkrv
