#include "types/digest.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace zkrv {

bool Digest::operator<(const Digest& rhs) const {
    for (size_t i = 0; i < LEN; ++i) {
        if (elements_[i] != rhs.elements_[i]) {
            return elements_[i] < rhs.elements_[i];
        }
    }
    return false;
}

std::string Digest::to_hex() const {
    std::ostringstream oss;
    for (size_t i = 0; i < LEN; ++i) {
        uint32_t val = elements_[i].value();
        for (size_t byte_idx = 0; byte_idx < 4; ++byte_idx) {
            uint8_t byte_val = static_cast<uint8_t>((val >> (byte_idx * 8)) & 0xFF);
            oss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte_val);
        }
    }
    return oss.str();
}

Digest Digest::from_hex(const std::string& hex) {
    if (hex.length() != LEN * 8) {
        throw std::invalid_argument("Invalid hex string length for Digest");
    }

    std::array<BFieldElement, LEN> elements;
    for (size_t i = 0; i < LEN; ++i) {
        std::string chunk = hex.substr(i * 8, 8);
        uint64_t value = 0;
        for (size_t byte_idx = 0; byte_idx < 4; ++byte_idx) {
            std::string byte_str = chunk.substr(byte_idx * 2, 2);
            uint8_t byte_val = static_cast<uint8_t>(std::stoul(byte_str, nullptr, 16));
            value |= static_cast<uint64_t>(byte_val) << (byte_idx * 8);
        }
        if (value >= BFieldElement::MODULUS) {
            throw std::invalid_argument("Digest element out of range: " + chunk);
        }
        elements[i] = BFieldElement(value);
    }

    return Digest(elements);
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    return os << digest.to_hex();
}

} // namespace zkrv
