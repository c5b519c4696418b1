#include "proof_stream/challenger.hpp"
#include <stdexcept>

namespace zkrv {

DuplexChallenger::DuplexChallenger() : sponge_state_{} {
    input_buffer_.reserve(Poseidon2::RATE);
    output_buffer_.reserve(Poseidon2::RATE);
}

void DuplexChallenger::duplexing() {
    if (input_buffer_.size() > Poseidon2::RATE) {
        throw std::logic_error("Challenger input buffer overflow");
    }
    for (size_t i = 0; i < input_buffer_.size(); ++i) {
        sponge_state_[i] = input_buffer_[i];
    }
    input_buffer_.clear();

    Poseidon2::permute(sponge_state_);

    output_buffer_.assign(sponge_state_.begin(), sponge_state_.begin() + Poseidon2::RATE);
}

void DuplexChallenger::observe(BFieldElement value) {
    // Any buffered output is stale once new input arrives
    output_buffer_.clear();
    input_buffer_.push_back(value);
    if (input_buffer_.size() == Poseidon2::RATE) {
        duplexing();
    }
}

void DuplexChallenger::observe(const Digest& digest) {
    for (const auto& e : digest.elements()) {
        observe(e);
    }
}

void DuplexChallenger::observe(const XFieldElement& value) {
    for (const auto& c : value.coefficients()) {
        observe(c);
    }
}

void DuplexChallenger::observe_slice(const std::vector<BFieldElement>& values) {
    for (const auto& v : values) {
        observe(v);
    }
}

void DuplexChallenger::observe_ext_slice(const std::vector<XFieldElement>& values) {
    for (const auto& v : values) {
        observe(v);
    }
}

BFieldElement DuplexChallenger::sample() {
    if (!input_buffer_.empty() || output_buffer_.empty()) {
        duplexing();
    }
    BFieldElement value = output_buffer_.back();
    output_buffer_.pop_back();
    return value;
}

XFieldElement DuplexChallenger::sample_ext() {
    BFieldElement c0 = sample();
    BFieldElement c1 = sample();
    BFieldElement c2 = sample();
    BFieldElement c3 = sample();
    return XFieldElement(c0, c1, c2, c3);
}

size_t DuplexChallenger::sample_bits(size_t bits) {
    if (bits >= BFieldElement::BITS) {
        throw std::invalid_argument("sample_bits: too many bits requested");
    }
    return static_cast<size_t>(sample().value()) & ((size_t{1} << bits) - 1);
}

BFieldElement DuplexChallenger::grind(size_t bits) {
    if (bits == 0) {
        BFieldElement witness = BFieldElement::zero();
        observe(witness);
        return witness;
    }
    for (uint32_t candidate = 0; candidate < BFieldElement::MODULUS; ++candidate) {
        DuplexChallenger fork = *this;
        BFieldElement witness(candidate);
        if (fork.check_witness(bits, witness)) {
            *this = fork;
            return witness;
        }
    }
    throw std::runtime_error("Proof-of-work grinding exhausted the field");
}

bool DuplexChallenger::check_witness(size_t bits, BFieldElement witness) {
    observe(witness);
    return bits == 0 || sample_bits(bits) == 0;
}

} // namespace zkrv
