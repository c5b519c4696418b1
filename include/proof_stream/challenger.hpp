#pragma once

#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include "types/digest.hpp"
#include "hash/poseidon2.hpp"
#include <vector>

namespace zkrv {

/**
 * DuplexChallenger - Fiat-Shamir transcript over the Poseidon2 sponge
 *
 * Observed elements are buffered and absorbed RATE at a time (overwrite
 * mode). Sampling flushes pending input, then pops from the squeezed rate
 * portion. Prover and verifier must issue identical observe/sample calls.
 */
class DuplexChallenger {
public:
    DuplexChallenger();

    void observe(BFieldElement value);
    void observe(const Digest& digest);
    void observe(const XFieldElement& value);
    void observe_slice(const std::vector<BFieldElement>& values);
    void observe_ext_slice(const std::vector<XFieldElement>& values);

    BFieldElement sample();
    XFieldElement sample_ext();

    // Uniform-ish integer below 2^bits taken from the low bits of a sample
    size_t sample_bits(size_t bits);

    // Proof-of-work: find a witness whose observation makes the next
    // sample_bits(bits) zero. The witness is observed on return.
    BFieldElement grind(size_t bits);
    bool check_witness(size_t bits, BFieldElement witness);

private:
    Poseidon2::State sponge_state_;
    std::vector<BFieldElement> input_buffer_;
    std::vector<BFieldElement> output_buffer_;

    void duplexing();
};

} // namespace zkrv
