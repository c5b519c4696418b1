#pragma once

#include "types/b_field_element.hpp"
#include "types/digest.hpp"
#include <array>
#include <vector>

namespace zkrv {

/**
 * Poseidon2 - Arithmetization-oriented permutation over BabyBear
 *
 * Width 16, S-box x^7, 4 + 4 full rounds around 13 partial rounds.
 * External layer: circulant M4 blocks followed by column sums.
 * Internal layer: state_i <- state_i * V_i + sum(state).
 *
 * Round constants are drawn from a ChaCha12 stream with a fixed seed,
 * so every build derives the same permutation.
 */
class Poseidon2 {
public:
    static constexpr size_t WIDTH = 16;
    static constexpr size_t RATE = 8;
    static constexpr size_t CAPACITY = 8;
    static constexpr size_t DIGEST_LEN = Digest::LEN;
    static constexpr size_t SBOX_DEGREE = 7;
    static constexpr size_t HALF_FULL_ROUNDS = 4;
    static constexpr size_t PARTIAL_ROUNDS = 13;
    static constexpr uint64_t ROUND_CONSTANT_SEED = 0x5a4b5256504f5332ULL;

    using State = std::array<BFieldElement, WIDTH>;

    struct RoundConstants {
        std::array<State, HALF_FULL_ROUNDS> beginning_full;
        std::array<BFieldElement, PARTIAL_ROUNDS> partial;
        std::array<State, HALF_FULL_ROUNDS> ending_full;
    };

    static const RoundConstants& round_constants();

    // Diagonal V of the internal matrix (1 + diag(V))
    static const State& internal_diagonal();

    static BFieldElement sbox(BFieldElement x);

    // Linear layers (exposed for the permutation AIR)
    static void external_linear_layer(State& state);
    static void internal_linear_layer(State& state);

    // Core permutation
    static void permute(State& state);

    // 2-to-1 compression: first 8 words of permute(left || right)
    static Digest compress(const Digest& left, const Digest& right);

    // Padding-free overwrite sponge; empty input hashes to zero
    static Digest hash_varlen(const std::vector<BFieldElement>& input);
    static Digest hash_varlen(const BFieldElement* input, size_t len);
};

} // namespace zkrv
