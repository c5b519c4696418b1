#pragma once

#include "air/air.hpp"
#include "hash/poseidon2.hpp"
#include <vector>

namespace zkrv {

/**
 * Poseidon2SubAir - one Poseidon2 permutation per row
 *
 * Column layout:
 *   inputs[16]
 *   4 beginning full rounds  { sbox_x3[16], post[16] }
 *   13 partial rounds        { sbox_x3, post_sbox }
 *   4 ending full rounds     { sbox_x3[16], post[16] }
 *
 * The S-box x^7 is split as x3 = x^3 and x^7 = x3^2 * x so every
 * constraint has degree 3. The output is the post state of the last round.
 */
class Poseidon2SubAir {
public:
    static constexpr size_t STATE_WIDTH = Poseidon2::WIDTH;
    static constexpr size_t FULL_ROUND_WIDTH = 2 * STATE_WIDTH;
    static constexpr size_t PARTIAL_ROUND_WIDTH = 2;
    static constexpr size_t WIDTH = STATE_WIDTH + 2 * Poseidon2::HALF_FULL_ROUNDS * FULL_ROUND_WIDTH +
                                    Poseidon2::PARTIAL_ROUNDS * PARTIAL_ROUND_WIDTH;
    static constexpr size_t OUTPUT_OFFSET = WIDTH - STATE_WIDTH;

    // cols must hold WIDTH expressions; returns the output state expressions.
    // Constraints hold on every row, so padding rows carry a real permutation.
    static std::vector<Expr> eval(AirBuilder& builder, const std::vector<Expr>& cols);

    // Fill WIDTH columns for one permutation of input
    static void generate_row(const Poseidon2::State& input, BFieldElement* row);
};

} // namespace zkrv
