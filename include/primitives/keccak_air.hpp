#pragma once

#include "air/air.hpp"
#include "hash/keccak.hpp"
#include <vector>

namespace zkrv {

/**
 * KeccakSubAir - one Keccak-f[1600] round per row, 24 rows per permutation
 *
 * Lanes are indexed x + 5y and split into four 16-bit limbs. Column layout:
 *   step_flags[24]          one-hot round index
 *   preimage[25][4]         permutation input, constant over the 24 rows
 *   a[25][4]                state at the start of the round
 *   c[5][64]                column parities of a, bits
 *   c_prime[5][64]          column parities of a', bits
 *   a_prime[25][64]         state after theta, bits
 *   a_prime_prime[25][4]    state after rho, pi and chi
 *   a_prime_prime_0_0_bits[64]
 *   a_prime_prime_prime_0_0_limbs[4]   lane (0, 0) after iota
 *
 * Every constraint has degree at most 3. The step flags start at round 0 on
 * the first row and rotate, so a trace is a sequence of whole permutations
 * possibly cut short by the last row.
 */
class KeccakSubAir {
public:
    static constexpr size_t LIMBS = 4;
    static constexpr size_t LIMB_BITS = 16;
    static constexpr size_t ROUNDS = keccak::NUM_ROUNDS;

    static constexpr size_t STEP_FLAGS = 0;
    static constexpr size_t PREIMAGE = STEP_FLAGS + ROUNDS;
    static constexpr size_t A = PREIMAGE + 25 * LIMBS;
    static constexpr size_t C = A + 25 * LIMBS;
    static constexpr size_t C_PRIME = C + 5 * 64;
    static constexpr size_t A_PRIME = C_PRIME + 5 * 64;
    static constexpr size_t A_PRIME_PRIME = A_PRIME + 25 * 64;
    static constexpr size_t A_PRIME_PRIME_0_0_BITS = A_PRIME_PRIME + 25 * LIMBS;
    static constexpr size_t A_PRIME_PRIME_PRIME_0_0_LIMBS = A_PRIME_PRIME_0_0_BITS + 64;
    static constexpr size_t WIDTH = A_PRIME_PRIME_PRIME_0_0_LIMBS + LIMBS;

    // Constraints over the local and next rows. cols/next hold at least
    // WIDTH expressions starting at the sub-air's first column.
    static void eval(AirBuilder& builder, const std::vector<Expr>& cols, const std::vector<Expr>& next);

    // Limb expressions of the round output; on the last round row this is
    // the permutation output.
    static std::vector<Expr> output_limbs(const std::vector<Expr>& cols);

    // Fill the 24 rows of one permutation of input. rows[r] points at the
    // sub-air's first column of round r.
    static void generate_rows(const keccak::State& input, BFieldElement* const* rows);
};

} // namespace zkrv
