#include "primitives/keccak_air.hpp"

namespace zkrv {

namespace {

constexpr size_t NUM_LANES = keccak::NUM_LANES;
constexpr size_t LIMBS = KeccakSubAir::LIMBS;
constexpr size_t LIMB_BITS = KeccakSubAir::LIMB_BITS;

size_t lane(size_t x, size_t y) { return x + 5 * y; }

size_t preimage_col(size_t l, size_t limb) { return KeccakSubAir::PREIMAGE + l * LIMBS + limb; }
size_t a_col(size_t l, size_t limb) { return KeccakSubAir::A + l * LIMBS + limb; }
size_t c_col(size_t x, size_t z) { return KeccakSubAir::C + x * 64 + z; }
size_t c_prime_col(size_t x, size_t z) { return KeccakSubAir::C_PRIME + x * 64 + z; }
size_t a_prime_col(size_t l, size_t z) { return KeccakSubAir::A_PRIME + l * 64 + z; }
size_t a_prime_prime_col(size_t l, size_t limb) { return KeccakSubAir::A_PRIME_PRIME + l * LIMBS + limb; }

Expr xor2(const Expr& a, const Expr& b) { return a + b - a * b * 2; }

Expr xor3(const Expr& a, const Expr& b, const Expr& c) {
    return a + b + c - (a * b + b * c + c * a) * 2 + a * b * c * 4;
}

// (not a) and b
Expr andn(const Expr& a, const Expr& b) { return b - a * b; }

uint64_t rotl(uint64_t v, unsigned n) {
    n &= 63;
    return n == 0 ? v : (v << n) | (v >> (64 - n));
}

uint64_t limb_of(uint64_t v, size_t limb) { return (v >> (LIMB_BITS * limb)) & 0xFFFF; }

bool bit_of(uint64_t v, size_t z) { return ((v >> z) & 1) != 0; }

// Bit z of lane (x, y) after rho and pi, read from the a' columns
Expr b_bit(const std::vector<Expr>& cols, size_t x, size_t y, size_t z) {
    const size_t src_x = (x + 3 * y) % 5;
    const size_t src_y = x;
    const size_t rot = keccak::ROTATION_OFFSETS[src_x][src_y];
    return cols[a_prime_col(lane(src_x, src_y), (z + 64 - rot) % 64)];
}

} // namespace

void KeccakSubAir::eval(AirBuilder& builder, const std::vector<Expr>& cols, const std::vector<Expr>& next) {
    const Expr one = Expr::from_u64(1);
    const Expr& first_step = cols[STEP_FLAGS];
    const Expr not_last_step = one - cols[STEP_FLAGS + ROUNDS - 1];

    builder.when_first_row().assert_one(first_step);
    for (size_t i = 1; i < ROUNDS; ++i) {
        builder.when_first_row().assert_zero(cols[STEP_FLAGS + i]);
    }
    for (size_t i = 0; i < ROUNDS; ++i) {
        builder.when_transition().assert_eq(next[STEP_FLAGS + i], cols[STEP_FLAGS + (i + ROUNDS - 1) % ROUNDS]);
    }

    for (size_t l = 0; l < NUM_LANES; ++l) {
        for (size_t limb = 0; limb < LIMBS; ++limb) {
            builder.when(first_step).assert_eq(cols[a_col(l, limb)], cols[preimage_col(l, limb)]);
            builder.when_transition().when(not_last_step).assert_eq(next[preimage_col(l, limb)],
                                                                   cols[preimage_col(l, limb)]);
        }
    }

    // theta
    for (size_t x = 0; x < 5; ++x) {
        for (size_t z = 0; z < 64; ++z) {
            builder.assert_bool(cols[c_col(x, z)]);
            const Expr c_prime = xor3(cols[c_col(x, z)], cols[c_col((x + 4) % 5, z)],
                                      cols[c_col((x + 1) % 5, (z + 63) % 64)]);
            builder.assert_eq(cols[c_prime_col(x, z)], c_prime);
        }
    }
    for (size_t y = 0; y < 5; ++y) {
        for (size_t x = 0; x < 5; ++x) {
            const size_t l = lane(x, y);
            for (size_t z = 0; z < 64; ++z) {
                builder.assert_bool(cols[a_prime_col(l, z)]);
            }
            // a = a' ^ c ^ c'
            for (size_t limb = 0; limb < LIMBS; ++limb) {
                Expr computed;
                for (size_t k = 0; k < LIMB_BITS; ++k) {
                    const size_t z = LIMB_BITS * limb + k;
                    computed += xor3(cols[a_prime_col(l, z)], cols[c_col(x, z)], cols[c_prime_col(x, z)]) *
                                static_cast<int64_t>(1u << k);
                }
                builder.assert_eq(cols[a_col(l, limb)], computed);
            }
        }
    }
    // c' is the parity of each column of a'
    for (size_t x = 0; x < 5; ++x) {
        for (size_t z = 0; z < 64; ++z) {
            Expr sum;
            for (size_t y = 0; y < 5; ++y) {
                sum += cols[a_prime_col(lane(x, y), z)];
            }
            const Expr diff = sum - cols[c_prime_col(x, z)];
            builder.assert_zero(diff * (diff - 2) * (diff - 4));
        }
    }

    // rho, pi and chi
    for (size_t y = 0; y < 5; ++y) {
        for (size_t x = 0; x < 5; ++x) {
            for (size_t limb = 0; limb < LIMBS; ++limb) {
                Expr computed;
                for (size_t k = 0; k < LIMB_BITS; ++k) {
                    const size_t z = LIMB_BITS * limb + k;
                    const Expr chi = xor2(b_bit(cols, x, y, z),
                                          andn(b_bit(cols, (x + 1) % 5, y, z), b_bit(cols, (x + 2) % 5, y, z)));
                    computed += chi * static_cast<int64_t>(1u << k);
                }
                builder.assert_eq(cols[a_prime_prime_col(lane(x, y), limb)], computed);
            }
        }
    }

    // iota on lane (0, 0)
    std::vector<Expr> bits(cols.begin() + A_PRIME_PRIME_0_0_BITS, cols.begin() + A_PRIME_PRIME_0_0_BITS + 64);
    for (const Expr& bit : bits) {
        builder.assert_bool(bit);
    }
    for (size_t limb = 0; limb < LIMBS; ++limb) {
        const std::vector<Expr> limb_bits(bits.begin() + LIMB_BITS * limb, bits.begin() + LIMB_BITS * (limb + 1));
        builder.assert_eq(cols[a_prime_prime_col(0, limb)], compose_limbs(limb_bits, 1));

        Expr computed;
        for (size_t k = 0; k < LIMB_BITS; ++k) {
            const size_t z = LIMB_BITS * limb + k;
            Expr rc_bit;
            for (size_t r = 0; r < ROUNDS; ++r) {
                if (bit_of(keccak::ROUND_CONSTANTS[r], z)) {
                    rc_bit += cols[STEP_FLAGS + r];
                }
            }
            computed += xor2(bits[z], rc_bit) * static_cast<int64_t>(1u << k);
        }
        builder.assert_eq(cols[A_PRIME_PRIME_PRIME_0_0_LIMBS + limb], computed);
    }

    // The round output is the next round's input
    const std::vector<Expr> out = output_limbs(cols);
    for (size_t l = 0; l < NUM_LANES; ++l) {
        for (size_t limb = 0; limb < LIMBS; ++limb) {
            builder.when_transition().when(not_last_step).assert_eq(next[a_col(l, limb)], out[l * LIMBS + limb]);
        }
    }
}

std::vector<Expr> KeccakSubAir::output_limbs(const std::vector<Expr>& cols) {
    std::vector<Expr> out;
    out.reserve(NUM_LANES * LIMBS);
    for (size_t l = 0; l < NUM_LANES; ++l) {
        for (size_t limb = 0; limb < LIMBS; ++limb) {
            out.push_back(l == 0 ? cols[A_PRIME_PRIME_PRIME_0_0_LIMBS + limb] : cols[a_prime_prime_col(l, limb)]);
        }
    }
    return out;
}

void KeccakSubAir::generate_rows(const keccak::State& input, BFieldElement* const* rows) {
    keccak::State state = input;
    for (size_t round = 0; round < ROUNDS; ++round) {
        BFieldElement* row = rows[round];
        row[STEP_FLAGS + round] = BFieldElement::one();
        for (size_t l = 0; l < NUM_LANES; ++l) {
            for (size_t limb = 0; limb < LIMBS; ++limb) {
                row[preimage_col(l, limb)] = BFieldElement(limb_of(input[l], limb));
                row[a_col(l, limb)] = BFieldElement(limb_of(state[l], limb));
            }
        }

        uint64_t c[5];
        uint64_t c_prime[5];
        for (size_t x = 0; x < 5; ++x) {
            c[x] = state[lane(x, 0)] ^ state[lane(x, 1)] ^ state[lane(x, 2)] ^ state[lane(x, 3)] ^ state[lane(x, 4)];
        }
        keccak::State a_prime;
        for (size_t x = 0; x < 5; ++x) {
            const uint64_t d = c[(x + 4) % 5] ^ rotl(c[(x + 1) % 5], 1);
            c_prime[x] = c[x] ^ d;
            for (size_t y = 0; y < 5; ++y) {
                a_prime[lane(x, y)] = state[lane(x, y)] ^ d;
            }
        }
        for (size_t x = 0; x < 5; ++x) {
            for (size_t z = 0; z < 64; ++z) {
                row[c_col(x, z)] = BFieldElement(bit_of(c[x], z) ? 1 : 0);
                row[c_prime_col(x, z)] = BFieldElement(bit_of(c_prime[x], z) ? 1 : 0);
            }
        }
        for (size_t l = 0; l < NUM_LANES; ++l) {
            for (size_t z = 0; z < 64; ++z) {
                row[a_prime_col(l, z)] = BFieldElement(bit_of(a_prime[l], z) ? 1 : 0);
            }
        }

        keccak::State b;
        for (size_t x = 0; x < 5; ++x) {
            for (size_t y = 0; y < 5; ++y) {
                b[lane(y, (2 * x + 3 * y) % 5)] = rotl(a_prime[lane(x, y)], keccak::ROTATION_OFFSETS[x][y]);
            }
        }
        keccak::State a_prime_prime;
        for (size_t x = 0; x < 5; ++x) {
            for (size_t y = 0; y < 5; ++y) {
                a_prime_prime[lane(x, y)] =
                    b[lane(x, y)] ^ (~b[lane((x + 1) % 5, y)] & b[lane((x + 2) % 5, y)]);
            }
        }
        for (size_t l = 0; l < NUM_LANES; ++l) {
            for (size_t limb = 0; limb < LIMBS; ++limb) {
                row[a_prime_prime_col(l, limb)] = BFieldElement(limb_of(a_prime_prime[l], limb));
            }
        }
        for (size_t z = 0; z < 64; ++z) {
            row[A_PRIME_PRIME_0_0_BITS + z] = BFieldElement(bit_of(a_prime_prime[0], z) ? 1 : 0);
        }
        const uint64_t a_ppp = a_prime_prime[0] ^ keccak::ROUND_CONSTANTS[round];
        for (size_t limb = 0; limb < LIMBS; ++limb) {
            row[A_PRIME_PRIME_PRIME_0_0_LIMBS + limb] = BFieldElement(limb_of(a_ppp, limb));
        }

        state = a_prime_prime;
        state[0] = a_ppp;
    }
}

} // namespace zkrv
