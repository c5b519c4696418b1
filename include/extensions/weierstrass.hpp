#pragma once

#include "mod_builder/core_chip.hpp"
#include <gmpxx.h>
#include <memory>
#include <string>

namespace zkrv {

/**
 * Short Weierstrass curve y^2 = x^3 + a x + b over F_p with a subgroup of
 * order n.
 */
struct CurveParams {
    std::string name;
    mpz_class modulus;
    mpz_class order;
    mpz_class a;
    mpz_class b;
};

// "secp256k1", "bn254" or "bls12_381"; throws std::invalid_argument otherwise
const CurveParams& curve_params(const std::string& name);

/**
 * SW_ADD_NE: (x3, y3) = (x1, y1) + (x2, y2) for x1 != x2.
 * Points are affine, x followed by y. x1 == x2 is
 * ExecutionError(ModularPrecondition).
 */
std::shared_ptr<Rv32FieldExprChip> make_ec_add_ne_chip(const FieldExprChipContext& ctx, size_t index,
                                                       const CurveParams& curve);

/**
 * SW_DOUBLE: (x3, y3) = 2 (x1, y1). y1 == 0 is
 * ExecutionError(ModularPrecondition).
 */
std::shared_ptr<Rv32FieldExprChip> make_ec_double_chip(const FieldExprChipContext& ctx, size_t index,
                                                       const CurveParams& curve);

} // namespace zkrv
