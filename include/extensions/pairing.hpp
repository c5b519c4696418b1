#pragma once

#include "mod_builder/core_chip.hpp"
#include <memory>
#include <string>

namespace zkrv {

/**
 * Line arithmetic for the Miller loop, one chip per pairing curve.
 *
 * Fp2 = Fp[u] / (u^2 + 1); Fp12 elements are six Fp2 coefficients of
 * w with w^6 = xi.
 *
 * "bn254", xi = 9 + u: MUL_013_BY_013 multiplies two D-type lines
 *   1 + b w + c w^3, reading (b0, c0) and (b1, c1) and writing the five
 *   Fp2 coefficients (1 + c0 c1 xi, b0 + b1, b0 b1, c0 + c1, b0 c1 + b1 c0)
 *   of the product at w^0, w^1, w^2, w^3, w^4.
 * "bls12_381", xi = 1 + u: MUL_BY_02345 multiplies f (six Fp2) by the
 *   sparse x0 + x2 w^2 + x3 w^3 + x4 w^4 + x5 w^5 and writes six Fp2.
 */
std::shared_ptr<Rv32FieldExprChip> make_pairing_line_chip(const FieldExprChipContext& ctx, size_t index,
                                                          const std::string& curve);

} // namespace zkrv
