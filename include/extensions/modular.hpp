#pragma once

#include "mod_builder/core_chip.hpp"
#include <gmpxx.h>
#include <memory>
#include <string>

namespace zkrv {

// Decimal or 0x-prefixed hex; throws std::invalid_argument unless a prime above 2
mpz_class parse_modulus(const std::string& text);

// Limb layout for a modulus: 32 limbs up to 256 bits, 48 up to 384
mod_builder::ExprBuilderConfig modulus_limb_config(const mpz_class& modulus, size_t range_checker_bits);

/**
 * ADD / SUB modulo the index-th configured modulus.
 * rd <- x +- y with x, y, rd heap elements of 32 or 48 bytes.
 */
std::shared_ptr<Rv32FieldExprChip> make_modular_addsub_chip(const FieldExprChipContext& ctx, size_t index,
                                                            const mpz_class& modulus);

/**
 * MUL / DIV modulo the index-th configured modulus.
 * DIV by a value with no inverse is ExecutionError(ModularPrecondition).
 */
std::shared_ptr<Rv32FieldExprChip> make_modular_muldiv_chip(const FieldExprChipContext& ctx, size_t index,
                                                            const mpz_class& modulus);

} // namespace zkrv
