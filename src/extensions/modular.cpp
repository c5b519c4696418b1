#include "extensions/modular.hpp"
#include "vm/opcode.hpp"
#include <stdexcept>

namespace zkrv {

using namespace mod_builder;

mpz_class parse_modulus(const std::string& text) {
    mpz_class modulus;
    if (modulus.set_str(text, 0) != 0) {
        throw std::invalid_argument("modulus '" + text + "' is not an integer");
    }
    if (modulus <= 2 || mpz_probab_prime_p(modulus.get_mpz_t(), 25) == 0) {
        throw std::invalid_argument("modulus '" + text + "' is not an odd prime");
    }
    return modulus;
}

ExprBuilderConfig modulus_limb_config(const mpz_class& modulus, size_t range_checker_bits) {
    const size_t bits = mpz_sizeinbase(modulus.get_mpz_t(), 2);
    if (bits <= 256) {
        return config_256(modulus, range_checker_bits);
    }
    if (bits <= 384) {
        return config_384(modulus, range_checker_bits);
    }
    throw std::invalid_argument("moduli above 384 bits are not supported");
}

std::shared_ptr<Rv32FieldExprChip> make_modular_addsub_chip(const FieldExprChipContext& ctx, size_t index,
                                                            const mpz_class& modulus) {
    auto builder = ExprBuilder::create(modulus_limb_config(modulus, ctx.range_checker->range_max_bits()));
    const FieldVariable x = builder->new_input();
    const FieldVariable y = builder->new_input();
    const size_t is_add = builder->new_flag();
    const size_t z = FieldVariable::select(is_add, x + y, x - y).save();
    auto expr = std::make_shared<const FieldExpr>(*builder, std::vector<size_t>{z});

    FieldExprOpcodes opcodes;
    opcodes.offset = modular_opcode(index, ModularOpcode::ADD);
    opcodes.locals = {static_cast<uint32_t>(ModularOpcode::ADD), static_cast<uint32_t>(ModularOpcode::SUB)};
    opcodes.flags = {is_add, FieldExprOpcodes::NO_FLAG};
    opcodes.names = {"MODULAR_ADD", "MODULAR_SUB"};
    return make_field_expr_chip(ctx, std::move(expr), std::move(opcodes), {1, 1},
                                "ModularAddSubAir<" + std::to_string(index) + ">");
}

std::shared_ptr<Rv32FieldExprChip> make_modular_muldiv_chip(const FieldExprChipContext& ctx, size_t index,
                                                            const mpz_class& modulus) {
    auto builder = ExprBuilder::create(modulus_limb_config(modulus, ctx.range_checker->range_max_bits()));
    const FieldVariable x = builder->new_input();
    const FieldVariable y = builder->new_input();
    const size_t is_mul = builder->new_flag();

    // MUL: x * y = z, DIV: z * y = x
    auto z = builder->new_var();
    builder->set_constraint(z.first, FieldVariable::select(is_mul, x, z.second) * y -
                                         FieldVariable::select(is_mul, z.second, x));
    builder->set_compute(z.first, FieldVariable::select(is_mul, x * y, x.div_unchecked(y)));
    auto expr = std::make_shared<const FieldExpr>(*builder, std::vector<size_t>{z.first});

    FieldExprOpcodes opcodes;
    opcodes.offset = modular_opcode(index, ModularOpcode::ADD);
    opcodes.locals = {static_cast<uint32_t>(ModularOpcode::MUL), static_cast<uint32_t>(ModularOpcode::DIV)};
    opcodes.flags = {is_mul, FieldExprOpcodes::NO_FLAG};
    opcodes.names = {"MODULAR_MUL", "MODULAR_DIV"};
    return make_field_expr_chip(ctx, std::move(expr), std::move(opcodes), {1, 1},
                                "ModularMulDivAir<" + std::to_string(index) + ">");
}

} // namespace zkrv
