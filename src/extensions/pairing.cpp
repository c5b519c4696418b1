#include "extensions/pairing.hpp"
#include "extensions/modular.hpp"
#include "extensions/weierstrass.hpp"
#include "vm/opcode.hpp"
#include <optional>
#include <stdexcept>

namespace zkrv {

using namespace mod_builder;

namespace {

FieldExprOpcodes single_opcode(size_t index, PairingOpcode op, const char* name) {
    FieldExprOpcodes opcodes;
    opcodes.offset = pairing_opcode(index, PairingOpcode::MUL_013_BY_013);
    opcodes.locals = {static_cast<uint32_t>(op)};
    opcodes.flags = {FieldExprOpcodes::NO_FLAG};
    opcodes.names = {name};
    return opcodes;
}

std::vector<size_t> save_all(const std::vector<Fp2>& coeffs) {
    std::vector<size_t> out;
    for (const Fp2& c : coeffs) {
        const auto saved = c.save();
        out.push_back(saved.first);
        out.push_back(saved.second);
    }
    return out;
}

std::shared_ptr<Rv32FieldExprChip> make_bn254_chip(const FieldExprChipContext& ctx, size_t index) {
    const CurveParams& curve = curve_params("bn254");
    auto builder = ExprBuilder::create(modulus_limb_config(curve.modulus, ctx.range_checker->range_max_bits()));
    const Fp2 b0 = Fp2::new_input(*builder);
    const Fp2 c0 = Fp2::new_input(*builder);
    const Fp2 b1 = Fp2::new_input(*builder);
    const Fp2 c1 = Fp2::new_input(*builder);

    const std::vector<Fp2> product = {
        (c0 * c1).mul_by_small(9, 1).int_add(1),
        b0 + b1,
        b0 * b1,
        c0 + c1,
        b0 * c1 + b1 * c0,
    };
    auto expr = std::make_shared<const FieldExpr>(*builder, save_all(product));
    return make_field_expr_chip(ctx, std::move(expr),
                                single_opcode(index, PairingOpcode::MUL_013_BY_013, "MUL_013_BY_013"), {4, 4},
                                "Mul013By013Air<bn254>");
}

std::shared_ptr<Rv32FieldExprChip> make_bls12_381_chip(const FieldExprChipContext& ctx, size_t index) {
    const CurveParams& curve = curve_params("bls12_381");
    auto builder = ExprBuilder::create(modulus_limb_config(curve.modulus, ctx.range_checker->range_max_bits()));
    std::vector<Fp2> f;
    for (size_t i = 0; i < 6; ++i) {
        f.push_back(Fp2::new_input(*builder));
    }
    // x1 is the missing coefficient
    std::vector<std::optional<Fp2>> x(6);
    for (size_t j : {0, 2, 3, 4, 5}) {
        x[j] = Fp2::new_input(*builder);
    }

    std::vector<Fp2> product;
    for (size_t k = 0; k < 6; ++k) {
        std::optional<Fp2> low;
        std::optional<Fp2> high;
        for (size_t i = 0; i < 6; ++i) {
            for (size_t j = 0; j < 6; ++j) {
                if (!x[j]) {
                    continue;
                }
                const Fp2 term = f[i] * *x[j];
                if (i + j == k) {
                    low = low ? *low + term : term;
                } else if (i + j == k + 6) {
                    high = high ? *high + term : term;
                }
            }
        }
        // w^6 = xi = 1 + u
        if (high) {
            const Fp2 wrapped = high->mul_by_small(1, 1);
            low = low ? *low + wrapped : wrapped;
        }
        product.push_back(*low);
    }
    auto expr = std::make_shared<const FieldExpr>(*builder, save_all(product));
    return make_field_expr_chip(ctx, std::move(expr), single_opcode(index, PairingOpcode::MUL_BY_02345, "MUL_BY_02345"),
                                {12, 10}, "MulBy02345Air<bls12_381>");
}

} // namespace

std::shared_ptr<Rv32FieldExprChip> make_pairing_line_chip(const FieldExprChipContext& ctx, size_t index,
                                                          const std::string& curve) {
    if (curve == "bn254") {
        return make_bn254_chip(ctx, index);
    }
    if (curve == "bls12_381") {
        return make_bls12_381_chip(ctx, index);
    }
    throw std::invalid_argument("no pairing line chip for curve '" + curve + "'");
}

} // namespace zkrv
