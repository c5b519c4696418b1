#include "extensions/weierstrass.hpp"
#include "extensions/modular.hpp"
#include "vm/opcode.hpp"
#include <map>
#include <stdexcept>

namespace zkrv {

using namespace mod_builder;

namespace {

CurveParams make_curve(const char* name, const char* modulus, const char* order, long a, long b) {
    CurveParams curve;
    curve.name = name;
    curve.modulus = mpz_class(modulus, 0);
    curve.order = mpz_class(order, 0);
    curve.a = a;
    curve.b = b;
    return curve;
}

const std::map<std::string, CurveParams>& known_curves() {
    static const std::map<std::string, CurveParams> curves = {
        {"secp256k1",
         make_curve("secp256k1", "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F",
                    "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141", 0, 7)},
        {"bn254",
         make_curve("bn254", "0x30644e72e131a029b85045b68181585d97816a916871ca8d3c208c16d87cfd47",
                    "0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001", 0, 3)},
        {"bls12_381",
         make_curve("bls12_381",
                    "0x1a0111ea397fe69a4b1ba7b6434bacd764774b84f38512bf6730d2a0f6b0f6241eabfffeb153ffffb9feffffffffaaab",
                    "0x73eda753299d7d483339d80809a1d80553bda402fffe5bfeffffffff00000001", 0, 4)},
    };
    return curves;
}

FieldExprOpcodes single_opcode(size_t index, WeierstrassOpcode op, const char* name) {
    FieldExprOpcodes opcodes;
    opcodes.offset = weierstrass_opcode(index, WeierstrassOpcode::SW_ADD_NE);
    opcodes.locals = {static_cast<uint32_t>(op)};
    opcodes.flags = {FieldExprOpcodes::NO_FLAG};
    opcodes.names = {name};
    return opcodes;
}

} // namespace

const CurveParams& curve_params(const std::string& name) {
    const auto& curves = known_curves();
    auto it = curves.find(name);
    if (it == curves.end()) {
        throw std::invalid_argument("unknown curve '" + name + "'");
    }
    return it->second;
}

std::shared_ptr<Rv32FieldExprChip> make_ec_add_ne_chip(const FieldExprChipContext& ctx, size_t index,
                                                       const CurveParams& curve) {
    auto builder = ExprBuilder::create(modulus_limb_config(curve.modulus, ctx.range_checker->range_max_bits()));
    const FieldVariable x1 = builder->new_input();
    const FieldVariable y1 = builder->new_input();
    const FieldVariable x2 = builder->new_input();
    const FieldVariable y2 = builder->new_input();

    const FieldVariable lambda = (y2 - y1) / (x2 - x1);
    const FieldVariable x3 = (lambda * lambda - x1 - x2).saved();
    const FieldVariable y3 = (lambda * (x1 - x3) - y1).saved();
    auto expr = std::make_shared<const FieldExpr>(*builder, std::vector<size_t>{x3.save(), y3.save()});

    return make_field_expr_chip(ctx, std::move(expr), single_opcode(index, WeierstrassOpcode::SW_ADD_NE, "SW_ADD_NE"),
                                {2, 2}, "EcAddNeAir<" + curve.name + ">");
}

std::shared_ptr<Rv32FieldExprChip> make_ec_double_chip(const FieldExprChipContext& ctx, size_t index,
                                                       const CurveParams& curve) {
    auto builder = ExprBuilder::create(modulus_limb_config(curve.modulus, ctx.range_checker->range_max_bits()));
    const FieldVariable x1 = builder->new_input();
    const FieldVariable y1 = builder->new_input();

    FieldVariable numerator = (x1 * x1).int_mul(3);
    if (curve.a != 0) {
        numerator = numerator + builder->constant(curve.a);
    }
    const FieldVariable lambda = numerator / y1.int_mul(2);
    const FieldVariable x3 = (lambda * lambda - x1.int_mul(2)).saved();
    const FieldVariable y3 = (lambda * (x1 - x3) - y1).saved();
    auto expr = std::make_shared<const FieldExpr>(*builder, std::vector<size_t>{x3.save(), y3.save()});

    return make_field_expr_chip(ctx, std::move(expr), single_opcode(index, WeierstrassOpcode::SW_DOUBLE, "SW_DOUBLE"),
                                {2}, "EcDoubleAir<" + curve.name + ">");
}

} // namespace zkrv
