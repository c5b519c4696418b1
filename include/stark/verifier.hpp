#pragma once

#include "fri/two_adic_pcs.hpp"
#include "stark/keygen.hpp"
#include "stark/proof.hpp"

namespace zkrv {

/**
 * MultiStarkVerifier - checks a Proof against a MultiStarkVerifyingKey
 *
 * verify() returns normally on success and throws VerificationError with
 * the failure class otherwise.
 */
class MultiStarkVerifier {
public:
    explicit MultiStarkVerifier(const MultiStarkVerifyingKey& vk) : vk_(vk), pcs_(vk.params) {}

    void verify(const Proof& proof) const;

private:
    const MultiStarkVerifyingKey& vk_;
    TwoAdicPcs pcs_;

    void check_shape(const Proof& proof) const;
};

} // namespace zkrv
