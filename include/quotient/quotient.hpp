#pragma once

#include "fri/two_adic_pcs.hpp"
#include "stark/keygen.hpp"
#include "table/matrix.hpp"
#include "types/b_field_element.hpp"
#include "types/x_field_element.hpp"
#include <vector>

namespace zkrv {

/**
 * QuotientInputs - committed traces of one AIR, read on the LDE coset
 */
struct QuotientInputs {
    const StarkVerifyingKey* vk = nullptr;
    size_t log_height = 0;
    const CommittedMatrix* preprocessed = nullptr;
    std::vector<const CommittedMatrix*> mains;  // cached first, common last
    // Permutation trace flattened to 4 base columns per extension column
    const CommittedMatrix* permutation = nullptr;
    std::vector<BFieldElement> public_values;
    std::vector<XFieldElement> challenges;
    std::vector<XFieldElement> exposed_values;
};

/**
 * Quotient - constraint quotient Q = (sum alpha^i C_i) / Z_H
 *
 * Q is evaluated on the quotient domain g * H_{qd * n}, which is a strided
 * subset of the LDE coset, interpolated and split into qd chunks of degree
 * below n. Each chunk is stored through its values on H so it can be
 * committed like any other trace.
 */
class Quotient {
public:
    /**
     * @return matrix of height n and width 4 * qd: column 4 * i + k holds
     *         coefficient k of chunk i
     */
    static RowMajorMatrix<BFieldElement> compute_quotient_chunks(const QuotientInputs& inputs,
                                                                 const XFieldElement& alpha,
                                                                 size_t log_blowup);

    // Q(zeta) = sum_i zeta^(i n) chunk_i(zeta) from the opened chunk columns
    static XFieldElement recompose(const std::vector<XFieldElement>& opened_chunk_columns,
                                   const XFieldElement& zeta, size_t log_height);

    // sum_k X^k v_k for 4 opened base columns of one extension column
    static XFieldElement recompose_extension(const XFieldElement* base_columns);
};

} // namespace zkrv
