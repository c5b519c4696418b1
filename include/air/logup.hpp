#pragma once

#include "air/air.hpp"
#include "air/symbolic_dag.hpp"
#include "table/matrix.hpp"
#include "types/x_field_element.hpp"
#include <string>
#include <vector>

namespace zkrv {
namespace logup {

// Indices of the Challenge variables used by the bus argument
constexpr uint32_t CHALLENGE_ALPHA = 0;
constexpr uint32_t CHALLENGE_BETA = 1;
constexpr size_t NUM_CHALLENGES = 2;
// Exposed value 0 is the final cumulative sum
constexpr uint32_t EXPOSED_CUMULATIVE_SUM = 0;

/**
 * Greedy grouping of an AIR's interactions so every chunk constraint stays
 * within the degree budget. The permutation trace has one extension
 * column per chunk plus the running sum column.
 */
struct InteractionChunks {
    std::vector<std::vector<size_t>> chunks;

    size_t num_columns() const { return chunks.empty() ? 0 : chunks.size() + 1; }
    size_t running_sum_column() const { return chunks.size(); }
};

// Throws KeygenError(DegreeTooHigh) if a single interaction does not fit
InteractionChunks partition(const std::vector<SymbolicInteraction>& interactions, size_t max_degree,
                            const std::string& air_name);

// Degree of the chunk constraint for the given member set
size_t chunk_degree(const std::vector<SymbolicInteraction>& interactions, const std::vector<size_t>& members);

// alpha + (bus + 1) + sum_j beta^(j+1) * field_j
SymbolicExpression denominator(const SymbolicInteraction& interaction);

// Signed count: +count for sends, -count for receives
SymbolicExpression signed_count(const SymbolicInteraction& interaction);

/**
 * Append the chunk, running-sum and exposed-sum constraints to an AIR's
 * constraint list.
 */
void append_constraints(const std::vector<SymbolicInteraction>& interactions, const InteractionChunks& chunks,
                        std::vector<SymbolicExpression>& constraints);

// Roots evaluated per row to build the permutation trace: for every
// interaction its fields followed by its count.
std::vector<SymbolicExpression> interaction_roots(const std::vector<SymbolicInteraction>& interactions);

struct PermutationTrace {
    RowMajorMatrix<XFieldElement> trace;
    XFieldElement cumulative_sum;
};

/**
 * Build the permutation trace of one AIR.
 *
 * @param interaction_dag DAG of interaction_roots(interactions)
 * @param mains main partitions in builder order (cached first, common last)
 */
PermutationTrace generate_trace(const std::vector<SymbolicInteraction>& interactions,
                                const InteractionChunks& chunks,
                                const SymbolicDag& interaction_dag,
                                const RowMajorMatrix<BFieldElement>* preprocessed,
                                const std::vector<const RowMajorMatrix<BFieldElement>*>& mains,
                                const std::vector<BFieldElement>& public_values,
                                const XFieldElement& alpha, const XFieldElement& beta);

/**
 * Row-wise view of preprocessed, main and public values for base-field
 * evaluation of symbolic expressions over a trace.
 */
class TraceRowSource : public VariableSource<BFieldElement> {
public:
    TraceRowSource(const RowMajorMatrix<BFieldElement>* preprocessed,
                   const std::vector<const RowMajorMatrix<BFieldElement>*>& mains,
                   const RowMajorMatrix<XFieldElement>* permutation,
                   const std::vector<BFieldElement>& public_values,
                   const std::vector<XFieldElement>& challenges,
                   const std::vector<XFieldElement>& exposed,
                   size_t height);

    void set_row(size_t row) { row_ = row; }

    BFieldElement base(const SymbolicVariable& var) const override;
    XFieldElement extension(const SymbolicVariable& var) const override;
    BFieldElement is_first_row() const override;
    BFieldElement is_last_row() const override;
    BFieldElement is_transition() const override;

private:
    const RowMajorMatrix<BFieldElement>* preprocessed_;
    std::vector<const RowMajorMatrix<BFieldElement>*> mains_;
    const RowMajorMatrix<XFieldElement>* permutation_;
    const std::vector<BFieldElement>& public_values_;
    const std::vector<XFieldElement>& challenges_;
    const std::vector<XFieldElement>& exposed_;
    size_t height_;
    size_t row_ = 0;

    size_t row_of(const SymbolicVariable& var) const { return (row_ + var.offset) % height_; }
};

} // namespace logup
} // namespace zkrv
