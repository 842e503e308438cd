#ifndef VIRALSEQ_PAIRWISE_ALIGNER_H
#define VIRALSEQ_PAIRWISE_ALIGNER_H

#include <string>

namespace viralseq {

/**
 * Global pairwise alignment of a query against a reference.
 * Both rows have the same length and use '-' for gaps.
 */
struct AlignmentResult {
    std::string aligned_query;
    std::string aligned_reference;
};

/**
 * Alignment collaborator used by the locator.
 *
 * Implementations return the aligned pair or throw
 * AlignmentUnavailableError when no alignment can be produced; callers do
 * not retry.
 */
class PairwiseAligner {
public:
    virtual ~PairwiseAligner() = default;

    virtual AlignmentResult align(const std::string& query, const std::string& reference) = 0;
};

}  // namespace viralseq

#endif  // VIRALSEQ_PAIRWISE_ALIGNER_H
