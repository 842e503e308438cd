#ifndef VIRALSEQ_POISSON_CUTOFF_H
#define VIRALSEQ_POISSON_CUTOFF_H

#include "sequence_collection.h"

#include <cstdint>
#include <map>

namespace viralseq {

struct PoissonCutoffConfig {
    double error_rate = 0.0001;   // per-base sequencing/methods error rate
    double fold_cutoff = 20.0;    // observed must exceed expected by this fold
};

/**
 * For each alignment column, the number of sequences that do not carry the
 * column's most frequent symbol; returned as (variant count -> number of
 * columns), keys ascending.
 */
std::map<int64_t, int64_t> variant_distribution(const SequenceMap& alignment);

/**
 * Minority-variant cutoff under a Poisson error model (Zhou et al. 2015).
 *
 * With N sequences of length L, lambda = N * error_rate and the expected
 * number of columns with k variants is L * Poisson(k; lambda). The result is
 * the smallest k >= 1 (up to the largest observed variant count) whose
 * observed column count reaches fold_cutoff times the expected one; a
 * variant seen at least that many times is unlikely to be an error.
 *
 * When no observed k qualifies the result is one past the largest observed
 * variant count (1 for a collection without variants), so the cutoff never
 * decreases as fold_cutoff grows. Returns 0 for an empty collection.
 * Throws DegenerateInputError when the sequences have no columns.
 */
int64_t poisson_minority_cutoff(const SequenceCollection& collection,
                                const PoissonCutoffConfig& config = PoissonCutoffConfig());

}  // namespace viralseq

#endif  // VIRALSEQ_POISSON_CUTOFF_H
