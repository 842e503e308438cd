#ifndef VIRALSEQ_STATS_H
#define VIRALSEQ_STATS_H

#include <cstdint>
#include <map>
#include <vector>

namespace viralseq {

/**
 * Fisher's exact test on the 2x2 table
 *
 *     | n11  n12 |
 *     | n21  n22 |
 *
 * left/right are the one-sided tail probabilities of n11 under the
 * hypergeometric null with fixed margins; two_tail sums the probability of
 * every table at least as extreme (no more probable) than the observed one.
 */
struct FisherResult {
    double left = 1.0;
    double right = 1.0;
    double two_tail = 1.0;
};

FisherResult fisher_exact_test(int64_t n11, int64_t n12, int64_t n21, int64_t n22);

/**
 * Poisson probability mass for k = 0..k_max at rate `lambda`.
 * lambda == 0 puts all mass on k = 0. Throws std::invalid_argument for a
 * negative or non-finite rate.
 */
std::vector<double> poisson_pmf(double lambda, int64_t k_max);

// Frequency table of integer observations, keys ascending.
std::map<int64_t, int64_t> frequency_table(const std::vector<int64_t>& values);

}  // namespace viralseq

#endif  // VIRALSEQ_STATS_H
