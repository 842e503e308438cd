#include "stats.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <boost/math/distributions/hypergeometric.hpp>
#include <boost/math/distributions/poisson.hpp>

namespace viralseq {

namespace {

// Tables whose probability is within this relative distance of the observed
// one count as equally extreme.
constexpr double kFisherRelTol = 1e-7;

}  // namespace

FisherResult fisher_exact_test(int64_t n11, int64_t n12, int64_t n21, int64_t n22) {
    if (n11 < 0 || n12 < 0 || n21 < 0 || n22 < 0) {
        throw std::invalid_argument("fisher_exact_test: negative cell count");
    }

    FisherResult result;
    const int64_t row1 = n11 + n12;
    const int64_t col1 = n11 + n21;
    const int64_t total = row1 + n21 + n22;

    // Only one table is possible with an empty margin.
    if (total == 0 || row1 == 0 || col1 == 0 || row1 == total || col1 == total) {
        return result;
    }

    // successes in population = col1, sample size = row1, population = total
    boost::math::hypergeometric_distribution<double> dist(
        static_cast<unsigned>(col1),
        static_cast<unsigned>(row1),
        static_cast<unsigned>(total));

    const int64_t k_min = std::max<int64_t>(0, row1 + col1 - total);
    const int64_t k_max = std::min(row1, col1);

    const double p_obs = boost::math::pdf(dist, static_cast<unsigned>(n11));
    const double threshold = p_obs * (1.0 + kFisherRelTol);

    double left = 0.0;
    double right = 0.0;
    double two_tail = 0.0;
    for (int64_t k = k_min; k <= k_max; ++k) {
        const double p = boost::math::pdf(dist, static_cast<unsigned>(k));
        if (k <= n11) left += p;
        if (k >= n11) right += p;
        if (p <= threshold) two_tail += p;
    }

    result.left = std::min(1.0, left);
    result.right = std::min(1.0, right);
    result.two_tail = std::min(1.0, two_tail);
    return result;
}

std::vector<double> poisson_pmf(double lambda, int64_t k_max) {
    if (!std::isfinite(lambda) || lambda < 0.0) {
        throw std::invalid_argument("poisson_pmf: rate must be finite and non-negative");
    }
    if (k_max < 0) return {};

    std::vector<double> pmf(static_cast<size_t>(k_max) + 1, 0.0);
    if (lambda == 0.0) {
        pmf[0] = 1.0;
        return pmf;
    }

    boost::math::poisson_distribution<double> dist(lambda);
    for (int64_t k = 0; k <= k_max; ++k) {
        pmf[static_cast<size_t>(k)] = boost::math::pdf(dist, static_cast<double>(k));
    }
    return pmf;
}

std::map<int64_t, int64_t> frequency_table(const std::vector<int64_t>& values) {
    std::map<int64_t, int64_t> table;
    for (int64_t v : values) ++table[v];
    return table;
}

}  // namespace viralseq
