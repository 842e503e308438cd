#include "poisson_cutoff.h"
#include "errors.h"
#include "stats.h"

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

namespace viralseq {

std::map<int64_t, int64_t> variant_distribution(const SequenceMap& alignment) {
    const size_t len = require_alignment(alignment, "variant_distribution");
    const int64_t n = static_cast<int64_t>(alignment.size());

    std::vector<int64_t> variants;
    variants.reserve(len);
    std::array<int64_t, 256> counts{};
    for (size_t pos = 0; pos < len; ++pos) {
        counts.fill(0);
        for (const auto& e : alignment) {
            ++counts[static_cast<unsigned char>(e.seq[pos])];
        }
        const int64_t top = *std::max_element(counts.begin(), counts.end());
        variants.push_back(n - top);
    }
    return frequency_table(variants);
}

int64_t poisson_minority_cutoff(const SequenceCollection& collection,
                                const PoissonCutoffConfig& config) {
    const SequenceMap& aln = collection.dna();
    if (aln.empty()) return 0;
    if (config.error_rate < 0.0 || config.fold_cutoff < 0.0) {
        throw std::invalid_argument("poisson_minority_cutoff: negative parameter");
    }

    const size_t len = require_alignment(aln, "poisson_minority_cutoff");
    if (len == 0) {
        throw DegenerateInputError("poisson_minority_cutoff: alignment has no columns");
    }
    const double lambda = static_cast<double>(aln.size()) * config.error_rate;

    const auto observed = variant_distribution(aln);
    const int64_t max_count = observed.rbegin()->first;
    const auto pmf = poisson_pmf(lambda, max_count);

    for (int64_t k = 1; k <= max_count; ++k) {
        const double expected = static_cast<double>(len) * pmf[static_cast<size_t>(k)];
        auto it = observed.find(k);
        const double obs = it == observed.end() ? 0.0 : static_cast<double>(it->second);
        if (obs >= config.fold_cutoff * expected) {
            return k;
        }
    }
    // No observed count stands out from the error model.
    return max_count + 1;
}

}  // namespace viralseq
