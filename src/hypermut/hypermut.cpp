#include "hypermut.h"
#include "consensus.h"
#include "errors.h"
#include "stats.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <tuple>
#include <utility>

namespace viralseq {

namespace {

inline bool is_purine(char c) { return c == 'A' || c == 'G'; }

// G[AG][AGT]
inline bool is_grd(const std::string& s, size_t n) {
    return s[n] == 'G' && is_purine(s[n + 1]) &&
           (s[n + 2] == 'A' || s[n + 2] == 'G' || s[n + 2] == 'T');
}

// (G->A count, usable count) over the given columns of one sequence.
std::pair<int64_t, int64_t> count_g_to_a(const std::string& seq,
                                         const std::vector<size_t>& columns) {
    int64_t mutated = 0;
    int64_t usable = 0;
    for (size_t col : columns) {
        const char base = seq[col];
        if (base == kGap) continue;
        ++usable;
        if (base == 'A') ++mutated;
    }
    return {mutated, usable};
}

}  // namespace

ApobecSites apobec3gf_sites(const std::string& reference) {
    ApobecSites sites;

    std::string stripped;
    std::vector<size_t> column_of;
    stripped.reserve(reference.size());
    column_of.reserve(reference.size());
    for (size_t i = 0; i < reference.size(); ++i) {
        if (reference[i] == kGap) continue;
        stripped.push_back(reference[i]);
        column_of.push_back(i);
    }

    if (stripped.size() < 3) return sites;
    for (size_t n = 0; n + 3 <= stripped.size(); ++n) {
        if (is_grd(stripped, n)) {
            sites.motif.push_back(column_of[n]);
        } else if (stripped[n] == 'G') {
            sites.control.push_back(column_of[n]);
        }
    }
    return sites;
}

int64_t apobec_outlier_cutoff(const std::vector<int64_t>& mutation_counts, double fold) {
    const auto observed = frequency_table(mutation_counts);
    if (observed.empty()) return 0;

    const double n = static_cast<double>(mutation_counts.size());
    int64_t total = 0;
    for (int64_t a : mutation_counts) total += a;
    const double lambda = static_cast<double>(total) / n;

    const int64_t max_count = observed.rbegin()->first;
    const auto pmf = poisson_pmf(lambda, max_count);

    for (int64_t k = 1; k <= max_count; ++k) {
        const double expected = n * pmf[static_cast<size_t>(k)];
        auto it = observed.find(k);
        const double obs = it == observed.end() ? 0.0 : static_cast<double>(it->second);
        if (obs >= fold * expected) {
            return k;
        }
    }
    return max_count;
}

std::vector<HypermutationRecord> HypermutResult::hypermutated_records() const {
    std::vector<HypermutationRecord> out;
    for (const auto& r : records) {
        if (r.hypermutated) out.push_back(r);
    }
    return out;
}

HypermutResult a3g_hypermut(const SequenceCollection& collection, const HypermutConfig& config) {
    const SequenceMap& aln = collection.dna();
    if (aln.empty()) {
        throw EmptyInputError("a3g_hypermut: collection has no sequences");
    }

    const std::string reference = consensus(aln, config.consensus_cutoff);
    const ApobecSites sites = apobec3gf_sites(reference);

    if (config.verbose) {
        std::cout << "[Hypermut] " << aln.size() << " sequences, "
                  << sites.motif.size() << " GRD sites, "
                  << sites.control.size() << " control sites" << std::endl;
    }

    HypermutResult result;
    result.records.reserve(aln.size());
    std::vector<int64_t> mutation_counts;
    mutation_counts.reserve(aln.size());

    for (const auto& e : aln) {
        HypermutationRecord rec;
        rec.name = e.name;
        std::tie(rec.a, rec.b) = count_g_to_a(e.seq, sites.motif);
        std::tie(rec.c, rec.d) = count_g_to_a(e.seq, sites.control);

        // IEEE division keeps zero denominators visible as NaN / Inf.
        rec.rate_ratio = (static_cast<double>(rec.a) / static_cast<double>(rec.b)) /
                         (static_cast<double>(rec.c) / static_cast<double>(rec.d));

        const FisherResult fisher = fisher_exact_test(rec.b - rec.a, rec.d - rec.c, rec.a, rec.c);
        rec.p_value = fisher.two_tail;
        rec.fisher_significant = rec.p_value < config.p_value_cutoff;
        rec.hypermutated = rec.fisher_significant;

        mutation_counts.push_back(rec.a);
        result.records.push_back(std::move(rec));
    }

    if (aln.size() > config.poisson_min_sequences) {
        const int64_t cutoff = apobec_outlier_cutoff(mutation_counts, config.outlier_fold);
        result.outlier_cutoff = cutoff;
        for (auto& rec : result.records) {
            if (rec.a > cutoff) {
                rec.poisson_outlier = true;
                rec.hypermutated = true;
            }
        }
        if (config.verbose) {
            std::cout << "[Hypermut] Poisson outlier cutoff: " << cutoff
                      << " GRD mutations" << std::endl;
        }
    }

    std::vector<std::string> hyper_keys;
    std::vector<std::string> clean_keys;
    for (const auto& rec : result.records) {
        (rec.hypermutated ? hyper_keys : clean_keys).push_back(rec.name);
    }

    result.hypermutated = collection.sub(hyper_keys);
    result.hypermutated.set_title(collection.title() + "_hypermut");
    result.filtered = collection.sub(clean_keys);

    if (config.verbose) {
        for (const auto& rec : result.records) {
            if (!rec.hypermutated) continue;
            std::cout << "[Hypermut] " << rec.name << " a=" << rec.a << " b=" << rec.b
                      << " c=" << rec.c << " d=" << rec.d
                      << " rr=" << std::fixed << std::setprecision(2) << rec.rate_ratio
                      << std::defaultfloat << std::setprecision(6) << " p=" << rec.p_value
                      << (rec.poisson_outlier ? " (Poisson outlier)" : "") << std::endl;
        }
    }

    return result;
}

}  // namespace viralseq
