#ifndef VIRALSEQ_HYPERMUT_H
#define VIRALSEQ_HYPERMUT_H

#include "sequence_collection.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace viralseq {

// ============================================================================
// APOBEC3G/F Hypermutation Configuration
// ============================================================================

struct HypermutConfig {
    double consensus_cutoff = 0.5;     // majority cutoff of the motif reference
    double p_value_cutoff = 0.05;      // Fisher two-tailed p below this -> hypermutated
    size_t poisson_min_sequences = 20; // outlier test only when N is larger than this
    double outlier_fold = 20.0;        // observed / expected fold for the outlier cutoff
    bool verbose = false;
};

/**
 * Per-sequence evidence.
 *   a: G->A at APOBEC3G/F (GRD) sites     b: usable GRD sites
 *   c: G->A at control sites              d: usable control sites
 * rate_ratio = (a/b)/(c/d); NaN or Inf when a denominator is zero.
 */
struct HypermutationRecord {
    std::string name;
    int64_t a = 0;
    int64_t b = 0;
    int64_t c = 0;
    int64_t d = 0;
    double rate_ratio = 0.0;
    double p_value = 1.0;
    bool fisher_significant = false;
    bool poisson_outlier = false;
    bool hypermutated = false;
};

/**
 * Alignment columns of the motif reference that are APOBEC3G/F targets
 * (G followed by [AG][AGT]) and the remaining G columns used as controls.
 * Gap columns of the reference are skipped when reading the trinucleotide
 * context; reported positions are columns of the gapped reference.
 */
struct ApobecSites {
    std::vector<size_t> motif;
    std::vector<size_t> control;
};

ApobecSites apobec3gf_sites(const std::string& reference);

/**
 * Poisson outlier cutoff on per-sequence GRD mutation counts.
 * lambda is the mean count; the cutoff is the smallest k in 1..max(counts)
 * with observed(k) >= fold * N * Poisson(k; lambda), or max(counts) when no
 * k qualifies. Sequences with more mutations than the cutoff are outliers.
 */
int64_t apobec_outlier_cutoff(const std::vector<int64_t>& mutation_counts, double fold);

struct HypermutResult {
    SequenceCollection hypermutated;   // title + "_hypermut"
    SequenceCollection filtered;       // everything else
    std::vector<HypermutationRecord> records;  // every sequence, input order
    std::optional<int64_t> outlier_cutoff;     // set when the Poisson test ran

    std::vector<HypermutationRecord> hypermutated_records() const;
};

/**
 * Detects APOBEC3G/F hypermutated sequences in an aligned nucleotide
 * collection: Fisher's exact test of GRD vs control G->A rates per sequence,
 * plus Poisson outliers of GRD mutation counts when the collection holds more
 * than `poisson_min_sequences` sequences.
 * Throws EmptyInputError on an empty collection.
 */
HypermutResult a3g_hypermut(const SequenceCollection& collection,
                            const HypermutConfig& config = HypermutConfig());

}  // namespace viralseq

#endif  // VIRALSEQ_HYPERMUT_H
