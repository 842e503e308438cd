#ifndef VIRALSEQ_DEDUP_H
#define VIRALSEQ_DEDUP_H

#include "sequence_collection.h"

#include <cstdint>
#include <optional>
#include <string>

namespace viralseq {

// ============================================================================
// Primer ID filtering
// ============================================================================

struct PrimerIdConfig {
    // A Primer ID is dropped when a neighbour within max_distance on the same
    // template sequence has at least `fold` times its read count.
    double fold = 10.0;
    int64_t max_distance = 1;
    bool verbose = false;
};

/**
 * Primer ID and raw read count encoded in a sequence identifier, e.g.
 * "AGGCGTAGA_32_sample1_RT" -> {AGGCGTAGA, 32}. A leading '>' is ignored.
 */
struct PrimerIdTag {
    std::string pid;
    int64_t count = 0;
};

std::optional<PrimerIdTag> parse_primer_id_tag(const std::string& name);

/**
 * Remove reads whose Primer ID looks like a resampling artifact of another
 * Primer ID carried by an identical sequence. Identifiers that do not parse
 * as "PID_count..." take no part in the comparison and are kept.
 */
SequenceCollection filter_similar_pid(const SequenceCollection& collection,
                                      const PrimerIdConfig& config = PrimerIdConfig());

// ============================================================================
// Collapsing
// ============================================================================

struct CollapseConfig {
    int64_t cutoff = 1;          // max Hamming distance to merge
    std::string tag = "seq";     // output names: <tag>_<rank>_<frequency>
};

/**
 * Collapse near-identical sequences. For every pair of distinct sequences
 * within `cutoff` differences the less frequent one is dropped (the later
 * one on equal frequency). Survivors keep first-appearance order.
 * Alignment is recommended but not required.
 */
SequenceCollection collapse(const SequenceCollection& collection,
                            const CollapseConfig& config = CollapseConfig());

}  // namespace viralseq

#endif  // VIRALSEQ_DEDUP_H
