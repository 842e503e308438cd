#ifndef VIRALSEQ_LOCATOR_H
#define VIRALSEQ_LOCATOR_H

#include "pairwise_aligner.h"
#include "reference_genome.h"
#include "sequence_collection.h"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace viralseq {

// ============================================================================
// Locator Configuration
// ============================================================================

struct LocatorConfig {
    ReferenceId reference = ReferenceId::HXB2;

    // When the first global alignment spreads the query over more than
    // refine_ratio * query length of reference, re-align against a window
    // around the query's longest gap-free block.
    double refine_ratio = 1.3;
    bool refine = true;

    bool verbose = false;
};

enum class Orientation {
    Forward,
    Reverse    // reverse complement of the input
};

const char* orientation_symbol(Orientation o);  // "+" / "-"

/**
 * Position of a query on a reference genome.
 * ref_start / ref_end are 1-based inclusive reference coordinates of the
 * first and last reference bases covered by the query; similarity is the
 * percentage of identical columns between them, rounded to 0.1.
 */
struct LocatorResult {
    int64_t ref_start = 0;
    int64_t ref_end = 0;
    double similarity = 0.0;
    bool has_indel = false;
    Orientation orientation = Orientation::Forward;
    std::string aligned_query;
    std::string aligned_reference;
};

/**
 * Derive a LocatorResult from one alignment. Leading and trailing query
 * gaps are trimmed; `ref_offset` is the 0-based start of the aligned
 * reference window within the full genome.
 * @throws AlignmentUnavailableError on rows of unequal length or an
 *         all-gap query row
 */
LocatorResult summarize_alignment(const AlignmentResult& alignment,
                                  int64_t ref_offset = 0,
                                  Orientation orientation = Orientation::Forward);

// One row of the locator report.
struct LocatorRow {
    std::string title;
    std::string name;
    ReferenceId reference = ReferenceId::HXB2;
    LocatorResult result;
};

// Inclusive range of accepted reference coordinates.
struct PositionRange {
    int64_t lo = std::numeric_limits<int64_t>::min();
    int64_t hi = std::numeric_limits<int64_t>::max();

    PositionRange() = default;
    PositionRange(int64_t pos) : lo(pos), hi(pos) {}
    PositionRange(int64_t l, int64_t h) : lo(l), hi(h) {}

    bool contains(int64_t pos) const { return pos >= lo && pos <= hi; }
};

/**
 * SequenceLocator: places sequences on a reference genome's coordinates.
 *
 * Holds references to the (immutable) reference library and the alignment
 * collaborator; both must outlive the locator. Alignment failures surface as
 * AlignmentUnavailableError and are not retried.
 */
class SequenceLocator {
public:
    SequenceLocator(const ReferenceLibrary& references,
                    PairwiseAligner& aligner,
                    LocatorConfig config = LocatorConfig());

    // Both orientations; the higher similarity wins, ties go to forward.
    LocatorResult locate(const std::string& sequence) const;
    LocatorResult locate(const std::string& sequence, ReferenceId reference) const;

    // Single orientation, the sequence as given.
    LocatorResult locate_forward(const std::string& sequence, ReferenceId reference) const;

    // Every distinct sequence is located once; one row per identifier.
    std::vector<LocatorRow> locate_collection(const SequenceCollection& collection) const;

    /**
     * Keep the sequences whose located start/end fall in the given ranges
     * and, unless allow_indel is set, that align without indels.
     */
    SequenceCollection hiv_seq_qc(const SequenceCollection& collection,
                                  const PositionRange& start,
                                  const PositionRange& end,
                                  bool allow_indel) const;

    const LocatorConfig& config() const { return config_; }

private:
    const ReferenceLibrary& references_;
    PairwiseAligner& aligner_;
    LocatorConfig config_;

    LocatorResult refine(const std::string& sequence,
                         const std::string& genome,
                         const LocatorResult& first_pass,
                         Orientation orientation) const;
};

}  // namespace viralseq

#endif  // VIRALSEQ_LOCATOR_H
