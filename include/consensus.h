#ifndef VIRALSEQ_CONSENSUS_H
#define VIRALSEQ_CONSENSUS_H

#include "sequence_collection.h"

#include <string>
#include <vector>

namespace viralseq {

struct ConsensusConfig {
    // Minimum column frequency for a symbol to take part in the call.
    // 0.5 is a simple majority; lower values produce more ambiguity codes.
    double cutoff = 0.5;
};

/**
 * Maps the set of symbols that passed the cutoff at one column to a single
 * IUPAC code. Order of `symbols` is irrelevant. Empty sets, sets of four or
 * more and combinations without an IUPAC code (e.g. a base with a gap) call 'N'.
 */
char call_consensus_base(std::vector<char> symbols);

/**
 * Column-wise consensus of an aligned nucleotide collection.
 * Gaps are counted like any other symbol.
 * Throws EmptyInputError on an empty collection, DegenerateInputError on
 * unaligned input and std::invalid_argument for a cutoff outside (0, 1].
 */
std::string consensus(const SequenceCollection& collection,
                      const ConsensusConfig& config = ConsensusConfig());

std::string consensus(const SequenceMap& alignment, double cutoff);

}  // namespace viralseq

#endif  // VIRALSEQ_CONSENSUS_H
