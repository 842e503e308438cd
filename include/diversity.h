#ifndef VIRALSEQ_DIVERSITY_H
#define VIRALSEQ_DIVERSITY_H

#include "sequence_collection.h"

#include <cstdint>
#include <map>
#include <string>

namespace viralseq {

// Number of positions at which two strings differ, over the shorter length.
int64_t hamming_distance(const std::string& a, const std::string& b);

/**
 * Shannon entropy (natural log) of every alignment column, keyed by 1-based
 * position. Stop symbols '*' are removed from a column before counting;
 * a column made only of '*' has entropy 0.
 */
std::map<size_t, double> shannons_entropy(const SequenceCollection& collection,
                                          SeqKind kind = SeqKind::NT);

/**
 * Nucleotide pairwise diversity pi over an aligned nucleotide collection,
 * rounded to 5 decimals. Only A/C/G/T take part; columns left with fewer
 * than two bases are skipped. Throws DegenerateInputError if every column is
 * skipped.
 */
double nucleotide_pi(const SequenceCollection& collection);

/**
 * Pairwise distance histogram: number of sequence pairs at each Hamming
 * distance, over all unordered pairs of the collection (duplicates included).
 */
std::map<int64_t, int64_t> pairwise_distance_histogram(const SequenceCollection& collection);

}  // namespace viralseq

#endif  // VIRALSEQ_DIVERSITY_H
