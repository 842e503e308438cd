#ifndef VIRALSEQ_ABPOA_WRAPPER_H
#define VIRALSEQ_ABPOA_WRAPPER_H

#include "pairwise_aligner.h"

#include <cstdint>
#include <string>
#include <vector>

// Include abPOA types (must come before any usage)
#include <abpoa.h>

namespace viralseq {

/**
 * abPOA-backed pairwise aligner
 *
 * Uses the abPOA library (yangao07/abPOA) in global mode with a
 * two-piece (convex) gap model, so that the long reference overhang on
 * either side of a short query is cheap and the query stays contiguous.
 * The reference is added to the graph first; the MSA rows are read back as
 * (reference, query).
 */
class AbPOAAligner : public PairwiseAligner {
public:
    struct Config {
        // Alignment mode: 0=global, 1=local, 2=extend
        int align_mode = 0;

        // Scoring (must be positive for abPOA)
        int match = 2;
        int mismatch = 4;     // positive: penalty is mismatch * -1
        int gap_open1 = 4;    // short-gap piece
        int gap_extend1 = 2;
        int gap_open2 = 24;   // long-gap piece
        int gap_extend2 = 1;

        // Adaptive banding; negative disables it (full DP)
        int extra_bw = -1;
    };

    AbPOAAligner();
    explicit AbPOAAligner(Config config);
    ~AbPOAAligner() override;

    // Non-copyable
    AbPOAAligner(const AbPOAAligner&) = delete;
    AbPOAAligner& operator=(const AbPOAAligner&) = delete;

    /**
     * Align query to reference.
     * @throws AlignmentUnavailableError if abPOA fails or returns no MSA
     */
    AlignmentResult align(const std::string& query, const std::string& reference) override;

    const Config& config() const { return config_; }

private:
    Config config_;
    abpoa_para_t* para_ = nullptr;
    abpoa_t* ab_ = nullptr;

    // Convert DNA string to abPOA format (uint8_t array with 0-4 encoding)
    std::vector<uint8_t> encode_sequence(const std::string& seq) const;

    // Decode one MSA row and put the original residues back in place of
    // the 0-4 codes, so IUPAC symbols survive the round trip.
    std::string decode_row(const uint8_t* row, int len, const std::string& original) const;
};

}  // namespace viralseq

#endif  // VIRALSEQ_ABPOA_WRAPPER_H
