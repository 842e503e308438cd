extern "C" {
#include <abpoa.h>
}

#include "abpoa_wrapper.h"
#include "errors.h"

#include <utility>

namespace viralseq {

namespace {

inline uint8_t base_to_code(char base) {
    switch (base) {
        case 'A': case 'a': return 0;
        case 'C': case 'c': return 1;
        case 'G': case 'g': return 2;
        case 'T': case 't': return 3;
        default: return 4;
    }
}

// abPOA MSA codes: 0-3 ACGT, 4 N, 5 gap
constexpr char kMsaDecode[] = {'A', 'C', 'G', 'T', 'N', '-'};
constexpr uint8_t kMsaGap = 5;

}  // namespace

// ============================================================================
// AbPOAAligner Implementation
// ============================================================================

AbPOAAligner::AbPOAAligner() : AbPOAAligner(Config()) {}

AbPOAAligner::AbPOAAligner(Config config) : config_(std::move(config)) {
    para_ = abpoa_init_para();
    if (!para_) {
        throw AlignmentUnavailableError("Failed to initialize abPOA parameters");
    }

    para_->align_mode = config_.align_mode;
    para_->match = config_.match;
    para_->mismatch = config_.mismatch;
    para_->gap_open1 = config_.gap_open1;
    para_->gap_ext1 = config_.gap_extend1;
    para_->gap_open2 = config_.gap_open2;
    para_->gap_ext2 = config_.gap_extend2;
    para_->wb = config_.extra_bw;
    para_->out_msa = 1;
    para_->out_cons = 0;
    para_->out_gfa = 0;

    abpoa_post_set_para(para_);

    ab_ = abpoa_init();
    if (!ab_) {
        abpoa_free_para(para_);
        para_ = nullptr;
        throw AlignmentUnavailableError("Failed to initialize abPOA object");
    }
}

AbPOAAligner::~AbPOAAligner() {
    if (ab_) abpoa_free(ab_);
    if (para_) abpoa_free_para(para_);
}

std::vector<uint8_t> AbPOAAligner::encode_sequence(const std::string& seq) const {
    std::vector<uint8_t> encoded(seq.size());
    for (size_t i = 0; i < seq.size(); ++i) {
        encoded[i] = base_to_code(seq[i]);
    }
    return encoded;
}

std::string AbPOAAligner::decode_row(const uint8_t* row, int len,
                                     const std::string& original) const {
    std::string out;
    out.reserve(static_cast<size_t>(len));
    size_t next = 0;
    for (int j = 0; j < len; ++j) {
        const uint8_t code = row[j];
        if (code >= kMsaGap) {
            out.push_back('-');
        } else if (next < original.size()) {
            out.push_back(original[next++]);
        } else {
            out.push_back(kMsaDecode[code]);
        }
    }
    return out;
}

AlignmentResult AbPOAAligner::align(const std::string& query, const std::string& reference) {
    if (query.empty() || reference.empty()) {
        throw AlignmentUnavailableError("abPOA: cannot align an empty sequence");
    }

    abpoa_reset(ab_, para_, static_cast<int>(reference.size()));

    // Reference first so that it forms the graph backbone.
    std::vector<std::vector<uint8_t>> encoded_data;
    encoded_data.push_back(encode_sequence(reference));
    encoded_data.push_back(encode_sequence(query));

    int seq_lens[2] = {static_cast<int>(reference.size()), static_cast<int>(query.size())};
    uint8_t* seqs[2] = {encoded_data[0].data(), encoded_data[1].data()};

    const int ret = abpoa_msa(ab_, para_, 2, nullptr, seq_lens, seqs, nullptr, nullptr);
    if (ret != 0 || !ab_->abc || ab_->abc->n_seq < 2 || ab_->abc->msa_len <= 0 ||
        !ab_->abc->msa_base) {
        throw AlignmentUnavailableError("abPOA returned no alignment");
    }

    const int msa_len = ab_->abc->msa_len;
    AlignmentResult result;
    result.aligned_reference = decode_row(ab_->abc->msa_base[0], msa_len, reference);
    result.aligned_query = decode_row(ab_->abc->msa_base[1], msa_len, query);
    return result;
}

}  // namespace viralseq
