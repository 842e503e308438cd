#include "diversity.h"
#include "errors.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace viralseq {

int64_t hamming_distance(const std::string& a, const std::string& b) {
    const size_t n = std::min(a.size(), b.size());
    int64_t diff = 0;
    for (size_t i = 0; i < n; ++i) {
        if (a[i] != b[i]) ++diff;
    }
    return diff;
}

std::map<size_t, double> shannons_entropy(const SequenceCollection& collection, SeqKind kind) {
    const SequenceMap& aln = collection.sequences(kind);
    const size_t len = require_alignment(aln, "shannons_entropy");

    std::map<size_t, double> entropy;
    std::array<int64_t, 256> counts{};
    for (size_t pos = 0; pos < len; ++pos) {
        counts.fill(0);
        int64_t column_size = 0;
        for (const auto& e : aln) {
            const char c = e.seq[pos];
            if (c == kStop) continue;
            ++counts[static_cast<unsigned char>(c)];
            ++column_size;
        }

        double h = 0.0;
        for (int64_t count : counts) {
            if (count == 0) continue;
            const double p = static_cast<double>(count) / static_cast<double>(column_size);
            h -= p * std::log(p);
        }
        // -p*log(p) with p == 1 gives -0.0
        entropy[pos + 1] = h == 0.0 ? 0.0 : h;
    }
    return entropy;
}

double nucleotide_pi(const SequenceCollection& collection) {
    const SequenceMap& aln = collection.dna();
    const size_t len = require_alignment(aln, "nucleotide_pi");

    int64_t mismatches = 0;
    int64_t combinations = 0;
    for (size_t pos = 0; pos < len; ++pos) {
        int64_t a = 0, c = 0, g = 0, t = 0;
        for (const auto& e : aln) {
            switch (e.seq[pos]) {
                case 'A': ++a; break;
                case 'C': ++c; break;
                case 'G': ++g; break;
                case 'T': ++t; break;
                default: break;
            }
        }
        const int64_t n = a + c + g + t;
        if (n < 2) continue;
        combinations += n * (n - 1) / 2;
        mismatches += a * c + a * t + a * g + c * t + c * g + t * g;
    }

    if (combinations == 0) {
        throw DegenerateInputError(
            "nucleotide_pi: no alignment column has two or more A/C/G/T bases");
    }

    const double pi = static_cast<double>(mismatches) / static_cast<double>(combinations);
    return std::round(pi * 1e5) / 1e5;
}

std::map<int64_t, int64_t> pairwise_distance_histogram(const SequenceCollection& collection) {
    const SequenceMap& aln = collection.dna();
    require_alignment(aln, "pairwise_distance_histogram");

    const auto freq = count_frequencies(aln.values());

    std::map<int64_t, int64_t> histogram;
    for (const auto& [seq, count] : freq) {
        const int64_t same = count * (count - 1) / 2;
        if (same > 0) histogram[0] += same;
    }
    for (size_t i = 0; i < freq.size(); ++i) {
        for (size_t j = i + 1; j < freq.size(); ++j) {
            const int64_t d = hamming_distance(freq[i].first, freq[j].first);
            histogram[d] += freq[i].second * freq[j].second;
        }
    }
    return histogram;
}

}  // namespace viralseq
