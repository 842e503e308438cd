#include "consensus.h"
#include "errors.h"

#include <algorithm>
#include <array>
#include <stdexcept>

namespace viralseq {

char call_consensus_base(std::vector<char> symbols) {
    if (symbols.size() == 1) return symbols[0];
    if (symbols.empty() || symbols.size() > 3) return 'N';

    std::sort(symbols.begin(), symbols.end());
    const std::string key(symbols.begin(), symbols.end());

    if (symbols.size() == 2) {
        if (key == "AT") return 'W';
        if (key == "CG") return 'S';
        if (key == "AC") return 'M';
        if (key == "GT") return 'K';
        if (key == "AG") return 'R';
        if (key == "CT") return 'Y';
        return 'N';
    }

    if (key == "CGT") return 'B';
    if (key == "AGT") return 'D';
    if (key == "ACT") return 'H';
    if (key == "ACG") return 'V';
    return 'N';
}

std::string consensus(const SequenceMap& alignment, double cutoff) {
    if (!(cutoff > 0.0 && cutoff <= 1.0)) {
        throw std::invalid_argument("consensus cutoff must be in (0, 1]");
    }
    const size_t len = require_alignment(alignment, "consensus");
    const double n = static_cast<double>(alignment.size());

    std::string out;
    out.reserve(len);

    std::array<int64_t, 256> counts{};
    std::vector<char> passing;
    for (size_t pos = 0; pos < len; ++pos) {
        counts.fill(0);
        for (const auto& e : alignment) {
            ++counts[static_cast<unsigned char>(e.seq[pos])];
        }
        passing.clear();
        for (size_t sym = 0; sym < counts.size(); ++sym) {
            if (counts[sym] > 0 && static_cast<double>(counts[sym]) / n >= cutoff) {
                passing.push_back(static_cast<char>(sym));
            }
        }
        out.push_back(call_consensus_base(passing));
    }
    return out;
}

std::string consensus(const SequenceCollection& collection, const ConsensusConfig& config) {
    return consensus(collection.dna(), config.cutoff);
}

}  // namespace viralseq
