#include "sequence_collection.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace viralseq {

namespace {

// Codon index order is T, C, A, G for each of the three bases.
constexpr char kStandardCode[] =
    "FFLLSSSSYY**CC*WLLLLPPPPHHQQRRRRIIIMTTTTNNKKSSRRVVVVAAAADDEEGGGG";

inline int tcag_index(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'T': return 0;
        case 'C': return 1;
        case 'A': return 2;
        case 'G': return 3;
        default: return -1;
    }
}

inline char complement(char c) {
    switch (c) {
        case 'A': return 'T';
        case 'T': return 'A';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'a': return 't';
        case 't': return 'a';
        case 'c': return 'g';
        case 'g': return 'c';
        case 'R': return 'Y';
        case 'Y': return 'R';
        case 'K': return 'M';
        case 'M': return 'K';
        case 'B': return 'V';
        case 'V': return 'B';
        case 'D': return 'H';
        case 'H': return 'D';
        default: return c;  // N, S, W, gap
    }
}

// Keeps columns flagged true in `keep`, for every sequence of the map.
SequenceMap keep_columns(const SequenceMap& seqs, const std::vector<bool>& keep) {
    SequenceMap out;
    for (const auto& e : seqs) {
        std::string s;
        s.reserve(e.seq.size());
        for (size_t i = 0; i < e.seq.size() && i < keep.size(); ++i) {
            if (keep[i]) s.push_back(e.seq[i]);
        }
        out.set(e.name, std::move(s));
    }
    return out;
}

}  // namespace

// ============================================================================
// SequenceMap
// ============================================================================

void SequenceMap::set(const std::string& name, std::string seq) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].seq = std::move(seq);
        return;
    }
    index_.emplace(name, entries_.size());
    entries_.push_back(Entry{name, std::move(seq)});
}

bool SequenceMap::erase(const std::string& name) {
    auto it = index_.find(name);
    if (it == index_.end()) return false;

    const size_t pos = it->second;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
    index_.erase(it);
    for (size_t i = pos; i < entries_.size(); ++i) {
        index_[entries_[i].name] = i;
    }
    return true;
}

const std::string* SequenceMap::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].seq;
}

const std::string& SequenceMap::at(const std::string& name) const {
    const std::string* seq = find(name);
    if (!seq) {
        throw std::out_of_range("no sequence named " + name);
    }
    return *seq;
}

void SequenceMap::clear() {
    entries_.clear();
    index_.clear();
}

std::vector<std::string> SequenceMap::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.name);
    return out;
}

std::vector<std::string> SequenceMap::values() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.seq);
    return out;
}

std::vector<std::pair<std::string, int64_t>> count_frequencies(
    const std::vector<std::string>& values) {
    std::vector<std::pair<std::string, int64_t>> out;
    std::unordered_map<std::string, size_t> slot;
    for (const auto& v : values) {
        auto it = slot.find(v);
        if (it == slot.end()) {
            slot.emplace(v, out.size());
            out.emplace_back(v, 1);
        } else {
            ++out[it->second].second;
        }
    }
    return out;
}

size_t require_alignment(const SequenceMap& seqs, const char* op) {
    if (seqs.empty()) {
        throw EmptyInputError(std::string(op) + ": collection has no sequences");
    }
    const size_t len = seqs.begin()->seq.size();
    for (const auto& e : seqs) {
        if (e.seq.size() != len) {
            throw DegenerateInputError(std::string(op) +
                ": sequences are not aligned (" + e.name + " has length " +
                std::to_string(e.seq.size()) + ", expected " + std::to_string(len) + ")");
        }
    }
    return len;
}

char translate_codon(char b1, char b2, char b3) {
    if (b1 == kGap && b2 == kGap && b3 == kGap) return kGap;
    const int i1 = tcag_index(b1);
    const int i2 = tcag_index(b2);
    const int i3 = tcag_index(b3);
    if (i1 < 0 || i2 < 0 || i3 < 0) return 'X';
    return kStandardCode[i1 * 16 + i2 * 4 + i3];
}

std::string translate_sequence(const std::string& dna, int codon_position) {
    std::string aa;
    if (codon_position < 0 || codon_position > 2) {
        throw std::invalid_argument("codon position must be 0, 1 or 2");
    }
    const size_t start = static_cast<size_t>(codon_position);
    if (dna.size() < start + 3) return aa;
    aa.reserve((dna.size() - start) / 3);
    for (size_t i = start; i + 3 <= dna.size(); i += 3) {
        aa.push_back(translate_codon(dna[i], dna[i + 1], dna[i + 2]));
    }
    return aa;
}

std::string reverse_complement(const std::string& seq) {
    std::string rc(seq.rbegin(), seq.rend());
    for (char& c : rc) c = complement(c);
    return rc;
}

// ============================================================================
// SequenceCollection
// ============================================================================

SequenceCollection::SequenceCollection(SequenceMap dna,
                                       SequenceMap aa,
                                       SequenceMap qc,
                                       std::string title,
                                       std::string file)
    : dna_(std::move(dna)),
      aa_(std::move(aa)),
      qc_(std::move(qc)),
      title_(std::move(title)),
      file_(std::move(file)) {}

SequenceCollection SequenceCollection::from_array(const std::vector<std::string>& seqs,
                                                  const std::string& tag) {
    SequenceMap dna;
    int n = 1;
    for (const auto& s : seqs) {
        dna.set(tag + "_" + std::to_string(n++), s);
    }
    return SequenceCollection(std::move(dna), {}, {}, tag);
}

SequenceCollection SequenceCollection::sub(const std::vector<std::string>& keys) const {
    SequenceMap dna, aa, qc;
    for (const auto& k : keys) {
        const std::string* seq = dna_.find(k);
        if (!seq) continue;
        dna.set(k, *seq);
        if (const std::string* a = aa_.find(k)) aa.set(k, *a);
        if (const std::string* q = qc_.find(k)) qc.set(k, *q);
    }
    return SequenceCollection(std::move(dna), std::move(aa), std::move(qc), title_, file_);
}

SequenceCollection SequenceCollection::unique(const std::string& tag) const {
    SequenceMap dna;
    int rank = 1;
    for (const auto& [seq, count] : count_frequencies(dna_.values())) {
        dna.set(tag + "_" + std::to_string(rank++) + "_" + std::to_string(count), seq);
    }
    return SequenceCollection(std::move(dna), {}, {}, title_ + "_uniq", file_);
}

void SequenceCollection::translate(int codon_position) {
    aa_.clear();
    for (const auto& e : dna_) {
        aa_.set(e.name, translate_sequence(e.seq, codon_position));
    }
}

std::pair<SequenceCollection, SequenceCollection> SequenceCollection::stop_codon(
    int codon_position) {
    translate(codon_position);
    std::vector<std::string> with_stop;
    std::vector<std::string> without_stop;
    for (const auto& e : aa_) {
        if (e.seq.find(kStop) != std::string::npos) {
            with_stop.push_back(e.name);
        } else {
            without_stop.push_back(e.name);
        }
    }
    SequenceCollection stop = sub(with_stop);
    stop.set_title(title_ + "_stop");
    return {std::move(stop), sub(without_stop)};
}

SequenceCollection SequenceCollection::gap_strip(SeqKind kind) const {
    const SequenceMap& aln = sequences(kind);
    const size_t len = require_alignment(aln, "gap_strip");

    std::vector<bool> keep(len, true);
    for (const auto& e : aln) {
        for (size_t i = 0; i < len; ++i) {
            if (e.seq[i] == kGap) keep[i] = false;
        }
    }

    SequenceMap stripped = keep_columns(aln, keep);
    SequenceCollection out = kind == SeqKind::NT
        ? SequenceCollection(std::move(stripped), aa_, qc_, title_ + "_strip", file_)
        : SequenceCollection(dna_, std::move(stripped), qc_, title_ + "_strip", file_);
    return out;
}

SequenceCollection SequenceCollection::gap_strip_ends(SeqKind kind) const {
    const SequenceMap& aln = sequences(kind);
    const size_t len = require_alignment(aln, "gap_strip_ends");

    auto column_has_gap = [&aln](size_t col) {
        for (const auto& e : aln) {
            if (e.seq[col] == kGap) return true;
        }
        return false;
    };

    size_t left = 0;
    while (left < len && column_has_gap(left)) ++left;
    size_t right = len;
    while (right > left && column_has_gap(right - 1)) --right;

    std::vector<bool> keep(len, false);
    for (size_t i = left; i < right; ++i) keep[i] = true;

    SequenceMap stripped = keep_columns(aln, keep);
    SequenceCollection out = kind == SeqKind::NT
        ? SequenceCollection(std::move(stripped), aa_, qc_, title_ + "_strip", file_)
        : SequenceCollection(dna_, std::move(stripped), qc_, title_ + "_strip", file_);
    return out;
}

std::string SequenceCollection::to_rsphylip() const {
    const size_t len = require_alignment(dna_, "to_rsphylip");

    size_t max_name = 0;
    for (const auto& e : dna_) max_name = std::max(max_name, e.name.size());
    const size_t name_block = std::max<size_t>(max_name, 10);

    std::ostringstream out;
    out << ' ' << dna_.size() << ' ' << len << '\n';
    for (const auto& e : dna_) {
        out << e.name << std::string(name_block - e.name.size() + 2, ' ');
        for (size_t i = 0; i < e.seq.size(); i += 10) {
            if (i > 0) out << ' ';
            out << e.seq.substr(i, 10);
        }
        out << '\n';
    }
    return out.str();
}

}  // namespace viralseq
