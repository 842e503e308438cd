#ifndef VIRALSEQ_SEQUENCE_COLLECTION_H
#define VIRALSEQ_SEQUENCE_COLLECTION_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace viralseq {

constexpr char kGap = '-';
constexpr char kStop = '*';

// Which payload of a collection an operation works on.
enum class SeqKind {
    NT,
    AA
};

/**
 * Insertion-ordered name -> sequence map.
 *
 * Iteration order is the order in which names were first inserted; every
 * order-dependent output (unique naming, collapsing, subsets) follows it.
 */
class SequenceMap {
public:
    struct Entry {
        std::string name;
        std::string seq;
    };

    SequenceMap() = default;

    // Inserts or overwrites. An overwritten name keeps its original position.
    void set(const std::string& name, std::string seq);

    bool erase(const std::string& name);

    const std::string* find(const std::string& name) const;
    bool contains(const std::string& name) const { return index_.count(name) > 0; }

    // Throws std::out_of_range for unknown names.
    const std::string& at(const std::string& name) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear();

    std::vector<std::string> names() const;
    std::vector<std::string> values() const;

    std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

/**
 * Distinct values with their multiplicity, in order of first appearance.
 */
std::vector<std::pair<std::string, int64_t>> count_frequencies(
    const std::vector<std::string>& values);

/**
 * SequenceCollection: named nucleotide sequences plus the amino-acid and
 * quality strings derived from (or read alongside) them.
 *
 * The three maps share identifiers but carry different payload roles.
 * Every transformation returns an independent copy; translate() is the only
 * operation that mutates the collection it is called on.
 */
class SequenceCollection {
public:
    SequenceCollection() = default;
    SequenceCollection(SequenceMap dna,
                       SequenceMap aa = {},
                       SequenceMap qc = {},
                       std::string title = "",
                       std::string file = "");

    // Names are "<tag>_1", "<tag>_2", ...; title is the tag.
    static SequenceCollection from_array(const std::vector<std::string>& seqs,
                                         const std::string& tag = "seq");

    SequenceMap& dna() { return dna_; }
    const SequenceMap& dna() const { return dna_; }
    SequenceMap& aa() { return aa_; }
    const SequenceMap& aa() const { return aa_; }
    SequenceMap& qc() { return qc_; }
    const SequenceMap& qc() const { return qc_; }

    const SequenceMap& sequences(SeqKind kind) const {
        return kind == SeqKind::AA ? aa_ : dna_;
    }

    const std::string& title() const { return title_; }
    void set_title(std::string title) { title_ = std::move(title); }
    const std::string& file() const { return file_; }
    void set_file(std::string file) { file_ = std::move(file); }

    size_t size() const { return dna_.size(); }
    bool empty() const { return dna_.empty(); }

    // Subset carrying all three maps; keys absent from the dna map are skipped.
    SequenceCollection sub(const std::vector<std::string>& keys) const;

    // One record per distinct nucleotide sequence: "<tag>_<rank>_<count>".
    SequenceCollection unique(const std::string& tag = "sequence") const;

    // Fills the aa map from the dna map in reading frame 0, 1 or 2.
    void translate(int codon_position = 0);

    // Translates, then splits into (with stop codon, without stop codon).
    std::pair<SequenceCollection, SequenceCollection> stop_codon(int codon_position = 0);

    // Drops every alignment column that contains a gap.
    SequenceCollection gap_strip(SeqKind kind = SeqKind::NT) const;

    // Drops gap-containing columns at the two ends of the alignment only.
    SequenceCollection gap_strip_ends(SeqKind kind = SeqKind::NT) const;

    // Relaxed sequential PHYLIP rendering of the dna map.
    std::string to_rsphylip() const;

private:
    SequenceMap dna_;
    SequenceMap aa_;
    SequenceMap qc_;
    std::string title_;
    std::string file_;
};

/**
 * Checks that every sequence in the map has the same length and returns it.
 * Throws EmptyInputError on an empty map and DegenerateInputError when the
 * lengths differ. `op` names the calling operation in the message.
 */
size_t require_alignment(const SequenceMap& seqs, const char* op);

// Standard genetic code; "---" -> '-', codons with any other symbol -> 'X'.
char translate_codon(char b1, char b2, char b3);
std::string translate_sequence(const std::string& dna, int codon_position = 0);

std::string reverse_complement(const std::string& seq);

}  // namespace viralseq

#endif  // VIRALSEQ_SEQUENCE_COLLECTION_H
