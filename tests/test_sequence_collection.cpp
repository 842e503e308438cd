#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "errors.h"
#include "sequence_collection.h"

using namespace viralseq;

// ============================================================================
// Test Helpers
// ============================================================================

void print_test_header(const std::string& name) {
    std::cout << "\nTesting " << name << "...\n";
}

SequenceCollection gapped_alignment() {
    return SequenceCollection::from_array(
        {"AACCGGTT", "A-CCGGTT", "AAC-GGTT", "AACCG-TT", "AACCGGT-"});
}

// ============================================================================
// SequenceMap
// ============================================================================

void test_sequence_map() {
    print_test_header("SequenceMap");

    SequenceMap m;
    m.set("b", "CCCC");
    m.set("a", "AAAA");
    m.set("c", "GGGG");
    assert(m.size() == 3);
    assert((m.names() == std::vector<std::string>{"b", "a", "c"}));

    // Overwrite keeps position
    m.set("b", "TTTT");
    assert(m.names().front() == "b");
    assert(m.at("b") == "TTTT");

    assert(m.erase("a"));
    assert(!m.erase("a"));
    assert((m.names() == std::vector<std::string>{"b", "c"}));
    assert(m.at("c") == "GGGG");
    assert(m.find("a") == nullptr);

    bool threw = false;
    try {
        m.at("missing");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    const auto freq = count_frequencies({"AC", "GT", "AC", "AC", "TT"});
    assert(freq.size() == 3);
    assert(freq[0].first == "AC" && freq[0].second == 3);
    assert(freq[1].first == "GT" && freq[1].second == 1);
    assert(freq[2].first == "TT" && freq[2].second == 1);

    std::cout << "  SequenceMap tests passed!\n";
}

// ============================================================================
// Construction / subsets
// ============================================================================

void test_from_array_and_sub() {
    print_test_header("from_array / sub");

    auto seqs = SequenceCollection::from_array({"ACGT", "ACGA", "TTTT"});
    assert(seqs.size() == 3);
    assert(seqs.title() == "seq");
    assert((seqs.dna().names() == std::vector<std::string>{"seq_1", "seq_2", "seq_3"}));

    auto tagged = SequenceCollection::from_array({"A"}, "env");
    assert(tagged.dna().names().front() == "env_1");

    seqs.qc().set("seq_3", "IIII");
    const auto subset = seqs.sub({"seq_3", "missing", "seq_1"});
    assert(subset.size() == 2);
    assert((subset.dna().names() == std::vector<std::string>{"seq_3", "seq_1"}));
    assert(subset.qc().size() == 1);
    assert(subset.qc().at("seq_3") == "IIII");
    assert(subset.title() == "seq");

    // The source is untouched.
    assert(seqs.size() == 3);

    std::cout << "  from_array / sub tests passed!\n";
}

void test_unique() {
    print_test_header("unique");

    const auto seqs = SequenceCollection::from_array({"AAA", "CCC", "AAA", "GGG", "CCC", "AAA"});
    const auto uniq = seqs.unique();
    assert(uniq.title() == "seq_uniq");
    assert((uniq.dna().names() ==
            std::vector<std::string>{"sequence_1_3", "sequence_2_2", "sequence_3_1"}));
    assert(uniq.dna().at("sequence_1_3") == "AAA");
    assert(uniq.dna().at("sequence_3_1") == "GGG");

    const auto tagged = seqs.unique("var");
    assert(tagged.dna().names().front() == "var_1_3");

    std::cout << "  unique tests passed!\n";
}

// ============================================================================
// Translation
// ============================================================================

void test_translation() {
    print_test_header("translation");

    assert(translate_codon('A', 'T', 'G') == 'M');
    assert(translate_codon('T', 'A', 'A') == '*');
    assert(translate_codon('T', 'G', 'G') == 'W');
    assert(translate_codon('G', 'G', 'C') == 'G');
    assert(translate_codon('-', '-', '-') == '-');
    assert(translate_codon('A', 'N', 'G') == 'X');
    assert(translate_codon('A', '-', 'G') == 'X');

    assert(translate_sequence("ATGAAATAA") == "MK*");
    assert(translate_sequence("ATG---AAA") == "M-K");
    assert(translate_sequence("CATGAAATAA", 1) == "MK*");
    assert(translate_sequence("ATGAA") == "M");   // trailing partial codon ignored
    assert(translate_sequence("AT").empty());

    bool threw = false;
    try {
        translate_sequence("ATG", 3);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    assert(reverse_complement("AACGTR-") == "-YACGTT");

    auto seqs = SequenceCollection::from_array({"ATGTGG", "ATGTAG"});
    seqs.translate();
    assert(seqs.aa().at("seq_1") == "MW");
    assert(seqs.aa().at("seq_2") == "M*");

    auto [with_stop, without_stop] = seqs.stop_codon();
    assert(with_stop.size() == 1);
    assert(with_stop.dna().contains("seq_2"));
    assert(with_stop.title() == "seq_stop");
    assert(without_stop.size() == 1);
    assert(without_stop.dna().contains("seq_1"));
    assert(without_stop.aa().at("seq_1") == "MW");

    std::cout << "  translation tests passed!\n";
}

// ============================================================================
// Gap stripping
// ============================================================================

void test_gap_strip() {
    print_test_header("gap_strip");

    const auto seqs = gapped_alignment();

    const auto stripped = seqs.gap_strip();
    assert(stripped.title() == "seq_strip");
    for (const auto& e : stripped.dna()) {
        assert(e.seq == "ACGT");
    }

    const auto ends = seqs.gap_strip_ends();
    const std::vector<std::string> expected = {
        "AACCGGT", "A-CCGGT", "AAC-GGT", "AACCG-T", "AACCGGT"};
    assert(ends.dna().values() == expected);

    // No gaps: nothing removed
    const auto clean = SequenceCollection::from_array({"ACGT", "ACGA"});
    assert(clean.gap_strip().dna().values() == clean.dna().values());

    // Amino-acid payload strips the aa map and leaves dna alone
    auto aa = SequenceCollection::from_array({"AAAAAA", "CCCCCC"});
    aa.aa().set("seq_1", "M-K");
    aa.aa().set("seq_2", "MRK");
    const auto aa_stripped = aa.gap_strip(SeqKind::AA);
    assert(aa_stripped.aa().at("seq_1") == "MK");
    assert(aa_stripped.aa().at("seq_2") == "MK");
    assert(aa_stripped.dna().at("seq_1") == "AAAAAA");

    bool threw = false;
    try {
        SequenceCollection::from_array({"ACGT", "ACG"}).gap_strip();
    } catch (const DegenerateInputError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        SequenceCollection().gap_strip_ends();
    } catch (const EmptyInputError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  gap_strip tests passed!\n";
}

void test_rsphylip() {
    print_test_header("to_rsphylip");

    const auto seqs = SequenceCollection::from_array({"ACGTACGTACGT", "ACGTACGTACGA"});
    const std::string phy = seqs.to_rsphylip();
    const std::string expected =
        " 2 12\n"
        "seq_1       ACGTACGTAC GT\n"
        "seq_2       ACGTACGTAC GA\n";
    assert(phy == expected);

    std::cout << "  to_rsphylip tests passed!\n";
}

// ============================================================================
// Main Test Runner
// ============================================================================

int main() {
    std::cout << "=== viralseq SequenceCollection Tests ===\n";

    try {
        test_sequence_map();
        test_from_array_and_sub();
        test_unique();
        test_translation();
        test_gap_strip();
        test_rsphylip();

        std::cout << "\n=== All SequenceCollection tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
