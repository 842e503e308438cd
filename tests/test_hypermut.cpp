#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "errors.h"
#include "hypermut.h"

using namespace viralseq;

// ============================================================================
// Test Helpers
// ============================================================================

void print_test_header(const std::string& name) {
    std::cout << "\nTesting " << name << "...\n";
}

bool near(double a, double b, double rel) {
    return std::fabs(a - b) <= rel * std::fabs(b);
}

// 19 GRD sites and 22 control G sites.
const std::string kBase =
    "AACGTCCGGCATGTTACACATCTACAAACGTGATGGTTGTACCGCATACCACCCTGGGGTACCCTAAGCAATGGGTTG"
    "CAACCGCTAGTAAATGGCAACGACGGATTGAGGCCTTTCGGGAGGTAAGGTGTGAACATATGAGGAATTATG";

// G->A at the first 12 GRD sites.
const std::string kHyper1 =
    "AACGTCCGGCATGTTACACATCTACAAACGTAATAGTTGTACCGCATACCACCCTAAAGTACCCTAAGCAATAAGTTG"
    "CAACCGCTAGTAAATGGCAACGACAAATTAAGGCCTTTCAAGAGGTAAGGTGTGAACATATGAGGAATTATG";

// G->A at every other GRD site (10) and one control site.
const std::string kHyper2 =
    "AACGTCCGGCATGTTACACATCTACAAACGTAATGGTTGTACCGCATACCACCCTAGAGTACCCTAAGCAATGAATTG"
    "CAACCGCTAGTAAATGGCAACGACGAATTGAGGCCTTTCAGAAGGTAAAGTGTGAACATATAAGAAATTATG";

// 22 background sequences: four carry one control-site G->A, four carry a
// C->T elsewhere, the rest are the base. The two hypermutants are inserted as
// seq_11 and seq_19.
SequenceCollection hypermut_panel() {
    const std::vector<size_t> control_columns = {3, 7, 8, 12};

    std::vector<size_t> c_columns;
    for (size_t i = 0; i < kBase.size(); ++i) {
        if (kBase[i] == 'C') c_columns.push_back(i);
    }

    std::vector<std::string> normals;
    for (size_t i = 0; i < 22; ++i) {
        std::string s = kBase;
        if (i < 4) {
            s[control_columns[i]] = 'A';
        } else if (i < 8) {
            s[c_columns[i]] = 'T';
        }
        normals.push_back(s);
    }

    std::vector<std::string> seqs(normals.begin(), normals.begin() + 10);
    seqs.push_back(kHyper1);
    seqs.insert(seqs.end(), normals.begin() + 10, normals.begin() + 17);
    seqs.push_back(kHyper2);
    seqs.insert(seqs.end(), normals.begin() + 17, normals.end());
    return SequenceCollection::from_array(seqs);
}

// ============================================================================
// APOBEC sites
// ============================================================================

void test_apobec_sites() {
    print_test_header("apobec3gf_sites");

    const auto sites = apobec3gf_sites(kBase);
    assert(sites.motif.size() == 19);
    assert(sites.control.size() == 22);
    assert(sites.motif.front() == 31);
    assert(sites.motif.back() == 142);
    assert(sites.control.front() == 3);
    assert(sites.control.back() == 129);

    // Gaps are skipped for the context, columns stay in gapped coordinates
    const auto gapped = apobec3gf_sites("G-AA-GCG");
    assert((gapped.motif == std::vector<size_t>{0}));
    assert((gapped.control == std::vector<size_t>{5}));

    // GC / GGC / GAC are controls, GAA / GGT motifs
    const auto small = apobec3gf_sites("GCAGGCAGAAGGTA");
    assert((small.motif == std::vector<size_t>{7, 10}));
    assert((small.control == std::vector<size_t>{0, 3, 4, 11}));

    assert(apobec3gf_sites("GA").motif.empty());

    std::cout << "  apobec3gf_sites tests passed!\n";
}

void test_outlier_cutoff() {
    print_test_header("apobec_outlier_cutoff");

    std::vector<int64_t> counts(22, 0);
    counts.push_back(12);
    counts.push_back(10);
    assert(apobec_outlier_cutoff(counts, 20.0) == 10);

    // Nothing stands out: the largest count
    assert(apobec_outlier_cutoff({1, 1, 1}, 20.0) == 1);
    assert(apobec_outlier_cutoff({}, 20.0) == 0);

    // Non-decreasing in the fold multiplier
    const std::vector<int64_t> mixed = {0, 0, 0, 1, 1, 2, 0, 3, 0, 0, 1, 7, 0, 0, 9};
    int64_t previous = 0;
    for (double fold : {0.1, 1.0, 2.0, 5.0, 20.0, 1e3, 1e6}) {
        const int64_t k = apobec_outlier_cutoff(mixed, fold);
        assert(k >= previous);
        previous = k;
    }

    std::cout << "  apobec_outlier_cutoff tests passed!\n";
}

// ============================================================================
// Hypermutation screen
// ============================================================================

void test_a3g_hypermut() {
    print_test_header("a3g_hypermut");

    auto panel = hypermut_panel();
    panel.set_title("panel");
    assert(panel.size() == 24);

    HypermutConfig config;
    config.verbose = true;
    const HypermutResult result = a3g_hypermut(panel, config);

    assert(result.records.size() == 24);
    assert(result.records[10].name == "seq_11");

    const auto hyper = result.hypermutated_records();
    assert(hyper.size() == 2);
    assert(hyper[0].name == "seq_11");
    assert(hyper[1].name == "seq_19");

    // seq_11: no control mutation, rate ratio infinite
    const auto& h1 = hyper[0];
    assert(h1.a == 12 && h1.b == 19 && h1.c == 0 && h1.d == 22);
    assert(std::isinf(h1.rate_ratio));
    assert(near(h1.p_value, 6.379314011100006e-06, 1e-6));
    assert(h1.fisher_significant);
    assert(h1.poisson_outlier);

    const auto& h2 = hyper[1];
    assert(h2.a == 10 && h2.b == 19 && h2.c == 1 && h2.d == 22);
    assert(near(h2.rate_ratio, 11.578947368421051, 1e-9));
    assert(near(h2.p_value, 0.0008904459140493759, 1e-6));
    assert(h2.fisher_significant);
    assert(!h2.poisson_outlier);

    assert(result.outlier_cutoff.has_value());
    assert(*result.outlier_cutoff == 10);

    // Background: zero GRD mutations, no call
    const auto& bg = result.records[0];
    assert(bg.a == 0 && bg.b == 19 && bg.c == 1 && bg.d == 22);
    assert(bg.rate_ratio == 0.0);
    assert(!bg.hypermutated);
    assert(std::isnan(result.records[5].rate_ratio));  // 0/19 over 0/22

    assert(result.hypermutated.size() == 2);
    assert(result.hypermutated.title() == "panel_hypermut");
    assert(result.hypermutated.dna().at("seq_19") == kHyper2);
    assert(result.filtered.size() == 22);
    assert(!result.filtered.dna().contains("seq_11"));
    assert(result.filtered.title() == "panel");

    std::cout << "  a3g_hypermut tests passed!\n";
}

void test_small_collection() {
    print_test_header("a3g_hypermut without Poisson test");

    // 20 sequences or fewer: Fisher only
    std::vector<std::string> seqs(9, kBase);
    seqs.push_back(kHyper1);
    const auto result = a3g_hypermut(SequenceCollection::from_array(seqs));
    assert(!result.outlier_cutoff.has_value());
    assert(result.hypermutated.size() == 1);
    assert(result.hypermutated.dna().contains("seq_10"));
    for (const auto& rec : result.records) {
        assert(!rec.poisson_outlier);
    }

    bool threw = false;
    try {
        a3g_hypermut(SequenceCollection());
    } catch (const EmptyInputError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  small collection tests passed!\n";
}

int main() {
    std::cout << "=== viralseq Hypermutation Tests ===\n";

    try {
        test_apobec_sites();
        test_outlier_cutoff();
        test_a3g_hypermut();
        test_small_collection();

        std::cout << "\n=== All hypermutation tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
