#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "errors.h"
#include "poisson_cutoff.h"

using namespace viralseq;

void print_test_header(const std::string& name) {
    std::cout << "\nTesting " << name << "...\n";
}

// n sequences of `len` A's; each (row, column) in `variants` becomes a T.
SequenceCollection make_alignment(int n, size_t len,
                                  const std::vector<std::pair<int, size_t>>& variants) {
    std::vector<std::string> seqs(static_cast<size_t>(n), std::string(len, 'A'));
    for (const auto& [row, col] : variants) {
        seqs[static_cast<size_t>(row)][col] = 'T';
    }
    return SequenceCollection::from_array(seqs);
}

void test_variant_distribution() {
    print_test_header("variant_distribution");

    const auto seqs = make_alignment(10, 5, {{0, 0}, {1, 1}, {2, 1}});
    const auto dist = variant_distribution(seqs.dna());
    assert(dist.at(0) == 3);
    assert(dist.at(1) == 1);
    assert(dist.at(2) == 1);

    std::cout << "  variant_distribution tests passed!\n";
}

void test_cutoff() {
    print_test_header("poisson_minority_cutoff");

    // N = 10, L = 100, lambda = 0.001; expected columns with one variant ~ 0.0999
    PoissonCutoffConfig config;

    // Two singleton columns exceed 20x expectation
    auto seqs = make_alignment(10, 100, {{0, 0}, {1, 1}});
    assert(poisson_minority_cutoff(seqs, config) == 1);

    // One singleton column does not, a triple-variant column does
    seqs = make_alignment(10, 100, {{0, 0}, {1, 5}, {2, 5}, {3, 5}});
    assert(poisson_minority_cutoff(seqs, config) == 3);

    // Nothing qualifies: one past the largest observed count
    seqs = make_alignment(10, 100, {{0, 0}});
    assert(poisson_minority_cutoff(seqs, config) == 2);

    // No variants at all
    seqs = make_alignment(10, 100, {});
    assert(poisson_minority_cutoff(seqs, config) == 1);

    // Empty collection
    assert(poisson_minority_cutoff(SequenceCollection(), config) == 0);

    // Sequences without columns
    bool threw = false;
    try {
        poisson_minority_cutoff(SequenceCollection::from_array({"", "", ""}), config);
    } catch (const DegenerateInputError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  poisson_minority_cutoff tests passed!\n";
}

void test_cutoff_monotonic_in_fold() {
    print_test_header("cutoff monotonic in fold");

    const auto seqs = make_alignment(10, 100, {{0, 0}, {1, 5}, {2, 5}, {3, 5}, {4, 9}, {5, 9}});

    int64_t previous = 0;
    for (double fold : {0.5, 1.0, 5.0, 20.0, 100.0, 1e4, 1e8, 1e12}) {
        PoissonCutoffConfig config;
        config.fold_cutoff = fold;
        const int64_t k = poisson_minority_cutoff(seqs, config);
        std::cout << "  fold=" << fold << " cutoff=" << k << "\n";
        assert(k >= previous);
        previous = k;
    }

    std::cout << "  monotonicity tests passed!\n";
}

int main() {
    std::cout << "=== viralseq Poisson Cutoff Tests ===\n";

    try {
        test_variant_distribution();
        test_cutoff();
        test_cutoff_monotonic_in_fold();

        std::cout << "\n=== All Poisson cutoff tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
