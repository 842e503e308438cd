#include "locator.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <unordered_map>

namespace viralseq {

namespace {

int64_t count_residues(const std::string& row, size_t from, size_t to) {
    int64_t n = 0;
    for (size_t i = from; i < to && i < row.size(); ++i) {
        if (row[i] != kGap) ++n;
    }
    return n;
}

}  // namespace

const char* orientation_symbol(Orientation o) {
    return o == Orientation::Forward ? "+" : "-";
}

LocatorResult summarize_alignment(const AlignmentResult& alignment,
                                  int64_t ref_offset,
                                  Orientation orientation) {
    const std::string& q = alignment.aligned_query;
    const std::string& r = alignment.aligned_reference;
    if (q.size() != r.size()) {
        throw AlignmentUnavailableError("aligner returned rows of unequal length (" +
                                        std::to_string(q.size()) + " vs " +
                                        std::to_string(r.size()) + ")");
    }

    const size_t first = q.find_first_not_of(kGap);
    if (first == std::string::npos) {
        throw AlignmentUnavailableError("aligner returned an all-gap query row");
    }
    const size_t last = q.find_last_not_of(kGap);

    LocatorResult result;
    result.orientation = orientation;
    result.aligned_query = q.substr(first, last - first + 1);
    result.aligned_reference = r.substr(first, last - first + 1);

    result.ref_start = ref_offset + count_residues(r, 0, first) + 1;
    result.ref_end = ref_offset + count_residues(r, 0, last + 1);

    int64_t matches = 0;
    for (size_t i = 0; i < result.aligned_query.size(); ++i) {
        if (result.aligned_query[i] == result.aligned_reference[i]) ++matches;
    }
    const double core = static_cast<double>(result.aligned_query.size());
    result.similarity = std::round(static_cast<double>(matches) / core * 1000.0) / 10.0;

    result.has_indel = result.aligned_query.find(kGap) != std::string::npos ||
                       result.aligned_reference.find(kGap) != std::string::npos;
    return result;
}

// ============================================================================
// SequenceLocator
// ============================================================================

SequenceLocator::SequenceLocator(const ReferenceLibrary& references,
                                 PairwiseAligner& aligner,
                                 LocatorConfig config)
    : references_(references), aligner_(aligner), config_(std::move(config)) {}

LocatorResult SequenceLocator::locate(const std::string& sequence) const {
    return locate(sequence, config_.reference);
}

LocatorResult SequenceLocator::locate(const std::string& sequence, ReferenceId reference) const {
    LocatorResult forward = locate_forward(sequence, reference);

    const std::string& genome = references_.sequence(reference);
    const std::string rc = reverse_complement(sequence);
    LocatorResult reverse = summarize_alignment(aligner_.align(rc, genome), 0,
                                                Orientation::Reverse);
    if (config_.refine) {
        reverse = refine(rc, genome, reverse, Orientation::Reverse);
    }

    if (config_.verbose) {
        std::cout << "[Locator] " << reference_name(reference)
                  << " forward=" << forward.similarity
                  << "% reverse=" << reverse.similarity << "%" << std::endl;
    }
    return forward.similarity >= reverse.similarity ? forward : reverse;
}

LocatorResult SequenceLocator::locate_forward(const std::string& sequence,
                                              ReferenceId reference) const {
    if (sequence.empty()) {
        throw InputError("locator: empty query sequence");
    }
    const std::string& genome = references_.sequence(reference);
    LocatorResult result = summarize_alignment(aligner_.align(sequence, genome), 0,
                                               Orientation::Forward);
    if (config_.refine) {
        result = refine(sequence, genome, result, Orientation::Forward);
    }
    return result;
}

LocatorResult SequenceLocator::refine(const std::string& sequence,
                                      const std::string& genome,
                                      const LocatorResult& first_pass,
                                      Orientation orientation) const {
    const int64_t query_len = static_cast<int64_t>(sequence.size());
    const int64_t span = first_pass.ref_end - first_pass.ref_start + 1;
    if (static_cast<double>(span) <= config_.refine_ratio * static_cast<double>(query_len)) {
        return first_pass;
    }

    // Longest gap-free block of the query inside the aligned core.
    const std::string& q = first_pass.aligned_query;
    const std::string& r = first_pass.aligned_reference;
    size_t best_from = 0, best_len = 0;
    size_t run_from = 0;
    for (size_t i = 0; i <= q.size(); ++i) {
        if (i < q.size() && q[i] != kGap) continue;
        if (i - run_from > best_len) {
            best_from = run_from;
            best_len = i - run_from;
        }
        run_from = i + 1;
    }
    if (best_len == 0) return first_pass;

    const size_t best_to = best_from + best_len;
    const int64_t before = count_residues(q, 0, best_from);
    const int64_t after = count_residues(q, best_to, q.size());

    const int64_t block_lo = first_pass.ref_start - 1 + count_residues(r, 0, best_from);
    const int64_t block_hi = first_pass.ref_start - 1 + count_residues(r, 0, best_to);

    const int64_t genome_len = static_cast<int64_t>(genome.size());
    const int64_t lo = std::max<int64_t>(
        0, block_lo - static_cast<int64_t>(config_.refine_ratio * static_cast<double>(before)));
    const int64_t hi = std::min<int64_t>(
        genome_len,
        block_hi + static_cast<int64_t>(config_.refine_ratio * static_cast<double>(after)));
    if (hi <= lo) return first_pass;

    if (config_.verbose) {
        std::cout << "[Locator] refining alignment against reference window "
                  << (lo + 1) << "-" << hi << std::endl;
    }

    const std::string window = genome.substr(static_cast<size_t>(lo), static_cast<size_t>(hi - lo));
    return summarize_alignment(aligner_.align(sequence, window), lo, orientation);
}

std::vector<LocatorRow> SequenceLocator::locate_collection(const SequenceCollection& collection) const {
    std::vector<LocatorRow> rows;
    rows.reserve(collection.size());

    std::unordered_map<std::string, LocatorResult> located;
    for (const auto& e : collection.dna()) {
        auto it = located.find(e.seq);
        if (it == located.end()) {
            it = located.emplace(e.seq, locate(e.seq, config_.reference)).first;
        }
        LocatorRow row;
        row.title = collection.title();
        row.name = e.name;
        row.reference = config_.reference;
        row.result = it->second;
        rows.push_back(std::move(row));
    }
    return rows;
}

SequenceCollection SequenceLocator::hiv_seq_qc(const SequenceCollection& collection,
                                               const PositionRange& start,
                                               const PositionRange& end,
                                               bool allow_indel) const {
    std::unordered_map<std::string, bool> verdict;
    std::vector<std::string> passed;
    for (const auto& e : collection.dna()) {
        auto it = verdict.find(e.seq);
        if (it == verdict.end()) {
            const LocatorResult loc = locate_forward(e.seq, config_.reference);
            const bool ok = start.contains(loc.ref_start) && end.contains(loc.ref_end) &&
                            (allow_indel || !loc.has_indel);
            it = verdict.emplace(e.seq, ok).first;
        }
        if (it->second) passed.push_back(e.name);
    }

    if (config_.verbose) {
        std::cout << "[Locator] QC kept " << passed.size() << "/" << collection.size()
                  << " sequences" << std::endl;
    }
    return collection.sub(passed);
}

}  // namespace viralseq
