#include "dedup.h"
#include "diversity.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace viralseq {

namespace {

// Hamming distance with unmatched tail positions counted as differences.
int64_t padded_hamming(const std::string& a, const std::string& b) {
    const int64_t len_diff = static_cast<int64_t>(a.size() > b.size() ? a.size() - b.size()
                                                                       : b.size() - a.size());
    return hamming_distance(a, b) + len_diff;
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

}  // namespace

std::optional<PrimerIdTag> parse_primer_id_tag(const std::string& name) {
    const size_t begin = !name.empty() && name[0] == '>' ? 1 : 0;
    const size_t sep = name.find('_', begin);
    if (sep == std::string::npos || sep == begin) return std::nullopt;

    const size_t next = name.find('_', sep + 1);
    const std::string count = name.substr(sep + 1, next == std::string::npos
                                                       ? std::string::npos
                                                       : next - sep - 1);
    if (!all_digits(count)) return std::nullopt;

    PrimerIdTag tag;
    tag.pid = name.substr(begin, sep - begin);
    tag.count = std::strtoll(count.c_str(), nullptr, 10);
    return tag;
}

SequenceCollection filter_similar_pid(const SequenceCollection& collection,
                                      const PrimerIdConfig& config) {
    // Primer IDs (with counts) per distinct payload, first-appearance order.
    std::vector<std::string> payloads;
    std::unordered_map<std::string, std::vector<PrimerIdTag>> pids_by_payload;
    int64_t unparsed = 0;

    for (const auto& e : collection.dna()) {
        auto tag = parse_primer_id_tag(e.name);
        if (!tag) {
            ++unparsed;
            continue;
        }
        auto it = pids_by_payload.find(e.seq);
        if (it == pids_by_payload.end()) {
            payloads.push_back(e.seq);
            it = pids_by_payload.emplace(e.seq, std::vector<PrimerIdTag>()).first;
        }
        auto& group = it->second;
        auto same = std::find_if(group.begin(), group.end(),
                                 [&tag](const PrimerIdTag& t) { return t.pid == tag->pid; });
        if (same != group.end()) {
            same->count = tag->count;  // later record wins
        } else {
            group.push_back(*tag);
        }
    }

    std::unordered_set<std::string> discarded;
    for (const auto& payload : payloads) {
        const auto& group = pids_by_payload[payload];
        for (size_t i = 0; i < group.size(); ++i) {
            for (size_t j = i + 1; j < group.size(); ++j) {
                if (padded_hamming(group[i].pid, group[j].pid) > config.max_distance) continue;
                const double n1 = static_cast<double>(group[i].count);
                const double n2 = static_cast<double>(group[j].count);
                if (n1 >= config.fold * n2) {
                    discarded.insert(group[j].pid);
                } else if (n2 >= config.fold * n1) {
                    discarded.insert(group[i].pid);
                }
            }
        }
    }

    std::vector<std::string> kept;
    for (const auto& e : collection.dna()) {
        auto tag = parse_primer_id_tag(e.name);
        if (tag && discarded.count(tag->pid)) continue;
        kept.push_back(e.name);
    }

    if (config.verbose) {
        std::cout << "[PrimerID] discarded " << discarded.size() << " Primer IDs, kept "
                  << kept.size() << "/" << collection.size() << " sequences" << std::endl;
        if (unparsed > 0) {
            std::cerr << "[PrimerID] Warning: " << unparsed
                      << " identifiers without a PID_count prefix were kept as is" << std::endl;
        }
    }
    return collection.sub(kept);
}

SequenceCollection collapse(const SequenceCollection& collection, const CollapseConfig& config) {
    const auto freq = count_frequencies(collection.dna().values());

    std::vector<bool> dropped(freq.size(), false);
    for (size_t i = 0; i < freq.size(); ++i) {
        for (size_t j = i + 1; j < freq.size(); ++j) {
            if (padded_hamming(freq[i].first, freq[j].first) > config.cutoff) continue;
            if (freq[i].second >= freq[j].second) {
                dropped[j] = true;
            } else {
                dropped[i] = true;
            }
        }
    }

    SequenceMap dna;
    int rank = 1;
    for (size_t i = 0; i < freq.size(); ++i) {
        if (dropped[i]) continue;
        dna.set(config.tag + "_" + std::to_string(rank++) + "_" + std::to_string(freq[i].second),
                freq[i].first);
    }
    return SequenceCollection(std::move(dna), {}, {}, collection.title(), collection.file());
}

}  // namespace viralseq
