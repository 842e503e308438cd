#include "reference_genome.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>

#include <htslib/faidx.h>

namespace viralseq {

namespace {

std::string to_upper(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

}  // namespace

const char* reference_name(ReferenceId id) {
    switch (id) {
        case ReferenceId::HXB2: return "HXB2";
        case ReferenceId::NL43: return "NL43";
        case ReferenceId::MAC239: return "MAC239";
    }
    return "HXB2";
}

std::optional<ReferenceId> find_reference_id(const std::string& token) {
    const std::string key = to_upper(token);
    for (ReferenceId id : kAllReferences) {
        if (key == reference_name(id)) return id;
    }
    return std::nullopt;
}

ReferenceId parse_reference_id(const std::string& token) {
    if (auto id = find_reference_id(token)) return *id;
    std::cerr << "[Reference] Warning: unknown reference '" << token
              << "', using HXB2 (options: HXB2, NL43, MAC239)" << std::endl;
    return ReferenceId::HXB2;
}

ReferenceLibrary::ReferenceLibrary(std::map<ReferenceId, std::string> sequences)
    : sequences_(std::move(sequences)) {
    for (auto& [id, seq] : sequences_) {
        seq = to_upper(std::move(seq));
    }
}

ReferenceLibrary ReferenceLibrary::load(const std::string& fasta_path) {
    if (fasta_path.empty()) {
        throw InputError(std::string("no reference FASTA given (use --ref-fasta or set ") +
                         kReferenceFastaEnv + ")");
    }

    std::unique_ptr<faidx_t, decltype(&fai_destroy)> fai(fai_load(fasta_path.c_str()),
                                                         &fai_destroy);
    if (!fai) {
        throw InputError("cannot open or index reference FASTA: " + fasta_path);
    }

    std::map<ReferenceId, std::string> sequences;
    for (ReferenceId id : kAllReferences) {
        const char* name = reference_name(id);
        if (!faidx_has_seq(fai.get(), name)) continue;

        hts_pos_t len = 0;
        char* raw = faidx_fetch_seq64(fai.get(), name, 0, HTS_POS_MAX, &len);
        if (!raw || len <= 0) {
            std::free(raw);
            throw InputError(std::string("failed to fetch ") + name + " from " + fasta_path);
        }
        sequences.emplace(id, std::string(raw, static_cast<size_t>(len)));
        std::free(raw);
    }

    if (sequences.empty()) {
        throw InputError("reference FASTA " + fasta_path +
                         " has no record named HXB2, NL43 or MAC239");
    }
    return ReferenceLibrary(std::move(sequences));
}

const std::string& ReferenceLibrary::sequence(ReferenceId id) const {
    auto it = sequences_.find(id);
    if (it == sequences_.end()) {
        throw InputError(std::string("reference ") + reference_name(id) + " is not loaded");
    }
    return it->second;
}

std::string default_reference_fasta() {
    const char* value = std::getenv(kReferenceFastaEnv);
    return value ? std::string(value) : std::string();
}

}  // namespace viralseq
