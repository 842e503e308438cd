#ifndef VIRALSEQ_REFERENCE_GENOME_H
#define VIRALSEQ_REFERENCE_GENOME_H

#include <array>
#include <map>
#include <optional>
#include <string>

namespace viralseq {

// Reference genomes the locator can report coordinates on.
enum class ReferenceId {
    HXB2,    // HIV-1 HXB2, GenBank K03455 (default)
    NL43,    // HIV-1 NL4-3, GenBank AF324493
    MAC239   // SIVmac239, GenBank M33262
};

constexpr std::array<ReferenceId, 3> kAllReferences = {
    ReferenceId::HXB2, ReferenceId::NL43, ReferenceId::MAC239};

const char* reference_name(ReferenceId id);

// Case-insensitive lookup; nullopt for an unknown token.
std::optional<ReferenceId> find_reference_id(const std::string& token);

// Unknown tokens fall back to HXB2 with a warning on stderr.
ReferenceId parse_reference_id(const std::string& token);

/**
 * Read-only table of reference genome sequences, keyed by ReferenceId.
 *
 * Built once (typically at startup) from a FASTA whose record names are the
 * reference names, and never modified afterwards. Sequences are upper-cased;
 * positions reported against them are 1-based.
 */
class ReferenceLibrary {
public:
    ReferenceLibrary() = default;
    explicit ReferenceLibrary(std::map<ReferenceId, std::string> sequences);

    /**
     * Load every known reference present in `fasta_path` through htslib's
     * faidx (the .fai index is built next to the FASTA if missing).
     * @throws InputError if the FASTA cannot be opened or holds none of them
     */
    static ReferenceLibrary load(const std::string& fasta_path);

    bool has(ReferenceId id) const { return sequences_.count(id) > 0; }

    // @throws InputError when the reference was not loaded
    const std::string& sequence(ReferenceId id) const;

    size_t size() const { return sequences_.size(); }

private:
    std::map<ReferenceId, std::string> sequences_;
};

// Environment variable naming the default reference FASTA.
constexpr const char* kReferenceFastaEnv = "VIRALSEQ_REF_FASTA";

// Value of VIRALSEQ_REF_FASTA, or empty.
std::string default_reference_fasta();

}  // namespace viralseq

#endif  // VIRALSEQ_REFERENCE_GENOME_H
