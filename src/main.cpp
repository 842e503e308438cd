/**
 * viralseq - viral sequence collection analysis
 *
 * Commands:
 *   consensus   IUPAC consensus of an alignment
 *   entropy     per-position Shannon entropy
 *   pi          nucleotide pairwise diversity
 *   tn93        pairwise distance histogram
 *   pm          Poisson minority-variant cutoff
 *   a3g         APOBEC3G/F hypermutation screen
 *   locate      reference coordinates of each sequence (CSV)
 *   qc          keep sequences located inside a reference window
 *   collapse    merge near-identical sequences
 *   filter-pid  drop resampled Primer IDs
 *   strip       remove gap columns
 *   stop        split sequences with / without stop codons
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "abpoa_wrapper.h"
#include "consensus.h"
#include "dedup.h"
#include "diversity.h"
#include "errors.h"
#include "hypermut.h"
#include "locator.h"
#include "poisson_cutoff.h"
#include "reference_genome.h"
#include "sequence_collection.h"
#include "sequence_io.h"

namespace viralseq {

// ============================================================================
// Command-line options
// ============================================================================

struct CommandLine {
    std::string command;
    std::string input;
    std::map<std::string, std::string> values;
    std::set<std::string> flags;

    bool has(const std::string& key) const { return values.count(key) > 0; }
    bool flag(const std::string& key) const { return flags.count(key) > 0; }

    std::string get(const std::string& key, const std::string& fallback = "") const {
        auto it = values.find(key);
        return it == values.end() ? fallback : it->second;
    }

    double get_double(const std::string& key, double fallback) const {
        return has(key) ? std::stod(get(key)) : fallback;
    }

    int64_t get_int(const std::string& key, int64_t fallback) const {
        return has(key) ? std::stoll(get(key)) : fallback;
    }
};

// Options that never take a value.
const std::set<std::string> kFlagOptions = {"--aa", "--ends", "--no-indel", "--verbose", "--all"};

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cl;
    if (argc < 2) return cl;
    cl.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (kFlagOptions.count(arg)) {
                cl.flags.insert(arg);
            } else if (i + 1 < argc) {
                cl.values[arg] = argv[++i];
            } else {
                throw std::invalid_argument("option " + arg + " needs a value");
            }
        } else if (cl.input.empty()) {
            cl.input = arg;
        } else {
            throw std::invalid_argument("unexpected argument: " + arg);
        }
    }
    return cl;
}

// "4384" or "4384-4386"
PositionRange parse_range(const std::string& text) {
    const size_t dash = text.find('-', 1);
    if (dash == std::string::npos) {
        return PositionRange(std::stoll(text));
    }
    return PositionRange(std::stoll(text.substr(0, dash)), std::stoll(text.substr(dash + 1)));
}

SequenceCollection load_input(const CommandLine& cl, SeqKind kind = SeqKind::NT) {
    if (cl.input.empty()) {
        throw std::invalid_argument("missing input sequence file");
    }
    const std::string& path = cl.input;
    if (path.size() > 3 && (path.substr(path.size() - 3) == ".fq" ||
                            (path.size() > 6 && path.substr(path.size() - 6) == ".fastq"))) {
        return read_fastq(path);
    }
    return read_fasta(path, kind);
}

std::string output_path(const CommandLine& cl, const std::string& suffix) {
    if (cl.has("--out")) return cl.get("--out");
    return file_stem(cl.input) + suffix;
}

ReferenceLibrary load_references(const CommandLine& cl) {
    const std::string path = cl.get("--ref-fasta", default_reference_fasta());
    ReferenceLibrary refs = ReferenceLibrary::load(path);
    std::cout << "[Reference] loaded " << refs.size() << " reference genome(s) from "
              << path << std::endl;
    return refs;
}

// ============================================================================
// Commands
// ============================================================================

int run_consensus(const CommandLine& cl) {
    ConsensusConfig config;
    config.cutoff = cl.get_double("--cutoff", config.cutoff);
    const SequenceCollection seqs = load_input(cl);
    std::cout << '>' << seqs.title() << "_consensus\n" << consensus(seqs, config) << std::endl;
    return 0;
}

int run_entropy(const CommandLine& cl) {
    const SeqKind kind = cl.flag("--aa") ? SeqKind::AA : SeqKind::NT;
    const SequenceCollection seqs = load_input(cl, kind);
    std::cout << "position\tentropy\n";
    for (const auto& [pos, h] : shannons_entropy(seqs, kind)) {
        std::cout << pos << '\t' << std::setprecision(6) << h << '\n';
    }
    return 0;
}

int run_pi(const CommandLine& cl) {
    const SequenceCollection seqs = load_input(cl);
    std::cout << std::fixed << std::setprecision(5) << nucleotide_pi(seqs) << std::endl;
    return 0;
}

int run_tn93(const CommandLine& cl) {
    const SequenceCollection seqs = load_input(cl);
    std::cout << "distance\tpairs\n";
    for (const auto& [dist, pairs] : pairwise_distance_histogram(seqs)) {
        std::cout << dist << '\t' << pairs << '\n';
    }
    return 0;
}

int run_pm(const CommandLine& cl) {
    PoissonCutoffConfig config;
    config.error_rate = cl.get_double("--error-rate", config.error_rate);
    config.fold_cutoff = cl.get_double("--fold", config.fold_cutoff);
    const SequenceCollection seqs = load_input(cl);
    std::cout << poisson_minority_cutoff(seqs, config) << std::endl;
    return 0;
}

int run_a3g(const CommandLine& cl) {
    HypermutConfig config;
    config.consensus_cutoff = cl.get_double("--cutoff", config.consensus_cutoff);
    config.p_value_cutoff = cl.get_double("--p-value", config.p_value_cutoff);
    config.outlier_fold = cl.get_double("--fold", config.outlier_fold);
    config.verbose = cl.flag("--verbose");

    const SequenceCollection seqs = load_input(cl);
    const HypermutResult result = a3g_hypermut(seqs, config);

    write_hypermut_table(cl.flag("--all") ? result.records : result.hypermutated_records(),
                         std::cout);
    if (result.outlier_cutoff) {
        std::cout << "# Poisson outlier cutoff: " << *result.outlier_cutoff << std::endl;
    }

    write_fasta(result.filtered, output_path(cl, "_filtered.fasta"));
    if (cl.has("--hypermut-out")) {
        write_fasta(result.hypermutated, cl.get("--hypermut-out"));
    }
    std::cout << "[Hypermut] " << result.hypermutated.size() << " hypermutated, "
              << result.filtered.size() << " kept" << std::endl;
    return 0;
}

int run_locate(const CommandLine& cl) {
    LocatorConfig config;
    config.reference = parse_reference_id(cl.get("--ref", "HXB2"));
    config.verbose = cl.flag("--verbose");

    const SequenceCollection seqs = load_input(cl);
    const ReferenceLibrary refs = load_references(cl);
    AbPOAAligner aligner;
    SequenceLocator locator(refs, aligner, config);

    const auto rows = locator.locate_collection(seqs);
    const std::string out = output_path(cl, "_locator.csv");
    LocatorCsvWriter writer(out);
    writer.write_rows(rows);
    std::cout << "[Locator] wrote " << rows.size() << " rows to " << out << std::endl;
    return 0;
}

int run_qc(const CommandLine& cl) {
    if (!cl.has("--start") || !cl.has("--end")) {
        throw std::invalid_argument("qc needs --start and --end");
    }
    LocatorConfig config;
    config.reference = parse_reference_id(cl.get("--ref", "HXB2"));
    config.verbose = cl.flag("--verbose");

    const SequenceCollection seqs = load_input(cl);
    const ReferenceLibrary refs = load_references(cl);
    AbPOAAligner aligner;
    SequenceLocator locator(refs, aligner, config);

    const SequenceCollection kept = locator.hiv_seq_qc(
        seqs, parse_range(cl.get("--start")), parse_range(cl.get("--end")),
        !cl.flag("--no-indel"));
    const std::string out = output_path(cl, "_qc.fasta");
    write_fasta(kept, out);
    std::cout << "[QC] " << kept.size() << "/" << seqs.size() << " sequences passed, written to "
              << out << std::endl;
    return 0;
}

int run_collapse(const CommandLine& cl) {
    CollapseConfig config;
    config.cutoff = cl.get_int("--cutoff", config.cutoff);
    config.tag = cl.get("--tag", config.tag);
    const SequenceCollection collapsed = collapse(load_input(cl), config);
    const std::string out = output_path(cl, "_collapsed.fasta");
    write_fasta(collapsed, out);
    std::cout << "[Collapse] " << collapsed.size() << " representative sequences written to "
              << out << std::endl;
    return 0;
}

int run_filter_pid(const CommandLine& cl) {
    PrimerIdConfig config;
    config.fold = cl.get_double("--fold", config.fold);
    config.verbose = cl.flag("--verbose");
    const SequenceCollection filtered = filter_similar_pid(load_input(cl), config);
    const std::string out = output_path(cl, "_pid_filtered.fasta");
    write_fasta(filtered, out);
    std::cout << "[PrimerID] " << filtered.size() << " sequences written to " << out << std::endl;
    return 0;
}

int run_strip(const CommandLine& cl) {
    const SeqKind kind = cl.flag("--aa") ? SeqKind::AA : SeqKind::NT;
    const SequenceCollection seqs = load_input(cl, kind);
    const SequenceCollection stripped = cl.flag("--ends") ? seqs.gap_strip_ends(kind)
                                                          : seqs.gap_strip(kind);
    const std::string out = output_path(cl, "_strip.fasta");
    write_fasta(stripped, out, kind);
    std::cout << "[Strip] written to " << out << std::endl;
    return 0;
}

int run_stop(const CommandLine& cl) {
    SequenceCollection seqs = load_input(cl);
    auto [with_stop, without_stop] = seqs.stop_codon(static_cast<int>(cl.get_int("--frame", 0)));
    const std::string out = output_path(cl, "_no_stop.fasta");
    write_fasta(without_stop, out);
    std::cout << "[Stop] " << with_stop.size() << " sequences with stop codons removed, "
              << without_stop.size() << " written to " << out << std::endl;
    return 0;
}

}  // namespace viralseq

// ============================================================================
// Main
// ============================================================================

using namespace viralseq;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " <command> <sequence_file> [options]\n\n"
              << "Commands:\n"
              << "  consensus   [--cutoff 0.5]\n"
              << "  entropy     [--aa]\n"
              << "  pi\n"
              << "  tn93\n"
              << "  pm          [--error-rate 0.0001] [--fold 20]\n"
              << "  a3g         [--cutoff 0.5] [--p-value 0.05] [--fold 20] [--all]\n"
              << "              [--out filtered.fasta] [--hypermut-out hypermut.fasta]\n"
              << "  locate      [--ref HXB2|NL43|MAC239] [--ref-fasta refs.fa] [--out report.csv]\n"
              << "  qc          --start N[-M] --end N[-M] [--no-indel] [--ref ...] [--ref-fasta ...]\n"
              << "  collapse    [--cutoff 1] [--tag seq] [--out ...]\n"
              << "  filter-pid  [--fold 10] [--out ...]\n"
              << "  strip       [--ends] [--aa] [--out ...]\n"
              << "  stop        [--frame 0] [--out ...]\n\n"
              << "Reference genomes are read from --ref-fasta or $" << kReferenceFastaEnv
              << " (records named HXB2, NL43, MAC239).\n"
              << "Use the GenBank entries K03455 (HXB2), AF324493 (NL4-3) and M33262 (SIVmac239).\n"
              << "Common: --verbose" << std::endl;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        const CommandLine cl = parse_command_line(argc, argv);

        if (cl.command == "consensus") return run_consensus(cl);
        if (cl.command == "entropy") return run_entropy(cl);
        if (cl.command == "pi") return run_pi(cl);
        if (cl.command == "tn93") return run_tn93(cl);
        if (cl.command == "pm") return run_pm(cl);
        if (cl.command == "a3g") return run_a3g(cl);
        if (cl.command == "locate") return run_locate(cl);
        if (cl.command == "qc") return run_qc(cl);
        if (cl.command == "collapse") return run_collapse(cl);
        if (cl.command == "filter-pid") return run_filter_pid(cl);
        if (cl.command == "strip") return run_strip(cl);
        if (cl.command == "stop") return run_stop(cl);

        std::cerr << "Error: unknown command '" << cl.command << "'" << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
