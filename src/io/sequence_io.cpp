#include "sequence_io.h"
#include "errors.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <ostream>

namespace viralseq {

namespace {

void chomp(std::string& line) {
    line.erase(std::remove(line.begin(), line.end(), '\0'), line.end());
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
}

void append_upper(std::string& dst, const std::string& src) {
    for (char c : src) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        dst.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
}

}  // namespace

std::string file_stem(const std::string& path) {
    const size_t slash = path.find_last_of('/');
    std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
    const size_t dot = base.find_last_of('.');
    if (dot != std::string::npos && dot > 0) base.erase(dot);
    return base;
}

SequenceCollection read_fasta(const std::string& path, SeqKind kind) {
    std::ifstream infile(path);
    if (!infile.is_open()) {
        throw InputError("cannot open FASTA file: " + path);
    }

    SequenceMap seqs;
    std::string line;
    std::string name;
    std::string current;
    bool have_record = false;

    while (std::getline(infile, line)) {
        chomp(line);
        if (line.empty() || line[0] == '=') continue;

        if (line[0] == '>') {
            if (have_record) seqs.set(name, std::move(current));
            name = line.substr(1);
            current.clear();
            have_record = true;
        } else if (have_record) {
            append_upper(current, line);
        }
    }
    if (have_record) seqs.set(name, std::move(current));

    SequenceCollection collection;
    if (kind == SeqKind::AA) {
        collection.aa() = std::move(seqs);
    } else {
        collection.dna() = std::move(seqs);
    }
    collection.set_title(file_stem(path));
    collection.set_file(path);
    return collection;
}

SequenceCollection read_fastq(const std::string& path) {
    std::ifstream infile(path);
    if (!infile.is_open()) {
        throw InputError("cannot open FASTQ file: " + path);
    }

    SequenceCollection collection;
    std::string header, seq, plus, qual;
    int64_t record = 0;
    while (std::getline(infile, header)) {
        chomp(header);
        if (header.empty()) continue;
        if (header[0] != '@' || !std::getline(infile, seq) ||
            !std::getline(infile, plus) || !std::getline(infile, qual)) {
            throw InputError("malformed FASTQ record " + std::to_string(record + 1) +
                             " in " + path);
        }
        chomp(seq);
        chomp(qual);
        const std::string name = header.substr(1);
        collection.dna().set(name, seq);
        collection.qc().set(name, qual);
        ++record;
    }

    collection.set_title(file_stem(path));
    collection.set_file(path);
    return collection;
}

void write_fasta(const SequenceCollection& collection, const std::string& path, SeqKind kind) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw InputError("cannot open for writing: " + path);
    }
    for (const auto& e : collection.sequences(kind)) {
        ofs << '>' << e.name << '\n' << e.seq << '\n';
    }
}

// ============================================================================
// LocatorCsvWriter
// ============================================================================

LocatorCsvWriter::LocatorCsvWriter(const std::string& path) : ofs_(path) {
    if (!ofs_.is_open()) {
        throw InputError("cannot open locator report for writing: " + path);
    }
    write_header();
}

void LocatorCsvWriter::write_header() {
    ofs_ << "title,sequence_identifier,reference_id,direction,start,end,"
            "percent_similarity,contains_indel,aligned_query,aligned_reference\n";
}

void LocatorCsvWriter::write_row(const LocatorRow& row) {
    const auto& loc = row.result;
    ofs_ << row.title << ','
         << row.name << ','
         << reference_name(row.reference) << ','
         << orientation_symbol(loc.orientation) << ','
         << loc.ref_start << ','
         << loc.ref_end << ','
         << std::fixed << std::setprecision(1) << loc.similarity << ','
         << (loc.has_indel ? "true" : "false") << ','
         << loc.aligned_query << ','
         << loc.aligned_reference << '\n';
}

void LocatorCsvWriter::write_rows(const std::vector<LocatorRow>& rows) {
    for (const auto& row : rows) write_row(row);
}

void write_hypermut_table(const std::vector<HypermutationRecord>& records, std::ostream& out) {
    out << "name\ta\tb\tc\td\trate_ratio\tp_value\tpoisson_outlier\n";
    for (const auto& r : records) {
        out << r.name << '\t' << r.a << '\t' << r.b << '\t' << r.c << '\t' << r.d << '\t'
            << std::fixed << std::setprecision(2) << r.rate_ratio << '\t'
            << std::defaultfloat << std::setprecision(6) << r.p_value << '\t'
            << (r.poisson_outlier ? "yes" : "no") << '\n';
    }
}

}  // namespace viralseq
