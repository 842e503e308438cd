#ifndef VIRALSEQ_SEQUENCE_IO_H
#define VIRALSEQ_SEQUENCE_IO_H

#include "hypermut.h"
#include "locator.h"
#include "sequence_collection.h"

#include <fstream>
#include <string>
#include <vector>

namespace viralseq {

/**
 * FASTA reader.
 * Header lines start with '>' (the identifier is the rest of the line);
 * sequence lines are concatenated and upper-cased. Blank lines, lines
 * starting with '=' and NUL bytes are ignored. The title is the file's base
 * name without extension.
 * @throws InputError if the file cannot be opened
 */
SequenceCollection read_fasta(const std::string& path, SeqKind kind = SeqKind::NT);

// Four-line FASTQ; fills the dna and qc maps. @throws InputError
SequenceCollection read_fastq(const std::string& path);

void write_fasta(const SequenceCollection& collection,
                 const std::string& path,
                 SeqKind kind = SeqKind::NT);

std::string file_stem(const std::string& path);

// ============================================================================
// Locator CSV writer
// ============================================================================

class LocatorCsvWriter {
public:
    explicit LocatorCsvWriter(const std::string& path);

    void write_row(const LocatorRow& row);
    void write_rows(const std::vector<LocatorRow>& rows);

private:
    std::ofstream ofs_;

    void write_header();
};

// Tab-separated a/b/c/d/rr/p table of hypermutation records.
void write_hypermut_table(const std::vector<HypermutationRecord>& records, std::ostream& out);

}  // namespace viralseq

#endif  // VIRALSEQ_SEQUENCE_IO_H
