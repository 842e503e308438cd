#ifndef VIRALSEQ_ERRORS_H
#define VIRALSEQ_ERRORS_H

#include <stdexcept>
#include <string>

namespace viralseq {

/**
 * Base class for every error raised by the library.
 * Callers that only want to report and exit can catch this (or std::exception).
 */
class ViralSeqError : public std::runtime_error {
public:
    explicit ViralSeqError(const std::string& what) : std::runtime_error(what) {}
};

// Missing or unreadable sequence / reference file.
class InputError : public ViralSeqError {
public:
    explicit InputError(const std::string& what) : ViralSeqError(what) {}
};

// Alignment engine could not be initialised or failed on a query.
class AlignmentUnavailableError : public ViralSeqError {
public:
    explicit AlignmentUnavailableError(const std::string& what) : ViralSeqError(what) {}
};

// Statistic is undefined on the given input (e.g. no usable column for pi).
class DegenerateInputError : public ViralSeqError {
public:
    explicit DegenerateInputError(const std::string& what) : ViralSeqError(what) {}
};

// Zero-sequence collection passed where at least one sequence is required.
class EmptyInputError : public ViralSeqError {
public:
    explicit EmptyInputError(const std::string& what) : ViralSeqError(what) {}
};

}  // namespace viralseq

#endif  // VIRALSEQ_ERRORS_H
