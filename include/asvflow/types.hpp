#pragma once

#include <array>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace asvflow {

using Sequence = std::string;

// Quality scores are clamped to [0, MAX_QUAL] everywhere they index a table.
constexpr int MAX_QUAL = 41;
constexpr int NUM_QUAL = MAX_QUAL + 1;

// Phred+33 is the only supported encoding
constexpr int PHRED_OFFSET = 33;

// Nucleotide encoding
enum class Nucleotide : uint8_t {
    A = 0,
    C = 1,
    G = 2,
    T = 3,
    N = 4  // Unknown
};

inline Nucleotide char_to_nt(char c) {
    switch(c) {
        case 'A': case 'a': return Nucleotide::A;
        case 'C': case 'c': return Nucleotide::C;
        case 'G': case 'g': return Nucleotide::G;
        case 'T': case 't': return Nucleotide::T;
        default: return Nucleotide::N;
    }
}

// 0-3 for ACGT, 4 otherwise
inline int nt_index(char c) {
    return static_cast<int>(char_to_nt(c));
}

inline int clamp_qual(int q) {
    if (q < 0) return 0;
    if (q > MAX_QUAL) return MAX_QUAL;
    return q;
}

inline int qual_char_to_phred(char qual_char) {
    return static_cast<int>(static_cast<unsigned char>(qual_char)) - PHRED_OFFSET;
}

/**
 * Convert Phred quality score (ASCII character) to error probability
 * Phred+33 encoding: Q = -10 * log10(P)
 */
inline double phred_to_error_prob(int phred) {
    if (phred < 0) phred = 0;
    return std::pow(10.0, -phred / 10.0);
}

// Read orientation within a pair
enum class Orientation : uint8_t {
    FORWARD = 0,
    REVERSE = 1
};

inline const char* orientation_name(Orientation o) {
    return o == Orientation::FORWARD ? "forward" : "reverse";
}

inline const char* orientation_tag(Orientation o) {
    return o == Orientation::FORWARD ? "F" : "R";
}

// Unreadable or malformed input (fatal for the sample it belongs to)
class InputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Pipeline-global condition that aborts before downstream stages run
class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A sample dropped from the run, reported in the final summary
struct SampleFailure {
    std::string sample;
    std::string stage;
    std::string message;
};

} // namespace asvflow
