#pragma once
// Pairwise alignment and k-mer screening for near-identical amplicons.

#include <cstdint>
#include <string>
#include <vector>

namespace asvflow {

struct AlignParams {
    int match = 5;
    int mismatch = -4;
    int gap = -8;
    int band = 16;         // < 0 = unbanded
    bool ends_free = true;  // leading/trailing gaps cost nothing
};

// Gapped alignment; a and b have equal length, '-' marks a gap.
struct PairwiseAlignment {
    std::string a;
    std::string b;
    int score = 0;
};

/**
 * Banded Needleman-Wunsch alignment of s1 against s2.
 *
 * The band is widened by the length difference so the end cell is always
 * reachable. Ties in the traceback prefer diagonal, then a gap in s2, then
 * a gap in s1, which keeps results identical across runs.
 */
PairwiseAlignment align_nw(const std::string& s1, const std::string& s2, const AlignParams& params);

constexpr int KMER_SIZE = 5;

// Counts of every k-mer (k = KMER_SIZE) over ACGT; k-mers with other
// symbols are skipped.
std::vector<uint16_t> kmer_profile(const std::string& seq);

// 1 - shared k-mers / (min length - k + 1); 1.0 when either is shorter than k
double kmer_distance(const std::vector<uint16_t>& a, size_t len_a,
                     const std::vector<uint16_t>& b, size_t len_b);

} // namespace asvflow
