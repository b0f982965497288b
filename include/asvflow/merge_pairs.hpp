#pragma once
// Merging of denoised forward and reverse variants into full amplicons.
//
// Reads are paired by position: read r of the filtered forward file and
// read r of the filtered reverse file come from the same fragment. Each
// (forward ASV, reverse ASV) combination supported by at least one read
// pair is merged once, by sliding the reverse complement of the reverse
// variant along the forward variant without gaps.

#include "denoise.hpp"
#include "dereplicate.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace asvflow {

struct MergeParams {
    size_t min_overlap = 12;
    size_t max_mismatch = 0;
    double max_mismatch_rate = 1.0;  // mismatches / overlap length
    bool just_concatenate = false;   // forward + 10 N + revcomp(reverse)
    bool trim_overhang = false;      // drop bases extending past the other mate
};

enum class MergeStatus {
    MERGED,
    NO_OVERLAP,        // no placement with at least min_overlap bases
    TOO_MANY_MISMATCHES,
    AMBIGUOUS          // two placements score equally well
};

const char* merge_status_name(MergeStatus s);

struct OverlapResult {
    MergeStatus status = MergeStatus::NO_OVERLAP;
    int64_t offset = 0;      // start of revcomp(reverse) in forward coordinates
    size_t overlap = 0;
    size_t mismatches = 0;
    std::string merged;      // set when status == MERGED
};

// Best ungapped placement of rev_rc against fwd
OverlapResult merge_overlap(const std::string& fwd, const std::string& rev_rc,
                            const MergeParams& params);

// One (forward ASV, reverse ASV) combination observed in a sample
struct MergedPair {
    int32_t forward_asv = -1;
    int32_t reverse_asv = -1;
    uint64_t abundance = 0;  // read pairs supporting the combination
    MergeStatus status = MergeStatus::NO_OVERLAP;
    size_t overlap = 0;
    size_t mismatches = 0;
    std::string sequence;    // merged sequence when status == MERGED
};

struct MergeResult {
    std::vector<MergedPair> pairs;  // sorted by descending abundance
    uint64_t input_pairs = 0;
    uint64_t uncorrected_pairs = 0;  // a mate was left uncorrected by denoising
    uint64_t merged_reads = 0;
    uint64_t rejected_reads = 0;

    // Merged abundance summed per sequence
    std::vector<std::pair<std::string, uint64_t>> merged_sequences() const;
};

/**
 * Merge one sample. Throws InputError when the forward and reverse
 * dereplications do not cover the same number of reads.
 */
MergeResult merge_pairs(const Dereplicated& derep_fwd, const DenoiseResult& dada_fwd,
                        const Dereplicated& derep_rev, const DenoiseResult& dada_rev,
                        const MergeParams& params);

} // namespace asvflow
