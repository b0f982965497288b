#pragma once
// Paired-end quality filtering and truncation.
//
// Per-read steps, in order: left trim, truncation at the first quality
// <= trunc_q, truncation to trunc_len (shorter reads are discarded),
// minimum length, ambiguous-base limit, expected-error limit.
// A pair is kept only when both mates pass, so read i of the filtered
// forward file still pairs with read i of the filtered reverse file.

#include "sample_sheet.hpp"
#include "sequence_io.hpp"
#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace asvflow {

struct FilterParams {
    std::array<size_t, 2> trunc_len = {240, 160};  // 0 = no length truncation
    std::array<size_t, 2> trim_left = {0, 0};
    int trunc_q = 2;                                // < 0 disables quality truncation
    size_t max_n = 0;
    std::array<double, 2> max_ee = {2.0, 2.0};     // < 0 disables the check
    size_t min_len = 20;

    size_t trunc_len_for(Orientation o) const { return trunc_len[static_cast<size_t>(o)]; }
    size_t trim_left_for(Orientation o) const { return trim_left[static_cast<size_t>(o)]; }
    double max_ee_for(Orientation o) const { return max_ee[static_cast<size_t>(o)]; }
};

enum class FilterOutcome {
    PASS,
    TOO_SHORT,
    TOO_MANY_N,
    TOO_MANY_EXPECTED_ERRORS
};

const char* filter_outcome_name(FilterOutcome outcome);

// Sum of per-base error probabilities implied by the quality string
double expected_errors(const std::string& quality);

// Trims `read` in place and reports whether it survives.
FilterOutcome filter_read(SequenceRecord& read, const FilterParams& params, Orientation o);

struct FilterStats {
    std::string sample;
    uint64_t reads_in = 0;
    uint64_t reads_out = 0;
    std::string forward_out;
    std::string reverse_out;
    // Discards by first failing mate's outcome
    uint64_t too_short = 0;
    uint64_t too_many_n = 0;
    uint64_t too_many_ee = 0;
};

// Path of the filtered file for one sample and orientation
std::string filtered_path(const std::string& out_dir, const std::string& sample, Orientation o);

/**
 * Filter one sample's read pairs in lockstep, writing gzip-compressed
 * FASTQ to out_dir. Throws InputError on unreadable input or when the
 * forward and reverse files hold different numbers of reads; both output
 * files are removed before the exception propagates.
 */
FilterStats filter_sample_pair(const SamplePair& sample,
                               const std::string& out_dir,
                               const FilterParams& params);

// One row per sample: reads in/out and discards by reason
void write_filter_stats_tsv(const std::vector<FilterStats>& stats, const std::string& path);

} // namespace asvflow
