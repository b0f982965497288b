#pragma once
// De novo bimera detection and removal.
//
// A variant is a bimera when a 5' fragment of one parent joined to a 3'
// fragment of another parent reproduces it. Parents must be more abundant
// overall than the query and, within the sample being examined, more
// abundant than min_fold_parent times the query. The most abundant column
// therefore never has parents and is never removed.
//
// CONSENSUS: each sample is examined separately and a column is removed
// when enough of the samples containing it flag it.
// POOLED: all samples are summed into one and examined once.

#include "alignment.hpp"
#include "feature_table.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace asvflow {

enum class ChimeraMethod {
    CONSENSUS,
    POOLED
};

const char* chimera_method_name(ChimeraMethod m);
// Throws std::invalid_argument on an unknown name
ChimeraMethod parse_chimera_method(const std::string& name);

struct ChimeraParams {
    ChimeraMethod method = ChimeraMethod::CONSENSUS;
    double min_fold_parent = 1.5;
    uint64_t min_parent_abundance = 2;
    double min_sample_fraction = 0.9;
    uint32_t ignore_n_negatives = 1;
    bool allow_one_off = false;
    uint32_t min_one_off_parent_distance = 4;
    AlignParams align;
};

struct BimeraModel {
    bool is_bimera = false;
    int32_t left_parent = -1;   // index into the parents passed in
    int32_t right_parent = -1;
    size_t breakpoint = 0;      // query bases taken from the left parent
};

/**
 * Test `query` against candidate parents. A pure mutant of a single parent
 * is not a bimera. With allow_one_off, one extra mismatch is tolerated on
 * either side when both parents differ from the query at no fewer than
 * min_one_off_parent_distance positions.
 */
BimeraModel find_bimera(const std::string& query,
                        const std::vector<const std::string*>& parents,
                        const ChimeraParams& params);

struct ChimeraResult {
    FeatureTable table;                 // input without bimeric columns
    std::vector<bool> is_chimera;       // per input column
    std::vector<uint32_t> samples_present;
    std::vector<uint32_t> samples_flagged;
    size_t removed = 0;
    double retained_fraction = 1.0;     // abundance kept / abundance in
};

ChimeraResult remove_bimeras(const FeatureTable& table, const ChimeraParams& params);

} // namespace asvflow
