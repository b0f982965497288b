#pragma once
// Stage orchestration for paired-end amplicon denoising.
//
//   filter -> learn errors (F, R) -> dereplicate + denoise + merge per sample
//          -> feature table -> chimera removal -> read tracking
//
// Every stage completes for all samples before the next one starts.
// Samples inside a stage are processed in parallel; a sample that fails
// is recorded as a SampleFailure and dropped from later stages, while a
// condition that leaves nothing to process throws PipelineError.

#include "chimera.hpp"
#include "denoise.hpp"
#include "error_learner.hpp"
#include "feature_table.hpp"
#include "merge_pairs.hpp"
#include "quality_filter.hpp"
#include "read_tracker.hpp"
#include "sample_sheet.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace asvflow {

struct PipelineConfig {
    std::string input_dir;
    std::string output_dir = "asvflow_out";
    std::string forward_marker = "_R1_001.fastq";
    std::string reverse_marker = "_R2_001.fastq";

    FilterParams filter;
    LearnParams learn;       // learn.denoise is replaced by `denoise`
    DenoiseParams denoise;
    MergeParams merge;
    ChimeraParams chimera;

    // When set, errors_F.tsv and errors_R.tsv are read from here and no
    // error model is learned
    std::string errors_dir;

    int threads = 0;         // 0 = OpenMP default
    bool verbose = false;
};

// Below this share of abundance surviving chimera removal a warning is printed
constexpr double LOW_NONCHIM_FRACTION = 0.5;

struct FilterStageResult {
    std::vector<FilterStats> stats;        // samples that could be read, input order
    std::vector<SamplePair> survivors;     // filtered file pairs with reads left
    std::vector<SampleFailure> failures;
};

// Filter all samples into out_dir. Unreadable samples and samples with no
// surviving pairs are returned as failures.
FilterStageResult filter_samples(const std::vector<SamplePair>& samples,
                                 const std::string& out_dir,
                                 const FilterParams& params);

// File name of an orientation's error model inside an output directory
std::string error_model_filename(Orientation o);

// Read a model written by write_outputs. The result has rounds == 0 and
// counts as converged. Throws InputError when the file is missing or malformed.
LearnResult load_orientation(const std::string& errors_dir, Orientation o);

// Learn one orientation's error model from filtered file pairs.
// Throws PipelineError when no bases could be loaded.
LearnResult learn_orientation(const std::vector<SamplePair>& filtered,
                              Orientation o,
                              const LearnParams& params);

// Denoising and merging outcome for one sample
struct SampleInference {
    std::string sample;
    uint64_t reads = 0;
    uint64_t denoised_fwd = 0;
    uint64_t denoised_rev = 0;
    uint32_t asvs_fwd = 0;
    uint32_t asvs_rev = 0;
    MergeResult merge;
};

// Dereplicate, denoise and merge one filtered sample
SampleInference infer_sample(const SamplePair& filtered,
                             const ErrorModel& model_fwd,
                             const ErrorModel& model_rev,
                             const DenoiseParams& denoise_params,
                             const MergeParams& merge_params);

struct PipelineResult {
    std::vector<SamplePair> samples;       // discovered input samples
    std::vector<FilterStats> filter_stats;
    LearnResult learn_fwd;
    LearnResult learn_rev;
    std::vector<SampleInference> inferences;
    FeatureTable table;
    ChimeraResult chimera;                 // chimera.table is the final table
    ReadTracker track;
    std::vector<SampleFailure> failures;
};

// Discover samples under config.input_dir and run every stage.
PipelineResult run_pipeline(const PipelineConfig& config);

// Run every stage on an explicit sample list.
PipelineResult run_pipeline(const std::vector<SamplePair>& samples,
                            const PipelineConfig& config);

// errors_F.tsv, errors_R.tsv, seqtab.tsv, seqtab_nochim.tsv, asvs.fasta,
// track.tsv and failures.tsv under out_dir (filtered/ is written by the
// filter stage).
void write_outputs(const PipelineResult& result, const std::string& out_dir);

void write_failures_tsv(const std::vector<SampleFailure>& failures, const std::string& path);

// Run summary on stderr, including every failed sample
void print_summary(const PipelineResult& result);

} // namespace asvflow
