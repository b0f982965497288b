#pragma once
// Self-consistent error model estimation
//
// Alternates denoising (under the current model) with refitting the model
// from the substitutions between partition centres and their members,
// until the fitted rates stop changing or max_consist rounds have run.
// Each round's model is a fresh immutable value shared read-only by the
// per-sample workers of the next round.

#include "denoise.hpp"
#include "error_model.hpp"
#include "types.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace asvflow {

struct LearnParams {
    uint64_t nbases = 100000000;   // stop loading samples once this many bases are held
    uint32_t max_consist = 10;     // maximum self-consistency rounds
    double tol = 1e-8;             // convergence: max |rate change| between rounds
    bool randomize = false;        // visit samples in seeded random order
    uint64_t seed = 42;
    DenoiseParams denoise;
    ErrorFitParams fit;
};

struct LearnIteration {
    uint32_t round = 0;
    double max_change = 0.0;
    uint64_t partitions = 0;       // total ASVs over all samples this round
};

struct LearnResult {
    ErrorModel model;
    bool converged = false;
    uint32_t rounds = 0;
    std::vector<LearnIteration> history;
    std::vector<std::string> samples_used;
    uint64_t reads_used = 0;
    uint64_t bases_used = 0;
    std::vector<MonotonicViolation> violations;
    std::vector<SampleFailure> failures;  // samples that could not be loaded
};

using LearnProgressCallback = std::function<void(const LearnIteration&)>;

// Learn from already dereplicated samples (all of them are used)
LearnResult learn_errors(const std::vector<Dereplicated>& samples,
                         const LearnParams& params,
                         const LearnProgressCallback& progress = nullptr);

/**
 * Learn from filtered FASTQ files, one per sample, for one orientation.
 * Files are loaded in name order (or seeded random order when
 * params.randomize is set) until params.nbases is reached. A file that
 * cannot be read is recorded in LearnResult::failures and skipped.
 */
LearnResult learn_errors_from_files(const std::vector<std::string>& sample_names,
                                    const std::vector<std::string>& paths,
                                    const LearnParams& params,
                                    const LearnProgressCallback& progress = nullptr);

} // namespace asvflow
