#include "asvflow/error_learner.hpp"
#include <algorithm>
#include <numeric>
#include <random>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace asvflow {

LearnResult learn_errors(const std::vector<Dereplicated>& samples,
                         const LearnParams& params,
                         const LearnProgressCallback& progress) {
    LearnResult result;
    for (const auto& s : samples) {
        result.reads_used += s.total_reads;
        result.bases_used += s.total_bases();
    }

    ErrorModel model = ErrorModel::initial();
    const int64_t n = static_cast<int64_t>(samples.size());

    for (uint32_t round = 1; round <= params.max_consist; ++round) {
        std::vector<TransitionCounts> per_sample(samples.size());
        std::vector<uint64_t> partitions(samples.size(), 0);

        #pragma omp parallel for schedule(dynamic, 1)
        for (int64_t i = 0; i < n; ++i) {
            DenoiseResult dr = denoise(samples[i], model, params.denoise);
            per_sample[i] = dr.transitions;
            partitions[i] = dr.asvs.size();
        }

        // Summed in sample order so the fit does not depend on scheduling
        TransitionCounts total;
        for (const auto& tc : per_sample) total += tc;

        ErrorModel next = fit_error_model(total, params.fit);
        LearnIteration it;
        it.round = round;
        it.max_change = next.max_abs_diff(model);
        it.partitions = std::accumulate(partitions.begin(), partitions.end(), uint64_t(0));
        result.history.push_back(it);
        if (progress) progress(it);

        model = next;
        result.rounds = round;
        if (it.max_change <= params.tol) {
            result.converged = true;
            break;
        }
    }

    result.model = model;
    result.violations = model.check_monotonic();
    return result;
}

LearnResult learn_errors_from_files(const std::vector<std::string>& sample_names,
                                    const std::vector<std::string>& paths,
                                    const LearnParams& params,
                                    const LearnProgressCallback& progress) {
    if (sample_names.size() != paths.size()) {
        throw std::invalid_argument("learn_errors_from_files: names and paths differ in length");
    }

    std::vector<size_t> order(paths.size());
    std::iota(order.begin(), order.end(), size_t(0));
    if (params.randomize) {
        // Fisher-Yates on raw engine output; the order depends only on the seed
        std::mt19937_64 rng(params.seed);
        for (size_t i = order.size(); i > 1; --i) {
            std::swap(order[i - 1], order[rng() % i]);
        }
    }

    std::vector<Dereplicated> loaded;
    std::vector<std::string> used;
    std::vector<SampleFailure> failures;
    uint64_t bases = 0;
    for (size_t idx : order) {
        if (bases >= params.nbases) break;
        try {
            Dereplicated d = dereplicate_file(paths[idx]);
            if (d.total_reads == 0) continue;
            bases += d.total_bases();
            used.push_back(sample_names[idx]);
            loaded.push_back(std::move(d));
        } catch (const std::exception& e) {
            failures.push_back({sample_names[idx], "learn-errors", e.what()});
        }
    }

    LearnResult result = learn_errors(loaded, params, progress);
    result.samples_used = std::move(used);
    result.failures = std::move(failures);
    return result;
}

} // namespace asvflow
