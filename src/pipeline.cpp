#include "asvflow/pipeline.hpp"
#include "asvflow/dereplicate.hpp"
#include "asvflow/log_utils.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace fs = std::filesystem;

namespace asvflow {

namespace {

using log_utils::logger;

void ensure_directory(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw PipelineError("Cannot create output directory " + dir + ": " + ec.message());
    }
}

std::string fixed(double v, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

void report_failure(const SampleFailure& f) {
    logger().warn(f.stage, "sample " + f.sample + " excluded: " + f.message);
}

} // namespace

FilterStageResult filter_samples(const std::vector<SamplePair>& samples,
                                 const std::string& out_dir,
                                 const FilterParams& params) {
    ensure_directory(out_dir);

    const int64_t n = static_cast<int64_t>(samples.size());
    std::vector<FilterStats> stats(samples.size());
    std::vector<std::string> errors(samples.size());
    std::vector<uint8_t> ok(samples.size(), 0);

    #pragma omp parallel for schedule(dynamic, 1)
    for (int64_t i = 0; i < n; ++i) {
        try {
            stats[i] = filter_sample_pair(samples[i], out_dir, params);
            ok[i] = 1;
        } catch (const std::exception& e) {
            errors[i] = e.what();
        }
    }

    FilterStageResult result;
    for (size_t i = 0; i < samples.size(); ++i) {
        if (!ok[i]) {
            result.failures.push_back({samples[i].name, "filter", errors[i]});
            report_failure(result.failures.back());
            continue;
        }
        const FilterStats& s = stats[i];
        result.stats.push_back(s);
        logger().info("filter", s.sample + ": " + std::to_string(s.reads_out) + "/" +
                                    std::to_string(s.reads_in) + " pairs kept (short " +
                                    std::to_string(s.too_short) + ", N " +
                                    std::to_string(s.too_many_n) + ", maxEE " +
                                    std::to_string(s.too_many_ee) + ")");
        if (s.reads_out == 0) {
            result.failures.push_back({s.sample, "filter",
                                       "no read pairs passed filtering (" +
                                           std::to_string(s.reads_in) + " in)"});
            report_failure(result.failures.back());
            continue;
        }
        result.survivors.push_back({s.sample, s.forward_out, s.reverse_out});
    }
    return result;
}

LearnResult learn_orientation(const std::vector<SamplePair>& filtered,
                              Orientation o,
                              const LearnParams& params) {
    const std::string stage = std::string("learn-errors ") + orientation_tag(o);
    std::vector<std::string> names;
    std::vector<std::string> paths;
    for (const auto& s : filtered) {
        names.push_back(s.name);
        paths.push_back(o == Orientation::FORWARD ? s.forward_path : s.reverse_path);
    }

    LearnResult result = learn_errors_from_files(
        names, paths, params, [&](const LearnIteration& it) {
            logger().info(stage, "round " + std::to_string(it.round) + ": max rate change " +
                                     fixed(it.max_change, 8) + ", " +
                                     std::to_string(it.partitions) + " partitions");
        });

    for (const auto& f : result.failures) report_failure(f);
    if (result.bases_used == 0) {
        throw PipelineError(std::string("No ") + orientation_name(o) +
                            " bases available to learn an error model");
    }

    logger().info(stage, std::to_string(result.bases_used) + " bases in " +
                             std::to_string(result.reads_used) + " reads from " +
                             std::to_string(result.samples_used.size()) + " samples");
    if (!result.converged) {
        logger().warn(stage, "error rates did not converge after " +
                                 std::to_string(result.rounds) +
                                 " rounds; using the last estimate (low confidence)");
    }
    for (const auto& v : result.violations) {
        logger().warn(stage, std::string("rate for ") + transition_label(v.transition) +
                                 " rises from " + fixed(v.rate_low, 6) + " to " +
                                 fixed(v.rate_high, 6) + " at Q" + std::to_string(v.qual));
    }
    return result;
}

std::string error_model_filename(Orientation o) {
    return o == Orientation::FORWARD ? "errors_F.tsv" : "errors_R.tsv";
}

LearnResult load_orientation(const std::string& errors_dir, Orientation o) {
    const std::string path = (fs::path(errors_dir) / error_model_filename(o)).string();
    LearnResult result;
    result.model = ErrorModel::read_tsv(path);
    result.converged = true;
    result.violations = result.model.check_monotonic();
    logger().info(std::string("learn-errors ") + orientation_tag(o), "loaded " + path);
    return result;
}

SampleInference infer_sample(const SamplePair& filtered,
                             const ErrorModel& model_fwd,
                             const ErrorModel& model_rev,
                             const DenoiseParams& denoise_params,
                             const MergeParams& merge_params) {
    SampleInference inf;
    inf.sample = filtered.name;

    // Dereplications are dropped when this function returns
    const Dereplicated derep_f = dereplicate_file(filtered.forward_path);
    const Dereplicated derep_r = dereplicate_file(filtered.reverse_path);
    if (derep_f.total_reads != derep_r.total_reads) {
        throw InputError("Filtered files of sample " + filtered.name +
                         " hold different read counts");
    }
    inf.reads = derep_f.total_reads;

    const DenoiseResult dada_f = denoise(derep_f, model_fwd, denoise_params);
    const DenoiseResult dada_r = denoise(derep_r, model_rev, denoise_params);
    inf.denoised_fwd = dada_f.denoised_reads;
    inf.denoised_rev = dada_r.denoised_reads;
    inf.asvs_fwd = static_cast<uint32_t>(dada_f.asvs.size());
    inf.asvs_rev = static_cast<uint32_t>(dada_r.asvs.size());

    inf.merge = merge_pairs(derep_f, dada_f, derep_r, dada_r, merge_params);
    return inf;
}

PipelineResult run_pipeline(const PipelineConfig& config) {
    logger().set_verbose(config.verbose);
    SampleSheet sheet = discover_samples(config.input_dir, config.forward_marker,
                                         config.reverse_marker);
    for (const auto& f : sheet.failures) report_failure(f);
    if (sheet.samples.empty()) {
        throw PipelineError("No paired samples found in " + config.input_dir);
    }
    logger().info("discover", std::to_string(sheet.samples.size()) + " paired samples in " +
                                  config.input_dir);

    PipelineResult result = run_pipeline(sheet.samples, config);
    result.failures.insert(result.failures.begin(), sheet.failures.begin(), sheet.failures.end());
    for (const auto& f : sheet.failures) result.track.mark_failed(f.sample, f.stage);
    return result;
}

PipelineResult run_pipeline(const std::vector<SamplePair>& samples,
                            const PipelineConfig& config) {
    auto& log = logger();
    log.set_verbose(config.verbose);
#ifdef _OPENMP
    if (config.threads > 0) omp_set_num_threads(config.threads);
#endif

    PipelineResult result;
    result.samples = samples;
    for (const auto& s : samples) result.track.add_sample(s.name);

    // Filter
    auto t0 = std::chrono::steady_clock::now();
    const std::string filtered_dir = (fs::path(config.output_dir) / "filtered").string();
    FilterStageResult filtered = filter_samples(samples, filtered_dir, config.filter);
    result.filter_stats = filtered.stats;
    for (const auto& s : filtered.stats) {
        result.track.record(s.sample, TrackStage::INPUT, s.reads_in);
        result.track.record(s.sample, TrackStage::FILTERED, s.reads_out);
    }
    for (const auto& f : filtered.failures) {
        result.track.mark_failed(f.sample, f.stage);
        result.failures.push_back(f);
    }
    if (filtered.survivors.empty()) {
        throw PipelineError("No sample has reads left after filtering");
    }
    log.info("filter", std::to_string(filtered.survivors.size()) + "/" +
                           std::to_string(samples.size()) + " samples kept in " +
                           log_utils::format_elapsed(t0, std::chrono::steady_clock::now()));

    // Learn one error model per orientation, or reuse an earlier run's
    t0 = std::chrono::steady_clock::now();
    if (!config.errors_dir.empty()) {
        result.learn_fwd = load_orientation(config.errors_dir, Orientation::FORWARD);
        result.learn_rev = load_orientation(config.errors_dir, Orientation::REVERSE);
    } else {
        LearnParams learn = config.learn;
        learn.denoise = config.denoise;
        result.learn_fwd = learn_orientation(filtered.survivors, Orientation::FORWARD, learn);
        result.learn_rev = learn_orientation(filtered.survivors, Orientation::REVERSE, learn);
        log.info("learn-errors", "models fitted in " +
                                     log_utils::format_elapsed(t0, std::chrono::steady_clock::now()));
    }

    // Dereplicate, denoise and merge each sample
    t0 = std::chrono::steady_clock::now();
    const ErrorModel& model_f = result.learn_fwd.model;
    const ErrorModel& model_r = result.learn_rev.model;
    const std::vector<SamplePair>& work = filtered.survivors;
    const int64_t n = static_cast<int64_t>(work.size());
    std::vector<SampleInference> inferred(work.size());
    std::vector<std::string> errors(work.size());
    std::vector<uint8_t> ok(work.size(), 0);

    #pragma omp parallel for schedule(dynamic, 1)
    for (int64_t i = 0; i < n; ++i) {
        try {
            inferred[i] = infer_sample(work[i], model_f, model_r, config.denoise, config.merge);
            ok[i] = 1;
        } catch (const std::exception& e) {
            errors[i] = e.what();
        }
    }

    FeatureTableBuilder builder;
    for (size_t i = 0; i < work.size(); ++i) {
        if (!ok[i]) {
            SampleFailure f{work[i].name, "denoise", errors[i]};
            report_failure(f);
            result.track.mark_failed(f.sample, f.stage);
            result.failures.push_back(f);
            continue;
        }
        SampleInference& inf = inferred[i];
        result.track.record(inf.sample, TrackStage::DENOISED_FWD, inf.denoised_fwd);
        result.track.record(inf.sample, TrackStage::DENOISED_REV, inf.denoised_rev);
        result.track.record(inf.sample, TrackStage::MERGED, inf.merge.merged_reads);
        log.info("denoise", inf.sample + ": " + std::to_string(inf.asvs_fwd) + " F / " +
                                std::to_string(inf.asvs_rev) + " R variants from " +
                                std::to_string(inf.reads) + " reads");
        log.info("merge", inf.sample + ": " + std::to_string(inf.merge.merged_reads) + " of " +
                              std::to_string(inf.merge.input_pairs) + " pairs merged (" +
                              std::to_string(inf.merge.rejected_reads) + " rejected, " +
                              std::to_string(inf.merge.uncorrected_pairs) + " uncorrected)");

        if (inf.merge.merged_reads == 0) {
            log.warn("merge", "sample " + inf.sample + " has no merged pairs; left out of the table");
        } else {
            builder.add_sample(inf.sample, inf.merge.merged_sequences());
            result.track.record(inf.sample, TrackStage::TABLED, inf.merge.merged_reads);
        }
        result.inferences.push_back(std::move(inf));
    }
    log.info("denoise", "samples processed in " +
                            log_utils::format_elapsed(t0, std::chrono::steady_clock::now()));

    // Feature table
    result.table = builder.build();
    if (result.table.num_samples() == 0) {
        throw PipelineError("No sample produced merged sequences");
    }
    log.info("table", std::to_string(result.table.num_samples()) + " samples x " +
                          std::to_string(result.table.num_sequences()) + " sequences");
    if (log.verbose()) {
        std::string dist;
        for (const auto& [len, count] : result.table.length_distribution()) {
            if (!dist.empty()) dist += ", ";
            dist += std::to_string(len) + ":" + std::to_string(count);
        }
        log.info("table", "length distribution " + dist);
    }

    // Chimera removal
    t0 = std::chrono::steady_clock::now();
    result.chimera = remove_bimeras(result.table, config.chimera);
    const FeatureTable& nochim = result.chimera.table;
    for (size_t r = 0; r < nochim.num_samples(); ++r) {
        result.track.record(nochim.samples()[r], TrackStage::NONCHIM, nochim.row_total(r));
    }
    log.info("chimera", std::to_string(result.chimera.removed) + " of " +
                            std::to_string(result.table.num_sequences()) + " sequences removed (" +
                            chimera_method_name(config.chimera.method) + ") in " +
                            log_utils::format_elapsed(t0, std::chrono::steady_clock::now()));
    if (result.chimera.retained_fraction < LOW_NONCHIM_FRACTION) {
        log.warn("chimera", "only " + fixed(100.0 * result.chimera.retained_fraction, 1) +
                                "% of abundance is non-chimeric; check primer removal");
    }

    for (const auto& problem : result.track.check_attrition()) {
        log.warn("track", "inconsistent counts for " + problem);
    }
    return result;
}

void write_failures_tsv(const std::vector<SampleFailure>& failures, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open failure report: " + path);
    }
    out << "sample\tstage\treason\n";
    for (const auto& f : failures) {
        out << f.sample << '\t' << f.stage << '\t' << f.message << '\n';
    }
    if (!out) {
        throw std::runtime_error("Failed writing failure report: " + path);
    }
}

void write_outputs(const PipelineResult& result, const std::string& out_dir) {
    ensure_directory(out_dir);
    const fs::path dir(out_dir);
    result.learn_fwd.model.write_tsv((dir / error_model_filename(Orientation::FORWARD)).string());
    result.learn_rev.model.write_tsv((dir / error_model_filename(Orientation::REVERSE)).string());
    result.table.write_tsv((dir / "seqtab.tsv").string());
    result.chimera.table.write_tsv((dir / "seqtab_nochim.tsv").string());
    result.chimera.table.write_fasta((dir / "asvs.fasta").string());
    result.track.write_tsv((dir / "track.tsv").string());
    write_failures_tsv(result.failures, (dir / "failures.tsv").string());
}

void print_summary(const PipelineResult& result) {
    std::cerr << "\n=== asvflow summary ===\n";
    std::cerr << "Samples:            " << result.samples.size() << " paired, "
              << result.chimera.table.num_samples() << " in final table\n";
    for (const LearnResult* l : {&result.learn_fwd, &result.learn_rev}) {
        std::cerr << (l == &result.learn_fwd ? "Error model F:      " : "Error model R:      ");
        if (l->rounds == 0) {
            std::cerr << "loaded\n";
            continue;
        }
        std::cerr << l->rounds << " rounds" << (l->converged ? "" : " (not converged)") << "\n";
    }
    std::cerr << "Sequence variants:  " << result.table.num_sequences() << " ("
              << result.chimera.removed << " chimeric removed)\n";
    std::cerr << "Non-chimeric reads: " << result.chimera.table.total() << " of "
              << result.table.total() << " ("
              << fixed(100.0 * result.chimera.retained_fraction, 1) << "%)\n";
    if (!result.failures.empty()) {
        std::cerr << "Failed samples:     " << result.failures.size() << "\n";
        for (const auto& f : result.failures) {
            std::cerr << "  " << f.sample << " [" << f.stage << "] " << f.message << "\n";
        }
    }
}

} // namespace asvflow
