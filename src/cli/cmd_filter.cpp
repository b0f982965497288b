// asvflow filter: paired quality filtering only
//
// Usage: asvflow filter -i <raw_dir> -o <out_dir> [options]
//
// Writes <out_dir>/filtered/<sample>_{F,R}_filt.fastq.gz, filter_summary.tsv
// and failures.tsv.

#include "subcommand.hpp"
#include "args.hpp"
#include "asvflow/log_utils.hpp"
#include "asvflow/pipeline.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace asvflow {
namespace cli {

int cmd_filter(int argc, char* argv[]) {
    auto run_start = std::chrono::steady_clock::now();

    Options opts;
    try {
        opts = parse_args(argc, argv, Command::FILTER);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            std::cerr << "Run 'asvflow filter --help' for usage.\n";
        }
        return e.exit_code();
    }
    const PipelineConfig& cfg = opts.config;
    log_utils::logger().set_verbose(cfg.verbose);

#ifdef _OPENMP
    if (cfg.threads > 0) omp_set_num_threads(cfg.threads);
#endif

    try {
        SampleSheet sheet = discover_samples(cfg.input_dir, cfg.forward_marker, cfg.reverse_marker);
        for (const auto& f : sheet.failures) {
            log_utils::logger().warn(f.stage, "sample " + f.sample + " excluded: " + f.message);
        }
        if (sheet.samples.empty()) {
            throw PipelineError("No paired samples found in " + cfg.input_dir);
        }

        const std::filesystem::path out(cfg.output_dir);
        FilterStageResult filtered = filter_samples(sheet.samples, (out / "filtered").string(),
                                                    cfg.filter);
        std::vector<SampleFailure> failures = sheet.failures;
        failures.insert(failures.end(), filtered.failures.begin(), filtered.failures.end());

        write_filter_stats_tsv(filtered.stats, (out / "filter_summary.tsv").string());
        write_failures_tsv(failures, (out / "failures.tsv").string());

        uint64_t in = 0, kept = 0;
        for (const auto& s : filtered.stats) {
            in += s.reads_in;
            kept += s.reads_out;
        }
        std::cerr << "Filtered " << filtered.survivors.size() << "/" << sheet.samples.size()
                  << " samples: " << kept << " of " << in << " read pairs kept\n";
        if (!failures.empty()) {
            std::cerr << "Failed samples: " << failures.size() << "\n";
            for (const auto& f : failures) {
                std::cerr << "  " << f.sample << " [" << f.stage << "] " << f.message << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto run_end = std::chrono::steady_clock::now();
    std::cerr << "Runtime: " << log_utils::format_elapsed(run_start, run_end) << "\n";
    return 0;
}

namespace {
    struct FilterRegistrar {
        FilterRegistrar() {
            SubcommandRegistry::instance().register_command(
                {"filter", "-i <raw> -o <dir>", "Quality-filter read pairs in lockstep", 1},
                cmd_filter);
        }
    };
    static FilterRegistrar registrar;
}

}  // namespace cli
}  // namespace asvflow
