// asvflow learn-errors: error models from already filtered reads
//
// Usage: asvflow learn-errors -i <filtered_dir> -o <out_dir> [options]
//
// Reads <sample>_F_filt.fastq.gz / <sample>_R_filt.fastq.gz pairs and writes
// errors_F.tsv and errors_R.tsv.

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

int cmd_learn_errors(int argc, char* argv[]) {
    auto run_start = std::chrono::steady_clock::now();

    Options opts;
    try {
        opts = parse_args(argc, argv, Command::LEARN_ERRORS);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            std::cerr << "Run 'asvflow learn-errors --help' for usage.\n";
        }
        return e.exit_code();
    }
    const PipelineConfig& cfg = opts.config;
    log_utils::logger().set_verbose(cfg.verbose);

#ifdef _OPENMP
    if (cfg.threads > 0) omp_set_num_threads(cfg.threads);
#endif

    try {
        SampleSheet sheet = discover_samples(cfg.input_dir, "_F_filt.fastq", "_R_filt.fastq");
        for (const auto& f : sheet.failures) {
            log_utils::logger().warn(f.stage, "sample " + f.sample + " excluded: " + f.message);
        }
        if (sheet.samples.empty()) {
            throw PipelineError("No filtered sample pairs found in " + cfg.input_dir);
        }

        LearnParams learn = cfg.learn;
        learn.denoise = cfg.denoise;
        const std::filesystem::path out(cfg.output_dir);
        std::error_code ec;
        std::filesystem::create_directories(out, ec);
        if (ec) {
            throw PipelineError("Cannot create output directory " + cfg.output_dir + ": " +
                                ec.message());
        }

        for (Orientation o : {Orientation::FORWARD, Orientation::REVERSE}) {
            LearnResult lr = learn_orientation(sheet.samples, o, learn);
            const std::string path =
                (out / error_model_filename(o)).string();
            lr.model.write_tsv(path);
            std::cerr << orientation_name(o) << ": " << lr.rounds << " rounds"
                      << (lr.converged ? "" : " (not converged)") << ", "
                      << lr.samples_used.size() << " samples, " << lr.bases_used
                      << " bases -> " << path << "\n";
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
    struct LearnErrorsRegistrar {
        LearnErrorsRegistrar() {
            SubcommandRegistry::instance().register_command(
                {"learn-errors", "-i <filtered> -o <dir>",
                 "Learn forward and reverse error models", 2},
                cmd_learn_errors);
        }
    };
    static LearnErrorsRegistrar registrar;
}

}  // namespace cli
}  // namespace asvflow
