// asvflow run: the whole denoising pipeline
//
// Usage: asvflow run -i <raw_dir> -o <out_dir> [options]
//
// Writes filtered/, errors_F.tsv, errors_R.tsv, seqtab.tsv,
// seqtab_nochim.tsv, asvs.fasta, track.tsv and failures.tsv.

#include "subcommand.hpp"
#include "args.hpp"
#include "asvflow/log_utils.hpp"
#include "asvflow/pipeline.hpp"
#include "asvflow/version.h"
#include <chrono>
#include <iostream>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace asvflow {
namespace cli {

int cmd_run(int argc, char* argv[]) {
    auto run_start = std::chrono::steady_clock::now();

    Options opts;
    try {
        opts = parse_args(argc, argv, Command::RUN);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            std::cerr << "Run 'asvflow run --help' for usage.\n";
        }
        return e.exit_code();
    }
    const PipelineConfig& cfg = opts.config;

    int num_threads = cfg.threads;
#ifdef _OPENMP
    if (num_threads == 0) {
        num_threads = omp_get_max_threads();
    }
    omp_set_num_threads(num_threads);
#else
    num_threads = 1;
#endif

    if (cfg.verbose) {
        std::cerr << "asvflow run v" << ASVFLOW_VERSION << "\n";
        std::cerr << "Input: " << cfg.input_dir << "\n";
        std::cerr << "Output: " << cfg.output_dir << "\n";
        std::cerr << "Truncation: " << cfg.filter.trunc_len[0] << "," << cfg.filter.trunc_len[1]
                  << "  maxEE: " << cfg.filter.max_ee[0] << "," << cfg.filter.max_ee[1] << "\n";
        if (!cfg.errors_dir.empty()) {
            std::cerr << "Error models: " << cfg.errors_dir << "\n";
        }
        std::cerr << "Chimera method: " << chimera_method_name(cfg.chimera.method) << "\n";
        std::cerr << "Threads: " << num_threads << "\n\n";
    }

    try {
        PipelineResult result = run_pipeline(cfg);
        write_outputs(result, cfg.output_dir);
        print_summary(result);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto run_end = std::chrono::steady_clock::now();
    std::cerr << "Runtime: " << log_utils::format_elapsed(run_start, run_end) << "\n";
    return 0;
}

// Register subcommand
namespace {
    struct RunRegistrar {
        RunRegistrar() {
            SubcommandRegistry::instance().register_command(
                {"run", "-i <raw> -o <dir>", "Raw read pairs to a chimera-free ASV table", 0},
                cmd_run);
        }
    } run_registrar;
}

}  // namespace cli
}  // namespace asvflow
