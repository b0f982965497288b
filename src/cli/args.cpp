#include "args.hpp"
#include "asvflow/version.h"
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace asvflow {
namespace cli {

namespace {

// Option groups; a command accepts only the groups it uses
constexpr uint32_t GROUP_DISCOVER = 1u << 0;
constexpr uint32_t GROUP_FILTER = 1u << 1;
constexpr uint32_t GROUP_LEARN = 1u << 2;
constexpr uint32_t GROUP_DENOISE = 1u << 3;
constexpr uint32_t GROUP_MERGE = 1u << 4;
constexpr uint32_t GROUP_CHIMERA = 1u << 5;
constexpr uint32_t GROUP_REUSE = 1u << 6;

uint32_t command_groups(Command cmd) {
    switch (cmd) {
        case Command::FILTER:
            return GROUP_DISCOVER | GROUP_FILTER;
        case Command::LEARN_ERRORS:
            return GROUP_LEARN | GROUP_DENOISE;
        case Command::RUN:
            break;
    }
    return GROUP_DISCOVER | GROUP_FILTER | GROUP_LEARN | GROUP_DENOISE |
           GROUP_MERGE | GROUP_CHIMERA | GROUP_REUSE;
}

}  // namespace

const char* command_name(Command cmd) {
    switch (cmd) {
        case Command::FILTER: return "filter";
        case Command::LEARN_ERRORS: return "learn-errors";
        case Command::RUN: break;
    }
    return "run";
}

void print_version() {
    std::cout << "asvflow " << ASVFLOW_VERSION << "\n";
}

void print_usage(const char* program_name, Command cmd) {
    const uint32_t groups = command_groups(cmd);
    std::cout << "asvflow v" << ASVFLOW_VERSION << "\n\n";
    std::cout << "Usage: " << program_name << " " << command_name(cmd)
              << " -i <dir> [-o <dir>] [options]\n\n";
    std::cout << "Options:\n";
    if (cmd == Command::LEARN_ERRORS) {
        std::cout << "  -i, --input <dir>          Directory of filtered *_F_filt / *_R_filt FASTQ files\n";
    } else {
        std::cout << "  -i, --input <dir>          Directory of raw paired FASTQ files (.gz ok)\n";
    }
    std::cout << "  -o, --output <dir>         Output directory (default: asvflow_out)\n";
    if (groups & GROUP_DISCOVER) {
        std::cout << "  --fwd-pattern <s>          Forward file marker (default: _R1_001.fastq)\n";
        std::cout << "  --rev-pattern <s>          Reverse file marker (default: _R2_001.fastq)\n";
    }
    if (groups & GROUP_FILTER) {
        std::cout << "\nFiltering:\n";
        std::cout << "  --trunc-len <F,R>          Truncation lengths, 0 = none (default: 240,160)\n";
        std::cout << "  --trim-left <F,R>          Bases removed from the 5' end (default: 0,0)\n";
        std::cout << "  --trunc-q <int>            Truncate at first quality <= Q (default: 2)\n";
        std::cout << "  --max-n <int>              Maximum ambiguous bases (default: 0)\n";
        std::cout << "  --max-ee <F,R>             Maximum expected errors (default: 2,2)\n";
        std::cout << "  --min-len <int>            Minimum length after trimming (default: 20)\n";
    }
    if (groups & GROUP_LEARN) {
        std::cout << "\nError learning:\n";
        std::cout << "  --learn-nbases <n>         Bases used per orientation (default: 1e8)\n";
        std::cout << "  --max-consist <int>        Maximum self-consistency rounds (default: 10)\n";
        std::cout << "  --randomize                Visit samples in random order\n";
        std::cout << "  --seed <int>               Seed for --randomize (default: 42)\n";
    }
    if (groups & GROUP_REUSE) {
        std::cout << "  --errors-dir <dir>         Reuse errors_F.tsv/errors_R.tsv from an earlier run\n";
    }
    if (groups & GROUP_DENOISE) {
        std::cout << "\nDenoising:\n";
        std::cout << "  --omega-a <x>              P-value threshold for new variants (default: 1e-40)\n";
        std::cout << "  --omega-c <x>              P-value below which reads stay uncorrected (default: 1e-40)\n";
        std::cout << "  --detect-singletons        Allow abundance-1 sequences to become variants\n";
        std::cout << "  --band-size <int>          Alignment band, -1 = unbanded (default: 16)\n";
    }
    if (groups & GROUP_MERGE) {
        std::cout << "\nMerging:\n";
        std::cout << "  --min-overlap <int>        Minimum overlap (default: 12)\n";
        std::cout << "  --max-mismatch <int>       Maximum overlap mismatches (default: 0)\n";
        std::cout << "  --max-mismatch-rate <x>    Maximum overlap mismatch fraction (default: 1.0)\n";
        std::cout << "  --just-concatenate         Join mates with a 10-N spacer\n";
        std::cout << "  --trim-overhang            Drop bases past the other mate's start\n";
    }
    if (groups & GROUP_CHIMERA) {
        std::cout << "\nChimera removal:\n";
        std::cout << "  --chimera-method <m>       consensus or pooled (default: consensus)\n";
        std::cout << "  --min-fold-parent <x>      Parent/query abundance ratio (default: 1.5)\n";
        std::cout << "  --min-sample-fraction <x>  Flagged sample fraction (default: 0.9)\n";
        std::cout << "  --ignore-negatives <int>   Unflagged samples ignored (default: 1)\n";
        std::cout << "  --allow-one-off            Allow one mismatch in a chimera model\n";
    }
    std::cout << "\n";
    std::cout << "  -t, --threads <int>        Number of threads (default: auto)\n";
    std::cout << "  -v, --verbose              Verbose output\n";
    std::cout << "  -V, --version              Show version and exit\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " " << command_name(cmd)
              << " -i MiSeq_SOP -o out --trunc-len 240,160 -t 8\n";
}

Options parse_args(int argc, char* argv[], Command cmd) {
    Options opts;
    opts.command = cmd;
    PipelineConfig& cfg = opts.config;
    const uint32_t groups = command_groups(cmd);

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto in_group = [&](uint32_t group) {
            if (!(groups & group)) {
                throw ParseArgsExit(1, "Error: Option " + arg + " is not used by '" +
                                           command_name(cmd) + "'");
            }
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            const int parsed = parse_int(flag, value);
            if (parsed < 0) {
                throw ParseArgsExit(1, "Error: " + flag + " must be >= 0");
            }
            return static_cast<size_t>(parsed);
        };

        auto parse_seed = [&](const std::string& flag, const std::string& value) -> uint64_t {
            try {
                size_t idx = 0;
                if (value.empty() || value[0] == '-') {
                    throw ParseArgsExit(1, "Error: Invalid seed for " + flag + ": " + value);
                }
                const unsigned long long parsed = std::stoull(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid seed for " + flag + ": " + value);
                }
                return static_cast<uint64_t>(parsed);
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid seed for " + flag + ": " + value);
            }
        };

        auto parse_double = [&](const std::string& flag, const std::string& value) -> double {
            try {
                size_t idx = 0;
                double parsed = std::stod(value, &idx);
                if (idx != value.size() || !std::isfinite(parsed)) {
                    throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
                }
                return parsed;
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
            }
        };

        // "F,R" or a single value used for both orientations
        auto split_pair = [&](const std::string& flag,
                              const std::string& value) -> std::pair<std::string, std::string> {
            const size_t comma = value.find(',');
            if (comma == std::string::npos) return {value, value};
            if (value.find(',', comma + 1) != std::string::npos) {
                throw ParseArgsExit(1, "Error: " + flag + " takes F,R: " + value);
            }
            return {value.substr(0, comma), value.substr(comma + 1)};
        };

        auto parse_probability = [&](const std::string& flag, const std::string& value) -> double {
            const double p = parse_double(flag, value);
            if (p < 0.0 || p > 1.0) {
                throw ParseArgsExit(1, "Error: " + flag + " must be in [0, 1]");
            }
            return p;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage("asvflow", cmd);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            cfg.input_dir = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            cfg.output_dir = require_value(arg);
        } else if (arg == "-t" || arg == "--threads") {
            cfg.threads = parse_int(arg, require_value(arg));
            if (cfg.threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--fwd-pattern") {
            in_group(GROUP_DISCOVER);
            cfg.forward_marker = require_value(arg);
        } else if (arg == "--rev-pattern") {
            in_group(GROUP_DISCOVER);
            cfg.reverse_marker = require_value(arg);
        } else if (arg == "--trunc-len") {
            in_group(GROUP_FILTER);
            auto [f, r] = split_pair(arg, require_value(arg));
            cfg.filter.trunc_len = {parse_size(arg, f), parse_size(arg, r)};
        } else if (arg == "--trim-left") {
            in_group(GROUP_FILTER);
            auto [f, r] = split_pair(arg, require_value(arg));
            cfg.filter.trim_left = {parse_size(arg, f), parse_size(arg, r)};
        } else if (arg == "--trunc-q") {
            in_group(GROUP_FILTER);
            cfg.filter.trunc_q = parse_int(arg, require_value(arg));
        } else if (arg == "--max-n") {
            in_group(GROUP_FILTER);
            cfg.filter.max_n = parse_size(arg, require_value(arg));
        } else if (arg == "--max-ee") {
            in_group(GROUP_FILTER);
            auto [f, r] = split_pair(arg, require_value(arg));
            cfg.filter.max_ee = {parse_double(arg, f), parse_double(arg, r)};
        } else if (arg == "--min-len") {
            in_group(GROUP_FILTER);
            cfg.filter.min_len = parse_size(arg, require_value(arg));
        } else if (arg == "--learn-nbases") {
            in_group(GROUP_LEARN);
            const double nb = parse_double(arg, require_value(arg));
            if (nb < 1.0) {
                throw ParseArgsExit(1, "Error: --learn-nbases must be >= 1");
            }
            cfg.learn.nbases = static_cast<uint64_t>(nb);
        } else if (arg == "--max-consist") {
            in_group(GROUP_LEARN);
            const int mc = parse_int(arg, require_value(arg));
            if (mc < 1) {
                throw ParseArgsExit(1, "Error: --max-consist must be >= 1");
            }
            cfg.learn.max_consist = static_cast<uint32_t>(mc);
        } else if (arg == "--randomize") {
            in_group(GROUP_LEARN);
            cfg.learn.randomize = true;
        } else if (arg == "--seed") {
            in_group(GROUP_LEARN);
            cfg.learn.seed = parse_seed(arg, require_value(arg));
        } else if (arg == "--errors-dir") {
            in_group(GROUP_REUSE);
            cfg.errors_dir = require_value(arg);
        } else if (arg == "--omega-a") {
            in_group(GROUP_DENOISE);
            cfg.denoise.omega_a = parse_probability(arg, require_value(arg));
        } else if (arg == "--omega-c") {
            in_group(GROUP_DENOISE);
            cfg.denoise.omega_c = parse_probability(arg, require_value(arg));
        } else if (arg == "--detect-singletons") {
            in_group(GROUP_DENOISE);
            cfg.denoise.detect_singletons = true;
        } else if (arg == "--band-size") {
            in_group(GROUP_DENOISE);
            const int band = parse_int(arg, require_value(arg));
            cfg.denoise.align.band = band;
            cfg.chimera.align.band = band;
        } else if (arg == "--min-overlap") {
            in_group(GROUP_MERGE);
            cfg.merge.min_overlap = parse_size(arg, require_value(arg));
            if (cfg.merge.min_overlap < 1) {
                throw ParseArgsExit(1, "Error: --min-overlap must be >= 1");
            }
        } else if (arg == "--max-mismatch") {
            in_group(GROUP_MERGE);
            cfg.merge.max_mismatch = parse_size(arg, require_value(arg));
        } else if (arg == "--max-mismatch-rate") {
            in_group(GROUP_MERGE);
            cfg.merge.max_mismatch_rate = parse_probability(arg, require_value(arg));
        } else if (arg == "--just-concatenate") {
            in_group(GROUP_MERGE);
            cfg.merge.just_concatenate = true;
        } else if (arg == "--trim-overhang") {
            in_group(GROUP_MERGE);
            cfg.merge.trim_overhang = true;
        } else if (arg == "--chimera-method") {
            in_group(GROUP_CHIMERA);
            const std::string method = require_value(arg);
            try {
                cfg.chimera.method = parse_chimera_method(method);
            } catch (const std::invalid_argument& e) {
                throw ParseArgsExit(1, std::string("Error: ") + e.what());
            }
        } else if (arg == "--min-fold-parent") {
            in_group(GROUP_CHIMERA);
            cfg.chimera.min_fold_parent = parse_double(arg, require_value(arg));
            if (cfg.chimera.min_fold_parent < 1.0) {
                throw ParseArgsExit(1, "Error: --min-fold-parent must be >= 1");
            }
        } else if (arg == "--min-sample-fraction") {
            in_group(GROUP_CHIMERA);
            cfg.chimera.min_sample_fraction = parse_probability(arg, require_value(arg));
        } else if (arg == "--ignore-negatives") {
            in_group(GROUP_CHIMERA);
            cfg.chimera.ignore_n_negatives = static_cast<uint32_t>(parse_size(arg, require_value(arg)));
        } else if (arg == "--allow-one-off") {
            in_group(GROUP_CHIMERA);
            cfg.chimera.allow_one_off = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (cfg.input_dir.empty()) {
        throw ParseArgsExit(1, "Error: No input directory specified");
    }
    if (cfg.output_dir.empty()) {
        throw ParseArgsExit(1, "Error: Output directory must not be empty");
    }

    return opts;
}

}  // namespace cli
}  // namespace asvflow
