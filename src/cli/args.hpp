#ifndef ASVFLOW_CLI_ARGS_HPP
#define ASVFLOW_CLI_ARGS_HPP

#include "asvflow/pipeline.hpp"
#include <exception>
#include <utility>
#include <string>

namespace asvflow {
namespace cli {

// Thrown instead of calling exit(): code 0 for --help/--version,
// 1 for invalid arguments
class ParseArgsExit : public std::exception {
public:
    explicit ParseArgsExit(int code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    int exit_code() const { return code_; }
    const std::string& message() const { return message_; }
    const char* what() const noexcept override { return message_.c_str(); }

private:
    int code_;
    std::string message_;
};

enum class Command {
    RUN,            // whole pipeline
    FILTER,         // quality filtering only
    LEARN_ERRORS    // error models from an existing filtered directory
};

const char* command_name(Command cmd);

struct Options {
    Command command = Command::RUN;
    // For learn-errors, config.input_dir holds filtered FASTQ files
    PipelineConfig config;
};

// Print version string to stdout
void print_version();

// Print usage/help for one command to stdout
void print_usage(const char* program_name, Command cmd);

// Parse the arguments following the command name.
// Throws ParseArgsExit(0) for --help/--version and ParseArgsExit(1) for
// errors (missing input, unknown options, options the command does not use).
Options parse_args(int argc, char* argv[], Command cmd = Command::RUN);

}  // namespace cli
}  // namespace asvflow

#endif  // ASVFLOW_CLI_ARGS_HPP
