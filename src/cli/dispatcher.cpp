// asvflow command-line entry point
//
//   asvflow run -i <raw> -o <dir>                 Whole pipeline
//   asvflow filter -i <raw> -o <dir>              Stage 1
//   asvflow learn-errors -i <filtered> -o <dir>   Stage 2
//   asvflow help [command]

#include "subcommand.hpp"
#include "asvflow/version.h"
#include <cstring>
#include <iostream>
#include <string>

namespace {

int unknown_command(const asvflow::cli::SubcommandRegistry& registry, const char* program,
                    const std::string& name) {
    std::cerr << "Unknown command: " << name << "\n";
    const std::string near = registry.suggest(name);
    if (!near.empty()) {
        std::cerr << "Did you mean '" << near << "'?\n";
    }
    std::cerr << "Run '" << program << " help' for the list of commands.\n";
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto& registry = asvflow::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];
    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(argv[0]);
        return 0;
    }
    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        std::cout << "asvflow " << ASVFLOW_VERSION << "\n";
        return 0;
    }

    // "help <command>" is "<command> --help"
    if (strcmp(first_arg, "help") == 0) {
        if (argc < 3) {
            registry.print_help(argv[0]);
            return 0;
        }
        if (!registry.has_command(argv[2])) {
            return unknown_command(registry, argv[0], argv[2]);
        }
        char help_flag[] = "--help";
        char* sub_argv[] = {argv[2], help_flag, nullptr};
        return registry.run_command(argv[2], 2, sub_argv);
    }

    if (registry.has_command(first_arg)) {
        return registry.run_command(first_arg, argc - 1, argv + 1);
    }
    return unknown_command(registry, argv[0], first_arg);
}
