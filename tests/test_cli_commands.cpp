// Unit tests for the subcommand registry and top-level help
// Compile: g++ -std=c++20 -I../include -I../src -o test_cli_commands test_cli_commands.cpp ../src/cli/subcommand.cpp

#include "cli/subcommand.hpp"
#include <cassert>
#include <iostream>
#include <string>

using asvflow::cli::SubcommandRegistry;

static int last_argc = -1;

static int record_call(int argc, char* argv[]) {
    (void)argv;
    last_argc = argc;
    return 7;
}

static void register_workflow() {
    auto& registry = SubcommandRegistry::instance();
    // Registered out of workflow order on purpose
    registry.register_command({"learn-errors", "-i <filtered> -o <dir>", "Learn models", 2}, record_call);
    registry.register_command({"run", "-i <raw> -o <dir>", "Whole pipeline", 0}, record_call);
    registry.register_command({"filter", "-i <raw> -o <dir>", "Filter pairs", 1}, record_call);
    registry.register_command({"filter", "", "duplicate ignored", 9}, record_call);
}

void test_workflow_order() {
    std::cout << "Testing workflow order... ";
    const auto cmds = SubcommandRegistry::instance().commands();
    assert(cmds.size() == 3);
    assert(cmds[0].name == "run" && cmds[0].step == 0);
    assert(cmds[1].name == "filter" && cmds[1].step == 1);
    assert(cmds[2].name == "learn-errors" && cmds[2].step == 2);
    assert(cmds[1].description == "Filter pairs");
    std::cout << "PASSED\n";
}

void test_help_sections() {
    std::cout << "Testing help sections... ";
    const std::string help = SubcommandRegistry::instance().help_text("asvflow");
    const size_t pipeline = help.find("Whole pipeline:");
    const size_t stages = help.find("Stages, in workflow order:");
    const size_t run = help.find("run -i <raw> -o <dir>");
    const size_t filter = help.find("1. Filter pairs");
    const size_t learn = help.find("2. Learn models");
    const size_t reuse = help.find("--errors-dir");
    assert(pipeline != std::string::npos && stages != std::string::npos);
    assert(pipeline < run && run < stages);
    assert(stages < filter && filter < learn);
    assert(learn < reuse && reuse != std::string::npos);
    assert(help.find("duplicate ignored") == std::string::npos);
    assert(help.find("asvflow help <command>") != std::string::npos);
    std::cout << "PASSED\n";
}

void test_dispatch_and_suggest() {
    std::cout << "Testing dispatch and suggestions... ";
    auto& registry = SubcommandRegistry::instance();
    char name[] = "filter";
    char flag[] = "--help";
    char* argv[] = {name, flag, nullptr};
    assert(registry.run_command("filter", 2, argv) == 7);
    assert(last_argc == 2);
    assert(registry.run_command("denoise", 2, argv) == 1);
    assert(registry.has_command("learn-errors"));
    assert(!registry.has_command("learn"));
    assert(registry.suggest("learn") == "learn-errors");
    assert(registry.suggest("filt") == "filter");
    assert(registry.suggest("ru") == "");
    assert(registry.suggest("chimeras") == "");
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Command Registry Tests ===\n\n";
    register_workflow();
    test_workflow_order();
    test_help_sections();
    test_dispatch_and_suggest();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
