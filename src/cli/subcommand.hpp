#ifndef ASVFLOW_CLI_SUBCOMMAND_HPP
#define ASVFLOW_CLI_SUBCOMMAND_HPP

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace asvflow {
namespace cli {

using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Step 0 is the whole pipeline; stages are numbered in the order a
// staged run calls them.
struct CommandInfo {
    std::string name;
    std::string synopsis;     // arguments shown after the name
    std::string description;
    int step = 0;
};

class SubcommandRegistry {
public:
    static SubcommandRegistry& instance();

    void register_command(const CommandInfo& info, SubcommandFn fn);

    bool has_command(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    // Registered name sharing the longest prefix with `name`, or "" when
    // none shares at least three characters
    std::string suggest(const std::string& name) const;

    // Commands sorted by step, then name
    std::vector<CommandInfo> commands() const;

    std::string help_text(const char* program_name) const;
    void print_help(const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::unordered_map<std::string, SubcommandFn> handlers_;
    std::vector<CommandInfo> infos_;
};

int cmd_run(int argc, char* argv[]);
int cmd_filter(int argc, char* argv[]);
int cmd_learn_errors(int argc, char* argv[]);

}  // namespace cli
}  // namespace asvflow

#endif  // ASVFLOW_CLI_SUBCOMMAND_HPP
