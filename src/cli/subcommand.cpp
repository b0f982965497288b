#include "subcommand.hpp"
#include "asvflow/version.h"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace asvflow {
namespace cli {

namespace {

size_t common_prefix(const std::string& a, const std::string& b) {
    size_t n = 0;
    while (n < a.size() && n < b.size() && a[n] == b[n]) ++n;
    return n;
}

void append_row(std::ostringstream& out, const std::string& label,
                const std::string& text, size_t width) {
    out << "  " << label << std::string(width + 2 - std::min(width, label.size()), ' ')
        << text << "\n";
}

}  // namespace

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const CommandInfo& info, SubcommandFn fn) {
    if (handlers_.count(info.name)) return;
    handlers_[info.name] = std::move(fn);
    infos_.push_back(info);
}

bool SubcommandRegistry::has_command(const std::string& name) const {
    return handlers_.find(name) != handlers_.end();
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        std::cerr << "Unknown command: " << name << "\n";
        return 1;
    }
    return it->second(argc, argv);
}

std::string SubcommandRegistry::suggest(const std::string& name) const {
    std::string best;
    size_t best_len = 2;
    for (const auto& info : commands()) {
        const size_t len = common_prefix(name, info.name);
        if (len > best_len) {
            best_len = len;
            best = info.name;
        }
    }
    return best;
}

std::vector<CommandInfo> SubcommandRegistry::commands() const {
    std::vector<CommandInfo> sorted = infos_;
    std::sort(sorted.begin(), sorted.end(), [](const CommandInfo& a, const CommandInfo& b) {
        return a.step != b.step ? a.step < b.step : a.name < b.name;
    });
    return sorted;
}

std::string SubcommandRegistry::help_text(const char* program_name) const {
    const std::vector<CommandInfo> sorted = commands();
    size_t width = 0;
    for (const auto& info : sorted) {
        width = std::max(width, info.name.size() + 1 + info.synopsis.size());
    }

    std::ostringstream out;
    out << "asvflow v" << ASVFLOW_VERSION
        << ": paired-end reads in, exact amplicon sequence variants out\n\n";
    out << "Usage: " << program_name << " <command> [options]\n";

    int section = -1;
    for (const auto& info : sorted) {
        const int s = info.step > 0 ? 1 : 0;
        if (s != section) {
            out << (s == 0 ? "\nWhole pipeline:\n" : "\nStages, in workflow order:\n");
            section = s;
        }
        const std::string label = info.synopsis.empty() ? info.name : info.name + " " + info.synopsis;
        const std::string prefix = info.step > 0 ? std::to_string(info.step) + ". " : "";
        append_row(out, label, prefix + info.description, width);
    }

    out << "\nStaged run, reusing the learned models:\n";
    out << "  " << program_name << " filter -i raw -o out\n";
    out << "  " << program_name << " learn-errors -i out/filtered -o out\n";
    out << "  " << program_name << " run -i raw -o out --errors-dir out\n";
    out << "\nCommand options: " << program_name << " help <command>\n";
    return out.str();
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << help_text(program_name);
}

}  // namespace cli
}  // namespace asvflow
