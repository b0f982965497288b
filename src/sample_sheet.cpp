#include "asvflow/sample_sheet.hpp"
#include <algorithm>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace asvflow {

std::string sample_name_from_path(const std::string& path) {
    std::string base = fs::path(path).filename().string();
    size_t us = base.find('_');
    return us == std::string::npos ? base : base.substr(0, us);
}

SampleSheet discover_samples(const std::string& input_dir,
                             const std::string& forward_marker,
                             const std::string& reverse_marker) {
    std::error_code ec;
    if (!fs::is_directory(input_dir, ec)) {
        throw InputError("Input directory not found: " + input_dir);
    }

    std::vector<std::string> files;
    for (fs::directory_iterator it(input_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path().string());
        }
    }
    if (ec) {
        throw InputError("Cannot list " + input_dir + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    // name -> (forward files, reverse files)
    std::map<std::string, std::pair<std::vector<std::string>, std::vector<std::string>>> by_name;
    for (const auto& f : files) {
        const std::string base = fs::path(f).filename().string();
        const bool is_fwd = base.find(forward_marker) != std::string::npos;
        const bool is_rev = base.find(reverse_marker) != std::string::npos;
        if (is_fwd == is_rev) continue;  // neither, or ambiguous marker
        auto& entry = by_name[sample_name_from_path(f)];
        (is_fwd ? entry.first : entry.second).push_back(f);
    }

    SampleSheet sheet;
    for (const auto& [name, entry] : by_name) {
        const auto& fwd = entry.first;
        const auto& rev = entry.second;
        if (fwd.size() == 1 && rev.size() == 1) {
            sheet.samples.push_back({name, fwd.front(), rev.front()});
        } else if (fwd.empty() || rev.empty()) {
            sheet.failures.push_back({name, "discover",
                                      fwd.empty() ? "no forward read file"
                                                  : "no reverse read file"});
        } else {
            sheet.failures.push_back({name, "discover",
                                      "multiple files for one orientation"});
        }
    }
    return sheet;
}

} // namespace asvflow
