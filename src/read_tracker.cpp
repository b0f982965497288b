#include "asvflow/read_tracker.hpp"
#include <fstream>
#include <stdexcept>

namespace asvflow {

void ReadTracker::add_sample(const std::string& sample) {
    if (index_.emplace(sample, rows_.size()).second) {
        TrackRecord rec;
        rec.sample = sample;
        rows_.push_back(rec);
    }
}

TrackRecord& ReadTracker::row(const std::string& sample) {
    add_sample(sample);
    return rows_[index_.at(sample)];
}

void ReadTracker::record(const std::string& sample, TrackStage stage, uint64_t count) {
    TrackRecord& r = row(sample);
    switch (stage) {
        case TrackStage::INPUT: r.input = count; break;
        case TrackStage::FILTERED: r.filtered = count; break;
        case TrackStage::DENOISED_FWD: r.denoised_fwd = count; break;
        case TrackStage::DENOISED_REV: r.denoised_rev = count; break;
        case TrackStage::MERGED: r.merged = count; break;
        case TrackStage::TABLED: r.tabled = count; break;
        case TrackStage::NONCHIM: r.nonchim = count; break;
    }
}

void ReadTracker::mark_failed(const std::string& sample, const std::string& stage) {
    TrackRecord& r = row(sample);
    if (r.failed_stage.empty()) r.failed_stage = stage;
}

std::vector<TrackRecord> ReadTracker::records() const {
    return rows_;
}

std::vector<std::string> ReadTracker::check_attrition() const {
    std::vector<std::string> problems;
    for (const auto& r : rows_) {
        if (r.failed()) continue;
        auto flag = [&](bool bad, const char* what) {
            if (bad) problems.push_back(r.sample + ": " + what);
        };
        flag(r.filtered > r.input, "filtered > input");
        flag(r.denoised_fwd > r.filtered, "denoised forward > filtered");
        flag(r.denoised_rev > r.filtered, "denoised reverse > filtered");
        flag(r.merged > r.filtered, "merged > filtered");
        flag(r.merged > r.denoised_fwd || r.merged > r.denoised_rev, "merged > denoised");
        flag(r.tabled != r.merged, "tabled != merged");
        flag(r.nonchim > r.tabled, "nonchim > tabled");
    }
    return problems;
}

void ReadTracker::write_tsv(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open track output: " + path);
    }
    out << "sample\tinput\tfiltered\tdenoisedF\tdenoisedR\tmerged\ttabled\tnonchim\tstatus\n";
    for (const auto& r : rows_) {
        out << r.sample << '\t' << r.input << '\t' << r.filtered << '\t'
            << r.denoised_fwd << '\t' << r.denoised_rev << '\t' << r.merged << '\t'
            << r.tabled << '\t' << r.nonchim << '\t'
            << (r.failed() ? "failed:" + r.failed_stage : std::string("ok")) << '\n';
    }
    if (!out) {
        throw std::runtime_error("Failed writing track table: " + path);
    }
}

} // namespace asvflow
