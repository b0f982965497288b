#pragma once
// Per-sample read survival through the pipeline stages.

#include "types.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace asvflow {

struct TrackRecord {
    std::string sample;
    uint64_t input = 0;
    uint64_t filtered = 0;
    uint64_t denoised_fwd = 0;
    uint64_t denoised_rev = 0;
    uint64_t merged = 0;
    uint64_t tabled = 0;
    uint64_t nonchim = 0;
    std::string failed_stage;  // empty when the sample completed

    bool failed() const { return !failed_stage.empty(); }
};

enum class TrackStage {
    INPUT,
    FILTERED,
    DENOISED_FWD,
    DENOISED_REV,
    MERGED,
    TABLED,
    NONCHIM
};

// Assembles TrackRecords from the counts each stage reports.
// Samples keep the order in which they were first registered.
class ReadTracker {
public:
    void add_sample(const std::string& sample);
    void record(const std::string& sample, TrackStage stage, uint64_t count);
    void mark_failed(const std::string& sample, const std::string& stage);

    std::vector<TrackRecord> records() const;

    // Rows whose counts grow where they may only shrink:
    // input >= filtered >= merged >= nonchim, filtered >= each denoised
    // count, tabled == merged, nonchim <= tabled. Failed rows are skipped.
    std::vector<std::string> check_attrition() const;

    void write_tsv(const std::string& path) const;

private:
    TrackRecord& row(const std::string& sample);

    std::vector<TrackRecord> rows_;
    std::map<std::string, size_t> index_;
};

} // namespace asvflow
