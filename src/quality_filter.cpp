#include "asvflow/quality_filter.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace asvflow {

const char* filter_outcome_name(FilterOutcome outcome) {
    switch (outcome) {
        case FilterOutcome::PASS: return "pass";
        case FilterOutcome::TOO_SHORT: return "too-short";
        case FilterOutcome::TOO_MANY_N: return "too-many-n";
        case FilterOutcome::TOO_MANY_EXPECTED_ERRORS: return "too-many-expected-errors";
    }
    return "unknown";
}

double expected_errors(const std::string& quality) {
    double ee = 0.0;
    for (char c : quality) {
        ee += phred_to_error_prob(qual_char_to_phred(c));
    }
    return ee;
}

FilterOutcome filter_read(SequenceRecord& read, const FilterParams& params, Orientation o) {
    const size_t trim_left = params.trim_left_for(o);
    if (read.sequence.size() <= trim_left) {
        return FilterOutcome::TOO_SHORT;
    }
    if (trim_left > 0) {
        read.sequence.erase(0, trim_left);
        read.quality.erase(0, trim_left);
    }

    if (params.trunc_q >= 0) {
        for (size_t i = 0; i < read.quality.size(); ++i) {
            if (qual_char_to_phred(read.quality[i]) <= params.trunc_q) {
                read.sequence.resize(i);
                read.quality.resize(i);
                break;
            }
        }
    }

    const size_t trunc_len = params.trunc_len_for(o);
    if (trunc_len > 0) {
        if (read.sequence.size() < trunc_len) {
            return FilterOutcome::TOO_SHORT;
        }
        read.sequence.resize(trunc_len);
        read.quality.resize(trunc_len);
    }

    if (read.sequence.size() < params.min_len || read.sequence.empty()) {
        return FilterOutcome::TOO_SHORT;
    }

    if (SequenceUtils::count_ambiguous(read.sequence) > params.max_n) {
        return FilterOutcome::TOO_MANY_N;
    }

    const double max_ee = params.max_ee_for(o);
    if (max_ee >= 0.0 && expected_errors(read.quality) > max_ee) {
        return FilterOutcome::TOO_MANY_EXPECTED_ERRORS;
    }

    return FilterOutcome::PASS;
}

std::string filtered_path(const std::string& out_dir, const std::string& sample, Orientation o) {
    return (std::filesystem::path(out_dir) /
            (sample + "_" + orientation_tag(o) + "_filt.fastq.gz")).string();
}

namespace {

// Streams one pair of files through the filter into stats.forward_out /
// stats.reverse_out. Readers and writers are released on every exit path.
void filter_pair_streams(const SamplePair& sample, const FilterParams& params,
                         FilterStats& stats) {
    SequenceReader fwd_reader(sample.forward_path);
    SequenceReader rev_reader(sample.reverse_path);
    SequenceWriter fwd_writer(stats.forward_out);
    SequenceWriter rev_writer(stats.reverse_out);

    SequenceRecord fwd, rev;
    while (true) {
        const bool has_fwd = fwd_reader.read_next(fwd);
        const bool has_rev = rev_reader.read_next(rev);
        if (!has_fwd && !has_rev) break;
        if (has_fwd != has_rev) {
            throw InputError("Mismatched read counts for sample " + sample.name + ": " +
                             (has_fwd ? sample.reverse_path : sample.forward_path) +
                             " ended after " + std::to_string(stats.reads_in) + " reads");
        }
        stats.reads_in++;

        FilterOutcome fo = filter_read(fwd, params, Orientation::FORWARD);
        FilterOutcome ro = filter_read(rev, params, Orientation::REVERSE);
        if (fo == FilterOutcome::PASS && ro == FilterOutcome::PASS) {
            fwd_writer.write(fwd);
            rev_writer.write(rev);
            stats.reads_out++;
            continue;
        }

        FilterOutcome why = fo != FilterOutcome::PASS ? fo : ro;
        switch (why) {
            case FilterOutcome::TOO_SHORT: stats.too_short++; break;
            case FilterOutcome::TOO_MANY_N: stats.too_many_n++; break;
            case FilterOutcome::TOO_MANY_EXPECTED_ERRORS: stats.too_many_ee++; break;
            case FilterOutcome::PASS: break;
        }
    }

    fwd_writer.close();
    rev_writer.close();
}

} // namespace

FilterStats filter_sample_pair(const SamplePair& sample,
                               const std::string& out_dir,
                               const FilterParams& params) {
    FilterStats stats;
    stats.sample = sample.name;
    stats.forward_out = filtered_path(out_dir, sample.name, Orientation::FORWARD);
    stats.reverse_out = filtered_path(out_dir, sample.name, Orientation::REVERSE);

    try {
        filter_pair_streams(sample, params, stats);
    } catch (const std::exception&) {
        // No filtered output survives a rejected sample
        std::error_code ec;
        std::filesystem::remove(stats.forward_out, ec);
        std::filesystem::remove(stats.reverse_out, ec);
        throw;
    }
    return stats;
}

void write_filter_stats_tsv(const std::vector<FilterStats>& stats, const std::string& path) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open filter summary: " + path);
    }
    out << "sample\treads_in\treads_out\ttoo_short\ttoo_many_n\ttoo_many_ee\n";
    for (const auto& s : stats) {
        out << s.sample << '\t' << s.reads_in << '\t' << s.reads_out << '\t'
            << s.too_short << '\t' << s.too_many_n << '\t' << s.too_many_ee << '\n';
    }
    if (!out) {
        throw std::runtime_error("Failed writing filter summary: " + path);
    }
}

} // namespace asvflow
