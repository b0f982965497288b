#pragma once
// Samples x sequence-variant count matrix.
//
// Columns are keyed by the sequence string itself, so tables built from
// independently processed sample batches line up without any shared
// index. Columns are ordered by descending total abundance, ties by
// sequence.

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace asvflow {

class FeatureTable {
public:
    FeatureTable() = default;

    size_t num_samples() const { return samples_.size(); }
    size_t num_sequences() const { return sequences_.size(); }

    const std::vector<std::string>& samples() const { return samples_; }
    const std::vector<std::string>& sequences() const { return sequences_; }

    uint64_t at(size_t row, size_t col) const { return counts_[row * sequences_.size() + col]; }

    // Count for a sample/sequence pair; 0 when either is absent
    uint64_t count(const std::string& sample, const std::string& sequence) const;

    int64_t column_of(const std::string& sequence) const;

    uint64_t row_total(size_t row) const;
    uint64_t column_total(size_t col) const;
    uint64_t total() const;

    // Number of columns per sequence length
    std::map<size_t, size_t> length_distribution() const;

    // Copy without the flagged columns (remove.size() == num_sequences())
    FeatureTable drop_columns(const std::vector<bool>& remove) const;

    // TSV: header "sample" + one column per sequence, one row per sample
    void write_tsv(const std::string& path) const;

    // FASTA of column sequences named ASV1, ASV2, ... in column order
    void write_fasta(const std::string& path) const;

private:
    friend class FeatureTableBuilder;

    std::vector<std::string> samples_;
    std::vector<std::string> sequences_;
    std::vector<uint64_t> counts_;  // row-major
};

class FeatureTableBuilder {
public:
    // Throws std::invalid_argument when the sample was already added.
    void add_sample(const std::string& sample,
                    const std::vector<std::pair<std::string, uint64_t>>& abundances);

    FeatureTable build() const;

private:
    std::vector<std::string> samples_;
    std::unordered_map<std::string, size_t> sample_index_;
    // per sample: sequence -> count
    std::vector<std::map<std::string, uint64_t>> rows_;
};

} // namespace asvflow
