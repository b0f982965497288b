#include "asvflow/feature_table.hpp"
#include "asvflow/sequence_io.hpp"
#include <algorithm>
#include <fstream>
#include <numeric>
#include <stdexcept>

namespace asvflow {

uint64_t FeatureTable::count(const std::string& sample, const std::string& sequence) const {
    const int64_t col = column_of(sequence);
    if (col < 0) return 0;
    for (size_t r = 0; r < samples_.size(); ++r) {
        if (samples_[r] == sample) return at(r, static_cast<size_t>(col));
    }
    return 0;
}

int64_t FeatureTable::column_of(const std::string& sequence) const {
    for (size_t c = 0; c < sequences_.size(); ++c) {
        if (sequences_[c] == sequence) return static_cast<int64_t>(c);
    }
    return -1;
}

uint64_t FeatureTable::row_total(size_t row) const {
    uint64_t sum = 0;
    for (size_t c = 0; c < sequences_.size(); ++c) sum += at(row, c);
    return sum;
}

uint64_t FeatureTable::column_total(size_t col) const {
    uint64_t sum = 0;
    for (size_t r = 0; r < samples_.size(); ++r) sum += at(r, col);
    return sum;
}

uint64_t FeatureTable::total() const {
    return std::accumulate(counts_.begin(), counts_.end(), uint64_t(0));
}

std::map<size_t, size_t> FeatureTable::length_distribution() const {
    std::map<size_t, size_t> dist;
    for (const auto& s : sequences_) dist[s.size()]++;
    return dist;
}

FeatureTable FeatureTable::drop_columns(const std::vector<bool>& remove) const {
    if (remove.size() != sequences_.size()) {
        throw std::invalid_argument("drop_columns: mask size does not match column count");
    }
    std::vector<size_t> keep;
    for (size_t c = 0; c < sequences_.size(); ++c) {
        if (!remove[c]) keep.push_back(c);
    }

    FeatureTable out;
    out.samples_ = samples_;
    for (size_t c : keep) out.sequences_.push_back(sequences_[c]);
    out.counts_.resize(samples_.size() * keep.size());
    for (size_t r = 0; r < samples_.size(); ++r) {
        for (size_t k = 0; k < keep.size(); ++k) {
            out.counts_[r * keep.size() + k] = at(r, keep[k]);
        }
    }
    return out;
}

void FeatureTable::write_tsv(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open feature table output: " + path);
    }
    out << "sample";
    for (const auto& s : sequences_) out << '\t' << s;
    out << '\n';
    for (size_t r = 0; r < samples_.size(); ++r) {
        out << samples_[r];
        for (size_t c = 0; c < sequences_.size(); ++c) out << '\t' << at(r, c);
        out << '\n';
    }
    if (!out) {
        throw std::runtime_error("Failed writing feature table: " + path);
    }
}

void FeatureTable::write_fasta(const std::string& path) const {
    FastaWriter writer(path);
    for (size_t c = 0; c < sequences_.size(); ++c) {
        writer.write_sequence("ASV" + std::to_string(c + 1),
                              "abundance=" + std::to_string(column_total(c)),
                              sequences_[c]);
    }
    writer.close();
}

void FeatureTableBuilder::add_sample(const std::string& sample,
                                     const std::vector<std::pair<std::string, uint64_t>>& abundances) {
    if (!sample_index_.emplace(sample, samples_.size()).second) {
        throw std::invalid_argument("Sample added twice to feature table: " + sample);
    }
    samples_.push_back(sample);
    std::map<std::string, uint64_t> row;
    for (const auto& [seq, n] : abundances) {
        if (n > 0) row[seq] += n;
    }
    rows_.push_back(std::move(row));
}

FeatureTable FeatureTableBuilder::build() const {
    std::map<std::string, uint64_t> totals;
    for (const auto& row : rows_) {
        for (const auto& [seq, n] : row) totals[seq] += n;
    }

    std::vector<std::pair<std::string, uint64_t>> cols(totals.begin(), totals.end());
    // std::map iteration is sequence-ordered, so the stable sort breaks
    // abundance ties by sequence
    std::stable_sort(cols.begin(), cols.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });

    FeatureTable table;
    table.samples_ = samples_;
    std::unordered_map<std::string, size_t> col_index;
    for (const auto& [seq, n] : cols) {
        col_index.emplace(seq, table.sequences_.size());
        table.sequences_.push_back(seq);
    }
    table.counts_.assign(samples_.size() * cols.size(), 0);
    for (size_t r = 0; r < rows_.size(); ++r) {
        for (const auto& [seq, n] : rows_[r]) {
            table.counts_[r * cols.size() + col_index.at(seq)] = n;
        }
    }
    return table;
}

} // namespace asvflow
