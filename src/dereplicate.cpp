#include "asvflow/dereplicate.hpp"
#include <algorithm>
#include <numeric>

namespace asvflow {

uint64_t Dereplicated::total_bases() const {
    uint64_t n = 0;
    for (const auto& u : uniques) {
        n += static_cast<uint64_t>(u.abundance) * u.sequence.size();
    }
    return n;
}

void Dereplicator::add(const std::string& sequence, const std::string& quality) {
    const uint32_t read_idx = static_cast<uint32_t>(read_map_.size());
    auto [it, inserted] = index_.emplace(sequence, static_cast<uint32_t>(accums_.size()));
    if (inserted) {
        Accum a;
        a.sequence = sequence;
        a.qual_sum.assign(sequence.size(), 0.0);
        a.first_read = read_idx;
        accums_.push_back(std::move(a));
    }
    Accum& a = accums_[it->second];
    a.abundance++;
    const size_t n = std::min(quality.size(), a.qual_sum.size());
    for (size_t i = 0; i < n; ++i) {
        a.qual_sum[i] += qual_char_to_phred(quality[i]);
    }
    read_map_.push_back(it->second);
}

Dereplicated Dereplicator::finish() {
    // Accumulators are already in first-occurrence order, so a stable sort
    // on abundance keeps that order among ties.
    std::vector<uint32_t> order(accums_.size());
    std::iota(order.begin(), order.end(), 0u);
    std::stable_sort(order.begin(), order.end(), [&](uint32_t a, uint32_t b) {
        return accums_[a].abundance > accums_[b].abundance;
    });

    std::vector<uint32_t> rank(accums_.size());
    Dereplicated out;
    out.uniques.reserve(accums_.size());
    for (uint32_t r = 0; r < order.size(); ++r) {
        Accum& a = accums_[order[r]];
        rank[order[r]] = r;
        DerepUnique u;
        u.sequence = std::move(a.sequence);
        u.abundance = a.abundance;
        u.first_read = a.first_read;
        u.mean_qual.resize(a.qual_sum.size());
        for (size_t i = 0; i < a.qual_sum.size(); ++i) {
            u.mean_qual[i] = a.qual_sum[i] / a.abundance;
        }
        out.uniques.push_back(std::move(u));
    }

    out.read_map.resize(read_map_.size());
    for (size_t i = 0; i < read_map_.size(); ++i) {
        out.read_map[i] = rank[read_map_[i]];
    }
    out.total_reads = read_map_.size();

    accums_.clear();
    read_map_.clear();
    index_.clear();
    return out;
}

Dereplicated dereplicate(const std::vector<SequenceRecord>& reads) {
    Dereplicator d;
    for (const auto& r : reads) {
        d.add(r.sequence, r.quality);
    }
    return d.finish();
}

Dereplicated dereplicate_file(const std::string& path) {
    Dereplicator d;
    SequenceReader reader(path);
    SequenceRecord rec;
    while (reader.read_next(rec)) {
        d.add(SequenceUtils::clean(rec.sequence), rec.quality);
    }
    return d.finish();
}

} // namespace asvflow
