#include "asvflow/merge_pairs.hpp"
#include "asvflow/sequence_io.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>

namespace asvflow {

namespace {

constexpr int MISMATCH_WEIGHT = 4;
const std::string CONCAT_SPACER = "NNNNNNNNNN";

} // namespace

const char* merge_status_name(MergeStatus s) {
    switch (s) {
        case MergeStatus::MERGED: return "merged";
        case MergeStatus::NO_OVERLAP: return "no-overlap";
        case MergeStatus::TOO_MANY_MISMATCHES: return "too-many-mismatches";
        case MergeStatus::AMBIGUOUS: return "ambiguous";
    }
    return "unknown";
}

OverlapResult merge_overlap(const std::string& fwd, const std::string& rev_rc,
                            const MergeParams& params) {
    OverlapResult res;
    const int64_t lf = static_cast<int64_t>(fwd.size());
    const int64_t lr = static_cast<int64_t>(rev_rc.size());
    const int64_t mo = static_cast<int64_t>(std::max<size_t>(params.min_overlap, 1));
    if (mo > std::min(lf, lr)) {
        return res;
    }

    bool found = false;
    bool tied = false;
    int64_t best_score = 0;

    for (int64_t s = -(lr - mo); s <= lf - mo; ++s) {
        const int64_t start = std::max<int64_t>(0, s);
        const int64_t end = std::min(lf, s + lr);
        const int64_t len = end - start;
        if (len < mo) continue;

        size_t mm = 0;
        for (int64_t p = start; p < end; ++p) {
            const char a = fwd[p];
            const char b = rev_rc[p - s];
            if (a != b || char_to_nt(a) == Nucleotide::N) mm++;
        }
        const int64_t score = (len - static_cast<int64_t>(mm)) -
                              MISMATCH_WEIGHT * static_cast<int64_t>(mm);
        if (!found || score > best_score) {
            found = true;
            tied = false;
            best_score = score;
            res.offset = s;
            res.overlap = static_cast<size_t>(len);
            res.mismatches = mm;
        } else if (score == best_score) {
            tied = true;
        }
    }

    if (!found) return res;

    const double rate = static_cast<double>(res.mismatches) / static_cast<double>(res.overlap);
    if (res.mismatches > params.max_mismatch || rate > params.max_mismatch_rate) {
        res.status = MergeStatus::TOO_MANY_MISMATCHES;
        return res;
    }
    if (tied) {
        res.status = MergeStatus::AMBIGUOUS;
        return res;
    }

    const int64_t s = res.offset;
    std::string body = fwd;
    // Forward base wins in the overlap unless it is ambiguous
    for (int64_t p = std::max<int64_t>(0, s); p < std::min(lf, s + lr); ++p) {
        if (char_to_nt(body[p]) == Nucleotide::N && char_to_nt(rev_rc[p - s]) != Nucleotide::N) {
            body[p] = rev_rc[p - s];
        }
    }

    std::string merged;
    if (params.trim_overhang) {
        merged = body.substr(0, static_cast<size_t>(std::min(lf, s + lr)));
    } else {
        if (s < 0) merged = rev_rc.substr(0, static_cast<size_t>(-s));
        merged += body;
    }
    if (s + lr > lf) {
        merged += rev_rc.substr(static_cast<size_t>(lf - s));
    }

    res.merged = std::move(merged);
    res.status = MergeStatus::MERGED;
    return res;
}

std::vector<std::pair<std::string, uint64_t>> MergeResult::merged_sequences() const {
    std::vector<std::pair<std::string, uint64_t>> out;
    std::unordered_map<std::string, size_t> index;
    for (const auto& p : pairs) {
        if (p.status != MergeStatus::MERGED) continue;
        auto [it, inserted] = index.emplace(p.sequence, out.size());
        if (inserted) {
            out.emplace_back(p.sequence, 0);
        }
        out[it->second].second += p.abundance;
    }
    return out;
}

MergeResult merge_pairs(const Dereplicated& derep_fwd, const DenoiseResult& dada_fwd,
                        const Dereplicated& derep_rev, const DenoiseResult& dada_rev,
                        const MergeParams& params) {
    if (derep_fwd.total_reads != derep_rev.total_reads) {
        throw InputError("Forward and reverse reads are out of step: " +
                         std::to_string(derep_fwd.total_reads) + " vs " +
                         std::to_string(derep_rev.total_reads));
    }

    MergeResult result;
    result.input_pairs = derep_fwd.total_reads;

    std::map<std::pair<int32_t, int32_t>, uint64_t> support;
    for (uint32_t r = 0; r < derep_fwd.total_reads; ++r) {
        const int32_t f = dada_fwd.asv_for_read(derep_fwd, r);
        const int32_t v = dada_rev.asv_for_read(derep_rev, r);
        if (f < 0 || v < 0) {
            result.uncorrected_pairs++;
            continue;
        }
        support[{f, v}]++;
    }

    for (const auto& [key, count] : support) {
        MergedPair mp;
        mp.forward_asv = key.first;
        mp.reverse_asv = key.second;
        mp.abundance = count;

        const std::string& fseq = dada_fwd.asvs[key.first].sequence;
        const std::string rc = SequenceUtils::reverse_complement(dada_rev.asvs[key.second].sequence);
        if (params.just_concatenate) {
            mp.status = MergeStatus::MERGED;
            mp.sequence = fseq + CONCAT_SPACER + rc;
        } else {
            OverlapResult ov = merge_overlap(fseq, rc, params);
            mp.status = ov.status;
            mp.overlap = ov.overlap;
            mp.mismatches = ov.mismatches;
            mp.sequence = std::move(ov.merged);
        }

        if (mp.status == MergeStatus::MERGED) {
            result.merged_reads += count;
        } else {
            result.rejected_reads += count;
        }
        result.pairs.push_back(std::move(mp));
    }

    std::stable_sort(result.pairs.begin(), result.pairs.end(),
                     [](const MergedPair& a, const MergedPair& b) {
                         return a.abundance > b.abundance;
                     });
    return result;
}

} // namespace asvflow
