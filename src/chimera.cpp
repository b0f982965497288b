#include "asvflow/chimera.hpp"
#include "asvflow/types.hpp"
#include <algorithm>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace asvflow {

namespace {

// How far a parent explains the query from each end
struct ParentProfile {
    size_t left = 0;      // query bases matched from the 5' end
    size_t left_oo = 0;   // same, tolerating one discrepancy
    size_t right = 0;
    size_t right_oo = 0;
    size_t diffs = 0;     // discrepancies outside the parent's terminal overhangs
};

ParentProfile profile_parent(const std::string& query, const std::string& parent,
                             const AlignParams& align) {
    const PairwiseAlignment aln = align_nw(parent, query, align);
    const std::string& p = aln.a;
    const std::string& q = aln.b;

    // Parent bases hanging past either end of the query are ignored
    size_t first = 0;
    size_t last = q.size();
    while (first < last && q[first] == '-') ++first;
    while (last > first && q[last - 1] == '-') --last;

    auto agrees = [&](size_t col) {
        return p[col] == q[col] && p[col] != '-' && char_to_nt(q[col]) != Nucleotide::N;
    };

    ParentProfile prof;
    for (size_t col = first; col < last; ++col) {
        if (!agrees(col)) prof.diffs++;
    }

    auto scan = [&](bool forward, size_t& exact, size_t& one_off) {
        size_t covered = 0;
        bool missed = false;
        bool second = false;
        for (size_t k = 0; k < last - first; ++k) {
            const size_t col = forward ? first + k : last - 1 - k;
            if (!agrees(col)) {
                if (missed) {
                    one_off = covered;
                    second = true;
                    break;
                }
                exact = covered;
                missed = true;
            }
            if (q[col] != '-') covered++;
        }
        if (!missed) exact = covered;
        if (!second) one_off = covered;
    };
    scan(true, prof.left, prof.left_oo);
    scan(false, prof.right, prof.right_oo);
    return prof;
}

BimeraModel evaluate_profiles(size_t qlen,
                              const std::vector<ParentProfile>& profiles,
                              const std::vector<int32_t>& ids,
                              const ChimeraParams& params) {
    BimeraModel model;
    const size_t n = ids.size();
    for (size_t a = 0; a < n; ++a) {
        const ParentProfile& A = profiles[ids[a]];
        for (size_t b = 0; b < n; ++b) {
            if (a == b) continue;
            const ParentProfile& B = profiles[ids[b]];
            bool hit = A.left + B.right >= qlen;
            size_t bp = A.left;
            if (!hit && params.allow_one_off &&
                A.diffs >= params.min_one_off_parent_distance &&
                B.diffs >= params.min_one_off_parent_distance) {
                if (A.left_oo + B.right >= qlen) {
                    hit = true;
                    bp = A.left_oo;
                } else if (A.left + B.right_oo >= qlen) {
                    hit = true;
                }
            }
            if (hit) {
                model.is_bimera = true;
                model.left_parent = ids[a];
                model.right_parent = ids[b];
                model.breakpoint = std::min(bp, qlen);
                return model;
            }
        }
    }
    return model;
}

} // namespace

const char* chimera_method_name(ChimeraMethod m) {
    return m == ChimeraMethod::POOLED ? "pooled" : "consensus";
}

ChimeraMethod parse_chimera_method(const std::string& name) {
    if (name == "consensus") return ChimeraMethod::CONSENSUS;
    if (name == "pooled") return ChimeraMethod::POOLED;
    throw std::invalid_argument("Unknown chimera method '" + name + "' (use consensus or pooled)");
}

BimeraModel find_bimera(const std::string& query,
                        const std::vector<const std::string*>& parents,
                        const ChimeraParams& params) {
    std::vector<ParentProfile> profiles;
    std::vector<int32_t> ids;
    profiles.reserve(parents.size());
    for (size_t i = 0; i < parents.size(); ++i) {
        profiles.push_back(profile_parent(query, *parents[i], params.align));
        ids.push_back(static_cast<int32_t>(i));
    }
    return evaluate_profiles(query.size(), profiles, ids, params);
}

ChimeraResult remove_bimeras(const FeatureTable& table, const ChimeraParams& params) {
    const size_t n_cols = table.num_sequences();
    const size_t n_rows = table.num_samples();

    std::vector<uint64_t> totals(n_cols);
    for (size_t c = 0; c < n_cols; ++c) totals[c] = table.column_total(c);

    // Abundance rows examined for each column: real samples, or one pooled row
    std::vector<std::vector<uint64_t>> rows;
    if (params.method == ChimeraMethod::POOLED) {
        rows.push_back(totals);
    } else {
        rows.assign(n_rows, std::vector<uint64_t>(n_cols, 0));
        for (size_t r = 0; r < n_rows; ++r) {
            for (size_t c = 0; c < n_cols; ++c) rows[r][c] = table.at(r, c);
        }
    }

    ChimeraResult result;
    result.is_chimera.assign(n_cols, false);
    result.samples_present.assign(n_cols, 0);
    result.samples_flagged.assign(n_cols, 0);

    // Byte flags: threads write neighbouring columns concurrently
    std::vector<uint8_t> chimeric(n_cols, 0);
    const int64_t n = static_cast<int64_t>(n_cols);
    #pragma omp parallel for schedule(dynamic, 1)
    for (int64_t ci = 0; ci < n; ++ci) {
        const size_t c = static_cast<size_t>(ci);
        const std::string& query = table.sequences()[c];

        // Columns more abundant overall than the query; profiled lazily
        std::vector<size_t> candidates;
        for (size_t p = 0; p < n_cols; ++p) {
            if (p != c && totals[p] > totals[c]) candidates.push_back(p);
        }
        std::vector<ParentProfile> profiles(candidates.size());
        std::vector<bool> profiled(candidates.size(), false);

        uint32_t present = 0;
        uint32_t flagged = 0;
        for (const auto& row : rows) {
            const uint64_t a = row[c];
            if (a == 0) continue;
            present++;

            std::vector<int32_t> ids;
            for (size_t k = 0; k < candidates.size(); ++k) {
                const uint64_t pa = row[candidates[k]];
                if (pa >= params.min_parent_abundance &&
                    static_cast<double>(pa) > params.min_fold_parent * static_cast<double>(a)) {
                    if (!profiled[k]) {
                        profiles[k] = profile_parent(query, table.sequences()[candidates[k]], params.align);
                        profiled[k] = true;
                    }
                    ids.push_back(static_cast<int32_t>(k));
                }
            }
            if (ids.size() < 2) continue;
            if (evaluate_profiles(query.size(), profiles, ids, params).is_bimera) {
                flagged++;
            }
        }

        result.samples_present[c] = present;
        result.samples_flagged[c] = flagged;
        const double needed = std::max(0.0, static_cast<double>(present) -
                                                static_cast<double>(params.ignore_n_negatives)) *
                              params.min_sample_fraction;
        chimeric[c] = flagged > 0 &&
                      (flagged >= present || static_cast<double>(flagged) >= needed);
    }

    for (size_t c = 0; c < n_cols; ++c) result.is_chimera[c] = chimeric[c] != 0;

    result.removed = static_cast<size_t>(
        std::count(result.is_chimera.begin(), result.is_chimera.end(), true));
    result.table = table.drop_columns(result.is_chimera);

    const uint64_t before = table.total();
    result.retained_fraction = before > 0
        ? static_cast<double>(result.table.total()) / static_cast<double>(before)
        : 1.0;
    return result;
}

} // namespace asvflow
