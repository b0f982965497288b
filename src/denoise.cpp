#include "asvflow/denoise.hpp"
#include "asvflow/poisson.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace asvflow {

namespace {

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

inline int rounded_qual(double q) {
    return clamp_qual(static_cast<int>(std::lround(q)));
}

} // namespace

double compute_log_lambda(const PairwiseAlignment& aln,
                          const std::vector<double>& read_qual,
                          const ErrorModel& model) {
    double log_lambda = 0.0;
    size_t rpos = 0;
    for (size_t col = 0; col < aln.a.size(); ++col) {
        const char c = aln.a[col];
        const char r = aln.b[col];
        if (r == '-') continue;
        if (c != '-') {
            const int from = nt_index(c);
            const int to = nt_index(r);
            if (from < 4 && to < 4 && rpos < read_qual.size()) {
                log_lambda += model.log_rate(from, to, rounded_qual(read_qual[rpos]));
                if (std::isinf(log_lambda)) return log_lambda;
            }
        }
        ++rpos;
    }
    return log_lambda;
}

Denoiser::Denoiser(const Dereplicated& derep, const ErrorModel& model, const DenoiseParams& params)
    : derep_(derep), model_(model), params_(params) {}

void Denoiser::refresh_cluster_reads() {
    cluster_reads_.assign(centers_.size(), 0);
    for (size_t u = 0; u < assignment_.size(); ++u) {
        cluster_reads_[assignment_[u]] += derep_.uniques[u].abundance;
    }
}

void Denoiser::add_center(uint32_t unique_idx) {
    const int32_t cluster = static_cast<int32_t>(centers_.size());
    centers_.push_back(unique_idx);
    is_center_[unique_idx] = true;
    assignment_[unique_idx] = cluster;

    const auto& uniques = derep_.uniques;
    const DerepUnique& center = uniques[unique_idx];
    const int64_t n = static_cast<int64_t>(uniques.size());
    std::vector<Comparison> row(uniques.size());

    #pragma omp parallel for schedule(dynamic, 16)
    for (int64_t v = 0; v < n; ++v) {
        const DerepUnique& other = uniques[v];
        Comparison comp{0.0, true};
        if (static_cast<uint32_t>(v) != unique_idx) {
            if (params_.kdist_cutoff >= 0.0 &&
                kmer_distance(kmers_[unique_idx], center.sequence.size(),
                              kmers_[v], other.sequence.size()) > params_.kdist_cutoff) {
                comp = {NEG_INF, false};
            } else {
                PairwiseAlignment aln = align_nw(center.sequence, other.sequence, params_.align);
                comp.log_lambda = compute_log_lambda(aln, other.mean_qual, model_);
            }
        }
        row[v] = comp;
    }
    comps_.push_back(std::move(row));
    refresh_cluster_reads();
}

bool Denoiser::reassign() {
    bool changed = false;
    const std::vector<uint64_t> reads = cluster_reads_;  // snapshot for this pass

    for (size_t u = 0; u < assignment_.size(); ++u) {
        if (is_center_[u]) continue;
        const int32_t current = assignment_[u];
        int32_t best = current;
        double best_e = NEG_INF;
        const Comparison& cur = comps_[current][u];
        if (cur.comparable && reads[current] > 0) {
            best_e = cur.log_lambda + std::log(static_cast<double>(reads[current]));
        }
        for (size_t c = 0; c < centers_.size(); ++c) {
            const Comparison& comp = comps_[c][u];
            if (!comp.comparable || reads[c] == 0) continue;
            const double e = comp.log_lambda + std::log(static_cast<double>(reads[c]));
            if (e > best_e) {
                best_e = e;
                best = static_cast<int32_t>(c);
            }
        }
        if (best != current) {
            assignment_[u] = best;
            changed = true;
        }
    }
    return changed;
}

double Denoiser::log_pvalue(uint32_t unique_idx) const {
    const int32_t c = assignment_[unique_idx];
    const Comparison& comp = comps_[c][unique_idx];
    if (!comp.comparable || cluster_reads_[c] == 0) return NEG_INF;
    const double log_mu = comp.log_lambda + std::log(static_cast<double>(cluster_reads_[c]));
    const uint64_t a = derep_.uniques[unique_idx].abundance;
    if (a == 1 && params_.detect_singletons) {
        return log_poisson_nonzero(log_mu);
    }
    return log_abundance_pvalue(a, log_mu);
}

DenoiseResult Denoiser::run() {
    const auto& uniques = derep_.uniques;
    const size_t n = uniques.size();
    if (n == 0) {
        DenoiseResult empty;
        return empty;
    }

    kmers_.clear();
    if (params_.kdist_cutoff >= 0.0) {
        kmers_.reserve(n);
        for (const auto& u : uniques) kmers_.push_back(kmer_profile(u.sequence));
    }

    centers_.clear();
    birth_pvals_.clear();
    comps_.clear();
    assignment_.assign(n, 0);
    is_center_.assign(n, false);
    rounds_ = 0;

    add_center(0);
    birth_pvals_.push_back(0.0);

    const double log_threshold = std::log(params_.omega_a) - std::log(static_cast<double>(n));

    while (true) {
        rounds_++;
        for (uint32_t s = 0; s < params_.max_shuffle; ++s) {
            const bool changed = reassign();
            refresh_cluster_reads();
            if (!changed) break;
        }

        if (params_.max_clusters > 0 && centers_.size() >= params_.max_clusters) break;

        // Most significant candidate; ties go to the higher abundance, then
        // to the earlier unique (uniques are sorted by abundance).
        int64_t best = -1;
        double best_lp = 0.0;
        for (uint32_t u = 0; u < n; ++u) {
            if (is_center_[u]) continue;
            if (uniques[u].abundance < 2 && !params_.detect_singletons) continue;
            const double lp = log_pvalue(u);
            if (best < 0 || lp < best_lp ||
                (lp == best_lp && uniques[u].abundance > uniques[best].abundance)) {
                best = u;
                best_lp = lp;
            }
        }

        if (best < 0 || !(best_lp < log_threshold)) break;

        add_center(static_cast<uint32_t>(best));
        birth_pvals_.push_back(best_lp);
    }

    return collect();
}

DenoiseResult Denoiser::collect() const {
    const auto& uniques = derep_.uniques;
    const size_t n_clusters = centers_.size();
    const double log_omega_c = params_.omega_c > 0.0 ? std::log(params_.omega_c) : NEG_INF;

    DenoiseResult result;
    result.input_reads = derep_.total_reads;
    result.rounds = rounds_;

    std::vector<Asv> by_cluster(n_clusters);
    std::vector<bool> corrected(uniques.size(), false);
    for (size_t c = 0; c < n_clusters; ++c) {
        by_cluster[c].sequence = uniques[centers_[c]].sequence;
        by_cluster[c].center_unique = centers_[c];
        by_cluster[c].birth_log_pval = birth_pvals_[c];
    }

    for (uint32_t u = 0; u < uniques.size(); ++u) {
        Asv& asv = by_cluster[assignment_[u]];
        asv.n_uniques++;
        corrected[u] = is_center_[u] || !(log_pvalue(u) < log_omega_c);
        if (corrected[u]) {
            asv.abundance += uniques[u].abundance;
        }
    }

    // Substitution counts between each centre and its corrected members
    for (uint32_t u = 0; u < uniques.size(); ++u) {
        if (!corrected[u]) continue;
        const DerepUnique& read = uniques[u];
        const DerepUnique& center = uniques[centers_[assignment_[u]]];
        const double weight = static_cast<double>(read.abundance);
        if (is_center_[u]) {
            for (size_t i = 0; i < read.sequence.size(); ++i) {
                const int nt = nt_index(read.sequence[i]);
                if (nt < 4) result.transitions.add(nt, nt, rounded_qual(read.mean_qual[i]), weight);
            }
            continue;
        }
        PairwiseAlignment aln = align_nw(center.sequence, read.sequence, params_.align);
        size_t rpos = 0;
        for (size_t col = 0; col < aln.a.size(); ++col) {
            if (aln.b[col] == '-') continue;
            if (aln.a[col] != '-') {
                const int from = nt_index(aln.a[col]);
                const int to = nt_index(aln.b[col]);
                if (from < 4 && to < 4) {
                    result.transitions.add(from, to, rounded_qual(read.mean_qual[rpos]), weight);
                }
            }
            ++rpos;
        }
    }

    std::vector<uint32_t> order(n_clusters);
    std::iota(order.begin(), order.end(), 0u);
    std::stable_sort(order.begin(), order.end(), [&](uint32_t a, uint32_t b) {
        return by_cluster[a].abundance > by_cluster[b].abundance;
    });
    std::vector<int32_t> rank(n_clusters);
    for (uint32_t r = 0; r < n_clusters; ++r) {
        rank[order[r]] = static_cast<int32_t>(r);
        result.denoised_reads += by_cluster[order[r]].abundance;
        result.asvs.push_back(std::move(by_cluster[order[r]]));
    }

    result.unique_to_asv.resize(uniques.size());
    for (uint32_t u = 0; u < uniques.size(); ++u) {
        result.unique_to_asv[u] = corrected[u] ? rank[assignment_[u]] : -1;
    }
    return result;
}

DenoiseResult denoise(const Dereplicated& derep, const ErrorModel& model,
                      const DenoiseParams& params) {
    Denoiser d(derep, model, params);
    return d.run();
}

} // namespace asvflow
