#include "asvflow/alignment.hpp"
#include "asvflow/types.hpp"
#include <algorithm>
#include <climits>

namespace asvflow {

namespace {

constexpr int NEG_INF = INT_MIN / 4;

enum : uint8_t { TB_NONE = 0, TB_DIAG = 1, TB_UP = 2, TB_LEFT = 3 };

} // namespace

PairwiseAlignment align_nw(const std::string& s1, const std::string& s2, const AlignParams& params) {
    const int n1 = static_cast<int>(s1.size());
    const int n2 = static_cast<int>(s2.size());
    const int cols = n2 + 1;

    // Allowed diagonal offsets j - i
    const int diff = n2 - n1;
    const bool banded = params.band >= 0;
    const int lo = std::min(0, diff) - params.band;
    const int hi = std::max(0, diff) + params.band;
    auto in_band = [&](int i, int j) {
        return !banded || (j - i >= lo && j - i <= hi);
    };

    std::vector<int> score(static_cast<size_t>(n1 + 1) * cols, NEG_INF);
    std::vector<uint8_t> trace(static_cast<size_t>(n1 + 1) * cols, TB_NONE);
    auto at = [cols](int i, int j) { return static_cast<size_t>(i) * cols + j; };

    score[at(0, 0)] = 0;
    for (int i = 1; i <= n1 && in_band(i, 0); ++i) {
        score[at(i, 0)] = params.ends_free ? 0 : i * params.gap;
        trace[at(i, 0)] = TB_UP;
    }
    for (int j = 1; j <= n2 && in_band(0, j); ++j) {
        score[at(0, j)] = params.ends_free ? 0 : j * params.gap;
        trace[at(0, j)] = TB_LEFT;
    }

    for (int i = 1; i <= n1; ++i) {
        const int j_start = banded ? std::max(1, i + lo) : 1;
        const int j_end = banded ? std::min(n2, i + hi) : n2;
        for (int j = j_start; j <= j_end; ++j) {
            int best = NEG_INF;
            uint8_t dir = TB_NONE;

            const int d = score[at(i - 1, j - 1)];
            if (d > NEG_INF) {
                const bool same = s1[i - 1] == s2[j - 1] && char_to_nt(s1[i - 1]) != Nucleotide::N;
                best = d + (same ? params.match : params.mismatch);
                dir = TB_DIAG;
            }
            const int u = score[at(i - 1, j)];
            if (u > NEG_INF) {
                const int cost = (params.ends_free && j == n2) ? 0 : params.gap;
                if (u + cost > best) {
                    best = u + cost;
                    dir = TB_UP;
                }
            }
            const int l = score[at(i, j - 1)];
            if (l > NEG_INF) {
                const int cost = (params.ends_free && i == n1) ? 0 : params.gap;
                if (l + cost > best) {
                    best = l + cost;
                    dir = TB_LEFT;
                }
            }
            score[at(i, j)] = best;
            trace[at(i, j)] = dir;
        }
    }

    PairwiseAlignment aln;
    aln.score = score[at(n1, n2)];
    aln.a.reserve(n1 + n2);
    aln.b.reserve(n1 + n2);

    int i = n1;
    int j = n2;
    while (i > 0 || j > 0) {
        const uint8_t dir = trace[at(i, j)];
        if (dir == TB_DIAG) {
            aln.a.push_back(s1[--i]);
            aln.b.push_back(s2[--j]);
        } else if (dir == TB_UP) {
            aln.a.push_back(s1[--i]);
            aln.b.push_back('-');
        } else if (dir == TB_LEFT) {
            aln.a.push_back('-');
            aln.b.push_back(s2[--j]);
        } else {
            // Unreachable with a band widened by the length difference
            break;
        }
    }
    std::reverse(aln.a.begin(), aln.a.end());
    std::reverse(aln.b.begin(), aln.b.end());
    return aln;
}

std::vector<uint16_t> kmer_profile(const std::string& seq) {
    constexpr size_t N_KMERS = size_t(1) << (2 * KMER_SIZE);
    std::vector<uint16_t> counts(N_KMERS, 0);
    if (seq.size() < static_cast<size_t>(KMER_SIZE)) return counts;

    const uint32_t mask = static_cast<uint32_t>(N_KMERS - 1);
    uint32_t kmer = 0;
    int valid = 0;
    for (char c : seq) {
        const int nt = nt_index(c);
        if (nt > 3) {
            valid = 0;
            kmer = 0;
            continue;
        }
        kmer = ((kmer << 2) | static_cast<uint32_t>(nt)) & mask;
        if (++valid >= KMER_SIZE && counts[kmer] < UINT16_MAX) {
            counts[kmer]++;
        }
    }
    return counts;
}

double kmer_distance(const std::vector<uint16_t>& a, size_t len_a,
                     const std::vector<uint16_t>& b, size_t len_b) {
    const size_t min_len = std::min(len_a, len_b);
    if (min_len < static_cast<size_t>(KMER_SIZE)) return 1.0;
    uint64_t shared = 0;
    for (size_t k = 0; k < a.size() && k < b.size(); ++k) {
        shared += std::min(a[k], b[k]);
    }
    const double denom = static_cast<double>(min_len - KMER_SIZE + 1);
    return 1.0 - static_cast<double>(shared) / denom;
}

} // namespace asvflow
