// tests/test_denoise.cpp
//
// Divisive partitioning: single-sequence samples, promotion of a real
// variant over noise, uncorrected reads and run-to-run determinism.

#include "asvflow/alignment.hpp"
#include "asvflow/denoise.hpp"
#include "asvflow/dereplicate.hpp"
#include "test_helpers.hpp"

#include <cmath>
#include <iostream>
#include <vector>

using namespace asvflow;
using asvflow_test::expect;
using asvflow_test::make_read;

namespace {

// Every substitution at `sub` for all qualities
ErrorModel flat_model(double sub) {
    std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS> rates{};
    for (int t = 0; t < NUM_TRANSITIONS; ++t) {
        for (int q = 0; q < NUM_QUAL; ++q) {
            rates[t][q] = (t / 4 == t % 4) ? 1.0 - 3.0 * sub : sub;
        }
    }
    return ErrorModel::from_rates(rates);
}

Dereplicated mixture(const std::string& truth, int n_truth,
                     const std::string& variant, int n_variant,
                     int n_singletons) {
    std::vector<SequenceRecord> reads;
    for (int i = 0; i < n_truth; ++i) reads.push_back(make_read("t", truth));
    for (int i = 0; i < n_variant; ++i) reads.push_back(make_read("v", variant));
    for (int i = 0; i < n_singletons; ++i) {
        reads.push_back(make_read("s", asvflow_test::substitute(truth, 70 + i)));
    }
    return dereplicate(reads);
}

int test_single_unique() {
    int failed = 0;
    const std::string seq = asvflow_test::random_sequence(100, 1);
    std::vector<SequenceRecord> reads(30, make_read("r", seq));
    Dereplicated d = dereplicate(reads);

    DenoiseResult r = denoise(d, flat_model(1e-3));
    expect(r.asvs.size() == 1, "one variant", failed);
    if (r.asvs.size() == 1) {
        expect(r.asvs[0].sequence == seq, "variant is the read", failed);
        expect(r.asvs[0].abundance == 30, "abundance equals read count", failed);
    }
    expect(r.denoised_reads == 30 && r.input_reads == 30, "all reads denoised", failed);
    expect(r.asv_for_read(d, 29) == 0, "every read maps to the variant", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": single unique sequence\n";
    return failed;
}

int test_variant_promoted() {
    int failed = 0;
    const std::string truth = asvflow_test::random_sequence(100, 2);
    const std::string variant = asvflow_test::substitute(truth, 40);
    Dereplicated d = mixture(truth, 200, variant, 50, 3);

    DenoiseResult r = denoise(d, flat_model(1e-3));
    expect(r.asvs.size() == 2, "variant promoted to its own partition", failed);
    if (r.asvs.size() == 2) {
        expect(r.asvs[0].sequence == truth && r.asvs[0].abundance == 203,
               "singletons absorbed by the dominant sequence", failed);
        expect(r.asvs[1].sequence == variant && r.asvs[1].abundance == 50, "variant keeps its reads", failed);
        expect(r.asvs[1].birth_log_pval < std::log(1e-40), "variant is significant", failed);
    }
    expect(r.denoised_reads == 253, "no read left uncorrected", failed);

    // Under the all-ones starting model nothing can be distinguished from noise
    DenoiseResult flat = denoise(d, ErrorModel::initial());
    expect(flat.asvs.size() == 1 && flat.asvs[0].abundance == 253, "initial model: one partition", failed);

    // A stricter threshold than the variant's p-value keeps one partition
    DenoiseParams strict;
    strict.omega_a = 1e-300;
    DenoiseResult held = denoise(d, flat_model(1e-3), strict);
    expect(held.asvs.size() == 1, "strict omega_a: no new partition", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": variant promotion\n";
    return failed;
}

int test_transitions_counted() {
    int failed = 0;
    const std::string truth = asvflow_test::random_sequence(60, 3);
    std::vector<SequenceRecord> reads(20, make_read("t", truth));
    std::string mutant = truth;
    mutant[10] = truth[10] == 'C' ? 'T' : 'C';
    reads.push_back(make_read("m", mutant));
    Dereplicated d = dereplicate(reads);

    DenoiseResult r = denoise(d, flat_model(1e-3));
    const int from = nt_index(truth[10]);
    const int to = nt_index(mutant[10]);
    expect(r.transitions.counts[transition_index(from, to)][40] == 1.0,
           "one substitution recorded at Q40", failed);
    expect(std::fabs(r.transitions.total() - 21.0 * 60.0) < 1e-9, "every base counted once", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": transitions counted\n";
    return failed;
}

int test_uncorrected_reads() {
    int failed = 0;
    const std::string truth = asvflow_test::random_sequence(100, 4);
    const std::string variant = asvflow_test::substitute(truth, 20);
    Dereplicated d = mixture(truth, 200, variant, 50, 0);

    // max_clusters 1 keeps the variant inside the truth partition, where
    // its abundance is far beyond omega_c
    DenoiseParams p;
    p.max_clusters = 1;
    DenoiseResult r = denoise(d, flat_model(1e-3), p);
    expect(r.asvs.size() == 1, "partition growth capped", failed);
    expect(r.denoised_reads == 200, "variant left uncorrected", failed);
    bool flagged = false;
    for (uint32_t u = 0; u < d.uniques.size(); ++u) {
        if (d.uniques[u].sequence == variant) flagged = r.unique_to_asv[u] == -1;
    }
    expect(flagged, "uncorrected unique maps to -1", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": uncorrected reads\n";
    return failed;
}

int test_deterministic() {
    int failed = 0;
    const std::string truth = asvflow_test::random_sequence(120, 5);
    std::vector<SequenceRecord> reads;
    for (int i = 0; i < 150; ++i) reads.push_back(make_read("t", truth));
    for (int k = 0; k < 6; ++k) {
        const std::string v = asvflow_test::substitute(truth, 10 + 15 * k);
        for (int i = 0; i < 5 + 7 * k; ++i) reads.push_back(make_read("v", v));
    }
    Dereplicated d = dereplicate(reads);
    const ErrorModel m = flat_model(2e-3);

    DenoiseResult a = denoise(d, m);
    for (int rep = 0; rep < 3; ++rep) {
        DenoiseResult b = denoise(d, m);
        expect(a.unique_to_asv == b.unique_to_asv, "identical assignments", failed);
        expect(a.asvs.size() == b.asvs.size(), "identical variant count", failed);
        for (size_t i = 0; i < a.asvs.size() && i < b.asvs.size(); ++i) {
            expect(a.asvs[i].sequence == b.asvs[i].sequence &&
                   a.asvs[i].abundance == b.asvs[i].abundance, "identical variants", failed);
        }
    }
    for (size_t i = 1; i < a.asvs.size(); ++i) {
        expect(a.asvs[i - 1].abundance >= a.asvs[i].abundance, "variants sorted by abundance", failed);
    }

    std::cout << (failed ? "FAIL" : "PASSED") << ": deterministic partitions\n";
    return failed;
}

int test_alignment_and_kmers() {
    int failed = 0;
    AlignParams p;
    PairwiseAlignment same = align_nw("ACGTACGT", "ACGTACGT", p);
    expect(same.a == "ACGTACGT" && same.b == "ACGTACGT" && same.score == 40, "identical alignment", failed);

    PairwiseAlignment gap = align_nw("ACGTTACGT", "ACGTACGT", p);
    expect(gap.a.size() == gap.b.size(), "aligned strings have equal length", failed);
    expect(gap.b.find('-') != std::string::npos, "deletion shown as a gap", failed);

    const std::string s = asvflow_test::random_sequence(100, 6);
    auto ks = kmer_profile(s);
    expect(kmer_distance(ks, s.size(), ks, s.size()) == 0.0, "self distance 0", failed);
    const std::string other = asvflow_test::random_sequence(100, 99);
    expect(kmer_distance(ks, s.size(), kmer_profile(other), other.size()) > 0.42,
           "unrelated sequences fail the screen", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": alignment and k-mer screen\n";
    return failed;
}

}  // namespace

int main() {
    std::cout << "\n=== Denoising Tests ===\n\n";
    int total = 0;
    total += test_single_unique();
    total += test_variant_promoted();
    total += test_transitions_counted();
    total += test_uncorrected_reads();
    total += test_deterministic();
    total += test_alignment_and_kmers();

    if (total == 0) {
        std::cout << "\nAll denoising tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
