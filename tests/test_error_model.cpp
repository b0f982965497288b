// tests/test_error_model.cpp
//
// Error-rate fitting, monotonicity checks, model persistence, the Poisson
// abundance test and the self-consistent learner.

#include "asvflow/error_learner.hpp"
#include "asvflow/error_model.hpp"
#include "asvflow/poisson.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <vector>

using namespace asvflow;
using asvflow_test::expect;

namespace {

constexpr int A = 0, C = 1, G = 2, T = 3;

// Counts for A only: rate(A->C) = 10^(-q/10) for q in [10, 40]
TransitionCounts phred_like_counts() {
    TransitionCounts tc;
    for (int q = 10; q <= 40; ++q) {
        const double errs = 10000.0 * std::pow(10.0, -q / 10.0);
        tc.add(A, C, q, errs);
        tc.add(A, A, q, 10000.0);
    }
    return tc;
}

int test_fit_follows_counts() {
    int failed = 0;
    ErrorModel m = fit_error_model(phred_like_counts());

    const double r20 = m.rate(A, C, 20);
    expect(r20 > 0.0067 && r20 < 0.015, "A2C near 1e-2 at Q20", failed);
    expect(m.rate(A, C, 10) > m.rate(A, C, 30), "A2C falls with quality", failed);
    expect(m.rate(A, C, 0) == m.rate(A, C, 10), "flat below observed range", failed);
    expect(m.rate(A, C, 41) == m.rate(A, C, 40), "flat above observed range", failed);
    expect(m.check_monotonic().empty(), "fitted model is monotone", failed);

    for (int q = 0; q < NUM_QUAL; ++q) {
        double sum = 0.0;
        for (int to = 0; to < 4; ++to) sum += m.rate(A, to, q);
        expect(std::fabs(sum - 1.0) < 1e-12, "rates out of A sum to 1", failed);
        expect(m.rate(C, G, q) == 1e-7, "unobserved base gets the minimum rate", failed);
        expect(m.rate(A, G, q) >= 1e-7 && m.rate(A, G, q) <= 0.25, "bounded rate", failed);
    }

    std::cout << (failed ? "FAIL" : "PASSED") << ": fit follows counts\n";
    return failed;
}

int test_local_linear_reproduces_lines() {
    int failed = 0;
    std::vector<double> x, y, w;
    for (int i = 0; i < 20; ++i) {
        x.push_back(i);
        y.push_back(3.0 - 0.5 * i);
        w.push_back(1.0 + i);
    }
    const double v = local_linear_fit(x, y, w, 7.0, 0.75);
    expect(std::fabs(v - (3.0 - 3.5)) < 1e-9, "linear data fitted exactly", failed);
    expect(local_linear_fit({5.0}, {2.0}, {1.0}, 0.0, 0.75) == 2.0, "single point", failed);
    std::cout << (failed ? "FAIL" : "PASSED") << ": local linear fit\n";
    return failed;
}

int test_monotonic_violation_flagged() {
    int failed = 0;
    std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS> rates{};
    for (int t = 0; t < NUM_TRANSITIONS; ++t) {
        for (int q = 0; q < NUM_QUAL; ++q) {
            rates[t][q] = (t / 4 == t % 4) ? 0.997 : 1e-3;
        }
    }
    rates[transition_index(G, T)][21] = 5e-3;  // rises from Q20 to Q21
    ErrorModel m = ErrorModel::from_rates(rates);
    auto v = m.check_monotonic();
    expect(v.size() == 1, "one violation", failed);
    if (v.size() == 1) {
        expect(v[0].transition == transition_index(G, T) && v[0].qual == 20, "G2T at Q20", failed);
        expect(transition_label(v[0].transition) == "G2T", "label", failed);
    }
    std::cout << (failed ? "FAIL" : "PASSED") << ": monotonic violation flagged\n";
    return failed;
}

int test_tsv_persistence() {
    int failed = 0;
    asvflow_test::TempDir tmp("errmodel");
    ErrorModel m = fit_error_model(phred_like_counts());
    const std::string path = tmp.file("errors_F.tsv");
    m.write_tsv(path);
    ErrorModel back = ErrorModel::read_tsv(path);
    expect(back.max_abs_diff(m) < 1e-9, "model survives TSV", failed);

    {
        std::ofstream out(tmp.file("bad.tsv"));
        out << "transition\tQ0\nX2Y\t0.1\n";
    }
    bool threw = false;
    try {
        ErrorModel::read_tsv(tmp.file("bad.tsv"));
    } catch (const InputError&) {
        threw = true;
    }
    expect(threw, "malformed model throws InputError", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": TSV persistence\n";
    return failed;
}

// Direct P(X >= a) for checking the log-space tail
double poisson_tail(uint64_t a, double mu) {
    double cdf = 0.0;
    double term = std::exp(-mu);
    for (uint64_t k = 0; k < a; ++k) {
        cdf += term;
        term *= mu / static_cast<double>(k + 1);
    }
    return 1.0 - cdf;
}

int test_poisson_tail() {
    int failed = 0;
    struct Case { uint64_t a; double mu; };
    const Case cases[] = {{1, 2.0}, {3, 0.5}, {5, 10.0}, {2, 0.01}, {20, 15.0}};
    for (const auto& c : cases) {
        const double expected = std::log(poisson_tail(c.a, c.mu));
        const double got = log_poisson_upper_tail(c.a, std::log(c.mu));
        expect(std::fabs(got - expected) < 1e-8 * std::max(1.0, std::fabs(expected)),
               "tail a=" + std::to_string(c.a) + " mu=" + std::to_string(c.mu), failed);
    }

    // Far below double range: log P(X >= 2) ~ 2 log mu - log 2
    const double log_mu = -800.0;
    const double tiny = log_poisson_upper_tail(2, log_mu);
    expect(std::isfinite(tiny) && std::fabs(tiny - (2 * log_mu - std::log(2.0))) < 1e-6,
           "underflowing mu stays finite in log space", failed);
    expect(log_abundance_pvalue(1, -3.0) == 0.0, "abundance 1 is never significant", failed);
    expect(std::isinf(log_abundance_pvalue(4, -std::numeric_limits<double>::infinity())),
           "mu = 0 gives -inf", failed);
    expect(log_abundance_pvalue(5, std::log(0.1)) < log_abundance_pvalue(2, std::log(0.1)),
           "higher abundance is more significant", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": Poisson tail\n";
    return failed;
}

int test_learner_converges() {
    int failed = 0;
    const std::string truth = asvflow_test::random_sequence(80, 7);
    std::vector<SequenceRecord> reads;
    for (int i = 0; i < 300; ++i) reads.push_back(asvflow_test::make_read("r", truth));
    for (int i = 0; i < 6; ++i) {
        reads.push_back(asvflow_test::make_read("e", asvflow_test::substitute(truth, 10 + 9 * i)));
    }
    std::vector<Dereplicated> samples = {dereplicate(reads), dereplicate(reads)};

    LearnParams params;
    params.max_consist = 10;
    std::vector<LearnIteration> seen;
    LearnResult lr = learn_errors(samples, params, [&](const LearnIteration& it) { seen.push_back(it); });

    expect(lr.converged, "learner converges", failed);
    expect(lr.rounds >= 2 && lr.rounds <= params.max_consist, "bounded rounds", failed);
    expect(seen.size() == lr.history.size() && seen.size() == lr.rounds, "progress each round", failed);
    expect(lr.history.front().partitions == 2, "first round: one partition per sample", failed);
    expect(lr.reads_used == 2 * 306, "all reads used", failed);
    expect(lr.model.rate(A, A, 40) > 0.99, "self transition dominates", failed);

    // Identical input gives an identical model
    LearnResult again = learn_errors(samples, params);
    expect(again.model.max_abs_diff(lr.model) == 0.0, "learning is deterministic", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": learner converges\n";
    return failed;
}

int test_learner_round_cap() {
    int failed = 0;
    const std::string truth = asvflow_test::random_sequence(80, 7);
    std::vector<SequenceRecord> reads;
    for (int i = 0; i < 300; ++i) reads.push_back(asvflow_test::make_read("r", truth));
    for (int i = 0; i < 6; ++i) {
        reads.push_back(asvflow_test::make_read("e", asvflow_test::substitute(truth, 10 + 9 * i)));
    }
    std::vector<Dereplicated> samples = {dereplicate(reads), dereplicate(reads)};

    // The first round always moves away from the initial rates
    LearnParams params;
    params.max_consist = 1;
    LearnResult lr = learn_errors(samples, params);
    expect(!lr.converged, "one round is not enough to converge", failed);
    expect(lr.rounds == 1 && lr.history.size() == 1, "stops at max_consist", failed);
    expect(lr.history.front().max_change > params.tol, "last change above tolerance", failed);
    expect(lr.model.rate(A, A, 40) > 0.99 && lr.model.rate(A, C, 40) < 0.01,
           "last estimate still returned", failed);

    params.max_consist = 10;
    params.tol = 0.0;
    LearnResult strict = learn_errors(samples, params);
    expect(strict.rounds <= params.max_consist, "zero tolerance stays bounded", failed);
    expect(strict.converged == (strict.history.back().max_change == 0.0),
           "converged only on an exact fixed point", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": learner round cap\n";
    return failed;
}

int test_learner_randomized_order() {
    int failed = 0;
    asvflow_test::TempDir tmp("learnorder");
    const std::string seq = asvflow_test::random_sequence(50, 12);
    std::vector<SequenceRecord> reads(40, asvflow_test::make_read("r", seq));
    std::vector<std::string> names;
    std::vector<std::string> paths;
    for (const char* name : {"A", "B", "C", "D", "E", "F"}) {
        names.push_back(name);
        paths.push_back(tmp.file(std::string(name) + "_F_filt.fastq.gz"));
        asvflow_test::write_fastq(paths.back(), reads);
    }

    LearnParams params;
    params.nbases = 1000;  // one sample's worth
    params.max_consist = 1;
    params.randomize = true;
    params.seed = 7;
    LearnResult first = learn_errors_from_files(names, paths, params);
    LearnResult second = learn_errors_from_files(names, paths, params);
    expect(first.samples_used.size() == 1, "one sample fills the budget", failed);
    expect(first.samples_used == second.samples_used, "same seed, same samples", failed);

    bool reordered = false;
    for (uint64_t seed = 0; seed < 20 && !reordered; ++seed) {
        params.seed = seed;
        LearnResult lr = learn_errors_from_files(names, paths, params);
        reordered = !lr.samples_used.empty() && lr.samples_used[0] != "A";
    }
    expect(reordered, "some seed starts away from name order", failed);

    params.nbases = 100000000;
    LearnResult all = learn_errors_from_files(names, paths, params);
    std::vector<std::string> sorted = all.samples_used;
    std::sort(sorted.begin(), sorted.end());
    expect(sorted == names, "every sample visited once", failed);

    params.randomize = false;
    params.nbases = 1000;
    LearnResult plain = learn_errors_from_files(names, paths, params);
    expect(plain.samples_used.size() == 1 && plain.samples_used[0] == "A", "name order without randomize", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": learner randomized order\n";
    return failed;
}

int test_learner_from_files_budget() {
    int failed = 0;
    asvflow_test::TempDir tmp("learnfiles");
    const std::string seq = asvflow_test::random_sequence(50, 11);
    std::vector<SequenceRecord> reads(40, asvflow_test::make_read("r", seq));
    asvflow_test::write_fastq(tmp.file("A_F_filt.fastq.gz"), reads);
    asvflow_test::write_fastq(tmp.file("B_F_filt.fastq.gz"), reads);

    LearnParams params;
    params.nbases = 1000;  // reached by the first sample (2000 bases)
    LearnResult lr = learn_errors_from_files(
        {"A", "B", "missing"},
        {tmp.file("A_F_filt.fastq.gz"), tmp.file("B_F_filt.fastq.gz"), tmp.file("nope.fastq.gz")},
        params);
    expect(lr.samples_used.size() == 1 && lr.samples_used[0] == "A", "stops at the base budget", failed);
    expect(lr.bases_used == 2000, "bases counted", failed);

    params.nbases = 100000000;
    LearnResult all = learn_errors_from_files(
        {"A", "missing"}, {tmp.file("A_F_filt.fastq.gz"), tmp.file("nope.fastq.gz")}, params);
    expect(all.failures.size() == 1 && all.failures[0].sample == "missing", "unreadable sample recorded", failed);
    expect(all.samples_used.size() == 1, "readable sample still used", failed);

    std::cout << (failed ? "FAIL" : "PASSED") << ": learner base budget\n";
    return failed;
}

}  // namespace

int main() {
    std::cout << "\n=== Error Model Tests ===\n\n";
    int total = 0;
    total += test_fit_follows_counts();
    total += test_local_linear_reproduces_lines();
    total += test_monotonic_violation_flagged();
    total += test_tsv_persistence();
    total += test_poisson_tail();
    total += test_learner_converges();
    total += test_learner_round_cap();
    total += test_learner_randomized_order();
    total += test_learner_from_files_budget();

    if (total == 0) {
        std::cout << "\nAll error model tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
