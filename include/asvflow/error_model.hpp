#pragma once
// Quality-aware substitution error model.
//
// rate(from, to, q) is the probability that a true base `from` is read as
// `to` at Phred quality q. One model is fitted per read orientation. A model
// is never modified after construction; the learner replaces it wholesale
// each round.

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace asvflow {

constexpr int NUM_TRANSITIONS = 16;  // index = from * 4 + to

inline int transition_index(int from, int to) {
    return from * 4 + to;
}

// "A2C" style label for a transition index
std::string transition_label(int t);

// Substitutions observed between partition centres and their members,
// weighted by read abundance.
struct TransitionCounts {
    std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS> counts{};

    void add(int from, int to, int q, double n) {
        counts[transition_index(from, to)][clamp_qual(q)] += n;
    }

    TransitionCounts& operator+=(const TransitionCounts& other);

    double total() const;
};

// A rate that increases with quality by more than the allowed tolerance
struct MonotonicViolation {
    int transition;
    int qual;          // rate(q + 1) > rate(q)
    double rate_low;   // rate at q
    double rate_high;  // rate at q + 1
};

struct ErrorFitParams {
    double span = 0.75;           // fraction of observed qualities in each local fit
    double min_rate = 1e-7;
    double max_rate = 0.25;
};

class ErrorModel {
public:
    // Same as initial()
    ErrorModel();

    // Every transition at rate 1: no read can be shown to be anything but
    // noise, so the first learning round yields one partition per sample.
    static ErrorModel initial();

    // rates laid out [transition][qual]
    static ErrorModel from_rates(const std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS>& rates);

    double rate(int from, int to, int q) const {
        return rates_[transition_index(from, to)][clamp_qual(q)];
    }

    double log_rate(int from, int to, int q) const {
        return log_rates_[transition_index(from, to)][clamp_qual(q)];
    }

    // Largest absolute rate difference over all cells
    double max_abs_diff(const ErrorModel& other) const;

    // Substitution rates (from != to) that rise with quality.
    // Relative tolerance `tol` absorbs smoothing wiggle.
    std::vector<MonotonicViolation> check_monotonic(double tol = 0.05) const;

    void write_tsv(const std::string& path) const;
    static ErrorModel read_tsv(const std::string& path);

private:
    void refresh_logs();

    std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS> rates_{};
    std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS> log_rates_{};
};

/**
 * Fit an error model to observed transition counts.
 *
 * For each substitution the per-quality rate log10((errors + 1) / total)
 * is smoothed by weighted local linear regression (tricube kernel, weights
 * = total observations), extended flat beyond the observed quality range,
 * and bounded to [min_rate, max_rate]. Self-transitions take the remaining
 * probability mass.
 */
ErrorModel fit_error_model(const TransitionCounts& counts, const ErrorFitParams& params = {});

// Weighted local linear regression evaluated at x0 (exposed for testing)
double local_linear_fit(const std::vector<double>& x,
                        const std::vector<double>& y,
                        const std::vector<double>& w,
                        double x0, double span);

} // namespace asvflow
