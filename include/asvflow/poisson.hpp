#pragma once
// Log-space Poisson tail probabilities for the abundance test.
//
// P(X >= a) for X ~ Poisson(mu) equals the regularized lower incomplete
// gamma function P(a, mu). Expected counts routinely underflow double
// precision (mu ~ 1e-300 and below), so everything is carried as logs and
// mu is supplied as log(mu).

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace asvflow {

// log P(X >= a), X ~ Poisson(exp(log_mu))
inline double log_poisson_upper_tail(uint64_t a, double log_mu) {
    if (a == 0) return 0.0;
    if (std::isinf(log_mu) && log_mu < 0) {
        return -std::numeric_limits<double>::infinity();
    }

    const double ad = static_cast<double>(a);
    const double mu = std::exp(log_mu);
    constexpr double EPS = 1e-15;
    constexpr int MAX_TERMS = 100000;

    if (mu < ad + 1.0) {
        // Series: P(a, mu) = mu^a e^-mu / Gamma(a+1) * sum_n mu^n / ((a+1)...(a+n))
        double term = 1.0;
        double sum = 1.0;
        for (int n = 1; n < MAX_TERMS; ++n) {
            term *= mu / (ad + n);
            sum += term;
            if (term < sum * EPS) break;
        }
        return ad * log_mu - mu - std::lgamma(ad + 1.0) + std::log(sum);
    }

    // Continued fraction for Q(a, mu) (modified Lentz), then P = 1 - Q
    constexpr double FPMIN = std::numeric_limits<double>::min() / EPS;
    double b = mu + 1.0 - ad;
    double c = 1.0 / FPMIN;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i < MAX_TERMS; ++i) {
        const double an = -i * (i - ad);
        b += 2.0;
        d = an * d + b;
        if (std::fabs(d) < FPMIN) d = FPMIN;
        c = b + an / c;
        if (std::fabs(c) < FPMIN) c = FPMIN;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;
        if (std::fabs(del - 1.0) < EPS) break;
    }
    const double q = std::exp(-mu + ad * log_mu - std::lgamma(ad)) * h;
    return std::log1p(-std::min(q, 1.0));
}

// log P(X >= 1), X ~ Poisson(exp(log_mu))
inline double log_poisson_nonzero(double log_mu) {
    if (std::isinf(log_mu) && log_mu < 0) {
        return -std::numeric_limits<double>::infinity();
    }
    const double mu = std::exp(log_mu);
    if (mu == 0.0) return log_mu;  // 1 - e^-mu ~ mu
    return std::log(-std::expm1(-mu));
}

/**
 * Abundance p-value: log P(X >= a | X >= 1).
 *
 * Conditioning on X >= 1 reflects that only sequences observed at least
 * once are ever tested. Returns -inf when mu == 0 (the sequence cannot be
 * produced by the error model at all).
 */
inline double log_abundance_pvalue(uint64_t a, double log_mu) {
    if (a <= 1) return 0.0;
    const double num = log_poisson_upper_tail(a, log_mu);
    const double den = log_poisson_nonzero(log_mu);
    if (std::isinf(num) && num < 0) return num;
    return std::min(0.0, num - den);
}

} // namespace asvflow
