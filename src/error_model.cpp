#include "asvflow/error_model.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>

namespace asvflow {

static const char NT_CHARS[4] = {'A', 'C', 'G', 'T'};

std::string transition_label(int t) {
    std::string s;
    s += NT_CHARS[t / 4];
    s += '2';
    s += NT_CHARS[t % 4];
    return s;
}

TransitionCounts& TransitionCounts::operator+=(const TransitionCounts& other) {
    for (int t = 0; t < NUM_TRANSITIONS; ++t) {
        for (int q = 0; q < NUM_QUAL; ++q) {
            counts[t][q] += other.counts[t][q];
        }
    }
    return *this;
}

double TransitionCounts::total() const {
    double sum = 0.0;
    for (const auto& row : counts) {
        for (double c : row) sum += c;
    }
    return sum;
}

ErrorModel::ErrorModel() {
    for (auto& row : rates_) row.fill(1.0);
    refresh_logs();
}

ErrorModel ErrorModel::initial() {
    return ErrorModel();
}

ErrorModel ErrorModel::from_rates(
    const std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS>& rates) {
    ErrorModel m;
    m.rates_ = rates;
    m.refresh_logs();
    return m;
}

void ErrorModel::refresh_logs() {
    for (int t = 0; t < NUM_TRANSITIONS; ++t) {
        for (int q = 0; q < NUM_QUAL; ++q) {
            const double r = rates_[t][q];
            log_rates_[t][q] = r > 0.0 ? std::log(r)
                                       : -std::numeric_limits<double>::infinity();
        }
    }
}

double ErrorModel::max_abs_diff(const ErrorModel& other) const {
    double diff = 0.0;
    for (int t = 0; t < NUM_TRANSITIONS; ++t) {
        for (int q = 0; q < NUM_QUAL; ++q) {
            diff = std::max(diff, std::fabs(rates_[t][q] - other.rates_[t][q]));
        }
    }
    return diff;
}

std::vector<MonotonicViolation> ErrorModel::check_monotonic(double tol) const {
    std::vector<MonotonicViolation> out;
    for (int t = 0; t < NUM_TRANSITIONS; ++t) {
        if (t / 4 == t % 4) continue;  // self-transitions rise with quality
        for (int q = 0; q + 1 < NUM_QUAL; ++q) {
            const double lo = rates_[t][q];
            const double hi = rates_[t][q + 1];
            if (hi > lo * (1.0 + tol)) {
                out.push_back({t, q, lo, hi});
            }
        }
    }
    return out;
}

void ErrorModel::write_tsv(const std::string& path) const {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot open error model output: " + path);
    }
    out << "transition";
    for (int q = 0; q < NUM_QUAL; ++q) out << "\tQ" << q;
    out << "\n";
    out << std::setprecision(10);
    for (int t = 0; t < NUM_TRANSITIONS; ++t) {
        out << transition_label(t);
        for (int q = 0; q < NUM_QUAL; ++q) out << "\t" << rates_[t][q];
        out << "\n";
    }
    if (!out) {
        throw std::runtime_error("Failed writing error model: " + path);
    }
}

ErrorModel ErrorModel::read_tsv(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw InputError("Cannot open error model: " + path);
    }
    std::string line;
    if (!std::getline(in, line)) {
        throw InputError("Empty error model file: " + path);
    }

    std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS> rates{};
    std::array<bool, NUM_TRANSITIONS> seen{};
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        std::istringstream ss(line);
        std::string label;
        std::getline(ss, label, '\t');
        int t = -1;
        for (int i = 0; i < NUM_TRANSITIONS; ++i) {
            if (transition_label(i) == label) t = i;
        }
        if (t < 0) {
            throw InputError("Unknown transition '" + label + "' in " + path);
        }
        for (int q = 0; q < NUM_QUAL; ++q) {
            std::string field;
            if (!std::getline(ss, field, '\t')) {
                throw InputError("Too few columns for " + label + " in " + path);
            }
            try {
                rates[t][q] = std::stod(field);
            } catch (const std::exception&) {
                throw InputError("Invalid rate '" + field + "' in " + path);
            }
        }
        seen[t] = true;
    }
    for (int t = 0; t < NUM_TRANSITIONS; ++t) {
        if (!seen[t]) {
            throw InputError("Missing transition " + transition_label(t) + " in " + path);
        }
    }
    return from_rates(rates);
}

double local_linear_fit(const std::vector<double>& x,
                        const std::vector<double>& y,
                        const std::vector<double>& w,
                        double x0, double span) {
    const size_t n = x.size();
    if (n == 0) return 0.0;
    if (n == 1) return y[0];

    std::vector<double> dist(n);
    for (size_t i = 0; i < n; ++i) dist[i] = std::fabs(x[i] - x0);

    size_t k = static_cast<size_t>(std::ceil(span * static_cast<double>(n)));
    k = std::clamp<size_t>(k, 2, n);
    std::vector<double> sorted = dist;
    std::nth_element(sorted.begin(), sorted.begin() + (k - 1), sorted.end());
    double h = sorted[k - 1];
    if (h <= 0.0) h = 1.0;
    h *= 1.0001;

    double sw = 0.0, swx = 0.0, swy = 0.0, swxx = 0.0, swxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double u = dist[i] / h;
        if (u >= 1.0) continue;
        const double tri = std::pow(1.0 - u * u * u, 3);
        const double wi = w[i] * tri;
        sw += wi;
        swx += wi * x[i];
        swy += wi * y[i];
        swxx += wi * x[i] * x[i];
        swxy += wi * x[i] * y[i];
    }
    if (sw <= 0.0) {
        // All kernel weight vanished; fall back to the nearest point
        size_t best = static_cast<size_t>(
            std::min_element(dist.begin(), dist.end()) - dist.begin());
        return y[best];
    }

    const double denom = sw * swxx - swx * swx;
    if (std::fabs(denom) < 1e-12 * sw * sw) {
        return swy / sw;
    }
    const double slope = (sw * swxy - swx * swy) / denom;
    const double intercept = (swy - slope * swx) / sw;
    return intercept + slope * x0;
}

ErrorModel fit_error_model(const TransitionCounts& counts, const ErrorFitParams& params) {
    std::array<std::array<double, NUM_QUAL>, NUM_TRANSITIONS> rates{};

    for (int from = 0; from < 4; ++from) {
        std::array<double, NUM_QUAL> tot{};
        for (int to = 0; to < 4; ++to) {
            for (int q = 0; q < NUM_QUAL; ++q) {
                tot[q] += counts.counts[transition_index(from, to)][q];
            }
        }

        std::vector<int> observed;
        for (int q = 0; q < NUM_QUAL; ++q) {
            if (tot[q] > 0.0) observed.push_back(q);
        }

        std::array<double, NUM_QUAL> sub_sum{};
        for (int to = 0; to < 4; ++to) {
            if (to == from) continue;
            auto& row = rates[transition_index(from, to)];

            if (observed.empty()) {
                row.fill(params.min_rate);
            } else {
                std::vector<double> xs, ys, ws;
                for (int q : observed) {
                    const double err = counts.counts[transition_index(from, to)][q];
                    xs.push_back(q);
                    ys.push_back(std::log10((err + 1.0) / tot[q]));
                    ws.push_back(tot[q]);
                }
                const int qmin = observed.front();
                const int qmax = observed.back();
                for (int q = 0; q < NUM_QUAL; ++q) {
                    const int qe = std::clamp(q, qmin, qmax);
                    const double pred = local_linear_fit(xs, ys, ws, qe, params.span);
                    row[q] = std::clamp(std::pow(10.0, pred), params.min_rate, params.max_rate);
                }
            }
            for (int q = 0; q < NUM_QUAL; ++q) sub_sum[q] += row[q];
        }

        auto& self = rates[transition_index(from, from)];
        for (int q = 0; q < NUM_QUAL; ++q) {
            self[q] = 1.0 - sub_sum[q];
        }
    }

    return ErrorModel::from_rates(rates);
}

} // namespace asvflow
