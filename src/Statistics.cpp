#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
double safeLog2(double p) {
    if (p <= 1e-12) return 0.0;
    return std::log(p) / std::log(2.0);
}
} // namespace

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats{0, 0, 0, 0};
    if (col.empty()) return stats;

    std::vector<double> finite;
    finite.reserve(col.size());
    for (double value : col) {
        if (std::isfinite(value)) {
            finite.push_back(value);
        }
    }
    if (finite.empty()) return stats;

    const size_t n = finite.size();

    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : finite) {
        ++count;
        double delta = value - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.mean = mean;
    stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    stats.stddev = std::sqrt(stats.variance);

    std::vector<double> medianWork = finite;
    size_t mid = n / 2;
    std::nth_element(medianWork.begin(), medianWork.begin() + mid, medianWork.end());
    double upper = medianWork[mid];
    if (n % 2 == 0) {
        std::nth_element(medianWork.begin(), medianWork.begin() + (mid - 1), medianWork.begin() + mid);
        stats.median = (medianWork[mid - 1] + upper) / 2.0;
    } else {
        stats.median = upper;
    }

    return stats;
}

double Statistics::kolmogorovQ(double lambda) {
    if (!std::isfinite(lambda) || lambda <= 0.0) return 1.0;
    if (lambda < 0.2) return 1.0;

    double sum = 0.0;
    double sign = 1.0;
    for (int j = 1; j <= 100; ++j) {
        const double term = sign * std::exp(-2.0 * j * j * lambda * lambda);
        sum += term;
        if (std::fabs(term) < 1e-12) break;
        sign = -sign;
    }
    return std::clamp(2.0 * sum, 0.0, 1.0);
}

KsResult Statistics::ksTwoSample(std::vector<double> a, std::vector<double> b) {
    KsResult out;
    a.erase(std::remove_if(a.begin(), a.end(), [](double v) { return !std::isfinite(v); }), a.end());
    b.erase(std::remove_if(b.begin(), b.end(), [](double v) { return !std::isfinite(v); }), b.end());
    if (a.empty() || b.empty()) return out;

    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());

    const double n = static_cast<double>(a.size());
    const double m = static_cast<double>(b.size());
    size_t i = 0;
    size_t j = 0;
    double d = 0.0;
    while (i < a.size() && j < b.size()) {
        const double x = std::min(a[i], b[j]);
        while (i < a.size() && a[i] <= x) ++i;
        while (j < b.size() && b[j] <= x) ++j;
        d = std::max(d, std::fabs(static_cast<double>(i) / n - static_cast<double>(j) / m));
    }

    const double en = std::sqrt(n * m / (n + m));
    out.statistic = d;
    out.pValue = kolmogorovQ((en + 0.12 + 0.11 / en) * d);
    out.valid = true;
    return out;
}

std::optional<double> Statistics::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    double sx = 0.0, sy = 0.0;
    size_t count = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
        sx += x[i];
        sy += y[i];
        ++count;
    }
    if (count < 2) return std::nullopt;

    const double mx = sx / static_cast<double>(count);
    const double my = sy / static_cast<double>(count);
    double sxx = 0.0, syy = 0.0, sxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) continue;
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxx += dx * dx;
        syy += dy * dy;
        sxy += dx * dy;
    }
    if (sxx <= std::numeric_limits<double>::epsilon() || syy <= std::numeric_limits<double>::epsilon()) {
        return std::nullopt;
    }
    return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

double Statistics::shannonEntropy(const std::unordered_map<std::string, size_t>& counts) {
    size_t total = 0;
    for (const auto& kv : counts) total += kv.second;
    if (total == 0) return 0.0;

    double h = 0.0;
    for (const auto& kv : counts) {
        const double p = static_cast<double>(kv.second) / static_cast<double>(total);
        h -= p * safeLog2(p);
    }
    return h;
}
