#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct ColumnStats {
    double mean;
    double median;
    double variance;
    double stddev;
};

struct KsResult {
    double statistic = 0.0;
    double pValue = 1.0;
    bool valid = false;
};

namespace Statistics {
ColumnStats calculateStats(const std::vector<double>& col);

/**
 * @brief Two-sample Kolmogorov-Smirnov test; non-finite entries are ignored.
 * @details p-value uses the asymptotic Kolmogorov distribution with the small-sample
 *          correction lambda = (en + 0.12 + 0.11 / en) * D, en = sqrt(n*m / (n+m)).
 * @post valid is false when either sample is empty.
 */
KsResult ksTwoSample(std::vector<double> a, std::vector<double> b);
double kolmogorovQ(double lambda);

// Pearson r over pairwise-complete (finite) rows; nullopt when fewer than two rows or zero variance.
std::optional<double> pearson(const std::vector<double>& x, const std::vector<double>& y);

// Base-2 entropy of a frequency table.
double shannonEntropy(const std::unordered_map<std::string, size_t>& counts);
}
