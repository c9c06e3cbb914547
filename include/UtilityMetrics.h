#pragma once

#include "RuleModel.h"
#include "StrategyEngine.h"
#include "TabularDataset.h"

#include <string>
#include <vector>

enum class MetricStatus { COMPUTED, NOT_APPLICABLE, ERROR };

/**
 * Three-state metric outcome. `score` (0-100) is meaningful only when status is COMPUTED;
 * aggregation never reads it otherwise.
 */
struct MetricResult {
    MetricStatus status = MetricStatus::NOT_APPLICABLE;
    double score = 0.0;
    std::string reason;

    bool computed() const noexcept { return status == MetricStatus::COMPUTED; }

    static MetricResult ofScore(double score);
    static MetricResult notApplicable(std::string reason);
    static MetricResult error(std::string reason);
};

struct DistributionMetrics {
    MetricResult result;
    double ksStatistic = 0.0;
    double ksPValue = 1.0;
    double meanAbsDifference = 0.0;
    double medianAbsDifference = 0.0;
    double stdRatio = 1.0;
    size_t samples = 0;
};

struct InformationLossMetrics {
    MetricResult result;
    size_t rawDistinct = 0;
    size_t anonymizedDistinct = 0;
    double uniqueRetained = 0.0;  // [0, 1]
    double rawEntropy = 0.0;
    double anonymizedEntropy = 0.0;
    double entropyRetained = 0.0; // [0, 1]
};

struct ColumnUtilityMetrics {
    std::string column;
    std::string strategy = "none";
    DistributionMetrics distribution;
    InformationLossMetrics informationLoss;

    // Row aligned numeric views used for correlation; NaN where a row does not take part.
    std::vector<double> rawNumeric;
    std::vector<double> anonymizedNumeric;
};

struct CorrelationMetrics {
    MetricResult result;
    std::vector<std::string> columns;
    std::vector<std::vector<double>> rawMatrix;
    std::vector<std::vector<double>> anonymizedMatrix;
    double similarity = 0.0; // 1 - mean |r_raw - r_anon| over the upper triangle
    double meanAbsDifference = 0.0;
    double maxAbsDifference = 0.0;
    size_t pairs = 0;
};

struct UtilityWeights {
    double distribution = 0.4;
    double correlation = 0.3;
    double informationLoss = 0.3;
};

struct UtilityReport {
    std::vector<ColumnUtilityMetrics> columns;
    MetricResult distribution;
    CorrelationMetrics correlation;
    MetricResult informationLoss;

    MetricResult overall;
    std::string band;
    bool reducedConfidence = false;
    std::vector<std::string> notes;
    std::vector<std::string> recommendations;
    std::vector<RunError> errors;
};

class UtilityMetrics {
public:
    /**
     * @brief Per-column distribution and information-loss metrics.
     * @details Numeric metrics apply to generalized (or untouched) numeric, date and location columns whose
     *          raw values all coerce to numbers; anonymized values are decoded with RangeCodec first.
     *          Hash, redact and pseudonymize columns are NOT_APPLICABLE. A RangeDecodeError downgrades the
     *          distribution metric to NOT_APPLICABLE and is appended to `errors` when given.
     * @pre raw and anonymized are row aligned.
     */
    static ColumnUtilityMetrics measure(const DataColumn& raw,
                                        const DataColumn& anonymized,
                                        const RuleConfig* rule,
                                        std::vector<RunError>* errors = nullptr);

    /**
     * @brief Pearson matrices over every column with a computed distribution metric.
     * @post NOT_APPLICABLE with fewer than two such columns or no defined raw correlation.
     */
    static CorrelationMetrics measureCorrelation(const std::vector<ColumnUtilityMetrics>& columns);

    /**
     * @brief Measures every column that has a rule; withheld columns (listed in runErrors) get no numeric metrics.
     * @details Numeric columns without a rule join the correlation matrix as-is but are not listed in `columns`.
     * @throws Obscura::DatasetException when the datasets are not the same shape.
     */
    static UtilityReport measureDataset(const TabularDataset& raw,
                                        const TabularDataset& anonymized,
                                        const RuleSet& rules,
                                        const UtilityWeights& weights = UtilityWeights{},
                                        const std::vector<RunError>& runErrors = {});

    /**
     * @brief Family averages, weighted overall score, band, notes and recommendations.
     * @details A family with no computed metric is excluded and the remaining weights are renormalized.
     */
    static UtilityReport aggregate(std::vector<ColumnUtilityMetrics> columns,
                                   CorrelationMetrics correlation,
                                   const UtilityWeights& weights = UtilityWeights{});

    // Family band: >90 excellent, >=80 good, >=70 fair, otherwise poor.
    static const char* familyBand(double score);

    // Overall band: <60 Poor, <75 Fair, <90 Good, otherwise Excellent.
    static const char* overallBand(double score);

    static std::vector<std::string> recommendations(const UtilityReport& report);
};

const char* metricStatusName(MetricStatus status);
