#include "UtilityMetrics.h"
#include "CommonUtils.h"
#include "DateUtils.h"
#include "ObscuraExceptions.h"
#include "RangeCodec.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <unordered_map>

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

bool coerceRaw(const std::string& value, SemanticType type, double& out) {
    if (CommonUtils::parseDouble(value, out)) return true;
    if (type != SemanticType::DATE) return false;
    DateUtils::CivilDate date;
    if (!DateUtils::parseDate(value, date)) return false;
    out = static_cast<double>(DateUtils::daysFromCivil(date.year,
                                                       static_cast<unsigned>(date.month),
                                                       static_cast<unsigned>(date.day)));
    return true;
}

bool numericType(SemanticType type) {
    return type == SemanticType::NUMERIC || type == SemanticType::DATE || type == SemanticType::LOCATION;
}

std::string formatScore(double v) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(1);
    os << v;
    return os.str();
}

DistributionMetrics distributionOf(const std::vector<double>& raw, const std::vector<double>& anon) {
    DistributionMetrics out;
    const KsResult ks = Statistics::ksTwoSample(raw, anon);
    if (!ks.valid) {
        out.result = MetricResult::notApplicable("no numeric rows");
        return out;
    }
    const ColumnStats rawStats = Statistics::calculateStats(raw);
    const ColumnStats anonStats = Statistics::calculateStats(anon);

    out.ksStatistic = ks.statistic;
    out.ksPValue = ks.pValue;
    out.meanAbsDifference = std::fabs(rawStats.mean - anonStats.mean);
    out.medianAbsDifference = std::fabs(rawStats.median - anonStats.median);
    out.stdRatio = rawStats.stddev > 0.0 ? anonStats.stddev / rawStats.stddev : (anonStats.stddev > 0.0 ? 0.0 : 1.0);
    out.samples = raw.size();
    out.result = MetricResult::ofScore(100.0 * (1.0 - ks.statistic));
    return out;
}

InformationLossMetrics informationLossOf(const DataColumn& raw, const DataColumn& anon) {
    InformationLossMetrics out;
    std::unordered_map<std::string, size_t> rawCounts;
    std::unordered_map<std::string, size_t> anonCounts;
    const size_t n = std::min(raw.size(), anon.size());
    for (size_t r = 0; r < n; ++r) {
        if (raw.isNull(r)) continue;
        ++rawCounts[raw.values[r]];
        ++anonCounts[anon.isNull(r) ? std::string() : anon.values[r]];
    }

    if (rawCounts.empty()) {
        out.result = MetricResult::notApplicable("column has no non-null values");
        return out;
    }

    out.rawDistinct = rawCounts.size();
    out.anonymizedDistinct = anonCounts.size();
    out.rawEntropy = Statistics::shannonEntropy(rawCounts);
    out.anonymizedEntropy = Statistics::shannonEntropy(anonCounts);

    if (out.rawDistinct == 1) {
        out.uniqueRetained = 1.0;
        out.entropyRetained = 1.0;
    } else {
        out.uniqueRetained = std::clamp(static_cast<double>(out.anonymizedDistinct) / static_cast<double>(out.rawDistinct), 0.0, 1.0);
        out.entropyRetained = out.rawEntropy > 0.0 ? std::clamp(out.anonymizedEntropy / out.rawEntropy, 0.0, 1.0) : 1.0;
    }
    out.result = MetricResult::ofScore(100.0 * (out.uniqueRetained + out.entropyRetained) / 2.0);
    return out;
}
} // namespace

MetricResult MetricResult::ofScore(double score) {
    MetricResult r;
    r.status = MetricStatus::COMPUTED;
    r.score = std::clamp(score, 0.0, 100.0);
    return r;
}

MetricResult MetricResult::notApplicable(std::string reason) {
    MetricResult r;
    r.status = MetricStatus::NOT_APPLICABLE;
    r.reason = std::move(reason);
    return r;
}

MetricResult MetricResult::error(std::string reason) {
    MetricResult r;
    r.status = MetricStatus::ERROR;
    r.reason = std::move(reason);
    return r;
}

const char* metricStatusName(MetricStatus status) {
    switch (status) {
        case MetricStatus::COMPUTED: return "computed";
        case MetricStatus::NOT_APPLICABLE: return "not_applicable";
        case MetricStatus::ERROR: return "error";
    }
    return "unknown";
}

const char* UtilityMetrics::familyBand(double score) {
    if (score > 90.0) return "excellent";
    if (score >= 80.0) return "good";
    if (score >= 70.0) return "fair";
    return "poor";
}

const char* UtilityMetrics::overallBand(double score) {
    if (score < 60.0) return "Poor";
    if (score < 75.0) return "Fair";
    if (score < 90.0) return "Good";
    return "Excellent";
}

ColumnUtilityMetrics UtilityMetrics::measure(const DataColumn& raw,
                                             const DataColumn& anonymized,
                                             const RuleConfig* rule,
                                             std::vector<RunError>* errors) {
    ColumnUtilityMetrics out;
    out.column = raw.name;
    out.strategy = rule ? RuleModel::strategyName(rule->strategy()) : "none";
    out.informationLoss = informationLossOf(raw, anonymized);

    const size_t n = std::min(raw.size(), anonymized.size());
    out.rawNumeric.assign(n, kNaN);
    out.anonymizedNumeric.assign(n, kNaN);

    if (rule && rule->strategy() != StrategyKind::GENERALIZE) {
        out.distribution.result = MetricResult::notApplicable(out.strategy + " output is not numeric");
        return out;
    }
    if (!numericType(raw.type)) {
        out.distribution.result = MetricResult::notApplicable(std::string(semanticTypeName(raw.type)) + " column");
        return out;
    }

    std::vector<double> rawValues;
    std::vector<double> anonValues;
    rawValues.reserve(n);
    anonValues.reserve(n);
    for (size_t r = 0; r < n; ++r) {
        if (raw.isNull(r)) continue;
        double v = 0.0;
        if (!coerceRaw(raw.values[r], raw.type, v)) {
            out.rawNumeric.assign(n, kNaN);
            out.distribution.result = MetricResult::notApplicable("raw values are not numeric");
            return out;
        }
        out.rawNumeric[r] = v;
        rawValues.push_back(v);
    }

    try {
        for (size_t r = 0; r < n; ++r) {
            if (raw.isNull(r)) continue;
            if (anonymized.isNull(r)) {
                throw Obscura::RangeDecodeError("null anonymized value at row " + std::to_string(r));
            }
            const double decoded = RangeCodec::decode(anonymized.values[r]);
            out.anonymizedNumeric[r] = decoded;
            anonValues.push_back(decoded);
        }
    } catch (const Obscura::RangeDecodeError& ex) {
        out.rawNumeric.assign(n, kNaN);
        out.anonymizedNumeric.assign(n, kNaN);
        out.distribution.result = MetricResult::notApplicable(ex.what());
        if (errors) errors->push_back({raw.name, "RangeDecodeError", ex.what()});
        return out;
    }

    out.distribution = distributionOf(rawValues, anonValues);
    return out;
}

CorrelationMetrics UtilityMetrics::measureCorrelation(const std::vector<ColumnUtilityMetrics>& columns) {
    CorrelationMetrics out;
    std::vector<const ColumnUtilityMetrics*> eligible;
    for (const auto& c : columns) {
        if (c.distribution.result.computed()) eligible.push_back(&c);
    }
    if (eligible.size() < 2) {
        out.result = MetricResult::notApplicable("fewer than two numeric columns");
        return out;
    }

    const size_t k = eligible.size();
    out.rawMatrix.assign(k, std::vector<double>(k, kNaN));
    out.anonymizedMatrix.assign(k, std::vector<double>(k, kNaN));
    for (const auto* c : eligible) out.columns.push_back(c->column);

    double sumDiff = 0.0;
    for (size_t i = 0; i < k; ++i) {
        out.rawMatrix[i][i] = 1.0;
        out.anonymizedMatrix[i][i] = 1.0;
        for (size_t j = i + 1; j < k; ++j) {
            const auto rawR = Statistics::pearson(eligible[i]->rawNumeric, eligible[j]->rawNumeric);
            const auto anonR = Statistics::pearson(eligible[i]->anonymizedNumeric, eligible[j]->anonymizedNumeric);
            if (rawR) out.rawMatrix[i][j] = out.rawMatrix[j][i] = *rawR;
            if (anonR) out.anonymizedMatrix[i][j] = out.anonymizedMatrix[j][i] = *anonR;
            if (!rawR) continue;

            // A correlation that collapsed to undefined after generalization counts as zero.
            const double diff = std::fabs(*rawR - anonR.value_or(0.0));
            sumDiff += diff;
            out.maxAbsDifference = std::max(out.maxAbsDifference, diff);
            ++out.pairs;
        }
    }

    if (out.pairs == 0) {
        out.result = MetricResult::notApplicable("no defined raw correlation");
        return out;
    }
    out.meanAbsDifference = sumDiff / static_cast<double>(out.pairs);
    out.similarity = std::clamp(1.0 - out.meanAbsDifference, 0.0, 1.0);
    out.result = MetricResult::ofScore(100.0 * out.similarity);
    return out;
}

UtilityReport UtilityMetrics::measureDataset(const TabularDataset& raw,
                                             const TabularDataset& anonymized,
                                             const RuleSet& rules,
                                             const UtilityWeights& weights,
                                             const std::vector<RunError>& runErrors) {
    if (raw.colCount() != anonymized.colCount() || raw.rowCount() != anonymized.rowCount()) {
        throw Obscura::DatasetException("raw and anonymized datasets differ in shape");
    }

    std::set<std::string> withheld;
    for (const auto& e : runErrors) withheld.insert(e.column);

    std::vector<RunError> errors;
    std::vector<ColumnUtilityMetrics> columns;
    // Correlation also spans numeric columns left untouched; they carry no per-column family scores.
    std::vector<ColumnUtilityMetrics> correlated;
    for (size_t c = 0; c < raw.colCount(); ++c) {
        const DataColumn& rawCol = raw.columns()[c];
        const RuleConfig* rule = rules.ruleForColumn(rawCol.name);
        if (!rule && rawCol.type != SemanticType::NUMERIC) continue;

        const int anonIdx = anonymized.findColumnIndex(rawCol.name);
        if (anonIdx < 0) {
            throw Obscura::DatasetException("anonymized dataset is missing column '" + rawCol.name + "'");
        }
        const DataColumn& anonCol = anonymized.columns()[static_cast<size_t>(anonIdx)];

        if (!rule) {
            ColumnUtilityMetrics m = measure(rawCol, anonCol, nullptr, nullptr);
            if (m.distribution.result.computed()) correlated.push_back(std::move(m));
            continue;
        }

        if (withheld.count(rawCol.name)) {
            ColumnUtilityMetrics m = measure(rawCol, anonCol, rule, nullptr);
            m.distribution = DistributionMetrics{};
            m.distribution.result = MetricResult::notApplicable("column withheld after a strategy failure");
            std::fill(m.rawNumeric.begin(), m.rawNumeric.end(), kNaN);
            std::fill(m.anonymizedNumeric.begin(), m.anonymizedNumeric.end(), kNaN);
            columns.push_back(std::move(m));
            continue;
        }
        columns.push_back(measure(rawCol, anonCol, rule, &errors));
        if (columns.back().distribution.result.computed()) correlated.push_back(columns.back());
    }

    CorrelationMetrics correlation = measureCorrelation(correlated);
    UtilityReport report = aggregate(std::move(columns), std::move(correlation), weights);
    report.errors.insert(report.errors.end(), errors.begin(), errors.end());
    return report;
}

UtilityReport UtilityMetrics::aggregate(std::vector<ColumnUtilityMetrics> columns,
                                        CorrelationMetrics correlation,
                                        const UtilityWeights& weights) {
    UtilityReport report;
    report.columns = std::move(columns);
    report.correlation = std::move(correlation);

    double distSum = 0.0, lossSum = 0.0;
    size_t distCount = 0, lossCount = 0;
    for (const auto& c : report.columns) {
        if (c.distribution.result.computed()) {
            distSum += c.distribution.result.score;
            ++distCount;
        }
        if (c.informationLoss.result.computed()) {
            lossSum += c.informationLoss.result.score;
            ++lossCount;
        }
    }
    report.distribution = distCount ? MetricResult::ofScore(distSum / static_cast<double>(distCount))
                                    : MetricResult::notApplicable("no column with numeric metrics");
    report.informationLoss = lossCount ? MetricResult::ofScore(lossSum / static_cast<double>(lossCount))
                                       : MetricResult::notApplicable("no column with information-loss metrics");

    struct Family {
        const char* name;
        const MetricResult* result;
        double weight;
    };
    const Family families[] = {
        {"distribution", &report.distribution, weights.distribution},
        {"correlation", &report.correlation.result, weights.correlation},
        {"information loss", &report.informationLoss, weights.informationLoss},
    };

    double weighted = 0.0;
    double weightSum = 0.0;
    for (const auto& f : families) {
        if (f.result->computed() && f.weight > 0.0) {
            weighted += f.weight * f.result->score;
            weightSum += f.weight;
        } else if (!f.result->computed()) {
            report.reducedConfidence = true;
            report.notes.push_back(std::string(f.name) + " excluded from the overall score: " + f.result->reason);
        }
    }

    if (weightSum > 0.0) {
        report.overall = MetricResult::ofScore(weighted / weightSum);
        report.band = overallBand(report.overall.score);
    } else {
        report.overall = MetricResult::notApplicable("no metric family could be computed");
        report.band = "N/A";
    }
    if (report.reducedConfidence) {
        report.notes.push_back("Reduced confidence: the overall score covers only the computed metric families");
    }

    report.recommendations = recommendations(report);
    return report;
}

std::vector<std::string> UtilityMetrics::recommendations(const UtilityReport& report) {
    std::vector<std::string> out;
    if (report.overall.computed() && report.overall.score < 70.0) {
        out.push_back("Consider using less aggressive anonymization strategies");
    }

    std::vector<std::string> poorDistribution;
    std::vector<std::string> highLoss;
    for (const auto& c : report.columns) {
        if (c.distribution.result.computed() && c.distribution.ksStatistic > 0.3) poorDistribution.push_back(c.column);
        if (c.informationLoss.result.computed() && c.informationLoss.uniqueRetained < 0.5) highLoss.push_back(c.column);
    }
    auto join = [](const std::vector<std::string>& names) {
        std::string s;
        for (const auto& n : names) s += (s.empty() ? "" : ", ") + n;
        return s;
    };

    if (!poorDistribution.empty()) out.push_back("Improve distribution preservation for: " + join(poorDistribution));
    if (report.correlation.result.computed() && report.correlation.similarity < 0.7) {
        out.push_back("Consider preserving more precise numeric values to maintain correlations (similarity " +
                      formatScore(report.correlation.result.score) + "%)");
    }
    if (!highLoss.empty()) out.push_back("High information loss in: " + join(highLoss));
    if (out.empty()) out.push_back("Anonymization provides good balance of privacy and utility");
    return out;
}
