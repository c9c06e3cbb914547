#include "AnonymizationPipeline.h"
#include "ObscuraExceptions.h"
#include "TerminalUI.h"

#include <cmath>
#include <iostream>
#include <sstream>

namespace {
std::string fixed(double v, int precision) {
    std::ostringstream os;
    os.setf(std::ios::fixed);
    os.precision(precision);
    os << v;
    return os.str();
}

std::string scoreText(const MetricResult& r) {
    if (r.computed()) return fixed(r.score, 1);
    return std::string(metricStatusName(r.status)) + (r.reason.empty() ? "" : " (" + r.reason + ")");
}

std::string matrixCell(double v) {
    return std::isfinite(v) ? fixed(v, 3) : "n/a";
}

void warnUnmatchedMappings(const TabularDataset& data, const RuleSet& rules) {
    for (const auto& kv : rules.columnMapping) {
        if (data.findColumnIndex(kv.first) < 0) {
            std::cerr << "[Obscura][Warning] Rule file maps column '" << kv.first
                      << "' which is not present in the dataset.\n";
        }
    }
}
} // namespace

PipelineResult AnonymizationPipeline::process(const TabularDataset& raw, const RuleSet& rules, const PipelineOptions& options) {
    PseudonymContext context(options.generator);

    PipelineResult result;
    if (options.verbose) std::cout << "[Obscura][Strategy] Applying rules to " << raw.colCount() << " columns...\n";
    result.anonymization = StrategyEngine::anonymize(raw, rules, context);
    result.anonymization.dataset.setDelimiter(raw.delimiter());

    if (options.verbose) {
        std::cout << "[Obscura][Strategy] " << result.anonymization.stats.cellsTransformed << " cells transformed, "
                  << context.cacheSize() << " distinct pseudonyms.\n";
        size_t shown = 0;
        for (const auto& record : result.anonymization.log) {
            if (record.flag == TransformFlag::NONE || record.flag == TransformFlag::WITHHELD) continue;
            if (++shown > 10) break;
            std::cout << "  row " << record.row << ", " << record.column << ": "
                      << transformFlagName(record.flag) << " -> '" << record.value << "'\n";
        }
        for (const auto& e : result.anonymization.errors) {
            std::cerr << "[Obscura][Warning] Column '" << e.column << "' withheld: " << e.message << "\n";
        }
        std::cout << "[Obscura][Metrics] Measuring utility...\n";
    }

    result.utility = UtilityMetrics::measureDataset(raw,
                                                    result.anonymization.dataset,
                                                    rules,
                                                    options.weights,
                                                    result.anonymization.errors);
    if (options.verbose) {
        for (const auto& e : result.utility.errors) {
            std::cerr << "[Obscura][Warning] Metric skipped for '" << e.column << "': " << e.message << "\n";
        }
    }
    return result;
}

ReportEngine AnonymizationPipeline::buildReport(const PipelineResult& result, const std::string& datasetName) {
    const UtilityReport& u = result.utility;
    const RunStatistics& s = result.anonymization.stats;

    ReportEngine report;
    report.addTitle("Anonymization Utility Report");
    report.addParagraph("Dataset: `" + datasetName + "`");

    report.addSection("Overall Utility");
    report.addParagraph("**Score:** " + scoreText(u.overall) + " (" + u.band + ")");
    report.addBulletList(u.notes);

    report.addTable("Metric Families",
                    {"Family", "Score", "Band"},
                    {
                        {"Distribution preservation", scoreText(u.distribution),
                         u.distribution.computed() ? UtilityMetrics::familyBand(u.distribution.score) : "-"},
                        {"Correlation preservation", scoreText(u.correlation.result),
                         u.correlation.result.computed() ? UtilityMetrics::familyBand(u.correlation.result.score) : "-"},
                        {"Information retained", scoreText(u.informationLoss),
                         u.informationLoss.computed() ? UtilityMetrics::familyBand(u.informationLoss.score) : "-"},
                    });

    std::vector<std::vector<std::string>> rows;
    for (const auto& c : u.columns) {
        const bool dist = c.distribution.result.computed();
        const bool loss = c.informationLoss.result.computed();
        rows.push_back({c.column,
                        c.strategy,
                        scoreText(c.distribution.result),
                        dist ? fixed(c.distribution.ksStatistic, 4) : "-",
                        dist ? fixed(c.distribution.ksPValue, 4) : "-",
                        dist ? fixed(c.distribution.meanAbsDifference, 3) : "-",
                        dist ? fixed(c.distribution.stdRatio, 3) : "-",
                        loss ? fixed(c.informationLoss.uniqueRetained, 3) : "-",
                        loss ? fixed(c.informationLoss.entropyRetained, 3) : "-",
                        scoreText(c.informationLoss.result)});
    }
    report.addTable("Per-Column Metrics",
                    {"Column", "Strategy", "Distribution", "KS", "p-value", "|Mean diff|", "Std ratio",
                     "Unique retained", "Entropy retained", "Information"},
                    rows);

    if (u.correlation.result.computed()) {
        std::vector<std::string> headers = {"Column"};
        headers.insert(headers.end(), u.correlation.columns.begin(), u.correlation.columns.end());
        std::vector<std::vector<std::string>> matrixRows;
        for (size_t i = 0; i < u.correlation.columns.size(); ++i) {
            std::vector<std::string> row = {u.correlation.columns[i]};
            for (size_t j = 0; j < u.correlation.columns.size(); ++j) {
                row.push_back(matrixCell(u.correlation.rawMatrix[i][j]) + " / " +
                              matrixCell(u.correlation.anonymizedMatrix[i][j]));
            }
            matrixRows.push_back(std::move(row));
        }
        report.addTable("Correlation (raw / anonymized)", headers, matrixRows);
        report.addParagraph("Similarity " + fixed(u.correlation.similarity, 4) + ", max |difference| " +
                            fixed(u.correlation.maxAbsDifference, 4) + " over " +
                            std::to_string(u.correlation.pairs) + " pairs.");
    }

    report.addSection("Anonymization Run");
    report.addBulletList({
        "Columns processed: " + std::to_string(s.columnsProcessed),
        "Columns anonymized: " + std::to_string(s.columnsAnonymized),
        "Columns withheld: " + std::to_string(s.columnsFailed),
        "Rows processed: " + std::to_string(s.rowsProcessed),
        "Cells transformed: " + std::to_string(s.cellsTransformed),
        "Clamped cells: " + std::to_string(s.clampedCells),
        "Null substitutions: " + std::to_string(s.nullSubstitutions),
    });

    std::vector<std::vector<std::string>> errorRows;
    for (const auto& e : result.anonymization.errors) errorRows.push_back({e.column, e.kind, e.message});
    for (const auto& e : u.errors) errorRows.push_back({e.column, e.kind, e.message});
    if (!errorRows.empty()) report.addTable("Errors", {"Column", "Kind", "Message"}, errorRows);

    report.addSection("Recommendations");
    report.addBulletList(u.recommendations);
    return report;
}

int AnonymizationPipeline::run(const RunConfig& config) {
    if (config.verbose) std::cout << "[Obscura][Load] Reading rules from " << config.rulesPath << "...\n";
    RuleSet rules = RuleModel::loadRuleFile(config.rulesPath);
    if (config.seed) rules.global.seed = *config.seed;

    if (config.verbose) std::cout << "[Obscura][Load] Reading dataset " << config.datasetPath << "...\n";
    TabularDataset data(config.datasetPath, config.delimiter);
    data.setColumnTypeOverrides(rules.typeOverrides);
    data.load();
    if (data.rowCount() == 0 || data.colCount() == 0) {
        throw Obscura::DatasetException("Dataset has no usable rows/columns");
    }
    std::cout << "[Obscura][Load] " << data.rowCount() << " rows x " << data.colCount() << " columns, "
              << rules.rules.size() << " rules.\n";
    if (config.verbose) {
        for (const auto& col : data.columns()) {
            const RuleConfig* rule = rules.ruleForColumn(col.name);
            std::cout << "  - " << col.name << " (" << semanticTypeName(col.type) << ") -> "
                      << (rule ? RuleModel::describeRule(*rule) : std::string("unchanged")) << "\n";
        }
    }
    warnUnmatchedMappings(data, rules);

    PipelineOptions options;
    options.verbose = config.verbose;
    options.weights = config.weights;
    PipelineResult result = process(data, rules, options);

    result.anonymization.dataset.writeCsv(config.outputPath);
    std::cout << "[Obscura][Strategy] Anonymized dataset written to " << config.outputPath << "\n";

    TerminalUI::printRunSummary(result.anonymization.stats, result.anonymization.errors);
    TerminalUI::printUtilitySummary(result.utility);
    if (config.verbose && result.utility.correlation.result.computed()) {
        TerminalUI::printCorrelationMatrix(result.utility.correlation.columns, result.utility.correlation.rawMatrix);
        TerminalUI::printCorrelationMatrix(result.utility.correlation.columns, result.utility.correlation.anonymizedMatrix);
    }

    if (!config.reportPath.empty()) {
        buildReport(result, config.datasetPath).save(config.reportPath);
        std::cout << "[Obscura][Report] Utility report written to " << config.reportPath << "\n";
    }

    if (result.hasFieldErrors()) {
        std::cerr << "[Obscura][Warning] " << result.anonymization.errors.size()
                  << " column(s) were withheld; see the error summary.\n";
        return 2;
    }
    return 0;
}
