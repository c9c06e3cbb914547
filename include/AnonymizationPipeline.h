#pragma once

#include "PseudonymGenerator.h"
#include "ReportEngine.h"
#include "RunConfig.h"
#include "StrategyEngine.h"
#include "UtilityMetrics.h"

#include <memory>
#include <string>

struct PipelineOptions {
    bool verbose = false;
    UtilityWeights weights;
    // Synthetic value source for pseudonymize; the built-in corpus when null.
    std::shared_ptr<const PseudonymGenerator> generator;
};

struct PipelineResult {
    AnonymizationResult anonymization;
    UtilityReport utility;

    bool hasFieldErrors() const noexcept { return !anonymization.errors.empty(); }
};

class AnonymizationPipeline final {
public:
    /**
     * @brief Loads rules and data, anonymizes, measures utility, writes the CSV and optional report.
     * @return 0 on success, 2 when at least one field was withheld after a strategy failure.
     * @throws Obscura::ObscuraException for configuration, IO or dataset failures.
     */
    int run(const RunConfig& config);

    /**
     * @brief In-memory anonymize-and-measure. Owns one PseudonymContext for the duration of the call.
     */
    static PipelineResult process(const TabularDataset& raw, const RuleSet& rules, const PipelineOptions& options = PipelineOptions{});

    static ReportEngine buildReport(const PipelineResult& result, const std::string& datasetName);
};
