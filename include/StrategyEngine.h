#pragma once

#include "PseudonymGenerator.h"
#include "RuleModel.h"
#include "TabularDataset.h"

#include <string>
#include <vector>

enum class TransformFlag { NONE, CLAMPED, NULL_SUBSTITUTED, WITHHELD };

struct TransformationRecord {
    size_t row = 0;
    std::string column;
    StrategyKind strategy = StrategyKind::REDACT_FULL;
    std::string value;
    TransformFlag flag = TransformFlag::NONE;
};

struct ColumnTransformResult {
    DataColumn column;
    std::vector<TransformationRecord> records;
};

// A field-scoped failure. The column it names was withheld from the output.
struct RunError {
    std::string column;
    std::string kind;
    std::string message;
};

struct RunStatistics {
    size_t columnsProcessed = 0;
    size_t columnsAnonymized = 0;
    size_t columnsFailed = 0;
    size_t rowsProcessed = 0;
    size_t cellsTransformed = 0;
    size_t clampedCells = 0;
    size_t nullSubstitutions = 0;
};

struct AnonymizationResult {
    TabularDataset dataset;
    std::vector<TransformationRecord> log;
    std::vector<RunError> errors;
    RunStatistics stats;
};

class StrategyEngine {
public:
    static constexpr const char* kWithheldValue = "[REDACTED]";

    /**
     * @brief Applies one rule to one column.
     * @pre column values are row aligned with its missing mask.
     * @post The returned column has the same name and length; nulls are either passed through
     *       (handle_nulls off) or substituted before any strategy runs.
     * @throws Obscura::UnsupportedStrategyError when the strategy does not fit the column's type or values.
     * @throws Obscura::InvalidParameterError when a parameter is out of range for this column.
     */
    static ColumnTransformResult apply(const DataColumn& column,
                                       const RuleConfig& rule,
                                       const GlobalConfig& global,
                                       PseudonymContext& context);

    /**
     * @brief Applies the rule set to every column of a dataset.
     * @details Columns are processed independently (in parallel with USE_OPENMP). A column that raises
     *          a field-scoped error is withheld and reported in `errors`; the rest still complete.
     *          Columns without a rule are copied unchanged.
     * @post The result dataset has the same shape and column order as `dataset`.
     */
    static AnonymizationResult anonymize(const TabularDataset& dataset,
                                         const RuleSet& rules,
                                         PseudonymContext& context);

    // Value a null becomes when handle_nulls is on and no null_replacement is configured.
    static std::string nullSentinel(const RuleConfig& rule);

    static ColumnTransformResult withhold(const DataColumn& column, StrategyKind strategy);
};

const char* transformFlagName(TransformFlag flag);
