#include "StrategyEngine.h"
#include "CommonUtils.h"
#include "DigestUtils.h"
#include "Generalizers.h"
#include "ObscuraExceptions.h"

#include <exception>
#include <memory>
#include <vector>

namespace {
std::string hashValue(const std::string& value, const HashParams& params, bool caseSensitive) {
    const std::string input = caseSensitive ? value : CommonUtils::toLower(value);
    return DigestUtils::hexDigest(params.salt.empty() ? input : params.salt + ":" + input, params.algorithm);
}

// Byte offset of every UTF-8 code point start, followed by the total length.
std::vector<size_t> codePointOffsets(const std::string& value) {
    std::vector<size_t> offsets;
    offsets.reserve(value.size() + 1);
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 0 || (static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) offsets.push_back(i);
    }
    offsets.push_back(value.size());
    return offsets;
}

std::string redactPartial(const std::string& value, const RedactPartialParams& params, const std::string& columnName) {
    const std::vector<size_t> offsets = codePointOffsets(value);
    const size_t length = offsets.size() - 1;
    if (params.visibleChars > length) {
        throw Obscura::InvalidParameterError("visible_chars (" + std::to_string(params.visibleChars) +
                                             ") exceeds value length (" + std::to_string(length) +
                                             ") in column '" + columnName + "'");
    }
    const size_t masked = length - params.visibleChars;
    if (params.visibleFromEnd) {
        return std::string(masked, params.maskChar) + value.substr(offsets[masked]);
    }
    return value.substr(0, offsets[params.visibleChars]) + std::string(masked, params.maskChar);
}

bool allNumeric(const DataColumn& column) {
    double parsed = 0.0;
    for (size_t r = 0; r < column.values.size(); ++r) {
        if (column.isNull(r)) continue;
        if (!CommonUtils::parseDouble(column.values[r], parsed)) return false;
    }
    return true;
}

SemanticType outputType(const DataColumn& in, const DataColumn& out, StrategyKind strategy, bool preserve) {
    if (!preserve) return SemanticType::CATEGORICAL;
    if (in.type == SemanticType::NUMERIC) {
        return allNumeric(out) ? SemanticType::NUMERIC : SemanticType::CATEGORICAL;
    }
    if (strategy == StrategyKind::GENERALIZE || strategy == StrategyKind::PSEUDONYMIZE) return in.type;
    return SemanticType::CATEGORICAL;
}
} // namespace

const char* transformFlagName(TransformFlag flag) {
    switch (flag) {
        case TransformFlag::NONE: return "none";
        case TransformFlag::CLAMPED: return "clamped";
        case TransformFlag::NULL_SUBSTITUTED: return "null_substituted";
        case TransformFlag::WITHHELD: return "withheld";
    }
    return "unknown";
}

std::string StrategyEngine::nullSentinel(const RuleConfig& rule) {
    switch (rule.strategy()) {
        case StrategyKind::HASH: return "HASH_NULL";
        case StrategyKind::REDACT_FULL: return std::get<RedactFullParams>(rule.params).replacement;
        case StrategyKind::REDACT_PARTIAL: return "";
        case StrategyKind::PSEUDONYMIZE: return "ANON_NULL";
        case StrategyKind::GENERALIZE: return "UNKNOWN";
    }
    return "";
}

ColumnTransformResult StrategyEngine::apply(const DataColumn& column,
                                            const RuleConfig& rule,
                                            const GlobalConfig& global,
                                            PseudonymContext& context) {
    RuleModel::validateParameters(rule);
    const StrategyKind kind = rule.strategy();

    std::unique_ptr<Generalizer> generalizer;
    PseudonymShape shape = PseudonymShape::AUTO;
    uint64_t seed = global.seed;
    if (kind == StrategyKind::GENERALIZE) {
        generalizer = makeGeneralizer(column.type);
    } else if (kind == StrategyKind::PSEUDONYMIZE) {
        const auto& p = std::get<PseudonymizeParams>(rule.params);
        shape = PseudonymContext::resolveShape(p.shape, rule.piiType, column.type, global.preserveDataTypes);
        seed = p.seed.value_or(global.seed);
    }

    ColumnTransformResult result;
    result.column.name = column.name;
    result.column.values.resize(column.values.size());
    result.column.missing.assign(column.values.size(), static_cast<uint8_t>(0));
    result.records.reserve(column.values.size());

    for (size_t r = 0; r < column.values.size(); ++r) {
        if (column.isNull(r)) {
            if (!global.handleNulls) {
                result.column.values[r] = column.values[r];
                result.column.missing[r] = 1;
                continue;
            }
            result.column.values[r] = global.nullReplacement.value_or(nullSentinel(rule));
            result.records.push_back({r, column.name, kind, result.column.values[r], TransformFlag::NULL_SUBSTITUTED});
            continue;
        }

        const std::string& value = column.values[r];
        TransformFlag flag = TransformFlag::NONE;
        std::string out;
        switch (kind) {
            case StrategyKind::HASH:
                out = hashValue(value, std::get<HashParams>(rule.params), global.caseSensitive);
                break;
            case StrategyKind::REDACT_FULL:
                out = std::get<RedactFullParams>(rule.params).replacement;
                break;
            case StrategyKind::REDACT_PARTIAL:
                out = redactPartial(value, std::get<RedactPartialParams>(rule.params), column.name);
                break;
            case StrategyKind::PSEUDONYMIZE:
                out = context.pseudonym(seed,
                                        rule.piiType,
                                        global.caseSensitive ? value : CommonUtils::toLower(value),
                                        shape);
                break;
            case StrategyKind::GENERALIZE: {
                GeneralizedValue g = generalizer->generalize(value, std::get<GeneralizeSpec>(rule.params).params);
                out = std::move(g.value);
                if (g.clamped) flag = TransformFlag::CLAMPED;
                break;
            }
        }
        result.column.values[r] = out;
        result.records.push_back({r, column.name, kind, std::move(out), flag});
    }

    result.column.type = outputType(column, result.column, kind, global.preserveDataTypes);
    return result;
}

ColumnTransformResult StrategyEngine::withhold(const DataColumn& column, StrategyKind strategy) {
    ColumnTransformResult result;
    result.column.name = column.name;
    result.column.type = SemanticType::CATEGORICAL;
    result.column.values.assign(column.values.size(), std::string());
    result.column.missing.assign(column.values.size(), static_cast<uint8_t>(0));
    for (size_t r = 0; r < column.values.size(); ++r) {
        if (column.isNull(r)) {
            result.column.values[r] = column.values[r];
            result.column.missing[r] = 1;
            continue;
        }
        result.column.values[r] = kWithheldValue;
        result.records.push_back({r, column.name, strategy, kWithheldValue, TransformFlag::WITHHELD});
    }
    return result;
}

AnonymizationResult StrategyEngine::anonymize(const TabularDataset& dataset,
                                              const RuleSet& rules,
                                              PseudonymContext& context) {
    const auto& columns = dataset.columns();
    const size_t n = columns.size();

    std::vector<const RuleConfig*> columnRules(n, nullptr);
    for (size_t c = 0; c < n; ++c) columnRules[c] = rules.ruleForColumn(columns[c].name);

    std::vector<ColumnTransformResult> transformed(n);
    std::vector<RunError> columnErrors(n);
    std::vector<uint8_t> failed(n, 0);
    std::vector<std::exception_ptr> fatal(n);

    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (size_t c = 0; c < n; ++c) {
        const RuleConfig* rule = columnRules[c];
        if (!rule) continue;
        try {
            transformed[c] = apply(columns[c], *rule, rules.global, context);
        } catch (const Obscura::UnsupportedStrategyError& ex) {
            columnErrors[c] = {columns[c].name, "UnsupportedStrategyError", ex.what()};
            failed[c] = 1;
        } catch (const Obscura::InvalidParameterError& ex) {
            columnErrors[c] = {columns[c].name, "InvalidParameterError", ex.what()};
            failed[c] = 1;
        } catch (...) {
            fatal[c] = std::current_exception();
        }
        if (failed[c]) transformed[c] = withhold(columns[c], rule->strategy());
    }

    for (const auto& ex : fatal) {
        if (ex) std::rethrow_exception(ex);
    }

    AnonymizationResult result;
    result.stats.columnsProcessed = n;
    result.stats.rowsProcessed = dataset.rowCount();
    for (size_t c = 0; c < n; ++c) {
        if (!columnRules[c]) {
            result.dataset.addColumn(columns[c]);
            continue;
        }
        if (failed[c]) {
            ++result.stats.columnsFailed;
            result.errors.push_back(std::move(columnErrors[c]));
        } else {
            ++result.stats.columnsAnonymized;
        }
        for (auto& record : transformed[c].records) {
            if (record.flag == TransformFlag::CLAMPED) ++result.stats.clampedCells;
            if (record.flag == TransformFlag::NULL_SUBSTITUTED) ++result.stats.nullSubstitutions;
            ++result.stats.cellsTransformed;
            result.log.push_back(std::move(record));
        }
        result.dataset.addColumn(std::move(transformed[c].column));
    }
    return result;
}
