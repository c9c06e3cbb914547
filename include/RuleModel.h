#pragma once
#include "DateUtils.h"
#include "TabularDataset.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

enum class StrategyKind { HASH, REDACT_FULL, REDACT_PARTIAL, PSEUDONYMIZE, GENERALIZE };

enum class HashAlgorithm { SHA256, SHA512, MD5 };

enum class PseudonymShape { AUTO, NAME, EMAIL, PHONE, SSN, NUMERIC, TOKEN };

enum class AddressLevel { FULL, STREET, CITY, STATE, COUNTRY };

struct HashParams {
    HashAlgorithm algorithm = HashAlgorithm::SHA256;
    std::string salt;
};

struct RedactFullParams {
    std::string replacement = "[REDACTED]";
};

struct RedactPartialParams {
    size_t visibleChars = 0;
    char maskChar = '*';
    bool visibleFromEnd = true;
};

struct PseudonymizeParams {
    std::optional<uint64_t> seed; // falls back to GlobalConfig::seed
    PseudonymShape shape = PseudonymShape::AUTO;
};

// Generalization parameter families; exactly one applies to a rule.

// Upper bound on (max_value - min_value) / bin_size.
constexpr double kMaxNumericBins = 1.0e6;

struct NumericBinParams {
    double binSize = 10.0;
    double minValue = 0.0;
    double maxValue = 100.0;
};

struct LocationParams {
    size_t precision = 3;
};

struct DateParams {
    DateUtils::Granularity granularity = DateUtils::Granularity::MONTH;
};

struct AddressParams {
    AddressLevel level = AddressLevel::CITY;
};

struct IpParams {
    int octets = 3;
};

using GeneralizeParams = std::variant<NumericBinParams, LocationParams, DateParams, AddressParams, IpParams>;

struct GeneralizeSpec {
    GeneralizeParams params;
};

// Order matches StrategyKind.
using StrategyParams = std::variant<HashParams, RedactFullParams, RedactPartialParams, PseudonymizeParams, GeneralizeSpec>;

struct RuleConfig {
    std::string piiType;
    StrategyParams params;

    StrategyKind strategy() const noexcept { return static_cast<StrategyKind>(params.index()); }
};

struct GlobalConfig {
    bool handleNulls = true;
    std::optional<std::string> nullReplacement;
    bool preserveDataTypes = true;
    bool caseSensitive = false;
    uint64_t seed = 1337;
};

/**
 * Validated, immutable rule model: global options, rules by pii type, column->pii type mapping
 * and semantic type overrides (keyed by lower-case column name).
 */
struct RuleSet {
    GlobalConfig global;
    std::map<std::string, RuleConfig> rules;
    std::map<std::string, std::string> columnMapping;
    std::unordered_map<std::string, SemanticType> typeOverrides;

    /**
     * @brief Rule for a column: explicit column mapping first, then a pii type equal to the column name.
     * @post Returns nullptr when the column has no rule.
     */
    const RuleConfig* ruleForColumn(const std::string& column) const;
};

namespace RuleModel {

const char* strategyName(StrategyKind kind);
std::optional<StrategyKind> parseStrategy(const std::string& name);

const char* hashAlgorithmName(HashAlgorithm algorithm);
const char* addressLevelName(AddressLevel level);

// One-line summary such as "generalize(month)" for progress output.
std::string describeRule(const RuleConfig& rule);

/**
 * @brief Builds a validated RuleConfig from raw `param -> value` pairs for one pii type.
 * @throws Obscura::ConfigurationException for an unknown strategy, a missing required parameter,
 *         an out-of-range value, an unknown parameter, or an ambiguous generalization family.
 */
RuleConfig buildRule(const std::string& piiType,
                     const std::string& strategy,
                     const std::map<std::string, std::string>& parameters);

/**
 * @brief Re-checks parameter ranges of an already built rule.
 * @throws Obscura::InvalidParameterError when a value is out of range.
 */
void validateParameters(const RuleConfig& rule);

/**
 * @brief Loads a RuleSet from the key:value rule file dialect.
 * @throws Obscura::IOException when unreadable, Obscura::ConfigurationException when invalid.
 */
RuleSet loadRuleFile(const std::string& path);

/**
 * @brief Parses rule file text; `sourceName` is used in error messages only.
 */
RuleSet parseRuleText(const std::string& text, const std::string& sourceName = "<memory>");

} // namespace RuleModel
