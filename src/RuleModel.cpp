#include "RuleModel.h"
#include "CommonUtils.h"
#include "ConfigUtils.h"
#include "ObscuraExceptions.h"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace {
using ParamMap = std::map<std::string, std::string>;

std::string paramKey(const std::string& piiType, const std::string& param) {
    return "rule." + piiType + "." + param;
}

void rejectUnknownParameters(const std::string& piiType,
                             const ParamMap& parameters,
                             const std::set<std::string>& allowed,
                             const char* strategy) {
    for (const auto& kv : parameters) {
        if (allowed.count(kv.first) == 0) {
            throw Obscura::ConfigurationException("Unknown parameter '" + kv.first + "' for " + strategy +
                                                  " rule '" + piiType + "'");
        }
    }
}

const std::string* findParam(const ParamMap& parameters, const std::string& key) {
    auto it = parameters.find(key);
    return (it == parameters.end()) ? nullptr : &it->second;
}

HashParams buildHash(const std::string& piiType, const ParamMap& p) {
    rejectUnknownParameters(piiType, p, {"algorithm", "salt"}, "hash");
    HashParams out;
    if (const std::string* alg = findParam(p, "algorithm")) {
        const std::string a = CommonUtils::toLower(*alg);
        if (a == "sha256") out.algorithm = HashAlgorithm::SHA256;
        else if (a == "sha512") out.algorithm = HashAlgorithm::SHA512;
        else if (a == "md5") out.algorithm = HashAlgorithm::MD5;
        else throw Obscura::ConfigurationException("Unsupported hash algorithm for " + paramKey(piiType, "algorithm") + ": " + *alg);
    }
    if (const std::string* salt = findParam(p, "salt")) out.salt = *salt;
    return out;
}

RedactFullParams buildRedactFull(const std::string& piiType, const ParamMap& p) {
    rejectUnknownParameters(piiType, p, {"replacement"}, "redact_full");
    RedactFullParams out;
    if (const std::string* r = findParam(p, "replacement")) out.replacement = *r;
    return out;
}

RedactPartialParams buildRedactPartial(const std::string& piiType, const ParamMap& p) {
    rejectUnknownParameters(piiType, p, {"visible_chars", "mask_char", "visible_from"}, "redact_partial");
    const std::string* visible = findParam(p, "visible_chars");
    const std::string* mask = findParam(p, "mask_char");
    if (!visible || !mask) {
        throw Obscura::ConfigurationException("redact_partial rule '" + piiType +
                                              "' requires visible_chars and mask_char");
    }

    RedactPartialParams out;
    out.visibleChars = static_cast<size_t>(ConfigUtils::parseIntStrict(*visible, paramKey(piiType, "visible_chars"), 0));
    if (mask->size() != 1) {
        throw Obscura::ConfigurationException(paramKey(piiType, "mask_char") + " must be exactly one character");
    }
    out.maskChar = mask->front();

    if (const std::string* from = findParam(p, "visible_from")) {
        const std::string f = CommonUtils::toLower(*from);
        if (f == "end") out.visibleFromEnd = true;
        else if (f == "start") out.visibleFromEnd = false;
        else throw Obscura::ConfigurationException(paramKey(piiType, "visible_from") + " must be 'end' or 'start'");
    }
    return out;
}

PseudonymizeParams buildPseudonymize(const std::string& piiType, const ParamMap& p) {
    rejectUnknownParameters(piiType, p, {"seed", "shape"}, "pseudonymize");
    PseudonymizeParams out;
    if (const std::string* seed = findParam(p, "seed")) {
        out.seed = ConfigUtils::parseUInt64Strict(*seed, paramKey(piiType, "seed"));
    }
    if (const std::string* shape = findParam(p, "shape")) {
        const std::string s = CommonUtils::toLower(*shape);
        if (s == "auto") out.shape = PseudonymShape::AUTO;
        else if (s == "name") out.shape = PseudonymShape::NAME;
        else if (s == "email") out.shape = PseudonymShape::EMAIL;
        else if (s == "phone") out.shape = PseudonymShape::PHONE;
        else if (s == "ssn") out.shape = PseudonymShape::SSN;
        else if (s == "numeric") out.shape = PseudonymShape::NUMERIC;
        else if (s == "token") out.shape = PseudonymShape::TOKEN;
        else throw Obscura::ConfigurationException("Unknown pseudonym shape for " + paramKey(piiType, "shape") + ": " + *shape);
    }
    return out;
}

GeneralizeSpec buildGeneralize(const std::string& piiType, const ParamMap& p) {
    rejectUnknownParameters(piiType,
                            p,
                            {"bin_size", "min_value", "max_value", "precision", "granularity", "level", "octets"},
                            "generalize");

    const bool numeric = p.count("bin_size") || p.count("min_value") || p.count("max_value");
    const bool location = p.count("precision") != 0;
    const bool date = p.count("granularity") != 0;
    const bool address = p.count("level") != 0;
    const bool ip = p.count("octets") != 0;
    const int families = static_cast<int>(numeric) + static_cast<int>(location) + static_cast<int>(date) +
                         static_cast<int>(address) + static_cast<int>(ip);
    if (families != 1) {
        throw Obscura::ConfigurationException(
            "generalize rule '" + piiType + "' must set exactly one parameter family: numeric (bin_size, min_value, "
            "max_value), location (precision), date (granularity), address (level) or ip (octets)");
    }

    GeneralizeSpec out;
    if (numeric) {
        const std::string* bin = findParam(p, "bin_size");
        if (!bin) throw Obscura::ConfigurationException("generalize rule '" + piiType + "' requires bin_size");
        NumericBinParams params;
        params.binSize = ConfigUtils::parseDoubleStrict(*bin, paramKey(piiType, "bin_size"));
        if (const std::string* lo = findParam(p, "min_value")) {
            params.minValue = ConfigUtils::parseDoubleStrict(*lo, paramKey(piiType, "min_value"));
        }
        if (const std::string* hi = findParam(p, "max_value")) {
            params.maxValue = ConfigUtils::parseDoubleStrict(*hi, paramKey(piiType, "max_value"));
        }
        out.params = params;
    } else if (location) {
        LocationParams params;
        params.precision = static_cast<size_t>(
            ConfigUtils::parseIntStrict(p.at("precision"), paramKey(piiType, "precision"), 1));
        out.params = params;
    } else if (date) {
        const auto g = DateUtils::parseGranularity(p.at("granularity"));
        if (!g) {
            throw Obscura::ConfigurationException(paramKey(piiType, "granularity") +
                                                  " must be one of day, week, month, quarter, year");
        }
        out.params = DateParams{*g};
    } else if (address) {
        const std::string l = CommonUtils::toLower(p.at("level"));
        AddressParams params;
        if (l == "full") params.level = AddressLevel::FULL;
        else if (l == "street") params.level = AddressLevel::STREET;
        else if (l == "city") params.level = AddressLevel::CITY;
        else if (l == "state") params.level = AddressLevel::STATE;
        else if (l == "country") params.level = AddressLevel::COUNTRY;
        else throw Obscura::ConfigurationException(paramKey(piiType, "level") +
                                                   " must be one of full, street, city, state, country");
        out.params = params;
    } else {
        IpParams params;
        params.octets = ConfigUtils::parseIntStrict(p.at("octets"), paramKey(piiType, "octets"), 1);
        out.params = params;
    }
    return out;
}
} // namespace

const RuleConfig* RuleSet::ruleForColumn(const std::string& column) const {
    auto mapped = columnMapping.find(column);
    const std::string& piiType = (mapped != columnMapping.end()) ? mapped->second : column;
    auto it = rules.find(piiType);
    return (it == rules.end()) ? nullptr : &it->second;
}

namespace RuleModel {

const char* strategyName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::HASH: return "hash";
        case StrategyKind::REDACT_FULL: return "redact_full";
        case StrategyKind::REDACT_PARTIAL: return "redact_partial";
        case StrategyKind::PSEUDONYMIZE: return "pseudonymize";
        case StrategyKind::GENERALIZE: return "generalize";
    }
    return "unknown";
}

std::optional<StrategyKind> parseStrategy(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    if (n == "hash") return StrategyKind::HASH;
    if (n == "redact_full") return StrategyKind::REDACT_FULL;
    if (n == "redact_partial") return StrategyKind::REDACT_PARTIAL;
    if (n == "pseudonymize") return StrategyKind::PSEUDONYMIZE;
    if (n == "generalize") return StrategyKind::GENERALIZE;
    return std::nullopt;
}

const char* hashAlgorithmName(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return "sha256";
        case HashAlgorithm::SHA512: return "sha512";
        case HashAlgorithm::MD5: return "md5";
    }
    return "unknown";
}

const char* addressLevelName(AddressLevel level) {
    switch (level) {
        case AddressLevel::FULL: return "full";
        case AddressLevel::STREET: return "street";
        case AddressLevel::CITY: return "city";
        case AddressLevel::STATE: return "state";
        case AddressLevel::COUNTRY: return "country";
    }
    return "unknown";
}

std::string describeRule(const RuleConfig& rule) {
    std::ostringstream os;
    os << strategyName(rule.strategy());
    switch (rule.strategy()) {
        case StrategyKind::HASH:
            os << "(" << hashAlgorithmName(std::get<HashParams>(rule.params).algorithm) << ")";
            break;
        case StrategyKind::REDACT_PARTIAL: {
            const auto& p = std::get<RedactPartialParams>(rule.params);
            os << "(" << p.visibleChars << " visible, mask '" << p.maskChar << "')";
            break;
        }
        case StrategyKind::GENERALIZE: {
            const GeneralizeParams& g = std::get<GeneralizeSpec>(rule.params).params;
            if (const auto* bins = std::get_if<NumericBinParams>(&g)) {
                os << "(bins of " << bins->binSize << " over [" << bins->minValue << ", " << bins->maxValue << "])";
            } else if (const auto* loc = std::get_if<LocationParams>(&g)) {
                os << "(precision " << loc->precision << ")";
            } else if (const auto* date = std::get_if<DateParams>(&g)) {
                os << "(" << DateUtils::granularityName(date->granularity) << ")";
            } else if (const auto* addr = std::get_if<AddressParams>(&g)) {
                os << "(" << addressLevelName(addr->level) << ")";
            } else if (const auto* ip = std::get_if<IpParams>(&g)) {
                os << "(" << ip->octets << " octets)";
            }
            break;
        }
        default:
            break;
    }
    return os.str();
}

RuleConfig buildRule(const std::string& piiType,
                     const std::string& strategy,
                     const std::map<std::string, std::string>& parameters) {
    const auto kind = parseStrategy(strategy);
    if (!kind) {
        throw Obscura::ConfigurationException("Unknown strategy '" + strategy + "' for rule '" + piiType +
                                              "' (expected hash, redact_full, redact_partial, pseudonymize, generalize)");
    }

    RuleConfig rule;
    rule.piiType = piiType;
    switch (*kind) {
        case StrategyKind::HASH: rule.params = buildHash(piiType, parameters); break;
        case StrategyKind::REDACT_FULL: rule.params = buildRedactFull(piiType, parameters); break;
        case StrategyKind::REDACT_PARTIAL: rule.params = buildRedactPartial(piiType, parameters); break;
        case StrategyKind::PSEUDONYMIZE: rule.params = buildPseudonymize(piiType, parameters); break;
        case StrategyKind::GENERALIZE: rule.params = buildGeneralize(piiType, parameters); break;
    }

    try {
        validateParameters(rule);
    } catch (const Obscura::InvalidParameterError& ex) {
        throw Obscura::ConfigurationException(ex.what());
    }
    return rule;
}

void validateParameters(const RuleConfig& rule) {
    const std::string& pii = rule.piiType;
    if (const auto* gen = std::get_if<GeneralizeSpec>(&rule.params)) {
        if (const auto* n = std::get_if<NumericBinParams>(&gen->params)) {
            if (!std::isfinite(n->binSize) || n->binSize <= 0.0) {
                throw Obscura::InvalidParameterError("bin_size must be > 0 for '" + pii + "'");
            }
            if (!std::isfinite(n->minValue) || !std::isfinite(n->maxValue) || !(n->minValue < n->maxValue)) {
                throw Obscura::InvalidParameterError("min_value must be < max_value for '" + pii + "'");
            }
            if (!((n->maxValue - n->minValue) / n->binSize <= kMaxNumericBins)) {
                throw Obscura::InvalidParameterError("bin_size is too small for [min_value, max_value] of '" + pii +
                                                     "' (more than 1000000 bins)");
            }
        } else if (const auto* l = std::get_if<LocationParams>(&gen->params)) {
            if (l->precision < 1) throw Obscura::InvalidParameterError("precision must be >= 1 for '" + pii + "'");
        } else if (const auto* ip = std::get_if<IpParams>(&gen->params)) {
            if (ip->octets < 1 || ip->octets > 4) {
                throw Obscura::InvalidParameterError("octets must be in 1..4 for '" + pii + "'");
            }
        }
    } else if (const auto* rp = std::get_if<RedactPartialParams>(&rule.params)) {
        if (rp->maskChar == '\0') throw Obscura::InvalidParameterError("mask_char must be set for '" + pii + "'");
    }
}

RuleSet parseRuleText(const std::string& text, const std::string& sourceName) {
    RuleSet out;
    std::map<std::string, std::string> strategies;
    std::map<std::string, ParamMap> parameters;
    std::map<std::string, size_t> firstLine;

    for (const auto& entry : ConfigUtils::readKeyValueLines(text, sourceName)) {
        const std::string where = sourceName + ":" + std::to_string(entry.lineNo) + ": ";
        const std::string lowerKey = CommonUtils::toLower(entry.key);
        try {
            if (lowerKey == "handle_nulls") {
                out.global.handleNulls = ConfigUtils::parseBoolStrict(entry.value, entry.key);
            } else if (lowerKey == "null_replacement") {
                out.global.nullReplacement = entry.value;
            } else if (lowerKey == "preserve_data_types") {
                out.global.preserveDataTypes = ConfigUtils::parseBoolStrict(entry.value, entry.key);
            } else if (lowerKey == "case_sensitive") {
                out.global.caseSensitive = ConfigUtils::parseBoolStrict(entry.value, entry.key);
            } else if (lowerKey == "seed") {
                out.global.seed = ConfigUtils::parseUInt64Strict(entry.value, entry.key);
            } else if (lowerKey.rfind("rule.", 0) == 0) {
                const std::string rest = entry.key.substr(5);
                const size_t dot = rest.rfind('.');
                if (dot == std::string::npos || dot == 0 || dot + 1 == rest.size()) {
                    throw Obscura::ConfigurationException("expected rule.<pii_type>.<param>, got '" + entry.key + "'");
                }
                const std::string piiType = rest.substr(0, dot);
                const std::string param = CommonUtils::toLower(rest.substr(dot + 1));
                firstLine.emplace(piiType, entry.lineNo);
                if (param == "strategy") {
                    strategies[piiType] = entry.value;
                } else if (!parameters[piiType].emplace(param, entry.value).second) {
                    throw Obscura::ConfigurationException("duplicate parameter '" + entry.key + "'");
                }
            } else if (lowerKey.rfind("column.", 0) == 0) {
                const std::string column = entry.key.substr(7);
                if (column.empty() || entry.value.empty()) {
                    throw Obscura::ConfigurationException("column mapping needs a column name and a pii type");
                }
                out.columnMapping[column] = entry.value;
            } else if (lowerKey.rfind("type.", 0) == 0) {
                const std::string column = CommonUtils::toLower(CommonUtils::trim(entry.key.substr(5)));
                const auto type = parseSemanticType(entry.value);
                if (column.empty() || !type) {
                    throw Obscura::ConfigurationException("invalid type override '" + entry.key + ": " + entry.value + "'");
                }
                out.typeOverrides[column] = *type;
            } else {
                throw Obscura::ConfigurationException("unknown key '" + entry.key + "'");
            }
        } catch (const Obscura::ConfigurationException& ex) {
            throw Obscura::ConfigurationException(where + ex.what());
        }
    }

    for (const auto& kv : parameters) {
        if (strategies.count(kv.first) == 0) {
            throw Obscura::ConfigurationException(sourceName + ":" + std::to_string(firstLine[kv.first]) +
                                                  ": rule '" + kv.first + "' has parameters but no strategy");
        }
    }
    for (const auto& kv : strategies) {
        auto params = parameters.find(kv.first);
        static const ParamMap kNoParams;
        out.rules.emplace(kv.first, buildRule(kv.first, kv.second, params == parameters.end() ? kNoParams : params->second));
    }

    for (const auto& kv : out.columnMapping) {
        if (out.rules.count(kv.second) == 0) {
            throw Obscura::ConfigurationException("Column '" + kv.first + "' maps to undefined rule '" + kv.second + "'");
        }
    }
    return out;
}

RuleSet loadRuleFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw Obscura::IOException("Could not open rule file: " + path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseRuleText(buffer.str(), path);
}

} // namespace RuleModel
