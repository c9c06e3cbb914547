#include "RunConfig.h"
#include "CommonUtils.h"
#include "ConfigUtils.h"
#include "ObscuraExceptions.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    for (char& c : key) {
        if (c == '-') c = '_';
    }
    return key;
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Obscura::ConfigurationException(key + " expects a single character");
    return value.front();
}

void assignKeyValue(RunConfig& config, const std::string& key, const std::string& value) {
    if (key == "rules") {
        config.rulesPath = value;
    } else if (key == "output") {
        config.outputPath = value;
    } else if (key == "report") {
        config.reportPath = value;
    } else if (key == "delimiter") {
        config.delimiter = parseDelimiter(value, key);
    } else if (key == "seed") {
        config.seed = ConfigUtils::parseUInt64Strict(value, key);
    } else if (key == "verbose") {
        config.verbose = ConfigUtils::parseBoolStrict(value, key);
    } else if (key == "weight_distribution") {
        config.weights.distribution = ConfigUtils::parseDoubleStrict(value, key);
    } else if (key == "weight_correlation") {
        config.weights.correlation = ConfigUtils::parseDoubleStrict(value, key);
    } else if (key == "weight_information_loss") {
        config.weights.informationLoss = ConfigUtils::parseDoubleStrict(value, key);
    } else {
        throw Obscura::ConfigurationException("Unknown option: " + key);
    }
}
} // namespace

std::string RunConfig::usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " <dataset.csv> --rules <rules.conf> [options]\n"
       << "Options:\n"
       << "  --rules <path>                   Rule file (strategies, column mapping, global options)\n"
       << "  --output <path>                  Anonymized CSV (default: <dataset>_anonymized.csv)\n"
       << "  --report <path>                  Markdown utility report\n"
       << "  --delimiter <char>               CSV delimiter (default ',')\n"
       << "  --seed <n>                       Pseudonymization seed, overrides the rule file\n"
       << "  --weight-distribution <w>        Overall score weight (default 0.4)\n"
       << "  --weight-correlation <w>         Overall score weight (default 0.3)\n"
       << "  --weight-information-loss <w>    Overall score weight (default 0.3)\n"
       << "  --config <path>                  key: value file with the options above\n"
       << "  --verbose                        Print per-phase progress\n"
       << "  --help                           Show this help message\n";
    return os.str();
}

RunConfig::RunConfig() = default;

RunConfig RunConfig::fromArgs(int argc, char* argv[]) {
    RunConfig config;
    if (argc < 2) {
        throw Obscura::ConfigurationException(usage(argc > 0 ? argv[0] : "obscura"));
    }

    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) throw Obscura::ConfigurationException(arg + " expects a value");
            assignKeyValue(config, normalizeConfigKey(arg.substr(2)), argv[++i]);
        } else if (config.datasetPath.empty()) {
            config.datasetPath = arg;
        } else {
            throw Obscura::ConfigurationException("Unexpected argument: " + arg);
        }
    }

    if (!configPath.empty()) {
        config = fromFile(configPath, config);
    }

    if (config.outputPath.empty() && !config.datasetPath.empty()) {
        const std::filesystem::path p(config.datasetPath);
        config.outputPath = (p.parent_path() / (p.stem().string() + "_anonymized.csv")).string();
    }

    config.validate();
    return config;
}

RunConfig RunConfig::fromFile(const std::string& configPath, const RunConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Obscura::ConfigurationException("Could not open config file: " + configPath);
    std::ostringstream buffer;
    buffer << in.rdbuf();

    RunConfig config = base;
    for (const auto& entry : ConfigUtils::readKeyValueLines(buffer.str(), configPath)) {
        try {
            assignKeyValue(config, normalizeConfigKey(entry.key), entry.value);
        } catch (const Obscura::ObscuraException& ex) {
            throw Obscura::ConfigurationException("Config parse error at line " + std::to_string(entry.lineNo) +
                                                  ": '" + entry.key + "' -> " + ex.what());
        }
    }
    return config;
}

void RunConfig::validate() const {
    if (datasetPath.empty()) {
        throw Obscura::ConfigurationException("dataset path is required");
    }
    if (rulesPath.empty()) {
        throw Obscura::ConfigurationException("--rules is required");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Obscura::ConfigurationException("delimiter cannot be a quote or newline");
    }
    const double ws[] = {weights.distribution, weights.correlation, weights.informationLoss};
    double total = 0.0;
    for (double w : ws) {
        if (!std::isfinite(w) || w < 0.0) {
            throw Obscura::ConfigurationException("utility weights must be finite and non-negative");
        }
        total += w;
    }
    if (total <= 0.0) {
        throw Obscura::ConfigurationException("at least one utility weight must be positive");
    }
}
