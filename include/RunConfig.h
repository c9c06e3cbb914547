#pragma once
#include "UtilityMetrics.h"

#include <cstdint>
#include <optional>
#include <string>

struct RunConfig {
    std::string datasetPath;
    std::string rulesPath;
    std::string outputPath;  // defaults to <dataset stem>_anonymized.csv
    std::string reportPath;  // markdown utility report; empty disables it
    char delimiter = ',';
    std::optional<uint64_t> seed; // overrides the rule file's seed
    bool verbose = false;
    bool showHelp = false;
    UtilityWeights weights;

    RunConfig();

    /**
     * @brief Parses `obscura <dataset.csv> --rules <file> [options]`.
     * @details A --config file is applied after the command line, as in fromFile().
     * @throws Obscura::ConfigurationException on unknown flags or malformed values.
     */
    static RunConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Applies `key: value` options (rules, output, report, delimiter, seed, verbose,
     *        weight_distribution, weight_correlation, weight_information_loss) on top of `base`.
     */
    static RunConfig fromFile(const std::string& configPath, const RunConfig& base = RunConfig{});

    static std::string usage(const std::string& program);

    void validate() const;
};
