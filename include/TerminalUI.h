#pragma once
#include "StrategyEngine.h"
#include "UtilityMetrics.h"
#include <string>
#include <vector>

class TerminalUI {
public:
    static void printRunSummary(const RunStatistics& stats, const std::vector<RunError>& errors);
    static void printUtilitySummary(const UtilityReport& report);
    static void printCorrelationMatrix(const std::vector<std::string>& columnNames, const std::vector<std::vector<double>>& matrix);
};
