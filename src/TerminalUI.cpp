#include "TerminalUI.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace {
void printScoreCell(const MetricResult& result, int width) {
    if (result.computed()) {
        std::cout << std::right << std::setw(width) << std::fixed << std::setprecision(1) << result.score;
    } else {
        std::cout << std::right << std::setw(width) << "n/a";
    }
}
} // namespace

void TerminalUI::printRunSummary(const RunStatistics& stats, const std::vector<RunError>& errors) {
    std::cout << "\n============================================ ANONYMIZATION SUMMARY ==========================================\n";
    std::cout << "Columns processed : " << stats.columnsProcessed << "\n"
              << "Columns anonymized: " << stats.columnsAnonymized << "\n"
              << "Columns withheld  : " << stats.columnsFailed << "\n"
              << "Rows processed    : " << stats.rowsProcessed << "\n"
              << "Cells transformed : " << stats.cellsTransformed
              << " (clamped " << stats.clampedCells << ", null substitutions " << stats.nullSubstitutions << ")\n";
    for (const auto& e : errors) {
        std::cout << "  -> [" << e.kind << "] " << e.column << ": " << e.message << "\n";
    }
    std::cout << "============================================================================================================\n";
}

void TerminalUI::printUtilitySummary(const UtilityReport& report) {
    size_t maxNameLen = 15;
    for (const auto& c : report.columns) maxNameLen = std::max(maxNameLen, c.column.length());
    const int w = static_cast<int>(maxNameLen) + 2;

    std::cout << "\n============================================== UTILITY SUMMARY =============================================\n";
    std::cout << std::left
              << std::setw(w) << "Column"
              << std::setw(16) << "Strategy"
              << std::setw(14) << "Distribution"
              << std::setw(10) << "KS"
              << std::setw(14) << "Unique Ret."
              << std::setw(14) << "Entropy Ret."
              << "Info Loss\n";
    std::cout << std::string(static_cast<size_t>(w) + 16 + 14 * 3 + 10 + 10, '-') << "\n";

    for (const auto& c : report.columns) {
        std::cout << std::left << std::setw(w) << c.column << std::setw(16) << c.strategy;
        printScoreCell(c.distribution.result, 12);
        std::cout << "  ";
        if (c.distribution.result.computed()) {
            std::cout << std::right << std::setw(8) << std::fixed << std::setprecision(3) << c.distribution.ksStatistic;
        } else {
            std::cout << std::right << std::setw(8) << "n/a";
        }
        std::cout << "  ";
        if (c.informationLoss.result.computed()) {
            std::cout << std::setw(12) << std::setprecision(3) << c.informationLoss.uniqueRetained << "  "
                      << std::setw(12) << c.informationLoss.entropyRetained << "  ";
        } else {
            std::cout << std::setw(12) << "n/a" << "  " << std::setw(12) << "n/a" << "  ";
        }
        printScoreCell(c.informationLoss.result, 9);
        std::cout << "\n";
    }

    std::cout << "------------------------------------------------------------------------------------------------------------\n";
    std::cout << "Distribution preservation : ";
    printScoreCell(report.distribution, 6);
    std::cout << "\nCorrelation preservation  : ";
    printScoreCell(report.correlation.result, 6);
    std::cout << "\nInformation retained      : ";
    printScoreCell(report.informationLoss, 6);
    std::cout << "\nOverall utility score     : ";
    printScoreCell(report.overall, 6);
    std::cout << "  [" << report.band << "]\n";

    for (const auto& note : report.notes) std::cout << "  note: " << note << "\n";
    for (size_t i = 0; i < report.recommendations.size(); ++i) {
        std::cout << "  " << (i + 1) << ". " << report.recommendations[i] << "\n";
    }
    std::cout << "============================================================================================================\n";
}

void TerminalUI::printCorrelationMatrix(const std::vector<std::string>& columnNames, const std::vector<std::vector<double>>& matrix) {
    std::cout << "\n============================================ CORRELATION MATRIX ============================================\n";
    std::cout << std::setw(12) << " ";
    for (const auto& name : columnNames) {
        std::cout << std::right << std::setw(10) << name.substr(0, 9);
    }
    std::cout << "\n------------------------------------------------------------------------------------------------------------\n";
    for (size_t i = 0; i < columnNames.size() && i < matrix.size(); ++i) {
        std::cout << std::left << std::setw(12) << columnNames[i].substr(0, 11) << std::right;
        for (size_t j = 0; j < columnNames.size() && j < matrix[i].size(); ++j) {
            if (std::isfinite(matrix[i][j])) {
                std::cout << std::setw(10) << std::fixed << std::setprecision(2) << matrix[i][j];
            } else {
                std::cout << std::setw(10) << "n/a";
            }
        }
        std::cout << "\n";
    }
    std::cout << "============================================================================================================\n";
}
