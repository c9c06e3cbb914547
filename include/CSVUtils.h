#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization and writing. No semantic typing happens here.
struct ParseLimits {
	size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
	size_t maxRecordBytes = 64 * 1024 * 1024;         // 64 MiB
	size_t maxColumns = 20000;
};

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may span physical lines.
 * @post *malformed is set for an unterminated quote, *limitExceeded when a ParseLimits bound was hit.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
									  char delimiter,
									  bool* malformed = nullptr,
									  bool* limitExceeded = nullptr,
									  const ParseLimits& limits = ParseLimits{});

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

std::string quoteField(const std::string& value, char delimiter);
void writeCSVLine(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
}
