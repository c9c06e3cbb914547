#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ConfigUtils {

struct KeyValueLine {
    size_t lineNo = 0;
    std::string key;   // trimmed, unquoted; case preserved
    std::string value; // trimmed, unquoted
};

/**
 * @brief Splits loose `key: value` text (YAML-ish or JSON-ish lines) into entries.
 * @details Blank lines and '#' comments are skipped; braces and trailing commas outside quotes are ignored.
 * @throws Obscura::ConfigurationException for a non-comment line without a ':' separator.
 */
std::vector<KeyValueLine> readKeyValueLines(const std::string& text, const std::string& sourceName);

std::string maybeUnquote(std::string value);

// Strict scalar parsing; every failure names the offending key.
int parseIntStrict(const std::string& value, const std::string& key, int minValue);
uint64_t parseUInt64Strict(const std::string& value, const std::string& key);
double parseDoubleStrict(const std::string& value, const std::string& key);
bool parseBoolStrict(const std::string& value, const std::string& key);

} // namespace ConfigUtils
