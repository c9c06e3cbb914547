#include "ConfigUtils.h"
#include "CommonUtils.h"
#include "ObscuraExceptions.h"

#include <cmath>
#include <sstream>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Obscura::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Obscura::ObscuraException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Obscura::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && c == '#') break;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}
} // namespace

namespace ConfigUtils {

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::vector<KeyValueLine> readKeyValueLines(const std::string& text, const std::string& sourceName) {
    std::vector<KeyValueLine> out;
    std::istringstream in(text);
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Obscura::ConfigurationException(sourceName + ":" + std::to_string(lineNo) +
                                                  ": expected 'key: value', got '" + line + "'");
        }

        KeyValueLine entry;
        entry.lineNo = lineNo;
        entry.key = maybeUnquote(line.substr(0, sep));
        entry.value = maybeUnquote(line.substr(sep + 1));
        if (entry.key.empty()) {
            throw Obscura::ConfigurationException(sourceName + ":" + std::to_string(lineNo) + ": empty key");
        }
        out.push_back(std::move(entry));
    }
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Obscura::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint64_t parseUInt64Strict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw Obscura::ConfigurationException("Value for " + key + " must be non-negative: " + value);
    }
    return parseNumericStrict<uint64_t>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return static_cast<uint64_t>(std::stoull(v, pos)); });
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) {
        throw Obscura::ConfigurationException("Value for " + key + " must be finite");
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Obscura::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

} // namespace ConfigUtils
