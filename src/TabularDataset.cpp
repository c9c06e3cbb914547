#include "TabularDataset.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "DateUtils.h"
#include "ObscuraExceptions.h"
#include <algorithm>
#include <fstream>

TabularDataset::TabularDataset(std::string filename, char delimiter)
    : filename_(std::move(filename)), delimiter_(delimiter) {}

const char* semanticTypeName(SemanticType type) {
    switch (type) {
        case SemanticType::NUMERIC: return "numeric";
        case SemanticType::CATEGORICAL: return "categorical";
        case SemanticType::DATE: return "date";
        case SemanticType::LOCATION: return "location";
        case SemanticType::ADDRESS: return "address";
        case SemanticType::IP_ADDRESS: return "ip";
        case SemanticType::FREE_TEXT: return "free_text";
    }
    return "unknown";
}

std::optional<SemanticType> parseSemanticType(const std::string& name) {
    const std::string n = CommonUtils::toLower(CommonUtils::trim(name));
    if (n == "numeric") return SemanticType::NUMERIC;
    if (n == "categorical") return SemanticType::CATEGORICAL;
    if (n == "date" || n == "datetime") return SemanticType::DATE;
    if (n == "location") return SemanticType::LOCATION;
    if (n == "address") return SemanticType::ADDRESS;
    if (n == "ip" || n == "ip_address") return SemanticType::IP_ADDRESS;
    if (n == "free_text" || n == "text") return SemanticType::FREE_TEXT;
    return std::nullopt;
}

size_t DataColumn::nonNullCount() const {
    size_t count = 0;
    for (size_t i = 0; i < values.size(); ++i) {
        if (!isNull(i)) ++count;
    }
    return count;
}

SemanticType TabularDataset::inferType(const std::string& header, const DataColumn& column) {
    size_t nonMissing = 0;
    size_t numericHits = 0;
    size_t dateHits = 0;
    size_t ipHits = 0;
    for (size_t i = 0; i < column.values.size(); ++i) {
        if (column.isNull(i)) continue;
        ++nonMissing;
        const std::string& v = column.values[i];
        double d = 0.0;
        DateUtils::CivilDate date;
        std::array<int, 4> octets{};
        if (CommonUtils::parseDouble(v, d)) {
            ++numericHits;
        } else if (DateUtils::parseDate(v, date)) {
            ++dateHits;
        } else if (CommonUtils::parseIpv4(v, octets)) {
            ++ipHits;
        }
    }
    if (nonMissing > 0 && ipHits == nonMissing) return SemanticType::IP_ADDRESS;

    const std::string h = CommonUtils::toLower(header);
    const bool emailHeader = CommonUtils::containsAny(h, {"email", "e-mail"});
    if (!emailHeader && CommonUtils::containsAny(h, {"address", "street"})) return SemanticType::ADDRESS;
    if (CommonUtils::containsAny(h, {"zip", "postal", "postcode", "latitude", "longitude", "lng", "coord"})) {
        return SemanticType::LOCATION;
    }
    if (CommonUtils::containsAny(h, {"note", "comment", "description", "remarks"})) return SemanticType::FREE_TEXT;

    if (nonMissing == 0) return SemanticType::CATEGORICAL;
    if (numericHits == nonMissing) return SemanticType::NUMERIC;
    if (dateHits == nonMissing) return SemanticType::DATE;
    return SemanticType::CATEGORICAL;
}

void TabularDataset::load() {
    std::ifstream in(filename_, std::ios::binary);
    if (!in) throw Obscura::IOException("Could not open file: " + filename_);

    CSVUtils::skipBOM(in);

    bool malformed = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter_, &malformed);
    if (malformed || header.empty()) throw Obscura::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);

    columns_.clear();
    columns_.resize(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        columns_[c].name = header[c];
    }

    rowCount_ = 0;
    size_t lineNo = 1;
    while (in.peek() != EOF) {
        ++lineNo;
        bool rowMalformed = false;
        bool limitExceeded = false;
        auto row = CSVUtils::parseCSVLine(in, delimiter_, &rowMalformed, &limitExceeded);
        if (limitExceeded) {
            throw Obscura::DatasetException("CSV parse limit exceeded near line " + std::to_string(lineNo));
        }
        if (rowMalformed) {
            throw Obscura::DatasetException("Unterminated quoted field near line " + std::to_string(lineNo));
        }
        if (row.empty()) continue;
        if (row.size() > header.size()) {
            throw Obscura::DatasetException("Row " + std::to_string(lineNo) + " has " + std::to_string(row.size()) +
                                            " fields, header has " + std::to_string(header.size()));
        }
        row.resize(header.size());

        for (size_t c = 0; c < header.size(); ++c) {
            const bool isMissing = CommonUtils::isMissingToken(row[c]);
            columns_[c].values.push_back(row[c]);
            columns_[c].missing.push_back(static_cast<uint8_t>(isMissing ? 1 : 0));
        }
        ++rowCount_;
    }

    for (auto& col : columns_) {
        const std::string key = CommonUtils::toLower(CommonUtils::trim(col.name));
        const auto it = columnTypeOverrides_.find(key);
        col.type = (it != columnTypeOverrides_.end()) ? it->second : inferType(col.name, col);
    }
}

void TabularDataset::writeCsv(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Obscura::IOException("Could not open output file: " + path);

    std::vector<std::string> fields;
    fields.reserve(columns_.size());
    for (const auto& col : columns_) fields.push_back(col.name);
    CSVUtils::writeCSVLine(out, fields, delimiter_);

    for (size_t r = 0; r < rowCount_; ++r) {
        fields.clear();
        for (const auto& col : columns_) {
            fields.push_back(col.values[r]);
        }
        CSVUtils::writeCSVLine(out, fields, delimiter_);
    }
    if (!out.good()) throw Obscura::IOException("Failed while writing output file: " + path);
}

void TabularDataset::addColumn(DataColumn column) {
    if (column.missing.size() != column.values.size()) {
        column.missing.resize(column.values.size(), static_cast<uint8_t>(0));
    }
    if (!columns_.empty() && column.values.size() != rowCount_) {
        throw Obscura::DatasetException("Column '" + column.name + "' has " + std::to_string(column.values.size()) +
                                        " rows, dataset has " + std::to_string(rowCount_));
    }
    if (findColumnIndex(column.name) >= 0) {
        throw Obscura::DatasetException("Duplicate column name: " + column.name);
    }
    rowCount_ = column.values.size();
    columns_.push_back(std::move(column));
}

int TabularDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}
