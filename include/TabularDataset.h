#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class SemanticType { NUMERIC, CATEGORICAL, DATE, LOCATION, ADDRESS, IP_ADDRESS, FREE_TEXT };
using MissingMask = std::vector<uint8_t>;

const char* semanticTypeName(SemanticType type);
std::optional<SemanticType> parseSemanticType(const std::string& name);

/**
 * One named, row-aligned column. Values are kept as text; missing[i] != 0 marks a null cell
 * and values[i] then holds the source token ("", "N/A", ...) that is written back unchanged.
 */
struct DataColumn {
    std::string name;
    SemanticType type = SemanticType::CATEGORICAL;
    std::vector<std::string> values;
    MissingMask missing;

    size_t size() const noexcept { return values.size(); }
    bool isNull(size_t row) const { return row < missing.size() && missing[row] != 0; }
    size_t nonNullCount() const;
};

class TabularDataset {
public:
    TabularDataset() = default;
    explicit TabularDataset(std::string filename, char delimiter = ',');

    void setDelimiter(char delimiter) { delimiter_ = delimiter; }
    char delimiter() const noexcept { return delimiter_; }

    void setColumnTypeOverride(std::string columnNameLower, SemanticType type) { columnTypeOverrides_[std::move(columnNameLower)] = type; }
    void setColumnTypeOverrides(std::unordered_map<std::string, SemanticType> overrides) { columnTypeOverrides_ = std::move(overrides); }

    /**
     * @brief Loads CSV content and infers a semantic type per column.
     * @details Tokenization is delegated to CSVUtils; missing tokens become null cells
     *          that keep their original text.
     * @pre file exists and is readable.
     * @post columns() is populated with row-aligned values and missing masks.
     * @throws Obscura::IOException / Obscura::DatasetException on IO or parse failure.
     */
    void load();

    /**
     * @brief Writes the dataset as CSV; null cells are written as their stored token.
     * @throws Obscura::IOException when the file cannot be written.
     */
    void writeCsv(const std::string& path) const;

    /**
     * @brief Appends a column.
     * @throws Obscura::DatasetException on row-count mismatch or duplicate name.
     */
    void addColumn(DataColumn column);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }

    const std::vector<DataColumn>& columns() const noexcept { return columns_; }
    std::vector<DataColumn>& columns() noexcept { return columns_; }

    /**
     * @brief Returns index of named column or -1 when absent.
     */
    int findColumnIndex(const std::string& name) const;

    /**
     * @brief Infers a semantic type from a header and its non-null values.
     * @details Header keywords for location/address/free text take priority over value shape.
     */
    static SemanticType inferType(const std::string& header, const DataColumn& column);

private:
    std::string filename_;
    char delimiter_ = ',';
    std::unordered_map<std::string, SemanticType> columnTypeOverrides_;
    size_t rowCount_ = 0;
    std::vector<DataColumn> columns_;
};
