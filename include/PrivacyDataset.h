#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class ColumnType { NUMERIC, CATEGORICAL, DATETIME };
enum class AttributeRole { IDENTIFIER, QUASI_IDENTIFIER, SENSITIVE, INSENSITIVE };

using ColumnStorage = std::variant<std::vector<double>, std::vector<std::string>, std::vector<int64_t>>;
using MissingMask = std::vector<uint8_t>;

struct TypedColumn {
    std::string name;
    ColumnType type = ColumnType::CATEGORICAL;
    AttributeRole role = AttributeRole::INSENSITIVE;
    ColumnStorage values = std::vector<std::string>{};
    MissingMask missing;
    // Type of the raw values before generalization; equals type for raw columns.
    ColumnType sourceType = ColumnType::CATEGORICAL;
    // Per-record generalization level. Empty means every record holds its raw value.
    std::vector<int> levels;

    int levelAt(size_t row) const { return levels.empty() ? 0 : levels[row]; }
};

TypedColumn makeNumericColumn(std::string name, std::vector<double> values, AttributeRole role = AttributeRole::INSENSITIVE);
TypedColumn makeCategoricalColumn(std::string name, std::vector<std::string> values, AttributeRole role = AttributeRole::INSENSITIVE);
TypedColumn makeDateColumn(std::string name, std::vector<int64_t> unixSeconds, AttributeRole role = AttributeRole::INSENSITIVE);
TypedColumn makeLabelColumn(const TypedColumn& source, std::vector<std::string> labels, MissingMask missing, std::vector<int> levels);

std::string roleName(AttributeRole role);
std::string columnTypeName(ColumnType type);
AttributeRole parseAttributeRole(const std::string& name);
ColumnType parseColumnType(const std::string& name);

/**
 * Immutable tabular container with role-tagged attributes.
 * Every transform returns a new PrivacyDataset; the source of each row in the
 * dataset it was derived from is kept so suppressed rows can be reconciled later.
 */
class PrivacyDataset {
public:
    /**
     * @brief Builds a dataset from aligned columns.
     * @pre at least one column, all columns the same length >= 1, unique names.
     * @throws Umbra::DatasetException on ragged, empty or duplicate columns.
     */
    explicit PrivacyDataset(std::vector<TypedColumn> columns);

    size_t rowCount() const noexcept { return rowCount_; }
    size_t colCount() const noexcept { return columns_.size(); }
    const std::vector<TypedColumn>& columns() const noexcept { return columns_; }
    const TypedColumn& column(size_t idx) const { return columns_.at(idx); }

    /**
     * @throws Umbra::DatasetException when the attribute is absent.
     */
    const TypedColumn& column(const std::string& name) const;
    int findColumnIndex(const std::string& name) const;
    size_t requireColumnIndex(const std::string& name) const;

    std::vector<std::string> namesWithRole(AttributeRole role) const;
    std::vector<size_t> indicesWithRole(AttributeRole role) const;

    bool isMissing(size_t row, size_t col) const { return columns_[col].missing[row] != 0; }
    std::string cellText(size_t row, size_t col) const;
    // Text usable as a grouping key; missing cells map to a reserved token.
    std::string cellKey(size_t row, size_t col) const;
    std::optional<double> numericValue(size_t row, size_t col) const;

    bool isSuppressed(size_t row) const noexcept { return !suppressed_.empty() && suppressed_[row] != 0; }
    size_t suppressedCount() const noexcept;
    std::vector<size_t> retainedRows() const;

    // Row i of this dataset derives from row sourceRows()[i] of a dataset with sourceRowCount() rows.
    const std::vector<size_t>& sourceRows() const noexcept { return sourceRows_; }
    size_t sourceRowCount() const noexcept { return sourceRowCount_; }

    PrivacyDataset withColumns(std::vector<TypedColumn> columns) const;
    PrivacyDataset withSuppressed(MissingMask suppressed) const;
    PrivacyDataset selectRows(const std::vector<size_t>& rows) const;
    PrivacyDataset withRole(const std::string& name, AttributeRole role) const;

    static const std::string& missingKey();

private:
    size_t rowCount_ = 0;
    std::vector<TypedColumn> columns_;
    MissingMask suppressed_;
    std::vector<size_t> sourceRows_;
    size_t sourceRowCount_ = 0;

    void validate() const;
};
