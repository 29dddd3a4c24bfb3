#include "PrivacyDataset.h"
#include "CommonUtils.h"
#include "UmbraExceptions.h"

#include <numeric>
#include <unordered_set>

namespace {
size_t storageSize(const ColumnStorage& values) {
    return std::visit([](const auto& v) { return v.size(); }, values);
}

bool storageMatchesType(const TypedColumn& col) {
    switch (col.type) {
        case ColumnType::NUMERIC: return std::holds_alternative<std::vector<double>>(col.values);
        case ColumnType::DATETIME: return std::holds_alternative<std::vector<int64_t>>(col.values);
        case ColumnType::CATEGORICAL: return std::holds_alternative<std::vector<std::string>>(col.values);
    }
    return false;
}

template <typename T>
std::vector<T> pickRows(const std::vector<T>& src, const std::vector<size_t>& rows) {
    std::vector<T> out;
    out.reserve(rows.size());
    for (size_t r : rows) out.push_back(src[r]);
    return out;
}
} // namespace

TypedColumn makeNumericColumn(std::string name, std::vector<double> values, AttributeRole role) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::NUMERIC;
    col.sourceType = ColumnType::NUMERIC;
    col.role = role;
    col.missing.assign(values.size(), 0);
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) col.missing[i] = 1;
    }
    col.values = std::move(values);
    return col;
}

TypedColumn makeCategoricalColumn(std::string name, std::vector<std::string> values, AttributeRole role) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::CATEGORICAL;
    col.sourceType = ColumnType::CATEGORICAL;
    col.role = role;
    col.missing.assign(values.size(), 0);
    col.values = std::move(values);
    return col;
}

TypedColumn makeDateColumn(std::string name, std::vector<int64_t> unixSeconds, AttributeRole role) {
    TypedColumn col;
    col.name = std::move(name);
    col.type = ColumnType::DATETIME;
    col.sourceType = ColumnType::DATETIME;
    col.role = role;
    col.missing.assign(unixSeconds.size(), 0);
    col.values = std::move(unixSeconds);
    return col;
}

TypedColumn makeLabelColumn(const TypedColumn& source, std::vector<std::string> labels, MissingMask missing, std::vector<int> levels) {
    TypedColumn col;
    col.name = source.name;
    col.role = source.role;
    col.type = ColumnType::CATEGORICAL;
    col.sourceType = source.sourceType;
    col.values = std::move(labels);
    col.missing = std::move(missing);
    col.levels = std::move(levels);
    return col;
}

std::string roleName(AttributeRole role) {
    switch (role) {
        case AttributeRole::IDENTIFIER: return "identifier";
        case AttributeRole::QUASI_IDENTIFIER: return "quasi-identifier";
        case AttributeRole::SENSITIVE: return "sensitive";
        case AttributeRole::INSENSITIVE: return "insensitive";
    }
    return "insensitive";
}

std::string columnTypeName(ColumnType type) {
    switch (type) {
        case ColumnType::NUMERIC: return "numeric";
        case ColumnType::CATEGORICAL: return "categorical";
        case ColumnType::DATETIME: return "datetime";
    }
    return "categorical";
}

AttributeRole parseAttributeRole(const std::string& name) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    if (v == "identifier" || v == "id") return AttributeRole::IDENTIFIER;
    if (v == "quasi" || v == "quasi-identifier" || v == "quasi_identifier" || v == "qi") return AttributeRole::QUASI_IDENTIFIER;
    if (v == "sensitive") return AttributeRole::SENSITIVE;
    if (v == "insensitive" || v == "none") return AttributeRole::INSENSITIVE;
    throw Umbra::ConfigurationException("Unknown attribute role '" + name + "' (allowed: identifier, quasi, sensitive, insensitive)");
}

ColumnType parseColumnType(const std::string& name) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    if (v == "numeric") return ColumnType::NUMERIC;
    if (v == "categorical") return ColumnType::CATEGORICAL;
    if (v == "datetime" || v == "date") return ColumnType::DATETIME;
    throw Umbra::ConfigurationException("Unknown column type '" + name + "' (allowed: numeric, categorical, datetime)");
}

PrivacyDataset::PrivacyDataset(std::vector<TypedColumn> columns)
    : columns_(std::move(columns)) {
    if (columns_.empty()) {
        throw Umbra::DatasetException("dataset requires at least one attribute");
    }
    rowCount_ = storageSize(columns_.front().values);
    sourceRows_.resize(rowCount_);
    std::iota(sourceRows_.begin(), sourceRows_.end(), size_t{0});
    sourceRowCount_ = rowCount_;
    validate();
}

void PrivacyDataset::validate() const {
    if (rowCount_ == 0) {
        throw Umbra::DatasetException("dataset requires at least one record");
    }
    std::unordered_set<std::string> seen;
    for (const auto& col : columns_) {
        if (col.name.empty()) throw Umbra::DatasetException("attribute names must be non-empty");
        if (!seen.insert(col.name).second) {
            throw Umbra::DatasetException("duplicate attribute name '" + col.name + "'");
        }
        if (!storageMatchesType(col)) {
            throw Umbra::DatasetException("storage of '" + col.name + "' does not match its type " + columnTypeName(col.type));
        }
        if (storageSize(col.values) != rowCount_ || col.missing.size() != rowCount_) {
            throw Umbra::DatasetException("attribute '" + col.name + "' has " + std::to_string(storageSize(col.values)) +
                                          " values, expected " + std::to_string(rowCount_));
        }
        if (!col.levels.empty() && col.levels.size() != rowCount_) {
            throw Umbra::DatasetException("generalization levels of '" + col.name + "' are misaligned");
        }
    }
    if (!suppressed_.empty() && suppressed_.size() != rowCount_) {
        throw Umbra::DatasetException("suppression flags are misaligned with records");
    }
}

const TypedColumn& PrivacyDataset::column(const std::string& name) const {
    return columns_[requireColumnIndex(name)];
}

int PrivacyDataset::findColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

size_t PrivacyDataset::requireColumnIndex(const std::string& name) const {
    const int idx = findColumnIndex(name);
    if (idx < 0) throw Umbra::DatasetException("unknown attribute '" + name + "'");
    return static_cast<size_t>(idx);
}

std::vector<std::string> PrivacyDataset::namesWithRole(AttributeRole role) const {
    std::vector<std::string> out;
    for (const auto& col : columns_) {
        if (col.role == role) out.push_back(col.name);
    }
    return out;
}

std::vector<size_t> PrivacyDataset::indicesWithRole(AttributeRole role) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].role == role) out.push_back(i);
    }
    return out;
}

std::string PrivacyDataset::cellText(size_t row, size_t col) const {
    const TypedColumn& c = columns_[col];
    if (c.missing[row]) return "";
    switch (c.type) {
        case ColumnType::NUMERIC: return CommonUtils::formatExact(std::get<std::vector<double>>(c.values)[row]);
        case ColumnType::DATETIME: return CommonUtils::formatIsoDateTime(std::get<std::vector<int64_t>>(c.values)[row]);
        case ColumnType::CATEGORICAL: return std::get<std::vector<std::string>>(c.values)[row];
    }
    return "";
}

const std::string& PrivacyDataset::missingKey() {
    static const std::string key("\x01<missing>");
    return key;
}

std::string PrivacyDataset::cellKey(size_t row, size_t col) const {
    if (columns_[col].missing[row]) return missingKey();
    return cellText(row, col);
}

std::optional<double> PrivacyDataset::numericValue(size_t row, size_t col) const {
    const TypedColumn& c = columns_[col];
    if (c.missing[row]) return std::nullopt;
    switch (c.type) {
        case ColumnType::NUMERIC: return std::get<std::vector<double>>(c.values)[row];
        case ColumnType::DATETIME: return static_cast<double>(std::get<std::vector<int64_t>>(c.values)[row]);
        case ColumnType::CATEGORICAL: {
            double parsed = 0.0;
            if (CommonUtils::parseDouble(std::get<std::vector<std::string>>(c.values)[row], parsed)) return parsed;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

size_t PrivacyDataset::suppressedCount() const noexcept {
    size_t n = 0;
    for (uint8_t s : suppressed_) n += (s != 0);
    return n;
}

std::vector<size_t> PrivacyDataset::retainedRows() const {
    std::vector<size_t> rows;
    rows.reserve(rowCount_);
    for (size_t r = 0; r < rowCount_; ++r) {
        if (!isSuppressed(r)) rows.push_back(r);
    }
    return rows;
}

PrivacyDataset PrivacyDataset::withColumns(std::vector<TypedColumn> columns) const {
    PrivacyDataset out(*this);
    out.columns_ = std::move(columns);
    if (out.columns_.empty()) throw Umbra::DatasetException("dataset requires at least one attribute");
    out.validate();
    return out;
}

PrivacyDataset PrivacyDataset::withSuppressed(MissingMask suppressed) const {
    PrivacyDataset out(*this);
    out.suppressed_ = std::move(suppressed);
    out.validate();
    return out;
}

PrivacyDataset PrivacyDataset::selectRows(const std::vector<size_t>& rows) const {
    for (size_t r : rows) {
        if (r >= rowCount_) throw Umbra::DatasetException("row index " + std::to_string(r) + " out of range");
    }
    std::vector<TypedColumn> cols;
    cols.reserve(columns_.size());
    for (const auto& src : columns_) {
        TypedColumn col = src;
        std::visit([&](auto& v) { v = pickRows(v, rows); }, col.values);
        col.missing = pickRows(src.missing, rows);
        if (!src.levels.empty()) col.levels = pickRows(src.levels, rows);
        cols.push_back(std::move(col));
    }

    PrivacyDataset out(*this);
    out.columns_ = std::move(cols);
    out.rowCount_ = rows.size();
    out.sourceRows_ = pickRows(sourceRows_, rows);
    out.suppressed_ = suppressed_.empty() ? MissingMask{} : pickRows(suppressed_, rows);
    out.validate();
    return out;
}

PrivacyDataset PrivacyDataset::withRole(const std::string& name, AttributeRole role) const {
    std::vector<TypedColumn> cols = columns_;
    cols[requireColumnIndex(name)].role = role;
    return withColumns(std::move(cols));
}
