#include "DatasetLoader.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "UmbraExceptions.h"

#include <fstream>
#include <set>

namespace {
ColumnType inferType(const std::vector<std::string>& cells, const std::vector<uint8_t>& missing) {
    bool numeric = true;
    bool datetime = true;
    size_t present = 0;
    for (size_t r = 0; r < cells.size() && (numeric || datetime); ++r) {
        if (missing[r]) continue;
        ++present;
        double d = 0.0;
        int64_t t = 0;
        if (numeric && !CommonUtils::parseDouble(cells[r], d)) numeric = false;
        if (datetime && !CommonUtils::parseIsoDateTime(cells[r], t)) datetime = false;
    }
    if (present == 0) return ColumnType::CATEGORICAL;
    if (numeric) return ColumnType::NUMERIC;
    if (datetime) return ColumnType::DATETIME;
    return ColumnType::CATEGORICAL;
}

TypedColumn buildColumn(const std::string& name,
                        ColumnType type,
                        AttributeRole role,
                        const std::vector<std::string>& cells,
                        const std::vector<uint8_t>& missing) {
    const size_t n = cells.size();
    TypedColumn col;
    switch (type) {
        case ColumnType::NUMERIC: {
            std::vector<double> values(n, 0.0);
            for (size_t r = 0; r < n; ++r) {
                if (missing[r]) continue;
                if (!CommonUtils::parseDouble(cells[r], values[r])) {
                    throw Umbra::DatasetException("column '" + name + "' row " + std::to_string(r + 1) +
                                                  ": '" + cells[r] + "' is not numeric");
                }
            }
            col = makeNumericColumn(name, std::move(values), role);
            break;
        }
        case ColumnType::DATETIME: {
            std::vector<int64_t> values(n, 0);
            for (size_t r = 0; r < n; ++r) {
                if (missing[r]) continue;
                if (!CommonUtils::parseIsoDateTime(cells[r], values[r])) {
                    throw Umbra::DatasetException("column '" + name + "' row " + std::to_string(r + 1) +
                                                  ": '" + cells[r] + "' is not an ISO date");
                }
            }
            col = makeDateColumn(name, std::move(values), role);
            break;
        }
        case ColumnType::CATEGORICAL: {
            std::vector<std::string> values(n);
            for (size_t r = 0; r < n; ++r) {
                if (!missing[r]) values[r] = cells[r];
            }
            col = makeCategoricalColumn(name, std::move(values), role);
            break;
        }
    }
    for (size_t r = 0; r < n; ++r) {
        if (missing[r]) col.missing[r] = 1;
    }
    return col;
}
} // namespace

bool DatasetLoader::isMissingToken(const std::string& raw) {
    std::string s = CommonUtils::trim(raw);
    if (s.empty()) return true;
    s = CommonUtils::toLower(std::move(s));
    return s == "na" || s == "n/a" || s == "null" || s == "none" || s == "nan" || s == "missing";
}

PrivacyDataset DatasetLoader::load(const std::string& path,
                                   char delimiter,
                                   const std::map<std::string, AttributeRole>& roles,
                                   const std::map<std::string, ColumnType>& types) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Umbra::IOException("Could not open file: " + path);

    CSVUtils::skipBOM(in);

    bool malformed = false;
    bool limitExceeded = false;
    auto header = CSVUtils::parseCSVLine(in, delimiter, &malformed, &limitExceeded);
    if (malformed || limitExceeded || header.empty()) throw Umbra::DatasetException("Malformed or empty CSV header");
    header = CSVUtils::normalizeHeader(header);

    const std::set<std::string> names(header.begin(), header.end());
    for (const auto& kv : roles) {
        if (!names.count(kv.first)) {
            throw Umbra::ConfigurationException("role given for unknown column '" + kv.first + "'", kv.first);
        }
    }
    for (const auto& kv : types) {
        if (!names.count(kv.first)) {
            throw Umbra::ConfigurationException("type given for unknown column '" + kv.first + "'", kv.first);
        }
    }

    std::vector<std::vector<std::string>> cells(header.size());
    std::vector<std::vector<uint8_t>> missing(header.size());
    size_t record = 1;
    while (in.peek() != EOF) {
        ++record;
        auto row = CSVUtils::parseCSVLine(in, delimiter, &malformed, &limitExceeded);
        if (limitExceeded) throw Umbra::DatasetException("record " + std::to_string(record) + " exceeds parse limits");
        if (malformed) throw Umbra::DatasetException("record " + std::to_string(record) + " has an unterminated quote");
        if (row.empty()) continue;
        if (row.size() > header.size()) {
            throw Umbra::DatasetException("record " + std::to_string(record) + " has " + std::to_string(row.size()) +
                                          " fields, header has " + std::to_string(header.size()));
        }
        row.resize(header.size());
        for (size_t c = 0; c < header.size(); ++c) {
            const bool absent = isMissingToken(row[c]);
            missing[c].push_back(absent ? 1 : 0);
            cells[c].push_back(absent ? std::string() : std::move(row[c]));
        }
    }
    if (cells.front().empty()) throw Umbra::DatasetException("CSV has a header but no records: " + path);

    std::vector<TypedColumn> columns;
    columns.reserve(header.size());
    for (size_t c = 0; c < header.size(); ++c) {
        const auto typeIt = types.find(header[c]);
        const ColumnType type = typeIt != types.end() ? typeIt->second : inferType(cells[c], missing[c]);
        const auto roleIt = roles.find(header[c]);
        const AttributeRole role = roleIt != roles.end() ? roleIt->second : AttributeRole::INSENSITIVE;
        columns.push_back(buildColumn(header[c], type, role, cells[c], missing[c]));
    }
    return PrivacyDataset(std::move(columns));
}

void DatasetLoader::save(const PrivacyDataset& data, const std::string& path, char delimiter) {
    std::ofstream out(path, std::ios::binary);
    if (!out) throw Umbra::IOException("Could not write file: " + path);

    std::vector<std::string> fields;
    fields.reserve(data.colCount());
    for (const auto& col : data.columns()) fields.push_back(col.name);
    CSVUtils::writeRecord(out, fields, delimiter);

    for (size_t r = 0; r < data.rowCount(); ++r) {
        fields.clear();
        for (size_t c = 0; c < data.colCount(); ++c) fields.push_back(data.cellText(r, c));
        CSVUtils::writeRecord(out, fields, delimiter);
    }
    if (!out) throw Umbra::IOException("Failed while writing file: " + path);
}
