#pragma once

#include "PrivacyDataset.h"

#include <map>
#include <string>

class DatasetLoader {
public:
    /**
     * @brief Reads a CSV file with a header row into a typed, role-tagged dataset.
     * @details A column is numeric when every present value parses as a number, datetime when every
     * present value is an ISO date, categorical otherwise. Empty, na, n/a, null, none, nan and missing
     * are read as missing. Columns without a role are insensitive.
     * @throws Umbra::IOException when the file cannot be opened.
     * @throws Umbra::DatasetException on a malformed header or record, or a value that contradicts a type override.
     * @throws Umbra::ConfigurationException when a role or type names a column that is not in the header.
     */
    static PrivacyDataset load(const std::string& path,
                               char delimiter = ',',
                               const std::map<std::string, AttributeRole>& roles = {},
                               const std::map<std::string, ColumnType>& types = {});

    // Suppressed rows kept under REDACT are written as they are stored.
    static void save(const PrivacyDataset& data, const std::string& path, char delimiter = ',');

    static bool isMissingToken(const std::string& raw);
};
