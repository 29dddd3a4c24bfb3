#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace CSVUtils {
// CSV tokenization and quoting. Type inference lives in DatasetLoader.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;
    size_t maxColumns = 20000;
};

void skipBOM(std::istream& is);

/**
 * @brief Reads one record, following quoted fields across line breaks.
 * @details Unquoted fields are trimmed of spaces and tabs; doubled quotes inside a quoted field
 * collapse to one. Returns an empty vector at end of input or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed = nullptr,
                                      bool* limitExceeded = nullptr,
                                      const ParseLimits& limits = ParseLimits{});

// Empty names become column_N; repeated names get _2, _3, ... suffixes.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

std::string quoteField(const std::string& value, char delimiter);
void writeRecord(std::ostream& os, const std::vector<std::string>& fields, char delimiter);
} // namespace CSVUtils
