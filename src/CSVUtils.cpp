#include "CSVUtils.h"

#include <unordered_set>

namespace CSVUtils {
namespace {
std::string trimUnquotedField(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}
} // namespace

void skipBOM(std::istream& is) {
    static const unsigned char bom[] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;
    const std::streampos start = is.tellg();
    for (unsigned char expected : bom) {
        const int c = is.peek();
        if (c == EOF || static_cast<unsigned char>(c) != expected) {
            is.clear();
            is.seekg(start);
            return;
        }
        is.get();
    }
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      bool* malformed,
                                      bool* limitExceeded,
                                      const ParseLimits& limits) {
    if (malformed) *malformed = false;
    if (limitExceeded) *limitExceeded = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    bool exceeded = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) exceeded = true;
    };

    while (!exceeded && is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    val += '"';
                } else {
                    inQuotes = false;
                }
            } else if (c == '\r') {
                if (is.peek() == '\n') is.get();
                val += '\n';
            } else {
                val += c;
            }
        } else if (c == '"' && trimUnquotedField(val).empty()) {
            val.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            val += c;
        }
        if (limits.maxFieldBytes > 0 && val.size() > limits.maxFieldBytes) exceeded = true;
    }

    if (exceeded) {
        if (limitExceeded) *limitExceeded = true;
        return {};
    }
    if (inQuotes && malformed) *malformed = true;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(val).empty()) return {};
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out = header;
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i].empty()) out[i] = "column_" + std::to_string(i + 1);

        const std::string original = out[i];
        if (seen.count(out[i])) {
            size_t suffix = 2;
            while (seen.count(original + "_" + std::to_string(suffix))) ++suffix;
            out[i] = original + "_" + std::to_string(suffix);
        }
        seen.insert(out[i]);
    }
    return out;
}

std::string quoteField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos || value.find('"') != std::string::npos ||
                             value.find('\n') != std::string::npos || value.find('\r') != std::string::npos ||
                             (!value.empty() && (value.front() == ' ' || value.back() == ' '));
    if (!needsQuotes) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void writeRecord(std::ostream& os, const std::vector<std::string>& fields, char delimiter) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i) os << delimiter;
        os << quoteField(fields[i], delimiter);
    }
    os << '\n';
}
} // namespace CSVUtils
