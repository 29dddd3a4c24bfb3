#include "GeneralizationHierarchy.h"
#include "CommonUtils.h"
#include "UmbraExceptions.h"

#include <cmath>
#include <cstdio>

namespace {
constexpr double kMultipleTolerance = 1e-9;
constexpr int kDateHeight = 4;

bool parseBand(const std::string& label, double& lo, double& hi) {
    if (label.size() < 5 || label.front() != '[' || label.back() != ')') return false;
    const size_t comma = label.find(',');
    if (comma == std::string::npos) return false;
    return CommonUtils::parseDouble(std::string_view(label).substr(1, comma - 1), lo) &&
           CommonUtils::parseDouble(std::string_view(label).substr(comma + 1, label.size() - comma - 2), hi);
}

std::string bandLabel(double lo, double hi) {
    return "[" + CommonUtils::formatExact(lo) + ", " + CommonUtils::formatExact(hi) + ")";
}

// Reads year/month/day back out of a label produced at the given date level.
bool parseDateLabel(const std::string& label, int level, int& year, int& month, int& day) {
    month = 1;
    day = 1;
    switch (level) {
        case 0: {
            int64_t secs = 0;
            if (!CommonUtils::parseIsoDateTime(label, secs)) return false;
            unsigned m = 0, d = 0;
            int64_t days = secs / 86400;
            if (secs % 86400 < 0) --days;
            CommonUtils::civilFromDays(days, year, m, d);
            month = static_cast<int>(m);
            day = static_cast<int>(d);
            return true;
        }
        case 1:
            return label.size() == 7 && label[4] == '-' &&
                   CommonUtils::parseFixedInt(label, 0, 4, year) && CommonUtils::parseFixedInt(label, 5, 2, month) &&
                   month >= 1 && month <= 12;
        case 2:
            return label.size() == 4 && CommonUtils::parseFixedInt(label, 0, 4, year);
        case 3:
            return label.size() > 5 && label[0] == '[' && CommonUtils::parseFixedInt(label, 1, 4, year);
        default:
            return false;
    }
}
} // namespace

GeneralizationHierarchy::GeneralizationHierarchy(std::string attribute, HierarchyKind kind, int height)
    : attribute_(std::move(attribute)), kind_(kind), height_(height) {}

const std::string& GeneralizationHierarchy::suppressedLabel() {
    static const std::string star = "*";
    return star;
}

GeneralizationHierarchy GeneralizationHierarchy::fromTable(std::string attribute, const std::vector<std::vector<std::string>>& rows) {
    if (rows.empty()) {
        throw Umbra::ConfigurationException("hierarchy for '" + attribute + "' has no values", attribute);
    }
    const size_t width = rows.front().size();
    if (width < 2) {
        throw Umbra::ConfigurationException("hierarchy for '" + attribute + "' needs at least one generalized level", attribute);
    }
    bool allEndWithStar = true;
    for (const auto& row : rows) {
        if (row.size() != width) {
            throw Umbra::ConfigurationException("hierarchy for '" + attribute + "' has rows of different depth", attribute);
        }
        allEndWithStar = allEndWithStar && row.back() == suppressedLabel();
    }

    const int height = static_cast<int>(allEndWithStar ? width - 1 : width);
    GeneralizationHierarchy h(attribute, HierarchyKind::TABLE, height);
    h.parents_.resize(static_cast<size_t>(height));

    for (const auto& rowIn : rows) {
        std::vector<std::string> row = rowIn;
        if (!allEndWithStar) row.push_back(suppressedLabel());
        for (int j = 0; j < height; ++j) {
            const std::string& child = row[static_cast<size_t>(j)];
            const std::string& parent = row[static_cast<size_t>(j) + 1];
            auto [it, inserted] = h.parents_[static_cast<size_t>(j)].emplace(child, parent);
            if (!inserted && it->second != parent) {
                throw Umbra::ConfigurationException(
                    "hierarchy for '" + attribute + "' is not monotonic: '" + child + "' at level " + std::to_string(j) +
                    " generalizes to both '" + it->second + "' and '" + parent + "'",
                    attribute);
            }
        }
    }
    return h;
}

GeneralizationHierarchy GeneralizationHierarchy::numericIntervals(std::string attribute, std::vector<double> widths) {
    if (widths.empty()) {
        throw Umbra::ConfigurationException("interval hierarchy for '" + attribute + "' needs at least one width", attribute);
    }
    for (size_t i = 0; i < widths.size(); ++i) {
        if (!(widths[i] > 0.0) || !std::isfinite(widths[i])) {
            throw Umbra::ConfigurationException("interval widths for '" + attribute + "' must be positive", attribute);
        }
        if (i == 0) continue;
        const double ratio = widths[i] / widths[i - 1];
        if (ratio <= 1.0 || std::abs(ratio - std::round(ratio)) > kMultipleTolerance * ratio) {
            throw Umbra::ConfigurationException(
                "interval width " + CommonUtils::formatNumber(widths[i]) + " for '" + attribute +
                "' is not a larger multiple of " + CommonUtils::formatNumber(widths[i - 1]),
                attribute);
        }
    }
    GeneralizationHierarchy h(attribute, HierarchyKind::INTERVAL, static_cast<int>(widths.size()) + 1);
    h.widths_ = std::move(widths);
    return h;
}

GeneralizationHierarchy GeneralizationHierarchy::suffixMasking(std::string attribute, size_t maskedChars) {
    if (maskedChars == 0) {
        throw Umbra::ConfigurationException("mask hierarchy for '" + attribute + "' must mask at least one character", attribute);
    }
    GeneralizationHierarchy h(attribute, HierarchyKind::MASK, static_cast<int>(maskedChars) + 1);
    h.maskedChars_ = maskedChars;
    return h;
}

GeneralizationHierarchy GeneralizationHierarchy::dateLevels(std::string attribute) {
    return GeneralizationHierarchy(std::move(attribute), HierarchyKind::DATE, kDateHeight);
}

GeneralizationHierarchy GeneralizationHierarchy::flat(std::string attribute) {
    return GeneralizationHierarchy(std::move(attribute), HierarchyKind::FLAT, 1);
}

std::string GeneralizationHierarchy::describe() const {
    switch (kind_) {
        case HierarchyKind::TABLE: return "table(height=" + std::to_string(height_) + ")";
        case HierarchyKind::INTERVAL: {
            std::string out = "intervals(";
            for (size_t i = 0; i < widths_.size(); ++i) {
                if (i) out += ",";
                out += CommonUtils::formatNumber(widths_[i]);
            }
            return out + ")";
        }
        case HierarchyKind::MASK: return "mask(" + std::to_string(maskedChars_) + ")";
        case HierarchyKind::DATE: return "date";
        case HierarchyKind::FLAT: return "flat";
    }
    return "unknown";
}

void GeneralizationHierarchy::checkLevel(int level) const {
    if (level < 0 || level > height_) {
        throw Umbra::ConfigurationException(
            "level " + std::to_string(level) + " outside [0, " + std::to_string(height_) + "] for '" + attribute_ + "'",
            attribute_);
    }
}

std::string GeneralizationHierarchy::intervalLabel(double value, int level) const {
    const double w = widths_[static_cast<size_t>(level) - 1];
    const double lo = std::floor(value / w) * w;
    return bandLabel(lo, lo + w);
}

std::string GeneralizationHierarchy::dateLabel(int year, int month, int day, int level) const {
    char buf[32];
    switch (level) {
        case 0: std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day); return buf;
        case 1: std::snprintf(buf, sizeof(buf), "%04d-%02d", year, month); return buf;
        case 2: std::snprintf(buf, sizeof(buf), "%04d", year); return buf;
        case 3: {
            const int decade = year - ((year % 10) + 10) % 10;
            std::snprintf(buf, sizeof(buf), "[%04d, %04d)", decade, decade + 10);
            return buf;
        }
        default: return suppressedLabel();
    }
}

std::string GeneralizationHierarchy::generalize(const std::string& raw, int level) const {
    checkLevel(level);
    if (level == 0) return raw;
    if (level == height_) return suppressedLabel();

    switch (kind_) {
        case HierarchyKind::TABLE: return generalizeFrom(raw, 0, level);
        case HierarchyKind::INTERVAL: {
            double v = 0.0;
            if (!CommonUtils::parseDouble(raw, v)) {
                throw Umbra::ConfigurationException("value '" + raw + "' of '" + attribute_ + "' is not numeric", attribute_);
            }
            return intervalLabel(v, level);
        }
        case HierarchyKind::MASK: {
            std::string out = raw;
            const size_t n = std::min(out.size(), static_cast<size_t>(level));
            for (size_t i = out.size() - n; i < out.size(); ++i) out[i] = '*';
            return out;
        }
        case HierarchyKind::DATE: {
            int y = 0, m = 1, d = 1;
            if (!parseDateLabel(raw, 0, y, m, d)) {
                throw Umbra::ConfigurationException("value '" + raw + "' of '" + attribute_ + "' is not a date", attribute_);
            }
            return dateLabel(y, m, d, level);
        }
        case HierarchyKind::FLAT: return suppressedLabel();
    }
    return suppressedLabel();
}

std::string GeneralizationHierarchy::generalizeFrom(const std::string& label, int fromLevel, int toLevel) const {
    checkLevel(fromLevel);
    checkLevel(toLevel);
    if (toLevel < fromLevel) {
        throw Umbra::ConfigurationException("cannot specialize '" + label + "' of '" + attribute_ + "' from level " +
                                                std::to_string(fromLevel) + " to " + std::to_string(toLevel),
                                            attribute_);
    }
    if (toLevel == fromLevel) return label;
    if (toLevel == height_) return suppressedLabel();
    if (fromLevel == 0 && kind_ != HierarchyKind::TABLE) return generalize(label, toLevel);

    switch (kind_) {
        case HierarchyKind::TABLE: {
            std::string current = label;
            for (int j = fromLevel; j < toLevel; ++j) {
                const auto& level = parents_[static_cast<size_t>(j)];
                auto it = level.find(current);
                if (it == level.end()) {
                    throw Umbra::ConfigurationException(
                        "value '" + current + "' is not in the hierarchy of '" + attribute_ + "' at level " + std::to_string(j),
                        attribute_);
                }
                current = it->second;
            }
            return current;
        }
        case HierarchyKind::INTERVAL: {
            double lo = 0.0, hi = 0.0;
            if (!parseBand(label, lo, hi)) {
                throw Umbra::ConfigurationException("label '" + label + "' of '" + attribute_ + "' is not a band", attribute_);
            }
            return intervalLabel(0.5 * (lo + hi), toLevel);
        }
        case HierarchyKind::MASK: return generalize(label, toLevel);
        case HierarchyKind::DATE: {
            int y = 0, m = 1, d = 1;
            if (!parseDateLabel(label, fromLevel, y, m, d)) {
                throw Umbra::ConfigurationException("label '" + label + "' of '" + attribute_ + "' is not a level-" +
                                                        std::to_string(fromLevel) + " date label",
                                                    attribute_);
            }
            return dateLabel(y, m, d, toLevel);
        }
        case HierarchyKind::FLAT: return suppressedLabel();
    }
    return suppressedLabel();
}

std::optional<double> GeneralizationHierarchy::labelMidpoint(const std::string& label, ColumnType sourceType) {
    if (label.empty() || label.find('*') != std::string::npos) return std::nullopt;

    if (sourceType == ColumnType::DATETIME) {
        int64_t secs = 0;
        if (CommonUtils::parseIsoDateTime(label, secs)) return static_cast<double>(secs);
        int y = 0, m = 1, d = 1;
        auto span = [](int y0, int m0, int y1, int m1) {
            const double a = static_cast<double>(CommonUtils::daysFromCivil(y0, static_cast<unsigned>(m0), 1));
            const double b = static_cast<double>(CommonUtils::daysFromCivil(y1, static_cast<unsigned>(m1), 1));
            return 0.5 * (a + b) * 86400.0;
        };
        if (parseDateLabel(label, 1, y, m, d)) {
            return m == 12 ? span(y, 12, y + 1, 1) : span(y, m, y, m + 1);
        }
        if (parseDateLabel(label, 2, y, m, d)) return span(y, 1, y + 1, 1);
        if (parseDateLabel(label, 3, y, m, d)) return span(y, 1, y + 10, 1);
        return std::nullopt;
    }

    double v = 0.0;
    if (CommonUtils::parseDouble(label, v)) return v;
    double lo = 0.0, hi = 0.0;
    if (parseBand(label, lo, hi)) return 0.5 * (lo + hi);
    return std::nullopt;
}
