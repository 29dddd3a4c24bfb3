#include "HierarchyRegistry.h"
#include "CommonUtils.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>
#include <set>

namespace {
constexpr double kTargetBands = 20.0;

// Smallest 1/2/5 x 10^k not below x.
double niceWidth(double x) {
    if (!(x > 0.0)) return 1.0;
    const double exponent = std::floor(std::log10(x));
    const double base = std::pow(10.0, exponent);
    for (double m : {1.0, 2.0, 5.0, 10.0}) {
        if (m * base >= x) return m * base;
    }
    return 10.0 * base;
}

bool isDigitCode(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}
} // namespace

HierarchyRegistry& HierarchyRegistry::global() {
    static HierarchyRegistry registry;
    return registry;
}

void HierarchyRegistry::registerHierarchy(GeneralizationHierarchy hierarchy) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    const std::string key = hierarchy.attribute();
    hierarchies.insert_or_assign(key, std::move(hierarchy));
}

std::optional<GeneralizationHierarchy> HierarchyRegistry::find(const std::string& attribute) const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    auto it = hierarchies.find(attribute);
    if (it == hierarchies.end()) return std::nullopt;
    return it->second;
}

void HierarchyRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex);
    hierarchies.clear();
}

HierarchySet HierarchyRegistry::resolve(const PrivacyDataset& data,
                                        const std::vector<std::string>& attributes,
                                        const HierarchySet& explicitSet) const {
    HierarchySet out;
    for (const auto& name : attributes) {
        const size_t col = data.requireColumnIndex(name);
        if (auto it = explicitSet.find(name); it != explicitSet.end()) {
            out.emplace(name, it->second);
        } else if (auto registered = find(name)) {
            out.emplace(name, std::move(*registered));
        } else {
            out.emplace(name, inferDefault(data, col));
        }
    }
    return out;
}

GeneralizationHierarchy HierarchyRegistry::inferDefault(const PrivacyDataset& data, size_t col) {
    const TypedColumn& column = data.column(col);
    switch (column.sourceType) {
        case ColumnType::DATETIME:
            return GeneralizationHierarchy::dateLevels(column.name);
        case ColumnType::NUMERIC: {
            double lo = 0.0, hi = 0.0;
            bool any = false;
            for (size_t r = 0; r < data.rowCount(); ++r) {
                const auto v = data.numericValue(r, col);
                if (!v) continue;
                lo = any ? std::min(lo, *v) : *v;
                hi = any ? std::max(hi, *v) : *v;
                any = true;
            }
            const double range = hi - lo;
            double w = niceWidth(range / kTargetBands);
            std::vector<double> widths;
            while (true) {
                widths.push_back(w);
                if (w >= range) break;
                w *= 2.0;
            }
            return GeneralizationHierarchy::numericIntervals(column.name, std::move(widths));
        }
        case ColumnType::CATEGORICAL: {
            std::set<size_t> lengths;
            bool digits = true;
            for (size_t r = 0; r < data.rowCount() && digits; ++r) {
                if (data.isMissing(r, col)) continue;
                const std::string v = data.cellText(r, col);
                digits = isDigitCode(v);
                lengths.insert(v.size());
            }
            if (digits && lengths.size() == 1 && *lengths.begin() >= 3) {
                return GeneralizationHierarchy::suffixMasking(column.name, *lengths.begin() - 1);
            }
            return GeneralizationHierarchy::flat(column.name);
        }
    }
    return GeneralizationHierarchy::flat(column.name);
}

GeneralizationHierarchy HierarchyRegistry::fromSpec(const std::string& attribute, const std::string& spec) {
    const std::string s = CommonUtils::trim(spec);
    const size_t colon = s.find(':');
    const std::string kind = CommonUtils::toLower(CommonUtils::trim(s.substr(0, colon)));
    const std::string args = colon == std::string::npos ? "" : s.substr(colon + 1);

    if (kind == "intervals") {
        std::vector<double> widths;
        for (const auto& item : CommonUtils::splitList(args)) {
            double w = 0.0;
            if (!CommonUtils::parseDouble(item, w)) {
                throw Umbra::ConfigurationException("invalid interval width '" + item + "' for '" + attribute + "'", attribute);
            }
            widths.push_back(w);
        }
        return GeneralizationHierarchy::numericIntervals(attribute, std::move(widths));
    }
    if (kind == "mask") {
        double n = 0.0;
        if (!CommonUtils::parseDouble(args, n) || n < 1.0 || std::floor(n) != n) {
            throw Umbra::ConfigurationException("mask hierarchy for '" + attribute + "' expects a positive character count", attribute);
        }
        return GeneralizationHierarchy::suffixMasking(attribute, static_cast<size_t>(n));
    }
    if (kind == "date") return GeneralizationHierarchy::dateLevels(attribute);
    if (kind == "flat") return GeneralizationHierarchy::flat(attribute);
    throw Umbra::ConfigurationException("unknown hierarchy '" + spec + "' for '" + attribute +
                                            "' (allowed: intervals:<w1,w2,...>, mask:<n>, date, flat)",
                                        attribute);
}
