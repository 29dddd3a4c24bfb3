#include "EquivalenceClasses.h"

#include <algorithm>
#include <limits>
#include <map>
#include <unordered_map>

size_t ClassKeyHash::operator()(const std::vector<uint32_t>& key) const noexcept {
    size_t h = 1469598103934665603ULL;
    for (uint32_t v : key) {
        h ^= static_cast<size_t>(v) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return h;
}

uint32_t EquivalenceClasses::LabelInterner::intern(const std::string& label) {
    auto [it, inserted] = codes_.emplace(label, static_cast<uint32_t>(labels_.size()));
    if (inserted) labels_.push_back(label);
    return it->second;
}

std::vector<EquivalenceClass> EquivalenceClasses::partition(const PrivacyDataset& data,
                                                            const std::vector<size_t>& columns,
                                                            const std::vector<size_t>* rows) {
    std::map<std::vector<std::string>, std::vector<size_t>> groups;
    auto add = [&](size_t r) {
        if (data.isSuppressed(r)) return;
        std::vector<std::string> key;
        key.reserve(columns.size());
        for (size_t c : columns) key.push_back(data.cellKey(r, c));
        groups[std::move(key)].push_back(r);
    };
    if (rows) {
        for (size_t r : *rows) add(r);
    } else {
        for (size_t r = 0; r < data.rowCount(); ++r) add(r);
    }

    std::vector<EquivalenceClass> out;
    out.reserve(groups.size());
    for (auto& [key, members] : groups) {
        EquivalenceClass ec;
        ec.values = key;
        for (auto& v : ec.values) {
            if (v == PrivacyDataset::missingKey()) v.clear();
        }
        ec.rows = std::move(members);
        out.push_back(std::move(ec));
    }
    // groups iterate in key order, so a stable sort leaves equal sizes in key order.
    std::stable_sort(out.begin(), out.end(), [](const EquivalenceClass& a, const EquivalenceClass& b) {
        return a.size() < b.size();
    });
    return out;
}

std::vector<uint32_t> EquivalenceClasses::groupCodes(const std::vector<const std::vector<uint32_t>*>& codes,
                                                     const std::vector<size_t>& rows,
                                                     std::vector<size_t>& classSizes) {
    const size_t n = codes.empty() ? 0 : codes.front()->size();
    std::vector<uint32_t> classOf(n, std::numeric_limits<uint32_t>::max());
    classSizes.clear();

    std::unordered_map<std::vector<uint32_t>, uint32_t, ClassKeyHash> ids;
    ids.reserve(rows.size());
    std::vector<uint32_t> key(codes.size());
    for (size_t r : rows) {
        for (size_t a = 0; a < codes.size(); ++a) key[a] = (*codes[a])[r];
        auto [it, inserted] = ids.emplace(key, static_cast<uint32_t>(classSizes.size()));
        if (inserted) classSizes.push_back(0);
        ++classSizes[it->second];
        classOf[r] = it->second;
    }
    return classOf;
}
