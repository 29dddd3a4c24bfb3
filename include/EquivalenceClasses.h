#pragma once

#include "PrivacyDataset.h"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct EquivalenceClass {
    std::vector<std::string> values;
    std::vector<size_t> rows;

    size_t size() const noexcept { return rows.size(); }
};

struct ClassKeyHash {
    size_t operator()(const std::vector<uint32_t>& key) const noexcept;
};

namespace EquivalenceClasses {
/**
 * @brief Groups retained records by exact match on the given columns.
 * @details Suppressed records are skipped; only the listed rows are used when rows is non-null.
 * @post Classes are ordered by size ascending, then by key values.
 */
std::vector<EquivalenceClass> partition(const PrivacyDataset& data,
                                        const std::vector<size_t>& columns,
                                        const std::vector<size_t>* rows = nullptr);

/**
 * @brief Per-row class id for rows grouped by their code tuples.
 * @details codes[a][r] is the interned label of attribute a at row r. Only listed rows are grouped;
 * others get UINT32_MAX. classSizes receives the size of each class id.
 */
std::vector<uint32_t> groupCodes(const std::vector<const std::vector<uint32_t>*>& codes,
                                 const std::vector<size_t>& rows,
                                 std::vector<size_t>& classSizes);

// Interns labels to dense codes in order of first appearance.
class LabelInterner {
public:
    uint32_t intern(const std::string& label);
    const std::string& label(uint32_t code) const { return labels_[code]; }
    size_t size() const noexcept { return labels_.size(); }

private:
    std::unordered_map<std::string, uint32_t> codes_;
    std::vector<std::string> labels_;
};
}
