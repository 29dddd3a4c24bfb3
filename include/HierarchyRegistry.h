#pragma once

#include "GeneralizationHierarchy.h"
#include "PrivacyDataset.h"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

using HierarchySet = std::map<std::string, GeneralizationHierarchy>;

/**
 * Process-wide named default hierarchies. Registration takes the write lock;
 * lookups only read, so concurrent engine calls are safe.
 */
class HierarchyRegistry {
public:
    static HierarchyRegistry& global();

    void registerHierarchy(GeneralizationHierarchy hierarchy);
    std::optional<GeneralizationHierarchy> find(const std::string& attribute) const;
    void clear();

    /**
     * @brief Completes an explicit set with registered or inferred hierarchies for each attribute.
     * @details Precedence: explicit set, registry entry, type-based default.
     * @throws Umbra::DatasetException when an attribute is absent from the dataset.
     */
    HierarchySet resolve(const PrivacyDataset& data,
                         const std::vector<std::string>& attributes,
                         const HierarchySet& explicitSet) const;

    // Numeric: doubling bands sized from the observed range. Date: calendar levels.
    // Categorical: suffix masking for fixed-width digit codes, flat otherwise.
    static GeneralizationHierarchy inferDefault(const PrivacyDataset& data, size_t col);

    /**
     * @brief Parses "intervals:5,10,20", "mask:3", "date" or "flat".
     * @throws Umbra::ConfigurationException on an unknown form.
     */
    static GeneralizationHierarchy fromSpec(const std::string& attribute, const std::string& spec);

private:
    mutable std::shared_mutex mutex;
    std::unordered_map<std::string, GeneralizationHierarchy> hierarchies;
};
