#pragma once

#include "Cancellation.h"
#include "HierarchyRegistry.h"
#include "PrivacyConfig.h"
#include "PrivacyDataset.h"

#include <map>
#include <string>
#include <vector>

struct ClassCheck {
    std::vector<std::string> values;
    size_t size = 0;
    bool passed = false;
};

struct GeneralizationReport {
    size_t k = 1;
    RecodingPolicy recoding = RecodingPolicy::GLOBAL;
    SuppressionPolicy suppression = SuppressionPolicy::DROP;
    std::vector<std::string> attributes;
    // Final level per attribute; the highest record level under local recoding.
    std::vector<int> levels;
    std::vector<int> heights;
    std::vector<std::string> hierarchies;
    size_t suppressedCount = 0;
    size_t suppressionBudget = 0;
    size_t iterations = 0;
    // Mean normalized generalization level over retained records and attributes.
    double informationLoss = 0.0;
    std::vector<ClassCheck> classes;

    std::map<std::string, int> levelMap() const;
    int levelOf(const std::string& attribute) const;
};

struct GeneralizationResult {
    PrivacyDataset dataset;
    GeneralizationReport report;
};

class Generalizer {
public:
    /**
     * @brief Greedy hierarchy generalization followed by bounded suppression until every class has >= k records.
     * @details Each step raises the attribute whose next level merges the most violating classes per unit of
     * information loss; ties go to the attribute with the lowest current level, then schema order.
     * Quasi-identifiers without an explicit hierarchy use the registry or a type-based default.
     * Under CLUSTERING recoding records are grouped by MDAV microaggregation instead: numeric and date
     * values are replaced by their group mean and categorical labels rise to the group's common ancestor.
     * Nothing is suppressed on that path.
     * @throws Umbra::ConfigurationException on invalid configuration or values outside a hierarchy.
     * @throws Umbra::UnattainablePrivacyException when the remaining violators exceed the suppression limit.
     */
    static GeneralizationResult generalize(const PrivacyDataset& data,
                                           const HierarchySet& hierarchies,
                                           const KAnonymityConfig& config,
                                           const CancelCheck& shouldCancel = {});

    // Cancellable form: polls shouldCancel once per equivalence-class recomputation.
    static RunOutcome<GeneralizationResult> run(const PrivacyDataset& data,
                                                const HierarchySet& hierarchies,
                                                const KAnonymityConfig& config,
                                                const CancelCheck& shouldCancel);

    /**
     * @brief Applies fixed global levels without searching or suppressing.
     */
    static PrivacyDataset applyLevels(const PrivacyDataset& data,
                                      const HierarchySet& hierarchies,
                                      const std::map<std::string, int>& levels);

    /**
     * @brief Rebuilds a column from per-record labels; PrivacyDataset::missingKey() marks missing cells.
     * @details Returns the source column unchanged when every level is 0.
     */
    static TypedColumn recodeColumn(const TypedColumn& source,
                                    const std::vector<std::string>& labels,
                                    const std::vector<int>& levels);
};
