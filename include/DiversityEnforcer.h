#pragma once

#include "Cancellation.h"
#include "HierarchyRegistry.h"
#include "PrivacyConfig.h"
#include "PrivacyDataset.h"
#include "Statistics.h"

#include <string>
#include <vector>

struct DiversityClassResult {
    std::vector<std::string> values;
    size_t size = 0;
    size_t distinctValues = 0;
    double entropy = 0.0;
    bool passed = false;
};

struct DiversityReport {
    std::string sensitiveAttribute;
    size_t l = 1;
    DiversityMethod method = DiversityMethod::DISTINCT;
    std::vector<std::string> attributes;
    std::vector<int> levels;
    std::vector<DiversityClassResult> classes;
    size_t mergesPerformed = 0;
    size_t suppressedCount = 0;
};

struct ClosenessClassResult {
    std::vector<std::string> values;
    size_t size = 0;
    double distance = 0.0;
    bool passed = false;
};

struct ClosenessReport {
    std::string sensitiveAttribute;
    double t = 0.0;
    DistanceMeasure measure = DistanceMeasure::EARTH_MOVER;
    // Earth mover distance falls back to variational distance when the attribute has no order.
    bool ordered = false;
    std::vector<std::string> attributes;
    std::vector<int> levels;
    // Distances are measured against the sensitive distribution of the input, before any class was suppressed.
    std::vector<ClosenessClassResult> classes;
    double maxDistance = 0.0;
    // Largest class distance to the distribution of the returned dataset; equals maxDistance when nothing was suppressed.
    double releasedMaxDistance = 0.0;
    size_t mergesPerformed = 0;
    size_t suppressedCount = 0;
};

struct DiversityResult {
    PrivacyDataset dataset;
    DiversityReport report;
};

struct ClosenessResult {
    PrivacyDataset dataset;
    ClosenessReport report;
};

class DiversityEnforcer {
public:
    /**
     * @brief Merges failing equivalence classes into their nearest neighbour until every class is l-diverse.
     * @details The smallest failing class is joined with the class reachable at the lowest weighted
     * generalization cost; both are lifted to the common hierarchy levels (local recoding).
     * @pre data is typically the output of Generalizer::generalize; raw data works too.
     * @throws Umbra::UnattainablePrivacyException when a single remaining class still fails.
     */
    static DiversityResult enforceLDiversity(const PrivacyDataset& data,
                                             const HierarchySet& hierarchies,
                                             const LDiversityConfig& config,
                                             const CancelCheck& shouldCancel = {});

    /**
     * @brief Same merge strategy with the class-to-global distance bounded by t.
     * @details The global distribution is taken from the input. Suppressing failing classes shifts the
     * released distribution; ClosenessReport::releasedMaxDistance measures classes against it.
     */
    static ClosenessResult enforceTCloseness(const PrivacyDataset& data,
                                             const HierarchySet& hierarchies,
                                             const TClosenessConfig& config,
                                             const CancelCheck& shouldCancel = {});

    static RunOutcome<DiversityResult> runLDiversity(const PrivacyDataset& data,
                                                     const HierarchySet& hierarchies,
                                                     const LDiversityConfig& config,
                                                     const CancelCheck& shouldCancel);
    static RunOutcome<ClosenessResult> runTCloseness(const PrivacyDataset& data,
                                                     const HierarchySet& hierarchies,
                                                     const TClosenessConfig& config,
                                                     const CancelCheck& shouldCancel);

    static bool isDiverse(const FrequencyTable& counts, size_t l, DiversityMethod method, double c);

    // Empty order means no ground order: earth mover reduces to variational distance.
    static double distance(const FrequencyTable& local,
                           const FrequencyTable& global,
                           DistanceMeasure measure,
                           const std::vector<std::string>& order);
};
