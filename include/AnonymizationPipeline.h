#pragma once

#include "Cancellation.h"
#include "DiversityEnforcer.h"
#include "Generalizer.h"
#include "HierarchyRegistry.h"
#include "NoiseEngine.h"
#include "PrivacyConfig.h"
#include "PrivacyDataset.h"
#include "SyntheticGenerator.h"

#include <optional>
#include <string>

struct AnonymizationResult {
    PrivacyDataset dataset;
    std::string technique;
    std::optional<GeneralizationReport> generalization;
    std::optional<DiversityReport> diversity;
    std::optional<ClosenessReport> closeness;
    std::optional<NoiseReport> noise;
    std::optional<SyntheticReport> synthetic;
};

class AnonymizationPipeline final {
public:
    /**
     * @brief Runs the technique selected by the active alternative of config.
     * @details l-diversity and t-closeness first generalize to their configured k, then enforce the
     * distributional criterion on the generalized dataset. Differential privacy perturbs the input directly; synthetic data replaces it with records drawn from fitted models.
     * Every stage validates its configuration before touching data.
     */
    static AnonymizationResult apply(const TechniqueConfig& config,
                                     const PrivacyDataset& data,
                                     const HierarchySet& hierarchies = {},
                                     const CancelCheck& shouldCancel = {});

    static RunOutcome<AnonymizationResult> run(const TechniqueConfig& config,
                                               const PrivacyDataset& data,
                                               const HierarchySet& hierarchies,
                                               const CancelCheck& shouldCancel);
};
