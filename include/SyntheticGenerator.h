#pragma once

#include "Cancellation.h"
#include "PrivacyConfig.h"
#include "PrivacyDataset.h"

#include <string>
#include <vector>

struct SyntheticAttributeResult {
    std::string attribute;
    // empirical | normal | frequency | redacted | missing
    std::string model;
    double missingRate = 0.0;
};

struct SyntheticReport {
    SyntheticMethod method = SyntheticMethod::COPULA;
    bool preserveDistributions = true;
    size_t sourceRecords = 0;
    size_t generatedRecords = 0;
    // Numeric attributes joined by the copula, in schema order.
    std::vector<std::string> correlatedAttributes;
    std::vector<SyntheticAttributeResult> attributes;
};

struct SyntheticResult {
    PrivacyDataset dataset;
    SyntheticReport report;
};

class SyntheticGenerator {
public:
    /**
     * @brief Draws a new dataset with the schema of data from per-attribute models fitted on its retained records.
     * @details Categorical attributes are sampled by observed frequency. Numeric and date attributes are sampled
     * from the empirical distribution or a normal fit; under COPULA their Pearson correlations are carried over
     * through a Gaussian copula. Missing cells keep their observed rate. Generated records have no source
     * record, so the result has its own lineage.
     * @throws Umbra::ConfigurationException for a non-positive or empty sample fraction.
     */
    static SyntheticResult generate(const PrivacyDataset& data,
                                    const SyntheticDataConfig& config,
                                    const CancelCheck& shouldCancel = {});

    // Cancellable form: polls shouldCancel every 4096 generated records.
    static RunOutcome<SyntheticResult> run(const PrivacyDataset& data,
                                           const SyntheticDataConfig& config,
                                           const CancelCheck& shouldCancel);
};
