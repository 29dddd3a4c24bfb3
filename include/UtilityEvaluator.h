#pragma once

#include "Cancellation.h"
#include "PrivacyDataset.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

enum class UtilityMetric {
    STATISTICAL_SIMILARITY,
    CORRELATION_PRESERVATION,
    DISTRIBUTION_SIMILARITY,
    INFORMATION_PRESERVATION,
    CLASSIFICATION_UTILITY,
    QUERY_ACCURACY
};

enum class UtilityLevel { EXCELLENT, GOOD, FAIR, POOR, VERY_POOR };

struct UtilityOptions {
    std::vector<UtilityMetric> metrics = {
        UtilityMetric::STATISTICAL_SIMILARITY,   UtilityMetric::CORRELATION_PRESERVATION,
        UtilityMetric::DISTRIBUTION_SIMILARITY,  UtilityMetric::INFORMATION_PRESERVATION,
        UtilityMetric::CLASSIFICATION_UTILITY,   UtilityMetric::QUERY_ACCURACY};
    // Empty picks the first categorical attribute with 2 to 10 distinct values.
    std::string targetAttribute;
    uint32_t seed = 42;
    double testFraction = 0.3;
    size_t bins = 10;

    void validate(const PrivacyDataset& original) const;
};

struct AttributeUtility {
    std::string attribute;
    bool numeric = false;
    double statisticalSimilarity = 1.0;
    double distributionSimilarity = 1.0;
    double informationPreservation = 1.0;
};

struct UtilityReport {
    // Metric name -> score in [0,1]; 1 means perfect preservation.
    std::map<std::string, double> metrics;
    std::vector<AttributeUtility> attributes;
    std::string targetAttribute;
    double originalAccuracy = 0.0;
    double transformedAccuracy = 0.0;
    size_t alignedRecords = 0;
    size_t droppedRecords = 0;
    double overallUtility = 0.0;
    UtilityLevel level = UtilityLevel::EXCELLENT;
    std::vector<std::string> recommendations;

    double metric(const std::string& name) const;
    bool has(const std::string& name) const { return metrics.count(name) != 0; }
};

std::string utilityMetricName(UtilityMetric metric);
UtilityMetric parseUtilityMetric(const std::string& name);
std::string utilityLevelName(UtilityLevel level);

class UtilityEvaluator {
public:
    /**
     * @brief Compares a transformed dataset against the original it was derived from.
     * @details Records are aligned through the transformed dataset's source rows; suppressed or dropped
     * records are removed from both sides. Identifiers are ignored. Generalized bands and dates are read
     * at their midpoint for numeric comparisons.
     * @throws Umbra::ShapeMismatchException when rows or attributes cannot be reconciled.
     * @throws Umbra::ConfigurationException when the target attribute is not in the schema.
     */
    static UtilityReport evaluate(const PrivacyDataset& original,
                                  const PrivacyDataset& transformed,
                                  const UtilityOptions& options = UtilityOptions{},
                                  const CancelCheck& shouldCancel = {});

    static RunOutcome<UtilityReport> run(const PrivacyDataset& original,
                                         const PrivacyDataset& transformed,
                                         const UtilityOptions& options,
                                         const CancelCheck& shouldCancel);

    static UtilityLevel classify(double score) noexcept;
};
