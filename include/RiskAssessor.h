#pragma once

#include "PrivacyDataset.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class AttackerModel { PROSECUTOR, JOURNALIST, MARKETER };
enum class RiskLevel { LOW, MEDIUM, HIGH };

struct RiskOptions {
    std::vector<std::string> quasiIdentifiers;
    std::vector<std::string> sensitiveAttributes;
    AttackerModel attackerModel = AttackerModel::PROSECUTOR;
    // Analyse a seeded subsample of this many records; clamped to the dataset size.
    std::optional<size_t> sampleSize;
    // Fraction of the population present in the data, used by the journalist model.
    std::optional<double> samplingFraction;
    size_t kThreshold = 5;
    uint32_t seed = 1337;

    void validate(const PrivacyDataset& data) const;
};

struct EquivalenceClassSummary {
    size_t size = 0;
    std::vector<std::string> representativeValues;
    double riskScore = 0.0;
};

struct SensitiveAttributeRisk {
    std::string attribute;
    size_t distinctValues = 0;
    // Mean chance of inferring the value from the class distribution.
    double disclosureRisk = 0.0;
    // Share of records in classes holding a single sensitive value.
    double homogeneityRisk = 0.0;
};

struct RiskReport {
    AttackerModel attackerModel = AttackerModel::PROSECUTOR;
    std::vector<std::string> quasiIdentifiers;
    std::map<std::string, double> metrics;
    // Ordered smallest class first.
    std::vector<EquivalenceClassSummary> classes;
    std::vector<SensitiveAttributeRisk> sensitiveRisks;
    RiskLevel level = RiskLevel::LOW;
    std::vector<std::string> recommendations;

    double metric(const std::string& name) const;
};

std::string attackerModelName(AttackerModel model);
AttackerModel parseAttackerModel(const std::string& name);
std::string riskLevelName(RiskLevel level);

class RiskAssessor {
public:
    /**
     * @brief Re-identification risk of the retained records over the quasi-identifiers.
     * @details Metrics: dataset_size, equivalence_class_count, min_class_size, max_class_size,
     * k_violations, records_in_violating_classes, unique_records, sample_uniqueness,
     * population_uniqueness, prosecutor_risk, journalist_risk, marketer_risk,
     * mean_record_risk, max_record_risk. Per-record figures follow the selected attacker model.
     * @throws Umbra::ConfigurationException when no quasi-identifier is given or an attribute is unknown.
     */
    static RiskReport assess(const PrivacyDataset& data, const RiskOptions& options);

    static RiskLevel classify(double risk) noexcept;
};
