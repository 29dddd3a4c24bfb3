#pragma once

#include "HierarchyRegistry.h"
#include "PrivacyConfig.h"
#include "PrivacyDataset.h"
#include "RiskAssessor.h"
#include "UtilityEvaluator.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct UmbraConfig {
    std::string datasetPath;
    std::string outputPath;
    char delimiter = ',';
    bool verbose = true;

    std::string technique = "k-anonymity"; // k-anonymity|l-diversity|t-closeness|differential-privacy|synthetic-data

    // Attribute roles; the lists and role.<column> entries are merged.
    std::vector<std::string> quasiIdentifiers;
    std::vector<std::string> sensitiveAttributes;
    std::vector<std::string> identifiers;
    std::map<std::string, std::string> roleOverrides;
    std::map<std::string, std::string> typeOverrides;
    std::map<std::string, std::string> hierarchySpecs;
    std::map<std::string, int> maxLevels;

    int k = 5;
    double suppressionLimit = 0.05;
    std::string suppressionPolicy = "drop"; // drop|redact
    std::string recoding = "global";        // global|local|clustering
    bool acceptWithinSuppressionLimit = false;
    bool redactIdentifiers = true;

    int l = 2;
    std::string diversityMethod = "distinct"; // distinct|entropy|recursive
    double c = 2.0;

    double t = 0.2;
    std::string distance = "earth_mover"; // variational|kl|earth_mover
    std::vector<std::string> ordinalOrder;

    std::vector<std::string> numericAttributes;
    double epsilon = 1.0;
    double sensitivity = 1.0;
    std::string mechanism = "laplace";      // laplace|gaussian
    double delta = 1e-5;
    bool boundedDomain = false;
    std::string composition = "parallel";   // parallel|sequential
    std::optional<uint32_t> seed;

    std::string syntheticMethod = "copula"; // statistical|copula
    double sampleFraction = 1.0;
    bool preserveDistributions = true;

    std::string attackerModel = "prosecutor"; // prosecutor|journalist|marketer
    int sampleSize = 0;                       // 0 => whole dataset
    double samplingFraction = 1.0;
    int kThreshold = 5;
    uint32_t riskSeed = 1337;

    std::string targetColumn;
    double testFraction = 0.3;
    uint32_t utilitySeed = 42;

    /**
     * @brief Builds config from CLI args and an optional config file.
     * @pre argv[1] holds the dataset path.
     * @throws Umbra::ConfigurationException on invalid arguments or values.
     */
    static UmbraConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws Umbra::IOException when the file cannot be opened.
     * @throws Umbra::ConfigurationException on parse/validation failures.
     */
    static UmbraConfig fromFile(const std::string& configPath, const UmbraConfig& base);

    void validate() const;

    std::map<std::string, AttributeRole> columnRoles() const;
    std::map<std::string, ColumnType> columnTypes() const;

    // Sensitive attribute defaults to the first column tagged sensitive.
    TechniqueConfig toTechniqueConfig(const PrivacyDataset& data) const;
    RiskOptions toRiskOptions(const PrivacyDataset& data) const;
    UtilityOptions toUtilityOptions() const;
    HierarchySet buildHierarchies() const;
};
