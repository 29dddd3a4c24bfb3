#pragma once

#include "PrivacyDataset.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// CLUSTERING groups records into clusters of k to 2k-1 nearest neighbours (MDAV microaggregation).
enum class RecodingPolicy { GLOBAL, LOCAL, CLUSTERING };
enum class SuppressionPolicy { DROP, REDACT };
enum class DiversityMethod { DISTINCT, ENTROPY, RECURSIVE };
enum class DistanceMeasure { VARIATIONAL, KL, EARTH_MOVER };
enum class NoiseMechanism { LAPLACE, GAUSSIAN };
// STATISTICAL samples every attribute independently; COPULA joins numeric attributes through a Gaussian copula.
enum class SyntheticMethod { STATISTICAL, COPULA };
// PARALLEL: every attribute spends the full epsilon. SEQUENTIAL: epsilon is split evenly across attributes.
enum class CompositionPolicy { PARALLEL, SEQUENTIAL };

struct KAnonymityConfig {
    // Empty means every attribute tagged quasi-identifier.
    std::vector<std::string> quasiIdentifiers;
    size_t k = 5;
    double suppressionLimit = 0.05;
    RecodingPolicy recoding = RecodingPolicy::GLOBAL;
    SuppressionPolicy suppression = SuppressionPolicy::DROP;
    // Stop raising levels once the remaining violators fit in the suppression budget.
    bool acceptWithinSuppressionLimit = false;
    bool redactIdentifiers = true;
    // Optional per-attribute ceiling below the hierarchy height.
    std::vector<std::pair<std::string, int>> maxLevels;

    void validate(const PrivacyDataset& data) const;
};

struct LDiversityConfig {
    std::string sensitiveAttribute;
    std::vector<std::string> quasiIdentifiers;
    size_t l = 2;
    DiversityMethod method = DiversityMethod::DISTINCT;
    // Recursive (c,l)-diversity constant.
    double c = 2.0;
    // Fraction of records that may be suppressed instead of merged.
    double suppressionLimit = 0.0;
    // k used for the generalization pass when run through the pipeline; 0 means l.
    size_t k = 0;

    void validate(const PrivacyDataset& data) const;
};

struct TClosenessConfig {
    std::string sensitiveAttribute;
    std::vector<std::string> quasiIdentifiers;
    double t = 0.2;
    DistanceMeasure measure = DistanceMeasure::EARTH_MOVER;
    // Ground order for a categorical sensitive attribute under earth mover distance.
    std::vector<std::string> ordinalOrder;
    double suppressionLimit = 0.0;
    size_t k = 1;

    void validate(const PrivacyDataset& data) const;
};

struct DifferentialPrivacyConfig {
    // Empty means every numeric attribute that is not an identifier.
    std::vector<std::string> numericAttributes;
    double epsilon = 1.0;
    double sensitivity = 1.0;
    NoiseMechanism mechanism = NoiseMechanism::LAPLACE;
    double delta = 1e-5;
    bool boundedDomain = false;
    CompositionPolicy composition = CompositionPolicy::PARALLEL;
    std::optional<uint32_t> seed;

    void validate(const PrivacyDataset& data) const;
};

struct SyntheticDataConfig {
    SyntheticMethod method = SyntheticMethod::COPULA;
    // Generated records as a fraction of the input records.
    double sampleFraction = 1.0;
    // true: numeric values are drawn from the empirical distribution; false: from a normal fit.
    bool preserveDistributions = true;
    bool redactIdentifiers = true;
    std::optional<uint32_t> seed;

    void validate(const PrivacyDataset& data) const;
};

using TechniqueConfig =
    std::variant<KAnonymityConfig, LDiversityConfig, TClosenessConfig, DifferentialPrivacyConfig, SyntheticDataConfig>;

std::vector<std::string> resolveQuasiIdentifiers(const PrivacyDataset& data, const std::vector<std::string>& requested);
std::vector<std::string> resolveNumericAttributes(const PrivacyDataset& data, const std::vector<std::string>& requested);

std::string techniqueName(const TechniqueConfig& config);
std::string diversityMethodName(DiversityMethod method);
std::string distanceMeasureName(DistanceMeasure measure);
std::string mechanismName(NoiseMechanism mechanism);
std::string compositionName(CompositionPolicy policy);
std::string suppressionPolicyName(SuppressionPolicy policy);
std::string recodingPolicyName(RecodingPolicy policy);
std::string syntheticMethodName(SyntheticMethod method);

DiversityMethod parseDiversityMethod(const std::string& name);
DistanceMeasure parseDistanceMeasure(const std::string& name);
NoiseMechanism parseNoiseMechanism(const std::string& name);
CompositionPolicy parseCompositionPolicy(const std::string& name);
SuppressionPolicy parseSuppressionPolicy(const std::string& name);
RecodingPolicy parseRecodingPolicy(const std::string& name);
SyntheticMethod parseSyntheticMethod(const std::string& name);
