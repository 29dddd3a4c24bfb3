#include "PrivacyConfig.h"
#include "CommonUtils.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace {
void requireFraction(double value, const std::string& key) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw Umbra::ConfigurationException(key + " must be within [0,1], got " + CommonUtils::formatNumber(value));
    }
}

void requireSensitive(const PrivacyDataset& data, const std::string& attribute, const std::vector<std::string>& qis) {
    if (attribute.empty()) {
        throw Umbra::ConfigurationException("a sensitive attribute is required");
    }
    if (data.findColumnIndex(attribute) < 0) {
        throw Umbra::ConfigurationException("sensitive attribute '" + attribute + "' is not in the schema", attribute);
    }
    if (std::find(qis.begin(), qis.end(), attribute) != qis.end()) {
        throw Umbra::ConfigurationException("attribute '" + attribute + "' cannot be both sensitive and quasi-identifying", attribute);
    }
}

template <typename Enum>
Enum parseNamed(const std::string& raw, const std::vector<std::pair<std::string, Enum>>& names, const std::string& what) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(raw));
    std::replace(v.begin(), v.end(), '-', '_');
    std::string allowed;
    for (const auto& [name, value] : names) {
        if (v == name) return value;
        if (!allowed.empty()) allowed += ", ";
        allowed += name;
    }
    throw Umbra::ConfigurationException("unknown " + what + " '" + raw + "' (allowed: " + allowed + ")");
}
} // namespace

std::vector<std::string> resolveQuasiIdentifiers(const PrivacyDataset& data, const std::vector<std::string>& requested) {
    std::vector<std::string> qis = requested.empty() ? data.namesWithRole(AttributeRole::QUASI_IDENTIFIER) : requested;
    if (qis.empty()) {
        throw Umbra::ConfigurationException("at least one quasi-identifier is required");
    }
    std::set<std::string> seen;
    for (const auto& name : qis) {
        if (data.findColumnIndex(name) < 0) {
            throw Umbra::ConfigurationException("quasi-identifier '" + name + "' is not in the schema", name);
        }
        if (!seen.insert(name).second) {
            throw Umbra::ConfigurationException("quasi-identifier '" + name + "' listed twice", name);
        }
    }
    return qis;
}

std::vector<std::string> resolveNumericAttributes(const PrivacyDataset& data, const std::vector<std::string>& requested) {
    std::vector<std::string> out;
    if (requested.empty()) {
        for (const auto& col : data.columns()) {
            if (col.type == ColumnType::NUMERIC && col.role != AttributeRole::IDENTIFIER) out.push_back(col.name);
        }
        if (out.empty()) {
            throw Umbra::ConfigurationException("dataset has no numeric attributes to perturb");
        }
        return out;
    }
    for (const auto& name : requested) {
        const int idx = data.findColumnIndex(name);
        if (idx < 0) {
            throw Umbra::ConfigurationException("numeric attribute '" + name + "' is not in the schema", name);
        }
        if (data.column(static_cast<size_t>(idx)).type != ColumnType::NUMERIC) {
            throw Umbra::ConfigurationException("attribute '" + name + "' is not numeric", name);
        }
        if (std::find(out.begin(), out.end(), name) == out.end()) out.push_back(name);
    }
    return out;
}

void KAnonymityConfig::validate(const PrivacyDataset& data) const {
    if (k < 1) throw Umbra::ConfigurationException("k must be >= 1");
    requireFraction(suppressionLimit, "suppression limit");
    const auto qis = resolveQuasiIdentifiers(data, quasiIdentifiers);
    for (const auto& [name, level] : maxLevels) {
        if (std::find(qis.begin(), qis.end(), name) == qis.end()) {
            throw Umbra::ConfigurationException("max level given for '" + name + "' which is not a quasi-identifier", name);
        }
        if (level < 0) throw Umbra::ConfigurationException("max level for '" + name + "' must be >= 0", name);
    }
}

void LDiversityConfig::validate(const PrivacyDataset& data) const {
    if (l < 1) throw Umbra::ConfigurationException("l must be >= 1");
    if (method == DiversityMethod::RECURSIVE && !(c > 0.0 && std::isfinite(c))) {
        throw Umbra::ConfigurationException("recursive diversity constant c must be > 0");
    }
    requireFraction(suppressionLimit, "suppression limit");
    requireSensitive(data, sensitiveAttribute, resolveQuasiIdentifiers(data, quasiIdentifiers));
}

void TClosenessConfig::validate(const PrivacyDataset& data) const {
    if (!(t > 0.0) || t > 2.0 || !std::isfinite(t)) {
        throw Umbra::ConfigurationException("t must be within (0,2], got " + CommonUtils::formatNumber(t));
    }
    requireFraction(suppressionLimit, "suppression limit");
    if (k < 1) throw Umbra::ConfigurationException("k must be >= 1");
    requireSensitive(data, sensitiveAttribute, resolveQuasiIdentifiers(data, quasiIdentifiers));

    if (!ordinalOrder.empty()) {
        const size_t col = data.requireColumnIndex(sensitiveAttribute);
        const std::set<std::string> order(ordinalOrder.begin(), ordinalOrder.end());
        if (order.size() != ordinalOrder.size()) {
            throw Umbra::ConfigurationException("ordinal order for '" + sensitiveAttribute + "' repeats a value", sensitiveAttribute);
        }
        for (size_t r = 0; r < data.rowCount(); ++r) {
            if (data.isMissing(r, col)) continue;
            const std::string v = data.cellText(r, col);
            if (order.find(v) == order.end()) {
                throw Umbra::ConfigurationException("value '" + v + "' of '" + sensitiveAttribute + "' is missing from the ordinal order",
                                                    sensitiveAttribute);
            }
        }
    }
}

void DifferentialPrivacyConfig::validate(const PrivacyDataset& data) const {
    if (!(epsilon > 0.0) || !std::isfinite(epsilon)) {
        throw Umbra::ConfigurationException("epsilon must be > 0, got " + CommonUtils::formatNumber(epsilon));
    }
    if (!(sensitivity > 0.0) || !std::isfinite(sensitivity)) {
        throw Umbra::ConfigurationException("sensitivity must be > 0, got " + CommonUtils::formatNumber(sensitivity));
    }
    if (mechanism == NoiseMechanism::GAUSSIAN && !(delta > 0.0 && delta < 1.0)) {
        throw Umbra::ConfigurationException("delta must be within (0,1) for the Gaussian mechanism");
    }
    resolveNumericAttributes(data, numericAttributes);
}

void SyntheticDataConfig::validate(const PrivacyDataset& data) const {
    if (!(sampleFraction > 0.0) || !std::isfinite(sampleFraction)) {
        throw Umbra::ConfigurationException("sample fraction must be > 0, got " + CommonUtils::formatNumber(sampleFraction));
    }
    if (static_cast<size_t>(std::floor(sampleFraction * static_cast<double>(data.rowCount()))) == 0) {
        throw Umbra::ConfigurationException("sample fraction " + CommonUtils::formatNumber(sampleFraction) + " of " +
                                            std::to_string(data.rowCount()) + " records generates no records");
    }
    for (const auto& column : data.columns()) {
        if (column.role != AttributeRole::IDENTIFIER) return;
    }
    throw Umbra::ConfigurationException("synthetic data needs at least one attribute that is not an identifier");
}

std::string techniqueName(const TechniqueConfig& config) {
    switch (config.index()) {
        case 0: return "k-anonymity";
        case 1: return "l-diversity";
        case 2: return "t-closeness";
        case 3: return "differential-privacy";
        default: return "synthetic-data";
    }
}

std::string diversityMethodName(DiversityMethod method) {
    switch (method) {
        case DiversityMethod::DISTINCT: return "distinct";
        case DiversityMethod::ENTROPY: return "entropy";
        case DiversityMethod::RECURSIVE: return "recursive";
    }
    return "distinct";
}

std::string distanceMeasureName(DistanceMeasure measure) {
    switch (measure) {
        case DistanceMeasure::VARIATIONAL: return "variational";
        case DistanceMeasure::KL: return "kl";
        case DistanceMeasure::EARTH_MOVER: return "earth_mover";
    }
    return "variational";
}

std::string mechanismName(NoiseMechanism mechanism) {
    return mechanism == NoiseMechanism::LAPLACE ? "laplace" : "gaussian";
}

std::string compositionName(CompositionPolicy policy) {
    return policy == CompositionPolicy::PARALLEL ? "parallel" : "sequential";
}

std::string suppressionPolicyName(SuppressionPolicy policy) {
    return policy == SuppressionPolicy::DROP ? "drop" : "redact";
}

std::string recodingPolicyName(RecodingPolicy policy) {
    switch (policy) {
        case RecodingPolicy::GLOBAL: return "global";
        case RecodingPolicy::LOCAL: return "local";
        case RecodingPolicy::CLUSTERING: return "clustering";
    }
    return "global";
}

std::string syntheticMethodName(SyntheticMethod method) {
    return method == SyntheticMethod::STATISTICAL ? "statistical" : "copula";
}

DiversityMethod parseDiversityMethod(const std::string& name) {
    return parseNamed<DiversityMethod>(name, {{"distinct", DiversityMethod::DISTINCT},
                                              {"entropy", DiversityMethod::ENTROPY},
                                              {"recursive", DiversityMethod::RECURSIVE}},
                                       "diversity method");
}

DistanceMeasure parseDistanceMeasure(const std::string& name) {
    return parseNamed<DistanceMeasure>(name, {{"variational", DistanceMeasure::VARIATIONAL},
                                              {"kl", DistanceMeasure::KL},
                                              {"earth_mover", DistanceMeasure::EARTH_MOVER},
                                              {"emd", DistanceMeasure::EARTH_MOVER}},
                                       "distance measure");
}

NoiseMechanism parseNoiseMechanism(const std::string& name) {
    return parseNamed<NoiseMechanism>(name, {{"laplace", NoiseMechanism::LAPLACE}, {"gaussian", NoiseMechanism::GAUSSIAN}},
                                      "noise mechanism");
}

CompositionPolicy parseCompositionPolicy(const std::string& name) {
    return parseNamed<CompositionPolicy>(name, {{"parallel", CompositionPolicy::PARALLEL},
                                                {"sequential", CompositionPolicy::SEQUENTIAL}},
                                         "composition policy");
}

SuppressionPolicy parseSuppressionPolicy(const std::string& name) {
    return parseNamed<SuppressionPolicy>(name, {{"drop", SuppressionPolicy::DROP}, {"redact", SuppressionPolicy::REDACT}},
                                         "suppression policy");
}

RecodingPolicy parseRecodingPolicy(const std::string& name) {
    return parseNamed<RecodingPolicy>(name, {{"global", RecodingPolicy::GLOBAL},
                                             {"local", RecodingPolicy::LOCAL},
                                             {"clustering", RecodingPolicy::CLUSTERING}},
                                      "recoding policy");
}

SyntheticMethod parseSyntheticMethod(const std::string& name) {
    return parseNamed<SyntheticMethod>(name, {{"statistical", SyntheticMethod::STATISTICAL},
                                              {"copula", SyntheticMethod::COPULA}},
                                       "synthetic method");
}
