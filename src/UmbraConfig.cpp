#include "UmbraConfig.h"
#include "CommonUtils.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <set>
#include <unordered_map>

namespace {
const char* kUsage =
    "Usage: umbra <dataset.csv> [--config path] [--output path] [--delimiter ,] "
    "[--technique k-anonymity|l-diversity|t-closeness|differential-privacy|synthetic-data] "
    "[--quasi a,b] [--sensitive s] [--identifiers id] [--k N] [--suppression-limit 0..1] "
    "[--suppression drop|redact] [--recoding global|local|clustering] [--accept-within-limit true|false] "
    "[--l N] [--diversity distinct|entropy|recursive] [--c N] [--t 0..2] [--distance variational|kl|earth_mover] "
    "[--ordinal a,b,c] [--numeric a,b] [--epsilon N] [--sensitivity N] [--mechanism laplace|gaussian] "
    "[--delta 0..1] [--bounded true|false] [--composition parallel|sequential] [--seed N] "
    "[--synthetic-method statistical|copula] [--sample-fraction N] [--preserve-distributions true|false] "
    "[--attacker prosecutor|journalist|marketer] [--sample-size N] [--sampling-fraction 0..1] "
    "[--k-threshold N] [--target col] [--test-fraction 0..1] [--verbose true|false]";

std::vector<std::string> splitCSV(const std::string& s) {
    std::vector<std::string> out;
    for (const auto& item : CommonUtils::splitList(s, ',')) {
        std::string t = CommonUtils::trim(item);
        if (!t.empty()) out.push_back(t);
    }
    return out;
}

template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Umbra::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Umbra::UmbraException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Umbra::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Column-scoped keys keep the column name verbatim; everything else is lowered with '-' mapped to '_'.
std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::trim(key);
    const std::string lowered = CommonUtils::toLower(key);
    for (const char* prefix : {"role.", "type.", "hierarchy.", "max_level."}) {
        const std::string p(prefix);
        if (lowered.rfind(p, 0) == 0) return p + key.substr(p.size());
    }
    std::string out = lowered;
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw Umbra::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value[0] == '-') {
        throw Umbra::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw Umbra::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed) || parsed < minValue) {
        throw Umbra::ConfigurationException("Value for " + key + " must be >= " + CommonUtils::formatNumber(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Umbra::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string normalizeTechnique(const std::string& raw) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(raw));
    std::replace(v.begin(), v.end(), '_', '-');
    if (v == "k" || v == "k-anonymity" || v == "kanonymity") return "k-anonymity";
    if (v == "l" || v == "l-diversity" || v == "ldiversity") return "l-diversity";
    if (v == "t" || v == "t-closeness" || v == "tcloseness") return "t-closeness";
    if (v == "dp" || v == "differential-privacy") return "differential-privacy";
    if (v == "synthetic" || v == "synthetic-data") return "synthetic-data";
    throw Umbra::ConfigurationException("Unknown technique '" + raw +
                                        "' (allowed: k-anonymity, l-diversity, t-closeness, differential-privacy, synthetic-data)");
}

std::string requireColumnName(const std::string& key, size_t prefixLength) {
    std::string column = CommonUtils::trim(key.substr(prefixLength));
    if (column.empty()) {
        throw Umbra::ConfigurationException(key + "<column> requires a non-empty column name");
    }
    return column;
}

void assignKeyValue(UmbraConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        if (value.size() != 1) throw Umbra::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "technique") {
        config.technique = normalizeTechnique(value);
        return;
    }
    if (key == "seed") {
        config.seed = parseUIntStrict(value, key);
        return;
    }
    if (key.rfind("role.", 0) == 0) {
        config.roleOverrides[requireColumnName(key, 5)] = CommonUtils::toLower(value);
        return;
    }
    if (key.rfind("type.", 0) == 0) {
        config.typeOverrides[requireColumnName(key, 5)] = CommonUtils::toLower(value);
        return;
    }
    if (key.rfind("hierarchy.", 0) == 0) {
        config.hierarchySpecs[requireColumnName(key, 10)] = value;
        return;
    }
    if (key.rfind("max_level.", 0) == 0) {
        config.maxLevels[requireColumnName(key, 10)] = parseIntStrict(value, key, 0);
        return;
    }

    struct IntRule {
        int UmbraConfig::*member;
        int minValue;
    };
    struct DoubleRule {
        double UmbraConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string UmbraConfig::*> rawStringFields = {
        {"dataset", &UmbraConfig::datasetPath},
        {"output", &UmbraConfig::outputPath},
        {"target", &UmbraConfig::targetColumn}
    };
    static const std::unordered_map<std::string, std::string UmbraConfig::*> lowerStringFields = {
        {"suppression", &UmbraConfig::suppressionPolicy},
        {"recoding", &UmbraConfig::recoding},
        {"diversity", &UmbraConfig::diversityMethod},
        {"distance", &UmbraConfig::distance},
        {"mechanism", &UmbraConfig::mechanism},
        {"composition", &UmbraConfig::composition},
        {"attacker", &UmbraConfig::attackerModel},
        {"synthetic_method", &UmbraConfig::syntheticMethod}
    };
    static const std::unordered_map<std::string, std::vector<std::string> UmbraConfig::*> listFields = {
        {"quasi_identifiers", &UmbraConfig::quasiIdentifiers},
        {"sensitive", &UmbraConfig::sensitiveAttributes},
        {"identifiers", &UmbraConfig::identifiers},
        {"numeric", &UmbraConfig::numericAttributes},
        {"ordinal", &UmbraConfig::ordinalOrder}
    };
    static const std::unordered_map<std::string, bool UmbraConfig::*> boolFields = {
        {"verbose", &UmbraConfig::verbose},
        {"accept_within_limit", &UmbraConfig::acceptWithinSuppressionLimit},
        {"redact_identifiers", &UmbraConfig::redactIdentifiers},
        {"bounded", &UmbraConfig::boundedDomain},
        {"preserve_distributions", &UmbraConfig::preserveDistributions}
    };
    static const std::unordered_map<std::string, IntRule> intFields = {
        {"k", {&UmbraConfig::k, 1}},
        {"l", {&UmbraConfig::l, 1}},
        {"sample_size", {&UmbraConfig::sampleSize, 0}},
        {"k_threshold", {&UmbraConfig::kThreshold, 1}}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"suppression_limit", {&UmbraConfig::suppressionLimit, 0.0}},
        {"c", {&UmbraConfig::c, 0.0}},
        {"t", {&UmbraConfig::t, 0.0}},
        {"epsilon", {&UmbraConfig::epsilon, 0.0}},
        {"sensitivity", {&UmbraConfig::sensitivity, 0.0}},
        {"delta", {&UmbraConfig::delta, 0.0}},
        {"sampling_fraction", {&UmbraConfig::samplingFraction, 0.0}},
        {"test_fraction", {&UmbraConfig::testFraction, 0.0}},
        {"sample_fraction", {&UmbraConfig::sampleFraction, 0.0}}
    };

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (const auto it = listFields.find(key); it != listFields.end()) {
        config.*(it->second) = splitCSV(value);
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = intFields.find(key); it != intFields.end()) {
        config.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    if (key == "risk_seed") {
        config.riskSeed = parseUIntStrict(value, key);
        return;
    }
    if (key == "utility_seed") {
        config.utilitySeed = parseUIntStrict(value, key);
        return;
    }
    throw Umbra::ConfigurationException("Unknown config key: " + key);
}

std::string flagToKey(const std::string& flag) {
    static const std::unordered_map<std::string, std::string> aliases = {
        {"quasi", "quasi_identifiers"},
        {"output_path", "output"}
    };
    std::string key = normalizeConfigKey(flag.substr(2));
    auto it = aliases.find(key);
    return it == aliases.end() ? key : it->second;
}
} // namespace

UmbraConfig UmbraConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Umbra::ConfigurationException(kUsage);
    }

    UmbraConfig config;
    config.datasetPath = argv[1];

    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg.rfind("--", 0) == 0 && arg.size() > 2 && i + 1 < argc) {
            overrides.emplace_back(flagToKey(arg), argv[++i]);
        } else {
            throw Umbra::ConfigurationException("Unknown or incomplete argument: " + arg + "\n" + kUsage);
        }
    }

    // Command-line flags take precedence over the config file.
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
        if (config.datasetPath.empty()) config.datasetPath = argv[1];
    }
    for (const auto& [key, value] : overrides) {
        assignKeyValue(config, key, value);
    }

    config.validate();
    return config;
}

UmbraConfig UmbraConfig::fromFile(const std::string& configPath, const UmbraConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Umbra::IOException("Could not open config file: " + configPath);

    UmbraConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Umbra::UmbraException& ex) {
            throw Umbra::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();
    return config;
}

void UmbraConfig::validate() const {
    if (datasetPath.empty()) throw Umbra::ConfigurationException("dataset path is required");
    normalizeTechnique(technique);

    if (suppressionLimit > 1.0) throw Umbra::ConfigurationException("suppression_limit must be within [0,1]");
    parseSuppressionPolicy(suppressionPolicy);
    parseRecodingPolicy(recoding);
    parseDiversityMethod(diversityMethod);
    parseDistanceMeasure(distance);
    parseNoiseMechanism(mechanism);
    parseCompositionPolicy(composition);
    parseAttackerModel(attackerModel);
    parseSyntheticMethod(syntheticMethod);

    if (!(t > 0.0) || t > 2.0) throw Umbra::ConfigurationException("t must be within (0,2]");
    if (!(epsilon > 0.0)) throw Umbra::ConfigurationException("epsilon must be > 0");
    if (!(sensitivity > 0.0)) throw Umbra::ConfigurationException("sensitivity must be > 0");
    if (!(delta > 0.0 && delta < 1.0)) throw Umbra::ConfigurationException("delta must be within (0,1)");
    if (!(samplingFraction > 0.0) || samplingFraction > 1.0) {
        throw Umbra::ConfigurationException("sampling_fraction must be within (0,1]");
    }
    if (!(testFraction > 0.0 && testFraction < 1.0)) {
        throw Umbra::ConfigurationException("test_fraction must be within (0,1)");
    }
    if (!(sampleFraction > 0.0)) throw Umbra::ConfigurationException("sample_fraction must be > 0");

    columnRoles();
    columnTypes();
    for (const auto& [column, spec] : hierarchySpecs) {
        HierarchyRegistry::fromSpec(column, spec);
    }
}

std::map<std::string, AttributeRole> UmbraConfig::columnRoles() const {
    std::map<std::string, AttributeRole> roles;
    auto assign = [&](const std::string& column, AttributeRole role) {
        auto [it, inserted] = roles.emplace(column, role);
        if (!inserted && it->second != role) {
            throw Umbra::ConfigurationException("column '" + column + "' is given conflicting roles", column);
        }
    };
    for (const auto& c : quasiIdentifiers) assign(c, AttributeRole::QUASI_IDENTIFIER);
    for (const auto& c : sensitiveAttributes) assign(c, AttributeRole::SENSITIVE);
    for (const auto& c : identifiers) assign(c, AttributeRole::IDENTIFIER);
    for (const auto& [column, role] : roleOverrides) assign(column, parseAttributeRole(role));
    return roles;
}

std::map<std::string, ColumnType> UmbraConfig::columnTypes() const {
    std::map<std::string, ColumnType> types;
    for (const auto& [column, type] : typeOverrides) types[column] = parseColumnType(type);
    return types;
}

TechniqueConfig UmbraConfig::toTechniqueConfig(const PrivacyDataset& data) const {
    const std::string name = normalizeTechnique(technique);
    std::string sensitive = sensitiveAttributes.empty() ? "" : sensitiveAttributes.front();
    if (sensitive.empty()) {
        const auto tagged = data.namesWithRole(AttributeRole::SENSITIVE);
        if (!tagged.empty()) sensitive = tagged.front();
    }

    if (name == "k-anonymity") {
        KAnonymityConfig cfg;
        cfg.quasiIdentifiers = quasiIdentifiers;
        cfg.k = static_cast<size_t>(k);
        cfg.suppressionLimit = suppressionLimit;
        cfg.recoding = parseRecodingPolicy(recoding);
        cfg.suppression = parseSuppressionPolicy(suppressionPolicy);
        cfg.acceptWithinSuppressionLimit = acceptWithinSuppressionLimit;
        cfg.redactIdentifiers = redactIdentifiers;
        for (const auto& [column, level] : maxLevels) cfg.maxLevels.emplace_back(column, level);
        return cfg;
    }
    if (name == "l-diversity") {
        LDiversityConfig cfg;
        cfg.sensitiveAttribute = sensitive;
        cfg.quasiIdentifiers = quasiIdentifiers;
        cfg.l = static_cast<size_t>(l);
        cfg.method = parseDiversityMethod(diversityMethod);
        cfg.c = c;
        cfg.suppressionLimit = suppressionLimit;
        cfg.k = static_cast<size_t>(std::max(k, l));
        return cfg;
    }
    if (name == "t-closeness") {
        TClosenessConfig cfg;
        cfg.sensitiveAttribute = sensitive;
        cfg.quasiIdentifiers = quasiIdentifiers;
        cfg.t = t;
        cfg.measure = parseDistanceMeasure(distance);
        cfg.ordinalOrder = ordinalOrder;
        cfg.suppressionLimit = suppressionLimit;
        cfg.k = static_cast<size_t>(k);
        return cfg;
    }
    if (name == "synthetic-data") {
        SyntheticDataConfig cfg;
        cfg.method = parseSyntheticMethod(syntheticMethod);
        cfg.sampleFraction = sampleFraction;
        cfg.preserveDistributions = preserveDistributions;
        cfg.redactIdentifiers = redactIdentifiers;
        cfg.seed = seed;
        return cfg;
    }
    DifferentialPrivacyConfig cfg;
    cfg.numericAttributes = numericAttributes;
    cfg.epsilon = epsilon;
    cfg.sensitivity = sensitivity;
    cfg.mechanism = parseNoiseMechanism(mechanism);
    cfg.delta = delta;
    cfg.boundedDomain = boundedDomain;
    cfg.composition = parseCompositionPolicy(composition);
    cfg.seed = seed;
    return cfg;
}

RiskOptions UmbraConfig::toRiskOptions(const PrivacyDataset& data) const {
    RiskOptions options;
    options.quasiIdentifiers = quasiIdentifiers.empty() ? data.namesWithRole(AttributeRole::QUASI_IDENTIFIER) : quasiIdentifiers;
    options.sensitiveAttributes = sensitiveAttributes.empty() ? data.namesWithRole(AttributeRole::SENSITIVE) : sensitiveAttributes;
    options.attackerModel = parseAttackerModel(attackerModel);
    if (sampleSize > 0) options.sampleSize = static_cast<size_t>(sampleSize);
    if (samplingFraction < 1.0) options.samplingFraction = samplingFraction;
    options.kThreshold = static_cast<size_t>(kThreshold);
    options.seed = riskSeed;
    return options;
}

UtilityOptions UmbraConfig::toUtilityOptions() const {
    UtilityOptions options;
    options.targetAttribute = targetColumn;
    options.testFraction = testFraction;
    options.seed = utilitySeed;
    return options;
}

HierarchySet UmbraConfig::buildHierarchies() const {
    HierarchySet set;
    for (const auto& [column, spec] : hierarchySpecs) {
        set.emplace(column, HierarchyRegistry::fromSpec(column, spec));
    }
    return set;
}
