#include "RiskAssessor.h"
#include "CommonUtils.h"
#include "EquivalenceClasses.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <random>
#include <set>
#include <sstream>
#include <unordered_map>

namespace {
constexpr double kLowRiskCeiling = 0.33;
constexpr double kMediumRiskCeiling = 0.67;
constexpr size_t kPopulationEstimateMinRecords = 100;
constexpr double kPopulationUniquenessFactor = 1.5;

std::string percent(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << (100.0 * v) << "%";
    return os.str();
}

std::vector<size_t> sampleRows(std::vector<size_t> rows, const RiskOptions& options) {
    if (!options.sampleSize || *options.sampleSize >= rows.size()) return rows;
    std::mt19937 rng(options.seed);
    std::shuffle(rows.begin(), rows.end(), rng);
    rows.resize(*options.sampleSize);
    std::sort(rows.begin(), rows.end());
    return rows;
}

std::vector<std::string> buildRecommendations(const RiskReport& report, size_t k) {
    std::vector<std::string> out;
    const double unique = report.metric("unique_records");
    const double violations = report.metric("k_violations");
    if (unique > 0) {
        out.push_back(CommonUtils::formatNumber(unique) +
                      " records are unique on the quasi-identifiers; generalize or suppress them before release.");
    }
    if (violations > 0) {
        out.push_back(CommonUtils::formatNumber(violations) + " equivalence classes are smaller than k=" + std::to_string(k) +
                      "; apply k-anonymity with k >= " + std::to_string(k) + ".");
    }
    for (const auto& s : report.sensitiveRisks) {
        if (s.homogeneityRisk > 0.0) {
            out.push_back("Sensitive attribute '" + s.attribute + "' has a single value in classes covering " +
                          percent(s.homogeneityRisk) + " of records; apply l-diversity.");
        }
        if (s.disclosureRisk > 0.5) {
            out.push_back("Sensitive attribute '" + s.attribute + "' can be inferred with probability " +
                          percent(s.disclosureRisk) + "; consider t-closeness.");
        }
    }
    if (report.level == RiskLevel::HIGH) {
        out.push_back("Overall risk is high; coarsen the quasi-identifier hierarchies or add noise to numeric attributes.");
    }
    if (out.empty()) {
        out.push_back("Re-identification risk is within the configured threshold; no action required.");
    }
    return out;
}
} // namespace

double RiskReport::metric(const std::string& name) const {
    auto it = metrics.find(name);
    return it == metrics.end() ? 0.0 : it->second;
}

std::string attackerModelName(AttackerModel model) {
    switch (model) {
        case AttackerModel::PROSECUTOR: return "prosecutor";
        case AttackerModel::JOURNALIST: return "journalist";
        case AttackerModel::MARKETER: return "marketer";
    }
    return "prosecutor";
}

AttackerModel parseAttackerModel(const std::string& name) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    if (v == "prosecutor") return AttackerModel::PROSECUTOR;
    if (v == "journalist") return AttackerModel::JOURNALIST;
    if (v == "marketer") return AttackerModel::MARKETER;
    throw Umbra::ConfigurationException("unknown attacker model '" + name + "' (allowed: prosecutor, journalist, marketer)");
}

std::string riskLevelName(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW: return "Low";
        case RiskLevel::MEDIUM: return "Medium";
        case RiskLevel::HIGH: return "High";
    }
    return "Low";
}

RiskLevel RiskAssessor::classify(double risk) noexcept {
    if (risk <= kLowRiskCeiling) return RiskLevel::LOW;
    if (risk <= kMediumRiskCeiling) return RiskLevel::MEDIUM;
    return RiskLevel::HIGH;
}

void RiskOptions::validate(const PrivacyDataset& data) const {
    if (quasiIdentifiers.empty()) {
        throw Umbra::ConfigurationException("risk assessment requires at least one quasi-identifier");
    }
    for (const auto& name : quasiIdentifiers) {
        if (data.findColumnIndex(name) < 0) {
            throw Umbra::ConfigurationException("quasi-identifier '" + name + "' is not in the schema", name);
        }
    }
    for (const auto& name : sensitiveAttributes) {
        if (data.findColumnIndex(name) < 0) {
            throw Umbra::ConfigurationException("sensitive attribute '" + name + "' is not in the schema", name);
        }
    }
    if (kThreshold < 1) throw Umbra::ConfigurationException("k threshold must be >= 1");
    if (sampleSize && *sampleSize == 0) throw Umbra::ConfigurationException("sample size must be >= 1");
    if (samplingFraction && !(*samplingFraction > 0.0 && *samplingFraction <= 1.0)) {
        throw Umbra::ConfigurationException("sampling fraction must be within (0,1]");
    }
}

RiskReport RiskAssessor::assess(const PrivacyDataset& data, const RiskOptions& options) {
    options.validate(data);

    std::vector<size_t> qiCols;
    for (const auto& name : options.quasiIdentifiers) qiCols.push_back(data.requireColumnIndex(name));

    const std::vector<size_t> rows = sampleRows(data.retainedRows(), options);
    if (rows.empty()) {
        throw Umbra::DatasetException("every record is suppressed; nothing to assess");
    }
    const auto classes = EquivalenceClasses::partition(data, qiCols, &rows);

    const double n = static_cast<double>(rows.size());
    const double classCount = static_cast<double>(classes.size());
    const double fraction = options.samplingFraction.value_or(1.0);
    const double marketer = classCount / n;

    auto recordRisk = [&](size_t size) {
        const double s = static_cast<double>(size);
        switch (options.attackerModel) {
            case AttackerModel::PROSECUTOR: return 1.0 / s;
            case AttackerModel::JOURNALIST: return std::min(1.0, fraction / s);
            case AttackerModel::MARKETER: return marketer;
        }
        return 1.0 / s;
    };

    RiskReport report;
    report.attackerModel = options.attackerModel;
    report.quasiIdentifiers = options.quasiIdentifiers;

    size_t unique = 0;
    size_t violating = 0;
    size_t violatingRecords = 0;
    double riskSum = 0.0;
    double riskMax = 0.0;
    for (const auto& ec : classes) {
        const double r = recordRisk(ec.size());
        riskSum += r * static_cast<double>(ec.size());
        riskMax = std::max(riskMax, r);
        if (ec.size() == 1) ++unique;
        if (ec.size() < options.kThreshold) {
            ++violating;
            violatingRecords += ec.size();
        }
        report.classes.push_back({ec.size(), ec.values, r});
    }

    const size_t minSize = classes.front().size();
    const size_t maxSize = classes.back().size();
    auto& m = report.metrics;
    m["dataset_size"] = n;
    m["equivalence_class_count"] = classCount;
    m["min_class_size"] = static_cast<double>(minSize);
    m["max_class_size"] = static_cast<double>(maxSize);
    m["k_violations"] = static_cast<double>(violating);
    m["records_in_violating_classes"] = static_cast<double>(violatingRecords);
    m["unique_records"] = static_cast<double>(unique);
    m["sample_uniqueness"] = static_cast<double>(unique) / n;
    if (rows.size() > kPopulationEstimateMinRecords) {
        m["population_uniqueness"] = std::min(1.0, kPopulationUniquenessFactor * static_cast<double>(unique) / n);
    }
    m["prosecutor_risk"] = 1.0 / static_cast<double>(minSize);
    m["journalist_risk"] = std::min(1.0, fraction / static_cast<double>(minSize));
    m["marketer_risk"] = marketer;
    m["mean_record_risk"] = riskSum / n;
    m["max_record_risk"] = riskMax;

    for (const auto& name : options.sensitiveAttributes) {
        const size_t col = data.requireColumnIndex(name);
        SensitiveAttributeRisk risk;
        risk.attribute = name;
        std::set<std::string> overall;
        double disclosure = 0.0;
        size_t homogeneous = 0;
        for (const auto& ec : classes) {
            std::set<std::string> distinct;
            for (size_t r : ec.rows) {
                if (data.isMissing(r, col)) continue;
                distinct.insert(data.cellText(r, col));
            }
            overall.insert(distinct.begin(), distinct.end());
            if (distinct.empty()) continue;
            disclosure += static_cast<double>(ec.size()) / static_cast<double>(distinct.size());
            if (distinct.size() == 1) homogeneous += ec.size();
        }
        risk.distinctValues = overall.size();
        risk.disclosureRisk = disclosure / n;
        risk.homogeneityRisk = static_cast<double>(homogeneous) / n;
        report.sensitiveRisks.push_back(std::move(risk));
    }

    report.level = classify(m["mean_record_risk"]);
    report.recommendations = buildRecommendations(report, options.kThreshold);
    return report;
}
