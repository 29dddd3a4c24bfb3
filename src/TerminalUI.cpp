#include "TerminalUI.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace {
constexpr size_t kMaxClassRows = 10;

void banner(const std::string& title) {
    const size_t width = 108;
    const std::string label = " " + title + " ";
    const size_t left = (width - std::min(width, label.size())) / 2;
    std::cout << "\n" << std::string(left, '=') << label << std::string(width - left - std::min(width - left, label.size()), '=') << "\n";
}

void rule() {
    std::cout << std::string(108, '=') << "\n";
}

std::string joinValues(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += " | ";
        out += values[i] == PrivacyDataset::missingKey() ? "<missing>" : values[i];
    }
    return out;
}

void printLevels(const std::vector<std::string>& attributes, const std::vector<int>& levels) {
    for (size_t i = 0; i < attributes.size() && i < levels.size(); ++i) {
        std::cout << "        -> " << std::left << std::setw(24) << attributes[i] << "level " << levels[i] << "\n";
    }
}

template <typename ClassT, typename Fn>
void printFailingClasses(const std::vector<ClassT>& classes, Fn describe) {
    size_t shown = 0;
    for (const auto& c : classes) {
        if (c.passed) continue;
        if (shown++ == kMaxClassRows) {
            std::cout << "        ...\n";
            break;
        }
        std::cout << "        [" << joinValues(c.values) << "] size=" << c.size << " " << describe(c) << "\n";
    }
}
} // namespace

void TerminalUI::printDatasetSummary(const PrivacyDataset& data) {
    banner("DATASET");
    std::cout << "Records: " << data.rowCount() << " | Attributes: " << data.colCount() << "\n";
    std::cout << std::left << std::setw(28) << "Attribute" << std::setw(14) << "Type" << std::setw(18) << "Role" << "Missing\n";
    std::cout << std::string(70, '-') << "\n";
    for (size_t c = 0; c < data.colCount(); ++c) {
        const TypedColumn& col = data.column(c);
        const size_t missing = static_cast<size_t>(std::count(col.missing.begin(), col.missing.end(), 1));
        std::cout << std::left << std::setw(28) << col.name << std::setw(14) << columnTypeName(col.type)
                  << std::setw(18) << roleName(col.role) << missing << "\n";
    }
    rule();
}

void TerminalUI::printRiskReport(const RiskReport& report, const std::string& title) {
    banner(title);
    std::cout << "Attacker model: " << attackerModelName(report.attackerModel)
              << " | Risk level: " << riskLevelName(report.level) << "\n";
    std::cout << "Quasi-identifiers: " << joinValues(report.quasiIdentifiers) << "\n\n";
    for (const auto& [name, value] : report.metrics) {
        std::cout << "    " << std::left << std::setw(32) << name << std::right << std::fixed << std::setprecision(4)
                  << std::setw(14) << value << "\n";
    }
    if (!report.sensitiveRisks.empty()) {
        std::cout << "\n    [Sensitive attributes]\n";
        for (const auto& s : report.sensitiveRisks) {
            std::cout << "        -> " << std::left << std::setw(24) << s.attribute << "distinct=" << s.distinctValues
                      << " | disclosure=" << std::setprecision(4) << s.disclosureRisk
                      << " | homogeneity=" << s.homogeneityRisk << "\n";
        }
    }
    for (const auto& line : report.recommendations) std::cout << "[Umbra] " << line << "\n";
    rule();
}

void TerminalUI::printGeneralizationReport(const GeneralizationReport& report) {
    banner("GENERALIZATION");
    std::cout << "k=" << report.k << " | recoding: " << recodingPolicyName(report.recoding)
              << " | suppression: " << suppressionPolicyName(report.suppression)
              << " | iterations: " << report.iterations << "\n";
    for (size_t i = 0; i < report.attributes.size(); ++i) {
        std::cout << "        -> " << std::left << std::setw(24) << report.attributes[i] << "level " << report.levels[i]
                  << "/" << report.heights[i];
        if (i < report.hierarchies.size()) std::cout << "  (" << report.hierarchies[i] << ")";
        std::cout << "\n";
    }
    std::cout << "Suppressed: " << report.suppressedCount << " of budget " << report.suppressionBudget
              << " | Information loss: " << std::fixed << std::setprecision(4) << report.informationLoss
              << " | Classes: " << report.classes.size() << "\n";
    rule();
}

void TerminalUI::printDiversityReport(const DiversityReport& report) {
    banner("L-DIVERSITY");
    std::cout << "Sensitive: " << report.sensitiveAttribute << " | l=" << report.l
              << " | method: " << diversityMethodName(report.method)
              << " | merges: " << report.mergesPerformed << " | suppressed: " << report.suppressedCount << "\n";
    printLevels(report.attributes, report.levels);
    const size_t failing = static_cast<size_t>(std::count_if(report.classes.begin(), report.classes.end(),
                                                             [](const DiversityClassResult& c) { return !c.passed; }));
    std::cout << "Classes: " << report.classes.size() << " | failing: " << failing << "\n";
    printFailingClasses(report.classes, [](const DiversityClassResult& c) {
        return "distinct=" + std::to_string(c.distinctValues);
    });
    rule();
}

void TerminalUI::printClosenessReport(const ClosenessReport& report) {
    banner("T-CLOSENESS");
    std::cout << "Sensitive: " << report.sensitiveAttribute << " | t=" << report.t
              << " | distance: " << distanceMeasureName(report.measure) << (report.ordered ? " (ordered)" : "")
              << " | merges: " << report.mergesPerformed << " | suppressed: " << report.suppressedCount << "\n";
    printLevels(report.attributes, report.levels);
    std::cout << "Classes: " << report.classes.size() << " | max distance: " << std::fixed << std::setprecision(4)
              << report.maxDistance << " | against released data: " << report.releasedMaxDistance << "\n";
    printFailingClasses(report.classes, [](const ClosenessClassResult& c) {
        return "distance=" + std::to_string(c.distance);
    });
    rule();
}

void TerminalUI::printNoiseReport(const NoiseReport& report) {
    banner("DIFFERENTIAL PRIVACY");
    std::cout << "Mechanism: " << mechanismName(report.mechanism) << " | composition: " << compositionName(report.composition)
              << " | epsilon=" << report.epsilon << " | sensitivity=" << report.sensitivity;
    if (report.mechanism == NoiseMechanism::GAUSSIAN) std::cout << " | delta=" << report.delta;
    std::cout << "\n";
    std::cout << std::left << std::setw(24) << "Attribute" << std::setw(14) << "Epsilon" << std::setw(14) << "Scale"
              << std::setw(10) << "Noised" << "Clipped\n";
    std::cout << std::string(70, '-') << "\n";
    for (const auto& a : report.attributes) {
        std::cout << std::left << std::setw(24) << a.attribute << std::fixed << std::setprecision(4) << std::setw(14)
                  << a.epsilonSpent << std::setw(14) << a.scale << std::setw(10) << a.noisedValues << a.clippedValues << "\n";
    }
    std::cout << "Aggregate budget: epsilon=" << report.aggregateEpsilon;
    if (report.mechanism == NoiseMechanism::GAUSSIAN) std::cout << " | delta=" << report.aggregateDelta;
    std::cout << "\n";
    if (!report.gaussianBoundHolds) {
        warning("Gaussian sigma uses the classic bound, which only guarantees (epsilon, delta)-DP for epsilon < 1");
    }
    rule();
}

void TerminalUI::printSyntheticReport(const SyntheticReport& report) {
    banner("SYNTHETIC DATA");
    std::cout << "Method: " << syntheticMethodName(report.method)
              << " | marginals: " << (report.preserveDistributions ? "empirical" : "normal fit")
              << " | records: " << report.sourceRecords << " -> " << report.generatedRecords << "\n";
    if (!report.correlatedAttributes.empty()) {
        std::cout << "Copula attributes: " << joinValues(report.correlatedAttributes) << "\n";
    }
    std::cout << std::left << std::setw(24) << "Attribute" << std::setw(14) << "Model" << "Missing rate\n";
    std::cout << std::string(50, '-') << "\n";
    for (const auto& a : report.attributes) {
        std::cout << std::left << std::setw(24) << a.attribute << std::setw(14) << a.model << std::fixed
                  << std::setprecision(4) << a.missingRate << "\n";
    }
    rule();
}

void TerminalUI::printUtilityReport(const UtilityReport& report) {
    banner("UTILITY");
    for (const auto& [name, value] : report.metrics) {
        std::cout << "    " << std::left << std::setw(32) << name << std::right << std::fixed << std::setprecision(4)
                  << std::setw(10) << value << "\n";
    }
    if (!report.targetAttribute.empty() && report.has("classification_utility")) {
        std::cout << "    Classification target '" << report.targetAttribute << "': accuracy " << report.originalAccuracy
                  << " -> " << report.transformedAccuracy << "\n";
    }
    std::cout << "\n" << std::left << std::setw(24) << "Attribute" << std::setw(14) << "Statistical" << std::setw(14)
              << "Distribution" << "Information\n";
    std::cout << std::string(66, '-') << "\n";
    for (const auto& a : report.attributes) {
        std::cout << std::left << std::setw(24) << a.attribute << std::fixed << std::setprecision(4) << std::setw(14)
                  << a.statisticalSimilarity << std::setw(14) << a.distributionSimilarity << a.informationPreservation << "\n";
    }
    std::cout << "\nOverall utility: " << report.overallUtility << " (" << utilityLevelName(report.level) << ")"
              << " | aligned records: " << report.alignedRecords << " | dropped: " << report.droppedRecords << "\n";
    for (const auto& line : report.recommendations) std::cout << "[Umbra] " << line << "\n";
    rule();
}

void TerminalUI::stage(const std::string& label, bool verbose) {
    if (verbose) std::cout << "[Umbra][Stage] " << label << "\n";
}

void TerminalUI::warning(const std::string& message) {
    std::cerr << "[Umbra Warning] " << message << "\n";
}

void TerminalUI::error(const std::string& message) {
    std::cerr << "[Umbra Error] " << message << "\n";
}
