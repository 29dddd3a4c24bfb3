#pragma once
#include "DiversityEnforcer.h"
#include "Generalizer.h"
#include "NoiseEngine.h"
#include "PrivacyDataset.h"
#include "RiskAssessor.h"
#include "SyntheticGenerator.h"
#include "UtilityEvaluator.h"
#include <string>

class TerminalUI {
public:
    static void printDatasetSummary(const PrivacyDataset& data);

    // Risk phase
    static void printRiskReport(const RiskReport& report, const std::string& title);

    // Transformation phase
    static void printGeneralizationReport(const GeneralizationReport& report);
    static void printDiversityReport(const DiversityReport& report);
    static void printClosenessReport(const ClosenessReport& report);
    static void printNoiseReport(const NoiseReport& report);
    static void printSyntheticReport(const SyntheticReport& report);

    static void printUtilityReport(const UtilityReport& report);

    static void stage(const std::string& label, bool verbose);
    static void warning(const std::string& message);
    static void error(const std::string& message);
};
