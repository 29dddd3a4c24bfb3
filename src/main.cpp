#include "AnonymizationPipeline.h"
#include "DatasetLoader.h"
#include "RiskAssessor.h"
#include "TerminalUI.h"
#include "UmbraConfig.h"
#include "UmbraExceptions.h"
#include "UtilityEvaluator.h"
#include <iostream>
#include <string>

namespace {
constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitUnattainable = 2;

void printUsage(const std::string& prog) {
    std::cout << "Usage: " << prog << " <dataset.csv> [options]\n"
              << "Options:\n"
              << "  --config <file>                   Key: value config file (flags override it)\n"
              << "  --output <file>                   Write the anonymized dataset as CSV\n"
              << "  --delimiter <char>                CSV delimiter character (default: ,)\n"
              << "  --technique <name>                k-anonymity | l-diversity | t-closeness |\n"
              << "                                    differential-privacy | synthetic-data\n"
              << "  --quasi <a,b,...>                 Quasi-identifier columns\n"
              << "  --sensitive <a,...>               Sensitive columns (first one drives l-diversity / t-closeness)\n"
              << "  --identifiers <a,...>             Direct identifier columns (redacted in the output)\n"
              << "  --k <N>                           Minimum class size (default: 5)\n"
              << "  --suppression-limit <0..1>        Fraction of records that may be suppressed (default: 0.05)\n"
              << "  --suppression <drop|redact>       How suppressed records appear in the output\n"
              << "  --recoding <policy>               Generalization recoding: global | local | clustering\n"
              << "  --l <N> --diversity <method>      l-diversity parameters (distinct | entropy | recursive)\n"
              << "  --t <0..2> --distance <measure>   t-closeness parameters (variational | kl | earth_mover)\n"
              << "  --epsilon <N> --sensitivity <N>   Differential privacy budget and sensitivity\n"
              << "  --mechanism <laplace|gaussian>    Noise mechanism; --delta applies to gaussian\n"
              << "  --seed <N>                        Seed for reproducible noise and synthetic records\n"
              << "  --synthetic-method <name>         statistical | copula (default: copula)\n"
              << "  --sample-fraction <N>             Synthetic records per input record (default: 1)\n"
              << "  --attacker <model>                prosecutor | journalist | marketer\n"
              << "  --target <col>                    Classification target for utility evaluation\n"
              << "  --verbose <true|false>            Stage progress lines (default: true)\n";
}
} // namespace

int main(int argc, char* argv[]) {
    if (argc >= 2 && (std::string(argv[1]) == "--help" || std::string(argv[1]) == "-h")) {
        printUsage(argv[0]);
        return kExitOk;
    }

    UmbraConfig config;
    try {
        config = UmbraConfig::fromArgs(argc, argv);
    } catch (const Umbra::UmbraException& e) {
        TerminalUI::error(e.what());
        printUsage(argv[0]);
        return kExitConfig;
    }

    try {
        TerminalUI::stage("Loading " + config.datasetPath, config.verbose);
        const PrivacyDataset original =
            DatasetLoader::load(config.datasetPath, config.delimiter, config.columnRoles(), config.columnTypes());
        TerminalUI::printDatasetSummary(original);

        TerminalUI::stage("Assessing re-identification risk", config.verbose);
        const RiskOptions riskOptions = config.toRiskOptions(original);
        TerminalUI::printRiskReport(RiskAssessor::assess(original, riskOptions), "RISK BEFORE");

        const TechniqueConfig technique = config.toTechniqueConfig(original);
        TerminalUI::stage("Applying " + techniqueName(technique), config.verbose);
        const AnonymizationResult result = AnonymizationPipeline::apply(technique, original, config.buildHierarchies());
        if (result.generalization) TerminalUI::printGeneralizationReport(*result.generalization);
        if (result.diversity) TerminalUI::printDiversityReport(*result.diversity);
        if (result.closeness) TerminalUI::printClosenessReport(*result.closeness);
        if (result.noise) TerminalUI::printNoiseReport(*result.noise);
        if (result.synthetic) TerminalUI::printSyntheticReport(*result.synthetic);

        TerminalUI::stage("Assessing risk of the anonymized dataset", config.verbose);
        if (result.dataset.suppressedCount() == result.dataset.rowCount()) {
            TerminalUI::warning("every record was suppressed; skipping the second risk assessment");
        } else {
            TerminalUI::printRiskReport(RiskAssessor::assess(result.dataset, riskOptions), "RISK AFTER");
        }

        if (result.dataset.sourceRowCount() == original.rowCount()) {
            TerminalUI::stage("Evaluating utility", config.verbose);
            TerminalUI::printUtilityReport(UtilityEvaluator::evaluate(original, result.dataset, config.toUtilityOptions()));
        } else {
            TerminalUI::warning("record count changed; utility evaluation needs a record-aligned dataset");
        }

        if (!config.outputPath.empty()) {
            DatasetLoader::save(result.dataset, config.outputPath, config.delimiter);
            TerminalUI::stage("Wrote " + config.outputPath, config.verbose);
        }
    } catch (const Umbra::UnattainablePrivacyException& e) {
        TerminalUI::error(e.what());
        return kExitUnattainable;
    } catch (const Umbra::UmbraException& e) {
        TerminalUI::error(e.what());
        return kExitConfig;
    }
    return kExitOk;
}
