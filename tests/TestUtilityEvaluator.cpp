#include "Generalizer.h"
#include "NoiseEngine.h"
#include "SyntheticGenerator.h"
#include "TestFixtures.h"
#include "UmbraExceptions.h"
#include "UtilityEvaluator.h"

#include <catch2/catch.hpp>

namespace {
const char* kAllMetrics[] = {"statistical_similarity",   "correlation_preservation", "distribution_similarity",
                             "information_preservation", "classification_utility",   "query_accuracy"};

PrivacyDataset noisy(const PrivacyDataset& data, double epsilon) {
    DifferentialPrivacyConfig config;
    config.epsilon = epsilon;
    config.seed = 31;
    return NoiseEngine::applyDifferentialPrivacy(data, config).dataset;
}
} // namespace

TEST_CASE("an unchanged dataset scores perfect utility", "[utility]") {
    const PrivacyDataset data = TestFixtures::patients(300);
    const UtilityReport report = UtilityEvaluator::evaluate(data, data);
    for (const char* name : kAllMetrics) {
        INFO(name);
        REQUIRE(report.has(name));
        REQUIRE(report.metric(name) == Approx(1.0));
    }
    REQUIRE(report.overallUtility == Approx(1.0));
    REQUIRE(report.level == UtilityLevel::EXCELLENT);
    REQUIRE(report.targetAttribute == "diagnosis");
    REQUIRE(report.alignedRecords == 300);
    REQUIRE(report.droppedRecords == 0);
}

TEST_CASE("generalized output is compared through its source rows", "[utility]") {
    const PrivacyDataset data = TestFixtures::patients(500);
    KAnonymityConfig config;
    config.k = 5;
    config.acceptWithinSuppressionLimit = true;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);
    const UtilityReport report = UtilityEvaluator::evaluate(data, result.dataset);

    REQUIRE(report.alignedRecords == result.dataset.rowCount());
    REQUIRE(report.droppedRecords == result.report.suppressedCount);
    for (const auto& [name, score] : report.metrics) {
        INFO(name);
        REQUIRE(score >= 0.0);
        REQUIRE(score <= 1.0);
    }
    REQUIRE(report.metric("information_preservation") < 1.0);
    REQUIRE_FALSE(report.recommendations.empty());
}

TEST_CASE("stronger noise lowers statistical similarity", "[utility]") {
    const PrivacyDataset data = TestFixtures::patients(500);
    UtilityOptions options;
    options.metrics = {UtilityMetric::STATISTICAL_SIMILARITY, UtilityMetric::QUERY_ACCURACY};
    const UtilityReport mild = UtilityEvaluator::evaluate(data, noisy(data, 100.0), options);
    const UtilityReport harsh = UtilityEvaluator::evaluate(data, noisy(data, 0.01), options);

    REQUIRE(mild.metric("statistical_similarity") > harsh.metric("statistical_similarity"));
    REQUIRE(mild.metric("statistical_similarity") > 0.9);
    REQUIRE(mild.metrics.size() == 2);
}

TEST_CASE("unrelated datasets are rejected", "[utility]") {
    const PrivacyDataset data = TestFixtures::patients(100);
    REQUIRE_THROWS_AS(UtilityEvaluator::evaluate(data, TestFixtures::patients(80)), Umbra::ShapeMismatchException);

    const PrivacyDataset renamed({makeNumericColumn("height", std::vector<double>(100, 1.0))});
    REQUIRE_THROWS_AS(UtilityEvaluator::evaluate(data, renamed), Umbra::ShapeMismatchException);

    std::vector<TypedColumn> columns = data.columns();
    columns.pop_back();
    REQUIRE_THROWS_AS(UtilityEvaluator::evaluate(data, data.withColumns(columns)), Umbra::ShapeMismatchException);
}

TEST_CASE("utility options are validated", "[utility]") {
    const PrivacyDataset data = TestFixtures::patients(50);
    UtilityOptions options;
    options.targetAttribute = "outcome";
    REQUIRE_THROWS_AS(UtilityEvaluator::evaluate(data, data, options), Umbra::ConfigurationException);

    options = UtilityOptions{};
    options.testFraction = 1.0;
    REQUIRE_THROWS_AS(UtilityEvaluator::evaluate(data, data, options), Umbra::ConfigurationException);

    options = UtilityOptions{};
    options.metrics.clear();
    REQUIRE_THROWS_AS(UtilityEvaluator::evaluate(data, data, options), Umbra::ConfigurationException);
}

TEST_CASE("metric names and levels", "[utility]") {
    REQUIRE(parseUtilityMetric("Query-Accuracy") == UtilityMetric::QUERY_ACCURACY);
    REQUIRE(parseUtilityMetric("correlation") == UtilityMetric::CORRELATION_PRESERVATION);
    REQUIRE_THROWS_AS(parseUtilityMetric("precision"), Umbra::ConfigurationException);
    REQUIRE(UtilityEvaluator::classify(0.95) == UtilityLevel::EXCELLENT);
    REQUIRE(UtilityEvaluator::classify(0.75) == UtilityLevel::GOOD);
    REQUIRE(UtilityEvaluator::classify(0.5) == UtilityLevel::FAIR);
    REQUIRE(UtilityEvaluator::classify(0.3) == UtilityLevel::POOR);
    REQUIRE(UtilityEvaluator::classify(0.1) == UtilityLevel::VERY_POOR);
    REQUIRE(utilityLevelName(UtilityLevel::VERY_POOR) == "Very Poor");
}

TEST_CASE("utility evaluation can be cancelled", "[utility]") {
    const PrivacyDataset data = TestFixtures::patients(50);
    const auto outcome = UtilityEvaluator::run(data, data, UtilityOptions{}, [] { return true; });
    REQUIRE(outcome.isCancelled());
}

TEST_CASE("synthetic records of the same size are scored positionally", "[utility]") {
    const PrivacyDataset data = TestFixtures::patients(400);
    SyntheticDataConfig config;
    config.seed = 21;
    const PrivacyDataset synthetic = SyntheticGenerator::generate(data, config).dataset;
    const UtilityReport report = UtilityEvaluator::evaluate(data, synthetic);

    REQUIRE(report.alignedRecords == 400);
    REQUIRE(report.droppedRecords == 0);
    for (const auto& [name, score] : report.metrics) {
        INFO(name);
        REQUIRE(score >= 0.0);
        REQUIRE(score <= 1.0);
    }
    // Marginals are resampled from the input, so aggregate statistics stay close.
    REQUIRE(report.metric("statistical_similarity") > 0.5);

    config.sampleFraction = 0.5;
    REQUIRE_THROWS_AS(UtilityEvaluator::evaluate(data, SyntheticGenerator::generate(data, config).dataset),
                      Umbra::ShapeMismatchException);
}
