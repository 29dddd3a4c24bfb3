#include "Generalizer.h"
#include "RiskAssessor.h"
#include "TestFixtures.h"
#include "UmbraExceptions.h"

#include <catch2/catch.hpp>

namespace {
// Classes on (age, zip): {30,A} x1, {40,B} x2, {50,C} x3.
PrivacyDataset sixRecords() {
    return PrivacyDataset({makeNumericColumn("age", {30, 40, 40, 50, 50, 50}, AttributeRole::QUASI_IDENTIFIER),
                           makeCategoricalColumn("zip", {"A", "B", "B", "C", "C", "C"}, AttributeRole::QUASI_IDENTIFIER),
                           makeCategoricalColumn("disease", {"flu", "flu", "flu", "flu", "cold", "asthma"}, AttributeRole::SENSITIVE)});
}

RiskOptions optionsFor(AttackerModel model) {
    RiskOptions options;
    options.quasiIdentifiers = {"age", "zip"};
    options.sensitiveAttributes = {"disease"};
    options.attackerModel = model;
    options.kThreshold = 3;
    return options;
}
} // namespace

TEST_CASE("class structure metrics follow the partition", "[risk]") {
    const RiskReport report = RiskAssessor::assess(sixRecords(), optionsFor(AttackerModel::PROSECUTOR));
    REQUIRE(report.metric("dataset_size") == Approx(6));
    REQUIRE(report.metric("equivalence_class_count") == Approx(3));
    REQUIRE(report.metric("min_class_size") == Approx(1));
    REQUIRE(report.metric("max_class_size") == Approx(3));
    REQUIRE(report.metric("unique_records") == Approx(1));
    REQUIRE(report.metric("sample_uniqueness") == Approx(1.0 / 6.0));
    REQUIRE(report.metric("k_violations") == Approx(2));
    REQUIRE(report.metric("records_in_violating_classes") == Approx(3));
    REQUIRE(report.classes.size() == 3);
    REQUIRE(report.classes.front().size == 1);
    REQUIRE(report.classes.back().size == 3);
}

TEST_CASE("attacker models score the same partition differently", "[risk]") {
    const PrivacyDataset data = sixRecords();

    const RiskReport prosecutor = RiskAssessor::assess(data, optionsFor(AttackerModel::PROSECUTOR));
    REQUIRE(prosecutor.metric("prosecutor_risk") == Approx(1.0));
    REQUIRE(prosecutor.metric("marketer_risk") == Approx(0.5));
    REQUIRE(prosecutor.metric("mean_record_risk") == Approx(0.5));
    REQUIRE(prosecutor.metric("max_record_risk") == Approx(1.0));
    REQUIRE(prosecutor.level == RiskLevel::MEDIUM);

    RiskOptions journalistOptions = optionsFor(AttackerModel::JOURNALIST);
    journalistOptions.samplingFraction = 0.5;
    const RiskReport journalist = RiskAssessor::assess(data, journalistOptions);
    REQUIRE(journalist.metric("journalist_risk") == Approx(0.5));
    REQUIRE(journalist.metric("max_record_risk") == Approx(0.5));

    const RiskReport marketer = RiskAssessor::assess(data, optionsFor(AttackerModel::MARKETER));
    REQUIRE(marketer.metric("mean_record_risk") == Approx(0.5));
    REQUIRE(marketer.metric("max_record_risk") == Approx(0.5));
}

TEST_CASE("sensitive attribute risks expose homogeneous classes", "[risk]") {
    const RiskReport report = RiskAssessor::assess(sixRecords(), optionsFor(AttackerModel::PROSECUTOR));
    REQUIRE(report.sensitiveRisks.size() == 1);
    const SensitiveAttributeRisk& s = report.sensitiveRisks.front();
    REQUIRE(s.distinctValues == 3);
    // Classes of size 1 and 2 hold only "flu".
    REQUIRE(s.homogeneityRisk == Approx(0.5));
    REQUIRE(s.disclosureRisk == Approx((1.0 + 2.0 + 1.0) / 6.0));
    REQUIRE_FALSE(report.recommendations.empty());
}

TEST_CASE("population uniqueness is only estimated for larger samples", "[risk]") {
    const RiskReport smallReport = RiskAssessor::assess(sixRecords(), optionsFor(AttackerModel::PROSECUTOR));
    REQUIRE(smallReport.metrics.count("population_uniqueness") == 0);

    RiskOptions options;
    options.quasiIdentifiers = {"age", "zip"};
    const RiskReport large = RiskAssessor::assess(TestFixtures::patients(), options);
    REQUIRE(large.metrics.count("population_uniqueness") == 1);
    REQUIRE(large.metric("population_uniqueness") <= 1.0);
}

TEST_CASE("sampling analyses a seeded subset", "[risk]") {
    RiskOptions options;
    options.quasiIdentifiers = {"age"};
    options.sampleSize = 200;
    const PrivacyDataset data = TestFixtures::patients();
    const RiskReport a = RiskAssessor::assess(data, options);
    const RiskReport b = RiskAssessor::assess(data, options);
    REQUIRE(a.metric("dataset_size") == Approx(200));
    REQUIRE(a.metric("equivalence_class_count") == Approx(b.metric("equivalence_class_count")));

    options.sampleSize = 5000;
    REQUIRE(RiskAssessor::assess(data, options).metric("dataset_size") == Approx(1000));
}

TEST_CASE("risk assessment rejects invalid options", "[risk]") {
    const PrivacyDataset data = sixRecords();
    RiskOptions options;
    REQUIRE_THROWS_AS(RiskAssessor::assess(data, options), Umbra::ConfigurationException);

    options.quasiIdentifiers = {"height"};
    REQUIRE_THROWS_AS(RiskAssessor::assess(data, options), Umbra::ConfigurationException);

    options.quasiIdentifiers = {"age"};
    options.samplingFraction = 0.0;
    REQUIRE_THROWS_AS(RiskAssessor::assess(data, options), Umbra::ConfigurationException);
}

TEST_CASE("fully suppressed datasets cannot be assessed", "[risk]") {
    const PrivacyDataset data = sixRecords().withSuppressed(MissingMask(6, 1));
    REQUIRE_THROWS_AS(RiskAssessor::assess(data, optionsFor(AttackerModel::PROSECUTOR)), Umbra::DatasetException);
}

TEST_CASE("risk levels follow fixed thresholds", "[risk]") {
    REQUIRE(RiskAssessor::classify(0.1) == RiskLevel::LOW);
    REQUIRE(RiskAssessor::classify(0.33) == RiskLevel::LOW);
    REQUIRE(RiskAssessor::classify(0.5) == RiskLevel::MEDIUM);
    REQUIRE(RiskAssessor::classify(0.9) == RiskLevel::HIGH);
    REQUIRE(parseAttackerModel("Journalist") == AttackerModel::JOURNALIST);
    REQUIRE_THROWS_AS(parseAttackerModel("insider"), Umbra::ConfigurationException);
}

TEST_CASE("k-anonymous output bounds record risk by 1/k", "[risk][generalizer]") {
    const PrivacyDataset data = TestFixtures::patients();
    RiskOptions options;
    options.quasiIdentifiers = {"age", "zip"};
    const RiskReport before = RiskAssessor::assess(data, options);

    KAnonymityConfig config;
    config.k = 5;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);
    const RiskReport after = RiskAssessor::assess(result.dataset, options);

    REQUIRE(after.metric("max_record_risk") <= 1.0 / 5.0 + 1e-12);
    REQUIRE(after.metric("mean_record_risk") <= 1.0 / 5.0 + 1e-12);
    REQUIRE(after.metric("mean_record_risk") <= before.metric("mean_record_risk"));
    REQUIRE(after.metric("k_violations") == Approx(0));
}

TEST_CASE("mean record risk does not grow with k", "[risk][generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(600, 11);
    RiskOptions options;
    options.quasiIdentifiers = {"age"};

    double previous = 1.0;
    for (size_t k : {2, 5, 10, 25}) {
        KAnonymityConfig config;
        config.quasiIdentifiers = {"age"};
        config.k = k;
        config.suppressionLimit = 0.0;
        const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);
        const double risk = RiskAssessor::assess(result.dataset, options).metric("mean_record_risk");
        REQUIRE(risk <= previous + 1e-12);
        previous = risk;
    }
}

TEST_CASE("nearby coordinates form separate classes", "[risk]") {
    const PrivacyDataset data({makeNumericColumn("lat", {40.7127761234, 40.7127761239}, AttributeRole::QUASI_IDENTIFIER)});
    RiskOptions options;
    options.quasiIdentifiers = {"lat"};
    options.kThreshold = 2;
    const RiskReport report = RiskAssessor::assess(data, options);

    REQUIRE(report.metric("equivalence_class_count") == Approx(2));
    REQUIRE(report.metric("unique_records") == Approx(2));
    REQUIRE(report.metric("prosecutor_risk") == Approx(1.0));
}
