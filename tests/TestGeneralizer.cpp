#include "Generalizer.h"
#include "TestFixtures.h"
#include "UmbraExceptions.h"

#include <catch2/catch.hpp>

#include <cmath>

namespace {
void requireKAnonymous(const PrivacyDataset& data, size_t k) {
    const auto classes = EquivalenceClasses::partition(data, TestFixtures::columnsOf(data, {"age", "zip"}));
    REQUIRE_FALSE(classes.empty());
    for (const auto& ec : classes) REQUIRE(ec.size() >= k);
}
} // namespace

TEST_CASE("global recoding reaches k-anonymity on the patient table", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients();
    KAnonymityConfig config;
    config.k = 5;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);

    requireKAnonymous(result.dataset, 5);
    for (const auto& c : result.report.classes) REQUIRE(c.passed);
    REQUIRE(result.report.suppressedCount <= static_cast<size_t>(std::floor(0.05 * 1000)));
    REQUIRE(result.report.suppressionBudget == 50);
    REQUIRE(result.dataset.rowCount() == 1000 - result.report.suppressedCount);
    REQUIRE(result.report.attributes == std::vector<std::string>{"age", "zip"});
    REQUIRE(result.report.informationLoss >= 0.0);
    REQUIRE(result.report.informationLoss <= 1.0);
}

TEST_CASE("identifiers are redacted and the schema is preserved", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(200);
    KAnonymityConfig config;
    config.k = 3;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);

    REQUIRE(result.dataset.colCount() == data.colCount());
    const size_t name = result.dataset.requireColumnIndex("name");
    for (size_t r = 0; r < result.dataset.rowCount(); ++r) REQUIRE(result.dataset.cellText(r, name) == "*");
    REQUIRE(result.dataset.column("age").sourceType == ColumnType::NUMERIC);

    // Non-quasi attributes keep their values through the source lineage.
    const size_t income = result.dataset.requireColumnIndex("income");
    for (size_t r = 0; r < result.dataset.rowCount(); ++r) {
        const size_t src = result.dataset.sourceRows()[r];
        REQUIRE(result.dataset.cellText(r, income) == data.cellText(src, data.requireColumnIndex("income")));
    }
}

TEST_CASE("stopping within the suppression limit keeps the budget", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients();
    KAnonymityConfig config;
    config.k = 5;
    config.acceptWithinSuppressionLimit = true;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);

    REQUIRE(result.report.suppressedCount <= result.report.suppressionBudget);
    requireKAnonymous(result.dataset, 5);
}

TEST_CASE("redacted suppression keeps rows but flags them", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients();
    KAnonymityConfig config;
    config.k = 5;
    config.acceptWithinSuppressionLimit = true;
    config.suppression = SuppressionPolicy::REDACT;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);

    REQUIRE(result.dataset.rowCount() == 1000);
    REQUIRE(result.dataset.suppressedCount() == result.report.suppressedCount);
    const size_t age = result.dataset.requireColumnIndex("age");
    for (size_t r = 0; r < result.dataset.rowCount(); ++r) {
        if (result.dataset.isSuppressed(r)) REQUIRE(result.dataset.cellText(r, age) == "*");
    }
    requireKAnonymous(result.dataset, 5);
}

TEST_CASE("local recoding only lifts violating records", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(400, 3);
    KAnonymityConfig config;
    config.k = 4;
    config.recoding = RecodingPolicy::LOCAL;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);

    requireKAnonymous(result.dataset, 4);
    REQUIRE(result.report.recoding == RecodingPolicy::LOCAL);
    REQUIRE(result.report.suppressedCount <= result.report.suppressionBudget);
}

TEST_CASE("generalization is idempotent with the same hierarchies", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(500, 5);
    const HierarchySet hierarchies = TestFixtures::patientHierarchies();
    KAnonymityConfig config;
    config.k = 5;
    const GeneralizationResult first = Generalizer::generalize(data, hierarchies, config);
    const GeneralizationResult second = Generalizer::generalize(first.dataset, hierarchies, config);

    REQUIRE(second.report.suppressedCount == 0);
    REQUIRE(TestFixtures::sameCells(first.dataset, second.dataset));

    const PrivacyDataset replayed = Generalizer::applyLevels(first.dataset, hierarchies, first.report.levelMap());
    REQUIRE(TestFixtures::sameCells(first.dataset, replayed));
}

TEST_CASE("applyLevels reproduces a global recoding", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(50);
    const PrivacyDataset out = Generalizer::applyLevels(data, TestFixtures::patientHierarchies(), {{"age", 2}, {"zip", 1}});
    const size_t age = out.requireColumnIndex("age");
    const size_t zip = out.requireColumnIndex("zip");
    for (size_t r = 0; r < out.rowCount(); ++r) {
        REQUIRE(out.cellText(r, age).front() == '[');
        REQUIRE(out.cellText(r, zip).back() == '*');
        REQUIRE(out.column(age).levelAt(r) == 2);
    }
    REQUIRE_THROWS_AS(Generalizer::applyLevels(data, TestFixtures::patientHierarchies(), {{"age", 9}}),
                      Umbra::ConfigurationException);
}

TEST_CASE("level ceilings below the required height make k unattainable", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(300);
    KAnonymityConfig config;
    config.k = 50;
    config.suppressionLimit = 0.0;
    config.maxLevels = {{"age", 0}, {"zip", 0}};
    try {
        Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);
        FAIL("expected UnattainablePrivacyException");
    } catch (const Umbra::UnattainablePrivacyException& ex) {
        REQUIRE(ex.criterion() == "k-anonymity");
        REQUIRE(ex.violatingRecords() > 0);
        REQUIRE(ex.levelsReached().at("age") == 0);
    }
}

TEST_CASE("invalid k-anonymity configurations are rejected before any work", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(20);
    KAnonymityConfig config;
    config.k = 0;
    REQUIRE_THROWS_AS(Generalizer::generalize(data, {}, config), Umbra::ConfigurationException);

    config.k = 2;
    config.suppressionLimit = 1.5;
    REQUIRE_THROWS_AS(Generalizer::generalize(data, {}, config), Umbra::ConfigurationException);

    config.suppressionLimit = 0.0;
    config.quasiIdentifiers = {"height"};
    REQUIRE_THROWS_AS(Generalizer::generalize(data, {}, config), Umbra::ConfigurationException);

    const PrivacyDataset untagged({makeNumericColumn("age", {30, 40})});
    REQUIRE_THROWS_AS(Generalizer::generalize(untagged, {}, KAnonymityConfig{}), Umbra::ConfigurationException);
}

TEST_CASE("inferred hierarchies still reach k-anonymity", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(300, 9);
    KAnonymityConfig config;
    config.k = 10;
    const GeneralizationResult result = Generalizer::generalize(data, {}, config);
    requireKAnonymous(result.dataset, 10);
}

TEST_CASE("generalization can be cancelled", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(100);
    KAnonymityConfig config;
    const auto outcome = Generalizer::run(data, TestFixtures::patientHierarchies(), config, [] { return true; });
    REQUIRE(outcome.isCancelled());
    REQUIRE_FALSE(outcome.result.has_value());

    const auto completed = Generalizer::run(data, TestFixtures::patientHierarchies(), config, {});
    REQUIRE_FALSE(completed.isCancelled());
    REQUIRE(completed.result.has_value());
}

namespace {
// Eight records on two categorical quasi-identifiers; every (a, b) pair is unique at level 0.
// Raising a merges {a1,a2} and {a7,a8}; raising b merges {p3,p4}.
PrivacyDataset greedyTable() {
    return PrivacyDataset({makeCategoricalColumn("a", {"a1", "a2", "a3", "a3", "a5", "a6", "a7", "a8"}, AttributeRole::QUASI_IDENTIFIER),
                           makeCategoricalColumn("b", {"p1", "p1", "p3", "p4", "p5", "p5", "p7", "p7"}, AttributeRole::QUASI_IDENTIFIER)});
}

HierarchySet greedyHierarchies() {
    HierarchySet set;
    set.emplace("a", GeneralizationHierarchy::fromTable("a", {{"a1", "A12", "B12"},
                                                              {"a2", "A12", "B12"},
                                                              {"a3", "A3", "B3"},
                                                              {"a5", "A5", "B56"},
                                                              {"a6", "A6", "B56"},
                                                              {"a7", "A78", "B78"},
                                                              {"a8", "A78", "B78"}}));
    set.emplace("b", GeneralizationHierarchy::fromTable("b", {{"p1", "P1", "PP"},
                                                              {"p3", "P34", "PP"},
                                                              {"p4", "P34", "PP"},
                                                              {"p5", "P5", "PP"},
                                                              {"p7", "P7", "PP"}}));
    return set;
}
} // namespace

TEST_CASE("the attribute that merges the most violating classes is raised first", "[generalizer]") {
    KAnonymityConfig config;
    config.k = 2;
    config.suppressionLimit = 0.5;
    config.acceptWithinSuppressionLimit = true;
    const GeneralizationResult result = Generalizer::generalize(greedyTable(), greedyHierarchies(), config);

    // Raising a leaves 4 violating classes, raising b leaves 6; one step is enough for the budget of 4.
    REQUIRE(result.report.attributes == std::vector<std::string>{"a", "b"});
    REQUIRE(result.report.levels == std::vector<int>{1, 0});
    REQUIRE(result.report.iterations == 1);
    REQUIRE(result.report.suppressedCount == 4);
    REQUIRE(result.dataset.rowCount() == 4);
}

TEST_CASE("equal benefit at equal height goes to the attribute at the lower level", "[generalizer]") {
    KAnonymityConfig config;
    config.k = 2;
    config.suppressionLimit = 0.25;
    config.acceptWithinSuppressionLimit = true;
    const GeneralizationResult result = Generalizer::generalize(greedyTable(), greedyHierarchies(), config);

    // After a -> 1, raising a again or raising b both merge two classes. b sits lower, so it wins
    // even though a comes first in the schema.
    REQUIRE(result.report.heights == std::vector<int>{3, 3});
    REQUIRE(result.report.levels == std::vector<int>{1, 1});
    REQUIRE(result.report.iterations == 2);
    REQUIRE(result.report.suppressedCount == 2);
    REQUIRE(result.dataset.rowCount() == 6);
    const size_t b = result.dataset.requireColumnIndex("b");
    for (size_t r = 0; r < result.dataset.rowCount(); ++r) REQUIRE(result.dataset.column(b).levelAt(r) == 1);
}

TEST_CASE("numeric values differing beyond ten significant digits stay distinct", "[generalizer]") {
    const PrivacyDataset data({makeNumericColumn("lat", {40.7127761234, 40.7127761239}, AttributeRole::QUASI_IDENTIFIER)});
    REQUIRE(data.cellKey(0, 0) != data.cellKey(1, 0));

    HierarchySet hierarchies;
    hierarchies.emplace("lat", GeneralizationHierarchy::numericIntervals("lat", {0.001, 0.01}));
    KAnonymityConfig config;
    config.k = 2;
    const GeneralizationResult result = Generalizer::generalize(data, hierarchies, config);

    REQUIRE(result.report.levelOf("lat") == 1);
    REQUIRE(result.report.suppressedCount == 0);
    REQUIRE(result.dataset.rowCount() == 2);
    REQUIRE(result.report.classes.size() == 1);
    REQUIRE(result.report.classes.front().size == 2);
}

TEST_CASE("clustering recoding forms groups of at least k records", "[generalizer]") {
    const PrivacyDataset data = TestFixtures::patients(200, 11);
    KAnonymityConfig config;
    config.k = 4;
    config.recoding = RecodingPolicy::CLUSTERING;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);

    requireKAnonymous(result.dataset, 4);
    REQUIRE(result.dataset.rowCount() == 200);
    REQUIRE(result.report.suppressedCount == 0);
    REQUIRE(result.report.recoding == RecodingPolicy::CLUSTERING);
    REQUIRE(result.report.hierarchies.front() == "microaggregation");
    REQUIRE(result.report.iterations >= 1);
    REQUIRE(result.report.iterations <= 200 / 4);
    for (const auto& c : result.report.classes) REQUIRE(c.passed);

    // Ages stay numeric and every record takes its group mean.
    const TypedColumn& age = result.dataset.column("age");
    REQUIRE(age.type == ColumnType::NUMERIC);
    double before = 0.0;
    double after = 0.0;
    for (size_t r = 0; r < 200; ++r) {
        before += *data.numericValue(r, data.requireColumnIndex("age"));
        after += *result.dataset.numericValue(r, result.dataset.requireColumnIndex("age"));
    }
    REQUIRE(after == Approx(before));
    REQUIRE(result.report.informationLoss >= 0.0);
    REQUIRE(result.report.informationLoss <= 1.0);
}

TEST_CASE("clustering lifts categorical labels to a common ancestor", "[generalizer]") {
    const PrivacyDataset data({makeNumericColumn("age", {21, 22, 23, 60, 61, 62}, AttributeRole::QUASI_IDENTIFIER),
                               makeCategoricalColumn("zip", {"13010", "13011", "13012", "13020", "13020", "13025"},
                                                     AttributeRole::QUASI_IDENTIFIER)});
    KAnonymityConfig config;
    config.k = 3;
    config.recoding = RecodingPolicy::CLUSTERING;
    const GeneralizationResult result = Generalizer::generalize(data, TestFixtures::patientHierarchies(), config);

    const size_t age = result.dataset.requireColumnIndex("age");
    const size_t zip = result.dataset.requireColumnIndex("zip");
    REQUIRE(result.dataset.cellText(0, age) == "22");
    REQUIRE(result.dataset.cellText(3, age) == "61");
    REQUIRE(result.dataset.cellText(0, zip) == "1301*");
    REQUIRE(result.dataset.cellText(5, zip) == "1302*");
    REQUIRE(result.report.levelOf("zip") == 1);
    REQUIRE(result.report.classes.size() == 2);

    config.k = 7;
    REQUIRE_THROWS_AS(Generalizer::generalize(data, TestFixtures::patientHierarchies(), config),
                      Umbra::UnattainablePrivacyException);
}
