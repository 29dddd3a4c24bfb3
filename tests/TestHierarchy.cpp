#include "GeneralizationHierarchy.h"
#include "HierarchyRegistry.h"
#include "UmbraExceptions.h"

#include <catch2/catch.hpp>

#include <cmath>

TEST_CASE("interval hierarchy nests bands up to full suppression", "[hierarchy]") {
    const auto h = GeneralizationHierarchy::numericIntervals("age", {5, 10});
    REQUIRE(h.height() == 3);
    REQUIRE(h.generalize("23", 0) == "23");
    REQUIRE(h.generalize("23", 1) == "[20, 25)");
    REQUIRE(h.generalize("23", 2) == "[20, 30)");
    REQUIRE(h.generalize("23", 3) == "*");
    REQUIRE(h.generalizeFrom("[20, 25)", 1, 2) == "[20, 30)");
    REQUIRE(h.generalizeFrom("[20, 25)", 1, 1) == "[20, 25)");
    REQUIRE_THROWS_AS(h.generalize("23", 4), Umbra::ConfigurationException);
    REQUIRE_THROWS_AS(h.generalize("abc", 1), Umbra::ConfigurationException);
    REQUIRE_THROWS_AS(h.generalizeFrom("[20, 30)", 2, 1), Umbra::ConfigurationException);
}

TEST_CASE("interval widths must grow by integer multiples", "[hierarchy]") {
    REQUIRE_THROWS_AS(GeneralizationHierarchy::numericIntervals("age", {}), Umbra::ConfigurationException);
    REQUIRE_THROWS_AS(GeneralizationHierarchy::numericIntervals("age", {5, 7}), Umbra::ConfigurationException);
    REQUIRE_THROWS_AS(GeneralizationHierarchy::numericIntervals("age", {-5}), Umbra::ConfigurationException);
    REQUIRE_NOTHROW(GeneralizationHierarchy::numericIntervals("age", {2.5, 5, 20}));
}

TEST_CASE("suffix masking hides trailing characters", "[hierarchy]") {
    const auto h = GeneralizationHierarchy::suffixMasking("zip", 3);
    REQUIRE(h.height() == 4);
    REQUIRE(h.generalize("12345", 1) == "1234*");
    REQUIRE(h.generalize("12345", 3) == "12***");
    REQUIRE(h.generalize("12345", 4) == "*");
    REQUIRE(h.generalizeFrom("1234*", 1, 2) == "123**");
    REQUIRE_THROWS_AS(GeneralizationHierarchy::suffixMasking("zip", 0), Umbra::ConfigurationException);
}

TEST_CASE("date hierarchy climbs month, year and decade", "[hierarchy]") {
    const auto h = GeneralizationHierarchy::dateLevels("admitted");
    REQUIRE(h.height() == 4);
    REQUIRE(h.generalize("2021-03-15", 1) == "2021-03");
    REQUIRE(h.generalize("2021-03-15", 2) == "2021");
    REQUIRE(h.generalize("2021-03-15", 3) == "[2020, 2030)");
    REQUIRE(h.generalizeFrom("2021-03", 1, 3) == "[2020, 2030)");
    REQUIRE(h.generalize("2021-03-15", 4) == "*");
    REQUIRE_THROWS_AS(h.generalize("15/03/2021", 1), Umbra::ConfigurationException);
}

TEST_CASE("table hierarchy follows explicit parents", "[hierarchy]") {
    const auto h = GeneralizationHierarchy::fromTable(
        "city", {{"Oslo", "Norway", "Europe"}, {"Bergen", "Norway", "Europe"}, {"Lyon", "France", "Europe"}});
    REQUIRE(h.height() == 3);
    REQUIRE(h.generalize("Lyon", 1) == "France");
    REQUIRE(h.generalize("Bergen", 2) == "Europe");
    REQUIRE(h.generalize("Oslo", 3) == "*");
    REQUIRE_THROWS_AS(h.generalize("Paris", 1), Umbra::ConfigurationException);

    const auto starred = GeneralizationHierarchy::fromTable("flag", {{"yes", "*"}, {"no", "*"}});
    REQUIRE(starred.height() == 1);
}

TEST_CASE("table hierarchy rejects a label with two parents", "[hierarchy]") {
    REQUIRE_THROWS_AS(GeneralizationHierarchy::fromTable("city", {{"Oslo", "Norway"}, {"Oslo", "Sweden"}}),
                      Umbra::ConfigurationException);
    REQUIRE_THROWS_AS(GeneralizationHierarchy::fromTable("city", {{"Oslo", "Norway"}, {"Lyon"}}),
                      Umbra::ConfigurationException);
}

TEST_CASE("label midpoints read bands and dates", "[hierarchy]") {
    REQUIRE(*GeneralizationHierarchy::labelMidpoint("[20, 30)", ColumnType::NUMERIC) == Approx(25.0));
    REQUIRE(*GeneralizationHierarchy::labelMidpoint("42", ColumnType::NUMERIC) == Approx(42.0));
    REQUIRE_FALSE(GeneralizationHierarchy::labelMidpoint("*", ColumnType::NUMERIC).has_value());
    REQUIRE_FALSE(GeneralizationHierarchy::labelMidpoint("12**", ColumnType::NUMERIC).has_value());
    const auto year = GeneralizationHierarchy::labelMidpoint("2020", ColumnType::DATETIME);
    REQUIRE(year.has_value());
    const auto day = GeneralizationHierarchy::labelMidpoint("2020-07-01", ColumnType::DATETIME);
    REQUIRE(day.has_value());
    REQUIRE(std::abs(*year - *day) < 2.0 * 86400.0);
}

TEST_CASE("hierarchy specs parse the supported forms", "[hierarchy]") {
    REQUIRE(HierarchyRegistry::fromSpec("age", "intervals:5,10,20").height() == 4);
    REQUIRE(HierarchyRegistry::fromSpec("zip", "mask:2").kind() == HierarchyKind::MASK);
    REQUIRE(HierarchyRegistry::fromSpec("d", "date").kind() == HierarchyKind::DATE);
    REQUIRE(HierarchyRegistry::fromSpec("c", "FLAT").height() == 1);
    REQUIRE_THROWS_AS(HierarchyRegistry::fromSpec("zip", "mask:0"), Umbra::ConfigurationException);
    REQUIRE_THROWS_AS(HierarchyRegistry::fromSpec("zip", "tree"), Umbra::ConfigurationException);
}

TEST_CASE("defaults are inferred from the column type", "[hierarchy]") {
    const PrivacyDataset data({makeNumericColumn("age", {18, 50, 90}),
                               makeCategoricalColumn("zip", {"13053", "13068", "14850"}),
                               makeCategoricalColumn("sex", {"M", "F", "F"}),
                               makeDateColumn("admitted", {0, 86400, 172800})});

    const auto age = HierarchyRegistry::inferDefault(data, 0);
    REQUIRE(age.kind() == HierarchyKind::INTERVAL);
    REQUIRE(age.height() == 6);
    REQUIRE(age.generalize("18", 1) == "[15, 20)");
    REQUIRE(age.generalize("90", age.height() - 1) == "[80, 160)");

    const auto zip = HierarchyRegistry::inferDefault(data, 1);
    REQUIRE(zip.kind() == HierarchyKind::MASK);
    REQUIRE(zip.height() == 5);

    REQUIRE(HierarchyRegistry::inferDefault(data, 2).kind() == HierarchyKind::FLAT);
    REQUIRE(HierarchyRegistry::inferDefault(data, 3).kind() == HierarchyKind::DATE);
}

TEST_CASE("registry resolution prefers explicit, then registered, then inferred", "[hierarchy]") {
    const PrivacyDataset data({makeNumericColumn("age", {18, 50, 90}), makeCategoricalColumn("sex", {"M", "F", "F"})});
    HierarchyRegistry registry;
    registry.registerHierarchy(GeneralizationHierarchy::numericIntervals("age", {10}));
    registry.registerHierarchy(GeneralizationHierarchy::fromTable("sex", {{"M", "person"}, {"F", "person"}}));

    HierarchySet explicitSet;
    explicitSet.emplace("age", GeneralizationHierarchy::numericIntervals("age", {25, 50}));
    const HierarchySet resolved = registry.resolve(data, {"age", "sex"}, explicitSet);
    REQUIRE(resolved.at("age").height() == 3);
    REQUIRE(resolved.at("sex").kind() == HierarchyKind::TABLE);

    registry.clear();
    REQUIRE_FALSE(registry.find("sex").has_value());
    REQUIRE(registry.resolve(data, {"sex"}, {}).at("sex").kind() == HierarchyKind::FLAT);
    REQUIRE_THROWS_AS(registry.resolve(data, {"height"}, {}), Umbra::DatasetException);
}
