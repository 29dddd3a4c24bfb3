#pragma once

#include "EquivalenceClasses.h"
#include "GeneralizationHierarchy.h"
#include "HierarchyRegistry.h"
#include "PrivacyDataset.h"

#include <cmath>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace TestFixtures {

// Seeded synthetic patient table: name (identifier), age and zip (quasi-identifiers),
// diagnosis (sensitive), income (insensitive).
inline PrivacyDataset patients(size_t n = 1000,
                               uint32_t seed = 7,
                               const std::vector<std::string>& diagnoses = {"flu", "cold", "asthma", "diabetes", "migraine"}) {
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> age(18, 89);
    std::uniform_int_distribution<int> zipSuffix(10, 49);
    std::uniform_int_distribution<size_t> diag(0, diagnoses.size() - 1);
    std::normal_distribution<double> income(50000.0, 12000.0);

    std::vector<std::string> names, zips, diagnosis;
    std::vector<double> ages, incomes;
    for (size_t i = 0; i < n; ++i) {
        names.push_back("P" + std::to_string(1000 + i));
        ages.push_back(static_cast<double>(age(rng)));
        zips.push_back("130" + std::to_string(zipSuffix(rng)));
        diagnosis.push_back(diagnoses[diag(rng)]);
        incomes.push_back(std::round(income(rng)));
    }
    return PrivacyDataset({makeCategoricalColumn("name", names, AttributeRole::IDENTIFIER),
                           makeNumericColumn("age", ages, AttributeRole::QUASI_IDENTIFIER),
                           makeCategoricalColumn("zip", zips, AttributeRole::QUASI_IDENTIFIER),
                           makeCategoricalColumn("diagnosis", diagnosis, AttributeRole::SENSITIVE),
                           makeNumericColumn("income", incomes)});
}

inline HierarchySet patientHierarchies() {
    HierarchySet set;
    set.emplace("age", GeneralizationHierarchy::numericIntervals("age", {5, 10, 20, 40, 80}));
    set.emplace("zip", GeneralizationHierarchy::suffixMasking("zip", 3));
    return set;
}

inline std::vector<size_t> columnsOf(const PrivacyDataset& data, const std::vector<std::string>& names) {
    std::vector<size_t> cols;
    for (const auto& name : names) cols.push_back(data.requireColumnIndex(name));
    return cols;
}

inline bool sameCells(const PrivacyDataset& a, const PrivacyDataset& b) {
    if (a.rowCount() != b.rowCount() || a.colCount() != b.colCount()) return false;
    for (size_t r = 0; r < a.rowCount(); ++r) {
        for (size_t c = 0; c < a.colCount(); ++c) {
            if (a.cellKey(r, c) != b.cellKey(r, c)) return false;
        }
    }
    return true;
}

} // namespace TestFixtures
