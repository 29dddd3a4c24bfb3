#pragma once

#include "PrivacyDataset.h"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class HierarchyKind { TABLE, INTERVAL, MASK, DATE, FLAT };

/**
 * Validated value hierarchy for one quasi-identifier.
 * Level 0 is the raw value and level height() is the full suppression marker "*".
 * Every label at level j determines its label at level j + 1, so raising a level
 * can only merge equivalence classes, never split them.
 */
class GeneralizationHierarchy {
public:
    /**
     * @brief Builds a hierarchy from explicit paths: raw, level 1, ..., level H-1 [, "*"].
     * @details A trailing "*" level is appended when the rows do not all end with one.
     * @throws Umbra::ConfigurationException on ragged rows or a label with two parents.
     */
    static GeneralizationHierarchy fromTable(std::string attribute, const std::vector<std::vector<std::string>>& rows);

    /**
     * @brief Nested numeric bands, e.g. widths {5, 10} gives 23 -> [20, 25) -> [20, 30) -> *.
     * @throws Umbra::ConfigurationException unless widths are positive and each is a multiple of the previous.
     */
    static GeneralizationHierarchy numericIntervals(std::string attribute, std::vector<double> widths);

    // Masks 1..maskedChars trailing characters, e.g. 12345 -> 1234* -> 123** -> *.
    static GeneralizationHierarchy suffixMasking(std::string attribute, size_t maskedChars);

    // YYYY-MM-DD -> YYYY-MM -> YYYY -> [1990, 2000) -> *.
    static GeneralizationHierarchy dateLevels(std::string attribute);

    // Single step: value -> *.
    static GeneralizationHierarchy flat(std::string attribute);

    static const std::string& suppressedLabel();

    const std::string& attribute() const noexcept { return attribute_; }
    HierarchyKind kind() const noexcept { return kind_; }
    int height() const noexcept { return height_; }
    std::string describe() const;

    /**
     * @brief Label of a raw value at the given level.
     * @throws Umbra::ConfigurationException for values outside the hierarchy or levels outside [0, height()].
     */
    std::string generalize(const std::string& raw, int level) const;

    /**
     * @brief Lifts a label already at fromLevel to toLevel (toLevel >= fromLevel).
     */
    std::string generalizeFrom(const std::string& label, int fromLevel, int toLevel) const;

    /**
     * @brief Numeric reading of a (possibly generalized) label of a numeric or date attribute.
     * @details Bands map to their midpoint, dates to seconds; masked or suppressed labels have none.
     */
    static std::optional<double> labelMidpoint(const std::string& label, ColumnType sourceType);

private:
    GeneralizationHierarchy(std::string attribute, HierarchyKind kind, int height);

    std::string attribute_;
    HierarchyKind kind_;
    int height_ = 1;

    // TABLE: parents_[j] maps a level-j label to its level-(j+1) label.
    std::vector<std::unordered_map<std::string, std::string>> parents_;
    // INTERVAL
    std::vector<double> widths_;
    // MASK
    size_t maskedChars_ = 0;

    void checkLevel(int level) const;
    std::string intervalLabel(double value, int level) const;
    std::string dateLabel(int year, int month, int day, int level) const;
};
