#ifndef UMBRA_EXCEPTIONS_H
#define UMBRA_EXCEPTIONS_H

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

namespace Umbra {

class UmbraException : public std::runtime_error {
public:
    explicit UmbraException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public UmbraException {
public:
    explicit IOException(const std::string& message) : UmbraException("IO Error: " + message) {}
};

class DatasetException : public UmbraException {
public:
    explicit DatasetException(const std::string& message) : UmbraException("Dataset Error: " + message) {}
};

class ConfigurationException : public UmbraException {
public:
    explicit ConfigurationException(const std::string& message, std::string attribute = "")
        : UmbraException("Configuration Error: " + message), attribute_(std::move(attribute)) {}

    const std::string& attribute() const noexcept { return attribute_; }

private:
    std::string attribute_;
};

/**
 * @brief Raised when a privacy criterion cannot be met within hierarchy heights and suppression limits.
 * @details Carries the best-effort state reached so callers can relax parameters.
 */
class UnattainablePrivacyException : public UmbraException {
public:
    UnattainablePrivacyException(const std::string& criterion,
                                 const std::string& message,
                                 std::map<std::string, int> levelsReached,
                                 size_t violatingClasses,
                                 size_t violatingRecords)
        : UmbraException("Unattainable " + criterion + ": " + message),
          criterion_(criterion),
          levelsReached_(std::move(levelsReached)),
          violatingClasses_(violatingClasses),
          violatingRecords_(violatingRecords) {}

    const std::string& criterion() const noexcept { return criterion_; }
    const std::map<std::string, int>& levelsReached() const noexcept { return levelsReached_; }
    size_t violatingClasses() const noexcept { return violatingClasses_; }
    size_t violatingRecords() const noexcept { return violatingRecords_; }

private:
    std::string criterion_;
    std::map<std::string, int> levelsReached_;
    size_t violatingClasses_;
    size_t violatingRecords_;
};

class ShapeMismatchException : public UmbraException {
public:
    explicit ShapeMismatchException(const std::string& message) : UmbraException("Shape Mismatch: " + message) {}
};

class NumericDomainException : public UmbraException {
public:
    NumericDomainException(const std::string& attribute, const std::string& message)
        : UmbraException("Numeric Domain Error [" + attribute + "]: " + message), attribute_(attribute) {}

    const std::string& attribute() const noexcept { return attribute_; }

private:
    std::string attribute_;
};

} // namespace Umbra

#endif // UMBRA_EXCEPTIONS_H
