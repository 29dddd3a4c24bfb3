#pragma once

#include "Cancellation.h"
#include "PrivacyConfig.h"
#include "PrivacyDataset.h"

#include <random>
#include <string>
#include <vector>

struct NoiseAttributeResult {
    std::string attribute;
    double epsilonSpent = 0.0;
    double deltaSpent = 0.0;
    // Laplace scale b or Gaussian standard deviation.
    double scale = 0.0;
    size_t noisedValues = 0;
    size_t clippedValues = 0;
};

struct NoiseReport {
    NoiseMechanism mechanism = NoiseMechanism::LAPLACE;
    CompositionPolicy composition = CompositionPolicy::PARALLEL;
    double epsilon = 0.0;
    double delta = 0.0;
    double sensitivity = 0.0;
    bool boundedDomain = false;
    // Budget consumed by the release as a whole under sequential composition over attributes.
    double aggregateEpsilon = 0.0;
    double aggregateDelta = 0.0;
    // False when a Gaussian attribute spent epsilon >= 1, outside the range where the classic sigma bound holds.
    bool gaussianBoundHolds = true;
    std::vector<NoiseAttributeResult> attributes;
};

struct NoiseResult {
    PrivacyDataset dataset;
    NoiseReport report;
};

class NoiseEngine {
public:
    /**
     * @brief Adds independent Laplace or Gaussian noise to every value of the selected numeric attributes.
     * @details Missing and suppressed cells are left untouched. With boundedDomain, results are clipped to the
     * attribute's observed range; clipping is post-processing and is reported per attribute.
     * @throws Umbra::ConfigurationException for epsilon <= 0, sensitivity <= 0, delta outside (0,1) or non-numeric attributes.
     * @throws Umbra::NumericDomainException when a scale or noised value is not finite.
     */
    static NoiseResult applyDifferentialPrivacy(const PrivacyDataset& data,
                                                const DifferentialPrivacyConfig& config,
                                                const CancelCheck& shouldCancel = {});

    // Cancellable form: polls shouldCancel every 4096 values.
    static RunOutcome<NoiseResult> run(const PrivacyDataset& data,
                                       const DifferentialPrivacyConfig& config,
                                       const CancelCheck& shouldCancel);

    static double laplaceScale(double epsilon, double sensitivity);
    // Classic Gaussian mechanism bound: sigma = sqrt(2 ln(1.25 / delta)) * sensitivity / epsilon, valid for epsilon < 1.
    static double gaussianSigma(double epsilon, double delta, double sensitivity);
    static double sampleLaplace(std::mt19937_64& rng, double scale);
};
