#include "NoiseEngine.h"
#include "CommonUtils.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr size_t kCancelCheckInterval = 4096;

std::mt19937_64 makeEngine(const DifferentialPrivacyConfig& config) {
    if (config.seed) return std::mt19937_64(*config.seed);
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}
} // namespace

double NoiseEngine::laplaceScale(double epsilon, double sensitivity) {
    return sensitivity / epsilon;
}

double NoiseEngine::gaussianSigma(double epsilon, double delta, double sensitivity) {
    return std::sqrt(2.0 * std::log(1.25 / delta)) * sensitivity / epsilon;
}

double NoiseEngine::sampleLaplace(std::mt19937_64& rng, double scale) {
    // Inverse CDF on u in (0,1), excluding 0 so log stays finite.
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    double u = uniform(rng);
    while (u <= 0.0) u = uniform(rng);
    return u < 0.5 ? scale * std::log(2.0 * u) : -scale * std::log(2.0 * (1.0 - u));
}

NoiseResult NoiseEngine::applyDifferentialPrivacy(const PrivacyDataset& data,
                                                  const DifferentialPrivacyConfig& config,
                                                  const CancelCheck& shouldCancel) {
    config.validate(data);
    const std::vector<std::string> attributes = resolveNumericAttributes(data, config.numericAttributes);
    const double m = static_cast<double>(attributes.size());
    const bool split = config.composition == CompositionPolicy::SEQUENTIAL;
    const bool gaussian = config.mechanism == NoiseMechanism::GAUSSIAN;
    const double epsPer = split ? config.epsilon / m : config.epsilon;
    const double deltaPer = gaussian ? (split ? config.delta / m : config.delta) : 0.0;

    NoiseReport report;
    report.mechanism = config.mechanism;
    report.composition = config.composition;
    report.epsilon = config.epsilon;
    report.delta = gaussian ? config.delta : 0.0;
    report.sensitivity = config.sensitivity;
    report.boundedDomain = config.boundedDomain;
    report.aggregateEpsilon = epsPer * m;
    report.aggregateDelta = deltaPer * m;
    report.gaussianBoundHolds = !gaussian || epsPer < 1.0;

    std::mt19937_64 rng = makeEngine(config);
    std::vector<TypedColumn> columns = data.columns();
    size_t processed = 0;

    for (const auto& name : attributes) {
        throwIfCancelled(shouldCancel);
        const size_t col = data.requireColumnIndex(name);
        const double scale = gaussian ? gaussianSigma(epsPer, deltaPer, config.sensitivity)
                                      : laplaceScale(epsPer, config.sensitivity);
        if (!std::isfinite(scale) || !(scale > 0.0)) {
            throw Umbra::NumericDomainException(name, "noise scale " + CommonUtils::formatNumber(scale) +
                                                          " is not a positive finite number");
        }

        TypedColumn& column = columns[col];
        auto& values = std::get<std::vector<double>>(column.values);
        double lo = 0.0, hi = 0.0;
        bool any = false;
        for (size_t r = 0; r < values.size(); ++r) {
            if (column.missing[r]) continue;
            lo = any ? std::min(lo, values[r]) : values[r];
            hi = any ? std::max(hi, values[r]) : values[r];
            any = true;
        }

        NoiseAttributeResult result;
        result.attribute = name;
        result.epsilonSpent = epsPer;
        result.deltaSpent = deltaPer;
        result.scale = scale;
        std::normal_distribution<double> normal(0.0, scale);
        for (size_t r = 0; r < values.size(); ++r) {
            if (++processed % kCancelCheckInterval == 0) throwIfCancelled(shouldCancel);
            if (column.missing[r] || data.isSuppressed(r)) continue;
            double noised = values[r] + (gaussian ? normal(rng) : sampleLaplace(rng, scale));
            if (!std::isfinite(noised)) {
                throw Umbra::NumericDomainException(name, "noised value at row " + std::to_string(r) + " is not finite");
            }
            if (config.boundedDomain && (noised < lo || noised > hi)) {
                noised = std::clamp(noised, lo, hi);
                ++result.clippedValues;
            }
            values[r] = noised;
            ++result.noisedValues;
        }
        report.attributes.push_back(result);
    }

    return {data.withColumns(std::move(columns)), std::move(report)};
}

RunOutcome<NoiseResult> NoiseEngine::run(const PrivacyDataset& data,
                                         const DifferentialPrivacyConfig& config,
                                         const CancelCheck& shouldCancel) {
    return runCancellable<NoiseResult>([&]() { return applyDifferentialPrivacy(data, config, shouldCancel); });
}
