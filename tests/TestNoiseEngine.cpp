#include "NoiseEngine.h"
#include "TestFixtures.h"
#include "UmbraExceptions.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace {
DifferentialPrivacyConfig seeded(double epsilon, uint32_t seed = 2024) {
    DifferentialPrivacyConfig config;
    config.epsilon = epsilon;
    config.seed = seed;
    return config;
}
} // namespace

TEST_CASE("noise scales follow the mechanism formulas", "[noise]") {
    REQUIRE(NoiseEngine::laplaceScale(0.5, 1.0) == Approx(2.0));
    REQUIRE(NoiseEngine::laplaceScale(2.0, 10.0) == Approx(5.0));
    REQUIRE(NoiseEngine::gaussianSigma(1.0, 1e-5, 1.0) == Approx(std::sqrt(2.0 * std::log(1.25 / 1e-5))));
}

TEST_CASE("Laplace samples have variance 2b^2", "[noise]") {
    std::mt19937_64 rng(99);
    const double b = NoiseEngine::laplaceScale(0.5, 1.0);
    const size_t n = 200000;
    double sum = 0.0, sumSq = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double x = NoiseEngine::sampleLaplace(rng, b);
        sum += x;
        sumSq += x * x;
    }
    const double mean = sum / static_cast<double>(n);
    const double variance = sumSq / static_cast<double>(n) - mean * mean;
    REQUIRE(std::abs(mean) < 0.05);
    REQUIRE(variance == Approx(2.0 * b * b).epsilon(0.05));
}

TEST_CASE("perturbed column keeps its mean and gains the expected spread", "[noise]") {
    const size_t n = 50000;
    const PrivacyDataset data({makeNumericColumn("value", std::vector<double>(n, 10.0))});
    const NoiseResult result = NoiseEngine::applyDifferentialPrivacy(data, seeded(1.0));

    double sum = 0.0, sumSq = 0.0;
    const size_t col = result.dataset.requireColumnIndex("value");
    for (size_t r = 0; r < n; ++r) {
        const double d = *result.dataset.numericValue(r, col) - 10.0;
        sum += d;
        sumSq += d * d;
    }
    REQUIRE(std::abs(sum / n) < 0.05);
    REQUIRE(sumSq / n == Approx(2.0).epsilon(0.08));
    REQUIRE(result.report.attributes.size() == 1);
    REQUIRE(result.report.attributes.front().noisedValues == n);
    REQUIRE(result.report.attributes.front().scale == Approx(1.0));
}

TEST_CASE("non-positive epsilon is rejected before any noise is added", "[noise]") {
    const PrivacyDataset data = TestFixtures::patients(20);
    REQUIRE_THROWS_AS(NoiseEngine::applyDifferentialPrivacy(data, seeded(0.0)), Umbra::ConfigurationException);
    REQUIRE_THROWS_AS(NoiseEngine::applyDifferentialPrivacy(data, seeded(-1.0)), Umbra::ConfigurationException);

    DifferentialPrivacyConfig config = seeded(1.0);
    config.sensitivity = 0.0;
    REQUIRE_THROWS_AS(NoiseEngine::applyDifferentialPrivacy(data, config), Umbra::ConfigurationException);

    config = seeded(1.0);
    config.mechanism = NoiseMechanism::GAUSSIAN;
    config.delta = 1.0;
    REQUIRE_THROWS_AS(NoiseEngine::applyDifferentialPrivacy(data, config), Umbra::ConfigurationException);

    config = seeded(1.0);
    config.numericAttributes = {"diagnosis"};
    REQUIRE_THROWS_AS(NoiseEngine::applyDifferentialPrivacy(data, config), Umbra::ConfigurationException);
}

TEST_CASE("seeded runs are reproducible", "[noise]") {
    const PrivacyDataset data = TestFixtures::patients(100);
    const NoiseResult a = NoiseEngine::applyDifferentialPrivacy(data, seeded(1.0, 5));
    const NoiseResult b = NoiseEngine::applyDifferentialPrivacy(data, seeded(1.0, 5));
    const NoiseResult c = NoiseEngine::applyDifferentialPrivacy(data, seeded(1.0, 6));
    REQUIRE(TestFixtures::sameCells(a.dataset, b.dataset));
    REQUIRE_FALSE(TestFixtures::sameCells(a.dataset, c.dataset));
}

TEST_CASE("default attributes are the numeric non-identifiers", "[noise]") {
    const PrivacyDataset data = TestFixtures::patients(100);
    const NoiseResult result = NoiseEngine::applyDifferentialPrivacy(data, seeded(1.0));
    REQUIRE(result.report.attributes.size() == 2);
    REQUIRE(result.report.attributes[0].attribute == "age");
    REQUIRE(result.report.attributes[1].attribute == "income");

    const size_t zip = data.requireColumnIndex("zip");
    for (size_t r = 0; r < data.rowCount(); ++r) REQUIRE(result.dataset.cellText(r, zip) == data.cellText(r, zip));
}

TEST_CASE("composition policy splits or repeats the budget", "[noise]") {
    const PrivacyDataset data = TestFixtures::patients(50);
    DifferentialPrivacyConfig config = seeded(1.0);
    config.numericAttributes = {"age", "income"};

    config.composition = CompositionPolicy::SEQUENTIAL;
    const NoiseReport sequential = NoiseEngine::applyDifferentialPrivacy(data, config).report;
    REQUIRE(sequential.attributes[0].epsilonSpent == Approx(0.5));
    REQUIRE(sequential.aggregateEpsilon == Approx(1.0));
    REQUIRE(sequential.attributes[0].scale == Approx(2.0));

    config.composition = CompositionPolicy::PARALLEL;
    const NoiseReport parallel = NoiseEngine::applyDifferentialPrivacy(data, config).report;
    REQUIRE(parallel.attributes[0].epsilonSpent == Approx(1.0));
    REQUIRE(parallel.aggregateEpsilon == Approx(2.0));
}

TEST_CASE("bounded domain clips to the observed range", "[noise]") {
    const PrivacyDataset data = TestFixtures::patients(300);
    DifferentialPrivacyConfig config = seeded(0.01);
    config.numericAttributes = {"age"};
    config.boundedDomain = true;
    const NoiseResult result = NoiseEngine::applyDifferentialPrivacy(data, config);

    const size_t age = result.dataset.requireColumnIndex("age");
    double lo = *data.numericValue(0, age), hi = lo;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        lo = std::min(lo, *data.numericValue(r, age));
        hi = std::max(hi, *data.numericValue(r, age));
    }
    for (size_t r = 0; r < result.dataset.rowCount(); ++r) {
        const double v = *result.dataset.numericValue(r, age);
        REQUIRE(v >= lo);
        REQUIRE(v <= hi);
    }
    REQUIRE(result.report.attributes.front().clippedValues > 0);
}

TEST_CASE("missing and suppressed cells are left untouched", "[noise]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const PrivacyDataset data =
        PrivacyDataset({makeNumericColumn("value", {1.0, nan, 3.0, 4.0})}).withSuppressed({0, 0, 0, 1});
    const NoiseResult result = NoiseEngine::applyDifferentialPrivacy(data, seeded(1.0));
    REQUIRE(result.dataset.isMissing(1, 0));
    REQUIRE(*result.dataset.numericValue(3, 0) == 4.0);
    REQUIRE(result.report.attributes.front().noisedValues == 2);
}

TEST_CASE("Gaussian mechanism reports delta and sigma", "[noise]") {
    const PrivacyDataset data = TestFixtures::patients(50);
    DifferentialPrivacyConfig config = seeded(1.0);
    config.mechanism = NoiseMechanism::GAUSSIAN;
    config.delta = 1e-5;
    config.numericAttributes = {"income"};
    const NoiseReport report = NoiseEngine::applyDifferentialPrivacy(data, config).report;
    REQUIRE(report.delta == Approx(1e-5));
    REQUIRE(report.attributes.front().scale == Approx(NoiseEngine::gaussianSigma(1.0, 1e-5, 1.0)));
}

TEST_CASE("noise injection can be cancelled", "[noise]") {
    const PrivacyDataset data = TestFixtures::patients(50);
    const auto outcome = NoiseEngine::run(data, seeded(1.0), [] { return true; });
    REQUIRE(outcome.isCancelled());
    const auto completed = NoiseEngine::run(data, seeded(1.0), {});
    REQUIRE(completed.result.has_value());
}

TEST_CASE("Gaussian runs flag epsilon outside the classic sigma bound", "[noise]") {
    const PrivacyDataset data = TestFixtures::patients(50);
    DifferentialPrivacyConfig config = seeded(1.0);
    config.mechanism = NoiseMechanism::GAUSSIAN;
    REQUIRE_FALSE(NoiseEngine::applyDifferentialPrivacy(data, config).report.gaussianBoundHolds);

    config.epsilon = 0.5;
    REQUIRE(NoiseEngine::applyDifferentialPrivacy(data, config).report.gaussianBoundHolds);

    // age and income split 1.5 sequentially, 0.75 each.
    config.epsilon = 1.5;
    config.composition = CompositionPolicy::SEQUENTIAL;
    const NoiseReport split = NoiseEngine::applyDifferentialPrivacy(data, config).report;
    REQUIRE(split.attributes.size() == 2);
    REQUIRE(split.gaussianBoundHolds);

    config.composition = CompositionPolicy::PARALLEL;
    REQUIRE_FALSE(NoiseEngine::applyDifferentialPrivacy(data, config).report.gaussianBoundHolds);

    // Laplace has no such restriction.
    REQUIRE(NoiseEngine::applyDifferentialPrivacy(data, seeded(3.0)).report.gaussianBoundHolds);
}
