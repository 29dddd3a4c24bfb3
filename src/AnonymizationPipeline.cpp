#include "AnonymizationPipeline.h"

#include <algorithm>
#include <type_traits>

namespace {
AnonymizationResult fromDataset(PrivacyDataset dataset, const TechniqueConfig& config) {
    return AnonymizationResult{std::move(dataset), techniqueName(config), std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt};
}

KAnonymityConfig generalizationStage(const std::vector<std::string>& qis, size_t k, double suppressionLimit) {
    KAnonymityConfig stage;
    stage.quasiIdentifiers = qis;
    stage.k = std::max<size_t>(1, k);
    stage.suppressionLimit = suppressionLimit;
    return stage;
}

// Both stages must lift labels through the same hierarchies; defaults are inferred from the raw values.
HierarchySet resolveOnSource(const PrivacyDataset& data, const std::vector<std::string>& requested, const HierarchySet& hierarchies) {
    return HierarchyRegistry::global().resolve(data, resolveQuasiIdentifiers(data, requested), hierarchies);
}
} // namespace

AnonymizationResult AnonymizationPipeline::apply(const TechniqueConfig& config,
                                                 const PrivacyDataset& data,
                                                 const HierarchySet& hierarchies,
                                                 const CancelCheck& shouldCancel) {
    return std::visit(
        [&](const auto& cfg) -> AnonymizationResult {
            using T = std::decay_t<decltype(cfg)>;
            if constexpr (std::is_same_v<T, KAnonymityConfig>) {
                GeneralizationResult g = Generalizer::generalize(data, hierarchies, cfg, shouldCancel);
                AnonymizationResult out = fromDataset(std::move(g.dataset), config);
                out.generalization = std::move(g.report);
                return out;
            } else if constexpr (std::is_same_v<T, LDiversityConfig>) {
                cfg.validate(data);
                const HierarchySet resolved = resolveOnSource(data, cfg.quasiIdentifiers, hierarchies);
                const size_t k = cfg.k == 0 ? cfg.l : cfg.k;
                GeneralizationResult g = Generalizer::generalize(
                    data, resolved, generalizationStage(cfg.quasiIdentifiers, k, cfg.suppressionLimit), shouldCancel);
                DiversityResult d = DiversityEnforcer::enforceLDiversity(g.dataset, resolved, cfg, shouldCancel);
                AnonymizationResult out = fromDataset(std::move(d.dataset), config);
                out.generalization = std::move(g.report);
                out.diversity = std::move(d.report);
                return out;
            } else if constexpr (std::is_same_v<T, TClosenessConfig>) {
                cfg.validate(data);
                const HierarchySet resolved = resolveOnSource(data, cfg.quasiIdentifiers, hierarchies);
                GeneralizationResult g = Generalizer::generalize(
                    data, resolved, generalizationStage(cfg.quasiIdentifiers, cfg.k, cfg.suppressionLimit), shouldCancel);
                ClosenessResult c = DiversityEnforcer::enforceTCloseness(g.dataset, resolved, cfg, shouldCancel);
                AnonymizationResult out = fromDataset(std::move(c.dataset), config);
                out.generalization = std::move(g.report);
                out.closeness = std::move(c.report);
                return out;
            } else if constexpr (std::is_same_v<T, DifferentialPrivacyConfig>) {
                NoiseResult n = NoiseEngine::applyDifferentialPrivacy(data, cfg, shouldCancel);
                AnonymizationResult out = fromDataset(std::move(n.dataset), config);
                out.noise = std::move(n.report);
                return out;
            } else {
                SyntheticResult s = SyntheticGenerator::generate(data, cfg, shouldCancel);
                AnonymizationResult out = fromDataset(std::move(s.dataset), config);
                out.synthetic = std::move(s.report);
                return out;
            }
        },
        config);
}

RunOutcome<AnonymizationResult> AnonymizationPipeline::run(const TechniqueConfig& config,
                                                           const PrivacyDataset& data,
                                                           const HierarchySet& hierarchies,
                                                           const CancelCheck& shouldCancel) {
    return runCancellable<AnonymizationResult>([&]() { return apply(config, data, hierarchies, shouldCancel); });
}
