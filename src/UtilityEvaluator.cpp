#include "UtilityEvaluator.h"
#include "CommonUtils.h"
#include "GeneralizationHierarchy.h"
#include "Statistics.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <optional>
#include <random>
#include <set>
#include <unordered_map>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr double kScaleFloor = 1e-8;
constexpr size_t kMaxEntropyBins = 20;
constexpr size_t kMinTargetClasses = 2;
constexpr size_t kMaxTargetClasses = 10;
constexpr size_t kMinClassificationRows = 10;
constexpr double kLaplaceSmoothing = 1.0;

struct AlignedPair {
    size_t original;
    size_t transformed;
};

// One attribute viewed on both sides over the aligned records.
struct AttributeView {
    std::string name;
    bool numeric = false;
    std::vector<std::optional<double>> origNum;
    std::vector<std::optional<double>> transNum;
    std::vector<std::string> origLabel;
    std::vector<std::string> transLabel;
    bool transformedIsNumericColumn = false;
};

double relativeSimilarity(double o, double t) {
    return std::max(0.0, 1.0 - std::abs(o - t) / (std::abs(o) + kScaleFloor));
}

std::vector<double> present(const std::vector<std::optional<double>>& v) {
    std::vector<double> out;
    out.reserve(v.size());
    for (const auto& x : v) {
        if (x) out.push_back(*x);
    }
    return out;
}

FrequencyTable frequencies(const std::vector<std::string>& labels) {
    FrequencyTable t;
    for (const auto& l : labels) t[l] += 1.0;
    return t;
}

std::optional<double> transformedNumber(const PrivacyDataset& data, size_t row, size_t col, ColumnType sourceType) {
    const TypedColumn& c = data.column(col);
    if (data.isMissing(row, col)) return std::nullopt;
    if (c.type != ColumnType::CATEGORICAL) return data.numericValue(row, col);
    return GeneralizationHierarchy::labelMidpoint(data.cellText(row, col), sourceType);
}

std::vector<AlignedPair> alignRecords(const PrivacyDataset& original, const PrivacyDataset& transformed) {
    if (transformed.sourceRowCount() != original.rowCount()) {
        throw Umbra::ShapeMismatchException("transformed dataset derives from " + std::to_string(transformed.sourceRowCount()) +
                                            " records but the original has " + std::to_string(original.rowCount()));
    }
    std::vector<uint8_t> seen(original.rowCount(), 0);
    std::vector<AlignedPair> pairs;
    for (size_t i = 0; i < transformed.rowCount(); ++i) {
        const size_t src = transformed.sourceRows()[i];
        if (src >= original.rowCount() || seen[src]) {
            throw Umbra::ShapeMismatchException("transformed record " + std::to_string(i) + " does not map to a unique original record");
        }
        seen[src] = 1;
        if (transformed.isSuppressed(i) || original.isSuppressed(src)) continue;
        pairs.push_back({src, i});
    }
    return pairs;
}

std::vector<AttributeView> buildViews(const PrivacyDataset& original,
                                      const PrivacyDataset& transformed,
                                      const std::vector<AlignedPair>& pairs) {
    std::vector<AttributeView> views;
    std::set<std::string> expected;
    for (const auto& col : original.columns()) {
        if (col.role == AttributeRole::IDENTIFIER) continue;
        expected.insert(col.name);
        const int tIdx = transformed.findColumnIndex(col.name);
        if (tIdx < 0) {
            throw Umbra::ShapeMismatchException("attribute '" + col.name + "' is missing from the transformed dataset");
        }
        const size_t oc = original.requireColumnIndex(col.name);
        const size_t tc = static_cast<size_t>(tIdx);

        AttributeView view;
        view.name = col.name;
        view.numeric = col.type == ColumnType::NUMERIC || col.type == ColumnType::DATETIME;
        view.transformedIsNumericColumn = transformed.column(tc).type != ColumnType::CATEGORICAL;
        for (const auto& p : pairs) {
            view.origLabel.push_back(original.cellKey(p.original, oc));
            view.transLabel.push_back(transformed.cellKey(p.transformed, tc));
            if (view.numeric) {
                view.origNum.push_back(original.numericValue(p.original, oc));
                view.transNum.push_back(transformedNumber(transformed, p.transformed, tc, col.type));
            }
        }
        views.push_back(std::move(view));
    }
    for (const auto& col : transformed.columns()) {
        const int oIdx = original.findColumnIndex(col.name);
        if (oIdx < 0) {
            throw Umbra::ShapeMismatchException("attribute '" + col.name + "' is not in the original dataset");
        }
    }
    return views;
}

double statisticalSimilarity(const AttributeView& v) {
    if (!v.numeric) return 1.0 - Statistics::totalVariation(frequencies(v.origLabel), frequencies(v.transLabel));
    const std::vector<double> o = present(v.origNum);
    const std::vector<double> t = present(v.transNum);
    if (o.empty()) return t.empty() ? 1.0 : 0.0;
    if (t.empty()) return 0.0;
    const ColumnStats so = Statistics::calculateStats(o);
    const ColumnStats st = Statistics::calculateStats(t);
    return (relativeSimilarity(so.mean, st.mean) + relativeSimilarity(so.stddev, st.stddev) +
            relativeSimilarity(so.max - so.min, st.max - st.min)) / 3.0;
}

double distributionSimilarity(const AttributeView& v) {
    if (!v.numeric) return 1.0 - Statistics::totalVariation(frequencies(v.origLabel), frequencies(v.transLabel));
    const std::vector<double> o = present(v.origNum);
    const std::vector<double> t = present(v.transNum);
    if (o.empty()) return t.empty() ? 1.0 : 0.0;
    if (t.empty()) return 0.0;
    const ColumnStats so = Statistics::calculateStats(o);
    const double range = so.max - so.min;
    const double w = Statistics::wasserstein1D(o, t);
    const double wScore = range > 0.0 ? std::max(0.0, 1.0 - w / range) : (w <= kScaleFloor ? 1.0 : 0.0);
    return std::clamp(0.5 * ((1.0 - Statistics::ksStatistic(o, t)) + wScore), 0.0, 1.0);
}

std::vector<std::string> equalWidthBins(const std::vector<std::optional<double>>& values, double lo, double hi, size_t bins) {
    std::vector<std::string> out;
    out.reserve(values.size());
    const double width = (hi - lo) / static_cast<double>(bins);
    for (const auto& v : values) {
        if (!v) {
            out.push_back(PrivacyDataset::missingKey());
            continue;
        }
        size_t b = width > 0.0 ? static_cast<size_t>(std::floor((*v - lo) / width)) : 0;
        if (*v < lo) b = 0;
        b = std::min(b, bins - 1);
        out.push_back(std::to_string(b));
    }
    return out;
}

double informationPreservation(const AttributeView& v) {
    std::vector<std::string> o = v.origLabel;
    std::vector<std::string> t = v.transLabel;
    if (v.numeric) {
        const std::vector<double> ov = present(v.origNum);
        const std::set<double> unique(ov.begin(), ov.end());
        if (unique.size() > 1) {
            const size_t bins = std::min(kMaxEntropyBins, unique.size());
            o = equalWidthBins(v.origNum, *unique.begin(), *unique.rbegin(), bins);
            t = equalWidthBins(v.transNum, *unique.begin(), *unique.rbegin(), bins);
        }
    }
    const double ho = Statistics::entropy(frequencies(o));
    if (ho <= 0.0) return 1.0;
    const double ht = Statistics::entropy(frequencies(t));
    return 1.0 - std::clamp((ho - ht) / ho, 0.0, 1.0);
}

// Categorical view of an attribute: quantile bins of the original values for numeric attributes.
std::pair<std::vector<std::string>, std::vector<std::string>> associationLabels(const AttributeView& v, size_t bins) {
    if (!v.numeric) return {v.origLabel, v.transLabel};
    const std::vector<double> edges = Statistics::quantileEdges(present(v.origNum), bins);
    auto binned = [&](const std::vector<std::optional<double>>& values) {
        std::vector<std::string> out;
        out.reserve(values.size());
        for (const auto& x : values) {
            out.push_back(x ? std::to_string(Statistics::binIndex(edges, *x)) : PrivacyDataset::missingKey());
        }
        return out;
    };
    return {binned(v.origNum), binned(v.transNum)};
}

double pairedPearson(const std::vector<std::optional<double>>& a, const std::vector<std::optional<double>>& b) {
    std::vector<double> x, y;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] && b[i]) {
            x.push_back(*a[i]);
            y.push_back(*b[i]);
        }
    }
    return Statistics::pearson(x, y);
}

double correlationPreservation(const std::vector<AttributeView>& views, size_t bins) {
    std::vector<std::pair<size_t, size_t>> pairs;
    for (size_t i = 0; i < views.size(); ++i) {
        for (size_t j = i + 1; j < views.size(); ++j) pairs.emplace_back(i, j);
    }
    if (pairs.empty()) return 1.0;

    std::vector<std::pair<std::vector<std::string>, std::vector<std::string>>> labels;
    labels.reserve(views.size());
    for (const auto& v : views) labels.push_back(associationLabels(v, bins));

    std::vector<double> diffs(pairs.size(), 0.0);
#ifdef USE_OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
    for (int p = 0; p < static_cast<int>(pairs.size()); ++p) {
        const auto& a = views[pairs[static_cast<size_t>(p)].first];
        const auto& b = views[pairs[static_cast<size_t>(p)].second];
        double before = 0.0, after = 0.0;
        if (a.numeric && b.numeric) {
            before = pairedPearson(a.origNum, b.origNum);
            after = pairedPearson(a.transNum, b.transNum);
        } else {
            const auto& la = labels[pairs[static_cast<size_t>(p)].first];
            const auto& lb = labels[pairs[static_cast<size_t>(p)].second];
            before = Statistics::cramersV(la.first, lb.first);
            after = Statistics::cramersV(la.second, lb.second);
        }
        diffs[static_cast<size_t>(p)] = std::abs(before - after);
    }
    const double mean = std::accumulate(diffs.begin(), diffs.end(), 0.0) / static_cast<double>(diffs.size());
    return std::clamp(1.0 - mean, 0.0, 1.0);
}

std::string pickTarget(const std::vector<AttributeView>& views, const PrivacyDataset& original) {
    for (const auto& v : views) {
        if (v.numeric || original.column(v.name).type != ColumnType::CATEGORICAL) continue;
        std::set<std::string> classes(v.origLabel.begin(), v.origLabel.end());
        classes.erase(PrivacyDataset::missingKey());
        if (classes.size() >= kMinTargetClasses && classes.size() <= kMaxTargetClasses) return v.name;
    }
    return "";
}

// Categorical naive Bayes with Laplace smoothing over token features.
double naiveBayesAccuracy(const std::vector<std::vector<std::string>>& features,
                          const std::vector<std::string>& target,
                          const std::vector<size_t>& train,
                          const std::vector<size_t>& test) {
    std::map<std::string, double> classCount;
    std::vector<std::unordered_map<std::string, std::map<std::string, double>>> tokenCount(features.size());
    std::vector<std::set<std::string>> vocab(features.size());
    for (size_t r : train) {
        classCount[target[r]] += 1.0;
        for (size_t f = 0; f < features.size(); ++f) {
            tokenCount[f][features[f][r]][target[r]] += 1.0;
            vocab[f].insert(features[f][r]);
        }
    }
    if (classCount.empty() || test.empty()) return 0.0;

    const double total = static_cast<double>(train.size());
    size_t correct = 0;
    for (size_t r : test) {
        std::string bestClass;
        double bestScore = -std::numeric_limits<double>::infinity();
        for (const auto& [cls, count] : classCount) {
            double score = std::log(count / total);
            for (size_t f = 0; f < features.size(); ++f) {
                double hits = 0.0;
                auto tok = tokenCount[f].find(features[f][r]);
                if (tok != tokenCount[f].end()) {
                    auto it = tok->second.find(cls);
                    if (it != tok->second.end()) hits = it->second;
                }
                const double v = static_cast<double>(vocab[f].size()) + 1.0;
                score += std::log((hits + kLaplaceSmoothing) / (count + kLaplaceSmoothing * v));
            }
            if (score > bestScore) {
                bestScore = score;
                bestClass = cls;
            }
        }
        if (bestClass == target[r]) ++correct;
    }
    return static_cast<double>(correct) / static_cast<double>(test.size());
}

std::vector<std::string> featureTokens(const std::vector<std::optional<double>>& numeric,
                                       const std::vector<std::string>& labels,
                                       bool useNumeric,
                                       const std::vector<size_t>& train,
                                       size_t bins) {
    if (!useNumeric) return labels;
    std::vector<double> trainValues;
    for (size_t r : train) {
        if (numeric[r]) trainValues.push_back(*numeric[r]);
    }
    const std::vector<double> edges = Statistics::quantileEdges(trainValues, bins);
    std::vector<std::string> out;
    out.reserve(numeric.size());
    for (const auto& x : numeric) {
        out.push_back(x ? std::to_string(Statistics::binIndex(edges, *x)) : PrivacyDataset::missingKey());
    }
    return out;
}

struct ClassificationOutcome {
    bool computed = false;
    double originalAccuracy = 0.0;
    double transformedAccuracy = 0.0;
    double score = 1.0;
};

ClassificationOutcome classificationUtility(const std::vector<AttributeView>& views,
                                            const std::string& target,
                                            const UtilityOptions& options) {
    ClassificationOutcome out;
    auto targetIt = std::find_if(views.begin(), views.end(), [&](const AttributeView& v) { return v.name == target; });
    if (targetIt == views.end()) return out;
    const size_t n = targetIt->origLabel.size();
    if (n < kMinClassificationRows || views.size() < 2) return out;

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), size_t{0});
    std::mt19937 rng(options.seed);
    std::shuffle(order.begin(), order.end(), rng);
    const size_t testCount = std::clamp<size_t>(static_cast<size_t>(std::round(options.testFraction * static_cast<double>(n))), 1, n - 1);
    const std::vector<size_t> test(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(testCount));
    const std::vector<size_t> train(order.begin() + static_cast<std::ptrdiff_t>(testCount), order.end());

    std::vector<std::vector<std::string>> origFeatures, transFeatures;
    for (const auto& v : views) {
        if (v.name == target) continue;
        origFeatures.push_back(featureTokens(v.origNum, v.origLabel, v.numeric, train, options.bins));
        transFeatures.push_back(featureTokens(v.transNum, v.transLabel, v.numeric && v.transformedIsNumericColumn, train, options.bins));
    }

    out.computed = true;
    out.originalAccuracy = naiveBayesAccuracy(origFeatures, targetIt->origLabel, train, test);
    out.transformedAccuracy = naiveBayesAccuracy(transFeatures, targetIt->transLabel, train, test);
    out.score = out.originalAccuracy <= 0.0 ? 1.0 : std::min(1.0, out.transformedAccuracy / out.originalAccuracy);
    return out;
}

double queryAccuracy(const PrivacyDataset& original, const PrivacyDataset& transformed, const std::vector<AttributeView>& views) {
    const std::vector<size_t> origRows = original.retainedRows();
    const std::vector<size_t> transRows = transformed.retainedRows();
    const double countScore = origRows.empty() ? 1.0
        : relativeSimilarity(static_cast<double>(origRows.size()), static_cast<double>(transRows.size()));

    std::vector<double> attrScores;
    for (const auto& v : views) {
        if (!v.numeric) continue;
        const size_t oc = original.requireColumnIndex(v.name);
        const size_t tc = transformed.requireColumnIndex(v.name);
        const ColumnType sourceType = original.column(oc).type;
        double sumO = 0.0, sumT = 0.0;
        size_t nO = 0, nT = 0;
        for (size_t r : origRows) {
            if (auto x = original.numericValue(r, oc)) {
                sumO += *x;
                ++nO;
            }
        }
        for (size_t r : transRows) {
            if (auto x = transformedNumber(transformed, r, tc, sourceType)) {
                sumT += *x;
                ++nT;
            }
        }
        if (nO == 0) continue;
        const double meanO = sumO / static_cast<double>(nO);
        const double meanT = nT ? sumT / static_cast<double>(nT) : 0.0;
        attrScores.push_back(0.5 * (relativeSimilarity(sumO, sumT) + relativeSimilarity(meanO, meanT)));
    }
    if (attrScores.empty()) return countScore;
    const double attrMean = std::accumulate(attrScores.begin(), attrScores.end(), 0.0) / static_cast<double>(attrScores.size());
    return 0.5 * (countScore + attrMean);
}

double meanOf(const std::vector<AttributeView>& views, double (*fn)(const AttributeView&), std::vector<double>& perAttribute) {
    perAttribute.clear();
    for (const auto& v : views) perAttribute.push_back(fn(v));
    if (perAttribute.empty()) return 1.0;
    return std::accumulate(perAttribute.begin(), perAttribute.end(), 0.0) / static_cast<double>(perAttribute.size());
}

std::vector<std::string> buildRecommendations(const UtilityReport& r) {
    std::vector<std::string> out;
    auto below = [&](const char* name, double threshold) { return r.has(name) && r.metric(name) < threshold; };
    if (below("statistical_similarity", 0.7)) {
        out.push_back("Summary statistics drift noticeably; use finer hierarchies or a larger privacy budget.");
    }
    if (below("correlation_preservation", 0.7)) {
        out.push_back("Relationships between attributes are weakened; generalize fewer quasi-identifiers or prefer local recoding.");
    }
    if (below("distribution_similarity", 0.7)) {
        out.push_back("Value distributions are distorted; reduce noise scale or enable bounded-domain clipping.");
    }
    if (below("information_preservation", 0.6)) {
        out.push_back("Generalization removes much of the detail; lower k or supply hierarchies with more intermediate levels.");
    }
    if (below("classification_utility", 0.8)) {
        out.push_back("Models trained on the transformed data lose accuracy predicting '" + r.targetAttribute + "'.");
    }
    if (below("query_accuracy", 0.8)) {
        out.push_back("Aggregate query answers deviate from the original; review suppression volume and noise scale.");
    }
    if (r.droppedRecords > 0) {
        out.push_back(std::to_string(r.droppedRecords) + " suppressed records were excluded from the comparison.");
    }
    if (out.empty()) out.push_back("The transformed dataset preserves analytical utility well.");
    return out;
}
} // namespace

double UtilityReport::metric(const std::string& name) const {
    auto it = metrics.find(name);
    return it == metrics.end() ? 0.0 : it->second;
}

std::string utilityMetricName(UtilityMetric metric) {
    switch (metric) {
        case UtilityMetric::STATISTICAL_SIMILARITY: return "statistical_similarity";
        case UtilityMetric::CORRELATION_PRESERVATION: return "correlation_preservation";
        case UtilityMetric::DISTRIBUTION_SIMILARITY: return "distribution_similarity";
        case UtilityMetric::INFORMATION_PRESERVATION: return "information_preservation";
        case UtilityMetric::CLASSIFICATION_UTILITY: return "classification_utility";
        case UtilityMetric::QUERY_ACCURACY: return "query_accuracy";
    }
    return "statistical_similarity";
}

UtilityMetric parseUtilityMetric(const std::string& name) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    std::replace(v.begin(), v.end(), '-', '_');
    for (UtilityMetric m : UtilityOptions{}.metrics) {
        if (utilityMetricName(m) == v) return m;
    }
    if (v == "statistical") return UtilityMetric::STATISTICAL_SIMILARITY;
    if (v == "correlation") return UtilityMetric::CORRELATION_PRESERVATION;
    if (v == "distribution") return UtilityMetric::DISTRIBUTION_SIMILARITY;
    if (v == "information") return UtilityMetric::INFORMATION_PRESERVATION;
    if (v == "classification") return UtilityMetric::CLASSIFICATION_UTILITY;
    if (v == "query") return UtilityMetric::QUERY_ACCURACY;
    throw Umbra::ConfigurationException("unknown utility metric '" + name + "'");
}

std::string utilityLevelName(UtilityLevel level) {
    switch (level) {
        case UtilityLevel::EXCELLENT: return "Excellent";
        case UtilityLevel::GOOD: return "Good";
        case UtilityLevel::FAIR: return "Fair";
        case UtilityLevel::POOR: return "Poor";
        case UtilityLevel::VERY_POOR: return "Very Poor";
    }
    return "Very Poor";
}

UtilityLevel UtilityEvaluator::classify(double score) noexcept {
    if (score >= 0.9) return UtilityLevel::EXCELLENT;
    if (score >= 0.7) return UtilityLevel::GOOD;
    if (score >= 0.5) return UtilityLevel::FAIR;
    if (score >= 0.3) return UtilityLevel::POOR;
    return UtilityLevel::VERY_POOR;
}

void UtilityOptions::validate(const PrivacyDataset& original) const {
    if (metrics.empty()) throw Umbra::ConfigurationException("at least one utility metric is required");
    if (!targetAttribute.empty() && original.findColumnIndex(targetAttribute) < 0) {
        throw Umbra::ConfigurationException("target attribute '" + targetAttribute + "' is not in the schema", targetAttribute);
    }
    if (!(testFraction > 0.0 && testFraction < 1.0)) {
        throw Umbra::ConfigurationException("test fraction must be within (0,1)");
    }
    if (bins < 2) throw Umbra::ConfigurationException("bins must be >= 2");
}

UtilityReport UtilityEvaluator::evaluate(const PrivacyDataset& original,
                                         const PrivacyDataset& transformed,
                                         const UtilityOptions& options,
                                         const CancelCheck& shouldCancel) {
    options.validate(original);
    const std::vector<AlignedPair> pairs = alignRecords(original, transformed);
    const std::vector<AttributeView> views = buildViews(original, transformed, pairs);

    UtilityReport report;
    report.alignedRecords = pairs.size();
    report.droppedRecords = original.retainedRows().size() - pairs.size();
    for (const auto& v : views) report.attributes.push_back({v.name, v.numeric, 1.0, 1.0, 1.0});

    auto wants = [&](UtilityMetric m) { return std::find(options.metrics.begin(), options.metrics.end(), m) != options.metrics.end(); };
    std::vector<double> per;

    if (wants(UtilityMetric::STATISTICAL_SIMILARITY)) {
        throwIfCancelled(shouldCancel);
        report.metrics["statistical_similarity"] = meanOf(views, statisticalSimilarity, per);
        for (size_t i = 0; i < per.size(); ++i) report.attributes[i].statisticalSimilarity = per[i];
    }
    if (wants(UtilityMetric::DISTRIBUTION_SIMILARITY)) {
        throwIfCancelled(shouldCancel);
        report.metrics["distribution_similarity"] = meanOf(views, distributionSimilarity, per);
        for (size_t i = 0; i < per.size(); ++i) report.attributes[i].distributionSimilarity = per[i];
    }
    if (wants(UtilityMetric::INFORMATION_PRESERVATION)) {
        throwIfCancelled(shouldCancel);
        report.metrics["information_preservation"] = meanOf(views, informationPreservation, per);
        for (size_t i = 0; i < per.size(); ++i) report.attributes[i].informationPreservation = per[i];
    }
    if (wants(UtilityMetric::CORRELATION_PRESERVATION)) {
        throwIfCancelled(shouldCancel);
        report.metrics["correlation_preservation"] = correlationPreservation(views, options.bins);
    }
    if (wants(UtilityMetric::CLASSIFICATION_UTILITY)) {
        throwIfCancelled(shouldCancel);
        report.targetAttribute = options.targetAttribute.empty() ? pickTarget(views, original) : options.targetAttribute;
        const ClassificationOutcome c = classificationUtility(views, report.targetAttribute, options);
        if (c.computed) {
            report.metrics["classification_utility"] = c.score;
            report.originalAccuracy = c.originalAccuracy;
            report.transformedAccuracy = c.transformedAccuracy;
        }
    }
    if (wants(UtilityMetric::QUERY_ACCURACY)) {
        throwIfCancelled(shouldCancel);
        report.metrics["query_accuracy"] = queryAccuracy(original, transformed, views);
    }

    double total = 0.0;
    for (const auto& kv : report.metrics) total += kv.second;
    report.overallUtility = report.metrics.empty() ? 0.0 : total / static_cast<double>(report.metrics.size());
    report.level = classify(report.overallUtility);
    report.recommendations = buildRecommendations(report);
    return report;
}

RunOutcome<UtilityReport> UtilityEvaluator::run(const PrivacyDataset& original,
                                                const PrivacyDataset& transformed,
                                                const UtilityOptions& options,
                                                const CancelCheck& shouldCancel) {
    return runCancellable<UtilityReport>([&]() { return evaluate(original, transformed, options, shouldCancel); });
}
