#include "DiversityEnforcer.h"
#include "CommonUtils.h"
#include "EquivalenceClasses.h"
#include "Generalizer.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <map>

namespace {
constexpr double kTolerance = 1e-12;

using ClassPredicate = std::function<bool(const std::vector<size_t>&)>;

struct Group {
    std::vector<std::string> key;
    std::vector<size_t> rows;
};

// Current per-record labels and levels of every quasi-identifier.
struct RecodingState {
    std::vector<std::string> names;
    std::vector<size_t> columns;
    std::vector<const GeneralizationHierarchy*> hierarchies;
    std::vector<std::vector<std::string>> labels;
    std::vector<std::vector<int>> levels;
    std::vector<uint8_t> dropped;
};

RecodingState initState(const PrivacyDataset& data, const std::vector<std::string>& qis, const HierarchySet& resolved) {
    RecodingState st;
    const size_t n = data.rowCount();
    for (const auto& name : qis) {
        const size_t col = data.requireColumnIndex(name);
        st.names.push_back(name);
        st.columns.push_back(col);
        st.hierarchies.push_back(&resolved.at(name));
        std::vector<std::string> labels(n);
        std::vector<int> levels(n);
        for (size_t r = 0; r < n; ++r) {
            labels[r] = data.cellKey(r, col);
            levels[r] = data.column(col).levelAt(r);
        }
        st.labels.push_back(std::move(labels));
        st.levels.push_back(std::move(levels));
    }
    st.dropped.assign(n, 0);
    for (size_t r = 0; r < n; ++r) {
        if (data.isSuppressed(r)) st.dropped[r] = 1;
    }
    return st;
}

std::vector<Group> groupRows(const RecodingState& st) {
    std::map<std::vector<std::string>, std::vector<size_t>> groups;
    const size_t n = st.dropped.size();
    for (size_t r = 0; r < n; ++r) {
        if (st.dropped[r]) continue;
        std::vector<std::string> key;
        key.reserve(st.labels.size());
        for (const auto& col : st.labels) key.push_back(col[r]);
        groups[std::move(key)].push_back(r);
    }
    std::vector<Group> out;
    out.reserve(groups.size());
    for (auto& [key, rows] : groups) out.push_back({key, std::move(rows)});
    std::stable_sort(out.begin(), out.end(), [](const Group& a, const Group& b) { return a.rows.size() < b.rows.size(); });
    return out;
}

std::string liftLabel(const GeneralizationHierarchy& h, const std::string& label, int from, int to) {
    if (to <= from) return label;
    if (label == PrivacyDataset::missingKey()) {
        return to == h.height() ? GeneralizationHierarchy::suppressedLabel() : label;
    }
    return h.generalizeFrom(label, from, to);
}

// Lowest level at which both representatives share a label.
int commonLevel(const GeneralizationHierarchy& h, const std::string& a, int la, const std::string& b, int lb) {
    for (int level = std::max(la, lb); level <= h.height(); ++level) {
        if (liftLabel(h, a, la, level) == liftLabel(h, b, lb, level)) return level;
    }
    return h.height();
}

std::map<std::string, int> reachedLevels(const RecodingState& st) {
    std::map<std::string, int> out;
    for (size_t a = 0; a < st.names.size(); ++a) {
        int top = 0;
        for (size_t r = 0; r < st.dropped.size(); ++r) {
            if (!st.dropped[r]) top = std::max(top, st.levels[a][r]);
        }
        out[st.names[a]] = top;
    }
    return out;
}

struct MergeStats {
    size_t merges = 0;
    size_t suppressed = 0;
};

MergeStats mergeUntilSatisfied(RecodingState& st,
                               const ClassPredicate& passes,
                               size_t budget,
                               const std::string& criterion,
                               const CancelCheck& shouldCancel) {
    MergeStats stats;
    while (true) {
        throwIfCancelled(shouldCancel);
        const std::vector<Group> groups = groupRows(st);

        std::vector<size_t> failing;
        size_t failingRecords = 0;
        for (size_t g = 0; g < groups.size(); ++g) {
            if (!passes(groups[g].rows)) {
                failing.push_back(g);
                failingRecords += groups[g].rows.size();
            }
        }
        if (failing.empty()) return stats;

        const size_t remaining = static_cast<size_t>(std::count(st.dropped.begin(), st.dropped.end(), 0));
        if (failingRecords <= budget - stats.suppressed && failingRecords < remaining) {
            for (size_t g : failing) {
                for (size_t r : groups[g].rows) st.dropped[r] = 1;
            }
            stats.suppressed += failingRecords;
            continue;
        }
        if (groups.size() == 1) {
            throw Umbra::UnattainablePrivacyException(
                criterion, "the whole dataset forms one equivalence class and it still fails", reachedLevels(st), 1, failingRecords);
        }

        const Group& target = groups[failing.front()];
        const size_t ti = target.rows.front();

        size_t best = groups.size();
        double bestCost = std::numeric_limits<double>::infinity();
        bool bestPasses = false;
        std::vector<int> bestLevels;
        for (size_t g = 0; g < groups.size(); ++g) {
            if (g == failing.front()) continue;
            const size_t oi = groups[g].rows.front();
            std::vector<int> common(st.names.size());
            double cost = 0.0;
            for (size_t a = 0; a < st.names.size(); ++a) {
                const GeneralizationHierarchy& h = *st.hierarchies[a];
                const int lt = st.levels[a][ti];
                const int lo = st.levels[a][oi];
                common[a] = commonLevel(h, st.labels[a][ti], lt, st.labels[a][oi], lo);
                cost += (static_cast<double>(common[a] - lt) * static_cast<double>(target.rows.size()) +
                         static_cast<double>(common[a] - lo) * static_cast<double>(groups[g].rows.size())) /
                        static_cast<double>(h.height());
            }
            std::vector<size_t> merged = target.rows;
            merged.insert(merged.end(), groups[g].rows.begin(), groups[g].rows.end());
            const bool mergedPasses = passes(merged);
            const bool better = cost < bestCost - kTolerance ||
                                (std::abs(cost - bestCost) <= kTolerance && mergedPasses && !bestPasses);
            if (better) {
                best = g;
                bestCost = cost;
                bestPasses = mergedPasses;
                bestLevels = std::move(common);
            }
        }

        for (const Group* grp : {&target, &groups[best]}) {
            for (size_t r : grp->rows) {
                for (size_t a = 0; a < st.names.size(); ++a) {
                    const int to = std::max(bestLevels[a], st.levels[a][r]);
                    st.labels[a][r] = liftLabel(*st.hierarchies[a], st.labels[a][r], st.levels[a][r], to);
                    st.levels[a][r] = to;
                }
            }
        }
        ++stats.merges;
    }
}

PrivacyDataset materialize(const PrivacyDataset& data, const RecodingState& st) {
    std::vector<TypedColumn> columns = data.columns();
    for (size_t a = 0; a < st.names.size(); ++a) {
        columns[st.columns[a]] = Generalizer::recodeColumn(data.column(st.columns[a]), st.labels[a], st.levels[a]);
    }
    PrivacyDataset recoded = data.withColumns(std::move(columns));
    std::vector<size_t> keep;
    for (size_t r = 0; r < st.dropped.size(); ++r) {
        if (!st.dropped[r] || data.isSuppressed(r)) keep.push_back(r);
    }
    return keep.size() == data.rowCount() ? recoded : recoded.selectRows(keep);
}

FrequencyTable countValues(const PrivacyDataset& data, size_t col, const std::vector<size_t>& rows) {
    FrequencyTable counts;
    for (size_t r : rows) {
        if (data.isMissing(r, col)) continue;
        counts[data.cellText(r, col)] += 1.0;
    }
    return counts;
}

std::vector<std::string> groundOrder(const PrivacyDataset& data, size_t col, const TClosenessConfig& config) {
    const TypedColumn& column = data.column(col);
    if (column.type == ColumnType::CATEGORICAL) return config.ordinalOrder;

    std::map<double, std::string> byValue;
    for (size_t r = 0; r < data.rowCount(); ++r) {
        if (auto v = data.numericValue(r, col)) byValue.emplace(*v, data.cellText(r, col));
    }
    std::vector<std::string> order;
    for (const auto& kv : byValue) order.push_back(kv.second);
    return order;
}

size_t budgetFor(double limit, size_t retained) {
    return static_cast<size_t>(std::floor(limit * static_cast<double>(retained) + 1e-9));
}
} // namespace

bool DiversityEnforcer::isDiverse(const FrequencyTable& counts, size_t l, DiversityMethod method, double c) {
    if (l <= 1) return true;
    switch (method) {
        case DiversityMethod::DISTINCT:
            return counts.size() >= l;
        case DiversityMethod::ENTROPY:
            return Statistics::entropy(counts) >= std::log(static_cast<double>(l)) - kTolerance;
        case DiversityMethod::RECURSIVE: {
            if (counts.size() < l) return false;
            std::vector<double> freq;
            for (const auto& kv : counts) freq.push_back(kv.second);
            std::sort(freq.begin(), freq.end(), std::greater<double>());
            double tail = 0.0;
            for (size_t i = l - 1; i < freq.size(); ++i) tail += freq[i];
            return freq.front() < c * tail;
        }
    }
    return false;
}

double DiversityEnforcer::distance(const FrequencyTable& local,
                                   const FrequencyTable& global,
                                   DistanceMeasure measure,
                                   const std::vector<std::string>& order) {
    switch (measure) {
        case DistanceMeasure::VARIATIONAL: return Statistics::totalVariation(local, global);
        case DistanceMeasure::KL: return Statistics::klDivergence(local, global);
        case DistanceMeasure::EARTH_MOVER:
            return order.empty() ? Statistics::totalVariation(local, global) : Statistics::orderedEarthMover(local, global, order);
    }
    return 0.0;
}

DiversityResult DiversityEnforcer::enforceLDiversity(const PrivacyDataset& data,
                                                     const HierarchySet& hierarchies,
                                                     const LDiversityConfig& config,
                                                     const CancelCheck& shouldCancel) {
    config.validate(data);
    const auto qis = resolveQuasiIdentifiers(data, config.quasiIdentifiers);
    const HierarchySet resolved = HierarchyRegistry::global().resolve(data, qis, hierarchies);
    const size_t sCol = data.requireColumnIndex(config.sensitiveAttribute);

    auto passes = [&](const std::vector<size_t>& rows) {
        return isDiverse(countValues(data, sCol, rows), config.l, config.method, config.c);
    };

    const std::vector<size_t> retained = data.retainedRows();
    if (!retained.empty() && !passes(retained)) {
        const FrequencyTable all = countValues(data, sCol, retained);
        std::map<std::string, int> levels;
        for (const auto& name : qis) levels[name] = 0;
        throw Umbra::UnattainablePrivacyException(
            "l-diversity",
            "'" + config.sensitiveAttribute + "' has only " + std::to_string(all.size()) + " distinct values across the dataset, " +
                diversityMethodName(config.method) + " l=" + std::to_string(config.l) + " cannot hold in any class",
            levels, 1, retained.size());
    }

    RecodingState st = initState(data, qis, resolved);
    const MergeStats stats = mergeUntilSatisfied(st, passes, budgetFor(config.suppressionLimit, retained.size()), "l-diversity", shouldCancel);
    PrivacyDataset out = materialize(data, st);

    DiversityReport report;
    report.sensitiveAttribute = config.sensitiveAttribute;
    report.l = config.l;
    report.method = config.method;
    report.mergesPerformed = stats.merges;
    report.suppressedCount = stats.suppressed;
    const auto reached = reachedLevels(st);
    for (const auto& name : qis) {
        report.attributes.push_back(name);
        report.levels.push_back(reached.at(name));
    }

    std::vector<size_t> qiCols;
    for (const auto& name : qis) qiCols.push_back(out.requireColumnIndex(name));
    const size_t outS = out.requireColumnIndex(config.sensitiveAttribute);
    for (const auto& ec : EquivalenceClasses::partition(out, qiCols)) {
        const FrequencyTable counts = countValues(out, outS, ec.rows);
        report.classes.push_back({ec.values, ec.size(), counts.size(), Statistics::entropy(counts),
                                  isDiverse(counts, config.l, config.method, config.c)});
    }
    return {std::move(out), std::move(report)};
}

ClosenessResult DiversityEnforcer::enforceTCloseness(const PrivacyDataset& data,
                                                     const HierarchySet& hierarchies,
                                                     const TClosenessConfig& config,
                                                     const CancelCheck& shouldCancel) {
    config.validate(data);
    const auto qis = resolveQuasiIdentifiers(data, config.quasiIdentifiers);
    const HierarchySet resolved = HierarchyRegistry::global().resolve(data, qis, hierarchies);
    const size_t sCol = data.requireColumnIndex(config.sensitiveAttribute);

    const std::vector<size_t> retained = data.retainedRows();
    const FrequencyTable global = countValues(data, sCol, retained);
    const std::vector<std::string> order =
        config.measure == DistanceMeasure::EARTH_MOVER ? groundOrder(data, sCol, config) : std::vector<std::string>{};

    auto distanceOf = [&](const PrivacyDataset& ds, size_t col, const std::vector<size_t>& rows) {
        const FrequencyTable local = countValues(ds, col, rows);
        if (local.empty()) return 0.0;
        return distance(local, global, config.measure, order);
    };
    auto passes = [&](const std::vector<size_t>& rows) { return distanceOf(data, sCol, rows) <= config.t + kTolerance; };

    RecodingState st = initState(data, qis, resolved);
    const MergeStats stats = mergeUntilSatisfied(st, passes, budgetFor(config.suppressionLimit, retained.size()), "t-closeness", shouldCancel);
    PrivacyDataset out = materialize(data, st);

    ClosenessReport report;
    report.sensitiveAttribute = config.sensitiveAttribute;
    report.t = config.t;
    report.measure = config.measure;
    report.ordered = !order.empty();
    report.mergesPerformed = stats.merges;
    report.suppressedCount = stats.suppressed;
    const auto reached = reachedLevels(st);
    for (const auto& name : qis) {
        report.attributes.push_back(name);
        report.levels.push_back(reached.at(name));
    }

    std::vector<size_t> qiCols;
    for (const auto& name : qis) qiCols.push_back(out.requireColumnIndex(name));
    const size_t outS = out.requireColumnIndex(config.sensitiveAttribute);
    const FrequencyTable released = countValues(out, outS, out.retainedRows());
    for (const auto& ec : EquivalenceClasses::partition(out, qiCols)) {
        const double d = distanceOf(out, outS, ec.rows);
        report.maxDistance = std::max(report.maxDistance, d);
        report.classes.push_back({ec.values, ec.size(), d, d <= config.t + kTolerance});
        const FrequencyTable local = countValues(out, outS, ec.rows);
        if (!local.empty()) {
            report.releasedMaxDistance = std::max(report.releasedMaxDistance, distance(local, released, config.measure, order));
        }
    }
    return {std::move(out), std::move(report)};
}

RunOutcome<DiversityResult> DiversityEnforcer::runLDiversity(const PrivacyDataset& data,
                                                             const HierarchySet& hierarchies,
                                                             const LDiversityConfig& config,
                                                             const CancelCheck& shouldCancel) {
    return runCancellable<DiversityResult>([&]() { return enforceLDiversity(data, hierarchies, config, shouldCancel); });
}

RunOutcome<ClosenessResult> DiversityEnforcer::runTCloseness(const PrivacyDataset& data,
                                                             const HierarchySet& hierarchies,
                                                             const TClosenessConfig& config,
                                                             const CancelCheck& shouldCancel) {
    return runCancellable<ClosenessResult>([&]() { return enforceTCloseness(data, hierarchies, config, shouldCancel); });
}
