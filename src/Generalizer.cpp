#include "Generalizer.h"
#include "EquivalenceClasses.h"
#include "Microaggregation.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr uint32_t kUnassigned = std::numeric_limits<uint32_t>::max();

// Label codes of one quasi-identifier at every level of its hierarchy.
struct AttributeLattice {
    std::string name;
    size_t column = 0;
    int height = 1;
    int maxLevel = 1;
    std::string hierarchyName;
    EquivalenceClasses::LabelInterner labels;
    std::vector<std::vector<uint32_t>> codes; // codes[level][row]
};

AttributeLattice buildLattice(const PrivacyDataset& data,
                              size_t col,
                              const GeneralizationHierarchy& h,
                              int maxLevel) {
    AttributeLattice lat;
    lat.name = data.column(col).name;
    lat.column = col;
    lat.height = h.height();
    lat.maxLevel = std::min(maxLevel, h.height());
    lat.hierarchyName = h.describe();

    const TypedColumn& source = data.column(col);
    const size_t n = data.rowCount();

    // Distinct (label, base level) pairs are generalized once per level.
    std::unordered_map<std::string, uint32_t> distinctIdx;
    std::vector<std::pair<std::string, int>> distinct;
    std::vector<uint32_t> rowDistinct(n);
    for (size_t r = 0; r < n; ++r) {
        const int base = source.levelAt(r);
        const std::string text = data.cellKey(r, col);
        auto [it, inserted] = distinctIdx.emplace(text + '\x02' + std::to_string(base), static_cast<uint32_t>(distinct.size()));
        if (inserted) distinct.emplace_back(text, base);
        rowDistinct[r] = it->second;
    }

    lat.codes.resize(static_cast<size_t>(lat.height) + 1);
    for (int level = 0; level <= lat.height; ++level) {
        std::vector<uint32_t> labelOf(distinct.size());
        for (size_t d = 0; d < distinct.size(); ++d) {
            const auto& [text, base] = distinct[d];
            std::string label;
            if (level <= base) {
                label = text;
            } else if (text == PrivacyDataset::missingKey()) {
                label = level == lat.height ? GeneralizationHierarchy::suppressedLabel() : text;
            } else {
                label = h.generalizeFrom(text, base, level);
            }
            labelOf[d] = lat.labels.intern(label);
        }
        auto& out = lat.codes[static_cast<size_t>(level)];
        out.resize(n);
        for (size_t r = 0; r < n; ++r) out[r] = labelOf[rowDistinct[r]];
    }
    return lat;
}

struct Violations {
    size_t classes = 0;
    size_t records = 0;
};

Violations countViolations(const std::vector<const std::vector<uint32_t>*>& codes,
                           const std::vector<size_t>& rows,
                           size_t k,
                           std::vector<uint32_t>* classOfOut = nullptr,
                           std::vector<size_t>* sizesOut = nullptr) {
    std::vector<size_t> sizes;
    std::vector<uint32_t> classOf = EquivalenceClasses::groupCodes(codes, rows, sizes);
    Violations v;
    for (size_t s : sizes) {
        if (s < k) {
            ++v.classes;
            v.records += s;
        }
    }
    if (classOfOut) *classOfOut = std::move(classOf);
    if (sizesOut) *sizesOut = std::move(sizes);
    return v;
}

// Greedy choice: highest merged-classes x height, then lowest current level, then schema order.
// Returns -1 when no attribute can be raised.
int pickAttribute(const std::vector<AttributeLattice>& lattice,
                  const std::vector<int>& currentLevels,
                  const std::vector<long long>& benefits) {
    int best = -1;
    for (size_t a = 0; a < lattice.size(); ++a) {
        if (benefits[a] < 0) continue;
        if (best < 0) {
            best = static_cast<int>(a);
            continue;
        }
        const size_t b = static_cast<size_t>(best);
        const long long score = benefits[a] * lattice[a].height;
        const long long bestScore = benefits[b] * lattice[b].height;
        if (score > bestScore || (score == bestScore && currentLevels[a] < currentLevels[b])) {
            best = static_cast<int>(a);
        }
    }
    return best;
}

std::map<std::string, int> levelsByName(const std::vector<AttributeLattice>& lattice, const std::vector<std::vector<int>>& recordLevels) {
    std::map<std::string, int> out;
    for (size_t a = 0; a < lattice.size(); ++a) {
        const auto& lv = recordLevels[a];
        out[lattice[a].name] = lv.empty() ? 0 : *std::max_element(lv.begin(), lv.end());
    }
    return out;
}
void redactIdentifiers(const PrivacyDataset& data, std::vector<TypedColumn>& columns) {
    const size_t n = data.rowCount();
    for (size_t c : data.indicesWithRole(AttributeRole::IDENTIFIER)) {
        columns[c] = makeLabelColumn(data.column(c), std::vector<std::string>(n, GeneralizationHierarchy::suppressedLabel()),
                                     MissingMask(n, 0), {});
    }
}

// Numeric and date quasi-identifiers take their group mean; categorical ones rise to the lowest level at
// which the whole group shares one label.
GeneralizationResult microaggregate(const PrivacyDataset& data,
                                    const std::vector<AttributeLattice>& lattice,
                                    const KAnonymityConfig& config,
                                    const CancelCheck& shouldCancel) {
    const std::vector<size_t> rows = data.retainedRows();
    const size_t n = data.rowCount();
    std::map<std::string, int> reached;
    for (const auto& lat : lattice) reached[lat.name] = 0;
    if (!rows.empty() && rows.size() < config.k) {
        throw Umbra::UnattainablePrivacyException(
            "k-anonymity",
            "k=" + std::to_string(config.k) + " exceeds the " + std::to_string(rows.size()) + " retained records",
            reached, 1, rows.size());
    }

    std::vector<size_t> qiCols;
    for (const auto& lat : lattice) qiCols.push_back(lat.column);
    const std::vector<std::vector<size_t>> groups = Microaggregation::mdavGroups(data, qiCols, rows, config.k, shouldCancel);

    GeneralizationReport report;
    report.k = config.k;
    report.recoding = config.recoding;
    report.suppression = config.suppression;
    report.suppressionBudget = static_cast<size_t>(std::floor(config.suppressionLimit * static_cast<double>(rows.size()) + 1e-9));
    report.iterations = groups.size();

    std::vector<TypedColumn> columns = data.columns();
    double loss = 0.0;
    size_t lossTerms = 0;
    for (const auto& lat : lattice) {
        const TypedColumn& source = data.column(lat.column);
        report.attributes.push_back(lat.name);
        report.heights.push_back(lat.height);

        if (source.type != ColumnType::CATEGORICAL) {
            const bool date = source.type == ColumnType::DATETIME;
            std::vector<double> values(n, 0.0);
            MissingMask missing = source.missing;
            double lo = std::numeric_limits<double>::infinity();
            double hi = -lo;
            for (size_t r = 0; r < n; ++r) {
                if (auto v = data.numericValue(r, lat.column)) values[r] = *v;
            }
            for (size_t r : rows) {
                if (missing[r]) continue;
                lo = std::min(lo, values[r]);
                hi = std::max(hi, values[r]);
            }
            const double range = hi > lo ? hi - lo : 0.0;

            for (const auto& group : groups) {
                lossTerms += group.size();
                double sum = 0.0;
                size_t present = 0;
                for (size_t r : group) {
                    if (missing[r]) continue;
                    sum += values[r];
                    ++present;
                }
                if (present == 0) continue;
                double centroid = sum / static_cast<double>(present);
                if (date) centroid = std::round(centroid);
                for (size_t r : group) {
                    if (!missing[r] && range > 0.0) loss += std::abs(values[r] - centroid) / range;
                    values[r] = centroid;
                    missing[r] = 0;
                }
            }

            TypedColumn column;
            if (date) {
                std::vector<int64_t> seconds(n, 0);
                for (size_t r = 0; r < n; ++r) seconds[r] = static_cast<int64_t>(std::llround(values[r]));
                column = makeDateColumn(source.name, std::move(seconds), source.role);
            } else {
                column = makeNumericColumn(source.name, std::move(values), source.role);
            }
            column.missing = std::move(missing);
            columns[lat.column] = std::move(column);
            report.levels.push_back(0);
            report.hierarchies.push_back("microaggregation");
            continue;
        }

        std::vector<int> levels(n);
        std::vector<std::string> labels(n);
        for (size_t r = 0; r < n; ++r) {
            levels[r] = source.levelAt(r);
            labels[r] = lat.labels.label(lat.codes[static_cast<size_t>(levels[r])][r]);
        }
        int highest = 0;
        for (const auto& group : groups) {
            int level = 0;
            for (size_t r : group) level = std::max(level, source.levelAt(r));
            auto shared = [&](int l) {
                const auto& codes = lat.codes[static_cast<size_t>(l)];
                const uint32_t first = codes[group.front()];
                return std::all_of(group.begin(), group.end(), [&](size_t r) { return codes[r] == first; });
            };
            // A level ceiling can leave the group split; the class check below reports it.
            while (level < lat.maxLevel && !shared(level)) ++level;
            for (size_t r : group) {
                levels[r] = level;
                labels[r] = lat.labels.label(lat.codes[static_cast<size_t>(level)][r]);
                loss += static_cast<double>(level) / static_cast<double>(lat.height);
                ++lossTerms;
            }
            highest = std::max(highest, level);
        }
        columns[lat.column] = Generalizer::recodeColumn(source, labels, levels);
        reached[lat.name] = highest;
        report.levels.push_back(highest);
        report.hierarchies.push_back(lat.hierarchyName);
    }
    if (config.redactIdentifiers) redactIdentifiers(data, columns);
    report.informationLoss = lossTerms ? loss / static_cast<double>(lossTerms) : 0.0;

    PrivacyDataset out = data.withColumns(std::move(columns));
    size_t violatingClasses = 0;
    size_t violatingRecords = 0;
    for (const auto& ec : EquivalenceClasses::partition(out, qiCols)) {
        const bool passed = ec.size() >= config.k;
        if (!passed) {
            ++violatingClasses;
            violatingRecords += ec.size();
        }
        report.classes.push_back({ec.values, ec.size(), passed});
    }
    if (violatingRecords > 0) {
        throw Umbra::UnattainablePrivacyException(
            "k-anonymity",
            "microaggregation leaves " + std::to_string(violatingRecords) + " records in " + std::to_string(violatingClasses) +
                " undersized classes under the configured level ceilings",
            reached, violatingClasses, violatingRecords);
    }
    return {std::move(out), std::move(report)};
}
} // namespace

std::map<std::string, int> GeneralizationReport::levelMap() const {
    std::map<std::string, int> out;
    for (size_t i = 0; i < attributes.size(); ++i) out[attributes[i]] = levels[i];
    return out;
}

int GeneralizationReport::levelOf(const std::string& attribute) const {
    for (size_t i = 0; i < attributes.size(); ++i) {
        if (attributes[i] == attribute) return levels[i];
    }
    return 0;
}

TypedColumn Generalizer::recodeColumn(const TypedColumn& source,
                                      const std::vector<std::string>& labels,
                                      const std::vector<int>& levels) {
    if (std::all_of(levels.begin(), levels.end(), [](int l) { return l == 0; })) return source;
    std::vector<std::string> values(labels.size());
    MissingMask missing(labels.size(), 0);
    for (size_t r = 0; r < labels.size(); ++r) {
        if (labels[r] == PrivacyDataset::missingKey()) {
            missing[r] = 1;
        } else {
            values[r] = labels[r];
        }
    }
    return makeLabelColumn(source, std::move(values), std::move(missing), levels);
}

GeneralizationResult Generalizer::generalize(const PrivacyDataset& data,
                                             const HierarchySet& hierarchies,
                                             const KAnonymityConfig& config,
                                             const CancelCheck& shouldCancel) {
    config.validate(data);
    const auto qis = resolveQuasiIdentifiers(data, config.quasiIdentifiers);
    const HierarchySet resolved = HierarchyRegistry::global().resolve(data, qis, hierarchies);

    std::vector<AttributeLattice> lattice;
    lattice.reserve(qis.size());
    for (const auto& name : qis) {
        int ceiling = std::numeric_limits<int>::max();
        for (const auto& [attr, level] : config.maxLevels) {
            if (attr == name) ceiling = level;
        }
        lattice.push_back(buildLattice(data, data.requireColumnIndex(name), resolved.at(name), ceiling));
    }
    if (config.recoding == RecodingPolicy::CLUSTERING) return microaggregate(data, lattice, config, shouldCancel);

    const std::vector<size_t> rows = data.retainedRows();
    const size_t n = data.rowCount();
    const size_t budget = static_cast<size_t>(std::floor(config.suppressionLimit * static_cast<double>(rows.size()) + 1e-9));
    const bool local = config.recoding == RecodingPolicy::LOCAL;

    std::vector<std::vector<int>> recordLevels(lattice.size(), std::vector<int>(n, 0));
    std::vector<int> globalLevels(lattice.size(), 0);
    std::vector<std::vector<uint32_t>> current(lattice.size());
    for (size_t a = 0; a < lattice.size(); ++a) current[a] = lattice[a].codes[0];

    auto codeView = [&]() {
        std::vector<const std::vector<uint32_t>*> view;
        for (const auto& c : current) view.push_back(&c);
        return view;
    };

    size_t iterations = 0;
    Violations v;
    std::vector<uint32_t> classOf;
    std::vector<size_t> sizes;
    while (true) {
        throwIfCancelled(shouldCancel);
        v = countViolations(codeView(), rows, config.k, &classOf, &sizes);
        if (v.classes == 0) break;
        if (config.acceptWithinSuppressionLimit && v.records <= budget) break;

        std::vector<size_t> violators;
        if (local) {
            for (size_t r : rows) {
                if (sizes[classOf[r]] < config.k) violators.push_back(r);
            }
        }

        std::vector<long long> benefits(lattice.size(), -1);
        std::vector<int> lowestLevel(lattice.size(), 0);
        for (size_t a = 0; a < lattice.size(); ++a) {
            if (local) {
                int lowest = std::numeric_limits<int>::max();
                for (size_t r : violators) lowest = std::min(lowest, recordLevels[a][r]);
                lowestLevel[a] = lowest;
            } else {
                lowestLevel[a] = globalLevels[a];
            }
        }

#ifdef USE_OPENMP
#pragma omp parallel for schedule(dynamic)
#endif
        for (int ai = 0; ai < static_cast<int>(lattice.size()); ++ai) {
            const size_t a = static_cast<size_t>(ai);
            if (lowestLevel[a] >= lattice[a].maxLevel) continue;
            std::vector<uint32_t> trial = current[a];
            if (local) {
                for (size_t r : violators) {
                    const int next = std::min(recordLevels[a][r] + 1, lattice[a].maxLevel);
                    trial[r] = lattice[a].codes[static_cast<size_t>(next)][r];
                }
            } else {
                trial = lattice[a].codes[static_cast<size_t>(globalLevels[a] + 1)];
            }
            std::vector<const std::vector<uint32_t>*> view;
            for (size_t b = 0; b < current.size(); ++b) view.push_back(b == a ? &trial : &current[b]);
            const Violations after = countViolations(view, rows, config.k);
            benefits[a] = static_cast<long long>(v.classes) - static_cast<long long>(after.classes);
            if (benefits[a] < 0) benefits[a] = 0;
        }

        const int chosen = pickAttribute(lattice, lowestLevel, benefits);
        if (chosen < 0) break;
        const size_t a = static_cast<size_t>(chosen);
        if (local) {
            for (size_t r : violators) {
                int& level = recordLevels[a][r];
                level = std::min(level + 1, lattice[a].maxLevel);
                current[a][r] = lattice[a].codes[static_cast<size_t>(level)][r];
            }
        } else {
            ++globalLevels[a];
            std::fill(recordLevels[a].begin(), recordLevels[a].end(), globalLevels[a]);
            current[a] = lattice[a].codes[static_cast<size_t>(globalLevels[a])];
        }
        ++iterations;
    }

    std::map<std::string, int> reached = levelsByName(lattice, recordLevels);
    if (v.records > budget || (v.records > 0 && v.records == rows.size())) {
        throw Umbra::UnattainablePrivacyException(
            "k-anonymity",
            "k=" + std::to_string(config.k) + " leaves " + std::to_string(v.records) + " records in " +
                std::to_string(v.classes) + " undersized classes at the highest allowed levels; suppression limit allows " +
                std::to_string(budget),
            reached, v.classes, v.records);
    }

    MissingMask suppressedRows(n, 0);
    for (size_t r = 0; r < n; ++r) {
        if (data.isSuppressed(r)) suppressedRows[r] = 1;
    }
    size_t newlySuppressed = 0;
    for (size_t r : rows) {
        if (sizes[classOf[r]] < config.k) {
            suppressedRows[r] = 1;
            ++newlySuppressed;
        }
    }

    std::vector<TypedColumn> columns = data.columns();
    for (size_t a = 0; a < lattice.size(); ++a) {
        const AttributeLattice& lat = lattice[a];
        std::vector<std::string> labels(n);
        std::vector<int> levels = recordLevels[a];
        for (size_t r = 0; r < n; ++r) {
            // Base levels of an already generalized input are kept.
            levels[r] = std::max(levels[r], data.column(lat.column).levelAt(r));
            if (config.suppression == SuppressionPolicy::REDACT && suppressedRows[r]) levels[r] = lat.height;
            labels[r] = lat.labels.label(lat.codes[static_cast<size_t>(levels[r])][r]);
        }
        columns[lat.column] = recodeColumn(data.column(lat.column), labels, levels);
    }
    if (config.redactIdentifiers) redactIdentifiers(data, columns);

    PrivacyDataset out = data.withColumns(std::move(columns));
    if (config.suppression == SuppressionPolicy::REDACT) {
        out = out.withSuppressed(std::move(suppressedRows));
    } else {
        std::vector<size_t> keep;
        for (size_t r = 0; r < n; ++r) {
            if (!suppressedRows[r]) keep.push_back(r);
        }
        out = out.selectRows(keep);
    }

    GeneralizationReport report;
    report.k = config.k;
    report.recoding = config.recoding;
    report.suppression = config.suppression;
    report.suppressedCount = newlySuppressed;
    report.suppressionBudget = budget;
    report.iterations = iterations;
    std::vector<size_t> qiCols;
    double loss = 0.0;
    size_t lossTerms = 0;
    for (size_t a = 0; a < lattice.size(); ++a) {
        report.attributes.push_back(lattice[a].name);
        report.levels.push_back(reached[lattice[a].name]);
        report.heights.push_back(lattice[a].height);
        report.hierarchies.push_back(lattice[a].hierarchyName);
        qiCols.push_back(out.requireColumnIndex(lattice[a].name));
        for (size_t r : out.retainedRows()) {
            loss += static_cast<double>(out.column(qiCols.back()).levelAt(r)) / static_cast<double>(lattice[a].height);
            ++lossTerms;
        }
    }
    report.informationLoss = lossTerms ? loss / static_cast<double>(lossTerms) : 0.0;
    for (const auto& ec : EquivalenceClasses::partition(out, qiCols)) {
        report.classes.push_back({ec.values, ec.size(), ec.size() >= config.k});
    }
    return {std::move(out), std::move(report)};
}

RunOutcome<GeneralizationResult> Generalizer::run(const PrivacyDataset& data,
                                                  const HierarchySet& hierarchies,
                                                  const KAnonymityConfig& config,
                                                  const CancelCheck& shouldCancel) {
    return runCancellable<GeneralizationResult>([&]() { return generalize(data, hierarchies, config, shouldCancel); });
}

PrivacyDataset Generalizer::applyLevels(const PrivacyDataset& data,
                                        const HierarchySet& hierarchies,
                                        const std::map<std::string, int>& levels) {
    std::vector<std::string> names;
    for (const auto& kv : levels) names.push_back(kv.first);
    const HierarchySet resolved = HierarchyRegistry::global().resolve(data, names, hierarchies);

    std::vector<TypedColumn> columns = data.columns();
    for (const auto& [name, level] : levels) {
        const size_t col = data.requireColumnIndex(name);
        const GeneralizationHierarchy& h = resolved.at(name);
        if (level < 0 || level > h.height()) {
            throw Umbra::ConfigurationException("level " + std::to_string(level) + " outside [0, " + std::to_string(h.height()) +
                                                    "] for '" + name + "'",
                                                name);
        }
        const AttributeLattice lat = buildLattice(data, col, h, h.height());
        std::vector<std::string> labels(data.rowCount());
        std::vector<int> recordLevels(data.rowCount());
        for (size_t r = 0; r < data.rowCount(); ++r) {
            recordLevels[r] = std::max(level, data.column(col).levelAt(r));
            labels[r] = lat.labels.label(lat.codes[static_cast<size_t>(recordLevels[r])][r]);
        }
        columns[col] = recodeColumn(data.column(col), labels, recordLevels);
    }
    return data.withColumns(std::move(columns));
}
