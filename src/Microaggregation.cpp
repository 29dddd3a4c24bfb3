#include "Microaggregation.h"
#include "EquivalenceClasses.h"
#include "Statistics.h"

#include <algorithm>
#include <cstddef>

namespace {
constexpr double kFlatSpread = 1e-12;

// Points are indexed by position in the row list.
struct Features {
    std::vector<std::vector<double>> numeric;
    std::vector<std::vector<uint32_t>> codes;
    std::vector<size_t> cardinality;
};

Features extract(const PrivacyDataset& data, const std::vector<size_t>& columns, const std::vector<size_t>& rows) {
    Features f;
    for (size_t c : columns) {
        if (data.column(c).type != ColumnType::CATEGORICAL) {
            std::vector<double> present;
            for (size_t r : rows) {
                if (auto v = data.numericValue(r, c)) present.push_back(*v);
            }
            const ColumnStats stats = Statistics::calculateStats(present);
            // Missing cells sit at the mean.
            std::vector<double> z(rows.size(), 0.0);
            if (stats.stddev > kFlatSpread) {
                for (size_t i = 0; i < rows.size(); ++i) {
                    if (auto v = data.numericValue(rows[i], c)) z[i] = (*v - stats.mean) / stats.stddev;
                }
            }
            f.numeric.push_back(std::move(z));
        } else {
            EquivalenceClasses::LabelInterner interner;
            std::vector<uint32_t> codes(rows.size());
            for (size_t i = 0; i < rows.size(); ++i) codes[i] = interner.intern(data.cellKey(rows[i], c));
            f.codes.push_back(std::move(codes));
            f.cardinality.push_back(interner.size());
        }
    }
    return f;
}

double pointDistance(const Features& f, size_t i, size_t j) {
    double d = 0.0;
    for (const auto& z : f.numeric) d += (z[i] - z[j]) * (z[i] - z[j]);
    for (const auto& c : f.codes) d += c[i] == c[j] ? 0.0 : 1.0;
    return d;
}

// Index into pool of the point farthest from the pool's average vector.
size_t farthestFromCentroid(const Features& f, const std::vector<size_t>& pool) {
    const double n = static_cast<double>(pool.size());
    std::vector<double> mean(f.numeric.size(), 0.0);
    for (size_t a = 0; a < f.numeric.size(); ++a) {
        for (size_t i : pool) mean[a] += f.numeric[a][i];
        mean[a] /= n;
    }
    // A categorical centroid is its frequency vector; distance to it is 0.5 * (1 - 2 f_x + sum f^2).
    std::vector<std::vector<double>> freq(f.codes.size());
    std::vector<double> sumSquares(f.codes.size(), 0.0);
    for (size_t a = 0; a < f.codes.size(); ++a) {
        freq[a].assign(f.cardinality[a], 0.0);
        for (size_t i : pool) freq[a][f.codes[a][i]] += 1.0 / n;
        for (double p : freq[a]) sumSquares[a] += p * p;
    }

    size_t best = 0;
    double bestDistance = -1.0;
    for (size_t p = 0; p < pool.size(); ++p) {
        const size_t i = pool[p];
        double d = 0.0;
        for (size_t a = 0; a < f.numeric.size(); ++a) d += (f.numeric[a][i] - mean[a]) * (f.numeric[a][i] - mean[a]);
        for (size_t a = 0; a < f.codes.size(); ++a) d += 0.5 * (1.0 - 2.0 * freq[a][f.codes[a][i]] + sumSquares[a]);
        if (d > bestDistance) {
            bestDistance = d;
            best = p;
        }
    }
    return best;
}

size_t farthestFrom(const Features& f, const std::vector<size_t>& pool, size_t from) {
    size_t best = 0;
    double bestDistance = -1.0;
    for (size_t p = 0; p < pool.size(); ++p) {
        const double d = pointDistance(f, pool[p], from);
        if (d > bestDistance) {
            bestDistance = d;
            best = p;
        }
    }
    return best;
}

// Removes the point at pool[seed] and its k-1 nearest neighbours from pool and returns them.
std::vector<size_t> takeGroup(const Features& f, std::vector<size_t>& pool, size_t seed, size_t k) {
    const size_t centre = pool[seed];
    std::vector<std::pair<double, size_t>> order;
    order.reserve(pool.size());
    for (size_t p = 0; p < pool.size(); ++p) {
        if (p == seed) continue;
        order.emplace_back(pointDistance(f, pool[p], centre), p);
    }
    const size_t take = std::min(k - 1, order.size());
    std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(take), order.end());

    std::vector<uint8_t> taken(pool.size(), 0);
    std::vector<size_t> group{centre};
    taken[seed] = 1;
    for (size_t t = 0; t < take; ++t) {
        group.push_back(pool[order[t].second]);
        taken[order[t].second] = 1;
    }
    std::vector<size_t> rest;
    rest.reserve(pool.size() - group.size());
    for (size_t p = 0; p < pool.size(); ++p) {
        if (!taken[p]) rest.push_back(pool[p]);
    }
    pool = std::move(rest);
    return group;
}
} // namespace

std::vector<std::vector<size_t>> Microaggregation::mdavGroups(const PrivacyDataset& data,
                                                              const std::vector<size_t>& columns,
                                                              const std::vector<size_t>& rows,
                                                              size_t k,
                                                              const CancelCheck& shouldCancel) {
    std::vector<std::vector<size_t>> groups;
    if (rows.empty()) return groups;
    k = std::max<size_t>(1, k);
    const Features f = extract(data, columns, rows);

    std::vector<size_t> pool(rows.size());
    for (size_t i = 0; i < pool.size(); ++i) pool[i] = i;

    std::vector<std::vector<size_t>> points;
    while (pool.size() >= 3 * k) {
        throwIfCancelled(shouldCancel);
        const size_t rIdx = farthestFromCentroid(f, pool);
        const size_t r = pool[rIdx];
        points.push_back(takeGroup(f, pool, rIdx, k));
        points.push_back(takeGroup(f, pool, farthestFrom(f, pool, r), k));
    }
    if (pool.size() >= 2 * k) {
        points.push_back(takeGroup(f, pool, farthestFromCentroid(f, pool), k));
    }
    if (!pool.empty()) points.push_back(std::move(pool));

    groups.reserve(points.size());
    for (const auto& group : points) {
        std::vector<size_t> out;
        out.reserve(group.size());
        for (size_t i : group) out.push_back(rows[i]);
        std::sort(out.begin(), out.end());
        groups.push_back(std::move(out));
    }
    return groups;
}
