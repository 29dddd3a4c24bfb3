#include "Statistics.h"
#include "CommonUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace {
constexpr double kDegenerateVariance = 1e-12;

double tableTotal(const FrequencyTable& t) {
    double total = 0.0;
    for (const auto& kv : t) total += kv.second;
    return total;
}

double massOf(const FrequencyTable& t, const std::string& key) {
    auto it = t.find(key);
    return it == t.end() ? 0.0 : it->second;
}
} // namespace

ColumnStats Statistics::calculateStats(const std::vector<double>& col) {
    ColumnStats stats;
    double mean = 0.0;
    double m2 = 0.0;
    size_t count = 0;
    for (double value : col) {
        if (!std::isfinite(value)) continue;
        if (count == 0) {
            stats.min = value;
            stats.max = value;
        } else {
            stats.min = std::min(stats.min, value);
            stats.max = std::max(stats.max, value);
        }
        ++count;
        double delta = value - mean;
        mean += delta / static_cast<double>(count);
        double delta2 = value - mean;
        m2 += delta * delta2;
    }
    stats.count = count;
    stats.mean = mean;
    stats.variance = (count > 1) ? (m2 / static_cast<double>(count - 1)) : 0.0;
    stats.stddev = std::sqrt(stats.variance);
    return stats;
}

FrequencyTable Statistics::normalize(const FrequencyTable& counts) {
    FrequencyTable out;
    const double total = tableTotal(counts);
    if (total <= 0.0) return out;
    for (const auto& kv : counts) {
        if (kv.second > 0.0) out[kv.first] = kv.second / total;
    }
    return out;
}

double Statistics::entropy(const FrequencyTable& counts) {
    double h = 0.0;
    for (const auto& kv : normalize(counts)) {
        h -= kv.second * std::log(kv.second);
    }
    return std::max(0.0, h);
}

double Statistics::totalVariation(const FrequencyTable& p, const FrequencyTable& q) {
    const FrequencyTable pn = normalize(p);
    const FrequencyTable qn = normalize(q);
    double sum = 0.0;
    for (const auto& kv : pn) sum += std::abs(kv.second - massOf(qn, kv.first));
    for (const auto& kv : qn) {
        if (pn.find(kv.first) == pn.end()) sum += kv.second;
    }
    return std::clamp(0.5 * sum, 0.0, 1.0);
}

double Statistics::klDivergence(const FrequencyTable& p, const FrequencyTable& q) {
    const FrequencyTable pn = normalize(p);
    const FrequencyTable qn = normalize(q);
    double d = 0.0;
    for (const auto& kv : pn) {
        const double qv = massOf(qn, kv.first);
        if (qv <= 0.0) return std::numeric_limits<double>::infinity();
        d += kv.second * std::log(kv.second / qv);
    }
    return std::max(0.0, d);
}

double Statistics::orderedEarthMover(const FrequencyTable& p,
                                     const FrequencyTable& q,
                                     const std::vector<std::string>& order) {
    if (order.size() < 2) return 0.0;
    const FrequencyTable pn = normalize(p);
    const FrequencyTable qn = normalize(q);
    double carried = 0.0;
    double work = 0.0;
    for (size_t i = 0; i + 1 < order.size(); ++i) {
        carried += massOf(pn, order[i]) - massOf(qn, order[i]);
        work += std::abs(carried);
    }
    return std::clamp(work / static_cast<double>(order.size() - 1), 0.0, 1.0);
}

double Statistics::pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) return 0.0;
    double mx = 0.0, my = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mx += x[i];
        my += y[i];
    }
    mx /= static_cast<double>(n);
    my /= static_cast<double>(n);
    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= kDegenerateVariance || syy <= kDegenerateVariance) return 0.0;
    return std::clamp(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

double Statistics::cramersV(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const size_t n = std::min(a.size(), b.size());
    if (n == 0) return 0.0;

    std::unordered_map<std::string, size_t> rowIdx;
    std::unordered_map<std::string, size_t> colIdx;
    for (size_t i = 0; i < n; ++i) {
        rowIdx.emplace(a[i], rowIdx.size());
        colIdx.emplace(b[i], colIdx.size());
    }
    const size_t r = rowIdx.size();
    const size_t c = colIdx.size();
    if (r < 2 || c < 2) return 0.0;

    std::vector<double> table(r * c, 0.0);
    std::vector<double> rowSum(r, 0.0);
    std::vector<double> colSum(c, 0.0);
    for (size_t i = 0; i < n; ++i) {
        const size_t ri = rowIdx[a[i]];
        const size_t ci = colIdx[b[i]];
        table[ri * c + ci] += 1.0;
        rowSum[ri] += 1.0;
        colSum[ci] += 1.0;
    }

    const double total = static_cast<double>(n);
    double chi2 = 0.0;
    for (size_t i = 0; i < r; ++i) {
        for (size_t j = 0; j < c; ++j) {
            const double expected = rowSum[i] * colSum[j] / total;
            if (expected <= 0.0) continue;
            const double diff = table[i * c + j] - expected;
            chi2 += diff * diff / expected;
        }
    }
    const double denom = total * static_cast<double>(std::min(r, c) - 1);
    return std::clamp(std::sqrt(chi2 / denom), 0.0, 1.0);
}

double Statistics::ksStatistic(std::vector<double> a, std::vector<double> b) {
    if (a.empty() || b.empty()) return 1.0;
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    size_t i = 0, j = 0;
    double d = 0.0;
    const double na = static_cast<double>(a.size());
    const double nb = static_cast<double>(b.size());
    while (i < a.size() && j < b.size()) {
        const double v = std::min(a[i], b[j]);
        while (i < a.size() && a[i] <= v) ++i;
        while (j < b.size() && b[j] <= v) ++j;
        d = std::max(d, std::abs(static_cast<double>(i) / na - static_cast<double>(j) / nb));
    }
    return d;
}

double Statistics::wasserstein1D(std::vector<double> a, std::vector<double> b) {
    if (a.empty() || b.empty()) return 0.0;
    std::sort(a.begin(), a.end());
    std::sort(b.begin(), b.end());
    // Integrate |F_a - F_b| over the merged support.
    std::vector<double> support;
    support.reserve(a.size() + b.size());
    support.insert(support.end(), a.begin(), a.end());
    support.insert(support.end(), b.begin(), b.end());
    std::sort(support.begin(), support.end());

    const double na = static_cast<double>(a.size());
    const double nb = static_cast<double>(b.size());
    size_t i = 0, j = 0;
    double dist = 0.0;
    for (size_t s = 0; s + 1 < support.size(); ++s) {
        const double x = support[s];
        while (i < a.size() && a[i] <= x) ++i;
        while (j < b.size() && b[j] <= x) ++j;
        const double width = support[s + 1] - x;
        if (width <= 0.0) continue;
        dist += std::abs(static_cast<double>(i) / na - static_cast<double>(j) / nb) * width;
    }
    return dist;
}

std::vector<double> Statistics::quantileEdges(const std::vector<double>& values, size_t bins) {
    std::vector<double> edges;
    if (values.empty() || bins < 2) return edges;
    for (size_t b = 1; b < bins; ++b) {
        const double q = CommonUtils::quantileByNth(values, static_cast<double>(b) / static_cast<double>(bins));
        if (edges.empty() || q > edges.back()) edges.push_back(q);
    }
    return edges;
}

size_t Statistics::binIndex(const std::vector<double>& edges, double value) {
    return static_cast<size_t>(std::upper_bound(edges.begin(), edges.end(), value) - edges.begin());
}

double Statistics::normalCdf(double z) {
    return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

std::vector<std::vector<double>> Statistics::choleskyLower(const std::vector<std::vector<double>>& a) {
    const size_t n = a.size();
    std::vector<std::vector<double>> l(n, std::vector<double>(n, 0.0));
    for (size_t j = 0; j < n; ++j) {
        double d = a[j][j];
        for (size_t k = 0; k < j; ++k) d -= l[j][k] * l[j][k];
        if (d <= kDegenerateVariance) continue;
        l[j][j] = std::sqrt(d);
        for (size_t i = j + 1; i < n; ++i) {
            double s = a[i][j];
            for (size_t k = 0; k < j; ++k) s -= l[i][k] * l[j][k];
            l[i][j] = s / l[j][j];
        }
    }
    return l;
}
