#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

struct ColumnStats {
    size_t count = 0;
    double mean = 0.0;
    double variance = 0.0;
    double stddev = 0.0;
    double min = 0.0;
    double max = 0.0;
};

using FrequencyTable = std::map<std::string, double>;

namespace Statistics {
ColumnStats calculateStats(const std::vector<double>& col);

// Shannon entropy in nats of a count or probability table (normalized internally).
double entropy(const FrequencyTable& counts);
FrequencyTable normalize(const FrequencyTable& counts);

double totalVariation(const FrequencyTable& p, const FrequencyTable& q);
double klDivergence(const FrequencyTable& p, const FrequencyTable& q);
// Earth mover distance over an ordered ground set with unit spacing, scaled to [0,1].
double orderedEarthMover(const FrequencyTable& p, const FrequencyTable& q, const std::vector<std::string>& order);

double pearson(const std::vector<double>& x, const std::vector<double>& y);
double cramersV(const std::vector<std::string>& a, const std::vector<std::string>& b);
double ksStatistic(std::vector<double> a, std::vector<double> b);
double wasserstein1D(std::vector<double> a, std::vector<double> b);

// Standard normal CDF.
double normalCdf(double z);

/**
 * @brief Lower-triangular L with L * L^T = a for a symmetric positive semi-definite matrix.
 * @details Pivots that vanish (collinear or constant inputs) give a zero column instead of failing.
 */
std::vector<std::vector<double>> choleskyLower(const std::vector<std::vector<double>>& a);

std::vector<double> quantileEdges(const std::vector<double>& values, size_t bins);
size_t binIndex(const std::vector<double>& edges, double value);
}
