#include "SyntheticGenerator.h"
#include "Statistics.h"
#include "UmbraExceptions.h"

#include <algorithm>
#include <cmath>
#include <random>

namespace {
constexpr size_t kCancelCheckInterval = 4096;

std::mt19937_64 makeEngine(const SyntheticDataConfig& config) {
    if (config.seed) return std::mt19937_64(*config.seed);
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return std::mt19937_64(seq);
}

struct AttributeModel {
    size_t column = 0;
    bool redacted = false;
    bool numeric = false;
    double missingRate = 0.0;
    // Numeric and date observations, sorted.
    std::vector<double> sorted;
    double mean = 0.0;
    double stddev = 0.0;
    std::vector<std::string> categories;
    std::discrete_distribution<size_t> pick;
    int copulaIndex = -1;

    bool empty() const { return numeric ? sorted.empty() : categories.empty(); }
};

AttributeModel fitAttribute(const PrivacyDataset& data, size_t col, const std::vector<size_t>& rows, bool redact) {
    AttributeModel model;
    model.column = col;
    const TypedColumn& column = data.column(col);
    if (redact && column.role == AttributeRole::IDENTIFIER) {
        model.redacted = true;
        return model;
    }
    model.numeric = column.type != ColumnType::CATEGORICAL;

    size_t missing = 0;
    FrequencyTable counts;
    for (size_t r : rows) {
        if (data.isMissing(r, col)) {
            ++missing;
        } else if (model.numeric) {
            if (auto v = data.numericValue(r, col)) model.sorted.push_back(*v);
        } else {
            counts[data.cellText(r, col)] += 1.0;
        }
    }
    model.missingRate = static_cast<double>(missing) / static_cast<double>(rows.size());

    if (model.numeric) {
        std::sort(model.sorted.begin(), model.sorted.end());
        const ColumnStats stats = Statistics::calculateStats(model.sorted);
        model.mean = stats.mean;
        model.stddev = stats.stddev;
    } else {
        std::vector<double> weights;
        for (const auto& [value, count] : counts) {
            model.categories.push_back(value);
            weights.push_back(count);
        }
        model.pick = std::discrete_distribution<size_t>(weights.begin(), weights.end());
    }
    return model;
}

// Pairwise-complete Pearson correlations of the copula attributes, factored for sampling.
std::vector<std::vector<double>> copulaFactor(const PrivacyDataset& data,
                                              const std::vector<const AttributeModel*>& joined,
                                              const std::vector<size_t>& rows) {
    const size_t d = joined.size();
    std::vector<std::vector<double>> corr(d, std::vector<double>(d, 0.0));
    for (size_t i = 0; i < d; ++i) {
        corr[i][i] = 1.0;
        for (size_t j = i + 1; j < d; ++j) {
            std::vector<double> x, y;
            for (size_t r : rows) {
                auto a = data.numericValue(r, joined[i]->column);
                auto b = data.numericValue(r, joined[j]->column);
                if (a && b) {
                    x.push_back(*a);
                    y.push_back(*b);
                }
            }
            corr[i][j] = corr[j][i] = Statistics::pearson(x, y);
        }
    }
    return Statistics::choleskyLower(corr);
}

double empiricalQuantile(const std::vector<double>& sorted, double u) {
    const size_t idx = static_cast<size_t>(u * static_cast<double>(sorted.size()));
    return sorted[std::min(idx, sorted.size() - 1)];
}

std::string modelName(const AttributeModel& model, bool preserveDistributions) {
    if (model.redacted) return "redacted";
    if (model.empty()) return "missing";
    if (!model.numeric) return "frequency";
    return preserveDistributions ? "empirical" : "normal";
}
} // namespace

SyntheticResult SyntheticGenerator::generate(const PrivacyDataset& data,
                                             const SyntheticDataConfig& config,
                                             const CancelCheck& shouldCancel) {
    config.validate(data);
    const std::vector<size_t> rows = data.retainedRows();
    if (rows.empty()) {
        throw Umbra::DatasetException("every record is suppressed; there is nothing to model");
    }
    const size_t m = static_cast<size_t>(std::floor(config.sampleFraction * static_cast<double>(data.rowCount())));

    std::vector<AttributeModel> models;
    models.reserve(data.colCount());
    for (size_t c = 0; c < data.colCount(); ++c) models.push_back(fitAttribute(data, c, rows, config.redactIdentifiers));

    SyntheticReport report;
    report.method = config.method;
    report.preserveDistributions = config.preserveDistributions;
    report.sourceRecords = rows.size();
    report.generatedRecords = m;

    std::vector<const AttributeModel*> joined;
    if (config.method == SyntheticMethod::COPULA) {
        for (auto& model : models) {
            if (!model.numeric || model.sorted.size() < 2) continue;
            model.copulaIndex = static_cast<int>(joined.size());
            joined.push_back(&model);
            report.correlatedAttributes.push_back(data.column(model.column).name);
        }
    }
    const std::vector<std::vector<double>> factor = copulaFactor(data, joined, rows);

    std::vector<std::vector<double>> numbers(models.size());
    std::vector<std::vector<std::string>> labels(models.size());
    std::vector<MissingMask> missing(models.size(), MissingMask(m, 0));
    for (size_t a = 0; a < models.size(); ++a) {
        if (models[a].numeric) {
            numbers[a].assign(m, 0.0);
        } else {
            labels[a].assign(m, "");
        }
    }

    std::mt19937_64 rng = makeEngine(config);
    std::normal_distribution<double> standardNormal(0.0, 1.0);
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    std::vector<double> g(joined.size()), z(joined.size());

    for (size_t r = 0; r < m; ++r) {
        if (r % kCancelCheckInterval == 0) throwIfCancelled(shouldCancel);
        for (double& x : g) x = standardNormal(rng);
        for (size_t i = 0; i < z.size(); ++i) {
            z[i] = 0.0;
            for (size_t k = 0; k <= i; ++k) z[i] += factor[i][k] * g[k];
        }

        for (size_t a = 0; a < models.size(); ++a) {
            AttributeModel& model = models[a];
            if (model.redacted) {
                labels[a][r] = "*";
                continue;
            }
            if (model.empty() || (model.missingRate > 0.0 && uniform(rng) < model.missingRate)) {
                missing[a][r] = 1;
                continue;
            }
            if (!model.numeric) {
                labels[a][r] = model.categories[model.pick(rng)];
                continue;
            }
            const double zi = model.copulaIndex >= 0 ? z[static_cast<size_t>(model.copulaIndex)] : standardNormal(rng);
            numbers[a][r] = config.preserveDistributions ? empiricalQuantile(model.sorted, Statistics::normalCdf(zi))
                                                         : model.mean + model.stddev * zi;
        }
    }

    std::vector<TypedColumn> columns;
    columns.reserve(models.size());
    for (size_t a = 0; a < models.size(); ++a) {
        const TypedColumn& source = data.column(models[a].column);
        TypedColumn column;
        if (models[a].redacted || !models[a].numeric) {
            column = makeCategoricalColumn(source.name, std::move(labels[a]), source.role);
            if (!models[a].redacted) column.sourceType = source.sourceType;
        } else if (source.type == ColumnType::DATETIME) {
            std::vector<int64_t> seconds(m, 0);
            for (size_t r = 0; r < m; ++r) {
                if (!missing[a][r]) seconds[r] = static_cast<int64_t>(std::llround(numbers[a][r]));
            }
            column = makeDateColumn(source.name, std::move(seconds), source.role);
        } else {
            column = makeNumericColumn(source.name, std::move(numbers[a]), source.role);
        }
        for (size_t r = 0; r < m; ++r) {
            if (missing[a][r]) column.missing[r] = 1;
        }
        columns.push_back(std::move(column));
        report.attributes.push_back({source.name, modelName(models[a], config.preserveDistributions), models[a].missingRate});
    }

    return {PrivacyDataset(std::move(columns)), std::move(report)};
}

RunOutcome<SyntheticResult> SyntheticGenerator::run(const PrivacyDataset& data,
                                                     const SyntheticDataConfig& config,
                                                     const CancelCheck& shouldCancel) {
    return runCancellable<SyntheticResult>([&]() { return generate(data, config, shouldCancel); });
}
