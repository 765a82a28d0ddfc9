#include "RegressionEngine.h"
#include "FlarejoinExceptions.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

std::vector<RegressionSample> RegressionEngine::extract(const Table& joined,
                                                        size_t targetCol,
                                                        const std::vector<size_t>& predictorCols,
                                                        ParseErrorPolicy policy) {
    std::vector<RegressionSample> samples;
    samples.reserve(joined.dataRowCount());

    for (size_t i = 0; i < joined.dataRowCount(); ++i) {
        const Row& row = joined.dataRow(i);
        if (row.size() <= targetCol) continue;

        const std::string context = "joined row " + std::to_string(i + 1);
        const std::optional<double> y = NumericParse::readCell(row, targetCol, policy, context);
        if (!y) continue;

        RegressionSample sample;
        sample.target = *y;
        bool skip = false;
        for (size_t col : predictorCols) {
            if (col >= row.size()) continue;
            const std::optional<double> x = NumericParse::readCell(row, col, policy, context);
            if (!x) {
                skip = true;
                break;
            }
            sample.predictors.push_back(*x);
        }
        if (!skip) samples.push_back(std::move(sample));
    }
    return samples;
}

RegressionFit RegressionEngine::fit(const std::vector<RegressionSample>& samples, size_t previewRows) {
    if (samples.empty()) {
        throw Flarejoin::RegressionException("insufficient data for regression analysis: no samples");
    }

    const size_t n = samples.size();
    std::vector<double> y(n);
    std::vector<double> xRaw(n);
    for (size_t i = 0; i < n; ++i) {
        if (samples[i].predictors.empty()) {
            throw Flarejoin::RegressionException("insufficient data for regression analysis: sample " +
                                                 std::to_string(i + 1) + " has no predictor values");
        }
        y[i] = samples[i].target;
        xRaw[i] = samples[i].predictors.front();
        if (!std::isfinite(y[i])) {
            throw Flarejoin::RegressionException("target of sample " + std::to_string(i + 1) + " is not finite");
        }
    }

    const std::vector<double> x = MathUtils::minMaxNormalize(xRaw);
    const bool constantTarget = std::all_of(y.begin(), y.end(), [&](double v) { return v == y.front(); });
    if (constantTarget) {
        throw Flarejoin::RegressionException("target has zero variance, R-squared cannot be computed");
    }

    RegressionFit out;
    out.sampleCount = n;
    const auto mm = std::minmax_element(xRaw.begin(), xRaw.end());
    out.predictorMin = *mm.first;
    out.predictorMax = *mm.second;

    const double xMean = MathUtils::mean(x);
    const double yMean = MathUtils::mean(y);
    double sxx = 0.0;
    double sxy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double dx = x[i] - xMean;
        sxx += dx * dx;
        sxy += dx * (y[i] - yMean);
    }
    // sxx > 0: normalization guarantees both 0 and 1 are present.
    const double beta = sxy / sxx;
    const double alpha = yMean - beta * xMean;

    double ssTotal = 0.0;
    double ssResidual = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double predicted = alpha + beta * x[i];
        ssTotal += (y[i] - yMean) * (y[i] - yMean);
        ssResidual += (y[i] - predicted) * (y[i] - predicted);
    }
    if (!(ssTotal > 0.0)) {
        throw Flarejoin::RegressionException("target has zero variance, R-squared cannot be computed");
    }

    out.result.alpha = alpha;
    out.result.beta = beta;
    out.result.rSquared = 1.0 - ssResidual / ssTotal;
    if (!std::isfinite(out.result.alpha) || !std::isfinite(out.result.beta) || !std::isfinite(out.result.rSquared)) {
        throw Flarejoin::RegressionException("regression produced non-finite coefficients");
    }

    const size_t shown = std::min(previewRows, n);
    out.preview.reserve(shown);
    for (size_t i = 0; i < shown; ++i) {
        out.preview.emplace_back(y[i], x[i]);
    }
    return out;
}
