#pragma once
#include "NumericParse.h"
#include "Table.h"

#include <cstddef>
#include <utility>
#include <vector>

struct RegressionSample {
    double target = 0.0;
    std::vector<double> predictors;
};

struct RegressionResult {
    double alpha = 0.0;      // intercept
    double beta = 0.0;       // slope on the normalized predictor
    double rSquared = 0.0;
};

struct RegressionFit {
    RegressionResult result;
    size_t sampleCount = 0;
    double predictorMin = 0.0;   // raw predictor range used for normalization
    double predictorMax = 0.0;
    // Leading (target, normalized predictor) pairs for display.
    std::vector<std::pair<double, double>> preview;
};

class RegressionEngine {
public:
    static constexpr size_t kDefaultPreviewRows = 10;

    /**
     * @brief Builds one sample per joined data row that is long enough to hold targetCol.
     * @details Predictor columns past the end of a short row are left out of that sample,
     *          so predictor vectors can differ in length.
     * @throws Flarejoin::DatasetException on a malformed cell under ParseErrorPolicy::FAIL.
     */
    static std::vector<RegressionSample> extract(const Table& joined,
                                                 size_t targetCol,
                                                 const std::vector<size_t>& predictorCols,
                                                 ParseErrorPolicy policy = ParseErrorPolicy::ZERO);

    /**
     * @brief Fits target = alpha + beta * x' by ordinary least squares, where x' is the
     *        min-max normalized first predictor of each sample.
     * @pre samples is non-empty and every sample has at least one predictor.
     * @throws Flarejoin::RegressionException when a precondition fails, the predictor is
     *         constant, the target is constant (R² undefined), or a value is non-finite.
     */
    static RegressionFit fit(const std::vector<RegressionSample>& samples,
                             size_t previewRows = kDefaultPreviewRows);
};
