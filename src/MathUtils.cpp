#include "MathUtils.h"
#include "FlarejoinExceptions.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
constexpr double kPi = 3.14159265358979323846;
}

double MathUtils::degreesToRadians(double degrees) {
    return degrees * (kPi / 180.0);
}

double MathUtils::haversineKm(double lat1, double lon1, double lat2, double lon2) {
    const double dLat = degreesToRadians(lat2 - lat1);
    const double dLon = degreesToRadians(lon2 - lon1);
    const double sinLat = std::sin(dLat / 2.0);
    const double sinLon = std::sin(dLon / 2.0);

    double a = sinLat * sinLat +
               std::cos(degreesToRadians(lat1)) * std::cos(degreesToRadians(lat2)) * sinLon * sinLon;
    // Rounding can push near-antipodal pairs just past 1. NaN must stay NaN.
    if (a > 1.0) a = 1.0;

    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return kEarthRadiusKm * c;
}

std::vector<double> MathUtils::minMaxNormalize(const std::vector<double>& values) {
    if (values.empty()) {
        throw Flarejoin::RegressionException("cannot normalize an empty predictor");
    }
    for (double v : values) {
        if (!std::isfinite(v)) {
            throw Flarejoin::RegressionException("cannot normalize a predictor containing non-finite values");
        }
    }

    const auto mm = std::minmax_element(values.begin(), values.end());
    const double minv = *mm.first;
    const double maxv = *mm.second;
    const double range = maxv - minv;
    if (!std::isfinite(range)) {
        throw Flarejoin::RegressionException("predictor range overflows double precision");
    }
    if (!(range > 0.0)) {
        throw Flarejoin::RegressionException("predictor has zero variance (all values equal " +
                                             std::to_string(minv) + "), min-max normalization is undefined");
    }

    std::vector<double> scaled(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        scaled[i] = (values[i] - minv) / range;
    }
    return scaled;
}

double MathUtils::mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    const double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}
