#pragma once
#include <vector>

class MathUtils {
public:
    // Mean Earth radius used for great-circle distances.
    static constexpr double kEarthRadiusKm = 6371.0;

    /**
     * @brief Great-circle distance in kilometres between two points given in decimal degrees.
     * @post Returns NaN when any coordinate is NaN.
     */
    static double haversineKm(double lat1, double lon1, double lat2, double lon2);

    /**
     * @brief Rescales values linearly onto [0,1] using their own minimum and maximum.
     * @post Result has the same length; its minimum is 0.0 and its maximum is 1.0.
     * @throws Flarejoin::RegressionException when values is empty, contains a
     *         non-finite value, or all values are equal.
     */
    static std::vector<double> minMaxNormalize(const std::vector<double>& values);

    static double mean(const std::vector<double>& values);

    static double degreesToRadians(double degrees);
};
