#pragma once
#include "RegressionEngine.h"
#include "Table.h"

#include <iostream>
#include <string>

// Plain-text report on a stream. Floats are printed with 4 decimals.
class TerminalUI {
public:
    static void printHeaders(const std::string& label, const Row& header, std::ostream& os = std::cout);
    static void printFilteredCount(const std::string& country, const std::string& label, size_t count,
                                   std::ostream& os = std::cout);
    static void printJoinSummary(size_t joined, size_t dangling, double maxDistanceKm, std::ostream& os = std::cout);
    static void printPreview(const std::string& targetLabel, const RegressionFit& fit, std::ostream& os = std::cout);
    static void printModel(const std::string& targetLabel, const RegressionFit& fit, std::ostream& os = std::cout);

    static std::string formatDistance(double km);
};
