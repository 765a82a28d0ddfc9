#pragma once
#include "NumericParse.h"
#include "Table.h"

#include <cstddef>
#include <string>
#include <vector>

// Proximity policy of the flare join: a survey site and a volume estimate
// closer than this are treated as the same flare.
constexpr double kDefaultMaxDistanceKm = 3.0;

struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

enum class MatchIndex {
    BRUTE_FORCE,
    LATITUDE_BANDS
};

struct MatchOptions {
    double maxDistanceKm = kDefaultMaxDistanceKm;
    ParseErrorPolicy onParseError = ParseErrorPolicy::ZERO;
    MatchIndex index = MatchIndex::BRUTE_FORCE;
};

struct JoinResult {
    // Header is the left header followed by the right header.
    Table matched;
    // Header is the left header.
    Table dangling;
    // Distance to the chosen right row, aligned with matched data rows.
    std::vector<double> matchDistancesKm;
    // Data-row index into the right table, aligned with matched data rows.
    std::vector<size_t> matchedRightRows;
};

class GeoMatcher {
public:
    /**
     * @brief Joins every left data row to its nearest right data row.
     * @details A right row is eligible only when its haversine distance is strictly below
     *          both the best distance seen so far and maxDistanceKm, so the earliest right
     *          row wins ties. Unmatched left rows land in `dangling` unchanged.
     * @post matched.dataRowCount() + dangling.dataRowCount() == left.dataRowCount().
     * @throws Flarejoin::DatasetException when either table lacks a header, or on a
     *         malformed coordinate under ParseErrorPolicy::FAIL.
     */
    static JoinResult match(const Table& left,
                            const Table& right,
                            size_t leftLatCol,
                            size_t leftLonCol,
                            size_t rightLatCol,
                            size_t rightLonCol,
                            const MatchOptions& options = MatchOptions{});

    static MatchIndex indexFromString(const std::string& value);
    static const char* indexName(MatchIndex index);
};
