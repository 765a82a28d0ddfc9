#include "GeoMatcher.h"
#include "CommonUtils.h"
#include "FlarejoinExceptions.h"
#include "MathUtils.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <unordered_map>
#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace {
constexpr size_t kNoMatch = std::numeric_limits<size_t>::max();
constexpr double kPi = 3.14159265358979323846;
// Bands are widened slightly so haversine rounding never pushes an eligible
// row outside the neighbouring bands.
constexpr double kBandSlack = 1.0 + 1e-9;
// Below this threshold the strip count would overflow the band key.
constexpr double kMinBandedDistanceKm = 1e-6;

std::vector<std::optional<GeoPoint>> resolvePoints(const Table& table,
                                                   size_t latCol,
                                                   size_t lonCol,
                                                   ParseErrorPolicy policy,
                                                   const char* side) {
    std::vector<std::optional<GeoPoint>> points(table.dataRowCount());
    for (size_t i = 0; i < table.dataRowCount(); ++i) {
        const Row& row = table.dataRow(i);
        const std::string context = std::string(side) + " row " + std::to_string(i + 1);
        const auto lat = NumericParse::readCell(row, latCol, policy, context);
        const auto lon = NumericParse::readCell(row, lonCol, policy, context);
        if (lat && lon) points[i] = GeoPoint{*lat, *lon};
    }
    return points;
}

bool bandable(const GeoPoint& p) {
    return std::isfinite(p.latitude) && std::abs(p.latitude) <= 90.0;
}

// Right rows bucketed by latitude strip. The great-circle distance between two
// valid points is never below R * |dLat|, so a row can only be within the
// threshold of a left row whose strip is the same or adjacent.
class LatitudeBands {
public:
    LatitudeBands(const std::vector<std::optional<GeoPoint>>& rightPoints, double maxDistanceKm)
        : bandHeightDeg_((maxDistanceKm / MathUtils::kEarthRadiusKm) * (180.0 / kPi) * kBandSlack) {
        for (size_t j = 0; j < rightPoints.size(); ++j) {
            if (!rightPoints[j]) continue;
            if (bandable(*rightPoints[j])) {
                bands_[bandOf(rightPoints[j]->latitude)].push_back(j);
            } else {
                unbanded_.push_back(j);
            }
        }
    }

    // Candidate right rows for a bandable left point, in ascending row order.
    void candidates(const GeoPoint& p, std::vector<size_t>& out) const {
        out.clear();
        const long long band = bandOf(p.latitude);
        for (long long b = band - 1; b <= band + 1; ++b) {
            const auto it = bands_.find(b);
            if (it != bands_.end()) out.insert(out.end(), it->second.begin(), it->second.end());
        }
        out.insert(out.end(), unbanded_.begin(), unbanded_.end());
        std::sort(out.begin(), out.end());
    }

private:
    long long bandOf(double latitude) const {
        return static_cast<long long>(std::floor((latitude + 90.0) / bandHeightDeg_));
    }

    double bandHeightDeg_;
    std::unordered_map<long long, std::vector<size_t>> bands_;
    std::vector<size_t> unbanded_;
};

struct Nearest {
    size_t index = kNoMatch;
    double distanceKm = 0.0;
};

template <typename IndexRange>
Nearest scanNearest(const GeoPoint& p,
                    const std::vector<std::optional<GeoPoint>>& rightPoints,
                    const IndexRange& order,
                    double maxDistanceKm) {
    Nearest best;
    double bestDist = maxDistanceKm;
    for (size_t j : order) {
        if (!rightPoints[j]) continue;
        const GeoPoint& q = *rightPoints[j];
        const double d = MathUtils::haversineKm(p.latitude, p.longitude, q.latitude, q.longitude);
        if (d < bestDist) {
            bestDist = d;
            best.index = j;
            best.distanceKm = d;
        }
    }
    return best;
}

// Iterates 0..n-1 without materialising the sequence.
struct AllRows {
    struct iterator {
        size_t i;
        size_t operator*() const { return i; }
        iterator& operator++() { ++i; return *this; }
        bool operator!=(const iterator& o) const { return i != o.i; }
    };
    size_t n;
    iterator begin() const { return {0}; }
    iterator end() const { return {n}; }
};
} // namespace

JoinResult GeoMatcher::match(const Table& left,
                             const Table& right,
                             size_t leftLatCol,
                             size_t leftLonCol,
                             size_t rightLatCol,
                             size_t rightLonCol,
                             const MatchOptions& options) {
    const Row& leftHeader = left.header();
    const Row& rightHeader = right.header();

    // Parsing happens up front so FAIL can throw outside the parallel region.
    const auto leftPoints = resolvePoints(left, leftLatCol, leftLonCol, options.onParseError, "left");
    const auto rightPoints = resolvePoints(right, rightLatCol, rightLonCol, options.onParseError, "right");

    const size_t nLeft = leftPoints.size();
    std::vector<Nearest> nearest(nLeft);

    // A threshold that is not positive admits nothing.
    if (options.maxDistanceKm > 0.0) {
        const AllRows everyRightRow{rightPoints.size()};
        std::optional<LatitudeBands> bands;
        if (options.index == MatchIndex::LATITUDE_BANDS && std::isfinite(options.maxDistanceKm) &&
            options.maxDistanceKm >= kMinBandedDistanceKm) {
            bands.emplace(rightPoints, options.maxDistanceKm);
        }

        #ifdef USE_OPENMP
        #pragma omp parallel
        #endif
        {
            std::vector<size_t> candidates;
            #ifdef USE_OPENMP
            #pragma omp for schedule(dynamic, 64)
            #endif
            for (size_t i = 0; i < nLeft; ++i) {
                if (!leftPoints[i]) continue;
                const GeoPoint& p = *leftPoints[i];
                if (bands && bandable(p)) {
                    bands->candidates(p, candidates);
                    nearest[i] = scanNearest(p, rightPoints, candidates, options.maxDistanceKm);
                } else {
                    nearest[i] = scanNearest(p, rightPoints, everyRightRow, options.maxDistanceKm);
                }
            }
        }
    }

    JoinResult result;
    Row joinedHeader = leftHeader;
    joinedHeader.insert(joinedHeader.end(), rightHeader.begin(), rightHeader.end());
    result.matched.appendRow(std::move(joinedHeader));
    result.dangling.appendRow(leftHeader);

    for (size_t i = 0; i < nLeft; ++i) {
        const Row& leftRow = left.dataRow(i);
        if (nearest[i].index == kNoMatch) {
            result.dangling.appendRow(leftRow);
            continue;
        }
        const Row& rightRow = right.dataRow(nearest[i].index);
        Row joined;
        joined.reserve(leftRow.size() + rightRow.size());
        joined.insert(joined.end(), leftRow.begin(), leftRow.end());
        joined.insert(joined.end(), rightRow.begin(), rightRow.end());
        result.matched.appendRow(std::move(joined));
        result.matchDistancesKm.push_back(nearest[i].distanceKm);
        result.matchedRightRows.push_back(nearest[i].index);
    }
    return result;
}

MatchIndex GeoMatcher::indexFromString(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "brute_force" || v == "brute-force") return MatchIndex::BRUTE_FORCE;
    if (v == "latitude_bands" || v == "latitude-bands") return MatchIndex::LATITUDE_BANDS;
    throw Flarejoin::ConfigurationException("match_index must be one of: brute_force, latitude_bands (got '" + value + "')");
}

const char* GeoMatcher::indexName(MatchIndex index) {
    switch (index) {
        case MatchIndex::BRUTE_FORCE: return "brute_force";
        case MatchIndex::LATITUDE_BANDS: return "latitude_bands";
    }
    return "unknown";
}
