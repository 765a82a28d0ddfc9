#include <catch2/catch.hpp>

#include "FlarejoinExceptions.h"
#include "GeoMatcher.h"
#include "MathUtils.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <utility>

namespace {
Table makeTable(std::vector<Row> rows) {
    return Table(std::move(rows));
}

std::string num(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.9f", v);
    return buf;
}

Table sites(const std::vector<std::pair<double, double>>& coords) {
    Table t = makeTable({{"id", "lat", "lon"}});
    for (size_t i = 0; i < coords.size(); ++i) {
        t.appendRow({"s" + std::to_string(i), num(coords[i].first), num(coords[i].second)});
    }
    return t;
}

JoinResult join(const Table& left, const Table& right, const MatchOptions& options = MatchOptions{}) {
    return GeoMatcher::match(left, right, 1, 2, 1, 2, options);
}

// Deterministic point cloud around Hassi Messaoud.
std::vector<std::pair<double, double>> cloud(size_t n, uint32_t seed) {
    std::vector<std::pair<double, double>> out;
    uint32_t state = seed;
    auto next = [&state]() {
        state = state * 1664525u + 1013904223u;
        return static_cast<double>(state >> 8) / static_cast<double>(1u << 24);
    };
    for (size_t i = 0; i < n; ++i) {
        out.emplace_back(31.6 + next() * 0.4, 5.9 + next() * 0.4);
    }
    return out;
}
} // namespace

TEST_CASE("GeoMatcher: nearest neighbour within 3 km, far rows dangle", "[geo]") {
    // ~0.56 km from r0, ~2.78 km from r1, ~10 km from r0.
    const Table left = sites({{0.005, 0.0}, {1.025, 0.0}, {-0.09, 0.0}});
    const Table right = sites({{0.0, 0.0}, {1.0, 0.0}});

    for (MatchIndex index : {MatchIndex::BRUTE_FORCE, MatchIndex::LATITUDE_BANDS}) {
        MatchOptions options;
        options.index = index;
        const JoinResult result = join(left, right, options);

        REQUIRE(result.matched.dataRowCount() == 2);
        REQUIRE(result.dangling.dataRowCount() == 1);
        CHECK(result.matchedRightRows == std::vector<size_t>{0, 1});
        CHECK(result.matched.dataRow(0)[0] == "s0");
        CHECK(result.matched.dataRow(1)[0] == "s1");
        CHECK(result.dangling.dataRow(0)[0] == "s2");
        CHECK(result.matchDistancesKm[0] < 1.0);
        CHECK(result.matchDistancesKm[1] < 2.9);
        CHECK(result.matchDistancesKm[1] > 2.5);
    }
}

TEST_CASE("GeoMatcher: joined rows are the left cells followed by the right cells", "[geo]") {
    const Table left = makeTable({{"id", "lat", "lon"}, {"a", "10.0", "20.0"}});
    const Table right = makeTable({{"country", "lat", "lon", "bcm"}, {"Algeria", "10.0", "20.0", "1.5"}});
    const JoinResult result = join(left, right);

    CHECK(result.matched.header() == Row{"id", "lat", "lon", "country", "lat", "lon", "bcm"});
    CHECK(result.dangling.header() == Row{"id", "lat", "lon"});
    REQUIRE(result.matched.dataRowCount() == 1);
    CHECK(result.matched.dataRow(0) == Row{"a", "10.0", "20.0", "Algeria", "10.0", "20.0", "1.5"});
    CHECK(result.matchDistancesKm[0] == Approx(0.0).margin(1e-12));
}

TEST_CASE("GeoMatcher: equal distances resolve to the earliest right row", "[geo]") {
    const Table left = sites({{0.0, 0.0}});
    const Table duplicates = sites({{0.0, 0.01}, {0.0, 0.01}, {0.0, 0.01}});
    const Table mirrored = sites({{5.0, 5.0}, {0.0, 0.01}, {0.0, -0.01}});

    for (int run = 0; run < 3; ++run) {
        for (MatchIndex index : {MatchIndex::BRUTE_FORCE, MatchIndex::LATITUDE_BANDS}) {
            MatchOptions options;
            options.index = index;
            CHECK(join(left, duplicates, options).matchedRightRows == std::vector<size_t>{0});
            CHECK(join(left, mirrored, options).matchedRightRows == std::vector<size_t>{1});
        }
    }
}

TEST_CASE("GeoMatcher: the threshold is an exclusive upper bound", "[geo]") {
    const Table left = sites({{0.0, 0.0}});
    const Table right = sites({{0.01, 0.0}});
    const double exact = MathUtils::haversineKm(0.0, 0.0, std::stod(num(0.01)), 0.0);

    MatchOptions options;
    options.maxDistanceKm = exact;
    CHECK(join(left, right, options).dangling.dataRowCount() == 1);

    options.maxDistanceKm = std::nextafter(exact, std::numeric_limits<double>::infinity());
    CHECK(join(left, right, options).matched.dataRowCount() == 1);
}

TEST_CASE("GeoMatcher: every left row lands in exactly one partition", "[geo]") {
    const Table left = sites(cloud(300, 7));
    const Table right = sites(cloud(200, 11));
    const JoinResult result = join(left, right);

    CHECK(result.matched.dataRowCount() + result.dangling.dataRowCount() == left.dataRowCount());
    CHECK(result.matchDistancesKm.size() == result.matched.dataRowCount());
    CHECK(result.matchedRightRows.size() == result.matched.dataRowCount());
    CHECK(result.matched.dataRowCount() > 0);
    CHECK(result.dangling.dataRowCount() > 0);

    // Left order is preserved within each partition.
    int previous = -1;
    for (size_t i = 0; i < result.matched.dataRowCount(); ++i) {
        const int id = std::stoi(result.matched.dataRow(i)[0].substr(1));
        CHECK(id > previous);
        previous = id;
    }
}

TEST_CASE("GeoMatcher: matches are true nearest neighbours", "[geo]") {
    const auto leftCoords = cloud(120, 3);
    const auto rightCoords = cloud(150, 5);
    const JoinResult result = join(sites(leftCoords), sites(rightCoords));

    for (size_t m = 0; m < result.matched.dataRowCount(); ++m) {
        const double lat = std::stod(result.matched.dataRow(m)[1]);
        const double lon = std::stod(result.matched.dataRow(m)[2]);
        const double chosen = result.matchDistancesKm[m];
        CHECK(chosen < kDefaultMaxDistanceKm);
        for (size_t j = 0; j < rightCoords.size(); ++j) {
            const double d = MathUtils::haversineKm(lat, lon,
                                                    std::stod(num(rightCoords[j].first)),
                                                    std::stod(num(rightCoords[j].second)));
            CHECK_FALSE(d < chosen);
            if (j < result.matchedRightRows[m]) CHECK(d > chosen);
        }
    }
}

TEST_CASE("GeoMatcher: latitude bands give the same join as brute force", "[geo]") {
    auto leftCoords = cloud(400, 21);
    auto rightCoords = cloud(400, 42);
    // Out-of-range latitudes cannot be banded and must still be searched.
    leftCoords.emplace_back(95.0, 6.0);
    rightCoords.emplace_back(95.0, 6.0);
    rightCoords.emplace_back(-91.0, 6.0);
    leftCoords.emplace_back(-91.0, 6.0);

    Table left = sites(leftCoords);
    Table right = sites(rightCoords);
    left.appendRow({"bad", "not-a-number", "6.0"});
    right.appendRow({"bad", "", "0.0"});

    for (double threshold : {0.5, 3.0, 25.0}) {
        for (ParseErrorPolicy policy : {ParseErrorPolicy::ZERO, ParseErrorPolicy::SKIP_ROW}) {
            MatchOptions brute;
            brute.maxDistanceKm = threshold;
            brute.onParseError = policy;
            MatchOptions banded = brute;
            banded.index = MatchIndex::LATITUDE_BANDS;

            const JoinResult a = join(left, right, brute);
            const JoinResult b = join(left, right, banded);
            CHECK(a.matchedRightRows == b.matchedRightRows);
            CHECK(a.matchDistancesKm == b.matchDistancesKm);
            CHECK(a.matched.rows() == b.matched.rows());
            CHECK(a.dangling.rows() == b.dangling.rows());
        }
    }
}

TEST_CASE("GeoMatcher: malformed coordinates follow the parse error policy", "[geo]") {
    const Table left = makeTable({{"id", "lat", "lon"}, {"a", "n/a", "0.0"}, {"b", "0.0"}});
    const Table right = sites({{0.0, 0.0}});

    SECTION("zero reads the coordinate as 0.0") {
        const JoinResult result = join(left, right);
        CHECK(result.matched.dataRowCount() == 2);
        CHECK(result.dangling.dataRowCount() == 0);
    }
    SECTION("skip_row leaves the row unmatched") {
        MatchOptions options;
        options.onParseError = ParseErrorPolicy::SKIP_ROW;
        const JoinResult result = join(left, right, options);
        CHECK(result.matched.dataRowCount() == 0);
        REQUIRE(result.dangling.dataRowCount() == 2);
        CHECK(result.dangling.dataRow(1) == Row{"b", "0.0"});
    }
    SECTION("fail aborts the join") {
        MatchOptions options;
        options.onParseError = ParseErrorPolicy::FAIL;
        CHECK_THROWS_WITH(join(left, right, options), Catch::Contains("left row 1"));
    }
}

TEST_CASE("GeoMatcher: skipped right rows are never candidates", "[geo]") {
    const Table left = sites({{0.0, 0.0}});
    const Table right = makeTable({{"id", "lat", "lon"}, {"bad", "x", "0.0"}, {"far", "5.0", "5.0"}});

    MatchOptions options;
    options.onParseError = ParseErrorPolicy::SKIP_ROW;
    CHECK(join(left, right, options).dangling.dataRowCount() == 1);

    // Read as (0, 0) under the default policy, so it matches.
    CHECK(join(left, right).matchedRightRows == std::vector<size_t>{0});
}

TEST_CASE("GeoMatcher: edge cases", "[geo]") {
    const Table left = sites({{0.0, 0.0}, {1.0, 1.0}});

    SECTION("empty right table leaves every row dangling") {
        const JoinResult result = join(left, sites({}));
        CHECK(result.matched.dataRowCount() == 0);
        CHECK(result.dangling.dataRowCount() == 2);
    }
    SECTION("empty left table gives empty partitions with headers") {
        const JoinResult result = join(sites({}), left);
        CHECK(result.matched.hasHeader());
        CHECK(result.dangling.hasHeader());
        CHECK(result.matched.dataRowCount() == 0);
    }
    SECTION("non-positive threshold admits nothing") {
        MatchOptions options;
        options.maxDistanceKm = 0.0;
        CHECK(join(left, left, options).dangling.dataRowCount() == 2);
    }
    SECTION("a table without a header is rejected") {
        CHECK_THROWS_AS(join(Table{}, left), Flarejoin::DatasetException);
    }
}

TEST_CASE("GeoMatcher: index names parse from configuration strings", "[geo]") {
    CHECK(GeoMatcher::indexFromString("brute_force") == MatchIndex::BRUTE_FORCE);
    CHECK(GeoMatcher::indexFromString("Latitude-Bands") == MatchIndex::LATITUDE_BANDS);
    CHECK(std::string(GeoMatcher::indexName(MatchIndex::LATITUDE_BANDS)) == "latitude_bands");
    CHECK_THROWS_AS(GeoMatcher::indexFromString("kd_tree"), Flarejoin::ConfigurationException);
}
