#include <catch2/catch.hpp>

#include "CountryFilter.h"
#include "FlarejoinExceptions.h"

#include <utility>

namespace {
Table makeTable(std::vector<Row> rows) {
    return Table(std::move(rows));
}
} // namespace

TEST_CASE("CountryFilter keeps the header and matching rows in order", "[filter]") {
    const Table table = makeTable({
        {"Country", "Site"},
        {"Algeria", "Hassi Messaoud"},
        {"Libya", "Zueitina"},
        {"ALGERIA", "In Amenas"},
        {"  algeria ", "Rhourde Nouss"},
        {"Algerian", "decoy"},
    });

    const Table filtered = CountryFilter::filter(table, 0, "Algeria");
    REQUIRE(filtered.dataRowCount() == 2);
    CHECK(filtered.header() == Row{"Country", "Site"});
    CHECK(filtered.dataRow(0)[1] == "Hassi Messaoud");
    CHECK(filtered.dataRow(1)[1] == "In Amenas");
}

TEST_CASE("CountryFilter compares cells exactly apart from case", "[filter]") {
    const Table table = makeTable({{"Country"}, {" Algeria"}, {"Algeria\t"}, {"algeria"}});
    const Table filtered = CountryFilter::filter(table, 0, "Algeria");
    REQUIRE(filtered.dataRowCount() == 1);
    CHECK(filtered.dataRow(0)[0] == "algeria");
}

TEST_CASE("CountryFilter trims the requested country and ignores its case", "[filter]") {
    const Table table = makeTable({{"Site", "Country"}, {"a", "Nigeria"}, {"b", "Niger"}});
    const Table filtered = CountryFilter::filter(table, 1, "  NIGERIA ");
    REQUIRE(filtered.dataRowCount() == 1);
    CHECK(filtered.dataRow(0)[0] == "a");
}

TEST_CASE("CountryFilter drops rows too short for the country column", "[filter]") {
    const Table table = makeTable({{"Site", "Country"}, {"a"}, {"b", "Algeria"}, {}});
    const Table filtered = CountryFilter::filter(table, 1, "Algeria");
    REQUIRE(filtered.dataRowCount() == 1);
    CHECK(filtered.dataRow(0)[0] == "b");
}

TEST_CASE("CountryFilter with no matches returns only the header", "[filter]") {
    const Table table = makeTable({{"Country"}, {"Iraq"}, {"Iran"}});
    const Table filtered = CountryFilter::filter(table, 0, "Algeria");
    CHECK(filtered.hasHeader());
    CHECK(filtered.dataRowCount() == 0);
}

TEST_CASE("CountryFilter rejects a table without a header", "[filter]") {
    CHECK_THROWS_AS(CountryFilter::filter(Table{}, 0, "Algeria"), Flarejoin::DatasetException);
}
