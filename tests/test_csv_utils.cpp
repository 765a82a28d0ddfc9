#include <catch2/catch.hpp>

#include "CSVUtils.h"
#include "FlarejoinExceptions.h"

#include <sstream>

using Records = std::vector<std::vector<std::string>>;

TEST_CASE("CSV: plain records are split and unquoted fields trimmed", "[csv]") {
    std::istringstream in("Country, Latitude ,Longitude\nAlgeria,31.5,5.25\n");
    CSVUtils::ReadSummary summary;
    const Records rows = CSVUtils::readRecords(in, ',', &summary);

    REQUIRE(rows.size() == 2);
    CHECK(rows[0] == std::vector<std::string>{"Country", "Latitude", "Longitude"});
    CHECK(rows[1] == std::vector<std::string>{"Algeria", "31.5", "5.25"});
    CHECK(summary.records == 2);
    CHECK(summary.blankLines == 0);
    CHECK(summary.malformedRecords == 0);
}

TEST_CASE("CSV: quoted fields keep delimiters, escaped quotes and line breaks", "[csv]") {
    std::istringstream in("name,notes\n\"Hassi, R'Mel\",\"said \"\"flare\"\"\nsecond line\"\n");
    const Records rows = CSVUtils::readRecords(in, ',');

    REQUIRE(rows.size() == 2);
    CHECK(rows[1][0] == "Hassi, R'Mel");
    CHECK(rows[1][1] == "said \"flare\"\nsecond line");
}

TEST_CASE("CSV: quoted whitespace is preserved", "[csv]") {
    std::istringstream in("a,b\n\"  padded  \",  bare  \n");
    const Records rows = CSVUtils::readRecords(in, ',');

    REQUIRE(rows.size() == 2);
    CHECK(rows[1][0] == "  padded  ");
    CHECK(rows[1][1] == "bare");
}

TEST_CASE("CSV: CRLF line endings and a UTF-8 BOM are handled", "[csv]") {
    std::istringstream in("\xEF\xBB\xBF" "Country,Year\r\nAlgeria,2015\r\n");
    const Records rows = CSVUtils::readRecords(in, ',');

    REQUIRE(rows.size() == 2);
    CHECK(rows[0][0] == "Country");
    CHECK(rows[1][1] == "2015");
}

TEST_CASE("CSV: blank lines are skipped and counted", "[csv]") {
    std::istringstream in("a,b\n\n1,2\n   \n3,4\n");
    CSVUtils::ReadSummary summary;
    const Records rows = CSVUtils::readRecords(in, ',', &summary);

    REQUIRE(rows.size() == 3);
    CHECK(rows[2] == std::vector<std::string>{"3", "4"});
    CHECK(summary.blankLines == 2);
}

TEST_CASE("CSV: empty fields are kept in position", "[csv]") {
    std::istringstream in("a,b,c\n1,,3\n,,\n");
    const Records rows = CSVUtils::readRecords(in, ',');

    REQUIRE(rows.size() == 3);
    CHECK(rows[1] == std::vector<std::string>{"1", "", "3"});
    CHECK(rows[2] == std::vector<std::string>{"", "", ""});
}

TEST_CASE("CSV: an unterminated quote is reported as malformed", "[csv]") {
    std::istringstream in("a,b\n1,\"never closed\n");
    CSVUtils::ReadSummary summary;
    const Records rows = CSVUtils::readRecords(in, ',', &summary);

    REQUIRE(rows.size() == 1);
    CHECK(summary.malformedRecords == 1);
}

TEST_CASE("CSV: alternative delimiters", "[csv]") {
    std::istringstream in("a;b\n1,5;2\n");
    const Records rows = CSVUtils::readRecords(in, ';');

    REQUIRE(rows.size() == 2);
    CHECK(rows[1] == std::vector<std::string>{"1,5", "2"});
}

TEST_CASE("CSV: records beyond the column limit are rejected", "[csv]") {
    std::istringstream in("a,b,c,d\n");
    CSVUtils::ParseLimits limits;
    limits.maxColumns = 3;
    CHECK_THROWS_AS(CSVUtils::readRecords(in, ',', nullptr, limits), Flarejoin::DatasetException);
}
