#pragma once
#include "CSVUtils.h"
#include "Table.h"

#include <istream>
#include <string>

struct LoadSummary {
    std::string sourcePath;
    std::string parsedPath;      // temporary CSV when the source was converted
    std::string converter;       // empty for plain CSV
    CSVUtils::ReadSummary csv;
};

class TableLoader {
public:
    /**
     * @brief Loads a CSV file, or converts a spreadsheet / compressed source to CSV first.
     * @details .xlsx goes through xlsx2csv and .xls through xls2csv (first sheet only);
     *          .gz and .zip are decompressed with gzip / unzip. Anything else is read as CSV.
     * @pre path names a readable file; converters must be on PATH for non-CSV sources.
     * @post Returned table has at least a header row.
     * @throws Flarejoin::IOException when the file or a converter is unavailable or fails.
     * @throws Flarejoin::DatasetException when the source holds no rows.
     */
    static Table load(const std::string& path, char delimiter = ',', LoadSummary* summary = nullptr);

    /**
     * @brief Parses CSV text from a stream. `sourceName` is used in error messages.
     * @throws Flarejoin::DatasetException when the stream holds no rows.
     */
    static Table loadCsv(std::istream& is, char delimiter, const std::string& sourceName,
                         CSVUtils::ReadSummary* summary = nullptr);
};
