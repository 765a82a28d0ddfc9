#pragma once
#include "Table.h"
#include <string>

class CountryFilter {
public:
    /**
     * @brief Keeps the header plus every data row whose `countryCol` cell equals
     *        `country` ignoring ASCII case. Only `country` itself is trimmed.
     * @post Rows too short to hold `countryCol` are dropped. Row order is preserved.
     * @throws Flarejoin::DatasetException when `table` has no header.
     */
    static Table filter(const Table& table, size_t countryCol, const std::string& country);
};
