#include "CountryFilter.h"
#include "CommonUtils.h"

Table CountryFilter::filter(const Table& table, size_t countryCol, const std::string& country) {
    const std::string wanted = CommonUtils::trim(country);
    Table out;
    out.appendRow(table.header());

    for (size_t i = 0; i < table.dataRowCount(); ++i) {
        const Row& row = table.dataRow(i);
        const std::string* cell = Table::cell(row, countryCol);
        if (cell && CommonUtils::equalsIgnoreCase(*cell, wanted)) {
            out.appendRow(row);
        }
    }
    return out;
}
