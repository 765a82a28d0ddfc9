#include "Table.h"
#include "FlarejoinExceptions.h"

const Row& Table::header() const {
    if (rows_.empty()) {
        throw Flarejoin::DatasetException("table has no header row");
    }
    return rows_.front();
}
