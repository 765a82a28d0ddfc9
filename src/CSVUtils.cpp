#include "CSVUtils.h"
#include "FlarejoinExceptions.h"

#include <cstdio>
#include <string>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    size_t matched = 0;
    while (matched < 3) {
        const int next = is.peek();
        if (next == EOF || static_cast<unsigned char>(next) != kBom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == 3 || matched == 0) return;

    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
}

std::vector<std::string> parseRecord(std::istream& is,
                                     char delimiter,
                                     RecordStatus& status,
                                     const ParseLimits& limits) {
    status = RecordStatus{};
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawContent = false;
    char c;

    auto pushField = [&]() {
        row.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) {
            status.limitExceeded = true;
        }
    };

    while (is.get(c)) {
        if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            ++status.consumedLines;
            if (!inQuotes) break;
            field += '\n';
        } else if (c == '"') {
            if (inQuotes) {
                if (is.peek() == '"') {
                    is.get();
                    field += '"';
                } else {
                    inQuotes = false;
                }
            } else if (trimUnquotedField(field).empty() && !fieldQuoted) {
                field.clear();
                inQuotes = true;
                fieldQuoted = true;
            } else {
                field += c;
            }
            sawContent = true;
        } else if (c == delimiter && !inQuotes) {
            pushField();
            sawContent = true;
        } else {
            // Text after a closing quote is kept verbatim.
            field += c;
            sawContent = true;
        }

        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) {
            status.limitExceeded = true;
        }
        if (status.limitExceeded) return row;
    }

    if (inQuotes) status.malformed = true;
    if (!sawContent) return {};
    const bool lastQuoted = fieldQuoted;
    pushField();
    if (row.size() == 1 && row[0].empty() && !lastQuoted) return {};
    return row;
}

std::vector<std::vector<std::string>> readRecords(std::istream& is,
                                                  char delimiter,
                                                  ReadSummary* summary,
                                                  const ParseLimits& limits) {
    ReadSummary local;
    std::vector<std::vector<std::string>> rows;
    skipBOM(is);

    size_t lineNo = 1;
    while (is.peek() != EOF) {
        RecordStatus status;
        auto row = parseRecord(is, delimiter, status, limits);
        if (status.limitExceeded) {
            throw Flarejoin::DatasetException("CSV record starting at line " + std::to_string(lineNo) +
                                              " exceeds parser limits");
        }
        lineNo += status.consumedLines;
        if (status.malformed) {
            ++local.malformedRecords;
            continue;
        }
        if (row.empty()) {
            ++local.blankLines;
            continue;
        }
        rows.push_back(std::move(row));
    }

    local.records = rows.size();
    if (summary) *summary = local;
    return rows;
}
} // namespace CSVUtils
