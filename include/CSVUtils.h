#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Low-level CSV tokenization. Cells stay strings; numeric interpretation
// belongs to the caller.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;   // 8 MiB
    size_t maxColumns = 20000;
};

struct RecordStatus {
    bool malformed = false;      // unterminated quoted field
    bool limitExceeded = false;
    size_t consumedLines = 0;
};

struct ReadSummary {
    size_t records = 0;
    size_t blankLines = 0;
    size_t malformedRecords = 0;
};

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record, following quoted fields across line breaks.
 * @post Returns an empty vector at EOF or for a blank line.
 */
std::vector<std::string> parseRecord(std::istream& is,
                                     char delimiter,
                                     RecordStatus& status,
                                     const ParseLimits& limits = ParseLimits{});

/**
 * @brief Reads every record of a stream. Blank lines and malformed records are skipped
 * and counted in `summary`.
 * @throws Flarejoin::DatasetException when a record exceeds `limits`.
 */
std::vector<std::vector<std::string>> readRecords(std::istream& is,
                                                  char delimiter,
                                                  ReadSummary* summary = nullptr,
                                                  const ParseLimits& limits = ParseLimits{});
}
