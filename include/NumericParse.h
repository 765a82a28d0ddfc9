#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * What to do with a numeric cell that is absent, empty or not a number.
 * ZERO keeps the row and reads the cell as 0.0, SKIP_ROW drops the row from
 * the stage that reads it, FAIL aborts the run.
 */
enum class ParseErrorPolicy { ZERO, SKIP_ROW, FAIL };

namespace NumericParse {

/**
 * @brief Parses a decimal (or inf/nan) token, ignoring surrounding whitespace.
 * @post Returns false for empty input, trailing characters, hex notation, or a value out of double range.
 */
bool tryParseDouble(std::string_view text, double& out);

/**
 * @brief Reads cell `col` of `row` as a number under `policy`.
 * @post Returns std::nullopt only for SKIP_ROW on a malformed or absent cell.
 * @throws Flarejoin::DatasetException under FAIL; `context` names the row in the message.
 */
std::optional<double> readCell(const std::vector<std::string>& row,
                               size_t col,
                               ParseErrorPolicy policy,
                               const std::string& context);

const char* policyName(ParseErrorPolicy policy);

/**
 * @throws Flarejoin::ConfigurationException for anything but zero|skip_row|fail.
 */
ParseErrorPolicy policyFromString(const std::string& value);

} // namespace NumericParse
