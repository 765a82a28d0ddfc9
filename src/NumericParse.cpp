#include "NumericParse.h"
#include "CommonUtils.h"
#include "FlarejoinExceptions.h"

#include <charconv>
#include <system_error>

namespace NumericParse {

bool tryParseDouble(std::string_view text, double& out) {
    const std::string token = CommonUtils::trim(text);
    std::string_view digits(token);
    // from_chars takes no leading '+'; one is allowed, a second sign is not.
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) return false;
    }
    if (digits.empty()) return false;

    double value = 0.0;
    const char* begin = digits.data();
    const char* end = begin + digits.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value, std::chars_format::general);
    if (ec != std::errc{} || ptr != end) return false;

    out = value;
    return true;
}

std::optional<double> readCell(const std::vector<std::string>& row,
                               size_t col,
                               ParseErrorPolicy policy,
                               const std::string& context) {
    double value = 0.0;
    if (col < row.size() && tryParseDouble(row[col], value)) {
        return value;
    }

    switch (policy) {
        case ParseErrorPolicy::ZERO:
            return 0.0;
        case ParseErrorPolicy::SKIP_ROW:
            return std::nullopt;
        case ParseErrorPolicy::FAIL:
            break;
    }
    if (col >= row.size()) {
        throw Flarejoin::DatasetException(context + ": column " + std::to_string(col) + " is missing");
    }
    throw Flarejoin::DatasetException(context + ": column " + std::to_string(col) +
                                      " is not numeric ('" + row[col] + "')");
}

const char* policyName(ParseErrorPolicy policy) {
    switch (policy) {
        case ParseErrorPolicy::ZERO: return "zero";
        case ParseErrorPolicy::SKIP_ROW: return "skip_row";
        case ParseErrorPolicy::FAIL: return "fail";
    }
    return "unknown";
}

ParseErrorPolicy policyFromString(const std::string& value) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "zero") return ParseErrorPolicy::ZERO;
    if (v == "skip_row" || v == "skip-row") return ParseErrorPolicy::SKIP_ROW;
    if (v == "fail") return ParseErrorPolicy::FAIL;
    throw Flarejoin::ConfigurationException("on_parse_error must be one of: zero, skip_row, fail (got '" + value + "')");
}

} // namespace NumericParse
