#include "PipelineConfig.h"
#include "CommonUtils.h"
#include "FlarejoinExceptions.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Flarejoin::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Flarejoin::FlarejoinException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Flarejoin::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
            continue;
        }
        if (c == '\\') {
            out.push_back(c);
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) {
            continue;
        }
        out.push_back(c);
    }

    // JSON-ish files end entries with a comma; list values are quoted.
    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
            continue;
        }
        if (c == '\\') {
            escaped = true;
            continue;
        }
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

size_t parseIndexStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::trim(value);
    if (v.empty() || v.front() == '-' || v.front() == '+') {
        throw Flarejoin::ConfigurationException("Invalid column index for " + key + ": " + value);
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        v,
        key,
        "Invalid column index for ",
        [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<size_t>::max())) {
        throw Flarejoin::ConfigurationException("Value for " + key + " exceeds size_t range");
    }
    return static_cast<size_t>(parsed);
}

std::vector<size_t> parseIndexList(const std::string& value, const std::string& key) {
    std::vector<size_t> out;
    for (const auto& token : CommonUtils::splitList(value)) {
        out.push_back(parseIndexStrict(token, key));
    }
    if (out.empty()) {
        throw Flarejoin::ConfigurationException(key + " needs at least one column index");
    }
    return out;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(
        CommonUtils::trim(value),
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Flarejoin::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

char parseDelimiter(const std::string& value, const std::string& key) {
    if (value == "\\t" || CommonUtils::toLower(value) == "tab") return '\t';
    if (value.size() != 1) throw Flarejoin::ConfigurationException(key + " expects a single character");
    return value[0];
}

// Applies one setting. Keys use the config-file spelling (snake_case).
// Returns false for an unknown key.
bool assignKeyValue(PipelineConfig& config, const std::string& key, const std::string& value) {
    if (key == "left_path") config.left.path = value;
    else if (key == "right_path") config.right.path = value;
    else if (key == "left_label") config.left.label = value;
    else if (key == "right_label") config.right.label = value;
    else if (key == "left_country_col") config.left.countryCol = parseIndexStrict(value, key);
    else if (key == "left_lat_col") config.left.latCol = parseIndexStrict(value, key);
    else if (key == "left_lon_col") config.left.lonCol = parseIndexStrict(value, key);
    else if (key == "right_country_col") config.right.countryCol = parseIndexStrict(value, key);
    else if (key == "right_lat_col") config.right.latCol = parseIndexStrict(value, key);
    else if (key == "right_lon_col") config.right.lonCol = parseIndexStrict(value, key);
    else if (key == "target_col") config.regression.targetCol = parseIndexStrict(value, key);
    else if (key == "predictor_cols") config.regression.predictorCols = parseIndexList(value, key);
    else if (key == "target_label") config.regression.targetLabel = value;
    else if (key == "country") config.country = value;
    else if (key == "max_distance_km") config.maxDistanceKm = parseDoubleStrict(value, key);
    else if (key == "on_parse_error") config.onParseError = NumericParse::policyFromString(value);
    else if (key == "match_index") config.matchIndex = GeoMatcher::indexFromString(value);
    else if (key == "preview_rows") config.previewRows = parseIndexStrict(value, key);
    else if (key == "delimiter") config.delimiter = parseDelimiter(value, key);
    else if (key == "report_file" || key == "report") config.reportFile = value;
    else if (key == "verbose") config.verbose = parseBoolStrict(value, key);
    else return false;
    return true;
}
} // namespace

std::string PipelineConfig::usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [survey.csv] [volumes.xlsx] [options]\n"
       << "Joins flare survey sites to flare volume estimates within a distance threshold\n"
       << "and regresses the target column on the first normalized predictor.\n\n"
       << "Options:\n"
       << "  --config <file>               key: value config file (flags override it)\n"
       << "  --country <name>              Country to keep in both inputs (default: Algeria)\n"
       << "  --left-country-col <N>        Survey country column (default: 0)\n"
       << "  --left-lat-col <N>            Survey latitude column (default: 4)\n"
       << "  --left-lon-col <N>            Survey longitude column (default: 5)\n"
       << "  --right-country-col <N>       Volume country column (default: 0)\n"
       << "  --right-lat-col <N>           Volume latitude column (default: 1)\n"
       << "  --right-lon-col <N>           Volume longitude column (default: 2)\n"
       << "  --target-col <N>              Target column in the joined row (default: 10)\n"
       << "  --predictor-cols <N,N,...>    Predictor columns in the joined row (default: 6,7,8)\n"
       << "  --target-label <text>         Target name used in the report\n"
       << "  --max-distance-km <km>        Join threshold, exclusive (default: 3.0)\n"
       << "  --on-parse-error <zero|skip_row|fail>  Malformed numeric cells (default: zero)\n"
       << "  --match-index <brute_force|latitude_bands>  Nearest-neighbour search (default: brute_force)\n"
       << "  --preview-rows <N>            Normalized samples to print (default: 10)\n"
       << "  --delimiter <char>            CSV delimiter (default: ,)\n"
       << "  --report <file.md>            Also write a Markdown report\n"
       << "  --verbose <true|false>        Progress logging (default: false)\n"
       << "  --help                        Show this help message\n";
    return os.str();
}

PipelineConfig PipelineConfig::fromArgs(int argc, char* argv[]) {
    PipelineConfig config;

    std::string configPath;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) throw Flarejoin::ConfigurationException("--config expects a file path");
            configPath = argv[++i];
        }
    }
    if (!configPath.empty()) {
        config = fromFile(configPath, config);
    }

    size_t positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            if (i + 1 >= argc) {
                throw Flarejoin::ConfigurationException(arg + " expects a value");
            }
            const std::string key = normalizeConfigKey(arg.substr(2));
            const std::string value = argv[++i];
            if (!assignKeyValue(config, key, value)) {
                throw Flarejoin::ConfigurationException("Unknown option: " + arg + "\n" + usage(argv[0]));
            }
            continue;
        }
        if (positional == 0) {
            config.left.path = arg;
        } else if (positional == 1) {
            config.right.path = arg;
        } else {
            throw Flarejoin::ConfigurationException("Unexpected argument: " + arg);
        }
        ++positional;
    }

    config.validate();
    return config;
}

PipelineConfig PipelineConfig::fromFile(const std::string& configPath, const PipelineConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Flarejoin::ConfigurationException("Could not open config file: " + configPath);

    PipelineConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        bool known = false;
        try {
            known = assignKeyValue(config, key, value);
        } catch (const Flarejoin::FlarejoinException& ex) {
            throw Flarejoin::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
        if (!known) {
            throw Flarejoin::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": unknown key '" + key + "'");
        }
    }
    config.validate();

    return config;
}

void PipelineConfig::validate() const {
    if (left.path.empty() || right.path.empty()) {
        throw Flarejoin::ConfigurationException("both input paths are required");
    }
    if (left.label.empty() || right.label.empty() || regression.targetLabel.empty()) {
        throw Flarejoin::ConfigurationException("left_label, right_label and target_label must not be empty");
    }
    if (CommonUtils::trim(country).empty()) {
        throw Flarejoin::ConfigurationException("country must not be empty");
    }
    if (!std::isfinite(maxDistanceKm) || maxDistanceKm <= 0.0) {
        throw Flarejoin::ConfigurationException("max_distance_km must be a finite value > 0");
    }
    if (regression.predictorCols.empty()) {
        throw Flarejoin::ConfigurationException("predictor_cols needs at least one column index");
    }
    if (left.latCol == left.lonCol || right.latCol == right.lonCol) {
        throw Flarejoin::ConfigurationException("latitude and longitude must be different columns");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw Flarejoin::ConfigurationException("delimiter cannot be a quote or line break");
    }
}
