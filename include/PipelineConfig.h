#pragma once
#include "GeoMatcher.h"
#include "NumericParse.h"
#include "RegressionEngine.h"

#include <cstddef>
#include <string>
#include <vector>

// Where one input file keeps the columns the join needs. Indices are 0-based.
struct DatasetSchema {
    std::string path;
    std::string label;
    size_t countryCol = 0;
    size_t latCol = 0;
    size_t lonCol = 0;
};

// Column positions in the joined row (left cells first, then right cells).
struct RegressionSchema {
    size_t targetCol = 10;
    std::vector<size_t> predictorCols{6, 7, 8};
    std::string targetLabel = "Flaring Volume";
};

struct PipelineConfig {
    // Global flare survey list (2015).
    DatasetSchema left{"eog_global_flare_survey_2015_flare_list.csv", "CSV", 0, 4, 5};
    // Individual flare volume estimates workbook (2012-2023).
    DatasetSchema right{"2012-2023-individual-flare-volume-estimates.xlsx", "Excel", 0, 1, 2};
    RegressionSchema regression;

    std::string country = "Algeria";
    double maxDistanceKm = kDefaultMaxDistanceKm;
    ParseErrorPolicy onParseError = ParseErrorPolicy::ZERO;
    MatchIndex matchIndex = MatchIndex::BRUTE_FORCE;
    size_t previewRows = RegressionEngine::kDefaultPreviewRows;
    char delimiter = ',';
    std::string reportFile;
    bool verbose = false;
    bool showHelp = false;

    /**
     * @brief Builds config from CLI args, layered over an optional --config file.
     * @details Precedence: built-in defaults, then the config file, then flags and
     *          positional paths (`flarejoin [left.csv] [right.xlsx] [options]`).
     * @post Returns a validated config object (unless showHelp is set).
     * @throws Flarejoin::ConfigurationException on invalid arguments or values.
     */
    static PipelineConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads config values from a lightweight YAML/JSON-like key:value file.
     * @pre configPath points to a readable text file.
     * @post Returns merged config using `base` as defaults.
     * @throws Flarejoin::ConfigurationException on parse/validation failures.
     */
    static PipelineConfig fromFile(const std::string& configPath, const PipelineConfig& base);

    static std::string usage(const std::string& program);

    /**
     * @brief Validates merged configuration invariants.
     * @throws Flarejoin::ConfigurationException on invalid values.
     */
    void validate() const;
};
