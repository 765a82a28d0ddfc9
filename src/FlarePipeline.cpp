#include "FlarePipeline.h"

#include "CountryFilter.h"
#include "FlarejoinExceptions.h"
#include "GeoMatcher.h"
#include "MathUtils.h"
#include "ReportEngine.h"
#include "TerminalUI.h"

#include <iomanip>
#include <sstream>
#include <utility>

namespace {
std::string toFixed(double v, int prec = 4) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(prec) << v;
    return os.str();
}

void requireColumn(const Row& header, size_t col, const std::string& tableLabel, const std::string& role) {
    if (col >= header.size()) {
        throw Flarejoin::DatasetException(role + " column " + std::to_string(col) + " is outside the " +
                                          tableLabel + " header (" + std::to_string(header.size()) + " columns)");
    }
}

void warnSkippedRecords(const LoadSummary& load) {
    if (load.csv.malformedRecords > 0) {
        std::cerr << "[Flarejoin Warning] " << load.sourcePath << ": skipped " << load.csv.malformedRecords
                  << " record(s) with an unterminated quoted field\n";
    }
}
} // namespace

FlarePipeline::FlarePipeline(PipelineConfig config) : config_(std::move(config)) {
    config_.validate();
}

void FlarePipeline::logVerbose(const std::string& message) const {
    if (config_.verbose) {
        std::cout << "[Flarejoin] " << message << "\n";
    }
}

PipelineSummary FlarePipeline::analyze() {
    return execute(nullptr);
}

int FlarePipeline::run(std::ostream& os) {
    // Held back until every stage has succeeded, so a fatal error prints no partial report.
    std::ostringstream buffered;
    const PipelineSummary summary = execute(&buffered);
    if (!config_.reportFile.empty()) {
        writeMarkdownReport(summary);
        logVerbose("Markdown report written to " + config_.reportFile);
    }
    os << buffered.str();
    return 0;
}

PipelineSummary FlarePipeline::execute(std::ostream* report) {
    PipelineSummary summary;
    const DatasetSchema& leftSchema = config_.left;
    const DatasetSchema& rightSchema = config_.right;

    logVerbose("Loading " + leftSchema.label + " table from " + leftSchema.path);
    const Table leftTable = TableLoader::load(leftSchema.path, config_.delimiter, &summary.leftLoad);
    logVerbose("Loading " + rightSchema.label + " table from " + rightSchema.path);
    const Table rightTable = TableLoader::load(rightSchema.path, config_.delimiter, &summary.rightLoad);
    if (!summary.rightLoad.converter.empty()) {
        logVerbose("Using first sheet of " + rightSchema.path + " (converted with " + summary.rightLoad.converter + ")");
    }
    warnSkippedRecords(summary.leftLoad);
    warnSkippedRecords(summary.rightLoad);

    summary.leftHeader = leftTable.header();
    summary.rightHeader = rightTable.header();
    requireColumn(summary.leftHeader, leftSchema.countryCol, leftSchema.label, "country");
    requireColumn(summary.leftHeader, leftSchema.latCol, leftSchema.label, "latitude");
    requireColumn(summary.leftHeader, leftSchema.lonCol, leftSchema.label, "longitude");
    requireColumn(summary.rightHeader, rightSchema.countryCol, rightSchema.label, "country");
    requireColumn(summary.rightHeader, rightSchema.latCol, rightSchema.label, "latitude");
    requireColumn(summary.rightHeader, rightSchema.lonCol, rightSchema.label, "longitude");

    const std::string joinedLabel = "joined " + leftSchema.label + "+" + rightSchema.label;
    Row joinedHeader = summary.leftHeader;
    joinedHeader.insert(joinedHeader.end(), summary.rightHeader.begin(), summary.rightHeader.end());
    requireColumn(joinedHeader, config_.regression.targetCol, joinedLabel, "target");
    for (size_t col : config_.regression.predictorCols) {
        requireColumn(joinedHeader, col, joinedLabel, "predictor");
    }

    if (report) {
        TerminalUI::printHeaders(leftSchema.label, summary.leftHeader, *report);
        TerminalUI::printHeaders(rightSchema.label, summary.rightHeader, *report);
    }

    const Table leftFiltered = CountryFilter::filter(leftTable, leftSchema.countryCol, config_.country);
    const Table rightFiltered = CountryFilter::filter(rightTable, rightSchema.countryCol, config_.country);
    summary.leftFiltered = leftFiltered.dataRowCount();
    summary.rightFiltered = rightFiltered.dataRowCount();
    if (report) {
        TerminalUI::printFilteredCount(config_.country, leftSchema.label, summary.leftFiltered, *report);
        TerminalUI::printFilteredCount(config_.country, rightSchema.label, summary.rightFiltered, *report);
    }

    MatchOptions matchOptions;
    matchOptions.maxDistanceKm = config_.maxDistanceKm;
    matchOptions.onParseError = config_.onParseError;
    matchOptions.index = config_.matchIndex;
    logVerbose(std::string("Matching with ") + GeoMatcher::indexName(matchOptions.index) +
               ", on_parse_error=" + NumericParse::policyName(matchOptions.onParseError));
    const JoinResult join = GeoMatcher::match(leftFiltered, rightFiltered,
                                              leftSchema.latCol, leftSchema.lonCol,
                                              rightSchema.latCol, rightSchema.lonCol,
                                              matchOptions);
    summary.joined = join.matched.dataRowCount();
    summary.dangling = join.dangling.dataRowCount();
    summary.meanMatchDistanceKm = MathUtils::mean(join.matchDistancesKm);
    if (report) {
        TerminalUI::printJoinSummary(summary.joined, summary.dangling, config_.maxDistanceKm, *report);
    }
    logVerbose("Mean match distance: " + toFixed(summary.meanMatchDistanceKm) + " km");

    const auto samples = RegressionEngine::extract(join.matched,
                                                   config_.regression.targetCol,
                                                   config_.regression.predictorCols,
                                                   config_.onParseError);
    summary.samplesExtracted = samples.size();
    logVerbose("Extracted " + std::to_string(samples.size()) + " regression samples");

    summary.fit = RegressionEngine::fit(samples, config_.previewRows);
    if (report) {
        TerminalUI::printPreview(config_.regression.targetLabel, summary.fit, *report);
        TerminalUI::printModel(config_.regression.targetLabel, summary.fit, *report);
    }
    return summary;
}

void FlarePipeline::writeMarkdownReport(const PipelineSummary& summary) const {
    ReportEngine doc;
    doc.addTitle("Flare Join Regression Report: " + config_.country);

    doc.addSection("Inputs");
    doc.addKeyValues({
        {config_.left.label + " source", summary.leftLoad.sourcePath},
        {config_.right.label + " source", summary.rightLoad.sourcePath +
            (summary.rightLoad.converter.empty() ? "" : " (first sheet, via " + summary.rightLoad.converter + ")")},
        {"Join threshold", TerminalUI::formatDistance(config_.maxDistanceKm) + " (exclusive)"},
        {"Nearest-neighbour search", GeoMatcher::indexName(config_.matchIndex)},
        {"Malformed numeric cells", NumericParse::policyName(config_.onParseError)},
    });
    doc.addColumnIndex(config_.left.label + " columns", summary.leftHeader);
    doc.addColumnIndex(config_.right.label + " columns", summary.rightHeader);

    doc.addSection("Join");
    doc.addKeyValues({
        {"Filtered " + config_.country + " records in " + config_.left.label, std::to_string(summary.leftFiltered)},
        {"Filtered " + config_.country + " records in " + config_.right.label, std::to_string(summary.rightFiltered)},
        {"Joined records", std::to_string(summary.joined)},
        {"Dangling records", std::to_string(summary.dangling)},
        {"Mean match distance (km)", toFixed(summary.meanMatchDistanceKm)},
    });

    doc.addSection("Regression");
    std::vector<std::vector<std::string>> previewRows;
    previewRows.reserve(summary.fit.preview.size());
    for (size_t i = 0; i < summary.fit.preview.size(); ++i) {
        previewRows.push_back({std::to_string(i), toFixed(summary.fit.preview[i].first), toFixed(summary.fit.preview[i].second)});
    }
    doc.addTable("Sample normalized data", {"#", config_.regression.targetLabel, "Normalized predictor"}, previewRows);
    doc.addKeyValues({
        {"Samples", std::to_string(summary.fit.sampleCount)},
        {"Predictor range", "[" + toFixed(summary.fit.predictorMin) + ", " + toFixed(summary.fit.predictorMax) + "]"},
        {"Model", config_.regression.targetLabel + " = " + toFixed(summary.fit.result.alpha) + " + " +
                      toFixed(summary.fit.result.beta) + " * predictor_normalized"},
        {"R-squared", toFixed(summary.fit.result.rSquared)},
    });

    doc.save(config_.reportFile);
}
