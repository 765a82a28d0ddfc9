#pragma once

#include "PipelineConfig.h"
#include "RegressionEngine.h"
#include "Table.h"
#include "TableLoader.h"

#include <iostream>
#include <string>

struct PipelineSummary {
    Row leftHeader;
    Row rightHeader;
    LoadSummary leftLoad;
    LoadSummary rightLoad;
    size_t leftFiltered = 0;
    size_t rightFiltered = 0;
    size_t joined = 0;
    size_t dangling = 0;
    double meanMatchDistanceKm = 0.0;
    size_t samplesExtracted = 0;
    RegressionFit fit;
};

// load -> country filter -> geo join -> extract -> fit -> report, run once.
class FlarePipeline final {
public:
    explicit FlarePipeline(PipelineConfig config);

    /**
     * Runs the batch, writes the Markdown report when one is configured, then
     * prints the text report to `os`. Nothing is printed when a stage throws.
     * @return process exit code (0 on success).
     * @throws Flarejoin::FlarejoinException on any fatal input, config or regression error.
     */
    int run(std::ostream& os = std::cout);

    /**
     * Same computation as run() without printing or writing anything.
     */
    PipelineSummary analyze();

    const PipelineConfig& config() const noexcept { return config_; }

private:
    PipelineSummary execute(std::ostream* report);
    void writeMarkdownReport(const PipelineSummary& summary) const;
    void logVerbose(const std::string& message) const;

    PipelineConfig config_;
};
