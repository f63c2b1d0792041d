#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <memory>
#include <chrono>
#include <thread>
#include "aggregation_result.hpp"
#include "output_writer.hpp"
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

struct CtxPackOptions {
    fs::path inputDir = ".";
    fs::path outputFile = "codebase_context.md";
    OutputFormat format = OutputFormat::Markdown;
    bool verbose = false;
    bool showTiming = false;
    unsigned int numThreads = std::thread::hardware_concurrency();
    std::string includePatterns;        // Comma-separated list of glob patterns to include
    std::string excludePatterns;        // Comma-separated list of glob patterns to exclude
    bool useDefaultIgnores = true;      // Skip dependency/build directories, media and lock files
    size_t maxReportedErrors = 10;      // Per-file errors listed in verbose mode before summarizing
};

class CtxPack {
public:
    explicit CtxPack(const CtxPackOptions& options);

    // Discover, process and write. Returns false (after printing the cause)
    // when the run cannot complete.
    bool run();

    // Get the summary of the processed repository
    std::string getSummary() const;

    // Get timing information
    std::string getTimingInfo() const;

    // Per-file failures, at most `maxEntries` listed individually
    std::string getErrorReport(size_t maxEntries) const;

    // Render the document again as a string for a clipboard or pipe
    std::string getOutput() const;

    const AggregationResult& getResult() const { return result_; }
    const fs::path& getOutputPath() const { return outputPath_; }

    // Patterns applied unless useDefaultIgnores is off
    static const std::vector<std::string>& defaultIgnorePatterns();

private:
    CtxPackOptions options_;
    std::unique_ptr<PatternMatcher> patternMatcher_;
    AggregationResult result_;

    fs::path rootPath_;
    fs::path outputPath_;
    size_t discoveredFiles_ = 0;

    // Timing info
    std::chrono::milliseconds duration_{0};
    std::chrono::milliseconds discoveryDuration_{0};
    std::chrono::milliseconds processingDuration_{0};
    std::chrono::milliseconds outputDuration_{0};

    // Helper methods
    void resolvePaths();
    void buildPatternMatcher();
    void writeOutput() const;
};
