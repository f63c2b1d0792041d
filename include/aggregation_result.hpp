#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "file_processor.hpp"

namespace fs = std::filesystem;

struct FileError {
    fs::path path;
    std::string message;
};

// Everything the output writers need, in final order
struct AggregationResult {
    std::string rootName;
    std::string generatedAt;        // "YYYY-MM-DD HH:MM:SS", local time
    std::string tree;
    std::vector<FileArtifact> files;

    // Sums over `files` only
    size_t totalFiles = 0;
    size_t totalLines = 0;
    size_t totalTokens = 0;

    // Console reporting only, not serialized
    size_t excludedCount = 0;
    std::vector<FileError> errors;
};

// Fold per-file outcomes (already in path order) into a result. Included
// artifacts keep their order; exclusions are counted, failures collected.
AggregationResult aggregateOutcomes(std::vector<FileOutcome> outcomes,
                                    std::string rootName,
                                    std::string tree,
                                    std::string generatedAt);

// Console listing of per-file failures: at most `maxEntries` lines, then a
// "... and N more" line. Empty when there are no errors.
std::string formatErrorReport(const std::vector<FileError>& errors, size_t maxEntries);

// Current local time formatted for the document headers
std::string currentTimestamp();
