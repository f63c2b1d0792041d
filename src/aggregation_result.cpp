#include "aggregation_result.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

AggregationResult aggregateOutcomes(std::vector<FileOutcome> outcomes,
                                    std::string rootName,
                                    std::string tree,
                                    std::string generatedAt) {
    AggregationResult result;
    result.rootName = std::move(rootName);
    result.tree = std::move(tree);
    result.generatedAt = std::move(generatedAt);
    result.files.reserve(outcomes.size());

    for (auto& outcome : outcomes) {
        switch (outcome.kind) {
            case FileOutcome::Kind::Included:
                result.totalLines += outcome.artifact->lineCount;
                result.totalTokens += outcome.artifact->tokenEstimate;
                result.files.push_back(std::move(*outcome.artifact));
                break;
            case FileOutcome::Kind::Excluded:
                ++result.excludedCount;
                break;
            case FileOutcome::Kind::Failed:
                result.errors.push_back({outcome.path, outcome.message});
                break;
        }
    }

    result.totalFiles = result.files.size();
    return result;
}

std::string formatErrorReport(const std::vector<FileError>& errors, size_t maxEntries) {
    if (errors.empty()) {
        return "";
    }

    std::stringstream ss;
    ss << "Failed to process " << errors.size() << " file(s):" << std::endl;

    const size_t shown = std::min(maxEntries, errors.size());
    for (size_t i = 0; i < shown; ++i) {
        ss << "  " << errors[i].path.string() << ": " << errors[i].message << std::endl;
    }
    if (errors.size() > shown) {
        ss << "  ... and " << (errors.size() - shown) << " more" << std::endl;
    }

    return ss.str();
}

std::string currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t timeNow = std::chrono::system_clock::to_time_t(now);

    std::tm localTime{};
    localtime_r(&timeNow, &localTime);

    std::ostringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
