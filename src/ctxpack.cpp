#include "ctxpack.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include "content_sanitizer.hpp"
#include "file_processor.hpp"
#include "file_walker.hpp"
#include "text_utils.hpp"
#include "tree_renderer.hpp"

namespace {

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

CtxPack::CtxPack(const CtxPackOptions& options)
    : options_(options) {
}

const std::vector<std::string>& CtxPack::defaultIgnorePatterns() {
    static const std::vector<std::string> patterns = {
        // Dependencies and build output
        "node_modules/",
        "venv/",
        ".venv/",
        "__pycache__/",
        ".pytest_cache/",
        ".mypy_cache/",
        "dist/",
        "build/",
        "target/",
        "vendor/",

        // Media and binary
        "*.png", "*.jpg", "*.jpeg", "*.gif", "*.ico", "*.svg", "*.pdf",
        "*.zip", "*.tar", "*.gz", "*.7z", "*.rar",
        "*.exe", "*.dll", "*.so", "*.dylib", "*.o", "*.obj", "*.a", "*.lib",
        "*.class", "*.jar", "*.pyc",
        "*.db", "*.sqlite", "*.sqlite3",

        // Lock files
        "package-lock.json",
        "yarn.lock",
        "pnpm-lock.yaml",
        "Gemfile.lock",

        // Editor droppings
        ".DS_Store"
    };
    return patterns;
}

bool CtxPack::run() {
    try {
        // Start overall timer
        const auto startTime = std::chrono::steady_clock::now();

        resolvePaths();
        buildPatternMatcher();

        std::cout << "🚀 Starting scan of: " << rootPath_.string() << std::endl;

        // Discovery
        const auto discoveryStart = std::chrono::steady_clock::now();
        FileWalker walker(rootPath_, *patternMatcher_, outputPath_, options_.verbose);
        const std::vector<fs::path> paths = walker.collect();
        discoveredFiles_ = paths.size();
        discoveryDuration_ = elapsedSince(discoveryStart);

        std::cout << "📂 Found " << paths.size() << " files." << std::endl;

        // Processing
        const auto processStart = std::chrono::steady_clock::now();
        const std::string tree = renderTree(paths, rootPath_);

        FileProcessor processor(rootPath_, options_.numThreads);
        if (options_.verbose) {
            std::cout << "Processing with " << processor.threadCount() << " threads" << std::endl;
            std::cout << "Redacting secrets with " << SanitizationRuleSet::getInstance().size()
                      << " rules" << std::endl;
        }

        std::string rootName = text::decodeUtf8Lossy(rootPath_.filename().string());
        if (rootName.empty()) {
            rootName = text::decodeUtf8Lossy(rootPath_.string());
        }

        result_ = aggregateOutcomes(processor.processFiles(paths), rootName, tree, currentTimestamp());
        processingDuration_ = elapsedSince(processStart);

        // Output
        const auto outputStart = std::chrono::steady_clock::now();
        writeOutput();
        outputDuration_ = elapsedSince(outputStart);

        if (options_.verbose && !result_.errors.empty()) {
            std::cerr << getErrorReport(options_.maxReportedErrors);
        }

        duration_ = elapsedSince(startTime);
        return true;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

void CtxPack::resolvePaths() {
    std::error_code ec;
    rootPath_ = fs::canonical(options_.inputDir, ec);
    if (ec) {
        throw std::runtime_error("Failed to resolve path " + options_.inputDir.string() + ": " + ec.message());
    }
    if (!fs::is_directory(rootPath_, ec)) {
        throw std::runtime_error("Not a directory: " + rootPath_.string());
    }

    outputPath_ = fs::weakly_canonical(fs::absolute(options_.outputFile), ec);
    if (ec) {
        throw std::runtime_error("Failed to resolve output path " + options_.outputFile.string() + ": " + ec.message());
    }
}

void CtxPack::buildPatternMatcher() {
    patternMatcher_ = std::make_unique<PatternMatcher>();

    if (options_.useDefaultIgnores) {
        for (const auto& pattern : defaultIgnorePatterns()) {
            patternMatcher_->addIgnorePattern(pattern);
        }
    }

    // Apply exclude patterns if specified
    if (!options_.excludePatterns.empty()) {
        patternMatcher_->setExcludePatterns(options_.excludePatterns);

        if (options_.verbose) {
            std::cout << "Using exclude patterns: " << options_.excludePatterns << std::endl;
        }
    }

    // Apply include patterns if specified
    if (!options_.includePatterns.empty()) {
        patternMatcher_->setIncludePatterns(options_.includePatterns);

        if (options_.verbose) {
            std::cout << "Using include patterns: " << options_.includePatterns << std::endl;
        }
    }
}

void CtxPack::writeOutput() const {
    // The destination is only created once there is a complete result to write
    std::ofstream outFile(outputPath_, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        throw std::runtime_error("Could not open output file: " + outputPath_.string());
    }

    makeOutputWriter(options_.format)->write(result_, outFile);
    outFile.flush();

    if (!outFile) {
        outFile.close();
        std::error_code ec;
        fs::remove(outputPath_, ec);
        throw std::runtime_error("Failed while writing output file: " + outputPath_.string());
    }

    if (options_.verbose) {
        std::cout << "Output written to " << outputPath_.string() << std::endl;
    }
}

std::string CtxPack::getSummary() const {
    std::stringstream ss;
    ss << "Packing summary:" << std::endl;
    ss << "  Total files: " << result_.totalFiles << std::endl;
    ss << "  Total lines: " << result_.totalLines << std::endl;
    ss << "  Total tokens: ~" << result_.totalTokens << std::endl;
    ss << "  Excluded files: " << result_.excludedCount << std::endl;
    ss << "  Failed files: " << result_.errors.size() << std::endl;
    ss << "  Elapsed: " << duration_.count() << " ms" << std::endl;
    return ss.str();
}

std::string CtxPack::getTimingInfo() const {
    const auto total = duration_.count() ? duration_.count() : 1;

    std::stringstream ss;
    ss << "Timing Information:" << std::endl;
    ss << "- Total time: " << duration_.count() << "ms" << std::endl;
    ss << "- Discovery time: " << discoveryDuration_.count() << "ms ("
       << (discoveryDuration_.count() * 100 / total) << "%)" << std::endl;
    ss << "- File processing time: " << processingDuration_.count() << "ms ("
       << (processingDuration_.count() * 100 / total) << "%)" << std::endl;
    ss << "- Output generation time: " << outputDuration_.count() << "ms ("
       << (outputDuration_.count() * 100 / total) << "%)" << std::endl;

    if (processingDuration_.count() > 0) {
        const double seconds = processingDuration_.count() / 1000.0;
        ss << "- Performance:" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2)
           << static_cast<double>(discoveredFiles_) / seconds << " files/second" << std::endl;
        ss << "  * " << std::fixed << std::setprecision(2)
           << static_cast<double>(result_.totalLines) / seconds << " lines/second" << std::endl;
    }

    return ss.str();
}

std::string CtxPack::getErrorReport(size_t maxEntries) const {
    return formatErrorReport(result_.errors, maxEntries);
}

std::string CtxPack::getOutput() const {
    return renderDocument(result_, options_.format);
}
