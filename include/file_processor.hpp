#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <optional>
#include <mutex>
#include <thread>
#include <queue>
#include <cstdint>
#include <exception>

namespace fs = std::filesystem;

// One packed file, built once by FileProcessor and never modified
struct FileArtifact {
    std::string relativePath;       // Relative to the scan root, '/' separated
    std::string language;
    size_t lineCount = 0;           // Counted on the final content
    std::string content;            // After truncation and redaction
    size_t tokenEstimate = 0;       // content.size() / CHARS_PER_TOKEN
    bool truncated = false;
    uintmax_t originalSize = 0;     // Size on disk
};

// Result of running one path through the pipeline
struct FileOutcome {
    enum class Kind {
        Included,       // artifact is set
        Excluded,       // empty, binary or blank; not an error
        Failed          // I/O or metadata error; message is set
    };

    Kind kind = Kind::Failed;
    fs::path path;
    std::optional<FileArtifact> artifact;
    std::string message;    // Exclusion reason or error description

    static FileOutcome included(const fs::path& path, FileArtifact artifact);
    static FileOutcome excluded(const fs::path& path, std::string reason);
    static FileOutcome failed(const fs::path& path, std::string error);

    bool isIncluded() const { return kind == Kind::Included; }
    bool isExcluded() const { return kind == Kind::Excluded; }
    bool isFailed() const { return kind == Kind::Failed; }
};

class FileProcessor {
public:
    // Files larger than this are read as text and cut down to an excerpt
    static constexpr uintmax_t LARGE_FILE_THRESHOLD = 1000000;

    // Large files with more lines than this keep a head and a tail
    static constexpr size_t EXCERPT_LINE_LIMIT = 100;
    static constexpr size_t EXCERPT_HEAD_LINES = 50;
    static constexpr size_t EXCERPT_TAIL_LINES = 50;

    // Number of leading bytes inspected for NUL when sniffing binaries
    static constexpr size_t BINARY_SNIFF_BYTES = 8192;

    static constexpr size_t CHARS_PER_TOKEN = 4;

    explicit FileProcessor(const fs::path& root,
                           unsigned int numThreads = std::thread::hardware_concurrency());

    FileProcessor(const FileProcessor&) = delete;
    FileProcessor& operator=(const FileProcessor&) = delete;

    // Run the pipeline for a single file. Never throws for I/O problems:
    // those come back as Kind::Failed.
    FileOutcome processFile(const fs::path& filePath) const;

    // Process every path on the worker pool. The returned outcomes line up
    // index for index with `paths`, whatever order the workers finished in.
    std::vector<FileOutcome> processFiles(const std::vector<fs::path>& paths);

    // Head/tail excerpt or warning marker for text over the size threshold
    static std::string truncateLargeContent(std::string_view content, uintmax_t fileSize);

    unsigned int threadCount() const { return numThreads_; }

private:
    fs::path root_;
    unsigned int numThreads_;

    // Work distribution for processFiles
    std::queue<size_t> workQueue_;
    std::mutex queueMutex_;
    std::exception_ptr workerError_;    // First unexpected failure, rethrown after join

    void workerThread(const std::vector<fs::path>& paths, std::vector<FileOutcome>& results);

    std::string relativePathOf(const fs::path& filePath) const;

    // Optimized file reading methods
    std::string readFile(const fs::path& filePath, uintmax_t fileSize) const;
    std::string readLargeFile(const fs::path& filePath, uintmax_t fileSize) const;
};
