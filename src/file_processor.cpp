#include "file_processor.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <iostream>
#include <system_error>
#include <cerrno>
#include <sys/mman.h>
#include <fcntl.h>
#include <unistd.h>
#include "content_sanitizer.hpp"
#include "language_classifier.hpp"
#include "text_utils.hpp"

// Add a buffer size for reading files
constexpr size_t FILE_BUFFER_SIZE = 128 * 1024; // 128 KB

FileOutcome FileOutcome::included(const fs::path& path, FileArtifact artifact) {
    FileOutcome outcome;
    outcome.kind = Kind::Included;
    outcome.path = path;
    outcome.artifact = std::move(artifact);
    return outcome;
}

FileOutcome FileOutcome::excluded(const fs::path& path, std::string reason) {
    FileOutcome outcome;
    outcome.kind = Kind::Excluded;
    outcome.path = path;
    outcome.message = std::move(reason);
    return outcome;
}

FileOutcome FileOutcome::failed(const fs::path& path, std::string error) {
    FileOutcome outcome;
    outcome.kind = Kind::Failed;
    outcome.path = path;
    outcome.message = std::move(error);
    return outcome;
}

FileProcessor::FileProcessor(const fs::path& root, unsigned int numThreads)
    : root_(root),
      numThreads_(numThreads == 0 ? 1 : numThreads) {
}

std::vector<FileOutcome> FileProcessor::processFiles(const std::vector<fs::path>& paths) {
    std::vector<FileOutcome> results(paths.size());
    if (paths.empty()) {
        return results;
    }

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        workQueue_ = std::queue<size_t>();
        for (size_t i = 0; i < paths.size(); ++i) {
            workQueue_.push(i);
        }
        workerError_ = nullptr;
    }

    // Use at most numThreads_ or paths.size() threads
    const unsigned int actualThreads = static_cast<unsigned int>(
        std::min<size_t>(numThreads_, paths.size()));

    std::vector<std::thread> workers;
    workers.reserve(actualThreads);

    for (unsigned int i = 0; i < actualThreads; ++i) {
        try {
            workers.emplace_back(&FileProcessor::workerThread, this, std::cref(paths), std::ref(results));
        } catch (const std::system_error& e) {
            // If we can't create more threads, just use what we have
            std::cerr << "Warning: Could not create worker thread: " << e.what() << std::endl;
            break;
        }
    }

    // No worker could be started: drain the queue on this thread
    if (workers.empty()) {
        std::cerr << "Warning: Falling back to single-threaded processing" << std::endl;
        workerThread(paths, results);
    }

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    if (workerError_) {
        std::rethrow_exception(workerError_);
    }

    return results;
}

void FileProcessor::workerThread(const std::vector<fs::path>& paths, std::vector<FileOutcome>& results) {
    while (true) {
        size_t index = 0;

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (workQueue_.empty() || workerError_) {
                return;
            }
            index = workQueue_.front();
            workQueue_.pop();
        }

        // Each index is handed out once, so slots are written without a lock
        try {
            results[index] = processFile(paths[index]);
        } catch (...) {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!workerError_) {
                workerError_ = std::current_exception();
            }
            return;
        }
    }
}

FileOutcome FileProcessor::processFile(const fs::path& filePath) const {
    std::error_code ec;
    const uintmax_t fileSize = fs::file_size(filePath, ec);
    if (ec) {
        return FileOutcome::failed(filePath, "Error reading file metadata: " + ec.message());
    }

    if (fileSize == 0) {
        return FileOutcome::excluded(filePath, "empty");
    }

    FileArtifact artifact;
    artifact.relativePath = relativePathOf(filePath);
    artifact.language = detectLanguage(filePath);
    artifact.originalSize = fileSize;

    std::string content;

    try {
        if (fileSize > LARGE_FILE_THRESHOLD) {
            const std::string raw = readLargeFile(filePath, fileSize);
            if (!text::isValidUtf8(raw)) {
                return FileOutcome::excluded(filePath, "binary");
            }
            content = truncateLargeContent(raw, fileSize);
            artifact.truncated = true;
        } else {
            const std::string raw = readFile(filePath, fileSize);
            if (text::containsNul(raw, BINARY_SNIFF_BYTES)) {
                return FileOutcome::excluded(filePath, "binary");
            }
            content = text::decodeUtf8Lossy(raw);
        }
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const std::exception& e) {
        return FileOutcome::failed(filePath, e.what());
    }

    if (text::isBlank(content)) {
        return FileOutcome::excluded(filePath, "blank");
    }

    artifact.content = sanitizeContent(content);
    artifact.lineCount = text::countLines(artifact.content);
    artifact.tokenEstimate = artifact.content.size() / CHARS_PER_TOKEN;

    return FileOutcome::included(filePath, std::move(artifact));
}

std::string FileProcessor::truncateLargeContent(std::string_view content, uintmax_t fileSize) {
    const auto lines = text::splitLines(content);

    if (lines.size() <= EXCERPT_LINE_LIMIT) {
        // Few but very long lines: nothing useful to excerpt
        std::ostringstream warning;
        warning << "<!-- WARNING: File too large (" << fileSize
                << " bytes). Truncated for context. -->\n";
        return warning.str();
    }

    const size_t omitted = lines.size() - EXCERPT_HEAD_LINES - EXCERPT_TAIL_LINES;

    std::ostringstream excerpt;
    for (size_t i = 0; i < EXCERPT_HEAD_LINES; ++i) {
        excerpt << lines[i] << '\n';
    }
    excerpt << "\n<!-- TRUNCATED: File too large (" << fileSize << " bytes). "
            << omitted << " lines omitted. Content is truncated. -->\n\n";
    for (size_t i = lines.size() - EXCERPT_TAIL_LINES; i < lines.size(); ++i) {
        excerpt << lines[i] << '\n';
    }

    return excerpt.str();
}

std::string FileProcessor::relativePathOf(const fs::path& filePath) const {
    // File names are arbitrary bytes on Linux; the documents are UTF-8
    const fs::path relative = filePath.lexically_relative(root_);
    if (relative.empty() || *relative.begin() == "..") {
        return text::decodeUtf8Lossy(filePath.generic_string());
    }
    return text::decodeUtf8Lossy(relative.generic_string());
}

std::string FileProcessor::readFile(const fs::path& filePath, uintmax_t fileSize) const {
    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filePath.string());
    }

    // Reserve the exact size we need to avoid reallocations
    std::string content;
    content.reserve(static_cast<size_t>(fileSize));

    // Use a buffer to read the file in chunks
    std::vector<char> buffer(FILE_BUFFER_SIZE);

    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        content.append(buffer.data(), static_cast<size_t>(file.gcount()));
    }

    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + filePath.string());
    }

    return content;
}

std::string FileProcessor::readLargeFile(const fs::path& filePath, uintmax_t fileSize) const {
    int fd = open(filePath.c_str(), O_RDONLY);
    if (fd == -1) {
        throw std::system_error(errno, std::generic_category(),
                                "Failed to open file for memory mapping: " + filePath.string());
    }

    void* mapped = mmap(nullptr, static_cast<size_t>(fileSize), PROT_READ, MAP_PRIVATE, fd, 0);
    const int mapErrno = errno;
    close(fd); // Close file descriptor immediately, mmap keeps the file open

    if (mapped == MAP_FAILED) {
        throw std::system_error(mapErrno, std::generic_category(),
                                "Memory mapping failed for file: " + filePath.string());
    }

    std::string content;
    try {
        content.assign(static_cast<const char*>(mapped), static_cast<size_t>(fileSize));
    } catch (...) {
        munmap(mapped, static_cast<size_t>(fileSize));
        throw;
    }

    munmap(mapped, static_cast<size_t>(fileSize));
    return content;
}
