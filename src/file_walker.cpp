#include "file_walker.hpp"
#include <algorithm>
#include <iostream>

namespace {

const char* const kIgnoreFileNames[] = {".gitignore", ".ignore"};

const PatternMatcher& sensitiveMatcher() {
    static const PatternMatcher matcher({
        // Environment files
        ".env",
        ".env.*",
        // Private keys, certificates and key containers
        "*.pem",
        "*.key",
        "*.p12",
        "*.pfx",
        "*.jks",
        "*.keystore",
        // SSH private keys
        "id_rsa",
        "id_dsa",
        "id_ecdsa",
        "id_ed25519"
    });
    return matcher;
}

} // namespace

FileWalker::FileWalker(const fs::path& root,
                       const PatternMatcher& userMatcher,
                       const fs::path& destination,
                       bool verbose)
    : userMatcher_(userMatcher),
      verbose_(verbose) {
    std::error_code ec;
    root_ = fs::weakly_canonical(root, ec);
    if (ec) {
        root_ = fs::absolute(root).lexically_normal();
    }

    if (!destination.empty()) {
        destination_ = fs::weakly_canonical(destination, ec);
        if (ec) {
            destination_ = fs::absolute(destination).lexically_normal();
        }
    }
}

bool FileWalker::isVcsMetadata(const std::string& name) {
    return name == ".git" || name == ".svn" || name == ".hg";
}

bool FileWalker::isSensitive(const fs::path& relPath) {
    return sensitiveMatcher().isEntryIgnored(relPath, false);
}

std::vector<fs::path> FileWalker::collect() {
    stats_ = WalkStats();
    ignoreFileRules_ = PatternMatcher();

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw std::runtime_error("Invalid directory: " + root_.string());
    }

    std::vector<fs::path> files;
    files.reserve(1000);
    walkDirectory(root_, files);

    // fs::path ordering compares component by component
    std::sort(files.begin(), files.end());

    if (verbose_) {
        std::cout << "Discovered " << files.size() << " files in "
                  << stats_.directoriesVisited << " directories" << std::endl;
    }

    return files;
}

void FileWalker::walkDirectory(const fs::path& dir, std::vector<fs::path>& files) {
    ++stats_.directoriesVisited;
    loadIgnoreFiles(dir);

    std::vector<fs::path> subdirectories;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& path = it->path();

        std::error_code statEc;
        const fs::file_status status = it->symlink_status(statEc);
        if (statEc) {
            reportError(path, statEc);
            continue;
        }

        // Never follow links: avoids cycles and double visits
        if (fs::is_symlink(status)) {
            continue;
        }

        // A .git file is a submodule or worktree link and is skipped as well
        if (isVcsMetadata(path.filename().string())) {
            continue;
        }

        const fs::path relPath = path.lexically_relative(root_);

        if (fs::is_directory(status)) {
            if (isExcluded(relPath, true)) {
                continue;
            }
            subdirectories.push_back(path);
        } else if (fs::is_regular_file(status)) {
            if (!destination_.empty() && path == destination_) {
                continue;
            }
            if (isExcluded(relPath, false) || !userMatcher_.isIncluded(relPath)) {
                continue;
            }
            files.push_back(path);
        }
    }

    if (ec) {
        reportError(dir, ec);
    }

    // Recurse after the iterator is closed to keep one open handle per level
    for (const auto& subdirectory : subdirectories) {
        walkDirectory(subdirectory, files);
    }
}

void FileWalker::loadIgnoreFiles(const fs::path& dir) {
    const fs::path base = dir.lexically_relative(root_);

    for (const char* name : kIgnoreFileNames) {
        const fs::path ignorePath = dir / name;

        std::error_code ec;
        if (!fs::is_regular_file(ignorePath, ec)) {
            continue;
        }

        try {
            const size_t added = ignoreFileRules_.loadGitignore(ignorePath, base);
            ++stats_.ignoreFilesLoaded;
            if (verbose_) {
                std::cout << "Loaded " << added << " rules from " << ignorePath << std::endl;
            }
        } catch (const std::exception& e) {
            ++stats_.entryErrors;
            if (verbose_) {
                std::cerr << "Warning: " << e.what() << std::endl;
            }
        }
    }
}

bool FileWalker::isExcluded(const fs::path& relPath, bool isDirectory) const {
    // Checked first and separately so that no '!' rule can re-include them.
    // Only files: a directory called .env or certs.key is an ordinary folder.
    if (!isDirectory && isSensitive(relPath)) {
        return true;
    }

    return ignoreFileRules_.isEntryIgnored(relPath, isDirectory) ||
           userMatcher_.isEntryIgnored(relPath, isDirectory);
}

void FileWalker::reportError(const fs::path& path, const std::error_code& ec) {
    ++stats_.entryErrors;
    if (verbose_) {
        std::cerr << "Error accessing " << path << ": " << ec.message() << std::endl;
    }
}
