#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "pattern_matcher.hpp"

namespace fs = std::filesystem;

/**
 * @brief Collects the files eligible for packing under a root directory
 *
 * Layers, any of which excludes a path:
 *  - version control metadata (.git, .svn, .hg), directories and files, always
 *  - sensitive files (env files, private keys, keystores), always; a negated
 *    rule elsewhere cannot bring them back. Directories are not matched.
 *  - .gitignore / .ignore files found in each visited directory
 *  - the caller's matcher (default ignores, user excludes and includes)
 *  - the destination file itself
 *
 * Symbolic links are neither followed nor yielded. Entries that cannot be
 * read are skipped and, in verbose mode, reported on stderr.
 */
class FileWalker {
public:
    struct WalkStats {
        size_t directoriesVisited = 0;
        size_t ignoreFilesLoaded = 0;
        size_t entryErrors = 0;
    };

    FileWalker(const fs::path& root,
               const PatternMatcher& userMatcher,
               const fs::path& destination = {},
               bool verbose = false);

    // Walk the tree; the result is sorted component-wise
    std::vector<fs::path> collect();

    const WalkStats& stats() const { return stats_; }

    // Version control metadata names (.git, .svn, .hg), excluded whether
    // they are directories or link files
    static bool isVcsMetadata(const std::string& name);

    // True if the relative file path matches a hard-coded sensitive pattern
    static bool isSensitive(const fs::path& relPath);

private:
    fs::path root_;
    const PatternMatcher& userMatcher_;
    fs::path destination_;
    bool verbose_;

    PatternMatcher ignoreFileRules_;
    WalkStats stats_;

    void walkDirectory(const fs::path& dir, std::vector<fs::path>& files);
    void loadIgnoreFiles(const fs::path& dir);
    bool isExcluded(const fs::path& relPath, bool isDirectory) const;
    void reportError(const fs::path& path, const std::error_code& ec);
};
