#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

// Thrown when a glob or ignore-file line cannot be compiled
class PatternError : public std::runtime_error {
public:
    explicit PatternError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Glob matcher with .gitignore semantics
 *
 * Paths are given relative to the scan root. Rules are evaluated in the order
 * they were added and the last matching rule decides; a leading '!' re-includes.
 * A rule loaded from a nested ignore file only applies below its base directory.
 */
class PatternMatcher {
public:
    PatternMatcher() = default;

    // Construct with a list of ignore patterns rooted at the scan root
    explicit PatternMatcher(const std::vector<std::string>& ignorePatterns);

    // Add an ignore pattern; `base` is the directory (relative to root) it is scoped to
    void addIgnorePattern(const std::string& pattern, const fs::path& base = {});

    // Add include patterns (when any exist, files must match one of them)
    void addIncludePattern(const std::string& pattern);

    // Set include patterns from a comma-separated string (e.g., "*.cpp,*.hpp")
    void setIncludePatterns(const std::string& patternsStr);

    // Add exclude patterns from a comma-separated string (e.g., "*.txt,docs/")
    void setExcludePatterns(const std::string& patternsStr);

    // Load every rule from an ignore file. Returns the number of rules added.
    size_t loadGitignore(const fs::path& gitignorePath, const fs::path& base = {});

    // Check a path and all of its parent directories against the ignore rules
    bool isIgnored(const fs::path& relPath, bool isDirectory = false) const;

    // Check only the entry itself; callers that walk top-down have already
    // rejected ignored parents
    bool isEntryIgnored(const fs::path& relPath, bool isDirectory) const;

    // Check if a file matches any include pattern (true when none are set)
    bool isIncluded(const fs::path& relPath) const;

    // Not ignored and included
    bool shouldProcess(const fs::path& relPath) const;

    bool hasIncludePatterns() const { return !includeRules_.empty(); }
    size_t ignoreRuleCount() const { return ignoreRules_.size(); }

    // Split a comma-separated pattern list, trimming whitespace and dropping empties
    static std::vector<std::string> splitPatternString(const std::string& patternsStr);

private:
    struct Rule {
        std::string pattern;
        std::string base;       // generic form, empty for the root
        std::regex regex;
        bool negated = false;
        bool directoryOnly = false;
    };

    enum class MatchState { None, Ignored, Whitelisted };

    std::vector<Rule> ignoreRules_;
    std::vector<Rule> includeRules_;

    MatchState matchState(const std::string& relPath, bool isDirectory) const;

    // Parse one ignore-file style line. Returns false for blanks and comments.
    static bool parseRule(const std::string& line, const fs::path& base, Rule& rule);

    static std::regex patternToRegex(const std::string& pattern, bool anchored);
};
