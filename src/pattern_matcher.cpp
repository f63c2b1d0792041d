#include "pattern_matcher.hpp"
#include <fstream>
#include <algorithm>
#include <sstream>
#include <cstring>
#include <cctype>

namespace {

std::string trim(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch) { return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch) { return !std::isspace(ch); }).base(), value.end());
    return value;
}

// gitignore keeps leading spaces and drops trailing ones unless escaped
std::string trimTrailing(std::string value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        if (value.back() == ' ' && value.size() >= 2 && value[value.size() - 2] == '\\') {
            break;
        }
        value.pop_back();
    }
    return value;
}

std::string normalizeBase(const fs::path& base) {
    std::string result = base.generic_string();
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    if (result == ".") {
        result.clear();
    }
    return result;
}

std::string normalizeRelative(const fs::path& relPath) {
    std::string result = relPath.generic_string();
    while (result.size() >= 2 && result.compare(0, 2, "./") == 0) {
        result.erase(0, 2);
    }
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

} // namespace

PatternMatcher::PatternMatcher(const std::vector<std::string>& ignorePatterns) {
    for (const auto& pattern : ignorePatterns) {
        addIgnorePattern(pattern);
    }
}

void PatternMatcher::addIgnorePattern(const std::string& pattern, const fs::path& base) {
    Rule rule;
    if (parseRule(pattern, base, rule)) {
        ignoreRules_.push_back(std::move(rule));
    }
}

void PatternMatcher::addIncludePattern(const std::string& pattern) {
    Rule rule;
    if (parseRule(pattern, {}, rule)) {
        includeRules_.push_back(std::move(rule));
    }
}

void PatternMatcher::setIncludePatterns(const std::string& patternsStr) {
    includeRules_.clear();

    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIncludePattern(pattern);
    }
}

void PatternMatcher::setExcludePatterns(const std::string& patternsStr) {
    for (const auto& pattern : splitPatternString(patternsStr)) {
        addIgnorePattern(pattern);
    }
}

std::vector<std::string> PatternMatcher::splitPatternString(const std::string& patternsStr) {
    std::vector<std::string> patterns;
    std::stringstream ss(patternsStr);
    std::string pattern;

    while (std::getline(ss, pattern, ',')) {
        pattern = trim(pattern);
        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }

    return patterns;
}

size_t PatternMatcher::loadGitignore(const fs::path& gitignorePath, const fs::path& base) {
    std::ifstream file(gitignorePath);
    if (!file) {
        throw std::runtime_error("Failed to open ignore file: " + gitignorePath.string());
    }

    size_t added = 0;
    std::string line;
    while (std::getline(file, line)) {
        // git skips lines it cannot parse, and so do we
        try {
            Rule rule;
            if (parseRule(line, base, rule)) {
                ignoreRules_.push_back(std::move(rule));
                ++added;
            }
        } catch (const PatternError&) {
            continue;
        }
    }

    return added;
}

bool PatternMatcher::parseRule(const std::string& line, const fs::path& base, Rule& rule) {
    std::string pattern = trimTrailing(line);

    // Skip empty lines and comments
    if (pattern.empty() || pattern[0] == '#') {
        return false;
    }

    rule.negated = false;
    if (pattern[0] == '!') {
        rule.negated = true;
        pattern.erase(0, 1);
    } else if (pattern.size() >= 2 && pattern[0] == '\\' && (pattern[1] == '!' || pattern[1] == '#')) {
        pattern.erase(0, 1);
    }

    rule.directoryOnly = false;
    while (!pattern.empty() && pattern.back() == '/') {
        rule.directoryOnly = true;
        pattern.pop_back();
    }

    // A separator anywhere but the end ties the pattern to the base directory
    const bool anchored = pattern.find('/') != std::string::npos;
    while (!pattern.empty() && pattern.front() == '/') {
        pattern.erase(0, 1);
    }

    if (pattern.empty()) {
        return false;
    }

    rule.pattern = line;
    rule.base = normalizeBase(base);
    rule.regex = patternToRegex(pattern, anchored);
    return true;
}

PatternMatcher::MatchState PatternMatcher::matchState(const std::string& relPath, bool isDirectory) const {
    MatchState state = MatchState::None;

    for (const auto& rule : ignoreRules_) {
        if (rule.directoryOnly && !isDirectory) {
            continue;
        }

        std::string candidate;
        if (rule.base.empty()) {
            candidate = relPath;
        } else {
            if (relPath.size() <= rule.base.size() ||
                relPath.compare(0, rule.base.size(), rule.base) != 0 ||
                relPath[rule.base.size()] != '/') {
                continue;
            }
            candidate = relPath.substr(rule.base.size() + 1);
        }

        if (std::regex_match(candidate, rule.regex)) {
            state = rule.negated ? MatchState::Whitelisted : MatchState::Ignored;
        }
    }

    return state;
}

bool PatternMatcher::isEntryIgnored(const fs::path& relPath, bool isDirectory) const {
    const std::string pathStr = normalizeRelative(relPath);
    if (pathStr.empty()) {
        return false;
    }
    return matchState(pathStr, isDirectory) == MatchState::Ignored;
}

bool PatternMatcher::isIgnored(const fs::path& relPath, bool isDirectory) const {
    const std::string pathStr = normalizeRelative(relPath);
    if (pathStr.empty()) {
        return false;
    }

    // A file inside an excluded directory cannot be re-included
    size_t slash = pathStr.find('/');
    while (slash != std::string::npos) {
        if (matchState(pathStr.substr(0, slash), true) == MatchState::Ignored) {
            return true;
        }
        slash = pathStr.find('/', slash + 1);
    }

    return matchState(pathStr, isDirectory) == MatchState::Ignored;
}

bool PatternMatcher::isIncluded(const fs::path& relPath) const {
    // If no include patterns, everything is included
    if (includeRules_.empty()) {
        return true;
    }

    const std::string pathStr = normalizeRelative(relPath);
    auto matchesAny = [this](const std::string& candidate, bool isDirectory) {
        return std::any_of(includeRules_.begin(), includeRules_.end(),
            [&](const Rule& rule) {
                return (isDirectory || !rule.directoryOnly) && std::regex_match(candidate, rule.regex);
            });
    };

    // Including a directory includes everything below it
    size_t slash = pathStr.find('/');
    while (slash != std::string::npos) {
        if (matchesAny(pathStr.substr(0, slash), true)) {
            return true;
        }
        slash = pathStr.find('/', slash + 1);
    }

    return matchesAny(pathStr, false);
}

bool PatternMatcher::shouldProcess(const fs::path& relPath) const {
    return !isIgnored(relPath) && isIncluded(relPath);
}

std::regex PatternMatcher::patternToRegex(const std::string& pattern, bool anchored) {
    // Unanchored patterns may match at any depth
    std::string regexStr = anchored ? "" : "(?:.*/)?";
    const size_t n = pattern.size();

    size_t i = 0;
    while (i < n) {
        const char c = pattern[i];

        if (c == '*') {
            size_t j = i;
            while (j < n && pattern[j] == '*') {
                ++j;
            }
            const bool wholeSegment = (i == 0 || pattern[i - 1] == '/') && (j == n || pattern[j] == '/');
            if (j - i >= 2 && wholeSegment) {
                if (j == n) {
                    // Trailing "/**" matches everything inside
                    regexStr += ".*";
                    i = j;
                } else {
                    // "**/" matches zero or more directories
                    regexStr += "(?:.*/)?";
                    i = j + 1;
                }
            } else {
                // * matches any character except directory separator
                regexStr += "[^/]*";
                i = j;
            }
        } else if (c == '?') {
            regexStr += "[^/]";
            ++i;
        } else if (c == '[') {
            size_t close = i + 1;
            if (close < n && (pattern[close] == '!' || pattern[close] == '^')) {
                ++close;
            }
            if (close < n && pattern[close] == ']') {
                ++close;
            }
            while (close < n && pattern[close] != ']') {
                ++close;
            }
            if (close >= n) {
                throw PatternError("Unterminated character class in pattern: " + pattern);
            }

            regexStr += '[';
            size_t k = i + 1;
            if (pattern[k] == '!' || pattern[k] == '^') {
                regexStr += '^';
                ++k;
            }
            for (; k < close; ++k) {
                const char member = pattern[k];
                if (member == '\\' || member == ']' || member == '[') {
                    regexStr += '\\';
                }
                regexStr += member;
            }
            regexStr += ']';
            i = close + 1;
        } else if (c == '\\') {
            if (i + 1 >= n) {
                throw PatternError("Trailing backslash in pattern: " + pattern);
            }
            const char escaped = pattern[i + 1];
            if (escaped != '\0' && std::strchr(".^$|()[]{}*+?\\", escaped) != nullptr) {
                regexStr += '\\';
            }
            regexStr += escaped;
            i += 2;
        } else {
            if (c != '\0' && std::strchr(".^$|()+{}]", c) != nullptr) {
                regexStr += '\\';
            }
            regexStr += c;
            ++i;
        }
    }

    try {
        return std::regex(regexStr);
    } catch (const std::regex_error& e) {
        throw PatternError("Invalid pattern '" + pattern + "': " + e.what());
    }
}
