#pragma once

#include <string>
#include <vector>
#include <regex>

// Text substituted for every detected secret
inline const std::string kRedactionMarker = "[REDACTED]";

struct SanitizationRule {
    std::string name;
    std::regex pattern;
};

/**
 * @brief Process-wide ordered list of secret matchers
 *
 * Built once on first use and never modified afterwards, so worker threads
 * share it without locking.
 */
class SanitizationRuleSet {
public:
    static const SanitizationRuleSet& getInstance();

    const std::vector<SanitizationRule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }

    SanitizationRuleSet(const SanitizationRuleSet&) = delete;
    SanitizationRuleSet& operator=(const SanitizationRuleSet&) = delete;

private:
    SanitizationRuleSet();

    std::vector<SanitizationRule> rules_;
};

// Replace every match of every rule (in rule order) with kRedactionMarker.
// sanitizeContent(sanitizeContent(x)) == sanitizeContent(x) for any x.
std::string sanitizeContent(const std::string& content);
