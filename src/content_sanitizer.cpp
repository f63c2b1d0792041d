#include "content_sanitizer.hpp"

// Quantifiers are bounded: libstdc++ matches recursively and an unbounded
// repeat over a long token can exhaust the stack. No character class admits
// '[' or ']', so the marker never takes part in a match. Every pattern starts
// with a literal so that most positions are rejected on the first byte.
SanitizationRuleSet::SanitizationRuleSet() {
    rules_.push_back({"private_key_header",
        std::regex(R"(-----BEGIN (?:[A-Z0-9]{1,16} ){0,4}PRIVATE KEY-----)")});

    rules_.push_back({"aws_access_key_id",
        std::regex(R"(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)")});

    rules_.push_back({"google_api_key",
        std::regex(R"(\bAIza[0-9A-Za-z_\-]{35})")});

    rules_.push_back({"github_token",
        std::regex(R"(\b(?:gh[pousr]_[A-Za-z0-9]{36,255}|github_pat_[A-Za-z0-9_]{22,255}))")});

    rules_.push_back({"openai_key",
        std::regex(R"(\bsk-(?:proj-|ant-)?[A-Za-z0-9_\-]{20,255})")});

    rules_.push_back({"slack_token",
        std::regex(R"(\bxox[baprs]-[A-Za-z0-9\-]{10,255})")});

    rules_.push_back({"gitlab_token",
        std::regex(R"(\bglpat-[A-Za-z0-9_\-]{20,255})")});

    rules_.push_back({"generic_secret_assignment",
        std::regex(R"((?:key|secret|token|password|passwd)[A-Za-z0-9_\-]{0,40}\s{0,8}[:=]\s{0,8}["'][^"'\s\[\]]{16,1024}["'])",
                   std::regex::ECMAScript | std::regex::icase)});
}

const SanitizationRuleSet& SanitizationRuleSet::getInstance() {
    static const SanitizationRuleSet instance;
    return instance;
}

std::string sanitizeContent(const std::string& content) {
    const auto& rules = SanitizationRuleSet::getInstance().rules();

    // A replacement can splice text around the marker into a new match, so
    // repeat until a pass changes nothing. Every rule matches more bytes than
    // the marker holds, so each productive pass shrinks the text.
    std::string current = content;
    while (true) {
        std::string next = current;
        for (const auto& rule : rules) {
            next = std::regex_replace(next, rule.pattern, kRedactionMarker);
        }
        if (next == current) {
            return next;
        }
        current = std::move(next);
    }
}
