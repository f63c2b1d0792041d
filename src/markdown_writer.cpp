#include "output_writer.hpp"
#include <algorithm>

std::string MarkdownWriter::fenceFor(std::string_view content) {
    size_t longestRun = 0;
    bool atLineStart = true;
    size_t run = 0;

    for (const char c : content) {
        if (c == '\n') {
            atLineStart = true;
            run = 0;
            continue;
        }
        if (atLineStart && (c == ' ' || c == '\t') && run == 0) {
            continue;
        }
        if (atLineStart && c == '`') {
            ++run;
            longestRun = std::max(longestRun, run);
            continue;
        }
        atLineStart = false;
    }

    return std::string(std::max<size_t>(3, longestRun + 1), '`');
}

void MarkdownWriter::write(const AggregationResult& result, std::ostream& out) const {
    // Header
    out << "# 📦 Codebase Context: " << result.rootName << "\n";
    out << "> Generated on " << result.generatedAt
        << " | Files: " << result.totalFiles
        << " | Tokens: ~" << result.totalTokens << "\n\n";

    // Tree
    out << "## 🌲 Project Structure\n```text\n";
    out << result.tree;
    out << "\n```\n\n";

    // Content
    out << "## 📄 File Contents\n";

    for (const auto& file : result.files) {
        out << "\n### `" << file.relativePath << "`\n";

        out << "_Language: " << file.language
            << " | Lines: " << file.lineCount
            << " | Tokens: ~" << file.tokenEstimate;
        if (file.truncated) {
            out << " | ⚠️ TRUNCATED";
        }
        out << "_\n";

        const std::string fence = fenceFor(file.content);
        out << fence << file.language << "\n";
        out << file.content;
        if (file.content.empty() || file.content.back() != '\n') {
            out << "\n";
        }
        out << fence << "\n---\n";
    }
}
