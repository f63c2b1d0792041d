#include "tree_renderer.hpp"
#include <set>
#include "text_utils.hpp"

namespace {

const std::string kIndentUnit = "│   ";
const std::string kBranch = "├── ";

std::string indentFor(size_t depth) {
    std::string indent;
    indent.reserve(depth * kIndentUnit.size());
    for (size_t i = 0; i < depth; ++i) {
        indent += kIndentUnit;
    }
    return indent;
}

} // namespace

std::string renderTree(const std::vector<fs::path>& sortedPaths, const fs::path& root) {
    // Preallocate a reasonably sized buffer
    std::string result;
    result.reserve(4096);

    result += "📂 ";
    result += text::decodeUtf8Lossy(root.filename().string());
    result += "/";

    std::set<fs::path> addedDirectories;

    for (const auto& path : sortedPaths) {
        const fs::path relative = path.lexically_relative(root);
        if (relative.empty() || *relative.begin() == "..") {
            continue;
        }

        std::vector<fs::path> components(relative.begin(), relative.end());
        const size_t depth = components.size() - 1;

        // Introduce each parent directory once
        fs::path parent;
        for (size_t i = 0; i < depth; ++i) {
            parent /= components[i];
            if (addedDirectories.insert(parent).second) {
                result += "\n";
                result += indentFor(i);
                result += kBranch;
                result += text::decodeUtf8Lossy(components[i].string());
                result += "/";
            }
        }

        result += "\n";
        result += indentFor(depth);
        result += kBranch;
        result += text::decodeUtf8Lossy(components.back().string());
    }

    return result;
}
