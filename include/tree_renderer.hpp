#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// Render the directory structure implied by `sortedPaths` (absolute paths
// under `root`). Each directory is introduced the first time a file below it
// appears, so the input must already be sorted for a stable layout.
// Paths outside `root` are ignored. No trailing newline.
std::string renderTree(const std::vector<fs::path>& sortedPaths, const fs::path& root);
