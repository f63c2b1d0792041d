#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Default tag for unknown or missing extensions
inline const std::string kDefaultLanguage = "text";

// Map a file name to a lowercase language tag. Well-known file names
// (Dockerfile, Makefile, ...) win over the extension lookup. Never throws for
// any path and always returns the same tag for the same input.
std::string detectLanguage(const fs::path& filePath);
