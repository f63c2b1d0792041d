#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace text {

// Returns true if the whole buffer is well-formed UTF-8
bool isValidUtf8(std::string_view bytes);

// Decode bytes as UTF-8, replacing each maximal invalid subsequence with U+FFFD
std::string decodeUtf8Lossy(std::string_view bytes);

// Split into logical lines: '\n' terminated, a trailing '\r' is dropped and
// a final empty segment after the last newline is not a line
std::vector<std::string_view> splitLines(std::string_view content);

// Number of logical lines (same rules as splitLines)
size_t countLines(std::string_view content);

// True for empty content or content made only of ASCII whitespace
bool isBlank(std::string_view content);

// True if a NUL byte appears in the first `window` bytes
bool containsNul(std::string_view bytes, size_t window = 8192);

} // namespace text
