#include "text_utils.hpp"
#include <algorithm>

namespace text {

namespace {

const char kReplacementChar[] = "\xEF\xBF\xBD";

// Inspect the sequence starting at `pos`. Returns the number of bytes it spans
// (the maximal valid prefix when it is ill-formed) and sets `valid`.
size_t scanSequence(std::string_view bytes, size_t pos, bool& valid) {
    const auto lead = static_cast<unsigned char>(bytes[pos]);
    valid = false;

    if (lead < 0x80) {
        valid = true;
        return 1;
    }

    size_t needed = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        needed = 1;
    } else if (lead == 0xE0) {
        needed = 2;
        lo = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        needed = 2;
    } else if (lead == 0xED) {
        needed = 2;
        hi = 0x9F;
    } else if (lead == 0xF0) {
        needed = 3;
        lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        needed = 3;
    } else if (lead == 0xF4) {
        needed = 3;
        hi = 0x8F;
    } else {
        return 1;
    }

    size_t consumed = 1;
    for (size_t k = 0; k < needed; ++k) {
        if (pos + consumed >= bytes.size()) {
            return consumed;
        }
        const auto c = static_cast<unsigned char>(bytes[pos + consumed]);
        const unsigned char min = (k == 0) ? lo : 0x80;
        const unsigned char max = (k == 0) ? hi : 0xBF;
        if (c < min || c > max) {
            return consumed;
        }
        ++consumed;
    }

    valid = true;
    return consumed;
}

bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

} // namespace

bool isValidUtf8(std::string_view bytes) {
    size_t pos = 0;
    while (pos < bytes.size()) {
        bool valid = false;
        pos += scanSequence(bytes, pos, valid);
        if (!valid) {
            return false;
        }
    }
    return true;
}

std::string decodeUtf8Lossy(std::string_view bytes) {
    std::string result;
    result.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        bool valid = false;
        const size_t len = scanSequence(bytes, pos, valid);
        if (valid) {
            result.append(bytes.data() + pos, len);
        } else {
            result.append(kReplacementChar);
        }
        pos += len;
    }

    return result;
}

std::vector<std::string_view> splitLines(std::string_view content) {
    std::vector<std::string_view> lines;

    size_t start = 0;
    while (start < content.size()) {
        size_t end = content.find('\n', start);
        const bool terminated = end != std::string_view::npos;
        if (!terminated) {
            end = content.size();
        }

        std::string_view line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);

        start = terminated ? end + 1 : end;
    }

    return lines;
}

size_t countLines(std::string_view content) {
    size_t count = std::count(content.begin(), content.end(), '\n');

    // An unterminated last line still counts
    if (!content.empty() && content.back() != '\n') {
        ++count;
    }

    return count;
}

bool isBlank(std::string_view content) {
    return std::all_of(content.begin(), content.end(), isAsciiSpace);
}

bool containsNul(std::string_view bytes, size_t window) {
    const auto head = bytes.substr(0, std::min(window, bytes.size()));
    return head.find('\0') != std::string_view::npos;
}

} // namespace text
