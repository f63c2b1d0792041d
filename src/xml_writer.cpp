#include "output_writer.hpp"
#include <sstream>
#include "text_utils.hpp"

namespace {

const char kReplacementChar[] = "\xEF\xBF\xBD";

} // namespace

void writeEscapedXml(std::ostream& out, std::string_view value, bool forAttribute) {
    // The document declares UTF-8, so ill-formed input is repaired first
    if (!text::isValidUtf8(value)) {
        const std::string repaired = text::decodeUtf8Lossy(value);
        writeEscapedXml(out, repaired, forAttribute);
        return;
    }

    size_t i = 0;
    while (i < value.size()) {
        const auto c = static_cast<unsigned char>(value[i]);

        // U+FFFE and U+FFFF are not XML characters
        if (c == 0xEF && i + 2 < value.size() &&
            static_cast<unsigned char>(value[i + 1]) == 0xBF &&
            (static_cast<unsigned char>(value[i + 2]) == 0xBE ||
             static_cast<unsigned char>(value[i + 2]) == 0xBF)) {
            out << kReplacementChar;
            i += 3;
            continue;
        }

        switch (c) {
            case '&':  out << "&amp;"; break;
            case '<':  out << "&lt;"; break;
            case '>':  out << "&gt;"; break;
            case '"':  out << "&quot;"; break;
            case '\'': out << "&apos;"; break;
            // Parsers normalize raw CR and attribute whitespace; references survive
            case '\r': out << "&#13;"; break;
            case '\n': out << (forAttribute ? "&#10;" : "\n"); break;
            case '\t': out << (forAttribute ? "&#9;" : "\t"); break;
            default:
                if (c < 0x20) {
                    // Not representable in XML 1.0, even as a reference
                    out << kReplacementChar;
                } else {
                    out << static_cast<char>(c);
                }
                break;
        }
        ++i;
    }
}

std::string escapeXml(std::string_view value, bool forAttribute) {
    std::ostringstream out;
    writeEscapedXml(out, value, forAttribute);
    return out.str();
}

void XmlWriter::write(const AggregationResult& result, std::ostream& out) const {
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<codebase>\n";

    out << "  <metadata>\n";
    out << "    <root>";
    writeEscapedXml(out, result.rootName);
    out << "</root>\n";
    out << "    <generated_at>";
    writeEscapedXml(out, result.generatedAt);
    out << "</generated_at>\n";
    out << "    <total_files>" << result.totalFiles << "</total_files>\n";
    out << "    <total_lines>" << result.totalLines << "</total_lines>\n";
    out << "    <total_tokens>" << result.totalTokens << "</total_tokens>\n";
    out << "  </metadata>\n";

    out << "  <project_tree>";
    writeEscapedXml(out, result.tree);
    out << "</project_tree>\n";

    out << "  <files>\n";
    for (const auto& file : result.files) {
        out << "    <file path=\"";
        writeEscapedXml(out, file.relativePath, true);
        out << "\" language=\"";
        writeEscapedXml(out, file.language, true);
        out << "\" lines=\"" << file.lineCount
            << "\" tokens=\"" << file.tokenEstimate << "\"";
        if (file.truncated) {
            out << " truncated=\"true\"";
        }
        out << ">\n";

        out << "      <content>";
        writeEscapedXml(out, file.content);
        out << "</content>\n";
        out << "    </file>\n";
    }
    out << "  </files>\n";

    out << "</codebase>\n";
}
