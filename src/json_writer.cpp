#include "output_writer.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

// Encode a single value; invalid UTF-8 is replaced rather than thrown on
template <typename T>
std::string encode(const T& value) {
    return json(value).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

void JsonWriter::write(const AggregationResult& result, std::ostream& out) const {
    // The envelope is streamed by hand so that only one file is encoded at a time
    out << "{\n";

    out << "  \"metadata\": {\n";
    out << "    \"root\": " << encode(result.rootName) << ",\n";
    out << "    \"generated_at\": " << encode(result.generatedAt) << ",\n";
    out << "    \"total_files\": " << result.totalFiles << ",\n";
    out << "    \"total_tokens\": " << result.totalTokens << ",\n";
    out << "    \"total_lines\": " << result.totalLines << "\n";
    out << "  },\n";

    out << "  \"project_tree\": " << encode(result.tree) << ",\n";

    out << "  \"files\": [";
    bool first = true;
    for (const auto& file : result.files) {
        out << (first ? "\n" : ",\n");
        first = false;

        out << "    {\n";
        out << "      \"path\": " << encode(file.relativePath) << ",\n";
        out << "      \"language\": " << encode(file.language) << ",\n";
        out << "      \"lines\": " << file.lineCount << ",\n";
        out << "      \"tokens\": " << file.tokenEstimate << ",\n";
        out << "      \"truncated\": " << (file.truncated ? "true" : "false") << ",\n";
        out << "      \"content\": " << encode(file.content) << "\n";
        out << "    }";
    }
    out << (first ? "]\n" : "\n  ]\n");

    out << "}\n";
}
