#include "output_writer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

OutputFormat outputFormatFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "markdown" || lower == "md") {
        return OutputFormat::Markdown;
    }
    if (lower == "xml") {
        return OutputFormat::XML;
    }
    if (lower == "json") {
        return OutputFormat::JSON;
    }
    throw std::runtime_error("Unsupported output format: " + name);
}

std::string outputFormatToString(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown:
            return "markdown";
        case OutputFormat::XML:
            return "xml";
        case OutputFormat::JSON:
            return "json";
    }
    throw std::runtime_error("Unknown output format enum value");
}

OutputFormat outputFormatFromPath(const fs::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".xml") {
        return OutputFormat::XML;
    }
    if (ext == ".json") {
        return OutputFormat::JSON;
    }
    return OutputFormat::Markdown;
}

std::unique_ptr<OutputWriter> makeOutputWriter(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown:
            return std::make_unique<MarkdownWriter>();
        case OutputFormat::XML:
            return std::make_unique<XmlWriter>();
        case OutputFormat::JSON:
            return std::make_unique<JsonWriter>();
    }
    throw std::runtime_error("Unknown output format enum value");
}

std::string renderDocument(const AggregationResult& result, OutputFormat format) {
    std::ostringstream out;
    makeOutputWriter(format)->write(result, out);
    return out.str();
}
