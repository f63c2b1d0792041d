#pragma once

#include <string>
#include <string_view>
#include <memory>
#include <ostream>
#include <filesystem>
#include "aggregation_result.hpp"

namespace fs = std::filesystem;

enum class OutputFormat {
    Markdown,
    XML,
    JSON
};

// "markdown"/"md", "xml", "json"; throws std::runtime_error otherwise
OutputFormat outputFormatFromString(const std::string& name);
std::string outputFormatToString(OutputFormat format);

// Guess the format from the destination extension (.xml, .json), Markdown otherwise
OutputFormat outputFormatFromPath(const fs::path& path);

/**
 * @brief Renders an AggregationResult in one encoding
 *
 * Implementations write straight to the stream as they go; they never build
 * the whole document in memory.
 */
class OutputWriter {
public:
    virtual ~OutputWriter() = default;

    virtual void write(const AggregationResult& result, std::ostream& out) const = 0;

    virtual OutputFormat format() const = 0;
};

// Document-style Markdown with fenced tree and file blocks
class MarkdownWriter : public OutputWriter {
public:
    void write(const AggregationResult& result, std::ostream& out) const override;
    OutputFormat format() const override { return OutputFormat::Markdown; }

    // Backtick fence long enough that nothing inside `content` can close it
    static std::string fenceFor(std::string_view content);
};

class XmlWriter : public OutputWriter {
public:
    void write(const AggregationResult& result, std::ostream& out) const override;
    OutputFormat format() const override { return OutputFormat::XML; }
};

class JsonWriter : public OutputWriter {
public:
    void write(const AggregationResult& result, std::ostream& out) const override;
    OutputFormat format() const override { return OutputFormat::JSON; }
};

std::unique_ptr<OutputWriter> makeOutputWriter(OutputFormat format);

// Render the complete document into a string (clipboard hand-off and tests)
std::string renderDocument(const AggregationResult& result, OutputFormat format);

// Escape text for XML character data, or for a double-quoted attribute value
void writeEscapedXml(std::ostream& out, std::string_view value, bool forAttribute = false);
std::string escapeXml(std::string_view value, bool forAttribute = false);
