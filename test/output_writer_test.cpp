#include <catch2/catch_test_macros.hpp>
#include "output_writer.hpp"
#include "text_utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

AggregationResult makeSampleResult() {
    AggregationResult result;
    result.rootName = "demo";
    result.generatedAt = "2024-01-02 03:04:05";
    result.tree = "📂 demo/\n├── a.py\n├── big & <odd>.txt";

    FileArtifact python;
    python.relativePath = "a.py";
    python.language = "python";
    python.content = "print('<hi>')\nx = 1 & 2\n";
    python.lineCount = 2;
    python.tokenEstimate = python.content.size() / 4;

    FileArtifact odd;
    odd.relativePath = "big & <odd>.txt";
    odd.language = "text";
    odd.content = "line\r\nwith \"quotes\"";
    odd.lineCount = 2;
    odd.tokenEstimate = odd.content.size() / 4;
    odd.truncated = true;

    result.files = {python, odd};
    result.totalFiles = 2;
    result.totalLines = 4;
    result.totalTokens = python.tokenEstimate + odd.tokenEstimate;
    return result;
}

std::string unescapeXml(std::string text) {
    const std::pair<const char*, const char*> entities[] = {
        {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&apos;", "'"},
        {"&#13;", "\r"}, {"&#10;", "\n"}, {"&#9;", "\t"}, {"&amp;", "&"}
    };
    for (const auto& entity : entities) {
        const std::string from = entity.first;
        for (size_t pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + 1)) {
            text.replace(pos, from.size(), entity.second);
        }
    }
    return text;
}

std::vector<std::string> xmlContents(const std::string& document) {
    std::vector<std::string> contents;
    const std::string open = "<content>";
    const std::string close = "</content>";
    for (size_t pos = document.find(open); pos != std::string::npos; pos = document.find(open, pos)) {
        pos += open.size();
        const size_t end = document.find(close, pos);
        contents.push_back(document.substr(pos, end - pos));
        pos = end;
    }
    return contents;
}

} // namespace

TEST_CASE("Output format selection", "[OutputWriter]") {
    REQUIRE(outputFormatFromString("markdown") == OutputFormat::Markdown);
    REQUIRE(outputFormatFromString("md") == OutputFormat::Markdown);
    REQUIRE(outputFormatFromString("XML") == OutputFormat::XML);
    REQUIRE(outputFormatFromString("json") == OutputFormat::JSON);
    REQUIRE_THROWS_AS(outputFormatFromString("yaml"), std::runtime_error);

    REQUIRE(outputFormatFromPath("context.JSON") == OutputFormat::JSON);
    REQUIRE(outputFormatFromPath("out/context.xml") == OutputFormat::XML);
    REQUIRE(outputFormatFromPath("codebase_context.md") == OutputFormat::Markdown);
    REQUIRE(outputFormatFromPath("no_extension") == OutputFormat::Markdown);

    for (auto format : {OutputFormat::Markdown, OutputFormat::XML, OutputFormat::JSON}) {
        REQUIRE(makeOutputWriter(format)->format() == format);
        REQUIRE(outputFormatFromString(outputFormatToString(format)) == format);
    }
}

TEST_CASE("Markdown output", "[OutputWriter]") {
    const AggregationResult result = makeSampleResult();
    const std::string document = renderDocument(result, OutputFormat::Markdown);

    SECTION("Header and tree") {
        REQUIRE(document.rfind("# 📦 Codebase Context: demo\n", 0) == 0);
        REQUIRE(document.find("> Generated on 2024-01-02 03:04:05 | Files: 2 | Tokens: ~" +
                              std::to_string(result.totalTokens) + "\n") != std::string::npos);
        REQUIRE(document.find("```text\n" + result.tree + "\n```\n") != std::string::npos);
        REQUIRE(document.find("## 📄 File Contents\n") != std::string::npos);
    }

    SECTION("File blocks in order") {
        const std::string firstBlock =
            "\n### `a.py`\n"
            "_Language: python | Lines: 2 | Tokens: ~" + std::to_string(result.files[0].tokenEstimate) + "_\n"
            "```python\n"
            "print('<hi>')\nx = 1 & 2\n"
            "```\n---\n";
        const size_t first = document.find(firstBlock);
        REQUIRE(first != std::string::npos);

        const size_t second = document.find("### `big & <odd>.txt`");
        REQUIRE(second != std::string::npos);
        REQUIRE(first < second);
        REQUIRE(document.find("| ⚠️ TRUNCATED_") != std::string::npos);
        REQUIRE(document.find("with \"quotes\"\n```\n---\n") != std::string::npos);
    }

    SECTION("Fences grow past backtick runs in the content") {
        REQUIRE(MarkdownWriter::fenceFor("no fences here") == "```");
        REQUIRE(MarkdownWriter::fenceFor("```cpp\ncode\n```") == "````");
        REQUIRE(MarkdownWriter::fenceFor("text\n  `````x\n") == "``````");
        REQUIRE(MarkdownWriter::fenceFor("inline ``` is fine") == "```");
    }
}

TEST_CASE("XML output", "[OutputWriter]") {
    SECTION("Escaping") {
        REQUIRE(escapeXml("<a & 'b'>\"") == "&lt;a &amp; &apos;b&apos;&gt;&quot;");
        REQUIRE(escapeXml("a\r\nb") == "a&#13;\nb");
        REQUIRE(escapeXml("a\nb\tc", true) == "a&#10;b&#9;c");
        REQUIRE(escapeXml("bell\x01") == "bell\xEF\xBF\xBD");
        REQUIRE(escapeXml("plain") == "plain");
    }

    SECTION("Ill-formed UTF-8 is repaired") {
        REQUIRE(escapeXml("caf\xE9.txt", true) == "caf\xEF\xBF\xBD.txt");
        REQUIRE(escapeXml("a\xFF<") == "a\xEF\xBF\xBD&lt;");
    }

    const AggregationResult result = makeSampleResult();
    const std::string document = renderDocument(result, OutputFormat::XML);

    SECTION("Structure and metadata") {
        REQUIRE(document.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<codebase>\n", 0) == 0);
        REQUIRE(document.find("<root>demo</root>") != std::string::npos);
        REQUIRE(document.find("<total_files>2</total_files>") != std::string::npos);
        REQUIRE(document.find("<total_lines>4</total_lines>") != std::string::npos);
        REQUIRE(document.find("<project_tree>📂 demo/\n├── a.py\n├── big &amp; &lt;odd&gt;.txt</project_tree>") !=
                std::string::npos);
        REQUIRE(document.find("<file path=\"big &amp; &lt;odd&gt;.txt\" language=\"text\" lines=\"2\" tokens=\"" +
                              std::to_string(result.files[1].tokenEstimate) + "\" truncated=\"true\">") !=
                std::string::npos);
        REQUIRE(document.find("</codebase>\n") != std::string::npos);
    }

    SECTION("Content survives escaping") {
        const auto contents = xmlContents(document);
        REQUIRE(contents.size() == 2);
        REQUIRE(unescapeXml(contents[0]) == result.files[0].content);
        REQUIRE(unescapeXml(contents[1]) == result.files[1].content);
    }
}

TEST_CASE("Encodings agree on ill-formed file names", "[OutputWriter]") {
    AggregationResult result = makeSampleResult();
    result.files[0].relativePath = "caf\xE9.py";
    result.tree = "\xF0\x28 tree";

    const std::string xml = renderDocument(result, OutputFormat::XML);
    REQUIRE(text::isValidUtf8(xml));
    REQUIRE(xml.find("<file path=\"caf\xEF\xBF\xBD.py\"") != std::string::npos);

    const json doc = json::parse(renderDocument(result, OutputFormat::JSON));
    REQUIRE(doc["files"][0]["path"] == "caf\xEF\xBF\xBD.py");
}

TEST_CASE("JSON output", "[OutputWriter]") {
    const AggregationResult result = makeSampleResult();

    SECTION("Parses back to the same values") {
        const json doc = json::parse(renderDocument(result, OutputFormat::JSON));

        REQUIRE(doc["metadata"]["root"] == "demo");
        REQUIRE(doc["metadata"]["generated_at"] == "2024-01-02 03:04:05");
        REQUIRE(doc["metadata"]["total_files"] == 2);
        REQUIRE(doc["metadata"]["total_lines"] == 4);
        REQUIRE(doc["metadata"]["total_tokens"] == result.totalTokens);
        REQUIRE(doc["project_tree"] == result.tree);

        REQUIRE(doc["files"].size() == 2);
        for (size_t i = 0; i < result.files.size(); ++i) {
            const auto& file = doc["files"][i];
            REQUIRE(file["path"] == result.files[i].relativePath);
            REQUIRE(file["language"] == result.files[i].language);
            REQUIRE(file["lines"] == result.files[i].lineCount);
            REQUIRE(file["tokens"] == result.files[i].tokenEstimate);
            REQUIRE(file["truncated"] == result.files[i].truncated);
            REQUIRE(file["content"] == result.files[i].content);
        }
    }

    SECTION("No files gives an empty array") {
        AggregationResult empty;
        empty.rootName = "empty";
        empty.generatedAt = "2024-01-02 03:04:05";
        empty.tree = "📂 empty/";

        const json doc = json::parse(renderDocument(empty, OutputFormat::JSON));
        REQUIRE(doc["files"].is_array());
        REQUIRE(doc["files"].empty());
        REQUIRE(doc["metadata"]["total_files"] == 0);
    }

    SECTION("Invalid UTF-8 is replaced") {
        AggregationResult broken = result;
        broken.files[0].content = "bad \xFF byte";

        const json doc = json::parse(renderDocument(broken, OutputFormat::JSON));
        REQUIRE(doc["files"][0]["content"] == "bad \xEF\xBF\xBD byte");
    }
}
