#include <iostream>
#include <CLI/CLI.hpp>
#include "ctxpack.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"ctxpack - Serialize a codebase into a single context document"};

        CtxPackOptions options;
        std::string formatStr;
        bool noDefaultIgnores = false;

        // Root directory to scan
        app.add_option("path", options.inputDir, "Root directory to scan (default: .)")
            ->check(CLI::ExistingDirectory);

        // Optional output file
        app.add_option("-o,--output", options.outputFile, "Output file path (default: codebase_context.md)");

        // Optional output format
        app.add_option("-f,--format", formatStr,
                       "Output format: markdown, xml, json (default: from output extension, else markdown)")
            ->check(CLI::IsMember({"markdown", "md", "xml", "json"}));

        // Optional include patterns
        app.add_option("--include", options.includePatterns,
                       "Comma-separated list of glob patterns for files to include (e.g. *.rs,src/)");

        // Optional exclude patterns
        app.add_option("--exclude", options.excludePatterns,
                       "Comma-separated list of glob patterns for files to exclude (e.g. *.txt,docs/)");

        app.add_flag("--no-default-ignores", noDefaultIgnores,
                     "Do not skip dependency/build directories, media and lock files");

        // Optional verbose flag
        app.add_flag("-v,--verbose", options.verbose, "Show per-file errors and discovery details");

        // Optional timing flag
        app.add_flag("-t,--timing", options.showTiming, "Show detailed timing information");

        // Optional thread count
        app.add_option("--threads", options.numThreads,
                       "Number of threads to use for processing (default: number of CPU cores)")
            ->check(CLI::Range(1u, 256u));

        CLI11_PARSE(app, argc, argv);

        options.format = formatStr.empty()
            ? outputFormatFromPath(options.outputFile)
            : outputFormatFromString(formatStr);
        options.useDefaultIgnores = !noDefaultIgnores;

        CtxPack ctxpack(options);
        if (!ctxpack.run()) {
            return 1;
        }

        const auto& result = ctxpack.getResult();
        std::cout << "✅ Success! Output written to: " << ctxpack.getOutputPath().string() << std::endl;
        std::cout << "📊 Stats: " << result.totalFiles << " files, " << result.totalLines
                  << " lines, ~" << result.totalTokens << " tokens" << std::endl;

        if (options.verbose) {
            std::cout << ctxpack.getSummary();
        }
        if (options.showTiming) {
            std::cout << ctxpack.getTimingInfo();
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
