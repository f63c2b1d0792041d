#include "language_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

const std::unordered_map<std::string, std::string> kSpecialFileNames = {
    {"dockerfile", "dockerfile"},
    {"makefile", "makefile"},
    {"cmakelists.txt", "cmake"},
    {"gemfile", "ruby"},
    {"rakefile", "ruby"}
};

const std::unordered_map<std::string, std::string> kExtensionMap = {
    // Python
    {".py", "python"}, {".pyi", "python"}, {".pyx", "python"}, {".ipynb", "json"},
    // Web
    {".js", "javascript"}, {".jsx", "javascript"}, {".mjs", "javascript"}, {".cjs", "javascript"},
    {".ts", "typescript"}, {".tsx", "typescript"},
    {".html", "html"}, {".htm", "html"}, {".css", "css"}, {".scss", "scss"},
    {".vue", "vue"}, {".svelte", "svelte"},
    // JVM
    {".java", "java"}, {".kt", "kotlin"}, {".scala", "scala"}, {".gradle", "groovy"},
    // Native
    {".c", "c"}, {".h", "c"},
    {".cpp", "cpp"}, {".cc", "cpp"}, {".cxx", "cpp"},
    {".hpp", "cpp"}, {".hh", "cpp"}, {".hxx", "cpp"},
    {".rs", "rust"}, {".go", "go"},
    // Scripting
    {".sh", "bash"}, {".bash", "bash"}, {".zsh", "zsh"},
    {".lua", "lua"}, {".rb", "ruby"}, {".php", "php"},
    // Config and data
    {".json", "json"}, {".yaml", "yaml"}, {".yml", "yaml"}, {".toml", "toml"},
    {".xml", "xml"}, {".sql", "sql"}, {".md", "markdown"}, {".txt", "text"},
    {".tf", "hcl"}, {".cmake", "cmake"}
};

} // namespace

std::string detectLanguage(const fs::path& filePath) {
    const std::string name = toLower(filePath.filename().string());

    auto special = kSpecialFileNames.find(name);
    if (special != kSpecialFileNames.end()) {
        return special->second;
    }

    // "archive.tar.gz" -> ".gz"; ".bashrc" has no extension per std::filesystem
    const std::string ext = toLower(filePath.extension().string());
    if (ext.empty()) {
        return kDefaultLanguage;
    }

    auto it = kExtensionMap.find(ext);
    return it != kExtensionMap.end() ? it->second : kDefaultLanguage;
}
