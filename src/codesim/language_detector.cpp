#include <codesim/language_detector.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace codesim {

namespace {

// Extension to language mapping
const std::unordered_map<std::string, std::string> EXTENSION_MAP = {
    // Shell
    {".sh", "bash"},
    {".bash", "bash"},
    {".zsh", "zsh"},

    // Python
    {".py", "python"},
    {".pyw", "python"},
    {".pyx", "python"},

    // C/C++
    {".c", "c"},
    {".h", "c"},
    {".cpp", "cpp"},
    {".cc", "cpp"},
    {".cxx", "cpp"},
    {".hpp", "cpp"},
    {".hxx", "cpp"},

    // C#
    {".cs", "csharp"},

    // JavaScript/TypeScript
    {".js", "javascript"},
    {".mjs", "javascript"},
    {".jsx", "javascript"},
    {".ts", "typescript"},
    {".tsx", "typescript"},

    // Go
    {".go", "go"},

    // Rust
    {".rs", "rust"},

    // Ruby
    {".rb", "ruby"},
    {".rake", "ruby"},

    // Java/Kotlin
    {".java", "java"},
    {".kt", "kotlin"},
    {".kts", "kotlin"},

    // PHP
    {".php", "php"},

    // Swift
    {".swift", "swift"},

    // Scala
    {".scala", "scala"},
    {".sc", "scala"},

    // Perl
    {".pl", "perl"},
    {".pm", "perl"},
};

// Shebang interpreter to language mapping
const std::unordered_map<std::string, std::string> SHEBANG_MAP = {
    {"bash", "bash"},
    {"sh", "bash"},
    {"zsh", "zsh"},
    {"python", "python"},
    {"python3", "python"},
    {"python2", "python"},
    {"node", "javascript"},
    {"nodejs", "javascript"},
    {"ruby", "ruby"},
    {"perl", "perl"},
    {"php", "php"},
};

// Languages where '#' starts a line comment
const std::unordered_set<std::string> HASH_COMMENT_LANGUAGES = {
    "bash", "zsh", "python", "ruby", "perl", "php",
};

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

}  // namespace

std::string LanguageDetector::detect(const std::string& content,
                                     const std::string& filename) {
    // Try shebang first (most reliable for scripts)
    std::string lang = from_shebang(content);
    if (!lang.empty()) {
        return lang;
    }

    lang = from_extension(filename);
    if (!lang.empty()) {
        return lang;
    }

    return "text";
}

Grammar LanguageDetector::grammar_for(const std::string& language) {
    Grammar grammar;
    grammar.language = language.empty() ? "text" : language;
    if (HASH_COMMENT_LANGUAGES.count(grammar.language) > 0) {
        grammar.line_comment_markers.push_back("#");
    }
    return grammar;
}

Grammar LanguageDetector::grammar_for_file(const std::string& content,
                                           const std::string& filename) {
    return grammar_for(detect(content, filename));
}

std::string LanguageDetector::from_extension(const std::string& filename) {
    if (filename.empty()) {
        return "";
    }

    // Only look at the last path component
    size_t slash_pos = filename.find_last_of("/\\");
    std::string base = slash_pos == std::string::npos
        ? filename : filename.substr(slash_pos + 1);

    size_t dot_pos = base.rfind('.');
    if (dot_pos == std::string::npos || dot_pos == base.length() - 1) {
        return "";
    }

    std::string ext = to_lower(base.substr(dot_pos));
    auto it = EXTENSION_MAP.find(ext);
    if (it != EXTENSION_MAP.end()) {
        return it->second;
    }

    return "";
}

std::string LanguageDetector::from_shebang(const std::string& content) {
    if (content.size() < 2 || content[0] != '#' || content[1] != '!') {
        return "";
    }

    size_t line_end = content.find('\n');
    if (line_end == std::string::npos) {
        line_end = content.length();
    }

    std::string shebang = content.substr(2, line_end - 2);
    if (!shebang.empty() && shebang.back() == '\r') {
        shebang.pop_back();
    }

    // Handle /usr/bin/env <interpreter>
    size_t env_pos = shebang.find("env ");
    if (env_pos != std::string::npos) {
        size_t interp_start = env_pos + 4;
        while (interp_start < shebang.length() && shebang[interp_start] == ' ') {
            interp_start++;
        }
        size_t interp_end = shebang.find_first_of(" \t\n", interp_start);
        if (interp_end == std::string::npos) {
            interp_end = shebang.length();
        }
        std::string interpreter = shebang.substr(interp_start, interp_end - interp_start);

        auto it = SHEBANG_MAP.find(interpreter);
        if (it != SHEBANG_MAP.end()) {
            return it->second;
        }
        return "";
    }

    // Handle direct path like /bin/bash
    size_t last_slash = shebang.rfind('/');
    if (last_slash != std::string::npos) {
        size_t interp_start = last_slash + 1;
        size_t interp_end = shebang.find_first_of(" \t\n", interp_start);
        if (interp_end == std::string::npos) {
            interp_end = shebang.length();
        }
        std::string interpreter = shebang.substr(interp_start, interp_end - interp_start);

        auto it = SHEBANG_MAP.find(interpreter);
        if (it != SHEBANG_MAP.end()) {
            return it->second;
        }
    }

    return "";
}

}  // namespace codesim
