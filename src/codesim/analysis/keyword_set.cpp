#include <codesim/analysis/keyword_set.hpp>

namespace codesim::analysis {

KeywordSet::KeywordSet()
    : words_(std::make_shared<const std::set<std::string>>()) {}

KeywordSet::KeywordSet(std::set<std::string> words)
    : words_(std::make_shared<const std::set<std::string>>(std::move(words))) {}

KeywordSet KeywordSet::with(const std::vector<std::string>& extra) const {
    std::set<std::string> merged = *words_;
    for (const auto& word : extra) {
        if (!word.empty()) {
            merged.insert(word);
        }
    }
    return KeywordSet(std::move(merged));
}

KeywordSet KeywordSet::java() {
    return KeywordSet({
        "abstract", "assert", "boolean", "break", "byte", "case", "catch",
        "char", "class", "const", "continue", "default", "do", "double",
        "else", "enum", "extends", "final", "finally", "float", "for",
        "goto", "if", "implements", "import", "instanceof", "int",
        "interface", "long", "native", "new", "package", "private",
        "protected", "public", "return", "short", "static", "strictfp",
        "super", "switch", "synchronized", "this", "throw", "throws",
        "transient", "try", "void", "volatile", "while",

        // Literals behave like keywords for shape matching
        "true", "false", "null"
    });
}

KeywordSet KeywordSet::javascript() {
    return KeywordSet({
        "break", "case", "catch", "class", "const", "continue", "debugger",
        "default", "delete", "do", "else", "export", "extends", "finally",
        "for", "function", "if", "import", "in", "instanceof", "let", "new",
        "return", "super", "switch", "this", "throw", "try", "typeof", "var",
        "void", "while", "with", "yield", "await", "async", "of", "from",

        // TypeScript
        "interface", "implements", "package", "private", "protected",
        "public", "enum", "type", "as", "any", "never", "unknown",
        "readonly", "global", "namespace", "declare", "module"
    });
}

KeywordSet KeywordSet::java_and_javascript() {
    const auto js = javascript();
    std::vector<std::string> extra(js.words().begin(), js.words().end());
    return java().with(extra);
}

}  // namespace codesim::analysis
