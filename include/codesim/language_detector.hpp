#pragma once

#include <string>
#include <vector>

namespace codesim {

/**
 * Lexical rules that differ between languages.
 *
 * Block comments and // line comments are always recognised; a grammar only
 * adds the markers specific to its language.
 */
struct Grammar {
    std::string language = "text";
    std::vector<std::string> line_comment_markers;
};

/**
 * Detects programming language from file content and/or filename.
 *
 * Detection priority:
 * 1. Shebang line (#!/bin/bash, #!/usr/bin/env python)
 * 2. File extension mapping
 * 3. Returns "text" if unknown
 */
class LanguageDetector {
public:
    /**
     * Detect language from content and optional filename.
     *
     * @param content The file content (checks shebang)
     * @param filename Optional filename (checks extension)
     * @return Detected language name (lowercase)
     */
    static std::string detect(const std::string& content,
                             const std::string& filename = "");

    /**
     * Grammar used to tokenize a file of the given language.
     */
    static Grammar grammar_for(const std::string& language);

    /**
     * Convenience: detect, then look up the grammar.
     */
    static Grammar grammar_for_file(const std::string& content,
                                    const std::string& filename);

private:
    static std::string from_extension(const std::string& filename);
    static std::string from_shebang(const std::string& content);
};

}  // namespace codesim
