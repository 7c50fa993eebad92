#pragma once

#include <string>
#include <string_view>

namespace codesim {

// U+FFFD REPLACEMENT CHARACTER, UTF-8 encoded
constexpr const char* UTF8_REPLACEMENT = "\xEF\xBF\xBD";

/**
 * Copy of s with every invalid UTF-8 sequence replaced by U+FFFD.
 * Overlong forms, surrogates and code points above U+10FFFF count as invalid.
 */
std::string sanitize_utf8(std::string_view s);

// True if s is already well-formed UTF-8
bool is_valid_utf8(std::string_view s);

}  // namespace codesim
