#include <codesim/util/utf8.hpp>

#include <cstdint>

namespace codesim {

namespace {

inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

// Length of the well-formed sequence starting at i, or 0 if invalid
size_t valid_sequence_length(std::string_view s, size_t i) {
    const unsigned char c0 = static_cast<unsigned char>(s[i]);
    if (c0 < 0x80) return 1;

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return 0;

    if (i + len > s.size()) return 0;

    const unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
    if (!is_cont(c1)) return 0;
    if (len == 2) return 2;

    const unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
    if (!is_cont(c2)) return 0;

    if (len == 3) {
        // overlong / surrogate checks
        if (c0 == 0xE0 && c1 < 0xA0) return 0;
        if (c0 == 0xED && c1 >= 0xA0) return 0;
        return 3;
    }

    const unsigned char c3 = static_cast<unsigned char>(s[i + 3]);
    if (!is_cont(c3)) return 0;

    if (c0 == 0xF0 && c1 < 0x90) return 0;
    if (c0 == 0xF4 && c1 > 0x8F) return 0;
    return 4;
}

}  // namespace

std::string sanitize_utf8(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        size_t len = valid_sequence_length(s, i);
        if (len == 0) {
            out += UTF8_REPLACEMENT;
            ++i;
            continue;
        }
        out.append(s.data() + i, len);
        i += len;
    }

    return out;
}

bool is_valid_utf8(std::string_view s) {
    for (size_t i = 0; i < s.size();) {
        size_t len = valid_sequence_length(s, i);
        if (len == 0) return false;
        i += len;
    }
    return true;
}

}  // namespace codesim
