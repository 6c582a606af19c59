#pragma once

#include <cctype>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>

namespace Shield::Common {

inline bool isSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

inline bool isIdentChar(char c) noexcept {
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_';
}

inline char toLowerAscii(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

/// Copy src into a fixed buffer, always NUL-terminated
inline void copyBounded(char* dst, size_t cap, std::string_view src) noexcept {
    if (cap == 0) return;
    const size_t n = src.size() < cap - 1 ? src.size() : cap - 1;
    if (n > 0) {
        std::memcpy(dst, src.data(), n);
    }
    dst[n] = '\0';
}

/// Byte length of the well-formed UTF-8 sequence at the start of s, 0 when
/// the leading bytes are not one (overlong, surrogate, truncated or > U+10FFFF)
inline size_t utf8SequenceLength(std::string_view s) noexcept {
    if (s.empty()) return 0;
    const auto b0 = static_cast<unsigned char>(s[0]);
    if (b0 < 0x80) return 1;

    size_t len;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (s.size() < len) return 0;

    const auto b1 = static_cast<unsigned char>(s[1]);
    if (b1 < lo || b1 > hi) return 0;
    for (size_t i = 2; i < len; ++i) {
        const auto b = static_cast<unsigned char>(s[i]);
        if (b < 0x80 || b > 0xBF) return 0;
    }
    return len;
}

/// Like copyBounded, but never splits a UTF-8 sequence at the cut and
/// replaces ill-formed bytes with '?'. The result is always valid UTF-8.
inline void copyUtf8Bounded(char* dst, size_t cap, std::string_view src) noexcept {
    if (cap == 0) return;
    size_t out = 0;
    size_t in = 0;
    while (in < src.size()) {
        const size_t len = utf8SequenceLength(src.substr(in));
        const size_t need = len == 0 ? 1 : len;
        if (out + need > cap - 1) break;
        if (len == 0) {
            dst[out++] = '?';
            ++in;
        } else {
            std::memcpy(dst + out, src.data() + in, len);
            out += len;
            in += len;
        }
    }
    dst[out] = '\0';
}

/// Append src with ill-formed UTF-8 bytes replaced by '?'
inline void appendValidUtf8(std::string_view src, std::string* out) {
    size_t in = 0;
    while (in < src.size()) {
        const size_t len = utf8SequenceLength(src.substr(in));
        if (len == 0) {
            out->push_back('?');
            ++in;
        } else {
            out->append(src.data() + in, len);
            in += len;
        }
    }
}

inline std::string_view trimView(std::string_view s) noexcept {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isSpace(s[b])) ++b;
    while (e > b && isSpace(s[e - 1])) --e;
    return s.substr(b, e - b);
}

/// Position of needle in hay, comparing ASCII case-insensitively
inline size_t findNoCase(std::string_view hay, std::string_view needle) noexcept {
    if (needle.empty()) return 0;
    if (needle.size() > hay.size()) return std::string_view::npos;
    const size_t last = hay.size() - needle.size();
    for (size_t i = 0; i <= last; ++i) {
        size_t j = 0;
        while (j < needle.size() && toLowerAscii(hay[i + j]) == toLowerAscii(needle[j])) {
            ++j;
        }
        if (j == needle.size()) return i;
    }
    return std::string_view::npos;
}

inline size_t findToken(std::string_view hay, std::string_view needle, bool case_sensitive) noexcept {
    return case_sensitive ? hay.find(needle) : findNoCase(hay, needle);
}

inline bool startsWith(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool endsWith(std::string_view s, std::string_view suffix) noexcept {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool equalsNoCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (toLowerAscii(a[i]) != toLowerAscii(b[i])) return false;
    }
    return true;
}

} // namespace Shield::Common
