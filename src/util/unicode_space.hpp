#ifndef PIIGUARD_UTIL_UNICODE_SPACE_HPP
#define PIIGUARD_UTIL_UNICODE_SPACE_HPP

#include <string>

/**
 * @file unicode_space.hpp
 * @brief Whitespace and line-break classification of UTF-8 text.
 *
 * Text is handled as bytes everywhere else, so these helpers look for the
 * encoded form of the Unicode separators directly:
 *
 *   whitespace:  \t \n \v \f \r, space, \x1c-\x1f, U+0085, U+00A0, U+1680,
 *                U+2000-U+200A, U+2028, U+2029, U+202F, U+205F, U+3000
 *   line breaks: \n, \r, "\r\n", \v, \f, \x1c, \x1d, \x1e, U+0085, U+2028, U+2029
 *
 * Bytes that are not valid UTF-8 are never whitespace.
 */

namespace piiguard {
namespace util {
namespace unicode {

inline bool isAsciiSpace(unsigned char c)
{
    return c == ' ' || (c >= '\t' && c <= '\r') || (c >= 0x1c && c <= 0x1f);
}

/**
 * @brief Byte length of the multi-byte whitespace character starting at s[i], or 0.
 */
inline size_t multiByteSpaceAt(const std::string &s, size_t i)
{
    if (i + 1 >= s.size()) {
        return 0;
    }
    unsigned char b0 = static_cast<unsigned char>(s[i]);
    unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
    if (b0 == 0xC2) {
        return (b1 == 0x85 || b1 == 0xA0) ? 2 : 0;
    }
    if (i + 2 >= s.size()) {
        return 0;
    }
    unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
    switch (b0) {
    case 0xE1:
        return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
    case 0xE2:
        if (b1 == 0x80) {
            return (b2 <= 0x8A && b2 >= 0x80) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF ? 3 : 0;
        }
        return (b1 == 0x81 && b2 == 0x9F) ? 3 : 0;
    case 0xE3:
        return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
    default:
        return 0;
    }
}

/**
 * @brief Byte length of the whitespace character starting at s[i], or 0.
 */
inline size_t spaceAt(const std::string &s, size_t i)
{
    if (i >= s.size()) {
        return 0;
    }
    if (isAsciiSpace(static_cast<unsigned char>(s[i]))) {
        return 1;
    }
    return multiByteSpaceAt(s, i);
}

/**
 * @brief True when s[i..] ends before a multi-byte whitespace character could be complete.
 *
 * Used by callers that see text in chunks: such a tail has to wait for the
 * next chunk before it can be classified.
 */
inline bool mayBeTruncatedSpace(const std::string &s, size_t i)
{
    unsigned char b0 = static_cast<unsigned char>(s[i]);
    size_t remaining = s.size() - i;
    if (b0 == 0xC2) {
        return remaining < 2;
    }
    if (b0 >= 0xE1 && b0 <= 0xE3) {
        return remaining < 3;
    }
    return false;
}

/**
 * @brief Byte length of the line break starting at s[i], "\r\n" included, or 0.
 */
inline size_t lineBreakAt(const std::string &s, size_t i)
{
    if (i >= s.size()) {
        return 0;
    }
    switch (s[i]) {
    case '\r':
        return (i + 1 < s.size() && s[i + 1] == '\n') ? 2 : 1;
    case '\n': case '\v': case '\f':
    case '\x1c': case '\x1d': case '\x1e':
        return 1;
    default:
        break;
    }
    size_t n = multiByteSpaceAt(s, i);
    if (n == 2 && static_cast<unsigned char>(s[i + 1]) == 0x85) {
        return 2;
    }
    if (n == 3 && static_cast<unsigned char>(s[i]) == 0xE2 && static_cast<unsigned char>(s[i + 1]) == 0x80) {
        unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
        return (b2 == 0xA8 || b2 == 0xA9) ? 3 : 0;
    }
    return 0;
}

/**
 * @brief Offset of the first multi-byte whitespace character in s[from, to), or to.
 */
inline size_t findMultiByteSpace(const std::string &s, size_t from, size_t to)
{
    for (size_t i = from; i < to; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c == 0xC2 || (c >= 0xE1 && c <= 0xE3)) && multiByteSpaceAt(s, i) != 0) {
            return i;
        }
    }
    return to;
}

} // namespace unicode
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_UNICODE_SPACE_HPP
