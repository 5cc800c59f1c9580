#ifndef PIIGUARD_UTIL_JSON_HPP
#define PIIGUARD_UTIL_JSON_HPP

#include <string>
#include <sstream>
#include <iomanip>
#include <cstdio>

/**
 * @file json.hpp
 * @brief Small JSON writing helpers. The payloads PiiGuard emits are flat and
 *        fixed-shape, so they are assembled with ostringstream.
 */

namespace piiguard {
namespace util {
namespace json {

namespace detail {

// Length of the valid UTF-8 sequence starting at s[i], or 0 if it is malformed.
inline size_t utf8SequenceLength(const std::string &s, size_t i)
{
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t len = 0;
    unsigned int minCode = 0;
    unsigned int code = 0;
    if (c >= 0xC2 && c <= 0xDF)      { len = 2; code = c & 0x1F; minCode = 0x80; }
    else if (c >= 0xE0 && c <= 0xEF) { len = 3; code = c & 0x0F; minCode = 0x800; }
    else if (c >= 0xF0 && c <= 0xF4) { len = 4; code = c & 0x07; minCode = 0x10000; }
    else return 0;

    if (i + len > s.size()) {
        return 0;
    }
    for (size_t k = 1; k < len; ++k) {
        unsigned char cc = static_cast<unsigned char>(s[i + k]);
        if ((cc & 0xC0) != 0x80) {
            return 0;
        }
        code = (code << 6) | (cc & 0x3F);
    }
    if (code < minCode || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        return 0;
    }
    return len;
}

} // namespace detail

/**
 * @brief Escape a string for use inside JSON quotes.
 *        Bytes that are not valid UTF-8 become U+FFFD so the output is always valid JSON.
 */
inline std::string escapeString(const std::string &in)
{
    std::ostringstream oss;
    size_t i = 0;
    while (i < in.size()) {
        char c = in[i];
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= 0x80) {
            size_t len = detail::utf8SequenceLength(in, i);
            if (len == 0) {
                oss << "\\ufffd";
                ++i;
            } else {
                oss.write(in.data() + i, static_cast<std::streamsize>(len));
                i += len;
            }
            continue;
        }
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (uc < 0x20 || uc == 0x7f) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(uc)
                    << std::dec;
            } else {
                oss << c;
            }
            break;
        }
        ++i;
    }
    return oss.str();
}

inline std::string quote(const std::string &in)
{
    return "\"" + escapeString(in) + "\"";
}

inline const char* boolean(bool b)
{
    return b ? "true" : "false";
}

// A score already rounded to one decimal, written as "12.3" / "0.0".
inline std::string oneDecimal(double value)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

} // namespace json
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_JSON_HPP
