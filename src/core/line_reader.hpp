#ifndef PIIGUARD_CORE_LINE_READER_HPP
#define PIIGUARD_CORE_LINE_READER_HPP

#include <string>
#include <vector>
#include <istream>
#include "../util/unicode_space.hpp"

/**
 * @file line_reader.hpp
 * @brief Splits text into lines while keeping each line's terminator.
 *
 * Recognized terminators: "\n", "\r\n", "\r", "\v", "\f", "\x1c", "\x1d",
 * "\x1e" and the UTF-8 encoded U+0085, U+2028 and U+2029. Concatenating the
 * pieces always gives back the input exactly, and an empty input gives no lines.
 */

namespace piiguard {
namespace core {

inline std::vector<std::string> splitLinesKeepEnds(const std::string &text)
{
    std::vector<std::string> lines;
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        size_t n = util::unicode::lineBreakAt(text, i);
        if (n == 0) {
            ++i;
            continue;
        }
        lines.push_back(text.substr(start, i + n - start));
        start = i + n;
        i = start;
    }
    if (start < text.size()) {
        lines.push_back(text.substr(start));
    }
    return lines;
}

/**
 * @brief Read the next line from a stream, terminator included.
 * @return false once the stream is exhausted and nothing was read.
 */
inline bool readLineKeepEnd(std::istream &in, std::string &line)
{
    line.clear();
    std::streambuf *buf = in.rdbuf();
    if (!buf) {
        return false;
    }
    while (true) {
        int ch = buf->sbumpc();
        if (ch == std::char_traits<char>::eof()) {
            if (line.empty()) {
                in.setstate(std::ios::eofbit);
                return false;
            }
            return true;
        }
        char c = static_cast<char>(ch);
        line.push_back(c);
        switch (static_cast<unsigned char>(c)) {
        case '\r':
            if (buf->sgetc() == '\n') {
                line.push_back(static_cast<char>(buf->sbumpc()));
            }
            return true;
        case '\n': case '\v': case '\f':
        case 0x1c: case 0x1d: case 0x1e:
            return true;
        case 0xC2:
            // U+0085
            if (buf->sgetc() == 0x85) {
                line.push_back(static_cast<char>(buf->sbumpc()));
                return true;
            }
            break;
        case 0xE2:
            // U+2028, U+2029; a consumed 0x80 that leads elsewhere is ordinary text
            if (buf->sgetc() == 0x80) {
                line.push_back(static_cast<char>(buf->sbumpc()));
                int next = buf->sgetc();
                if (next == 0xA8 || next == 0xA9) {
                    line.push_back(static_cast<char>(buf->sbumpc()));
                    return true;
                }
            }
            break;
        default:
            break;
        }
    }
}

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_LINE_READER_HPP
