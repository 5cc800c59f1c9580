#ifndef PIIGUARD_UTIL_COMPRESSION_HPP
#define PIIGUARD_UTIL_COMPRESSION_HPP

#include <string>
#include <stdexcept>
#include <cstring>
#include <zlib.h>

/**
 * @file compression.hpp
 * @brief gzip encoding of HTTP response bodies (zlib).
 *
 * compress2() produces a zlib stream, which browsers do not accept as
 * "Content-Encoding: gzip", so we drive deflate() directly with windowBits
 * 15 + 16 to get the gzip wrapper.
 */

namespace piiguard {
namespace util {
namespace compression {

/**
 * @brief gzip-compress a buffer.
 * @throw std::runtime_error if zlib reports an error.
 */
inline std::string gzipCompress(const std::string &input, int level = Z_DEFAULT_COMPRESSION)
{
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("compression::gzipCompress: deflateInit2 failed.");
    }

    std::string out;
    out.resize(deflateBound(&zs, static_cast<uLong>(input.size())) + 32);

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&zs, Z_FINISH);
    if (rc != Z_STREAM_END) {
        deflateEnd(&zs);
        throw std::runtime_error("compression::gzipCompress: deflate failed (" + std::to_string(rc) + ").");
    }
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

} // namespace compression
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_COMPRESSION_HPP
