#ifndef PIIGUARD_SERVICE_REQUEST_HPP
#define PIIGUARD_SERVICE_REQUEST_HPP

#include <string>
#include <stdexcept>
#include <unordered_map>
#include <cctype>
#include <cstdint>
#include <algorithm>

/**
 * @file request.hpp
 * @brief Parses the HTTP/1.x requests the redaction host accepts into an HttpRequest.
 *
 * DESIGN GOALS:
 *   - Provide a basic "HttpRequest" struct: method, path (query stripped),
 *     query, version, headers (names lower-cased) and the raw body.
 *   - parseRequestHead() handles the request line plus header lines; the
 *     socket layer uses it once the blank line has arrived, then reads
 *     Content-Length bytes of body on its own.
 *   - parseRequest() handles a complete buffer (head + body) and is what the
 *     tests use.
 *   - Anything malformed throws std::runtime_error; the host answers 400.
 *   - No chunked transfer encoding; a body needs a Content-Length.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::service;
 *
 *   HttpRequest req = parseRequest("POST /redact HTTP/1.1\r\n"
 *                                  "Content-Length: 16\r\n\r\n"
 *                                  "password=hunter2");
 *   // req.method == "POST", req.path == "/redact", req.body == "password=hunter2"
 *   @endcode
 */

namespace piiguard {
namespace service {

/**
 * @struct HttpRequest
 * @brief One parsed HTTP request.
 */
struct HttpRequest
{
    std::string method;   ///< e.g. "GET", "POST"
    std::string path;     ///< e.g. "/redact"
    std::string query;    ///< text after '?', without it
    std::string version;  ///< "HTTP/1.0" or "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers; ///< lower-cased names
    std::string body;

    bool hasHeader(const std::string &name) const
    {
        return headers.find(name) != headers.end();
    }

    std::string header(const std::string &name) const
    {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }

    /**
     * @brief Declared body size; 0 when there is no Content-Length header.
     * @throw std::runtime_error if the header is not a plain decimal number.
     */
    uint64_t contentLength() const
    {
        auto it = headers.find("content-length");
        if (it == headers.end()) {
            return 0;
        }
        const std::string &v = it->second;
        if (v.empty() || v.size() > 19) {
            throw std::runtime_error("HttpRequest: invalid Content-Length '" + v + "'");
        }
        uint64_t n = 0;
        for (char c : v) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw std::runtime_error("HttpRequest: invalid Content-Length '" + v + "'");
            }
            n = n * 10 + static_cast<uint64_t>(c - '0');
        }
        return n;
    }

    bool acceptsGzip() const
    {
        std::string enc = header("accept-encoding");
        std::transform(enc.begin(), enc.end(), enc.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return enc.find("gzip") != std::string::npos;
    }
};

namespace detail {

inline std::string trimSpaces(const std::string &s)
{
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) {
        return "";
    }
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

inline bool isTokenChar(unsigned char c)
{
    return std::isalnum(c) || std::string("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) != std::string::npos;
}

} // namespace detail

/**
 * @brief Parse the request line and headers.
 * @param head Everything before the blank line, lines separated by "\r\n" (bare "\n" tolerated).
 */
inline HttpRequest parseRequestHead(const std::string &head)
{
    HttpRequest req;

    size_t lineEnd = head.find('\n');
    std::string requestLine = head.substr(0, lineEnd);
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }

    size_t sp1 = requestLine.find(' ');
    size_t sp2 = (sp1 == std::string::npos) ? std::string::npos : requestLine.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos
        || requestLine.find(' ', sp2 + 1) != std::string::npos) {
        throw std::runtime_error("parseRequestHead: malformed request line");
    }
    req.method = requestLine.substr(0, sp1);
    std::string target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
    req.version = requestLine.substr(sp2 + 1);

    if (req.method.empty()
        || !std::all_of(req.method.begin(), req.method.end(),
                        [](unsigned char c) { return std::isupper(c) != 0; })) {
        throw std::runtime_error("parseRequestHead: bad method");
    }
    if (target.empty() || target[0] != '/') {
        throw std::runtime_error("parseRequestHead: bad request target");
    }
    if (req.version != "HTTP/1.1" && req.version != "HTTP/1.0") {
        throw std::runtime_error("parseRequestHead: unsupported version '" + req.version + "'");
    }

    size_t q = target.find('?');
    req.path = target.substr(0, q);
    if (q != std::string::npos) {
        req.query = target.substr(q + 1);
    }

    size_t pos = (lineEnd == std::string::npos) ? head.size() : lineEnd + 1;
    while (pos < head.size()) {
        size_t end = head.find('\n', pos);
        std::string line = head.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        pos = (end == std::string::npos) ? head.size() : end + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw std::runtime_error("parseRequestHead: malformed header line");
        }
        std::string name = line.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(),
                         [](unsigned char c) { return detail::isTokenChar(c); })) {
            throw std::runtime_error("parseRequestHead: bad header name");
        }
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::string value = detail::trimSpaces(line.substr(colon + 1));
        auto it = req.headers.find(name);
        if (it != req.headers.end()) {
            if (name == "content-length") {
                if (it->second != value) {
                    throw std::runtime_error("parseRequestHead: conflicting Content-Length");
                }
            } else {
                it->second += ", " + value;
            }
        } else {
            req.headers.emplace(std::move(name), std::move(value));
        }
    }

    if (req.hasHeader("transfer-encoding")) {
        throw std::runtime_error("parseRequestHead: Transfer-Encoding is not supported");
    }
    // validates the header early
    req.contentLength();
    return req;
}

/**
 * @brief Parse a complete request buffer.
 * @throw std::runtime_error if the head is malformed or the body is shorter than Content-Length.
 */
inline HttpRequest parseRequest(const std::string &raw)
{
    size_t headEnd = raw.find("\r\n\r\n");
    size_t bodyStart = headEnd + 4;
    if (headEnd == std::string::npos) {
        headEnd = raw.find("\n\n");
        bodyStart = headEnd + 2;
    }
    if (headEnd == std::string::npos) {
        throw std::runtime_error("parseRequest: incomplete request head");
    }

    HttpRequest req = parseRequestHead(raw.substr(0, headEnd));
    uint64_t length = req.contentLength();
    if (raw.size() - bodyStart < length) {
        throw std::runtime_error("parseRequest: body shorter than Content-Length");
    }
    req.body = raw.substr(bodyStart, static_cast<size_t>(length));
    return req;
}

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_REQUEST_HPP
