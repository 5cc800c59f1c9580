#ifndef PIIGUARD_SERVICE_RESPONSE_HPP
#define PIIGUARD_SERVICE_RESPONSE_HPP

#include <string>
#include <vector>
#include <utility>
#include <sstream>
#include "../util/compression.hpp"
#include "../util/json.hpp"

/**
 * @file response.hpp
 * @brief The HTTP response the redaction host writes back to a client.
 *
 * DESIGN GOALS:
 *   - Provide a minimal "HttpResponse" struct: status code, content type,
 *     body and any extra headers.
 *   - serialize() produces the full HTTP/1.1 message with Content-Length and
 *     "Connection: close"; with gzip=true the body is gzip-encoded first and
 *     Content-Encoding / Vary are added.
 *   - jsonResponse()/errorResponse() build the common shapes.
 *
 * USAGE EXAMPLE:
 *   @code
 *   using namespace piiguard::service;
 *
 *   HttpResponse resp = jsonResponse(200, "{\"status\":\"ok\"}");
 *   std::string wire = resp.serialize(false);
 *   // => "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n..."
 *   @endcode
 */

namespace piiguard {
namespace service {

inline const char* reasonPhrase(int status)
{
    switch (status) {
    case 200: return "OK";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
    }
}

/**
 * @struct HttpResponse
 * @brief A response ready to be serialized onto a socket.
 */
struct HttpResponse
{
    int statusCode = 200;
    std::string contentType = "application/json";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers; ///< extra headers, in order

    /**
     * @brief Render the complete message.
     * @param gzip Encode the body with gzip (caller checked Accept-Encoding).
     * @throw std::runtime_error if compression fails.
     */
    std::string serialize(bool gzip) const
    {
        std::string payload = gzip ? util::compression::gzipCompress(body) : body;

        std::ostringstream oss;
        oss << "HTTP/1.1 " << statusCode << " " << reasonPhrase(statusCode) << "\r\n";
        oss << "Content-Type: " << contentType << "\r\n";
        if (gzip) {
            oss << "Content-Encoding: gzip\r\n";
            oss << "Vary: Accept-Encoding\r\n";
        }
        for (const auto &h : headers) {
            oss << h.first << ": " << h.second << "\r\n";
        }
        oss << "Content-Length: " << payload.size() << "\r\n";
        oss << "Connection: close\r\n\r\n";
        oss << payload;
        return oss.str();
    }
};

inline HttpResponse jsonResponse(int status, std::string body)
{
    HttpResponse resp;
    resp.statusCode = status;
    resp.body = std::move(body);
    return resp;
}

// {"error":"<message>"}
inline HttpResponse errorResponse(int status, const std::string &message)
{
    return jsonResponse(status, "{\"error\":" + util::json::quote(message) + "}");
}

} // namespace service
} // namespace piiguard

#endif // PIIGUARD_SERVICE_RESPONSE_HPP
