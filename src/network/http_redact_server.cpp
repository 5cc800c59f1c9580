#include "network/http_redact_server.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include "util/logger.hpp"

namespace piiguard {
namespace network {

namespace {

const int kPollIntervalMs = 250;
const int kSocketTimeoutSec = 10;

service::HttpResponse methodNotAllowed(const char* allow) {
    service::HttpResponse resp = service::errorResponse(405, "method not allowed");
    resp.headers.emplace_back("Allow", allow);
    return resp;
}

} // namespace

ScopedSocket::~ScopedSocket() {
    if (m_fd >= 0)
        close(m_fd);
}

bool HttpRedactServer::Start() {
    if (m_running.load())
        return false;

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        util::logger::error(std::string("HttpRedactServer: socket() failed: ") + std::strerror(errno));
        return false;
    }
    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(m_port);
    if (inet_pton(AF_INET, m_host.c_str(), &addr.sin_addr) != 1) {
        util::logger::error("HttpRedactServer: invalid IPv4 listen address '" + m_host + "'");
        close(fd);
        return false;
    }
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        util::logger::error("HttpRedactServer: bind to " + m_host + ":" + std::to_string(m_port)
                            + " failed: " + std::strerror(errno));
        close(fd);
        return false;
    }
    if (listen(fd, SOMAXCONN) < 0) {
        util::logger::error(std::string("HttpRedactServer: listen() failed: ") + std::strerror(errno));
        close(fd);
        return false;
    }

    m_listenFd = fd;
    m_pool = std::make_unique<util::ThreadPool>(m_workerThreads, std::max<size_t>(m_workerThreads, 1) * 16);
    m_running = true;
    m_thread = std::thread([this]() { run(); });
    util::logger::info("HttpRedactServer: listening on " + m_host + ":" + std::to_string(m_port)
                       + " with " + std::to_string(m_pool->size()) + " workers");
    return true;
}

void HttpRedactServer::Stop() {
    if (!m_running.load())
        return;
    m_running = false;
    if (m_thread.joinable())
        m_thread.join();
    if (m_listenFd >= 0) {
        close(m_listenFd);
        m_listenFd = -1;
    }
    // finishes in-flight connections before returning
    m_pool.reset();
    util::logger::info("HttpRedactServer: stopped");
}

void HttpRedactServer::run() {
    while (m_running.load()) {
        pollfd pfd{};
        pfd.fd = m_listenFd;
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, kPollIntervalMs);
        if (ready <= 0)
            continue;

        int client = accept(m_listenFd, nullptr, nullptr);
        if (client < 0)
            continue;

        timeval tv{};
        tv.tv_sec = kSocketTimeoutSec;
        setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(client, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        bool queued = m_pool->trySubmit([this, client]() {
            ScopedSocket conn(client);
            handleClient(conn.get());
        });
        if (!queued) {
            ScopedSocket conn(client);
            util::logger::warn("HttpRedactServer: worker backlog full, refusing connection");
            sendAll(conn.get(), service::errorResponse(503, "server busy").serialize(false));
        }
    }
}

int HttpRedactServer::readRequest(int fd, service::HttpRequest& req) const {
    std::string data;
    char buffer[4096];
    size_t headEnd;
    while ((headEnd = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > kMaxHeadBytes)
            return 400;
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return data.empty() ? -1 : 400;
        data.append(buffer, static_cast<size_t>(n));
    }

    uint64_t length = 0;
    try {
        req = service::parseRequestHead(data.substr(0, headEnd));
        length = req.contentLength();
    } catch (const std::exception& e) {
        util::logger::warn(std::string("HttpRedactServer: rejecting request: ") + e.what());
        return 400;
    }
    if (length > m_maxBodyBytes)
        return 413;

    req.body = data.substr(headEnd + 4);
    while (req.body.size() < length) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return 400;
        req.body.append(buffer, static_cast<size_t>(n));
    }
    req.body.resize(static_cast<size_t>(length));
    return 0;
}

void HttpRedactServer::handleClient(int fd) {
    service::HttpRequest req;
    int status = readRequest(fd, req);
    if (status < 0)
        return;

    service::HttpResponse resp = status == 0
        ? handle(req)
        : service::errorResponse(status, service::reasonPhrase(status));
    bool gzip = status == 0 && m_gzip && req.acceptsGzip();

    std::string wire;
    try {
        wire = resp.serialize(gzip);
    } catch (const std::exception& e) {
        util::logger::error(std::string("HttpRedactServer: serializing response failed: ") + e.what());
        wire = service::errorResponse(500, "internal error").serialize(false);
    }
    if (!sendAll(fd, wire))
        util::logger::warn("HttpRedactServer: client went away before the response was sent");

    util::logger::debug("HttpRedactServer: " + (status == 0 ? req.method + " " + req.path : std::string("-"))
                        + " -> " + std::to_string(resp.statusCode));
}

service::HttpResponse HttpRedactServer::handle(const service::HttpRequest& req) const {
    try {
        if (req.path == "/redact") {
            if (req.method != "POST")
                return methodNotAllowed("POST");
            return service::jsonResponse(200, m_engine.redact(req.body).toJson());
        }
        if (req.path == "/entities") {
            if (req.method != "POST")
                return methodNotAllowed("POST");
            return service::jsonResponse(
                200, core::entitiesToJson(m_engine.extractEntities(req.body), m_engine.nerAvailable()));
        }
        if (req.path == "/health") {
            if (req.method != "GET")
                return methodNotAllowed("GET");
            return service::jsonResponse(200, "{\"status\":\"ok\"}");
        }
        return service::errorResponse(404, "not found");
    } catch (const std::exception& e) {
        util::logger::error("HttpRedactServer: " + req.method + " " + req.path + " failed: " + e.what());
        return service::errorResponse(500, "internal error");
    }
}

bool HttpRedactServer::sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace network
} // namespace piiguard
