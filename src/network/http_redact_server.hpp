#ifndef PIIGUARD_NETWORK_HTTP_REDACT_SERVER_HPP
#define PIIGUARD_NETWORK_HTTP_REDACT_SERVER_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include "../../config/redactor_config.hpp"
#include "../core/redaction_engine.hpp"
#include "../service/request.hpp"
#include "../service/response.hpp"
#include "../util/thread_pool.hpp"

namespace piiguard {
namespace network {

// Owns an accepted client descriptor; closes it on scope exit, exceptions included.
class ScopedSocket {
  public:
    explicit ScopedSocket(int fd) : m_fd(fd) {}
    ~ScopedSocket();

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    int get() const { return m_fd; }

  private:
    int m_fd;
};

/*
  HttpRedactServer
  --------------------------------------------------------
  A small HTTP/1.1 host in front of a RedactionEngine.
  One request per connection ("Connection: close"); each
  accepted socket is handed to the worker pool.

  Endpoints:
    POST /redact    -> RedactionResult JSON
    POST /entities  -> advisory NER spans
    GET  /health    -> {"status":"ok"}

  Bodies larger than maxBodyBytes are refused with 413.
  Responses are gzip-encoded when the client accepts it
  and gzipResponses is on.
*/
class HttpRedactServer {
  public:
    static constexpr size_t kMaxHeadBytes = 16 * 1024;

    HttpRedactServer(const core::RedactionEngine& engine, const config::RedactorConfig& cfg)
        : m_engine(engine), m_host(cfg.host), m_port(cfg.port), m_workerThreads(cfg.workerThreads),
          m_maxBodyBytes(cfg.maxBodyBytes), m_gzip(cfg.gzipResponses), m_listenFd(-1),
          m_running(false) {}

    ~HttpRedactServer() { Stop(); }

    HttpRedactServer(const HttpRedactServer&) = delete;
    HttpRedactServer& operator=(const HttpRedactServer&) = delete;

    // Binds and starts accepting. false if already running or the socket could not be set up.
    bool Start();

    void Stop();

    bool IsRunning() const { return m_running.load(); }

    // Route one parsed request. Never throws; faults become a 500.
    service::HttpResponse handle(const service::HttpRequest& req) const;

  private:
    void run();
    void handleClient(int fd);
    // 0 on success, -1 if the peer went away, otherwise the HTTP status to answer with
    int readRequest(int fd, service::HttpRequest& req) const;
    static bool sendAll(int fd, const std::string& data);

    const core::RedactionEngine& m_engine;
    std::string m_host;
    uint16_t m_port;
    uint16_t m_workerThreads;
    uint64_t m_maxBodyBytes;
    bool m_gzip;
    int m_listenFd;
    std::atomic_bool m_running;
    std::thread m_thread;
    std::unique_ptr<util::ThreadPool> m_pool;
};

} // namespace network
} // namespace piiguard

#endif // PIIGUARD_NETWORK_HTTP_REDACT_SERVER_HPP
