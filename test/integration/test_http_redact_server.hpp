#ifndef PIIGUARD_TEST_INTEGRATION_TEST_HTTP_REDACT_SERVER_HPP
#define PIIGUARD_TEST_INTEGRATION_TEST_HTTP_REDACT_SERVER_HPP

#include <gtest/gtest.h>
#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

#include "config/redactor_config.hpp"
#include "network/http_redact_server.hpp"
#include "service/request.hpp"
#include "test_support.hpp"

// Routing is exercised through handle() without opening sockets, since
// listeners may be refused in sandboxed environments.
namespace {

piiguard::service::HttpResponse route(const piiguard::network::HttpRedactServer& server,
                                      const std::string& raw) {
    return server.handle(piiguard::service::parseRequest(raw));
}

} // namespace

TEST(HttpRedactServerTest, RedactRoute) {
    auto engine = piiguard::test::makePlaceholderEngine();
    piiguard::config::RedactorConfig cfg;
    piiguard::network::HttpRedactServer server(*engine, cfg);
    EXPECT_FALSE(server.IsRunning());

    auto resp = route(server, "POST /redact HTTP/1.1\r\nContent-Length: 16\r\n\r\npassword=hunter2");
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_EQ(resp.contentType, "application/json");
    EXPECT_NE(resp.body.find("\"redacted\":\"password=[REDACTED_SECRET]\""), std::string::npos);
    EXPECT_NE(resp.body.find("\"secrets\":1"), std::string::npos);
    EXPECT_NE(resp.body.find("\"pii_score\":73.0"), std::string::npos);
}

TEST(HttpRedactServerTest, EntitiesAndHealthRoutes) {
    auto engine = piiguard::test::makePlaceholderEngine();
    piiguard::config::RedactorConfig cfg;
    piiguard::network::HttpRedactServer server(*engine, cfg);

    auto entities = route(server, "POST /entities HTTP/1.1\r\nContent-Length: 5\r\n\r\nAlice");
    EXPECT_EQ(entities.statusCode, 200);
    EXPECT_EQ(entities.body, "{\"entities\":[],\"ner_available\":false}");

    auto health = route(server, "GET /health HTTP/1.1\r\n\r\n");
    EXPECT_EQ(health.statusCode, 200);
    EXPECT_EQ(health.body, "{\"status\":\"ok\"}");
}

TEST(HttpRedactServerTest, WrongMethodAndUnknownRoute) {
    auto engine = piiguard::test::makePlaceholderEngine();
    piiguard::config::RedactorConfig cfg;
    piiguard::network::HttpRedactServer server(*engine, cfg);

    auto wrong = route(server, "GET /redact HTTP/1.1\r\n\r\n");
    EXPECT_EQ(wrong.statusCode, 405);
    ASSERT_EQ(wrong.headers.size(), (size_t)1);
    EXPECT_EQ(wrong.headers[0].first, "Allow");
    EXPECT_EQ(wrong.headers[0].second, "POST");

    EXPECT_EQ(route(server, "POST /health HTTP/1.1\r\n\r\n").statusCode, 405);
    EXPECT_EQ(route(server, "GET /metrics HTTP/1.1\r\n\r\n").statusCode, 404);
}

TEST(HttpRedactServerTest, EntitiesRouteWithGazetteer) {
    piiguard::core::Capabilities caps = piiguard::core::Capabilities::none();
    caps.recognizer = piiguard::test::makeSampleGazetteer();
    piiguard::core::RedactionEngine engine(std::move(caps), piiguard::config::NerMode::ADVISORY);
    piiguard::config::RedactorConfig cfg;
    piiguard::network::HttpRedactServer server(engine, cfg);

    auto resp = route(server, "POST /entities HTTP/1.1\r\nContent-Length: 6\r\n\r\nFrance");
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_EQ(resp.body,
              "{\"entities\":[{\"text\":\"France\",\"label\":\"GPE\",\"start\":0,\"end\":6}],"
              "\"ner_available\":true}");
}

TEST(HttpRedactServerTest, ScopedSocketClosesWhenHandlerThrows) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);

    EXPECT_THROW(
        {
            piiguard::network::ScopedSocket conn(fds[0]);
            throw std::runtime_error("handler failed");
        },
        std::runtime_error);

    errno = 0;
    EXPECT_EQ(fcntl(fds[0], F_GETFD), -1);
    EXPECT_EQ(errno, EBADF);
    // the peer sees an orderly shutdown
    char c;
    EXPECT_EQ(recv(fds[1], &c, 1, 0), 0);
    close(fds[1]);
}

TEST(HttpRedactServerTest, LargeSingleLineBody) {
    auto engine = piiguard::test::makePlaceholderEngine();
    piiguard::config::RedactorConfig cfg;
    piiguard::network::HttpRedactServer server(*engine, cfg);

    piiguard::service::HttpRequest req;
    req.method = "POST";
    req.path = "/redact";
    req.version = "HTTP/1.1";
    req.body = std::string(1 << 20, 'A');
    auto resp = server.handle(req);
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_NE(resp.body.find("\"pii_score\":0.0"), std::string::npos);
}

#endif // PIIGUARD_TEST_INTEGRATION_TEST_HTTP_REDACT_SERVER_HPP
