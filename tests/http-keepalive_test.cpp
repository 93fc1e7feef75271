#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <string_view>
#include <thread>

#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/http-server-config.hpp"
#include "karics/http-status-code.hpp"
#include "karics/router.hpp"
#include "karics/test-server.hpp"
#include "karics/test-util.hpp"

using namespace std::chrono_literals;
using namespace karics;

namespace {

Router MakeEchoPathRouter() {
  Router router;
  router.get("/close", RouteHandler([](const RouteParams&) {
               HttpResponse response = HttpResponse::Text(http::StatusCodeOK, "bye");
               response.header("Connection", "close");
               return response;
             }));
  router.route(http::kAllMethods, "/", RequestRouteHandler([](const HttpRequest& request, const RouteParams&) {
                 return HttpResponse::Text(http::StatusCodeOK, std::string("ECHO") + std::string(request.path()));
               }),
               MatchType::Prefix);
  return router;
}

std::string BuildGet(std::string_view target, std::string_view extraHeaders = "",
                     std::string_view version = "HTTP/1.1") {
  std::string req("GET ");
  req.append(target).append(" ").append(version).append("\r\nHost: x\r\n").append(extraHeaders).append("\r\n");
  return req;
}

}  // namespace

TEST(HttpKeepAlive, MultipleSequentialRequests) {
  test::TestServer ts(HttpServerConfig{}, MakeEchoPathRouter());
  test::ClientConnection cnx(ts.port());
  const int fd = cnx.fd();

  ASSERT_TRUE(test::sendAll(fd, BuildGet("/one")));
  const auto resp1 = test::parseResponseOrThrow(test::recvWithTimeout(fd));
  EXPECT_EQ(resp1.body, "ECHO/one");
  EXPECT_FALSE(resp1.hasHeader("Connection"));

  ASSERT_TRUE(test::sendAll(fd, BuildGet("/two", "Connection: keep-alive\r\n")));
  const auto resp2 = test::parseResponseOrThrow(test::recvWithTimeout(fd));
  EXPECT_EQ(resp2.body, "ECHO/two");

  ASSERT_TRUE(test::sendAll(fd, BuildGet("/three", "Connection: close\r\n")));
  const auto resp3 = test::parseResponseOrThrow(test::recvWithTimeout(fd));
  EXPECT_EQ(resp3.body, "ECHO/three");
  EXPECT_EQ(resp3.headerOrEmpty("Connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(fd, 1s));
}

TEST(HttpKeepAlive, Http10ClosesByDefault) {
  test::TestServer ts(HttpServerConfig{}, MakeEchoPathRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/old", "", "HTTP/1.0")));
  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.version, "HTTP/1.1");
  EXPECT_EQ(resp.body, "ECHO/old");
  EXPECT_EQ(resp.headerOrEmpty("Connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}

TEST(HttpKeepAlive, Http10KeepAliveOptIn) {
  test::TestServer ts(HttpServerConfig{}, MakeEchoPathRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/a", "Connection: Keep-Alive\r\n", "HTTP/1.0")));
  const auto resp1 = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp1.headerOrEmpty("Connection"), "keep-alive");

  ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/b", "", "HTTP/1.0")));
  const auto resp2 = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp2.body, "ECHO/b");
  EXPECT_EQ(resp2.headerOrEmpty("Connection"), "close");
}

TEST(HttpKeepAlive, MaxRequestsPerConnection) {
  test::TestServer ts(HttpServerConfig{}.withMaxRequestsPerConnection(2), MakeEchoPathRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/1")));
  EXPECT_FALSE(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).hasHeader("Connection"));
  ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/2")));
  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).headerOrEmpty("Connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}

TEST(HttpKeepAlive, KeepAliveDisabled) {
  test::TestServer ts(HttpServerConfig{}.withKeepAliveMode(false), MakeEchoPathRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/x", "Connection: keep-alive\r\n")));
  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).headerOrEmpty("Connection"), "close");
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}

TEST(HttpKeepAlive, HandlerRequestedClose) {
  test::TestServer ts(HttpServerConfig{}, MakeEchoPathRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/close")));
  const std::string raw = test::recvWithTimeout(cnx.fd());
  EXPECT_EQ(test::countOccurrences(raw, "Connection: close"), 1);
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 1s));
}

TEST(HttpKeepAlive, IdleTimeoutClosesConnection) {
  test::TestServer ts(HttpServerConfig{}.withKeepAliveTimeout(100ms), MakeEchoPathRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/idle")));
  EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).statusCode, http::StatusCodeOK);
  EXPECT_TRUE(test::WaitForPeerClose(cnx.fd(), 2s));
}

TEST(HttpKeepAlive, ActivityResetsIdleTimeout) {
  test::TestServer ts(HttpServerConfig{}.withKeepAliveTimeout(300ms), MakeEchoPathRouter());
  test::ClientConnection cnx(ts.port());
  for (int reqIdx = 0; reqIdx < 4; ++reqIdx) {
    std::this_thread::sleep_for(150ms);
    ASSERT_TRUE(test::sendAll(cnx.fd(), BuildGet("/alive")));
    EXPECT_EQ(test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd())).body, "ECHO/alive");
  }
}
