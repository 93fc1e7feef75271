#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
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

Router MakeCoreRouter() {
  Router router;
  router.get("/hello", RouteHandler([](const RouteParams&) { return HttpResponse::Text(http::StatusCodeOK, "Hello"); }));
  router.post("/echo", RequestRouteHandler([](const HttpRequest& request, const RouteParams&) {
                return HttpResponse::Text(http::StatusCodeOK, request.body());
              }));
  router.any(http::Method::GET | http::Method::HEAD, "/both",
             RouteHandler([](const RouteParams&) { return HttpResponse::Text(http::StatusCodeOK, "12345"); }));
  router.get("/boom", RouteHandler([](const RouteParams&) -> HttpResponse { throw std::runtime_error("boom"); }));
  router.get("/inject", RouteHandler([](const RouteParams&) {
               return HttpResponse(http::StatusCodeOK).header("X-Note", "a\r\nSet-Cookie: evil=1").body("ok");
             }));
  router.get("/path", RequestRouteHandler([](const HttpRequest& request, const RouteParams&) {
               return HttpResponse::Text(http::StatusCodeOK, request.path());
             }));
  return router;
}

}  // namespace

TEST(HttpCore, SimpleGet) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), {.target = "/hello"}));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.version, "HTTP/1.1");
  EXPECT_EQ(resp.reason, "OK");
  EXPECT_EQ(resp.body, "Hello");
  EXPECT_EQ(resp.headerOrEmpty("Content-Length"), "5");
  EXPECT_EQ(resp.headerOrEmpty("Content-Type"), "text/plain");
  EXPECT_EQ(resp.headerOrEmpty("Connection"), "close");
}

TEST(HttpCore, ServerComputedHeaders) {
  test::TestServer ts(HttpServerConfig{}.withGlobalHeader("X-Global", "on"), MakeCoreRouter());
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), {.target = "/hello"}));
  EXPECT_EQ(resp.headerOrEmpty("Server"), "Karics");
  const std::string date = resp.headerOrEmpty("Date");
  EXPECT_EQ(date.size(), 29U);
  EXPECT_TRUE(date.ends_with("GMT"));
  EXPECT_EQ(resp.headerOrEmpty("X-Content-Type-Options"), "nosniff");
  EXPECT_EQ(resp.headerOrEmpty("X-Frame-Options"), "DENY");
  EXPECT_EQ(resp.headerOrEmpty("X-Global"), "on");
}

TEST(HttpCore, ServerHeadersCanBeDisabled) {
  test::TestServer ts(HttpServerConfig{}.withServerName("").withDateHeader(false).withoutGlobalHeaders(),
                      MakeCoreRouter());
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), {.target = "/hello"}));
  EXPECT_FALSE(resp.hasHeader("Server"));
  EXPECT_FALSE(resp.hasHeader("Date"));
  EXPECT_FALSE(resp.hasHeader("X-Frame-Options"));
}

TEST(HttpCore, NotFoundJson) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), {.target = "/missing"}));
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotFound);
  EXPECT_EQ(resp.headerOrEmpty("Content-Type"), "application/json");
  EXPECT_EQ(resp.body, R"({"error": "Not Found"})");
}

TEST(HttpCore, QueryIsNotPartOfThePath) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), {.target = "/path?a=1&b=2"}));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "/path");
}

TEST(HttpCore, PostBodyEcho) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  const auto resp =
      test::parseResponseOrThrow(test::requestOrThrow(ts.port(), {.method = "POST", .target = "/echo", .body = "payload"}));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "payload");
}

TEST(HttpCore, ChunkedRequestBody) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(),
                            "POST /echo HTTP/1.1\r\nHost: x\r\nConnection: close\r\nTransfer-Encoding: chunked\r\n\r\n"
                            "5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n"));
  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "hello world");
}

TEST(HttpCore, RequestSentOneByteAtATime) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  test::ClientConnection cnx(ts.port());
  const std::string req = "POST /echo HTTP/1.1\r\nHost: x\r\nConnection: close\r\nContent-Length: 10\r\n\r\n0123456789";
  for (char ch : req) {
    ASSERT_TRUE(test::sendAll(cnx.fd(), std::string_view(&ch, 1)));
    std::this_thread::sleep_for(1ms);
  }
  const auto resp = test::parseResponseOrThrow(test::recvWithTimeout(cnx.fd()));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "0123456789");
}

TEST(HttpCore, PipelinedRequestsAnsweredInOrder) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  test::ClientConnection cnx(ts.port());
  ASSERT_TRUE(test::sendAll(cnx.fd(),
                            "GET /path?first HTTP/1.1\r\nHost: x\r\n\r\n"
                            "POST /echo HTTP/1.1\r\nHost: x\r\nContent-Length: 6\r\n\r\nsecond"
                            "GET /hello HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n"));
  const auto responses = test::parseResponses(test::recvUntilClosed(cnx.fd()));
  ASSERT_EQ(responses.size(), 3U);
  EXPECT_EQ(responses[0].body, "/path");
  EXPECT_EQ(responses[1].body, "second");
  EXPECT_EQ(responses[2].body, "Hello");
  EXPECT_EQ(responses[2].headerOrEmpty("Connection"), "close");
}

TEST(HttpCore, HeadOmitsBody) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  const std::string raw = test::requestOrThrow(ts.port(), {.method = "HEAD", .target = "/both"});
  const auto resp = test::parseResponse(raw, nullptr, false);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp->headerOrEmpty("Content-Length"), "5");
  EXPECT_TRUE(resp->body.empty());
  EXPECT_FALSE(raw.contains("12345"));
}

TEST(HttpCore, HandlerExceptionIsolated) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  const auto failed = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), {.target = "/boom"}));
  EXPECT_EQ(failed.statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(failed.body, "boom");

  const auto resp = test::parseResponseOrThrow(test::requestOrThrow(ts.port(), {.target = "/hello"}));
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
}

TEST(HttpCore, HeaderWithLineBreakBecomesServerError) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  const std::string raw = test::requestOrThrow(ts.port(), {.target = "/inject"});
  const auto resp = test::parseResponseOrThrow(raw);
  EXPECT_EQ(resp.statusCode, http::StatusCodeInternalServerError);
  EXPECT_FALSE(raw.contains("Set-Cookie"));
}

TEST(HttpCore, HandlerExceptionKeepsConnectionUsable) {
  test::TestServer ts(HttpServerConfig{}, MakeCoreRouter());
  const auto responses =
      test::sequentialRequests(ts.port(), {{.target = "/boom", .connection = ""}, {.target = "/hello"}});
  ASSERT_EQ(responses.size(), 2U);
  EXPECT_EQ(responses[0].statusCode, http::StatusCodeInternalServerError);
  EXPECT_EQ(responses[1].statusCode, http::StatusCodeOK);
}
