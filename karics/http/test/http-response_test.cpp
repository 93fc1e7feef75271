#include "karics/http-response.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "karics/http-header.hpp"
#include "karics/http-status-code.hpp"
#include "karics/raw-chars.hpp"

namespace karics {

namespace {

std::string Serialize(const HttpResponse& response, const ResponseSerializeOptions& options = {}) {
  RawChars out;
  SerializeResponse(response, options, out);
  return std::string(std::string_view(out));
}

}  // namespace

TEST(HttpResponse, DefaultReasonPhrase) {
  HttpResponse response;
  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.reason(), "OK");
  response.status(http::StatusCodeNotFound);
  EXPECT_EQ(response.reason(), "Not Found");
  response.status(http::StatusCodeOK, "Fine");
  EXPECT_EQ(response.reason(), "Fine");
}

TEST(HttpResponse, JsonAndTextFactories) {
  const HttpResponse json = HttpResponse::Json(http::StatusCodeCreated, R"({"id":1})");
  EXPECT_EQ(json.status(), http::StatusCodeCreated);
  EXPECT_EQ(json.headerValue("content-type"), "application/json");
  EXPECT_EQ(json.body(), R"({"id":1})");

  const HttpResponse text = HttpResponse::Text(http::StatusCodeBadRequest, "oops");
  EXPECT_EQ(text.headerValue("Content-Type"), "text/plain");
  EXPECT_EQ(text.body(), "oops");
}

TEST(HttpResponse, RejectsStatusOutsideValidRange) {
  EXPECT_THROW(HttpResponse(42), std::invalid_argument);
  EXPECT_THROW(HttpResponse(600), std::invalid_argument);
  EXPECT_THROW(HttpResponse(0, "Zero"), std::invalid_argument);
  EXPECT_NO_THROW(HttpResponse(100));
  EXPECT_NO_THROW(HttpResponse(599));

  HttpResponse response;
  EXPECT_THROW(response.status(1000), std::invalid_argument);
  EXPECT_THROW(response.status(99, "Low"), std::invalid_argument);
  EXPECT_EQ(response.status(), http::StatusCodeOK);
}

TEST(HttpResponse, RejectsReasonWithLineBreak) {
  EXPECT_THROW(HttpResponse(http::StatusCodeOK, "OK\r\nSet-Cookie: a=1"), std::invalid_argument);
  HttpResponse response;
  EXPECT_THROW(response.status(http::StatusCodeOK, "OK\n"), std::invalid_argument);
  EXPECT_EQ(response.reason(), "OK");
}

TEST(HttpResponse, RejectsInvalidHeaderName) {
  HttpResponse response;
  EXPECT_THROW(response.header("", "v"), std::invalid_argument);
  EXPECT_THROW(response.header("X Space", "v"), std::invalid_argument);
  EXPECT_THROW(response.header("X-Colon:", "v"), std::invalid_argument);
  EXPECT_THROW(response.header("X-Line\r\n", "v"), std::invalid_argument);
  EXPECT_TRUE(response.headers().empty());
}

TEST(HttpResponse, RejectsHeaderValueInjection) {
  HttpResponse response;
  EXPECT_THROW(response.header("X-Inject", "a\r\nSet-Cookie: evil=1"), std::invalid_argument);
  EXPECT_THROW(response.header("X-Inject", "a\nb"), std::invalid_argument);
  EXPECT_THROW(response.contentType("text/plain\r\n"), std::invalid_argument);
  EXPECT_TRUE(response.headers().empty());

  response.body("ok");
  EXPECT_EQ(Serialize(response), "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
}

TEST(HttpResponse, AcceptsTabAndEmptyHeaderValue) {
  HttpResponse response;
  response.header("X-Tab", "a\tb").header("X-Empty", "");
  EXPECT_EQ(response.headerValue("X-Tab"), "a\tb");
  EXPECT_EQ(response.headerValue("X-Empty"), "");
}

TEST(HttpResponse, BodyAcceptsLiteralStringViewAndString) {
  const char* cstr = "from pointer";
  HttpResponse response;
  EXPECT_EQ(response.body("literal").body(), "literal");
  EXPECT_EQ(response.body(cstr).body(), "from pointer");
  EXPECT_EQ(response.body(std::string_view("view")).body(), "view");
  std::string owned("owned");
  EXPECT_EQ(response.body(std::move(owned)).body(), "owned");
}

TEST(HttpResponse, HeadersKeepOrderAndDuplicates) {
  HttpResponse response;
  response.header("Set-Cookie", "a=1").header("X-Other", "x").header("Set-Cookie", "b=2");
  ASSERT_EQ(response.headers().size(), 3U);
  EXPECT_EQ(response.headers()[2], (http::Header{"Set-Cookie", "b=2"}));
  EXPECT_EQ(response.headerValue("set-cookie"), "a=1");
  EXPECT_FALSE(response.hasHeader("X-Missing"));
}

TEST(HttpResponse, BodyAppend) {
  HttpResponse response;
  response.body("Hello").appendBody(", ").appendBody("World");
  EXPECT_EQ(response.body(), "Hello, World");
  response.body(std::string("moved"));
  EXPECT_EQ(response.body(), "moved");
}

TEST(SerializeResponse, MinimalResponse) {
  HttpResponse response(http::StatusCodeOK);
  response.body("hi");
  EXPECT_EQ(Serialize(response), "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nhi");
}

TEST(SerializeResponse, EmptyBodyHasZeroContentLength) {
  EXPECT_EQ(Serialize(HttpResponse(http::StatusCodeNoContent)), "HTTP/1.1 204 No Content\r\nContent-Length: 0\r\n\r\n");
}

TEST(SerializeResponse, ServerHeadersAfterUserHeaders) {
  HttpResponse response = HttpResponse::Text(http::StatusCodeOK, "body");
  const std::vector<http::Header> globalHeaders{{"X-Frame-Options", "DENY"}, {"X-Global", "g"}};
  ResponseSerializeOptions options;
  options.serverName = "srv";
  options.date = "Thu, 01 Jan 1970 00:00:00 GMT";
  options.globalHeaders = globalHeaders;
  options.connection = ResponseSerializeOptions::ConnectionDirective::KeepAlive;
  EXPECT_EQ(Serialize(response, options),
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: text/plain\r\n"
            "Server: srv\r\n"
            "Date: Thu, 01 Jan 1970 00:00:00 GMT\r\n"
            "X-Frame-Options: DENY\r\n"
            "X-Global: g\r\n"
            "Connection: keep-alive\r\n"
            "Content-Length: 4\r\n"
            "\r\n"
            "body");
}

TEST(SerializeResponse, UserHeadersWinOverServerOnes) {
  HttpResponse response;
  response.header("server", "custom").header("X-Frame-Options", "SAMEORIGIN").header("Connection", "close");
  const std::vector<http::Header> globalHeaders{{"X-Frame-Options", "DENY"}};
  ResponseSerializeOptions options;
  options.serverName = "srv";
  options.globalHeaders = globalHeaders;
  options.connection = ResponseSerializeOptions::ConnectionDirective::KeepAlive;
  EXPECT_EQ(Serialize(response, options),
            "HTTP/1.1 200 OK\r\n"
            "server: custom\r\n"
            "X-Frame-Options: SAMEORIGIN\r\n"
            "Connection: close\r\n"
            "Content-Length: 0\r\n"
            "\r\n");
}

TEST(SerializeResponse, CloseDirective) {
  ResponseSerializeOptions options;
  options.connection = ResponseSerializeOptions::ConnectionDirective::Close;
  EXPECT_EQ(Serialize(HttpResponse(http::StatusCodeOK), options),
            "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 0\r\n\r\n");
}

TEST(SerializeResponse, OmitBodyKeepsContentLength) {
  HttpResponse response;
  response.body("12345");
  ResponseSerializeOptions options;
  options.omitBody = true;
  EXPECT_EQ(Serialize(response, options), "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\n");
}

TEST(SerializeResponse, CustomReasonAndUnknownStatus) {
  EXPECT_EQ(Serialize(HttpResponse(299)), "HTTP/1.1 299 Unknown\r\nContent-Length: 0\r\n\r\n");
  EXPECT_EQ(Serialize(HttpResponse(http::StatusCodeOK, "All Good")),
            "HTTP/1.1 200 All Good\r\nContent-Length: 0\r\n\r\n");
}

TEST(SerializeResponse, AppendsToExistingBuffer) {
  RawChars out;
  SerializeResponse(HttpResponse(http::StatusCodeOK), out);
  const auto firstSize = out.size();
  SerializeResponse(HttpResponse(http::StatusCodeNotFound), out);
  EXPECT_EQ(std::string_view(out).substr(firstSize), "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\n\r\n");
}

}  // namespace karics
