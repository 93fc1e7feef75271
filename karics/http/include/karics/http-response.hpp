#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "karics/http-header.hpp"
#include "karics/http-status-code.hpp"
#include "karics/raw-chars.hpp"

namespace karics {

// HTTP response built by a handler (or by the server for its default error paths).
// Headers are kept in append order without any implicit deduplication; the body is owned.
// Status codes outside [100, 599], header names that are not tokens and header values or reasons containing
// control characters (CR / LF included) are rejected with std::invalid_argument.
class HttpResponse {
 public:
  // Reason phrase defaults to the canonical one of the status code.
  explicit HttpResponse(http::StatusCode status = http::StatusCodeOK);

  HttpResponse(http::StatusCode status, std::string_view reason);

  // Response with 'Content-Type: application/json' and given body.
  static HttpResponse Json(http::StatusCode status, std::string_view body);

  // Response with 'Content-Type: text/plain' and given body.
  static HttpResponse Text(http::StatusCode status, std::string_view body);

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] std::string_view reason() const noexcept { return _reason; }

  [[nodiscard]] std::span<const http::Header> headers() const noexcept { return _headers; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Value of the first header with given name (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  [[nodiscard]] bool hasHeader(std::string_view name) const noexcept { return headerValue(name).has_value(); }

  // Sets the status code and its canonical reason phrase.
  HttpResponse& status(http::StatusCode status);

  HttpResponse& status(http::StatusCode status, std::string_view reason);

  // Appends a header. Several headers with the same name are all emitted.
  HttpResponse& header(std::string_view name, std::string_view value);

  HttpResponse& contentType(std::string_view value) { return header("Content-Type", value); }

  HttpResponse& body(std::string_view body);

  HttpResponse& body(const char* body) { return this->body(std::string_view(body)); }

  HttpResponse& body(std::string&& body) noexcept;

  HttpResponse& appendBody(std::string_view data);

  bool operator==(const HttpResponse&) const noexcept = default;

 private:
  http::StatusCode _status;
  std::string _reason;
  std::vector<http::Header> _headers;
  std::string _body;
};

// Headers and framing decisions added by the server on top of the handler's response.
struct ResponseSerializeOptions {
  enum class ConnectionDirective : uint8_t { None, KeepAlive, Close };

  // Appended if absent from the response.
  std::span<const http::Header> globalHeaders;
  // Server header value if absent from the response (empty: none).
  std::string_view serverName;
  // Date header value if absent from the response (empty: none).
  std::string_view date;
  ConnectionDirective connection{ConnectionDirective::None};
  // Responses to HEAD requests keep their Content-Length but carry no body bytes.
  bool omitBody{false};
};

// Appends the wire representation of the response to 'out':
//   HTTP/1.1 <code> <reason>\r\n
//   <name>: <value>\r\n for each response header in append order, then the server computed ones
//   \r\n
//   <body>
// A Content-Length header consistent with the body is added if the response does not set one.
void SerializeResponse(const HttpResponse& response, const ResponseSerializeOptions& options, RawChars& out);

inline void SerializeResponse(const HttpResponse& response, RawChars& out) { SerializeResponse(response, {}, out); }

}  // namespace karics
