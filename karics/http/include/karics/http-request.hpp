#pragma once

#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "karics/http-header.hpp"
#include "karics/http-method.hpp"
#include "karics/http-version.hpp"

namespace karics {

class RequestParser;

// Parsed HTTP/1.x request.
// All views reference the buffer of the RequestParser that produced it and are valid only until the next
// feed of this parser: a service must not retain a HttpRequest (nor any of its views) past its call.
class HttpRequest {
 public:
  HttpRequest() noexcept = default;

  [[nodiscard]] http::Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view methodStr() const noexcept { return http::MethodToStr(_method); }

  // Request target as received (path + optional '?' query).
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // Path part of the target (before '?').
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // Query part of the target (after '?', empty if none).
  [[nodiscard]] std::string_view query() const noexcept { return _query; }

  [[nodiscard]] http::Version version() const noexcept { return _version; }

  // Header lines in arrival order, duplicates preserved.
  [[nodiscard]] std::span<const http::HeaderView> headers() const noexcept { return _headers; }

  // Value of the first header with given name (case-insensitive), if any.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept;

  // Value of the first header with given name (case-insensitive), empty if absent.
  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return headerValue(name).value_or(std::string_view{});
  }

  // Decoded body (de-chunked if it was sent with chunked transfer encoding).
  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Whether the client asks to keep the connection open after this exchange.
  // HTTP/1.1 defaults to keep-alive unless 'Connection: close'; HTTP/1.0 defaults to close unless
  // 'Connection: keep-alive'.
  [[nodiscard]] bool wantKeepAlive() const noexcept;

 private:
  friend class RequestParser;

  void clear() noexcept;

  http::Method _method{http::Method::GET};
  http::Version _version{http::HTTP_1_1};
  std::string_view _target;
  std::string_view _path;
  std::string_view _query;
  std::string_view _body;
  std::vector<http::HeaderView> _headers;
};

}  // namespace karics
