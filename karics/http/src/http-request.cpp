#include "karics/http-request.hpp"

#include <optional>
#include <string_view>

#include "karics/http-constants.hpp"
#include "karics/http-header.hpp"
#include "karics/http-version.hpp"
#include "karics/string-equal-ignore-case.hpp"

namespace karics {

std::optional<std::string_view> HttpRequest::headerValue(std::string_view name) const noexcept {
  for (const http::HeaderView& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return header.value;
    }
  }
  return std::nullopt;
}

bool HttpRequest::wantKeepAlive() const noexcept {
  // Several Connection headers are allowed, their values are combined as a single list.
  bool hasClose = false;
  bool hasKeepAlive = false;
  for (const http::HeaderView& header : _headers) {
    if (CaseInsensitiveEqual(header.name, http::Connection)) {
      hasClose = hasClose || ContainsTokenIgnoreCase(header.value, http::close);
      hasKeepAlive = hasKeepAlive || ContainsTokenIgnoreCase(header.value, http::keepalive);
    }
  }
  if (hasClose) {
    return false;
  }
  return _version == http::HTTP_1_1 || hasKeepAlive;
}

void HttpRequest::clear() noexcept {
  _method = http::Method::GET;
  _version = http::HTTP_1_1;
  _target = {};
  _path = {};
  _query = {};
  _body = {};
  _headers.clear();
}

}  // namespace karics
