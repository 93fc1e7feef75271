#include "karics/http-response.hpp"

#include <fmt/format.h>

#include <charconv>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "karics/http-constants.hpp"
#include "karics/http-header.hpp"
#include "karics/http-status-code.hpp"
#include "karics/raw-chars.hpp"
#include "karics/string-equal-ignore-case.hpp"

namespace karics {

namespace {

void AppendHeader(RawChars& out, std::string_view name, std::string_view value) {
  out.append(name);
  out.append(http::HeaderSep);
  out.append(value);
  out.append(http::CRLF);
}

template <class Integral>
void AppendInteger(RawChars& out, Integral value) {
  char buf[24];
  const auto res = std::to_chars(buf, buf + sizeof(buf), value);
  out.append(buf, static_cast<RawChars::size_type>(res.ptr - buf));
}

http::StatusCode CheckStatus(http::StatusCode status) {
  if (status < 100 || status > 599) [[unlikely]] {
    throw std::invalid_argument(fmt::format("Invalid HTTP status code {}, should be in [100, 599]", status));
  }
  return status;
}

std::string_view CheckReason(std::string_view reason) {
  if (!http::IsValidHeaderValue(reason)) [[unlikely]] {
    throw std::invalid_argument(fmt::format("Invalid reason phrase '{}'", reason));
  }
  return reason;
}

}  // namespace

HttpResponse::HttpResponse(http::StatusCode status)
    : _status(CheckStatus(status)), _reason(http::ReasonPhraseFor(status)) {}

HttpResponse::HttpResponse(http::StatusCode status, std::string_view reason)
    : _status(CheckStatus(status)), _reason(CheckReason(reason)) {}

HttpResponse HttpResponse::Json(http::StatusCode status, std::string_view body) {
  HttpResponse response(status);
  response.contentType(http::ContentTypeApplicationJson).body(body);
  return response;
}

HttpResponse HttpResponse::Text(http::StatusCode status, std::string_view body) {
  HttpResponse response(status);
  response.contentType(http::ContentTypeTextPlain).body(body);
  return response;
}

std::optional<std::string_view> HttpResponse::headerValue(std::string_view name) const noexcept {
  for (const http::Header& header : _headers) {
    if (CaseInsensitiveEqual(header.name, name)) {
      return header.value;
    }
  }
  return std::nullopt;
}

HttpResponse& HttpResponse::status(http::StatusCode status) {
  _status = CheckStatus(status);
  _reason = http::ReasonPhraseFor(status);
  return *this;
}

HttpResponse& HttpResponse::status(http::StatusCode status, std::string_view reason) {
  CheckReason(reason);
  _status = CheckStatus(status);
  _reason = reason;
  return *this;
}

HttpResponse& HttpResponse::header(std::string_view name, std::string_view value) {
  if (!http::IsValidHeaderName(name)) [[unlikely]] {
    throw std::invalid_argument(fmt::format("Invalid header name '{}'", name));
  }
  if (!http::IsValidHeaderValue(value)) [[unlikely]] {
    throw std::invalid_argument(fmt::format("Invalid value for header '{}'", name));
  }
  _headers.emplace_back(std::string(name), std::string(value));
  return *this;
}

HttpResponse& HttpResponse::body(std::string_view body) {
  _body.assign(body);
  return *this;
}

HttpResponse& HttpResponse::body(std::string&& body) noexcept {
  _body = std::move(body);
  return *this;
}

HttpResponse& HttpResponse::appendBody(std::string_view data) {
  _body.append(data);
  return *this;
}

void SerializeResponse(const HttpResponse& response, const ResponseSerializeOptions& options, RawChars& out) {
  out.append(http::HTTP11Sv);
  out.push_back(' ');
  AppendInteger(out, response.status());
  out.push_back(' ');
  out.append(response.reason());
  out.append(http::CRLF);

  for (const http::Header& header : response.headers()) {
    AppendHeader(out, header.name, header.value);
  }

  if (!options.serverName.empty() && !response.hasHeader(http::Server)) {
    AppendHeader(out, http::Server, options.serverName);
  }
  if (!options.date.empty() && !response.hasHeader(http::Date)) {
    AppendHeader(out, http::Date, options.date);
  }
  for (const http::Header& header : options.globalHeaders) {
    if (!response.hasHeader(header.name)) {
      AppendHeader(out, header.name, header.value);
    }
  }
  if (!response.hasHeader(http::Connection)) {
    switch (options.connection) {
      case ResponseSerializeOptions::ConnectionDirective::KeepAlive:
        AppendHeader(out, http::Connection, http::keepalive);
        break;
      case ResponseSerializeOptions::ConnectionDirective::Close:
        AppendHeader(out, http::Connection, http::close);
        break;
      default:
        break;
    }
  }
  if (!response.hasHeader(http::ContentLength)) {
    out.append(http::ContentLength);
    out.append(http::HeaderSep);
    AppendInteger(out, response.body().size());
    out.append(http::CRLF);
  }

  out.append(http::CRLF);
  if (!options.omitBody) {
    out.append(response.body());
  }
}

}  // namespace karics
