#pragma once

#include <string_view>

#include "karics/http-status-code.hpp"

namespace karics::http {

// Header field names are case-insensitive (RFC 7230); they are stored here in their canonical form for emission.
// Tokens (keep-alive, close, chunked) are lowercase to make case-insensitive comparisons cheaper.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Date = "Date";
inline constexpr std::string_view Server = "Server";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view XContentTypeOptions = "X-Content-Type-Options";
inline constexpr std::string_view XFrameOptions = "X-Frame-Options";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view chunked = "chunked";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

inline constexpr std::string_view kServerName = "Karics";

// Fixed JSON bodies of the router fallbacks.
inline constexpr std::string_view kNotFoundJsonBody = R"({"error": "Not Found"})";
inline constexpr std::string_view kMethodNotAllowedJsonBody = R"({"error": "Method Not Allowed"})";

// Return the canonical reason phrase of a status code, "Unknown" for codes outside of the table.
constexpr std::string_view ReasonPhraseFor(StatusCode status) noexcept {
  switch (status) {
    case StatusCodeOK:
      return "OK";
    case StatusCodeCreated:
      return "Created";
    case StatusCodeAccepted:
      return "Accepted";
    case StatusCodeNoContent:
      return "No Content";
    case StatusCodeMovedPermanently:
      return "Moved Permanently";
    case StatusCodeFound:
      return "Found";
    case StatusCodeNotModified:
      return "Not Modified";
    case StatusCodeBadRequest:
      return "Bad Request";
    case StatusCodeUnauthorized:
      return "Unauthorized";
    case StatusCodeForbidden:
      return "Forbidden";
    case StatusCodeNotFound:
      return "Not Found";
    case StatusCodeMethodNotAllowed:
      return "Method Not Allowed";
    case StatusCodeRequestTimeout:
      return "Request Timeout";
    case StatusCodeConflict:
      return "Conflict";
    case StatusCodeLengthRequired:
      return "Length Required";
    case StatusCodePayloadTooLarge:
      return "Payload Too Large";
    case StatusCodeURITooLong:
      return "URI Too Long";
    case StatusCodeUnprocessableEntity:
      return "Unprocessable Entity";
    case StatusCodeTooManyRequests:
      return "Too Many Requests";
    case StatusCodeRequestHeaderFieldsTooLarge:
      return "Request Header Fields Too Large";
    case StatusCodeInternalServerError:
      return "Internal Server Error";
    case StatusCodeNotImplemented:
      return "Not Implemented";
    case StatusCodeServiceUnavailable:
      return "Service Unavailable";
    case StatusCodeHTTPVersionNotSupported:
      return "HTTP Version Not Supported";
    default:
      return "Unknown";
  }
}

}  // namespace karics::http
