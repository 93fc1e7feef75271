#pragma once

#include <string_view>

#include "karics/http-header.hpp"

namespace karics::http {

constexpr bool IsHeaderWhitespace(char ch) noexcept { return ch == ' ' || ch == '\t'; }

// Parse a single HTTP header line (range [lineStart, lineLast), CRLF excluded).
// The value is trimmed of optional whitespace. Returns an empty name view when there is no colon.
constexpr HeaderView ParseHeaderLine(const char* lineStart, const char* lineLast) {
  const char* colonPtr = lineStart;
  while (colonPtr < lineLast && *colonPtr != ':') {
    ++colonPtr;
  }
  if (colonPtr == lineLast) {
    return {};
  }

  const char* valueFirst = colonPtr + 1;
  while (valueFirst < lineLast && IsHeaderWhitespace(*valueFirst)) {
    ++valueFirst;
  }
  const char* valueLast = lineLast;
  while (valueLast > valueFirst && IsHeaderWhitespace(*(valueLast - 1))) {
    --valueLast;
  }

  return {std::string_view(lineStart, colonPtr), std::string_view(valueFirst, valueLast)};
}

}  // namespace karics::http
