#pragma once

#include <string>
#include <string_view>

namespace karics::http {

// Owned header, used for responses and configuration.
struct Header {
  std::string name;
  std::string value;

  bool operator==(const Header&) const noexcept = default;
};

// Non-owning header view into a connection buffer, used for parsed requests.
struct HeaderView {
  std::string_view name;
  std::string_view value;

  bool operator==(const HeaderView&) const noexcept = default;
};

// Header names are tokens (RFC 7230 tchar).
constexpr bool IsTokenChar(char ch) noexcept {
  if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9')) {
    return true;
  }
  switch (ch) {
    case '!':
    case '#':
    case '$':
    case '%':
    case '&':
    case '\'':
    case '*':
    case '+':
    case '-':
    case '.':
    case '^':
    case '_':
    case '`':
    case '|':
    case '~':
      return true;
    default:
      return false;
  }
}

constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (char ch : name) {
    if (!IsTokenChar(ch)) {
      return false;
    }
  }
  return true;
}

constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  for (char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    if ((uch < 0x20 && ch != '\t') || uch == 0x7F) {
      return false;
    }
  }
  return true;
}

}  // namespace karics::http
