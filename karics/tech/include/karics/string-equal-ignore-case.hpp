#pragma once

#include <string_view>

namespace karics {

// ASCII only, header names and tokens are never localized.
constexpr char AsciiLower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch | 0x20) : ch; }

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (AsciiLower(*pLhs) != AsciiLower(*pRhs)) {
      return false;
    }
  }
  return true;
}

// Returns true if the comma separated list 'values' contains 'token' (case-insensitive, OWS trimmed).
// Example: ContainsTokenIgnoreCase("keep-alive, Upgrade", "upgrade") -> true
constexpr bool ContainsTokenIgnoreCase(std::string_view values, std::string_view token) {
  while (!values.empty()) {
    const auto commaPos = values.find(',');
    auto item = values.substr(0, commaPos);
    while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) {
      item.remove_prefix(1);
    }
    while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) {
      item.remove_suffix(1);
    }
    if (CaseInsensitiveEqual(item, token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    values.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace karics
