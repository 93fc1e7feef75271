#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "karics/http-constants.hpp"

namespace karics::http {

struct Version {
  uint8_t major{1};
  uint8_t minor{1};

  [[nodiscard]] constexpr std::string_view str() const noexcept { return minor == 0 ? HTTP10Sv : HTTP11Sv; }

  constexpr bool operator==(const Version&) const noexcept = default;
};

inline constexpr Version HTTP_1_0{1, 0};
inline constexpr Version HTTP_1_1{1, 1};

// Parse the version token of a request line. Only HTTP/1.0 and HTTP/1.1 are accepted.
constexpr std::optional<Version> ParseVersion(std::string_view token) noexcept {
  if (token == HTTP11Sv) {
    return HTTP_1_1;
  }
  if (token == HTTP10Sv) {
    return HTTP_1_0;
  }
  return std::nullopt;
}

}  // namespace karics::http
