#include "karics/bind-address.hpp"

#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>

#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include "karics/socket-ops.hpp"

namespace karics {

BindAddress ParseBindAddress(std::string_view address) {
  const auto colonPos = address.rfind(':');
  if (colonPos == std::string_view::npos) {
    throw std::invalid_argument(fmt::format("Bind address '{}' should be of the form host:port", address));
  }
  const std::string_view host = address.substr(0, colonPos);
  const std::string_view portStr = address.substr(colonPos + 1);

  uint16_t port{};
  const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (portStr.empty() || errc != std::errc{} || ptr != portStr.data() + portStr.size()) {
    throw std::invalid_argument(fmt::format("Invalid port in bind address '{}'", address));
  }
  if (host.find(':') != std::string_view::npos) {
    throw std::invalid_argument(fmt::format("Only IPv4 bind addresses are supported, got '{}'", address));
  }
  return {host.empty() ? std::string("0.0.0.0") : std::string(host), port};
}

sockaddr_in ToSockAddr(const BindAddress& address) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(address.port);
  if (!ResolveIPv4(address.host, addr)) {
    throw std::invalid_argument(fmt::format("Unable to resolve host '{}'", address.host));
  }
  return addr;
}

}  // namespace karics
