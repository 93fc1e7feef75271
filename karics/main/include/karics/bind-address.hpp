#pragma once

#include <netinet/in.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace karics {

struct BindAddress {
  std::string host;
  uint16_t port{};
};

// Parses a "host:port" string. An empty host means all interfaces ("0.0.0.0"), port 0 an ephemeral port.
// Throws std::invalid_argument if the string is malformed.
BindAddress ParseBindAddress(std::string_view address);

// Resolves the address into an IPv4 socket address.
// Throws std::invalid_argument if the host cannot be resolved.
sockaddr_in ToSockAddr(const BindAddress& address);

}  // namespace karics
