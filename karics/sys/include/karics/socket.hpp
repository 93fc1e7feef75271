#pragma once

#include <netinet/in.h>

#include <cstdint>

#include "karics/base-fd.hpp"
#include "karics/platform.hpp"

namespace karics {

// Simple RAII class wrapping an IPv4 TCP socket file descriptor.
class Socket {
 public:
  enum class Type : std::uint8_t { Stream, StreamNonBlock };

  Socket() noexcept = default;

  // Construct a socket with the given type and protocol.
  // Throws std::system_error on failure.
  explicit Socket(Type type, int protocol = 0);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Bind to the given address and start listening.
  // If the port of addr is 0, an ephemeral port is chosen by the kernel.
  // Returns the effectively bound port.
  // Throws std::system_error on failure.
  uint16_t bindAndListen(const sockaddr_in& addr, bool reusePort, int backlog);

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

}  // namespace karics
