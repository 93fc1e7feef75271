#include "karics/socket.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>

#include "karics/base-fd.hpp"
#include "karics/errno-throw.hpp"
#include "karics/log.hpp"
#include "karics/socket-ops.hpp"

namespace karics {

namespace {
int ToSysType(Socket::Type type) {
  switch (type) {
    case Socket::Type::StreamNonBlock:
      return SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC;
    default:
      return SOCK_STREAM | SOCK_CLOEXEC;
  }
}
}  // namespace

Socket::Socket(Type type, int protocol) : _baseFd(::socket(AF_INET, ToSysType(type), protocol)) {
  if (!_baseFd) {
    throw_errno("Unable to create a new socket");
  }
  log::debug("Socket fd # {} opened", _baseFd.fd());
}

uint16_t Socket::bindAndListen(const sockaddr_in& addr, bool reusePort, int backlog) {
  static constexpr int kEnable = 1;
  if (::setsockopt(fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed on fd # {}", fd());
  }
  if (reusePort && ::setsockopt(fd(), SOL_SOCKET, SO_REUSEPORT, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEPORT) failed on fd # {}", fd());
  }
  if (::bind(fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("bind failed on port {}", ntohs(addr.sin_port));
  }
  if (::listen(fd(), backlog) != 0) {
    throw_errno("listen failed on fd # {}", fd());
  }
  const uint16_t port = GetLocalPort(fd());
  if (port == 0) {
    throw_errno("Unable to retrieve the bound port of fd # {}", fd());
  }
  return port;
}

}  // namespace karics
