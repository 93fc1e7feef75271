#include "karics/socket-ops.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

#include "karics/log.hpp"
#include "karics/platform.hpp"

namespace karics {

bool SetNonBlocking(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  return flags != -1 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1;
}

bool SetCloseOnExec(NativeHandle fd) noexcept {
  const int flags = ::fcntl(fd, F_GETFD, 0);
  return flags != -1 && ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) != -1;
}

bool SetTcpNoDelay(NativeHandle fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

int GetSocketError(NativeHandle fd) noexcept {
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == -1) {
    return errno;
  }
  return err;
}

uint16_t GetLocalPort(NativeHandle fd) noexcept {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    log::error("getsockname failed for fd # {}: {}", fd, std::strerror(errno));
    return 0;
  }
  return ntohs(addr.sin_port);
}

bool ResolveIPv4(std::string_view host, sockaddr_in& addr) noexcept {
  const std::string hostStr(host);
  if (::inet_pton(AF_INET, hostStr.c_str(), &addr.sin_addr) == 1) {
    return true;
  }
  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const int ret = ::getaddrinfo(hostStr.c_str(), nullptr, &hints, &result);
  if (ret != 0 || result == nullptr) {
    log::error("Unable to resolve host '{}': {}", host, ::gai_strerror(ret));
    return false;
  }
  addr.sin_addr = reinterpret_cast<const sockaddr_in*>(result->ai_addr)->sin_addr;
  ::freeaddrinfo(result);
  return true;
}

NativeHandle AcceptNonBlocking(NativeHandle listenFd) noexcept {
  while (true) {
    const int fd = ::accept4(listenFd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd == -1 && errno == EINTR) {
      continue;
    }
    return fd;
  }
}

int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept {
  while (true) {
    const auto ret = ::send(fd, data, len, MSG_NOSIGNAL);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(ret);
  }
}

int64_t SafeRecv(NativeHandle fd, void* data, std::size_t len) noexcept {
  while (true) {
    const auto ret = ::recv(fd, data, len, 0);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(ret);
  }
}

bool ShutdownWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

bool ShutdownReadWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

}  // namespace karics
