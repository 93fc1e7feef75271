#pragma once

#include <netinet/in.h>

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "karics/platform.hpp"

namespace karics {

// Thin wrappers centralising socket system calls so that higher level modules (http, coro, main)
// never include networking headers directly.

// Set a file descriptor to non-blocking mode.
// Returns true on success.
bool SetNonBlocking(NativeHandle fd) noexcept;

// Set the close-on-exec flag on a file descriptor.
// Returns true on success.
bool SetCloseOnExec(NativeHandle fd) noexcept;

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(NativeHandle fd) noexcept;

// Retrieve the pending socket error (SO_ERROR). 0 means no error.
int GetSocketError(NativeHandle fd) noexcept;

// Returns the local port bound to `fd`, or 0 on failure.
uint16_t GetLocalPort(NativeHandle fd) noexcept;

// Resolve an IPv4 host (dotted notation or host name) into `addr` (port left untouched).
// Returns true on success.
bool ResolveIPv4(std::string_view host, sockaddr_in& addr) noexcept;

// Accept a pending connection as a non-blocking, close-on-exec socket.
// Returns the new fd, or kInvalidHandle with errno set (EAGAIN when no connection is pending).
NativeHandle AcceptNonBlocking(NativeHandle listenFd) noexcept;

// Send data on a connected socket without raising SIGPIPE.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(NativeHandle fd, std::string_view data) noexcept {
  return SafeSend(fd, data.data(), data.size());
}

// Receive data, retrying on EINTR.
// Returns the number of bytes read, 0 on orderly shutdown, or -1 on error (errno is set).
int64_t SafeRecv(NativeHandle fd, void* data, std::size_t len) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(NativeHandle fd) noexcept;

// Shutdown both read and write halves of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownReadWrite(NativeHandle fd) noexcept;

}  // namespace karics
