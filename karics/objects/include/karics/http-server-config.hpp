#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "karics/http-header.hpp"

namespace karics {

struct HttpServerConfig {
  // Number of worker OS threads multiplexing the connection coroutines.
  // 0 means std::thread::hardware_concurrency() (at least 1).
  uint32_t nbThreads{0};

  // SO_REUSEPORT on the listening socket. Off by default so that binding an address in use fails.
  bool reusePort{false};

  // TCP_NODELAY on accepted sockets.
  bool tcpNoDelay{false};

  // Allow connection reuse for several sequential exchanges.
  bool enableKeepAlive{true};

  // Close the connection after this number of exchanges (0: unlimited).
  uint32_t maxRequestsPerConnection{0};

  // Maximum idle time of a keep-alive connection waiting for its next request (0: no limit).
  std::chrono::milliseconds keepAliveTimeout{std::chrono::milliseconds{5000}};

  // Maximum time to receive a complete request head once its first byte arrived (0: disabled).
  // On expiry a 408 is sent and the connection is closed.
  std::chrono::milliseconds headerReadTimeout{std::chrono::milliseconds{0}};

  // Cadence of the workers maintenance (timeouts sweep, stop request observation).
  std::chrono::milliseconds pollInterval{std::chrono::milliseconds{500}};

  // Maximum time granted to in-flight exchanges when stopping.
  std::chrono::milliseconds maxDrainPeriod{std::chrono::milliseconds{5000}};

  // Maximum length of the request line, CRLF included.
  std::size_t maxRequestLineBytes{8192};

  // Maximum size of the request head (request line + headers + final CRLF).
  std::size_t maxHeaderBytes{8192};

  // Maximum number of header lines.
  std::size_t maxHeaderCount{100};

  // Maximum size of the decoded request body.
  std::size_t maxBodyBytes{std::size_t{64} << 20};

  // Backlog of the listening socket.
  int listenBacklog{1024};

  // Value of the Server header added to responses not setting it (empty: no header).
  std::string serverName{"Karics"};

  // Add a RFC 7231 Date header to responses not setting it.
  bool addDateHeader{true};

  // Headers appended to every response that does not already carry a header of the same name.
  std::vector<http::Header> globalHeaders{{"X-Content-Type-Options", "nosniff"}, {"X-Frame-Options", "DENY"}};

  // Throws std::invalid_argument on incoherent values.
  void validate() const;

  // Effective number of worker threads.
  [[nodiscard]] uint32_t resolvedNbThreads() const;

  HttpServerConfig& withNbThreads(uint32_t nb);

  HttpServerConfig& withReusePort(bool on = true);

  HttpServerConfig& withTcpNoDelay(bool on = true);

  HttpServerConfig& withKeepAliveMode(bool on = true);

  HttpServerConfig& withMaxRequestsPerConnection(uint32_t maxRequests);

  HttpServerConfig& withKeepAliveTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withHeaderReadTimeout(std::chrono::milliseconds timeout);

  HttpServerConfig& withPollInterval(std::chrono::milliseconds interval);

  HttpServerConfig& withMaxDrainPeriod(std::chrono::milliseconds period);

  HttpServerConfig& withMaxRequestLineBytes(std::size_t maxRequestLineBytes);

  HttpServerConfig& withMaxHeaderBytes(std::size_t maxHeaderBytes);

  HttpServerConfig& withMaxHeaderCount(std::size_t maxHeaderCount);

  HttpServerConfig& withMaxBodyBytes(std::size_t maxBodyBytes);

  HttpServerConfig& withServerName(std::string_view name);

  HttpServerConfig& withDateHeader(bool on = true);

  HttpServerConfig& withGlobalHeader(std::string_view name, std::string_view value);

  HttpServerConfig& withoutGlobalHeaders();
};

}  // namespace karics
