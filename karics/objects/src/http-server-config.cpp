#include "karics/http-server-config.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <utility>

#include "karics/http-constants.hpp"
#include "karics/http-header.hpp"
#include "karics/string-equal-ignore-case.hpp"

namespace karics {

namespace {

// Headers computed by the server for each response, they cannot be forced globally.
bool IsReservedResponseHeader(std::string_view name) {
  return CaseInsensitiveEqual(name, http::ContentLength) || CaseInsensitiveEqual(name, http::TransferEncoding) ||
         CaseInsensitiveEqual(name, http::Connection) || CaseInsensitiveEqual(name, http::Date);
}

}  // namespace

void HttpServerConfig::validate() const {
  if (std::cmp_less(maxRequestLineBytes, 16)) {
    throw std::invalid_argument("maxRequestLineBytes must be >= 16");
  }
  if (std::cmp_less(maxHeaderBytes, 128)) {
    throw std::invalid_argument("maxHeaderBytes must be >= 128");
  }
  if (maxRequestLineBytes > maxHeaderBytes) {
    throw std::invalid_argument("maxRequestLineBytes must be <= maxHeaderBytes");
  }
  if (maxHeaderCount == 0) {
    throw std::invalid_argument("maxHeaderCount must be > 0");
  }
  if (maxBodyBytes == 0) {
    throw std::invalid_argument("maxBodyBytes must be > 0");
  }
  if (keepAliveTimeout.count() < 0) {
    throw std::invalid_argument("keepAliveTimeout must be non-negative");
  }
  if (headerReadTimeout.count() < 0) {
    throw std::invalid_argument("headerReadTimeout must be non-negative");
  }
  if (maxDrainPeriod.count() < 0) {
    throw std::invalid_argument("maxDrainPeriod must be non-negative");
  }
  if (pollInterval.count() <= 0) {
    throw std::invalid_argument("pollInterval must be > 0");
  }
  if (std::cmp_less(std::numeric_limits<int>::max(), pollInterval.count())) {
    throw std::invalid_argument("Poll interval value is too large");
  }
  if (listenBacklog <= 0) {
    throw std::invalid_argument("listenBacklog must be > 0");
  }
  if (!http::IsValidHeaderValue(serverName)) {
    throw std::invalid_argument(fmt::format("serverName has invalid value: '{}'", serverName));
  }
  for (const http::Header& header : globalHeaders) {
    if (!http::IsValidHeaderName(header.name)) {
      throw std::invalid_argument(fmt::format("header has invalid name: '{}'", header.name));
    }
    if (IsReservedResponseHeader(header.name)) {
      throw std::invalid_argument(fmt::format("attempt to set reserved header: '{}'", header.name));
    }
    if (!http::IsValidHeaderValue(header.value)) {
      throw std::invalid_argument(fmt::format("header has invalid value: '{}'", header.value));
    }
  }
}

uint32_t HttpServerConfig::resolvedNbThreads() const {
  if (nbThreads != 0) {
    return nbThreads;
  }
  return std::max(1U, std::thread::hardware_concurrency());
}

HttpServerConfig& HttpServerConfig::withNbThreads(uint32_t nb) {
  nbThreads = nb;
  return *this;
}

HttpServerConfig& HttpServerConfig::withReusePort(bool on) {
  reusePort = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withTcpNoDelay(bool on) {
  tcpNoDelay = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveMode(bool on) {
  enableKeepAlive = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxRequestsPerConnection(uint32_t maxRequests) {
  maxRequestsPerConnection = maxRequests;
  return *this;
}

HttpServerConfig& HttpServerConfig::withKeepAliveTimeout(std::chrono::milliseconds timeout) {
  keepAliveTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withHeaderReadTimeout(std::chrono::milliseconds timeout) {
  headerReadTimeout = timeout;
  return *this;
}

HttpServerConfig& HttpServerConfig::withPollInterval(std::chrono::milliseconds interval) {
  pollInterval = interval;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxDrainPeriod(std::chrono::milliseconds period) {
  maxDrainPeriod = period;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxRequestLineBytes(std::size_t maxRequestLineBytes_) {
  maxRequestLineBytes = maxRequestLineBytes_;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderBytes(std::size_t maxHeaderBytes_) {
  maxHeaderBytes = maxHeaderBytes_;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxHeaderCount(std::size_t maxHeaderCount_) {
  maxHeaderCount = maxHeaderCount_;
  return *this;
}

HttpServerConfig& HttpServerConfig::withMaxBodyBytes(std::size_t maxBodyBytes_) {
  maxBodyBytes = maxBodyBytes_;
  return *this;
}

HttpServerConfig& HttpServerConfig::withServerName(std::string_view name) {
  serverName = name;
  return *this;
}

HttpServerConfig& HttpServerConfig::withDateHeader(bool on) {
  addDateHeader = on;
  return *this;
}

HttpServerConfig& HttpServerConfig::withGlobalHeader(std::string_view name, std::string_view value) {
  globalHeaders.emplace_back(std::string(name), std::string(value));
  return *this;
}

HttpServerConfig& HttpServerConfig::withoutGlobalHeaders() {
  globalHeaders.clear();
  return *this;
}

}  // namespace karics
