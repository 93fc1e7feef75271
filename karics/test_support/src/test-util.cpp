#include "karics/test-util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "karics/http-constants.hpp"
#include "karics/http-status-code.hpp"
#include "karics/log.hpp"
#include "karics/socket.hpp"
#include "karics/string-equal-ignore-case.hpp"
#include "karics/timedef.hpp"

namespace karics::test {

namespace {

void connectLoop(int fd, uint16_t port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  for (const auto deadline = std::chrono::steady_clock::now() + timeout; std::chrono::steady_clock::now() < deadline;
       std::this_thread::sleep_for(std::chrono::milliseconds{1})) {
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
      return;
    }
    log::debug("connect failed for fd={}: {}", fd, std::strerror(errno));
  }
  throw std::runtime_error("Unable to connect to port " + std::to_string(port));
}

// Number of complete responses at the beginning of raw.
std::size_t CountCompleteResponses(std::string_view raw) {
  std::size_t nb = 0;
  std::size_t consumed = 0;
  while (!raw.empty() && parseResponse(raw, &consumed)) {
    ++nb;
    raw.remove_prefix(consumed);
  }
  return nb;
}

enum class RecvResult : uint8_t { Data, WouldBlock, Closed };

RecvResult RecvSome(int fd, std::string& out) {
  char buf[16384];
  const auto nb = ::recv(fd, buf, sizeof(buf), MSG_DONTWAIT);
  if (nb > 0) {
    out.append(buf, static_cast<std::size_t>(nb));
    return RecvResult::Data;
  }
  if (nb < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
    return RecvResult::WouldBlock;
  }
  return RecvResult::Closed;
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _socket(::karics::Socket::Type::Stream) {
  connectLoop(_socket.fd(), port, timeout);
}

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  while (!data.empty()) {
    const auto sent = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent <= 0) {
      if (sent < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        log::error("sendAll failed with error {}", std::strerror(errno));
        return false;
      }
      if (std::chrono::steady_clock::now() >= maxTs) {
        log::error("sendAll timed out after {} ms", totalTimeout.count());
        return false;
      }
      std::this_thread::sleep_for(1ms);
      continue;
    }
    data.remove_prefix(static_cast<std::size_t>(sent));
  }
  return true;
}

std::string recvResponses(int fd, std::size_t nbResponses, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  while (std::chrono::steady_clock::now() < maxTs) {
    const RecvResult res = RecvSome(fd, out);
    if (res == RecvResult::Closed) {
      break;
    }
    if (res == RecvResult::Data) {
      if (CountCompleteResponses(out) >= nbResponses) {
        break;
      }
      continue;
    }
    std::this_thread::sleep_for(1ms);
  }
  return out;
}

std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout) {
  return recvResponses(fd, 1, totalTimeout);
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout) {
  std::string out;
  const auto maxTs = std::chrono::steady_clock::now() + totalTimeout;
  while (std::chrono::steady_clock::now() < maxTs) {
    const RecvResult res = RecvSome(fd, out);
    if (res == RecvResult::Closed) {
      break;
    }
    if (res == RecvResult::WouldBlock) {
      std::this_thread::sleep_for(1ms);
    }
  }
  return out;
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  std::string ignored;
  const auto maxTs = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < maxTs) {
    const RecvResult res = RecvSome(fd, ignored);
    if (res == RecvResult::Closed) {
      return true;
    }
    if (res == RecvResult::WouldBlock) {
      std::this_thread::sleep_for(1ms);
    }
  }
  return false;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw, std::size_t* consumed, bool expectBody) {
  const auto headEnd = raw.find(http::DoubleCRLF);
  if (headEnd == std::string_view::npos) {
    return std::nullopt;
  }
  const auto statusLineEnd = raw.find(http::CRLF);
  const std::string_view statusLine = raw.substr(0, statusLineEnd);
  // Expect: HTTP/1.1 <code> <reason>
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos) {
    return std::nullopt;
  }
  auto secondSpace = statusLine.find(' ', firstSpace + 1);
  if (secondSpace == std::string_view::npos) {
    secondSpace = statusLine.size();
  }

  ParsedResponse pr;
  pr.version = statusLine.substr(0, firstSpace);
  const std::string_view codeStr = statusLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
  const auto [ptr, errc] = std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), pr.statusCode);
  if (errc != std::errc{}) {
    return std::nullopt;
  }
  if (secondSpace < statusLine.size()) {
    pr.reason = statusLine.substr(secondSpace + 1);
  }

  std::size_t contentLength = 0;
  std::size_t cursor = statusLineEnd + http::CRLF.size();
  while (cursor < headEnd + http::CRLF.size()) {
    const auto lineEnd = raw.find(http::CRLF, cursor);
    const std::string_view line = raw.substr(cursor, lineEnd - cursor);
    cursor = lineEnd + http::CRLF.size();
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
      continue;
    }
    std::string_view value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ') {
      value.remove_prefix(1);
    }
    std::string key(line.substr(0, colon));
    if (CaseInsensitiveEqual(key, http::ContentLength)) {
      std::from_chars(value.data(), value.data() + value.size(), contentLength);
    }
    pr.headerList.emplace_back(key, value);
    pr.headers.emplace(std::move(key), value);
  }

  const std::size_t bodyStart = headEnd + http::DoubleCRLF.size();
  if (!expectBody) {
    contentLength = 0;
  }
  if (raw.size() < bodyStart + contentLength) {
    return std::nullopt;
  }
  pr.body = raw.substr(bodyStart, contentLength);
  if (consumed != nullptr) {
    *consumed = bodyStart + contentLength;
  }
  return pr;
}

ParsedResponse parseResponseOrThrow(std::string_view raw) {
  auto parsed = parseResponse(raw);
  if (!parsed) {
    throw std::runtime_error("Unable to parse HTTP response: " + std::string(raw.substr(0, 256)));
  }
  return std::move(*parsed);
}

std::vector<ParsedResponse> parseResponses(std::string_view raw) {
  std::vector<ParsedResponse> responses;
  std::size_t consumed = 0;
  while (!raw.empty()) {
    auto parsed = parseResponse(raw, &consumed);
    if (!parsed) {
      break;
    }
    responses.push_back(std::move(*parsed));
    raw.remove_prefix(consumed);
  }
  return responses;
}

bool setRecvTimeout(int fd, SysDuration timeout) {
  const auto timeoutMs = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
  timeval tv{static_cast<time_t>(timeoutMs / 1000), static_cast<suseconds_t>((timeoutMs % 1000) * 1000)};
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req;
  req.reserve(256 + opt.body.size());
  req.append(opt.method).append(" ").append(opt.target).append(" ").append(opt.version).append(http::CRLF);
  req.append("Host: ").append(opt.host).append(http::CRLF);
  if (!opt.connection.empty()) {
    req.append("Connection: ").append(opt.connection).append(http::CRLF);
  }
  for (const auto& [name, value] : opt.headers) {
    req.append(name).append(http::HeaderSep).append(value).append(http::CRLF);
  }
  if (!opt.body.empty()) {
    req.append("Content-Length: ").append(std::to_string(opt.body.size())).append(http::CRLF);
  }
  req.append(http::CRLF);
  req.append(opt.body);
  return req;
}

std::optional<std::string> request(uint16_t port, const RequestOptions& opt) {
  ClientConnection cnx(port);
  if (!sendAll(cnx.fd(), buildRequest(opt))) {
    return std::nullopt;
  }
  std::string out = recvWithTimeout(cnx.fd(), opt.recvTimeout);
  if (out.empty()) {
    return std::nullopt;
  }
  return out;
}

std::string requestOrThrow(uint16_t port, const RequestOptions& opt) {
  auto res = request(port, opt);
  if (!res) {
    throw std::runtime_error("request failed");
  }
  return std::move(*res);
}

std::vector<ParsedResponse> sequentialRequests(uint16_t port, const std::vector<RequestOptions>& requests) {
  ClientConnection cnx(port);
  std::vector<ParsedResponse> responses;
  for (const RequestOptions& opt : requests) {
    if (!sendAll(cnx.fd(), buildRequest(opt))) {
      break;
    }
    const std::string raw = recvWithTimeout(cnx.fd(), opt.recvTimeout);
    auto parsed = parseResponse(raw);
    if (!parsed) {
      break;
    }
    responses.push_back(std::move(*parsed));
  }
  return responses;
}

int countOccurrences(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return 0;
  }
  int count = 0;
  std::size_t pos = 0;
  while ((pos = haystack.find(needle, pos)) != std::string_view::npos) {
    ++count;
    pos += needle.size();
  }
  return count;
}

}  // namespace karics::test
