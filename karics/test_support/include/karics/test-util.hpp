#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "karics/http-status-code.hpp"
#include "karics/socket.hpp"
#include "karics/timedef.hpp"

namespace karics::test {
using namespace std::chrono_literals;

// Blocking client socket connected to the loopback interface.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Retries connecting until timeout. Throws std::runtime_error if the connection could not be established.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = std::chrono::milliseconds{1000});

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

  void close() noexcept { _socket.close(); }

 private:
  ::karics::Socket _socket;
};

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  http::StatusCode statusCode{0};
  std::string version;
  std::string reason;
  std::map<std::string, std::string> headers;  // case-sensitive keys (sufficient for tests)
  std::vector<std::pair<std::string, std::string>> headerList;  // in received order
  std::string body;

  [[nodiscard]] bool hasHeader(const std::string& name) const { return headers.contains(name); }

  [[nodiscard]] std::string headerOrEmpty(const std::string& name) const {
    const auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
  }
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string version{"HTTP/1.1"};
  std::string host{"localhost"};
  std::string connection{"close"};  // empty: no Connection header
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;  // additional headers
  std::chrono::milliseconds recvTimeout{2000};
};

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 500ms);

// Reads until a complete HTTP response (head + Content-Length bytes of body) is received, the peer closes, or
// timeout. Bytes of a subsequent pipelined response may be returned as well.
std::string recvWithTimeout(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// Reads until nbResponses complete responses have been received, the peer closes, or timeout.
std::string recvResponses(int fd, std::size_t nbResponses, std::chrono::milliseconds totalTimeout = 2000ms);

// Reads until the peer closes the connection (or timeout).
std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout = 2000ms);

// Returns true if the peer closed the connection (read returns 0 or reset) before timeout.
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

// Parses one response at the beginning of raw. Returns std::nullopt if incomplete or invalid.
// If consumed is not null, it receives the number of bytes of the response.
// expectBody should be false for responses to HEAD requests, which announce a Content-Length without body.
std::optional<ParsedResponse> parseResponse(std::string_view raw, std::size_t* consumed = nullptr,
                                            bool expectBody = true);

ParsedResponse parseResponseOrThrow(std::string_view raw);

// Parses all complete responses of raw, in order.
std::vector<ParsedResponse> parseResponses(std::string_view raw);

bool setRecvTimeout(int fd, SysDuration timeout);

std::string buildRequest(const RequestOptions& opt);

// Sends one request on a fresh connection and returns the raw bytes received until the response is complete.
std::optional<std::string> request(uint16_t port, const RequestOptions& opt = {});

// Convenience wrapper that throws std::runtime_error on failure instead of returning std::nullopt.
std::string requestOrThrow(uint16_t port, const RequestOptions& opt = {});

// Sends several requests sequentially over a single keep-alive connection and returns the parsed responses.
std::vector<ParsedResponse> sequentialRequests(uint16_t port, const std::vector<RequestOptions>& requests);

int countOccurrences(std::string_view haystack, std::string_view needle);

}  // namespace karics::test
