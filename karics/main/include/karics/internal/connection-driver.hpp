#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include "karics/base-fd.hpp"
#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/http-server-config.hpp"
#include "karics/http-status-code.hpp"
#include "karics/http-service.hpp"
#include "karics/internal/lifecycle.hpp"
#include "karics/platform.hpp"
#include "karics/raw-chars.hpp"
#include "karics/request-parser.hpp"
#include "karics/task.hpp"
#include "karics/timedef.hpp"
#include "karics/worker.hpp"

namespace karics::internal {

// Drives one accepted connection through Reading -> Dispatching -> Writing -> (Reading | Closed).
//
// Requests are processed strictly in arrival order, pipelined requests already buffered are served before reading
// again. Socket I/O errors close the connection without any response; malformed requests are answered with an
// error status then the connection is closed; service failures are answered with 500.
//
// A driver, its buffers and its service are owned by the coroutine running run() on one worker.
class ConnectionDriver {
 public:
  enum class State : uint8_t { Reading, Dispatching, Writing, Closed };

  ConnectionDriver(Worker& worker, BaseFd socket, ConnectionId id, std::unique_ptr<HttpService> service,
                   const HttpServerConfig& config, const Lifecycle& lifecycle);

  ConnectionDriver(const ConnectionDriver&) = delete;
  ConnectionDriver(ConnectionDriver&&) = delete;
  ConnectionDriver& operator=(const ConnectionDriver&) = delete;
  ConnectionDriver& operator=(ConnectionDriver&&) = delete;

  ~ConnectionDriver();

  // Serves the connection until it is closed.
  Task<void> run();

  // Called on the worker thread when the server starts draining: an idle connection (waiting for a new request
  // without any partial frame) is shut down immediately, a busy one closes after its current exchange.
  void onDrain() noexcept;

  [[nodiscard]] ConnectionId id() const noexcept { return _id; }

  [[nodiscard]] State state() const noexcept { return _state; }

  [[nodiscard]] uint32_t nbRequests() const noexcept { return _nbRequests; }

 private:
  enum class ReadStatus : uint8_t { Data, Closed, HeaderTimeout };

  static constexpr std::size_t kReadChunkSize = 16UL * 1024;

  [[nodiscard]] NativeHandle fd() const noexcept { return _socket.fd(); }

  Task<ReadStatus> receive();

  Task<HttpResponse> dispatch(const HttpRequest& request);

  // Writes all of _outBuf, waiting for writability on partial writes. Returns false on I/O error.
  Task<bool> flush();

  // Sends an error response followed by a graceful close.
  Task<void> answerErrorAndClose(http::StatusCode status, std::string_view reason);

  [[nodiscard]] bool shouldKeepAlive(const HttpRequest& request, const HttpResponse& response) const noexcept;

  void serialize(const HttpResponse& response, bool keepAlive, bool http10, bool omitBody);

  [[nodiscard]] SteadyTimePoint readDeadline() const noexcept;

  // Half-closes the socket and discards what the peer still sends for a short while, so that the response is not
  // lost in a reset caused by unread data.
  Task<void> lingeringClose();

  void close() noexcept;

  Worker& _worker;
  BaseFd _socket;
  ConnectionId _id;
  std::unique_ptr<HttpService> _service;
  const HttpServerConfig& _config;
  const Lifecycle& _lifecycle;
  RequestParser _parser;
  RawChars _outBuf;
  SteadyTimePoint _frameStartTime;
  uint32_t _nbRequests{0};
  State _state{State::Reading};
  // True while suspended waiting for the first byte of a new request.
  bool _idle{false};
};

}  // namespace karics::internal
