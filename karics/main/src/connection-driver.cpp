#include "karics/internal/connection-driver.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstring>
#include <exception>
#include <memory>
#include <span>
#include <string_view>
#include <utility>

#include "karics/base-fd.hpp"
#include "karics/http-constants.hpp"
#include "karics/http-method.hpp"
#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/http-server-config.hpp"
#include "karics/http-service.hpp"
#include "karics/http-status-code.hpp"
#include "karics/http-version.hpp"
#include "karics/internal/lifecycle.hpp"
#include "karics/log.hpp"
#include "karics/request-parser.hpp"
#include "karics/socket-ops.hpp"
#include "karics/string-equal-ignore-case.hpp"
#include "karics/task.hpp"
#include "karics/timedef.hpp"
#include "karics/timestring.hpp"
#include "karics/worker.hpp"

namespace karics::internal {

namespace {

constexpr std::chrono::milliseconds kMaxLingerDuration{500};

bool IsWouldBlock(int err) noexcept { return err == EAGAIN || err == EWOULDBLOCK; }

}  // namespace

ConnectionDriver::ConnectionDriver(Worker& worker, BaseFd socket, ConnectionId id,
                                   std::unique_ptr<HttpService> service, const HttpServerConfig& config,
                                   const Lifecycle& lifecycle)
    : _worker(worker),
      _socket(std::move(socket)),
      _id(id),
      _service(std::move(service)),
      _config(config),
      _lifecycle(lifecycle),
      _parser(RequestParser::Limits::From(config)),
      _frameStartTime(SteadyClock::now()) {}

ConnectionDriver::~ConnectionDriver() { close(); }

Task<void> ConnectionDriver::run() {
  log::debug("Connection {} opened on fd # {}", _id, fd());

  while (_state != State::Closed) {
    _state = State::Reading;
    const ParseOutcome outcome = _parser.tryParseOne();

    if (outcome.isIncomplete()) {
      const ReadStatus status = co_await receive();
      if (status == ReadStatus::HeaderTimeout) {
        log::warn("Connection {} did not send a complete request head in time", _id);
        co_await answerErrorAndClose(http::StatusCodeRequestTimeout, "request head timeout");
      } else if (status == ReadStatus::Closed) {
        close();
      }
      continue;
    }

    if (outcome.isMalformed()) {
      log::warn("Malformed request on connection {}: {} ({})", _id, outcome.reason, outcome.errorStatus);
      co_await answerErrorAndClose(outcome.errorStatus, outcome.reason);
      continue;
    }

    const HttpRequest& request = _parser.request();
    ++_nbRequests;
    _state = State::Dispatching;
    HttpResponse response = co_await dispatch(request);

    const bool keepAlive = shouldKeepAlive(request, response);
    serialize(response, keepAlive, request.version() == http::HTTP_1_0, request.method() == http::Method::HEAD);
    _state = State::Writing;
    if (!co_await flush()) {
      close();
      continue;
    }
    if (!keepAlive) {
      co_await lingeringClose();
      continue;
    }
    // Remaining bytes belong to the next (pipelined) request.
    _frameStartTime = SteadyClock::now();
    _parser.shrinkIfIdle(kReadChunkSize * 4);
  }

  log::debug("Connection {} closed after {} request(s)", _id, _nbRequests);
}

void ConnectionDriver::onDrain() noexcept {
  if (_idle && _socket) {
    log::debug("Shutting down idle connection {} for drain", _id);
    ShutdownReadWrite(fd());
  }
}

Task<ConnectionDriver::ReadStatus> ConnectionDriver::receive() {
  while (true) {
    const bool hadPartialFrame = _parser.hasPartialFrame();
    const std::span<char> buf = _parser.writableSpan(kReadChunkSize);
    const auto nbRead = SafeRecv(fd(), buf.data(), buf.size());
    if (nbRead > 0) {
      _parser.commit(static_cast<std::size_t>(nbRead));
      if (!hadPartialFrame) {
        _frameStartTime = SteadyClock::now();
      }
      co_return ReadStatus::Data;
    }
    if (nbRead == 0) {
      log::debug("Connection {} closed by peer", _id);
      co_return ReadStatus::Closed;
    }
    if (!IsWouldBlock(errno)) {
      log::debug("Connection {} read error: {}", _id, std::strerror(errno));
      co_return ReadStatus::Closed;
    }

    if (!hadPartialFrame && _lifecycle.isStopping()) {
      co_return ReadStatus::Closed;
    }

    _idle = !hadPartialFrame;
    const IoWaitStatus waitStatus = co_await _worker.readable(fd(), readDeadline());
    _idle = false;

    if (waitStatus == IoWaitStatus::TimedOut) {
      if (hadPartialFrame && _parser.isReadingHead()) {
        co_return ReadStatus::HeaderTimeout;
      }
      log::debug("Connection {} idle timeout", _id);
      co_return ReadStatus::Closed;
    }
    if (waitStatus == IoWaitStatus::Error) {
      co_return ReadStatus::Closed;
    }
  }
}

SteadyTimePoint ConnectionDriver::readDeadline() const noexcept {
  if (_parser.hasPartialFrame()) {
    if (_parser.isReadingHead() && _config.headerReadTimeout.count() > 0) {
      return _frameStartTime + _config.headerReadTimeout;
    }
    return kNoDeadline;
  }
  if (_config.keepAliveTimeout.count() > 0) {
    return SteadyClock::now() + _config.keepAliveTimeout;
  }
  return kNoDeadline;
}

Task<HttpResponse> ConnectionDriver::dispatch(const HttpRequest& request) {
  try {
    co_return co_await _service->callAsync(request);
  } catch (const std::exception& ex) {
    log::error("Service of connection {} failed on {} {}: {}", _id, request.methodStr(), request.path(), ex.what());
    co_return HttpResponse::Text(http::StatusCodeInternalServerError, ex.what());
  } catch (...) {
    log::error("Service of connection {} failed on {} {} with an unknown exception", _id, request.methodStr(),
               request.path());
    co_return HttpResponse::Text(http::StatusCodeInternalServerError, "Unknown error");
  }
}

bool ConnectionDriver::shouldKeepAlive(const HttpRequest& request, const HttpResponse& response) const noexcept {
  if (!_config.enableKeepAlive || _lifecycle.isStopping() || !request.wantKeepAlive()) {
    return false;
  }
  if (_config.maxRequestsPerConnection != 0 && _nbRequests >= _config.maxRequestsPerConnection) {
    return false;
  }
  const auto connection = response.headerValue(http::Connection);
  return !connection || !ContainsTokenIgnoreCase(*connection, http::close);
}

void ConnectionDriver::serialize(const HttpResponse& response, bool keepAlive, bool http10, bool omitBody) {
  char dateStr[kRFC7231DateStrLen];
  std::string_view date;
  if (_config.addDateHeader) {
    TimeToStringRFC7231(SysClock::now(), dateStr);
    date = std::string_view(dateStr, kRFC7231DateStrLen);
  }

  using ConnectionDirective = ResponseSerializeOptions::ConnectionDirective;

  ResponseSerializeOptions options;
  options.globalHeaders = _config.globalHeaders;
  options.serverName = _config.serverName;
  options.date = date;
  if (!keepAlive) {
    options.connection = ConnectionDirective::Close;
  } else if (http10) {
    options.connection = ConnectionDirective::KeepAlive;
  }
  options.omitBody = omitBody;

  _outBuf.clear();
  SerializeResponse(response, options, _outBuf);
}

Task<bool> ConnectionDriver::flush() {
  std::size_t written = 0;
  while (written < _outBuf.size()) {
    const auto nbSent = SafeSend(fd(), _outBuf.data() + written, _outBuf.size() - written);
    if (nbSent > 0) {
      written += static_cast<std::size_t>(nbSent);
      continue;
    }
    if (nbSent < 0 && IsWouldBlock(errno)) {
      if (co_await _worker.writable(fd()) != IoWaitStatus::Ready) {
        co_return false;
      }
      continue;
    }
    log::debug("Connection {} write error: {}", _id, std::strerror(errno));
    co_return false;
  }
  _outBuf.clear();
  co_return true;
}

Task<void> ConnectionDriver::answerErrorAndClose(http::StatusCode status, std::string_view reason) {
  HttpResponse response = HttpResponse::Text(status, reason);
  serialize(response, false, false, false);
  _state = State::Writing;
  if (co_await flush()) {
    co_await lingeringClose();
  } else {
    close();
  }
}

Task<void> ConnectionDriver::lingeringClose() {
  if (!ShutdownWrite(fd())) {
    close();
    co_return;
  }
  const auto deadline = SteadyClock::now() + std::min(kMaxLingerDuration, _config.pollInterval);
  char discard[4096];
  while (true) {
    const auto nbRead = SafeRecv(fd(), discard, sizeof(discard));
    if (nbRead > 0) {
      if (SteadyClock::now() < deadline) {
        continue;
      }
      break;
    }
    if (nbRead < 0 && IsWouldBlock(errno) &&
        co_await _worker.readable(fd(), deadline) == IoWaitStatus::Ready) {
      continue;
    }
    break;
  }
  close();
}

void ConnectionDriver::close() noexcept {
  if (_socket) {
    _worker.forget(fd());
    _socket.close();
  }
  _parser.reset();
  _state = State::Closed;
}

}  // namespace karics::internal
