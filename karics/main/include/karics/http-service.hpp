#pragma once

#include <cstdint>
#include <memory>

#include "karics/http-request.hpp"
#include "karics/http-response.hpp"
#include "karics/task.hpp"

namespace karics {

// Identifier of an accepted connection, unique and increasing for the lifetime of a server.
using ConnectionId = uint64_t;

// Per-connection unit turning one request into one response.
//
// A service instance is owned by exactly one connection coroutine and called once per parsed request, strictly in
// arrival order: its state needs no locking. The request and all its views are only valid during the call.
//
// A failure is reported by throwing. The connection driver catches it and answers 500 with the exception message
// as body, the other connections are not affected.
class HttpService {
 public:
  HttpService() noexcept = default;

  HttpService(const HttpService&) = delete;
  HttpService(HttpService&&) = delete;
  HttpService& operator=(const HttpService&) = delete;
  HttpService& operator=(HttpService&&) = delete;

  virtual ~HttpService() = default;

  // Synchronous flavor. Must not block the worker thread.
  virtual HttpResponse call(const HttpRequest& request) = 0;

  // Entry point used by the connection driver. Services needing to wait (timers, other sockets) override it and
  // suspend with the awaitables of the current Worker instead of blocking. Defaults to call().
  virtual Task<HttpResponse> callAsync(const HttpRequest& request);
};

// Process-wide constructor of per-connection services, shared read-only by all workers.
class HttpServiceFactory {
 public:
  HttpServiceFactory() noexcept = default;

  HttpServiceFactory(const HttpServiceFactory&) = delete;
  HttpServiceFactory(HttpServiceFactory&&) = delete;
  HttpServiceFactory& operator=(const HttpServiceFactory&) = delete;
  HttpServiceFactory& operator=(HttpServiceFactory&&) = delete;

  virtual ~HttpServiceFactory() = default;

  // Called once per accepted connection, possibly concurrently from several workers.
  // Must not mutate shared state: it only allocates the service and hands it references to shared data.
  [[nodiscard]] virtual std::unique_ptr<HttpService> newService(ConnectionId connectionId) const = 0;
};

}  // namespace karics
