#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <thread>

#include "karics/http-server-config.hpp"
#include "karics/http-service.hpp"
#include "karics/router.hpp"

namespace karics {

namespace internal {
struct ServerState;
}

// Handle on a started server.
//
// The server runs on its own worker threads until stop() is called, a SIGINT / SIGTERM is received (if
// SignalHandler::Enable() was called), or the handle is destroyed. Stopping is graceful: the listening socket is
// closed, idle keep-alive connections are shut down, in-flight exchanges complete (with 'Connection: close'), and
// connections still open after maxDrainPeriod are force-closed.
class ServerHandle {
 public:
  ServerHandle() noexcept = default;

  ServerHandle(const ServerHandle&) = delete;
  ServerHandle(ServerHandle&&) noexcept = default;
  ServerHandle& operator=(const ServerHandle&) = delete;
  ServerHandle& operator=(ServerHandle&& other) noexcept;

  // Stops the server and waits for its termination.
  ~ServerHandle();

  // Blocks until the server terminates.
  // Rethrows the exception that made it terminate, if any.
  void join();

  // Requests a graceful stop and waits for the server termination. Errors are logged.
  void stop() noexcept;

  // Requests a graceful stop without waiting.
  void requestStop() noexcept;

  // Bound port (the ephemeral one when started on port 0).
  [[nodiscard]] uint16_t port() const noexcept { return _port; }

  [[nodiscard]] bool isRunning() const noexcept { return _controller.joinable(); }

 private:
  friend class HttpServer;

  ServerHandle(std::shared_ptr<internal::ServerState> state, std::jthread controller, uint16_t port) noexcept;

  std::shared_ptr<internal::ServerState> _state;
  std::jthread _controller;
  uint16_t _port{0};
};

// HTTP/1.x server: a listening socket whose accept loop and connections run as coroutines multiplexed on a pool
// of worker threads.
//
// The service factory is shared read-only by all workers and must stay immutable once the server is started.
class HttpServer {
 public:
  // Throws std::invalid_argument if the configuration is invalid or the factory is null.
  HttpServer(HttpServerConfig config, std::shared_ptr<const HttpServiceFactory> factory);

  // Server answering with the given router (see RouterServiceFactory).
  HttpServer(HttpServerConfig config, Router router);

  // Binds 'address' ("host:port") synchronously and starts serving in the background.
  // Throws std::invalid_argument if the address is malformed or cannot be resolved, std::system_error if the
  // socket cannot be bound (address already in use for instance).
  [[nodiscard]] ServerHandle start(std::string_view address) const;

  [[nodiscard]] const HttpServerConfig& config() const noexcept { return _config; }

 private:
  HttpServerConfig _config;
  std::shared_ptr<const HttpServiceFactory> _factory;
};

}  // namespace karics
