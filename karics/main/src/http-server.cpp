#include "karics/http-server.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <utility>

#include "karics/base-fd.hpp"
#include "karics/bind-address.hpp"
#include "karics/http-server-config.hpp"
#include "karics/http-service.hpp"
#include "karics/internal/connection-driver.hpp"
#include "karics/internal/server-state.hpp"
#include "karics/log.hpp"
#include "karics/platform.hpp"
#include "karics/router-service.hpp"
#include "karics/router.hpp"
#include "karics/signal-handler.hpp"
#include "karics/socket-ops.hpp"
#include "karics/socket.hpp"
#include "karics/task.hpp"
#include "karics/timedef.hpp"
#include "karics/worker.hpp"

namespace karics {

namespace {

constexpr std::chrono::milliseconds kDrainCheckPeriod{5};

// Keeps a connection visible to the drain procedure of its worker while it is alive.
class ConnectionRegistration {
 public:
  ConnectionRegistration(std::unordered_set<internal::ConnectionDriver*>& connections,
                         internal::ConnectionDriver& driver)
      : _connections(connections), _pDriver(&driver) {
    _connections.insert(_pDriver);
  }

  ConnectionRegistration(const ConnectionRegistration&) = delete;
  ConnectionRegistration(ConnectionRegistration&&) = delete;
  ConnectionRegistration& operator=(const ConnectionRegistration&) = delete;
  ConnectionRegistration& operator=(ConnectionRegistration&&) = delete;

  ~ConnectionRegistration() { _connections.erase(_pDriver); }

 private:
  std::unordered_set<internal::ConnectionDriver*>& _connections;
  internal::ConnectionDriver* _pDriver;
};

Task<void> DriveConnection(internal::ServerState& state, BaseFd socket, ConnectionId id,
                           [[maybe_unused]] internal::ActiveConnectionGuard activeGuard) {
  Worker& worker = *Worker::Current();
  internal::ConnectionDriver driver(worker, std::move(socket), id, state.factory->newService(id), state.config,
                                    state.lifecycle);
  ConnectionRegistration registration(state.connections[worker.index()], driver);
  co_await driver.run();
}

bool IsTransientAcceptError(int err) noexcept {
  return err == ECONNABORTED || err == EPROTO || err == EPERM || err == ENETDOWN || err == ENOPROTOOPT ||
         err == EHOSTDOWN || err == ENONET || err == EHOSTUNREACH || err == EOPNOTSUPP || err == ENETUNREACH;
}

Task<void> AcceptLoop(internal::ServerState& state, Socket listener) {
  Worker& worker = *Worker::Current();
  const NativeHandle listenFd = listener.fd();
  log::debug("Accept loop started on worker {} (fd # {})", worker.index(), listenFd);

  while (!state.lifecycle.isStopping()) {
    const NativeHandle fd = AcceptNonBlocking(listenFd);
    if (fd == kInvalidHandle) {
      const int err = errno;
      if (err == EAGAIN || err == EWOULDBLOCK) {
        // Bounded wait so that a stop request is observed within a poll interval.
        const auto status = co_await worker.readable(listenFd, SteadyClock::now() + state.config.pollInterval);
        if (status == IoWaitStatus::Error) {
          log::error("Unable to watch listening socket fd # {}, stop accepting", listenFd);
          break;
        }
      } else if (IsTransientAcceptError(err)) {
        log::warn("accept failed: {}", std::strerror(err));
      } else {
        // Out of fds or memory: back off instead of spinning.
        log::error("accept failed: {}", std::strerror(err));
        co_await worker.sleepFor(state.config.pollInterval);
      }
      continue;
    }

    BaseFd socket(fd);
    if (state.config.tcpNoDelay && !SetTcpNoDelay(fd)) {
      log::warn("Unable to set TCP_NODELAY on fd # {}", fd);
    }
    const ConnectionId id = state.nextConnectionId.fetch_add(1, std::memory_order_relaxed);
    log::debug("Accepted connection {} on fd # {}", id, fd);
    state.scheduler.nextWorker().spawn(
        DriveConnection(state, std::move(socket), id, internal::ActiveConnectionGuard(state.nbActiveConnections)));
  }

  worker.forget(listenFd);
  log::debug("Accept loop stopped, closing listening socket fd # {}", listenFd);
}

void DrainConnections(internal::ServerState& state, std::chrono::milliseconds drainPeriod) {
  for (uint32_t workerIdx = 0; workerIdx < state.scheduler.nbWorkers(); ++workerIdx) {
    state.scheduler.worker(workerIdx).post([&state, workerIdx]() {
      for (internal::ConnectionDriver* pDriver : state.connections[workerIdx]) {
        pDriver->onDrain();
      }
    });
  }

  const auto deadline = SteadyClock::now() + drainPeriod;
  while (state.nbActiveConnections.load(std::memory_order_acquire) != 0 && SteadyClock::now() < deadline) {
    std::this_thread::sleep_for(kDrainCheckPeriod);
  }
  const auto nbRemaining = state.nbActiveConnections.load(std::memory_order_acquire);
  if (nbRemaining != 0) {
    log::warn("Drain period of {} ms expired, force closing {} connection(s)", drainPeriod.count(), nbRemaining);
  }
}

void RunServer(internal::ServerState& state, const std::stop_token& stopToken, uint16_t port) {
  state.lifecycle.enterRunning();
  state.scheduler.start();
  log::info("Server listening on port {} with {} worker(s)", port, state.scheduler.nbWorkers());

  {
    std::unique_lock lock(state.stopMutex);
    while (!stopToken.stop_requested() && !SignalHandler::IsStopRequested()) {
      state.stopCv.wait_for(lock, stopToken, state.config.pollInterval,
                            []() { return SignalHandler::IsStopRequested(); });
    }
  }

  auto drainPeriod = state.config.maxDrainPeriod;
  if (SignalHandler::IsStopRequested()) {
    log::info("Termination signal {} received", SignalHandler::ReceivedSignal());
    drainPeriod = std::min(drainPeriod, SignalHandler::GetMaxDrainPeriod());
  }

  if (state.lifecycle.exchangeDraining() == internal::Lifecycle::State::Running) {
    log::info("Stopping server on port {}, draining {} connection(s)", port,
              state.nbActiveConnections.load(std::memory_order_relaxed));
    DrainConnections(state, drainPeriod);
  }

  state.lifecycle.enterStopping();
  state.scheduler.requestStop();
  state.scheduler.join();
  state.lifecycle.reset();
  log::info("Server on port {} stopped", port);
}

}  // namespace

ServerHandle::ServerHandle(std::shared_ptr<internal::ServerState> state, std::jthread controller,
                           uint16_t port) noexcept
    : _state(std::move(state)), _controller(std::move(controller)), _port(port) {}

ServerHandle& ServerHandle::operator=(ServerHandle&& other) noexcept {
  if (this != &other) {
    stop();
    _state = std::move(other._state);
    _controller = std::move(other._controller);
    _port = std::exchange(other._port, 0);
  }
  return *this;
}

ServerHandle::~ServerHandle() { stop(); }

void ServerHandle::join() {
  if (_controller.joinable()) {
    _controller.join();
  }
  if (_state && _state->error) {
    std::rethrow_exception(std::exchange(_state->error, {}));
  }
}

void ServerHandle::requestStop() noexcept {
  if (_controller.joinable()) {
    _controller.request_stop();
  }
}

void ServerHandle::stop() noexcept {
  requestStop();
  try {
    join();
  } catch (const std::exception& ex) {
    log::error("Server on port {} terminated with an error: {}", _port, ex.what());
  }
}

HttpServer::HttpServer(HttpServerConfig config, std::shared_ptr<const HttpServiceFactory> factory)
    : _config(std::move(config)), _factory(std::move(factory)) {
  _config.validate();
  if (!_factory) {
    throw std::invalid_argument("HttpServer requires a service factory");
  }
}

HttpServer::HttpServer(HttpServerConfig config, Router router)
    : HttpServer(std::move(config), std::make_shared<const RouterServiceFactory>(std::move(router))) {}

ServerHandle HttpServer::start(std::string_view address) const {
  const sockaddr_in addr = ToSockAddr(ParseBindAddress(address));

  Socket listener(Socket::Type::StreamNonBlock);
  const uint16_t port = listener.bindAndListen(addr, _config.reusePort, _config.listenBacklog);

  auto state = std::make_shared<internal::ServerState>(_config, _factory);
  state->scheduler.worker(0).spawn(AcceptLoop(*state, std::move(listener)));

  std::jthread controller([state, port](const std::stop_token& stopToken) {
    try {
      RunServer(*state, stopToken, port);
    } catch (...) {
      state->error = std::current_exception();
    }
  });
  return {std::move(state), std::move(controller), port};
}

}  // namespace karics
