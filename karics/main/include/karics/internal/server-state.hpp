#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <utility>
#include <vector>

#include "karics/http-server-config.hpp"
#include "karics/http-service.hpp"
#include "karics/internal/connection-driver.hpp"
#include "karics/internal/lifecycle.hpp"
#include "karics/scheduler.hpp"

namespace karics::internal {

// Decrements the number of active connections when the connection coroutine frame is destroyed, whether it ran
// or not.
class ActiveConnectionGuard {
 public:
  explicit ActiveConnectionGuard(std::atomic<uint32_t>& nbActive) noexcept : _pNbActive(&nbActive) {
    _pNbActive->fetch_add(1, std::memory_order_relaxed);
  }

  ActiveConnectionGuard(const ActiveConnectionGuard&) = delete;
  ActiveConnectionGuard(ActiveConnectionGuard&& other) noexcept : _pNbActive(std::exchange(other._pNbActive, nullptr)) {}
  ActiveConnectionGuard& operator=(const ActiveConnectionGuard&) = delete;
  ActiveConnectionGuard& operator=(ActiveConnectionGuard&&) = delete;

  ~ActiveConnectionGuard() {
    if (_pNbActive != nullptr) {
      _pNbActive->fetch_sub(1, std::memory_order_release);
    }
  }

 private:
  std::atomic<uint32_t>* _pNbActive;
};

// Everything a running server shares between its controlling thread, its accept loop and its connections.
// Connections reference it, it outlives them: the scheduler (declared last) destroys all coroutines first.
struct ServerState {
  ServerState(HttpServerConfig cfg, std::shared_ptr<const HttpServiceFactory> serviceFactory)
      : config(std::move(cfg)),
        factory(std::move(serviceFactory)),
        connections(config.resolvedNbThreads()),
        scheduler(config.resolvedNbThreads(), config.pollInterval) {}

  const HttpServerConfig config;
  const std::shared_ptr<const HttpServiceFactory> factory;
  Lifecycle lifecycle;
  std::atomic<uint32_t> nbActiveConnections{0};
  std::atomic<ConnectionId> nextConnectionId{1};
  // Live connections per worker index, only accessed from their worker thread.
  std::vector<std::unordered_set<ConnectionDriver*>> connections;
  std::mutex stopMutex;
  std::condition_variable_any stopCv;
  std::exception_ptr error;
  Scheduler scheduler;
};

}  // namespace karics::internal
