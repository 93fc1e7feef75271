#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <thread>
#include <vector>

#include "karics/task.hpp"
#include "karics/worker.hpp"

namespace karics {

// Pool of workers, each running its own event loop on a dedicated thread.
// Root tasks are assigned to workers either explicitly or in round-robin.
class Scheduler {
 public:
  // Creates nbWorkers workers (at least one). Threads are not started until start().
  Scheduler(uint32_t nbWorkers, std::chrono::milliseconds pollInterval);

  Scheduler(const Scheduler&) = delete;
  Scheduler(Scheduler&&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;
  Scheduler& operator=(Scheduler&&) = delete;

  // Requests stop and joins the worker threads.
  ~Scheduler();

  // Launches one thread per worker. Calling it twice is a no-op.
  void start();

  [[nodiscard]] uint32_t nbWorkers() const noexcept { return static_cast<uint32_t>(_workers.size()); }

  [[nodiscard]] Worker& worker(uint32_t index) noexcept { return *_workers[index]; }

  // Next worker in round-robin order. Thread-safe.
  Worker& nextWorker() noexcept;

  // Spawns a root task on the next worker in round-robin order.
  void spawn(Task<void> task) { nextWorker().spawn(std::move(task)); }

  // Asks all workers to stop, without waiting.
  void requestStop() noexcept;

  // Waits for all worker threads to return.
  // Rethrows the first exception that escaped a worker run loop, if any.
  void join();

  [[nodiscard]] bool isRunning() const noexcept { return !_threads.empty(); }

 private:
  std::vector<std::unique_ptr<Worker>> _workers;
  std::vector<std::jthread> _threads;
  std::vector<std::exception_ptr> _errors;
  std::atomic<uint32_t> _nextWorkerIdx{0};
};

}  // namespace karics
