#include "karics/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <thread>
#include <utility>

#include "karics/log.hpp"
#include "karics/worker.hpp"

namespace karics {

Scheduler::Scheduler(uint32_t nbWorkers, std::chrono::milliseconds pollInterval) {
  nbWorkers = std::max(nbWorkers, 1U);
  _workers.reserve(nbWorkers);
  for (uint32_t workerIdx = 0; workerIdx < nbWorkers; ++workerIdx) {
    _workers.push_back(std::make_unique<Worker>(workerIdx, pollInterval));
  }
  _errors.resize(nbWorkers);
}

Scheduler::~Scheduler() {
  requestStop();
  try {
    join();
  } catch (const std::exception& ex) {
    log::error("Worker ended with an exception: {}", ex.what());
  }
}

void Scheduler::start() {
  if (!_threads.empty()) {
    return;
  }
  _threads.reserve(_workers.size());
  for (uint32_t workerIdx = 0; workerIdx < _workers.size(); ++workerIdx) {
    _threads.emplace_back([this, workerIdx]() {
      try {
        _workers[workerIdx]->run();
      } catch (...) {
        _errors[workerIdx] = std::current_exception();
      }
    });
  }
  log::debug("Started {} worker thread(s)", _threads.size());
}

Worker& Scheduler::nextWorker() noexcept {
  const uint32_t idx = _nextWorkerIdx.fetch_add(1, std::memory_order_relaxed) % _workers.size();
  return *_workers[idx];
}

void Scheduler::requestStop() noexcept {
  for (auto& pWorker : _workers) {
    pWorker->requestStop();
  }
}

void Scheduler::join() {
  for (std::jthread& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  _threads.clear();
  for (std::exception_ptr& error : _errors) {
    if (error) {
      std::rethrow_exception(std::exchange(error, {}));
    }
  }
}

}  // namespace karics
