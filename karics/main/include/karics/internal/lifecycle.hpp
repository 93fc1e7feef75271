#pragma once

#include <atomic>
#include <cstdint>

namespace karics::internal {

// Server state, written by the controlling thread and read by the workers.
struct Lifecycle {
  enum class State : uint8_t { Idle, Running, Draining, Stopping };

  void enterRunning() noexcept { state.store(State::Running, std::memory_order_release); }

  // Atomically set state to Draining only if current state is Running.
  // Returns the previous state.
  State exchangeDraining() noexcept {
    State expected = State::Running;
    state.compare_exchange_strong(expected, State::Draining, std::memory_order_acq_rel);
    return expected;
  }

  void enterStopping() noexcept { state.store(State::Stopping, std::memory_order_release); }

  void reset() noexcept { state.store(State::Idle, std::memory_order_release); }

  [[nodiscard]] State current() const noexcept { return state.load(std::memory_order_acquire); }

  [[nodiscard]] bool isIdle() const noexcept { return current() == State::Idle; }

  [[nodiscard]] bool isRunning() const noexcept { return current() == State::Running; }

  // True once a stop has been requested: no new exchange should start.
  [[nodiscard]] bool isStopping() const noexcept {
    const State st = current();
    return st == State::Draining || st == State::Stopping;
  }

  std::atomic<State> state{State::Idle};
};

}  // namespace karics::internal
