#include "karics/signal-handler.hpp"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <csignal>

namespace karics {

namespace {

volatile std::sig_atomic_t gReceivedSignal = 0;
std::atomic<std::chrono::milliseconds::rep> gMaxDrainPeriodMs{5000};

// Async-signal-safe: only records the signal, the servers poll it.
void RecordTerminationSignal(int sigNum) { gReceivedSignal = sigNum; }

void Install(void (*handler)(int)) {
  struct sigaction action{};
  action.sa_handler = handler;
  ::sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  ::sigaction(SIGINT, &action, nullptr);
  ::sigaction(SIGTERM, &action, nullptr);
}

}  // namespace

void SignalHandler::Enable(std::chrono::milliseconds maxDrainPeriod) {
  gMaxDrainPeriodMs.store(maxDrainPeriod.count(), std::memory_order_relaxed);
  Install(RecordTerminationSignal);
}

void SignalHandler::Disable() { Install(SIG_DFL); }

int SignalHandler::ReceivedSignal() noexcept { return gReceivedSignal; }

std::chrono::milliseconds SignalHandler::GetMaxDrainPeriod() noexcept {
  return std::chrono::milliseconds{gMaxDrainPeriodMs.load(std::memory_order_relaxed)};
}

void SignalHandler::ResetStopRequest() noexcept { gReceivedSignal = 0; }

}  // namespace karics
