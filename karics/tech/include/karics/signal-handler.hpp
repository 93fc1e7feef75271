#pragma once

#include <chrono>

namespace karics {

// Process-wide SIGINT / SIGTERM hook turning a termination signal into a graceful stop of the running servers.
class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Installs the handlers. maxDrainPeriod caps the drain period of the servers stopped by a signal.
  static void Enable(std::chrono::milliseconds maxDrainPeriod = std::chrono::milliseconds{5000});

  // Restores the default dispositions.
  static void Disable();

  [[nodiscard]] static bool IsStopRequested() noexcept { return ReceivedSignal() != 0; }

  // Number of the last termination signal received, 0 if none.
  [[nodiscard]] static int ReceivedSignal() noexcept;

  [[nodiscard]] static std::chrono::milliseconds GetMaxDrainPeriod() noexcept;

  // Forgets a received signal, so that several servers can be run in sequence in the same process.
  static void ResetStopRequest() noexcept;
};

}  // namespace karics
