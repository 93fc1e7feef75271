#pragma once

#include <cstdint>

#include "karics/base-fd.hpp"
#include "karics/platform.hpp"

namespace karics {

// Non-blocking eventfd used to interrupt a worker blocked in epoll_wait from any thread.
// Notifications coalesce: several notify() before a drain() are seen as a single readiness.
class WakeupFd {
 public:
  // Throws std::system_error if the eventfd cannot be created.
  WakeupFd();

  void notify() const noexcept;

  // Resets the counter. Returns the number of notifications received since the last drain (0 if none).
  uint64_t drain() const noexcept;

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
};

}  // namespace karics
