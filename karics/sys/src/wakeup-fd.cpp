#include "karics/wakeup-fd.hpp"

#include <sys/eventfd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>

#include "karics/errno-throw.hpp"
#include "karics/log.hpp"

namespace karics {

WakeupFd::WakeupFd() : _fd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (!_fd) {
    throw_errno("eventfd creation failed");
  }
}

void WakeupFd::notify() const noexcept {
  // EAGAIN means the counter is saturated, the reader is already notified.
  if (::eventfd_write(fd(), 1) != 0 && errno != EAGAIN) {
    log::error("Unable to notify wakeup fd # {}: {}", fd(), std::strerror(errno));
  }
}

uint64_t WakeupFd::drain() const noexcept {
  eventfd_t nbNotifications = 0;
  if (::eventfd_read(fd(), &nbNotifications) != 0) {
    if (errno != EAGAIN) {
      log::error("Unable to drain wakeup fd # {}: {}", fd(), std::strerror(errno));
    }
    return 0;
  }
  return nbNotifications;
}

}  // namespace karics
