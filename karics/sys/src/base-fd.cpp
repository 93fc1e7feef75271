#include "karics/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "karics/log.hpp"

namespace karics {

void BaseFd::reset(NativeHandle fd) noexcept {
  const NativeHandle previous = std::exchange(_fd, fd);
  if (previous == kInvalidHandle) {
    return;
  }
  // On Linux the descriptor is released even when close reports EINTR, it must not be closed again.
  if (::close(previous) != 0 && errno != EINTR) {
    log::error("close of fd # {} failed: {}", previous, std::strerror(errno));
    return;
  }
  log::trace("fd # {} closed", previous);
}

}  // namespace karics
