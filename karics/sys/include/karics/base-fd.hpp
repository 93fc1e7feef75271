#pragma once

#include <utility>

#include "karics/platform.hpp"

namespace karics {

// Owning file descriptor (listening or accepted socket, epoll, eventfd). Closed at destruction.
class BaseFd {
 public:
  BaseFd() noexcept = default;

  explicit BaseFd(NativeHandle fd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd&) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd&) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept {
    if (this != &other) {
      reset(other.release());
    }
    return *this;
  }

  ~BaseFd() { close(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

  explicit operator bool() const noexcept { return _fd != kInvalidHandle; }

  // Gives up ownership without closing.
  [[nodiscard]] NativeHandle release() noexcept { return std::exchange(_fd, kInvalidHandle); }

  // Closes the owned fd (if any) then takes ownership of 'fd'.
  void reset(NativeHandle fd = kInvalidHandle) noexcept;

  void close() noexcept { reset(); }

 private:
  NativeHandle _fd{kInvalidHandle};
};

}  // namespace karics
