#include "karics/event-loop.hpp"

#include <sys/epoll.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <span>

#include "karics/errno-throw.hpp"
#include "karics/log.hpp"

namespace karics {

EventLoop::EventLoop(uint32_t initialCapacity)
    : _epollFd(::epoll_create1(EPOLL_CLOEXEC)), _epollEvents(std::max(initialCapacity, 1U)) {
  if (!_epollFd) {
    throw_errno("epoll_create1 failed");
  }
  _readyEvents.reserve(_epollEvents.size());
  log::debug("epoll fd # {} opened", _epollFd.fd());
}

bool EventLoop::watch(NativeHandle fd, EventBmp events) const {
  epoll_event ev{};
  ev.events = events;
  ev.data.fd = fd;
  if (::epoll_ctl(_epollFd.fd(), EPOLL_CTL_ADD, fd, &ev) != 0) [[unlikely]] {
    const auto err = errno;
    log::error("Unable to watch fd # {} for events 0x{:x}: {}", fd, events, std::strerror(err));
    errno = err;
    return false;
  }
  return true;
}

void EventLoop::watchOrThrow(NativeHandle fd, EventBmp events) const {
  if (!watch(fd, events)) {
    throw_errno("epoll_ctl ADD failed for fd # {}", fd);
  }
}

void EventLoop::unwatch(NativeHandle fd) const {
  if (::epoll_ctl(_epollFd.fd(), EPOLL_CTL_DEL, fd, nullptr) != 0) {
    log::debug("epoll_ctl DEL failed for fd # {}: {}", fd, std::strerror(errno));
  }
}

std::span<const EventLoop::ReadyEvent> EventLoop::wait(std::chrono::milliseconds timeout) {
  const int nbReady = ::epoll_wait(_epollFd.fd(), _epollEvents.data(), static_cast<int>(_epollEvents.size()),
                                   static_cast<int>(timeout.count()));
  _readyEvents.clear();
  if (nbReady < 0) {
    if (errno == EINTR) {
      return {};
    }
    throw_errno("epoll_wait failed on fd # {}", _epollFd.fd());
  }

  for (int idx = 0; idx < nbReady; ++idx) {
    _readyEvents.push_back(ReadyEvent{_epollEvents[idx].events, _epollEvents[idx].data.fd});
  }

  if (static_cast<std::size_t>(nbReady) == _epollEvents.size()) {
    _epollEvents.resize(_epollEvents.size() * 2U);
    log::debug("epoll fd # {} ready list grown to {} slots", _epollFd.fd(), _epollEvents.size());
  }
  return _readyEvents;
}

}  // namespace karics
