#pragma once

#include <sys/epoll.h>

#include <chrono>
#include <cstdint>
#include <span>
#include <vector>

#include "karics/base-fd.hpp"
#include "karics/platform.hpp"

namespace karics {

using EventBmp = uint32_t;

inline constexpr EventBmp kEventReadable = EPOLLIN;
inline constexpr EventBmp kEventWritable = EPOLLOUT;
inline constexpr EventBmp kEventError = EPOLLERR;
inline constexpr EventBmp kEventHangUp = EPOLLHUP;
inline constexpr EventBmp kEventPeerClosed = EPOLLRDHUP;
inline constexpr EventBmp kEventEdgeTriggered = EPOLLET;

// epoll instance owned by one worker thread.
// The ready list starts with kInitialCapacity slots and doubles each time a wait fills it entirely.
class EventLoop {
 public:
  static constexpr uint32_t kInitialCapacity = 64;

  struct ReadyEvent {
    EventBmp events;
    NativeHandle fd;
  };

  // Throws std::system_error if the epoll instance cannot be created.
  explicit EventLoop(uint32_t initialCapacity = kInitialCapacity);

  EventLoop(const EventLoop&) = delete;
  EventLoop(EventLoop&&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;
  EventLoop& operator=(EventLoop&&) = delete;

  ~EventLoop() = default;

  // Starts monitoring fd for 'events'. Returns false (logged) on failure, errno is preserved.
  [[nodiscard]] bool watch(NativeHandle fd, EventBmp events) const;

  // Same as watch(), throws std::system_error on failure.
  void watchOrThrow(NativeHandle fd, EventBmp events) const;

  // Stops monitoring fd. Failures (fd already closed) are only logged at debug level.
  void unwatch(NativeHandle fd) const;

  // Blocks at most 'timeout' for events. An interrupted wait returns no events.
  // Throws std::system_error on unrecoverable epoll_wait failures.
  // The returned span is valid until the next call.
  std::span<const ReadyEvent> wait(std::chrono::milliseconds timeout);

  [[nodiscard]] std::size_t capacity() const noexcept { return _epollEvents.size(); }

 private:
  BaseFd _epollFd;
  std::vector<epoll_event> _epollEvents;
  std::vector<ReadyEvent> _readyEvents;
};

}  // namespace karics
