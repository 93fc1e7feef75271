#pragma once

#include <atomic>
#include <chrono>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "karics/wakeup-fd.hpp"
#include "karics/event-loop.hpp"
#include "karics/platform.hpp"
#include "karics/task.hpp"
#include "karics/timedef.hpp"

namespace karics {

enum class IoWaitStatus : uint8_t {
  // The fd reported readiness (or an error / hang-up, to be observed by the next I/O call).
  Ready,
  // The deadline expired before the fd became ready.
  TimedOut,
  // The fd could not be watched.
  Error
};

class Worker;

// Awaiter suspending the current coroutine until an fd is readable / writable or a deadline expires.
class IoAwaiter {
 public:
  enum class Direction : uint8_t { Read, Write };

  IoAwaiter(Worker& worker, NativeHandle fd, Direction direction, SteadyTimePoint deadline) noexcept
      : _worker(worker), _fd(fd), _direction(direction), _deadline(deadline) {}

  [[nodiscard]] bool await_ready() const noexcept { return false; }

  bool await_suspend(std::coroutine_handle<> handle);

  [[nodiscard]] IoWaitStatus await_resume() const noexcept { return _status; }

 private:
  friend class Worker;

  Worker& _worker;
  NativeHandle _fd;
  Direction _direction;
  SteadyTimePoint _deadline;
  IoWaitStatus _status{IoWaitStatus::Ready};
};

// Awaiter suspending the current coroutine until a point in time.
class SleepAwaiter {
 public:
  SleepAwaiter(Worker& worker, SteadyTimePoint wakeUpTime) noexcept : _worker(worker), _wakeUpTime(wakeUpTime) {}

  [[nodiscard]] bool await_ready() const noexcept { return _wakeUpTime <= SteadyClock::now(); }

  void await_suspend(std::coroutine_handle<> handle);

  void await_resume() const noexcept {}

 private:
  Worker& _worker;
  SteadyTimePoint _wakeUpTime;
};

// Awaiter giving the hand to the other ready coroutines of the worker.
class YieldAwaiter {
 public:
  explicit YieldAwaiter(Worker& worker) noexcept : _worker(worker) {}

  [[nodiscard]] bool await_ready() const noexcept { return false; }

  void await_suspend(std::coroutine_handle<> handle);

  void await_resume() const noexcept {}

 private:
  Worker& _worker;
};

// Single OS thread cooperative scheduler of coroutines, multiplexed over an edge-triggered epoll.
//
// Coroutines running on a worker suspend on readable() / writable() / sleepUntil() and are resumed by the worker
// thread when the fd becomes ready or the deadline expires, so a waiting coroutine never occupies the thread.
// Coroutines must always attempt their non-blocking I/O before waiting: with edge-triggered notifications only
// readiness changes happening after the EAGAIN are reported.
//
// Thread-safety: post(), spawn() and requestStop() may be called from any thread. All other methods must be called
// from the worker thread, typically by the coroutines it runs.
class Worker {
 public:
  using Job = std::move_only_function<void()>;

  Worker(uint32_t index, std::chrono::milliseconds pollInterval);

  Worker(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker& operator=(Worker&&) = delete;

  ~Worker();

  // Worker running on the current thread, nullptr outside of worker threads.
  static Worker* Current() noexcept;

  [[nodiscard]] uint32_t index() const noexcept { return _index; }

  // Schedules a job on the worker thread.
  void post(Job job);

  // Schedules a root task on the worker thread. The worker owns it until it completes, or destroys it when
  // the worker stops.
  void spawn(Task<void> task);

  // Requests the run loop to return. Root tasks still suspended at that time are destroyed.
  void requestStop() noexcept;

  [[nodiscard]] bool isStopRequested() const noexcept { return _stopRequested.load(std::memory_order_acquire); }

  // Runs the event loop on the calling thread until requestStop().
  // Throws std::system_error if the epoll instance fails.
  void run();

  // Stops watching fd. Must be called before closing an fd that was awaited.
  void forget(NativeHandle fd);

  IoAwaiter readable(NativeHandle fd, SteadyTimePoint deadline = kNoDeadline) noexcept {
    return {*this, fd, IoAwaiter::Direction::Read, deadline};
  }

  IoAwaiter writable(NativeHandle fd, SteadyTimePoint deadline = kNoDeadline) noexcept {
    return {*this, fd, IoAwaiter::Direction::Write, deadline};
  }

  SleepAwaiter sleepUntil(SteadyTimePoint wakeUpTime) noexcept { return {*this, wakeUpTime}; }

  SleepAwaiter sleepFor(std::chrono::milliseconds duration) noexcept {
    return {*this, SteadyClock::now() + duration};
  }

  YieldAwaiter yield() noexcept { return YieldAwaiter{*this}; }

  // Number of live root tasks.
  [[nodiscard]] std::size_t nbRootTasks() const noexcept { return _roots.size(); }

 private:
  friend class IoAwaiter;
  friend class SleepAwaiter;
  friend class YieldAwaiter;
  friend struct RootTaskFinalizer;

  struct FdWaiters {
    std::coroutine_handle<> reader;
    IoAwaiter* readerAwaiter{nullptr};
    uint64_t readerWaitId{0};
    std::coroutine_handle<> writer;
    IoAwaiter* writerAwaiter{nullptr};
    uint64_t writerWaitId{0};
  };

  struct Timer {
    SteadyTimePoint deadline;
    uint64_t waitId;
    NativeHandle fd;
    IoAwaiter::Direction direction;
    // Set for sleeps only, I/O wait timers resolve their waiter through fd and waitId.
    std::coroutine_handle<> sleeper;

    bool operator>(const Timer& rhs) const noexcept { return deadline > rhs.deadline; }
  };

  bool addIoWaiter(IoAwaiter& awaiter, std::coroutine_handle<> handle);
  void addSleeper(SteadyTimePoint wakeUpTime, std::coroutine_handle<> handle);
  void addReady(std::coroutine_handle<> handle) { _ready.push_back(handle); }

  void onRootDone(std::coroutine_handle<> handle) noexcept;

  void processEvent(EventLoop::ReadyEvent event);
  void drainPostedJobs();
  void fireExpiredTimers();
  void resumeReady();
  std::chrono::milliseconds nextPollTimeout();
  void destroyRemainingRoots() noexcept;

  uint32_t _index;
  std::chrono::milliseconds _pollInterval;
  EventLoop _eventLoop;
  WakeupFd _wakeupFd;
  std::atomic<bool> _stopRequested{false};
  uint64_t _nextWaitId{1};
  std::unordered_map<NativeHandle, FdWaiters> _fdWaiters;
  std::priority_queue<Timer, std::vector<Timer>, std::greater<>> _timers;
  std::vector<std::coroutine_handle<>> _ready;
  std::vector<std::coroutine_handle<>> _resuming;
  // Frames of the live root tasks, keyed by coroutine frame address.
  std::unordered_set<void*> _roots;

  std::mutex _postedMutex;
  std::vector<Job> _postedJobs;
  std::vector<Job> _runningJobs;
};

}  // namespace karics
