#include "karics/worker.hpp"

#include <algorithm>
#include <chrono>
#include <coroutine>
#include <exception>
#include <mutex>
#include <unordered_set>
#include <utility>
#include <vector>

#include "karics/event-loop.hpp"
#include "karics/log.hpp"
#include "karics/task.hpp"
#include "karics/timedef.hpp"

namespace karics {

namespace {

thread_local Worker* tCurrentWorker = nullptr;

constexpr EventBmp kWatchedEvents = kEventReadable | kEventWritable | kEventPeerClosed | kEventEdgeTriggered;

}  // namespace

// Final awaiter of root tasks: unregisters the finished coroutine from its worker and frees it.
struct RootTaskFinalizer {
  [[nodiscard]] bool await_ready() const noexcept { return false; }

  void await_suspend(std::coroutine_handle<> handle) const noexcept { worker->onRootDone(handle); }

  void await_resume() const noexcept {}

  Worker* worker;
};

namespace {

struct RootTask {
  struct promise_type {
    RootTask get_return_object() noexcept { return RootTask{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    std::suspend_always initial_suspend() const noexcept { return {}; }
    RootTaskFinalizer final_suspend() const noexcept { return {worker}; }

    void return_void() const noexcept {}

    // Exceptions not deriving from std::exception terminate the process.
    void unhandled_exception() const noexcept {
      try {
        throw;
      } catch (const std::exception& ex) {
        log::error("Root task on worker {} ended with an exception: {}", worker->index(), ex.what());
      }
    }

    Worker* worker{nullptr};
  };

  std::coroutine_handle<promise_type> handle;
};

RootTask RunRoot(Task<void> task) { co_await std::move(task); }

}  // namespace

bool IoAwaiter::await_suspend(std::coroutine_handle<> handle) { return _worker.addIoWaiter(*this, handle); }

void SleepAwaiter::await_suspend(std::coroutine_handle<> handle) { _worker.addSleeper(_wakeUpTime, handle); }

void YieldAwaiter::await_suspend(std::coroutine_handle<> handle) { _worker.addReady(handle); }

Worker::Worker(uint32_t index, std::chrono::milliseconds pollInterval)
    : _index(index), _pollInterval(pollInterval) {
  _eventLoop.watchOrThrow(_wakeupFd.fd(), kEventReadable);
}

Worker::~Worker() { destroyRemainingRoots(); }

Worker* Worker::Current() noexcept { return tCurrentWorker; }

void Worker::post(Job job) {
  {
    std::scoped_lock lock(_postedMutex);
    _postedJobs.push_back(std::move(job));
  }
  _wakeupFd.notify();
}

void Worker::spawn(Task<void> task) {
  post([this, task = std::move(task)]() mutable {
    RootTask root = RunRoot(std::move(task));
    root.handle.promise().worker = this;
    _roots.insert(root.handle.address());
    root.handle.resume();
  });
}

void Worker::requestStop() noexcept {
  _stopRequested.store(true, std::memory_order_release);
  _wakeupFd.notify();
}

void Worker::run() {
  tCurrentWorker = this;
  log::debug("Worker {} started", _index);

  while (!isStopRequested()) {
    for (const EventLoop::ReadyEvent event : _eventLoop.wait(nextPollTimeout())) {
      if (event.fd == _wakeupFd.fd()) {
        _wakeupFd.drain();
      } else {
        processEvent(event);
      }
    }
    resumeReady();
    drainPostedJobs();
    fireExpiredTimers();
    resumeReady();
  }

  destroyRemainingRoots();
  log::debug("Worker {} stopped", _index);
  tCurrentWorker = nullptr;
}

void Worker::forget(NativeHandle fd) {
  const auto it = _fdWaiters.find(fd);
  if (it != _fdWaiters.end()) {
    _eventLoop.unwatch(fd);
    _fdWaiters.erase(it);
  }
}

bool Worker::addIoWaiter(IoAwaiter& awaiter, std::coroutine_handle<> handle) {
  auto [it, inserted] = _fdWaiters.try_emplace(awaiter._fd);
  if (inserted && !_eventLoop.watch(awaiter._fd, kWatchedEvents)) {
    _fdWaiters.erase(it);
    awaiter._status = IoWaitStatus::Error;
    return false;
  }

  FdWaiters& waiters = it->second;
  const bool isRead = awaiter._direction == IoAwaiter::Direction::Read;
  std::coroutine_handle<>& slot = isRead ? waiters.reader : waiters.writer;
  if (slot) {
    log::error("fd # {} already has a {} waiter on worker {}", awaiter._fd, isRead ? "read" : "write", _index);
    awaiter._status = IoWaitStatus::Error;
    return false;
  }

  const uint64_t waitId = _nextWaitId++;
  slot = handle;
  if (isRead) {
    waiters.readerAwaiter = &awaiter;
    waiters.readerWaitId = waitId;
  } else {
    waiters.writerAwaiter = &awaiter;
    waiters.writerWaitId = waitId;
  }
  if (awaiter._deadline != kNoDeadline) {
    _timers.push(Timer{awaiter._deadline, waitId, awaiter._fd, awaiter._direction, {}});
  }
  return true;
}

void Worker::addSleeper(SteadyTimePoint wakeUpTime, std::coroutine_handle<> handle) {
  _timers.push(Timer{wakeUpTime, 0, kInvalidHandle, IoAwaiter::Direction::Read, handle});
}

void Worker::onRootDone(std::coroutine_handle<> handle) noexcept {
  _roots.erase(handle.address());
  handle.destroy();
}

void Worker::processEvent(EventLoop::ReadyEvent event) {
  const auto it = _fdWaiters.find(event.fd);
  if (it == _fdWaiters.end()) {
    return;
  }
  FdWaiters& waiters = it->second;
  // Errors and hang-ups wake up both directions, the next I/O call reports them.
  const bool errorOrHup = (event.events & (kEventError | kEventHangUp)) != 0;
  if (waiters.reader && (errorOrHup || (event.events & (kEventReadable | kEventPeerClosed)) != 0)) {
    waiters.readerAwaiter->_status = IoWaitStatus::Ready;
    waiters.readerAwaiter = nullptr;
    addReady(std::exchange(waiters.reader, {}));
  }
  if (waiters.writer && (errorOrHup || (event.events & kEventWritable) != 0)) {
    waiters.writerAwaiter->_status = IoWaitStatus::Ready;
    waiters.writerAwaiter = nullptr;
    addReady(std::exchange(waiters.writer, {}));
  }
}

void Worker::drainPostedJobs() {
  {
    std::scoped_lock lock(_postedMutex);
    _runningJobs.swap(_postedJobs);
  }
  for (Job& job : _runningJobs) {
    job();
  }
  _runningJobs.clear();
}

void Worker::fireExpiredTimers() {
  const auto now = SteadyClock::now();
  while (!_timers.empty() && _timers.top().deadline <= now) {
    const Timer timer = _timers.top();
    _timers.pop();
    if (timer.sleeper) {
      addReady(timer.sleeper);
      continue;
    }
    // Stale timers (waiter already resumed by its fd) are recognized by their wait id.
    const auto it = _fdWaiters.find(timer.fd);
    if (it == _fdWaiters.end()) {
      continue;
    }
    FdWaiters& waiters = it->second;
    if (timer.direction == IoAwaiter::Direction::Read) {
      if (waiters.reader && waiters.readerWaitId == timer.waitId) {
        waiters.readerAwaiter->_status = IoWaitStatus::TimedOut;
        waiters.readerAwaiter = nullptr;
        addReady(std::exchange(waiters.reader, {}));
      }
    } else if (waiters.writer && waiters.writerWaitId == timer.waitId) {
      waiters.writerAwaiter->_status = IoWaitStatus::TimedOut;
      waiters.writerAwaiter = nullptr;
      addReady(std::exchange(waiters.writer, {}));
    }
  }
}

void Worker::resumeReady() {
  while (!_ready.empty()) {
    _resuming.swap(_ready);
    for (std::coroutine_handle<> handle : _resuming) {
      handle.resume();
    }
    _resuming.clear();
  }
}

std::chrono::milliseconds Worker::nextPollTimeout() {
  std::chrono::milliseconds timeout = _pollInterval;
  bool hasPostedJobs;
  {
    std::scoped_lock lock(_postedMutex);
    hasPostedJobs = !_postedJobs.empty();
  }
  if (!_ready.empty() || hasPostedJobs) {
    timeout = std::chrono::milliseconds{0};
  } else if (!_timers.empty()) {
    const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(_timers.top().deadline - SteadyClock::now());
    timeout = std::clamp(remaining, std::chrono::milliseconds{0}, timeout);
  }
  return timeout;
}

void Worker::destroyRemainingRoots() noexcept {
  _fdWaiters.clear();
  _timers = {};
  _ready.clear();
  auto roots = std::move(_roots);
  _roots.clear();
  if (!roots.empty()) {
    log::debug("Worker {} destroys {} suspended root task(s)", _index, roots.size());
  }
  for (void* frame : roots) {
    std::coroutine_handle<>::from_address(frame).destroy();
  }
}

}  // namespace karics
