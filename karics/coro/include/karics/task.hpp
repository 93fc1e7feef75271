#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace karics {

template <class T = void>
class Task;

namespace internal {

// Resumes the awaiting coroutine (symmetric transfer) when the task completes.
struct TaskFinalAwaiter {
  [[nodiscard]] bool await_ready() const noexcept { return false; }

  template <class Promise>
  std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) const noexcept {
    auto continuation = handle.promise()._continuation;
    if (continuation) {
      return continuation;
    }
    return std::noop_coroutine();
  }

  void await_resume() const noexcept {}
};

struct TaskPromiseBase {
  std::suspend_always initial_suspend() const noexcept { return {}; }
  TaskFinalAwaiter final_suspend() const noexcept { return {}; }

  void unhandled_exception() noexcept { _exception = std::current_exception(); }

  void rethrowIfNeeded() const {
    if (_exception) {
      std::rethrow_exception(_exception);
    }
  }

  std::coroutine_handle<> _continuation;
  std::exception_ptr _exception;
};

}  // namespace internal

// Lazily started coroutine producing a T.
// A Task is started either by being co_awaited from another coroutine (which is resumed once the task completes),
// or handed to Worker::spawn as a root task, or driven by runSynchronously() when it never suspends on I/O.
// The coroutine frame is owned by the Task object and destroyed with it.
template <class T>
class Task {
 public:
  struct promise_type : internal::TaskPromiseBase {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    template <class U>
    void return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>) {
      _value.emplace(std::forward<U>(value));
    }

    T consumeResult() {
      rethrowIfNeeded();
      return std::move(*_value);
    }

    std::optional<T> _value;
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  auto operator co_await() && noexcept {
    struct Awaiter {
      [[nodiscard]] bool await_ready() const noexcept { return !coro || coro.done(); }

      std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        coro.promise()._continuation = awaiting;
        return coro;
      }

      T await_resume() { return coro.promise().consumeResult(); }

      std::coroutine_handle<promise_type> coro;
    };
    return Awaiter{_coro};
  }

  // Runs the task to completion on the current thread. Only valid for tasks that never wait for I/O.
  T runSynchronously() {
    while (_coro && !_coro.done()) {
      _coro.resume();
    }
    return _coro.promise().consumeResult();
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

template <>
class Task<void> {
 public:
  struct promise_type : internal::TaskPromiseBase {
    Task get_return_object() noexcept { return Task{std::coroutine_handle<promise_type>::from_promise(*this)}; }

    void return_void() const noexcept {}
  };

  Task() noexcept = default;
  explicit Task(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  Task(Task&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  Task& operator=(Task&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  Task(const Task&) = delete;
  Task& operator=(const Task&) = delete;

  ~Task() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  auto operator co_await() && noexcept {
    struct Awaiter {
      [[nodiscard]] bool await_ready() const noexcept { return !coro || coro.done(); }

      std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        coro.promise()._continuation = awaiting;
        return coro;
      }

      void await_resume() const {
        if (coro) {
          coro.promise().rethrowIfNeeded();
        }
      }

      std::coroutine_handle<promise_type> coro;
    };
    return Awaiter{_coro};
  }

  void runSynchronously() {
    while (_coro && !_coro.done()) {
      _coro.resume();
    }
    if (_coro) {
      _coro.promise().rethrowIfNeeded();
    }
  }

  void reset() noexcept {
    if (_coro) {
      _coro.destroy();
      _coro = {};
    }
  }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace karics
