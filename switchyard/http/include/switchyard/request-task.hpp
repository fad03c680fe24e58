#pragma once

#include <coroutine>
#include <exception>
#include <stdexcept>
#include <utility>
#include <variant>

namespace switchyard {

// Lazily started coroutine task carrying the result of an asynchronous computation.
// Route handlers return RequestTask<HttpResponse>.
//
// The coroutine does not run until first resumed. Whoever owns the task (usually the transport) drives it
// with resume() until done(), then consumes the result. An exception escaping the coroutine body is stored
// and rethrown, unchanged, when the result is consumed.
template <class T>
class RequestTask {
 public:
  class promise_type {
   public:
    RequestTask get_return_object() noexcept {
      return RequestTask{std::coroutine_handle<promise_type>::from_promise(*this)};
    }

    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }

    template <class U = T>
    void return_value(U&& value) {
      _outcome.template emplace<T>(std::forward<U>(value));
    }

    void unhandled_exception() noexcept { _outcome.template emplace<std::exception_ptr>(std::current_exception()); }

    // Moves out the produced value, or rethrows the stored exception.
    T consume() {
      if (auto* pException = std::get_if<std::exception_ptr>(&_outcome)) {
        std::rethrow_exception(*pException);
      }
      return std::get<T>(std::move(_outcome));
    }

   private:
    std::variant<std::monostate, T, std::exception_ptr> _outcome;
  };

  RequestTask() noexcept = default;

  explicit RequestTask(std::coroutine_handle<promise_type> handle) noexcept : _coro(handle) {}

  RequestTask(const RequestTask&) = delete;
  RequestTask(RequestTask&& other) noexcept : _coro(std::exchange(other._coro, {})) {}
  RequestTask& operator=(const RequestTask&) = delete;
  RequestTask& operator=(RequestTask&& other) noexcept {
    if (this != &other) {
      reset();
      _coro = std::exchange(other._coro, {});
    }
    return *this;
  }

  ~RequestTask() { reset(); }

  [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(_coro); }

  // A task without coroutine is considered done.
  [[nodiscard]] bool done() const noexcept { return !_coro || _coro.done(); }

  // Runs the coroutine until its next suspension point, or completion. No-op once done.
  void resume() {
    if (!done()) {
      _coro.resume();
    }
  }

  // Drives the coroutine to completion and returns its result, rethrowing a stored exception.
  // Throws std::logic_error on a task without coroutine.
  T runSynchronously() {
    if (!_coro) {
      throw std::logic_error("RequestTask has no coroutine to run");
    }
    while (!_coro.done()) {
      _coro.resume();
    }
    return _coro.promise().consume();
  }

  // Destroys the coroutine frame, if any.
  void reset() noexcept {
    if (_coro) {
      std::exchange(_coro, {}).destroy();
    }
  }

  // Gives up ownership of the coroutine frame to the caller.
  [[nodiscard]] std::coroutine_handle<promise_type> release() noexcept { return std::exchange(_coro, {}); }

 private:
  std::coroutine_handle<promise_type> _coro;
};

}  // namespace switchyard
