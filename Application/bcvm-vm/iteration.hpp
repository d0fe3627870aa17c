#pragma once
#include "../../Domain/bcvm-core/value.hpp"
#include <coroutine>
#include <cstdint>
#include <exception>
#include <optional>
#include <utility>

namespace bcvm {

  // Pull-style generator over a foreign iteration protocol. Each resume runs
  // the driver up to its next co_yield.
  class IterationDriver {
  public:
    struct promise_type {
      ValueList current;
      std::exception_ptr error;

      IterationDriver get_return_object() {
        return IterationDriver(std::coroutine_handle<promise_type>::from_promise(*this));
      }
      std::suspend_always initial_suspend() noexcept { return {}; }
      std::suspend_always final_suspend() noexcept { return {}; }
      std::suspend_always yield_value(ValueList values) {
        current = std::move(values);
        return {};
      }
      void return_void() {}
      void unhandled_exception() {
        error = std::current_exception();
      }
    };

    IterationDriver() = default;
    explicit IterationDriver(std::coroutine_handle<promise_type> h) : handle_(h) {}
    IterationDriver(IterationDriver &&o) noexcept : handle_(std::exchange(o.handle_, nullptr)) {}
    IterationDriver &operator=(IterationDriver &&o) noexcept {
      if (this != &o) {
        destroy();
        handle_ = std::exchange(o.handle_, nullptr);
      }
      return *this;
    }
    IterationDriver(const IterationDriver &)            = delete;
    IterationDriver &operator=(const IterationDriver &) = delete;
    ~IterationDriver() {
      destroy();
    }

    // Next tuple, or nullopt once the driver has finished. Rethrows driver errors.
    std::optional<ValueList> resume();
    bool done() const {
      return !handle_ || handle_.done();
    }

  private:
    void destroy() {
      if (handle_)
        handle_.destroy();
      handle_ = nullptr;
    }

    std::coroutine_handle<promise_type> handle_;
  };

  // Yields {key, value} for every entry of the table.
  IterationDriver driveTable(TableRef table);

  // Adapter used by generic for-loops over non-callable values: one step()
  // per loop iteration, padded or truncated to the loop's result arity.
  class IterationBridge {
  public:
    IterationBridge(IterationDriver driver, uint32_t arity) : driver_(std::move(driver)), arity_(arity) {}

    // Result tuple, or nullopt as the termination sentinel. After the sentinel
    // the driver is never resumed again.
    std::optional<ValueList> step();

    bool finished() const {
      return finished_;
    }
    uint64_t resumes() const {
      return resumes_;
    }

  private:
    IterationDriver driver_;
    uint32_t arity_{0};
    bool finished_{false};
    uint64_t resumes_{0};
  };

  // Builds the bridge for an iterable; throws RuntimeFault for values that
  // have no iteration protocol.
  IterationBridge makeIterationBridge(const Value &iterable, uint32_t arity);

} // namespace bcvm
