#ifndef CRUSH_CANCELLATION_TOKEN_HPP
#define CRUSH_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>

namespace crush {

enum class CancelRequest {
  Accepted,         // first request, the operation starts cancelling
  AlreadyCancelling // flag was already set, nothing else happens
};

// Shared cancellation flag checked cooperatively by workers between units of
// work. is_cancelled() and cancel() are lock-free and allocation-free so the
// token can be driven from a signal handler. All accesses are sequentially
// consistent.
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  bool is_cancelled() const noexcept {
    return cancelled_.load(std::memory_order_seq_cst);
  }

  // Idempotent. Async-signal-safe.
  CancelRequest cancel() noexcept;

  // Clears the flag for the next operation. Not async-signal-safe.
  void reset() noexcept;

  // Time elapsed since the first accepted cancel(), if any. Diagnostic only.
  std::optional<std::chrono::nanoseconds> time_since_cancel() const noexcept;

private:
  static_assert(std::atomic<bool>::is_always_lock_free,
                "cancellation flag must be lock-free");
  static_assert(std::atomic<int64_t>::is_always_lock_free,
                "cancellation timestamp must be lock-free");

  std::atomic<bool> cancelled_{false};
  // steady_clock ticks in ns; 0 while not cancelled
  std::atomic<int64_t> cancelled_at_ns_{0};
};

enum class OperationState { Running, Cancelling, Cancelled, Completed };

const char *operation_state_to_string(OperationState state);

// Per-operation state machine:
//   Running -> Completed
//   Running -> Cancelling -> Cancelled
// Transitions are compare-and-swap; an illegal transition leaves the state
// unchanged and returns false.
class OperationStatus {
public:
  OperationState state() const noexcept {
    return state_.load(std::memory_order_seq_cst);
  }

  bool begin_cancel() noexcept {
    return transition(OperationState::Running, OperationState::Cancelling);
  }
  bool finish_cancel() noexcept {
    return transition(OperationState::Cancelling, OperationState::Cancelled);
  }
  bool complete() noexcept {
    return transition(OperationState::Running, OperationState::Completed);
  }

  bool is_terminal() const noexcept {
    auto s = state();
    return s == OperationState::Cancelled || s == OperationState::Completed;
  }

private:
  bool transition(OperationState from, OperationState to) noexcept {
    return state_.compare_exchange_strong(from, to, std::memory_order_seq_cst);
  }

  std::atomic<OperationState> state_{OperationState::Running};
};

} // namespace crush

#endif // CRUSH_CANCELLATION_TOKEN_HPP
