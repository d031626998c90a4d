#include "cancel/cancellation_token.hpp"

namespace crush {

namespace {
int64_t steady_now_ns() noexcept {
  // steady_clock is backed by clock_gettime(CLOCK_MONOTONIC), which is
  // async-signal-safe.
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}
} // namespace

CancelRequest CancellationToken::cancel() noexcept {
  if (cancelled_.exchange(true, std::memory_order_seq_cst))
    return CancelRequest::AlreadyCancelling;

  cancelled_at_ns_.store(steady_now_ns(), std::memory_order_seq_cst);
  return CancelRequest::Accepted;
}

void CancellationToken::reset() noexcept {
  cancelled_at_ns_.store(0, std::memory_order_seq_cst);
  cancelled_.store(false, std::memory_order_seq_cst);
}

std::optional<std::chrono::nanoseconds>
CancellationToken::time_since_cancel() const noexcept {
  if (!is_cancelled())
    return std::nullopt;

  int64_t at = cancelled_at_ns_.load(std::memory_order_seq_cst);
  // The flag is set before the timestamp is stored
  if (at == 0)
    return std::chrono::nanoseconds{0};

  int64_t elapsed = steady_now_ns() - at;
  return std::chrono::nanoseconds{elapsed < 0 ? 0 : elapsed};
}

const char *operation_state_to_string(OperationState state) {
  switch (state) {
  case OperationState::Running:
    return "Running";
  case OperationState::Cancelling:
    return "Cancelling";
  case OperationState::Cancelled:
    return "Cancelled";
  case OperationState::Completed:
    return "Completed";
  }
  return "Unknown";
}

} // namespace crush
