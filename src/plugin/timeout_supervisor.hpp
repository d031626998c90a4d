#ifndef CRUSH_TIMEOUT_SUPERVISOR_HPP
#define CRUSH_TIMEOUT_SUPERVISOR_HPP

#include "cancel/cancellation_token.hpp"
#include "plugin/algorithm.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace crush {

enum class AlgorithmOperation { Compress, Decompress };

const char *operation_to_string(AlgorithmOperation operation);

using SharedBuffer = std::shared_ptr<const std::vector<uint8_t>>;

// Runs one algorithm call on a dedicated worker thread and waits for its
// result, the deadline, or the caller's cancellation, whichever comes first.
//
// Each attempt gets its own token. The caller's token is polled every
// POLL_INTERVAL and forwarded to it; when the supervisor returns without
// having received the worker's result the attempt token is cancelled so the
// worker stops at its next block boundary. A worker that never polls keeps
// running in the background until it finishes on its own; it owns everything
// it touches, so abandoning it is safe.
class TimeoutSupervisor {
public:
  static constexpr std::chrono::milliseconds POLL_INTERVAL{5};
  static constexpr std::chrono::milliseconds CANCEL_GRACE{20};
  static constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

  // A zero timeout disables the deadline.
  explicit TimeoutSupervisor(
      std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

  struct Outcome {
    std::vector<uint8_t> output;
    AlgorithmMetadata algorithm;
    bool used_fallback = false;
  };

  // Single attempt. Throws Timeout, WorkerCrashed (the algorithm threw
  // something other than CrushError), Cancelled, or whatever CrushError the
  // algorithm raised. `max_output` bounds decompression output.
  std::vector<uint8_t> run(const AlgorithmPtr &algorithm,
                           AlgorithmOperation operation,
                           const SharedBuffer &input,
                           const CancellationToken &cancel,
                           size_t max_output = NO_OUTPUT_LIMIT) const;

  // Runs `primary`; on Timeout or WorkerCrashed retries exactly once with
  // `fallback`. Cancellation is never retried, and a failed fallback is
  // reported to the caller.
  Outcome run_with_fallback(const AlgorithmPtr &primary,
                            const AlgorithmPtr &fallback,
                            AlgorithmOperation operation,
                            const SharedBuffer &input,
                            const CancellationToken &cancel) const;

  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
};

} // namespace crush

#endif // CRUSH_TIMEOUT_SUPERVISOR_HPP
