#include "plugin/timeout_supervisor.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/thread_safe_queue.hpp"

#include <optional>
#include <string>
#include <thread>

namespace crush {

namespace {

struct WorkerResult {
  enum class Status { Ok, Failed, Crashed };

  Status status = Status::Ok;
  std::vector<uint8_t> output;
  std::optional<CrushError> error;
  std::string crash_message;
};

using ResultChannel = ThreadSafeQueue<WorkerResult>;

// Cancels the attempt token unless the worker's result was received.
class AbandonGuard {
public:
  explicit AbandonGuard(std::shared_ptr<CancellationToken> token)
      : token_(std::move(token)) {}
  ~AbandonGuard() {
    if (!completed_)
      token_->cancel();
  }

  AbandonGuard(const AbandonGuard &) = delete;
  AbandonGuard &operator=(const AbandonGuard &) = delete;

  void mark_completed() { completed_ = true; }

private:
  std::shared_ptr<CancellationToken> token_;
  bool completed_ = false;
};

void worker_main(AlgorithmPtr algorithm, AlgorithmOperation operation,
                 SharedBuffer input, size_t max_output,
                 std::shared_ptr<CancellationToken> token,
                 std::shared_ptr<ResultChannel> channel) {
  WorkerResult result;
  try {
    result.output = operation == AlgorithmOperation::Compress
                        ? algorithm->compress(*input, *token)
                        : algorithm->decompress(*input, max_output, *token);
  } catch (const CrushError &e) {
    result.status = WorkerResult::Status::Failed;
    result.error = e;
  } catch (const std::exception &e) {
    result.status = WorkerResult::Status::Crashed;
    result.crash_message = e.what();
  } catch (...) {
    result.status = WorkerResult::Status::Crashed;
    result.crash_message = "non-standard exception";
  }
  channel->push(std::move(result));
}

std::vector<uint8_t> unwrap(WorkerResult &result, const std::string &name,
                            AlgorithmOperation operation) {
  switch (result.status) {
  case WorkerResult::Status::Ok:
    return std::move(result.output);
  case WorkerResult::Status::Failed:
    throw *result.error;
  case WorkerResult::Status::Crashed:
    break;
  }
  LOG(LogLevel::WARN, LogComponent::PLUGIN_SUPERVISOR,
      "Algorithm '" << name << "' crashed during "
                    << operation_to_string(operation) << ": "
                    << result.crash_message);
  throw CrushError(ErrorKind::WorkerCrashed,
                   "Algorithm '" + name + "' crashed: " + result.crash_message);
}

} // namespace

const char *operation_to_string(AlgorithmOperation operation) {
  return operation == AlgorithmOperation::Compress ? "compression"
                                                   : "decompression";
}

TimeoutSupervisor::TimeoutSupervisor(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

std::vector<uint8_t>
TimeoutSupervisor::run(const AlgorithmPtr &algorithm,
                       AlgorithmOperation operation, const SharedBuffer &input,
                       const CancellationToken &cancel,
                       size_t max_output) const {
  const std::string name = algorithm->metadata().name;
  if (cancel.is_cancelled())
    throw CrushError(ErrorKind::Cancelled,
                     std::string("Operation cancelled before ") +
                         operation_to_string(operation) + " started");

  auto attempt_token = std::make_shared<CancellationToken>();
  auto channel = std::make_shared<ResultChannel>();
  AbandonGuard guard(attempt_token);

  std::thread(worker_main, algorithm, operation, input, max_output,
              attempt_token, channel)
      .detach();

  const auto start = std::chrono::steady_clock::now();
  const bool has_deadline = timeout_.count() > 0;
  const auto deadline = start + timeout_;

  LOG(LogLevel::TRACE, LogComponent::PLUGIN_SUPERVISOR,
      "Started " << operation_to_string(operation) << " with '" << name
                 << "' (timeout " << timeout_.count() << " ms)");

  while (true) {
    if (auto result = channel->wait_and_pop_for(POLL_INTERVAL)) {
      guard.mark_completed();
      return unwrap(*result, name, operation);
    }

    if (cancel.is_cancelled()) {
      attempt_token->cancel();
      // Give the worker a moment to finish its block and acknowledge.
      if (channel->wait_and_pop_for(CANCEL_GRACE)) {
        guard.mark_completed();
        LOG(LogLevel::DEBUG, LogComponent::PLUGIN_SUPERVISOR,
            "Worker for '" << name << "' acknowledged cancellation");
      } else {
        LOG(LogLevel::DEBUG, LogComponent::PLUGIN_SUPERVISOR,
            "Abandoning worker for '" << name
                                      << "' after cancellation request");
      }
      throw CrushError(ErrorKind::Cancelled,
                       std::string("Operation cancelled during ") +
                           operation_to_string(operation));
    }

    if (has_deadline && std::chrono::steady_clock::now() >= deadline) {
      LOG(LogLevel::WARN, LogComponent::PLUGIN_SUPERVISOR,
          "Algorithm '" << name << "' timed out after " << timeout_.count()
                        << " ms during " << operation_to_string(operation));
      throw CrushError(ErrorKind::Timeout,
                       "Algorithm '" + name + "' timed out after " +
                           std::to_string(timeout_.count()) + " ms");
    }
  }
}

TimeoutSupervisor::Outcome TimeoutSupervisor::run_with_fallback(
    const AlgorithmPtr &primary, const AlgorithmPtr &fallback,
    AlgorithmOperation operation, const SharedBuffer &input,
    const CancellationToken &cancel) const {
  AlgorithmMetadata primary_meta = primary->metadata();
  try {
    return Outcome{run(primary, operation, input, cancel), primary_meta, false};
  } catch (const CrushError &e) {
    if (e.kind() != ErrorKind::Timeout && e.kind() != ErrorKind::WorkerCrashed)
      throw;
    if (cancel.is_cancelled())
      throw CrushError(ErrorKind::Cancelled,
                       std::string("Operation cancelled during ") +
                           operation_to_string(operation));
    if (!fallback) {
      LOG(LogLevel::ERROR, LogComponent::PLUGIN_SUPERVISOR,
          "No default algorithm registered to fall back to");
      throw;
    }

    AlgorithmMetadata fallback_meta = fallback->metadata();
    LOG(LogLevel::WARN, LogComponent::PLUGIN_SUPERVISOR,
        "Falling back from '" << primary_meta.name << "' to '"
                              << fallback_meta.name << "': " << e.what());

    try {
      return Outcome{run(fallback, operation, input, cancel), fallback_meta,
                     true};
    } catch (const CrushError &retry_error) {
      if (retry_error.is_cancellation())
        throw;
      LOG(LogLevel::ERROR, LogComponent::PLUGIN_SUPERVISOR,
          "Fallback algorithm '" << fallback_meta.name
                                 << "' failed: " << retry_error.what());
      throw CrushError(retry_error.kind(),
                       "Fallback algorithm '" + fallback_meta.name +
                           "' failed after '" + primary_meta.name +
                           "' did not complete (" + e.what() +
                           "): " + retry_error.what());
    }
  }
}

} // namespace crush
