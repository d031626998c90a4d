#ifndef CRUSH_THREAD_SAFE_QUEUE_HPP
#define CRUSH_THREAD_SAFE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

// Multi-producer / multi-consumer channel. The timeout supervisor uses it as
// the result channel between a worker thread and the waiting caller; a worker
// that outlives its caller can still push without blocking.
template <typename T> class ThreadSafeQueue {
public:
  void push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
    cond_.notify_one();
  }

  // Waits at most `timeout`. Returns nullopt on timeout.
  template <typename Rep, typename Period>
  std::optional<T>
  wait_and_pop_for(const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cond_.wait_for(lock, timeout, [this] { return !queue_.empty(); }))
      return std::nullopt;

    T value = std::move(queue_.front());
    queue_.pop();
    return value;
  }

private:
  std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable cond_;
};

#endif // CRUSH_THREAD_SAFE_QUEUE_HPP
