#ifndef THREAD_SAFE_QUEUE_HPP
#define THREAD_SAFE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <limits>
#include <mutex>
#include <optional>
#include <queue>

// Multi-producer multi-consumer queue. A capacity bounds try_push; push
// blocks until there is room or the queue is shut down.
template <typename T> class ThreadSafeQueue {
public:
  explicit ThreadSafeQueue(
      size_t capacity = std::numeric_limits<size_t>::max())
      : capacity_(capacity == 0 ? 1 : capacity) {}

  // Returns false once the queue has been shut down
  bool push(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] {
      return queue_.size() < capacity_ || shutdown_requested_;
    });
    if (shutdown_requested_)
      return false;
    queue_.push(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  // Non-blocking; returns false when full or shut down
  bool try_push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_requested_ || queue_.size() >= capacity_)
      return false;
    queue_.push(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  // A non-blocking try_pop
  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
      return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop();
    not_full_.notify_one();
    return value;
  }

  // Blocks until an item arrives. Returns nullopt on shutdown once the
  // remaining items have been drained.
  std::optional<T> wait_and_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock,
                    [this] { return !queue_.empty() || shutdown_requested_; });
    if (queue_.empty())
      return std::nullopt;

    T value = std::move(queue_.front());
    queue_.pop();
    not_full_.notify_one();
    return value;
  }

  // Notify all waiting threads to wake up for shutdown
  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_requested_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

private:
  mutable std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  size_t capacity_;
  bool shutdown_requested_ = false;
};

#endif // THREAD_SAFE_QUEUE_HPP
