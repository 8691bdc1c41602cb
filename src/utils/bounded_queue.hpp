#ifndef BOUNDED_QUEUE_HPP
#define BOUNDED_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// Multi-producer/multi-consumer FIFO with a fixed capacity. A full queue
// blocks `push` (backpressure) and rejects `try_push`.
template <typename T> class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity)
      : capacity_(capacity ? capacity : 1) {}

  // Blocks while full. Returns false once the queue is closed.
  bool push(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock,
                   [this] { return queue_.size() < capacity_ || closed_; });
    if (closed_)
      return false;
    queue_.push_back(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  bool try_push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || queue_.size() >= capacity_)
      return false;
    queue_.push_back(std::move(value));
    not_empty_.notify_one();
    return true;
  }

  std::optional<T> try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
      return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return value;
  }

  // Blocks until an item arrives. Returns false when closed and drained.
  bool wait_and_pop(T &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty())
      return false;

    value = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return true;
  }

  // Like wait_and_pop but gives up after `timeout`
  template <typename Rep, typename Period>
  std::optional<T>
  wait_and_pop_for(const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout,
                             [this] { return !queue_.empty() || closed_; }))
      return std::nullopt;
    if (queue_.empty())
      return std::nullopt;
    T value = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return value;
  }

  // Pending items stay poppable; new pushes are refused
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  bool empty() const { return size() == 0; }
  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<T> queue_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  bool closed_ = false;
};

#endif // BOUNDED_QUEUE_HPP
