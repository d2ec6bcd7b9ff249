#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace bt {

/**
 * ThreadSafeQueue - A bounded, closable FIFO for multi-producer use
 *
 * push() blocks while the queue is at capacity, which gives producers
 * backpressure instead of dropping or reordering elements. Once close() is
 * called, push() fails and consumers may drain what is left.
 *
 * @tparam T The type of elements stored in the queue
 */
template <typename T> class ThreadSafeQueue {
public:
  /**
   * Constructor
   * @param capacity Maximum number of queued elements, 0 for unbounded
   */
  explicit ThreadSafeQueue(size_t capacity = 0) : capacity_(capacity) {}

  ThreadSafeQueue(const ThreadSafeQueue &) = delete;
  ThreadSafeQueue &operator=(const ThreadSafeQueue &) = delete;

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  size_t capacity() const { return capacity_; }

  bool isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  /**
   * Push an element to the back of the queue, waiting for room if full
   * @return false if the queue was closed before the element was accepted
   */
  bool push(T &&value) {
    std::unique_lock<std::mutex> lock(mutex_);
    notFull_.wait(lock, [this] {
      return closed_ || capacity_ == 0 || queue_.size() < capacity_;
    });
    if (closed_) {
      return false;
    }
    queue_.push(std::move(value));
    notEmpty_.notify_one();
    return true;
  }

  /**
   * Poll an element from the front of the queue without waiting
   * @param t Reference to store the popped element
   * @return true if an element was popped, false if queue was empty
   */
  bool poll(T &t) {
    std::lock_guard<std::mutex> lock(mutex_);
    return popLocked(t);
  }

  /**
   * Poll an element, waiting up to timeout for one to arrive
   * @return true if an element was popped
   */
  template <typename Rep, typename Period>
  bool pollFor(T &t, const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    notEmpty_.wait_for(lock, timeout,
                       [this] { return closed_ || !queue_.empty(); });
    return popLocked(t);
  }

  /**
   * Reject further pushes and wake every waiting producer and consumer.
   */
  void close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    notFull_.notify_all();
    notEmpty_.notify_all();
  }

private:
  bool popLocked(T &t) {
    if (queue_.empty()) {
      return false;
    }
    t = std::move(queue_.front());
    queue_.pop();
    notFull_.notify_one();
    return true;
  }

  mutable std::mutex mutex_;
  std::condition_variable notFull_;
  std::condition_variable notEmpty_;
  std::queue<T> queue_;
  size_t capacity_;
  bool closed_{ false };
};

} // namespace bt
