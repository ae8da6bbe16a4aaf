#ifndef __TD_BOUNDED_QUEUE__
#define __TD_BOUNDED_QUEUE__

#include "Headers.hpp"

namespace td {
/**
 * @brief Thread-safe FIFO shared between a producer and a consumer thread.
 *
 * A capacity of zero means unbounded. When bounded, push() blocks the
 * producer until the consumer makes room. Once closed, pushes are rejected
 * and pops drain what is left before reporting the close.
 */
template <typename T>
class BoundedQueue {
 public:
  explicit BoundedQueue(size_t _capacity) : capacity(_capacity), closed(false) {}

  /**
   * @brief Appends an item, blocking while the queue is full.
   * @return false if the queue was closed.
   */
  bool push(const T& item) {
    unique_lock<mutex> guard(queueMutex);
    notFull.wait(guard, [this] {
      return closed || capacity == 0 || items.size() < capacity;
    });
    if (closed) {
      return false;
    }
    items.push_back(item);
    notEmpty.notify_one();
    return true;
  }

  /**
   * @brief Appends an item unless the queue is full or closed.
   */
  bool tryPush(const T& item) {
    lock_guard<mutex> guard(queueMutex);
    if (closed || (capacity > 0 && items.size() >= capacity)) {
      return false;
    }
    items.push_back(item);
    notEmpty.notify_one();
    return true;
  }

  /**
   * @brief Removes the oldest item, waiting up to timeoutMs for one.
   * @return nullopt on timeout, or once the queue is closed and drained.
   */
  optional<T> pop(int timeoutMs) {
    unique_lock<mutex> guard(queueMutex);
    notEmpty.wait_for(guard, chrono::milliseconds(timeoutMs),
                      [this] { return closed || !items.empty(); });
    return popLocked();
  }

  optional<T> tryPop() {
    lock_guard<mutex> guard(queueMutex);
    return popLocked();
  }

  void close() {
    lock_guard<mutex> guard(queueMutex);
    closed = true;
    notFull.notify_all();
    notEmpty.notify_all();
  }

  bool isClosed() {
    lock_guard<mutex> guard(queueMutex);
    return closed;
  }

  size_t size() {
    lock_guard<mutex> guard(queueMutex);
    return items.size();
  }

 protected:
  optional<T> popLocked() {
    if (items.empty()) {
      return nullopt;
    }
    T item = items.front();
    items.pop_front();
    notFull.notify_one();
    return item;
  }

  size_t capacity;
  bool closed;
  deque<T> items;
  mutex queueMutex;
  condition_variable notFull;
  condition_variable notEmpty;
};
}  // namespace td

#endif  // __TD_BOUNDED_QUEUE__
