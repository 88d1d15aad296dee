#ifndef __TH_CIRCULAR_BUFFER__
#define __TH_CIRCULAR_BUFFER__

#include "Headers.hpp"

namespace th {
/**
 * @brief Bounded FIFO that keeps the most recent `capacity` items.
 *
 * Pushing into a full buffer evicts the oldest item. The buffer carries its
 * own mutex so producers and the drain side never need a wider lock.
 */
template <typename T>
class CircularBuffer {
 public:
  explicit CircularBuffer(size_t _capacity) : cap(_capacity), evicted(0) {
    if (cap == 0) {
      throw std::invalid_argument("CircularBuffer capacity must be positive");
    }
  }

  /** @brief Appends an item, evicting the oldest one when full. */
  void push(T item) {
    lock_guard<mutex> guard(bufferMutex);
    if (items.size() == cap) {
      items.pop_front();
      evicted++;
    }
    items.push_back(std::move(item));
  }

  /** @brief Removes and returns the oldest item, if any. */
  optional<T> shift() {
    lock_guard<mutex> guard(bufferMutex);
    if (items.empty()) {
      return nullopt;
    }
    T item = std::move(items.front());
    items.pop_front();
    return item;
  }

  /** @brief Copies every item, oldest first, without consuming them. */
  vector<T> getAll() const {
    lock_guard<mutex> guard(bufferMutex);
    return vector<T>(items.begin(), items.end());
  }

  /** @brief Removes and returns every item, oldest first. */
  vector<T> drain() {
    lock_guard<mutex> guard(bufferMutex);
    vector<T> retval(std::make_move_iterator(items.begin()),
                     std::make_move_iterator(items.end()));
    items.clear();
    return retval;
  }

  void clear() {
    lock_guard<mutex> guard(bufferMutex);
    items.clear();
  }

  size_t size() const {
    lock_guard<mutex> guard(bufferMutex);
    return items.size();
  }

  bool empty() const {
    lock_guard<mutex> guard(bufferMutex);
    return items.empty();
  }

  size_t capacity() const { return cap; }

  /** @brief Number of items dropped because the buffer was full. */
  int64_t evictedCount() const {
    lock_guard<mutex> guard(bufferMutex);
    return evicted;
  }

 protected:
  const size_t cap;
  int64_t evicted;
  deque<T> items;
  mutable mutex bufferMutex;
};
}  // namespace th

#endif  // __TH_CIRCULAR_BUFFER__
