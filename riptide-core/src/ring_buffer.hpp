#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

namespace riptide {

// Bounded FIFO shared by one producer (the capture thread) and one consumer.
// When full, push() overwrites the oldest entry and counts a drop.
template <typename T, size_t Capacity>
class RingBuffer {
  static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be a power of 2");

public:
  RingBuffer() = default;

  RingBuffer(const RingBuffer&) = delete;
  RingBuffer& operator=(const RingBuffer&) = delete;

  template <typename U>
  void push(U&& item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (size_ == Capacity) {
        tail_ = (tail_ + 1) & MASK;
        size_--;
        drops_.fetch_add(1, std::memory_order_relaxed);
      }
      buffer_[head_] = std::forward<U>(item);
      head_ = (head_ + 1) & MASK;
      size_++;
    }
    not_empty_.notify_one();
  }

  // Blocks until an item is available or the timeout elapses.
  std::optional<T> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!not_empty_.wait_for(lock, timeout, [this] { return size_ > 0; })) {
      return std::nullopt;
    }
    return take_locked();
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_ == 0;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
  }

  uint64_t drops() const { return drops_.load(std::memory_order_relaxed); }

  static constexpr size_t capacity() { return Capacity; }

private:
  static constexpr size_t MASK = Capacity - 1;

  std::optional<T> take_locked() {
    if (size_ == 0) return std::nullopt;
    T item = std::move(buffer_[tail_]);
    tail_ = (tail_ + 1) & MASK;
    size_--;
    return item;
  }

  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::array<T, Capacity> buffer_;
  size_t head_ = 0;
  size_t tail_ = 0;
  size_t size_ = 0;
  std::atomic<uint64_t> drops_{0};
};

}
