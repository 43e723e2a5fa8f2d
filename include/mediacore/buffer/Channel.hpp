// Repository: Mediacore-player
// Component: Channel
// Purpose: Mutex/condvar message channel used for every cross-thread hand-off
//          outside the real-time audio path (commands, events, load outcomes,
//          video frames, sink control requests).
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_BUFFER_CHANNEL_HPP_
#define MEDIACORE_BUFFER_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace mediacore::buffer {

enum class ChannelStatus {
  kOk,
  kEmpty,    // TryReceive: nothing queued
  kFull,     // TrySend: bounded channel at capacity
  kTimeout,  // ReceiveFor: nothing arrived in time
  kClosed,   // Closed and (for receives) fully drained
};

// Channel is a FIFO with an optional capacity bound.
//
// Capacity 0 means unbounded. Send() blocks while a bounded channel is full.
// Close() is the disconnect signal: further sends fail, blocked senders and
// receivers wake, and receivers still drain whatever was queued before
// reporting kClosed.
//
// Thread safety: all methods may be called from any thread.
// Not for the real-time audio callback (takes a mutex); see SampleRing.
template <typename T>
class Channel {
 public:
  static constexpr size_t kUnbounded = 0;

  explicit Channel(size_t capacity = kUnbounded) : capacity_(capacity) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  // Blocks while full. Returns false if the channel is (or becomes) closed.
  bool Send(T value) {
    std::unique_lock<std::mutex> lock(mutex_);
    space_cv_.wait(lock, [this] { return closed_ || HasSpaceLocked(); });
    if (closed_) return false;
    items_.push_back(std::move(value));
    lock.unlock();
    data_cv_.notify_one();
    return true;
  }

  ChannelStatus TrySend(T value) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return ChannelStatus::kClosed;
      if (!HasSpaceLocked()) return ChannelStatus::kFull;
      items_.push_back(std::move(value));
    }
    data_cv_.notify_one();
    return ChannelStatus::kOk;
  }

  // Blocks until an item arrives. Returns false once closed and drained.
  bool Receive(T& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    data_cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return false;
    PopLocked(out);
    lock.unlock();
    space_cv_.notify_one();
    return true;
  }

  ChannelStatus TryReceive(T& out) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (items_.empty()) {
        return closed_ ? ChannelStatus::kClosed : ChannelStatus::kEmpty;
      }
      PopLocked(out);
    }
    space_cv_.notify_one();
    return ChannelStatus::kOk;
  }

  ChannelStatus ReceiveFor(T& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!data_cv_.wait_for(lock, timeout,
                           [this] { return closed_ || !items_.empty(); })) {
      return ChannelStatus::kTimeout;
    }
    if (items_.empty()) return ChannelStatus::kClosed;
    PopLocked(out);
    lock.unlock();
    space_cv_.notify_one();
    return ChannelStatus::kOk;
  }

  // Idempotent.
  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    data_cv_.notify_all();
    space_cv_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t Capacity() const { return capacity_; }

 private:
  bool HasSpaceLocked() const {
    return capacity_ == kUnbounded || items_.size() < capacity_;
  }

  void PopLocked(T& out) {
    out = std::move(items_.front());
    items_.pop_front();
  }

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable data_cv_;
  std::condition_variable space_cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace mediacore::buffer

#endif  // MEDIACORE_BUFFER_CHANNEL_HPP_
