// Repository: Mediacore-player
// Component: SampleRing
// Purpose: Lock-free SPSC ring of sample buffers for the real-time audio path.
// Copyright (c) 2025 Mediacore

#include "mediacore/buffer/SampleRing.hpp"

#include <algorithm>
#include <cstring>

namespace mediacore::buffer {

SampleRing::SampleRing(size_t capacity, size_t reserve_samples)
    : slots_(capacity == 0 ? 1 : capacity) {
  for (auto& slot : slots_) {
    slot.samples.resize(reserve_samples);
  }
}

bool SampleRing::TryPush(const float* samples, size_t count, double timestamp) {
  if (closed_.load(std::memory_order_acquire)) return false;

  const uint64_t tail = tail_.load(std::memory_order_relaxed);
  const uint64_t head = head_.load(std::memory_order_acquire);
  if (tail - head >= slots_.size()) return false;

  Slot& slot = slots_[tail % slots_.size()];
  if (slot.samples.size() < count) {
    slot.samples.resize(count);
  }
  if (count > 0) {
    std::memcpy(slot.samples.data(), samples, count * sizeof(float));
  }
  slot.size = count;
  slot.timestamp = timestamp;
  slot.epoch = epoch_.load(std::memory_order_relaxed);

  tail_.store(tail + 1, std::memory_order_release);
  pushed_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void SampleRing::Invalidate() {
  epoch_.fetch_add(1, std::memory_order_release);
}

void SampleRing::Close() {
  closed_.store(true, std::memory_order_release);
}

size_t SampleRing::Read(float* out, size_t count) {
  // Tail first: a slot visible through tail_ was stamped no later than the
  // epoch observed afterwards.
  const uint64_t tail = tail_.load(std::memory_order_acquire);
  const uint64_t current_epoch = epoch_.load(std::memory_order_acquire);
  uint64_t head = head_.load(std::memory_order_relaxed);

  size_t copied = 0;
  while (copied < count && head != tail) {
    Slot& slot = slots_[head % slots_.size()];

    if (slot.epoch != current_epoch) {
      head_offset_ = 0;
      ++head;
      head_.store(head, std::memory_order_release);
      discarded_.fetch_add(1, std::memory_order_relaxed);
      continue;
    }

    const size_t take = std::min(slot.size - head_offset_, count - copied);
    if (take > 0) {
      std::memcpy(out + copied, slot.samples.data() + head_offset_,
                  take * sizeof(float));
    }
    copied += take;
    head_offset_ += take;
    last_read_timestamp_.store(slot.timestamp, std::memory_order_relaxed);

    if (head_offset_ >= slot.size) {
      head_offset_ = 0;
      ++head;
      head_.store(head, std::memory_order_release);
    }
  }
  return copied;
}

double SampleRing::LastReadTimestamp() const {
  return last_read_timestamp_.load(std::memory_order_relaxed);
}

bool SampleRing::Full() const {
  return Size() >= slots_.size();
}

bool SampleRing::Empty() const {
  return Size() == 0;
}

size_t SampleRing::Size() const {
  const uint64_t tail = tail_.load(std::memory_order_acquire);
  const uint64_t head = head_.load(std::memory_order_acquire);
  return static_cast<size_t>(tail - head);
}

}  // namespace mediacore::buffer
