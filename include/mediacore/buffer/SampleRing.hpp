// Repository: Mediacore-player
// Component: SampleRing
// Purpose: Lock-free single-producer/single-consumer ring of sample buffers
//          between the decoder engine and the real-time audio callback.
// Copyright (c) 2025 Mediacore

#ifndef MEDIACORE_BUFFER_SAMPLE_RING_HPP_
#define MEDIACORE_BUFFER_SAMPLE_RING_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace mediacore::buffer {

// SampleRing holds at most `capacity` interleaved f32 sample buffers.
//
// Producer side (decoder engine thread): TryPush() copies a buffer into the
// next free slot and fails when the ring is full or closed. Slots grow on the
// producer thread only, so the consumer never allocates.
//
// Consumer side (audio callback): Read() copies queued samples in production
// order. A buffer larger than the request is consumed across several Read()
// calls; its unread tail stays in the slot until drained.
//
// Invalidate() (producer) bumps the epoch; slots pushed before it are skipped
// by the consumer. Used after a seek so stale audio is never heard.
//
// Close() marks the producer as gone; Read() then reports whatever is left
// and afterwards returns 0.
class SampleRing {
 public:
  static constexpr size_t kDefaultCapacity = 32;
  static constexpr size_t kDefaultReserveSamples = 8192;

  explicit SampleRing(size_t capacity = kDefaultCapacity,
                      size_t reserve_samples = kDefaultReserveSamples);

  SampleRing(const SampleRing&) = delete;
  SampleRing& operator=(const SampleRing&) = delete;

  // --- Producer ---

  bool TryPush(const float* samples, size_t count, double timestamp);
  bool TryPush(const std::vector<float>& samples, double timestamp) {
    return TryPush(samples.data(), samples.size(), timestamp);
  }

  void Invalidate();

  void Close();

  // --- Consumer (real-time safe: no locks, no allocation) ---

  // Copies up to `count` samples into out; returns the number copied.
  // Never touches out[returned..count).
  size_t Read(float* out, size_t count);

  // Timestamp of the buffer most recently read from (seconds).
  double LastReadTimestamp() const;

  // --- Observability ---

  bool Full() const;
  bool Empty() const;
  size_t Size() const;
  size_t Capacity() const { return slots_.size(); }
  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }
  uint64_t PushedCount() const { return pushed_.load(std::memory_order_relaxed); }
  uint64_t DiscardedCount() const { return discarded_.load(std::memory_order_relaxed); }

 private:
  struct Slot {
    std::vector<float> samples;
    size_t size = 0;
    double timestamp = 0.0;
    uint64_t epoch = 0;
  };

  std::vector<Slot> slots_;

  // Monotonic counters; index = counter % capacity.
  std::atomic<uint64_t> head_{0};  // written by consumer only
  std::atomic<uint64_t> tail_{0};  // written by producer only
  std::atomic<uint64_t> epoch_{0};
  std::atomic<bool> closed_{false};

  // Consumer-only: samples already read from the head slot.
  size_t head_offset_ = 0;
  std::atomic<double> last_read_timestamp_{0.0};

  std::atomic<uint64_t> pushed_{0};
  std::atomic<uint64_t> discarded_{0};
};

}  // namespace mediacore::buffer

#endif  // MEDIACORE_BUFFER_SAMPLE_RING_HPP_
