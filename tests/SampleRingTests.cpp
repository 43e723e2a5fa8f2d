// Repository: Mediacore-player
// Component: SampleRing Tests
// Purpose: Verify ordering, capacity bound, partial reads, invalidation and
//          close semantics of the SPSC sample ring.
// Copyright (c) 2025 Mediacore

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "mediacore/buffer/SampleRing.hpp"

namespace mediacore::buffer::testing {
namespace {

std::vector<float> Ramp(float start, size_t count) {
  std::vector<float> v(count);
  for (size_t i = 0; i < count; ++i) v[i] = start + static_cast<float>(i);
  return v;
}

// =============================================================================
// Capacity
// =============================================================================

TEST(SampleRingTest, RejectsPushWhenFull) {
  SampleRing ring(4, 16);
  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(ring.TryPush(Ramp(0.0f, 8), i));
  }
  EXPECT_TRUE(ring.Full());
  EXPECT_FALSE(ring.TryPush(Ramp(0.0f, 8), 4.0));
  EXPECT_EQ(ring.Size(), 4u);
  EXPECT_EQ(ring.PushedCount(), 4u);
}

TEST(SampleRingTest, ReadingAWholeBufferFreesItsSlot) {
  SampleRing ring(2, 16);
  ASSERT_TRUE(ring.TryPush(Ramp(0.0f, 4), 0.0));
  ASSERT_TRUE(ring.TryPush(Ramp(10.0f, 4), 0.1));
  ASSERT_FALSE(ring.TryPush(Ramp(20.0f, 4), 0.2));

  float out[4];
  EXPECT_EQ(ring.Read(out, 4), 4u);
  EXPECT_TRUE(ring.TryPush(Ramp(20.0f, 4), 0.2));
}

TEST(SampleRingTest, GrowsSlotForBufferLargerThanReserve) {
  SampleRing ring(2, 4);
  auto big = Ramp(0.0f, 100);
  ASSERT_TRUE(ring.TryPush(big, 0.0));

  std::vector<float> out(100, -1.0f);
  EXPECT_EQ(ring.Read(out.data(), out.size()), 100u);
  EXPECT_EQ(out, big);
}

// =============================================================================
// Ordering and partial reads
// =============================================================================

TEST(SampleRingTest, ReadsInProductionOrderAcrossBuffers) {
  SampleRing ring(4, 16);
  ASSERT_TRUE(ring.TryPush(Ramp(1.0f, 3), 0.0));
  ASSERT_TRUE(ring.TryPush(Ramp(4.0f, 3), 0.1));

  float out[6] = {};
  EXPECT_EQ(ring.Read(out, 6), 6u);
  for (int i = 0; i < 6; ++i) {
    EXPECT_FLOAT_EQ(out[i], static_cast<float>(i + 1));
  }
  EXPECT_TRUE(ring.Empty());
}

TEST(SampleRingTest, UnreadTailIsKeptForNextRead) {
  SampleRing ring(4, 16);
  ASSERT_TRUE(ring.TryPush(Ramp(1.0f, 6), 2.5));

  float first[4] = {};
  EXPECT_EQ(ring.Read(first, 4), 4u);
  EXPECT_FLOAT_EQ(first[0], 1.0f);
  EXPECT_FLOAT_EQ(first[3], 4.0f);
  EXPECT_EQ(ring.Size(), 1u) << "Partially read buffer still occupies its slot";
  EXPECT_DOUBLE_EQ(ring.LastReadTimestamp(), 2.5);

  float second[4] = {-1.0f, -1.0f, -1.0f, -1.0f};
  EXPECT_EQ(ring.Read(second, 4), 2u);
  EXPECT_FLOAT_EQ(second[0], 5.0f);
  EXPECT_FLOAT_EQ(second[1], 6.0f);
  EXPECT_FLOAT_EQ(second[2], -1.0f) << "Read must not touch samples it did not fill";
  EXPECT_TRUE(ring.Empty());
}

TEST(SampleRingTest, EmptyRingReadsNothing) {
  SampleRing ring(4, 16);
  float out[8];
  EXPECT_EQ(ring.Read(out, 8), 0u);
}

// =============================================================================
// Invalidate / Close
// =============================================================================

TEST(SampleRingTest, InvalidateDiscardsBuffersPushedBefore) {
  SampleRing ring(4, 16);
  ASSERT_TRUE(ring.TryPush(Ramp(100.0f, 4), 0.0));
  ASSERT_TRUE(ring.TryPush(Ramp(200.0f, 4), 0.1));
  ring.Invalidate();
  ASSERT_TRUE(ring.TryPush(Ramp(1.0f, 4), 5.0));

  float out[8] = {};
  EXPECT_EQ(ring.Read(out, 8), 4u);
  EXPECT_FLOAT_EQ(out[0], 1.0f);
  EXPECT_EQ(ring.DiscardedCount(), 2u);
  EXPECT_DOUBLE_EQ(ring.LastReadTimestamp(), 5.0);
}

TEST(SampleRingTest, InvalidateDropsPartiallyReadBuffer) {
  SampleRing ring(4, 16);
  ASSERT_TRUE(ring.TryPush(Ramp(100.0f, 8), 0.0));
  float out[4];
  ASSERT_EQ(ring.Read(out, 4), 4u);

  ring.Invalidate();
  EXPECT_EQ(ring.Read(out, 4), 0u);
  EXPECT_TRUE(ring.Empty());
}

TEST(SampleRingTest, CloseRejectsPushButDrainsQueued) {
  SampleRing ring(4, 16);
  ASSERT_TRUE(ring.TryPush(Ramp(1.0f, 4), 0.0));
  ring.Close();

  EXPECT_TRUE(ring.IsClosed());
  EXPECT_FALSE(ring.TryPush(Ramp(1.0f, 4), 0.1));

  float out[4];
  EXPECT_EQ(ring.Read(out, 4), 4u);
  EXPECT_EQ(ring.Read(out, 4), 0u);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST(SampleRingTest, ProducerConsumerThreadsPreserveEverySample) {
  constexpr size_t kBuffers = 2000;
  constexpr size_t kPerBuffer = 37;
  SampleRing ring(8, 64);

  std::thread producer([&] {
    float next = 0.0f;
    for (size_t b = 0; b < kBuffers; ++b) {
      auto buf = Ramp(next, kPerBuffer);
      while (!ring.TryPush(buf, static_cast<double>(b))) {
        std::this_thread::yield();
      }
      next += kPerBuffer;
    }
  });

  std::vector<float> received;
  received.reserve(kBuffers * kPerBuffer);
  float chunk[50];
  while (received.size() < kBuffers * kPerBuffer) {
    const size_t n = ring.Read(chunk, 50);
    received.insert(received.end(), chunk, chunk + n);
    if (n == 0) std::this_thread::yield();
  }
  producer.join();

  for (size_t i = 0; i < received.size(); ++i) {
    ASSERT_FLOAT_EQ(received[i], static_cast<float>(i)) << "at sample " << i;
  }
}

TEST(SampleRingTest, BufferPushedAfterInvalidateIsNeverDiscarded) {
  constexpr size_t kCycles = 20000;
  constexpr size_t kPerBuffer = 16;
  SampleRing ring(4, kPerBuffer);
  std::atomic<bool> done{false};

  std::thread producer([&] {
    const auto buf = Ramp(1.0f, kPerBuffer);
    for (size_t i = 0; i < kCycles; ++i) {
      ring.Invalidate();
      while (!ring.TryPush(buf, static_cast<double>(i))) {
        std::this_thread::yield();
      }
      // One buffer in flight at a time, so nothing is stale when invalidated.
      while (!ring.Empty()) {
        std::this_thread::yield();
      }
    }
    done.store(true);
  });

  size_t received = 0;
  float chunk[kPerBuffer];
  while (!done.load() || !ring.Empty()) {
    const size_t n = ring.Read(chunk, kPerBuffer);
    received += n;
    if (n == 0) std::this_thread::yield();
  }
  producer.join();

  EXPECT_EQ(ring.DiscardedCount(), 0u);
  EXPECT_EQ(received, kCycles * kPerBuffer);
}

}  // namespace
}  // namespace mediacore::buffer::testing
