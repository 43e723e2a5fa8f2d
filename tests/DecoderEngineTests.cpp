// Repository: Mediacore-player
// Component: DecoderEngine Tests
// Purpose: Verify the engine's command handling, outlets, end-of-stream
//          behavior, backpressure and disconnect semantics.
// Copyright (c) 2025 Mediacore

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "fixtures/MediaFixtures.h"
#include "mediacore/buffer/Channel.hpp"
#include "mediacore/buffer/SampleRing.hpp"
#include "mediacore/runtime/DecoderEngine.h"
#include "support/WaitFor.hpp"

namespace mediacore::runtime::testing {
namespace {

using tests::fixtures::TempPath;
using tests::fixtures::WritePcmWav;
using tests::fixtures::WriteY4m;

class DecoderEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    wav_path_ = TempPath("engine_audio.wav");
    y4m_path_ = TempPath("engine_video.y4m");
    ASSERT_TRUE(WritePcmWav(wav_path_, 1.0));
    ASSERT_TRUE(WriteY4m(y4m_path_, 12));
    ASSERT_TRUE(engine_.Start());
  }

  void TearDown() override {
    engine_.Shutdown();
    std::remove(wav_path_.c_str());
    std::remove(y4m_path_.c_str());
  }

  LoadOutcome LoadAndWait(const std::string& path, VideoOutlet outlet = nullptr,
                          uint64_t generation = 0) {
    const uint64_t id = ++load_id_;
    EXPECT_TRUE(engine_.SendCommand(Command::Load(id, path, std::move(outlet), generation)));
    LoadOutcome outcome;
    EXPECT_EQ(engine_.load_outcomes().ReceiveFor(outcome, std::chrono::seconds(5)),
              buffer::ChannelStatus::kOk);
    EXPECT_EQ(outcome.load_id, id);
    return outcome;
  }

  // Reads the ring like an audio callback would, until end of stream.
  // Returns the audio event count seen before the end-of-stream event.
  size_t DrainUntilEndOfStream(buffer::SampleRing& ring, std::vector<float>* heard = nullptr) {
    size_t audio_events = 0;
    std::vector<float> period(2048);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      const size_t n = ring.Read(period.data(), period.size());
      if (heard) heard->insert(heard->end(), period.begin(), period.begin() + n);

      EngineEvent event;
      while (engine_.events().TryReceive(event) == buffer::ChannelStatus::kOk) {
        if (event.type == EngineEvent::Type::kEndOfStream) return audio_events;
        audio_events++;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ADD_FAILURE() << "end of stream never observed";
    return audio_events;
  }

  size_t CountPendingAudioEvents() {
    size_t count = 0;
    EngineEvent event;
    while (engine_.events().TryReceive(event) == buffer::ChannelStatus::kOk) {
      if (event.type == EngineEvent::Type::kAudioFrame) count++;
    }
    return count;
  }

  std::string wav_path_;
  std::string y4m_path_;
  DecoderEngine engine_;
  uint64_t load_id_ = 0;
};

// =============================================================================
// Load
// =============================================================================

TEST_F(DecoderEngineTest, LoadPublishesMediaInfo) {
  LoadOutcome outcome = LoadAndWait(wav_path_);
  ASSERT_TRUE(outcome.success) << outcome.error;
  EXPECT_TRUE(outcome.info.has_audio);
  EXPECT_FALSE(outcome.info.has_video);
  EXPECT_NEAR(outcome.info.duration, 1.0, 0.05);
}

TEST_F(DecoderEngineTest, LoadOfMissingFilePublishesFailure) {
  LoadOutcome outcome = LoadAndWait(TempPath("missing.mp4"));
  EXPECT_FALSE(outcome.success);
  EXPECT_FALSE(outcome.error.empty());
}

TEST_F(DecoderEngineTest, FailedLoadClosesItsVideoOutlet) {
  auto outlet = std::make_shared<buffer::Channel<buffer::VideoFrame>>();
  LoadOutcome outcome = LoadAndWait(TempPath("missing.y4m"), outlet);
  EXPECT_FALSE(outcome.success);
  EXPECT_TRUE(outlet->IsClosed());
}

TEST_F(DecoderEngineTest, CommandsWithoutSourceAreHarmless) {
  EXPECT_TRUE(engine_.SendCommand(Command::WithValue(Command::Type::kSeek, 3.0)));
  EXPECT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));
  EXPECT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kStop)));
  EXPECT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kStop)));

  LoadOutcome outcome = LoadAndWait(wav_path_);
  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(engine_.AudioFramesEmitted(), 0u);
}

// =============================================================================
// Playback
// =============================================================================

TEST_F(DecoderEngineTest, NothingIsProducedUntilPlay) {
  auto ring = std::make_shared<buffer::SampleRing>();
  ASSERT_TRUE(LoadAndWait(wav_path_).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_TRUE(ring->Empty());
  EXPECT_EQ(engine_.AudioFramesEmitted(), 0u);
}

TEST_F(DecoderEngineTest, PlayToEndEmitsAudioThenOneEndOfStream) {
  auto ring = std::make_shared<buffer::SampleRing>();
  ASSERT_TRUE(LoadAndWait(wav_path_).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));

  std::vector<float> heard;
  const size_t audio_events = DrainUntilEndOfStream(*ring, &heard);
  EXPECT_GT(audio_events, 0u);
  EXPECT_EQ(engine_.EndOfStreamCount(), 1u);

  // Whatever is still in the ring was produced before end of stream.
  std::vector<float> rest(4096);
  size_t n;
  while ((n = ring->Read(rest.data(), rest.size())) > 0) {
    heard.insert(heard.end(), rest.begin(), rest.begin() + n);
  }
  const double expected = 1.0 * buffer::kOutputSampleRate * buffer::kOutputChannels;
  EXPECT_NEAR(static_cast<double>(heard.size()), expected, expected * 0.01);

  // Session is kept but idle: no further audio until seek + play.
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(CountPendingAudioEvents(), 0u);
  EXPECT_TRUE(ring->Empty());

  ASSERT_TRUE(engine_.SendCommand(Command::WithValue(Command::Type::kSeek, 0.0)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));
  EXPECT_GT(DrainUntilEndOfStream(*ring), 0u);
  EXPECT_EQ(engine_.EndOfStreamCount(), 2u);
}

TEST_F(DecoderEngineTest, VolumeScalesProducedSamples) {
  auto ring = std::make_shared<buffer::SampleRing>();
  ASSERT_TRUE(LoadAndWait(wav_path_).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));
  ASSERT_TRUE(engine_.SendCommand(Command::WithValue(Command::Type::kSetVolume, 0.5)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));

  ASSERT_TRUE(WaitFor([&] { return !ring->Empty(); }));
  float sample = 0.0f;
  ASSERT_EQ(ring->Read(&sample, 1), 1u);
  // Source is a constant 0.5 signal.
  EXPECT_NEAR(sample, 0.25f, 1e-4);
}

TEST_F(DecoderEngineTest, VolumeIsClampedToUnitRange) {
  auto ring = std::make_shared<buffer::SampleRing>();
  ASSERT_TRUE(LoadAndWait(wav_path_).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));
  ASSERT_TRUE(engine_.SendCommand(Command::WithValue(Command::Type::kSetVolume, 4.0)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));

  ASSERT_TRUE(WaitFor([&] { return !ring->Empty(); }));
  float sample = 0.0f;
  ASSERT_EQ(ring->Read(&sample, 1), 1u);
  EXPECT_NEAR(sample, 0.5f, 1e-4);
}

TEST_F(DecoderEngineTest, FullRingStallsAudioProduction) {
  auto ring = std::make_shared<buffer::SampleRing>(4);
  ASSERT_TRUE(LoadAndWait(wav_path_).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));

  ASSERT_TRUE(WaitFor([&] { return ring->Full(); }));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(ring->PushedCount(), 4u);
  EXPECT_EQ(engine_.EndOfStreamCount(), 0u);
}

TEST_F(DecoderEngineTest, PauseStopsProduction) {
  auto ring = std::make_shared<buffer::SampleRing>(4);
  ASSERT_TRUE(LoadAndWait(wav_path_).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));
  ASSERT_TRUE(WaitFor([&] { return ring->Full(); }));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPause)));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));

  const uint64_t pushed = ring->PushedCount();
  std::vector<float> sink(1 << 16);
  while (ring->Read(sink.data(), sink.size()) > 0) {
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(ring->PushedCount(), pushed);
}

TEST_F(DecoderEngineTest, SeekDiscardsQueuedAudio) {
  auto ring = std::make_shared<buffer::SampleRing>(4);
  ASSERT_TRUE(LoadAndWait(wav_path_).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));
  ASSERT_TRUE(WaitFor([&] { return ring->Full(); }));

  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPause)));
  ASSERT_TRUE(engine_.SendCommand(Command::WithValue(Command::Type::kSeek, 0.5)));
  // Attaching a replacement ring closes the old one once the seek is handled.
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(std::make_shared<buffer::SampleRing>())));
  ASSERT_TRUE(WaitFor([&] { return ring->IsClosed(); }));

  float scratch[8];
  EXPECT_EQ(ring->Read(scratch, 8), 0u) << "pre-seek audio must not be heard";
  EXPECT_EQ(ring->DiscardedCount(), 4u);
}

TEST_F(DecoderEngineTest, EndOfStreamCarriesGenerationOfLastAppliedSeek) {
  auto ring = std::make_shared<buffer::SampleRing>();
  ASSERT_TRUE(LoadAndWait(wav_path_, nullptr, 1).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));

  // Consume audio until the engine has emitted end of stream, leaving the
  // event queued as if the receiver had not pumped yet.
  std::vector<float> period(2048);
  ASSERT_TRUE(WaitFor([&] {
    ring->Read(period.data(), period.size());
    return engine_.EndOfStreamCount() == 1;
  }));

  // A seek issued by a receiver that has not seen that event yet.
  ASSERT_TRUE(engine_.SendCommand(Command::Seek(0.5, 2)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));

  std::vector<EngineEvent> ends;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (ends.size() < 2 && std::chrono::steady_clock::now() < deadline) {
    ring->Read(period.data(), period.size());
    EngineEvent event;
    while (engine_.events().TryReceive(event) == buffer::ChannelStatus::kOk) {
      if (event.type == EngineEvent::Type::kEndOfStream) ends.push_back(event);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  ASSERT_EQ(ends.size(), 2u);
  EXPECT_EQ(ends[0].generation, 1u) << "emitted before the seek was applied";
  EXPECT_EQ(ends[1].generation, 2u);
}

// =============================================================================
// Video
// =============================================================================

TEST_F(DecoderEngineTest, VideoFramesGoToTheLoadOutlet) {
  auto outlet = std::make_shared<buffer::Channel<buffer::VideoFrame>>();
  LoadOutcome outcome = LoadAndWait(y4m_path_, outlet);
  ASSERT_TRUE(outcome.success);
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));

  ASSERT_TRUE(WaitFor([&] { return engine_.EndOfStreamCount() == 1; }));
  EXPECT_EQ(outlet->Size(), 12u);
  EXPECT_EQ(engine_.VideoFramesEmitted(), 12u);

  buffer::VideoFrame frame;
  ASSERT_EQ(outlet->TryReceive(frame), buffer::ChannelStatus::kOk);
  EXPECT_EQ(frame.pixels.size(), 64u * 48u * 4u);

  // Video never goes through the event outlet.
  EXPECT_EQ(CountPendingAudioEvents(), 0u);
}

TEST_F(DecoderEngineTest, StopDetachesOutlets) {
  auto outlet = std::make_shared<buffer::Channel<buffer::VideoFrame>>();
  auto ring = std::make_shared<buffer::SampleRing>();
  ASSERT_TRUE(LoadAndWait(y4m_path_, outlet).success);
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(ring)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kStop)));

  EXPECT_TRUE(WaitFor([&] { return outlet->IsClosed(); }));
  EXPECT_TRUE(WaitFor([&] { return ring->IsClosed(); }));
}

TEST_F(DecoderEngineTest, NewLoadReplacesPreviousSession) {
  auto first = std::make_shared<buffer::Channel<buffer::VideoFrame>>();
  ASSERT_TRUE(LoadAndWait(y4m_path_, first).success);

  auto second = std::make_shared<buffer::Channel<buffer::VideoFrame>>();
  ASSERT_TRUE(LoadAndWait(y4m_path_, second).success);

  EXPECT_TRUE(first->IsClosed());
  EXPECT_FALSE(second->IsClosed());
}

// =============================================================================
// Disconnect
// =============================================================================

TEST_F(DecoderEngineTest, ShutdownClosesEveryOutlet) {
  auto outlet = std::make_shared<buffer::Channel<buffer::VideoFrame>>();
  ASSERT_TRUE(LoadAndWait(y4m_path_, outlet).success);

  engine_.Shutdown();
  EXPECT_FALSE(engine_.IsRunning());
  EXPECT_TRUE(engine_.events().IsClosed());
  EXPECT_TRUE(engine_.load_outcomes().IsClosed());
  EXPECT_TRUE(outlet->IsClosed());
  EXPECT_FALSE(engine_.SendCommand(Command::Simple(Command::Type::kPlay)));
}

TEST_F(DecoderEngineTest, UncollectedOutcomeIsReplaced) {
  ASSERT_TRUE(engine_.SendCommand(Command::Load(100, wav_path_, nullptr)));
  ASSERT_TRUE(engine_.SendCommand(Command::Load(101, y4m_path_, nullptr)));

  // The ring is closed by the Stop that follows, after both loads ran.
  auto marker = std::make_shared<buffer::SampleRing>();
  ASSERT_TRUE(engine_.SendCommand(Command::AttachSamples(marker)));
  ASSERT_TRUE(engine_.SendCommand(Command::Simple(Command::Type::kStop)));
  ASSERT_TRUE(WaitFor([&] { return marker->IsClosed(); }));

  LoadOutcome outcome;
  ASSERT_EQ(engine_.load_outcomes().TryReceive(outcome), buffer::ChannelStatus::kOk);
  EXPECT_EQ(outcome.load_id, 101u);
  EXPECT_TRUE(outcome.info.has_video);
  EXPECT_EQ(engine_.load_outcomes().TryReceive(outcome), buffer::ChannelStatus::kEmpty);
}

}  // namespace
}  // namespace mediacore::runtime::testing
