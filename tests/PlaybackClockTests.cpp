// Repository: Mediacore-player
// Component: PlaybackClock Tests
// Purpose: Verify the reporting clock advances, freezes and re-anchors.
// Copyright (c) 2025 Mediacore

#include <gtest/gtest.h>

#include <memory>

#include "mediacore/timing/PlaybackClock.h"
#include "support/DeterministicTimeSource.hpp"

namespace mediacore::timing::testing {
namespace {

class PlaybackClockTest : public ::testing::Test {
 protected:
  std::shared_ptr<DeterministicTimeSource> time_ =
      std::make_shared<DeterministicTimeSource>(1'000'000);
  PlaybackClock clock_{time_};
};

TEST_F(PlaybackClockTest, StartsStoppedAtZero) {
  EXPECT_FALSE(clock_.IsRunning());
  time_->AdvanceSeconds(3.0);
  EXPECT_DOUBLE_EQ(clock_.Position(), 0.0);
}

TEST_F(PlaybackClockTest, AdvancesWhileRunning) {
  clock_.Start();
  time_->AdvanceMs(1500);
  EXPECT_NEAR(clock_.Position(), 1.5, 1e-9);
}

TEST_F(PlaybackClockTest, PauseFreezesPosition) {
  clock_.Start();
  time_->AdvanceSeconds(2.0);
  clock_.Pause();
  time_->AdvanceSeconds(10.0);
  EXPECT_NEAR(clock_.Position(), 2.0, 1e-9);

  clock_.Start();
  time_->AdvanceSeconds(1.0);
  EXPECT_NEAR(clock_.Position(), 3.0, 1e-9);
}

TEST_F(PlaybackClockTest, SetPositionKeepsRunningState) {
  clock_.Start();
  time_->AdvanceSeconds(1.0);
  clock_.SetPosition(7.0);
  EXPECT_NEAR(clock_.Position(), 7.0, 1e-9);
  time_->AdvanceSeconds(0.5);
  EXPECT_NEAR(clock_.Position(), 7.5, 1e-9);

  clock_.Pause();
  clock_.SetPosition(4.0);
  time_->AdvanceSeconds(3.0);
  EXPECT_NEAR(clock_.Position(), 4.0, 1e-9);
}

TEST_F(PlaybackClockTest, ResetStopsAtZero) {
  clock_.Start();
  time_->AdvanceSeconds(5.0);
  clock_.Reset();
  EXPECT_FALSE(clock_.IsRunning());
  EXPECT_DOUBLE_EQ(clock_.Position(), 0.0);
}

}  // namespace
}  // namespace mediacore::timing::testing
