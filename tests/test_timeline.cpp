// Repository: Dossier-render
// Component: Timeline Tests
// Purpose: Frame-to-block mapping and alpha curves.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include "dossier/timeline/Timeline.hpp"

namespace dossier::timeline {
namespace {

Block TextBlock(size_t lines, double hold_sec) {
  Block b;
  for (size_t i = 0; i < lines; ++i) b.lines.push_back("line " + std::to_string(i));
  b.computed_hold_sec = hold_sec;
  return b;
}

Block SceneBlock(int64_t frames) {
  Block b;
  b.scene = OutroScene{};
  b.frame_count = frames;
  return b;
}

TEST(TimelineTest, TextBlockDuration) {
  const TimingConstants timing;
  const BlockTiming t = ScheduleBlock(TextBlock(3, 1.0), timing, timing::FPS_30, 0);
  EXPECT_EQ(t.lines_frames, 3 * 6 + 8);
  EXPECT_EQ(t.hold_frames, 30);
  EXPECT_EQ(t.duration, 26 + 30 + 10 + 8);
}

TEST(TimelineTest, HoldRoundsHalfUp) {
  const TimingConstants timing;
  // 0.25 s at 30 fps = 7.5 frames.
  EXPECT_EQ(ScheduleBlock(TextBlock(1, 0.25), timing, timing::FPS_30, 0).hold_frames, 8);
}

TEST(TimelineTest, SceneUsesItsFrameCount) {
  const BlockTiming t = ScheduleBlock(SceneBlock(90), TimingConstants(), timing::FPS_30, 12);
  EXPECT_EQ(t.start, 12);
  EXPECT_EQ(t.duration, 90);
}

TEST(TimelineTest, EveryBlockFrameMapsToExactlyOneBlock) {
  const std::vector<Block> blocks = {TextBlock(1, 0.5), TextBlock(4, 1.2), SceneBlock(45),
                                     TextBlock(2, 0.3)};
  const int64_t head = 5;
  const int64_t tail = 30;
  Timeline tl(blocks, TimingConstants(), timing::FPS_30, head, tail);

  int64_t sum = 0;
  for (size_t i = 0; i < tl.BlockCount(); ++i) sum += tl.TimingOf(i).duration;
  EXPECT_EQ(tl.TotalFrames(), head + sum + tail);

  std::vector<int64_t> frames_per_block(blocks.size(), 0);
  for (int64_t f = 0; f < tl.TotalFrames(); ++f) {
    auto active = tl.BlockAt(f);
    if (f < head || f >= head + sum) {
      EXPECT_FALSE(active.has_value()) << "frame " << f;
      continue;
    }
    ASSERT_TRUE(active.has_value()) << "frame " << f;
    const BlockTiming& t = tl.TimingOf(active->index);
    EXPECT_EQ(active->local_frame, f - t.start);
    EXPECT_GE(f, t.start);
    EXPECT_LT(f, t.end());
    ++frames_per_block[active->index];
  }
  for (size_t i = 0; i < blocks.size(); ++i) {
    EXPECT_EQ(frames_per_block[i], tl.TimingOf(i).duration) << "block " << i;
  }
}

TEST(TimelineTest, ZeroLengthSceneIsNeverActive) {
  const std::vector<Block> blocks = {TextBlock(1, 0.5), SceneBlock(0), TextBlock(1, 0.5)};
  Timeline tl(blocks, TimingConstants(), timing::FPS_30, 0, 0);
  for (int64_t f = 0; f < tl.TotalFrames(); ++f) {
    auto active = tl.BlockAt(f);
    ASSERT_TRUE(active.has_value());
    EXPECT_NE(active->index, 1u);
  }
}

TEST(TimelineTest, LineAlphaBoundaries) {
  const std::vector<Block> blocks = {TextBlock(3, 1.0)};
  Timeline tl(blocks, TimingConstants(), timing::FPS_30, 0, 0);
  for (size_t line = 0; line < 3; ++line) {
    const int64_t start = static_cast<int64_t>(line) * 6;
    EXPECT_DOUBLE_EQ(tl.LineAlpha(line, start), 0.0) << "line " << line;
    EXPECT_DOUBLE_EQ(tl.LineAlpha(line, start + 8), 1.0) << "line " << line;
    const double mid = tl.LineAlpha(line, start + 4);
    EXPECT_GT(mid, 0.5);  // ease-out front-loads the fade
    EXPECT_LT(mid, 1.0);
  }
}

TEST(TimelineTest, BlockAlphaFadesOut) {
  const std::vector<Block> blocks = {TextBlock(2, 1.0)};
  Timeline tl(blocks, TimingConstants(), timing::FPS_30, 0, 0);
  const int64_t content_end = tl.TimingOf(0).content_end();
  EXPECT_DOUBLE_EQ(tl.BlockAlpha(0, 0), 1.0);
  EXPECT_DOUBLE_EQ(tl.BlockAlpha(0, content_end - 1), 1.0);
  EXPECT_DOUBLE_EQ(tl.BlockAlpha(0, content_end + 5), 0.5);
  EXPECT_DOUBLE_EQ(tl.BlockAlpha(0, content_end + 10), 0.0);
  EXPECT_DOUBLE_EQ(tl.BlockAlpha(0, tl.TimingOf(0).duration - 1), 0.0);
}

TEST(TimelineTest, SceneAlphaIsAlwaysOne) {
  const std::vector<Block> blocks = {SceneBlock(30)};
  Timeline tl(blocks, TimingConstants(), timing::FPS_30, 0, 0);
  EXPECT_DOUBLE_EQ(tl.BlockAlpha(0, 29), 1.0);
}

TEST(RationalFpsTest, SampleCountsAreExact) {
  EXPECT_EQ(timing::FPS_30.SamplesForFramesCeil(30, 44100), 44100);
  EXPECT_EQ(timing::FPS_30.SamplesForFramesCeil(1, 44100), 1470);
  // 1 frame at 29.97 = 1471.47 samples, rounded up.
  EXPECT_EQ(timing::FPS_2997.SamplesForFramesCeil(1, 44100), 1472);
  EXPECT_EQ(timing::FPS_2997.ToArgString(), "30000/1001");
  EXPECT_EQ(timing::RationalFps(60, 2), timing::FPS_30);
}

}  // namespace
}  // namespace dossier::timeline
