// Repository: Dossier-render
// Component: Frame Stream Writer Tests
// Purpose: Backpressure, stall detection and broken channels.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <numeric>
#include <vector>

#include "FakeByteChannels.hpp"
#include "dossier/encode/FrameStreamWriter.hpp"

namespace dossier::encode {
namespace {

using std::chrono::milliseconds;

std::vector<uint8_t> Frame(size_t len, uint8_t tag) {
  std::vector<uint8_t> f(len);
  std::iota(f.begin(), f.end(), tag);
  return f;
}

TEST(FrameStreamWriterTest, FullChannelStillReceivesEveryFrameInOrder) {
  test::EveryOtherCallChannel channel(1000);
  FrameStreamWriter writer(&channel, milliseconds(1000));

  std::vector<uint8_t> expected;
  for (uint8_t i = 0; i < 5; ++i) {
    const std::vector<uint8_t> frame = Frame(4096, i);
    expected.insert(expected.end(), frame.begin(), frame.end());
    RenderResult r = writer.WriteFrame(frame.data(), frame.size());
    ASSERT_TRUE(r.ok) << r.detail;
  }

  EXPECT_EQ(channel.received(), expected);
  EXPECT_EQ(writer.stats().frames, 5u);
  EXPECT_EQ(writer.stats().bytes, 5u * 4096u);
  EXPECT_GT(writer.stats().full_events, 0u);
  EXPECT_EQ(channel.waits(), writer.stats().full_events);
}

TEST(FrameStreamWriterTest, NoProgressIsAStall) {
  test::StalledChannel channel;
  FrameStreamWriter writer(&channel, milliseconds(50));
  const std::vector<uint8_t> frame = Frame(64, 0);

  const auto start = std::chrono::steady_clock::now();
  RenderResult r = writer.WriteFrame(frame.data(), frame.size());
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kBackpressureStall);
  EXPECT_NE(r.detail.find("0/64 bytes"), std::string::npos) << r.detail;
  EXPECT_GE(elapsed, milliseconds(50));
  EXPECT_LT(elapsed, milliseconds(5000));
  EXPECT_EQ(writer.stats().frames, 0u);
}

TEST(FrameStreamWriterTest, BrokenChannelIsEncodeFailure) {
  test::BreakingChannel channel(100);
  FrameStreamWriter writer(&channel, milliseconds(1000));
  const std::vector<uint8_t> frame = Frame(64, 0);

  ASSERT_TRUE(writer.WriteFrame(frame.data(), frame.size()).ok);
  RenderResult r = writer.WriteFrame(frame.data(), frame.size());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kEncodeFailure);
  EXPECT_NE(r.detail.find("frame 1"), std::string::npos) << r.detail;
  EXPECT_NE(r.detail.find("Broken pipe"), std::string::npos) << r.detail;
}

TEST(FrameStreamWriterTest, InterruptStopsTheWait) {
  test::StalledChannel channel;
  std::atomic<bool> interrupt{true};
  FrameStreamWriter writer(&channel, milliseconds(60000), &interrupt);
  const std::vector<uint8_t> frame = Frame(64, 0);

  RenderResult r = writer.WriteFrame(frame.data(), frame.size());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kInterrupted);
}

}  // namespace
}  // namespace dossier::encode
