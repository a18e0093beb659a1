// Repository: Dossier-render
// Component: Video Encoder Tests
// Purpose: Encoder arguments, subprocess handling and output publication
//          against scripted stand-in encoders.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

#include "TestPaths.hpp"
#include "dossier/encode/EncoderConfig.hpp"
#include "dossier/encode/Subprocess.hpp"
#include "dossier/encode/VideoEncoder.hpp"
#include "dossier/util/AtomicFile.hpp"

namespace dossier::encode {
namespace {

using std::chrono::milliseconds;

// ---------------------------------------------------------------------------
// EncoderConfig
// ---------------------------------------------------------------------------

TEST(EncoderConfigTest, DefaultsAreValid) {
  EXPECT_TRUE(ValidateEncoderConfig(EncoderConfig()).ok);
}

TEST(EncoderConfigTest, RejectsBadGeometry) {
  EncoderConfig c;
  c.width = 0;
  EXPECT_FALSE(ValidateEncoderConfig(c).ok);

  c = EncoderConfig();
  c.width = 641;
  RenderResult r = ValidateEncoderConfig(c);
  EXPECT_FALSE(r.ok);
  EXPECT_NE(r.detail.find("even"), std::string::npos);

  c = EncoderConfig();
  c.fps = timing::RationalFps(0, 1);
  EXPECT_FALSE(ValidateEncoderConfig(c).ok);

  c = EncoderConfig();
  c.crf = 52;
  EXPECT_FALSE(ValidateEncoderConfig(c).ok);
}

TEST(EncoderConfigTest, ArgsDescribeRawRgbaInput) {
  EncoderConfig c;
  c.width = 1280;
  c.height = 720;
  c.fps = timing::FPS_2997;
  c.crf = 20;
  const auto args = BuildEncoderArgs(c, "/tmp/out.tmp");

  auto after = [&](const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    return it != args.end() && it + 1 != args.end() ? *(it + 1) : std::string();
  };
  EXPECT_EQ(args.front(), "ffmpeg");
  EXPECT_EQ(args.back(), "/tmp/out.tmp");
  EXPECT_EQ(after("-s"), "1280x720");
  EXPECT_EQ(after("-pix_fmt"), "rgba");
  EXPECT_EQ(after("-r"), "30000/1001");
  EXPECT_EQ(after("-i"), "-");
  EXPECT_EQ(after("-crf"), "20");
  EXPECT_EQ(after("-c:v"), "libx264");
  EXPECT_NE(std::find(args.begin(), args.end(), "-an"), args.end());
}

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

TEST(SubprocessTest, ReportsExitCodeAndOutputTail) {
  std::string error;
  SubprocessResult r =
      RunSubprocess({"/bin/sh", "-c", "echo oops >&2; exit 3"}, milliseconds(10000), &error);
  EXPECT_TRUE(error.empty()) << error;
  EXPECT_FALSE(r.ok());
  EXPECT_EQ(r.exit_code, 3);
  EXPECT_NE(r.stderr_tail.find("oops"), std::string::npos);
  EXPECT_NE(r.Describe().find("exit code 3"), std::string::npos);
}

TEST(SubprocessTest, KillsOnTimeout) {
  std::string error;
  SubprocessResult r = RunSubprocess({"sleep", "10"}, milliseconds(100), &error);
  EXPECT_TRUE(r.timed_out);
  EXPECT_FALSE(r.ok());
}

int64_t ElapsedMs(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - start)
      .count();
}

TEST(SubprocessTest, TimeoutKillsTheWholeProcessGroup) {
  // The shell forks sleep instead of exec'ing it; both share the output pipe.
  std::string error;
  const auto start = std::chrono::steady_clock::now();
  SubprocessResult r = RunSubprocess({"/bin/sh", "-c", "sleep 5; echo done"}, milliseconds(200),
                                     &error);
  EXPECT_TRUE(error.empty()) << error;
  EXPECT_TRUE(r.timed_out);
  EXPECT_LT(ElapsedMs(start), 1000);
}

TEST(SubprocessTest, LingeringBackgroundChildDoesNotBlockWait) {
  std::string error;
  const auto start = std::chrono::steady_clock::now();
  SubprocessResult r = RunSubprocess({"/bin/sh", "-c", "sleep 30 & echo started; exit 0"},
                                     milliseconds(10000), &error);
  EXPECT_TRUE(error.empty()) << error;
  EXPECT_TRUE(r.ok()) << r.Describe();
  EXPECT_NE(r.stderr_tail.find("started"), std::string::npos);
  EXPECT_LT(ElapsedMs(start), 2000);
}

TEST(SubprocessTest, InterruptFlagStopsTheWait) {
  std::atomic<bool> interrupt{true};
  std::string error;
  const auto start = std::chrono::steady_clock::now();
  SubprocessResult r = RunSubprocess({"/bin/sh", "-c", "sleep 10; echo done"},
                                     milliseconds(30000), &error, "Subprocess", &interrupt);
  EXPECT_TRUE(r.interrupted);
  EXPECT_FALSE(r.ok());
  EXPECT_NE(r.Describe().find("interrupted"), std::string::npos);
  EXPECT_LT(ElapsedMs(start), 1000);
}

TEST(SubprocessTest, MissingBinaryFailsToSpawn) {
  std::string error;
  auto proc = Subprocess::Spawn({"/nonexistent/dossier-encoder"}, SubprocessOptions(), &error);
  EXPECT_EQ(proc, nullptr);
  EXPECT_FALSE(error.empty());
}

// ---------------------------------------------------------------------------
// VideoEncoder
// ---------------------------------------------------------------------------

class VideoEncoderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = test::ScratchDir("encoder");
    output_ = dir_ + "/out.mp4";
    util::DiscardFile(output_);
  }

  EncoderConfig SmallConfig(const std::string& encoder) {
    EncoderConfig c;
    c.encoder_path = encoder;
    c.width = 4;
    c.height = 2;
    c.stall_timeout = milliseconds(5000);
    c.finish_timeout = milliseconds(10000);
    return c;
  }

  std::string dir_;
  std::string output_;
};

TEST_F(VideoEncoderTest, PublishesWhatTheEncoderWrote) {
  // Writes stdin to the last argument, the temp output path.
  const std::string script =
      test::WriteScript(dir_ + "/cat_encoder.sh", "for a; do out=$a; done\ncat > \"$out\"\n");
  VideoEncoder encoder(SmallConfig(script));
  ASSERT_TRUE(encoder.Open(output_).ok);

  std::vector<uint8_t> expected;
  for (uint8_t f = 0; f < 3; ++f) {
    std::vector<uint8_t> frame(32, f);
    expected.insert(expected.end(), frame.begin(), frame.end());
    RenderResult r = encoder.Submit(frame.data(), frame.size());
    ASSERT_TRUE(r.ok) << r.detail;
  }
  RenderResult r = encoder.Finish();
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(encoder.frames_submitted(), 3);

  std::string bytes;
  ASSERT_TRUE(util::ReadFile(output_, &bytes));
  EXPECT_EQ(bytes, std::string(expected.begin(), expected.end()));
  EXPECT_FALSE(util::FileExists(encoder.temp_path()));
}

TEST_F(VideoEncoderTest, NonZeroExitLeavesNoOutput) {
  VideoEncoder encoder(SmallConfig("/bin/false"));
  ASSERT_TRUE(encoder.Open(output_).ok);
  std::vector<uint8_t> frame(32, 0);
  // The child may already be gone; either Submit or Finish reports it.
  RenderResult r = encoder.Submit(frame.data(), frame.size());
  if (r.ok) r = encoder.Finish();
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kEncodeFailure);
  EXPECT_FALSE(util::FileExists(output_));
  EXPECT_FALSE(encoder.IsOpen());
}

TEST_F(VideoEncoderTest, MissingEncoderFailsToOpen) {
  VideoEncoder encoder(SmallConfig("/nonexistent/ffmpeg"));
  RenderResult r = encoder.Open(output_);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kEncodeFailure);
  EXPECT_NE(r.detail.find("cannot start encoder"), std::string::npos);
}

TEST_F(VideoEncoderTest, EncoderThatStopsReadingStalls) {
  const std::string script = test::WriteScript(dir_ + "/deaf_encoder.sh", "exec sleep 30\n");
  EncoderConfig c = SmallConfig(script);
  c.width = 256;
  c.height = 256;
  c.stall_timeout = milliseconds(200);
  VideoEncoder encoder(c);
  ASSERT_TRUE(encoder.Open(output_).ok);

  std::vector<uint8_t> frame(c.FrameBytes(), 0);
  RenderResult r = RenderResult::Success();
  for (int i = 0; i < 8 && r.ok; ++i) r = encoder.Submit(frame.data(), frame.size());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kEncodeFailure);
  EXPECT_NE(r.detail.find("BACKPRESSURE_STALL"), std::string::npos) << r.detail;
  EXPECT_FALSE(util::FileExists(output_));
}

TEST_F(VideoEncoderTest, EncoderThatExitsEarlyBreaksThePipe) {
  const std::string script = test::WriteScript(dir_ + "/quitter.sh", "exit 2\n");
  EncoderConfig c = SmallConfig(script);
  c.width = 256;
  c.height = 256;
  VideoEncoder encoder(c);
  ASSERT_TRUE(encoder.Open(output_).ok);

  std::vector<uint8_t> frame(c.FrameBytes(), 0);
  RenderResult r = RenderResult::Success();
  for (int i = 0; i < 8 && r.ok; ++i) r = encoder.Submit(frame.data(), frame.size());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kEncodeFailure);
  EXPECT_NE(r.detail.find("exit code 2"), std::string::npos) << r.detail;
  EXPECT_FALSE(util::FileExists(output_));
}

TEST_F(VideoEncoderTest, WrongFrameSizeAborts) {
  const std::string script =
      test::WriteScript(dir_ + "/cat_encoder2.sh", "for a; do out=$a; done\ncat > \"$out\"\n");
  VideoEncoder encoder(SmallConfig(script));
  ASSERT_TRUE(encoder.Open(output_).ok);
  std::vector<uint8_t> frame(31, 0);
  RenderResult r = encoder.Submit(frame.data(), frame.size());
  EXPECT_FALSE(r.ok);
  EXPECT_NE(r.detail.find("frame size mismatch"), std::string::npos);
  EXPECT_FALSE(encoder.IsOpen());
}

}  // namespace
}  // namespace dossier::encode
