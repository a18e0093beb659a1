// Repository: Dossier-render
// Component: Audio Tests
// Purpose: Synthesized track length and shape, WAV layout, external
//          sonifier failure handling.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>

#include "TestPaths.hpp"
#include "dossier/audio/AudioSynthesizer.hpp"
#include "dossier/audio/ExternalSonifier.hpp"
#include "dossier/audio/Muxer.hpp"
#include "dossier/audio/WavWriter.hpp"
#include "dossier/util/AtomicFile.hpp"

namespace dossier::audio {
namespace {

using std::chrono::milliseconds;
using timeline::Block;
using timeline::Importance;
using timeline::Timeline;
using timeline::TimingConstants;

std::vector<Block> TwoBlocks() {
  Block a;
  a.lines = {"scanning."};
  a.computed_hold_sec = 1.0;
  Block b;
  b.lines = {"you are the product."};
  b.importance = Importance::kLinger;
  b.computed_hold_sec = 2.0;
  return {a, b};
}

double Rms(const std::vector<int16_t>& s, int64_t from, int64_t to) {
  double sum = 0.0;
  for (int64_t i = from; i < to; ++i) {
    const double v = s[static_cast<size_t>(i)] / 32767.0;
    sum += v * v;
  }
  return std::sqrt(sum / static_cast<double>(to - from));
}

uint32_t ReadU32(const std::vector<uint8_t>& b, size_t at) {
  return b[at] | (b[at + 1] << 8) | (b[at + 2] << 16) | (static_cast<uint32_t>(b[at + 3]) << 24);
}

uint16_t ReadU16(const std::vector<uint8_t>& b, size_t at) {
  return static_cast<uint16_t>(b[at] | (b[at + 1] << 8));
}

// ---------------------------------------------------------------------------
// Synthesizer
// ---------------------------------------------------------------------------

TEST(AudioSynthesizerTest, TrackCoversEveryVideoFrame) {
  const auto blocks = TwoBlocks();
  for (const auto& fps : {timing::FPS_30, timing::FPS_2997, timing::FPS_24}) {
    Timeline tl(blocks, TimingConstants(), fps, 0, 30);
    const AudioTrack track = SynthesizeTrack(blocks, tl, 42);
    EXPECT_EQ(static_cast<int64_t>(track.samples.size()),
              fps.SamplesForFramesCeil(tl.TotalFrames(), kSampleRate));
    EXPECT_GE(track.DurationSeconds(), fps.SecondsFromFrames(tl.TotalFrames()));
  }
}

TEST(AudioSynthesizerTest, SameSeedSameSamples) {
  const auto blocks = TwoBlocks();
  Timeline tl(blocks, TimingConstants(), timing::FPS_30, 0, 30);
  EXPECT_EQ(SynthesizeTrack(blocks, tl, 7).samples, SynthesizeTrack(blocks, tl, 7).samples);
  EXPECT_NE(SynthesizeTrack(blocks, tl, 7).samples, SynthesizeTrack(blocks, tl, 8).samples);
}

TEST(AudioSynthesizerTest, SamplesStayWithinTheLimiter) {
  const auto blocks = TwoBlocks();
  Timeline tl(blocks, TimingConstants(), timing::FPS_30, 0, 30);
  const AudioTrack track = SynthesizeTrack(blocks, tl, 3);
  const int limit = static_cast<int>(std::floor(0.95 * 32767.0));
  for (int16_t s : track.samples) {
    ASSERT_LE(s, limit);
    ASSERT_GE(s, -limit - 1);
  }
}

TEST(AudioSynthesizerTest, BlockStartsCarryAClick) {
  const auto blocks = TwoBlocks();
  Timeline tl(blocks, TimingConstants(), timing::FPS_30, 0, 30);
  const AudioTrack track = SynthesizeTrack(blocks, tl, 11);

  const int64_t start = tl.fps().SampleAtFrameFloor(tl.TimingOf(1).start, kSampleRate);
  const int64_t window = kSampleRate / 20;
  const double before = Rms(track.samples, start - window, start);
  const double after = Rms(track.samples, start, start + window / 4);
  EXPECT_GT(after, before * 1.5) << "before " << before << " after " << after;
}

TEST(AudioSynthesizerTest, EmptyTimelineGivesEmptyTrack) {
  Timeline tl({}, TimingConstants(), timing::FPS_30, 0, 0);
  EXPECT_TRUE(SynthesizeTrack({}, tl, 1).samples.empty());
}

// ---------------------------------------------------------------------------
// WAV
// ---------------------------------------------------------------------------

TEST(WavWriterTest, HeaderLayout) {
  AudioTrack track;
  track.samples = {1, -2, 32767};
  const std::vector<uint8_t> wav = EncodeWav(track);

  ASSERT_EQ(wav.size(), kWavHeaderBytes + 6);
  EXPECT_EQ(std::memcmp(wav.data(), "RIFF", 4), 0);
  EXPECT_EQ(ReadU32(wav, 4), 36u + 6u);
  EXPECT_EQ(std::memcmp(wav.data() + 8, "WAVEfmt ", 8), 0);
  EXPECT_EQ(ReadU32(wav, 16), 16u);
  EXPECT_EQ(ReadU16(wav, 20), 1);  // PCM
  EXPECT_EQ(ReadU16(wav, 22), 1);  // mono
  EXPECT_EQ(ReadU32(wav, 24), 44100u);
  EXPECT_EQ(ReadU32(wav, 28), 88200u);
  EXPECT_EQ(ReadU16(wav, 32), 2);
  EXPECT_EQ(ReadU16(wav, 34), 16);
  EXPECT_EQ(std::memcmp(wav.data() + 36, "data", 4), 0);
  EXPECT_EQ(ReadU32(wav, 40), 6u);

  EXPECT_EQ(ReadU16(wav, 44), 1);
  EXPECT_EQ(ReadU16(wav, 46), 0xFFFE);
  EXPECT_EQ(ReadU16(wav, 48), 0x7FFF);
}

TEST(WavWriterTest, UnwritablePathIsAudioFailure) {
  AudioTrack track;
  track.samples = {0};
  RenderResult r = WriteWav("/nonexistent/dir/track.wav", track);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kAudioFailure);
}

// ---------------------------------------------------------------------------
// External sonifier
// ---------------------------------------------------------------------------

class ExternalSonifierTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = test::ScratchDir("sonifier");
    wav_ = dir_ + "/out.wav";
    util::DiscardFile(wav_);
  }

  std::string dir_;
  std::string wav_;
};

TEST_F(ExternalSonifierTest, ArgsAppendVideoAndWav) {
  ExternalSonifier s("python3  sonify.py --fast", milliseconds(1000));
  EXPECT_EQ(s.BuildArgs("in.mp4", "out.wav"),
            (std::vector<std::string>{"python3", "sonify.py", "--fast", "in.mp4", "out.wav"}));
}

TEST_F(ExternalSonifierTest, ProducesTrack) {
  AudioTrack track;
  track.samples.assign(441, 100);
  const std::string source = dir_ + "/source.wav";
  ASSERT_TRUE(WriteWav(source, track).ok);
  const std::string script =
      test::WriteScript(dir_ + "/good.sh", "cp \"" + source + "\" \"$2\"\n");

  ExternalSonifier s(script, milliseconds(10000));
  RenderResult r = s.Generate(dir_ + "/silent.mp4", wav_);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(util::FileSize(wav_), static_cast<int64_t>(kWavHeaderBytes + 882));
}

TEST_F(ExternalSonifierTest, FailingCommandLeavesNoTrack) {
  const std::string script =
      test::WriteScript(dir_ + "/bad.sh", "echo partial > \"$2\"\necho boom >&2\nexit 1\n");
  ExternalSonifier s(script, milliseconds(10000));
  RenderResult r = s.Generate(dir_ + "/silent.mp4", wav_);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kAudioFailure);
  EXPECT_NE(r.detail.find("boom"), std::string::npos) << r.detail;
  EXPECT_FALSE(util::FileExists(wav_));
}

TEST_F(ExternalSonifierTest, HeaderOnlyOutputIsRejected) {
  const std::string script = test::WriteScript(dir_ + "/empty.sh", ": > \"$2\"\n");
  ExternalSonifier s(script, milliseconds(10000));
  RenderResult r = s.Generate(dir_ + "/silent.mp4", wav_);
  EXPECT_FALSE(r.ok);
  EXPECT_NE(r.detail.find("no audio"), std::string::npos) << r.detail;
  EXPECT_FALSE(util::FileExists(wav_));
}

TEST_F(ExternalSonifierTest, TimeoutIsAudioFailure) {
  const std::string script = test::WriteScript(dir_ + "/slow.sh", "exec sleep 10\n");
  ExternalSonifier s(script, milliseconds(100));
  RenderResult r = s.Generate(dir_ + "/silent.mp4", wav_);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kAudioFailure);
  EXPECT_NE(r.detail.find("timed out"), std::string::npos) << r.detail;
}

TEST_F(ExternalSonifierTest, TimeoutIsBoundedForWrapperScripts) {
  // Not exec'd: the shell waits on a sleep child that shares its output pipe.
  const std::string script = test::WriteScript(dir_ + "/wrapper.sh", "sleep 5\n");
  ExternalSonifier s(script, milliseconds(200));
  const auto start = std::chrono::steady_clock::now();
  RenderResult r = s.Generate(dir_ + "/silent.mp4", wav_);
  const auto elapsed = std::chrono::duration_cast<milliseconds>(
      std::chrono::steady_clock::now() - start);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kAudioFailure);
  EXPECT_NE(r.detail.find("timed out"), std::string::npos) << r.detail;
  EXPECT_LT(elapsed.count(), 1000);
  EXPECT_FALSE(util::FileExists(wav_));
}

TEST_F(ExternalSonifierTest, InterruptStopsTheCommand) {
  std::atomic<bool> interrupt{true};
  const std::string script =
      test::WriteScript(dir_ + "/long.sh", "sleep 5\necho late > \"$2\"\n");
  ExternalSonifier s(script, milliseconds(30000), &interrupt);
  const auto start = std::chrono::steady_clock::now();
  RenderResult r = s.Generate(dir_ + "/silent.mp4", wav_);
  const auto elapsed = std::chrono::duration_cast<milliseconds>(
      std::chrono::steady_clock::now() - start);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kInterrupted);
  EXPECT_LT(elapsed.count(), 1000);
  EXPECT_FALSE(util::FileExists(wav_));
}

TEST_F(ExternalSonifierTest, MissingCommand) {
  ExternalSonifier empty("", milliseconds(1000));
  EXPECT_FALSE(empty.Generate(dir_ + "/silent.mp4", wav_).ok);

  ExternalSonifier missing("/nonexistent/sonify", milliseconds(1000));
  RenderResult r = missing.Generate(dir_ + "/silent.mp4", wav_);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kAudioFailure);
}

// ---------------------------------------------------------------------------
// Muxer
// ---------------------------------------------------------------------------

TEST(LibavMuxerTest, MissingInputsAreAudioFailure) {
  const std::string dir = test::ScratchDir("mux");
  MuxRequest request;
  request.video_path = dir + "/missing.mp4";
  request.audio_path = dir + "/missing.wav";
  request.output_path = dir + "/out.mp4";
  LibavMuxer muxer;
  RenderResult r = muxer.Mux(request);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kAudioFailure);
  EXPECT_FALSE(util::FileExists(request.output_path));
}

}  // namespace
}  // namespace dossier::audio
