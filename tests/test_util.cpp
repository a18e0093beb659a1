// Repository: Dossier-render
// Component: Utility Tests
// Purpose: Text formatting, atomic files, run configuration and progress
//          lines.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include <cstdlib>
#include <vector>

#include "TestPaths.hpp"
#include "dossier/session/ProgressReporter.hpp"
#include "dossier/session/RenderConfig.hpp"
#include "dossier/util/AtomicFile.hpp"
#include "dossier/util/Easing.hpp"
#include "dossier/util/Logger.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier {
namespace {

// ---------------------------------------------------------------------------
// TextFormat
// ---------------------------------------------------------------------------

TEST(TextFormatTest, FixedRoundsHalfUp) {
  EXPECT_EQ(util::FormatFixed(34.25, 1), "34.3");
  EXPECT_EQ(util::FormatFixed(4.75, 2), "4.75");
  EXPECT_EQ(util::FormatFixed(-0.01, 1), "0.0");
  EXPECT_EQ(util::FormatFixed(99.5, 0), "100");
}

TEST(TextFormatTest, NumberIsShortest) {
  EXPECT_EQ(util::FormatNumber(8.0), "8");
  EXPECT_EQ(util::FormatNumber(0.5), "0.5");
  EXPECT_EQ(util::FormatNumber(1.25), "1.25");
  EXPECT_EQ(util::FormatNumber(99.99), "99.99");
}

TEST(TextFormatTest, Utf8) {
  const std::string s = "caf\xC3\xA9 \xE2\x86\x92 ok";  // "café → ok"
  EXPECT_EQ(util::Utf8Length(s), 9u);
  EXPECT_EQ(util::Utf8Prefix(s, 4), "caf\xC3\xA9");
  EXPECT_EQ(util::DecodeUtf8("\xFF")[0], 0xFFFDu);
  EXPECT_EQ(util::EncodeUtf8(0x2192), "\xE2\x86\x92");
}

TEST(TextFormatTest, Strings) {
  EXPECT_EQ(util::ToLowerAscii("MacBook Pro"), "macbook pro");
  EXPECT_EQ(util::Join({"a", "b", "c"}, ". "), "a. b. c");
  EXPECT_EQ(util::ReplaceFirst("facebook.com.com", ".com", ""), "facebook.com");
  EXPECT_EQ(util::PadLeft("7", 3, ' '), "  7");
}

TEST(EasingTest, EaseOutEndpoints) {
  EXPECT_DOUBLE_EQ(util::EaseOut(0.0), 0.0);
  EXPECT_DOUBLE_EQ(util::EaseOut(1.0), 1.0);
  EXPECT_DOUBLE_EQ(util::EaseOut(2.0), 1.0);
  EXPECT_DOUBLE_EQ(util::EaseOut(0.5), 0.875);
}

// ---------------------------------------------------------------------------
// AtomicFile
// ---------------------------------------------------------------------------

TEST(AtomicFileTest, WriteReadRoundTrip) {
  const std::string path = test::ScratchDir("atomic") + "/data.bin";
  std::string error;
  ASSERT_TRUE(util::WriteFileAtomically(path, {1, 2, 3}, &error)) << error;
  EXPECT_EQ(util::FileSize(path), 3);
  EXPECT_FALSE(util::FileExists(util::TempPathFor(path)));
  std::string bytes;
  ASSERT_TRUE(util::ReadFile(path, &bytes));
  EXPECT_EQ(bytes, std::string("\x01\x02\x03", 3));
  util::DiscardFile(path);
  EXPECT_FALSE(util::FileExists(path));
}

TEST(AtomicFileTest, ScopedRemoverHonorsRelease) {
  const std::string dir = test::ScratchDir("atomic");
  std::string error;
  ASSERT_TRUE(util::WriteFileAtomically(dir + "/a", {1}, &error));
  ASSERT_TRUE(util::WriteFileAtomically(dir + "/b", {1}, &error));
  {
    util::ScopedFileRemover a(dir + "/a");
    util::ScopedFileRemover b(dir + "/b");
    b.Release();
  }
  EXPECT_FALSE(util::FileExists(dir + "/a"));
  EXPECT_TRUE(util::FileExists(dir + "/b"));
  util::DiscardFile(dir + "/b");
}

TEST(AtomicFileTest, CommitMissingFileFails) {
  const std::string dir = test::ScratchDir("atomic");
  std::string error;
  EXPECT_FALSE(util::CommitFile(dir + "/none", dir + "/target", &error));
  EXPECT_FALSE(error.empty());
}

// ---------------------------------------------------------------------------
// RenderConfig
// ---------------------------------------------------------------------------

TEST(RenderConfigTest, DefaultOutputPath) {
  EXPECT_EQ(session::DefaultOutputPath("dossier.json"), "dossier.mp4");
  EXPECT_EQ(session::DefaultOutputPath("/tmp/P.JSON"), "/tmp/P.mp4");
  EXPECT_EQ(session::DefaultOutputPath("profile"), "profile.mp4");

  session::RenderConfig c;
  c.input_path = "a.json";
  EXPECT_EQ(c.ResolvedOutputPath(), "a.mp4");
  c.output_path = "b.mp4";
  EXPECT_EQ(c.ResolvedOutputPath(), "b.mp4");
}

TEST(RenderConfigTest, Validation) {
  session::RenderConfig c;
  EXPECT_EQ(session::ValidateRenderConfig(c).error, RenderError::kInputError);

  c.input_path = "a.json";
  EXPECT_TRUE(session::ValidateRenderConfig(c).ok);

  c.width = 1;
  EXPECT_FALSE(session::ValidateRenderConfig(c).ok);
  c.width = 1920;

  c.fps = 0;
  EXPECT_FALSE(session::ValidateRenderConfig(c).ok);
  c.fps = 30;

  c.output_path = "a.json";
  EXPECT_FALSE(session::ValidateRenderConfig(c).ok);
}

TEST(RenderConfigTest, EnvironmentOverrides) {
  setenv("DOSSIER_ENCODER", "/opt/ffmpeg/bin/ffmpeg", 1);
  setenv("DOSSIER_FONT", "", 1);
  session::RenderConfig c;
  session::ApplyEnvironmentOverrides(&c);
  EXPECT_EQ(c.encoder_path, "/opt/ffmpeg/bin/ffmpeg");
  EXPECT_EQ(c.display_font, session::kDefaultDisplayFont);
  unsetenv("DOSSIER_ENCODER");
  unsetenv("DOSSIER_FONT");
}

// ---------------------------------------------------------------------------
// ProgressReporter
// ---------------------------------------------------------------------------

TEST(ProgressReporterTest, FormatLine) {
  EXPECT_EQ(session::ProgressReporter::FormatLine(150, 300, 5.0),
            "[ 50%]  150/300 frames  5.0s  30.0 fps");
  EXPECT_EQ(session::ProgressReporter::FormatLine(0, 300, 0.0),
            "[  0%]  0/300 frames  0.0s  0.0 fps");
}

TEST(ProgressReporterTest, LogsEveryIntervalAndTheLastFrame) {
  std::vector<std::string> lines;
  util::Logger::SetInfoSink([&lines](const std::string& line) { lines.push_back(line); });
  session::ProgressReporter progress(65);
  for (int64_t f = 0; f < 65; ++f) progress.OnFrame(f);
  util::Logger::SetInfoSink(nullptr);

  // Frames 0, 30, 60 and 64.
  ASSERT_EQ(lines.size(), 4u);
  EXPECT_NE(lines[3].find("64/65 frames"), std::string::npos) << lines[3];
}

}  // namespace
}  // namespace dossier
