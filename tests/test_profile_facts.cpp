// Repository: Dossier-render
// Component: Profile Facts Tests
// Purpose: Derived device, browser and clock facts.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include "TestPaths.hpp"
#include "dossier/profile/ProfileLoader.hpp"
#include "dossier/timeline/ProfileFacts.hpp"

namespace dossier::timeline {
namespace {

profile::ProfileRecord Load(const std::string& name) {
  profile::ProfileRecord record;
  RenderResult r = profile::LoadProfileRecord(test::FixturePath(name), &record);
  EXPECT_TRUE(r.ok) << r.detail;
  return record;
}

TEST(ProfileFactsTest, FullRecord) {
  const ProfileFacts f = DeriveProfileFacts(Load("profile_full.json"));
  EXPECT_EQ(f.apple_chip, "M2 Max");
  EXPECT_TRUE(f.nvidia_gpu.empty());
  EXPECT_TRUE(f.is_apple);
  EXPECT_FALSE(f.is_windows);
  EXPECT_TRUE(f.is_premium);
  EXPECT_TRUE(f.high_memory);
  EXPECT_TRUE(f.high_cores);
  EXPECT_TRUE(f.retina);
  EXPECT_TRUE(f.wide_color);
  EXPECT_TRUE(f.has_webcam);
  EXPECT_TRUE(f.has_mic);
  EXPECT_FALSE(f.do_not_track);
  EXPECT_TRUE(f.cookies_enabled);
  EXPECT_TRUE(f.is_chrome);
  EXPECT_FALSE(f.is_brave);
}

TEST(ProfileFactsTest, LocalTimeIsSubjectClock) {
  const ProfileFacts f = DeriveProfileFacts(Load("profile_full.json"));
  // 21:47 UTC with a +240 minute offset.
  ASSERT_TRUE(f.local_time.has_value());
  EXPECT_EQ(f.local_time->hour, 17);
  EXPECT_EQ(f.local_time->minute, 47);
}

TEST(ProfileFactsTest, LocalTimeWrapsAcrossMidnight) {
  profile::ProfileRecord r = Load("profile_full.json");
  r.fingerprint.collected_at = "2025-03-14T01:10:00Z";
  r.fingerprint.basic.timezone_offset_min = 180.0;
  const ProfileFacts f = DeriveProfileFacts(r);
  ASSERT_TRUE(f.local_time.has_value());
  EXPECT_EQ(f.local_time->hour, 22);
  EXPECT_EQ(f.local_time->minute, 10);
}

TEST(ProfileFactsTest, MinimalRecordHasNoClock) {
  const ProfileFacts f = DeriveProfileFacts(Load("profile_minimal.json"));
  EXPECT_FALSE(f.local_time.has_value());
  EXPECT_TRUE(f.cookies_enabled);  // absent counts as enabled
  EXPECT_FALSE(f.has_webcam);
}

TEST(ProfileFactsTest, GpuPatterns) {
  profile::ProfileRecord r = Load("profile_minimal.json");
  r.fingerprint.gpu_renderer = "ANGLE (NVIDIA, NVIDIA GeForce RTX 4090 Direct3D11)";
  ProfileFacts f = DeriveProfileFacts(r);
  EXPECT_EQ(f.nvidia_gpu, "RTX 4090 Direct3D11");
  EXPECT_TRUE(f.nvidia_recent);

  r.fingerprint.gpu_renderer = "NVIDIA GeForce GTX 1060";
  f = DeriveProfileFacts(r);
  EXPECT_FALSE(f.nvidia_recent);
}

TEST(ProfileFactsTest, ParseIsoTimestampMinutes) {
  const auto a = ParseIsoTimestampMinutes("2025-03-14T21:47:00.000Z");
  const auto b = ParseIsoTimestampMinutes("2025-03-14T21:48:59Z");
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_EQ(*b - *a, 1);
  EXPECT_FALSE(ParseIsoTimestampMinutes("").has_value());
  EXPECT_FALSE(ParseIsoTimestampMinutes("yesterday").has_value());
  EXPECT_FALSE(ParseIsoTimestampMinutes("2025-13-01T00:00:00Z").has_value());
}

TEST(ProfileFactsTest, FilterFontsKeepsInstalledOrder) {
  const auto out = FilterFonts({"Menlo", "Comic Sans MS", "Arial"}, {"Arial", "Menlo"});
  EXPECT_EQ(out, (std::vector<std::string>{"Menlo", "Arial"}));
}

}  // namespace
}  // namespace dossier::timeline
