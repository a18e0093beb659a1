// Repository: Dossier-render
// Component: Timeline Builder Tests
// Purpose: Determinism, conditional blocks and per-variant behavior.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include <algorithm>

#include "TestPaths.hpp"
#include "dossier/profile/ProfileLoader.hpp"
#include "dossier/timeline/ScaredTiming.hpp"
#include "dossier/timeline/TimelineBuilder.hpp"

namespace dossier::timeline {
namespace {

using Lines = std::vector<std::string>;

profile::ProfileRecord LoadFull() {
  profile::ProfileRecord record;
  RenderResult r = profile::LoadProfileRecord(test::FixturePath("profile_full.json"), &record);
  EXPECT_TRUE(r.ok) << r.detail;
  return record;
}

std::vector<Lines> AllLines(const Schedule& s) {
  std::vector<Lines> out;
  for (const auto& b : s.blocks) out.push_back(b.lines);
  return out;
}

ptrdiff_t FindBlock(const std::vector<Lines>& blocks, const Lines& lines) {
  auto it = std::find(blocks.begin(), blocks.end(), lines);
  return it == blocks.end() ? -1 : it - blocks.begin();
}

TEST(TimelineBuilderTest, SeedComesFromVisitorId) {
  const profile::ProfileRecord record = LoadFull();
  TimelineBuilder builder(VariantConfigFor(Variant::kDossier));
  Schedule s = builder.Build(record);
  EXPECT_EQ(s.seed, SeedFromVisitorId("a1b2c3d4e5f60718"));
}

TEST(TimelineBuilderTest, SameRecordSameSchedule) {
  const profile::ProfileRecord record = LoadFull();
  TimelineBuilder builder(VariantConfigFor(Variant::kDossier));
  Schedule a = builder.Build(record);
  Schedule b = builder.Build(record);

  ASSERT_EQ(a.blocks.size(), b.blocks.size());
  for (size_t i = 0; i < a.blocks.size(); ++i) {
    EXPECT_EQ(a.blocks[i].lines, b.blocks[i].lines) << "block " << i;
    EXPECT_EQ(a.blocks[i].importance, b.blocks[i].importance) << "block " << i;
    EXPECT_DOUBLE_EQ(a.blocks[i].computed_hold_sec, b.blocks[i].computed_hold_sec)
        << "block " << i;
  }
}

TEST(TimelineBuilderTest, CookieSummaryBlock) {
  const profile::ProfileRecord record = LoadFull();
  TimelineBuilder builder(VariantConfigFor(Variant::kDossier));
  const auto blocks = AllLines(builder.Build(record));

  const Lines expected = {"40 cookies found.", "12 belong to known trackers.",
                          "30% surveillance."};
  EXPECT_GE(FindBlock(blocks, expected), 0);
}

TEST(TimelineBuilderTest, RemovingCookiesRemovesOnlyCookieBlocks) {
  const profile::ProfileRecord with = LoadFull();
  profile::ProfileRecord without = with;
  without.extension.cookies.reset();

  TimelineBuilder builder(VariantConfigFor(Variant::kDossier));
  const auto a = AllLines(builder.Build(with));
  const auto b = AllLines(builder.Build(without));

  const ptrdiff_t k = FindBlock(a, {"40 cookies found.", "12 belong to known trackers.",
                                    "30% surveillance."});
  ASSERT_GE(k, 0);
  // Summary, consent, category breakdown, top trackers.
  constexpr size_t kCookieBlocks = 4;
  ASSERT_EQ(a.size(), b.size() + kCookieBlocks);

  for (ptrdiff_t i = 0; i < k; ++i) {
    EXPECT_EQ(a[i], b[i]) << "block " << i;
  }
  for (size_t i = static_cast<size_t>(k); i < b.size(); ++i) {
    EXPECT_EQ(a[i + kCookieBlocks], b[i]) << "block " << i;
  }
  for (const auto& lines : b) {
    for (const auto& line : lines) {
      EXPECT_EQ(line.find("cookies found"), std::string::npos) << line;
      EXPECT_NE(line, "subject agreed to this.");
    }
  }
}

TEST(TimelineBuilderTest, DossierDropsEmptyLinesAndUsesScaredTiming) {
  const profile::ProfileRecord record = LoadFull();
  TimelineBuilder builder(VariantConfigFor(Variant::kDossier));
  Schedule s = builder.Build(record);
  ASSERT_FALSE(s.blocks.empty());

  for (const auto& b : s.blocks) {
    EXPECT_FALSE(b.IsScene());
    EXPECT_GE(b.computed_hold_sec, kMinHoldSec);
    for (const auto& line : b.lines) EXPECT_FALSE(line.empty());
  }
  EXPECT_EQ(s.blocks.front().lines, Lines({"scanning."}));
  EXPECT_EQ(s.blocks.back().lines, Lines({"you are the product."}));
  EXPECT_EQ(s.blocks.back().importance, Importance::kLinger);
}

TEST(TimelineBuilderTest, ClassicKeepsSpacersAndAuthoredHolds) {
  const profile::ProfileRecord record = LoadFull();
  TimelineBuilder builder(VariantConfigFor(Variant::kClassic));
  Schedule s = builder.Build(record);

  bool found = false;
  for (const auto& b : s.blocks) {
    ASSERT_TRUE(b.hold_sec.has_value());
    EXPECT_DOUBLE_EQ(b.computed_hold_sec, *b.hold_sec);
    if (b.lines == Lines({"power savvy,", "", "=power user?"})) {
      found = true;
      EXPECT_DOUBLE_EQ(b.computed_hold_sec, 1.5);
    }
  }
  EXPECT_TRUE(found);
}

TEST(TimelineBuilderTest, ReelIsSixScenes) {
  const profile::ProfileRecord record = LoadFull();
  TimelineBuilder builder(VariantConfigFor(Variant::kReel));
  Schedule s = builder.Build(record);

  ASSERT_EQ(s.blocks.size(), 6u);
  const SceneKind kinds[] = {SceneKind::kEmergence, SceneKind::kIdentity,
                             SceneKind::kEntropyConstellation, SceneKind::kValuation,
                             SceneKind::kDataRain, SceneKind::kOutro};
  const int64_t frames[] = {90, 180, 150, 135, 90, 120};
  for (size_t i = 0; i < 6; ++i) {
    ASSERT_TRUE(s.blocks[i].IsScene());
    EXPECT_EQ(KindOf(*s.blocks[i].scene), kinds[i]);
    EXPECT_EQ(s.blocks[i].frame_count.value_or(-1), frames[i]);
  }

  const auto& constellation = std::get<EntropyConstellationScene>(*s.blocks[2].scene);
  EXPECT_EQ(constellation.bars.size(), 6u);
  EXPECT_DOUBLE_EQ(constellation.total_bits, 34.2);

  const auto& rain = std::get<DataRainScene>(*s.blocks[4].scene);
  EXPECT_EQ(rain.signal_count, 6);
}

TEST(ScaredTimingTest, PacingCurveShape) {
  EXPECT_DOUBLE_EQ(PacingCurve(0.0), 1.3);
  EXPECT_DOUBLE_EQ(PacingCurve(0.3), 0.75);
  EXPECT_DOUBLE_EQ(PacingCurve(0.6), 0.6);
  EXPECT_DOUBLE_EQ(PacingCurve(1.0), 2.1);
}

TEST(ScaredTimingTest, LingerHoldsLongerThanFlash) {
  SeededRng a(7);
  SeededRng b(7);
  const double linger = ScaredHoldSeconds(3, 10, 2, Importance::kLinger, a);
  const double flash = ScaredHoldSeconds(3, 10, 2, Importance::kFlash, b);
  EXPECT_GT(linger, flash);
  EXPECT_NEAR(linger / flash, 2.2 / 0.35, 1e-9);
}

}  // namespace
}  // namespace dossier::timeline
