// Repository: Dossier-render
// Component: Profile Loader Tests
// Purpose: Required-field validation and tolerated fallbacks.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "TestPaths.hpp"
#include "dossier/profile/ProfileLoader.hpp"

namespace dossier::profile {
namespace {

using test::FixturePath;

TEST(ProfileLoaderTest, LoadsFullRecord) {
  ProfileRecord record;
  RenderResult r = LoadProfileRecord(FixturePath("profile_full.json"), &record);
  ASSERT_TRUE(r.ok) << r.detail;

  EXPECT_EQ(record.fingerprint.visitor_id, "a1b2c3d4e5f60718");
  EXPECT_EQ(record.profile.device.device_guess, "MacBook Pro");
  EXPECT_EQ(record.profile.location.country, "United States");
  EXPECT_DOUBLE_EQ(record.entropy.total_bits, 34.2);
  EXPECT_EQ(record.entropy.contributions.size(), 7u);
  EXPECT_EQ(record.entropy.Present().size(), 6u);
  EXPECT_DOUBLE_EQ(record.pricing.cpm, 4.75);
  EXPECT_DOUBLE_EQ(record.pricing.annual_value, 142.5);
  EXPECT_EQ(record.fingerprint.fonts.size(), 6u);
  EXPECT_NE(record.fingerprint.gpu_renderer.find("M2 Max"), std::string::npos);

  ASSERT_TRUE(record.extension.cookies.has_value());
  EXPECT_EQ(record.extension.cookies->total, 40);
  EXPECT_EQ(record.extension.cookies->tracker_count, 12);
  EXPECT_FALSE(record.extension.cookies->tracker_percentage.has_value());
  // Denied history access reads as absent.
  EXPECT_FALSE(record.extension.history.has_value());
}

TEST(ProfileLoaderTest, MinimalRecordGetsFallbacks) {
  ProfileRecord record;
  RenderResult r = LoadProfileRecord(FixturePath("profile_minimal.json"), &record);
  ASSERT_TRUE(r.ok) << r.detail;

  EXPECT_TRUE(record.fingerprint.visitor_id.empty());
  EXPECT_EQ(record.DisplayVisitorId(), "00000000");
  EXPECT_EQ(record.profile.tech_literacy.score, 50);
  EXPECT_FALSE(record.extension.cookies.has_value());
  EXPECT_GT(record.pricing.annual_value, 0.0);
  EXPECT_FALSE(record.uniqueness.description.empty());
}

TEST(ProfileLoaderTest, MissingCpmIsInputError) {
  ProfileRecord record;
  RenderResult r = LoadProfileRecord(FixturePath("profile_missing_cpm.json"), &record);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kInputError);
  EXPECT_NE(r.detail.find("pricing.cpm"), std::string::npos) << r.detail;
}

TEST(ProfileLoaderTest, MissingFileIsInputError) {
  ProfileRecord record;
  RenderResult r = LoadProfileRecord(FixturePath("does_not_exist.json"), &record);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kInputError);
}

TEST(ProfileLoaderTest, MalformedJsonIsInputError) {
  ProfileRecord record;
  RenderResult r = ParseProfileRecord("{\"profile\": [", &record);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kInputError);

  r = ParseProfileRecord("[1, 2, 3]", &record);
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, RenderError::kInputError);
}

TEST(ProfileLoaderTest, ReportsFirstMissingFieldInDocumentOrder) {
  const std::string doc = R"({
    "fingerprint": {"basic": {}},
    "profile": {"device": {"parsed": {"os": "Linux"}}},
    "entropy": {"totalBits": 1, "contributions": []},
    "pricing": {"cpm": 1}
  })";
  ProfileRecord record;
  RenderResult r = ParseProfileRecord(doc, &record);
  ASSERT_FALSE(r.ok);
  EXPECT_NE(r.detail.find("profile.device.parsed.browser"), std::string::npos) << r.detail;
}

TEST(ProfileLoaderTest, TopLevelSignalsWithoutFingerprintWrapper) {
  const std::string doc = R"({
    "basic": {"timezone": "Europe/Berlin"},
    "advanced": {"visitorId": "xyz"},
    "profile": {
      "device": {"parsed": {"os": "Linux", "browser": "Firefox"}},
      "location": {"country": "Germany", "market": "Tier 1"},
      "income": {"bracket": "Middle", "estimate": "$50k"}
    },
    "entropy": {"totalBits": 18, "contributions": []},
    "pricing": {"cpm": 2}
  })";
  ProfileRecord record;
  RenderResult r = ParseProfileRecord(doc, &record);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(record.fingerprint.visitor_id, "xyz");
  EXPECT_EQ(record.fingerprint.basic.timezone, "Europe/Berlin");
}

TEST(ProfileLoaderTest, NullOptionalFieldsAreAbsent) {
  ProfileRecord record;
  ASSERT_TRUE(LoadProfileRecord(FixturePath("profile_full.json"), &record).ok);
  EXPECT_TRUE(record.fingerprint.basic.do_not_track.empty());
  ASSERT_TRUE(record.fingerprint.battery.has_value());
  EXPECT_FALSE(record.fingerprint.battery->charging_time_sec.has_value());
}

TEST(ProfileLoaderTest, OutOfRangeCountsSaturate) {
  const std::string doc = R"({
    "basic": {"timezone": "UTC"},
    "profile": {
      "device": {"parsed": {"os": "Linux", "browser": "Firefox"}},
      "location": {"country": "Germany", "market": "Tier 1"},
      "income": {"bracket": "Middle", "estimate": "$50k"},
      "techLiteracy": {"score": 1e300, "level": "Expert"}
    },
    "entropy": {"totalBits": 18, "contributions": []},
    "pricing": {"cpm": 2},
    "extension": {
      "cookies": {"total": 1e12, "trackerCount": -1e12},
      "bookmarks": {"count": 5e9}
    }
  })";
  ProfileRecord record;
  RenderResult r = ParseProfileRecord(doc, &record);
  ASSERT_TRUE(r.ok) << r.detail;
  EXPECT_EQ(record.profile.tech_literacy.score, std::numeric_limits<int>::max());
  ASSERT_TRUE(record.extension.cookies.has_value());
  EXPECT_EQ(record.extension.cookies->total, std::numeric_limits<int>::max());
  EXPECT_EQ(record.extension.cookies->tracker_count, std::numeric_limits<int>::min());
  ASSERT_TRUE(record.extension.bookmark_count.has_value());
  EXPECT_EQ(*record.extension.bookmark_count, std::numeric_limits<int>::max());
}

TEST(ProfileLoaderTest, HistoryPatternsAreCarried) {
  const std::string doc = R"({
    "basic": {"timezone": "UTC"},
    "profile": {
      "device": {"parsed": {"os": "Linux", "browser": "Firefox"}},
      "location": {"country": "Germany", "market": "Tier 1"},
      "income": {"bracket": "Middle", "estimate": "$50k"}
    },
    "entropy": {"totalBits": 18, "contributions": []},
    "pricing": {"cpm": 2},
    "extension": {
      "history": {
        "totalItems": 812,
        "uniqueDomains": 97,
        "interests": [{"interest": "Cooking", "visits": 40}, "Travel"],
        "patterns": {"peakHour": "22:00", "estimatedSleep": "01:00-07:00",
                     "isWeekendWarrior": true, "isWorkaholic": false}
      },
      "bookmarks": {"count": 214}
    }
  })";
  ProfileRecord record;
  RenderResult r = ParseProfileRecord(doc, &record);
  ASSERT_TRUE(r.ok) << r.detail;
  ASSERT_TRUE(record.extension.history.has_value());
  const HistorySummary& h = *record.extension.history;
  EXPECT_EQ(h.total_items, 812);
  EXPECT_EQ(h.unique_domains, 97);
  EXPECT_EQ(h.interests, (std::vector<std::string>{"Cooking", "Travel"}));
  ASSERT_TRUE(h.patterns.has_value());
  EXPECT_EQ(h.patterns->peak_hour, "22:00");
  EXPECT_TRUE(h.patterns->weekend_warrior);
  EXPECT_FALSE(h.patterns->workaholic);
  ASSERT_TRUE(record.extension.bookmark_count.has_value());
  EXPECT_EQ(*record.extension.bookmark_count, 214);
  // No cookie report: the cookie blocks stay out.
  EXPECT_FALSE(record.extension.cookies.has_value());
}

}  // namespace
}  // namespace dossier::profile
