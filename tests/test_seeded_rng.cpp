// Repository: Dossier-render
// Component: Seeded RNG Tests
// Purpose: Park-Miller sequence, seed normalization and visitor-ID seeding.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include "dossier/timeline/SeededRng.hpp"

namespace dossier::timeline {
namespace {

TEST(SeededRngTest, FirstDrawMatchesMinimalStandard) {
  SeededRng rng(1);
  const double v = rng.Next();
  EXPECT_EQ(rng.state(), 16807);
  EXPECT_DOUBLE_EQ(v, 16806.0 / 2147483646.0);
  rng.Next();
  EXPECT_EQ(rng.state(), 282475249);
}

TEST(SeededRngTest, SameSeedSameSequence) {
  SeededRng a(987654);
  SeededRng b(987654);
  for (int i = 0; i < 1000; ++i) {
    ASSERT_EQ(a.Next(), b.Next()) << "draw " << i;
  }
}

TEST(SeededRngTest, DrawsStayInUnitInterval) {
  SeededRng rng(123);
  for (int i = 0; i < 10000; ++i) {
    const double v = rng.Next();
    ASSERT_GE(v, 0.0);
    ASSERT_LT(v, 1.0);
  }
}

TEST(SeededRngTest, ZeroSeedFallsBackToDefault) {
  SeededRng zero(0);
  SeededRng modulus(SeededRng::kModulus);
  SeededRng fallback(SeededRng::kDefaultSeed);
  EXPECT_EQ(zero.state(), SeededRng::kDefaultSeed);
  EXPECT_EQ(modulus.state(), SeededRng::kDefaultSeed);
  EXPECT_EQ(zero.Next(), fallback.Next());
}

TEST(SeededRngTest, NegativeSeedIsNormalized) {
  SeededRng rng(-5);
  EXPECT_EQ(rng.state(), SeededRng::kModulus - 5);
}

TEST(SeededRngTest, SeedFromVisitorIdSumsBytes) {
  EXPECT_EQ(SeedFromVisitorId(""), 1);
  EXPECT_EQ(SeedFromVisitorId("A"), 1 + 65);
  EXPECT_EQ(SeedFromVisitorId("ab"), 1 + 97 + 98);
  EXPECT_EQ(SeedFromVisitorId("ba"), SeedFromVisitorId("ab"));
}

}  // namespace
}  // namespace dossier::timeline
