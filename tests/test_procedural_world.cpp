// Repository: Dossier-render
// Component: Procedural World Tests
// Purpose: Seeded generation and per-frame motion.
// Copyright (c) 2025 Dossier

#include <gtest/gtest.h>

#include "TestPaths.hpp"
#include "dossier/profile/ProfileLoader.hpp"
#include "dossier/world/ProceduralWorld.hpp"

namespace dossier::world {
namespace {

profile::ProfileRecord LoadFull() {
  profile::ProfileRecord record;
  RenderResult r = profile::LoadProfileRecord(test::FixturePath("profile_full.json"), &record);
  EXPECT_TRUE(r.ok) << r.detail;
  return record;
}

void ExpectSameNodes(const ProceduralWorld& a, const ProceduralWorld& b) {
  ASSERT_EQ(a.nodes().size(), b.nodes().size());
  for (size_t i = 0; i < a.nodes().size(); ++i) {
    EXPECT_DOUBLE_EQ(a.nodes()[i].x, b.nodes()[i].x) << "node " << i;
    EXPECT_DOUBLE_EQ(a.nodes()[i].y, b.nodes()[i].y) << "node " << i;
    EXPECT_DOUBLE_EQ(a.nodes()[i].speed, b.nodes()[i].speed) << "node " << i;
  }
}

TEST(ProceduralWorldTest, Layout) {
  const ProceduralWorld w = ProceduralWorld::Generate(LoadFull(), 1234, 1920, 1080);

  // Center, six present contributions, ambient nodes.
  ASSERT_EQ(w.nodes().size(), 1u + 6u + WorldConstants::kAmbientNodes);
  EXPECT_TRUE(w.nodes()[0].center);
  EXPECT_DOUBLE_EQ(w.nodes()[0].x, 960.0);
  EXPECT_DOUBLE_EQ(w.nodes()[0].y, 540.0);
  EXPECT_DOUBLE_EQ(w.nodes()[0].bits, 34.2);
  EXPECT_EQ(w.nodes()[1].label, "User Agent");
  EXPECT_EQ(w.nodes()[6].label, "Fonts");
  EXPECT_TRUE(w.nodes()[7].label.empty());

  EXPECT_EQ(w.rings().size(), 3u);
  EXPECT_EQ(w.particles().size(), static_cast<size_t>(WorldConstants::kParticles));
  for (const auto& c : w.connections()) {
    EXPECT_LT(c.a, c.b);
    EXPECT_LT(c.dist, WorldConstants::kConnectDistance);
  }
}

TEST(ProceduralWorldTest, SameSeedSameWorld) {
  const profile::ProfileRecord record = LoadFull();
  const ProceduralWorld a = ProceduralWorld::Generate(record, 99, 1280, 720);
  const ProceduralWorld b = ProceduralWorld::Generate(record, 99, 1280, 720);
  ExpectSameNodes(a, b);
  EXPECT_EQ(a.connections().size(), b.connections().size());
}

TEST(ProceduralWorldTest, DifferentSeedDifferentWorld) {
  const profile::ProfileRecord record = LoadFull();
  const ProceduralWorld a = ProceduralWorld::Generate(record, 1, 1280, 720);
  const ProceduralWorld b = ProceduralWorld::Generate(record, 2, 1280, 720);
  EXPECT_NE(a.nodes()[1].speed, b.nodes()[1].speed);
}

TEST(ProceduralWorldTest, AdvanceOrbitsAndWraps) {
  ProceduralWorld w = ProceduralWorld::Generate(LoadFull(), 7, 640, 360);
  const WorldNode before = w.nodes()[1];

  for (int i = 0; i < 500; ++i) w.Advance();
  EXPECT_EQ(w.advances(), 500);

  const WorldNode& center = w.nodes()[0];
  EXPECT_DOUBLE_EQ(center.x, 320.0);
  EXPECT_DOUBLE_EQ(center.y, 180.0);

  const WorldNode& after = w.nodes()[1];
  EXPECT_NEAR(after.angle, before.angle + 500 * before.speed, 1e-9);
  EXPECT_DOUBLE_EQ(after.orbit, before.orbit);

  for (const auto& p : w.particles()) {
    EXPECT_GE(p.x, 0.0);
    EXPECT_LE(p.x, 640.0);
    EXPECT_GE(p.y, 0.0);
    EXPECT_LE(p.y, 360.0);
  }
}

TEST(ProceduralWorldTest, AdvancingTwoCopiesInLockstep) {
  const profile::ProfileRecord record = LoadFull();
  ProceduralWorld a = ProceduralWorld::Generate(record, 5, 640, 360);
  ProceduralWorld b = ProceduralWorld::Generate(record, 5, 640, 360);
  for (int i = 0; i < 30; ++i) {
    a.Advance();
    b.Advance();
  }
  ExpectSameNodes(a, b);
}

}  // namespace
}  // namespace dossier::world
