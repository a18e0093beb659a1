// Repository: Dossier-render
// Component: Procedural World
// Purpose: Seeded node / connection / ring / particle graph advanced once
//          per frame and painted as the backdrop.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_WORLD_PROCEDURAL_WORLD_HPP_
#define DOSSIER_WORLD_PROCEDURAL_WORLD_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dossier/profile/ProfileRecord.hpp"

namespace dossier::world {

struct WorldNode {
  double x = 0.0;
  double y = 0.0;
  double r = 0.0;
  double bits = 0.0;
  std::string label;
  double orbit = 0.0;
  double angle = 0.0;
  double speed = 0.0;
  bool center = false;
};

// Pair (a < b) chosen at generation time; `dist` is the distance then and
// only drives the pulse phase.
struct Connection {
  size_t a = 0;
  size_t b = 0;
  double dist = 0.0;
};

struct Ring {
  double radius = 0.0;
  double width = 0.0;
  double speed = 0.0;
};

struct Particle {
  double x = 0.0;
  double y = 0.0;
  double vx = 0.0;
  double vy = 0.0;
  double r = 0.0;
  double life = 0.0;
};

struct WorldConstants {
  static constexpr int kAmbientNodes = 30;
  static constexpr int kParticles = 60;
  static constexpr double kConnectDistance = 220.0;
  static constexpr double kParticleLifeStep = 0.003;
};

class ProceduralWorld {
 public:
  // Node 0 is the center; data nodes follow in present-contribution order,
  // then the ambient nodes. All randomness comes from one SeededRng(seed).
  static ProceduralWorld Generate(const profile::ProfileRecord& record, int64_t seed,
                                  int width, int height);

  // One frame of motion: orbital nodes advance by their speed, particles
  // drift, age and wrap at the frame bounds.
  void Advance();

  const std::vector<WorldNode>& nodes() const { return nodes_; }
  const std::vector<Connection>& connections() const { return connections_; }
  const std::vector<Ring>& rings() const { return rings_; }
  const std::vector<Particle>& particles() const { return particles_; }

  int width() const { return width_; }
  int height() const { return height_; }
  double cx() const { return width_ / 2.0; }
  double cy() const { return height_ / 2.0; }
  int64_t advances() const { return advances_; }

 private:
  ProceduralWorld(int width, int height) : width_(width), height_(height) {}

  int width_;
  int height_;
  int64_t advances_ = 0;
  std::vector<WorldNode> nodes_;
  std::vector<Connection> connections_;
  std::vector<Ring> rings_;
  std::vector<Particle> particles_;
};

}  // namespace dossier::world

#endif  // DOSSIER_WORLD_PROCEDURAL_WORLD_HPP_
