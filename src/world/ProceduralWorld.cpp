// Repository: Dossier-render
// Component: Procedural World
// Purpose: Seeded node / connection / ring / particle graph.
// Copyright (c) 2025 Dossier

#include "dossier/world/ProceduralWorld.hpp"

#include <algorithm>
#include <cmath>

#include "dossier/timeline/SeededRng.hpp"
#include "dossier/util/Logger.hpp"

namespace dossier::world {

namespace {
constexpr double kTwoPi = 6.283185307179586;
}  // namespace

ProceduralWorld ProceduralWorld::Generate(const profile::ProfileRecord& record, int64_t seed,
                                          int width, int height) {
  const profile::EntropyReport& entropy = record.entropy;
  ProceduralWorld w(width, height);
  timeline::SeededRng rng(seed);
  const double cx = w.cx();
  const double cy = w.cy();

  const auto contribs = entropy.Present();
  double max_bits = 1.0;
  for (const auto& c : contribs) max_bits = std::max(max_bits, c.bits);

  WorldNode center;
  center.x = cx;
  center.y = cy;
  center.r = 6.0;
  center.bits = entropy.total_bits;
  center.center = true;
  w.nodes_.push_back(center);

  // Data nodes in orbital layers of four (then 5, 6, ...), each layer offset
  // half a slot and 0.4 rad from the previous one.
  const auto n = static_cast<int64_t>(contribs.size());
  for (int64_t i = 0; i < n; ++i) {
    const auto& c = contribs[static_cast<size_t>(i)];
    const int64_t layer = i / 4;
    const double slot = static_cast<double>(i % 4) + (layer > 0 ? 0.5 : 0.0);
    const int64_t count = std::min<int64_t>(4 + layer, n - layer * 4);
    const double angle = slot / static_cast<double>(std::max<int64_t>(count, 4)) * kTwoPi +
                         static_cast<double>(layer) * 0.4;
    const double dist = 140.0 + static_cast<double>(layer) * 130.0 + c.bits / max_bits * 60.0;

    WorldNode node;
    node.x = cx + std::cos(angle) * dist;
    node.y = cy + std::sin(angle) * dist;
    node.r = 2.0 + c.bits / max_bits * 5.0;
    node.bits = c.bits;
    node.label = c.label;
    node.orbit = dist;
    node.angle = angle;
    node.speed = 0.002 + rng.Next() * 0.004;
    w.nodes_.push_back(node);
  }

  for (int i = 0; i < WorldConstants::kAmbientNodes; ++i) {
    const double angle = rng.Next() * kTwoPi;
    const double dist = 80.0 + rng.Next() * 420.0;
    WorldNode node;
    node.x = cx + std::cos(angle) * dist;
    node.y = cy + std::sin(angle) * dist;
    node.r = 0.5 + rng.Next() * 1.5;
    node.orbit = dist;
    node.angle = angle;
    node.speed = 0.001 + rng.Next() * 0.005;
    w.nodes_.push_back(node);
  }

  // The rng is consulted only for in-range pairs where neither end carries
  // data, so the draw count depends on the layout.
  for (size_t i = 0; i < w.nodes_.size(); ++i) {
    for (size_t j = i + 1; j < w.nodes_.size(); ++j) {
      const double dx = w.nodes_[i].x - w.nodes_[j].x;
      const double dy = w.nodes_[i].y - w.nodes_[j].y;
      const double d = std::sqrt(dx * dx + dy * dy);
      if (d >= WorldConstants::kConnectDistance) continue;
      if (w.nodes_[i].bits > 0 || w.nodes_[j].bits > 0 || rng.Next() > 0.7) {
        w.connections_.push_back(Connection{i, j, d});
      }
    }
  }

  w.rings_.push_back(Ring{140.0, 0.5, 0.003});
  w.rings_.push_back(Ring{270.0, 0.3, -0.002});
  w.rings_.push_back(Ring{400.0, 0.2, 0.001});

  for (int i = 0; i < WorldConstants::kParticles; ++i) {
    Particle p;
    p.x = rng.Next() * width;
    p.y = rng.Next() * height;
    p.vx = (rng.Next() - 0.5) * 0.5;
    p.vy = (rng.Next() - 0.5) * 0.5;
    p.r = 0.5 + rng.Next() * 1.5;
    p.life = rng.Next();
    w.particles_.push_back(p);
  }

  util::Logger::Debug("[ProceduralWorld] seed=" + std::to_string(seed) +
                      " nodes=" + std::to_string(w.nodes_.size()) +
                      " connections=" + std::to_string(w.connections_.size()));
  return w;
}

void ProceduralWorld::Advance() {
  const double cx = this->cx();
  const double cy = this->cy();
  for (size_t i = 1; i < nodes_.size(); ++i) {
    WorldNode& node = nodes_[i];
    node.angle += node.speed;
    node.x = cx + std::cos(node.angle) * node.orbit;
    node.y = cy + std::sin(node.angle) * node.orbit;
  }
  const double w = static_cast<double>(width_);
  const double h = static_cast<double>(height_);
  for (auto& p : particles_) {
    p.x += p.vx;
    p.y += p.vy;
    p.life += WorldConstants::kParticleLifeStep;
    if (p.x < 0) p.x = w;
    if (p.x > w) p.x = 0;
    if (p.y < 0) p.y = h;
    if (p.y > h) p.y = 0;
  }
  ++advances_;
}

}  // namespace dossier::world
