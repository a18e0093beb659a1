// Repository: Dossier-render
// Component: Network Painter
// Purpose: Draws the procedural world (rings, connections, nodes, particles,
//          labels) at a given visibility.
// Copyright (c) 2025 Dossier

#include "dossier/render/NetworkPainter.hpp"

#include <cmath>

#include "dossier/util/Easing.hpp"

namespace dossier::render {

namespace {

constexpr double kTwoPi = 6.283185307179586;
constexpr int kRingTicks = 36;
constexpr double kLabelPx = 11.0;

}  // namespace

void PaintNetwork(const PaintContext& ctx, double visibility, double label_alpha,
                  const std::vector<Point2>* positions) {
  if (visibility <= 0.0 && label_alpha <= 0.0) return;
  Canvas& canvas = *ctx.canvas;
  const world::ProceduralWorld& world = *ctx.world;
  const auto& nodes = world.nodes();
  const double cx = world.cx();
  const double cy = world.cy();
  const double t = ctx.seconds;

  auto pos = [&](size_t i) {
    if (positions != nullptr && i < positions->size()) return (*positions)[i];
    return Point2{nodes[i].x, nodes[i].y};
  };

  // Ring guides with rotating ticks.
  for (const auto& ring : world.rings()) {
    const double a = 0.04 * visibility;
    canvas.StrokeCircle(cx, cy, ring.radius, ring.width, kWhite, a);
    for (int i = 0; i < kRingTicks; ++i) {
      const double ang = static_cast<double>(i) / kRingTicks * kTwoPi + t * ring.speed * 10.0;
      const double ix = cx + std::cos(ang) * ring.radius;
      const double iy = cy + std::sin(ang) * ring.radius;
      canvas.FillRect(ix - 0.5, iy - 0.5, 1.0, 1.0, kWhite, a * 1.5);
    }
  }

  // Connections with a traveling pulse.
  for (const auto& conn : world.connections()) {
    const Point2 na = pos(conn.a);
    const Point2 nb = pos(conn.b);
    const double dx = na.x - nb.x;
    const double dy = na.y - nb.y;
    const double d = std::sqrt(dx * dx + dy * dy);
    const double alpha = (1.0 - d / world::WorldConstants::kConnectDistance) * 0.12 * visibility;
    if (alpha <= 0.0) continue;
    canvas.StrokeLine(na.x, na.y, nb.x, nb.y, 0.5, kWhite, alpha);

    const double pulse = std::fmod(t * 0.5 + conn.dist * 0.001, 1.0);
    canvas.FillCircle(util::Lerp(na.x, nb.x, pulse), util::Lerp(na.y, nb.y, pulse), 1.0,
                      kWhite, alpha * 3.0);
  }

  for (size_t i = 0; i < nodes.size(); ++i) {
    const world::WorldNode& n = nodes[i];
    const Point2 p = pos(i);
    const double a = (n.bits > 0 ? 0.7 : 0.15) * visibility;
    if (n.bits > 0) canvas.FillRadialGlow(p.x, p.y, n.r * 8.0, kWhite, a * 0.15);
    canvas.FillCircle(p.x, p.y, n.r * visibility, kWhite, a);

    if (n.bits > 2 && visibility > 0.5) {
      const double s = n.r * 2.5;
      const double da = a * 0.3;
      canvas.StrokeLine(p.x, p.y - s, p.x + s, p.y, 0.5, kWhite, da);
      canvas.StrokeLine(p.x + s, p.y, p.x, p.y + s, 0.5, kWhite, da);
      canvas.StrokeLine(p.x, p.y + s, p.x - s, p.y, 0.5, kWhite, da);
      canvas.StrokeLine(p.x - s, p.y, p.x, p.y - s, 0.5, kWhite, da);
    }
  }

  for (const auto& part : world.particles()) {
    const double a = (0.5 + 0.5 * std::sin(part.life * 4.0)) * 0.15 * visibility;
    canvas.FillCircle(part.x, part.y, part.r, kWhite, a);
  }

  if (label_alpha > 0.0 && ctx.text != nullptr) {
    for (size_t i = 1; i < nodes.size(); ++i) {
      const world::WorldNode& n = nodes[i];
      if (n.label.empty()) continue;
      const Point2 p = pos(i);
      ctx.text->DrawText(&canvas, FontFace::kMono, kLabelPx, n.label, p.x, p.y + n.r + 14.0,
                         TextAlign::kCenter, kWhite, label_alpha * 0.4);
    }
  }
}

}  // namespace dossier::render
