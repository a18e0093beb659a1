// Repository: Dossier-render
// Component: Network Painter
// Purpose: Draws the procedural world (rings, connections, nodes, particles,
//          labels) at a given visibility.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_RENDER_NETWORK_PAINTER_HPP_
#define DOSSIER_RENDER_NETWORK_PAINTER_HPP_

#include <vector>

#include "dossier/render/Canvas.hpp"
#include "dossier/render/TextRenderer.hpp"
#include "dossier/world/ProceduralWorld.hpp"

namespace dossier::render {

// Everything a painter needs for one frame. Pointers are borrowed.
struct PaintContext {
  Canvas* canvas = nullptr;
  TextRenderer* text = nullptr;
  const world::ProceduralWorld* world = nullptr;
  double fps = 30.0;
  double seconds = 0.0;  // global frame / fps; drives ring ticks and pulses
};

struct Point2 {
  double x = 0.0;
  double y = 0.0;
};

// `positions`, when given, replaces the node positions (one per node) for
// this draw only; connection alpha follows the replaced positions.
void PaintNetwork(const PaintContext& ctx, double visibility, double label_alpha,
                  const std::vector<Point2>* positions = nullptr);

}  // namespace dossier::render

#endif  // DOSSIER_RENDER_NETWORK_PAINTER_HPP_
