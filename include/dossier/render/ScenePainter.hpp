// Repository: Dossier-render
// Component: Scene Painter
// Purpose: Per-scene drawing for the full-frame scene blocks; used as the
//          std::visit visitor over timeline::Scene.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_RENDER_SCENE_PAINTER_HPP_
#define DOSSIER_RENDER_SCENE_PAINTER_HPP_

#include <cstdint>
#include <string>

#include "dossier/render/NetworkPainter.hpp"
#include "dossier/timeline/Scene.hpp"

namespace dossier::render {

// `local_frame` is the frame index inside the scene block. Each scene paints
// its own network pass, so the caller only clears the background first.
class ScenePainter {
 public:
  ScenePainter(const PaintContext& ctx, int64_t local_frame);

  void operator()(const timeline::EmergenceScene& scene) const;
  void operator()(const timeline::IdentityScene& scene) const;
  void operator()(const timeline::EntropyConstellationScene& scene) const;
  void operator()(const timeline::ValuationScene& scene) const;
  void operator()(const timeline::DataRainScene& scene) const;
  void operator()(const timeline::OutroScene& scene) const;

 private:
  // Text over a 60% black backdrop sized to the measured width.
  void TextGlow(const std::string& text, double x, double y, double px, Rgb color,
                TextAlign align) const;

  // Expanding circle: radius (t mod 1) * max_radius, alpha fading to 0.
  void Pulse(double t, double max_radius, double alpha) const;

  // Center crosshair with corner brackets.
  void Crosshair(double size, double alpha) const;

  void Label(const std::string& text, double x, double y, double px, Rgb color,
             TextAlign align, double alpha) const;

  const PaintContext& ctx_;
  double f_;
  double cx_;
  double cy_;
  double w_;
  double h_;
};

}  // namespace dossier::render

#endif  // DOSSIER_RENDER_SCENE_PAINTER_HPP_
