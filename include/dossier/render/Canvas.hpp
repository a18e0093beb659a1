// Repository: Dossier-render
// Component: Canvas
// Purpose: Anti-aliased source-over drawing into a FrameBuffer.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_RENDER_CANVAS_HPP_
#define DOSSIER_RENDER_CANVAS_HPP_

#include <cstdint>
#include <vector>

#include "dossier/render/FrameBuffer.hpp"

namespace dossier::render {

struct Rgb {
  uint8_t r = 255;
  uint8_t g = 255;
  uint8_t b = 255;

  static constexpr Rgb Gray(uint8_t v) { return Rgb{v, v, v}; }
};

constexpr Rgb kWhite{255, 255, 255};
constexpr Rgb kBlack{0, 0, 0};

// Every draw call takes a straight (non-premultiplied) color plus an alpha;
// the effective alpha is alpha * global_alpha * coverage. Geometry is in
// pixel space with (0, 0) at the top-left corner of the first pixel, so a
// pixel's center is (x + 0.5, y + 0.5).
//
// Strokes narrower than one pixel are drawn one pixel wide at reduced
// intensity. Line and arc ends are butt caps.
class Canvas {
 public:
  explicit Canvas(FrameBuffer* buffer);

  FrameBuffer* buffer() { return buffer_; }
  int width() const { return buffer_->width(); }
  int height() const { return buffer_->height(); }

  void SetGlobalAlpha(double alpha);
  double global_alpha() const { return global_alpha_; }

  void Clear(Rgb color);

  // Blends one pixel; `alpha` is multiplied by the global alpha. Out-of-range
  // coordinates are ignored.
  void BlendPixel(int x, int y, Rgb color, double alpha);

  void FillRect(double x, double y, double w, double h, Rgb color, double alpha);
  void FillCircle(double cx, double cy, double radius, Rgb color, double alpha);

  // Linear radial fall-off from `alpha` at the center to 0 at `radius`.
  void FillRadialGlow(double cx, double cy, double radius, Rgb color, double alpha);

  void StrokeLine(double x0, double y0, double x1, double y1, double width, Rgb color,
                  double alpha);

  // Dash pattern restarts at (x0, y0).
  void StrokeDashedLine(double x0, double y0, double x1, double y1, double dash, double gap,
                        double width, Rgb color, double alpha);

  void StrokeCircle(double cx, double cy, double radius, double width, Rgb color,
                    double alpha);

  // Clockwise (screen space) from start_rad to end_rad.
  void StrokeArc(double cx, double cy, double radius, double start_rad, double end_rad,
                 double width, Rgb color, double alpha);

  // Darkens each pixel by mask[y * width + x]. The mask must match the
  // buffer geometry; anything else is ignored.
  void ApplyMask(const std::vector<float>& mask, Rgb color);

 private:
  void Annulus(double cx, double cy, double radius, double width, Rgb color, double alpha,
               bool limit_angle, double start_rad, double sweep_rad);

  FrameBuffer* buffer_;
  double global_alpha_ = 1.0;
};

// Radial darkening mask: 0 inside inner_radius, rising linearly to max_alpha
// at outer_radius and beyond, centered on the frame.
std::vector<float> BuildVignetteMask(int width, int height, double inner_radius,
                                     double outer_radius, double max_alpha);

}  // namespace dossier::render

#endif  // DOSSIER_RENDER_CANVAS_HPP_
