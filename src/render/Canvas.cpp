// Repository: Dossier-render
// Component: Canvas
// Purpose: Anti-aliased source-over drawing into a FrameBuffer.
// Copyright (c) 2025 Dossier

#include "dossier/render/Canvas.hpp"

#include <algorithm>
#include <cmath>

#include "dossier/util/Easing.hpp"

namespace dossier::render {

namespace {

constexpr double kTwoPi = 6.283185307179586;

inline uint8_t Mix(uint8_t dst, uint8_t src, double a) {
  const double v = dst + (static_cast<double>(src) - dst) * a;
  return static_cast<uint8_t>(util::Clamp(v + 0.5, 0.0, 255.0));
}

// Overlap of pixel [p, p + 1) with [lo, hi).
inline double SpanCoverage(int p, double lo, double hi) {
  return util::Clamp01(std::min(hi, p + 1.0) - std::max(lo, static_cast<double>(p)));
}

}  // namespace

Canvas::Canvas(FrameBuffer* buffer) : buffer_(buffer) {}

void Canvas::SetGlobalAlpha(double alpha) { global_alpha_ = util::Clamp01(alpha); }

void Canvas::Clear(Rgb color) { buffer_->Clear(color.r, color.g, color.b); }

void Canvas::BlendPixel(int x, int y, Rgb color, double alpha) {
  if (x < 0 || y < 0 || x >= width() || y >= height()) return;
  const double a = util::Clamp01(alpha * global_alpha_);
  if (a <= 0.0) return;
  uint8_t* p = buffer_->PixelAt(x, y);
  p[0] = Mix(p[0], color.r, a);
  p[1] = Mix(p[1], color.g, a);
  p[2] = Mix(p[2], color.b, a);
  p[3] = 255;
}

// =============================================================================
// Fills
// =============================================================================

void Canvas::FillRect(double x, double y, double w, double h, Rgb color, double alpha) {
  if (w <= 0.0 || h <= 0.0 || alpha <= 0.0) return;
  const double x1 = x + w;
  const double y1 = y + h;
  const int px0 = std::max(0, static_cast<int>(std::floor(x)));
  const int py0 = std::max(0, static_cast<int>(std::floor(y)));
  const int px1 = std::min(width() - 1, static_cast<int>(std::ceil(x1)) - 1);
  const int py1 = std::min(height() - 1, static_cast<int>(std::ceil(y1)) - 1);
  for (int py = py0; py <= py1; ++py) {
    const double cy = SpanCoverage(py, y, y1);
    for (int px = px0; px <= px1; ++px) {
      BlendPixel(px, py, color, alpha * cy * SpanCoverage(px, x, x1));
    }
  }
}

void Canvas::FillCircle(double cx, double cy, double radius, Rgb color, double alpha) {
  if (radius <= 0.0 || alpha <= 0.0) return;
  // Sub-pixel dots keep their area instead of vanishing.
  const double intensity = std::min(1.0, radius * 2.0);
  const double r = std::max(radius, 0.5);
  const int px0 = std::max(0, static_cast<int>(std::floor(cx - r - 1)));
  const int py0 = std::max(0, static_cast<int>(std::floor(cy - r - 1)));
  const int px1 = std::min(width() - 1, static_cast<int>(std::ceil(cx + r + 1)));
  const int py1 = std::min(height() - 1, static_cast<int>(std::ceil(cy + r + 1)));
  for (int py = py0; py <= py1; ++py) {
    const double dy = py + 0.5 - cy;
    for (int px = px0; px <= px1; ++px) {
      const double dx = px + 0.5 - cx;
      const double cov = util::Clamp01(r + 0.5 - std::sqrt(dx * dx + dy * dy));
      if (cov > 0.0) BlendPixel(px, py, color, alpha * cov * intensity);
    }
  }
}

void Canvas::FillRadialGlow(double cx, double cy, double radius, Rgb color, double alpha) {
  if (radius <= 0.0 || alpha <= 0.0) return;
  const int px0 = std::max(0, static_cast<int>(std::floor(cx - radius)));
  const int py0 = std::max(0, static_cast<int>(std::floor(cy - radius)));
  const int px1 = std::min(width() - 1, static_cast<int>(std::ceil(cx + radius)));
  const int py1 = std::min(height() - 1, static_cast<int>(std::ceil(cy + radius)));
  for (int py = py0; py <= py1; ++py) {
    const double dy = py + 0.5 - cy;
    for (int px = px0; px <= px1; ++px) {
      const double dx = px + 0.5 - cx;
      const double d = std::sqrt(dx * dx + dy * dy);
      if (d < radius) BlendPixel(px, py, color, alpha * (1.0 - d / radius));
    }
  }
}

// =============================================================================
// Strokes
// =============================================================================

void Canvas::StrokeLine(double x0, double y0, double x1, double y1, double width, Rgb color,
                        double alpha) {
  if (alpha <= 0.0 || width <= 0.0) return;
  const double dx = x1 - x0;
  const double dy = y1 - y0;
  const double len = std::sqrt(dx * dx + dy * dy);
  if (len < 1e-9) return;
  const double ux = dx / len;
  const double uy = dy / len;
  const double hw = std::max(width, 1.0) / 2.0;
  const double intensity = std::min(width, 1.0);
  const double reach = hw + 1.0;

  auto cover = [&](int px, int py) {
    const double qx = px + 0.5 - x0;
    const double qy = py + 0.5 - y0;
    const double along = qx * ux + qy * uy;
    const double perp = std::fabs(qx * uy - qy * ux);
    const double cov = util::Clamp01(hw + 0.5 - perp) * util::Clamp01(along + 0.5) *
                       util::Clamp01(len - along + 0.5);
    if (cov > 0.0) BlendPixel(px, py, color, alpha * cov * intensity);
  };

  // Walk the major axis; the minor span covers the perpendicular reach.
  if (std::fabs(dx) >= std::fabs(dy)) {
    const double slope = dy / dx;
    const double ext = reach * len / std::fabs(dx);
    const int xa = std::max(0, static_cast<int>(std::floor(std::min(x0, x1) - reach)));
    const int xb = std::min(this->width() - 1, static_cast<int>(std::ceil(std::max(x0, x1) + reach)));
    for (int px = xa; px <= xb; ++px) {
      const double yc = y0 + (px + 0.5 - x0) * slope;
      const int ya = std::max(0, static_cast<int>(std::floor(yc - ext)));
      const int yb = std::min(height() - 1, static_cast<int>(std::ceil(yc + ext)));
      for (int py = ya; py <= yb; ++py) cover(px, py);
    }
  } else {
    const double slope = dx / dy;
    const double ext = reach * len / std::fabs(dy);
    const int ya = std::max(0, static_cast<int>(std::floor(std::min(y0, y1) - reach)));
    const int yb = std::min(height() - 1, static_cast<int>(std::ceil(std::max(y0, y1) + reach)));
    for (int py = ya; py <= yb; ++py) {
      const double xc = x0 + (py + 0.5 - y0) * slope;
      const int xa = std::max(0, static_cast<int>(std::floor(xc - ext)));
      const int xb = std::min(this->width() - 1, static_cast<int>(std::ceil(xc + ext)));
      for (int px = xa; px <= xb; ++px) cover(px, py);
    }
  }
}

void Canvas::StrokeDashedLine(double x0, double y0, double x1, double y1, double dash,
                              double gap, double width, Rgb color, double alpha) {
  const double dx = x1 - x0;
  const double dy = y1 - y0;
  const double len = std::sqrt(dx * dx + dy * dy);
  if (len < 1e-9 || dash <= 0.0) return;
  const double period = dash + std::max(gap, 0.0);
  for (double s = 0.0; s < len; s += period) {
    const double e = std::min(s + dash, len);
    StrokeLine(x0 + dx * s / len, y0 + dy * s / len, x0 + dx * e / len, y0 + dy * e / len,
               width, color, alpha);
  }
}

void Canvas::StrokeCircle(double cx, double cy, double radius, double width, Rgb color,
                          double alpha) {
  Annulus(cx, cy, radius, width, color, alpha, false, 0.0, kTwoPi);
}

void Canvas::StrokeArc(double cx, double cy, double radius, double start_rad, double end_rad,
                       double width, Rgb color, double alpha) {
  const double sweep = end_rad - start_rad;
  if (sweep <= 0.0) return;
  Annulus(cx, cy, radius, width, color, alpha, sweep < kTwoPi, start_rad, sweep);
}

void Canvas::Annulus(double cx, double cy, double radius, double width, Rgb color,
                     double alpha, bool limit_angle, double start_rad, double sweep_rad) {
  if (radius <= 0.0 || width <= 0.0 || alpha <= 0.0) return;
  const double hw = std::max(width, 1.0) / 2.0;
  const double intensity = std::min(width, 1.0);
  const double ro = radius + hw + 1.0;
  const double ri = radius - hw - 1.0;

  auto cover = [&](int px, int py, double dy) {
    const double dx = px + 0.5 - cx;
    const double d = std::sqrt(dx * dx + dy * dy);
    const double cov = util::Clamp01(hw + 0.5 - std::fabs(d - radius));
    if (cov <= 0.0) return;
    if (limit_angle) {
      double rel = std::fmod(std::atan2(dy, dx) - start_rad, kTwoPi);
      if (rel < 0.0) rel += kTwoPi;
      if (rel > sweep_rad) return;
    }
    BlendPixel(px, py, color, alpha * cov * intensity);
  };
  auto span = [&](double xa, double xb, int py, double dy) {
    const int a = std::max(0, static_cast<int>(std::floor(xa)));
    const int b = std::min(this->width() - 1, static_cast<int>(std::ceil(xb)));
    for (int px = a; px <= b; ++px) cover(px, py, dy);
  };

  const int py0 = std::max(0, static_cast<int>(std::floor(cy - ro)));
  const int py1 = std::min(height() - 1, static_cast<int>(std::ceil(cy + ro)));
  for (int py = py0; py <= py1; ++py) {
    const double dy = py + 0.5 - cy;
    const double dy2 = dy * dy;
    if (dy2 > ro * ro) continue;
    const double xo = std::sqrt(ro * ro - dy2);
    if (ri > 0.0 && ri * ri > dy2) {
      const double xi = std::sqrt(ri * ri - dy2);
      span(cx - xo, cx - xi, py, dy);
      span(cx + xi, cx + xo, py, dy);
    } else {
      span(cx - xo, cx + xo, py, dy);
    }
  }
}

// =============================================================================
// Masks
// =============================================================================

void Canvas::ApplyMask(const std::vector<float>& mask, Rgb color) {
  const size_t count = static_cast<size_t>(width()) * static_cast<size_t>(height());
  if (mask.size() != count) return;
  uint8_t* p = buffer_->data();
  for (size_t i = 0; i < count; ++i, p += 4) {
    const double a = mask[i];
    if (a <= 0.0) continue;
    p[0] = Mix(p[0], color.r, a);
    p[1] = Mix(p[1], color.g, a);
    p[2] = Mix(p[2], color.b, a);
  }
}

std::vector<float> BuildVignetteMask(int width, int height, double inner_radius,
                                     double outer_radius, double max_alpha) {
  std::vector<float> mask(static_cast<size_t>(std::max(width, 0)) *
                              static_cast<size_t>(std::max(height, 0)),
                          0.0f);
  const double cx = width / 2.0;
  const double cy = height / 2.0;
  const double range = std::max(outer_radius - inner_radius, 1e-9);
  for (int y = 0; y < height; ++y) {
    const double dy = y + 0.5 - cy;
    for (int x = 0; x < width; ++x) {
      const double dx = x + 0.5 - cx;
      const double t = util::Clamp01((std::sqrt(dx * dx + dy * dy) - inner_radius) / range);
      mask[static_cast<size_t>(y) * width + x] = static_cast<float>(t * max_alpha);
    }
  }
  return mask;
}

}  // namespace dossier::render
