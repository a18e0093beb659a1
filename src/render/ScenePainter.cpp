// Repository: Dossier-render
// Component: Scene Painter
// Purpose: Per-scene drawing for the full-frame scene blocks; used as the
//          std::visit visitor over timeline::Scene.
// Copyright (c) 2025 Dossier

#include "dossier/render/ScenePainter.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "dossier/util/Easing.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier::render {

namespace {

constexpr double kPi = 3.141592653589793;
constexpr double kTwoPi = 2.0 * kPi;

// Identity panel geometry.
constexpr size_t kMaxIdentityRows = 14;
constexpr double kRowStartY = 135.0;
constexpr double kRowHeight = 56.0;
constexpr size_t kMaxValueChars = 45;
constexpr size_t kTruncatedValueChars = 42;
// Only the first data nodes (one per scene bar) get a leader line.
constexpr size_t kMaxLinkedNodes = 10;

constexpr size_t kMaxOrbitingFactors = 6;
constexpr double kOutroFrames = 120.0;

const Rgb kGray22 = Rgb::Gray(0x22);
const Rgb kGray44 = Rgb::Gray(0x44);
const Rgb kGray55 = Rgb::Gray(0x55);
const Rgb kGray66 = Rgb::Gray(0x66);
const Rgb kGray88 = Rgb::Gray(0x88);

// Restores the canvas global alpha on scope exit.
class GlobalAlphaScope {
 public:
  GlobalAlphaScope(Canvas* canvas, double alpha) : canvas_(canvas) {
    canvas_->SetGlobalAlpha(alpha);
  }
  ~GlobalAlphaScope() { canvas_->SetGlobalAlpha(1.0); }

  GlobalAlphaScope(const GlobalAlphaScope&) = delete;
  GlobalAlphaScope& operator=(const GlobalAlphaScope&) = delete;

 private:
  Canvas* canvas_;
};

}  // namespace

ScenePainter::ScenePainter(const PaintContext& ctx, int64_t local_frame)
    : ctx_(ctx),
      f_(static_cast<double>(local_frame)),
      cx_(ctx.world->cx()),
      cy_(ctx.world->cy()),
      w_(static_cast<double>(ctx.canvas->width())),
      h_(static_cast<double>(ctx.canvas->height())) {}

// =============================================================================
// Helpers
// =============================================================================

void ScenePainter::Label(const std::string& text, double x, double y, double px, Rgb color,
                         TextAlign align, double alpha) const {
  ctx_.text->DrawText(ctx_.canvas, FontFace::kMono, px, text, x, y, align, color, alpha);
}

void ScenePainter::TextGlow(const std::string& text, double x, double y, double px, Rgb color,
                            TextAlign align) const {
  const double w = ctx_.text->MeasureWidth(FontFace::kMono, px, text);
  const double bx = align == TextAlign::kCenter ? x - w / 2.0 - 12.0 : x - 12.0;
  ctx_.canvas->FillRect(bx, y - px - 2.0, w + 24.0, px + 12.0, kBlack, 0.6);
  Label(text, x, y, px, color, align, 1.0);
}

void ScenePainter::Pulse(double t, double max_radius, double alpha) const {
  const double phase = std::fmod(t, 1.0);
  const double r = phase * max_radius;
  if (r <= 0.0) return;
  ctx_.canvas->StrokeCircle(cx_, cy_, r, 0.5, kWhite, (1.0 - phase) * alpha);
}

void ScenePainter::Crosshair(double size, double alpha) const {
  if (size <= 0.0 || alpha <= 0.0) return;
  Canvas& c = *ctx_.canvas;
  const double x = cx_;
  const double y = cy_;
  c.StrokeLine(x - size, y, x - size * 0.3, y, 0.5, kWhite, alpha);
  c.StrokeLine(x + size * 0.3, y, x + size, y, 0.5, kWhite, alpha);
  c.StrokeLine(x, y - size, x, y - size * 0.3, 0.5, kWhite, alpha);
  c.StrokeLine(x, y + size * 0.3, x, y + size, 0.5, kWhite, alpha);

  // Corner brackets, 8 px legs.
  const double s = size * 0.7;
  const double corners[4][2] = {{-1, -1}, {1, -1}, {1, 1}, {-1, 1}};
  for (const auto& k : corners) {
    const double px = x + k[0] * s;
    const double py = y + k[1] * s;
    c.StrokeLine(px, py, px - k[0] * 8.0, py, 0.5, kWhite, alpha);
    c.StrokeLine(px, py, px, py - k[1] * 8.0, 0.5, kWhite, alpha);
  }
}

// =============================================================================
// Scenes
// =============================================================================

void ScenePainter::operator()(const timeline::EmergenceScene& scene) const {
  const double net = util::EaseOut(f_ / 60.0);
  PaintNetwork(ctx_, net, 0.0);

  Pulse(f_ / 60.0, 300.0, 0.1);
  if (f_ > 20) Pulse((f_ - 20.0) / 60.0, 200.0, 0.08);

  if (f_ > 25) {
    GlobalAlphaScope alpha(ctx_.canvas, util::EaseOut((f_ - 25.0) / 30.0));
    TextGlow(scene.title, cx_, cy_ - 8.0, 52.0, kWhite, TextAlign::kCenter);
  }
  if (f_ > 50) {
    GlobalAlphaScope alpha(ctx_.canvas, util::EaseOut((f_ - 50.0) / 25.0));
    Label(scene.subtitle, cx_, cy_ + 30.0, 14.0, kGray66, TextAlign::kCenter, 1.0);
  }

  Crosshair(60.0 * net, 0.15 * net);
}

void ScenePainter::operator()(const timeline::IdentityScene& scene) const {
  PaintNetwork(ctx_, 1.0, util::Clamp01(f_ / 60.0));
  Canvas& c = *ctx_.canvas;

  const double panel_x = w_ * 0.52;
  const double panel_w = w_ * 0.44;
  const double pa = util::EaseOut(f_ / 30.0);
  c.FillRect(panel_x - 20.0, 60.0, panel_w + 40.0, h_ - 120.0, kBlack, 0.7 * pa);
  c.FillRect(panel_x - 20.0, 60.0, 1.0, h_ - 120.0, kWhite, 0.08 * pa);

  if (f_ > 10) {
    const double ha = util::Clamp01((f_ - 10.0) / 15.0);
    GlobalAlphaScope alpha(&c, ha);
    Label("// IDENTITY PROFILE", panel_x, 95.0, 11.0, kGray55, TextAlign::kLeft, 1.0);
    c.FillRect(panel_x, 102.0, panel_w * ha, 1.0, kGray22, 1.0);
  }

  const size_t rows = std::min(scene.rows.size(), kMaxIdentityRows);
  for (size_t i = 0; i < rows; ++i) {
    const double rp = util::Clamp01((f_ - (20.0 + 9.0 * i)) / 18.0);
    if (rp <= 0.0) continue;
    const double y = kRowStartY + i * kRowHeight;
    GlobalAlphaScope alpha(&c, util::EaseOut(rp));

    const timeline::IdentityRow& row = scene.rows[i];
    Label(row.label, panel_x, y, 11.0, kGray44, TextAlign::kLeft, 1.0);
    const std::string value = util::Utf8Length(row.value) > kMaxValueChars
                                  ? util::Utf8Prefix(row.value, kTruncatedValueChars) + "..."
                                  : row.value;
    Label(value, panel_x, y + 20.0, 16.0, kWhite, TextAlign::kLeft, 1.0);
    c.FillRect(panel_x, y + 32.0, panel_w, 1.0, kWhite, 0.04);
  }

  // Leader lines from data nodes left of the panel to their matching row.
  if (f_ > 60) {
    const double line_alpha = util::Clamp01((f_ - 60.0) / 30.0) * 0.06;
    const auto& nodes = ctx_.world->nodes();
    const size_t limit = std::min(nodes.size(), kMaxLinkedNodes + 1);
    for (size_t i = 1; i < limit; ++i) {
      const world::WorldNode& n = nodes[i];
      if (n.label.empty() || n.x > panel_x - 30.0) continue;
      const std::string wanted = util::ToUpperAscii(n.label);
      auto it = std::find_if(scene.rows.begin(), scene.rows.end(),
                             [&](const timeline::IdentityRow& r) { return r.label == wanted; });
      if (it == scene.rows.end()) continue;
      const double ly = kRowStartY + static_cast<double>(it - scene.rows.begin()) * kRowHeight + 10.0;
      c.StrokeDashedLine(n.x, n.y, panel_x - 5.0, ly, 3.0, 6.0, 0.5, kWhite, line_alpha);
    }
  }
}

void ScenePainter::operator()(const timeline::EntropyConstellationScene& scene) const {
  PaintNetwork(ctx_, 0.4, 0.0);
  Canvas& c = *ctx_.canvas;

  const double count_up = util::EaseOut(f_ / 60.0);
  const std::string bits = util::FormatFixed(scene.total_bits * count_up, 1);
  const double max_bits = scene.max_bits > 0.0 ? scene.max_bits : 1.0;
  const double n = static_cast<double>(scene.bars.size());

  for (size_t i = 0; i < scene.bars.size(); ++i) {
    const double bp = util::EaseOut((f_ - 15.0 - 5.0 * i) / 40.0);
    if (bp <= 0.0) continue;
    const timeline::EntropyBar& bar = scene.bars[i];
    const double angle = static_cast<double>(i) / n * kTwoPi - kPi / 2.0;
    const double inner = 120.0;
    const double outer = inner + bar.bits / max_bits * 200.0 * bp;

    c.StrokeArc(cx_, cy_, (inner + outer) / 2.0, angle - 0.08, angle + 0.08, 12.0, kWhite,
                0.5 * bp);
    c.StrokeLine(cx_ + std::cos(angle) * outer, cy_ + std::sin(angle) * outer,
                 cx_ + std::cos(angle) * (outer + 50.0), cy_ + std::sin(angle) * (outer + 50.0),
                 0.5, kWhite, 0.15 * bp);

    if (bp > 0.5) {
      const double lx = cx_ + std::cos(angle) * (outer + 60.0);
      const double ly = cy_ + std::sin(angle) * (outer + 60.0);
      const bool left_side = angle > kPi / 2.0 && angle < kPi * 1.5;
      Label(bar.label + " " + util::FormatFixed(bar.bits, 1) + "b", lx, ly + 3.0, 10.0, kWhite,
            left_side ? TextAlign::kRight : TextAlign::kLeft, 0.35 * bp);
    }
  }

  c.StrokeCircle(cx_, cy_, 120.0, 0.5, kWhite, 0.08);
  TextGlow(bits + " BITS", cx_, cy_ - 5.0, 48.0, kWhite, TextAlign::kCenter);

  if (f_ > 30) {
    GlobalAlphaScope alpha(&c, util::Clamp01((f_ - 30.0) / 20.0));
    Label(util::FormatNumber(scene.uniqueness_percent) + "% UNIQUE  //  " +
              util::ToUpperAscii(scene.uniqueness_description),
          cx_, cy_ + 30.0, 13.0, kGray55, TextAlign::kCenter, 1.0);
  }

  const double scan = f_ / ctx_.fps * 0.8;
  c.StrokeLine(cx_, cy_, cx_ + std::cos(scan) * 500.0, cy_ + std::sin(scan) * 500.0, 1.0, kWhite,
               0.04);
}

void ScenePainter::operator()(const timeline::ValuationScene& scene) const {
  PaintNetwork(ctx_, 0.5, 0.0);
  Canvas& c = *ctx_.canvas;

  const double pp = util::EaseOut(f_ / 50.0);
  for (int k = 1; k <= 3; ++k) {
    c.StrokeCircle(cx_, cy_, 80.0 * k * pp, 0.5, kWhite, 0.05 / k);
  }

  TextGlow("$" + util::FormatFixed(scene.cpm * pp, 2), cx_, cy_ - 15.0, 72.0, kWhite,
           TextAlign::kCenter);
  {
    GlobalAlphaScope alpha(&c, pp);
    Label("ESTIMATED CPM / COST PER THOUSAND IMPRESSIONS", cx_, cy_ + 25.0, 12.0, kGray55,
          TextAlign::kCenter, 1.0);
  }

  const size_t count = std::min(scene.factors.size(), kMaxOrbitingFactors);
  for (size_t i = 0; i < count; ++i) {
    const double fp = util::EaseOut((f_ - 40.0 - 12.0 * i) / 25.0);
    if (fp <= 0.0) continue;
    const double angle = static_cast<double>(i) / count * kTwoPi - kPi / 2.0 +
                         f_ / ctx_.fps * 0.1;
    const double dist = 280.0 + 15.0 * i;
    const double fx = cx_ + std::cos(angle) * dist;
    const double fy = cy_ + std::sin(angle) * dist;

    GlobalAlphaScope alpha(&c, fp * 0.8);
    c.StrokeLine(cx_ + std::cos(angle) * 130.0, cy_ + std::sin(angle) * 130.0, fx, fy, 0.5,
                 kWhite, 0.04);
    Label(scene.factors[i].label, fx, fy - 8.0, 11.0, kGray88, TextAlign::kCenter, 1.0);
    Label(scene.factors[i].effect, fx, fy + 10.0, 14.0, kWhite, TextAlign::kCenter, 1.0);
    c.FillCircle(fx, fy - 20.0, 2.0, kWhite, fp * 0.5);
  }
}

void ScenePainter::operator()(const timeline::DataRainScene& scene) const {
  PaintNetwork(ctx_, 0.25, 0.0);
  Canvas& c = *ctx_.canvas;

  const double col_w = w_ / static_cast<double>(scene.columns.size() + 1);
  for (size_t i = 0; i < scene.columns.size(); ++i) {
    const double col = col_w * static_cast<double>(i + 1);
    const double delay = 4.0 * i;
    const double sp = util::Clamp01((f_ - delay) / 15.0);
    if (sp <= 0.0) continue;
    c.StrokeLine(col, 0.0, col, h_, 0.5, kWhite, 0.03 * sp);

    const std::vector<uint32_t> chars = util::DecodeUtf8(scene.columns[i]);
    const double len = static_cast<double>(chars.size());
    for (size_t k = 0; k < chars.size(); ++k) {
      const double cp = util::Clamp01((f_ - delay - 0.5 * k) / 30.0);
      if (cp <= 0.0) continue;
      const double y = 40.0 + 14.0 * k + (1.0 - cp) * 100.0;
      const double a = cp * 0.4 * (1.0 - static_cast<double>(k) / len * 0.5);
      Label(util::EncodeUtf8(chars[k]), col, y, 10.0, kWhite, TextAlign::kCenter, a);
    }
  }

  if (f_ > 30) {
    GlobalAlphaScope alpha(&c, util::EaseOut((f_ - 30.0) / 20.0));
    TextGlow(std::to_string(scene.signal_count) + " SIGNALS COLLECTED", cx_, cy_ - 10.0, 24.0,
             kWhite, TextAlign::kCenter);
    Label("EVERY DATA POINT ADDS TO YOUR UNIQUE FINGERPRINT", cx_, cy_ + 25.0, 12.0, kGray55,
          TextAlign::kCenter, 1.0);
  }
}

void ScenePainter::operator()(const timeline::OutroScene& scene) const {
  const double collapse = util::EaseInOut(f_ / 50.0);
  const double vis = std::min(util::EaseInOut(f_ / 30.0),
                              util::EaseInOut((kOutroFrames - f_) / 25.0));

  // Nodes pulled toward the center for this frame only.
  const auto& nodes = ctx_.world->nodes();
  std::vector<Point2> positions(nodes.size());
  for (size_t i = 0; i < nodes.size(); ++i) {
    positions[i] = Point2{nodes[i].x, nodes[i].y};
    if (i == 0) continue;
    positions[i].x = util::Lerp(nodes[i].x, cx_, collapse * 0.8);
    positions[i].y = util::Lerp(nodes[i].y, cy_, collapse * 0.8);
  }
  PaintNetwork(ctx_, (1.0 - collapse * 0.7) * vis, 0.0, &positions);

  if (collapse > 0.3) {
    Pulse((f_ - 15.0) / 40.0, 400.0, 0.08 * vis);
    Pulse((f_ - 25.0) / 50.0, 300.0, 0.06 * vis);
  }

  GlobalAlphaScope alpha(ctx_.canvas, vis);
  TextGlow(scene.headline, cx_, cy_ - 15.0, 48.0, kWhite, TextAlign::kCenter);
  if (f_ > 30) Label(scene.footer, cx_, cy_ + 30.0, 16.0, kGray66, TextAlign::kCenter, 1.0);
}

}  // namespace dossier::render
