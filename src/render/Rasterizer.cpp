// Repository: Dossier-render
// Component: Rasterizer
// Purpose: Paints one complete frame from (world, timeline, blocks, frame).
// Copyright (c) 2025 Dossier

#include "dossier/render/Rasterizer.hpp"

#include <algorithm>
#include <variant>

#include "dossier/render/NetworkPainter.hpp"
#include "dossier/render/ScenePainter.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier::render {

namespace {

const Rgb kWatermark = Rgb::Gray(0x1a);
constexpr double kWatermarkPx = 10.0;
constexpr double kVignetteInner = 0.3;  // fractions of frame height
constexpr double kVignetteOuter = 0.9;
constexpr double kVignetteAlpha = 0.5;

}  // namespace

Rasterizer::Rasterizer(const timeline::VariantConfig& variant, TextRenderer* text, int width,
                       int height, std::string visitor_id)
    : variant_(variant),
      text_(text),
      width_(width),
      height_(height),
      visitor_id_(std::move(visitor_id)) {
  if (variant_.overlay) {
    vignette_ = BuildVignetteMask(width_, height_, height_ * kVignetteInner,
                                  height_ * kVignetteOuter, kVignetteAlpha);
  }
}

int Rasterizer::FitFontSize(const std::string& text) {
  const double max_w = width_ - 2.0 * TextLayoutConstants::kMarginLeft;
  for (int s = variant_.max_font_px; s >= variant_.min_font_px;
       s -= TextLayoutConstants::kFontStepPx) {
    if (text_->MeasureWidth(FontFace::kDisplay, s, text) <= max_w) return s;
  }
  return variant_.min_font_px;
}

std::vector<LineLayout> Rasterizer::LayoutLines(const std::vector<std::string>& lines) {
  std::vector<LineLayout> layout;
  layout.reserve(lines.size());
  for (const auto& line : lines) {
    if (line.empty()) {
      layout.push_back(LineLayout{"", TextLayoutConstants::kSpacerPx});
    } else {
      layout.push_back(LineLayout{line, static_cast<double>(FitFontSize(line))});
    }
  }
  return layout;
}

void Rasterizer::Paint(FrameBuffer* buffer, const world::ProceduralWorld& world,
                       const timeline::Timeline& timeline,
                       const std::vector<timeline::Block>& blocks, int64_t frame) {
  Canvas canvas(buffer);
  canvas.Clear(kBlack);

  const double fps = timeline.fps().ToDouble();
  PaintContext ctx;
  ctx.canvas = &canvas;
  ctx.text = text_;
  ctx.world = &world;
  ctx.fps = fps;
  ctx.seconds = timeline.fps().SecondsFromFrames(frame);

  const auto active = timeline.BlockAt(frame);
  if (active && active->index < blocks.size()) {
    const timeline::Block& block = blocks[active->index];
    if (block.IsScene()) {
      std::visit(ScenePainter(ctx, active->local_frame), *block.scene);
    } else {
      if (variant_.world_backdrop) PaintNetwork(ctx, variant_.backdrop_visibility, 0.0);
      PaintTextBlock(&canvas, timeline, block, active->index, active->local_frame, frame);
    }
  }

  canvas.SetGlobalAlpha(1.0);
  if (variant_.overlay) PaintOverlay(&canvas, frame, fps);
}

void Rasterizer::PaintTextBlock(Canvas* canvas, const timeline::Timeline& timeline,
                                const timeline::Block& block, size_t index, int64_t local_frame,
                                int64_t global_frame) {
  const double block_alpha = timeline.BlockAlpha(index, local_frame);
  if (block_alpha <= 0.0 || block.lines.empty()) return;

  const std::vector<LineLayout> layout = LayoutLines(block.lines);
  const double spacing = TextLayoutConstants::kLineSpacing;
  const double x = TextLayoutConstants::kMarginLeft;

  double total_h = 0.0;
  for (const auto& l : layout) total_h += l.size * spacing;

  std::vector<double> baselines(layout.size(), 0.0);
  double y = (height_ - total_h) / 2.0 + layout[0].size;
  for (size_t i = 0; i < layout.size(); ++i) {
    baselines[i] = y;
    y += layout[i].size * spacing;
    if (layout[i].text.empty()) continue;
    const double alpha = timeline.LineAlpha(i, local_frame) * block_alpha;
    if (alpha <= 0.0) continue;
    text_->DrawText(canvas, FontFace::kDisplay, layout[i].size, layout[i].text, x, baselines[i],
                    TextAlign::kLeft, kWhite, alpha);
  }

  // Blinking cursor after the newest visible line while content is on screen.
  const timeline::BlockTiming& timing = timeline.TimingOf(index);
  const int64_t gap = std::max(timeline.constants().line_gap, 1);
  const size_t visible =
      std::min(layout.size(), static_cast<size_t>(local_frame / gap) + 1);
  const bool blink_on = (global_frame / TextLayoutConstants::kCursorBlinkFrames) % 2 == 0;
  if (local_frame < timing.content_end() && block_alpha > 0.5 && blink_on && visible > 0) {
    const LineLayout& last = layout[visible - 1];
    const double tw = text_->MeasureWidth(FontFace::kDisplay, last.size, last.text);
    const double cy = baselines[visible - 1];
    canvas->FillRect(x + tw + 8.0, cy - last.size * 0.75, 3.0, last.size * 0.85, kWhite,
                     0.7 * block_alpha);
  }
}

void Rasterizer::PaintOverlay(Canvas* canvas, int64_t frame, double fps) {
  canvas->ApplyMask(vignette_, kBlack);
  const double seconds = fps > 0.0 ? static_cast<double>(frame) / fps : 0.0;
  text_->DrawText(canvas, FontFace::kMono, kWatermarkPx, "ID: " + visitor_id_, width_ - 20.0,
                  height_ - 15.0, TextAlign::kRight, kWatermark, 1.0);
  text_->DrawText(canvas, FontFace::kMono, kWatermarkPx, util::FormatFixed(seconds, 1) + "s",
                  width_ - 20.0, 20.0, TextAlign::kRight, kWatermark, 1.0);
}

}  // namespace dossier::render
