// Repository: Dossier-render
// Component: Rasterizer
// Purpose: Paints one complete frame from (world, timeline, blocks, frame).
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_RENDER_RASTERIZER_HPP_
#define DOSSIER_RENDER_RASTERIZER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "dossier/render/Canvas.hpp"
#include "dossier/render/FrameBuffer.hpp"
#include "dossier/render/TextRenderer.hpp"
#include "dossier/timeline/BlockTypes.hpp"
#include "dossier/timeline/Timeline.hpp"
#include "dossier/timeline/VariantConfig.hpp"
#include "dossier/world/ProceduralWorld.hpp"

namespace dossier::render {

struct TextLayoutConstants {
  static constexpr double kMarginLeft = 80.0;
  static constexpr double kSpacerPx = 40.0;
  static constexpr double kLineSpacing = 1.25;
  static constexpr int kFontStepPx = 2;
  static constexpr int kCursorBlinkFrames = 15;
};

// One laid-out text line: empty text is a spacer.
struct LineLayout {
  std::string text;
  double size = 0.0;
};

// Stateless apart from the vignette mask built at construction. The text
// renderer is borrowed and must outlive the rasterizer.
class Rasterizer {
 public:
  Rasterizer(const timeline::VariantConfig& variant, TextRenderer* text, int width, int height,
             std::string visitor_id);

  // Draw order: clear, network backdrop (text blocks only, when enabled),
  // block foreground (text or scene), vignette, watermark. Frames outside
  // every block get the background and overlay only.
  void Paint(FrameBuffer* buffer, const world::ProceduralWorld& world,
             const timeline::Timeline& timeline, const std::vector<timeline::Block>& blocks,
             int64_t frame);

  // Largest size from max_font_px down to min_font_px (step 2) whose
  // measured width fits width - 2 * margin; min_font_px when none fits.
  int FitFontSize(const std::string& text);

  std::vector<LineLayout> LayoutLines(const std::vector<std::string>& lines);

 private:
  void PaintTextBlock(Canvas* canvas, const timeline::Timeline& timeline,
                      const timeline::Block& block, size_t index, int64_t local_frame,
                      int64_t global_frame);
  void PaintOverlay(Canvas* canvas, int64_t frame, double fps);

  timeline::VariantConfig variant_;
  TextRenderer* text_;
  int width_;
  int height_;
  std::string visitor_id_;
  std::vector<float> vignette_;
};

}  // namespace dossier::render

#endif  // DOSSIER_RENDER_RASTERIZER_HPP_
