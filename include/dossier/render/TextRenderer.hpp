// Repository: Dossier-render
// Component: Text Renderer
// Purpose: Font measurement and glyph drawing seam between the rasterizer
//          and a concrete font backend.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_RENDER_TEXT_RENDERER_HPP_
#define DOSSIER_RENDER_TEXT_RENDERER_HPP_

#include <string>

#include "dossier/render/Canvas.hpp"

namespace dossier::render {

enum class FontFace {
  kDisplay = 0,  // bold sans, monologue text
  kMono,         // scene labels, readouts, watermark
};

enum class TextAlign {
  kLeft = 0,
  kCenter,
  kRight,
};

const char* FontFaceToString(FontFace face);

// Text is UTF-8. Sizes are the em height in pixels. Implementations may
// cache glyphs, so neither call is const.
class TextRenderer {
 public:
  virtual ~TextRenderer() = default;

  // Advance width including kerning.
  virtual double MeasureWidth(FontFace face, double px, const std::string& text) = 0;

  // `y` is the baseline. `x` is the left edge, center or right edge per
  // `align`. Coverage is blended through the canvas, so the canvas global
  // alpha applies.
  virtual void DrawText(Canvas* canvas, FontFace face, double px, const std::string& text,
                        double x, double y, TextAlign align, Rgb color, double alpha) = 0;
};

}  // namespace dossier::render

#endif  // DOSSIER_RENDER_TEXT_RENDERER_HPP_
