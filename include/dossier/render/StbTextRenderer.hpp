// Repository: Dossier-render
// Component: stb_truetype Text Renderer
// Purpose: TrueType measurement and anti-aliased glyph blending with a
//          per-size glyph cache.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_RENDER_STB_TEXT_RENDERER_HPP_
#define DOSSIER_RENDER_STB_TEXT_RENDERER_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "dossier/render/TextRenderer.hpp"

namespace dossier::render {

class StbTextRenderer : public TextRenderer {
 public:
  // Loads both faces. Returns nullptr and fills *error when either file is
  // unreadable or not a font stb_truetype understands.
  static std::unique_ptr<StbTextRenderer> Create(const std::string& display_font_path,
                                                 const std::string& mono_font_path,
                                                 std::string* error);

  ~StbTextRenderer() override;

  double MeasureWidth(FontFace face, double px, const std::string& text) override;
  void DrawText(Canvas* canvas, FontFace face, double px, const std::string& text, double x,
                double y, TextAlign align, Rgb color, double alpha) override;

  size_t cached_glyphs() const { return glyphs_.size(); }

 private:
  struct Font;

  struct Glyph {
    int width = 0;
    int height = 0;
    int x_offset = 0;
    int y_offset = 0;
    std::vector<uint8_t> coverage;
  };

  StbTextRenderer();

  Font& FontFor(FontFace face);
  const Glyph& GlyphFor(FontFace face, double px, uint32_t codepoint);

  std::unique_ptr<Font> display_;
  std::unique_ptr<Font> mono_;
  std::unordered_map<uint64_t, Glyph> glyphs_;
};

}  // namespace dossier::render

#endif  // DOSSIER_RENDER_STB_TEXT_RENDERER_HPP_
