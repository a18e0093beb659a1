// Repository: Dossier-render
// Component: stb_truetype Text Renderer
// Purpose: TrueType measurement and anti-aliased glyph blending with a
//          per-size glyph cache.
// Copyright (c) 2025 Dossier

#include "dossier/render/StbTextRenderer.hpp"

#include <cmath>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

#include "dossier/util/AtomicFile.hpp"
#include "dossier/util/Logger.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier::render {

struct StbTextRenderer::Font {
  std::string path;
  std::vector<unsigned char> bytes;
  stbtt_fontinfo info{};
};

namespace {

// Glyph cache key: face | quarter-pixel size | code point.
uint64_t GlyphKey(FontFace face, double px, uint32_t codepoint) {
  const auto quarter = static_cast<uint64_t>(std::lround(px * 4.0)) & 0x7FFFF;
  return (static_cast<uint64_t>(face) << 40) | (quarter << 21) |
         (static_cast<uint64_t>(codepoint) & 0x1FFFFF);
}

}  // namespace

StbTextRenderer::StbTextRenderer() = default;
StbTextRenderer::~StbTextRenderer() = default;

std::unique_ptr<StbTextRenderer> StbTextRenderer::Create(const std::string& display_font_path,
                                                         const std::string& mono_font_path,
                                                         std::string* error) {
  std::unique_ptr<StbTextRenderer> renderer(new StbTextRenderer());
  const std::string* paths[2] = {&display_font_path, &mono_font_path};
  std::unique_ptr<Font>* slots[2] = {&renderer->display_, &renderer->mono_};

  for (int i = 0; i < 2; ++i) {
    std::string raw;
    if (!util::ReadFile(*paths[i], &raw) || raw.empty()) {
      *error = "cannot read font file: " + *paths[i];
      return nullptr;
    }
    auto font = std::make_unique<Font>();
    font->path = *paths[i];
    font->bytes.assign(raw.begin(), raw.end());
    const int offset = stbtt_GetFontOffsetForIndex(font->bytes.data(), 0);
    if (offset < 0 || !stbtt_InitFont(&font->info, font->bytes.data(), offset)) {
      *error = "not a usable TrueType font: " + *paths[i];
      return nullptr;
    }
    util::Logger::Debug("[StbTextRenderer] Loaded font: " + *paths[i]);
    *slots[i] = std::move(font);
  }
  return renderer;
}

StbTextRenderer::Font& StbTextRenderer::FontFor(FontFace face) {
  return face == FontFace::kMono ? *mono_ : *display_;
}

const StbTextRenderer::Glyph& StbTextRenderer::GlyphFor(FontFace face, double px,
                                                        uint32_t codepoint) {
  const uint64_t key = GlyphKey(face, px, codepoint);
  auto it = glyphs_.find(key);
  if (it != glyphs_.end()) return it->second;

  Font& font = FontFor(face);
  const float scale = stbtt_ScaleForMappingEmToPixels(&font.info, static_cast<float>(px));
  Glyph glyph;
  unsigned char* bitmap =
      stbtt_GetCodepointBitmap(&font.info, scale, scale, static_cast<int>(codepoint),
                               &glyph.width, &glyph.height, &glyph.x_offset, &glyph.y_offset);
  if (bitmap != nullptr) {
    glyph.coverage.assign(bitmap, bitmap + static_cast<size_t>(glyph.width) * glyph.height);
    stbtt_FreeBitmap(bitmap, nullptr);
  } else {
    glyph.width = 0;
    glyph.height = 0;
  }
  return glyphs_.emplace(key, std::move(glyph)).first->second;
}

double StbTextRenderer::MeasureWidth(FontFace face, double px, const std::string& text) {
  Font& font = FontFor(face);
  const float scale = stbtt_ScaleForMappingEmToPixels(&font.info, static_cast<float>(px));
  const std::vector<uint32_t> cps = util::DecodeUtf8(text);
  double width = 0.0;
  for (size_t i = 0; i < cps.size(); ++i) {
    int advance = 0;
    int bearing = 0;
    stbtt_GetCodepointHMetrics(&font.info, static_cast<int>(cps[i]), &advance, &bearing);
    width += advance * scale;
    if (i + 1 < cps.size()) {
      width += stbtt_GetCodepointKernAdvance(&font.info, static_cast<int>(cps[i]),
                                             static_cast<int>(cps[i + 1])) *
               scale;
    }
  }
  return width;
}

void StbTextRenderer::DrawText(Canvas* canvas, FontFace face, double px,
                               const std::string& text, double x, double y, TextAlign align,
                               Rgb color, double alpha) {
  if (text.empty() || alpha <= 0.0 || px <= 0.0) return;
  double pen = x;
  if (align != TextAlign::kLeft) {
    const double w = MeasureWidth(face, px, text);
    pen -= align == TextAlign::kCenter ? w / 2.0 : w;
  }

  Font& font = FontFor(face);
  const float scale = stbtt_ScaleForMappingEmToPixels(&font.info, static_cast<float>(px));
  const int baseline = static_cast<int>(std::lround(y));
  const std::vector<uint32_t> cps = util::DecodeUtf8(text);

  for (size_t i = 0; i < cps.size(); ++i) {
    const Glyph& glyph = GlyphFor(face, px, cps[i]);
    const int gx = static_cast<int>(std::lround(pen)) + glyph.x_offset;
    const int gy = baseline + glyph.y_offset;
    for (int row = 0; row < glyph.height; ++row) {
      const uint8_t* src = &glyph.coverage[static_cast<size_t>(row) * glyph.width];
      for (int col = 0; col < glyph.width; ++col) {
        if (src[col] == 0) continue;
        canvas->BlendPixel(gx + col, gy + row, color, alpha * (src[col] / 255.0));
      }
    }

    int advance = 0;
    int bearing = 0;
    stbtt_GetCodepointHMetrics(&font.info, static_cast<int>(cps[i]), &advance, &bearing);
    pen += advance * scale;
    if (i + 1 < cps.size()) {
      pen += stbtt_GetCodepointKernAdvance(&font.info, static_cast<int>(cps[i]),
                                           static_cast<int>(cps[i + 1])) *
             scale;
    }
  }
}

}  // namespace dossier::render
