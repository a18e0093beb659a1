// Fixed-advance text renderer for tests: every codepoint is 0.5 * px wide and
// is drawn as a solid box from the baseline up to 0.7 * px. Needs no font
// files, so layout and pixel tests are exact.

#pragma once

#include <string>

#include "dossier/render/Canvas.hpp"
#include "dossier/render/TextRenderer.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier::test {

class FakeTextRenderer : public render::TextRenderer {
 public:
  static constexpr double kAdvance = 0.5;
  static constexpr double kAscent = 0.7;

  double MeasureWidth(render::FontFace, double px, const std::string& text) override {
    return static_cast<double>(util::Utf8Length(text)) * px * kAdvance;
  }

  void DrawText(render::Canvas* canvas, render::FontFace face, double px, const std::string& text,
                double x, double y, render::TextAlign align, render::Rgb color,
                double alpha) override {
    ++draw_calls_;
    last_text_ = text;
    const double w = MeasureWidth(face, px, text);
    if (align == render::TextAlign::kCenter) x -= w / 2.0;
    if (align == render::TextAlign::kRight) x -= w;
    canvas->FillRect(x, y - px * kAscent, w, px * kAscent, color, alpha);
  }

  int draw_calls() const { return draw_calls_; }
  const std::string& last_text() const { return last_text_; }

 private:
  int draw_calls_ = 0;
  std::string last_text_;
};

}  // namespace dossier::test
