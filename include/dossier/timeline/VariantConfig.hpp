// Repository: Dossier-render
// Component: Variant Config
// Purpose: Per-variant knobs consumed by the single timeline builder and
//          by the rasterizer.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMELINE_VARIANT_CONFIG_HPP_
#define DOSSIER_TIMELINE_VARIANT_CONFIG_HPP_

#include <optional>
#include <string>

#include "dossier/timeline/BlockTypes.hpp"

namespace dossier::timeline {

enum class Variant {
  kClassic = 0,  // fixed block list, explicit holds
  kExtended,     // classic plus device, time, font and cookie blocks
  kDossier,      // data-conditional monologue with scared timing
  kReel,         // six full-frame scenes
};

const char* VariantToString(Variant variant);
std::optional<Variant> ParseVariant(const std::string& name);

struct VariantConfig {
  Variant variant = Variant::kDossier;
  TimingConstants timing;

  // Hold durations come from the scared-timing model instead of the
  // authored values.
  bool scared_timing = true;

  // Empty lines are removed before scheduling instead of being kept as
  // 40 px spacers.
  bool drop_empty_lines = true;

  int max_font_px = 120;
  int min_font_px = 28;

  int head_frames = 0;
  int tail_frames = 30;

  // Procedural network painted behind text blocks, at this visibility.
  bool world_backdrop = true;
  double backdrop_visibility = 0.3;

  // Vignette and ID / clock watermark.
  bool overlay = true;
};

VariantConfig VariantConfigFor(Variant variant);

}  // namespace dossier::timeline

#endif  // DOSSIER_TIMELINE_VARIANT_CONFIG_HPP_
