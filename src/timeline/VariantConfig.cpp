// Repository: Dossier-render
// Component: Variant Config
// Purpose: Built-in variant table.
// Copyright (c) 2025 Dossier

#include "dossier/timeline/VariantConfig.hpp"

namespace dossier::timeline {

const char* VariantToString(Variant variant) {
  switch (variant) {
    case Variant::kClassic:
      return "classic";
    case Variant::kExtended:
      return "extended";
    case Variant::kDossier:
      return "dossier";
    case Variant::kReel:
      return "reel";
  }
  return "unknown";
}

std::optional<Variant> ParseVariant(const std::string& name) {
  if (name == "classic") return Variant::kClassic;
  if (name == "extended") return Variant::kExtended;
  if (name == "dossier") return Variant::kDossier;
  if (name == "reel") return Variant::kReel;
  return std::nullopt;
}

VariantConfig VariantConfigFor(Variant variant) {
  VariantConfig c;
  c.variant = variant;
  switch (variant) {
    case Variant::kClassic:
      c.timing.block_black = 12;
      c.scared_timing = false;
      c.drop_empty_lines = false;
      c.min_font_px = 36;
      c.world_backdrop = false;
      c.overlay = false;
      break;
    case Variant::kExtended:
      c.timing.block_black = 12;
      c.scared_timing = false;
      c.drop_empty_lines = false;
      c.min_font_px = 32;
      c.world_backdrop = false;
      c.overlay = false;
      break;
    case Variant::kDossier:
      break;
    case Variant::kReel:
      // Scenes carry their own frame counts and backdrop visibility.
      c.scared_timing = false;
      c.drop_empty_lines = false;
      c.tail_frames = 0;
      break;
  }
  return c;
}

}  // namespace dossier::timeline
