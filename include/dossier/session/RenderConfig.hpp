// Repository: Dossier-render
// Component: Render Config
// Purpose: Everything one render needs to know, with defaults.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_SESSION_RENDER_CONFIG_HPP_
#define DOSSIER_SESSION_RENDER_CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "dossier/RenderError.hpp"
#include "dossier/timeline/VariantConfig.hpp"

namespace dossier::session {

constexpr const char* kDefaultDisplayFont = "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf";
constexpr const char* kDefaultMonoFont = "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf";

struct RenderConfig {
  std::string input_path;
  // Empty: DefaultOutputPath(input_path).
  std::string output_path;

  timeline::Variant variant = timeline::Variant::kDossier;

  int width = 1920;
  int height = 1080;
  int fps = 30;

  std::string display_font = kDefaultDisplayFont;
  std::string mono_font = kDefaultMonoFont;

  // External encoder.
  std::string encoder_path = "ffmpeg";
  std::string preset = "medium";
  int crf = 18;
  std::chrono::milliseconds stall_timeout{30000};

  // Audio. A sonifier command replaces the synthesized track.
  bool audio = true;
  std::string sonifier_command;
  std::chrono::milliseconds sonifier_timeout{300000};
  std::chrono::milliseconds mux_timeout{60000};

  // --no-backdrop turns off the network behind text blocks.
  bool backdrop = true;

  // Overrides the world seed derived from the visitor ID.
  std::optional<int64_t> world_seed;

  // Per-frame CRC-32 fingerprints, "frame,crc32" rows.
  std::string frame_csv_path;

  // Print the block schedule and stop.
  bool dry_run = false;

  std::string ResolvedOutputPath() const;
};

// "<input minus .json>.mp4"; a path without a .json suffix gets ".mp4"
// appended.
std::string DefaultOutputPath(const std::string& input_path);

// DOSSIER_ENCODER, DOSSIER_FONT and DOSSIER_MONO_FONT, when set and
// non-empty. Applied before command-line flags so flags win.
void ApplyEnvironmentOverrides(RenderConfig* config);

// Geometry and timing sanity. Failures are kInputError.
RenderResult ValidateRenderConfig(const RenderConfig& config);

}  // namespace dossier::session

#endif  // DOSSIER_SESSION_RENDER_CONFIG_HPP_
