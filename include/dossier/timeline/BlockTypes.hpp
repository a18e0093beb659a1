// Repository: Dossier-render
// Component: Block Types
// Purpose: Timed content units and the frame constants that schedule them.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMELINE_BLOCK_TYPES_HPP_
#define DOSSIER_TIMELINE_BLOCK_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dossier/timeline/Scene.hpp"

namespace dossier::timeline {

enum class Importance {
  kNormal = 0,
  kFlash,   // short beat
  kLinger,  // long beat; louder transient click
};

const char* ImportanceToString(Importance importance);

// =============================================================================
// Block
// =============================================================================

// Either a list of text lines (empty strings are spacers) or a Scene.
// Duration comes from exactly one of: frame_count (scenes), hold_sec
// (explicit authoring), or the scared-timing model when both are unset.
struct Block {
  std::vector<std::string> lines;
  Importance importance = Importance::kNormal;
  std::optional<double> hold_sec;
  std::optional<int64_t> frame_count;
  std::optional<Scene> scene;

  // Filled by the builder: the hold actually used for scheduling.
  double computed_hold_sec = 0.0;

  bool IsScene() const { return scene.has_value(); }
};

// =============================================================================
// Frame constants
// =============================================================================

struct TimingConstants {
  int line_fade = 8;     // frames for one line to fade in
  int line_gap = 6;      // frames between consecutive line starts
  int fade_out = 10;     // frames for the whole block to fade out
  int block_black = 8;   // black frames after the fade-out
};

// Placement of one block in the global frame sequence.
struct BlockTiming {
  int64_t start = 0;
  int64_t duration = 0;
  int64_t lines_frames = 0;  // lines * line_gap + line_fade
  int64_t hold_frames = 0;

  int64_t content_end() const { return lines_frames + hold_frames; }
  int64_t end() const { return start + duration; }
};

}  // namespace dossier::timeline

#endif  // DOSSIER_TIMELINE_BLOCK_TYPES_HPP_
