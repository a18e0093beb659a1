// Repository: Dossier-render
// Component: Timeline
// Purpose: Block schedule -> global frame mapping and per-frame alpha curves.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMELINE_TIMELINE_HPP_
#define DOSSIER_TIMELINE_TIMELINE_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "dossier/timeline/BlockTypes.hpp"
#include "dossier/timing/RationalFps.hpp"

namespace dossier::timeline {

struct ActiveBlock {
  size_t index = 0;
  int64_t local_frame = 0;
};

// Frames a block occupies. Scenes use their frame count; text blocks use
// lines*line_gap + line_fade + round(hold*fps) + fade_out + block_black.
BlockTiming ScheduleBlock(const Block& block, const TimingConstants& timing,
                          const timing::RationalFps& fps, int64_t start);

// Read-only after construction. Frames [0, head) and
// [head + sum(durations), total) belong to no block.
class Timeline {
 public:
  Timeline(const std::vector<Block>& blocks, const TimingConstants& timing,
           const timing::RationalFps& fps, int64_t head_frames, int64_t tail_frames);

  int64_t TotalFrames() const { return total_frames_; }
  size_t BlockCount() const { return timings_.size(); }
  const BlockTiming& TimingOf(size_t index) const { return timings_[index]; }
  const std::vector<BlockTiming>& timings() const { return timings_; }
  const TimingConstants& constants() const { return timing_; }
  const timing::RationalFps& fps() const { return fps_; }

  // Binary search over block start frames.
  std::optional<ActiveBlock> BlockAt(int64_t frame) const;

  // easeOut(clamp((f - line*line_gap) / line_fade)).
  double LineAlpha(size_t line, int64_t local_frame) const;

  // 1 - clamp((f - content_end) / fade_out). Scenes are always 1.
  double BlockAlpha(size_t index, int64_t local_frame) const;

 private:
  TimingConstants timing_;
  timing::RationalFps fps_;
  std::vector<BlockTiming> timings_;
  std::vector<bool> is_scene_;
  int64_t head_frames_ = 0;
  int64_t total_frames_ = 0;
};

}  // namespace dossier::timeline

#endif  // DOSSIER_TIMELINE_TIMELINE_HPP_
