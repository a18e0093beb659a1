// Repository: Dossier-render
// Component: Timeline
// Purpose: Block schedule -> global frame mapping and per-frame alpha curves.
// Copyright (c) 2025 Dossier

#include "dossier/timeline/Timeline.hpp"

#include <algorithm>

#include "dossier/util/Easing.hpp"

namespace dossier::timeline {

BlockTiming ScheduleBlock(const Block& block, const TimingConstants& timing,
                          const timing::RationalFps& fps, int64_t start) {
  BlockTiming t;
  t.start = start;
  if (block.IsScene()) {
    const int64_t frames = std::max<int64_t>(block.frame_count.value_or(0), 0);
    t.lines_frames = 0;
    t.hold_frames = frames;
    t.duration = frames;
    return t;
  }
  const auto lines = static_cast<int64_t>(block.lines.size());
  t.lines_frames = lines * timing.line_gap + timing.line_fade;
  t.hold_frames = block.frame_count ? *block.frame_count
                                    : fps.FramesFromSecondsRounded(block.computed_hold_sec);
  t.duration = t.lines_frames + t.hold_frames + timing.fade_out + timing.block_black;
  return t;
}

Timeline::Timeline(const std::vector<Block>& blocks, const TimingConstants& timing,
                   const timing::RationalFps& fps, int64_t head_frames, int64_t tail_frames)
    : timing_(timing), fps_(fps), head_frames_(std::max<int64_t>(head_frames, 0)) {
  timings_.reserve(blocks.size());
  is_scene_.reserve(blocks.size());
  int64_t cursor = head_frames_;
  for (const auto& block : blocks) {
    BlockTiming t = ScheduleBlock(block, timing_, fps_, cursor);
    cursor += t.duration;
    timings_.push_back(t);
    is_scene_.push_back(block.IsScene());
  }
  total_frames_ = cursor + std::max<int64_t>(tail_frames, 0);
}

std::optional<ActiveBlock> Timeline::BlockAt(int64_t frame) const {
  if (timings_.empty() || frame < head_frames_) return std::nullopt;
  // First block whose start is > frame; the candidate is the one before it.
  auto it = std::upper_bound(
      timings_.begin(), timings_.end(), frame,
      [](int64_t f, const BlockTiming& t) { return f < t.start; });
  if (it == timings_.begin()) return std::nullopt;
  --it;
  // Zero-duration blocks share a start with their successor; upper_bound
  // already skipped past them.
  if (frame >= it->end()) return std::nullopt;
  ActiveBlock active;
  active.index = static_cast<size_t>(it - timings_.begin());
  active.local_frame = frame - it->start;
  return active;
}

double Timeline::LineAlpha(size_t line, int64_t local_frame) const {
  const double start = static_cast<double>(line) * timing_.line_gap;
  return util::EaseOut(util::Clamp01((static_cast<double>(local_frame) - start) /
                                     static_cast<double>(timing_.line_fade)));
}

double Timeline::BlockAlpha(size_t index, int64_t local_frame) const {
  if (is_scene_[index]) return 1.0;
  const BlockTiming& t = timings_[index];
  if (local_frame < t.content_end()) return 1.0;
  return 1.0 - util::Clamp01(static_cast<double>(local_frame - t.content_end()) /
                             static_cast<double>(timing_.fade_out));
}

}  // namespace dossier::timeline
