// Repository: Dossier-render
// Component: Scared Timing
// Purpose: Hold-duration model: early blocks deliberate, the middle hurried,
//          the ending slowing to a halt.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMELINE_SCARED_TIMING_HPP_
#define DOSSIER_TIMELINE_SCARED_TIMING_HPP_

#include <cstddef>

#include "dossier/timeline/BlockTypes.hpp"
#include "dossier/timeline/SeededRng.hpp"

namespace dossier::timeline {

constexpr double kMinHoldSec = 0.25;

// Pacing curve over progress in [0, 1].
double PacingCurve(double progress);

double ImportanceMultiplier(Importance importance);

// Hold in seconds for block `index` of `total` with `line_count` lines.
// Draws exactly one value from `rng` (the jitter).
double ScaredHoldSeconds(size_t index, size_t total, size_t line_count,
                         Importance importance, SeededRng& rng);

}  // namespace dossier::timeline

#endif  // DOSSIER_TIMELINE_SCARED_TIMING_HPP_
