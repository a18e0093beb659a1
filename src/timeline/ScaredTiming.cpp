// Repository: Dossier-render
// Component: Scared Timing
// Purpose: Hold-duration model for data-conditional monologues.
// Copyright (c) 2025 Dossier

#include "dossier/timeline/ScaredTiming.hpp"

#include <algorithm>

namespace dossier::timeline {

double PacingCurve(double progress) {
  if (progress < 0.15) return 1.3;
  if (progress < 0.5) return 0.75;
  if (progress < 0.75) return 0.6;
  return 1.1 + (progress - 0.75) * 4.0;
}

double ImportanceMultiplier(Importance importance) {
  switch (importance) {
    case Importance::kFlash:
      return 0.35;
    case Importance::kLinger:
      return 2.2;
    case Importance::kNormal:
      break;
  }
  return 1.0;
}

double ScaredHoldSeconds(size_t index, size_t total, size_t line_count,
                         Importance importance, SeededRng& rng) {
  const double progress =
      static_cast<double>(index) / static_cast<double>(std::max<size_t>(total, 1));
  const double base = 0.3 + static_cast<double>(line_count) * 0.22;
  const double jitter = 0.75 + rng.Next() * 0.5;
  return std::max(kMinHoldSec,
                  base * PacingCurve(progress) * ImportanceMultiplier(importance) * jitter);
}

}  // namespace dossier::timeline
