// Repository: Dossier-render
// Component: Seeded RNG
// Purpose: Park-Miller minimal standard generator.
// Copyright (c) 2025 Dossier

#include "dossier/timeline/SeededRng.hpp"

namespace dossier::timeline {

SeededRng::SeededRng(int64_t seed) {
  int64_t s = seed % kModulus;
  if (s < 0) s += kModulus;
  state_ = (s == 0) ? kDefaultSeed : s;
}

double SeededRng::Next() {
  // state_ < 2^31 and the multiplier < 2^15, so the product fits in 64 bits.
  state_ = (state_ * kMultiplier) % kModulus;
  return static_cast<double>(state_ - 1) / static_cast<double>(kModulus - 1);
}

int64_t SeedFromVisitorId(const std::string& visitor_id) {
  int64_t seed = 1;
  for (char c : visitor_id) {
    seed += static_cast<unsigned char>(c);
  }
  return seed;
}

}  // namespace dossier::timeline
