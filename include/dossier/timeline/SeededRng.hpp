// Repository: Dossier-render
// Component: Seeded RNG
// Purpose: Park-Miller minimal standard generator shared by timing jitter,
//          world generation and audio noise.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMELINE_SEEDED_RNG_HPP_
#define DOSSIER_TIMELINE_SEEDED_RNG_HPP_

#include <cstdint>
#include <string>

namespace dossier::timeline {

// state' = state * 16807 mod (2^31 - 1); Next() returns (state' - 1) / (2^31 - 2),
// which lies in [0, 1). The sequence is fully determined by the seed.
class SeededRng {
 public:
  static constexpr int64_t kModulus = 2147483647;
  static constexpr int64_t kMultiplier = 16807;
  static constexpr int64_t kDefaultSeed = 42;

  // A seed that is 0 mod kModulus would lock the generator at zero; it is
  // replaced by kDefaultSeed.
  explicit SeededRng(int64_t seed = kDefaultSeed);

  double Next();

  int64_t state() const { return state_; }

 private:
  int64_t state_;
};

// 1 + sum of the visitor ID's byte values. An empty ID yields 1.
int64_t SeedFromVisitorId(const std::string& visitor_id);

}  // namespace dossier::timeline

#endif  // DOSSIER_TIMELINE_SEEDED_RNG_HPP_
