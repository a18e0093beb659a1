// Repository: Dossier-render
// Component: Profile Facts
// Purpose: Derived observations (GPU family, font classes, subject-local
//          clock) that the monologue conditions on.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMELINE_PROFILE_FACTS_HPP_
#define DOSSIER_TIMELINE_PROFILE_FACTS_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dossier/profile/ProfileRecord.hpp"

namespace dossier::timeline {

struct LocalClock {
  int hour = 0;
  int minute = 0;
};

struct ProfileFacts {
  // Extracted from the GPU renderer string, original case ("M2 Max",
  // "RTX 3080 Ti", "Radeon RX 6800 XT"); empty when not matched.
  std::string apple_chip;
  std::string nvidia_gpu;
  std::string amd_gpu;
  bool nvidia_recent = false;  // RTX 30 / 40 / 50 series

  bool is_mobile = false;
  bool is_apple = false;
  bool is_windows = false;
  bool is_linux = false;
  bool is_chromeos = false;
  bool is_premium = false;

  bool high_memory = false;  // >= 8 GB
  bool high_cores = false;   // >= 8 threads
  bool retina = false;       // DPR >= 2
  bool wide_color = false;   // >= 30-bit
  bool has_webcam = false;
  bool has_mic = false;
  bool do_not_track = false;
  bool cookies_enabled = true;  // absent counts as enabled

  bool is_brave = false;
  bool is_firefox = false;
  bool is_safari = false;
  bool is_chrome = false;  // Chrome and not Brave

  // Collection time on the subject's own clock: collected_at (UTC) minus
  // timezoneOffset minutes. Absent when either input is missing or the
  // timestamp does not parse.
  std::optional<LocalClock> local_time;
};

ProfileFacts DeriveProfileFacts(const profile::ProfileRecord& record);

// Minutes since the Unix epoch for an ISO-8601 timestamp
// ("2025-01-15T14:32:10.123Z", "...+01:00", or no zone meaning UTC).
std::optional<int64_t> ParseIsoTimestampMinutes(const std::string& iso);

// Fonts from `installed` that appear in `known`, in installed order.
std::vector<std::string> FilterFonts(const std::vector<std::string>& installed,
                                     const std::vector<std::string>& known);

}  // namespace dossier::timeline

#endif  // DOSSIER_TIMELINE_PROFILE_FACTS_HPP_
