// Repository: Dossier-render
// Component: Audio Synthesizer
// Purpose: Procedural soundtrack derived from the block schedule.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_AUDIO_AUDIO_SYNTHESIZER_HPP_
#define DOSSIER_AUDIO_AUDIO_SYNTHESIZER_HPP_

#include <cstdint>
#include <vector>

#include "dossier/timeline/BlockTypes.hpp"
#include "dossier/timeline/Timeline.hpp"

namespace dossier::audio {

constexpr int kSampleRate = 44100;

// Mono, signed 16-bit.
struct AudioTrack {
  int sample_rate = kSampleRate;
  std::vector<int16_t> samples;

  double DurationSeconds() const {
    return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
  }
};

struct SynthesisConstants {
  double drone_base_hz = 40.0;
  double drone_spread_hz = 20.0;
  double sub_hz = 25.0;
  double click_window_sec = 0.05;
  double click_decay_sec = 0.008;
  double click_linger = 0.7;
  double click_normal = 0.4;
  double tension_onset = 0.5;
  double limit = 0.95;
};

// Sum of drone, sub-bass, transient clicks at every block start, a rising
// tension tone and a noise floor, all shaped by progress p = i / N. The
// track covers the timeline's frames rounded up to whole samples. Output is
// a pure function of the schedule and the seed.
AudioTrack SynthesizeTrack(const std::vector<timeline::Block>& blocks,
                           const timeline::Timeline& timeline, int64_t seed,
                           const SynthesisConstants& constants = SynthesisConstants());

}  // namespace dossier::audio

#endif  // DOSSIER_AUDIO_AUDIO_SYNTHESIZER_HPP_
