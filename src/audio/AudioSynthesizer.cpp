// Repository: Dossier-render
// Component: Audio Synthesizer
// Purpose: Procedural soundtrack derived from the block schedule.
// Copyright (c) 2025 Dossier

#include "dossier/audio/AudioSynthesizer.hpp"

#include <algorithm>
#include <cmath>

#include "dossier/timeline/SeededRng.hpp"
#include "dossier/util/Logger.hpp"

namespace dossier::audio {

namespace {

constexpr double kTwoPi = 6.283185307179586;

struct Transient {
  int64_t sample;
  double intensity;
};

}  // namespace

AudioTrack SynthesizeTrack(const std::vector<timeline::Block>& blocks,
                           const timeline::Timeline& timeline, int64_t seed,
                           const SynthesisConstants& constants) {
  AudioTrack track;
  const timing::RationalFps& fps = timeline.fps();
  const int64_t total = fps.SamplesForFramesCeil(timeline.TotalFrames(), kSampleRate);
  if (total <= 0) return track;
  track.samples.resize(static_cast<size_t>(total));

  timeline::SeededRng rng(seed);
  const double drone_hz = constants.drone_base_hz + rng.Next() * constants.drone_spread_hz;

  std::vector<Transient> transients;
  transients.reserve(timeline.BlockCount());
  for (size_t i = 0; i < timeline.BlockCount() && i < blocks.size(); ++i) {
    const double intensity = blocks[i].importance == timeline::Importance::kLinger
                                 ? constants.click_linger
                                 : constants.click_normal;
    transients.push_back(
        Transient{fps.SampleAtFrameFloor(timeline.TimingOf(i).start, kSampleRate), intensity});
  }

  const double sr = static_cast<double>(kSampleRate);
  const int64_t click_window = static_cast<int64_t>(sr * constants.click_window_sec);
  const double click_decay = sr * constants.click_decay_sec;

  double drone_phase = 0.0;
  double tension_phase = 0.0;
  // Transients are sorted by start; `first` skips the ones already past.
  size_t first = 0;

  for (int64_t i = 0; i < total; ++i) {
    const double t = static_cast<double>(i) / sr;
    const double p = static_cast<double>(i) / static_cast<double>(total);

    const double drone = std::sin(drone_phase) * (0.05 + p * 0.15);
    drone_phase += kTwoPi * drone_hz * (1.0 + p * 0.3) / sr;

    const double sub = std::sin(kTwoPi * constants.sub_hz * t) * 0.03 * (1.0 + p);

    double click = 0.0;
    while (first < transients.size() && i - transients[first].sample >= click_window) ++first;
    for (size_t k = first; k < transients.size(); ++k) {
      const int64_t dist = i - transients[k].sample;
      if (dist < 0) break;
      if (dist >= click_window) continue;
      const double env = std::exp(-static_cast<double>(dist) / click_decay);
      click += env * transients[k].intensity * (rng.Next() * 2.0 - 1.0);
    }

    const double tension_amp = std::max(0.0, (p - constants.tension_onset) * 0.08);
    const double tension = std::sin(tension_phase) * tension_amp *
                           (0.5 + 0.5 * std::sin(kTwoPi * 0.3 * t));
    tension_phase += kTwoPi * (800.0 + p * 3000.0) / sr;

    const double noise = (rng.Next() * 2.0 - 1.0) * 0.01 * p;

    const double s = std::clamp(drone + sub + click + tension + noise, -constants.limit,
                                constants.limit);
    track.samples[static_cast<size_t>(i)] = static_cast<int16_t>(std::floor(s * 32767.0));
  }

  util::Logger::Debug("[AudioSynth] " + std::to_string(total) + " samples, drone " +
                      std::to_string(drone_hz) + " Hz, " + std::to_string(transients.size()) +
                      " transients");
  return track;
}

}  // namespace dossier::audio
