// Repository: Dossier-render
// Component: Rational Frame Rate
// Purpose: Exact frame/second/sample conversions for the render timeline.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_TIMING_RATIONAL_FPS_HPP_
#define DOSSIER_TIMING_RATIONAL_FPS_HPP_

#include <cmath>
#include <cstdint>
#include <string>

namespace dossier::timing {

constexpr int64_t FpsAbs64(int64_t v) { return v < 0 ? -v : v; }

constexpr int64_t FpsGcd64(int64_t a, int64_t b) {
  a = FpsAbs64(a);
  b = FpsAbs64(b);
  while (b != 0) {
    const int64_t t = a % b;
    a = b;
    b = t;
  }
  return a == 0 ? 1 : a;
}

// Frame rate as num/den. Everything the timeline and audio track derive from
// the frame count goes through here so the video and audio lengths agree to
// the sample.
struct RationalFps {
  int64_t num;
  int64_t den;

  constexpr RationalFps(int64_t n = 0, int64_t d = 1) : num(n), den(d) {
    NormalizeInPlace();
  }

  constexpr bool IsValid() const { return num > 0 && den > 0; }

  constexpr void NormalizeInPlace() {
    if (den == 0) {
      num = 0;
      den = 1;
      return;
    }
    if (den < 0) {
      den = -den;
      num = -num;
    }
    if (num <= 0) {
      num = 0;
      den = 1;
      return;
    }
    const int64_t g = FpsGcd64(num, den);
    num /= g;
    den /= g;
  }

  constexpr double ToDouble() const { return static_cast<double>(num) / static_cast<double>(den); }

  constexpr double SecondsFromFrames(int64_t frames) const {
    return IsValid() ? (static_cast<double>(frames) * static_cast<double>(den) /
                        static_cast<double>(num))
                     : 0.0;
  }

  // Hold durations are authored in seconds; half-up rounding to whole frames.
  int64_t FramesFromSecondsRounded(double seconds) const {
    if (!IsValid()) return 0;
    return static_cast<int64_t>(std::floor(seconds * ToDouble() + 0.5));
  }

  // Audio samples covering `frames` video frames, rounded up so the track is
  // never shorter than the picture.
  constexpr int64_t SamplesForFramesCeil(int64_t frames, int64_t sample_rate) const {
    if (!IsValid()) return 0;
    const int64_t numer = frames * sample_rate * den;
    return (numer + num - 1) / num;
  }

  // First audio sample at or after the start of `frame`.
  constexpr int64_t SampleAtFrameFloor(int64_t frame, int64_t sample_rate) const {
    return IsValid() ? (frame * sample_rate * den) / num : 0;
  }

  // ffmpeg -r argument: "30" or "30000/1001".
  std::string ToArgString() const {
    if (den == 1) return std::to_string(num);
    return std::to_string(num) + "/" + std::to_string(den);
  }

  constexpr bool operator==(const RationalFps& other) const {
    return num == other.num && den == other.den;
  }
  constexpr bool operator!=(const RationalFps& other) const {
    return !(*this == other);
  }
};

constexpr RationalFps FPS_24{24, 1};
constexpr RationalFps FPS_25{25, 1};
constexpr RationalFps FPS_2997{30000, 1001};
constexpr RationalFps FPS_30{30, 1};
constexpr RationalFps FPS_60{60, 1};

}  // namespace dossier::timing

#endif  // DOSSIER_TIMING_RATIONAL_FPS_HPP_
