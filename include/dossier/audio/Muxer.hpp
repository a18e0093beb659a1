// Repository: Dossier-render
// Component: Muxer
// Purpose: Combines the silent video with the soundtrack into the final MP4.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_AUDIO_MUXER_HPP_
#define DOSSIER_AUDIO_MUXER_HPP_

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "dossier/RenderError.hpp"

namespace dossier::audio {

struct MuxRequest {
  std::string video_path;   // silent MP4 from the encoder
  std::string audio_path;   // WAV (synthesized or from the sonifier)
  std::string output_path;
  std::chrono::milliseconds timeout{60000};
};

// Implementations leave nothing at output_path on failure and report
// kAudioFailure, or kInterrupted when the interrupt flag stopped them. A
// successful Mux() has published output_path.
class IMuxer {
 public:
  virtual ~IMuxer() = default;
  virtual RenderResult Mux(const MuxRequest& request) = 0;
};

// libavformat remux: the video stream is copied packet for packet, the audio
// is decoded, resampled and encoded to AAC. Output stops at the end of the
// shorter stream and is written to a temp path, then renamed. The timeout and
// the interrupt flag are enforced through the format interrupt callback.
//
// Without FFmpeg support compiled in, Mux() always fails.
class LibavMuxer : public IMuxer {
 public:
  explicit LibavMuxer(const std::atomic<bool>* interrupt = nullptr, int audio_bitrate = 192000);

  RenderResult Mux(const MuxRequest& request) override;

  static bool Available();

 private:
  const std::atomic<bool>* interrupt_;
  int audio_bitrate_;
};

}  // namespace dossier::audio

#endif  // DOSSIER_AUDIO_MUXER_HPP_
