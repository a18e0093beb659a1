// Repository: Dossier-render
// Component: External Sonifier
// Purpose: Runs a user-supplied command that scores the silent video.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_AUDIO_EXTERNAL_SONIFIER_HPP_
#define DOSSIER_AUDIO_EXTERNAL_SONIFIER_HPP_

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "dossier/RenderError.hpp"

namespace dossier::audio {

// Invoked as `<command...> <silent_video> <wav_out>`. The command string is
// split on whitespace; no shell is involved. Success means exit 0 within the
// timeout and a WAV at wav_out with at least one sample. On timeout or
// interrupt the command's whole process group is killed.
class ExternalSonifier {
 public:
  ExternalSonifier(std::string command, std::chrono::milliseconds timeout,
                   const std::atomic<bool>* interrupt = nullptr);

  // Failures are kAudioFailure, or kInterrupted when the interrupt flag
  // stopped the command. A partial wav_out is removed.
  RenderResult Generate(const std::string& silent_video, const std::string& wav_out) const;

  std::vector<std::string> BuildArgs(const std::string& silent_video,
                                     const std::string& wav_out) const;

 private:
  std::string command_;
  std::chrono::milliseconds timeout_;
  const std::atomic<bool>* interrupt_;
};

}  // namespace dossier::audio

#endif  // DOSSIER_AUDIO_EXTERNAL_SONIFIER_HPP_
