// Repository: Dossier-render
// Component: External Sonifier
// Purpose: Runs a user-supplied command that scores the silent video.
// Copyright (c) 2025 Dossier

#include "dossier/audio/ExternalSonifier.hpp"

#include <sstream>

#include "dossier/audio/WavWriter.hpp"
#include "dossier/encode/Subprocess.hpp"
#include "dossier/util/AtomicFile.hpp"
#include "dossier/util/Logger.hpp"

namespace dossier::audio {

ExternalSonifier::ExternalSonifier(std::string command, std::chrono::milliseconds timeout,
                                   const std::atomic<bool>* interrupt)
    : command_(std::move(command)), timeout_(timeout), interrupt_(interrupt) {}

std::vector<std::string> ExternalSonifier::BuildArgs(const std::string& silent_video,
                                                     const std::string& wav_out) const {
  std::vector<std::string> argv;
  std::istringstream words(command_);
  std::string word;
  while (words >> word) argv.push_back(word);
  argv.push_back(silent_video);
  argv.push_back(wav_out);
  return argv;
}

RenderResult ExternalSonifier::Generate(const std::string& silent_video,
                                        const std::string& wav_out) const {
  std::vector<std::string> argv = BuildArgs(silent_video, wav_out);
  if (argv.size() < 3) {
    return RenderResult::Failure(RenderError::kAudioFailure, "sonifier command is empty");
  }

  util::DiscardFile(wav_out);
  util::Logger::Info("[Sonifier] running " + argv.front());

  std::string spawn_error;
  encode::SubprocessResult result =
      encode::RunSubprocess(argv, timeout_, &spawn_error, "Sonifier", interrupt_);
  if (!spawn_error.empty()) {
    return RenderResult::Failure(RenderError::kAudioFailure,
                                 "sonifier '" + argv.front() + "': " + spawn_error);
  }
  if (result.interrupted) {
    util::DiscardFile(wav_out);
    return RenderResult::Failure(RenderError::kInterrupted, "sonifier interrupted");
  }
  if (!result.ok()) {
    util::DiscardFile(wav_out);
    return RenderResult::Failure(RenderError::kAudioFailure, "sonifier " + result.Describe());
  }

  const int64_t size = util::FileSize(wav_out);
  if (size <= static_cast<int64_t>(kWavHeaderBytes)) {
    util::DiscardFile(wav_out);
    return RenderResult::Failure(RenderError::kAudioFailure,
                                 "sonifier produced no audio at " + wav_out);
  }
  return RenderResult::Success();
}

}  // namespace dossier::audio
