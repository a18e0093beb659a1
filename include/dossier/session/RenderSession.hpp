// Repository: Dossier-render
// Component: Render Session
// Purpose: Owns one render's state and drives frames, audio, mux and fallback.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_SESSION_RENDER_SESSION_HPP_
#define DOSSIER_SESSION_RENDER_SESSION_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "dossier/RenderError.hpp"
#include "dossier/audio/Muxer.hpp"
#include "dossier/encode/FrameSink.hpp"
#include "dossier/profile/ProfileRecord.hpp"
#include "dossier/render/FrameBuffer.hpp"
#include "dossier/render/Rasterizer.hpp"
#include "dossier/render/TextRenderer.hpp"
#include "dossier/session/RenderConfig.hpp"
#include "dossier/timeline/Timeline.hpp"
#include "dossier/timeline/TimelineBuilder.hpp"
#include "dossier/world/ProceduralWorld.hpp"

namespace dossier::session {

// Collaborators the session would otherwise build from the config. Null
// members get the production implementation.
struct SessionDeps {
  std::unique_ptr<render::TextRenderer> text;  // default: StbTextRenderer
  std::unique_ptr<audio::IMuxer> muxer;        // default: LibavMuxer
  // Writes the synthesized track to the given WAV path. Runs on the audio
  // worker thread. Default: SynthesizeTrack + WriteWav.
  std::function<RenderResult(const std::string& wav_path)> audio_writer;
};

struct RenderOutcome {
  RenderResult result;
  std::string output_path;
  int64_t frames = 0;
  // False when the delivered file is the silent video.
  bool has_audio = false;
  double wall_seconds = 0.0;
};

// Single use: the world advances as frames are produced, so RenderVideo and
// Run may each be called once per session.
class RenderSession {
 public:
  // Loads and validates the Profile Record, builds the schedule, timeline,
  // world and rasterizer. Input problems come back as kInputError.
  static RenderResult Create(const RenderConfig& config, SessionDeps deps,
                             const std::atomic<bool>* interrupt,
                             std::unique_ptr<RenderSession>* out);

  ~RenderSession();

  RenderSession(const RenderSession&) = delete;
  RenderSession& operator=(const RenderSession&) = delete;

  // Frame loop: advance world, paint, fingerprint, submit. Stops at the
  // first sink failure or when the interrupt flag is raised.
  RenderResult RenderVideo(encode::IFrameSink* sink);

  // The whole job: audio worker, encoder, frame loop, mux with silent
  // fallback, intermediate cleanup and summary.
  RenderOutcome Run();

  // One line per block: index, start, duration, importance, content.
  std::vector<std::string> DescribeSchedule() const;

  const RenderConfig& config() const { return config_; }
  const profile::ProfileRecord& record() const { return record_; }
  const timeline::Schedule& schedule() const { return schedule_; }
  const timeline::Timeline& timeline() const { return *timeline_; }
  const world::ProceduralWorld& world() const { return *world_; }
  int64_t world_seed() const { return world_seed_; }
  // Filled by RenderVideo, one per frame.
  const std::vector<uint32_t>& frame_crcs() const { return frame_crcs_; }

  // Intermediate artifacts next to the output.
  std::string SilentVideoPath() const;
  std::string AudioTrackPath() const;

 private:
  RenderSession() = default;

  RenderResult WriteFrameCsv() const;
  RenderResult WriteSynthesizedTrack(const std::string& wav_path) const;
  void LogSummary(const RenderOutcome& outcome) const;

  RenderConfig config_;
  const std::atomic<bool>* interrupt_ = nullptr;
  std::string output_path_;

  profile::ProfileRecord record_;
  timeline::VariantConfig variant_;
  timeline::Schedule schedule_;
  std::unique_ptr<timeline::Timeline> timeline_;
  int64_t world_seed_ = 1;
  std::unique_ptr<world::ProceduralWorld> world_;
  std::unique_ptr<render::TextRenderer> text_;
  std::unique_ptr<render::Rasterizer> rasterizer_;
  std::unique_ptr<render::FrameBuffer> buffer_;
  std::unique_ptr<audio::IMuxer> muxer_;
  std::function<RenderResult(const std::string&)> audio_writer_;

  std::vector<uint32_t> frame_crcs_;
};

// Exit status for the command line: 0 ok, 2 input, 3 encode, 4 interrupted.
int ExitCodeFor(const RenderResult& result);

}  // namespace dossier::session

#endif  // DOSSIER_SESSION_RENDER_SESSION_HPP_
