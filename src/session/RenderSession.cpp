// Repository: Dossier-render
// Component: Render Session
// Purpose: Owns one render's state and drives frames, audio, mux and fallback.
// Copyright (c) 2025 Dossier

#include "dossier/session/RenderSession.hpp"

#include <chrono>
#include <cstdio>
#include <exception>
#include <thread>

#include "dossier/audio/AudioSynthesizer.hpp"
#include "dossier/audio/ExternalSonifier.hpp"
#include "dossier/audio/WavWriter.hpp"
#include "dossier/encode/VideoEncoder.hpp"
#include "dossier/profile/ProfileLoader.hpp"
#include "dossier/render/StbTextRenderer.hpp"
#include "dossier/session/ProgressReporter.hpp"
#include "dossier/util/AtomicFile.hpp"
#include "dossier/util/Logger.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier::session {

namespace {

bool Interrupted(const std::atomic<bool>* flag) {
  return flag && flag->load(std::memory_order_acquire);
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

RenderResult RenderSession::Create(const RenderConfig& config, SessionDeps deps,
                                   const std::atomic<bool>* interrupt,
                                   std::unique_ptr<RenderSession>* out) {
  RenderResult valid = ValidateRenderConfig(config);
  if (!valid.ok) return valid;

  std::unique_ptr<RenderSession> session(new RenderSession());
  session->config_ = config;
  session->interrupt_ = interrupt;
  session->output_path_ = config.ResolvedOutputPath();

  util::Logger::Info("[Render] Reading: " + config.input_path);
  RenderResult loaded = profile::LoadProfileRecord(config.input_path, &session->record_);
  if (!loaded.ok) return loaded;

  const profile::ProfileRecord& record = session->record_;
  util::Logger::Info("[Render] Profile: " + record.profile.device.device_guess + " | " +
                     record.profile.location.country);
  util::Logger::Info("[Render] Entropy: " + util::FormatFixed(record.entropy.total_bits, 1) +
                     " bits | " + util::FormatNumber(record.uniqueness.percent) + "% unique");
  util::Logger::Info("[Render] CPM: $" + util::FormatFixed(record.pricing.cpm, 2));

  session->variant_ = timeline::VariantConfigFor(config.variant);
  if (!config.backdrop) session->variant_.world_backdrop = false;

  timeline::TimelineBuilder builder(session->variant_);
  session->schedule_ = builder.Build(record);
  if (session->schedule_.blocks.empty()) {
    return RenderResult::Failure(RenderError::kInputError,
                                 "profile produced no blocks for variant " +
                                     std::string(timeline::VariantToString(config.variant)));
  }
  util::Logger::Info("[Render] " + std::to_string(session->schedule_.blocks.size()) +
                     " thought blocks generated (" +
                     timeline::VariantToString(config.variant) + ")");

  const timing::RationalFps fps(config.fps, 1);
  session->timeline_ = std::make_unique<timeline::Timeline>(
      session->schedule_.blocks, session->variant_.timing, fps, session->variant_.head_frames,
      session->variant_.tail_frames);

  session->world_seed_ = config.world_seed.value_or(session->schedule_.seed);
  session->world_ = std::make_unique<world::ProceduralWorld>(world::ProceduralWorld::Generate(
      record, session->world_seed_, config.width, config.height));

  if (deps.text) {
    session->text_ = std::move(deps.text);
  } else {
    std::string error;
    session->text_ = render::StbTextRenderer::Create(config.display_font, config.mono_font, &error);
    if (!session->text_) {
      return RenderResult::Failure(RenderError::kInputError, "fonts: " + error);
    }
  }

  session->rasterizer_ = std::make_unique<render::Rasterizer>(
      session->variant_, session->text_.get(), config.width, config.height,
      record.DisplayVisitorId());
  session->buffer_ = std::make_unique<render::FrameBuffer>(config.width, config.height);
  session->muxer_ =
      deps.muxer ? std::move(deps.muxer) : std::make_unique<audio::LibavMuxer>(interrupt);
  session->audio_writer_ = std::move(deps.audio_writer);

  const int64_t total = session->timeline_->TotalFrames();
  util::Logger::Info("[Render] Rendering " + std::to_string(total) + " frames (" +
                     util::FormatFixed(fps.SecondsFromFrames(total), 1) + "s) at " +
                     std::to_string(config.width) + "x" + std::to_string(config.height) + " @ " +
                     std::to_string(config.fps) + "fps");
  util::Logger::Info("[Render] Output: " + session->output_path_);

  *out = std::move(session);
  return RenderResult::Success();
}

RenderSession::~RenderSession() = default;

std::string RenderSession::SilentVideoPath() const { return output_path_ + ".silent.mp4"; }

std::string RenderSession::AudioTrackPath() const { return output_path_ + ".wav"; }

std::vector<std::string> RenderSession::DescribeSchedule() const {
  std::vector<std::string> out;
  for (size_t i = 0; i < schedule_.blocks.size(); ++i) {
    const timeline::Block& block = schedule_.blocks[i];
    const timeline::BlockTiming& t = timeline_->TimingOf(i);
    std::string content;
    if (block.IsScene()) {
      content = std::string("scene:") + timeline::SceneKindToString(timeline::KindOf(*block.scene));
    } else {
      content = util::Join(block.lines, " / ");
    }
    out.push_back("#" + std::to_string(i) + "  start=" + std::to_string(t.start) +
                  "  frames=" + std::to_string(t.duration) + "  " +
                  timeline::ImportanceToString(block.importance) + "  " + content);
  }
  return out;
}

// =============================================================================
// Frame loop
// =============================================================================

RenderResult RenderSession::RenderVideo(encode::IFrameSink* sink) {
  if (!sink) {
    return RenderResult::Failure(RenderError::kEncodeFailure, "no frame sink");
  }
  const int64_t total = timeline_->TotalFrames();
  const bool fingerprint = !config_.frame_csv_path.empty();
  frame_crcs_.clear();
  if (fingerprint) frame_crcs_.reserve(static_cast<size_t>(total));

  ProgressReporter progress(total);
  for (int64_t frame = 0; frame < total; ++frame) {
    if (Interrupted(interrupt_)) {
      return RenderResult::Failure(RenderError::kInterrupted,
                                   "interrupted at frame " + std::to_string(frame));
    }
    world_->Advance();
    rasterizer_->Paint(buffer_.get(), *world_, *timeline_, schedule_.blocks, frame);
    if (fingerprint) frame_crcs_.push_back(buffer_->Crc32());

    RenderResult r = sink->Submit(buffer_->data(), buffer_->size_bytes());
    if (!r.ok) return r;
    progress.OnFrame(frame);
  }
  return RenderResult::Success();
}

RenderResult RenderSession::WriteFrameCsv() const {
  std::string text = "frame,crc32\n";
  char row[48];
  for (size_t i = 0; i < frame_crcs_.size(); ++i) {
    std::snprintf(row, sizeof(row), "%zu,%08x\n", i, static_cast<unsigned>(frame_crcs_[i]));
    text += row;
  }
  std::string error;
  if (!util::WriteFileAtomically(config_.frame_csv_path,
                                 std::vector<uint8_t>(text.begin(), text.end()), &error)) {
    return RenderResult::Failure(RenderError::kEncodeFailure, "frame csv: " + error);
  }
  return RenderResult::Success();
}

RenderResult RenderSession::WriteSynthesizedTrack(const std::string& wav_path) const {
  audio::AudioTrack track = audio::SynthesizeTrack(schedule_.blocks, *timeline_, schedule_.seed);
  return audio::WriteWav(wav_path, track);
}

// =============================================================================
// Whole job
// =============================================================================

RenderOutcome RenderSession::Run() {
  const auto start = std::chrono::steady_clock::now();
  RenderOutcome outcome;
  outcome.output_path = output_path_;
  outcome.frames = timeline_->TotalFrames();
  auto finish = [&outcome, start](RenderResult result) {
    outcome.result = std::move(result);
    outcome.wall_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return outcome;
  };

  if (config_.dry_run) {
    for (const std::string& line : DescribeSchedule()) util::Logger::Info("[Schedule] " + line);
    return finish(RenderResult::Success());
  }

  const std::string silent_path = SilentVideoPath();
  const std::string wav_path = AudioTrackPath();
  util::ScopedFileRemover silent_cleanup(silent_path);
  util::ScopedFileRemover wav_cleanup(wav_path);

  // The synthesized track depends only on the schedule, so it is produced
  // while frames render. A sonifier needs the finished video and runs after.
  RenderResult audio_result =
      RenderResult::Failure(RenderError::kAudioFailure, "audio not produced");
  std::thread audio_worker;
  if (config_.audio && config_.sonifier_command.empty()) {
    audio_worker = std::thread([this, &audio_result, wav_path]() {
      util::Logger::Info("[Render] Generating audio...");
      try {
        audio_result =
            audio_writer_ ? audio_writer_(wav_path) : WriteSynthesizedTrack(wav_path);
      } catch (const std::exception& e) {
        audio_result = RenderResult::Failure(RenderError::kAudioFailure,
                                             std::string("audio synthesis: ") + e.what());
      }
    });
  }
  auto join_audio = [&audio_worker]() {
    if (audio_worker.joinable()) audio_worker.join();
  };

  encode::EncoderConfig encoder_config;
  encoder_config.encoder_path = config_.encoder_path;
  encoder_config.width = config_.width;
  encoder_config.height = config_.height;
  encoder_config.fps = timing::RationalFps(config_.fps, 1);
  encoder_config.preset = config_.preset;
  encoder_config.crf = config_.crf;
  encoder_config.stall_timeout = config_.stall_timeout;

  encode::VideoEncoder encoder(encoder_config, interrupt_);
  RenderResult video = encoder.Open(silent_path);
  if (video.ok) video = RenderVideo(&encoder);
  if (video.ok) {
    video = encoder.Finish();
  } else {
    encoder.Abort();
  }
  join_audio();
  if (!video.ok) {
    util::Logger::Error("[Render] " + std::string(RenderErrorToString(video.error)) + ": " +
                        video.detail);
    return finish(video);
  }

  if (!config_.frame_csv_path.empty()) {
    RenderResult csv = WriteFrameCsv();
    if (!csv.ok) util::Logger::Warn("[Render] " + csv.detail);
  }

  if (config_.audio && !config_.sonifier_command.empty()) {
    audio::ExternalSonifier sonifier(config_.sonifier_command, config_.sonifier_timeout,
                                     interrupt_);
    audio_result = sonifier.Generate(silent_path, wav_path);
  }

  if (config_.audio) {
    bool muxed = false;
    if (audio_result.ok && !Interrupted(interrupt_)) {
      util::Logger::Info("[Render] Merging video + audio...");
      audio::MuxRequest request;
      request.video_path = silent_path;
      request.audio_path = wav_path;
      request.output_path = output_path_;
      request.timeout = config_.mux_timeout;
      audio_result = muxer_->Mux(request);
      muxed = audio_result.ok;
    }
    // A completed mux has already published the output.
    if (!muxed && Interrupted(interrupt_)) {
      return finish(
          RenderResult::Failure(RenderError::kInterrupted, "interrupted before audio was muxed"));
    }
    if (muxed) {
      outcome.has_audio = true;
    } else {
      util::Logger::Warn("[Render] AUDIO_FAILURE: " + audio_result.detail +
                         "; delivering silent video");
    }
  }

  if (!outcome.has_audio) {
    std::string error;
    if (!util::CommitFile(silent_path, output_path_, &error)) {
      return finish(RenderResult::Failure(RenderError::kEncodeFailure, error));
    }
  }

  finish(RenderResult::Success());
  LogSummary(outcome);
  return outcome;
}

void RenderSession::LogSummary(const RenderOutcome& outcome) const {
  const int64_t size = util::FileSize(outcome.output_path);
  const double mb = size > 0 ? static_cast<double>(size) / 1024.0 / 1024.0 : 0.0;
  util::Logger::Info("[Render] Output: " + outcome.output_path +
                     (outcome.has_audio ? "" : " (silent)"));
  util::Logger::Info("[Render] Size:   " + util::FormatFixed(mb, 1) + " MB");
  util::Logger::Info("[Render] Time:   " + util::FormatFixed(outcome.wall_seconds, 1) + "s");
}

int ExitCodeFor(const RenderResult& result) {
  if (result.ok) return 0;
  switch (result.error) {
    case RenderError::kNone:
      return 0;
    case RenderError::kInputError:
      return 2;
    case RenderError::kEncodeFailure:
    case RenderError::kBackpressureStall:
    case RenderError::kAudioFailure:
      return 3;
    case RenderError::kInterrupted:
      return 4;
  }
  return 3;
}

}  // namespace dossier::session
