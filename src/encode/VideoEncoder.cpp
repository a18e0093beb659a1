// Repository: Dossier-render
// Component: Video Encoder
// Purpose: Streams raw RGBA frames into the external encoder process and
//          publishes the result atomically.
// Copyright (c) 2025 Dossier

#include "dossier/encode/VideoEncoder.hpp"

#include "dossier/util/AtomicFile.hpp"
#include "dossier/util/Logger.hpp"

namespace dossier::encode {

VideoEncoder::VideoEncoder(EncoderConfig config, const std::atomic<bool>* interrupt)
    : config_(std::move(config)), interrupt_(interrupt) {}

VideoEncoder::~VideoEncoder() {
  if (IsOpen()) Abort();
}

RenderResult VideoEncoder::Open(const std::string& output_path) {
  if (IsOpen()) {
    return RenderResult::Failure(RenderError::kEncodeFailure, "encoder already open");
  }
  RenderResult valid = ValidateEncoderConfig(config_);
  if (!valid.ok) return valid;

  output_path_ = output_path;
  temp_path_ = util::TempPathFor(output_path);
  util::DiscardFile(temp_path_);

  SubprocessOptions options;
  options.pipe_stdin = true;
  options.log_tag = "Encoder";
  std::string error;
  proc_ = Subprocess::Spawn(BuildEncoderArgs(config_, temp_path_), options, &error);
  if (!proc_) {
    return RenderResult::Failure(RenderError::kEncodeFailure,
                                 "cannot start encoder '" + config_.encoder_path + "': " + error);
  }

  channel_ = std::make_unique<PipeChannel>(proc_->ReleaseStdin(), "EncoderPipe");
  writer_ = std::make_unique<FrameStreamWriter>(channel_.get(), config_.stall_timeout, interrupt_);
  frames_submitted_ = 0;

  util::Logger::Info("[VideoEncoder] " + config_.encoder_path + " " +
                     std::to_string(config_.width) + "x" + std::to_string(config_.height) +
                     " @ " + config_.fps.ToArgString() + " fps -> " + output_path_);
  return RenderResult::Success();
}

RenderResult VideoEncoder::Submit(const uint8_t* rgba, size_t len) {
  if (!IsOpen()) {
    return RenderResult::Failure(RenderError::kEncodeFailure, "encoder not open");
  }
  if (len != config_.FrameBytes()) {
    return FailAndAbort(RenderResult::Failure(
        RenderError::kEncodeFailure, "frame size mismatch: got " + std::to_string(len) +
                                         " bytes, expected " +
                                         std::to_string(config_.FrameBytes())));
  }

  RenderResult r = writer_->WriteFrame(rgba, len);
  if (!r.ok) {
    if (r.error == RenderError::kBackpressureStall) {
      r = RenderResult::Failure(RenderError::kEncodeFailure,
                                std::string(RenderErrorToString(RenderError::kBackpressureStall)) +
                                    ": " + r.detail);
    } else if (r.error == RenderError::kEncodeFailure && proc_) {
      // Broken pipe: the child is gone or going; its exit status says why.
      SubprocessResult exit = proc_->Wait(config_.finish_timeout);
      r.detail += " (encoder " + exit.Describe() + ")";
    }
    return FailAndAbort(r);
  }
  ++frames_submitted_;
  return RenderResult::Success();
}

RenderResult VideoEncoder::Finish() {
  if (!IsOpen()) {
    return RenderResult::Failure(RenderError::kEncodeFailure, "encoder not open");
  }
  channel_->Close();
  SubprocessResult exit = proc_->Wait(config_.finish_timeout, interrupt_);
  if (exit.interrupted) {
    return FailAndAbort(RenderResult::Failure(RenderError::kInterrupted,
                                              "interrupted while the encoder finished"));
  }
  if (!exit.ok()) {
    return FailAndAbort(RenderResult::Failure(RenderError::kEncodeFailure,
                                              "encoder " + exit.Describe()));
  }

  std::string error;
  if (!util::FileExists(temp_path_) || !util::CommitFile(temp_path_, output_path_, &error)) {
    return FailAndAbort(RenderResult::Failure(
        RenderError::kEncodeFailure,
        "encoder output not published: " + (error.empty() ? "missing " + temp_path_ : error)));
  }

  util::Logger::Info("[VideoEncoder] wrote " + std::to_string(frames_submitted_) + " frames to " +
                     output_path_);
  writer_.reset();
  channel_.reset();
  proc_.reset();
  return RenderResult::Success();
}

void VideoEncoder::Abort() {
  if (channel_) channel_->Close();
  if (proc_) {
    proc_->Kill();
    proc_->Wait(config_.finish_timeout);
  }
  writer_.reset();
  channel_.reset();
  proc_.reset();
  if (!temp_path_.empty()) util::DiscardFile(temp_path_);
}

RenderResult VideoEncoder::FailAndAbort(RenderResult failure) {
  util::Logger::Error("[VideoEncoder] " + failure.detail);
  Abort();
  return failure;
}

}  // namespace dossier::encode
