// Repository: Dossier-render
// Component: Video Encoder
// Purpose: Streams raw RGBA frames into the external encoder process and
//          publishes the result atomically.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_ENCODE_VIDEO_ENCODER_HPP_
#define DOSSIER_ENCODE_VIDEO_ENCODER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "dossier/RenderError.hpp"
#include "dossier/encode/ByteChannel.hpp"
#include "dossier/encode/EncoderConfig.hpp"
#include "dossier/encode/FrameSink.hpp"
#include "dossier/encode/FrameStreamWriter.hpp"
#include "dossier/encode/Subprocess.hpp"

namespace dossier::encode {

// Lifecycle: Open → Submit* → Finish, or Abort at any point. The encoder
// writes to TempPathFor(output); only a zero exit renames it onto the
// output path. Every failure path kills the child and unlinks the temp file.
//
// A backpressure stall is reported as kEncodeFailure with the stall named in
// the detail.
class VideoEncoder : public IFrameSink {
 public:
  // `interrupt` (may be null) is polled while a frame waits on the pipe and
  // while Finish() waits for the encoder to exit.
  VideoEncoder(EncoderConfig config, const std::atomic<bool>* interrupt = nullptr);
  ~VideoEncoder() override;

  VideoEncoder(const VideoEncoder&) = delete;
  VideoEncoder& operator=(const VideoEncoder&) = delete;

  RenderResult Open(const std::string& output_path);
  RenderResult Submit(const uint8_t* rgba, size_t len) override;
  RenderResult Finish();
  void Abort();

  bool IsOpen() const { return proc_ != nullptr; }
  const std::string& temp_path() const { return temp_path_; }
  const std::string& output_path() const { return output_path_; }
  int64_t frames_submitted() const { return frames_submitted_; }

 private:
  RenderResult FailAndAbort(RenderResult failure);

  EncoderConfig config_;
  const std::atomic<bool>* interrupt_;
  std::string output_path_;
  std::string temp_path_;
  std::unique_ptr<Subprocess> proc_;
  std::unique_ptr<PipeChannel> channel_;
  std::unique_ptr<FrameStreamWriter> writer_;
  int64_t frames_submitted_ = 0;
};

}  // namespace dossier::encode

#endif  // DOSSIER_ENCODE_VIDEO_ENCODER_HPP_
