// Repository: Dossier-render
// Component: Encoder Config
// Purpose: External encoder parameters, validation and command line.
// Copyright (c) 2025 Dossier

#include "dossier/encode/EncoderConfig.hpp"

namespace dossier::encode {

RenderResult ValidateEncoderConfig(const EncoderConfig& config) {
  if (config.encoder_path.empty()) {
    return RenderResult::Failure(RenderError::kEncodeFailure, "encoder path is empty");
  }
  if (config.width <= 0 || config.height <= 0) {
    return RenderResult::Failure(RenderError::kEncodeFailure,
                                 "invalid frame size " + std::to_string(config.width) + "x" +
                                     std::to_string(config.height));
  }
  if (config.output_pix_fmt == "yuv420p" && (config.width % 2 != 0 || config.height % 2 != 0)) {
    return RenderResult::Failure(RenderError::kEncodeFailure,
                                 "yuv420p output needs even dimensions, got " +
                                     std::to_string(config.width) + "x" +
                                     std::to_string(config.height));
  }
  if (!config.fps.IsValid()) {
    return RenderResult::Failure(RenderError::kEncodeFailure, "frame rate must be positive");
  }
  if (config.crf < 0 || config.crf > 51) {
    return RenderResult::Failure(RenderError::kEncodeFailure,
                                 "crf out of range 0..51: " + std::to_string(config.crf));
  }
  if (config.stall_timeout.count() <= 0) {
    return RenderResult::Failure(RenderError::kEncodeFailure, "stall timeout must be positive");
  }
  return RenderResult::Success();
}

std::vector<std::string> BuildEncoderArgs(const EncoderConfig& config,
                                          const std::string& output_path) {
  return {
      config.encoder_path,
      "-y",
      "-hide_banner",
      "-loglevel", "error",
      "-f", "rawvideo",
      "-vcodec", "rawvideo",
      "-s", std::to_string(config.width) + "x" + std::to_string(config.height),
      "-pix_fmt", "rgba",
      "-r", config.fps.ToArgString(),
      "-i", "-",
      "-an",
      "-c:v", config.video_codec,
      "-pix_fmt", config.output_pix_fmt,
      "-preset", config.preset,
      "-crf", std::to_string(config.crf),
      "-movflags", "+faststart",
      // The temp path has no extension to infer the container from.
      "-f", "mp4",
      output_path,
  };
}

}  // namespace dossier::encode
