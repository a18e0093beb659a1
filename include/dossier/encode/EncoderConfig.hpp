// Repository: Dossier-render
// Component: Encoder Config
// Purpose: External encoder parameters, validation and command line.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_ENCODE_ENCODER_CONFIG_HPP_
#define DOSSIER_ENCODE_ENCODER_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "dossier/RenderError.hpp"
#include "dossier/timing/RationalFps.hpp"

namespace dossier::encode {

struct EncoderConfig {
  std::string encoder_path = "ffmpeg";

  // Input geometry: raw RGBA frames.
  int width = 1920;
  int height = 1080;
  timing::RationalFps fps{30, 1};

  // Output stream.
  std::string video_codec = "libx264";
  std::string output_pix_fmt = "yuv420p";
  std::string preset = "medium";
  int crf = 18;

  // No accepted byte for this long while a frame is pending → stall.
  std::chrono::milliseconds stall_timeout{30000};

  // Bound on the encoder's exit after stdin is closed.
  std::chrono::milliseconds finish_timeout{120000};

  size_t FrameBytes() const {
    return static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
  }
};

// Rejects non-positive geometry or frame rate, odd dimensions for 4:2:0
// output, crf outside 0..51 and an empty encoder path.
RenderResult ValidateEncoderConfig(const EncoderConfig& config);

// ffmpeg -y -f rawvideo -vcodec rawvideo -s WxH -pix_fmt rgba -r FPS -i -
//   -an -c:v CODEC -pix_fmt FMT -preset P -crf N -movflags +faststart -f mp4 OUT
std::vector<std::string> BuildEncoderArgs(const EncoderConfig& config,
                                          const std::string& output_path);

}  // namespace dossier::encode

#endif  // DOSSIER_ENCODE_ENCODER_CONFIG_HPP_
