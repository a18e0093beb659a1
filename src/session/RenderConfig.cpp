// Repository: Dossier-render
// Component: Render Config
// Purpose: Everything one render needs to know, with defaults.
// Copyright (c) 2025 Dossier

#include "dossier/session/RenderConfig.hpp"

#include <cstdlib>

#include "dossier/util/TextFormat.hpp"

namespace dossier::session {

namespace {

void OverrideFromEnv(const char* name, std::string* field) {
  const char* value = std::getenv(name);
  if (value && *value) *field = value;
}

}  // namespace

std::string RenderConfig::ResolvedOutputPath() const {
  return output_path.empty() ? DefaultOutputPath(input_path) : output_path;
}

std::string DefaultOutputPath(const std::string& input_path) {
  constexpr size_t kSuffixLen = 5;  // ".json"
  if (input_path.size() >= kSuffixLen &&
      util::ToLowerAscii(input_path.substr(input_path.size() - kSuffixLen)) == ".json") {
    return input_path.substr(0, input_path.size() - kSuffixLen) + ".mp4";
  }
  return input_path + ".mp4";
}

void ApplyEnvironmentOverrides(RenderConfig* config) {
  OverrideFromEnv("DOSSIER_ENCODER", &config->encoder_path);
  OverrideFromEnv("DOSSIER_FONT", &config->display_font);
  OverrideFromEnv("DOSSIER_MONO_FONT", &config->mono_font);
}

RenderResult ValidateRenderConfig(const RenderConfig& config) {
  if (config.input_path.empty()) {
    return RenderResult::Failure(RenderError::kInputError, "no input path");
  }
  if (config.width < 2 || config.height < 2) {
    return RenderResult::Failure(RenderError::kInputError,
                                 "frame size too small: " + std::to_string(config.width) + "x" +
                                     std::to_string(config.height));
  }
  if (config.fps <= 0) {
    return RenderResult::Failure(RenderError::kInputError,
                                 "fps must be positive, got " + std::to_string(config.fps));
  }
  if (config.ResolvedOutputPath() == config.input_path) {
    return RenderResult::Failure(RenderError::kInputError,
                                 "output path equals input path: " + config.input_path);
  }
  return RenderResult::Success();
}

}  // namespace dossier::session
