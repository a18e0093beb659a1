// Repository: Dossier-render
// Component: Render Error Taxonomy
// Purpose: Error codes and result type shared by every render stage.
// Copyright (c) 2025 Dossier

#include "dossier/RenderError.hpp"

namespace dossier {

const char* RenderErrorToString(RenderError error) {
  switch (error) {
    case RenderError::kNone:
      return "NONE";
    case RenderError::kInputError:
      return "INPUT_ERROR";
    case RenderError::kEncodeFailure:
      return "ENCODE_FAILURE";
    case RenderError::kAudioFailure:
      return "AUDIO_FAILURE";
    case RenderError::kBackpressureStall:
      return "BACKPRESSURE_STALL";
    case RenderError::kInterrupted:
      return "INTERRUPTED";
  }
  return "UNKNOWN";
}

}  // namespace dossier
