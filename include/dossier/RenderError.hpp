// Repository: Dossier-render
// Component: Render Error Taxonomy
// Purpose: Error codes and result type shared by every render stage.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_RENDER_ERROR_HPP_
#define DOSSIER_RENDER_ERROR_HPP_

#include <string>
#include <utility>

namespace dossier {

// =============================================================================
// Error Codes
// =============================================================================

enum class RenderError {
  // No error
  kNone = 0,

  // Malformed or missing Profile Record fields beyond the tolerated-optional
  // set. Surfaced before the first frame; nothing is written.
  kInputError,

  // External encoder could not be started, rejected its parameters, or
  // exited non-zero. Fatal; no partial output is left at the target path.
  kEncodeFailure,

  // Audio synthesis, sonifier or mux failed or timed out. Recoverable:
  // the silent video is delivered instead.
  kAudioFailure,

  // Encoder input channel never drained within the stall timeout.
  // Escalated as an encode failure by the pipeline.
  kBackpressureStall,

  // SIGINT / SIGTERM observed; encoder killed, partial output removed.
  kInterrupted,
};

const char* RenderErrorToString(RenderError error);

// Result of a render stage. Mirrors the success/failure factory style used by
// validation results: callers check `ok`, then log `detail`.
struct RenderResult {
  bool ok = true;
  RenderError error = RenderError::kNone;
  std::string detail;

  static RenderResult Success() { return RenderResult{}; }

  static RenderResult Failure(RenderError err, std::string detail_msg) {
    RenderResult r;
    r.ok = false;
    r.error = err;
    r.detail = std::move(detail_msg);
    return r;
  }
};

}  // namespace dossier

#endif  // DOSSIER_RENDER_ERROR_HPP_
