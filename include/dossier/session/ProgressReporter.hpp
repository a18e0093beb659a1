// Repository: Dossier-render
// Component: Progress Reporter
// Purpose: Periodic frame-loop progress lines.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_SESSION_PROGRESS_REPORTER_HPP_
#define DOSSIER_SESSION_PROGRESS_REPORTER_HPP_

#include <chrono>
#include <cstdint>
#include <string>

namespace dossier::session {

// Logs "[ pct%]  f/total frames  elapsed  fps" for every 30th frame and the
// last one.
class ProgressReporter {
 public:
  static constexpr int64_t kInterval = 30;

  explicit ProgressReporter(int64_t total_frames);

  // Called after `frame` has been submitted.
  void OnFrame(int64_t frame);

  double ElapsedSeconds() const;

  static std::string FormatLine(int64_t frame, int64_t total_frames, double elapsed_sec);

 private:
  int64_t total_frames_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace dossier::session

#endif  // DOSSIER_SESSION_PROGRESS_REPORTER_HPP_
