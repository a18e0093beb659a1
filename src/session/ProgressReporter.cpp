// Repository: Dossier-render
// Component: Progress Reporter
// Purpose: Periodic frame-loop progress lines.
// Copyright (c) 2025 Dossier

#include "dossier/session/ProgressReporter.hpp"

#include <algorithm>

#include "dossier/util/Logger.hpp"
#include "dossier/util/TextFormat.hpp"

namespace dossier::session {

ProgressReporter::ProgressReporter(int64_t total_frames)
    : total_frames_(total_frames), start_(std::chrono::steady_clock::now()) {}

void ProgressReporter::OnFrame(int64_t frame) {
  if (frame % kInterval != 0 && frame != total_frames_ - 1) return;
  util::Logger::Info("[Render] " + FormatLine(frame, total_frames_, ElapsedSeconds()));
}

double ProgressReporter::ElapsedSeconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

std::string ProgressReporter::FormatLine(int64_t frame, int64_t total_frames, double elapsed_sec) {
  const double pct =
      total_frames > 0 ? static_cast<double>(frame) / static_cast<double>(total_frames) * 100.0
                       : 100.0;
  // Rate over at least one millisecond.
  const double fps = static_cast<double>(frame) / std::max(elapsed_sec, 0.001);
  return "[" + util::PadLeft(util::FormatFixed(pct, 0), 3, ' ') + "%]  " + std::to_string(frame) +
         "/" + std::to_string(total_frames) + " frames  " + util::FormatFixed(elapsed_sec, 1) +
         "s  " + util::FormatFixed(fps, 1) + " fps";
}

}  // namespace dossier::session
