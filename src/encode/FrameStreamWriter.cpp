// Repository: Dossier-render
// Component: Frame Stream Writer
// Purpose: Pushes whole frames through a byte channel, suspending on
//          backpressure; never drops or reorders.
// Copyright (c) 2025 Dossier

#include "dossier/encode/FrameStreamWriter.hpp"

#include <algorithm>

namespace dossier::encode {

FrameStreamWriter::FrameStreamWriter(IByteChannel* channel,
                                     std::chrono::milliseconds stall_timeout,
                                     const std::atomic<bool>* interrupt)
    : channel_(channel), stall_timeout_(stall_timeout), interrupt_(interrupt) {}

RenderResult FrameStreamWriter::WriteFrame(const uint8_t* data, size_t len) {
  using Clock = std::chrono::steady_clock;
  size_t offset = 0;
  auto last_progress = Clock::now();

  while (offset < len) {
    if (interrupt_ != nullptr && interrupt_->load(std::memory_order_acquire)) {
      return RenderResult::Failure(RenderError::kInterrupted, "interrupted while writing frame " +
                                                                  std::to_string(stats_.frames));
    }

    const int64_t n = channel_->TryWrite(data + offset, len - offset);
    if (n < 0) {
      return RenderResult::Failure(RenderError::kEncodeFailure,
                                   "encoder input closed at frame " +
                                       std::to_string(stats_.frames) + ": " +
                                       channel_->last_error());
    }
    if (n > 0) {
      offset += static_cast<size_t>(n);
      stats_.bytes += static_cast<uint64_t>(n);
      last_progress = Clock::now();
      continue;
    }

    ++stats_.full_events;
    const auto waited =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - last_progress);
    if (waited >= stall_timeout_) {
      return RenderResult::Failure(
          RenderError::kBackpressureStall,
          "encoder input did not drain within " + std::to_string(stall_timeout_.count()) +
              " ms (frame " + std::to_string(stats_.frames) + ", " +
              std::to_string(offset) + "/" + std::to_string(len) + " bytes)");
    }
    channel_->WaitWritable(std::min(kPollSlice, stall_timeout_ - waited));
  }

  ++stats_.frames;
  return RenderResult::Success();
}

}  // namespace dossier::encode
