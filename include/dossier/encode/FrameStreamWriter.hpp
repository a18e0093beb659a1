// Repository: Dossier-render
// Component: Frame Stream Writer
// Purpose: Pushes whole frames through a byte channel, suspending on
//          backpressure; never drops or reorders.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_ENCODE_FRAME_STREAM_WRITER_HPP_
#define DOSSIER_ENCODE_FRAME_STREAM_WRITER_HPP_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include "dossier/RenderError.hpp"
#include "dossier/encode/ByteChannel.hpp"

namespace dossier::encode {

struct FrameStreamStats {
  uint64_t frames = 0;
  uint64_t bytes = 0;
  uint64_t full_events = 0;  // TryWrite calls that accepted nothing
};

// The stall clock restarts whenever the channel accepts at least one byte:
// a slow encoder is fine, a stuck one is not.
class FrameStreamWriter {
 public:
  FrameStreamWriter(IByteChannel* channel, std::chrono::milliseconds stall_timeout,
                    const std::atomic<bool>* interrupt = nullptr);

  // Returns once every byte has been accepted. Failures:
  //   kBackpressureStall  no progress within the stall timeout
  //   kInterrupted        interrupt flag observed while waiting
  //   kEncodeFailure      channel closed or broken
  RenderResult WriteFrame(const uint8_t* data, size_t len);

  const FrameStreamStats& stats() const { return stats_; }

 private:
  IByteChannel* channel_;
  std::chrono::milliseconds stall_timeout_;
  const std::atomic<bool>* interrupt_;
  FrameStreamStats stats_;

  static constexpr std::chrono::milliseconds kPollSlice{100};
};

}  // namespace dossier::encode

#endif  // DOSSIER_ENCODE_FRAME_STREAM_WRITER_HPP_
