// Frame sink that keeps a CRC-32 per submitted frame and can fail on demand.

#pragma once

#include <cstdint>
#include <vector>

#include "dossier/RenderError.hpp"
#include "dossier/encode/FrameSink.hpp"
#include "dossier/render/FrameBuffer.hpp"

namespace dossier::test {

class RecordingFrameSink : public encode::IFrameSink {
 public:
  // fail_at < 0: never fail.
  explicit RecordingFrameSink(int64_t fail_at = -1) : fail_at_(fail_at) {}

  RenderResult Submit(const uint8_t* rgba, size_t len) override {
    if (fail_at_ >= 0 && static_cast<int64_t>(crcs_.size()) == fail_at_) {
      return RenderResult::Failure(RenderError::kEncodeFailure, "sink failure injected");
    }
    crcs_.push_back(render::Crc32Bytes(rgba, len));
    last_len_ = len;
    return RenderResult::Success();
  }

  const std::vector<uint32_t>& crcs() const { return crcs_; }
  size_t last_len() const { return last_len_; }

 private:
  int64_t fail_at_;
  std::vector<uint32_t> crcs_;
  size_t last_len_ = 0;
};

}  // namespace dossier::test
