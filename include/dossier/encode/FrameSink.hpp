// Repository: Dossier-render
// Component: Frame Sink
// Purpose: Consumer of finished RGBA frames, in order.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_ENCODE_FRAME_SINK_HPP_
#define DOSSIER_ENCODE_FRAME_SINK_HPP_

#include <cstddef>
#include <cstdint>

#include "dossier/RenderError.hpp"

namespace dossier::encode {

// The buffer is only valid for the duration of the call.
class IFrameSink {
 public:
  virtual ~IFrameSink() = default;
  virtual RenderResult Submit(const uint8_t* rgba, size_t len) = 0;
};

}  // namespace dossier::encode

#endif  // DOSSIER_ENCODE_FRAME_SINK_HPP_
