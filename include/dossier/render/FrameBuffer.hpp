// Repository: Dossier-render
// Component: Frame Buffer
// Purpose: Fixed-size RGBA8 pixel buffer, reused for every frame.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_RENDER_FRAME_BUFFER_HPP_
#define DOSSIER_RENDER_FRAME_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace dossier::render {

// Row-major, 4 bytes per pixel (R, G, B, A), no padding. Alpha is always
// 255 after a paint: frames are composited onto an opaque background.
class FrameBuffer {
 public:
  FrameBuffer(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }

  uint8_t* data() { return pixels_.data(); }
  const uint8_t* data() const { return pixels_.data(); }
  size_t size_bytes() const { return pixels_.size(); }

  uint8_t* PixelAt(int x, int y) { return &pixels_[(static_cast<size_t>(y) * width_ + x) * 4]; }
  const uint8_t* PixelAt(int x, int y) const {
    return &pixels_[(static_cast<size_t>(y) * width_ + x) * 4];
  }

  void Clear(uint8_t r, uint8_t g, uint8_t b);

  // zlib CRC-32 over the whole buffer.
  uint32_t Crc32() const;

 private:
  int width_;
  int height_;
  std::vector<uint8_t> pixels_;
};

// CRC-32 of an arbitrary byte range.
uint32_t Crc32Bytes(const uint8_t* data, size_t size);

}  // namespace dossier::render

#endif  // DOSSIER_RENDER_FRAME_BUFFER_HPP_
