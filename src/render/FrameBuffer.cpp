// Repository: Dossier-render
// Component: Frame Buffer
// Purpose: Fixed-size RGBA8 pixel buffer, reused for every frame.
// Copyright (c) 2025 Dossier

#include "dossier/render/FrameBuffer.hpp"

#include <zlib.h>

#include <algorithm>
#include <limits>

namespace dossier::render {

FrameBuffer::FrameBuffer(int width, int height)
    : width_(std::max(width, 0)),
      height_(std::max(height, 0)),
      pixels_(static_cast<size_t>(width_) * static_cast<size_t>(height_) * 4, 0) {}

void FrameBuffer::Clear(uint8_t r, uint8_t g, uint8_t b) {
  uint8_t* p = pixels_.data();
  const size_t count = pixels_.size() / 4;
  for (size_t i = 0; i < count; ++i, p += 4) {
    p[0] = r;
    p[1] = g;
    p[2] = b;
    p[3] = 255;
  }
}

uint32_t FrameBuffer::Crc32() const {
  return Crc32Bytes(pixels_.data(), pixels_.size());
}

uint32_t Crc32Bytes(const uint8_t* data, size_t size) {
  uLong crc = crc32(0L, Z_NULL, 0);
  if (data == nullptr) return static_cast<uint32_t>(crc);
  // crc32() takes a uInt length; feed large buffers in chunks.
  constexpr size_t kChunk = std::numeric_limits<uInt>::max();
  while (size > 0) {
    const size_t n = std::min(size, kChunk);
    crc = crc32(crc, data, static_cast<uInt>(n));
    data += n;
    size -= n;
  }
  return static_cast<uint32_t>(crc);
}

}  // namespace dossier::render
