// Repository: Dossier-render
// Component: WAV Writer
// Purpose: RIFF/PCM serialization of the synthesized track.
// Copyright (c) 2025 Dossier

#include "dossier/audio/WavWriter.hpp"

#include "dossier/util/AtomicFile.hpp"

namespace dossier::audio {

namespace {

void PutTag(std::vector<uint8_t>& out, const char* tag) {
  out.insert(out.end(), tag, tag + 4);
}

void PutU16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
  for (int shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<uint8_t>((v >> shift) & 0xFF));
  }
}

}  // namespace

std::vector<uint8_t> EncodeWav(const AudioTrack& track) {
  constexpr uint16_t kChannels = 1;
  constexpr uint16_t kBitsPerSample = 16;
  constexpr uint16_t kBlockAlign = kChannels * kBitsPerSample / 8;

  const uint32_t data_bytes = static_cast<uint32_t>(track.samples.size() * kBlockAlign);
  const uint32_t rate = static_cast<uint32_t>(track.sample_rate);

  std::vector<uint8_t> out;
  out.reserve(kWavHeaderBytes + data_bytes);
  PutTag(out, "RIFF");
  PutU32(out, 36 + data_bytes);
  PutTag(out, "WAVE");
  PutTag(out, "fmt ");
  PutU32(out, 16);
  PutU16(out, 1);  // PCM
  PutU16(out, kChannels);
  PutU32(out, rate);
  PutU32(out, rate * kBlockAlign);
  PutU16(out, kBlockAlign);
  PutU16(out, kBitsPerSample);
  PutTag(out, "data");
  PutU32(out, data_bytes);

  for (int16_t s : track.samples) {
    PutU16(out, static_cast<uint16_t>(s));
  }
  return out;
}

RenderResult WriteWav(const std::string& path, const AudioTrack& track) {
  std::string error;
  if (!util::WriteFileAtomically(path, EncodeWav(track), &error)) {
    return RenderResult::Failure(RenderError::kAudioFailure, "wav: " + error);
  }
  return RenderResult::Success();
}

}  // namespace dossier::audio
