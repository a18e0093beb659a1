// Repository: Dossier-render
// Component: WAV Writer
// Purpose: RIFF/PCM serialization of the synthesized track.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_AUDIO_WAV_WRITER_HPP_
#define DOSSIER_AUDIO_WAV_WRITER_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "dossier/RenderError.hpp"
#include "dossier/audio/AudioSynthesizer.hpp"

namespace dossier::audio {

constexpr size_t kWavHeaderBytes = 44;

// 44-byte canonical header (PCM, mono, 16 bit, little endian) followed by
// the samples.
std::vector<uint8_t> EncodeWav(const AudioTrack& track);

// Failures are kAudioFailure.
RenderResult WriteWav(const std::string& path, const AudioTrack& track);

}  // namespace dossier::audio

#endif  // DOSSIER_AUDIO_WAV_WRITER_HPP_
