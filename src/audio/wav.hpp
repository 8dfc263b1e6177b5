// src/audio/wav.hpp
// Decode RIFF/WAVE audio into interleaved float samples in [-1, 1].
// Backed by miniaudio's decoder (WAV backend only).
//
// Accepted sample formats: float32, int16, int24, int32. Integer formats
// are scaled by their full-scale magnitude (1/32768, 1/8388608,
// 1/2147483648). Anything else throws common::Error{UnsupportedFormat};
// undecodable bytes throw {ContainerParse}.

#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace audio {

struct WavData {
  std::vector<float> samples; // interleaved, channels per frame
  std::uint32_t sampleRate = 0;
  std::uint16_t channels = 0;

  std::size_t frames() const {
    return channels ? samples.size() / channels : 0;
  }
  float duration_seconds() const {
    return sampleRate ? float(frames()) / float(sampleRate) : 0.0f;
  }
};

WavData decode_wav(const std::vector<std::uint8_t> &bytes);

// Reads the file (common::Error{Io} on failure) and decodes it.
WavData read_wav(const std::filesystem::path &path);

} // namespace audio
