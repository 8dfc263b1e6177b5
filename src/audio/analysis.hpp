// src/audio/analysis.hpp
// Harmonic spectrum extraction: turns a stretch of a WAV recording into a
// soundfont (relative amplitudes of the fundamental and its overtones).
//
// Pipeline (analyze_harmonics):
//   validate -> mono downmix -> Hann window -> FFT -> per-harmonic parabolic
//   peak refinement -> normalize to max -> * boost -> round to 5 decimals
//
// All parameter problems throw common::Error{InvalidParameters} before any
// FFT work starts, naming the quantity and the limit it broke.

#pragma once
#include <complex>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "audio/wav.hpp"

namespace audio {

struct AnalysisConfig {
  std::size_t samples = 8192;    // FFT length
  float startTime = 0.0f;        // seconds
  float baseFreq = 440.0f;       // Hz
  std::size_t numHarmonics = 16; // including the fundamental
  float boost = 1.0f;            // multiplies the normalized weights
};

void validate(const AnalysisConfig &config, const WavData &wav);

// Average of all channels per frame, config.samples frames from startTime.
std::vector<float> extract_mono(const WavData &wav,
                                const AnalysisConfig &config);

// w(n) = 0.5 * (1 - cos(2*pi*n / (N-1)))
std::vector<float> apply_hann_window(const std::vector<float> &samples);

// Forward complex FFT of a real signal, full length.
std::vector<std::complex<float>> compute_fft(const std::vector<float> &samples);

std::vector<float>
extract_harmonic_weights(const std::vector<std::complex<float>> &spectrum,
                         const AnalysisConfig &config,
                         std::uint32_t sampleRate);

std::vector<float> analyze_harmonics(const WavData &wav,
                                     const AnalysisConfig &config);

} // namespace audio
