// src/audio/analysis.cpp
// Windowed FFT (FFTW, single precision) and harmonic peak extraction.

#include "audio/analysis.hpp"
#include "common/errors.hpp"

#include <fftw3.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>

namespace {

using common::Error;
using common::ErrorKind;

constexpr float kPi = 3.14159265358979323846f;

[[noreturn]] void invalid(const std::string &msg) {
  throw Error(ErrorKind::InvalidParameters, msg);
}

struct FftwFree {
  void operator()(void *p) const { fftwf_free(p); }
};
struct FftwPlanDestroy {
  void operator()(fftwf_plan p) const { fftwf_destroy_plan(p); }
};
using FftwBuffer = std::unique_ptr<fftwf_complex[], FftwFree>;
using FftwPlan =
    std::unique_ptr<std::remove_pointer_t<fftwf_plan>, FftwPlanDestroy>;

std::size_t start_frame(const audio::AnalysisConfig &config,
                        const audio::WavData &wav) {
  return static_cast<std::size_t>(config.startTime *
                                  static_cast<float>(wav.sampleRate));
}

} // namespace

namespace audio {

void validate(const AnalysisConfig &config, const WavData &wav) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2);

  if (wav.channels == 0 || wav.sampleRate == 0)
    invalid("Audio has no channels or a sample rate of 0");
  if (config.samples < 2) {
    oss << "Sample count must be at least 2, got " << config.samples;
    invalid(oss.str());
  }
  if (config.numHarmonics < 1)
    invalid("Number of harmonics must be at least 1");
  if (!(config.baseFreq > 0.0f)) {
    oss << "Base frequency must be positive, got " << config.baseFreq << "Hz";
    invalid(oss.str());
  }
  if (!(config.startTime >= 0.0f)) {
    oss << "Start time must not be negative, got " << config.startTime << "s";
    invalid(oss.str());
  }

  const std::size_t totalFrames = wav.frames();
  const float duration = wav.duration_seconds();
  if (config.startTime >= duration) {
    oss << "Start time (" << config.startTime
        << "s) exceeds audio duration (" << duration << "s)";
    invalid(oss.str());
  }

  const std::size_t start = start_frame(config, wav);
  if (start > totalFrames || config.samples > totalFrames - start) {
    const std::size_t available = totalFrames > start ? totalFrames - start : 0;
    oss << "Not enough samples available. Requested " << config.samples
        << " samples starting at " << config.startTime << "s, but only "
        << available
        << " samples available. Try reducing the sample count or start time.";
    invalid(oss.str());
  }

  const float nyquist = static_cast<float>(wav.sampleRate) / 2.0f;
  const auto maxHarmonics =
      static_cast<std::size_t>(std::floor(nyquist / config.baseFreq));
  if (config.baseFreq * static_cast<float>(config.numHarmonics) > nyquist) {
    oss.str("");
    oss << std::setprecision(1) << "With base frequency of " << config.baseFreq
        << "Hz, maximum number of harmonics possible is " << maxHarmonics
        << " (limited by Nyquist frequency of " << nyquist << "Hz)";
    invalid(oss.str());
  }
}

std::vector<float> extract_mono(const WavData &wav,
                                const AnalysisConfig &config) {
  const std::size_t start = start_frame(config, wav);
  if (start > wav.frames() || config.samples > wav.frames() - start)
    invalid("Sample range exceeds file length");

  const std::size_t ch = wav.channels;
  std::vector<float> mono;
  mono.reserve(config.samples);
  for (std::size_t i = 0; i < config.samples; ++i) {
    const std::size_t base = (start + i) * ch;
    float sum = 0.0f;
    for (std::size_t c = 0; c < ch; ++c)
      sum += wav.samples[base + c];
    mono.push_back(sum / static_cast<float>(ch));
  }
  return mono;
}

std::vector<float> apply_hann_window(const std::vector<float> &samples) {
  const std::size_t n = samples.size();
  std::vector<float> out(n);
  if (n < 2) {
    std::copy(samples.begin(), samples.end(), out.begin());
    return out;
  }
  const float denom = static_cast<float>(n - 1);
  for (std::size_t i = 0; i < n; ++i) {
    const float w =
        0.5f * (1.0f - std::cos(2.0f * kPi * static_cast<float>(i) / denom));
    out[i] = samples[i] * w;
  }
  return out;
}

std::vector<std::complex<float>>
compute_fft(const std::vector<float> &samples) {
  const std::size_t n = samples.size();
  FftwBuffer in(fftwf_alloc_complex(n));
  FftwBuffer out(fftwf_alloc_complex(n));
  if (!in || !out)
    throw Error(ErrorKind::Processing, "FFT buffer allocation failed");

  FftwPlan plan(fftwf_plan_dft_1d(static_cast<int>(n), in.get(), out.get(),
                                  FFTW_FORWARD, FFTW_ESTIMATE));
  if (!plan)
    throw Error(ErrorKind::Processing,
                "FFT plan creation failed for length " + std::to_string(n));

  for (std::size_t i = 0; i < n; ++i) {
    in[i][0] = samples[i];
    in[i][1] = 0.0f;
  }
  fftwf_execute(plan.get());

  std::vector<std::complex<float>> spectrum(n);
  for (std::size_t i = 0; i < n; ++i)
    spectrum[i] = std::complex<float>(out[i][0], out[i][1]);
  return spectrum;
}

std::vector<float>
extract_harmonic_weights(const std::vector<std::complex<float>> &spectrum,
                         const AnalysisConfig &config,
                         std::uint32_t sampleRate) {
  const float resolution =
      static_cast<float>(sampleRate) / static_cast<float>(spectrum.size());
  std::vector<float> harmonics;
  harmonics.reserve(config.numHarmonics);

  for (std::size_t k = 1; k <= config.numHarmonics; ++k) {
    const float target = config.baseFreq * static_cast<float>(k);
    const auto bin = static_cast<std::size_t>(target / resolution);
    if (bin + 1 >= spectrum.size()) {
      invalid("Harmonic " + std::to_string(k) +
              " exceeds Nyquist frequency");
    }
    if (bin == 0) {
      invalid("Harmonic " + std::to_string(k) +
              " is below the frequency resolution of " +
              std::to_string(resolution) + "Hz");
    }

    // Parabolic interpolation over the peak bin and its neighbours.
    const float alpha = std::abs(spectrum[bin - 1]);
    const float beta = std::abs(spectrum[bin]);
    const float gamma = std::abs(spectrum[bin + 1]);
    const float p =
        beta > 0.0f ? 0.5f * (alpha - gamma) / (alpha - 2.0f * beta + gamma)
                    : 0.0f;
    harmonics.push_back(std::abs(beta - 0.25f * (alpha - gamma) * p));
  }

  if (harmonics.empty())
    return harmonics;
  const float peak = *std::max_element(harmonics.begin(), harmonics.end());
  if (peak > 0.0f) {
    for (auto &h : harmonics)
      h /= peak;
  }
  for (auto &h : harmonics) {
    h *= config.boost;
    h = std::round(h * 100000.0f) / 100000.0f;
  }
  return harmonics;
}

std::vector<float> analyze_harmonics(const WavData &wav,
                                     const AnalysisConfig &config) {
  validate(config, wav);
  const std::vector<float> mono = extract_mono(wav, config);
  const std::vector<float> windowed = apply_hann_window(mono);
  const auto spectrum = compute_fft(windowed);
  return extract_harmonic_weights(spectrum, config, wav.sampleRate);
}

} // namespace audio
