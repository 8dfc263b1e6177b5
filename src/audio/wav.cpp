// src/audio/wav.cpp
// WAV decoding through miniaudio. This translation unit holds the
// single-header library implementation, trimmed to the decoder.

#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_DEVICE_IO
#define MA_NO_ENGINE
#define MA_NO_NODE_GRAPH
#define MA_NO_RESOURCE_MANAGER
#define MA_NO_ENCODING
#define MA_NO_MP3
#define MA_NO_FLAC
#include <miniaudio.h>

#include "audio/wav.hpp"
#include "common/errors.hpp"
#include "io/io.hpp"

#include <string>

namespace {

using common::Error;
using common::ErrorKind;

// Uninitializes the decoder on every exit path.
struct DecoderGuard {
  ma_decoder *dec;
  ~DecoderGuard() { ma_decoder_uninit(dec); }
};

const char *format_name(ma_format f) {
  switch (f) {
  case ma_format_u8:
    return "8-bit integer";
  case ma_format_s16:
    return "16-bit integer";
  case ma_format_s24:
    return "24-bit integer";
  case ma_format_s32:
    return "32-bit integer";
  case ma_format_f32:
    return "32-bit float";
  default:
    return "unknown";
  }
}

bool is_supported(ma_format f) {
  return f == ma_format_s16 || f == ma_format_s24 || f == ma_format_s32 ||
         f == ma_format_f32;
}

} // namespace

namespace audio {

WavData decode_wav(const std::vector<std::uint8_t> &bytes) {
  // Native format, channel count and rate: we convert samples ourselves.
  ma_decoder_config config = ma_decoder_config_init(ma_format_unknown, 0, 0);
  config.encodingFormat = ma_encoding_format_wav;

  ma_decoder decoder;
  ma_result res =
      ma_decoder_init_memory(bytes.data(), bytes.size(), &config, &decoder);
  if (res != MA_SUCCESS) {
    throw Error(ErrorKind::ContainerParse,
                std::string("WAV parsing error: ") + ma_result_description(res));
  }
  DecoderGuard guard{&decoder};

  ma_format format = ma_format_unknown;
  ma_uint32 channels = 0;
  ma_uint32 sampleRate = 0;
  res = ma_decoder_get_data_format(&decoder, &format, &channels, &sampleRate,
                                   nullptr, 0);
  if (res != MA_SUCCESS) {
    throw Error(ErrorKind::ContainerParse,
                std::string("WAV parsing error: ") + ma_result_description(res));
  }
  if (!is_supported(format)) {
    throw Error(ErrorKind::UnsupportedFormat,
                std::string("Unsupported WAV format: ") + format_name(format));
  }
  if (channels == 0 || channels > 0xFFFF || sampleRate == 0) {
    throw Error(ErrorKind::ContainerParse,
                "WAV parsing error: bad channel count or sample rate");
  }

  WavData wav;
  wav.sampleRate = sampleRate;
  wav.channels = static_cast<std::uint16_t>(channels);

  ma_uint64 totalFrames = 0;
  if (ma_decoder_get_length_in_pcm_frames(&decoder, &totalFrames) ==
      MA_SUCCESS) {
    wav.samples.reserve(static_cast<std::size_t>(totalFrames) * channels);
  }

  // Pull native frames in chunks and convert each chunk to f32.
  const ma_uint64 chunkFrames = 4096;
  const std::size_t bytesPerFrame = ma_get_bytes_per_frame(format, channels);
  std::vector<std::uint8_t> raw(static_cast<std::size_t>(chunkFrames) *
                                bytesPerFrame);
  std::vector<float> converted(static_cast<std::size_t>(chunkFrames) *
                               channels);
  while (true) {
    ma_uint64 framesRead = 0;
    res = ma_decoder_read_pcm_frames(&decoder, raw.data(), chunkFrames,
                                     &framesRead);
    if (framesRead > 0) {
      const ma_uint64 sampleCount = framesRead * channels;
      ma_pcm_convert(converted.data(), ma_format_f32, raw.data(), format,
                     sampleCount, ma_dither_mode_none);
      wav.samples.insert(wav.samples.end(), converted.begin(),
                         converted.begin() +
                             static_cast<std::ptrdiff_t>(sampleCount));
    }
    if (res == MA_AT_END || framesRead == 0)
      break;
    if (res != MA_SUCCESS) {
      throw Error(ErrorKind::ContainerParse,
                  std::string("WAV parsing error: ") +
                      ma_result_description(res));
    }
  }
  return wav;
}

WavData read_wav(const std::filesystem::path &path) {
  return decode_wav(io::read_all(path));
}

} // namespace audio
