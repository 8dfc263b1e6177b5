// src/common/errors.hpp
// One exception type for the whole tool, tagged with what went wrong.
// Derives from std::runtime_error so callers that only care about the
// message can keep catching std::exception.

#pragma once
#include <stdexcept>
#include <string>

namespace common {

enum class ErrorKind {
  ContainerParse,    // malformed MIDI/WAV bytes
  UnsupportedFormat, // valid container, encoding we don't handle
  InvalidParameters, // caller-supplied values fail validation
  SoundfontMismatch, // soundfont count vs channel count
  InvalidSoundfont,  // missing or unparsable soundfont file
  Io,                // open/read/write failures
  Processing         // numeric backend failures (FFT plan, ...)
};

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &msg)
      : std::runtime_error(msg), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// Short human label, used as the prefix of CLI diagnostics.
inline const char *kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ContainerParse:
    return "Parsing error";
  case ErrorKind::UnsupportedFormat:
    return "Unsupported format";
  case ErrorKind::InvalidParameters:
    return "Invalid parameters";
  case ErrorKind::SoundfontMismatch:
    return "Soundfont mismatch";
  case ErrorKind::InvalidSoundfont:
    return "Invalid soundfont";
  case ErrorKind::Io:
    return "IO error";
  case ErrorKind::Processing:
    return "Processing error";
  }
  return "Error";
}

} // namespace common
