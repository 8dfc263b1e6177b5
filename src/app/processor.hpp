// src/app/processor.hpp
// File-level orchestration: read a MIDI file, resolve soundfont names in a
// soundfont directory, decode, reduce and bind.
//
// The directory is handed in by the caller; nothing here reads ambient
// configuration.

#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "midi/song.hpp"

namespace app {

class MidiProcessor {
public:
  explicit MidiProcessor(std::filesystem::path soundfontDir);

  // Channels and instruments only; noteEvents stays empty.
  midi::ProcessedSong process_info(const std::filesystem::path &midiPath) const;

  // names: one soundfont name per channel in discovery order, or a single
  // name for all channels. "-" excludes a channel. Throws
  // common::Error{SoundfontMismatch} on a count mismatch before loading
  // anything.
  midi::ProcessedSong
  process_with_soundfonts(const std::filesystem::path &midiPath,
                          std::vector<std::string> names) const;

  // Throws common::Error{InvalidSoundfont} for the first missing file.
  void verify_soundfonts(const std::vector<std::string> &names) const;

private:
  std::filesystem::path dir_;
};

} // namespace app
