// src/app/processor.cpp
// MIDI file -> bound ProcessedSong, loading soundfonts by name.

#include "app/processor.hpp"
#include "io/io.hpp"
#include "midi/binder.hpp"
#include "soundfont/store.hpp"

#include <optional>
#include <utility>

namespace app {

MidiProcessor::MidiProcessor(std::filesystem::path soundfontDir)
    : dir_(std::move(soundfontDir)) {}

midi::ProcessedSong
MidiProcessor::process_info(const std::filesystem::path &midiPath) const {
  return midi::decode_song(io::read_all(midiPath), true);
}

midi::ProcessedSong
MidiProcessor::process_with_soundfonts(const std::filesystem::path &midiPath,
                                       std::vector<std::string> names) const {
  const auto bytes = io::read_all(midiPath);

  // Channel discovery first: the count check must not wait for reduction.
  const midi::ProcessedSong info = midi::decode_song(bytes, true);
  const std::vector<midi::Channel> &channels = info.channels;

  // Load nothing until the counts agree.
  midi::check_soundfont_count(channels.size(), names.size());
  std::vector<std::optional<midi::SoundFont>> fonts;
  for (const auto &name : names)
    fonts.push_back(soundfont::resolve(name, dir_));
  const midi::SoundfontBinding binding = midi::plan_binding(channels, fonts);

  midi::ProcessedSong song = midi::decode_song(bytes, false);
  midi::apply_binding(song, binding);
  return song;
}

void MidiProcessor::verify_soundfonts(
    const std::vector<std::string> &names) const {
  soundfont::verify(names, dir_);
}

} // namespace app
