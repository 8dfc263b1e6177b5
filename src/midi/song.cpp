// src/midi/song.cpp
// Soundfont table padding and the decode -> tempo map -> reduce chain.

#include "midi/song.hpp"
#include "midi/reducer.hpp"
#include "midi/smf.hpp"
#include "midi/tempo.hpp"

#include <algorithm>
#include <utility>

namespace midi {

SoundFontTable::SoundFontTable(std::vector<SoundFont> fonts)
    : fonts_(std::move(fonts)) {
  for (const auto &f : fonts_)
    maxSize_ = std::max(maxSize_, f.size());
  for (auto &f : fonts_)
    f.resize(maxSize_, 0.0f);
}

ProcessedSong decode_song(const std::vector<std::uint8_t> &bytes,
                          bool infoOnly) {
  DecodedMidi decoded = parse_smf(bytes);

  ProcessedSong song;
  song.header = decoded.header;
  song.channels = std::move(decoded.channels);
  if (infoOnly) {
    song.soundfonts = SoundFontTable({SoundFont{1.0f}});
    return song;
  }

  const TempoMap tempo =
      build_tempo_map(std::move(decoded.tempi), decoded.header.ppqn);
  song.noteEvents = reduce_notes(std::move(decoded.events), tempo);
  return song;
}

} // namespace midi
