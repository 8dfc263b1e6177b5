// src/app/preview.hpp
// Pretty, compact console output of a parsed MIDI song.
// - print_channel_info: the --info listing (channel, drum tag, instrument)
// - print_preview: SMF header summary + reduction stats for --verbose

#pragma once
#include <cstddef>
#include <iostream>

#include "midi/instruments.hpp"
#include "midi/song.hpp"

namespace app {

inline void print_channel_info(const midi::ProcessedSong &song,
                               std::ostream &out = std::cout) {
  out << "MIDI Channel Information:\n";
  out << "------------------------\n";
  for (const auto &ch : song.channels) {
    // channels are 1-based in display
    out << "Channel " << int(ch.id) + 1 << ": "
        << (ch.isDrum ? "[DRUMS] " : "")
        << midi::instrument_name(ch.instrument, ch.isDrum) << "\n";
  }
}

inline void print_preview(const midi::ProcessedSong &song,
                          std::ostream &out = std::cerr) {
  out << "SMF header:\n";
  out << "  format  = " << song.header.format << "\n";
  out << "  nTracks = " << song.header.nTracks << "\n";
  out << "  PPQN    = " << song.header.ppqn << " ticks/qn\n";

  std::size_t intervals = 0;
  for (const auto &ev : song.noteEvents)
    intervals += ev.notes.size();
  out << "channels    = " << song.channels.size() << "\n";
  out << "note events = " << song.noteEvents.size() << " (" << intervals
      << " notes)\n";
  out << "soundfonts  = " << song.soundfonts.fonts().size() << " x "
      << song.soundfonts.max_size() << " harmonics\n";
}

} // namespace app
