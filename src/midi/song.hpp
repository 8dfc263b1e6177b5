// src/midi/song.hpp
// The reduced, serializable view of a MIDI file: note intervals grouped by
// start time, the channels they came from and the soundfont table they
// refer to.

#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "midi/events.hpp"

namespace midi {

// Timestamp in milliseconds
using Timestamp = std::uint64_t;

// Harmonic weights of one timbre, index 0 = fundamental.
using SoundFont = std::vector<float>;

// One closed note. soundfont holds the raw channel id until the binder
// rewrites it to a row of the soundfont table.
struct NoteInterval {
  std::uint8_t note = 0;
  std::uint8_t velocity = 0;
  std::size_t soundfont = 0;
  Timestamp endMs = 0;
};

// All intervals starting at the same millisecond.
struct NoteEvent {
  Timestamp startMs = 0;
  std::vector<NoteInterval> notes;
};

// Soundfonts padded with trailing zeros to the longest row.
class SoundFontTable {
public:
  SoundFontTable() = default;
  explicit SoundFontTable(std::vector<SoundFont> fonts);

  const std::vector<SoundFont> &fonts() const { return fonts_; }
  std::size_t max_size() const { return maxSize_; }

private:
  std::vector<SoundFont> fonts_;
  std::size_t maxSize_ = 0;
};

struct ProcessedSong {
  SMFHeader header;
  std::vector<NoteEvent> noteEvents; // ascending by startMs
  std::vector<Channel> channels;
  SoundFontTable soundfonts;
};

// Number of relative semitones from A4 (MIDI 69, 440 Hz).
inline int relative_note(std::uint8_t note) { return int(note) - 69; }

// Decode a file into a ProcessedSong. With infoOnly, stops after channel
// discovery: noteEvents stays empty and soundfonts holds a placeholder
// single-entry table.
ProcessedSong decode_song(const std::vector<std::uint8_t> &bytes,
                          bool infoOnly);

} // namespace midi
