// src/midi/events.hpp
// Core MIDI domain types shared across the app.
// Keep this header light: plain structs, no implementation details.

#pragma once
#include <cstdint>
#include <vector>

namespace midi {

// Channel-voice messages we act on. Everything else is skipped by the parser.
enum class EvType { NoteOn, NoteOff, ProgramChange, Other };

// A channel-voice event at an absolute tick of its track.
struct ChannelEv {
  std::uint64_t tick; // absolute tick in its track timeline
  std::uint8_t ch;    // MIDI channel 0..15
  EvType type;
  std::uint8_t data1; // note / program / controller
  std::uint8_t data2; // velocity / value (0 for one-byte messages)
};

// A tempo meta event: microseconds per quarter note at a given tick
struct TempoChange {
  std::uint64_t tick;    // absolute tick where tempo takes effect
  std::uint32_t usPerQN; // microseconds per quarter note
};

// Parsed SMF header (subset we need)
struct SMFHeader {
  std::uint16_t format = 0;   // 0, 1, or 2
  std::uint16_t nTracks = 0;  // number of track chunks
  std::uint16_t division = 0; // raw division field
  unsigned ppqn = 480;        // ticks per quarter note
};

// A channel seen in the file. instrument stays 0 (Acoustic Grand Piano)
// until a Program Change arrives.
struct Channel {
  std::uint8_t id = 0;
  std::uint8_t instrument = 0;
  bool isDrum = false; // GM channel 10
};

// Everything the decoder extracts from one file.
struct DecodedMidi {
  SMFHeader header;
  std::vector<Channel> channels;   // in discovery order
  std::vector<ChannelEv> events;   // per track, absolute ticks, unsorted
  std::vector<TempoChange> tempi;  // collected from all tracks, unsorted
};

// Ordered tempo checkpoints; changes.front() is always {0, 500000}.
struct TempoMap {
  unsigned ppqn = 480;
  std::vector<TempoChange> changes;
};

} // namespace midi
