// src/midi/smf.hpp
// Public API: parse a Standard MIDI File (SMF) from memory.
// - No printing here; pure data extraction.
// - Throws common::Error on malformed (ContainerParse) or SMPTE-timed
//   (UnsupportedFormat) input.

#pragma once
#include <cstdint>
#include <vector>

#include "midi/events.hpp"

namespace midi {

// Parse an entire Standard MIDI File already loaded in memory.
// On success, returns:
//   - header  : format, track count, PPQN
//   - channels: every channel carrying a channel-voice message, in the order
//               first seen, with the last Program Change applied
//   - events  : all channel-voice events across tracks (absolute ticks)
//   - tempi   : tempo meta events from every track
DecodedMidi parse_smf(const std::vector<std::uint8_t> &bytes);

} // namespace midi
