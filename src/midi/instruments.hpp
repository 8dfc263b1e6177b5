// src/midi/instruments.hpp
// General MIDI program names.

#pragma once
#include <cstdint>

namespace midi {

// "Drum Kit" for the drum channel, otherwise the GM1 name of program
// (0..127); anything out of range is "Unknown Instrument".
const char *instrument_name(std::uint8_t program, bool isDrum);

} // namespace midi
