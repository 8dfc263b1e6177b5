// src/midi/reducer.hpp
// Merge the per-track event lists into one timeline and turn note on/off
// pairs into closed intervals.

#pragma once
#include <vector>

#include "midi/events.hpp"
#include "midi/song.hpp"

namespace midi {

// Rules:
//  - events are ordered by tick; simultaneous events keep file order
//  - a NoteOn on an already sounding (note, channel) restarts it: the old
//    start is replaced, no interval is emitted for it
//  - NoteOff (or NoteOn velocity 0) without a sounding note is ignored
//  - notes still sounding at the end close at the time of the last event
// Intervals carry the channel id in NoteInterval::soundfont.
std::vector<NoteEvent> reduce_notes(std::vector<ChannelEv> events,
                                    const TempoMap &tempo);

} // namespace midi
