// src/midi/binder.hpp
// Attach soundfonts to channels and rewrite note intervals to refer to rows
// of the soundfont table.
//
// Contract:
//  - fonts holds one entry per channel, in song.channels order; an empty
//    optional excludes that channel (its notes are dropped)
//  - a single entry is broadcast to every channel, all sharing one row
//  - any other count different from the channel count throws
//    common::Error{SoundfontMismatch}; the song is left untouched

#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <vector>

#include "midi/song.hpp"

namespace midi {

struct SoundfontBinding {
  std::array<std::optional<std::size_t>, 16> channelToIndex; // by channel id
  std::vector<SoundFont> fonts;                              // table rows
};

// Throws common::Error{SoundfontMismatch} unless fonts is 1 or channels.
void check_soundfont_count(std::size_t channels, std::size_t fonts);

// Validates counts and resolves the channel -> row mapping.
SoundfontBinding plan_binding(const std::vector<Channel> &channels,
                              const std::vector<std::optional<SoundFont>> &fonts);

// Applies a binding: drops excluded notes (and events left empty),
// rewrites channel ids to row indices and replaces the soundfont table.
void apply_binding(ProcessedSong &song, const SoundfontBinding &binding);

inline void bind_soundfonts(ProcessedSong &song,
                            const std::vector<std::optional<SoundFont>> &fonts) {
  apply_binding(song, plan_binding(song.channels, fonts));
}

} // namespace midi
