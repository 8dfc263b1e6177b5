// src/midi/binder.cpp
// Channel -> soundfont row resolution and note rewriting.

#include "midi/binder.hpp"
#include "common/errors.hpp"

#include <string>
#include <utility>

namespace midi {

void check_soundfont_count(std::size_t channels, std::size_t fonts) {
  if (fonts == 1 || fonts == channels)
    return;
  const std::string what = fonts < channels ? "Not enough" : "Too many";
  throw common::Error(common::ErrorKind::SoundfontMismatch,
                      what + " soundfonts provided. Need " +
                          std::to_string(channels) + " for channels, got " +
                          std::to_string(fonts));
}

SoundfontBinding
plan_binding(const std::vector<Channel> &channels,
             const std::vector<std::optional<SoundFont>> &fonts) {
  check_soundfont_count(channels.size(), fonts.size());
  const std::size_t need = channels.size();

  SoundfontBinding b;
  if (fonts.size() == 1) {
    if (fonts[0]) {
      b.fonts.push_back(*fonts[0]);
      for (const auto &c : channels)
        b.channelToIndex[c.id & 0x0F] = 0;
    }
    return b;
  }

  for (std::size_t i = 0; i < need; ++i) {
    if (!fonts[i])
      continue;
    b.channelToIndex[channels[i].id & 0x0F] = b.fonts.size();
    b.fonts.push_back(*fonts[i]);
  }
  return b;
}

void apply_binding(ProcessedSong &song, const SoundfontBinding &binding) {
  std::vector<NoteEvent> kept;
  kept.reserve(song.noteEvents.size());

  for (auto &ev : song.noteEvents) {
    std::vector<NoteInterval> notes;
    notes.reserve(ev.notes.size());
    for (const auto &n : ev.notes) {
      const auto &slot = binding.channelToIndex[n.soundfont & 0x0F];
      if (!slot)
        continue;
      NoteInterval bound = n;
      bound.soundfont = *slot;
      notes.push_back(bound);
    }
    if (!notes.empty())
      kept.push_back(NoteEvent{ev.startMs, std::move(notes)});
  }

  song.noteEvents = std::move(kept);
  song.soundfonts = SoundFontTable(binding.fonts);
}

} // namespace midi
