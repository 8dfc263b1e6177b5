// src/midi/reducer.cpp
// Note on/off pairing over the merged, tick-ordered event list.

#include "midi/reducer.hpp"
#include "midi/tempo.hpp"

#include <algorithm>
#include <cstdint>
#include <map>
#include <utility>

namespace midi {

namespace {

struct Sounding {
  std::uint8_t velocity;
  Timestamp startMs;
};

} // namespace

std::vector<NoteEvent> reduce_notes(std::vector<ChannelEv> events,
                                    const TempoMap &tempo) {
  std::stable_sort(events.begin(), events.end(),
                   [](const ChannelEv &a, const ChannelEv &b) {
                     return a.tick < b.tick;
                   });

  // key: (note, channel)
  std::map<std::pair<std::uint8_t, std::uint8_t>, Sounding> active;
  std::map<Timestamp, std::vector<NoteInterval>> byStart;

  auto close = [&byStart](std::uint8_t note, std::uint8_t ch,
                          const Sounding &s, Timestamp endMs) {
    byStart[s.startMs].push_back(NoteInterval{note, s.velocity, ch, endMs});
  };

  // Tick -> ms is monotonic; cache the last conversion since runs of events
  // share a tick.
  std::uint64_t lastTick = 0;
  Timestamp nowMs = 0;

  for (const auto &ev : events) {
    if (ev.tick != lastTick) {
      lastTick = ev.tick;
      nowMs = ticks_to_ms(ev.tick, tempo);
    }

    const auto key = std::make_pair(ev.data1, ev.ch);
    if (ev.type == EvType::NoteOn) {
      active[key] = Sounding{ev.data2, nowMs};
    } else if (ev.type == EvType::NoteOff) {
      auto it = active.find(key);
      if (it != active.end()) {
        close(ev.data1, ev.ch, it->second, nowMs);
        active.erase(it);
      }
    }
  }

  // Hanging notes end with the last event of the file.
  for (const auto &kv : active) {
    close(kv.first.first, kv.first.second, kv.second, nowMs);
  }

  std::vector<NoteEvent> out;
  out.reserve(byStart.size());
  for (auto &kv : byStart) {
    out.push_back(NoteEvent{kv.first, std::move(kv.second)});
  }
  return out;
}

} // namespace midi
