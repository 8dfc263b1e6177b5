// src/midi/tempo.cpp
// Implementation of timing utilities.

#include "midi/tempo.hpp"

#include <algorithm>
#include <vector>

namespace midi {

TempoMap build_tempo_map(std::vector<TempoChange> tempi, unsigned ppqn) {
  // stable: equal ticks keep file order, so the last one wins below
  std::stable_sort(tempi.begin(), tempi.end(),
                   [](const TempoChange &a, const TempoChange &b) {
                     return a.tick < b.tick;
                   });

  TempoMap map;
  map.ppqn = ppqn;
  map.changes.push_back(TempoChange{0, kDefaultUsPerQN});

  for (const auto &t : tempi) {
    if (t.tick == map.changes.back().tick) {
      map.changes.back().usPerQN = t.usPerQN; // overwrite in place
    } else {
      map.changes.push_back(t);
    }
  }
  return map;
}

std::uint64_t ticks_to_us(std::uint64_t tick, const TempoMap &tempo) {
  std::uint64_t us = 0;
  const std::size_t n = tempo.changes.size();
  for (std::size_t i = 0; i < n; ++i) {
    const std::uint64_t segStart = tempo.changes[i].tick;
    if (segStart >= tick)
      break;
    const std::uint64_t segEnd =
        (i + 1 < n) ? std::min(tempo.changes[i + 1].tick, tick) : tick;
    const std::uint64_t segTicks = segEnd - segStart;
    const std::uint64_t usPerQN = tempo.changes[i].usPerQN;
    // floor(segTicks * usPerQN / ppqn), split so the product can't overflow
    us += (segTicks / tempo.ppqn) * usPerQN +
          (segTicks % tempo.ppqn) * usPerQN / tempo.ppqn;
  }
  return us;
}

std::uint64_t ticks_to_ms(std::uint64_t tick, const TempoMap &tempo) {
  return ticks_to_us(tick, tempo) / 1000;
}

} // namespace midi
