// src/midi/tempo.hpp
// Timing utilities: build a tempo map and convert ticks -> milliseconds.
//
// Contract:
//  - build_tempo_map(tempi, ppqn): sorts the collected tempo events by tick.
//    Several changes on the same tick collapse to the last one in file
//    order. The map always starts with the implicit 120 BPM at tick 0,
//    unless the file overrides it there.
//  - ticks_to_ms(tick, TempoMap): walks the tempo segments up to tick,
//    summing microseconds, and divides by 1000 once at the end.

#pragma once
#include "midi/events.hpp"

#include <cstdint>
#include <vector>

namespace midi {

constexpr std::uint32_t kDefaultUsPerQN = 500000; // 120 BPM

TempoMap build_tempo_map(std::vector<TempoChange> tempi, unsigned ppqn);

// Elapsed microseconds from tick 0 to tick. Beyond the last tempo change
// the last tempo continues.
std::uint64_t ticks_to_us(std::uint64_t tick, const TempoMap &tempo);

std::uint64_t ticks_to_ms(std::uint64_t tick, const TempoMap &tempo);

} // namespace midi
