// src/formula/encoder.hpp
// Serialize a ProcessedSong into graphing-calculator definitions:
//
//   A=\left\{t<T1:\left[n,v,s,...\right],t<T2:...\right\}
//   B=\left[w1,w2,...\right]      flattened soundfont table
//   C=<row length>
//
// Each branch lists the notes sounding in [T(i-1), T(i)) as
// (semitones from A4, velocity, soundfont row) triples. Long songs are split
// into A_{1}, A_{2}, ... with A selecting the section by time.
// Output is a pure function of the song: same song, same bytes.

#pragma once
#include <cstddef>
#include <string>

#include "midi/song.hpp"

namespace formula {

// Longest single definition the calculator editor accepts comfortably.
constexpr std::size_t kMaxSectionLength = 20000;

std::string encode(const midi::ProcessedSong &song);

// Shortest text that reads back as the same value ("1", "0.33333", "6.35").
std::string format_shortest(double v);
std::string format_shortest(float v);

// Fixed three decimals ("1.000").
std::string format_seconds(double seconds);

} // namespace formula
