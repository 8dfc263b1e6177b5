// src/io/io.hpp
// Thin I/O façade for whole-file reads and writes.
// Higher layers (app, soundfont store, WAV reader) depend on io:: only.
//
// Usage:
//   auto bytes = io::read_all(path);
//   io::write_text(outPath, formula);
//
// Throws common::Error{Io} on errors (propagated from common/util.hpp).

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "common/util.hpp"

namespace io {

inline std::vector<std::uint8_t> read_all(const std::filesystem::path &p) {
  return ::read_all(p.string());
}

inline std::string read_text(const std::filesystem::path &p) {
  return ::read_text(p.string());
}

inline void write_text(const std::filesystem::path &p,
                       const std::string &text) {
  ::write_text(p.string(), text);
}

} // namespace io
