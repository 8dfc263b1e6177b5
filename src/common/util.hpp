// src/common/util.hpp
// Whole-file helpers (binary read, text read, write). Failures throw
// common::Error{Io} with the offending path in the message.
#pragma once
#include <cstdint>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <vector>

#include "common/errors.hpp"

inline std::vector<std::uint8_t> read_all(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw common::Error(common::ErrorKind::Io, "Could not open file: " + path);
  }
  f.seekg(0, std::ios::end);
  std::streamsize sz = f.tellg();
  if (sz < 0) {
    throw common::Error(common::ErrorKind::Io,
                        "Could not get size of file: " + path);
  }
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(sz));
  f.seekg(0, std::ios::beg);
  if (sz && !f.read(reinterpret_cast<char *>(buf.data()), sz)) {
    throw common::Error(common::ErrorKind::Io, "Could not read file: " + path);
  }
  return buf;
}

inline std::string read_text(const std::string &path) {
  std::ifstream f(path);
  if (!f) {
    throw common::Error(common::ErrorKind::Io, "Could not open file: " + path);
  }
  std::string text((std::istreambuf_iterator<char>(f)),
                   std::istreambuf_iterator<char>());
  if (f.bad()) {
    throw common::Error(common::ErrorKind::Io, "Could not read file: " + path);
  }
  return text;
}

inline void write_text(const std::string &path, const std::string &text) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    throw common::Error(common::ErrorKind::Io,
                        "Could not create file: " + path);
  }
  f.write(text.data(), static_cast<std::streamsize>(text.size()));
  if (!f) {
    throw common::Error(common::ErrorKind::Io,
                        "Could not write file: " + path);
  }
}
