// src/soundfont/store.cpp
// Soundfont name handling and text parsing.

#include "soundfont/store.hpp"
#include "common/errors.hpp"
#include "io/io.hpp"

#include <cctype>
#include <charconv>
#include <system_error>

namespace soundfont {

namespace {

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string trim(const std::string &s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

} // namespace

std::string normalize_name(const std::string &name) {
  if (name == kNone || ends_with(name, ".txt"))
    return name;
  return name + ".txt";
}

std::optional<std::filesystem::path>
parse_ref(const std::string &name, const std::filesystem::path &dir) {
  if (name == kNone)
    return std::nullopt;
  return dir / name;
}

midi::SoundFont parse_weights(const std::string &text,
                              const std::string &source) {
  midi::SoundFont weights;
  const std::string body = trim(text);
  std::size_t pos = 0;
  while (true) {
    const std::size_t comma = body.find(',', pos);
    const std::string field = trim(body.substr(
        pos, comma == std::string::npos ? std::string::npos : comma - pos));

    float v = 0.0f;
    const char *first = field.data();
    const char *last = field.data() + field.size();
    // from_chars has no explicit plus sign; allow exactly one
    if (field.size() > 1 && field[0] == '+' && field[1] != '+' &&
        field[1] != '-')
      ++first;
    const auto res = std::from_chars(first, last, v);
    if (field.empty() || res.ec != std::errc() || res.ptr != last) {
      throw common::Error(common::ErrorKind::InvalidSoundfont,
                          "Invalid value '" + field + "' in " + source);
    }
    weights.push_back(v);

    if (comma == std::string::npos)
      break;
    pos = comma + 1;
  }
  return weights;
}

midi::SoundFont load(const std::filesystem::path &path) {
  return parse_weights(io::read_text(path), path.string());
}

std::optional<midi::SoundFont> resolve(const std::string &name,
                                       const std::filesystem::path &dir) {
  const auto ref = parse_ref(name, dir);
  if (!ref)
    return std::nullopt;
  return load(*ref);
}

void verify(const std::vector<std::string> &names,
            const std::filesystem::path &dir) {
  for (const auto &name : names) {
    const auto ref = parse_ref(name, dir);
    if (ref && !std::filesystem::exists(*ref)) {
      throw common::Error(common::ErrorKind::InvalidSoundfont,
                          "Soundfont file not found: " + name);
    }
  }
}

std::vector<std::string>
default_assignment(const std::vector<midi::Channel> &channels) {
  std::vector<std::string> names;
  names.reserve(channels.size());
  for (const auto &c : channels)
    names.emplace_back(c.isDrum ? kNone : kDefaultFont);
  return names;
}

} // namespace soundfont
