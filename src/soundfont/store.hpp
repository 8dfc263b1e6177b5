// src/soundfont/store.hpp
// Soundfont files: plain text, comma-separated float weights, looked up by
// name inside a soundfont directory. The name "-" means "no soundfont".

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "midi/events.hpp"
#include "midi/song.hpp"

namespace soundfont {

inline constexpr const char *kNone = "-";
inline constexpr const char *kDefaultDir = "soundfonts";
inline constexpr const char *kDefaultFont = "default.txt";

// Appends ".txt" unless already present; "-" is returned unchanged.
std::string normalize_name(const std::string &name);

// "-" -> nullopt, anything else -> dir / name.
std::optional<std::filesystem::path>
parse_ref(const std::string &name, const std::filesystem::path &dir);

// Parse "1, 0.5,0.25" into weights. source names the file in errors.
midi::SoundFont parse_weights(const std::string &text,
                              const std::string &source);

// Read and parse one soundfont file. Throws common::Error{Io} if the file
// can't be read, {InvalidSoundfont} on a bad value.
midi::SoundFont load(const std::filesystem::path &path);

// Resolve a name through parse_ref + load.
std::optional<midi::SoundFont> resolve(const std::string &name,
                                       const std::filesystem::path &dir);

// Throws common::Error{InvalidSoundfont} naming the first missing file.
void verify(const std::vector<std::string> &names,
            const std::filesystem::path &dir);

// "-" for drum channels, default.txt for the rest.
std::vector<std::string>
default_assignment(const std::vector<midi::Channel> &channels);

} // namespace soundfont
