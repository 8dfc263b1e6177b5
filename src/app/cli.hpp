// src/app/cli.hpp
// Minimal, robust CLI parsing for our two commands.
// Responsibilities:
//  - Pick the command (midi | audio) and its positional input path.
//  - Parse the command's flags and numeric values.
//  - Validate that the input file exists (fail early with a clear error).
//
// Design notes:
//  * Header-only, like the rest of the app glue.
//  * We throw common::Error{InvalidParameters} on problems (and
//    {Io} for a missing input file); main() catches and prints.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);
//   if (cli.command == app::Command::Midi) ... cli.midi.inputPath ...

#pragma once
#include <charconv>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "audio/analysis.hpp"
#include "common/errors.hpp"
#include "soundfont/store.hpp"

namespace app {

enum class Command { Help, Midi, Audio };

struct MidiArgs {
  std::filesystem::path inputPath;
  std::vector<std::string> soundfonts; // as typed; empty = defaults
  std::filesystem::path soundfontDir = soundfont::kDefaultDir;
  std::optional<std::filesystem::path> outputPath;
  bool info = false;
  bool verbose = false;
};

struct AudioArgs {
  std::filesystem::path inputPath;
  audio::AnalysisConfig config;
  std::optional<std::filesystem::path> outputPath;
};

struct Cli {
  Command command = Command::Help;
  MidiArgs midi;
  AudioArgs audio;
};

inline std::string usage(const std::string &prog) {
  return "Usage:\n"
         "  " + prog + " midi <file.mid> [options]\n"
         "  " + prog + " audio <file.wav> [options]\n"
         "\n"
         "midi options:\n"
         "  -s, --soundfonts <name>...  Soundfont per channel, in channel order\n"
         "                              ('-' skips a channel; one name = all)\n"
         "  -i, --info                  List channels and instruments, then exit\n"
         "  -o, --output <file>         Write the formula to a file\n"
         "      --soundfont-dir <dir>   Where soundfonts live (default: soundfonts)\n"
         "  -v, --verbose               Print a parse summary to stderr\n"
         "\n"
         "audio options:\n"
         "      --samples <n>           FFT length (default: 8192)\n"
         "      --start-time <sec>      Where analysis begins (default: 0)\n"
         "      --base-freq <hz>        Fundamental frequency (default: 440)\n"
         "      --harmonics <n>         Harmonics to extract (default: 16)\n"
         "      --boost <x>             Amplification factor (default: 1.0)\n"
         "  -o, --output <file>         Write the weights to a file\n";
}

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

namespace detail {

[[noreturn]] inline void bad_args(const std::string &msg) {
  throw common::Error(common::ErrorKind::InvalidParameters, msg);
}

inline std::string take_value(int argc, char **argv, int &i,
                              const std::string &flag) {
  if (i + 1 >= argc || is_flag_like(argv[i + 1]))
    bad_args(flag + " requires a value");
  return argv[++i];
}

template <typename T>
T parse_number(const std::string &text, const std::string &flag) {
  T v{};
  const char *first = text.data();
  const char *last = text.data() + text.size();
  const auto res = std::from_chars(first, last, v);
  if (text.empty() || res.ec != std::errc() || res.ptr != last)
    bad_args("Invalid value for " + flag + ": '" + text + "'");
  return v;
}

inline std::filesystem::path existing_input(const std::string &arg,
                                            const std::string &what) {
  if (is_flag_like(arg))
    bad_args("Expected a " + what + " file path, got flag " + arg);
  std::filesystem::path p = arg;
  if (!std::filesystem::exists(p) || !std::filesystem::is_regular_file(p))
    throw common::Error(common::ErrorKind::Io,
                        what + " file not found: " + p.string());
  return p;
}

inline MidiArgs parse_midi_args(int argc, char **argv) {
  MidiArgs a;
  a.inputPath = existing_input(argv[2], "MIDI");
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-s" || arg == "--soundfonts") {
      // Greedy: everything up to the next flag. "-" is a value here.
      while (i + 1 < argc && !is_flag_like(argv[i + 1]))
        a.soundfonts.emplace_back(argv[++i]);
      if (a.soundfonts.empty())
        bad_args(arg + " requires at least one soundfont name");
    } else if (arg == "-i" || arg == "--info") {
      a.info = true;
    } else if (arg == "-v" || arg == "--verbose") {
      a.verbose = true;
    } else if (arg == "-o" || arg == "--output") {
      a.outputPath = take_value(argc, argv, i, arg);
    } else if (arg == "--soundfont-dir") {
      a.soundfontDir = take_value(argc, argv, i, arg);
    } else {
      bad_args("Unknown option: " + arg);
    }
  }
  return a;
}

inline AudioArgs parse_audio_args(int argc, char **argv) {
  AudioArgs a;
  a.inputPath = existing_input(argv[2], "WAV");
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--samples") {
      a.config.samples =
          parse_number<std::size_t>(take_value(argc, argv, i, arg), arg);
    } else if (arg == "--start-time") {
      a.config.startTime =
          parse_number<float>(take_value(argc, argv, i, arg), arg);
    } else if (arg == "--base-freq") {
      a.config.baseFreq =
          parse_number<float>(take_value(argc, argv, i, arg), arg);
    } else if (arg == "--harmonics") {
      a.config.numHarmonics =
          parse_number<std::size_t>(take_value(argc, argv, i, arg), arg);
    } else if (arg == "--boost") {
      a.config.boost = parse_number<float>(take_value(argc, argv, i, arg), arg);
    } else if (arg == "-o" || arg == "--output") {
      a.outputPath = take_value(argc, argv, i, arg);
    } else {
      bad_args("Unknown option: " + arg);
    }
  }
  return a;
}

} // namespace detail

// Parse argv into our Cli struct.
// Contract:
//  - argv[1] is the command, argv[2] its input file.
//  - "-h"/"--help" anywhere yields Command::Help.
//  - Throws common::Error on any invalid input.
inline Cli parse_cli(int argc, char **argv) {
  const std::string prog = argc > 0 ? argv[0] : "desmos_midi";
  Cli cli;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-h" || a == "--help")
      return cli;
  }
  if (argc < 3)
    detail::bad_args(usage(prog));

  const std::string command = argv[1];
  if (command == "midi") {
    cli.command = Command::Midi;
    cli.midi = detail::parse_midi_args(argc, argv);
  } else if (command == "audio") {
    cli.command = Command::Audio;
    cli.audio = detail::parse_audio_args(argc, argv);
  } else {
    detail::bad_args("Unknown command: " + command + "\n" + usage(prog));
  }
  return cli;
}

} // namespace app
