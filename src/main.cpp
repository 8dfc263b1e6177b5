// src/main.cpp
// Entry point: MIDI -> formula conversion and WAV -> soundfont analysis.
// Results go to stdout (or --output); diagnostics go to stderr.

#include "app/cli.hpp"
#include "app/preview.hpp"
#include "app/processor.hpp"
#include "audio/analysis.hpp"
#include "audio/wav.hpp"
#include "common/errors.hpp"
#include "formula/encoder.hpp"
#include "io/io.hpp"
#include "soundfont/store.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void emit(const std::string &text,
          const std::optional<std::filesystem::path> &outputPath) {
  if (outputPath) {
    io::write_text(*outputPath, text);
    std::cerr << "Exported to file: " << outputPath->string() << "\n";
  } else {
    std::cout << text;
    std::cout.flush();
  }
}

void run_midi(const app::MidiArgs &args) {
  const app::MidiProcessor processor(args.soundfontDir);

  if (args.info) {
    app::print_channel_info(processor.process_info(args.inputPath));
    return;
  }

  std::vector<std::string> names;
  if (args.soundfonts.empty()) {
    names = soundfont::default_assignment(
        processor.process_info(args.inputPath).channels);
  } else {
    for (const auto &s : args.soundfonts)
      names.push_back(soundfont::normalize_name(s));
  }
  processor.verify_soundfonts(names);

  const midi::ProcessedSong song =
      processor.process_with_soundfonts(args.inputPath, names);
  if (args.verbose)
    app::print_preview(song);

  emit(formula::encode(song), args.outputPath);
}

void run_audio(const app::AudioArgs &args) {
  const audio::WavData wav = audio::read_wav(args.inputPath);
  const std::vector<float> weights = audio::analyze_harmonics(wav, args.config);

  std::string out;
  for (std::size_t i = 0; i < weights.size(); ++i) {
    if (i)
      out += ',';
    out += formula::format_shortest(weights[i]);
  }
  emit(out, args.outputPath);
}

void print_hint(common::ErrorKind kind) {
  if (kind == common::ErrorKind::Io) {
    std::cerr << "Please check that:\n"
                 "1. The file path is correct\n"
                 "2. The file exists\n"
                 "3. You have permission to read the file\n";
  } else if (kind == common::ErrorKind::InvalidSoundfont) {
    std::cerr << "Make sure the file exists in the soundfonts directory!\n";
  }
}

} // namespace

int main(int argc, char **argv) {
  try {
    const app::Cli cli = app::parse_cli(argc, argv);
    switch (cli.command) {
    case app::Command::Help:
      std::cout << app::usage(argc > 0 ? argv[0] : "desmos_midi");
      return 0;
    case app::Command::Midi:
      run_midi(cli.midi);
      return 0;
    case app::Command::Audio:
      run_audio(cli.audio);
      return 0;
    }
    return 0;
  } catch (const common::Error &ex) {
    std::cerr << "error: " << common::kind_name(ex.kind()) << ": " << ex.what()
              << "\n";
    print_hint(ex.kind());
    return 1;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
