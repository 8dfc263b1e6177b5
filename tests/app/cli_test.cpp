// tests/app/cli_test.cpp
// Tests for command-line parsing.

#include "app/cli.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "common/errors.hpp"
#include "test_helpers.hpp"

namespace app {
namespace {

// ===========================================================================
// Helpers
// ===========================================================================

// Owns argv storage for one parse_cli call.
class Argv {
public:
  explicit Argv(std::vector<std::string> args) : args_(std::move(args)) {
    for (auto &a : args_)
      ptrs_.push_back(a.data());
  }
  int argc() const { return static_cast<int>(ptrs_.size()); }
  char **argv() { return ptrs_.data(); }

private:
  std::vector<std::string> args_;
  std::vector<char *> ptrs_;
};

Cli parse(std::vector<std::string> args) {
  Argv a(std::move(args));
  return parse_cli(a.argc(), a.argv());
}

common::ErrorKind kind_of(std::vector<std::string> args) {
  try {
    (void)parse(std::move(args));
  } catch (const common::Error &e) {
    return e.kind();
  }
  ADD_FAILURE() << "parse_cli did not throw";
  return common::ErrorKind::Processing;
}

// Any existing file works as the positional input.
std::string existing_file() {
  return (test_helpers::samples_dir() / "sine.txt").string();
}

// ===========================================================================
// Tests
// ===========================================================================

TEST(CliTest, HelpAnywhere) {
  EXPECT_EQ(parse({"desmos_midi", "--help"}).command, Command::Help);
  EXPECT_EQ(parse({"desmos_midi", "midi", existing_file(), "-h"}).command,
            Command::Help);
}

TEST(CliTest, MissingArgumentsShowUsage) {
  EXPECT_EQ(kind_of({"desmos_midi"}), common::ErrorKind::InvalidParameters);
  EXPECT_EQ(kind_of({"desmos_midi", "midi"}),
            common::ErrorKind::InvalidParameters);
}

TEST(CliTest, UnknownCommand) {
  EXPECT_EQ(kind_of({"desmos_midi", "video", existing_file()}),
            common::ErrorKind::InvalidParameters);
}

TEST(CliTest, MissingInputFileIsIoError) {
  EXPECT_EQ(kind_of({"desmos_midi", "midi", "/nonexistent/song.mid"}),
            common::ErrorKind::Io);
}

TEST(CliTest, MidiDefaults) {
  Cli cli = parse({"desmos_midi", "midi", existing_file()});
  EXPECT_EQ(cli.command, Command::Midi);
  EXPECT_EQ(cli.midi.inputPath, std::filesystem::path(existing_file()));
  EXPECT_TRUE(cli.midi.soundfonts.empty());
  EXPECT_EQ(cli.midi.soundfontDir, std::filesystem::path("soundfonts"));
  EXPECT_FALSE(cli.midi.outputPath.has_value());
  EXPECT_FALSE(cli.midi.info);
  EXPECT_FALSE(cli.midi.verbose);
}

TEST(CliTest, SoundfontListStopsAtNextFlag) {
  Cli cli = parse({"desmos_midi", "midi", existing_file(), "-s", "piano", "-",
                   "strings.txt", "-o", "out.txt", "--verbose"});
  EXPECT_EQ(cli.midi.soundfonts,
            (std::vector<std::string>{"piano", "-", "strings.txt"}));
  ASSERT_TRUE(cli.midi.outputPath.has_value());
  EXPECT_EQ(*cli.midi.outputPath, std::filesystem::path("out.txt"));
  EXPECT_TRUE(cli.midi.verbose);
}

TEST(CliTest, InfoAndSoundfontDir) {
  Cli cli = parse({"desmos_midi", "midi", existing_file(), "--info",
                   "--soundfont-dir", "/opt/fonts"});
  EXPECT_TRUE(cli.midi.info);
  EXPECT_EQ(cli.midi.soundfontDir, std::filesystem::path("/opt/fonts"));
}

TEST(CliTest, EmptySoundfontListIsRejected) {
  EXPECT_EQ(kind_of({"desmos_midi", "midi", existing_file(), "-s", "-i"}),
            common::ErrorKind::InvalidParameters);
}

TEST(CliTest, OutputNeedsValue) {
  EXPECT_EQ(kind_of({"desmos_midi", "midi", existing_file(), "-o"}),
            common::ErrorKind::InvalidParameters);
}

TEST(CliTest, UnknownMidiOption) {
  EXPECT_EQ(kind_of({"desmos_midi", "midi", existing_file(), "--loud"}),
            common::ErrorKind::InvalidParameters);
}

TEST(CliTest, AudioDefaults) {
  Cli cli = parse({"desmos_midi", "audio", existing_file()});
  EXPECT_EQ(cli.command, Command::Audio);
  EXPECT_EQ(cli.audio.config.samples, 8192u);
  EXPECT_FLOAT_EQ(cli.audio.config.startTime, 0.0f);
  EXPECT_FLOAT_EQ(cli.audio.config.baseFreq, 440.0f);
  EXPECT_EQ(cli.audio.config.numHarmonics, 16u);
  EXPECT_FLOAT_EQ(cli.audio.config.boost, 1.0f);
}

TEST(CliTest, AudioNumbers) {
  Cli cli = parse({"desmos_midi", "audio", existing_file(), "--samples",
                   "4096", "--start-time", "0.5", "--base-freq", "261.63",
                   "--harmonics", "8", "--boost", "1.5", "-o", "font.txt"});
  EXPECT_EQ(cli.audio.config.samples, 4096u);
  EXPECT_FLOAT_EQ(cli.audio.config.startTime, 0.5f);
  EXPECT_FLOAT_EQ(cli.audio.config.baseFreq, 261.63f);
  EXPECT_EQ(cli.audio.config.numHarmonics, 8u);
  EXPECT_FLOAT_EQ(cli.audio.config.boost, 1.5f);
  ASSERT_TRUE(cli.audio.outputPath.has_value());
}

TEST(CliTest, AudioRejectsMalformedNumbers) {
  EXPECT_EQ(kind_of({"desmos_midi", "audio", existing_file(), "--samples",
                     "12abc"}),
            common::ErrorKind::InvalidParameters);
  EXPECT_EQ(kind_of({"desmos_midi", "audio", existing_file(), "--boost",
                     "loud"}),
            common::ErrorKind::InvalidParameters);
}

} // namespace
} // namespace app
