// tests/app/processor_test.cpp
// End-to-end tests: MIDI file on disk + soundfont directory -> formula.

#include "app/processor.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "common/errors.hpp"
#include "formula/encoder.hpp"
#include "test_helpers.hpp"

namespace app {
namespace {

using test_helpers::make_smf;
using test_helpers::samples_dir;
using test_helpers::TrackBuilder;
using test_helpers::write_temp;

// ===========================================================================
// Helpers
// ===========================================================================

// One middle C lasting 960 ticks = one second at the default tempo.
std::filesystem::path single_note_file() {
  TrackBuilder t;
  t.note_on(0, 0, 60, 100).note_off(960, 0, 60).end();
  return write_temp("single_note.mid", make_smf(480, {t}));
}

// Piano on channel 0, saxophone on channel 1, drums on channel 9.
std::filesystem::path band_file() {
  TrackBuilder piano;
  piano.program(0, 0, 0).note_on(0, 0, 60, 100).note_off(960, 0, 60).end();
  TrackBuilder sax;
  sax.program(0, 1, 65).note_on(0, 1, 72, 100).note_off(960, 1, 72).end();
  TrackBuilder drums;
  drums.note_on(480, 9, 36, 120).note_off(240, 9, 36).end();
  return write_temp("band.mid", make_smf(480, {piano, sax, drums}));
}

// ===========================================================================
// Tests
// ===========================================================================

TEST(ProcessorTest, InfoListsChannelsOnly) {
  MidiProcessor proc(samples_dir());
  midi::ProcessedSong song = proc.process_info(band_file());
  ASSERT_EQ(song.channels.size(), 3u);
  EXPECT_EQ(song.channels[1].instrument, 65);
  EXPECT_TRUE(song.channels[2].isDrum);
  EXPECT_TRUE(song.noteEvents.empty());
}

TEST(ProcessorTest, SingleNoteWithSine) {
  MidiProcessor proc(samples_dir());
  midi::ProcessedSong song =
      proc.process_with_soundfonts(single_note_file(), {"sine.txt"});
  EXPECT_EQ(formula::encode(song),
            "A=\\left\\{t<1.000:\\left[-9,100,0\\right],"
            "t<1.1:\\left[\\right]\\right\\}\n"
            "B=\\left[1\\right]\n"
            "C=1");
}

TEST(ProcessorTest, QuarterNoteAtSixtyBpm) {
  TrackBuilder t;
  t.tempo(0, 1000000).note_on(0, 0, 60, 100).note_off(1, 0, 60).end();
  const auto path = write_temp("sixty_bpm.mid", make_smf(1, {t}));
  MidiProcessor proc(samples_dir());
  const std::string text =
      formula::encode(proc.process_with_soundfonts(path, {"sine.txt"}));
  EXPECT_NE(text.find("t<1.000:"), std::string::npos);
  EXPECT_EQ(text.substr(text.find("\nB=") + 1), "B=\\left[1\\right]\nC=1");
}

TEST(ProcessorTest, PerChannelSoundfontsWithDrumsSkipped) {
  MidiProcessor proc(samples_dir());
  midi::ProcessedSong song = proc.process_with_soundfonts(
      band_file(), {"sine.txt", "square.txt", "-"});
  const std::string text = formula::encode(song);

  EXPECT_NE(text.find("t<1.000:\\left[-9,100,0,3,100,1\\right]"),
            std::string::npos);
  // No drum note (36 -> -33) anywhere.
  EXPECT_EQ(text.find("-33,"), std::string::npos);
  EXPECT_NE(text.find("\nB=\\left[1,0,0,0,0,0,0,0,0,0,"
                      "1,0,0.33333,0,0.2,0,0.14286,0,0.11111,0\\right]\n"),
            std::string::npos);
  EXPECT_EQ(text.substr(text.size() - 5), "\nC=10");
}

TEST(ProcessorTest, OneSoundfontForEveryChannel) {
  MidiProcessor proc(samples_dir());
  midi::ProcessedSong song =
      proc.process_with_soundfonts(band_file(), {"square.txt"});
  EXPECT_EQ(song.soundfonts.fonts().size(), 1u);
  const std::string text = formula::encode(song);
  EXPECT_NE(text.find("-33,120,0"), std::string::npos);
}

TEST(ProcessorTest, CountMismatch) {
  MidiProcessor proc(samples_dir());
  try {
    (void)proc.process_with_soundfonts(band_file(), {"sine.txt", "sine.txt"});
    FAIL() << "expected a mismatch";
  } catch (const common::Error &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::SoundfontMismatch);
    EXPECT_STREQ(e.what(),
                 "Not enough soundfonts provided. Need 3 for channels, got 2");
  }
}

TEST(ProcessorTest, BrokenSoundfontSurfaces) {
  MidiProcessor proc(samples_dir());
  try {
    (void)proc.process_with_soundfonts(single_note_file(), {"broken.txt"});
    FAIL() << "expected an exception";
  } catch (const common::Error &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::InvalidSoundfont);
  }
}

TEST(ProcessorTest, VerifyNamesInDirectory) {
  MidiProcessor proc(samples_dir());
  EXPECT_NO_THROW(proc.verify_soundfonts({"sine.txt", "-", "default.txt"}));
  EXPECT_THROW(proc.verify_soundfonts({"violin.txt"}), common::Error);
}

TEST(ProcessorTest, MissingMidiFile) {
  MidiProcessor proc(samples_dir());
  try {
    (void)proc.process_info("/nonexistent/song.mid");
    FAIL() << "expected an exception";
  } catch (const common::Error &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::Io);
  }
}

} // namespace
} // namespace app
