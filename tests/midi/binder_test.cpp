// tests/midi/binder_test.cpp
// Tests for attaching soundfonts to channels.

#include "midi/binder.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "common/errors.hpp"

namespace midi {
namespace {

// ===========================================================================
// Helpers
// ===========================================================================

// Two channels (0 and 9), one note each plus a shared chord at 500 ms.
ProcessedSong two_channel_song() {
  ProcessedSong song;
  song.channels = {Channel{0, 0, false}, Channel{9, 0, true}};
  song.noteEvents = {
      NoteEvent{0, {NoteInterval{60, 100, 0, 500}}},
      NoteEvent{250, {NoteInterval{36, 90, 9, 400}}},
      NoteEvent{500,
                {NoteInterval{64, 80, 0, 1000}, NoteInterval{38, 70, 9, 600}}},
  };
  return song;
}

const SoundFont kSine = {1.0f};
const SoundFont kSquare = {1.0f, 0.0f, 0.33333f};

// ===========================================================================
// Tests
// ===========================================================================

TEST(BinderTest, OnePerChannelMapsInOrder) {
  ProcessedSong song = two_channel_song();
  bind_soundfonts(song, {kSine, kSquare});

  ASSERT_EQ(song.soundfonts.fonts().size(), 2u);
  EXPECT_EQ(song.soundfonts.max_size(), 3u);
  EXPECT_EQ(song.noteEvents[0].notes[0].soundfont, 0u);
  EXPECT_EQ(song.noteEvents[1].notes[0].soundfont, 1u);
  EXPECT_EQ(song.noteEvents[2].notes[1].soundfont, 1u);
}

TEST(BinderTest, RowsArePaddedWithZeros) {
  ProcessedSong song = two_channel_song();
  bind_soundfonts(song, {kSine, kSquare});
  const auto &rows = song.soundfonts.fonts();
  ASSERT_EQ(rows[0].size(), 3u);
  EXPECT_FLOAT_EQ(rows[0][0], 1.0f);
  EXPECT_FLOAT_EQ(rows[0][1], 0.0f);
  EXPECT_FLOAT_EQ(rows[0][2], 0.0f);
}

TEST(BinderTest, SingleSoundfontIsSharedByAllChannels) {
  ProcessedSong song = two_channel_song();
  bind_soundfonts(song, {kSquare});

  ASSERT_EQ(song.soundfonts.fonts().size(), 1u);
  for (const auto &ev : song.noteEvents)
    for (const auto &n : ev.notes)
      EXPECT_EQ(n.soundfont, 0u);
}

TEST(BinderTest, ExcludedChannelLosesItsNotes) {
  ProcessedSong song = two_channel_song();
  bind_soundfonts(song, {kSine, std::nullopt});

  // The 250 ms event only held a drum note and disappears.
  ASSERT_EQ(song.noteEvents.size(), 2u);
  EXPECT_EQ(song.noteEvents[0].startMs, 0u);
  EXPECT_EQ(song.noteEvents[1].startMs, 500u);
  ASSERT_EQ(song.noteEvents[1].notes.size(), 1u);
  EXPECT_EQ(song.noteEvents[1].notes[0].note, 64);
  EXPECT_EQ(song.soundfonts.fonts().size(), 1u);
}

TEST(BinderTest, ExcludingFirstChannelCompactsRows) {
  ProcessedSong song = two_channel_song();
  bind_soundfonts(song, {std::nullopt, kSquare});
  ASSERT_EQ(song.soundfonts.fonts().size(), 1u);
  for (const auto &ev : song.noteEvents)
    for (const auto &n : ev.notes)
      EXPECT_EQ(n.soundfont, 0u);
}

TEST(BinderTest, SingleExclusionDropsEverything) {
  ProcessedSong song = two_channel_song();
  bind_soundfonts(song, {std::nullopt});
  EXPECT_TRUE(song.noteEvents.empty());
  EXPECT_TRUE(song.soundfonts.fonts().empty());
  EXPECT_EQ(song.soundfonts.max_size(), 0u);
}

TEST(BinderTest, TooFewSoundfontsIsRejected) {
  ProcessedSong song;
  song.channels = {Channel{0, 0, false}, Channel{1, 0, false},
                   Channel{2, 0, false}};
  song.noteEvents = {NoteEvent{0, {NoteInterval{60, 100, 1, 10}}}};
  try {
    bind_soundfonts(song, {kSine, kSine});
    FAIL() << "expected a mismatch";
  } catch (const common::Error &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::SoundfontMismatch);
    EXPECT_STREQ(e.what(),
                 "Not enough soundfonts provided. Need 3 for channels, got 2");
  }
  // Nothing was rewritten.
  EXPECT_EQ(song.noteEvents[0].notes[0].soundfont, 1u);
  EXPECT_TRUE(song.soundfonts.fonts().empty());
}

TEST(BinderTest, TooManySoundfontsIsRejected) {
  try {
    check_soundfont_count(2, 3);
    FAIL() << "expected a mismatch";
  } catch (const common::Error &e) {
    EXPECT_EQ(e.kind(), common::ErrorKind::SoundfontMismatch);
    EXPECT_STREQ(e.what(),
                 "Too many soundfonts provided. Need 2 for channels, got 3");
  }
}

TEST(BinderTest, ZeroSoundfontsIsRejected) {
  EXPECT_THROW(check_soundfont_count(1, 0), common::Error);
}

TEST(BinderTest, PlanUsesChannelIdsNotPositions) {
  std::vector<Channel> channels = {Channel{5, 0, false}, Channel{2, 0, false}};
  SoundfontBinding b = plan_binding(channels, {kSine, kSquare});
  ASSERT_TRUE(b.channelToIndex[5].has_value());
  ASSERT_TRUE(b.channelToIndex[2].has_value());
  EXPECT_EQ(*b.channelToIndex[5], 0u);
  EXPECT_EQ(*b.channelToIndex[2], 1u);
  EXPECT_FALSE(b.channelToIndex[0].has_value());
}

} // namespace
} // namespace midi
