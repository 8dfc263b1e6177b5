// src/midi/smf.cpp
// Parse a Standard MIDI File (SMF) from memory into midi::DecodedMidi.
// Pure parsing: no printing, no I/O.

#include "midi/smf.hpp"
#include "common/errors.hpp"
#include "common/reader.hpp" // Bytes cursor + read_vlq()

#include <cstdint>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

using common::Error;
using common::ErrorKind;

constexpr std::uint32_t kMThd = 0x4D546864;
constexpr std::uint32_t kMTrk = 0x4D54726B;

// Parse SMF header (MThd chunk). Only PPQN timing is accepted.
midi::SMFHeader parse_header(Bytes &r) {
  if (r.be32() != kMThd) {
    throw Error(ErrorKind::ContainerParse, "Not a MIDI file (missing 'MThd')");
  }

  const std::uint32_t length = r.be32();
  if (length < 6) {
    throw Error(ErrorKind::ContainerParse,
                "Header chunk length must be at least 6, got " +
                    std::to_string(length));
  }

  midi::SMFHeader h{};
  h.format = r.be16();
  h.nTracks = r.be16();
  h.division = r.be16();
  r.skip(length - 6); // future header fields

  if (h.format > 2) {
    throw Error(ErrorKind::ContainerParse,
                "Unknown SMF format " + std::to_string(h.format));
  }
  if (h.division & 0x8000) {
    throw Error(ErrorKind::UnsupportedFormat,
                "Unsupported MIDI timing format (SMPTE)");
  }
  h.ppqn = static_cast<unsigned>(h.division & 0x7FFF);
  if (h.ppqn == 0) {
    throw Error(ErrorKind::ContainerParse, "Division of 0 ticks per quarter");
  }
  return h;
}

// Registers channels on first sight and applies Program Changes.
class ChannelRegistry {
public:
  void touch(std::uint8_t ch) {
    if (slot_[ch] >= 0)
      return;
    slot_[ch] = static_cast<int>(channels_.size());
    midi::Channel c;
    c.id = ch;
    c.isDrum = (ch == 9);
    channels_.push_back(c);
  }

  void set_program(std::uint8_t ch, std::uint8_t program) {
    touch(ch);
    channels_[static_cast<std::size_t>(slot_[ch])].instrument = program;
  }

  std::vector<midi::Channel> take() { return std::move(channels_); }

private:
  int slot_[16] = {-1, -1, -1, -1, -1, -1, -1, -1,
                   -1, -1, -1, -1, -1, -1, -1, -1};
  std::vector<midi::Channel> channels_;
};

midi::EvType classify(std::uint8_t type, std::uint8_t d2) {
  switch (type) {
  case 0x90:
    return d2 != 0 ? midi::EvType::NoteOn : midi::EvType::NoteOff;
  case 0x80:
    return midi::EvType::NoteOff;
  case 0xC0:
    return midi::EvType::ProgramChange;
  default:
    return midi::EvType::Other;
  }
}

// Walk the body of a single MTrk chunk and append events to out.
// - Produces absolute tick times (track-local; OK for formats 0 and 1).
void walk_one_track(Bytes tr, int trackIndex, midi::DecodedMidi &out,
                    ChannelRegistry &channels) {

  std::uint64_t tick = 0;
  std::uint8_t running = 0; // last seen channel status for running status

  while (!tr.eof()) {
    // 1) Delta-time (Variable-Length Quantity)
    tick += read_vlq(tr);

    // 2) Status or running status?
    std::uint8_t first = tr.u8();
    std::uint8_t status = 0;
    bool haveData1 = false;
    std::uint8_t data1 = 0;

    if (first & 0x80) {
      status = first;
      if (status < 0xF0) {
        running = status; // only channel messages set running status
      }
    } else {
      if (running == 0) {
        throw Error(ErrorKind::ContainerParse,
                    "Running status used before any status in track " +
                        std::to_string(trackIndex));
      }
      status = running;
      haveData1 = true;
      data1 = first;
    }

    const std::uint8_t type = status & 0xF0;
    const std::uint8_t ch = status & 0x0F;

    // Channel messages (one or two data bytes)
    if (type >= 0x80 && type <= 0xE0) {
      const bool twoBytes = !(type == 0xC0 || type == 0xD0);
      std::uint8_t d1 = haveData1 ? data1 : tr.u8();
      std::uint8_t d2 = twoBytes ? tr.u8() : 0;
      if ((d1 | d2) & 0x80) {
        throw Error(ErrorKind::ContainerParse,
                    "Data byte with high bit set in track " +
                        std::to_string(trackIndex));
      }

      const midi::EvType ev = classify(type, d2);
      if (ev == midi::EvType::ProgramChange) {
        channels.set_program(ch, d1);
      } else {
        channels.touch(ch);
      }
      out.events.push_back(midi::ChannelEv{tick, ch, ev, d1, d2});
      continue;
    }

    // Meta events
    if (status == 0xFF) {
      running = 0; // meta and sysex cancel running status
      std::uint8_t metaType = tr.u8();
      std::uint32_t mlen = read_vlq(tr);

      if (metaType == 0x2F) { // End of Track
        tr.skip(mlen);
        break;
      } else if (metaType == 0x51 && mlen == 3) {
        // Tempo: 3 bytes big-endian microseconds per quarter note
        out.tempi.push_back(midi::TempoChange{tick, tr.be24()});
      } else {
        tr.skip(mlen);
      }
      continue;
    }

    // SysEx events
    if (status == 0xF0 || status == 0xF7) {
      running = 0;
      tr.skip(read_vlq(tr));
      continue;
    }

    std::ostringstream oss;
    oss << "Unsupported or malformed status byte: 0x" << std::hex
        << int(status) << " in track " << std::dec << trackIndex;
    throw Error(ErrorKind::ContainerParse, oss.str());
  }
}

} // namespace

namespace midi {

DecodedMidi parse_smf(const std::vector<std::uint8_t> &bytes) {
  Bytes r(bytes);

  DecodedMidi song;
  song.header = parse_header(r);
  song.events.reserve(4096);
  song.tempi.reserve(64);

  ChannelRegistry channels;
  // Chunks other than MTrk (vendor data such as XFIH) are skipped.
  std::uint16_t tracks = 0;
  while (tracks < song.header.nTracks) {
    if (r.remaining() < 8) {
      throw Error(ErrorKind::ContainerParse,
                  "Missing 'MTrk' for track " + std::to_string(tracks));
    }
    const std::uint32_t id = r.be32();
    const std::uint32_t len = r.be32();
    if (id != kMTrk) {
      r.skip(len);
      continue;
    }
    walk_one_track(r.slice(len), static_cast<int>(tracks), song, channels);
    ++tracks;
  }
  song.channels = channels.take();
  return song;
}

} // namespace midi
