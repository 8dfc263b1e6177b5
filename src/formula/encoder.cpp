// src/formula/encoder.cpp
// Change-point sweep that renders a song as piecewise definitions.

#include "formula/encoder.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace formula {

namespace {

const char *const kEmptySong =
    "A=\\left\\{t<0:\\left[\\right]\\right\\}\nB=\\left[\\right]\nC=0";

// A note interval flattened out of its NoteEvent.
struct Span {
  midi::Timestamp startMs;
  midi::Timestamp endMs;
  std::uint8_t note;
  std::uint8_t velocity;
  std::size_t soundfont;
};

struct Section {
  std::vector<std::string> pieces;
  std::size_t length = 0;
  double lastTime = 0.0; // boundary of the last piece
};

// Every millisecond at which a note starts or ends, ascending, unique.
std::vector<midi::Timestamp> change_points(const midi::ProcessedSong &song) {
  std::vector<midi::Timestamp> ts;
  for (const auto &ev : song.noteEvents) {
    ts.push_back(ev.startMs);
    for (const auto &n : ev.notes)
      ts.push_back(n.endMs);
  }
  std::sort(ts.begin(), ts.end());
  ts.erase(std::unique(ts.begin(), ts.end()), ts.end());
  return ts;
}

// Intervals ordered by start time, then by position inside their event.
std::vector<Span> flatten(const midi::ProcessedSong &song) {
  std::vector<const midi::NoteEvent *> events;
  for (const auto &ev : song.noteEvents)
    events.push_back(&ev);
  std::stable_sort(events.begin(), events.end(),
                   [](const midi::NoteEvent *a, const midi::NoteEvent *b) {
                     return a->startMs < b->startMs;
                   });

  std::vector<Span> spans;
  for (const auto *ev : events) {
    for (const auto &n : ev->notes)
      spans.push_back(Span{ev->startMs, n.endMs, n.note, n.velocity,
                           n.soundfont});
  }
  return spans;
}

std::string note_array(const std::vector<Span> &active) {
  std::string out = "\\left[";
  bool first = true;
  for (const auto &s : active) {
    if (!first)
      out += ',';
    first = false;
    out += std::to_string(midi::relative_note(s.note));
    out += ',';
    out += std::to_string(s.velocity);
    out += ',';
    out += std::to_string(s.soundfont);
  }
  out += "\\right]";
  return out;
}

std::string piecewise(const std::string &name,
                      const std::vector<std::string> &pieces) {
  std::string out = name + "=\\left\\{";
  for (std::size_t i = 0; i < pieces.size(); ++i) {
    if (i)
      out += ',';
    out += pieces[i];
  }
  out += "\\right\\}";
  return out;
}

std::string section_name(std::size_t index) {
  return "A_{" + std::to_string(index) + "}";
}

} // namespace

// chars_format::fixed keeps tiny weights as "0.00001" instead of "1e-05".
std::string format_shortest(double v) {
  char buf[400];
  const auto res =
      std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
  return std::string(buf, res.ptr);
}

std::string format_shortest(float v) {
  char buf[64];
  const auto res =
      std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
  return std::string(buf, res.ptr);
}

std::string format_seconds(double seconds) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << seconds;
  return oss.str();
}

std::string encode(const midi::ProcessedSong &song) {
  if (song.noteEvents.empty())
    return kEmptySong;

  const std::vector<midi::Timestamp> times = change_points(song);
  const std::vector<Span> spans = flatten(song);

  std::vector<Section> sections;
  Section current;

  auto close_section = [&sections, &current]() {
    sections.push_back(std::move(current));
    current = Section{};
  };

  // Sweep the change points keeping the sounding spans in start order.
  std::vector<Span> sounding;
  std::size_t next = 0;
  for (std::size_t i = 0; i + 1 < times.size(); ++i) {
    const midi::Timestamp now = times[i];
    while (next < spans.size() && spans[next].startMs <= now)
      sounding.push_back(spans[next++]);
    sounding.erase(std::remove_if(sounding.begin(), sounding.end(),
                                  [now](const Span &s) {
                                    return s.endMs <= now;
                                  }),
                   sounding.end());

    std::vector<Span> active = sounding;
    std::stable_sort(active.begin(), active.end(),
                     [](const Span &a, const Span &b) {
                       return a.note < b.note;
                     });

    const double until = static_cast<double>(times[i + 1]) / 1000.0;
    std::string piece = "t<" + format_seconds(until) + ":" + note_array(active);

    if (current.length + piece.size() > kMaxSectionLength &&
        !current.pieces.empty())
      close_section();

    current.length += piece.size();
    current.pieces.push_back(std::move(piece));
    current.lastTime = until;
  }

  // Silence after the last change.
  const double end = static_cast<double>(times.back()) / 1000.0 + 0.1;
  current.pieces.push_back("t<" + format_shortest(end) + ":\\left[\\right]");
  current.lastTime = end;
  close_section();

  std::vector<std::string> lines;
  if (sections.size() == 1) {
    lines.push_back(piecewise("A", sections[0].pieces));
  } else {
    std::vector<std::string> selector;
    for (std::size_t i = 0; i < sections.size(); ++i)
      selector.push_back("t<" + format_seconds(sections[i].lastTime) + ":" +
                         section_name(i + 1));
    lines.push_back(piecewise("A", selector));
    for (std::size_t i = 0; i < sections.size(); ++i)
      lines.push_back(piecewise(section_name(i + 1), sections[i].pieces));
  }

  std::string weights = "B=\\left[";
  bool first = true;
  for (const auto &font : song.soundfonts.fonts()) {
    for (float w : font) {
      if (!first)
        weights += ',';
      first = false;
      weights += format_shortest(w);
    }
  }
  weights += "\\right]";
  lines.push_back(weights);
  lines.push_back("C=" + std::to_string(song.soundfonts.max_size()));

  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i)
      out += '\n';
    out += lines[i];
  }
  return out;
}

} // namespace formula
