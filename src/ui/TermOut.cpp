#include "ui/TermOut.hpp"
#include "app/Errors.hpp"
#include <algorithm>

namespace kata::ui {

static int fg_code(Color c) {
  switch (c) {
    case Color::Red: return 31;
    case Color::Green: return 32;
    case Color::Yellow: return 33;
    case Color::Blue: return 34;
    case Color::Magenta: return 35;
    case Color::Reset: break;
  }
  return 39;
}

static std::string rgb_params(Rgb c) {
  int r = std::clamp(c.r, 0, 255), g = std::clamp(c.g, 0, 255), b = std::clamp(c.b, 0, 255);
  return std::to_string(r) + ";" + std::to_string(g) + ";" + std::to_string(b);
}

TermOut::TermOut(std::ostream& sink, bool colors) : sink_(sink), colors_(colors) {
  buf_.reserve(16 * 1024);
}

TermOut& TermOut::csi(std::string_view body) {
  buf_ += "\x1B[";
  buf_ += body;
  return *this;
}

TermOut& TermOut::move_to(int col, int row) {
  col = std::max(0, col); row = std::max(0, row);
  return csi(std::to_string(row + 1) + ";" + std::to_string(col + 1) + "H");
}

TermOut& TermOut::move_to_next_line() { return csi("1E"); }

TermOut& TermOut::clear_until_newline() { return csi("K"); }

TermOut& TermOut::clear_all() { return csi("2J"); }

TermOut& TermOut::fg(Color c) {
  if (!colors_) return *this;
  return csi(std::to_string(fg_code(c)) + "m");
}

TermOut& TermOut::bg(Rgb c) {
  if (!colors_) return *this;
  return csi("48;2;" + rgb_params(c) + "m");
}

TermOut& TermOut::underline() {
  if (!colors_) return *this;
  return csi("4m");
}

TermOut& TermOut::reset_color() {
  if (!colors_) return *this;
  return csi("0m");
}

TermOut& TermOut::begin_sync() { return csi("?2026h"); }

TermOut& TermOut::end_sync() { return csi("?2026l"); }

TermOut& TermOut::write(std::string_view bytes) {
  buf_.append(bytes.data(), bytes.size());
  return *this;
}

void TermOut::flush() {
  if (!buf_.empty()) {
    sink_.write(buf_.data(), static_cast<std::streamsize>(buf_.size()));
    buf_.clear();
  }
  sink_.flush();
  if (!sink_) throw kata::app::IoError("failed to write to the terminal");
}

} // namespace kata::ui
