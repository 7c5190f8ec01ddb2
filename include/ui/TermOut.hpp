#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace kata::ui {

enum class Color { Reset, Red, Green, Yellow, Blue, Magenta };

struct Rgb { int r{0}; int g{0}; int b{0}; };

// Queue of terminal commands for one frame. Nothing reaches the sink
// until flush(), which emits the whole frame in a single write.
class TermOut {
public:
  explicit TermOut(std::ostream& sink, bool colors = true);
  TermOut(const TermOut&) = delete;
  TermOut& operator=(const TermOut&) = delete;

  // Cursor and screen (0-based col/row)
  TermOut& move_to(int col, int row);
  TermOut& move_to_next_line();
  TermOut& clear_until_newline();
  TermOut& clear_all();

  // SGR; no-ops when colors are disabled
  TermOut& fg(Color c);
  TermOut& bg(Rgb c);
  TermOut& underline();
  TermOut& reset_color();

  // Synchronized output (DEC mode 2026)
  TermOut& begin_sync();
  TermOut& end_sync();

  TermOut& write(std::string_view bytes);

  // Throws kata::app::IoError if the sink fails
  void flush();

  [[nodiscard]] bool colors() const { return colors_; }
  [[nodiscard]] const std::string& pending() const { return buf_; }

private:
  TermOut& csi(std::string_view body);

  std::ostream& sink_;
  std::string buf_;
  bool colors_;
};

} // namespace kata::ui
