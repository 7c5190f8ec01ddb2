#include "ui/Terminal.hpp"
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace kata::ui {

std::atomic<bool> g_stop{false};
std::atomic<bool> g_alt_in_use{false};
std::atomic<bool> g_resized{false};

void best_effort_write(int fd, const char* buf, size_t len) {
  if (len == 0) return;
  if (::write(fd, buf, len) < 0) { /* ignore */ }
}

void restore_terminal_minimal() {
  // Async-signal-safe: close any open synchronized update, leave the alt
  // screen, then show the cursor and reset SGR
  const char* sync_off = "\x1B[?2026l";
  const char* alt_off = "\x1B[?1049l";
  const char* show_cur = "\x1B[?25h";
  const char* reset = "\x1B[0m";
  best_effort_write(STDOUT_FILENO, sync_off, std::char_traits<char>::length(sync_off));
  if (g_alt_in_use.load()) best_effort_write(STDOUT_FILENO, alt_off, std::char_traits<char>::length(alt_off));
  best_effort_write(STDOUT_FILENO, show_cur, std::char_traits<char>::length(show_cur));
  best_effort_write(STDOUT_FILENO, reset, std::char_traits<char>::length(reset));
}

void on_sigint(int){ g_stop.store(true); }

void on_sigwinch(int){ g_resized.store(true); }

void on_atexit_restore(){
  // Ensure all buffered output is written, then restore terminal state
  std::fflush(stdout);
  restore_terminal_minimal();
  if (::isatty(STDOUT_FILENO) == 1) {
    tcdrain(STDOUT_FILENO);
  }
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

TermSize term_size() {
  struct winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0)
    return TermSize{ws.ws_col, ws.ws_row};
  auto env_dim = [](const char* name, int defv) {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    try { return std::clamp(std::stoi(v), 0, 0xFFFF); } catch (const std::exception&) { return defv; }
  };
  return TermSize{(uint16_t)env_dim("COLUMNS", 80), (uint16_t)env_dim("LINES", 24)};
}

RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) == 1) {
    if (tcgetattr(STDIN_FILENO, &old_) == 0) {
      termios neo = old_;
      neo.c_lflag &= ~(ICANON | ECHO);
      neo.c_cc[VMIN] = 0;
      neo.c_cc[VTIME] = 0;
      tcsetattr(STDIN_FILENO, TCSANOW, &neo);
      old_flags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
      fcntl(STDIN_FILENO, F_SETFL, old_flags_ | O_NONBLOCK);
      active_ = true;
    }
  }
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
    fcntl(STDIN_FILENO, F_SETFL, old_flags_);
  }
}

CursorGuard::CursorGuard() {
  if (tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?25l", 6);
    active_ = true;
  }
}

CursorGuard::~CursorGuard() {
  if (active_) best_effort_write(STDOUT_FILENO, "\x1B[?25h", 6);
}

AltScreenGuard::AltScreenGuard(bool enable) {
  if (enable && tty_stdout()) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049h", 8);
    active_ = true;
    g_alt_in_use.store(true);
  }
}

AltScreenGuard::~AltScreenGuard() {
  if (active_) {
    best_effort_write(STDOUT_FILENO, "\x1B[?1049l", 8);
    g_alt_in_use.store(false);
  }
}

} // namespace kata::ui
