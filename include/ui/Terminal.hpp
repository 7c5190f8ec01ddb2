#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <termios.h>

namespace kata::ui {

// Terminal state management
extern std::atomic<bool> g_stop;
extern std::atomic<bool> g_alt_in_use;
extern std::atomic<bool> g_resized;

void restore_terminal_minimal();
void on_sigint(int);
void on_sigwinch(int);
void on_atexit_restore();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();

struct TermSize { uint16_t cols; uint16_t rows; };
// As reported by the tty; rows may be 0 while a resize is in flight
[[nodiscard]] TermSize term_size();

// Best-effort terminal write (async-signal-safe)
void best_effort_write(int fd, const char* buf, size_t len);

// RAII guards for terminal state
class RawTermGuard {
  bool active_{false};
  termios old_{};
  int old_flags_{0};
public:
  RawTermGuard();
  ~RawTermGuard();
};

class CursorGuard {
  bool active_{false};
public:
  CursorGuard();
  ~CursorGuard();
};

class AltScreenGuard {
  bool active_{false};
public:
  explicit AltScreenGuard(bool enable);
  ~AltScreenGuard();
};

} // namespace kata::ui
