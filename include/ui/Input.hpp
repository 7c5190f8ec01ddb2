#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace kata::ui {

enum class ListAction {
  Next, Previous, First, Last,
  ToggleDone, TogglePending,
  Reset, Continue, Quit
};

// Decode one complete buffer into list actions; unknown bytes are dropped
// and a trailing lone ESC is Esc (Quit)
[[nodiscard]] std::vector<ListAction> decode_keys(const unsigned char* buf, size_t n);

// Stream decoder for successive reads. An escape sequence cut off at the end
// of one read is held back and completed by the next one.
class KeyDecoder {
public:
  [[nodiscard]] std::vector<ListAction> feed(const unsigned char* buf, size_t n);
  // Input went quiet: whatever is held back is decoded as typed (a bare ESC quits)
  [[nodiscard]] std::vector<ListAction> finish();
  [[nodiscard]] bool pending() const { return !carry_.empty(); }

private:
  std::string carry_;
};

// True when fd is readable or hung up (a following read reports EOF)
bool has_input_available(int fd, int timeout_ms);

struct ReadResult {
  std::vector<ListAction> actions;
  bool eof{false};
};

// Non-blocking read of whatever is pending on fd
[[nodiscard]] ReadResult read_actions(int fd, KeyDecoder& decoder);

} // namespace kata::ui
