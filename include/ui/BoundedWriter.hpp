#pragma once

#include "ui/TermOut.hpp"
#include <cstddef>
#include <string_view>

namespace kata::ui {

// Column-counting writer for a single terminal line. Text that does not fit
// in the remaining budget is dropped; a line never grows past max_cols.
class BoundedWriter {
public:
  BoundedWriter(TermOut& out, size_t max_cols) : out_(out), max_cols_(max_cols) {}

  // Bytes are assumed to be printable ASCII (one column each)
  void write_ascii(std::string_view ascii);
  // UTF-8 text, measured per code point
  void write_text(std::string_view text);

  // Reserve columns for a glyph the caller writes straight to out().
  // Returns false (and reserves nothing) when the glyph would not fit.
  [[nodiscard]] bool add_to_len(size_t cols);

  [[nodiscard]] size_t len() const { return len_; }
  [[nodiscard]] size_t remaining() const { return len_ >= max_cols_ ? 0 : max_cols_ - len_; }
  [[nodiscard]] TermOut& out() { return out_; }

private:
  TermOut& out_;
  size_t len_{0};
  size_t max_cols_;
};

} // namespace kata::ui
