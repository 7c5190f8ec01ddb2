#include "ui/BoundedWriter.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>

namespace kata::ui {

void BoundedWriter::write_ascii(std::string_view ascii) {
  size_t n = std::min(ascii.size(), remaining());
  if (n == 0) return;
  out_.write(ascii.substr(0, n));
  len_ += n;
}

void BoundedWriter::write_text(std::string_view text) {
  size_t end = 0;
  size_t i = 0;
  while (i < text.size()) {
    size_t next = i;
    char32_t cp = decode_u8(text, next);
    size_t cols = static_cast<size_t>(char_cols(cp));
    if (len_ + cols > max_cols_) break;
    len_ += cols;
    i = next;
    end = i;
  }
  if (end > 0) out_.write(text.substr(0, end));
}

bool BoundedWriter::add_to_len(size_t cols) {
  if (cols > remaining()) return false;
  len_ += cols;
  return true;
}

} // namespace kata::ui
