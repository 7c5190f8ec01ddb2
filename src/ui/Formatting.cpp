#include "ui/Formatting.hpp"
#include <cstdio>
#include <cwchar>
#include <filesystem>
#include <system_error>

namespace kata::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

char32_t decode_u8(std::string_view s, size_t& i) {
  unsigned char c = (unsigned char)s[i];
  int len = u8_len(c);
  if (len == 1 || i + (size_t)len > s.size()) {
    i += 1;
    return c < 0x80 ? (char32_t)c : 0xFFFD;
  }
  char32_t cp = (len == 2) ? (c & 0x1F) : (len == 3) ? (c & 0x0F) : (c & 0x07);
  for (int k = 1; k < len; ++k) {
    unsigned char cc = (unsigned char)s[i + k];
    if ((cc & 0xC0) != 0x80) { i += 1; return 0xFFFD; }
    cp = (cp << 6) | (cc & 0x3F);
  }
  i += len;
  return cp;
}

int char_cols(char32_t cp) {
  if (cp < 0x80) return 1;
  int w = ::wcwidth(static_cast<wchar_t>(cp));
  // Unknown to the locale: assume a single cell
  return w < 0 ? 1 : w;
}

// Length of an escape sequence starting at s[i] (ESC), 0 if none
static size_t escape_len(std::string_view s, size_t i) {
  if (i + 1 >= s.size() || s[i] != '\x1B') return 0;
  size_t j = i + 2;
  if (s[i+1] == '[') {
    while (j < s.size() && (s[j] < '@' || s[j] > '~')) j++;
    if (j < s.size()) j++; // final byte
    return j - i;
  }
  if (s[i+1] == ']') {
    while (j < s.size()) {
      if (s[j] == '\a') { j++; break; }
      if (s[j] == '\x1B' && j + 1 < s.size() && s[j+1] == '\\') { j += 2; break; }
      j++;
    }
    return j - i;
  }
  return 0;
}

int display_cols(std::string_view s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    if (size_t esc = escape_len(s, i)) { i += esc; continue; }
    cols += char_cols(decode_u8(s, i));
  }
  return cols;
}

std::string take_cols(std::string_view s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size()) {
    // Copy escape sequences without counting them
    if (size_t esc = escape_len(s, i)) {
      out.append(s.substr(i, esc));
      i += esc;
      continue;
    }
    size_t next = i;
    int w = char_cols(decode_u8(s, next));
    if (seen + w > cols) break;
    out.append(s.substr(i, next - i));
    seen += w;
    i = next;
  }
  return out;
}

void progress_bar(BoundedWriter& w, size_t done, size_t total, int term_width) {
  constexpr std::string_view kPrefix = "Progress: [";
  constexpr int kWrapperWidth = (int)kPrefix.size() + (int)std::string_view("] xxx/xxx").size();
  constexpr int kMinLineWidth = kWrapperWidth + 4;

  if (done > total) done = total;
  if (term_width < kMinLineWidth) {
    w.write_ascii("Progress: ");
    w.write_ascii(std::to_string(done) + "/" + std::to_string(total));
    return;
  }

  w.write_ascii(kPrefix);
  size_t width = (size_t)(term_width - kWrapperWidth);
  size_t filled = total == 0 ? 0 : (width * done) / total;

  w.out().fg(Color::Green);
  w.write_ascii(std::string(filled, '#'));
  if (filled < width) w.write_ascii(">");
  if (width - filled > 1) {
    w.out().fg(Color::Red);
    w.write_ascii(std::string(width - filled - 1, '-'));
  }
  w.out().fg(Color::Reset);

  char buf[48];
  std::snprintf(buf, sizeof(buf), "] %3zu/%zu", done, total);
  w.write_ascii(buf);
}

void file_link(BoundedWriter& w, std::string_view text, const std::filesystem::path& target, Color color) {
  std::error_code ec;
  auto canonical = std::filesystem::canonical(target, ec);
  if (ec) {
    w.write_text(text);
    return;
  }
  w.out().fg(color).write("\x1B]8;;file://" + canonical.string() + "\x1B\\");
  w.write_text(text);
  w.out().write("\x1B]8;;\x1B\\").fg(Color::Reset);
}

} // namespace kata::ui
