#include "ui/Input.hpp"
#include <unistd.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>

namespace kata::ui {

bool has_input_available(int fd, int timeout_ms) {
  struct pollfd pfd{.fd=fd,.events=POLLIN,.revents=0};
  int to = std::clamp(timeout_ms, 10, 1000);
  // EINTR (e.g. SIGWINCH) reads as "no input"; the caller re-checks its flags
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR));
}

// Decode buf[0..n). Returns the offset of an escape sequence cut off at the
// end (n if there is none); with final set such a tail is decoded as is.
static size_t decode_into(const unsigned char* buf, size_t n, bool final, std::vector<ListAction>& out) {
  size_t k = 0;
  while (k < n) {
    const size_t start = k;
    unsigned char c = buf[k++];
    switch (c) {
      case 'j': out.push_back(ListAction::Next); break;
      case 'k': out.push_back(ListAction::Previous); break;
      case 'g': out.push_back(ListAction::First); break;
      case 'G': out.push_back(ListAction::Last); break;
      case 'd': out.push_back(ListAction::ToggleDone); break;
      case 'p': out.push_back(ListAction::TogglePending); break;
      case 'r': out.push_back(ListAction::Reset); break;
      case 'c': out.push_back(ListAction::Continue); break;
      case 'q': out.push_back(ListAction::Quit); break;
      case 0x1B: {
        if (k >= n) {
          if (!final) return start;
          out.push_back(ListAction::Quit); // lone ESC
          break;
        }
        unsigned char a = buf[k];
        if (a != '[' && a != 'O') break; // Alt+key: drop the ESC
        ++k;
        if (k >= n) {
          if (!final) return start;
          break;
        }
        unsigned char b = buf[k++];
        if (b == 'A') out.push_back(ListAction::Previous);
        else if (b == 'B') out.push_back(ListAction::Next);
        else if (b == 'H') out.push_back(ListAction::First);
        else if (b == 'F') out.push_back(ListAction::Last);
        else if (b >= '0' && b <= '9' && a == '[') {
          // ESC [ <n> ~
          int num = b - '0';
          while (k < n && buf[k] >= '0' && buf[k] <= '9') num = num * 10 + (buf[k++] - '0');
          if (k >= n && !final) return start;
          if (k < n && buf[k] == '~') {
            ++k;
            if (num == 1 || num == 7) out.push_back(ListAction::First);
            else if (num == 4 || num == 8) out.push_back(ListAction::Last);
          }
        }
        break;
      }
      default: break;
    }
  }
  return n;
}

std::vector<ListAction> decode_keys(const unsigned char* buf, size_t n) {
  std::vector<ListAction> out;
  decode_into(buf, n, true, out);
  return out;
}

std::vector<ListAction> KeyDecoder::feed(const unsigned char* buf, size_t n) {
  carry_.append(reinterpret_cast<const char*>(buf), n);
  std::vector<ListAction> out;
  const auto* bytes = reinterpret_cast<const unsigned char*>(carry_.data());
  size_t tail = decode_into(bytes, carry_.size(), false, out);
  carry_.erase(0, tail);
  return out;
}

std::vector<ListAction> KeyDecoder::finish() {
  std::vector<ListAction> out;
  if (carry_.empty()) return out;
  decode_into(reinterpret_cast<const unsigned char*>(carry_.data()), carry_.size(), true, out);
  carry_.clear();
  return out;
}

ReadResult read_actions(int fd, KeyDecoder& decoder) {
  ReadResult r;
  unsigned char buf[64];
  ssize_t n = ::read(fd, buf, sizeof(buf));
  if (n > 0) {
    r.actions = decoder.feed(buf, (size_t)n);
  } else if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
    // Nothing more will arrive: settle what was held back, then stop
    r.actions = decoder.finish();
    r.eof = true;
  }
  return r;
}

} // namespace kata::ui
