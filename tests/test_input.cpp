#include "minitest.hpp"
#include "ui/Input.hpp"
#include <string>
#include <vector>
#include <unistd.h>

using kata::ui::ListAction;

static std::vector<ListAction> decode(const std::string& s) {
  return kata::ui::decode_keys(reinterpret_cast<const unsigned char*>(s.data()), s.size());
}

TEST(input_letter_keys) {
  auto a = decode("jkgGdprcq");
  std::vector<ListAction> want{ListAction::Next, ListAction::Previous, ListAction::First, ListAction::Last,
                               ListAction::ToggleDone, ListAction::TogglePending, ListAction::Reset,
                               ListAction::Continue, ListAction::Quit};
  ASSERT_TRUE(a == want);
}

TEST(input_arrow_and_home_end) {
  auto a = decode("\x1B[A\x1B[B\x1B[H\x1B[F\x1BOH\x1BOF");
  std::vector<ListAction> want{ListAction::Previous, ListAction::Next, ListAction::First, ListAction::Last,
                               ListAction::First, ListAction::Last};
  ASSERT_TRUE(a == want);
}

TEST(input_tilde_sequences) {
  auto a = decode("\x1B[1~\x1B[4~\x1B[7~\x1B[8~\x1B[5~");
  std::vector<ListAction> want{ListAction::First, ListAction::Last, ListAction::First, ListAction::Last};
  ASSERT_TRUE(a == want);
}

TEST(input_lone_escape_quits) {
  auto a = decode("\x1B");
  ASSERT_EQ(a.size(), 1u);
  ASSERT_TRUE(a[0] == ListAction::Quit);
}

TEST(input_unknown_bytes_dropped) {
  ASSERT_TRUE(decode("xyz 1\n").empty());
  // Alt+j: ESC is dropped, j still moves
  auto a = decode("\x1Bj");
  ASSERT_EQ(a.size(), 1u);
  ASSERT_TRUE(a[0] == ListAction::Next);
}

TEST(input_escape_split_across_reads) {
  kata::ui::KeyDecoder keys;
  const unsigned char first[] = {0x1B};
  const unsigned char second[] = {'[', 'B', 'j'};
  ASSERT_TRUE(keys.feed(first, sizeof(first)).empty());
  ASSERT_TRUE(keys.pending());
  auto a = keys.feed(second, sizeof(second));
  std::vector<ListAction> want{ListAction::Next, ListAction::Next};
  ASSERT_TRUE(a == want);
  ASSERT_TRUE(!keys.pending());

  const unsigned char home[] = {0x1B, '[', '1'};
  const unsigned char tilde[] = {'~'};
  ASSERT_TRUE(keys.feed(home, sizeof(home)).empty());
  a = keys.feed(tilde, sizeof(tilde));
  ASSERT_EQ(a.size(), 1u);
  ASSERT_TRUE(a[0] == ListAction::First);
}

TEST(input_held_escape_quits_when_input_stops) {
  kata::ui::KeyDecoder keys;
  const unsigned char buf[] = {'k', 0x1B};
  auto a = keys.feed(buf, sizeof(buf));
  ASSERT_EQ(a.size(), 1u);
  ASSERT_TRUE(a[0] == ListAction::Previous);
  a = keys.finish();
  ASSERT_EQ(a.size(), 1u);
  ASSERT_TRUE(a[0] == ListAction::Quit);
  ASSERT_TRUE(keys.finish().empty());
}

TEST(input_read_reports_eof) {
  int fds[2];
  ASSERT_EQ(::pipe(fds), 0);
  kata::ui::KeyDecoder keys;
  ASSERT_TRUE(::write(fds[1], "j", 1) == 1);
  ASSERT_TRUE(kata::ui::has_input_available(fds[0], 10));
  auto r = kata::ui::read_actions(fds[0], keys);
  ASSERT_TRUE(!r.eof);
  ASSERT_EQ(r.actions.size(), 1u);
  ASSERT_TRUE(r.actions[0] == ListAction::Next);

  ::close(fds[1]);
  ASSERT_TRUE(kata::ui::has_input_available(fds[0], 10));
  r = kata::ui::read_actions(fds[0], keys);
  ASSERT_TRUE(r.eof);
  ASSERT_TRUE(r.actions.empty());
  ::close(fds[0]);
}
