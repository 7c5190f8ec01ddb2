#include "minitest.hpp"
#include "app/Errors.hpp"
#include "ui/BoundedWriter.hpp"
#include "ui/Formatting.hpp"
#include "ui/TermOut.hpp"
#include <cwchar>
#include <sstream>

using kata::ui::BoundedWriter;
using kata::ui::TermOut;

TEST(writer_truncates_ascii) {
  std::ostringstream os;
  TermOut out(os, false);
  BoundedWriter w(out, 5);
  w.write_ascii("abc");
  w.write_ascii("defgh");
  ASSERT_EQ(out.pending(), "abcde");
  ASSERT_EQ(w.len(), 5u);
  ASSERT_EQ(w.remaining(), 0u);
  w.write_ascii("x");
  ASSERT_EQ(out.pending(), "abcde");
}

TEST(writer_zero_width_writes_nothing) {
  std::ostringstream os;
  TermOut out(os, false);
  BoundedWriter w(out, 0);
  w.write_ascii("abc");
  w.write_text("日本");
  ASSERT_TRUE(!w.add_to_len(1));
  ASSERT_TRUE(out.pending().empty());
}

TEST(writer_text_stops_at_glyph_that_does_not_fit) {
  if (::wcwidth(L'日') != 2) return;
  std::ostringstream os;
  TermOut out(os, false);
  BoundedWriter w(out, 4);
  w.write_text("a日本");
  ASSERT_EQ(out.pending(), "a日");
  ASSERT_EQ(w.len(), 3u);
  // One column left; a narrow char still fits
  w.write_text("bc");
  ASSERT_EQ(out.pending(), "a日b");
  ASSERT_EQ(w.len(), 4u);
}

TEST(writer_reserves_columns_for_raw_glyphs) {
  std::ostringstream os;
  TermOut out(os, false);
  BoundedWriter w(out, 3);
  ASSERT_TRUE(w.add_to_len(2));
  ASSERT_EQ(w.len(), 2u);
  ASSERT_TRUE(!w.add_to_len(2));
  ASSERT_EQ(w.len(), 2u);
  w.write_ascii("xyz");
  ASSERT_EQ(out.pending(), "x");
}

TEST(progress_bar_full_width) {
  std::ostringstream os;
  TermOut out(os, false);
  BoundedWriter w(out, 40);
  kata::ui::progress_bar(w, 5, 10, 40);
  // 20 columns of bar: 10 filled, the arrow, 9 remaining
  ASSERT_EQ(out.pending(), "Progress: [##########>---------]   5/10");
  ASSERT_EQ(w.len(), 39u);
}

TEST(progress_bar_edges) {
  std::ostringstream os;
  TermOut out(os, false);
  {
    BoundedWriter w(out, 30);
    kata::ui::progress_bar(w, 0, 0, 30);
  }
  ASSERT_EQ(out.pending(), "Progress: [>---------]   0/0");
  std::ostringstream os2;
  TermOut out2(os2, false);
  {
    BoundedWriter w(out2, 30);
    kata::ui::progress_bar(w, 3, 3, 30);
  }
  ASSERT_EQ(out2.pending(), "Progress: [##########]   3/3");
}

TEST(progress_bar_compact_on_tiny_terminal) {
  std::ostringstream os;
  TermOut out(os, false);
  BoundedWriter w(out, 12);
  kata::ui::progress_bar(w, 12, 94, 12);
  ASSERT_EQ(out.pending(), "Progress: 12");
  ASSERT_EQ(w.len(), 12u);
}

TEST(termout_flush_and_colors) {
  std::ostringstream os;
  TermOut out(os, true);
  out.move_to(0, 0).fg(kata::ui::Color::Red).write("x").reset_color().move_to_next_line();
  ASSERT_TRUE(os.str().empty());
  out.flush();
  ASSERT_EQ(os.str(), "\x1B[1;1H\x1B[31mx\x1B[0m\x1B[1E");
  ASSERT_TRUE(out.pending().empty());

  std::ostringstream plain;
  TermOut mono(plain, false);
  mono.fg(kata::ui::Color::Green).bg(kata::ui::Rgb{1, 2, 3}).underline().write("y").reset_color().flush();
  ASSERT_EQ(plain.str(), "y");
}

TEST(termout_failed_sink_throws) {
  std::ostringstream os;
  os.setstate(std::ios::badbit);
  TermOut out(os, false);
  out.write("frame");
  ASSERT_THROWS(out.flush(), kata::app::IoError);
}
