#include "ui/ListView.hpp"
#include "app/Errors.hpp"
#include "ui/BoundedWriter.hpp"
#include "ui/Formatting.hpp"
#include <algorithm>

namespace kata::ui {

using kata::app::Filter;

namespace {

constexpr std::string_view kSelectionMarker = "🦀";
constexpr std::string_view kSeparator = "─";
constexpr std::string_view kNameColTitle = "Name";

void next_ln(TermOut& out) {
  out.clear_until_newline().move_to_next_line();
}

std::string spaces(size_t n) { return std::string(n, ' '); }

} // namespace

ListView::ListView(kata::app::IProgressStore& store, size_t min_visible_rows, ListStyle style)
    : store_(store),
      style_(style),
      scroll_(store.exercises().size(), store.current_exercise_index(), min_visible_rows) {
  message_.reserve(128);
  size_t widest = kNameColTitle.size();
  for (const auto& e : store_.exercises())
    widest = std::max(widest, (size_t)display_cols(e.name));
  name_col_width_ = widest;
}

void ListView::set_term_size(uint16_t width, uint16_t height) {
  term_width_ = width;
  term_height_ = height;
  update_layout();
}

void ListView::update_layout() {
  if (term_height_ == 0) return;

  // The help footer is shorter when nothing is selected
  narrow_term_ = term_width_ < kWideHelpFooterWidth && scroll_.selected().has_value();

  // 2 separators, 1 progress bar, 1-2 help lines
  const size_t footer_height = 4 + (narrow_term_ ? 1 : 0);
  show_footer_ = term_height_ > kHeaderHeight + footer_height;

  if (show_footer_) {
    separator_line_.clear();
    separator_line_.reserve(kSeparator.size() * term_width_);
    for (uint16_t i = 0; i < term_width_; ++i) separator_line_ += kSeparator;
  }

  const size_t used = kHeaderHeight + (show_footer_ ? footer_height : 0);
  scroll_.set_max_n_rows_to_display(term_height_ > used ? term_height_ - used : 0);
}

size_t ListView::draw_rows(TermOut& out) {
  const auto& exercises = store_.exercises();
  const size_t current = store_.current_exercise_index();
  const size_t offset = scroll_.offset();
  const size_t max_rows = scroll_.max_n_rows_to_display();
  const auto selected = scroll_.selected();

  size_t ordinal = 0;
  size_t n_displayed = 0;
  for (size_t ind = 0; ind < exercises.size() && n_displayed < max_rows; ++ind) {
    const auto& e = exercises[ind];
    if (!kata::app::filter_matches(filter_, e)) continue;
    if (ordinal++ < offset) continue;

    BoundedWriter w(out, term_width_);

    if (selected == offset + n_displayed) {
      out.bg(style_.selected_bg);
      // The marker is two columns wide
      if (w.add_to_len(2)) out.write(kSelectionMarker);
      else w.write_ascii("  ");
    } else {
      w.write_ascii("  ");
    }

    if (ind == current) {
      out.fg(style_.current);
      w.write_ascii(">>>>>>>  ");
    } else {
      w.write_ascii("         ");
    }

    if (e.done) {
      out.fg(style_.done);
      w.write_ascii("DONE     ");
    } else {
      out.fg(style_.pending);
      w.write_ascii("PENDING  ");
    }
    out.fg(Color::Reset);

    w.write_text(e.name);
    w.write_ascii(spaces(name_col_width_ + 2 - (size_t)display_cols(e.name)));

    file_link(w, e.path, store_.root() / e.path, style_.link);

    next_ln(out);
    out.reset_color();
    ++n_displayed;
  }

  return n_displayed;
}

static void draw_filter_help(BoundedWriter& w, std::string_view prefix, Filter filter, Color accent) {
  w.write_ascii(prefix);
  switch (filter) {
    case Filter::Done:
      w.out().fg(accent).underline();
      w.write_ascii("<d>one");
      w.out().reset_color();
      w.write_ascii("/<p>ending");
      break;
    case Filter::Pending:
      w.write_ascii("<d>one/");
      w.out().fg(accent).underline();
      w.write_ascii("<p>ending");
      w.out().reset_color();
      break;
    case Filter::All:
      w.write_ascii("<d>one/<p>ending");
      break;
  }
  w.write_ascii(" | <q>uit list");
}

void ListView::draw_footer_text(TermOut& out) {
  BoundedWriter w(out, term_width_);

  if (!message_.empty()) {
    out.fg(style_.accent);
    w.write_text(message_);
    out.reset_color();
    // Blank the line the wrapped help text would otherwise leave behind
    if (narrow_term_) next_ln(out);
    next_ln(out);
    return;
  }

  if (scroll_.selected()) {
    w.write_text("↓/j ↑/k home/g end/G | <c>ontinue at | <r>eset exercise");
    if (narrow_term_) {
      next_ln(out);
      BoundedWriter second(out, term_width_);
      draw_filter_help(second, "filter ", filter_, style_.accent);
    } else {
      draw_filter_help(w, " | filter ", filter_, style_.accent);
    }
  } else {
    // Nothing selected (and nothing shown), so only filter and quit apply
    draw_filter_help(w, "filter ", filter_, style_.accent);
  }
  next_ln(out);
}

void ListView::draw(TermOut& out) {
  if (term_height_ == 0) return;

  out.begin_sync().move_to(0, 0);

  // Header
  {
    BoundedWriter w(out, term_width_);
    w.write_ascii("  Current  State    ");
    w.write_ascii(kNameColTitle);
    w.write_ascii(spaces(name_col_width_ + 2 - kNameColTitle.size()));
    w.write_ascii("Path");
    next_ln(out);
  }

  const size_t n_displayed = draw_rows(out);
  for (size_t i = n_displayed; i < scroll_.max_n_rows_to_display(); ++i) next_ln(out);

  if (show_footer_) {
    out.write(separator_line_);
    next_ln(out);

    {
      BoundedWriter w(out, term_width_);
      progress_bar(w, store_.n_done(), store_.exercises().size(), term_width_);
    }
    next_ln(out);

    out.write(separator_line_);
    next_ln(out);

    draw_footer_text(out);
  }

  out.end_sync().flush();
}

void ListView::update_rows() {
  scroll_.set_n_rows(kata::app::count_matching(filter_, store_.exercises()));
  update_layout();
}

void ListView::set_filter(Filter filter) {
  filter_ = filter;
  update_rows();
}

size_t ListView::selected_to_absolute_index(size_t ordinal) const {
  auto ind = kata::app::filtered_to_absolute(filter_, store_.exercises(), ordinal);
  if (!ind) throw kata::app::InvalidSelection("Invalid selection index");
  return *ind;
}

void ListView::reset_selected() {
  auto selected = scroll_.selected();
  if (!selected) {
    message_ += "Nothing selected to reset!";
    return;
  }

  const size_t ind = selected_to_absolute_index(*selected);
  std::string name = store_.reset_exercise_by_index(ind);
  update_rows();
  message_ += "The exercise `" + name + "` has been reset";
}

bool ListView::selected_to_current() {
  auto selected = scroll_.selected();
  if (!selected) {
    message_ += "Nothing selected to continue at!";
    return false;
  }

  store_.set_current_exercise_index(selected_to_absolute_index(*selected));
  return true;
}

} // namespace kata::ui
