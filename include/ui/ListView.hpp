#pragma once

#include "app/Filter.hpp"
#include "app/IProgressStore.hpp"
#include "ui/Config.hpp"
#include "ui/ScrollState.hpp"
#include "ui/TermOut.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace kata::ui {

// Full-screen exercise list: header, filtered rows, progress footer.
//
// Rows are addressed two ways. The scroll state works with ordinals in the
// filtered view; the store works with absolute exercise indices. Every action
// that reaches the store goes through selected_to_absolute_index().
//
// The view borrows the store exclusively for its whole lifetime and only
// mutates it from reset_selected() and selected_to_current().
class ListView {
public:
  static constexpr uint16_t kWideHelpFooterWidth = 95;
  static constexpr uint16_t kHeaderHeight = 1;

  ListView(kata::app::IProgressStore& store, size_t min_visible_rows = 5, ListStyle style = {});
  ListView(const ListView&) = delete;
  ListView& operator=(const ListView&) = delete;

  // Height 0 leaves the layout unresolved and makes draw() a no-op
  void set_term_size(uint16_t width, uint16_t height);

  // Render one frame as a single synchronized update. Throws IoError.
  void draw(TermOut& out);

  [[nodiscard]] kata::app::Filter filter() const { return filter_; }
  void set_filter(kata::app::Filter filter);

  void select_next() { scroll_.select_next(); }
  void select_previous() { scroll_.select_previous(); }
  void select_first() { scroll_.select_first(); }
  void select_last() { scroll_.select_last(); }

  // Throws InvalidSelection if the filtered view has no such row
  [[nodiscard]] size_t selected_to_absolute_index(size_t ordinal) const;

  // Nothing selected is reported through message(), not as an error.
  // Store failures propagate as StoreError.
  void reset_selected();
  // Returns false if nothing was selected
  bool selected_to_current();

  // Footer message, shown instead of the help line while non-empty
  [[nodiscard]] std::string& message() { return message_; }
  [[nodiscard]] const std::string& message() const { return message_; }

  [[nodiscard]] const ScrollState& scroll_state() const { return scroll_; }
  [[nodiscard]] std::optional<size_t> selected() const { return scroll_.selected(); }
  [[nodiscard]] bool narrow_term() const { return narrow_term_; }
  [[nodiscard]] bool show_footer() const { return show_footer_; }
  [[nodiscard]] size_t name_col_width() const { return name_col_width_; }

private:
  size_t draw_rows(TermOut& out);
  void draw_footer_text(TermOut& out);
  void update_rows();
  void update_layout();

  kata::app::IProgressStore& store_;
  ListStyle style_;
  ScrollState scroll_;
  std::string message_;
  size_t name_col_width_;
  kata::app::Filter filter_{kata::app::Filter::All};
  uint16_t term_width_{0};
  uint16_t term_height_{0};
  std::string separator_line_;
  bool narrow_term_{false};
  bool show_footer_{true};
};

} // namespace kata::ui
