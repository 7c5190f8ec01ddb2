#pragma once

#include <cstddef>
#include <optional>

namespace kata::ui {

// Selection and scroll-window arithmetic for a list of n_rows rows, of which
// at most max_n_rows_to_display are visible starting at offset.
//
// Invariants (whenever max_n_rows_to_display > 0):
//   selected, if present, is in [0, n_rows) and in [offset, offset + max - 1];
//   offset <= n_rows - 1 (offset == 0 for an empty list).
// Navigation clamps at both ends; it never wraps around.
class ScrollState {
public:
  ScrollState(size_t n_rows, std::optional<size_t> selected, size_t min_n_rows_to_display);

  void set_n_rows(size_t n_rows);
  void set_max_n_rows_to_display(size_t max_n_rows);

  void select_next();
  void select_previous();
  void select_first();
  void select_last();

  [[nodiscard]] size_t n_rows() const { return n_rows_; }
  [[nodiscard]] std::optional<size_t> selected() const { return selected_; }
  [[nodiscard]] size_t offset() const { return offset_; }
  [[nodiscard]] size_t max_n_rows_to_display() const { return max_n_rows_to_display_; }

private:
  void set_selected(size_t selected);
  void update_offset();

  size_t n_rows_;
  std::optional<size_t> selected_;
  size_t offset_{0};
  size_t max_n_rows_to_display_;
};

} // namespace kata::ui
