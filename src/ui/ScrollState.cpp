#include "ui/ScrollState.hpp"
#include <algorithm>

namespace kata::ui {

ScrollState::ScrollState(size_t n_rows, std::optional<size_t> selected, size_t min_n_rows_to_display)
    : n_rows_(n_rows), max_n_rows_to_display_(min_n_rows_to_display) {
  if (n_rows_ > 0) selected_ = std::min(selected.value_or(0), n_rows_ - 1);
  update_offset();
}

// Move offset as little as possible so that the window stays inside the
// list and, if there is a selection, contains it.
void ScrollState::update_offset() {
  size_t last_offset = n_rows_ == 0 ? 0 : n_rows_ - 1;
  if (max_n_rows_to_display_ > 0)
    last_offset = n_rows_ > max_n_rows_to_display_ ? n_rows_ - max_n_rows_to_display_ : 0;

  if (selected_ && max_n_rows_to_display_ > 0) {
    size_t sel = *selected_;
    size_t min_offset = sel + 1 > max_n_rows_to_display_ ? sel + 1 - max_n_rows_to_display_ : 0;
    offset_ = std::clamp(offset_, min_offset, sel);
  }
  offset_ = std::min(offset_, last_offset);
}

void ScrollState::set_selected(size_t selected) {
  selected_ = selected;
  update_offset();
}

void ScrollState::set_n_rows(size_t n_rows) {
  n_rows_ = n_rows;
  if (n_rows_ == 0) {
    selected_.reset();
    offset_ = 0;
    return;
  }
  set_selected(std::min(selected_.value_or(0), n_rows_ - 1));
}

void ScrollState::set_max_n_rows_to_display(size_t max_n_rows) {
  max_n_rows_to_display_ = max_n_rows;
  update_offset();
}

void ScrollState::select_next() {
  if (selected_) set_selected(std::min(*selected_ + 1, n_rows_ - 1));
}

void ScrollState::select_previous() {
  if (selected_ && *selected_ > 0) set_selected(*selected_ - 1);
}

void ScrollState::select_first() {
  if (n_rows_ > 0) set_selected(0);
}

void ScrollState::select_last() {
  if (n_rows_ > 0) set_selected(n_rows_ - 1);
}

} // namespace kata::ui
