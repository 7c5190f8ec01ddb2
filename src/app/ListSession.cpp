#include "app/ListSession.hpp"
#include "app/Errors.hpp"
#include "ui/Terminal.hpp"
#include "ui/TermOut.hpp"
#include <iostream>
#include <string>
#include <utility>
#include <unistd.h>

namespace kata::app {

using kata::ui::ListAction;

static void toggle_filter(kata::ui::ListView& view, Filter filter, char key) {
  auto& msg = view.message();
  if (view.filter() == filter) {
    view.set_filter(Filter::All);
    msg += "Disabled filter ";
    msg += filter_name(filter);
  } else {
    view.set_filter(filter);
    msg += "Enabled filter ";
    msg += filter_name(filter);
    msg += " │ Press ";
    msg += key;
    msg += " again to disable the filter";
  }
}

SessionStep handle_action(kata::ui::ListView& view, ListAction action) {
  view.message().clear();
  try {
    switch (action) {
      case ListAction::Quit: return SessionStep::Quit;
      case ListAction::Next: view.select_next(); break;
      case ListAction::Previous: view.select_previous(); break;
      case ListAction::First: view.select_first(); break;
      case ListAction::Last: view.select_last(); break;
      case ListAction::ToggleDone: toggle_filter(view, Filter::Done, 'd'); break;
      case ListAction::TogglePending: toggle_filter(view, Filter::Pending, 'p'); break;
      case ListAction::Reset: view.reset_selected(); break;
      case ListAction::Continue:
        if (view.selected_to_current()) return SessionStep::ContinueAt;
        break;
    }
  } catch (const InvalidSelection& e) {
    view.message() = e.what();
  }
  return SessionStep::Redraw;
}

SessionResult run_list_session(std::unique_ptr<IProgressStore> store, const kata::ui::Config& cfg) {
  return run_list_session(std::move(store), cfg, std::cout, STDIN_FILENO);
}

SessionResult run_list_session(std::unique_ptr<IProgressStore> store, const kata::ui::Config& cfg,
                               std::ostream& sink, int input_fd) {
  if (!store) throw StoreError("no progress store to list");

  SessionExit exit = SessionExit::Quit;
  std::exception_ptr error;
  try {
    const bool tty = kata::ui::tty_stdout();
    kata::ui::RawTermGuard raw{};
    kata::ui::CursorGuard curs{};
    kata::ui::AltScreenGuard alt{cfg.ui.alt_screen && tty};

    kata::ui::TermOut out(sink, cfg.ui.colors && tty);
    kata::ui::ListView view(*store, (size_t)cfg.list.min_visible_rows, cfg.style);
    kata::ui::KeyDecoder keys;

    auto resize = [&]{
      auto sz = kata::ui::term_size();
      view.set_term_size(sz.cols, sz.rows);
    };

    out.clear_all();
    resize();
    view.draw(out);
    out.flush();

    bool running = true;
    while (running && !kata::ui::g_stop.load()) {
      if (kata::ui::g_resized.exchange(false)) {
        resize();
        out.clear_all();
        view.draw(out);
        out.flush();
      }

      kata::ui::ReadResult input;
      if (kata::ui::has_input_available(input_fd, cfg.list.poll_ms)) {
        input = kata::ui::read_actions(input_fd, keys);
      } else if (keys.pending()) {
        // Nothing followed the ESC within one poll interval
        input.actions = keys.finish();
      }

      for (auto action : input.actions) {
        SessionStep step = handle_action(view, action);
        if (step == SessionStep::Redraw) continue;
        if (step == SessionStep::ContinueAt) exit = SessionExit::ContinueAt;
        running = false;
        break;
      }
      if (running && input.eof) running = false;
      if (running && !input.actions.empty()) view.draw(out);
    }
  } catch (const IoError&) {
    error = std::current_exception();
  } catch (const StoreError&) {
    error = std::current_exception();
  }

  return SessionResult{std::move(store), exit, error};
}

} // namespace kata::app
