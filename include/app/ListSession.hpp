#pragma once
#include "app/IProgressStore.hpp"
#include "ui/Config.hpp"
#include "ui/Input.hpp"
#include "ui/ListView.hpp"
#include <exception>
#include <memory>
#include <ostream>

namespace kata::app {

enum class SessionExit { Quit, ContinueAt };

struct SessionResult {
  std::unique_ptr<IProgressStore> store;
  SessionExit exit{SessionExit::Quit};
  // IoError or StoreError that ended the session early, null otherwise
  std::exception_ptr error;
};

// What the loop should do after one action
enum class SessionStep { Redraw, Quit, ContinueAt };

// Apply one action to the view. Clears the footer message first.
// InvalidSelection is reported in the message; StoreError propagates.
SessionStep handle_action(kata::ui::ListView& view, kata::ui::ListAction action);

// Run the interactive list on the terminal. The store is handed over for
// the session and always handed back in the result. IoError and StoreError
// end the session and are returned in SessionResult::error after the
// terminal state has been restored. End of input on stdin quits.
SessionResult run_list_session(std::unique_ptr<IProgressStore> store, const kata::ui::Config& cfg);

// Same, drawing to sink and reading keys from input_fd
SessionResult run_list_session(std::unique_ptr<IProgressStore> store, const kata::ui::Config& cfg,
                               std::ostream& sink, int input_fd);

} // namespace kata::app
