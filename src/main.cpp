#include "app/Errors.hpp"
#include "app/ListSession.hpp"
#include "app/ProgressStore.hpp"
#include "ui/Config.hpp"
#include "ui/Terminal.hpp"

#include <clocale>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

static void usage() {
  std::cout << "Usage: kata [--info FILE] [--state FILE] [--pristine DIR]\n";
  std::cout << "  --info FILE      exercise list (default: kata.toml)\n";
  std::cout << "  --state FILE     progress file (default: .kata-state.txt beside the info file)\n";
  std::cout << "  --pristine DIR   tree of untouched exercise files used by <r>eset\n";
  std::cout << "Keys: j/k or arrows move, g/G first/last, d/p filter, r reset, c continue, q quit\n";
}

int main(int argc, char** argv) {
  using namespace kata;

  app::StoreOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--info" && i + 1 < argc) opts.info_path = argv[++i];
    else if (a == "--state" && i + 1 < argc) opts.state_path = argv[++i];
    else if (a == "--pristine" && i + 1 < argc) opts.pristine_dir = argv[++i];
    else if (a == "-h" || a == "--help") { usage(); return 0; }
    else {
      std::fprintf(stderr, "kata: unknown argument: %s\n", a.c_str());
      usage();
      return 2;
    }
  }

  if (!ui::tty_stdout()) {
    std::fprintf(stderr, "kata: the exercise list needs an interactive terminal\n");
    return 1;
  }

  // wcwidth() column widths follow the user's LC_CTYPE
  std::setlocale(LC_CTYPE, "");

  std::signal(SIGINT, ui::on_sigint);
  std::signal(SIGWINCH, ui::on_sigwinch);
  std::atexit(&ui::on_atexit_restore);

  try {
    const auto& cfg = ui::config();
    std::unique_ptr<app::IProgressStore> store = app::ProgressStore::open(opts);

    auto result = app::run_list_session(std::move(store), cfg);
    // Progress is saved per mutation, so a failed session has nothing left to flush
    if (result.error) std::rethrow_exception(result.error);

    if (result.exit == app::SessionExit::ContinueAt) {
      const auto& ex = result.store->exercises()[result.store->current_exercise_index()];
      std::cout << "Continuing at " << ex.name << " (" << ex.path << ")\n";
    }
    std::cout << result.store->n_done() << "/" << result.store->exercises().size()
              << " exercises done\n";
  } catch (const std::exception& e) {
    std::fprintf(stderr, "kata: error: %s\n", e.what());
    return 1;
  }
  return 0;
}
