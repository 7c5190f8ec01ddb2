#include "minitest.hpp"
#include "app/Errors.hpp"
#include "app/ProgressStore.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using kata::app::ProgressStore;
using kata::app::StoreOptions;

namespace {

// Scratch directory removed when the test ends
struct TempDir {
  fs::path path;
  explicit TempDir(const char* tag) {
    path = fs::temp_directory_path() / ("kata_store_" + std::string(tag) + "_" + std::to_string(::getpid()));
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

void write_file(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream f(p);
  f << content;
}

std::string read_file(const fs::path& p) {
  std::ifstream f(p);
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

const char* kInfo =
  "# exercise list\n"
  "[exercise.intro1]\n"
  "path = \"exercises/intro1.rs\"\n"
  "\n"
  "[exercise.vars1]\n"
  "path = \"exercises/variables/vars1.rs\"\n"
  "\n"
  "[exercise.vars2]\n";

StoreOptions options(const TempDir& dir) {
  StoreOptions opts;
  opts.info_path = dir.path / "kata.toml";
  return opts;
}

} // namespace

TEST(store_open_reads_exercises) {
  TempDir dir("open");
  write_file(dir.path / "kata.toml", kInfo);
  auto store = ProgressStore::open(options(dir));
  const auto& list = store->exercises();
  ASSERT_EQ(list.size(), 3u);
  ASSERT_EQ(list[0].name, "intro1");
  ASSERT_EQ(list[1].path, "exercises/variables/vars1.rs");
  ASSERT_EQ(list[2].path, "exercises/vars2.rs");
  ASSERT_EQ(store->current_exercise_index(), 0u);
  ASSERT_EQ(store->n_done(), 0u);
  ASSERT_EQ(store->state_path(), dir.path / ".kata-state.txt");
}

TEST(store_progress_survives_reopen) {
  TempDir dir("persist");
  write_file(dir.path / "kata.toml", kInfo);
  {
    auto store = ProgressStore::open(options(dir));
    store->set_done(0, true);
    store->set_done(2, true);
    store->set_current_exercise_index(1);
  }
  ASSERT_EQ(read_file(dir.path / ".kata-state.txt"), "DON'T EDIT THIS FILE!\n\nvars1\n\nintro1\nvars2\n");
  auto store = ProgressStore::open(options(dir));
  ASSERT_EQ(store->current_exercise_index(), 1u);
  ASSERT_EQ(store->n_done(), 2u);
  ASSERT_TRUE(store->exercises()[0].done);
  ASSERT_TRUE(!store->exercises()[1].done);
}

TEST(store_unknown_current_falls_back_to_first_pending) {
  TempDir dir("fallback");
  write_file(dir.path / "kata.toml", kInfo);
  write_file(dir.path / ".kata-state.txt", "DON'T EDIT THIS FILE!\n\nremoved_exercise\n\nintro1\n");
  auto store = ProgressStore::open(options(dir));
  ASSERT_EQ(store->current_exercise_index(), 1u);
  ASSERT_EQ(store->n_done(), 1u);
}

TEST(store_ignores_foreign_state_file) {
  TempDir dir("foreign");
  write_file(dir.path / "kata.toml", kInfo);
  write_file(dir.path / ".kata-state.txt", "something else\nvars1\n");
  auto store = ProgressStore::open(options(dir));
  ASSERT_EQ(store->current_exercise_index(), 0u);
  ASSERT_EQ(store->n_done(), 0u);
}

TEST(store_reset_restores_pristine_copy) {
  TempDir dir("reset");
  write_file(dir.path / "kata.toml", kInfo);
  write_file(dir.path / "exercises/variables/vars1.rs", "edited\n");
  write_file(dir.path / "pristine/exercises/variables/vars1.rs", "original\n");
  auto opts = options(dir);
  opts.pristine_dir = dir.path / "pristine";
  auto store = ProgressStore::open(opts);
  store->set_done(1, true);
  ASSERT_EQ(store->reset_exercise_by_index(1), "vars1");
  ASSERT_EQ(read_file(dir.path / "exercises/variables/vars1.rs"), "original\n");
  ASSERT_TRUE(!store->exercises()[1].done);
  ASSERT_EQ(store->n_done(), 0u);
}

TEST(store_reset_without_pristine_copy_fails) {
  TempDir dir("nopristine");
  write_file(dir.path / "kata.toml", kInfo);
  auto opts = options(dir);
  opts.pristine_dir = dir.path / "pristine";
  auto store = ProgressStore::open(opts);
  ASSERT_THROWS(store->reset_exercise_by_index(0), kata::app::StoreError);
}

TEST(store_reset_without_pristine_dir_clears_done) {
  TempDir dir("flagonly");
  write_file(dir.path / "kata.toml", kInfo);
  auto store = ProgressStore::open(options(dir));
  store->set_done(2, true);
  ASSERT_EQ(store->reset_exercise_by_index(2), "vars2");
  ASSERT_EQ(store->n_done(), 0u);
}

TEST(store_rejects_out_of_range_index) {
  TempDir dir("range");
  write_file(dir.path / "kata.toml", kInfo);
  auto store = ProgressStore::open(options(dir));
  ASSERT_THROWS(store->set_current_exercise_index(3), kata::app::StoreError);
  ASSERT_THROWS(store->reset_exercise_by_index(99), kata::app::StoreError);
  ASSERT_EQ(store->current_exercise_index(), 0u);
}

TEST(store_open_errors) {
  TempDir dir("errors");
  ASSERT_THROWS(ProgressStore::open(options(dir)), kata::app::StoreError);
  write_file(dir.path / "kata.toml", "[ui]\ncolors = true\n");
  ASSERT_THROWS(ProgressStore::open(options(dir)), kata::app::StoreError);
}
