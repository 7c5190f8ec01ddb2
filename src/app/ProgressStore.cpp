#include "app/ProgressStore.hpp"
#include "app/Errors.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <unordered_set>

namespace kata::app {

static constexpr const char* kStateHeader = "DON'T EDIT THIS FILE!";
static constexpr const char* kExercisePrefix = "exercise";

std::unique_ptr<ProgressStore> ProgressStore::open(const StoreOptions& opts) {
  kata::util::TomlReader toml;
  if (!toml.load(opts.info_path.string()))
    throw StoreError("failed to read the exercise info file " + opts.info_path.string());
  for (int line : toml.bad_lines())
    std::fprintf(stderr, "kata: %s:%d: ignoring malformed line\n", opts.info_path.c_str(), line);

  std::unique_ptr<ProgressStore> store(new ProgressStore());
  store->root_ = opts.info_path.parent_path();
  store->state_path_ = opts.state_path.empty() ? store->root_ / ".kata-state.txt" : opts.state_path;
  store->pristine_dir_ = opts.pristine_dir;

  // A repeated [exercise.<name>] header merges into the first one
  for (const auto& section : toml.sections(kExercisePrefix)) {
    std::string name = section.substr(std::string_view(kExercisePrefix).size() + 1);
    std::string path = toml.get_string(section, "path", "exercises/" + name + ".rs");
    store->exercises_.push_back(kata::model::Exercise{.name = name, .path = path, .done = false});
  }
  if (store->exercises_.empty())
    throw StoreError("no exercises found in " + opts.info_path.string());

  store->load_state();
  return store;
}

void ProgressStore::load_state() {
  std::ifstream in(state_path_);
  if (!in) return; // first run: nothing done, first exercise current

  std::string line;
  if (!std::getline(in, line) || line != kStateHeader) {
    std::fprintf(stderr, "kata: %s: unrecognized state file, starting fresh\n", state_path_.c_str());
    return;
  }
  std::getline(in, line); // blank
  std::string current_name;
  std::getline(in, current_name);
  std::getline(in, line); // blank

  std::unordered_set<std::string> done;
  while (std::getline(in, line)) {
    if (!line.empty()) done.insert(line);
  }

  bool found_current = false;
  for (size_t i = 0; i < exercises_.size(); ++i) {
    auto& e = exercises_[i];
    e.done = done.count(e.name) > 0;
    if (e.done) ++n_done_;
    if (e.name == current_name) { current_ = i; found_current = true; }
  }
  if (!found_current) {
    // Unknown current exercise: continue at the first pending one
    auto it = std::find_if(exercises_.begin(), exercises_.end(), [](const auto& e){ return !e.done; });
    current_ = it == exercises_.end() ? 0 : (size_t)(it - exercises_.begin());
  }
}

void ProgressStore::save() const {
  std::string body;
  body.reserve(64 + exercises_.size() * 24);
  body += kStateHeader;
  body += "\n\n";
  body += exercises_[current_].name;
  body += "\n\n";
  for (const auto& e : exercises_) {
    if (!e.done) continue;
    body += e.name;
    body += '\n';
  }

  // Write to a sibling then rename so a crash never leaves a truncated file
  auto tmp = state_path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.flush();
    if (!out) throw StoreError("failed to write the state file " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, state_path_, ec);
  if (ec) throw StoreError("failed to replace " + state_path_.string() + ": " + ec.message());
}

void ProgressStore::check_index(size_t index) const {
  if (index >= exercises_.size())
    throw StoreError("The current exercise index is higher than the number of exercises");
}

std::string ProgressStore::reset_exercise_by_index(size_t index) {
  check_index(index);
  auto& e = exercises_[index];

  if (!pristine_dir_.empty()) {
    auto src = pristine_dir_ / e.path;
    auto dst = root_ / e.path;
    std::error_code ec;
    if (!std::filesystem::exists(src, ec))
      throw StoreError("no pristine copy of `" + e.name + "` at " + src.string());
    std::filesystem::create_directories(dst.parent_path(), ec);
    std::filesystem::copy_file(src, dst, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) throw StoreError("failed to reset " + dst.string() + ": " + ec.message());
  }

  set_done(index, false);
  save();
  return e.name;
}

void ProgressStore::set_current_exercise_index(size_t index) {
  check_index(index);
  current_ = index;
  save();
}

void ProgressStore::set_done(size_t index, bool done) {
  check_index(index);
  auto& e = exercises_[index];
  if (e.done == done) return;
  e.done = done;
  if (done) ++n_done_; else --n_done_;
}

} // namespace kata::app
