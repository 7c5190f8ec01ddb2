#pragma once
#include "app/IProgressStore.hpp"
#include <filesystem>
#include <memory>

namespace kata::app {

struct StoreOptions {
  std::filesystem::path info_path{"kata.toml"};
  // Empty: ".kata-state.txt" next to the info file
  std::filesystem::path state_path;
  // Empty: resets only clear the done flag
  std::filesystem::path pristine_dir;
};

// File-backed progress store. Exercise paths are relative to the directory
// holding the info file; progress lives in a small text state file.
class ProgressStore : public IProgressStore {
public:
  // Throws StoreError if the info file is missing or has no exercises
  static std::unique_ptr<ProgressStore> open(const StoreOptions& opts);

  [[nodiscard]] const kata::model::ExerciseList& exercises() const override { return exercises_; }
  [[nodiscard]] size_t current_exercise_index() const override { return current_; }
  [[nodiscard]] size_t n_done() const override { return n_done_; }

  std::string reset_exercise_by_index(size_t index) override;
  void set_current_exercise_index(size_t index) override;

  void set_done(size_t index, bool done);
  // Persist current exercise and done set. Throws StoreError.
  void save() const;

  [[nodiscard]] const std::filesystem::path& root() const override { return root_; }
  [[nodiscard]] const std::filesystem::path& state_path() const { return state_path_; }

private:
  ProgressStore() = default;
  void load_state();
  void check_index(size_t index) const;

  kata::model::ExerciseList exercises_;
  size_t current_{0};
  size_t n_done_{0};
  std::filesystem::path root_;
  std::filesystem::path state_path_;
  std::filesystem::path pristine_dir_;
};

} // namespace kata::app
