#pragma once
#include "model/Exercise.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace kata::app {

// Owner of the exercise list and the learner's progress. The list view
// borrows one exclusively for the duration of a session.
class IProgressStore {
public:
  virtual ~IProgressStore() = default;

  // Stable order; index into this list is the absolute exercise index
  [[nodiscard]] virtual const kata::model::ExerciseList& exercises() const = 0;
  [[nodiscard]] virtual size_t current_exercise_index() const = 0;
  [[nodiscard]] virtual size_t n_done() const = 0;
  // Directory exercise paths are relative to
  [[nodiscard]] virtual const std::filesystem::path& root() const = 0;

  // Restore the exercise to its initial state and mark it pending.
  // Returns the exercise name. Throws StoreError.
  virtual std::string reset_exercise_by_index(size_t index) = 0;

  // Throws StoreError
  virtual void set_current_exercise_index(size_t index) = 0;
};

} // namespace kata::app
