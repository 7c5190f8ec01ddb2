#pragma once
#include <string>
#include <vector>

namespace kata::model {

// One curriculum exercise. Its absolute index is its position in the
// store's exercise list and never changes while the list is alive.
struct Exercise {
  std::string name;
  std::string path;  // relative to the curriculum root
  bool done{false};
};

using ExerciseList = std::vector<Exercise>;

} // namespace kata::model
