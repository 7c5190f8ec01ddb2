#pragma once
#include "model/Exercise.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace kata::app {

enum class Filter { All, Done, Pending };

[[nodiscard]] bool filter_matches(Filter f, const kata::model::Exercise& e);

// Number of exercises visible under the filter
[[nodiscard]] size_t count_matching(Filter f, const kata::model::ExerciseList& exercises);

// Absolute indices of the matching exercises, in list order
[[nodiscard]] std::vector<size_t> apply_filter(Filter f, const kata::model::ExerciseList& exercises);

// Translate an ordinal within the filtered view to an absolute index.
// std::nullopt when the view has no such row.
[[nodiscard]] std::optional<size_t> filtered_to_absolute(Filter f,
                                                         const kata::model::ExerciseList& exercises,
                                                         size_t ordinal);

[[nodiscard]] const char* filter_name(Filter f);

} // namespace kata::app
