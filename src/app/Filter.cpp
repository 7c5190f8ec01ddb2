#include "app/Filter.hpp"

namespace kata::app {

bool filter_matches(Filter f, const kata::model::Exercise& e) {
  switch (f) {
    case Filter::Done: return e.done;
    case Filter::Pending: return !e.done;
    case Filter::All: break;
  }
  return true;
}

size_t count_matching(Filter f, const kata::model::ExerciseList& exercises) {
  if (f == Filter::All) return exercises.size();
  size_t n = 0;
  for (const auto& e : exercises)
    if (filter_matches(f, e)) ++n;
  return n;
}

std::vector<size_t> apply_filter(Filter f, const kata::model::ExerciseList& exercises) {
  std::vector<size_t> out;
  out.reserve(exercises.size());
  for (size_t i = 0; i < exercises.size(); ++i) {
    if (filter_matches(f, exercises[i])) out.push_back(i);
  }
  return out;
}

std::optional<size_t> filtered_to_absolute(Filter f, const kata::model::ExerciseList& exercises,
                                           size_t ordinal) {
  // Identity under All; range checking is the store's job there.
  if (f == Filter::All) return ordinal;
  size_t seen = 0;
  for (size_t i = 0; i < exercises.size(); ++i) {
    if (!filter_matches(f, exercises[i])) continue;
    if (seen == ordinal) return i;
    ++seen;
  }
  return std::nullopt;
}

const char* filter_name(Filter f) {
  switch (f) {
    case Filter::Done: return "DONE";
    case Filter::Pending: return "PENDING";
    case Filter::All: break;
  }
  return "NONE";
}

} // namespace kata::app
