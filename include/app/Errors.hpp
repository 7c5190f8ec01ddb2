#pragma once
#include <stdexcept>
#include <string>

namespace kata::app {

// Writing to or flushing the terminal failed.
struct IoError : public std::runtime_error { using std::runtime_error::runtime_error; };

// A filtered-view ordinal has no matching exercise (view/data desync).
struct InvalidSelection : public std::runtime_error { using std::runtime_error::runtime_error; };

// Raised by the progress store (bad index, unreadable files, failed reset).
struct StoreError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace kata::app
