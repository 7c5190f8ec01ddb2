#pragma once

#include "ui/BoundedWriter.hpp"
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace kata::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
// Decode the code point at s[i] and advance i past it (U+FFFD on bad input)
char32_t decode_u8(std::string_view s, size_t& i);
int char_cols(char32_t cp);
int display_cols(std::string_view s);
std::string take_cols(std::string_view s, int cols);

// "Progress: [####>---]  3/10", compact "Progress: 3/10" on tiny terminals
void progress_bar(BoundedWriter& w, size_t done, size_t total, int term_width);

// Write text as an OSC 8 hyperlink to the canonical form of target;
// plain text if target can't be resolved
void file_link(BoundedWriter& w, std::string_view text, const std::filesystem::path& target, Color color);

} // namespace kata::ui
