#pragma once

#include "ui/TermOut.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace kata::ui {

// Colors used by the list view
struct ListStyle {
  Rgb selected_bg{40, 40, 40};
  Color current{Color::Red};
  Color done{Color::Green};
  Color pending{Color::Yellow};
  Color link{Color::Blue};
  Color accent{Color::Magenta};
};

struct Config {
  struct Ui {
    bool alt_screen{true};
    bool colors{true};
  } ui;
  struct List {
    int min_visible_rows{5};
    int poll_ms{100};
  } list;
  ListStyle style;
};

// Resolve every key from the TOML file at path (may be empty or missing),
// then the KATA_* environment, then compiled defaults.
[[nodiscard]] Config load_config(const std::string& path);

// Process-wide configuration, loaded from config_file_path() on first use
const Config& config();
[[nodiscard]] std::string config_file_path();

// Environment variable helpers
const char* getenv_nonempty(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b);
[[nodiscard]] std::optional<Color> parse_color_name(std::string_view name);

} // namespace kata::ui
