#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace kata::ui {

bool parse_hex_rgb(const std::string& hex, int& r, int& g, int& b) {
  if (hex.size()!=7 || hex[0] != '#') return false;
  auto hexv = [&](char c)->int{
    if (c>='0'&&c<='9') return c-'0';
    if (c>='a'&&c<='f') return c-'a'+10;
    if (c>='A'&&c<='F') return c-'A'+10;
    return -1;
  };
  int v[6];
  for (int i = 0; i < 6; ++i) {
    v[i] = hexv(hex[i+1]);
    if (v[i] < 0) return false;
  }
  r = v[0]*16+v[1]; g = v[2]*16+v[3]; b = v[4]*16+v[5];
  return true;
}

std::optional<Color> parse_color_name(std::string_view name) {
  std::string s(name);
  for (auto& c : s) c = (char)std::tolower((unsigned char)c);
  if (s == "red") return Color::Red;
  if (s == "green") return Color::Green;
  if (s == "yellow") return Color::Yellow;
  if (s == "blue") return Color::Blue;
  if (s == "magenta") return Color::Magenta;
  if (s == "default" || s == "reset") return Color::Reset;
  return std::nullopt;
}

const char* getenv_nonempty(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_nonempty(name);
  if (!v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_nonempty(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/kata/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/kata/config.toml";
  return {};
}

// TOML -> env -> compiled default
static int resolve_int(const kata::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static bool resolve_bool(const kata::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

static Color resolve_color(const kata::util::TomlReader& toml, bool have_toml,
                           const char* key, Color def) {
  if (!have_toml || !toml.has("colors", key)) return def;
  auto c = parse_color_name(toml.get_string("colors", key));
  if (!c) {
    std::fprintf(stderr, "kata: config: unknown color for colors.%s, using default\n", key);
    return def;
  }
  return *c;
}

static Rgb resolve_rgb(const kata::util::TomlReader& toml, bool have_toml,
                       const char* key, Rgb def) {
  if (!have_toml || !toml.has("colors", key)) return def;
  int r, g, b;
  if (!parse_hex_rgb(toml.get_string("colors", key), r, g, b)) {
    std::fprintf(stderr, "kata: config: colors.%s is not #RRGGBB, using default\n", key);
    return def;
  }
  return Rgb{r, g, b};
}

Config load_config(const std::string& path) {
  Config c{};
  kata::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) {
    for (int line : toml.bad_lines())
      std::fprintf(stderr, "kata: %s:%d: ignoring malformed line\n", path.c_str(), line);
  }

  // --- [ui] ---
  c.ui.alt_screen = resolve_bool(toml, have_toml, "ui", "alt_screen", "KATA_ALT_SCREEN", true);
  c.ui.colors     = resolve_bool(toml, have_toml, "ui", "colors",     "KATA_COLORS", true);
  if (std::getenv("NO_COLOR")) c.ui.colors = false;

  // --- [list] ---
  c.list.min_visible_rows = std::max(1, resolve_int(toml, have_toml, "list", "min_visible_rows", "KATA_MIN_VISIBLE_ROWS", 5));
  c.list.poll_ms = std::clamp(resolve_int(toml, have_toml, "list", "poll_ms", "KATA_POLL_MS", 100), 10, 1000);

  // --- [colors] ---
  const ListStyle defaults{};
  c.style.selected_bg = resolve_rgb(toml, have_toml, "selected_bg", defaults.selected_bg);
  c.style.current = resolve_color(toml, have_toml, "current", defaults.current);
  c.style.done    = resolve_color(toml, have_toml, "done",    defaults.done);
  c.style.pending = resolve_color(toml, have_toml, "pending", defaults.pending);
  c.style.link    = resolve_color(toml, have_toml, "link",    defaults.link);
  c.style.accent  = resolve_color(toml, have_toml, "accent",  defaults.accent);

  return c;
}

const Config& config() {
  static Config cfg = load_config(config_file_path());
  return cfg;
}

} // namespace kata::ui
