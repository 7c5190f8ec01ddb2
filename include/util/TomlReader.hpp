#pragma once

#include <cctype>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace kata::util {

// Reader for the flat TOML subset used by kata's config and exercise info
// files: [section] headers, key = value pairs, # comments, quoted strings.
// Sections and keys keep their file order.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    bad_lines_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[') {
        if (sv.back() != ']' || sv.size() < 3) { bad_lines_.push_back(lineno); continue; }
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos || eq == 0) { bad_lines_.push_back(lineno); continue; }
      std::string key(trim(sv.substr(0, eq)));
      ensure_section(current_section).set(key, unquote(trim(sv.substr(eq + 1))));
    }
    return true;
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val.empty()) return def;
    try { return std::stoi(val); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  // Section names in file order, optionally only those under "prefix."
  [[nodiscard]] std::vector<std::string> sections(std::string_view prefix = {}) const {
    std::vector<std::string> out;
    for (const auto& [name, sec] : sections_) {
      if (prefix.empty()) { out.push_back(name); continue; }
      if (name.size() > prefix.size() + 1 && name.starts_with(prefix) && name[prefix.size()] == '.')
        out.push_back(name);
    }
    return out;
  }

  // 1-based numbers of lines that were neither blank, comment, header nor key = value
  [[nodiscard]] const std::vector<int>& bad_lines() const { return bad_lines_; }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;
  std::vector<int> bad_lines_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Strip surrounding quotes; for bare values drop a trailing "# comment"
  static std::string unquote(std::string_view val) {
    if (val.size() >= 2 && val.front() == '"') {
      auto close = val.find('"', 1);
      if (close != std::string_view::npos) return std::string(val.substr(1, close - 1));
    }
    auto hash = val.find(" #");
    if (hash != std::string_view::npos) val = trim(val.substr(0, hash));
    return std::string(val);
  }
};

} // namespace kata::util
