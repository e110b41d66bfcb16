#pragma once

#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace netstatus::util {

// The TOML subset netstatus config files use: [table] headers, bare keys,
// basic ("...", with \" \\ \n \t escapes) and literal ('...') strings,
// integers (1_000 allowed), true/false, and # comments. Lines outside the
// subset are recorded as problems with their line number and skipped.
class TomlReader {
public:
  struct Problem {
    int line;
    std::string message;
  };

  // False only when the file cannot be opened; syntax problems go to problems()
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
      clear();
      return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    parse(ss.str());
    return true;
  }

  void parse(std::string_view text) {
    clear();
    size_t table = 0;
    tables_.push_back({"", {}}); // keys before the first header
    int lineno = 0;
    while (!text.empty()) {
      ++lineno;
      auto nl = text.find('\n');
      std::string_view line = text.substr(0, nl);
      text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
      line = trim(without_comment(line));
      if (line.empty()) continue;

      if (line.front() == '[') {
        if (line.back() != ']' || line.size() < 3) {
          problems_.push_back({lineno, "malformed table header"});
          continue;
        }
        table = table_index(std::string(trim(line.substr(1, line.size() - 2))));
        continue;
      }

      auto eq = line.find('=');
      if (eq == std::string_view::npos) {
        problems_.push_back({lineno, "expected key = value"});
        continue;
      }
      std::string key(trim(line.substr(0, eq)));
      if (key.empty() || !is_bare_key(key)) {
        problems_.push_back({lineno, "invalid key '" + key + "'"});
        continue;
      }
      Value v;
      v.line = lineno;
      if (!decode_value(trim(line.substr(eq + 1)), v)) {
        problems_.push_back({lineno, "unsupported value for '" + key + "'"});
        continue;
      }
      auto& entries = tables_[table].entries;
      bool dup = false;
      for (const auto& e : entries) dup = dup || e.key == key;
      if (dup) {
        problems_.push_back({lineno, "duplicate key '" + key + "'"});
        continue;
      }
      v.key = std::move(key);
      entries.push_back(std::move(v));
    }
  }

  // Strings come back decoded; other scalars as written
  [[nodiscard]] std::string get_string(std::string_view table, std::string_view key,
                                       const std::string& def = "") const {
    const Value* v = find(table, key);
    return v ? v->text : def;
  }

  // `def` when missing, quoted, or not an integer
  [[nodiscard]] int get_int(std::string_view table, std::string_view key, int def = 0) const {
    const Value* v = find(table, key);
    if (!v || v->quoted) return def;
    std::string digits;
    for (char c : v->text) if (c != '_') digits += c;
    if (!digits.empty() && digits.front() == '+') digits.erase(0, 1);
    int out = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) return def;
    return out;
  }

  // true/false in any case; `def` for anything else
  [[nodiscard]] bool get_bool(std::string_view table, std::string_view key, bool def = false) const {
    const Value* v = find(table, key);
    if (!v || v->quoted) return def;
    std::string lower;
    for (char c : v->text) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "true") return true;
    if (lower == "false") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view table, std::string_view key) const {
    return find(table, key) != nullptr;
  }

  // Line the key was set on, 0 when absent
  [[nodiscard]] int line_of(std::string_view table, std::string_view key) const {
    const Value* v = find(table, key);
    return v ? v->line : 0;
  }

  // Declared tables, in file order; the unnamed top-level table only if it has keys
  [[nodiscard]] std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    for (const auto& t : tables_) {
      if (t.name.empty() && t.entries.empty()) continue;
      out.push_back(t.name);
    }
    return out;
  }

  [[nodiscard]] std::vector<std::string> keys(std::string_view table) const {
    std::vector<std::string> out;
    for (const auto& t : tables_) {
      if (t.name != table) continue;
      for (const auto& e : t.entries) out.push_back(e.key);
    }
    return out;
  }

  [[nodiscard]] const std::vector<Problem>& problems() const { return problems_; }

private:
  struct Value {
    std::string key;
    std::string text;
    bool quoted{false};
    int line{0};
  };
  struct Table {
    std::string name;
    std::vector<Value> entries;
  };

  std::vector<Table> tables_;
  std::vector<Problem> problems_;

  void clear() {
    tables_.clear();
    problems_.clear();
  }

  size_t table_index(const std::string& name) {
    for (size_t i = 0; i < tables_.size(); ++i)
      if (tables_[i].name == name) return i;
    tables_.push_back({name, {}});
    return tables_.size() - 1;
  }

  [[nodiscard]] const Value* find(std::string_view table, std::string_view key) const {
    for (const auto& t : tables_) {
      if (t.name != table) continue;
      for (const auto& e : t.entries)
        if (e.key == key) return &e;
    }
    return nullptr;
  }

  static bool is_bare_key(std::string_view k) {
    for (char c : k) {
      if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) return false;
    }
    return true;
  }

  static bool decode_value(std::string_view raw, Value& v) {
    if (raw.empty()) return false;
    if (raw.front() == '\'') {
      if (raw.size() < 2 || raw.back() != '\'') return false;
      v.text = std::string(raw.substr(1, raw.size() - 2));
      v.quoted = true;
      return true;
    }
    if (raw.front() == '"') {
      if (raw.size() < 2 || raw.back() != '"') return false;
      std::string out;
      auto body = raw.substr(1, raw.size() - 2);
      for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] != '\\') { out += body[i]; continue; }
        if (++i == body.size()) return false;
        switch (body[i]) {
          case '"':  out += '"'; break;
          case '\\': out += '\\'; break;
          case 'n':  out += '\n'; break;
          case 't':  out += '\t'; break;
          default:   return false;
        }
      }
      v.text = std::move(out);
      v.quoted = true;
      return true;
    }
    // Bare scalar: integer, boolean, or a lenient unquoted word
    for (char c : raw) if (std::isspace(static_cast<unsigned char>(c))) return false;
    v.text = std::string(raw);
    return true;
  }

  // Cut at the first # outside a string
  static std::string_view without_comment(std::string_view sv) {
    char quote = 0;
    for (size_t i = 0; i < sv.size(); ++i) {
      char c = sv[i];
      if (quote) {
        if (c == '\\' && quote == '"') { ++i; continue; }
        if (c == quote) quote = 0;
      } else if (c == '"' || c == '\'') {
        quote = c;
      } else if (c == '#') {
        return sv.substr(0, i);
      }
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace netstatus::util
