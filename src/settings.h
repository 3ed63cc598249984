#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

// Read-only key/value configuration. Keys are normalised: "GEMFETCH_" prefix removed,
// lower-cased, "__" turned into "." ("GEMFETCH_GEMS__EXAMPLE__COM" -> "gems.example.com").
class settings {
 public:
  static constexpr std::string_view kEnvPrefix{ "GEMFETCH_" };

  settings() = default;
  explicit settings(std::map<std::string, std::string> values);

  // Config file first, environment entries ("NAME=value") override it. Only environment
  // names carrying kEnvPrefix are considered.
  static settings load(std::optional<std::filesystem::path> const &config_file,
                       std::vector<std::string> const &environment);

  // Parse "KEY: value" lines. '#' starts a comment, values may be single or double
  // quoted, a leading "---" document marker is ignored.
  static std::map<std::string, std::string> parse_file_contents(std::string_view text);

  static std::string normalize_key(std::string_view raw);

  std::optional<std::string> get(std::string_view key) const;

  // Throws std::invalid_argument when present but not a boolean/integer.
  bool get_bool(std::string_view key, bool fallback) const;
  std::optional<long> get_int(std::string_view key) const;

  std::vector<std::string> keys() const;
  bool empty() const { return values_.empty(); }

 private:
  std::map<std::string, std::string> values_;
};

}  // namespace gemfetch
