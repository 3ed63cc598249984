#include "settings.h"

#include "util.h"

#include <charconv>
#include <stdexcept>
#include <string>
#include <utility>

namespace gemfetch {

namespace {

std::string_view unquote(std::string_view value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace

settings::settings(std::map<std::string, std::string> values) {
  for (auto &[key, value] : values) { values_[normalize_key(key)] = std::move(value); }
}

std::string settings::normalize_key(std::string_view raw) {
  auto key{ util_trim(raw) };
  if (key.starts_with(kEnvPrefix)) { key.remove_prefix(kEnvPrefix.size()); }

  std::string result;
  result.reserve(key.size());
  for (size_t i{}; i < key.size(); ++i) {
    if (key[i] == '_' && i + 1 < key.size() && key[i + 1] == '_') {
      result.push_back('.');
      ++i;
    } else {
      result.push_back(key[i]);
    }
  }
  return util_to_lower(result);
}

std::map<std::string, std::string> settings::parse_file_contents(std::string_view text) {
  std::map<std::string, std::string> result;

  int line_number{ 0 };
  for (std::string_view sv{ text }; !sv.empty();) {
    auto const eol{ sv.find('\n') };
    auto line{ util_trim(sv.substr(0, eol)) };
    sv = (eol == std::string_view::npos) ? std::string_view{} : sv.substr(eol + 1);
    ++line_number;

    if (line.empty() || line.front() == '#' || line == "---") { continue; }

    // Keys may themselves contain "://", so split on ": " (or a trailing ':').
    auto sep{ line.find(": ") };
    if (sep == std::string_view::npos && line.back() == ':') { sep = line.size() - 1; }
    if (sep == std::string_view::npos || sep == 0) {
      throw std::runtime_error("settings: malformed line " + std::to_string(line_number) +
                               ": " + std::string{ line });
    }

    auto const key{ unquote(util_trim(line.substr(0, sep))) };
    auto const value{ unquote(util_trim(line.substr(sep + 1))) };
    result[normalize_key(key)] = std::string{ value };
  }

  return result;
}

settings settings::load(std::optional<std::filesystem::path> const &config_file,
                        std::vector<std::string> const &environment) {
  std::map<std::string, std::string> values;

  if (config_file) {
    auto const bytes{ util_load_file(*config_file) };
    values = parse_file_contents(
        std::string_view{ reinterpret_cast<char const *>(bytes.data()), bytes.size() });
  }

  for (auto const &entry : environment) {
    if (!std::string_view{ entry }.starts_with(kEnvPrefix)) { continue; }
    auto const eq{ entry.find('=') };
    if (eq == std::string::npos) { continue; }
    values[normalize_key(entry.substr(0, eq))] = entry.substr(eq + 1);
  }

  settings result{};
  result.values_ = std::move(values);
  return result;
}

std::optional<std::string> settings::get(std::string_view key) const {
  auto const it{ values_.find(normalize_key(key)) };
  if (it == values_.end()) { return std::nullopt; }
  return it->second;
}

bool settings::get_bool(std::string_view key, bool fallback) const {
  auto const value{ get(key) };
  if (!value) { return fallback; }

  auto const lowered{ util_to_lower(util_trim(*value)) };
  if (lowered == "true" || lowered == "1" || lowered == "yes") { return true; }
  if (lowered == "false" || lowered == "0" || lowered == "no" || lowered.empty()) {
    return false;
  }
  throw std::invalid_argument("settings: " + std::string{ key } +
                              " is not a boolean: " + *value);
}

std::optional<long> settings::get_int(std::string_view key) const {
  auto const value{ get(key) };
  if (!value) { return std::nullopt; }

  auto const text{ util_trim(*value) };
  long result{ 0 };
  auto const [ptr, ec]{ std::from_chars(text.data(), text.data() + text.size(), result) };
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw std::invalid_argument("settings: " + std::string{ key } +
                                " is not an integer: " + *value);
  }
  return result;
}

std::vector<std::string> settings::keys() const {
  std::vector<std::string> result;
  result.reserve(values_.size());
  for (auto const &[key, value] : values_) { result.push_back(key); }
  return result;
}

}  // namespace gemfetch
