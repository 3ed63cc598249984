#include "gem_version.h"

#include "util.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace gemfetch {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }
bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
bool is_alnum(char c) { return is_digit(c) || is_alpha(c); }

// [0-9]+(\.[0-9a-zA-Z]+)*(-[0-9A-Za-z-]+(\.[0-9A-Za-z-]+)*)?
bool version_text_is_valid(std::string_view text) {
  std::size_t i{ 0 };
  auto const run{ [&](auto pred) {
    std::size_t const start{ i };
    while (i < text.size() && pred(text[i])) { ++i; }
    return i > start;
  } };

  if (!run(is_digit)) { return false; }
  while (i < text.size() && text[i] == '.') {
    ++i;
    if (!run(is_alnum)) { return false; }
  }

  if (i < text.size() && text[i] == '-') {
    ++i;
    auto const pre_char{ [](char c) { return is_alnum(c) || c == '-'; } };
    if (!run(pre_char)) { return false; }
    while (i < text.size() && text[i] == '.') {
      ++i;
      if (!run(pre_char)) { return false; }
    }
  }

  return i == text.size();
}

std::string strip_leading_zeros(std::string_view digits) {
  auto const first{ digits.find_first_not_of('0') };
  if (first == std::string_view::npos) { return "0"; }
  return std::string{ digits.substr(first) };
}

std::string increment_digits(std::string digits) {
  for (auto it{ digits.rbegin() }; it != digits.rend(); ++it) {
    if (*it != '9') {
      ++*it;
      return digits;
    }
    *it = '0';
  }
  return "1" + digits;
}

bool is_zero(gem_version::segment const &s) { return s.numeric && s.text == "0"; }

std::strong_ordering compare_segments(gem_version::segment const &lhs,
                                      gem_version::segment const &rhs) {
  if (lhs.numeric != rhs.numeric) {
    return lhs.numeric ? std::strong_ordering::greater : std::strong_ordering::less;
  }
  if (lhs.numeric && lhs.text.size() != rhs.text.size()) {
    return lhs.text.size() <=> rhs.text.size();
  }
  return lhs.text.compare(rhs.text) <=> 0;
}

// Numeric prefix and string remainder each lose their trailing zeros.
std::vector<gem_version::segment> canonical_segments(
    std::vector<gem_version::segment> const &segments) {
  auto const string_start{ std::ranges::find_if(segments, [](auto const &s) {
    return !s.numeric;
  }) };

  std::vector<gem_version::segment> numeric{ segments.begin(), string_start };
  std::vector<gem_version::segment> rest{ string_start, segments.end() };
  while (!numeric.empty() && is_zero(numeric.back())) { numeric.pop_back(); }
  while (!rest.empty() && is_zero(rest.back())) { rest.pop_back(); }

  numeric.insert(numeric.end(), rest.begin(), rest.end());
  return numeric;
}

}  // namespace

gem_version::gem_version() : text_{ "0" }, segments_{ { true, "0" } } {}

std::optional<gem_version> gem_version::try_parse(std::string_view text) {
  auto const trimmed{ util_trim(text) };
  if (trimmed.empty()) { return gem_version{}; }
  if (!version_text_is_valid(trimmed)) { return std::nullopt; }

  gem_version result;
  result.text_.clear();
  for (char const c : trimmed) {
    if (c == '-') {
      result.text_ += ".pre.";
    } else {
      result.text_.push_back(c);
    }
  }

  result.segments_.clear();
  std::string_view const canon{ result.text_ };
  for (std::size_t i{ 0 }; i < canon.size();) {
    std::size_t const start{ i };
    if (is_digit(canon[i])) {
      while (i < canon.size() && is_digit(canon[i])) { ++i; }
      result.segments_.push_back({ true, strip_leading_zeros(canon.substr(start, i - start)) });
    } else if (is_alpha(canon[i])) {
      while (i < canon.size() && is_alpha(canon[i])) { ++i; }
      result.segments_.push_back({ false, std::string{ canon.substr(start, i - start) } });
    } else {
      ++i;
    }
  }

  return result;
}

gem_version gem_version::parse(std::string_view text) {
  auto result{ try_parse(text) };
  if (!result) {
    throw std::invalid_argument("Malformed version number string " + std::string{ text });
  }
  return std::move(*result);
}

gem_version gem_version::from_segments(std::vector<segment> segments) {
  std::vector<std::string> parts;
  parts.reserve(segments.size());
  for (auto const &s : segments) { parts.push_back(s.text); }

  gem_version result;
  result.text_ = util_join(parts, ".");
  result.segments_ = std::move(segments);
  if (result.segments_.empty()) { return gem_version{}; }
  return result;
}

bool gem_version::prerelease() const {
  return std::ranges::any_of(segments_, [](auto const &s) { return !s.numeric; });
}

gem_version gem_version::release() const {
  if (!prerelease()) { return *this; }
  auto segments{ segments_ };
  while (std::ranges::any_of(segments, [](auto const &s) { return !s.numeric; })) {
    segments.pop_back();
  }
  return from_segments(std::move(segments));
}

gem_version gem_version::bump() const {
  auto segments{ segments_ };
  while (std::ranges::any_of(segments, [](auto const &s) { return !s.numeric; })) {
    segments.pop_back();
  }
  if (segments.size() > 1) { segments.pop_back(); }
  if (segments.empty()) { segments.push_back({ true, "0" }); }
  segments.back().text = increment_digits(segments.back().text);
  return from_segments(std::move(segments));
}

std::strong_ordering gem_version::operator<=>(gem_version const &other) const {
  auto const lhs{ canonical_segments(segments_) };
  auto const rhs{ canonical_segments(other.segments_) };
  segment const zero{ true, "0" };

  for (std::size_t i{ 0 }; i < std::max(lhs.size(), rhs.size()); ++i) {
    auto const &l{ i < lhs.size() ? lhs[i] : zero };
    auto const &r{ i < rhs.size() ? rhs[i] : zero };
    if (auto const cmp{ compare_segments(l, r) }; cmp != 0) { return cmp; }
  }
  return std::strong_ordering::equal;
}

bool gem_version::operator==(gem_version const &other) const {
  return (*this <=> other) == 0;
}

std::string_view gem_requirement_op_string(gem_requirement_op op) {
  switch (op) {
    case gem_requirement_op::EQ: return "=";
    case gem_requirement_op::NE: return "!=";
    case gem_requirement_op::GT: return ">";
    case gem_requirement_op::LT: return "<";
    case gem_requirement_op::GE: return ">=";
    case gem_requirement_op::LE: return "<=";
    case gem_requirement_op::PESSIMISTIC: return "~>";
  }
  return "?";
}

bool gem_constraint::satisfied_by(gem_version const &v) const {
  switch (op) {
    case gem_requirement_op::EQ: return v == version;
    case gem_requirement_op::NE: return v != version;
    case gem_requirement_op::GT: return v > version;
    case gem_requirement_op::LT: return v < version;
    case gem_requirement_op::GE: return v >= version;
    case gem_requirement_op::LE: return v <= version;
    case gem_requirement_op::PESSIMISTIC:
      return v >= version && v.release() < version.bump();
  }
  return false;
}

std::string gem_constraint::to_string() const {
  return std::string{ gem_requirement_op_string(op) } + " " + version.to_string();
}

bool gem_constraint::operator==(gem_constraint const &other) const {
  return op == other.op && version == other.version;
}

gem_requirement::gem_requirement() : constraints_{ gem_constraint{} } {}

gem_requirement::gem_requirement(std::vector<gem_constraint> constraints)
    : constraints_{ std::move(constraints) } {
  if (constraints_.empty()) { constraints_.push_back(gem_constraint{}); }
}

gem_constraint gem_requirement::parse_constraint(std::string_view text) {
  auto rest{ util_trim(text) };

  gem_requirement_op op{ gem_requirement_op::EQ };
  // Two-character operators first so ">=" is not read as ">".
  static constexpr std::pair<std::string_view, gem_requirement_op> kOps[]{
    { "!=", gem_requirement_op::NE }, { ">=", gem_requirement_op::GE },
    { "<=", gem_requirement_op::LE }, { "~>", gem_requirement_op::PESSIMISTIC },
    { "=", gem_requirement_op::EQ },  { ">", gem_requirement_op::GT },
    { "<", gem_requirement_op::LT },
  };
  for (auto const &[token, value] : kOps) {
    if (rest.starts_with(token)) {
      op = value;
      rest.remove_prefix(token.size());
      break;
    }
  }

  rest = util_trim(rest);
  if (rest.empty()) {
    throw std::invalid_argument("Illformed requirement [\"" + std::string{ text } + "\"]");
  }

  auto version{ gem_version::try_parse(rest) };
  if (!version) {
    throw std::invalid_argument("Illformed requirement [\"" + std::string{ text } + "\"]");
  }
  return gem_constraint{ op, std::move(*version) };
}

gem_requirement gem_requirement::parse(std::string_view text) {
  return parse(util_split(text, ','));
}

gem_requirement gem_requirement::parse(std::vector<std::string> const &parts) {
  std::vector<gem_constraint> constraints;
  constraints.reserve(parts.size());
  for (auto const &part : parts) { constraints.push_back(parse_constraint(part)); }
  return gem_requirement{ std::move(constraints) };
}

bool gem_requirement::satisfied_by(gem_version const &v) const {
  return std::ranges::all_of(constraints_, [&](auto const &c) { return c.satisfied_by(v); });
}

bool gem_requirement::is_default() const {
  return constraints_.size() == 1 && constraints_.front() == gem_constraint{};
}

std::string gem_requirement::to_string() const {
  std::vector<std::string> parts;
  parts.reserve(constraints_.size());
  for (auto const &c : constraints_) { parts.push_back(c.to_string()); }
  return util_join(parts, ", ");
}

bool gem_requirement::operator==(gem_requirement const &other) const {
  return constraints_ == other.constraints_;
}

}  // namespace gemfetch
