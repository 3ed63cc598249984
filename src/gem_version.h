#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

// RubyGems version value. Segments are runs of digits or letters; "-" is read as
// ".pre."; trailing zero segments do not affect ordering ("1.0" == "1"); a letter
// segment sorts before any number, so "1.0.a" < "1.0".
class gem_version {
 public:
  struct segment {
    bool numeric{ true };
    std::string text;  // numeric segments carry no leading zeros

    bool operator==(segment const &) const = default;
  };

  gem_version();  // "0"

  // Throws std::invalid_argument on a malformed version string.
  static gem_version parse(std::string_view text);
  static std::optional<gem_version> try_parse(std::string_view text);

  std::string const &to_string() const { return text_; }
  std::vector<segment> const &segments() const { return segments_; }
  bool prerelease() const;

  // Leading numeric segments only ("1.2.b.3" -> "1.2").
  gem_version release() const;

  // Next significant release, used by "~>": "1.2.3" -> "1.3", "1" -> "2".
  gem_version bump() const;

  std::strong_ordering operator<=>(gem_version const &other) const;
  bool operator==(gem_version const &other) const;

 private:
  static gem_version from_segments(std::vector<segment> segments);

  std::string text_;
  std::vector<segment> segments_;
};

enum class gem_requirement_op { EQ, NE, GT, LT, GE, LE, PESSIMISTIC };

std::string_view gem_requirement_op_string(gem_requirement_op op);

struct gem_constraint {
  gem_requirement_op op{ gem_requirement_op::GE };
  gem_version version;

  bool satisfied_by(gem_version const &v) const;
  std::string to_string() const;

  bool operator==(gem_constraint const &other) const;
};

// Conjunction of constraints. The default requirement is ">= 0".
class gem_requirement {
 public:
  gem_requirement();
  explicit gem_requirement(std::vector<gem_constraint> constraints);

  // Comma-separated constraints ("> 1.0, < 2"); a bare version means "=".
  // Throws std::invalid_argument on unparseable text.
  static gem_requirement parse(std::string_view text);
  static gem_requirement parse(std::vector<std::string> const &parts);

  static gem_constraint parse_constraint(std::string_view text);

  bool satisfied_by(gem_version const &v) const;

  // True for the default ">= 0".
  bool is_default() const;

  std::vector<gem_constraint> const &constraints() const { return constraints_; }

  // ">= 1.0, < 2"
  std::string to_string() const;

  bool operator==(gem_requirement const &other) const;

 private:
  std::vector<gem_constraint> constraints_;
};

}  // namespace gemfetch
