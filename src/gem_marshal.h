#pragma once

#include "gem_version.h"
#include "marshal.h"
#include "package_spec.h"

#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

// Interpretation of RubyGems objects inside a decoded Marshal document. All functions
// throw marshal_error when the node does not have the expected shape, and
// std::invalid_argument when a version or requirement string is malformed.

// Gem::Version ('U' with ["1.2.0"]) or a plain version string.
gem_version gem_marshal_version(marshal_value const &node);

// Gem::Requirement ('U' with [[[op, version], ...]] or an object with @requirements).
gem_requirement gem_marshal_requirement(marshal_value const &node);

// Platform string, or Gem::Platform object rendered "cpu-os[-version]". nil -> "ruby".
std::string gem_marshal_platform(marshal_value const &node);

// Gem::Dependency object (@name, @requirement or @version_requirements, @type).
gem_dependency gem_marshal_dependency(marshal_value const &node);

// Fields of a Gem::Specification ('u' _dump payload).
struct gem_marshal_specification {
  std::string name;
  gem_version version;
  std::string platform;
  std::vector<gem_dependency> dependencies;  // every type, in declaration order
};

gem_marshal_specification gem_marshal_spec(marshal_value const &node);

}  // namespace gemfetch
