#include "gem_marshal.h"

#include <utility>

namespace gemfetch {

namespace {

// Gem::Specification#_dump array positions.
constexpr std::size_t kSpecName{ 2 };
constexpr std::size_t kSpecVersion{ 3 };
constexpr std::size_t kSpecOriginalPlatform{ 8 };
constexpr std::size_t kSpecDependencies{ 9 };
constexpr std::size_t kSpecNewPlatform{ 16 };

marshal_value const &require_node(marshal_value const *node, char const *what) {
  if (!node) { throw marshal_error(std::string{ "marshal: missing " } + what); }
  return *node;
}

marshal_value const &element(std::vector<marshal_value const *> const &items,
                             std::size_t index,
                             char const *what) {
  if (index >= items.size()) {
    throw marshal_error(std::string{ "marshal: missing " } + what);
  }
  return require_node(items[index], what);
}

}  // namespace

gem_version gem_marshal_version(marshal_value const &node) {
  switch (node.type) {
    case marshal_type::STRING: return gem_version::parse(node.text);
    case marshal_type::USER_MARSHAL: {
      auto const &payload{ require_node(node.payload, "version payload") };
      return gem_version::parse(element(payload.as_array(), 0, "version").as_string());
    }
    case marshal_type::OBJECT:
      return gem_version::parse(require_node(node.ivar("@version"), "@version").as_string());
    default:
      throw marshal_error("marshal: expected Gem::Version, found " +
                          std::string{ marshal_type_name(node.type) });
  }
}

gem_requirement gem_marshal_requirement(marshal_value const &node) {
  marshal_value const *pairs{ nullptr };
  switch (node.type) {
    case marshal_type::STRING: return gem_requirement::parse(node.text);
    case marshal_type::USER_MARSHAL:
      pairs = &element(require_node(node.payload, "requirement payload").as_array(),
                       0,
                       "requirement list");
      break;
    case marshal_type::OBJECT:
      pairs = &require_node(node.ivar("@requirements"), "@requirements");
      break;
    default:
      throw marshal_error("marshal: expected Gem::Requirement, found " +
                          std::string{ marshal_type_name(node.type) });
  }

  std::vector<gem_constraint> constraints;
  for (auto const *pair : pairs->as_array()) {
    auto const &items{ require_node(pair, "requirement pair").as_array() };
    auto const &op{ element(items, 0, "requirement operator").as_string() };
    auto const version{ gem_marshal_version(element(items, 1, "requirement version")) };
    constraints.push_back(gem_requirement::parse_constraint(op + " " + version.to_string()));
  }
  return gem_requirement{ std::move(constraints) };
}

std::string gem_marshal_platform(marshal_value const &node) {
  switch (node.type) {
    case marshal_type::NIL: return kRubyPlatform;
    case marshal_type::STRING:
    case marshal_type::SYMBOL: return node.text.empty() ? kRubyPlatform : node.text;
    case marshal_type::OBJECT: {
      std::string result;
      for (char const *name : { "@cpu", "@os", "@version" }) {
        auto const *part{ node.ivar(name) };
        if (!part || part->is_nil()) { continue; }
        if (!result.empty()) { result.push_back('-'); }
        result += part->as_string();
      }
      return result.empty() ? kRubyPlatform : result;
    }
    default:
      throw marshal_error("marshal: expected platform, found " +
                          std::string{ marshal_type_name(node.type) });
  }
}

gem_dependency gem_marshal_dependency(marshal_value const &node) {
  if (!node.is(marshal_type::OBJECT)) {
    throw marshal_error("marshal: expected Gem::Dependency, found " +
                        std::string{ marshal_type_name(node.type) });
  }

  gem_dependency dep{};
  dep.name = require_node(node.ivar("@name"), "@name").as_string();

  auto const *requirement{ node.ivar("@requirement") };
  if (!requirement || requirement->is_nil()) {
    requirement = node.ivar("@version_requirements");
  }
  if (requirement && !requirement->is_nil()) {
    dep.requirement = gem_marshal_requirement(*requirement);
  }

  if (auto const *type{ node.ivar("@type") }; type && !type->is_nil()) {
    dep.type = type->as_string();
  }
  return dep;
}

gem_marshal_specification gem_marshal_spec(marshal_value const &node) {
  if (!node.is(marshal_type::USER_DUMP)) {
    throw marshal_error("marshal: expected Gem::Specification, found " +
                        std::string{ marshal_type_name(node.type) });
  }

  // The _dump payload is itself a complete Marshal stream.
  auto const payload{ marshal_document::parse(node.text) };
  auto const &fields{ payload.root().as_array() };

  gem_marshal_specification result{};
  result.name = element(fields, kSpecName, "specification name").as_string();
  result.version = gem_marshal_version(element(fields, kSpecVersion, "specification version"));

  marshal_value const *platform{ nullptr };
  if (kSpecNewPlatform < fields.size() && !fields[kSpecNewPlatform]->is_nil()) {
    platform = fields[kSpecNewPlatform];
  } else if (kSpecOriginalPlatform < fields.size()) {
    platform = fields[kSpecOriginalPlatform];
  }
  result.platform = platform ? gem_marshal_platform(*platform) : kRubyPlatform;

  if (kSpecDependencies < fields.size() && !fields[kSpecDependencies]->is_nil()) {
    for (auto const *dep : fields[kSpecDependencies]->as_array()) {
      result.dependencies.push_back(
          gem_marshal_dependency(require_node(dep, "dependency")));
    }
  }

  return result;
}

}  // namespace gemfetch
