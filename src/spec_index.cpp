#include "spec_index.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace gemfetch {

bool spec_index::add(package_spec_ptr spec) {
  if (!spec) { throw std::invalid_argument("spec_index: null spec"); }

  auto &variants{ specs_[spec->name()] };
  bool const duplicate{ std::ranges::any_of(variants, [&](package_spec_ptr const &v) {
    return v->version() == spec->version() && v->platform() == spec->platform();
  }) };
  if (duplicate) { return false; }

  variants.push_back(std::move(spec));
  ++size_;
  return true;
}

void spec_index::merge(spec_index const &other) {
  for (auto const &[name, variants] : other.specs_) {
    for (auto const &spec : variants) { add(spec); }
  }
}

std::vector<package_spec_ptr> spec_index::search(std::string_view name) const {
  auto const it{ specs_.find(name) };
  if (it == specs_.end()) { return {}; }
  return it->second;
}

std::vector<package_spec_ptr> spec_index::search(std::string_view name,
                                                 gem_requirement const &requirement) const {
  auto result{ search(name) };
  std::erase_if(result, [&](package_spec_ptr const &spec) {
    return !requirement.satisfied_by(spec->version());
  });
  return result;
}

std::vector<std::string> spec_index::names() const {
  std::vector<std::string> result;
  result.reserve(specs_.size());
  for (auto const &[name, variants] : specs_) { result.push_back(name); }
  return result;
}

spec_index spec_index_build(std::vector<raw_spec> entries,
                            spec_index_build_options const &options) {
  spec_index index;

  for (auto &entry : entries) {
    if (entry.name == options.self_name) { continue; }

    package_spec::cfg cfg{ .name = entry.name,
                           .version = entry.version,
                           .platform = entry.platform.empty() ? kRubyPlatform
                                                              : entry.platform,
                           .source = options.source,
                           .origin = options.origin };

    if (entry.dependencies) {
      index.add(std::make_shared<package_spec const>(std::move(cfg),
                                                     std::move(*entry.dependencies)));
    } else {
      if (!options.make_loader) {
        throw std::invalid_argument("spec_index_build: no loader for " + entry.name);
      }
      index.add(
          std::make_shared<package_spec const>(std::move(cfg), options.make_loader(entry)));
    }
  }

  return index;
}

}  // namespace gemfetch
