#pragma once

#include "credentials.h"
#include "gem_version.h"
#include "package_spec.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

using package_spec_ptr = std::shared_ptr<package_spec const>;

// Package name -> variants. Variants are unique on (name, version, platform).
class spec_index {
 public:
  // False when an equal variant is already present (the first one wins).
  bool add(package_spec_ptr spec);

  // Adds every variant of `other` not already present.
  void merge(spec_index const &other);

  std::vector<package_spec_ptr> search(std::string_view name) const;
  std::vector<package_spec_ptr> search(std::string_view name,
                                       gem_requirement const &requirement) const;

  std::vector<std::string> names() const;
  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

 private:
  std::map<std::string, std::vector<package_spec_ptr>, std::less<>> specs_;
  std::size_t size_{ 0 };
};

struct spec_index_build_options {
  std::string source;           // label recorded on every spec
  credential_scoped_uri origin;  // registry the entries came from
  std::string self_name{ "bundler" };

  // Produces the loader for an entry without a dependency list.
  std::function<package_spec::dependency_loader_t(raw_spec const &)> make_loader;
};

// Raw tuples -> typed specs. Entries named `self_name` are skipped; entries without a
// dependency list get lazily resolved dependencies.
spec_index spec_index_build(std::vector<raw_spec> entries,
                            spec_index_build_options const &options);

}  // namespace gemfetch
