#include "dependency_api.h"

#include "fetch_error.h"
#include "marshal.h"
#include "trace.h"
#include "tui.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace gemfetch {

namespace {

constexpr char kDependencyEndpoint[]{ "api/v1/dependencies" };

std::string const &required_string(marshal_value const &entry, char const *key) {
  auto const *value{ entry.get(key) };
  if (!value) { throw marshal_error(std::string{ "marshal: entry without :" } + key); }
  return value->as_string();
}

gem_dependency decode_dependency(std::string const &package,
                                 std::string const &location,
                                 std::string name,
                                 std::string const &requirement) {
  try {
    auto const parts{ util_split(requirement, ',') };
    return gem_dependency{ .name = std::move(name),
                           .requirement = parts.empty() ? gem_requirement{}
                                                        : gem_requirement::parse(parts) };
  } catch (std::invalid_argument const &ex) {
    throw make_malformed_spec_error(location, package, ex.what());
  }
}

raw_spec decode_entry(marshal_value const &entry, std::string const &location) {
  if (!entry.is(marshal_type::HASH)) {
    throw marshal_error("marshal: expected hash, found " +
                        std::string{ marshal_type_name(entry.type) });
  }

  raw_spec spec{};
  spec.name = required_string(entry, "name");
  auto const &number{ required_string(entry, "number") };

  try {
    spec.version = gem_version::parse(number);
  } catch (std::invalid_argument const &ex) {
    throw make_malformed_spec_error(location, spec.name, ex.what());
  }

  if (auto const *platform{ entry.get("platform") }; platform && !platform->is_nil()) {
    spec.platform = platform->as_string().empty() ? kRubyPlatform : platform->as_string();
  }

  std::vector<gem_dependency> deps;
  if (auto const *list{ entry.get("dependencies") }; list && !list->is_nil()) {
    auto const package{ spec_full_name(spec.name, spec.version, spec.platform) };
    if (list->is(marshal_type::HASH)) {
      for (auto const &[key, value] : list->entries) {
        deps.push_back(
            decode_dependency(package, location, key->as_string(), value->as_string()));
      }
    } else {
      for (auto const *pair : list->as_array()) {
        auto const &items{ pair->as_array() };
        if (items.size() != 2) {
          throw marshal_error("marshal: dependency is not a [name, requirement] pair");
        }
        deps.push_back(decode_dependency(package,
                                         location,
                                         items[0]->as_string(),
                                         items[1]->as_string()));
      }
    }
  }
  spec.dependencies = std::move(deps);
  return spec;
}

}  // namespace

uri dependency_api_base(uri const &registry) {
  uri result{ uri_as_directory(registry) };
  if (result.host == "rubygems.org") { result.host = "bundler.rubygems.org"; }
  return result;
}

uri dependency_api_uri(uri const &base, std::vector<std::string> const &names) {
  uri result{ uri_join_path(base, kDependencyEndpoint) };
  if (names.empty()) { return result; }

  std::string query{ "gems=" };
  for (std::size_t i{ 0 }; i < names.size(); ++i) {
    if (i) { query.push_back(','); }
    query += uri_percent_encode(names[i]);
  }
  result.query = std::move(query);
  return result;
}

std::vector<raw_spec> dependency_api_decode(std::string_view body,
                                            std::string const &location) {
  try {
    auto const doc{ marshal_document::parse(body) };
    std::vector<raw_spec> result;
    for (auto const *entry : doc.root().as_array()) {
      result.push_back(decode_entry(*entry, location));
    }
    return result;
  } catch (marshal_error const &ex) {
    tui::debug("Undecodable dependency response from %s: %s", location.c_str(), ex.what());
    throw fetch_error{ fetch_error_kind::HTTP_ERROR,
                       location,
                       "Invalid dependency data from " + location +
                           ". Your network or your gem server is probably having issues "
                           "right now." };
  }
}

std::vector<std::vector<std::string>> dependency_api_batches(
    std::vector<std::string> const &names,
    std::size_t limit) {
  if (limit == 0) { throw std::invalid_argument("dependency_api_batches: zero limit"); }

  std::vector<std::vector<std::string>> batches;
  for (std::size_t i{ 0 }; i < names.size(); i += limit) {
    auto const end{ std::min(names.size(), i + limit) };
    batches.emplace_back(names.begin() + static_cast<std::ptrdiff_t>(i),
                         names.begin() + static_cast<std::ptrdiff_t>(end));
  }
  return batches;
}

dependency_api_fetcher::dependency_api_fetcher(uri base,
                                               std::shared_ptr<http_client> client,
                                               retry_policy policy,
                                               std::size_t request_limit)
    : base_{ std::move(base) },
      client_{ std::move(client) },
      policy_{ std::move(policy) },
      request_limit_{ request_limit } {
  if (!client_) { throw std::invalid_argument("dependency_api_fetcher: no http client"); }
  if (request_limit_ == 0) {
    throw std::invalid_argument("dependency_api_fetcher: request limit must be positive");
  }
}

std::vector<raw_spec> dependency_api_fetcher::query(std::vector<std::string> const &names) {
  auto const target{ dependency_api_uri(base_, names) };
  auto const location{ uri_without_credentials(target).to_string() };

  return retry_attempt(policy_, "dependency api", [&] {
    return dependency_api_decode(client_->fetch(target), location);
  });
}

dependency_closure dependency_api_fetcher::resolve_closure(
    std::vector<std::string> const &requested) {
  dependency_closure closure;
  std::set<std::string> pending{ requested.begin(), requested.end() };
  auto const registry{ uri_without_credentials(base_).to_string() };

  for (;;) {
    std::vector<std::string> frontier;
    std::ranges::set_difference(pending, closure.fully_queried, std::back_inserter(frontier));
    if (frontier.empty()) { break; }

    ++closure.rounds;
    tui::debug("Query List: %s", util_join(frontier, ", ").c_str());

    auto const batches{ dependency_api_batches(frontier, request_limit_) };
    std::set<std::string> referenced;
    for (auto const &batch : batches) {
      auto entries{ query(batch) };
      ++closure.requests;
      for (auto &entry : entries) {
        for (auto const &dep : *entry.dependencies) { referenced.insert(dep.name); }
        closure.specs.push_back(std::move(entry));
      }
    }

    closure.fully_queried.insert(frontier.begin(), frontier.end());
    pending = std::move(referenced);

    GEMFETCH_TRACE_CLOSURE_ROUND(registry,
                                 closure.rounds,
                                 static_cast<std::int64_t>(frontier.size()),
                                 static_cast<std::int64_t>(batches.size()),
                                 static_cast<std::int64_t>(closure.specs.size()));
  }

  return closure;
}

}  // namespace gemfetch
