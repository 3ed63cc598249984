#pragma once

#include "http_client.h"
#include "package_spec.h"
#include "retry.h"
#include "uri.h"
#include "util.h"

#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

struct dependency_closure {
  std::vector<raw_spec> specs;
  std::set<std::string> fully_queried;
  int rounds{ 0 };
  std::size_t requests{ 0 };
};

// Registry base used for the dependency API: rubygems.org is served from
// bundler.rubygems.org, every other host is used as is.
uri dependency_api_base(uri const &registry);

// "<base>api/v1/dependencies[?gems=a,b]" with each name percent-encoded.
uri dependency_api_uri(uri const &base, std::vector<std::string> const &names = {});

// Decode one response body: an array of {name:, number:, platform:, dependencies:}
// hashes. Throws fetch_error (MALFORMED_SPEC for an unparseable requirement, HTTP_ERROR
// for an undecodable body).
std::vector<raw_spec> dependency_api_decode(std::string_view body, std::string const &location);

// Splits `names` (in order) into consecutive batches of at most `limit` names.
std::vector<std::vector<std::string>> dependency_api_batches(
    std::vector<std::string> const &names,
    std::size_t limit);

class dependency_api_fetcher : unmovable {
 public:
  dependency_api_fetcher(uri base,
                         std::shared_ptr<http_client> client,
                         retry_policy policy,
                         std::size_t request_limit);

  // Transitive closure over the dependency API. Every round queries the names not yet
  // queried; the next round's names are the dependencies the round returned. Any
  // failure aborts the whole closure.
  dependency_closure resolve_closure(std::vector<std::string> const &requested);

  // One request for one batch, retried per policy.
  std::vector<raw_spec> query(std::vector<std::string> const &names);

  uri const &base() const { return base_; }

 private:
  uri base_;
  std::shared_ptr<http_client> client_;
  retry_policy policy_;
  std::size_t request_limit_;
};

}  // namespace gemfetch
