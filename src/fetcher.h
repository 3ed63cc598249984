#pragma once

#include "connection_manager.h"
#include "credentials.h"
#include "dependency_api.h"
#include "fetch_config.h"
#include "http_client.h"
#include "http_transport.h"
#include "retry.h"
#include "spec_file.h"
#include "spec_index.h"
#include "util.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gemfetch {

enum class api_availability { UNKNOWN, AVAILABLE, UNAVAILABLE };

std::string_view api_availability_name(api_availability value);

// One fetch session against one registry. Owns its connections, configuration and
// API availability state; nothing is shared with other sessions. Not thread-safe,
// except that lazily loaded spec dependencies may be resolved from any thread.
class fetcher : unmovable {
 public:
  fetcher(credential_scoped_uri remote,
          fetch_config cfg,
          std::shared_ptr<http_transport> transport);

  // Index of `names` and their transitive dependencies through the dependency API, or
  // of the whole registry (full index) when no names are given or the API is not
  // usable. A non-authentication API failure latches the API unavailable for the rest
  // of the session.
  spec_index specs(std::optional<std::vector<std::string>> const &names,
                   std::string const &source);

  gem_marshal_specification fetch_spec(std::string_view name,
                                       std::string_view version,
                                       std::string_view platform);

  // Memoised probe of the dependency API.
  bool use_api();

  api_availability api_available() const { return availability_; }

  // Credential-stripped registry location.
  std::string uri() const { return remote_.to_string(); }

  credential_scoped_uri const &remote() const { return remote_; }
  fetch_config const &config() const { return cfg_; }

 private:
  std::optional<std::vector<raw_spec>> fetch_remote_specs(
      std::vector<std::string> const &names);

  retry_policy policy() const;

  credential_scoped_uri remote_;
  fetch_config cfg_;
  std::shared_ptr<connection_manager> connections_;
  std::shared_ptr<http_client> client_;
  std::shared_ptr<spec_file_fetcher> spec_files_;
  dependency_api_fetcher api_;
  api_availability availability_{ api_availability::UNKNOWN };
};

}  // namespace gemfetch
