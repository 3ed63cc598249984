#include "fetcher.h"

#include "fetch_error.h"
#include "full_index.h"
#include "trace.h"
#include "tui.h"

#include <stdexcept>
#include <utility>

namespace gemfetch {

std::string_view api_availability_name(api_availability value) {
  switch (value) {
    case api_availability::UNKNOWN: return "unknown";
    case api_availability::AVAILABLE: return "available";
    case api_availability::UNAVAILABLE: return "unavailable";
  }
  return "unknown";
}

fetcher::fetcher(credential_scoped_uri remote,
                 fetch_config cfg,
                 std::shared_ptr<http_transport> transport)
    : remote_{ std::move(remote) },
      cfg_{ std::move(cfg) },
      connections_{ std::make_shared<connection_manager>(cfg_, std::move(transport)) },
      client_{ std::make_shared<http_client>(cfg_, connections_) },
      spec_files_{ std::make_shared<spec_file_fetcher>(remote_, cfg_.spec_cache_dirs, client_) },
      api_{ dependency_api_base(remote_.original()), client_, policy(), cfg_.api_request_limit } {}

retry_policy fetcher::policy() const {
  return retry_policy{ .max_attempts = cfg_.max_attempts, .delay = cfg_.retry_delay };
}

bool fetcher::use_api() {
  if (availability_ != api_availability::UNKNOWN) {
    return availability_ == api_availability::AVAILABLE;
  }

  if (remote_.original().kind() == uri_scheme::LOCAL_FILE || cfg_.disable_endpoint) {
    availability_ = api_availability::UNAVAILABLE;
  } else {
    try {
      client_->fetch(dependency_api_uri(api_.base()));
      availability_ = api_availability::AVAILABLE;
    } catch (fetch_error const &err) {
      if (fetch_error_is_abort_class(err.kind())) { throw; }
      if (err.kind() == fetch_error_kind::NETWORK_DOWN) {
        throw fetch_error{ fetch_error_kind::HTTP_ERROR, err.location(), err.what() };
      }
      tui::debug("Dependency API probe of %s failed: %s", uri().c_str(), err.what());
      availability_ = api_availability::UNAVAILABLE;
    }
  }

  GEMFETCH_TRACE_API_PROBE(uri(), availability_ == api_availability::AVAILABLE);
  return availability_ == api_availability::AVAILABLE;
}

std::optional<std::vector<raw_spec>> fetcher::fetch_remote_specs(
    std::vector<std::string> const &names) {
  try {
    return api_.resolve_closure(names).specs;
  } catch (fetch_error const &err) {
    if (fetch_error_is_abort_class(err.kind())) { throw; }

    tui::debug("could not fetch from the dependency API, trying the full index (%s)",
               err.what());
    GEMFETCH_TRACE_API_FALLBACK(uri(), std::string{ fetch_error_kind_name(err.kind()) });
    availability_ = api_availability::UNAVAILABLE;
    return std::nullopt;
  }
}

spec_index fetcher::specs(std::optional<std::vector<std::string>> const &names,
                          std::string const &source) {
  tui::info("Fetching gem metadata from %s", uri().c_str());

  std::optional<std::vector<raw_spec>> entries;
  if (names && use_api()) { entries = fetch_remote_specs(*names); }

  if (!entries) {
    availability_ = api_availability::UNAVAILABLE;
    entries = retry_attempt(policy(), "source fetch", [&] {
      return full_index_fetch(remote_, *client_);
    });
  }

  spec_index_build_options options{ .source = source,
                                    .origin = remote_,
                                    .self_name = cfg_.self_name };
  options.make_loader = [files = spec_files_](raw_spec const &entry) {
    return package_spec::dependency_loader_t{
      [files, name = entry.name, version = entry.version.to_string(), platform = entry.platform] {
        return files->fetch_spec(name, version, platform).dependencies;
      }
    };
  };

  return spec_index_build(std::move(*entries), options);
}

gem_marshal_specification fetcher::fetch_spec(std::string_view name,
                                              std::string_view version,
                                              std::string_view platform) {
  return spec_files_->fetch_spec(name, version, platform);
}

}  // namespace gemfetch
