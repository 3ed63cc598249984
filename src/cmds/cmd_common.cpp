#include "cmd_common.h"

#include "credentials.h"
#include "libcurl_util.h"
#include "user_agent.h"

#include <stdexcept>
#include <utility>

namespace gemfetch {

transport_factory_t default_transport_factory() {
  return [] { return std::shared_ptr<http_transport>{ libcurl_make_transport() }; };
}

fetch_config make_fetch_config(settings const &s, std::string_view command) {
  return fetch_config_from_settings(s, user_agent_for_process(command, s));
}

std::unique_ptr<fetcher> make_fetcher(std::string_view source,
                                      settings const &s,
                                      fetch_config const &cfg,
                                      std::shared_ptr<http_transport> transport) {
  if (!transport) { throw std::invalid_argument("make_fetcher: no transport"); }
  return std::make_unique<fetcher>(credentials_resolve(source, s), cfg, std::move(transport));
}

}  // namespace gemfetch
