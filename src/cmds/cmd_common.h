#pragma once

#include "fetch_config.h"
#include "fetcher.h"
#include "http_transport.h"
#include "settings.h"

#include <functional>
#include <memory>
#include <string_view>

namespace gemfetch {

using transport_factory_t = std::function<std::shared_ptr<http_transport>()>;

// libcurl-backed transport, one per session.
transport_factory_t default_transport_factory();

// Session configuration for `command`, identifying client string included.
fetch_config make_fetch_config(settings const &s, std::string_view command);

// Mirror and credential resolution for `source`, then a fresh session over `transport`.
std::unique_ptr<fetcher> make_fetcher(std::string_view source,
                                      settings const &s,
                                      fetch_config const &cfg,
                                      std::shared_ptr<http_transport> transport);

}  // namespace gemfetch
