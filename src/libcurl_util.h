#pragma once

#include "http_transport.h"

#include <memory>
#include <string>

namespace gemfetch {

void libcurl_ensure_initialized();

// "curl/<version>" of the linked libcurl.
std::string libcurl_version_string();

// Transport backed by one libcurl easy handle per connection. Connection reuse
// (keep-alive) happens inside the handle.
std::unique_ptr<http_transport> libcurl_make_transport();

}  // namespace gemfetch
